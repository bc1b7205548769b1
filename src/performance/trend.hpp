/**
 * @file trend.hpp
 * @brief Metric selectors, least-squares regression and trend classification.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "storage/metric_record.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace adaptive_scheduler {

// ─────────────────────────────────────────────
// Metric selector
// ─────────────────────────────────────────────

enum class Metric : uint8_t {
    Latency,
    CpuUsage,
    RamUsage,
    Throughput,
    ErrorRate,
    QueueDepth
};

[[nodiscard]] constexpr std::string_view to_string(Metric metric) noexcept {
    switch (metric) {
        case Metric::Latency:    return "latency";
        case Metric::CpuUsage:   return "cpu_usage";
        case Metric::RamUsage:   return "ram_usage";
        case Metric::Throughput: return "throughput";
        case Metric::ErrorRate:  return "error_rate";
        case Metric::QueueDepth: return "queue_depth";
    }
    return "unknown";
}

[[nodiscard]] std::optional<Metric> parse_metric(std::string_view name) noexcept;

/// Throughput is the only metric where larger values are better.
[[nodiscard]] constexpr bool higher_is_better(Metric metric) noexcept {
    return metric == Metric::Throughput;
}

[[nodiscard]] double metric_value(const MetricRecord& record, Metric metric) noexcept;

/// Values of @p metric from @p records, in the same order.
[[nodiscard]] std::vector<double> extract(const std::vector<MetricRecord>& records, Metric metric);

[[nodiscard]] double mean(std::span<const double> values) noexcept;

// ─────────────────────────────────────────────
// Regression
// ─────────────────────────────────────────────

struct Regression {
    double slope{0.0};
    double intercept{0.0};
    double r_squared{0.0};     ///< 0 when the series is constant
};

/**
 * @brief Ordinary least squares of values[i] against i.
 *
 * Fewer than two points yield an all-zero Regression.
 */
[[nodiscard]] Regression linear_regression(std::span<const double> values) noexcept;

// ─────────────────────────────────────────────
// Trend
// ─────────────────────────────────────────────

enum class TrendDirection : uint8_t {
    InsufficientData,
    Improving,
    Stable,
    Degrading
};

[[nodiscard]] constexpr std::string_view to_string(TrendDirection direction) noexcept {
    switch (direction) {
        case TrendDirection::InsufficientData: return "insufficient_data";
        case TrendDirection::Improving:        return "improving";
        case TrendDirection::Stable:           return "stable";
        case TrendDirection::Degrading:        return "degrading";
    }
    return "unknown";
}

struct TrendResult {
    double slope{0.0};
    TrendDirection direction{TrendDirection::InsufficientData};
    double confidence{0.0};    ///< R² of the fit
    size_t samples{0};
};

/// Slopes within ±dead_band are Stable.
constexpr double TREND_DEAD_BAND = 0.01;

/**
 * @brief Fit the most recent @p window values (chronological input).
 *
 * Returns InsufficientData with zero confidence when fewer than @p window
 * values exist or the window is below two points.
 */
[[nodiscard]] TrendResult classify_trend(std::span<const double> chronological,
                                         Metric metric,
                                         size_t window,
                                         double dead_band = TREND_DEAD_BAND) noexcept;

}  // namespace adaptive_scheduler
