/**
 * @file trend.cpp
 * @brief Regression and trend helpers.
 * @author Dimitris Kafetzis
 */

#include "performance/trend.hpp"

#include <numeric>

namespace adaptive_scheduler {

std::optional<Metric> parse_metric(std::string_view name) noexcept {
    if (name == "latency") return Metric::Latency;
    if (name == "cpu_usage" || name == "cpu") return Metric::CpuUsage;
    if (name == "ram_usage" || name == "ram") return Metric::RamUsage;
    if (name == "throughput") return Metric::Throughput;
    if (name == "error_rate") return Metric::ErrorRate;
    if (name == "queue_depth") return Metric::QueueDepth;
    return std::nullopt;
}

double metric_value(const MetricRecord& record, Metric metric) noexcept {
    switch (metric) {
        case Metric::Latency:    return record.latency;
        case Metric::CpuUsage:   return record.cpu_usage;
        case Metric::RamUsage:   return record.ram_usage;
        case Metric::Throughput: return record.throughput;
        case Metric::ErrorRate:  return record.error_rate;
        case Metric::QueueDepth: return static_cast<double>(record.queue_depth);
    }
    return 0.0;
}

std::vector<double> extract(const std::vector<MetricRecord>& records, Metric metric) {
    std::vector<double> out;
    out.reserve(records.size());
    for (const auto& rec : records) out.push_back(metric_value(rec, metric));
    return out;
}

double mean(std::span<const double> values) noexcept {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

Regression linear_regression(std::span<const double> values) noexcept {
    const size_t n = values.size();
    if (n < 2) return {};

    const double nd = static_cast<double>(n);
    const double x_mean = (nd - 1.0) / 2.0;
    const double y_mean = mean(values);

    double sxy = 0.0;
    double sxx = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double dx = static_cast<double>(i) - x_mean;
        sxy += dx * (values[i] - y_mean);
        sxx += dx * dx;
    }

    Regression out;
    out.slope = sxx > 0.0 ? sxy / sxx : 0.0;
    out.intercept = y_mean - out.slope * x_mean;

    double ss_res = 0.0;
    double ss_tot = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double predicted = out.intercept + out.slope * static_cast<double>(i);
        ss_res += (values[i] - predicted) * (values[i] - predicted);
        ss_tot += (values[i] - y_mean) * (values[i] - y_mean);
    }
    out.r_squared = ss_tot > 0.0 ? 1.0 - ss_res / ss_tot : 0.0;
    return out;
}

TrendResult classify_trend(std::span<const double> chronological,
                           Metric metric,
                           size_t window,
                           double dead_band) noexcept {
    TrendResult out;
    if (window < 2 || chronological.size() < window) {
        out.samples = chronological.size();
        return out;
    }

    auto recent = chronological.subspan(chronological.size() - window);
    auto fit = linear_regression(recent);

    out.slope = fit.slope;
    out.confidence = fit.r_squared;
    out.samples = window;

    // A rising series is good news for higher-is-better metrics
    const double signed_slope = higher_is_better(metric) ? -fit.slope : fit.slope;
    if (signed_slope < -dead_band) {
        out.direction = TrendDirection::Improving;
    } else if (signed_slope > dead_band) {
        out.direction = TrendDirection::Degrading;
    } else {
        out.direction = TrendDirection::Stable;
    }
    return out;
}

}  // namespace adaptive_scheduler
