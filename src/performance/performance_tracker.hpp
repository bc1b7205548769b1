/**
 * @file performance_tracker.hpp
 * @brief Per-task timing, buffered metric persistence and trend analysis.
 * @author Dimitris Kafetzis
 *
 * The tracker times tasks, turns each finished task into a MetricRecord,
 * buffers records until buffer_size is reached and then appends them to
 * the IMetricsStore. Queries always merge the store with whatever is still
 * buffered so that fresh observations are visible immediately.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "performance/trend.hpp"
#include "storage/metric_record.hpp"
#include "storage/metrics_store.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace adaptive_scheduler {

enum class Severity : uint8_t {
    Low,
    Medium,
    High,
    Critical
};

[[nodiscard]] constexpr std::string_view to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Low:      return "low";
        case Severity::Medium:   return "medium";
        case Severity::High:     return "high";
        case Severity::Critical: return "critical";
    }
    return "unknown";
}

struct DegradationAlert {
    ProviderId provider_id;
    Metric metric{Metric::Latency};
    Severity severity{Severity::Low};
    double current{0.0};
    double baseline{0.0};
    std::string details;
    Timestamp timestamp{};
};

struct ProviderRanking {
    ProviderId provider_id;
    double score{0.0};                 ///< Lower is better
    size_t samples{0};
    double avg_latency{0.0};
    double avg_cpu{0.0};
    double avg_ram{0.0};
    double avg_throughput{0.0};
    double avg_error_rate{0.0};
    double avg_queue_depth{0.0};
    TrendDirection trend{TrendDirection::InsufficientData};
    double trend_confidence{0.0};
};

/// Current host usage; only cpu_percent and mem_percent are read.
using UsageSource = std::function<ResourceSample()>;

class PerformanceTracker {
public:
    // Degradation thresholds
    static constexpr size_t MIN_DEGRADATION_SAMPLES = 20;
    static constexpr size_t RECENT_WINDOW = 10;
    static constexpr size_t BASELINE_WINDOW = 100;
    static constexpr double MIN_TREND_CONFIDENCE = 0.7;
    static constexpr double ERROR_RATE_ALERT = 0.2;
    static constexpr double ERROR_RATE_CRITICAL = 0.5;
    static constexpr double CPU_ALERT = 0.75;
    static constexpr double CPU_HIGH = 0.85;
    static constexpr double RAM_ALERT = 0.70;
    static constexpr double RAM_HIGH = 0.80;
    static constexpr auto THROUGHPUT_WINDOW = std::chrono::seconds{60};

    PerformanceTracker(IMetricsStore& store,
                       const TrackerConfig& config,
                       Logger& logger,
                       UsageSource usage = {});
    ~PerformanceTracker();

    PerformanceTracker(const PerformanceTracker&) = delete;
    PerformanceTracker& operator=(const PerformanceTracker&) = delete;

    // ── Timing ──────────────────────────────

    void start_timing(const TaskId& task_id);

    /**
     * @brief Build a record for @p task_id on @p provider_id and buffer it.
     *
     * Latency is the time since start_timing(), or 0 when the task is not
     * being timed.
     */
    MetricRecord collect_metrics(const TaskId& task_id, const ProviderId& provider_id);

    /// Stop timing and count the outcome against the task's provider.
    void end_timing(const TaskId& task_id, bool success);

    /// Buffer an externally produced record.
    void ingest(MetricRecord record);

    /// Append the buffer to the store. The buffer is kept on failure.
    Result<void> flush();

    // ── Queries ─────────────────────────────

    /// Records within the last @p window_hours, newest first.
    std::vector<MetricRecord> history(const std::optional<ProviderId>& provider,
                                      double window_hours = 24.0);

    TrendResult trend(const ProviderId& provider, Metric metric, size_t window);

    /// First alert found for @p provider, checking latency, error rate, CPU and RAM.
    std::optional<DegradationAlert> detect_degradation(const ProviderId& provider,
                                                       double threshold = 0.2);

    /// Every alert for every provider seen in the last 24 hours.
    std::vector<DegradationAlert> detect_all_degradations(double threshold = 0.2);

    std::vector<ProviderRanking> rankings(Metric metric = Metric::Latency,
                                          std::optional<double> window_hours = std::nullopt);

    /// Delete stored records older than @p days (config retention by default).
    Result<uint64_t> apply_retention(std::optional<uint32_t> days = std::nullopt);

    [[nodiscard]] size_t buffered() const;
    [[nodiscard]] size_t timing_count() const;
    [[nodiscard]] double throughput() const;
    [[nodiscard]] double error_rate(const ProviderId& provider) const;

private:
    struct Outcomes {
        uint64_t completions{0};
        uint64_t errors{0};
    };

    std::vector<DegradationAlert> check_provider(const ProviderId& provider,
                                                 double threshold,
                                                 bool first_only);
    Result<void> flush_locked();
    double throughput_locked(SteadyTime now) const;
    double error_rate_locked(const ProviderId& provider) const;

    IMetricsStore& store_;
    TrackerConfig config_;
    Logger& logger_;
    UsageSource usage_;

    mutable std::mutex mutex_;
    std::map<TaskId, SteadyTime> start_times_;
    std::map<TaskId, ProviderId> task_providers_;
    std::map<ProviderId, Outcomes> outcomes_;
    std::vector<MetricRecord> buffer_;

    SteadyTime window_start_;
    uint64_t window_completed_{0};
};

}  // namespace adaptive_scheduler
