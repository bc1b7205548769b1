/**
 * @file performance_tracker.cpp
 * @brief PerformanceTracker implementation.
 * @author Dimitris Kafetzis
 */

#include "performance/performance_tracker.hpp"

#include <algorithm>
#include <cstdio>
#include <set>

namespace adaptive_scheduler {

namespace {

constexpr size_t HISTORY_QUERY_LIMIT = 100000;

std::string format_ratio(double current, double baseline) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "current %.4f vs baseline %.4f", current, baseline);
    return buf;
}

std::string format_value(std::string_view label, double value, double limit) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "%.*s %.3f above %.3f",
                  static_cast<int>(label.size()), label.data(), value, limit);
    return buf;
}

}  // namespace

PerformanceTracker::PerformanceTracker(IMetricsStore& store,
                                       const TrackerConfig& config,
                                       Logger& logger,
                                       UsageSource usage)
    : store_(store)
    , config_(config)
    , logger_(logger)
    , usage_(std::move(usage))
    , window_start_(std::chrono::steady_clock::now()) {
    buffer_.reserve(config_.buffer_size);
}

PerformanceTracker::~PerformanceTracker() {
    std::lock_guard lock(mutex_);
    if (buffer_.empty()) return;
    if (auto r = flush_locked(); !r) {
        logger_.warn("Dropping " + std::to_string(buffer_.size())
                     + " buffered metrics on shutdown: " + r.error().message);
    }
}

// ─────────────────────────────────────────────
// Timing
// ─────────────────────────────────────────────

void PerformanceTracker::start_timing(const TaskId& task_id) {
    std::lock_guard lock(mutex_);
    start_times_[task_id] = std::chrono::steady_clock::now();
}

MetricRecord PerformanceTracker::collect_metrics(const TaskId& task_id,
                                                 const ProviderId& provider_id) {
    // Read usage before taking the lock; the source may sample the host
    ResourceSample usage{};
    if (usage_) usage = usage_();

    std::lock_guard lock(mutex_);
    const auto now = std::chrono::steady_clock::now();

    MetricRecord rec;
    rec.task_id = task_id;
    rec.provider_id = provider_id;
    rec.timestamp = std::chrono::system_clock::now();
    if (auto it = start_times_.find(task_id); it != start_times_.end()) {
        rec.latency = std::chrono::duration<double>(now - it->second).count();
    }
    rec.cpu_usage = static_cast<double>(usage.cpu_percent) / 100.0;
    rec.ram_usage = static_cast<double>(usage.mem_percent) / 100.0;
    rec.throughput = throughput_locked(now);
    rec.error_rate = error_rate_locked(provider_id);
    rec.queue_depth = static_cast<uint32_t>(start_times_.size());

    task_providers_[task_id] = provider_id;

    buffer_.push_back(rec);
    if (buffer_.size() >= config_.buffer_size) {
        if (auto r = flush_locked(); !r) {
            logger_.warn("Metrics flush failed, keeping " + std::to_string(buffer_.size())
                         + " records buffered: " + r.error().message);
        }
    }
    return rec;
}

void PerformanceTracker::end_timing(const TaskId& task_id, bool success) {
    std::lock_guard lock(mutex_);

    auto it = start_times_.find(task_id);
    if (it == start_times_.end()) {
        logger_.warn("end_timing for untimed task " + task_id);
        return;
    }
    start_times_.erase(it);

    ProviderId provider = "unknown";
    if (auto p = task_providers_.find(task_id); p != task_providers_.end()) {
        provider = p->second;
        task_providers_.erase(p);
    }

    auto& outcome = outcomes_[provider];
    if (success) {
        ++outcome.completions;
    } else {
        ++outcome.errors;
    }

    const auto now = std::chrono::steady_clock::now();
    if (now - window_start_ > THROUGHPUT_WINDOW) {
        window_start_ = now;
        window_completed_ = 0;
    }
    if (success) ++window_completed_;
}

void PerformanceTracker::ingest(MetricRecord record) {
    std::lock_guard lock(mutex_);
    buffer_.push_back(std::move(record));
    if (buffer_.size() >= config_.buffer_size) {
        if (auto r = flush_locked(); !r) {
            logger_.warn("Metrics flush failed, keeping " + std::to_string(buffer_.size())
                         + " records buffered: " + r.error().message);
        }
    }
}

Result<void> PerformanceTracker::flush() {
    std::lock_guard lock(mutex_);
    return flush_locked();
}

Result<void> PerformanceTracker::flush_locked() {
    if (buffer_.empty()) return {};

    auto r = store_.append(buffer_);
    if (!r) return r;

    logger_.debug("Flushed " + std::to_string(buffer_.size()) + " metric records");
    buffer_.clear();
    return {};
}

double PerformanceTracker::throughput_locked(SteadyTime now) const {
    const double elapsed = std::chrono::duration<double>(now - window_start_).count();
    if (elapsed < 1.0) return 0.0;
    return static_cast<double>(window_completed_) / elapsed;
}

double PerformanceTracker::error_rate_locked(const ProviderId& provider) const {
    auto it = outcomes_.find(provider);
    if (it == outcomes_.end()) return 0.0;
    const auto total = it->second.completions + it->second.errors;
    if (total == 0) return 0.0;
    return static_cast<double>(it->second.errors) / static_cast<double>(total);
}

size_t PerformanceTracker::buffered() const {
    std::lock_guard lock(mutex_);
    return buffer_.size();
}

size_t PerformanceTracker::timing_count() const {
    std::lock_guard lock(mutex_);
    return start_times_.size();
}

double PerformanceTracker::throughput() const {
    std::lock_guard lock(mutex_);
    return throughput_locked(std::chrono::steady_clock::now());
}

double PerformanceTracker::error_rate(const ProviderId& provider) const {
    std::lock_guard lock(mutex_);
    return error_rate_locked(provider);
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

std::vector<MetricRecord> PerformanceTracker::history(const std::optional<ProviderId>& provider,
                                                      double window_hours) {
    const auto now = std::chrono::system_clock::now();
    const auto start = now - std::chrono::duration_cast<std::chrono::system_clock::duration>(
                                 std::chrono::duration<double, std::ratio<3600>>(window_hours));

    std::vector<MetricRecord> out;
    {
        std::lock_guard lock(mutex_);
        for (const auto& rec : buffer_) {
            if (provider && rec.provider_id != *provider) continue;
            if (rec.timestamp < start) continue;
            out.push_back(rec);
        }
    }

    MetricQuery q;
    q.provider = provider;
    q.start = start;
    q.limit = HISTORY_QUERY_LIMIT;
    if (auto stored = store_.query(q)) {
        auto& rows = stored.value();
        out.insert(out.end(), rows.begin(), rows.end());
    } else {
        logger_.warn("Metrics query failed, using buffered records only: "
                     + stored.error().message);
    }

    std::stable_sort(out.begin(), out.end(), [](const MetricRecord& a, const MetricRecord& b) {
        return a.timestamp > b.timestamp;
    });
    return out;
}

TrendResult PerformanceTracker::trend(const ProviderId& provider, Metric metric, size_t window) {
    auto records = history(provider);
    std::reverse(records.begin(), records.end());
    auto values = extract(records, metric);
    return classify_trend(values, metric, window);
}

std::optional<DegradationAlert> PerformanceTracker::detect_degradation(const ProviderId& provider,
                                                                       double threshold) {
    auto alerts = check_provider(provider, threshold, true);
    if (alerts.empty()) return std::nullopt;
    return alerts.front();
}

std::vector<DegradationAlert> PerformanceTracker::detect_all_degradations(double threshold) {
    std::set<ProviderId> providers;
    for (const auto& rec : history(std::nullopt)) providers.insert(rec.provider_id);

    std::vector<DegradationAlert> out;
    for (const auto& provider : providers) {
        auto alerts = check_provider(provider, threshold, false);
        out.insert(out.end(), alerts.begin(), alerts.end());
    }
    return out;
}

std::vector<DegradationAlert> PerformanceTracker::check_provider(const ProviderId& provider,
                                                                 double threshold,
                                                                 bool first_only) {
    auto records = history(provider);
    std::vector<DegradationAlert> alerts;
    if (records.empty()) return alerts;

    std::reverse(records.begin(), records.end());
    const auto now = std::chrono::system_clock::now();

    auto raise = [&](Metric metric, Severity severity, double current, double baseline,
                     std::string details) {
        alerts.push_back(DegradationAlert{
            .provider_id = provider,
            .metric = metric,
            .severity = severity,
            .current = current,
            .baseline = baseline,
            .details = std::move(details),
            .timestamp = now,
        });
    };

    auto recent_mean = [&](Metric metric) {
        auto values = extract(records, metric);
        const size_t n = std::min(RECENT_WINDOW, values.size());
        return mean(std::span<const double>(values).last(n));
    };

    // Latency: needs a confident upward trend and a step over the baseline
    auto latencies = extract(records, Metric::Latency);
    if (latencies.size() >= MIN_DEGRADATION_SAMPLES) {
        auto tr = classify_trend(latencies, Metric::Latency, config_.degradation_window);
        if (tr.slope > 0.0 && tr.confidence > MIN_TREND_CONFIDENCE) {
            std::span<const double> all(latencies);
            const double recent = mean(all.last(RECENT_WINDOW));
            auto older = all.first(all.size() - RECENT_WINDOW);
            const double baseline = mean(older.last(std::min(BASELINE_WINDOW, older.size())));
            if (baseline > 0.0 && recent > baseline * (1.0 + threshold)) {
                const auto severity = recent > baseline * 1.5 ? Severity::High : Severity::Medium;
                raise(Metric::Latency, severity, recent, baseline,
                      "latency increased: " + format_ratio(recent, baseline));
                if (first_only) return alerts;
            }
        }
    }

    const double errors = recent_mean(Metric::ErrorRate);
    if (errors > ERROR_RATE_ALERT) {
        raise(Metric::ErrorRate,
              errors > ERROR_RATE_CRITICAL ? Severity::Critical : Severity::High,
              errors, ERROR_RATE_ALERT, format_value("error rate", errors, ERROR_RATE_ALERT));
        if (first_only) return alerts;
    }

    const double cpu = recent_mean(Metric::CpuUsage);
    if (cpu > CPU_ALERT) {
        raise(Metric::CpuUsage, cpu > CPU_HIGH ? Severity::High : Severity::Medium,
              cpu, CPU_ALERT, format_value("cpu usage", cpu, CPU_ALERT));
        if (first_only) return alerts;
    }

    const double ram = recent_mean(Metric::RamUsage);
    if (ram > RAM_ALERT) {
        raise(Metric::RamUsage, ram > RAM_HIGH ? Severity::High : Severity::Medium,
              ram, RAM_ALERT, format_value("ram usage", ram, RAM_ALERT));
    }
    return alerts;
}

std::vector<ProviderRanking> PerformanceTracker::rankings(Metric metric,
                                                          std::optional<double> window_hours) {
    const double hours = window_hours.value_or(static_cast<double>(config_.ranking_window_hours));
    auto records = history(std::nullopt, hours);
    std::reverse(records.begin(), records.end());

    std::map<ProviderId, std::vector<MetricRecord>> grouped;
    for (auto& rec : records) grouped[rec.provider_id].push_back(std::move(rec));

    std::vector<ProviderRanking> out;
    out.reserve(grouped.size());
    for (const auto& [provider, recs] : grouped) {
        ProviderRanking r;
        r.provider_id = provider;
        r.samples = recs.size();

        auto avg = [&recs](Metric m) {
            auto values = extract(recs, m);
            return mean(values);
        };
        r.avg_latency = avg(Metric::Latency);
        r.avg_cpu = avg(Metric::CpuUsage);
        r.avg_ram = avg(Metric::RamUsage);
        r.avg_throughput = avg(Metric::Throughput);
        r.avg_error_rate = avg(Metric::ErrorRate);
        r.avg_queue_depth = avg(Metric::QueueDepth);

        const double value = avg(metric);
        r.score = higher_is_better(metric) ? -value : value;

        auto values = extract(recs, metric);
        const size_t window = std::min<size_t>(values.size(), config_.trend_window);
        auto tr = classify_trend(values, metric, window);
        r.trend = tr.direction;
        r.trend_confidence = tr.confidence;

        out.push_back(std::move(r));
    }

    std::stable_sort(out.begin(), out.end(), [](const ProviderRanking& a, const ProviderRanking& b) {
        return a.score < b.score;
    });
    return out;
}

Result<uint64_t> PerformanceTracker::apply_retention(std::optional<uint32_t> days) {
    const auto keep = std::chrono::hours{24} * days.value_or(config_.retention_days);
    const auto cutoff = std::chrono::system_clock::now() - keep;

    auto removed = store_.delete_older_than(cutoff);
    if (!removed) {
        logger_.warn("Metrics retention sweep failed: " + removed.error().message);
        return removed;
    }
    if (removed.value() > 0) {
        logger_.info("Retention removed " + std::to_string(removed.value()) + " metric records");
    }
    return removed;
}

}  // namespace adaptive_scheduler
