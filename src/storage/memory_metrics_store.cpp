/**
 * @file memory_metrics_store.cpp
 * @brief InMemoryMetricsStore implementation.
 * @author Dimitris Kafetzis
 */

#include "storage/metrics_store.hpp"

#include <algorithm>
#include <set>

namespace adaptive_scheduler {

Result<void> InMemoryMetricsStore::append(const std::vector<MetricRecord>& records) {
    std::lock_guard lock(mutex_);
    if (failing_) return Error{"in-memory metrics store configured to fail"};

    for (const auto& rec : records) {
        records_.push_back(rec);
        auto& summary = summaries_[rec.provider_id];
        summary.provider_id = rec.provider_id;
        accumulate(summary, rec);
    }
    return {};
}

Result<std::vector<MetricRecord>> InMemoryMetricsStore::query(const MetricQuery& q) {
    std::lock_guard lock(mutex_);
    if (failing_) return Error{"in-memory metrics store configured to fail"};

    std::vector<MetricRecord> out;
    // Walk backwards so that equal timestamps keep newest-inserted first
    for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
        const auto& rec = *it;
        if (q.provider && rec.provider_id != *q.provider) continue;
        if (q.task && rec.task_id != *q.task) continue;
        if (q.start && rec.timestamp < *q.start) continue;
        if (q.end && rec.timestamp > *q.end) continue;
        out.push_back(rec);
    }

    std::stable_sort(out.begin(), out.end(), [](const MetricRecord& a, const MetricRecord& b) {
        return a.timestamp > b.timestamp;
    });
    if (out.size() > q.limit) out.resize(q.limit);
    return out;
}

Result<std::optional<ProviderSummary>> InMemoryMetricsStore::summary(const ProviderId& provider) {
    std::lock_guard lock(mutex_);
    if (failing_) return Error{"in-memory metrics store configured to fail"};

    if (auto it = summaries_.find(provider); it != summaries_.end()) {
        return std::optional<ProviderSummary>{it->second};
    }
    return std::optional<ProviderSummary>{};
}

Result<std::vector<ProviderSummary>> InMemoryMetricsStore::summaries() {
    std::lock_guard lock(mutex_);
    if (failing_) return Error{"in-memory metrics store configured to fail"};

    std::vector<ProviderSummary> out;
    out.reserve(summaries_.size());
    for (const auto& [id, summary] : summaries_) out.push_back(summary);
    return out;
}

Result<uint64_t> InMemoryMetricsStore::delete_older_than(Timestamp cutoff) {
    std::lock_guard lock(mutex_);
    if (failing_) return Error{"in-memory metrics store configured to fail"};

    auto before = records_.size();
    std::erase_if(records_, [cutoff](const MetricRecord& r) { return r.timestamp < cutoff; });
    return static_cast<uint64_t>(before - records_.size());
}

Result<MetricsStoreStats> InMemoryMetricsStore::stats() {
    std::lock_guard lock(mutex_);
    if (failing_) return Error{"in-memory metrics store configured to fail"};

    MetricsStoreStats out;
    out.record_count = records_.size();

    std::set<ProviderId> providers;
    std::set<TaskId> tasks;
    for (const auto& rec : records_) {
        providers.insert(rec.provider_id);
        tasks.insert(rec.task_id);
        if (!out.oldest || rec.timestamp < *out.oldest) out.oldest = rec.timestamp;
        if (!out.newest || rec.timestamp > *out.newest) out.newest = rec.timestamp;
    }
    out.provider_count = providers.size();
    out.task_count = tasks.size();
    return out;
}

void InMemoryMetricsStore::set_failing(bool failing) {
    std::lock_guard lock(mutex_);
    failing_ = failing;
}

size_t InMemoryMetricsStore::size() const {
    std::lock_guard lock(mutex_);
    return records_.size();
}

}  // namespace adaptive_scheduler
