/**
 * @file metric_record.hpp
 * @brief Per-task performance observation and per-provider running aggregate.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <string>

namespace adaptive_scheduler {

/**
 * @brief One observation of a task on a provider. Append-only once stored.
 *
 * Units: latency in seconds, cpu/ram usage as fractions [0, 1], throughput
 * in tasks per second, error_rate as a fraction.
 */
struct MetricRecord {
    TaskId task_id;
    ProviderId provider_id;
    Timestamp timestamp{};

    double latency{0.0};
    double cpu_usage{0.0};
    double ram_usage{0.0};
    double throughput{0.0};
    double error_rate{0.0};
    uint32_t queue_depth{0};

    std::map<std::string, std::string> metadata;
};

/**
 * @brief Running means over every record stored for one provider.
 */
struct ProviderSummary {
    ProviderId provider_id;
    uint64_t total_tasks{0};
    double avg_latency{0.0};
    double avg_cpu{0.0};
    double avg_ram{0.0};
    double error_rate{0.0};
    Timestamp last_updated{};
};

/// Fold one record into a summary: new_mean = (old_mean * n + x) / (n + 1).
inline void accumulate(ProviderSummary& summary, const MetricRecord& record) {
    const double n = static_cast<double>(summary.total_tasks);
    const double next = n + 1.0;
    summary.avg_latency = (summary.avg_latency * n + record.latency) / next;
    summary.avg_cpu = (summary.avg_cpu * n + record.cpu_usage) / next;
    summary.avg_ram = (summary.avg_ram * n + record.ram_usage) / next;
    summary.error_rate = (summary.error_rate * n + record.error_rate) / next;
    summary.total_tasks += 1;
    summary.last_updated = record.timestamp;
}

}  // namespace adaptive_scheduler
