/**
 * @file knowledge.hpp
 * @brief Learned execution patterns and adaptation outcomes.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace adaptive_scheduler {

/// Units: cpu as a fraction of one host, ram in MB, duration in seconds.
struct ResourceProfile {
    double avg_cpu{0.0};
    double avg_ram{0.0};
    double avg_duration{0.0};
    uint64_t sample_count{0};
};

/**
 * @brief What the learner knows about one (task kind, provider) pair.
 */
struct Pattern {
    TaskKind task_kind;
    ProviderId provider_id;
    uint64_t execution_count{0};
    double success_rate{0.5};
    ResourceProfile resource_profile;
    Timestamp last_updated{};
};

using PatternKey = std::pair<TaskKind, ProviderId>;

struct AdaptationRecord {
    TaskId task_id;
    bool success{false};
    std::string reason;
    std::string details;
    Timestamp timestamp{};
};

/**
 * @brief Everything the learner persists, saved and loaded as one document.
 */
struct KnowledgeSnapshot {
    std::map<PatternKey, Pattern> patterns;
    std::vector<AdaptationRecord> adaptations;     ///< Oldest first
};

}  // namespace adaptive_scheduler
