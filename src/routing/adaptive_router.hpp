/**
 * @file adaptive_router.hpp
 * @brief Provider selection, fallback chains and live provider switching.
 * @author Dimitris Kafetzis
 *
 * Routing tiers, first match wins:
 *   1. learned_pattern      learner recommendation with confidence > 0.7
 *                           on a usable provider
 *   2. performance_ranking  first usable provider in the latency ranking
 *                           that is under its load ceiling (confidence 0.6)
 *   3. default_fallback     the configured default provider (confidence 0.3)
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "learning/context_learner.hpp"
#include "performance/performance_tracker.hpp"
#include "routing/provider_health.hpp"
#include "storage/knowledge.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace adaptive_scheduler {

struct RoutingDecision {
    ProviderId provider_id;
    std::vector<ProviderId> fallback_chain;    ///< Primary first, unique, ends with the default
    std::string reason;
    double confidence{0.0};
    std::optional<ResourceProfile> estimated_resources;
    TaskId task_id;
};

/**
 * @brief Outcome of an adaptation attempt.
 *
 * reason is a machine-readable tag (e.g. "switched_latency_spike",
 * "task_not_found", "rate_limited").
 */
struct AdaptationResult {
    bool success{false};
    std::string reason;
    std::map<std::string, std::string> details;
    Timestamp timestamp{std::chrono::system_clock::now()};
};

/// "k=v, k=v" rendering of AdaptationResult::details.
[[nodiscard]] std::string format_details(const std::map<std::string, std::string>& details);

struct SwitchDecision {
    bool should_switch{false};
    std::string reason;
};

struct RouterStats {
    size_t active_tasks{0};
    std::map<ProviderId, uint32_t> load;
    std::map<ProviderId, ProviderHealth> health;
    size_t healthy_providers{0};
};

class AdaptiveRouter {
public:
    static constexpr double LEARNED_CONFIDENCE = 0.7;
    static constexpr double RANKING_CONFIDENCE = 0.6;
    static constexpr double DEFAULT_CONFIDENCE = 0.3;
    static constexpr double BALANCE_CONFIDENCE = 0.5;
    static constexpr size_t BALANCE_RANKING_CANDIDATES = 5;

    AdaptiveRouter(ContextLearner& learner,
                   PerformanceTracker& tracker,
                   const RouterConfig& config,
                   Logger& logger);

    AdaptiveRouter(const AdaptiveRouter&) = delete;
    AdaptiveRouter& operator=(const AdaptiveRouter&) = delete;

    RoutingDecision route(const TaskKind& kind, const TaskId& task_id);

    void update_health(const ProviderId& provider,
                       bool success,
                       std::optional<double> response_time = std::nullopt);

    /// Whether @p task_id should move off its provider given fresh metrics.
    SwitchDecision should_switch(const TaskId& task_id, const MetricRecord& current);

    /// Move a running task to @p alternative or to the next usable provider.
    AdaptationResult adapt(const TaskId& task_id,
                           const std::string& reason,
                           const std::optional<ProviderId>& alternative = std::nullopt);

    /// Least-loaded usable provider among @p candidates (or learned/ranked ones),
    /// else the default provider.
    ProviderId load_balance(
        const TaskKind& kind,
        const std::optional<std::vector<ProviderId>>& candidates = std::nullopt);

    void register_start(const TaskId& task_id, const ProviderId& provider, const TaskKind& kind);
    void register_completion(const TaskId& task_id,
                             bool success,
                             std::optional<double> response_time = std::nullopt);

    [[nodiscard]] ProviderHealth health(const ProviderId& provider) const;
    [[nodiscard]] std::optional<ProviderId> active_provider(const TaskId& task_id) const;
    [[nodiscard]] std::optional<double> baseline_latency(const ProviderId& provider) const;
    [[nodiscard]] uint32_t load(const ProviderId& provider) const;
    [[nodiscard]] RouterStats stats() const;

private:
    struct ActiveTask {
        ProviderId provider;
        TaskKind kind;
        Timestamp started_at;
    };

    [[nodiscard]] bool usable_locked(const ProviderId& provider) const;
    [[nodiscard]] bool has_capacity_locked(const ProviderId& provider) const;
    [[nodiscard]] std::vector<ProviderId> build_chain_locked(
        const ProviderId& primary, const std::vector<ScoredPattern>& patterns) const;
    void update_health_locked(const ProviderId& provider,
                              bool success,
                              std::optional<double> response_time);
    void increment_load_locked(const ProviderId& provider);
    void decrement_load_locked(const ProviderId& provider);

    ContextLearner& learner_;
    PerformanceTracker& tracker_;
    RouterConfig config_;
    Logger& logger_;

    mutable std::mutex mutex_;
    std::map<ProviderId, ProviderHealth> health_;
    std::map<TaskId, ActiveTask> active_;
    std::map<ProviderId, uint32_t> load_;
    std::map<ProviderId, double> baseline_latency_;
};

}  // namespace adaptive_scheduler
