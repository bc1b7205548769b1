/**
 * @file adaptation_orchestrator.hpp
 * @brief Single entry point for monitoring, learning and routing under safety budgets.
 * @author Dimitris Kafetzis
 *
 * The orchestrator owns the PerformanceTracker, ContextLearner and
 * AdaptiveRouter but builds them only on start_monitoring() or on the first
 * call that needs them. It borrows the ResourceMonitor, both stores, the
 * authorizer and the audit sink from its owner (AppContext or a test).
 *
 * trigger_adaptation() gates, in order:
 *   permission_denied           authorizer refused; nothing is mutated
 *   safety_limits_exceeded      usage + adaptation budget would pass a ceiling
 *   rate_limited                last successful adaptation < 5 s ago
 *   max_concurrent_adaptations  2 adaptations already in flight
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/safety.hpp"
#include "core/types.hpp"
#include "learning/context_learner.hpp"
#include "orchestrator/authorizer.hpp"
#include "performance/performance_tracker.hpp"
#include "resource_monitor/resource_monitor.hpp"
#include "routing/adaptive_router.hpp"
#include "storage/knowledge_store.hpp"
#include "storage/metrics_store.hpp"
#include "telemetry/audit_log.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace adaptive_scheduler {

enum class MonitorStatus : uint8_t {
    Ok,
    Throttled,
    PermissionDenied
};

[[nodiscard]] constexpr std::string_view to_string(MonitorStatus status) noexcept {
    switch (status) {
        case MonitorStatus::Ok:               return "ok";
        case MonitorStatus::Throttled:        return "throttled";
        case MonitorStatus::PermissionDenied: return "permission_denied";
    }
    return "unknown";
}

struct MonitorOutcome {
    MonitorStatus status{MonitorStatus::Ok};
    std::string reason;
    std::optional<MetricRecord> metrics;   ///< Set only when status is Ok
    float cpu_percent{0.0f};
    float mem_percent{0.0f};
};

struct OrchestratorStatus {
    bool monitoring_active{false};
    bool components_loaded{false};
    uint64_t adaptation_count{0};
    std::optional<Timestamp> last_adaptation;
    uint32_t concurrent_adaptations{0};

    MonitorState monitor_state{MonitorState::Idle};
    float cpu_percent{0.0f};
    float mem_percent{0.0f};
    Headroom headroom;
    double cpu_limit_proximity{0.0};       ///< current / ceiling
    double mem_limit_proximity{0.0};

    size_t pattern_count{0};
    size_t buffered_metrics{0};
    size_t active_routed_tasks{0};
};

struct MaintenanceReport {
    uint64_t metrics_removed{0};
    size_t patterns_forgotten{0};
    bool metrics_flushed{true};
};

class AdaptationOrchestrator {
public:
    static constexpr std::string_view ACTOR = "adaptation_orchestrator";

    AdaptationOrchestrator(ResourceMonitor& monitor,
                           IMetricsStore& metrics_store,
                           IKnowledgeStore& knowledge_store,
                           IAuthorizer& authorizer,
                           IAuditSink& audit,
                           const Config& config,
                           Logger& logger);
    ~AdaptationOrchestrator();

    AdaptationOrchestrator(const AdaptationOrchestrator&) = delete;
    AdaptationOrchestrator& operator=(const AdaptationOrchestrator&) = delete;

    // ── Lifecycle ────────────────────────────

    void start_monitoring();
    /// Flushes buffered metrics. Components stay loaded.
    void stop_monitoring();
    [[nodiscard]] bool monitoring_active() const noexcept { return monitoring_.load(); }
    [[nodiscard]] bool components_loaded() const;

    // ── Core operations ──────────────────────

    MonitorOutcome monitor_execution(const TaskId& task_id, const ProviderId& provider);

    AdaptationResult trigger_adaptation(const TaskId& task_id,
                                        const std::string& reason,
                                        const std::optional<ProviderId>& alternative = std::nullopt);

    RoutingDecision route_task(const TaskKind& kind, const TaskId& task_id);

    /// Begin timing and load accounting for a task routed to @p provider.
    void task_started(const TaskId& task_id, const TaskKind& kind, const ProviderId& provider);

    /**
     * @brief Record a finished task with tracker, learner and router.
     *
     * When @p observed is absent, the learner is fed the collected record's
     * cpu and latency and the host's used memory.
     */
    MetricRecord task_finished(const TaskId& task_id,
                               const TaskKind& kind,
                               const ProviderId& provider,
                               bool success,
                               const std::optional<ExecutionMetrics>& observed = std::nullopt);

    /// Degradation alerts for one provider, or for all when @p provider is empty.
    std::vector<DegradationAlert> check_degradation(const std::optional<ProviderId>& provider = std::nullopt);

    // ── Management queries ───────────────────

    OrchestratorStatus status();
    std::vector<ScoredPattern> patterns(const TaskKind& kind);
    std::vector<ProviderRanking> rankings(Metric metric = Metric::Latency);
    Insights insights(size_t window = 100);
    std::optional<Recommendation> recommend(const TaskKind& kind,
                                            const std::optional<ResourceConstraints>& constraints = std::nullopt);
    std::vector<AdaptationRecord> adaptation_history(size_t n = 20);

    /// Retention sweep over stored metrics plus a stale-pattern sweep.
    MaintenanceReport run_maintenance();

    // ── Component access (builds lazily) ─────

    PerformanceTracker& tracker();
    ContextLearner& learner();
    AdaptiveRouter& router();

    /// Overrides the in-flight adaptation count. Intended for tests.
    void set_concurrent_adaptations(uint32_t count) noexcept { concurrent_adaptations_.store(count); }
    [[nodiscard]] uint32_t concurrent_adaptations() const noexcept { return concurrent_adaptations_.load(); }
    [[nodiscard]] uint64_t adaptation_count() const;

private:
    void ensure_components();
    bool safe_to_monitor(const ResourceSample& sample) const noexcept;
    bool safe_to_adapt(const ResourceSample& sample) const noexcept;
    void emit(AuditEvent event) noexcept;
    AdaptationResult reject(const TaskId& task_id,
                            std::string reason,
                            std::map<std::string, std::string> details);

    ResourceMonitor& monitor_;
    IMetricsStore& metrics_store_;
    IKnowledgeStore& knowledge_store_;
    IAuthorizer& authorizer_;
    IAuditSink& audit_;
    Config config_;
    Logger& logger_;

    mutable std::mutex components_mutex_;
    std::unique_ptr<PerformanceTracker> tracker_;
    std::unique_ptr<ContextLearner> learner_;
    std::unique_ptr<AdaptiveRouter> router_;

    std::atomic<bool> monitoring_{false};
    std::atomic<uint32_t> concurrent_adaptations_{0};

    mutable std::mutex adaptation_mutex_;
    uint64_t adaptation_count_{0};
    std::optional<SteadyTime> last_adaptation_;
    std::optional<Timestamp> last_adaptation_wall_;
};

}  // namespace adaptive_scheduler
