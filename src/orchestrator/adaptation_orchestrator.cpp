/**
 * @file adaptation_orchestrator.cpp
 * @brief AdaptationOrchestrator implementation.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/adaptation_orchestrator.hpp"

#include <cstdio>
#include <exception>

namespace adaptive_scheduler {

namespace {

std::string format_percent(float value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", static_cast<double>(value));
    return buf;
}

/// Releases an in-flight adaptation slot on every exit path.
class AdaptationSlot {
public:
    explicit AdaptationSlot(std::atomic<uint32_t>& counter) : counter_(counter) {}
    ~AdaptationSlot() { counter_.fetch_sub(1); }

    AdaptationSlot(const AdaptationSlot&) = delete;
    AdaptationSlot& operator=(const AdaptationSlot&) = delete;

private:
    std::atomic<uint32_t>& counter_;
};

}  // anonymous namespace

AdaptationOrchestrator::AdaptationOrchestrator(ResourceMonitor& monitor,
                                               IMetricsStore& metrics_store,
                                               IKnowledgeStore& knowledge_store,
                                               IAuthorizer& authorizer,
                                               IAuditSink& audit,
                                               const Config& config,
                                               Logger& logger)
    : monitor_(monitor)
    , metrics_store_(metrics_store)
    , knowledge_store_(knowledge_store)
    , authorizer_(authorizer)
    , audit_(audit)
    , config_(config)
    , logger_(logger) {
    logger_.info("Adaptation orchestrator created (components load on first use)");
}

AdaptationOrchestrator::~AdaptationOrchestrator() {
    stop_monitoring();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

void AdaptationOrchestrator::ensure_components() {
    std::lock_guard lock(components_mutex_);
    if (tracker_) return;

    logger_.info("Initializing adaptation components");
    tracker_ = std::make_unique<PerformanceTracker>(
        metrics_store_, config_.tracker, logger_, [this] { return monitor_.sample(); });
    learner_ = std::make_unique<ContextLearner>(knowledge_store_, config_.learner, logger_);
    router_ = std::make_unique<AdaptiveRouter>(*learner_, *tracker_, config_.router, logger_);
}

bool AdaptationOrchestrator::components_loaded() const {
    std::lock_guard lock(components_mutex_);
    return tracker_ != nullptr;
}

void AdaptationOrchestrator::start_monitoring() {
    if (monitoring_.exchange(true)) {
        logger_.warn("Adaptation monitoring already active");
        return;
    }
    ensure_components();
    logger_.info("Adaptation monitoring started");
}

void AdaptationOrchestrator::stop_monitoring() {
    if (!monitoring_.exchange(false)) return;

    PerformanceTracker* tracker = nullptr;
    {
        std::lock_guard lock(components_mutex_);
        tracker = tracker_.get();
    }
    if (tracker) {
        if (auto r = tracker->flush(); !r) {
            logger_.warn("Metrics flush on stop failed: " + r.error().message);
        }
    }
    logger_.info("Adaptation monitoring stopped");
}

PerformanceTracker& AdaptationOrchestrator::tracker() {
    ensure_components();
    return *tracker_;
}

ContextLearner& AdaptationOrchestrator::learner() {
    ensure_components();
    return *learner_;
}

AdaptiveRouter& AdaptationOrchestrator::router() {
    ensure_components();
    return *router_;
}

// ─────────────────────────────────────────────
// Safety
// ─────────────────────────────────────────────

bool AdaptationOrchestrator::safe_to_monitor(const ResourceSample& sample) const noexcept {
    return sample.cpu_percent < safety::CPU_CEILING_PERCENT - safety::MONITOR_BUFFER_PERCENT
        && sample.mem_percent < safety::MEM_CEILING_PERCENT - safety::MONITOR_BUFFER_PERCENT;
}

bool AdaptationOrchestrator::safe_to_adapt(const ResourceSample& sample) const noexcept {
    float mem_budget_percent = 0.0f;
    if (sample.mem_total_bytes > 0) {
        mem_budget_percent = static_cast<float>(
            100.0 * static_cast<double>(safety::ADAPTATION_MEM_BUDGET_BYTES)
            / static_cast<double>(sample.mem_total_bytes));
    }
    return sample.cpu_percent + safety::ADAPTATION_CPU_BUDGET_PERCENT <= safety::CPU_CEILING_PERCENT
        && sample.mem_percent + mem_budget_percent <= safety::MEM_CEILING_PERCENT;
}

void AdaptationOrchestrator::emit(AuditEvent event) noexcept {
    try {
        audit_.record(event);
    } catch (const std::exception& e) {
        logger_.warn(std::string{"Audit emission failed: "} + e.what());
    } catch (...) {
        logger_.warn("Audit emission failed with a non-standard exception");
    }
}

// ─────────────────────────────────────────────
// Core operations
// ─────────────────────────────────────────────

MonitorOutcome AdaptationOrchestrator::monitor_execution(const TaskId& task_id,
                                                         const ProviderId& provider) {
    MonitorOutcome out;

    auto auth = authorizer_.authorize("monitor_execution", provider);
    if (!auth.allowed) {
        out.status = MonitorStatus::PermissionDenied;
        out.reason = auth.reason;
        return out;
    }

    const auto sample = monitor_.sample();
    out.cpu_percent = sample.cpu_percent;
    out.mem_percent = sample.mem_percent;

    if (!safe_to_monitor(sample)) {
        out.status = MonitorStatus::Throttled;
        out.reason = "resource_limits";
        logger_.info("Monitoring of " + task_id + " throttled (cpu " + format_percent(sample.cpu_percent)
                     + "%, mem " + format_percent(sample.mem_percent) + "%)");
        return out;
    }

    if (!monitoring_.load()) start_monitoring();

    out.metrics = tracker().collect_metrics(task_id, provider);
    out.status = MonitorStatus::Ok;
    return out;
}

AdaptationResult AdaptationOrchestrator::reject(const TaskId& task_id,
                                                std::string reason,
                                                std::map<std::string, std::string> details) {
    AdaptationResult result{.success = false, .reason = std::move(reason), .details = std::move(details)};
    logger_.info("Adaptation of " + task_id + " rejected: " + result.reason);
    emit(AuditEvent{
        .actor = std::string{ACTOR},
        .action = "trigger_adaptation",
        .resource = task_id,
        .result = result.reason,
        .provider = std::nullopt,
        .details = result.details,
    });
    return result;
}

AdaptationResult AdaptationOrchestrator::trigger_adaptation(const TaskId& task_id,
                                                            const std::string& reason,
                                                            const std::optional<ProviderId>& alternative) {
    auto auth = authorizer_.authorize("trigger_adaptation", alternative);
    if (!auth.allowed) {
        return reject(task_id, "permission_denied", {{"reason", auth.reason}});
    }

    const auto sample = monitor_.sample();
    if (!safe_to_adapt(sample)) {
        return reject(task_id, "safety_limits_exceeded",
                      {{"cpu", format_percent(sample.cpu_percent)},
                       {"ram", format_percent(sample.mem_percent)},
                       {"cpu_limit", format_percent(safety::CPU_CEILING_PERCENT)},
                       {"ram_limit", format_percent(safety::MEM_CEILING_PERCENT)}});
    }

    // Gates are decided under the lock; rejection logging and audit run after it is released
    std::string gate;
    std::map<std::string, std::string> gate_details;
    SteadyTime reserved_at;
    std::optional<SteadyTime> previous_adaptation;
    {
        std::lock_guard lock(adaptation_mutex_);
        reserved_at = std::chrono::steady_clock::now();
        const auto in_flight = concurrent_adaptations_.load();
        if (last_adaptation_ && reserved_at - *last_adaptation_ < safety::MIN_ADAPTATION_INTERVAL) {
            const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                reserved_at - *last_adaptation_).count();
            gate = "rate_limited";
            gate_details = {{"since_last_ms", std::to_string(ms)},
                            {"min_interval_s", std::to_string(safety::MIN_ADAPTATION_INTERVAL.count())}};
        } else if (in_flight >= safety::MAX_CONCURRENT_ADAPTATIONS) {
            gate = "max_concurrent_adaptations";
            gate_details = {{"current", std::to_string(in_flight)},
                            {"max", std::to_string(safety::MAX_CONCURRENT_ADAPTATIONS)}};
        } else {
            // Reserve the rate window now so a concurrent caller sees it
            previous_adaptation = last_adaptation_;
            last_adaptation_ = reserved_at;
            concurrent_adaptations_.fetch_add(1);
        }
    }
    if (!gate.empty()) {
        return reject(task_id, std::move(gate), std::move(gate_details));
    }

    AdaptationResult result;
    {
        AdaptationSlot slot(concurrent_adaptations_);
        if (!monitoring_.load()) start_monitoring();
        result = router().adapt(task_id, reason, alternative);
    }

    {
        std::lock_guard lock(adaptation_mutex_);
        if (result.success) {
            ++adaptation_count_;
            last_adaptation_wall_ = result.timestamp;
        } else if (last_adaptation_ == reserved_at) {
            // A failed switch does not consume the rate window
            last_adaptation_ = previous_adaptation;
        }
    }

    learner().record_adaptation(AdaptationRecord{
        .task_id = task_id,
        .success = result.success,
        .reason = result.reason,
        .details = format_details(result.details),
        .timestamp = result.timestamp,
    });

    std::optional<ProviderId> new_provider;
    if (auto it = result.details.find("new_provider"); it != result.details.end()) {
        new_provider = it->second;
    }
    emit(AuditEvent{
        .actor = std::string{ACTOR},
        .action = "switch_provider",
        .resource = task_id,
        .result = result.reason,
        .provider = new_provider,
        .details = result.details,
    });
    return result;
}

RoutingDecision AdaptationOrchestrator::route_task(const TaskKind& kind, const TaskId& task_id) {
    auto decision = router().route(kind, task_id);

    std::string chain;
    for (const auto& p : decision.fallback_chain) {
        if (!chain.empty()) chain += ">";
        chain += p;
    }
    emit(AuditEvent{
        .actor = std::string{ACTOR},
        .action = "route",
        .resource = task_id,
        .result = decision.reason,
        .provider = decision.provider_id,
        .details = {{"kind", kind},
                    {"confidence", std::to_string(decision.confidence)},
                    {"fallback_chain", chain}},
    });
    return decision;
}

void AdaptationOrchestrator::task_started(const TaskId& task_id,
                                          const TaskKind& kind,
                                          const ProviderId& provider) {
    tracker().start_timing(task_id);
    router().register_start(task_id, provider, kind);
}

MetricRecord AdaptationOrchestrator::task_finished(const TaskId& task_id,
                                                   const TaskKind& kind,
                                                   const ProviderId& provider,
                                                   bool success,
                                                   const std::optional<ExecutionMetrics>& observed) {
    auto record = tracker().collect_metrics(task_id, provider);
    tracker().end_timing(task_id, success);

    ExecutionMetrics metrics;
    if (observed) {
        metrics = *observed;
    } else {
        const auto sample = monitor_.sample();
        metrics.cpu = record.cpu_usage;
        metrics.ram_mb = static_cast<double>(sample.mem_used_bytes) / (1024.0 * 1024.0);
        metrics.duration_s = record.latency;
    }
    learner().record_execution(kind, provider, metrics, success);
    router().register_completion(task_id, success, record.latency);
    return record;
}

std::vector<DegradationAlert> AdaptationOrchestrator::check_degradation(
    const std::optional<ProviderId>& provider) {
    std::vector<DegradationAlert> alerts;
    if (provider) {
        if (auto alert = tracker().detect_degradation(*provider)) alerts.push_back(*alert);
    } else {
        alerts = tracker().detect_all_degradations();
    }

    for (const auto& alert : alerts) {
        logger_.warn("Degradation on " + alert.provider_id + ": "
                     + std::string{to_string(alert.metric)} + " ("
                     + std::string{to_string(alert.severity)} + ") " + alert.details);
        emit(AuditEvent{
            .actor = std::string{ACTOR},
            .action = "degradation_alert",
            .resource = std::string{to_string(alert.metric)},
            .result = std::string{to_string(alert.severity)},
            .provider = alert.provider_id,
            .details = {{"details", alert.details}},
        });
    }
    return alerts;
}

// ─────────────────────────────────────────────
// Management queries
// ─────────────────────────────────────────────

OrchestratorStatus AdaptationOrchestrator::status() {
    OrchestratorStatus out;
    out.monitoring_active = monitoring_.load();
    out.concurrent_adaptations = concurrent_adaptations_.load();
    {
        std::lock_guard lock(adaptation_mutex_);
        out.adaptation_count = adaptation_count_;
        out.last_adaptation = last_adaptation_wall_;
    }

    const auto sample = monitor_.sample();
    out.monitor_state = monitor_.state();
    out.cpu_percent = sample.cpu_percent;
    out.mem_percent = sample.mem_percent;
    out.headroom = monitor_.headroom();
    out.cpu_limit_proximity = static_cast<double>(sample.cpu_percent / safety::CPU_CEILING_PERCENT);
    out.mem_limit_proximity = static_cast<double>(sample.mem_percent / safety::MEM_CEILING_PERCENT);

    // Status is read-only: report component details only when already loaded
    std::lock_guard lock(components_mutex_);
    out.components_loaded = tracker_ != nullptr;
    if (out.components_loaded) {
        out.pattern_count = learner_->pattern_count();
        out.buffered_metrics = tracker_->buffered();
        out.active_routed_tasks = router_->stats().active_tasks;
    }
    return out;
}

std::vector<ScoredPattern> AdaptationOrchestrator::patterns(const TaskKind& kind) {
    return learner().patterns_for(kind);
}

std::vector<ProviderRanking> AdaptationOrchestrator::rankings(Metric metric) {
    return tracker().rankings(metric);
}

Insights AdaptationOrchestrator::insights(size_t window) {
    return learner().analyze_patterns(window);
}

std::optional<Recommendation> AdaptationOrchestrator::recommend(
    const TaskKind& kind, const std::optional<ResourceConstraints>& constraints) {
    return learner().recommend(kind, constraints);
}

std::vector<AdaptationRecord> AdaptationOrchestrator::adaptation_history(size_t n) {
    return learner().adaptation_history(n);
}

uint64_t AdaptationOrchestrator::adaptation_count() const {
    std::lock_guard lock(adaptation_mutex_);
    return adaptation_count_;
}

MaintenanceReport AdaptationOrchestrator::run_maintenance() {
    MaintenanceReport report;

    if (auto r = tracker().flush(); !r) {
        report.metrics_flushed = false;
        logger_.warn("Maintenance flush failed: " + r.error().message);
    }
    if (auto removed = tracker().apply_retention()) {
        report.metrics_removed = removed.value();
    }
    report.patterns_forgotten = learner().forget_stale();
    return report;
}

}  // namespace adaptive_scheduler
