/**
 * @file test_orchestrator.cpp
 * @brief Tests for AdaptationOrchestrator safety gates, lifecycle and task flow.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/adaptation_orchestrator.hpp"
#include "resource_monitor/probe.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace adaptive_scheduler;

namespace {

class RecordingAuditSink final : public IAuditSink {
public:
    void record(const AuditEvent& event) override {
        std::lock_guard lock(mutex_);
        events_.push_back(event);
    }

    std::vector<AuditEvent> events() const {
        std::lock_guard lock(mutex_);
        return events_;
    }

    size_t count(const std::string& action) const {
        std::lock_guard lock(mutex_);
        return static_cast<size_t>(std::count_if(events_.begin(), events_.end(),
            [&](const AuditEvent& e) { return e.action == action; }));
    }

private:
    mutable std::mutex mutex_;
    std::vector<AuditEvent> events_;
};

class ThrowingAuditSink final : public IAuditSink {
public:
    void record(const AuditEvent& /*event*/) override {
        throw std::runtime_error("audit backend down");
    }
};

/// Queries the orchestrator from inside record(), as a status dashboard sink would.
class ReentrantAuditSink final : public IAuditSink {
public:
    void attach(AdaptationOrchestrator* orch) { orch_ = orch; }

    void record(const AuditEvent& event) override {
        if (orch_ == nullptr || event.action != "trigger_adaptation") return;
        std::lock_guard lock(mutex_);
        seen_.push_back(event.result + ":" + std::to_string(orch_->adaptation_count()));
        (void)orch_->status();
    }

    std::vector<std::string> seen() const {
        std::lock_guard lock(mutex_);
        return seen_;
    }

private:
    AdaptationOrchestrator* orch_{nullptr};
    mutable std::mutex mutex_;
    std::vector<std::string> seen_;
};

class DenyingAuthorizer final : public IAuthorizer {
public:
    AuthDecision authorize(std::string_view operation,
                           const std::optional<ProviderId>& /*provider*/) override {
        return {false, "missing capability for " + std::string{operation}};
    }
};

MonitorConfig uncached() {
    MonitorConfig c;
    c.cache_ttl_ms = 0;
    return c;
}

}  // namespace

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        probe_.set_usage(25.0f, 35.0f);
    }

    MockProbe probe_;
    Logger logger_{std::make_unique<NullSink>()};
    ResourceMonitor monitor_{probe_, uncached(), logger_};
    InMemoryMetricsStore metrics_;
    InMemoryKnowledgeStore knowledge_;
    AllowAllAuthorizer allow_;
    RecordingAuditSink audit_;
    Config config_;
    AdaptationOrchestrator orch_{monitor_, metrics_, knowledge_, allow_, audit_, config_, logger_};
};

// ═══════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════

TEST_F(OrchestratorTest, ComponentsLoadLazily) {
    EXPECT_FALSE(orch_.components_loaded());
    auto s = orch_.status();
    EXPECT_FALSE(s.components_loaded);
    EXPECT_FALSE(orch_.components_loaded());

    orch_.route_task("sim", "t1");
    EXPECT_TRUE(orch_.components_loaded());
    EXPECT_FALSE(orch_.monitoring_active());
}

TEST_F(OrchestratorTest, StartAndStopMonitoring) {
    orch_.start_monitoring();
    EXPECT_TRUE(orch_.monitoring_active());
    EXPECT_TRUE(orch_.components_loaded());

    orch_.task_started("t1", "sim", "A");
    orch_.task_finished("t1", "sim", "A", true);
    EXPECT_EQ(metrics_.size(), 0u);

    orch_.stop_monitoring();
    EXPECT_FALSE(orch_.monitoring_active());
    EXPECT_EQ(metrics_.size(), 1u);
    EXPECT_TRUE(orch_.components_loaded());
}

TEST_F(OrchestratorTest, StatusReportsHostAndComponents) {
    orch_.start_monitoring();
    orch_.task_started("t1", "sim", "A");

    auto s = orch_.status();
    EXPECT_TRUE(s.monitoring_active);
    EXPECT_TRUE(s.components_loaded);
    EXPECT_FLOAT_EQ(s.cpu_percent, 25.0f);
    EXPECT_FLOAT_EQ(s.mem_percent, 35.0f);
    EXPECT_NEAR(s.cpu_limit_proximity, 25.0 / 80.0, 1e-6);
    EXPECT_NEAR(s.mem_limit_proximity, 35.0 / 70.0, 1e-6);
    EXPECT_FLOAT_EQ(s.headroom.cpu_percent, 55.0f);
    EXPECT_EQ(s.active_routed_tasks, 1u);
    EXPECT_EQ(s.adaptation_count, 0u);
    EXPECT_FALSE(s.last_adaptation.has_value());
}

// ═══════════════════════════════════════════════
// monitor_execution
// ═══════════════════════════════════════════════

TEST_F(OrchestratorTest, MonitorExecutionCollectsMetrics) {
    orch_.tracker().start_timing("t1");
    auto out = orch_.monitor_execution("t1", "A");
    EXPECT_EQ(out.status, MonitorStatus::Ok);
    ASSERT_TRUE(out.metrics.has_value());
    EXPECT_EQ(out.metrics->provider_id, "A");
    EXPECT_NEAR(out.metrics->cpu_usage, 0.25, 1e-6);
    EXPECT_TRUE(orch_.monitoring_active());
}

TEST_F(OrchestratorTest, MonitorExecutionThrottledNearCeiling) {
    probe_.set_usage(78.0f, 35.0f);
    auto out = orch_.monitor_execution("t1", "A");
    EXPECT_EQ(out.status, MonitorStatus::Throttled);
    EXPECT_EQ(out.reason, "resource_limits");
    EXPECT_FALSE(out.metrics.has_value());
    EXPECT_FLOAT_EQ(out.cpu_percent, 78.0f);

    probe_.set_usage(25.0f, 66.0f);
    EXPECT_EQ(orch_.monitor_execution("t1", "A").status, MonitorStatus::Throttled);
}

// ═══════════════════════════════════════════════
// trigger_adaptation gates
// ═══════════════════════════════════════════════

TEST_F(OrchestratorTest, PermissionDeniedMutatesNothing) {
    DenyingAuthorizer deny;
    AdaptationOrchestrator orch(monitor_, metrics_, knowledge_, deny, audit_, config_, logger_);

    auto m = orch.monitor_execution("t1", "A");
    EXPECT_EQ(m.status, MonitorStatus::PermissionDenied);
    EXPECT_EQ(m.reason, "missing capability for monitor_execution");

    auto r = orch.trigger_adaptation("t1", "latency_spike", ProviderId{"B"});
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.reason, "permission_denied");
    EXPECT_EQ(r.details.at("reason"), "missing capability for trigger_adaptation");

    EXPECT_FALSE(orch.components_loaded());
    EXPECT_EQ(knowledge_.save_count(), 0u);
    ASSERT_EQ(audit_.count("trigger_adaptation"), 1u);
    EXPECT_EQ(audit_.events().back().result, "permission_denied");
}

TEST_F(OrchestratorTest, SafetyLimitsBlockAdaptation) {
    orch_.task_started("t1", "sim", "A");

    probe_.set_usage(76.0f, 35.0f);
    auto r = orch_.trigger_adaptation("t1", "latency_spike");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.reason, "safety_limits_exceeded");
    EXPECT_EQ(r.details.at("cpu"), "76.0");
    EXPECT_EQ(r.details.at("cpu_limit"), "80.0");

    probe_.set_usage(25.0f, 69.8f);
    EXPECT_EQ(orch_.trigger_adaptation("t1", "latency_spike").reason, "safety_limits_exceeded");

    // At the CPU boundary the budget still fits
    probe_.set_usage(75.0f, 35.0f);
    EXPECT_TRUE(orch_.trigger_adaptation("t1", "latency_spike").success);
}

TEST_F(OrchestratorTest, SuccessfulAdaptationIsRateLimited) {
    orch_.task_started("t1", "sim", "A");

    auto first = orch_.trigger_adaptation("t1", "latency_spike");
    ASSERT_TRUE(first.success);
    EXPECT_EQ(first.reason, "switched_latency_spike");
    EXPECT_EQ(first.details.at("new_provider"), "local_cpu");
    EXPECT_EQ(orch_.adaptation_count(), 1u);
    EXPECT_EQ(orch_.concurrent_adaptations(), 0u);
    EXPECT_TRUE(orch_.status().last_adaptation.has_value());

    auto second = orch_.trigger_adaptation("t1", "latency_spike", ProviderId{"A"});
    EXPECT_FALSE(second.success);
    EXPECT_EQ(second.reason, "rate_limited");
    EXPECT_EQ(second.details.at("min_interval_s"), "5");
    EXPECT_EQ(orch_.router().active_provider("t1"), ProviderId{"local_cpu"});

    auto history = orch_.adaptation_history();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_TRUE(history[0].success);
    EXPECT_EQ(history[0].task_id, "t1");
    EXPECT_EQ(audit_.count("switch_provider"), 1u);
}

TEST_F(OrchestratorTest, ConcurrencyGate) {
    orch_.task_started("t1", "sim", "A");
    orch_.set_concurrent_adaptations(safety::MAX_CONCURRENT_ADAPTATIONS);

    auto r = orch_.trigger_adaptation("t1", "latency_spike");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.reason, "max_concurrent_adaptations");
    EXPECT_EQ(r.details.at("current"), "2");
    EXPECT_EQ(orch_.concurrent_adaptations(), 2u);

    orch_.set_concurrent_adaptations(1);
    EXPECT_TRUE(orch_.trigger_adaptation("t1", "latency_spike").success);
    EXPECT_EQ(orch_.concurrent_adaptations(), 1u);
}

TEST_F(OrchestratorTest, FailedAdaptationIsLearnedButNotRateLimited) {
    auto r = orch_.trigger_adaptation("ghost", "manual");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.reason, "task_not_found");

    EXPECT_EQ(orch_.trigger_adaptation("ghost", "manual").reason, "task_not_found");
    EXPECT_EQ(orch_.adaptation_count(), 0u);

    auto history = orch_.adaptation_history();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_FALSE(history[0].success);
    EXPECT_EQ(history[0].reason, "task_not_found");

    auto insights = orch_.insights();
    ASSERT_TRUE(insights.adaptations.has_value());
    EXPECT_DOUBLE_EQ(insights.adaptations->success_rate, 0.0);
}

TEST_F(OrchestratorTest, ThrowingAuditSinkIsContained) {
    ThrowingAuditSink broken;
    AdaptationOrchestrator orch(monitor_, metrics_, knowledge_, allow_, broken, config_, logger_);

    auto d = orch.route_task("sim", "t1");
    EXPECT_EQ(d.provider_id, "local_cpu");

    orch.task_started("t1", "sim", "A");
    EXPECT_TRUE(orch.trigger_adaptation("t1", "manual").success);
}

TEST_F(OrchestratorTest, RejectionAuditMayCallBackIntoOrchestrator) {
    ReentrantAuditSink sink;
    AdaptationOrchestrator orch(monitor_, metrics_, knowledge_, allow_, sink, config_, logger_);
    sink.attach(&orch);

    orch.task_started("t1", "sim", "A");
    ASSERT_TRUE(orch.trigger_adaptation("t1", "manual", ProviderId{"B"}).success);

    auto limited = orch.trigger_adaptation("t1", "manual", ProviderId{"A"});
    EXPECT_EQ(limited.reason, "rate_limited");

    auto seen = sink.seen();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "rate_limited:1");
}

TEST_F(OrchestratorTest, ConcurrencyRejectionAuditMayCallBackIntoOrchestrator) {
    ReentrantAuditSink sink;
    AdaptationOrchestrator orch(monitor_, metrics_, knowledge_, allow_, sink, config_, logger_);
    sink.attach(&orch);

    orch.task_started("t1", "sim", "A");
    orch.set_concurrent_adaptations(safety::MAX_CONCURRENT_ADAPTATIONS);
    EXPECT_EQ(orch.trigger_adaptation("t1", "manual").reason, "max_concurrent_adaptations");

    auto seen = sink.seen();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "max_concurrent_adaptations:0");
}

TEST_F(OrchestratorTest, ConcurrentCallersShareOneRateWindow) {
    for (int i = 0; i < 8; ++i) {
        orch_.task_started("t" + std::to_string(i), "sim", "A");
    }

    std::atomic<int> switched{0};
    std::atomic<int> limited{0};
    {
        std::vector<std::jthread> callers;
        for (int i = 0; i < 8; ++i) {
            callers.emplace_back([&, i] {
                auto r = orch_.trigger_adaptation("t" + std::to_string(i), "manual");
                if (r.success) switched.fetch_add(1);
                else if (r.reason == "rate_limited") limited.fetch_add(1);
            });
        }
    }

    EXPECT_EQ(switched.load(), 1);
    EXPECT_EQ(orch_.adaptation_count(), 1u);
    EXPECT_EQ(limited.load(), 7);
}

TEST_F(OrchestratorTest, FailedAdaptationReleasesReservedWindow) {
    orch_.task_started("t1", "sim", "A");
    EXPECT_EQ(orch_.trigger_adaptation("ghost", "manual").reason, "task_not_found");
    EXPECT_TRUE(orch_.trigger_adaptation("t1", "manual").success);
}

// ═══════════════════════════════════════════════
// Task flow
// ═══════════════════════════════════════════════

TEST_F(OrchestratorTest, RouteEmitsAudit) {
    auto d = orch_.route_task("sim", "t1");
    EXPECT_EQ(d.reason, "default_fallback");

    auto events = audit_.events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].action, "route");
    EXPECT_EQ(events[0].actor, "adaptation_orchestrator");
    EXPECT_EQ(events[0].provider, ProviderId{"local_cpu"});
    EXPECT_EQ(events[0].details.at("fallback_chain"), "local_cpu");
    EXPECT_EQ(events[0].details.at("kind"), "sim");
}

TEST_F(OrchestratorTest, TaskFinishedFeedsEveryComponent) {
    orch_.task_started("t1", "sim", "A");
    EXPECT_EQ(orch_.router().load("A"), 1u);

    ExecutionMetrics observed{.cpu = 0.4, .ram_mb = 256.0, .duration_s = 2.0};
    auto rec = orch_.task_finished("t1", "sim", "A", true, observed);
    EXPECT_EQ(rec.provider_id, "A");
    EXPECT_EQ(orch_.tracker().timing_count(), 0u);
    EXPECT_EQ(orch_.router().load("A"), 0u);
    EXPECT_TRUE(orch_.router().baseline_latency("A").has_value());

    auto p = orch_.learner().pattern("sim", "A");
    ASSERT_TRUE(p.has_value());
    EXPECT_DOUBLE_EQ(p->resource_profile.avg_ram, 256.0);
    EXPECT_DOUBLE_EQ(p->resource_profile.avg_duration, 2.0);

    auto patterns = orch_.patterns("sim");
    ASSERT_EQ(patterns.size(), 1u);
    EXPECT_TRUE(orch_.recommend("sim").has_value());
}

TEST_F(OrchestratorTest, TaskFinishedUsesHostMemoryWhenUnobserved) {
    orch_.task_started("t1", "sim", "A");
    orch_.task_finished("t1", "sim", "A", false);

    auto p = orch_.learner().pattern("sim", "A");
    ASSERT_TRUE(p.has_value());
    // 35% of the mock host's 8 GiB
    EXPECT_NEAR(p->resource_profile.avg_ram, 0.35 * 8192.0, 1.0);
    EXPECT_NEAR(p->resource_profile.avg_cpu, 0.25, 1e-6);
    EXPECT_EQ(orch_.router().health("A").status, HealthStatus::Degraded);
}

TEST_F(OrchestratorTest, DegradationAlertsAreAudited) {
    for (int i = 0; i < 10; ++i) {
        MetricRecord r;
        r.task_id = "f" + std::to_string(i);
        r.provider_id = "flaky";
        r.timestamp = std::chrono::system_clock::now() - std::chrono::seconds{60 - i};
        r.error_rate = 0.6;
        orch_.tracker().ingest(r);
    }

    auto alerts = orch_.check_degradation();
    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_EQ(alerts[0].metric, Metric::ErrorRate);
    EXPECT_EQ(orch_.check_degradation(ProviderId{"flaky"}).size(), 1u);
    EXPECT_TRUE(orch_.check_degradation(ProviderId{"steady"}).empty());
    EXPECT_EQ(audit_.count("degradation_alert"), 2u);
}

TEST_F(OrchestratorTest, MaintenanceSweepsMetricsAndPatterns) {
    MetricRecord old;
    old.task_id = "old";
    old.provider_id = "A";
    old.timestamp = std::chrono::system_clock::now() - std::chrono::hours{24 * 60};
    ASSERT_TRUE(metrics_.append({old}));

    orch_.learner().record_execution("sim", "stale", ExecutionMetrics{}, true,
                                     std::chrono::system_clock::now() - std::chrono::hours{24 * 120});
    orch_.task_started("t1", "sim", "A");
    orch_.task_finished("t1", "sim", "A", true);

    auto report = orch_.run_maintenance();
    EXPECT_TRUE(report.metrics_flushed);
    EXPECT_EQ(report.metrics_removed, 1u);
    EXPECT_EQ(report.patterns_forgotten, 1u);
    EXPECT_EQ(metrics_.size(), 1u);
}
