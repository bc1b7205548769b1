/**
 * @file test_adaptive_router.cpp
 * @brief Unit tests for AdaptiveRouter routing tiers, health tracking and switching.
 * @author Dimitris Kafetzis
 */

#include "routing/adaptive_router.hpp"
#include "storage/knowledge_store.hpp"
#include "storage/metrics_store.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <set>

using namespace adaptive_scheduler;

namespace {

const ExecutionMetrics kSim{.cpu = 0.3, .ram_mb = 150.0, .duration_s = 8.0};

MetricRecord latency_record(const ProviderId& provider, double latency) {
    MetricRecord r;
    r.task_id = "seed-" + provider;
    r.provider_id = provider;
    r.timestamp = std::chrono::system_clock::now() - std::chrono::seconds{30};
    r.latency = latency;
    return r;
}

}  // namespace

class AdaptiveRouterTest : public ::testing::Test {
protected:
    void learn(const ProviderId& provider, int successes) {
        for (int i = 0; i < successes; ++i) learner_.record_execution("sim", provider, kSim, true);
    }

    void mark_failures(const ProviderId& provider, int failures) {
        for (int i = 0; i < failures; ++i) router_.update_health(provider, false);
    }

    InMemoryMetricsStore metrics_;
    InMemoryKnowledgeStore knowledge_;
    Logger logger_{std::make_unique<NullSink>()};
    LearnerConfig learner_config_;
    TrackerConfig tracker_config_;
    RouterConfig router_config_;
    ContextLearner learner_{knowledge_, learner_config_, logger_};
    PerformanceTracker tracker_{metrics_, tracker_config_, logger_};
    AdaptiveRouter router_{learner_, tracker_, router_config_, logger_};
};

// ═══════════════════════════════════════════
// Routing tiers
// ═══════════════════════════════════════════

TEST_F(AdaptiveRouterTest, DefaultWhenNothingKnown) {
    auto d = router_.route("sim", "t1");
    EXPECT_EQ(d.provider_id, "local_cpu");
    EXPECT_EQ(d.reason, "default_fallback");
    EXPECT_DOUBLE_EQ(d.confidence, AdaptiveRouter::DEFAULT_CONFIDENCE);
    EXPECT_EQ(d.fallback_chain, std::vector<ProviderId>{"local_cpu"});
    EXPECT_EQ(d.task_id, "t1");
    EXPECT_FALSE(d.estimated_resources.has_value());
}

TEST_F(AdaptiveRouterTest, LearnedPatternWins) {
    learn("A", 25);

    auto d = router_.route("sim", "t1");
    EXPECT_EQ(d.provider_id, "A");
    EXPECT_EQ(d.reason, "learned_pattern");
    EXPECT_GT(d.confidence, 0.7);
    ASSERT_TRUE(d.estimated_resources.has_value());
    EXPECT_NEAR(d.estimated_resources->avg_duration, 8.0, 1e-9);
    EXPECT_EQ(d.fallback_chain, (std::vector<ProviderId>{"A", "local_cpu"}));
}

TEST_F(AdaptiveRouterTest, WeakPatternFallsThroughToRanking) {
    learn("A", 1);
    tracker_.ingest(latency_record("B", 0.05));

    auto d = router_.route("sim", "t1");
    EXPECT_EQ(d.provider_id, "B");
    EXPECT_EQ(d.reason, "performance_ranking");
    EXPECT_DOUBLE_EQ(d.confidence, AdaptiveRouter::RANKING_CONFIDENCE);
}

TEST_F(AdaptiveRouterTest, UnhealthyLearnedProviderIsSkipped) {
    learn("A", 25);
    tracker_.ingest(latency_record("B", 0.05));
    mark_failures("A", 2);

    auto d = router_.route("sim", "t1");
    EXPECT_EQ(d.provider_id, "B");
    EXPECT_EQ(d.reason, "performance_ranking");
    EXPECT_EQ(std::count(d.fallback_chain.begin(), d.fallback_chain.end(), "A"), 0);
}

TEST_F(AdaptiveRouterTest, RankingSkipsOverloadedProviders) {
    router_config_.max_provider_load = 1;
    AdaptiveRouter router(learner_, tracker_, router_config_, logger_);
    tracker_.ingest(latency_record("B", 0.05));
    tracker_.ingest(latency_record("C", 0.10));

    EXPECT_EQ(router.route("sim", "t1").provider_id, "B");

    router.register_start("busy", "B", "sim");
    EXPECT_EQ(router.route("sim", "t2").provider_id, "C");
}

TEST_F(AdaptiveRouterTest, FallbackChainIsBoundedUniqueAndEndsWithDefault) {
    learn("A", 25);
    learn("B", 15);
    learn("C", 10);
    learn("D", 5);

    auto d = router_.route("sim", "t1");
    EXPECT_EQ(d.fallback_chain, (std::vector<ProviderId>{"A", "B", "local_cpu"}));

    mark_failures("B", 3);
    d = router_.route("sim", "t2");
    EXPECT_EQ(d.fallback_chain, (std::vector<ProviderId>{"A", "C", "local_cpu"}));

    std::set<ProviderId> unique(d.fallback_chain.begin(), d.fallback_chain.end());
    EXPECT_EQ(unique.size(), d.fallback_chain.size());
}

TEST_F(AdaptiveRouterTest, DefaultProviderAppearsOnceInChain) {
    learn("local_cpu", 25);
    learn("A", 10);

    auto d = router_.route("sim", "t1");
    EXPECT_EQ(d.provider_id, "local_cpu");
    EXPECT_EQ(d.fallback_chain, (std::vector<ProviderId>{"local_cpu", "A"}));
}

// ═══════════════════════════════════════════
// Health
// ═══════════════════════════════════════════

TEST(ProviderHealthTest, StatusRules) {
    EXPECT_EQ(status_after_success(std::nullopt), HealthStatus::Healthy);
    EXPECT_EQ(status_after_success(0.5), HealthStatus::Healthy);
    EXPECT_EQ(status_after_success(1.0), HealthStatus::Degraded);
    EXPECT_EQ(status_after_success(4.9), HealthStatus::Degraded);
    EXPECT_EQ(status_after_success(5.0), HealthStatus::Healthy);

    EXPECT_EQ(status_after_failures(1), HealthStatus::Degraded);
    EXPECT_EQ(status_after_failures(2), HealthStatus::Unhealthy);
    EXPECT_EQ(status_after_failures(3), HealthStatus::Offline);
    EXPECT_EQ(status_after_failures(7), HealthStatus::Offline);

    EXPECT_TRUE(is_usable(HealthStatus::Degraded));
    EXPECT_FALSE(is_usable(HealthStatus::Unhealthy));
}

TEST_F(AdaptiveRouterTest, HealthTransitions) {
    EXPECT_EQ(router_.health("A").status, HealthStatus::Healthy);
    EXPECT_EQ(router_.health("A").provider_id, "A");

    router_.update_health("A", true, 0.5);
    auto h = router_.health("A");
    EXPECT_EQ(h.status, HealthStatus::Healthy);
    EXPECT_DOUBLE_EQ(h.avg_response_time, 0.5);
    EXPECT_TRUE(h.last_success.has_value());

    router_.update_health("A", true, 2.0);
    h = router_.health("A");
    EXPECT_EQ(h.status, HealthStatus::Degraded);
    EXPECT_NEAR(h.avg_response_time, 0.95, 1e-9);

    router_.update_health("A", false);
    EXPECT_EQ(router_.health("A").status, HealthStatus::Degraded);
    router_.update_health("A", false);
    EXPECT_EQ(router_.health("A").status, HealthStatus::Unhealthy);
    router_.update_health("A", false);
    EXPECT_EQ(router_.health("A").status, HealthStatus::Offline);
    EXPECT_EQ(router_.health("A").consecutive_failures, 3u);

    router_.update_health("A", true);
    EXPECT_EQ(router_.health("A").status, HealthStatus::Healthy);
    EXPECT_EQ(router_.health("A").consecutive_failures, 0u);
}

// ═══════════════════════════════════════════
// Switching
// ═══════════════════════════════════════════

TEST_F(AdaptiveRouterTest, ShouldSwitchReasons) {
    MetricRecord current;
    EXPECT_EQ(router_.should_switch("t1", current).reason, "task_not_active");

    router_.register_start("t0", "A", "sim");
    router_.register_completion("t0", true, 0.1);
    ASSERT_TRUE(router_.baseline_latency("A").has_value());
    EXPECT_DOUBLE_EQ(*router_.baseline_latency("A"), 0.1);

    router_.register_start("t1", "A", "sim");

    current.latency = 0.5;
    auto s = router_.should_switch("t1", current);
    EXPECT_TRUE(s.should_switch);
    EXPECT_EQ(s.reason, "latency_spike");

    current.latency = 0.2;
    current.error_rate = 0.3;
    EXPECT_EQ(router_.should_switch("t1", current).reason, "error_threshold");

    current.error_rate = 0.0;
    s = router_.should_switch("t1", current);
    EXPECT_FALSE(s.should_switch);
    EXPECT_EQ(s.reason, "no_switch_needed");

    mark_failures("A", 2);
    EXPECT_EQ(router_.should_switch("t1", current).reason, "health_check_failure");
}

TEST_F(AdaptiveRouterTest, BaselineIsSmoothed) {
    router_.register_start("t0", "A", "sim");
    router_.register_completion("t0", true, 0.1);
    router_.register_start("t1", "A", "sim");
    router_.register_completion("t1", true, 0.2);
    EXPECT_NEAR(*router_.baseline_latency("A"), 0.13, 1e-9);
    EXPECT_FALSE(router_.baseline_latency("B").has_value());
}

TEST_F(AdaptiveRouterTest, AdaptToExplicitAlternative) {
    auto missing = router_.adapt("nope", "latency_spike");
    EXPECT_FALSE(missing.success);
    EXPECT_EQ(missing.reason, "task_not_found");

    router_.register_start("t1", "A", "sim");
    auto r = router_.adapt("t1", "latency_spike", ProviderId{"B"});
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.reason, "switched_latency_spike");
    EXPECT_EQ(r.details.at("old_provider"), "A");
    EXPECT_EQ(r.details.at("new_provider"), "B");
    EXPECT_EQ(router_.active_provider("t1"), ProviderId{"B"});
    EXPECT_EQ(router_.load("A"), 0u);
    EXPECT_EQ(router_.load("B"), 1u);

    mark_failures("C", 3);
    auto bad = router_.adapt("t1", "manual", ProviderId{"C"});
    EXPECT_FALSE(bad.success);
    EXPECT_EQ(bad.reason, "alternative_unhealthy");
    EXPECT_EQ(router_.active_provider("t1"), ProviderId{"B"});
}

TEST_F(AdaptiveRouterTest, AdaptPicksNextProvider) {
    learn("A", 20);
    learn("B", 10);
    router_.register_start("t1", "A", "sim");

    auto r = router_.adapt("t1", "error_threshold");
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.details.at("new_provider"), "B");
}

TEST_F(AdaptiveRouterTest, AdaptFallsBackToDefaultThenGivesUp) {
    router_.register_start("t1", "A", "sim");

    auto r = router_.adapt("t1", "manual");
    ASSERT_TRUE(r.success);
    EXPECT_EQ(router_.active_provider("t1"), ProviderId{"local_cpu"});

    auto stuck = router_.adapt("t1", "manual");
    EXPECT_FALSE(stuck.success);
    EXPECT_EQ(stuck.reason, "no_alternative_provider");
    EXPECT_EQ(stuck.details.at("current_provider"), "local_cpu");
}

// ═══════════════════════════════════════════
// Load balancing and bookkeeping
// ═══════════════════════════════════════════

TEST_F(AdaptiveRouterTest, LoadBalancePicksLeastLoaded) {
    const std::vector<ProviderId> pool{"A", "B"};
    router_.register_start("t1", "A", "sim");
    EXPECT_EQ(router_.load_balance("sim", pool), ProviderId{"B"});

    mark_failures("B", 2);
    EXPECT_EQ(router_.load_balance("sim", pool), ProviderId{"A"});

    // Nothing usable in the pool: the default provider takes the work
    mark_failures("A", 3);
    EXPECT_EQ(router_.load_balance("sim", pool), ProviderId{"local_cpu"});
}

TEST_F(AdaptiveRouterTest, LoadBalanceWithoutCandidates) {
    EXPECT_EQ(router_.load_balance("sim"), ProviderId{"local_cpu"});

    learn("A", 20);
    learn("B", 20);
    router_.register_start("t1", "A", "sim");
    EXPECT_EQ(router_.load_balance("sim"), ProviderId{"B"});
}

TEST_F(AdaptiveRouterTest, CompletionReleasesLoad) {
    router_.register_start("t1", "A", "sim");
    router_.register_start("t2", "A", "sim");
    router_.register_start("t3", "B", "sim");

    auto s = router_.stats();
    EXPECT_EQ(s.active_tasks, 3u);
    EXPECT_EQ(s.load.at("A"), 2u);

    router_.register_completion("t1", true, 0.2);
    router_.register_completion("t3", false);
    router_.register_completion("unknown", true);

    s = router_.stats();
    EXPECT_EQ(s.active_tasks, 1u);
    EXPECT_EQ(s.load.at("A"), 1u);
    EXPECT_EQ(s.load.at("B"), 0u);
    EXPECT_EQ(s.healthy_providers, 1u);
    EXPECT_EQ(s.health.at("B").status, HealthStatus::Degraded);
    EXPECT_FALSE(router_.active_provider("t1").has_value());
}

TEST(FormatDetailsTest, JoinsSortedPairs) {
    EXPECT_EQ(format_details({{"b", "2"}, {"a", "1"}}), "a=1, b=2");
    EXPECT_EQ(format_details({}), "");
}
