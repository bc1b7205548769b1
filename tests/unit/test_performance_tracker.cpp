/**
 * @file test_performance_tracker.cpp
 * @brief Unit tests for PerformanceTracker timing, buffering, trends,
 *        degradation detection and rankings.
 * @author Dimitris Kafetzis
 */

#include "performance/performance_tracker.hpp"
#include "storage/metrics_store.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <thread>

using namespace adaptive_scheduler;

namespace {

MetricRecord record_at(const ProviderId& provider, int seconds_ago, double latency) {
    MetricRecord r;
    r.task_id = provider + "-" + std::to_string(seconds_ago);
    r.provider_id = provider;
    r.timestamp = std::chrono::system_clock::now() - std::chrono::seconds{seconds_ago};
    r.latency = latency;
    return r;
}

}  // namespace

class PerformanceTrackerTest : public ::testing::Test {
protected:
    InMemoryMetricsStore store_;
    Logger logger_{std::make_unique<NullSink>()};
    TrackerConfig config_;
};

TEST_F(PerformanceTrackerTest, CollectMetricsFromTiming) {
    PerformanceTracker tracker(store_, config_, logger_, [] {
        ResourceSample s;
        s.cpu_percent = 40.0f;
        s.mem_percent = 25.0f;
        return s;
    });

    tracker.start_timing("t1");
    EXPECT_EQ(tracker.timing_count(), 1u);
    std::this_thread::sleep_for(std::chrono::milliseconds{20});

    auto rec = tracker.collect_metrics("t1", "A");
    EXPECT_EQ(rec.task_id, "t1");
    EXPECT_EQ(rec.provider_id, "A");
    EXPECT_GE(rec.latency, 0.02);
    EXPECT_LT(rec.latency, 5.0);
    EXPECT_NEAR(rec.cpu_usage, 0.40, 1e-6);
    EXPECT_NEAR(rec.ram_usage, 0.25, 1e-6);
    EXPECT_EQ(rec.queue_depth, 1u);
    EXPECT_DOUBLE_EQ(rec.error_rate, 0.0);
    EXPECT_EQ(tracker.buffered(), 1u);
}

TEST_F(PerformanceTrackerTest, UntimedTaskHasZeroLatency) {
    PerformanceTracker tracker(store_, config_, logger_);
    auto rec = tracker.collect_metrics("never-started", "A");
    EXPECT_DOUBLE_EQ(rec.latency, 0.0);
    EXPECT_DOUBLE_EQ(rec.cpu_usage, 0.0);

    // Unknown task: ignored
    tracker.end_timing("never-started", true);
    EXPECT_DOUBLE_EQ(tracker.error_rate("A"), 0.0);
}

TEST_F(PerformanceTrackerTest, ErrorRateCountsOutcomesPerProvider) {
    PerformanceTracker tracker(store_, config_, logger_);

    tracker.start_timing("t1");
    tracker.collect_metrics("t1", "A");
    tracker.end_timing("t1", false);

    tracker.start_timing("t2");
    tracker.collect_metrics("t2", "A");
    tracker.end_timing("t2", true);

    tracker.start_timing("t3");
    tracker.collect_metrics("t3", "B");
    tracker.end_timing("t3", true);

    EXPECT_DOUBLE_EQ(tracker.error_rate("A"), 0.5);
    EXPECT_DOUBLE_EQ(tracker.error_rate("B"), 0.0);
    EXPECT_EQ(tracker.timing_count(), 0u);

    // The next record for A carries the rate observed so far
    tracker.start_timing("t4");
    auto rec = tracker.collect_metrics("t4", "A");
    EXPECT_DOUBLE_EQ(rec.error_rate, 0.5);
}

TEST_F(PerformanceTrackerTest, FlushesWhenBufferFills) {
    config_.buffer_size = 5;
    PerformanceTracker tracker(store_, config_, logger_);

    for (int i = 0; i < 4; ++i) tracker.ingest(record_at("A", i, 0.1));
    EXPECT_EQ(store_.size(), 0u);
    EXPECT_EQ(tracker.buffered(), 4u);

    tracker.ingest(record_at("A", 10, 0.1));
    EXPECT_EQ(store_.size(), 5u);
    EXPECT_EQ(tracker.buffered(), 0u);
}

TEST_F(PerformanceTrackerTest, FailedFlushKeepsBuffer) {
    config_.buffer_size = 2;
    PerformanceTracker tracker(store_, config_, logger_);
    store_.set_failing(true);

    tracker.ingest(record_at("A", 1, 0.1));
    tracker.ingest(record_at("A", 2, 0.1));
    EXPECT_EQ(tracker.buffered(), 2u);
    EXPECT_FALSE(tracker.flush());

    // Queries still see buffered data while the store is down
    EXPECT_EQ(tracker.history("A").size(), 2u);

    store_.set_failing(false);
    EXPECT_TRUE(tracker.flush());
    EXPECT_EQ(tracker.buffered(), 0u);
    EXPECT_EQ(store_.size(), 2u);
}

TEST_F(PerformanceTrackerTest, DestructorFlushes) {
    {
        PerformanceTracker tracker(store_, config_, logger_);
        tracker.ingest(record_at("A", 1, 0.1));
        tracker.ingest(record_at("A", 2, 0.1));
    }
    EXPECT_EQ(store_.size(), 2u);
}

TEST_F(PerformanceTrackerTest, HistoryMergesStoreAndBuffer) {
    ASSERT_TRUE(store_.append({record_at("A", 30, 0.3), record_at("B", 20, 0.2)}));
    PerformanceTracker tracker(store_, config_, logger_);
    tracker.ingest(record_at("A", 10, 0.1));

    auto a = tracker.history("A");
    ASSERT_EQ(a.size(), 2u);
    EXPECT_DOUBLE_EQ(a[0].latency, 0.1);     // newest first
    EXPECT_DOUBLE_EQ(a[1].latency, 0.3);

    EXPECT_EQ(tracker.history(std::nullopt).size(), 3u);

    // Outside a 1-hour window
    ASSERT_TRUE(store_.append({record_at("A", 7200, 0.9)}));
    EXPECT_EQ(tracker.history("A", 1.0).size(), 2u);
}

TEST_F(PerformanceTrackerTest, TrendOverRecentWindow) {
    PerformanceTracker tracker(store_, config_, logger_);
    for (int i = 0; i < 10; ++i) {
        tracker.ingest(record_at("A", 100 - i, 0.1 + 0.05 * i));
    }
    auto t = tracker.trend("A", Metric::Latency, 10);
    EXPECT_EQ(t.direction, TrendDirection::Degrading);
    EXPECT_NEAR(t.slope, 0.05, 1e-9);

    EXPECT_EQ(tracker.trend("A", Metric::Latency, 50).direction, TrendDirection::InsufficientData);
}

TEST_F(PerformanceTrackerTest, DetectsLatencyDegradation) {
    PerformanceTracker tracker(store_, config_, logger_);
    for (int i = 0; i < 50; ++i) tracker.ingest(record_at("A", 200 - i, 0.010));
    for (int i = 0; i < 10; ++i) tracker.ingest(record_at("A", 100 - i, 0.050));

    auto alert = tracker.detect_degradation("A");
    ASSERT_TRUE(alert.has_value());
    EXPECT_EQ(alert->metric, Metric::Latency);
    EXPECT_EQ(alert->severity, Severity::High);
    EXPECT_NEAR(alert->current, 0.050, 1e-9);
    EXPECT_NEAR(alert->baseline, 0.010, 1e-9);
    EXPECT_NE(alert->details.find("latency increased"), std::string::npos);
}

TEST_F(PerformanceTrackerTest, NoAlertForSteadyProvider) {
    PerformanceTracker tracker(store_, config_, logger_);
    for (int i = 0; i < 40; ++i) tracker.ingest(record_at("A", 100 - i, 0.020));
    EXPECT_FALSE(tracker.detect_degradation("A").has_value());
    EXPECT_FALSE(tracker.detect_degradation("unknown").has_value());
}

TEST_F(PerformanceTrackerTest, TooFewSamplesSkipsLatencyCheck) {
    PerformanceTracker tracker(store_, config_, logger_);
    for (int i = 0; i < 10; ++i) tracker.ingest(record_at("A", 50 - i, 0.01));
    for (int i = 0; i < 5; ++i) tracker.ingest(record_at("A", 20 - i, 1.0));
    EXPECT_FALSE(tracker.detect_degradation("A").has_value());
}

TEST_F(PerformanceTrackerTest, ResourceAndErrorAlerts) {
    PerformanceTracker tracker(store_, config_, logger_);
    for (int i = 0; i < 10; ++i) {
        auto flaky = record_at("flaky", 50 - i, 0.1);
        flaky.error_rate = 0.6;
        tracker.ingest(flaky);

        auto hot = record_at("hot", 50 - i, 0.1);
        hot.cpu_usage = 0.80;
        hot.ram_usage = 0.85;
        tracker.ingest(hot);
    }

    auto flaky = tracker.detect_degradation("flaky");
    ASSERT_TRUE(flaky.has_value());
    EXPECT_EQ(flaky->metric, Metric::ErrorRate);
    EXPECT_EQ(flaky->severity, Severity::Critical);

    auto all = tracker.detect_all_degradations();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].provider_id, "flaky");
    EXPECT_EQ(all[1].provider_id, "hot");
    EXPECT_EQ(all[1].metric, Metric::CpuUsage);
    EXPECT_EQ(all[1].severity, Severity::Medium);
    EXPECT_EQ(all[2].metric, Metric::RamUsage);
    EXPECT_EQ(all[2].severity, Severity::High);
}

TEST_F(PerformanceTrackerTest, RankingsOrderByMetric) {
    PerformanceTracker tracker(store_, config_, logger_);
    for (int i = 0; i < 5; ++i) {
        auto slow = record_at("slow", 60 - i, 0.200);
        slow.throughput = 10.0;
        tracker.ingest(slow);
        auto fast = record_at("fast", 60 - i, 0.050);
        fast.throughput = 2.0;
        tracker.ingest(fast);
    }

    auto by_latency = tracker.rankings(Metric::Latency);
    ASSERT_EQ(by_latency.size(), 2u);
    EXPECT_EQ(by_latency[0].provider_id, "fast");
    EXPECT_NEAR(by_latency[0].score, 0.050, 1e-9);
    EXPECT_EQ(by_latency[0].samples, 5u);
    EXPECT_EQ(by_latency[0].trend, TrendDirection::Stable);

    auto by_throughput = tracker.rankings(Metric::Throughput);
    EXPECT_EQ(by_throughput[0].provider_id, "slow");
    EXPECT_NEAR(by_throughput[0].avg_throughput, 10.0, 1e-9);
    EXPECT_LT(by_throughput[0].score, 0.0);

    EXPECT_TRUE(tracker.rankings(Metric::Latency, 0.001).empty());
}

TEST_F(PerformanceTrackerTest, RetentionSweep) {
    ASSERT_TRUE(store_.append({record_at("A", 40 * 86400, 0.1), record_at("A", 60, 0.1)}));
    PerformanceTracker tracker(store_, config_, logger_);

    auto removed = tracker.apply_retention();
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed, 1u);

    auto none = tracker.apply_retention(30);
    EXPECT_EQ(*none, 0u);

    store_.set_failing(true);
    EXPECT_FALSE(tracker.apply_retention().has_value());
    store_.set_failing(false);
}
