/**
 * @file bench_adaptation.cpp
 * @brief Performance benchmarks for the adaptation pipeline and core operations.
 * @author Dimitris Kafetzis
 *
 * Measures trend analysis, learning, routing, metrics storage and
 * scheduling overhead.
 *
 * Usage: ./bench_adaptation [--csv]
 */

#include "core/config.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "learning/context_learner.hpp"
#include "performance/performance_tracker.hpp"
#include "performance/trend.hpp"
#include "resource_monitor/probe.hpp"
#include "resource_monitor/resource_monitor.hpp"
#include "routing/adaptive_router.hpp"
#include "scheduler/priority_scheduler.hpp"
#include "storage/knowledge_store.hpp"
#include "storage/metrics_store.hpp"
#include "telemetry/json_sink.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

using namespace adaptive_scheduler;
using Clock = std::chrono::high_resolution_clock;

// ─────────────────────────────────────────────
// Benchmark Harness
// ─────────────────────────────────────────────

struct BenchResult {
    std::string name;
    std::string category;
    double mean_us;
    double stddev_us;
    double min_us;
    double max_us;
    double p99_us;
    size_t iterations;
    std::string extra;
};

template <typename Fn>
BenchResult run_bench(const std::string& name,
                      const std::string& category,
                      size_t iterations,
                      Fn&& fn,
                      const std::string& extra = "") {
    std::vector<double> timings;
    timings.reserve(iterations);

    // Warmup
    for (size_t i = 0; i < std::min(iterations / 10, size_t{5}); ++i) fn();

    for (size_t i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        fn();
        auto end = Clock::now();
        timings.push_back(std::chrono::duration<double, std::micro>(end - start).count());
    }

    std::sort(timings.begin(), timings.end());

    const double sum = std::accumulate(timings.begin(), timings.end(), 0.0);
    const double mean = sum / static_cast<double>(iterations);
    const double sq_sum = std::accumulate(timings.begin(), timings.end(), 0.0,
        [mean](double acc, double v) { return acc + (v - mean) * (v - mean); });
    const double stddev = std::sqrt(sq_sum / static_cast<double>(iterations));

    const size_t p99_idx = std::min(static_cast<size_t>(0.99 * static_cast<double>(iterations)),
                                    iterations - 1);

    return BenchResult{
        .name = name, .category = category,
        .mean_us = mean, .stddev_us = stddev,
        .min_us = timings.front(), .max_us = timings.back(),
        .p99_us = timings[p99_idx], .iterations = iterations, .extra = extra
    };
}

void print_results(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "category,name,mean_us,stddev_us,min_us,max_us,p99_us,iterations,extra\n";
        for (const auto& r : results) {
            std::cout << r.category << "," << r.name << ","
                      << std::fixed << std::setprecision(2)
                      << r.mean_us << "," << r.stddev_us << ","
                      << r.min_us << "," << r.max_us << "," << r.p99_us << ","
                      << r.iterations << "," << r.extra << "\n";
        }
        return;
    }

    std::string current_cat;
    for (const auto& r : results) {
        if (r.category != current_cat) {
            current_cat = r.category;
            std::cout << "\n══ " << current_cat << " ══\n";
            std::cout << std::left << std::setw(42) << "Benchmark"
                      << std::right << std::setw(11) << "Mean(us)"
                      << std::setw(11) << "Stddev"
                      << std::setw(11) << "P99(us)"
                      << std::setw(11) << "Min(us)"
                      << "  Info\n"
                      << std::string(98, '-') << "\n";
        }
        std::cout << std::left << std::setw(42) << r.name
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(11) << r.mean_us
                  << std::setw(11) << r.stddev_us
                  << std::setw(11) << r.p99_us
                  << std::setw(11) << r.min_us
                  << "  " << r.extra << "\n";
    }
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

Logger& quiet_logger() {
    static Logger logger(std::make_unique<NullSink>(), LogLevel::Error);
    return logger;
}

MetricRecord make_record(const ProviderId& provider, size_t i) {
    MetricRecord r;
    r.task_id = provider + "-" + std::to_string(i);
    r.provider_id = provider;
    r.timestamp = std::chrono::system_clock::now() - std::chrono::seconds{static_cast<int64_t>(i)};
    r.latency = 0.01 + 0.001 * static_cast<double>(i % 17);
    r.cpu_usage = 0.3;
    r.ram_usage = 0.4;
    return r;
}

std::vector<double> noisy_series(size_t n) {
    std::vector<double> v(n);
    for (size_t i = 0; i < n; ++i) {
        v[i] = 0.05 + 0.0005 * static_cast<double>(i) + 0.002 * std::sin(static_cast<double>(i));
    }
    return v;
}

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_trend() {
    std::vector<BenchResult> R;
    constexpr size_t N = 2000;

    for (size_t n : {20, 50, 200, 1000}) {
        auto series = noisy_series(n);
        R.push_back(run_bench("regression(" + std::to_string(n) + ")", "Trend", N,
            [&]{ auto r = linear_regression(series); (void)r; }, std::to_string(n) + " points"));
    }

    auto series = noisy_series(1000);
    R.push_back(run_bench("classify_trend(w=50)", "Trend", N,
        [&]{ auto t = classify_trend(series, Metric::Latency, 50); (void)t; }, "1000 points"));

    std::vector<MetricRecord> records;
    for (size_t i = 0; i < 1000; ++i) records.push_back(make_record("A", i));
    R.push_back(run_bench("extract(latency)", "Trend", N,
        [&]{ auto v = extract(records, Metric::Latency); (void)v; }, "1000 records"));

    return R;
}

std::vector<BenchResult> bench_learner() {
    std::vector<BenchResult> R;
    constexpr size_t N = 2000;

    InMemoryKnowledgeStore store;
    LearnerConfig config;
    ContextLearner learner(store, config, quiet_logger());
    const ExecutionMetrics m{.cpu = 0.3, .ram_mb = 150.0, .duration_s = 1.0};

    size_t i = 0;
    R.push_back(run_bench("record_execution", "Learner", N,
        [&]{ learner.record_execution("sim", "p" + std::to_string(i++ % 10), m, true); },
        "10 providers"));
    R.push_back(run_bench("recommend", "Learner", N,
        [&]{ auto r = learner.recommend("sim"); (void)r; }, "10 providers"));
    R.push_back(run_bench("predict_resource_needs", "Learner", N,
        [&]{ auto p = learner.predict_resource_needs("sim"); (void)p; }, "weighted"));
    R.push_back(run_bench("analyze_patterns", "Learner", N,
        [&]{ auto a = learner.analyze_patterns(); (void)a; }));

    return R;
}

std::vector<BenchResult> bench_tracker_router() {
    std::vector<BenchResult> R;
    constexpr size_t N = 200;

    InMemoryMetricsStore metrics;
    InMemoryKnowledgeStore knowledge;
    TrackerConfig tracker_config;
    LearnerConfig learner_config;
    RouterConfig router_config;
    PerformanceTracker tracker(metrics, tracker_config, quiet_logger());
    ContextLearner learner(knowledge, learner_config, quiet_logger());
    AdaptiveRouter router(learner, tracker, router_config, quiet_logger());

    for (const auto* p : {"A", "B", "C", "D", "E"}) {
        for (size_t i = 0; i < 200; ++i) tracker.ingest(make_record(p, i));
    }
    auto label = "1000 records";

    R.push_back(run_bench("rankings(latency)", "Tracker", N,
        [&]{ auto r = tracker.rankings(Metric::Latency); (void)r; }, label));
    R.push_back(run_bench("detect_degradation", "Tracker", N,
        [&]{ auto a = tracker.detect_degradation("A"); (void)a; }, label));
    R.push_back(run_bench("detect_all_degradations", "Tracker", N,
        [&]{ auto a = tracker.detect_all_degradations(); (void)a; }, label));

    R.push_back(run_bench("route(ranking)", "Router", N,
        [&]{ auto d = router.route("sim", "t"); (void)d; }, "5 ranked providers"));

    const ExecutionMetrics m{.cpu = 0.3, .ram_mb = 150.0, .duration_s = 1.0};
    for (int i = 0; i < 25; ++i) learner.record_execution("sim", "A", m, true);
    R.push_back(run_bench("route(learned)", "Router", N * 10,
        [&]{ auto d = router.route("sim", "t"); (void)d; }, "learned pattern"));

    size_t i = 0;
    R.push_back(run_bench("start+complete", "Router", N * 10, [&]{
        const auto id = "t" + std::to_string(i++);
        router.register_start(id, "A", "sim");
        router.register_completion(id, true, 0.01);
    }));

    return R;
}

std::vector<BenchResult> bench_storage() {
    std::vector<BenchResult> R;
    const auto dir = std::filesystem::temp_directory_path() / "as_bench_storage";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    auto opened = SqliteMetricsStore::open(dir / "bench.db");
    if (!opened) {
        std::cerr << "  sqlite unavailable: " << opened.error().message << "\n";
        return R;
    }
    auto store = std::move(opened).value();

    std::vector<MetricRecord> batch;
    for (size_t i = 0; i < 100; ++i) batch.push_back(make_record("A", i));

    R.push_back(run_bench("sqlite_append(100)", "Storage", 50,
        [&]{ auto r = store->append(batch); (void)r; }, "one transaction"));

    MetricQuery q;
    q.provider = "A";
    q.limit = 1000;
    R.push_back(run_bench("sqlite_query(1000)", "Storage", 50,
        [&]{ auto r = store->query(q); (void)r; }, "newest first"));
    R.push_back(run_bench("sqlite_summary", "Storage", 500,
        [&]{ auto r = store->summary("A"); (void)r; }));

    InMemoryMetricsStore memory;
    R.push_back(run_bench("memory_append(100)", "Storage", 50,
        [&]{ auto r = memory.append(batch); (void)r; }));

    store.reset();
    std::filesystem::remove_all(dir);
    return R;
}

std::vector<BenchResult> bench_runtime() {
    std::vector<BenchResult> R;
    constexpr size_t N = 500;

    MockProbe mock;
    R.push_back(run_bench("mock_read", "Monitor", N * 2, [&]{ auto s = mock.read(); (void)s; }));

    LinuxProbe linux_probe;
    if (linux_probe.read()) {
        R.push_back(run_bench("linux_read", "Monitor", N, [&]{ auto s = linux_probe.read(); (void)s; }));
    }

    MonitorConfig monitor_config;
    ResourceMonitor monitor(mock, monitor_config, quiet_logger());
    R.push_back(run_bench("monitor_sample(cached)", "Monitor", N * 2,
        [&]{ auto s = monitor.sample(); (void)s; }));

    ThreadPool tpool(4);
    R.push_back(run_bench("threadpool_submit", "Executor", N, [&]{
        auto f = tpool.submit([]{});
        f.wait();
    }));

    SchedulerConfig scheduler_config;
    PriorityScheduler scheduler(monitor, scheduler_config, quiet_logger());
    size_t i = 0;
    R.push_back(run_bench("schedule+tick", "Scheduler", N, [&]{
        Task t;
        t.id = "bench-" + std::to_string(i++);
        t.priority = Priority::High;
        t.callback = [](std::stop_token) {};
        scheduler.schedule(std::move(t));
        scheduler.tick();
    }));
    (void)scheduler.wait_idle(std::chrono::seconds{5});

    return R;
}

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  AdaptiveScheduler Performance Benchmarks\n"
                  << "  " << std::string(40, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_trend());
    append(bench_learner());
    append(bench_tracker_router());
    append(bench_storage());
    append(bench_runtime());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
