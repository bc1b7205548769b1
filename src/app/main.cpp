/**
 * @file main.cpp
 * @brief AdaptiveScheduler daemon and management CLI entry point.
 * @author Dimitris Kafetzis
 *
 * Wires all modules through AppContext:
 *   Config → Logger → Monitor → Stores → Orchestrator → Scheduler
 */

#include "app/app_context.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "performance/trend.hpp"
#include "resource_monitor/probe.hpp"
#include "scheduler/task.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace adaptive_scheduler;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║         AdaptiveScheduler v1.0.0          ║
  ║   Resource-Governed Task Scheduling       ║
  ║   with Live Provider Adaptation           ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

void print_usage() {
    std::cout << "Usage: adaptive_scheduler [OPTIONS] [COMMAND [ARGS]]\n"
              << "  --config <path>    Configuration file (default: config/default.toml)\n"
              << "  --log-dir <path>   Log output directory\n"
              << "  --mock             Use a simulated resource probe\n"
              << "  --help, -h         Show this help message\n"
              << "\nCommands:\n"
              << "  run                               Daemon loop (default)\n"
              << "  demo                              Synthetic workload across three providers\n"
              << "  status                            Monitor, scheduler and adaptation status\n"
              << "  patterns <kind>                   Learned patterns for a task kind\n"
              << "  recommend <kind>                  Provider recommendation for a task kind\n"
              << "  rankings [metric]                 Provider rankings (default: latency)\n"
              << "  insights                          High performers, underperformers, adaptations\n"
              << "  history [n]                       Recent adaptation outcomes\n"
              << "  adapt <task> <reason> [provider]  Ask the running daemon to switch a task\n";
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string log_dir;
    bool mock = false;
    std::string command = "run";
    std::vector<std::string> command_args;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    bool have_command = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--mock") {
            args.mock = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else if (!have_command) {
            args.command = arg;
            have_command = true;
        } else {
            args.command_args.push_back(arg);
        }
    }
    return args;
}

std::string fixed(double value, int precision = 3) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", precision, value);
    return buf;
}

// ─────────────────────────────────────────────
// Commands
// ─────────────────────────────────────────────

int cmd_status(AppContext& ctx) {
    auto st = ctx.orchestrator().status();
    auto sched = ctx.scheduler().status();

    std::cout << "Monitor:     " << to_string(st.monitor_state)
              << "  cpu " << fixed(st.cpu_percent, 1) << "%"
              << "  mem " << fixed(st.mem_percent, 1) << "%"
              << "  headroom cpu " << fixed(st.headroom.cpu_percent, 1)
              << " / mem " << fixed(st.headroom.mem_percent, 1) << "\n"
              << "Limits:      cpu at " << fixed(st.cpu_limit_proximity * 100.0, 1)
              << "% of ceiling, mem at " << fixed(st.mem_limit_proximity * 100.0, 1) << "% of ceiling\n"
              << "Scheduler:   throttle " << to_string(sched.throttle)
              << " (" << sched.throttle_description << "), limit " << sched.effective_limit
              << ", running " << sched.active.size() << "\n"
              << "Adaptation:  " << (st.monitoring_active ? "active" : "inactive")
              << ", " << st.adaptation_count << " adaptations, "
              << st.concurrent_adaptations << " in flight, "
              << st.pattern_count << " patterns\n";
    return 0;
}

int cmd_patterns(AppContext& ctx, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "patterns: missing task kind\n";
        return 2;
    }
    auto patterns = ctx.orchestrator().patterns(args[0]);
    if (patterns.empty()) {
        std::cout << "No learned patterns for " << args[0] << "\n";
        return 0;
    }
    for (const auto& s : patterns) {
        const auto& p = s.pattern;
        std::cout << p.provider_id
                  << "  confidence " << fixed(s.confidence)
                  << "  success " << fixed(p.success_rate)
                  << "  runs " << p.execution_count
                  << "  cpu " << fixed(p.resource_profile.avg_cpu)
                  << "  ram " << fixed(p.resource_profile.avg_ram, 1) << "MB"
                  << "  duration " << fixed(p.resource_profile.avg_duration) << "s\n";
    }
    return 0;
}

int cmd_recommend(AppContext& ctx, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "recommend: missing task kind\n";
        return 2;
    }
    auto rec = ctx.orchestrator().recommend(args[0]);
    if (!rec) {
        std::cout << "No recommendation for " << args[0] << "\n";
        return 0;
    }
    std::cout << rec->provider_id << " (confidence " << fixed(rec->confidence) << ")\n"
              << "  " << rec->reason << "\n"
              << "  estimate: cpu " << fixed(rec->estimate.avg_cpu)
              << ", ram " << fixed(rec->estimate.avg_ram, 1) << "MB"
              << ", duration " << fixed(rec->estimate.avg_duration) << "s\n";
    return 0;
}

int cmd_rankings(AppContext& ctx, const std::vector<std::string>& args) {
    Metric metric = Metric::Latency;
    if (!args.empty()) {
        auto parsed = parse_metric(args[0]);
        if (!parsed) {
            std::cerr << "rankings: unknown metric " << args[0] << "\n";
            return 2;
        }
        metric = *parsed;
    }

    auto rankings = ctx.orchestrator().rankings(metric);
    if (rankings.empty()) {
        std::cout << "No metrics recorded in the ranking window\n";
        return 0;
    }
    size_t rank = 1;
    for (const auto& r : rankings) {
        std::cout << "#" << rank++ << " " << r.provider_id
                  << "  " << to_string(metric) << " " << fixed(r.score < 0 ? -r.score : r.score)
                  << "  samples " << r.samples
                  << "  errors " << fixed(r.avg_error_rate)
                  << "  trend " << to_string(r.trend)
                  << " (" << fixed(r.trend_confidence, 2) << ")\n";
    }
    return 0;
}

int cmd_insights(AppContext& ctx) {
    auto insights = ctx.orchestrator().insights();

    std::cout << "High performers: " << insights.high_performers.size() << "\n";
    for (const auto& s : insights.high_performers) {
        std::cout << "  " << s.pattern.task_kind << "/" << s.pattern.provider_id
                  << "  success " << fixed(s.pattern.success_rate)
                  << "  confidence " << fixed(s.confidence) << "\n";
    }
    std::cout << "Underperformers: " << insights.underperformers.size() << "\n";
    for (const auto& s : insights.underperformers) {
        std::cout << "  " << s.pattern.task_kind << "/" << s.pattern.provider_id
                  << "  success " << fixed(s.pattern.success_rate)
                  << "  runs " << s.pattern.execution_count << "\n";
    }
    if (insights.adaptations) {
        std::cout << "Adaptations: " << insights.adaptations->total << " recent, "
                  << fixed(insights.adaptations->success_rate * 100.0, 1) << "% successful\n";
    }
    return 0;
}

int cmd_history(AppContext& ctx, const std::vector<std::string>& args) {
    size_t n = 20;
    if (!args.empty()) {
        try {
            n = static_cast<size_t>(std::stoul(args[0]));
        } catch (const std::exception&) {
            std::cerr << "history: invalid count " << args[0] << "\n";
            return 2;
        }
    }
    auto history = ctx.orchestrator().adaptation_history(n);
    if (history.empty()) {
        std::cout << "No adaptations recorded\n";
        return 0;
    }
    for (const auto& a : history) {
        std::cout << to_unix_micros(a.timestamp) << "  " << a.task_id
                  << "  " << (a.success ? "ok    " : "failed")
                  << "  " << a.reason;
        if (!a.details.empty()) std::cout << "  [" << a.details << "]";
        std::cout << "\n";
    }
    return 0;
}

int cmd_adapt(AppContext& ctx, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        std::cerr << "adapt: usage adapt <task> <reason> [provider]\n";
        return 2;
    }
    AdaptationRequest request{.task_id = args[0], .reason = args[1], .alternative = std::nullopt};
    if (args.size() > 2) request.alternative = args[2];

    // The task table lives in the daemon, so the request goes through its control queue
    auto id = ctx.control().submit(request);
    if (!id) {
        std::cerr << "adapt: " << id.error().message << "\n";
        return 1;
    }
    auto result = ctx.control().await_result(*id, std::chrono::seconds{10});
    if (!result) {
        std::cerr << "adapt: " << result.error().message << " (is `run` active?)\n";
        return 1;
    }
    std::cout << (result->success ? "Adapted: " : "Not adapted: ") << result->reason;
    if (!result->details.empty()) std::cout << " [" << format_details(result->details) << "]";
    std::cout << "\n";
    return result->success ? 0 : 1;
}

/**
 * @brief Simulated workload: three providers with distinct latency and
 *        reliability, routed and learned from through the orchestrator.
 */
int cmd_demo(AppContext& ctx) {
    struct SimProvider {
        ProviderId id;
        std::chrono::milliseconds latency;
        double failure_rate;
    };
    /// Shared by every demo callback; owned jointly so it outlives this frame.
    struct DemoState {
        std::vector<SimProvider> providers;
        std::mt19937 rng{42};
        std::uniform_real_distribution<double> coin{0.0, 1.0};
        std::mutex rng_mutex;
    };
    auto state = std::make_shared<DemoState>();
    state->providers = {
        {"local_cpu", std::chrono::milliseconds{40}, 0.02},
        {"gpu_sim", std::chrono::milliseconds{15}, 0.05},
        {"remote_api", std::chrono::milliseconds{80}, 0.25},
    };
    const TaskKind kind = "sim";
    constexpr int TASKS = 60;

    auto& logger = ctx.logger();
    auto& orchestrator = ctx.orchestrator();
    auto& scheduler = ctx.scheduler();
    logger.info("=== Demo Mode ===");

    ctx.start();

    int accepted = 0;
    for (int i = 0; i < TASKS && !g_shutdown_requested; ++i) {
        const TaskId id = "demo-" + std::to_string(i);

        // Seed every provider early so the learner has something to compare
        std::optional<size_t> forced;
        if (i < 9) forced = static_cast<size_t>(i) % state->providers.size();

        Task task;
        task.id = id;
        task.priority = i % 10 == 0 ? Priority::High : Priority::Normal;
        // The orchestrator outlives every callback: AppContext joins the scheduler first
        task.callback = [state, &orchestrator, kind, id, forced](std::stop_token stop) {
            auto decision = orchestrator.route_task(kind, id);
            ProviderId provider = forced ? state->providers[*forced].id : decision.provider_id;

            SimProvider sim = state->providers.front();
            for (const auto& p : state->providers) {
                if (p.id == provider) sim = p;
            }

            orchestrator.task_started(id, kind, provider);
            auto deadline = std::chrono::steady_clock::now() + sim.latency;
            while (std::chrono::steady_clock::now() < deadline && !stop.stop_requested()) {
                std::this_thread::sleep_for(std::chrono::milliseconds{5});
            }

            bool success = false;
            {
                std::lock_guard lock(state->rng_mutex);
                success = state->coin(state->rng) >= sim.failure_rate;
            }
            orchestrator.task_finished(id, kind, provider, success);
            if (!success) throw std::runtime_error("simulated provider failure on " + provider);
        };

        if (scheduler.schedule(std::move(task))) ++accepted;
    }

    if (!scheduler.wait_idle(std::chrono::seconds{60})) {
        logger.warn("Demo tasks still pending after 60s");
    }
    if (auto r = orchestrator.tracker().flush(); !r) {
        logger.warn("Demo flush failed: " + r.error().message);
    }

    auto stats = scheduler.stats();
    std::cout << "Scheduled " << accepted << "/" << TASKS << ": "
              << stats.completed << " completed, " << stats.failed << " failed\n\n";

    std::cout << "Rankings by latency:\n";
    cmd_rankings(ctx, {});
    std::cout << "\nPatterns for " << kind << ":\n";
    cmd_patterns(ctx, {kind});
    std::cout << "\nRecommendation:\n";
    cmd_recommend(ctx, {kind});

    auto alerts = orchestrator.check_degradation();
    std::cout << "\nDegradation alerts: " << alerts.size() << "\n";
    for (const auto& a : alerts) {
        std::cout << "  " << a.provider_id << " " << to_string(a.metric)
                  << " " << to_string(a.severity) << ": " << a.details << "\n";
    }

    ctx.stop();
    logger.info("=== Demo Complete ===");
    return 0;
}

int cmd_run(AppContext& ctx) {
    auto& logger = ctx.logger();
    ctx.start();
    logger.info("Entering main loop. Press Ctrl+C to shutdown.");

    constexpr uint64_t STATUS_EVERY = 300;         // 30 s at 100 ms
    constexpr uint64_t MAINTENANCE_EVERY = 36000;  // 1 h at 100 ms

    uint64_t loop_count = 0;
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ++loop_count;

        ctx.control().process(ctx.orchestrator());

        if (loop_count % STATUS_EVERY == 0) {
            auto st = ctx.orchestrator().status();
            auto sched = ctx.scheduler().status();
            logger.info("Status: " + std::string{to_string(st.monitor_state)}
                        + ", cpu " + fixed(st.cpu_percent, 1) + "%"
                        + ", mem " + fixed(st.mem_percent, 1) + "%"
                        + ", throttle " + std::string{to_string(sched.throttle)}
                        + ", running " + std::to_string(sched.active.size())
                        + ", adaptations " + std::to_string(st.adaptation_count));
        }
        if (loop_count % MAINTENANCE_EVERY == 0) {
            auto report = ctx.orchestrator().run_maintenance();
            logger.info("Maintenance: removed " + std::to_string(report.metrics_removed)
                        + " metrics, forgot " + std::to_string(report.patterns_forgotten)
                        + " patterns");
        }
    }

    logger.info("Shutdown requested. Cleaning up...");
    ctx.stop();
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (args.mock) config.monitor.mock = true;

    AppContext::Options options;
    options.config = config;
    if (config.monitor.mock) {
        auto probe = std::make_unique<MockProbe>();
        probe->set_usage(25.0f, 35.0f);
        options.probe = std::move(probe);
    }
    AppContext ctx(std::move(options));

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const auto& cmd = args.command;
    if (cmd == "run") {
        print_banner();
        return cmd_run(ctx);
    }
    if (cmd == "demo") {
        print_banner();
        return cmd_demo(ctx);
    }
    if (cmd == "status") return cmd_status(ctx);
    if (cmd == "patterns") return cmd_patterns(ctx, args.command_args);
    if (cmd == "recommend") return cmd_recommend(ctx, args.command_args);
    if (cmd == "rankings") return cmd_rankings(ctx, args.command_args);
    if (cmd == "insights") return cmd_insights(ctx);
    if (cmd == "history") return cmd_history(ctx, args.command_args);
    if (cmd == "adapt") return cmd_adapt(ctx, args.command_args);

    std::cerr << "Unknown command: " << cmd << "\n";
    print_usage();
    return 2;
}
