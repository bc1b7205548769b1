/**
 * @file app_context.cpp
 * @brief AppContext wiring.
 * @author Dimitris Kafetzis
 */

#include "app/app_context.hpp"

#include "telemetry/json_sink.hpp"

#include <system_error>

namespace adaptive_scheduler {

AppContext::AppContext(Options options)
    : config_(std::move(options.config)) {
    // ── Logger ───────────────────────────────
    auto sink = std::move(options.log_sink);
    if (!sink) {
        sink = std::make_unique<JsonFileSink>(config_.telemetry.log_dir, "adaptive_scheduler",
                                              config_.telemetry.max_file_size_mb,
                                              config_.telemetry.rotate_count);
    }
    logger_ = std::make_unique<Logger>(std::move(sink), parse_log_level(config_.telemetry.log_level));

    // ── Resource monitor ─────────────────────
    probe_ = std::move(options.probe);
    if (!probe_) {
        if (config_.monitor.mock) {
            probe_ = std::make_unique<MockProbe>();
        } else {
            probe_ = std::make_unique<LinuxProbe>();
        }
    }
    monitor_ = std::make_unique<ResourceMonitor>(*probe_, config_.monitor, *logger_);
    logger_->info("Resource probe: " + std::string{probe_->name()});

    // ── Storage ──────────────────────────────
    if (options.ephemeral_storage) {
        metrics_store_ = std::make_unique<InMemoryMetricsStore>();
        knowledge_store_ = std::make_unique<InMemoryKnowledgeStore>();
    } else {
        std::error_code ec;
        std::filesystem::create_directories(config_.storage.data_dir, ec);
        if (ec) {
            logger_->warn("Cannot create data directory " + config_.storage.data_dir.string()
                          + ": " + ec.message());
        }

        if (auto opened = SqliteMetricsStore::open(config_.storage.metrics_path())) {
            metrics_store_ = std::move(opened).value();
            logger_->info("Metrics store: " + config_.storage.metrics_path().string());
        } else {
            logger_->warn("Metrics store unavailable, keeping metrics in memory: "
                          + opened.error().message);
            metrics_store_ = std::make_unique<InMemoryMetricsStore>();
        }
        knowledge_store_ = std::make_unique<TomlKnowledgeStore>(config_.storage.knowledge_path());
    }

    // ── Collaborators ────────────────────────
    authorizer_ = std::move(options.authorizer);
    if (!authorizer_) authorizer_ = std::make_unique<AllowAllAuthorizer>();

    audit_ = std::move(options.audit);
    if (!audit_) {
        audit_ = std::make_unique<AuditLog>(std::make_unique<JsonFileSink>(
            config_.telemetry.log_dir, config_.telemetry.audit_prefix,
            config_.telemetry.max_file_size_mb, config_.telemetry.rotate_count));
    }

    // ── Orchestrator & scheduler ─────────────
    orchestrator_ = std::make_unique<AdaptationOrchestrator>(
        *monitor_, *metrics_store_, *knowledge_store_, *authorizer_, *audit_, config_, *logger_);
    control_ = std::make_unique<ControlQueue>(config_.storage.control_path(), *logger_);
    scheduler_ = std::make_unique<PriorityScheduler>(*monitor_, config_.scheduler, *logger_);

    scheduler_->on_throttle_change([this](ThrottleLevel from, ThrottleLevel to) {
        logger_->info("Throttle " + std::string{to_string(from)} + " -> "
                      + std::string{to_string(to)} + ": " + std::string{describe(to)});
    });
}

AppContext::~AppContext() {
    stop();
    // Joins the worker pool, so no callback outlives the components below
    scheduler_.reset();
}

void AppContext::start() {
    if (running_.exchange(true)) return;

    monitor_->start();
    scheduler_->start();
    orchestrator_->start_monitoring();
    logger_->info("Adaptive scheduler started");
}

void AppContext::stop() {
    if (!running_.exchange(false)) return;

    scheduler_->stop(std::chrono::milliseconds{config_.scheduler.drain_ms});
    orchestrator_->stop_monitoring();
    monitor_->stop();
    logger_->info("Adaptive scheduler stopped");
    logger_->flush();
}

}  // namespace adaptive_scheduler
