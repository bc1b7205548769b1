/**
 * @file app_context.hpp
 * @brief Owns one instance of every component and their lifecycle.
 * @author Dimitris Kafetzis
 *
 * Construction order: Logger → probe → ResourceMonitor → stores →
 * AuditLog → AdaptationOrchestrator → PriorityScheduler. Members are
 * destroyed in reverse, after stop() has quiesced every loop. The
 * scheduler goes first so task callbacks that still hold the
 * orchestrator finish before it is released.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "orchestrator/adaptation_orchestrator.hpp"
#include "orchestrator/authorizer.hpp"
#include "orchestrator/control_queue.hpp"
#include "resource_monitor/probe.hpp"
#include "resource_monitor/resource_monitor.hpp"
#include "scheduler/priority_scheduler.hpp"
#include "storage/knowledge_store.hpp"
#include "storage/metrics_store.hpp"
#include "telemetry/audit_log.hpp"

#include <atomic>
#include <memory>

namespace adaptive_scheduler {

class AppContext {
public:
    struct Options {
        Config config;
        /// Null selects a JsonFileSink in config.telemetry.log_dir.
        std::unique_ptr<ILogSink> log_sink;
        /// Null selects MockProbe when config.monitor.mock is set, else LinuxProbe.
        std::unique_ptr<IResourceProbe> probe;
        /// Null selects an NDJSON AuditLog next to the log file.
        std::unique_ptr<IAuditSink> audit;
        std::unique_ptr<IAuthorizer> authorizer;
        /// Keep metrics and knowledge in memory only.
        bool ephemeral_storage = false;
    };

    explicit AppContext(Options options);
    ~AppContext();

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

    /// Start the monitor sampler, the scheduler loop and adaptation monitoring.
    void start();
    /// Stop in reverse order. Idempotent.
    void stop();
    [[nodiscard]] bool running() const noexcept { return running_.load(); }

    [[nodiscard]] const Config& config() const noexcept { return config_; }
    Logger& logger() noexcept { return *logger_; }
    IResourceProbe& probe() noexcept { return *probe_; }
    ResourceMonitor& monitor() noexcept { return *monitor_; }
    IMetricsStore& metrics_store() noexcept { return *metrics_store_; }
    IKnowledgeStore& knowledge_store() noexcept { return *knowledge_store_; }
    PriorityScheduler& scheduler() noexcept { return *scheduler_; }
    AdaptationOrchestrator& orchestrator() noexcept { return *orchestrator_; }
    ControlQueue& control() noexcept { return *control_; }

private:
    Config config_;
    std::unique_ptr<Logger> logger_;
    std::unique_ptr<IResourceProbe> probe_;
    std::unique_ptr<ResourceMonitor> monitor_;
    std::unique_ptr<IMetricsStore> metrics_store_;
    std::unique_ptr<IKnowledgeStore> knowledge_store_;
    std::unique_ptr<IAuthorizer> authorizer_;
    std::unique_ptr<IAuditSink> audit_;
    std::unique_ptr<AdaptationOrchestrator> orchestrator_;
    std::unique_ptr<ControlQueue> control_;
    std::unique_ptr<PriorityScheduler> scheduler_;

    std::atomic<bool> running_{false};
};

}  // namespace adaptive_scheduler
