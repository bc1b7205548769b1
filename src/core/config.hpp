/**
 * @file config.hpp
 * @brief Scheduler configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 *
 * Safety ceilings are not configurable; they live in core/safety.hpp.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace adaptive_scheduler {

struct MonitorConfig {
    bool mock = false;
    uint32_t cache_ttl_ms = 1000;
    uint32_t idle_timeout_s = 30;
    uint32_t history_size = 60;
    uint32_t idle_interval_ms = 8000;
    uint32_t active_interval_ms = 4000;
    uint32_t alert_interval_ms = 2000;
    uint32_t critical_interval_ms = 1000;
};

struct SchedulerConfig {
    uint32_t max_concurrent = 3;
    uint32_t tick_ms = 100;
    uint32_t history_size = 100;
    uint32_t drain_ms = 5000;            ///< Wait for running tasks on stop
    float light_cpu_percent = 50.0f;     ///< Light throttle at or above this CPU
    float light_mem_percent = 45.0f;     ///< Light throttle at or above this memory
};

struct TrackerConfig {
    uint32_t buffer_size = 100;
    uint32_t retention_days = 30;
    uint32_t trend_window = 50;
    uint32_t degradation_window = 20;    ///< Trend window used by degradation checks
    uint32_t ranking_window_hours = 24;
};

struct LearnerConfig {
    double alpha = 0.3;
    uint32_t confidence_cap = 20;
    double half_life_days = 30.0;
    uint32_t stale_days = 90;
    uint32_t adaptation_history = 100;
};

struct RouterConfig {
    std::string default_provider = "local_cpu";
    uint32_t max_fallback_chain = 3;
    double latency_spike_factor = 3.0;
    double error_rate_threshold = 0.2;
    uint32_t max_provider_load = 10;
    double health_ema_alpha = 0.3;
};

struct StorageConfig {
    std::filesystem::path data_dir = "./data";
    std::string metrics_db = "metrics.db";
    std::string knowledge_file = "knowledge.toml";
    std::string control_dir = "control";     ///< Request/result drop box for the CLI

    [[nodiscard]] std::filesystem::path metrics_path() const { return data_dir / metrics_db; }
    [[nodiscard]] std::filesystem::path knowledge_path() const { return data_dir / knowledge_file; }
    [[nodiscard]] std::filesystem::path control_path() const { return data_dir / control_dir; }
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    std::string audit_prefix = "audit";
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    MonitorConfig monitor;
    SchedulerConfig scheduler;
    TrackerConfig tracker;
    LearnerConfig learner;
    RouterConfig router;
    StorageConfig storage;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file and validate it.
 *
 * Missing keys keep their defaults. A missing file, a parse error or a
 * failed validation is reported as an Error.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Check cross-field constraints (interval ordering, positive limits).
 */
Result<void> validate_config(const Config& config);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace adaptive_scheduler
