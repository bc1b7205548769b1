/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <stdexcept>

namespace adaptive_scheduler {

namespace {

/// Raised by read_uint for a value that cannot be held by an unsigned field.
class ConfigValueError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

template <typename T>
T read_uint(const toml::node_view<toml::node>& section, std::string_view key, T fallback) {
    const auto value = section[key].value_or(static_cast<int64_t>(fallback));
    if (value < 0) {
        throw ConfigValueError(std::string{key} + " must not be negative (got "
                               + std::to_string(value) + ")");
    }
    return static_cast<T>(value);
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string()};
    }

    Config config;

    try {
        auto tbl = toml::parse_file(path.string());

        // [monitor]
        if (auto monitor = tbl["monitor"]; monitor.is_table()) {
            auto& m = config.monitor;
            m.mock = monitor["mock"].value_or(m.mock);
            m.cache_ttl_ms = read_uint(monitor, "cache_ttl_ms", m.cache_ttl_ms);
            m.idle_timeout_s = read_uint(monitor, "idle_timeout_s", m.idle_timeout_s);
            m.history_size = read_uint(monitor, "history_size", m.history_size);
            m.idle_interval_ms = read_uint(monitor, "idle_interval_ms", m.idle_interval_ms);
            m.active_interval_ms = read_uint(monitor, "active_interval_ms", m.active_interval_ms);
            m.alert_interval_ms = read_uint(monitor, "alert_interval_ms", m.alert_interval_ms);
            m.critical_interval_ms =
                read_uint(monitor, "critical_interval_ms", m.critical_interval_ms);
        }

        // [scheduler]
        if (auto scheduler = tbl["scheduler"]; scheduler.is_table()) {
            auto& s = config.scheduler;
            s.max_concurrent = read_uint(scheduler, "max_concurrent", s.max_concurrent);
            s.tick_ms = read_uint(scheduler, "tick_ms", s.tick_ms);
            s.history_size = read_uint(scheduler, "history_size", s.history_size);
            s.drain_ms = read_uint(scheduler, "drain_ms", s.drain_ms);
            s.light_cpu_percent = static_cast<float>(
                scheduler["light_cpu_percent"].value_or(double{s.light_cpu_percent}));
            s.light_mem_percent = static_cast<float>(
                scheduler["light_mem_percent"].value_or(double{s.light_mem_percent}));
        }

        // [tracker]
        if (auto tracker = tbl["tracker"]; tracker.is_table()) {
            auto& t = config.tracker;
            t.buffer_size = read_uint(tracker, "buffer_size", t.buffer_size);
            t.retention_days = read_uint(tracker, "retention_days", t.retention_days);
            t.trend_window = read_uint(tracker, "trend_window", t.trend_window);
            t.degradation_window =
                read_uint(tracker, "degradation_window", t.degradation_window);
            t.ranking_window_hours =
                read_uint(tracker, "ranking_window_hours", t.ranking_window_hours);
        }

        // [learner]
        if (auto learner = tbl["learner"]; learner.is_table()) {
            auto& l = config.learner;
            l.alpha = learner["alpha"].value_or(l.alpha);
            l.confidence_cap = read_uint(learner, "confidence_cap", l.confidence_cap);
            l.half_life_days = learner["half_life_days"].value_or(l.half_life_days);
            l.stale_days = read_uint(learner, "stale_days", l.stale_days);
            l.adaptation_history =
                read_uint(learner, "adaptation_history", l.adaptation_history);
        }

        // [router]
        if (auto router = tbl["router"]; router.is_table()) {
            auto& r = config.router;
            r.default_provider = router["default_provider"].value_or(r.default_provider);
            r.max_fallback_chain = read_uint(router, "max_fallback_chain", r.max_fallback_chain);
            r.latency_spike_factor =
                router["latency_spike_factor"].value_or(r.latency_spike_factor);
            r.error_rate_threshold =
                router["error_rate_threshold"].value_or(r.error_rate_threshold);
            r.max_provider_load = read_uint(router, "max_provider_load", r.max_provider_load);
            r.health_ema_alpha = router["health_ema_alpha"].value_or(r.health_ema_alpha);
        }

        // [storage]
        if (auto storage = tbl["storage"]; storage.is_table()) {
            auto& st = config.storage;
            st.data_dir = storage["data_dir"].value_or(st.data_dir.string());
            st.metrics_db = storage["metrics_db"].value_or(st.metrics_db);
            st.knowledge_file = storage["knowledge_file"].value_or(st.knowledge_file);
            st.control_dir = storage["control_dir"].value_or(st.control_dir);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            auto& te = config.telemetry;
            te.log_dir = telemetry["log_dir"].value_or(te.log_dir.string());
            te.max_file_size_mb = read_uint(telemetry, "max_file_size_mb", te.max_file_size_mb);
            te.rotate_count = read_uint(telemetry, "rotate_count", te.rotate_count);
            te.log_level = telemetry["log_level"].value_or(te.log_level);
            te.audit_prefix = telemetry["audit_prefix"].value_or(te.audit_prefix);
        }

    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    } catch (const ConfigValueError& err) {
        return Error{std::string{"Invalid configuration value: "} + err.what()};
    }

    if (auto valid = validate_config(config); !valid) {
        return valid.error();
    }
    return config;
}

Result<void> validate_config(const Config& config) {
    const auto& m = config.monitor;
    if (!(m.idle_interval_ms > m.active_interval_ms &&
          m.active_interval_ms > m.alert_interval_ms &&
          m.alert_interval_ms > m.critical_interval_ms)) {
        return Error{"monitor intervals must strictly decrease: idle > active > alert > critical"};
    }
    if (m.critical_interval_ms == 0) {
        return Error{"monitor.critical_interval_ms must be positive"};
    }
    if (m.history_size == 0) {
        return Error{"monitor.history_size must be positive"};
    }
    if (config.scheduler.max_concurrent == 0) {
        return Error{"scheduler.max_concurrent must be at least 1"};
    }
    if (config.scheduler.tick_ms == 0) {
        return Error{"scheduler.tick_ms must be positive"};
    }
    if (config.tracker.buffer_size == 0) {
        return Error{"tracker.buffer_size must be positive"};
    }
    if (config.tracker.trend_window < 2 || config.tracker.degradation_window < 2) {
        return Error{"tracker trend windows need at least two points"};
    }
    if (!(config.learner.alpha > 0.0 && config.learner.alpha <= 1.0)) {
        return Error{"learner.alpha must be in (0, 1]"};
    }
    if (!(config.router.health_ema_alpha > 0.0 && config.router.health_ema_alpha <= 1.0)) {
        return Error{"router.health_ema_alpha must be in (0, 1]"};
    }
    if (config.router.max_fallback_chain < 2) {
        return Error{"router.max_fallback_chain must be at least 2"};
    }
    if (config.router.default_provider.empty()) {
        return Error{"router.default_provider must not be empty"};
    }
    return {};
}

Config default_config() {
    return Config{};
}

}  // namespace adaptive_scheduler
