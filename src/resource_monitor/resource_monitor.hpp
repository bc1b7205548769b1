/**
 * @file resource_monitor.hpp
 * @brief Resource governor with adaptive polling.
 * @author Dimitris Kafetzis
 *
 * ResourceMonitor is the single source of truth for host load. It caches
 * the latest probe reading for a short TTL, derives a MonitorState from
 * every fresh sample, and runs a sampling thread whose interval follows
 * the state (Idle slowest, Critical fastest).
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/ring_buffer.hpp"
#include "core/types.hpp"
#include "resource_monitor/probe.hpp"

#include <array>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_set>
#include <vector>

namespace adaptive_scheduler {

/// Invoked once per state transition, outside the monitor's lock.
using StateChangeCallback =
    std::function<void(MonitorState from, MonitorState to, const ResourceSample&)>;

/// Invoked for every fresh sample, outside the monitor's lock.
using SampleCallback = std::function<void(const ResourceSample&)>;

enum class LoadTrend : uint8_t {
    Unknown,
    Rising,
    Falling,
    Stable
};

[[nodiscard]] constexpr std::string_view to_string(LoadTrend trend) noexcept {
    switch (trend) {
        case LoadTrend::Unknown: return "unknown";
        case LoadTrend::Rising:  return "rising";
        case LoadTrend::Falling: return "falling";
        case LoadTrend::Stable:  return "stable";
    }
    return "unknown";
}

struct MonitorStats {
    MonitorState state{MonitorState::Idle};
    std::chrono::milliseconds interval{0};
    std::optional<ResourceSample> last_sample;
    Headroom headroom;
    uint64_t samples_collected{0};
    uint64_t probe_failures{0};
    float recent_avg_cpu{0.0f};          ///< Mean over the last 10 samples
    float recent_avg_mem{0.0f};
    size_t history_size{0};
    size_t active_work{0};
    bool sampling{false};
};

/**
 * @brief Thread-safe resource monitor.
 *
 * All public methods may be called from any thread. Callbacks registered
 * with on_state_change() and on_sample() run on whichever thread produced
 * the sample and must not call back into the monitor's registration API.
 */
class ResourceMonitor {
public:
    ResourceMonitor(IResourceProbe& probe, const MonitorConfig& config, Logger& logger);
    ~ResourceMonitor();

    ResourceMonitor(const ResourceMonitor&) = delete;
    ResourceMonitor& operator=(const ResourceMonitor&) = delete;

    /**
     * @brief Latest reading; probes again only when the cache is stale.
     *
     * A failed probe read returns the last good sample (or a zeroed one)
     * and is logged at warn level.
     */
    ResourceSample sample(bool force_refresh = false);

    /**
     * @brief Feed a sample through history, state derivation and callbacks.
     *
     * Used by sample() for every fresh reading. State timing (idle timeout)
     * is keyed on the sample's own timestamp.
     */
    void record_sample(const ResourceSample& sample);

    [[nodiscard]] MonitorState state() const;
    [[nodiscard]] std::chrono::milliseconds current_interval() const;
    [[nodiscard]] std::chrono::milliseconds interval_for(MonitorState state) const noexcept;

    /// max(0, ceiling - current) for CPU and memory.
    Headroom headroom();

    /// True iff both estimates fit within current headroom.
    bool can_start_work(float estimated_cpu_percent, float estimated_mem_percent);

    /// True while both metrics are under their safety ceilings.
    bool is_safe();

    /// Mark the host as busy so that the idle timeout restarts.
    void signal_activity();

    void register_work(const std::string& work_id);
    void unregister_work(const std::string& work_id);
    [[nodiscard]] size_t active_work_count() const;

    [[nodiscard]] MonitorStats stats() const;
    [[nodiscard]] std::vector<ResourceSample> history() const;

    /// Compares the newest 10 samples against the oldest 10.
    [[nodiscard]] LoadTrend trend() const;

    /// Back-off a caller should apply before starting optional work.
    [[nodiscard]] std::chrono::milliseconds suggest_delay() const;

    void on_state_change(StateChangeCallback cb);
    void on_sample(SampleCallback cb);

    /// Start the background sampling thread. Idempotent.
    void start();
    /// Stop and join the sampling thread. Idempotent.
    void stop();
    [[nodiscard]] bool running() const noexcept;

private:
    MonitorState derive_state(const ResourceSample& sample);
    void sampling_loop(std::stop_token stop);

    IResourceProbe& probe_;
    Logger& logger_;

    std::chrono::milliseconds cache_ttl_;
    std::chrono::seconds idle_timeout_;
    std::array<std::chrono::milliseconds, 4> intervals_;

    mutable std::mutex mutex_;
    std::condition_variable_any interval_cv_;
    bool interval_changed_{false};

    MonitorState state_{MonitorState::Idle};
    std::optional<ResourceSample> cached_;
    SteadyTime cached_at_{};
    Timestamp last_activity_{std::chrono::system_clock::now()};   ///< Construction counts as activity
    RingBuffer<ResourceSample> history_;
    uint64_t samples_collected_{0};
    uint64_t probe_failures_{0};
    std::unordered_set<std::string> active_work_;

    std::mutex callbacks_mutex_;
    std::vector<StateChangeCallback> state_callbacks_;
    std::vector<SampleCallback> sample_callbacks_;

    std::jthread sampling_thread_;
};

}  // namespace adaptive_scheduler
