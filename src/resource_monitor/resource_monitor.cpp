/**
 * @file resource_monitor.cpp
 * @brief ResourceMonitor: cached sampling, state derivation and the
 *        adaptive-interval sampling thread.
 * @author Dimitris Kafetzis
 */

#include "resource_monitor/resource_monitor.hpp"

#include "core/safety.hpp"

#include <algorithm>
#include <exception>
#include <sstream>

namespace adaptive_scheduler {

namespace {

constexpr size_t TREND_SPAN = 10;
constexpr float TREND_DEAD_BAND = 5.0f;

size_t state_index(MonitorState state) noexcept {
    return static_cast<size_t>(state);
}

std::string describe(const ResourceSample& s) {
    std::ostringstream oss;
    oss.precision(1);
    oss << std::fixed << "cpu " << s.cpu_percent << "%, mem " << s.mem_percent << "%";
    return oss.str();
}

}  // anonymous namespace

ResourceMonitor::ResourceMonitor(IResourceProbe& probe, const MonitorConfig& config, Logger& logger)
    : probe_(probe)
    , logger_(logger)
    , cache_ttl_(config.cache_ttl_ms)
    , idle_timeout_(config.idle_timeout_s)
    , intervals_{std::chrono::milliseconds{config.idle_interval_ms},
                 std::chrono::milliseconds{config.active_interval_ms},
                 std::chrono::milliseconds{config.alert_interval_ms},
                 std::chrono::milliseconds{config.critical_interval_ms}}
    , history_(config.history_size) {}

ResourceMonitor::~ResourceMonitor() {
    stop();
}

// ─────────────────────────────────────────────
// Sampling
// ─────────────────────────────────────────────

ResourceSample ResourceMonitor::sample(bool force_refresh) {
    {
        std::lock_guard lock(mutex_);
        if (!force_refresh && cached_ &&
            std::chrono::steady_clock::now() - cached_at_ < cache_ttl_) {
            return *cached_;
        }
    }

    auto reading = probe_.read();
    if (!reading) {
        logger_.warn("Resource probe '" + std::string{probe_.name()}
                     + "' failed: " + reading.error().message);
        std::lock_guard lock(mutex_);
        ++probe_failures_;
        if (cached_) return *cached_;
        ResourceSample zeroed;
        zeroed.timestamp = std::chrono::system_clock::now();
        return zeroed;
    }

    record_sample(*reading);
    return *reading;
}

void ResourceMonitor::record_sample(const ResourceSample& sample) {
    MonitorState previous;
    MonitorState next;
    {
        std::lock_guard lock(mutex_);
        history_.push(sample);
        ++samples_collected_;
        cached_ = sample;
        cached_at_ = std::chrono::steady_clock::now();

        previous = state_;
        next = derive_state(sample);
        if (next != previous) {
            state_ = next;
            interval_changed_ = true;
        }
    }

    if (next != previous) {
        interval_cv_.notify_all();
        logger_.info("Monitor state " + std::string{to_string(previous)} + " -> "
                     + std::string{to_string(next)} + " (" + describe(sample) + ", interval "
                     + std::to_string(interval_for(next).count()) + "ms)");
    }

    std::vector<StateChangeCallback> state_cbs;
    std::vector<SampleCallback> sample_cbs;
    {
        std::lock_guard lock(callbacks_mutex_);
        if (next != previous) state_cbs = state_callbacks_;
        sample_cbs = sample_callbacks_;
    }

    for (const auto& cb : sample_cbs) {
        try {
            cb(sample);
        } catch (const std::exception& e) {
            logger_.warn(std::string{"Sample callback threw: "} + e.what());
        }
    }
    for (const auto& cb : state_cbs) {
        try {
            cb(previous, next, sample);
        } catch (const std::exception& e) {
            logger_.warn(std::string{"State-change callback threw: "} + e.what());
        }
    }
}

MonitorState ResourceMonitor::derive_state(const ResourceSample& sample) {
    using namespace safety;
    const float cpu = sample.cpu_percent;
    const float mem = sample.mem_percent;

    if (cpu > CPU_CEILING_PERCENT || mem > MEM_CEILING_PERCENT) {
        return MonitorState::Critical;
    }
    if (cpu > CPU_CEILING_PERCENT * ALERT_FRACTION || mem > MEM_CEILING_PERCENT * ALERT_FRACTION) {
        return MonitorState::Alert;
    }
    if (cpu > ACTIVE_CPU_PERCENT || mem > ACTIVE_MEM_PERCENT) {
        last_activity_ = sample.timestamp;
        return MonitorState::Active;
    }

    // Low usage: stay Active until the idle timeout has elapsed
    if (sample.timestamp - last_activity_ >= idle_timeout_) {
        return MonitorState::Idle;
    }
    return MonitorState::Active;
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

MonitorState ResourceMonitor::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

std::chrono::milliseconds ResourceMonitor::current_interval() const {
    std::lock_guard lock(mutex_);
    return intervals_[state_index(state_)];
}

std::chrono::milliseconds ResourceMonitor::interval_for(MonitorState state) const noexcept {
    return intervals_[state_index(state)];
}

Headroom ResourceMonitor::headroom() {
    auto s = sample();
    return Headroom{
        .cpu_percent = std::max(0.0f, safety::CPU_CEILING_PERCENT - s.cpu_percent),
        .mem_percent = std::max(0.0f, safety::MEM_CEILING_PERCENT - s.mem_percent),
    };
}

bool ResourceMonitor::can_start_work(float estimated_cpu_percent, float estimated_mem_percent) {
    auto room = headroom();
    return estimated_cpu_percent <= room.cpu_percent
        && estimated_mem_percent <= room.mem_percent;
}

bool ResourceMonitor::is_safe() {
    auto s = sample();
    return s.cpu_percent <= safety::CPU_CEILING_PERCENT
        && s.mem_percent <= safety::MEM_CEILING_PERCENT;
}

void ResourceMonitor::signal_activity() {
    std::lock_guard lock(mutex_);
    last_activity_ = std::chrono::system_clock::now();
}

void ResourceMonitor::register_work(const std::string& work_id) {
    std::lock_guard lock(mutex_);
    active_work_.insert(work_id);
    last_activity_ = std::chrono::system_clock::now();
}

void ResourceMonitor::unregister_work(const std::string& work_id) {
    std::lock_guard lock(mutex_);
    active_work_.erase(work_id);
}

size_t ResourceMonitor::active_work_count() const {
    std::lock_guard lock(mutex_);
    return active_work_.size();
}

MonitorStats ResourceMonitor::stats() const {
    std::lock_guard lock(mutex_);
    MonitorStats out;
    out.state = state_;
    out.interval = intervals_[state_index(state_)];
    out.last_sample = cached_;
    out.samples_collected = samples_collected_;
    out.probe_failures = probe_failures_;
    out.history_size = history_.size();
    out.active_work = active_work_.size();
    out.sampling = sampling_thread_.joinable();

    if (cached_) {
        out.headroom.cpu_percent =
            std::max(0.0f, safety::CPU_CEILING_PERCENT - cached_->cpu_percent);
        out.headroom.mem_percent =
            std::max(0.0f, safety::MEM_CEILING_PERCENT - cached_->mem_percent);
    }

    auto recent = history_.last(TREND_SPAN);
    if (!recent.empty()) {
        float cpu = 0.0f, mem = 0.0f;
        for (const auto& s : recent) {
            cpu += s.cpu_percent;
            mem += s.mem_percent;
        }
        out.recent_avg_cpu = cpu / static_cast<float>(recent.size());
        out.recent_avg_mem = mem / static_cast<float>(recent.size());
    }
    return out;
}

std::vector<ResourceSample> ResourceMonitor::history() const {
    std::lock_guard lock(mutex_);
    return history_.to_vector();
}

LoadTrend ResourceMonitor::trend() const {
    std::lock_guard lock(mutex_);
    if (history_.size() < 2 * TREND_SPAN) return LoadTrend::Unknown;

    auto load = [](const ResourceSample& s) { return (s.cpu_percent + s.mem_percent) / 2.0f; };

    float oldest = 0.0f, newest = 0.0f;
    for (size_t i = 0; i < TREND_SPAN; ++i) {
        oldest += load(history_.at(i));
        newest += load(history_.at(history_.size() - TREND_SPAN + i));
    }
    float delta = (newest - oldest) / static_cast<float>(TREND_SPAN);

    if (delta > TREND_DEAD_BAND) return LoadTrend::Rising;
    if (delta < -TREND_DEAD_BAND) return LoadTrend::Falling;
    return LoadTrend::Stable;
}

std::chrono::milliseconds ResourceMonitor::suggest_delay() const {
    switch (state()) {
        case MonitorState::Critical: return std::chrono::milliseconds{5000};
        case MonitorState::Alert:    return std::chrono::milliseconds{2000};
        case MonitorState::Active:   return std::chrono::milliseconds{500};
        case MonitorState::Idle:     return std::chrono::milliseconds{0};
    }
    return std::chrono::milliseconds{0};
}

void ResourceMonitor::on_state_change(StateChangeCallback cb) {
    std::lock_guard lock(callbacks_mutex_);
    state_callbacks_.push_back(std::move(cb));
}

void ResourceMonitor::on_sample(SampleCallback cb) {
    std::lock_guard lock(callbacks_mutex_);
    sample_callbacks_.push_back(std::move(cb));
}

// ─────────────────────────────────────────────
// Background sampling
// ─────────────────────────────────────────────

void ResourceMonitor::start() {
    if (sampling_thread_.joinable()) return;
    sampling_thread_ = std::jthread([this](std::stop_token stop) {
        sampling_loop(stop);
    });
    logger_.info("Resource monitor started (probe: " + std::string{probe_.name()} + ")");
}

void ResourceMonitor::stop() {
    if (!sampling_thread_.joinable()) return;
    sampling_thread_.request_stop();
    sampling_thread_.join();
    logger_.info("Resource monitor stopped");
}

bool ResourceMonitor::running() const noexcept {
    return sampling_thread_.joinable();
}

void ResourceMonitor::sampling_loop(std::stop_token stop) {
    auto take_sample = [this] {
        try {
            sample(true);
        } catch (const std::exception& e) {
            logger_.error(std::string{"Sampling tick failed: "} + e.what());
        }
    };

    take_sample();

    std::unique_lock lock(mutex_);
    while (!stop.stop_requested()) {
        interval_changed_ = false;
        auto wait = intervals_[state_index(state_)];

        // A state transition elsewhere restarts the timer with the new interval
        bool changed = interval_cv_.wait_for(lock, stop, wait, [this] { return interval_changed_; });
        if (stop.stop_requested()) return;
        if (changed) continue;

        lock.unlock();
        take_sample();
        lock.lock();
    }
}

}  // namespace adaptive_scheduler
