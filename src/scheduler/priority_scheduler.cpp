/**
 * @file priority_scheduler.cpp
 * @brief PriorityScheduler: admission, throttling, execution and timeouts.
 * @author Dimitris Kafetzis
 */

#include "scheduler/priority_scheduler.hpp"

#include "core/safety.hpp"

#include <algorithm>
#include <exception>

namespace adaptive_scheduler {

namespace {

size_t index_of(Priority priority) noexcept {
    return static_cast<size_t>(priority);
}

}  // anonymous namespace

PriorityScheduler::PriorityScheduler(ResourceMonitor& monitor,
                                     const SchedulerConfig& config,
                                     Logger& logger)
    : monitor_(monitor)
    , logger_(logger)
    , config_(config)
    , history_(config.history_size)
    , pool_(std::max<size_t>(config.max_concurrent, 1)) {}

PriorityScheduler::~PriorityScheduler() {
    stop();
}

// ─────────────────────────────────────────────
// Admission API
// ─────────────────────────────────────────────

bool PriorityScheduler::schedule(Task task) {
    if (task.id.empty() || !task.callback) {
        logger_.warn("Rejected task without id or callback");
        std::lock_guard lock(mutex_);
        ++stats_.rejected;
        return false;
    }

    bool host_critical = monitor_.state() == MonitorState::Critical
                      || throttle_level() == ThrottleLevel::Critical;
    if (host_critical && task.priority != Priority::Critical) {
        logger_.info("Rejected task " + task.id + " (" + std::string{to_string(task.priority)}
                     + "): host is critical");
        std::lock_guard lock(mutex_);
        ++stats_.rejected;
        return false;
    }

    if (task.priority > Priority::High &&
        !monitor_.can_start_work(task.estimated_cpu_percent, task.estimated_mem_percent)) {
        logger_.info("Rejected task " + task.id + ": insufficient headroom");
        std::lock_guard lock(mutex_);
        ++stats_.rejected;
        return false;
    }

    {
        std::lock_guard lock(mutex_);
        if (known_locked(task.id)) {
            ++stats_.rejected;
            logger_.warn("Rejected task " + task.id + ": id already queued or running");
            return false;
        }
        task.state = TaskState::Pending;
        task.created_at = std::chrono::system_clock::now();
        task.started_at.reset();
        logger_.debug("Queued task " + task.id + " at priority "
                      + std::string{to_string(task.priority)});
        queues_[index_of(task.priority)].push_back(std::move(task));
        ++stats_.scheduled;
        wake_ = true;
    }
    cv_.notify_all();
    return true;
}

bool PriorityScheduler::cancel(const TaskId& id) {
    std::lock_guard lock(mutex_);

    for (auto& queue : queues_) {
        auto it = std::find_if(queue.begin(), queue.end(),
                               [&](const Task& t) { return t.id == id; });
        if (it == queue.end()) continue;

        TaskRecord rec{
            .id = it->id,
            .priority = it->priority,
            .state = TaskState::Throttled,
            .created_at = it->created_at,
            .started_at = std::nullopt,
            .finished_at = std::chrono::system_clock::now(),
            .error = std::string{"cancelled before start"},
        };
        history_.push(std::move(rec));
        queue.erase(it);
        ++stats_.cancelled;
        logger_.info("Cancelled pending task " + id);
        cv_.notify_all();
        return true;
    }

    if (auto it = active_.find(id); it != active_.end()) {
        auto& active = *it->second;
        if (!active.cancelled) {
            active.cancelled = true;
            active.task.state = TaskState::Throttled;
            active.stop.request_stop();
            ++stats_.cancelled;
            logger_.info("Cancellation requested for running task " + id);
        }
        return true;
    }
    return false;
}

// ─────────────────────────────────────────────
// Coordinator
// ─────────────────────────────────────────────

ThrottleLevel PriorityScheduler::compute_throttle() {
    auto sample = monitor_.sample();
    auto state = monitor_.state();

    if (state == MonitorState::Critical ||
        sample.cpu_percent >= safety::CPU_CEILING_PERCENT ||
        sample.mem_percent >= safety::MEM_CEILING_PERCENT) {
        return ThrottleLevel::Critical;
    }
    if (state == MonitorState::Alert) {
        return ThrottleLevel::Heavy;
    }
    if (sample.cpu_percent >= config_.light_cpu_percent ||
        sample.mem_percent >= config_.light_mem_percent) {
        return ThrottleLevel::Light;
    }
    return ThrottleLevel::None;
}

size_t PriorityScheduler::concurrency_limit(ThrottleLevel level) const noexcept {
    const size_t full = config_.max_concurrent;
    switch (level) {
        case ThrottleLevel::None:     return full;
        case ThrottleLevel::Light:    return full > 1 ? full - 1 : 1;
        case ThrottleLevel::Heavy:    return std::min<size_t>(full, 1);
        case ThrottleLevel::Critical: return 0;
    }
    return 0;
}

void PriorityScheduler::tick() {
    const auto level = compute_throttle();

    ThrottleLevel previous;
    std::vector<std::shared_ptr<ActiveTask>> launch;
    {
        std::lock_guard lock(mutex_);
        previous = throttle_;
        throttle_ = level;

        const size_t limit = concurrency_limit(level);
        while (active_.size() < limit) {
            auto next = pop_next_locked(level);
            if (!next) break;

            auto active = std::make_shared<ActiveTask>();
            active->task = std::move(*next);
            active->task.state = TaskState::Running;
            active->task.started_at = std::chrono::system_clock::now();
            active->started_steady = std::chrono::steady_clock::now();
            active_.emplace(active->task.id, active);
            launch.push_back(std::move(active));
        }

        check_timeouts_locked();
    }

    if (level != previous) {
        logger_.info("Throttle level " + std::string{to_string(previous)} + " -> "
                     + std::string{to_string(level)} + " (limit "
                     + std::to_string(concurrency_limit(level)) + ")");

        std::vector<ThrottleCallback> callbacks;
        {
            std::lock_guard lock(callbacks_mutex_);
            callbacks = throttle_callbacks_;
        }
        for (const auto& cb : callbacks) {
            try {
                cb(previous, level);
            } catch (const std::exception& e) {
                logger_.warn(std::string{"Throttle callback threw: "} + e.what());
            }
        }
    }

    for (auto& active : launch) {
        monitor_.register_work(active->task.id);
        logger_.debug("Starting task " + active->task.id);
        pool_.submit([this, active] { run_task(active); });
    }
}

std::optional<Task> PriorityScheduler::pop_next_locked(ThrottleLevel level) {
    for (auto priority : ALL_PRIORITIES) {
        if (!admits(level, priority)) continue;
        auto& queue = queues_[index_of(priority)];
        if (queue.empty()) continue;

        Task task = std::move(queue.front());
        queue.pop_front();
        return task;
    }
    return std::nullopt;
}

void PriorityScheduler::check_timeouts_locked() {
    const auto now = std::chrono::steady_clock::now();
    for (auto& [id, active] : active_) {
        if (active->timed_out || active->cancelled) continue;
        if (now - active->started_steady <= active->task.max_runtime) continue;

        // Detection only: the callback keeps running
        active->timed_out = true;
        active->task.state = TaskState::Throttled;
        ++stats_.throttled;
        logger_.warn("Task " + id + " exceeded max_runtime of "
                     + std::to_string(active->task.max_runtime.count()) + "ms");
    }
}

void PriorityScheduler::coordinator_loop(std::stop_token stop) {
    const auto period = std::chrono::milliseconds{config_.tick_ms};
    while (!stop.stop_requested()) {
        try {
            tick();
        } catch (const std::exception& e) {
            logger_.error(std::string{"Scheduler tick failed: "} + e.what());
        }

        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, stop, period, [this] { return wake_; });
        wake_ = false;
    }
}

// ─────────────────────────────────────────────
// Execution
// ─────────────────────────────────────────────

void PriorityScheduler::run_task(const std::shared_ptr<ActiveTask>& active) {
    SlotGuard guard(*this, active);
    try {
        active->task.callback(active->stop.get_token());
        guard.outcome = TaskState::Completed;
        guard.error.reset();
    } catch (const std::exception& e) {
        guard.outcome = TaskState::Failed;
        guard.error = e.what();
    } catch (...) {
        guard.outcome = TaskState::Failed;
        guard.error = "unknown exception";
    }
}

void PriorityScheduler::finish(const std::shared_ptr<ActiveTask>& active,
                               TaskState outcome,
                               std::optional<std::string> error) noexcept {
    const auto finished_at = std::chrono::system_clock::now();
    const double runtime = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - active->started_steady).count();
    const TaskId id = active->task.id;

    TaskState final_state = outcome;
    {
        std::lock_guard lock(mutex_);
        if (active->cancelled) final_state = TaskState::Throttled;

        active->task.state = final_state;
        active_.erase(id);

        if (outcome == TaskState::Completed) {
            ++stats_.completed;
        } else {
            ++stats_.failed;
        }
        stats_.total_runtime_seconds += runtime;

        history_.push(TaskRecord{
            .id = id,
            .priority = active->task.priority,
            .state = final_state,
            .created_at = active->task.created_at,
            .started_at = active->task.started_at,
            .finished_at = finished_at,
            .runtime_seconds = runtime,
            .timed_out = active->timed_out,
            .error = error,
        });
        wake_ = true;
    }
    cv_.notify_all();

    monitor_.unregister_work(id);
    if (outcome == TaskState::Failed) {
        logger_.warn("Task " + id + " failed: " + error.value_or("unknown error"));
    } else {
        logger_.debug("Task " + id + " finished as " + std::string{to_string(final_state)}
                      + " in " + std::to_string(runtime) + "s");
    }
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

void PriorityScheduler::start() {
    if (coordinator_.joinable()) return;
    coordinator_ = std::jthread([this](std::stop_token stop) {
        coordinator_loop(stop);
    });
    logger_.info("Priority scheduler started (max_concurrent "
                 + std::to_string(config_.max_concurrent) + ", tick "
                 + std::to_string(config_.tick_ms) + "ms)");
}

void PriorityScheduler::stop(std::chrono::milliseconds drain) {
    if (!coordinator_.joinable()) return;
    coordinator_.request_stop();
    coordinator_.join();

    std::unique_lock lock(mutex_);
    for (auto& [id, active] : active_) {
        active->stop.request_stop();
    }
    bool drained = cv_.wait_for(lock, drain, [this] { return active_.empty(); });
    if (!drained) {
        logger_.warn(std::to_string(active_.size())
                     + " task(s) still running after scheduler stop");
    }
    logger_.info("Priority scheduler stopped");
}

bool PriorityScheduler::running() const noexcept {
    return coordinator_.joinable();
}

bool PriorityScheduler::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] {
        if (!active_.empty()) return false;
        return std::all_of(queues_.begin(), queues_.end(),
                           [](const auto& q) { return q.empty(); });
    });
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

bool PriorityScheduler::known_locked(const TaskId& id) const {
    if (active_.contains(id)) return true;
    return std::any_of(queues_.begin(), queues_.end(), [&](const auto& queue) {
        return std::any_of(queue.begin(), queue.end(),
                           [&](const Task& t) { return t.id == id; });
    });
}

ThrottleLevel PriorityScheduler::throttle_level() const {
    std::lock_guard lock(mutex_);
    return throttle_;
}

size_t PriorityScheduler::running_count() const {
    std::lock_guard lock(mutex_);
    return active_.size();
}

size_t PriorityScheduler::pending_count() const {
    std::lock_guard lock(mutex_);
    size_t total = 0;
    for (const auto& queue : queues_) total += queue.size();
    return total;
}

std::optional<TaskState> PriorityScheduler::task_state(const TaskId& id) const {
    std::lock_guard lock(mutex_);
    if (auto it = active_.find(id); it != active_.end()) {
        return it->second->task.state;
    }
    for (const auto& queue : queues_) {
        for (const auto& t : queue) {
            if (t.id == id) return t.state;
        }
    }
    for (size_t i = history_.size(); i > 0; --i) {
        const auto& rec = history_.at(i - 1);
        if (rec.id == id) return rec.state;
    }
    return std::nullopt;
}

std::optional<TaskRecord> PriorityScheduler::record(const TaskId& id) const {
    std::lock_guard lock(mutex_);
    for (size_t i = history_.size(); i > 0; --i) {
        const auto& rec = history_.at(i - 1);
        if (rec.id == id) return rec;
    }
    return std::nullopt;
}

std::vector<TaskRecord> PriorityScheduler::history() const {
    std::lock_guard lock(mutex_);
    return history_.to_vector();
}

SchedulerStats PriorityScheduler::stats() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

SchedulerStatus PriorityScheduler::status() const {
    std::lock_guard lock(mutex_);
    SchedulerStatus out;
    out.running = coordinator_.joinable();
    out.throttle = throttle_;
    out.throttle_description = describe(throttle_);
    out.effective_limit = concurrency_limit(throttle_);
    for (const auto& [id, active] : active_) out.active.push_back(id);
    std::sort(out.active.begin(), out.active.end());
    for (size_t i = 0; i < PRIORITY_COUNT; ++i) out.pending[i] = queues_[i].size();
    out.stats = stats_;
    return out;
}

void PriorityScheduler::on_throttle_change(ThrottleCallback cb) {
    std::lock_guard lock(callbacks_mutex_);
    throttle_callbacks_.push_back(std::move(cb));
}

}  // namespace adaptive_scheduler
