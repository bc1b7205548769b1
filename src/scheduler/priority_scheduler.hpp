/**
 * @file priority_scheduler.hpp
 * @brief Resource-throttled priority scheduler.
 * @author Dimitris Kafetzis
 *
 * Tasks wait in one FIFO queue per priority. A coordinator thread ticks at
 * a fixed period; every tick it derives a throttle level from the resource
 * monitor, admits queued tasks up to the level's concurrency ceiling, and
 * flags running tasks that exceeded their max_runtime.
 *
 * Concurrency ceilings (max_concurrent = 3 by default):
 *   None → 3, Light → 2, Heavy → 1, Critical → 0
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/ring_buffer.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "resource_monitor/resource_monitor.hpp"
#include "scheduler/task.hpp"

#include <array>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace adaptive_scheduler {

struct SchedulerStats {
    uint64_t scheduled{0};
    uint64_t rejected{0};
    uint64_t completed{0};
    uint64_t failed{0};
    uint64_t throttled{0};       ///< Timed out while running
    uint64_t cancelled{0};
    double total_runtime_seconds{0.0};
};

struct SchedulerStatus {
    bool running{false};
    ThrottleLevel throttle{ThrottleLevel::None};
    std::string_view throttle_description;
    size_t effective_limit{0};
    std::vector<TaskId> active;
    std::array<size_t, PRIORITY_COUNT> pending{};
    SchedulerStats stats;
};

using ThrottleCallback = std::function<void(ThrottleLevel from, ThrottleLevel to)>;

class PriorityScheduler {
public:
    PriorityScheduler(ResourceMonitor& monitor, const SchedulerConfig& config, Logger& logger);
    ~PriorityScheduler();

    PriorityScheduler(const PriorityScheduler&) = delete;
    PriorityScheduler& operator=(const PriorityScheduler&) = delete;

    /**
     * @brief Queue a task for execution.
     *
     * Declined (returns false) when the host is critical and the task is not
     * Critical priority, when Normal/Low/Idle work does not fit the monitor's
     * headroom, or when the id is empty or already queued/running.
     */
    bool schedule(Task task);

    /**
     * @brief Remove a pending task, or flag a running one as Throttled.
     *
     * A running task receives a stop request on its token; the callback is
     * never interrupted forcibly.
     */
    bool cancel(const TaskId& id);

    /// One admission round. Called by the coordinator thread; public for tests.
    void tick();

    void start();
    /// Stop the coordinator, signal running tasks, and wait up to @p drain for them.
    void stop(std::chrono::milliseconds drain = std::chrono::milliseconds{5000});
    [[nodiscard]] bool running() const noexcept;

    /// Block until nothing is queued or running, or @p timeout elapses.
    bool wait_idle(std::chrono::milliseconds timeout);

    [[nodiscard]] ThrottleLevel throttle_level() const;
    [[nodiscard]] size_t concurrency_limit(ThrottleLevel level) const noexcept;
    [[nodiscard]] size_t running_count() const;
    [[nodiscard]] size_t pending_count() const;
    [[nodiscard]] std::optional<TaskState> task_state(const TaskId& id) const;
    [[nodiscard]] std::optional<TaskRecord> record(const TaskId& id) const;
    [[nodiscard]] std::vector<TaskRecord> history() const;
    [[nodiscard]] SchedulerStats stats() const;
    [[nodiscard]] SchedulerStatus status() const;

    void on_throttle_change(ThrottleCallback cb);

private:
    struct ActiveTask {
        Task task;
        std::stop_source stop;
        SteadyTime started_steady{};
        bool cancelled{false};
        bool timed_out{false};
    };

    /// Releases the concurrency slot and records the outcome on every exit path.
    class SlotGuard {
    public:
        SlotGuard(PriorityScheduler& owner, std::shared_ptr<ActiveTask> task)
            : owner_(owner), task_(std::move(task)) {}
        ~SlotGuard() { owner_.finish(task_, outcome, std::move(error)); }

        SlotGuard(const SlotGuard&) = delete;
        SlotGuard& operator=(const SlotGuard&) = delete;

        TaskState outcome{TaskState::Failed};
        std::optional<std::string> error{"task did not run to completion"};

    private:
        PriorityScheduler& owner_;
        std::shared_ptr<ActiveTask> task_;
    };

    ThrottleLevel compute_throttle();
    std::optional<Task> pop_next_locked(ThrottleLevel level);
    void check_timeouts_locked();
    void run_task(const std::shared_ptr<ActiveTask>& active);
    void finish(const std::shared_ptr<ActiveTask>& active, TaskState outcome,
                std::optional<std::string> error) noexcept;
    bool known_locked(const TaskId& id) const;
    void coordinator_loop(std::stop_token stop);

    ResourceMonitor& monitor_;
    Logger& logger_;
    SchedulerConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    bool wake_{false};

    std::array<std::deque<Task>, PRIORITY_COUNT> queues_;
    std::unordered_map<TaskId, std::shared_ptr<ActiveTask>> active_;
    RingBuffer<TaskRecord> history_;
    SchedulerStats stats_;
    ThrottleLevel throttle_{ThrottleLevel::None};

    std::mutex callbacks_mutex_;
    std::vector<ThrottleCallback> throttle_callbacks_;

    std::jthread coordinator_;
    ThreadPool pool_;   // last member: joins workers before anything above is destroyed
};

}  // namespace adaptive_scheduler
