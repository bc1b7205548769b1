/**
 * @file task.hpp
 * @brief Task, priority, task-state and throttle vocabulary for the scheduler.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace adaptive_scheduler {

// ─────────────────────────────────────────────
// Priority
// ─────────────────────────────────────────────

/// Lower value drains first.
enum class Priority : uint8_t {
    Critical = 0,
    High = 1,
    Normal = 2,
    Low = 3,
    Idle = 4
};

constexpr size_t PRIORITY_COUNT = 5;

constexpr std::array<Priority, PRIORITY_COUNT> ALL_PRIORITIES = {
    Priority::Critical, Priority::High, Priority::Normal, Priority::Low, Priority::Idle
};

[[nodiscard]] constexpr std::string_view to_string(Priority priority) noexcept {
    switch (priority) {
        case Priority::Critical: return "critical";
        case Priority::High:     return "high";
        case Priority::Normal:   return "normal";
        case Priority::Low:      return "low";
        case Priority::Idle:     return "idle";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Task State
// ─────────────────────────────────────────────

enum class TaskState : uint8_t {
    Pending,       ///< Queued, awaiting admission
    Running,       ///< Executing on a pool worker
    Paused,        ///< Reserved for callers that suspend work themselves
    Completed,     ///< Callback returned normally
    Failed,        ///< Callback threw
    Throttled      ///< Cancelled, or exceeded max_runtime
};

[[nodiscard]] constexpr std::string_view to_string(TaskState state) noexcept {
    switch (state) {
        case TaskState::Pending:   return "pending";
        case TaskState::Running:   return "running";
        case TaskState::Paused:    return "paused";
        case TaskState::Completed: return "completed";
        case TaskState::Failed:    return "failed";
        case TaskState::Throttled: return "throttled";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(TaskState state) noexcept {
    switch (state) {
        case TaskState::Completed:
        case TaskState::Failed:
        case TaskState::Throttled:
            return true;
        case TaskState::Pending:
        case TaskState::Running:
        case TaskState::Paused:
            return false;
    }
    return false;
}

// ─────────────────────────────────────────────
// Throttle Level
// ─────────────────────────────────────────────

enum class ThrottleLevel : uint8_t {
    None,
    Light,
    Heavy,
    Critical
};

[[nodiscard]] constexpr std::string_view to_string(ThrottleLevel level) noexcept {
    switch (level) {
        case ThrottleLevel::None:     return "none";
        case ThrottleLevel::Light:    return "light";
        case ThrottleLevel::Heavy:    return "heavy";
        case ThrottleLevel::Critical: return "critical";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view describe(ThrottleLevel level) noexcept {
    switch (level) {
        case ThrottleLevel::None:     return "normal operation";
        case ThrottleLevel::Light:    return "light throttle, concurrency reduced by one";
        case ThrottleLevel::Heavy:    return "heavy throttle, critical and high priority only";
        case ThrottleLevel::Critical: return "critical, admission suspended";
    }
    return "unknown";
}

/// Whether a priority tier may be admitted at the given throttle level.
[[nodiscard]] constexpr bool admits(ThrottleLevel level, Priority priority) noexcept {
    switch (level) {
        case ThrottleLevel::None:     return true;
        case ThrottleLevel::Light:    return priority <= Priority::Normal;
        case ThrottleLevel::Heavy:    return priority <= Priority::High;
        case ThrottleLevel::Critical: return false;
    }
    return false;
}

// ─────────────────────────────────────────────
// Task
// ─────────────────────────────────────────────

/// Task body. The token is signalled by cancel() and by scheduler shutdown.
using TaskCallback = std::function<void(std::stop_token)>;

/**
 * @brief A unit of work owned by the scheduler until it reaches a terminal state.
 */
struct Task {
    TaskId id;
    Priority priority{Priority::Normal};
    TaskCallback callback;

    float estimated_cpu_percent{10.0f};
    float estimated_mem_percent{5.0f};
    std::chrono::milliseconds max_runtime{30000};   ///< Soft limit, detected not enforced

    Timestamp created_at{};
    std::optional<Timestamp> started_at;
    TaskState state{TaskState::Pending};
};

/**
 * @brief Immutable record of a task that left the scheduler.
 */
struct TaskRecord {
    TaskId id;
    Priority priority{Priority::Normal};
    TaskState state{TaskState::Pending};
    Timestamp created_at{};
    std::optional<Timestamp> started_at;
    Timestamp finished_at{};
    double runtime_seconds{0.0};
    bool timed_out{false};
    std::optional<std::string> error;
};

}  // namespace adaptive_scheduler
