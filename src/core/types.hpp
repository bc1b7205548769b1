/**
 * @file types.hpp
 * @brief Fundamental types used throughout AdaptiveScheduler.
 * @author Dimitris Kafetzis
 *
 * Defines ProviderId, TaskId, ResourceSample, MonitorState and other shared
 * vocabulary types. All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace adaptive_scheduler {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using ProviderId = std::string;
using TaskId = std::string;
using TaskKind = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

/// Seconds elapsed between two timestamps (negative if @p to precedes @p from).
[[nodiscard]] inline double seconds_between(Timestamp from, Timestamp to) noexcept {
    return std::chrono::duration<double>(to - from).count();
}

[[nodiscard]] inline int64_t to_unix_micros(Timestamp ts) noexcept {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        ts.time_since_epoch()).count();
}

[[nodiscard]] inline Timestamp from_unix_micros(int64_t us) noexcept {
    return Timestamp{std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::microseconds{us})};
}

// ─────────────────────────────────────────────
// Resource Sample
// ─────────────────────────────────────────────

/**
 * @brief A point-in-time reading of host CPU and memory load.
 *
 * Produced by a resource probe on every poll. Immutable once constructed;
 * the monitor hands out copies.
 */
struct ResourceSample {
    Timestamp timestamp;

    float cpu_percent{0.0f};            ///< Aggregate CPU [0.0, 100.0]
    float mem_percent{0.0f};            ///< Used memory [0.0, 100.0]

    uint64_t mem_used_bytes{0};
    uint64_t mem_available_bytes{0};
    uint64_t mem_total_bytes{0};
};

/**
 * @brief Remaining room below the safety ceilings, in percentage points.
 */
struct Headroom {
    float cpu_percent{0.0f};
    float mem_percent{0.0f};
};

// ─────────────────────────────────────────────
// Monitor State
// ─────────────────────────────────────────────

enum class MonitorState : uint8_t {
    Idle,       ///< Sustained low usage, slowest polling
    Active,     ///< Moderate usage
    Alert,      ///< Above 85% of a safety ceiling
    Critical    ///< Above a safety ceiling, fastest polling
};

[[nodiscard]] constexpr std::string_view to_string(MonitorState state) noexcept {
    switch (state) {
        case MonitorState::Idle:     return "idle";
        case MonitorState::Active:   return "active";
        case MonitorState::Alert:    return "alert";
        case MonitorState::Critical: return "critical";
    }
    return "unknown";
}

}  // namespace adaptive_scheduler
