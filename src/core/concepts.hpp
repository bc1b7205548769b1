/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for AdaptiveScheduler interfaces.
 * @author Dimitris Kafetzis
 *
 * Compile-time interface constraints, checked with static_assert next to
 * the types that satisfy them.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <concepts>
#include <string_view>

namespace adaptive_scheduler {

// ─────────────────────────────────────────────
// ResourceProbeLike
// ─────────────────────────────────────────────

/**
 * @concept ResourceProbeLike
 * @brief Constrains types that can take one reading of host resources.
 *
 * The resource monitor calls the probe on every sampling tick.
 */
template <typename T>
concept ResourceProbeLike = requires(T probe) {
    { probe.read() } -> std::same_as<Result<ResourceSample>>;
    { probe.name() } -> std::convertible_to<std::string_view>;
};

}  // namespace adaptive_scheduler
