/**
 * @file provider_health.hpp
 * @brief Provider health state machine.
 * @author Dimitris Kafetzis
 *
 * Transitions are driven only by reported outcomes:
 *
 *   success, response < 1 s        → Healthy
 *   success, 1 s <= response < 5 s → Degraded
 *   success, otherwise             → Healthy
 *   failure #1 → Degraded, #2 → Unhealthy, #3 and later → Offline
 *
 * Healthy and Degraded providers are usable; Unhealthy and Offline are not.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace adaptive_scheduler {

enum class HealthStatus : uint8_t {
    Healthy,
    Degraded,
    Unhealthy,
    Offline
};

[[nodiscard]] constexpr std::string_view to_string(HealthStatus status) noexcept {
    switch (status) {
        case HealthStatus::Healthy:   return "healthy";
        case HealthStatus::Degraded:  return "degraded";
        case HealthStatus::Unhealthy: return "unhealthy";
        case HealthStatus::Offline:   return "offline";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_usable(HealthStatus status) noexcept {
    switch (status) {
        case HealthStatus::Healthy:
        case HealthStatus::Degraded:
            return true;
        case HealthStatus::Unhealthy:
        case HealthStatus::Offline:
            return false;
    }
    return false;
}

constexpr double FAST_RESPONSE_S = 1.0;
constexpr double SLOW_RESPONSE_S = 5.0;
constexpr uint32_t OFFLINE_AFTER_FAILURES = 3;

struct ProviderHealth {
    ProviderId provider_id;
    HealthStatus status{HealthStatus::Healthy};
    uint32_t consecutive_failures{0};
    std::optional<Timestamp> last_success;
    double avg_response_time{0.0};       ///< EMA, seconds
    Timestamp last_check{};
};

/// Status implied by a successful call with the given response time.
[[nodiscard]] HealthStatus status_after_success(std::optional<double> response_time) noexcept;

/// Status implied by @p consecutive_failures (at least 1).
[[nodiscard]] HealthStatus status_after_failures(uint32_t consecutive_failures) noexcept;

/**
 * @brief Fold one outcome into @p health.
 *
 * The first response time seeds avg_response_time; later ones are blended
 * with weight @p alpha.
 */
void apply_outcome(ProviderHealth& health,
                   bool success,
                   std::optional<double> response_time,
                   double alpha,
                   Timestamp now);

}  // namespace adaptive_scheduler
