/**
 * @file provider_health.cpp
 * @brief Health transitions.
 * @author Dimitris Kafetzis
 */

#include "routing/provider_health.hpp"

namespace adaptive_scheduler {

HealthStatus status_after_success(std::optional<double> response_time) noexcept {
    if (response_time && *response_time >= FAST_RESPONSE_S && *response_time < SLOW_RESPONSE_S) {
        return HealthStatus::Degraded;
    }
    return HealthStatus::Healthy;
}

HealthStatus status_after_failures(uint32_t consecutive_failures) noexcept {
    if (consecutive_failures >= OFFLINE_AFTER_FAILURES) return HealthStatus::Offline;
    if (consecutive_failures == 2) return HealthStatus::Unhealthy;
    return HealthStatus::Degraded;
}

void apply_outcome(ProviderHealth& health,
                   bool success,
                   std::optional<double> response_time,
                   double alpha,
                   Timestamp now) {
    if (success) {
        health.consecutive_failures = 0;
        health.last_success = now;
        if (response_time) {
            health.avg_response_time = health.avg_response_time == 0.0
                ? *response_time
                : alpha * *response_time + (1.0 - alpha) * health.avg_response_time;
        }
        health.status = status_after_success(response_time);
    } else {
        ++health.consecutive_failures;
        health.status = status_after_failures(health.consecutive_failures);
    }
    health.last_check = now;
}

}  // namespace adaptive_scheduler
