/**
 * @file safety.hpp
 * @brief Hard safety ceilings and adaptation budgets.
 * @author Dimitris Kafetzis
 *
 * Compile-time constants; no configuration key can raise them.
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace adaptive_scheduler::safety {

constexpr float CPU_CEILING_PERCENT = 80.0f;
constexpr float MEM_CEILING_PERCENT = 70.0f;

/// Fraction of a ceiling above which the monitor reports Alert.
constexpr float ALERT_FRACTION = 0.85f;

/// Usage above either bound counts as moderate (Active) load.
constexpr float ACTIVE_CPU_PERCENT = 30.0f;
constexpr float ACTIVE_MEM_PERCENT = 40.0f;

constexpr float ADAPTATION_CPU_BUDGET_PERCENT = 5.0f;
constexpr uint64_t ADAPTATION_MEM_BUDGET_BYTES = 50ULL * 1024 * 1024;
constexpr std::chrono::seconds MIN_ADAPTATION_INTERVAL{5};
constexpr uint32_t MAX_CONCURRENT_ADAPTATIONS = 2;

/// Margin below the ceilings that execution monitoring keeps free.
constexpr float MONITOR_BUFFER_PERCENT = 5.0f;

}  // namespace adaptive_scheduler::safety
