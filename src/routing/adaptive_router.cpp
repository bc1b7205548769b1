/**
 * @file adaptive_router.cpp
 * @brief AdaptiveRouter implementation.
 * @author Dimitris Kafetzis
 *
 * Learner and tracker queries take their own locks and may touch storage,
 * so they are always made before mutex_ is acquired.
 */

#include "routing/adaptive_router.hpp"

#include <algorithm>
#include <limits>

namespace adaptive_scheduler {

namespace {

bool contains(const std::vector<ProviderId>& chain, const ProviderId& provider) {
    return std::find(chain.begin(), chain.end(), provider) != chain.end();
}

}  // namespace

std::string format_details(const std::map<std::string, std::string>& details) {
    std::string out;
    for (const auto& [key, value] : details) {
        if (!out.empty()) out += ", ";
        out += key;
        out += '=';
        out += value;
    }
    return out;
}

AdaptiveRouter::AdaptiveRouter(ContextLearner& learner,
                               PerformanceTracker& tracker,
                               const RouterConfig& config,
                               Logger& logger)
    : learner_(learner), tracker_(tracker), config_(config), logger_(logger) {}

// ─────────────────────────────────────────────
// Routing
// ─────────────────────────────────────────────

RoutingDecision AdaptiveRouter::route(const TaskKind& kind, const TaskId& task_id) {
    auto patterns = learner_.patterns_for(kind);
    auto recommendation = learner_.recommend(kind);

    if (recommendation && recommendation->confidence > LEARNED_CONFIDENCE) {
        std::lock_guard lock(mutex_);
        if (usable_locked(recommendation->provider_id)) {
            RoutingDecision decision{
                .provider_id = recommendation->provider_id,
                .fallback_chain = build_chain_locked(recommendation->provider_id, patterns),
                .reason = "learned_pattern",
                .confidence = recommendation->confidence,
                .estimated_resources = recommendation->estimate,
                .task_id = task_id,
            };
            logger_.debug("Routed " + task_id + " to " + decision.provider_id + " (learned_pattern)");
            return decision;
        }
    }

    auto rankings = tracker_.rankings(Metric::Latency);

    std::lock_guard lock(mutex_);
    for (const auto& rank : rankings) {
        if (!usable_locked(rank.provider_id) || !has_capacity_locked(rank.provider_id)) continue;

        RoutingDecision decision{
            .provider_id = rank.provider_id,
            .fallback_chain = build_chain_locked(rank.provider_id, patterns),
            .reason = "performance_ranking",
            .confidence = RANKING_CONFIDENCE,
            .estimated_resources = std::nullopt,
            .task_id = task_id,
        };
        logger_.debug("Routed " + task_id + " to " + decision.provider_id + " (performance_ranking)");
        return decision;
    }

    logger_.debug("Routed " + task_id + " to default provider " + config_.default_provider);
    return RoutingDecision{
        .provider_id = config_.default_provider,
        .fallback_chain = build_chain_locked(config_.default_provider, patterns),
        .reason = "default_fallback",
        .confidence = DEFAULT_CONFIDENCE,
        .estimated_resources = std::nullopt,
        .task_id = task_id,
    };
}

std::vector<ProviderId> AdaptiveRouter::build_chain_locked(
    const ProviderId& primary, const std::vector<ScoredPattern>& patterns) const {
    const size_t limit = config_.max_fallback_chain;
    const auto& fallback = config_.default_provider;

    std::vector<ProviderId> chain{primary};
    for (const auto& scored : patterns) {
        const auto& candidate = scored.pattern.provider_id;
        if (candidate == fallback || contains(chain, candidate)) continue;
        if (!usable_locked(candidate)) continue;

        // Keep the last slot for the default provider
        const size_t reserved = contains(chain, fallback) ? 0 : 1;
        if (chain.size() + reserved >= limit) break;
        chain.push_back(candidate);
    }
    if (!contains(chain, fallback)) chain.push_back(fallback);
    return chain;
}

// ─────────────────────────────────────────────
// Health
// ─────────────────────────────────────────────

void AdaptiveRouter::update_health(const ProviderId& provider,
                                   bool success,
                                   std::optional<double> response_time) {
    std::lock_guard lock(mutex_);
    update_health_locked(provider, success, response_time);
}

void AdaptiveRouter::update_health_locked(const ProviderId& provider,
                                          bool success,
                                          std::optional<double> response_time) {
    auto [it, inserted] = health_.try_emplace(provider);
    auto& health = it->second;
    if (inserted) health.provider_id = provider;

    const auto before = health.status;
    apply_outcome(health, success, response_time, config_.health_ema_alpha,
                  std::chrono::system_clock::now());

    if (health.status != before) {
        logger_.info("Provider " + provider + " health " + std::string{to_string(before)}
                     + " -> " + std::string{to_string(health.status)}
                     + " (failures: " + std::to_string(health.consecutive_failures) + ")");
    }
}

bool AdaptiveRouter::usable_locked(const ProviderId& provider) const {
    auto it = health_.find(provider);
    // Providers never reported on are presumed healthy
    return it == health_.end() || is_usable(it->second.status);
}

bool AdaptiveRouter::has_capacity_locked(const ProviderId& provider) const {
    auto it = load_.find(provider);
    return it == load_.end() || it->second < config_.max_provider_load;
}

ProviderHealth AdaptiveRouter::health(const ProviderId& provider) const {
    std::lock_guard lock(mutex_);
    if (auto it = health_.find(provider); it != health_.end()) return it->second;
    ProviderHealth fresh;
    fresh.provider_id = provider;
    fresh.last_check = std::chrono::system_clock::now();
    return fresh;
}

// ─────────────────────────────────────────────
// Switching
// ─────────────────────────────────────────────

SwitchDecision AdaptiveRouter::should_switch(const TaskId& task_id, const MetricRecord& current) {
    std::lock_guard lock(mutex_);

    auto task = active_.find(task_id);
    if (task == active_.end()) return {false, "task_not_active"};
    const auto& provider = task->second.provider;

    if (auto base = baseline_latency_.find(provider);
        base != baseline_latency_.end() && base->second > 0.0) {
        if (current.latency > base->second * config_.latency_spike_factor) {
            return {true, "latency_spike"};
        }
    }
    if (current.error_rate > config_.error_rate_threshold) {
        return {true, "error_threshold"};
    }
    if (!usable_locked(provider)) {
        return {true, "health_check_failure"};
    }
    return {false, "no_switch_needed"};
}

AdaptationResult AdaptiveRouter::adapt(const TaskId& task_id,
                                       const std::string& reason,
                                       const std::optional<ProviderId>& alternative) {
    ActiveTask snapshot;
    {
        std::lock_guard lock(mutex_);
        auto it = active_.find(task_id);
        if (it == active_.end()) {
            return AdaptationResult{.success = false,
                                    .reason = "task_not_found",
                                    .details = {{"task_id", task_id}}};
        }
        snapshot = it->second;
    }

    std::vector<ScoredPattern> patterns;
    std::vector<ProviderRanking> rankings;
    if (!alternative) {
        patterns = learner_.patterns_for(snapshot.kind);
        rankings = tracker_.rankings(Metric::Latency);
    }

    std::lock_guard lock(mutex_);
    auto it = active_.find(task_id);
    if (it == active_.end()) {
        return AdaptationResult{.success = false,
                                .reason = "task_not_found",
                                .details = {{"task_id", task_id}}};
    }
    const ProviderId current = it->second.provider;

    std::optional<ProviderId> replacement = alternative;
    if (!replacement) {
        for (const auto& scored : patterns) {
            const auto& candidate = scored.pattern.provider_id;
            if (candidate != current && usable_locked(candidate)) {
                replacement = candidate;
                break;
            }
        }
    }
    if (!replacement) {
        for (const auto& rank : rankings) {
            if (rank.provider_id != current && usable_locked(rank.provider_id)) {
                replacement = rank.provider_id;
                break;
            }
        }
    }
    if (!replacement && current != config_.default_provider) {
        replacement = config_.default_provider;
    }

    if (!replacement) {
        return AdaptationResult{.success = false,
                                .reason = "no_alternative_provider",
                                .details = {{"current_provider", current}}};
    }
    if (!usable_locked(*replacement)) {
        return AdaptationResult{.success = false,
                                .reason = "alternative_unhealthy",
                                .details = {{"alternative", *replacement}}};
    }

    it->second.provider = *replacement;
    it->second.started_at = std::chrono::system_clock::now();
    decrement_load_locked(current);
    increment_load_locked(*replacement);

    logger_.info("Task " + task_id + " switched from " + current + " to " + *replacement
                 + " (reason: " + reason + ")");

    return AdaptationResult{.success = true,
                            .reason = "switched_" + reason,
                            .details = {{"old_provider", current},
                                        {"new_provider", *replacement},
                                        {"switch_reason", reason}}};
}

ProviderId AdaptiveRouter::load_balance(
    const TaskKind& kind, const std::optional<std::vector<ProviderId>>& candidates) {
    std::vector<ProviderId> pool;
    if (candidates && !candidates->empty()) {
        pool = *candidates;
    } else {
        for (const auto& scored : learner_.patterns_for(kind)) {
            if (scored.confidence > BALANCE_CONFIDENCE) pool.push_back(scored.pattern.provider_id);
        }
        if (pool.empty()) {
            auto rankings = tracker_.rankings(Metric::Latency);
            for (size_t i = 0; i < rankings.size() && i < BALANCE_RANKING_CANDIDATES; ++i) {
                pool.push_back(rankings[i].provider_id);
            }
        }
        if (pool.empty()) return config_.default_provider;
    }

    std::lock_guard lock(mutex_);
    std::optional<ProviderId> selected;
    uint32_t min_load = std::numeric_limits<uint32_t>::max();
    for (const auto& provider : pool) {
        if (!usable_locked(provider)) continue;
        auto it = load_.find(provider);
        const uint32_t current = it == load_.end() ? 0 : it->second;
        if (current < min_load) {
            min_load = current;
            selected = provider;
        }
    }
    return selected.value_or(config_.default_provider);
}

// ─────────────────────────────────────────────
// Task bookkeeping
// ─────────────────────────────────────────────

void AdaptiveRouter::register_start(const TaskId& task_id,
                                    const ProviderId& provider,
                                    const TaskKind& kind) {
    std::lock_guard lock(mutex_);
    if (auto it = active_.find(task_id); it != active_.end()) {
        decrement_load_locked(it->second.provider);
    }
    active_[task_id] = ActiveTask{provider, kind, std::chrono::system_clock::now()};
    increment_load_locked(provider);
    logger_.debug("Task " + task_id + " started on " + provider);
}

void AdaptiveRouter::register_completion(const TaskId& task_id,
                                         bool success,
                                         std::optional<double> response_time) {
    std::lock_guard lock(mutex_);

    auto it = active_.find(task_id);
    if (it == active_.end()) return;
    const ProviderId provider = it->second.provider;

    update_health_locked(provider, success, response_time);

    if (response_time) {
        auto [base, inserted] = baseline_latency_.try_emplace(provider, *response_time);
        if (!inserted) {
            const double a = config_.health_ema_alpha;
            base->second = a * *response_time + (1.0 - a) * base->second;
        }
    }

    active_.erase(it);
    decrement_load_locked(provider);
    logger_.debug("Task " + task_id + " completed on " + provider
                  + (success ? " (success)" : " (failure)"));
}

void AdaptiveRouter::increment_load_locked(const ProviderId& provider) {
    ++load_[provider];
}

void AdaptiveRouter::decrement_load_locked(const ProviderId& provider) {
    if (auto it = load_.find(provider); it != load_.end() && it->second > 0) {
        --it->second;
    }
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

std::optional<ProviderId> AdaptiveRouter::active_provider(const TaskId& task_id) const {
    std::lock_guard lock(mutex_);
    if (auto it = active_.find(task_id); it != active_.end()) return it->second.provider;
    return std::nullopt;
}

std::optional<double> AdaptiveRouter::baseline_latency(const ProviderId& provider) const {
    std::lock_guard lock(mutex_);
    if (auto it = baseline_latency_.find(provider); it != baseline_latency_.end()) return it->second;
    return std::nullopt;
}

uint32_t AdaptiveRouter::load(const ProviderId& provider) const {
    std::lock_guard lock(mutex_);
    auto it = load_.find(provider);
    return it == load_.end() ? 0 : it->second;
}

RouterStats AdaptiveRouter::stats() const {
    std::lock_guard lock(mutex_);
    RouterStats out;
    out.active_tasks = active_.size();
    out.load = load_;
    out.health = health_;
    out.healthy_providers = static_cast<size_t>(
        std::count_if(health_.begin(), health_.end(), [](const auto& entry) {
            return entry.second.status == HealthStatus::Healthy;
        }));
    return out;
}

}  // namespace adaptive_scheduler
