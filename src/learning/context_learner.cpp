/**
 * @file context_learner.cpp
 * @brief ContextLearner implementation.
 * @author Dimitris Kafetzis
 */

#include "learning/context_learner.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace adaptive_scheduler {

ContextLearner::ContextLearner(IKnowledgeStore& store, const LearnerConfig& config, Logger& logger)
    : store_(store), config_(config), logger_(logger) {
    auto loaded = store_.load();
    if (!loaded) {
        logger_.warn("Knowledge load failed, starting empty: " + loaded.error().message);
        return;
    }
    knowledge_ = std::move(loaded).value();

    auto& history = knowledge_.adaptations;
    if (history.size() > config_.adaptation_history) {
        history.erase(history.begin(),
                      history.end() - static_cast<std::ptrdiff_t>(config_.adaptation_history));
    }
    logger_.info("Loaded " + std::to_string(knowledge_.patterns.size()) + " learned patterns");
}

// ─────────────────────────────────────────────
// Learning
// ─────────────────────────────────────────────

void ContextLearner::record_execution(const TaskKind& kind,
                                      const ProviderId& provider,
                                      const ExecutionMetrics& metrics,
                                      bool success,
                                      Timestamp now) {
    std::lock_guard lock(mutex_);

    auto [it, inserted] = knowledge_.patterns.try_emplace(PatternKey{kind, provider});
    auto& p = it->second;
    if (inserted) {
        p.task_kind = kind;
        p.provider_id = provider;
        p.success_rate = NEUTRAL_SUCCESS_RATE;
    }

    const double a = config_.alpha;
    const double outcome = success ? 1.0 : 0.0;
    p.success_rate = a * outcome + (1.0 - a) * p.success_rate;

    auto& profile = p.resource_profile;
    if (profile.sample_count == 0) {
        profile.avg_cpu = metrics.cpu;
        profile.avg_ram = metrics.ram_mb;
        profile.avg_duration = metrics.duration_s;
    } else {
        profile.avg_cpu = a * metrics.cpu + (1.0 - a) * profile.avg_cpu;
        profile.avg_ram = a * metrics.ram_mb + (1.0 - a) * profile.avg_ram;
        profile.avg_duration = a * metrics.duration_s + (1.0 - a) * profile.avg_duration;
    }
    ++profile.sample_count;
    ++p.execution_count;
    p.last_updated = now;

    logger_.debug("Learned " + kind + "/" + provider + " success=" + (success ? "true" : "false")
                  + " count=" + std::to_string(p.execution_count));
    persist_locked();
}

void ContextLearner::record_adaptation(AdaptationRecord record) {
    std::lock_guard lock(mutex_);

    auto& history = knowledge_.adaptations;
    history.push_back(std::move(record));
    if (history.size() > config_.adaptation_history) {
        history.erase(history.begin(),
                      history.end() - static_cast<std::ptrdiff_t>(config_.adaptation_history));
    }
    persist_locked();
}

void ContextLearner::persist_locked() {
    if (auto r = store_.save(knowledge_); !r) {
        logger_.warn("Knowledge save failed, keeping in-memory state: " + r.error().message);
    }
}

// ─────────────────────────────────────────────
// Scoring
// ─────────────────────────────────────────────

double ContextLearner::confidence(const Pattern& pattern, Timestamp now) const {
    const double cap = static_cast<double>(std::max<uint32_t>(config_.confidence_cap, 1));
    const double count_factor =
        std::min(static_cast<double>(pattern.execution_count) / cap, 1.0);

    const double days = std::max(0.0, seconds_between(pattern.last_updated, now) / 86400.0);
    const double recency_factor = std::pow(0.5, days / config_.half_life_days);

    return COUNT_WEIGHT * count_factor
         + SUCCESS_WEIGHT * pattern.success_rate
         + RECENCY_WEIGHT * recency_factor;
}

std::string ContextLearner::describe(const ScoredPattern& scored) {
    const auto count = static_cast<unsigned long long>(scored.pattern.execution_count);
    const double rate = scored.pattern.success_rate * 100.0;

    char buf[160];
    if (scored.confidence > 0.9) {
        std::snprintf(buf, sizeof(buf),
                      "High confidence based on %llu successful executions (%.1f%% success rate)",
                      count, rate);
    } else if (scored.confidence > 0.7) {
        std::snprintf(buf, sizeof(buf),
                      "Good track record with %llu executions (%.1f%% success rate)", count, rate);
    } else if (scored.confidence > 0.5) {
        std::snprintf(buf, sizeof(buf),
                      "Moderate confidence from %llu executions (%.1f%% success rate)", count, rate);
    } else {
        std::snprintf(buf, sizeof(buf),
                      "Limited data (%llu executions, %.1f%% success rate)", count, rate);
    }
    return buf;
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

std::vector<ScoredPattern> ContextLearner::patterns_for(const TaskKind& kind, Timestamp now) const {
    std::lock_guard lock(mutex_);
    return patterns_for_locked(kind, now);
}

std::vector<ScoredPattern> ContextLearner::patterns_for_locked(const TaskKind& kind,
                                                               Timestamp now) const {
    std::vector<ScoredPattern> out;
    for (const auto& [key, p] : knowledge_.patterns) {
        if (key.first != kind) continue;
        out.push_back({p, confidence(p, now)});
    }
    std::stable_sort(out.begin(), out.end(), [](const ScoredPattern& a, const ScoredPattern& b) {
        return a.confidence > b.confidence;
    });
    return out;
}

std::optional<Recommendation> ContextLearner::recommend(
    const TaskKind& kind,
    const std::optional<ResourceConstraints>& constraints,
    Timestamp now) const {
    std::lock_guard lock(mutex_);

    auto candidates = patterns_for_locked(kind, now);
    if (candidates.empty()) {
        logger_.debug("No learned patterns for " + kind);
        return std::nullopt;
    }

    if (constraints) {
        std::erase_if(candidates, [&](const ScoredPattern& s) {
            const auto& profile = s.pattern.resource_profile;
            return profile.avg_cpu > constraints->cpu_max
                || profile.avg_ram > constraints->ram_max_mb;
        });
        if (candidates.empty()) {
            logger_.debug("No provider for " + kind + " fits the resource constraints");
            return std::nullopt;
        }
    }

    const auto& best = candidates.front();
    return Recommendation{
        .provider_id = best.pattern.provider_id,
        .confidence = best.confidence,
        .reason = describe(best),
        .estimate = best.pattern.resource_profile,
        .success_rate = best.pattern.success_rate,
        .execution_count = best.pattern.execution_count,
    };
}

std::optional<ResourcePrediction> ContextLearner::predict_resource_needs(
    const TaskKind& kind,
    const std::optional<ProviderId>& provider,
    Timestamp now) const {
    std::lock_guard lock(mutex_);

    if (provider) {
        auto it = knowledge_.patterns.find(PatternKey{kind, *provider});
        if (it == knowledge_.patterns.end()) return std::nullopt;
        const auto& profile = it->second.resource_profile;
        return ResourcePrediction{
            .cpu = profile.avg_cpu,
            .ram_mb = profile.avg_ram,
            .duration_s = profile.avg_duration,
            .confidence = confidence(it->second, now),
            .sample_count = profile.sample_count,
        };
    }

    auto scored = patterns_for_locked(kind, now);
    if (scored.empty()) return std::nullopt;

    double total_weight = 0.0;
    ResourcePrediction out;
    for (const auto& s : scored) {
        const auto& profile = s.pattern.resource_profile;
        total_weight += s.confidence;
        out.cpu += profile.avg_cpu * s.confidence;
        out.ram_mb += profile.avg_ram * s.confidence;
        out.duration_s += profile.avg_duration * s.confidence;
        out.sample_count += profile.sample_count;
    }
    if (total_weight <= 0.0) return std::nullopt;

    out.cpu /= total_weight;
    out.ram_mb /= total_weight;
    out.duration_s /= total_weight;
    out.confidence = total_weight / static_cast<double>(scored.size());
    return out;
}

Insights ContextLearner::analyze_patterns(size_t window, Timestamp now) const {
    std::lock_guard lock(mutex_);

    Insights out;
    for (const auto& [key, p] : knowledge_.patterns) {
        const double c = confidence(p, now);
        if (c > HIGH_PERFORMER_CONFIDENCE && p.success_rate > HIGH_PERFORMER_SUCCESS) {
            out.high_performers.push_back({p, c});
        }
        if (p.execution_count >= UNDERPERFORMER_MIN_EXECUTIONS
            && p.success_rate < UNDERPERFORMER_SUCCESS) {
            out.underperformers.push_back({p, c});
        }
    }

    const auto& history = knowledge_.adaptations;
    if (!history.empty() && window > 0) {
        const size_t n = std::min(window, history.size());
        auto first = history.end() - static_cast<std::ptrdiff_t>(n);

        AdaptationEffectiveness eff;
        eff.total = n;
        const auto succeeded = std::count_if(first, history.end(),
                                             [](const AdaptationRecord& r) { return r.success; });
        eff.success_rate = static_cast<double>(succeeded) / static_cast<double>(n);

        const size_t reasons = std::min<size_t>(n, 10);
        for (auto it = history.end() - static_cast<std::ptrdiff_t>(reasons); it != history.end(); ++it) {
            eff.recent_reasons.push_back(it->reason);
        }
        out.adaptations = std::move(eff);
    }
    return out;
}

size_t ContextLearner::forget_stale(std::optional<uint32_t> max_age_days, Timestamp now) {
    std::lock_guard lock(mutex_);

    const auto age = std::chrono::hours{24} * max_age_days.value_or(config_.stale_days);
    const auto cutoff = now - age;

    const auto removed = std::erase_if(knowledge_.patterns, [cutoff](const auto& entry) {
        return entry.second.last_updated < cutoff;
    });
    if (removed > 0) {
        logger_.info("Forgot " + std::to_string(removed) + " stale patterns");
        persist_locked();
    }
    return removed;
}

std::vector<Pattern> ContextLearner::all_patterns() const {
    std::lock_guard lock(mutex_);
    std::vector<Pattern> out;
    out.reserve(knowledge_.patterns.size());
    for (const auto& [key, p] : knowledge_.patterns) out.push_back(p);
    return out;
}

std::optional<Pattern> ContextLearner::pattern(const TaskKind& kind, const ProviderId& provider) const {
    std::lock_guard lock(mutex_);
    if (auto it = knowledge_.patterns.find(PatternKey{kind, provider}); it != knowledge_.patterns.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<AdaptationRecord> ContextLearner::adaptation_history(size_t n) const {
    std::lock_guard lock(mutex_);
    const auto& history = knowledge_.adaptations;
    const size_t take = std::min(n, history.size());
    return {history.end() - static_cast<std::ptrdiff_t>(take), history.end()};
}

size_t ContextLearner::pattern_count() const {
    std::lock_guard lock(mutex_);
    return knowledge_.patterns.size();
}

}  // namespace adaptive_scheduler
