/**
 * @file context_learner.hpp
 * @brief Confidence-scored behavioral model per (task kind, provider).
 * @author Dimitris Kafetzis
 *
 * Every execution updates its Pattern with exponential moving averages
 * (success rate and resource profile). Confidence blends execution count,
 * success rate and recency:
 *
 *   confidence = 0.4 * min(count / cap, 1) + 0.4 * success_rate
 *              + 0.2 * 0.5^(days_since_update / half_life)
 *
 * The whole model is saved through an IKnowledgeStore after each change.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "storage/knowledge.hpp"
#include "storage/knowledge_store.hpp"

#include <cstddef>
#include <limits>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace adaptive_scheduler {

/// One observed execution. cpu as a fraction, ram in MB, duration in seconds.
struct ExecutionMetrics {
    double cpu{0.0};
    double ram_mb{0.0};
    double duration_s{0.0};
};

struct ResourceConstraints {
    double cpu_max{1.0};
    double ram_max_mb{std::numeric_limits<double>::infinity()};
};

struct Recommendation {
    ProviderId provider_id;
    double confidence{0.0};
    std::string reason;
    ResourceProfile estimate;
    double success_rate{0.0};
    uint64_t execution_count{0};
};

struct ResourcePrediction {
    double cpu{0.0};
    double ram_mb{0.0};
    double duration_s{0.0};
    double confidence{0.0};
    uint64_t sample_count{0};
};

struct ScoredPattern {
    Pattern pattern;
    double confidence{0.0};
};

struct AdaptationEffectiveness {
    size_t total{0};
    double success_rate{0.0};
    std::vector<std::string> recent_reasons;   ///< Up to the last 10
};

struct Insights {
    std::vector<ScoredPattern> high_performers;
    std::vector<ScoredPattern> underperformers;
    std::optional<AdaptationEffectiveness> adaptations;
};

class ContextLearner {
public:
    static constexpr double COUNT_WEIGHT = 0.4;
    static constexpr double SUCCESS_WEIGHT = 0.4;
    static constexpr double RECENCY_WEIGHT = 0.2;
    static constexpr double NEUTRAL_SUCCESS_RATE = 0.5;

    static constexpr double HIGH_PERFORMER_CONFIDENCE = 0.7;
    static constexpr double HIGH_PERFORMER_SUCCESS = 0.9;
    static constexpr uint64_t UNDERPERFORMER_MIN_EXECUTIONS = 10;
    static constexpr double UNDERPERFORMER_SUCCESS = 0.7;

    /// Loads the persisted snapshot; a failed load starts empty.
    ContextLearner(IKnowledgeStore& store, const LearnerConfig& config, Logger& logger);

    ContextLearner(const ContextLearner&) = delete;
    ContextLearner& operator=(const ContextLearner&) = delete;

    void record_execution(const TaskKind& kind,
                          const ProviderId& provider,
                          const ExecutionMetrics& metrics,
                          bool success,
                          Timestamp now = std::chrono::system_clock::now());

    void record_adaptation(AdaptationRecord record);

    [[nodiscard]] double confidence(const Pattern& pattern,
                                    Timestamp now = std::chrono::system_clock::now()) const;

    /// Highest-confidence pattern for @p kind that fits @p constraints.
    std::optional<Recommendation> recommend(
        const TaskKind& kind,
        const std::optional<ResourceConstraints>& constraints = std::nullopt,
        Timestamp now = std::chrono::system_clock::now()) const;

    /// Profile of one provider, or the confidence-weighted mean across providers.
    std::optional<ResourcePrediction> predict_resource_needs(
        const TaskKind& kind,
        const std::optional<ProviderId>& provider = std::nullopt,
        Timestamp now = std::chrono::system_clock::now()) const;

    Insights analyze_patterns(size_t window = 100,
                              Timestamp now = std::chrono::system_clock::now()) const;

    /// Drop patterns not updated within @p max_age_days. Returns the number removed.
    size_t forget_stale(std::optional<uint32_t> max_age_days = std::nullopt,
                        Timestamp now = std::chrono::system_clock::now());

    /// Patterns for @p kind, highest confidence first.
    std::vector<ScoredPattern> patterns_for(const TaskKind& kind,
                                            Timestamp now = std::chrono::system_clock::now()) const;

    [[nodiscard]] std::vector<Pattern> all_patterns() const;
    [[nodiscard]] std::optional<Pattern> pattern(const TaskKind& kind, const ProviderId& provider) const;

    /// Most recent @p n adaptation outcomes, oldest first.
    [[nodiscard]] std::vector<AdaptationRecord> adaptation_history(size_t n = 100) const;

    [[nodiscard]] size_t pattern_count() const;

private:
    static std::string describe(const ScoredPattern& scored);

    std::vector<ScoredPattern> patterns_for_locked(const TaskKind& kind, Timestamp now) const;
    void persist_locked();

    IKnowledgeStore& store_;
    LearnerConfig config_;
    Logger& logger_;

    mutable std::mutex mutex_;
    KnowledgeSnapshot knowledge_;
};

}  // namespace adaptive_scheduler
