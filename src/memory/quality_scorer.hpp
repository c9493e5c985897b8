// File: src/memory/quality_scorer.hpp
//
// Quality scoring and tier bands
//
// score = base(profile) * recency(idle time) + freshness bonus, clamped to [0, 1]
//
//   base      = weighted mean of strength, confidence, normalized complexity
//               and log-scaled occurrences (weights may be overridden per
//               category)
//   recency   = floor + (1 - floor) * 2^(-max(0, idle - grace) / half_life)
//   freshness = freshness_weight * e^(-age since creation / freshness_decay)
//
// The tier is a pure step function of the score, so a higher score never
// maps to a worse tier.

#pragma once

#include "core/pattern.hpp"
#include "core/types.hpp"
#include <map>
#include <string>

namespace dpcm {

/// Relative weight of each profile component
struct QualityWeights {
    double strength{0.35};
    double confidence{0.25};
    double complexity{0.25};
    double occurrences{0.15};

    double Sum() const { return strength + confidence + complexity + occurrences; }

    bool IsValid() const;
};

/// Per-component detail of a score
struct QualityBreakdown {
    double strength{0.0};         ///< Weighted contribution
    double confidence{0.0};
    double complexity{0.0};
    double occurrences{0.0};
    double base{0.0};             ///< Sum of contributions, [0, 1]
    double recency{1.0};          ///< Multiplier in [recency_floor, 1]
    double freshness{1.0};        ///< Creation-age decay in (0, 1]
    double freshness_bonus{0.0};  ///< freshness * freshness_weight
    double score{0.0};            ///< Final score, [0, 1]
};

class QualityScorer {
public:
    struct Config {
        QualityWeights default_weights;

        /// Weight overrides keyed by normalized (upper-case) category
        std::map<std::string, QualityWeights> category_weights{
            {"AUTH", QualityWeights{0.40, 0.30, 0.20, 0.10}},
            {"CRYPTO", QualityWeights{0.50, 0.30, 0.10, 0.10}},
            {"ERROR_PATTERN", QualityWeights{0.30, 0.20, 0.20, 0.30}},
            {"STRUCTURAL", QualityWeights{0.30, 0.20, 0.30, 0.20}},
        };

        double complexity_normalizer{10.0};     ///< complexity / this, capped at 1
        double occurrence_log_span{2.0};        ///< log10(occ + 1) / this, capped at 1

        double recency_floor{0.6};
        double recency_grace_hours{24.0};
        double recency_half_life_hours{168.0};

        /// Bonus for newly created patterns; 0 disables it
        double freshness_weight{0.1};
        double freshness_decay_hours{24.0};

        // Tier bands (score >= threshold)
        double premium_threshold{0.85};
        double standard_threshold{0.70};
        double archive_threshold{0.50};

        bool IsValid() const;
    };

    QualityScorer();
    explicit QualityScorer(const Config& config);

    /// Score a pattern as of `now`
    QualityBreakdown Score(const Pattern& pattern, const Timestamp& now) const;

    /// Profile-only score, recency 1
    double BaseScore(const HarmonicProfile& profile) const;

    /// Recency multiplier for a pattern idle since `last_access`
    double RecencyFactor(const Timestamp& last_access, const Timestamp& now) const;

    /// Creation-age decay, 1 for a pattern created at or after `now`
    double Freshness(const Timestamp& created_at, const Timestamp& now) const;

    /// Tier band for a score
    StorageTier TierFor(double score) const;

    /// Weights applied to a category
    const QualityWeights& WeightsFor(const std::string& category) const;

    const Config& GetConfig() const { return config_; }

private:
    QualityBreakdown Components(const HarmonicProfile& profile) const;

    Config config_;
};

} // namespace dpcm
