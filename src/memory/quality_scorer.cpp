// File: src/memory/quality_scorer.cpp
#include "memory/quality_scorer.hpp"
#include "spatial/coordinate_hasher.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace dpcm {

bool QualityWeights::IsValid() const {
    if (strength < 0.0 || confidence < 0.0 || complexity < 0.0 || occurrences < 0.0) {
        return false;
    }
    return Sum() > 0.0;
}

bool QualityScorer::Config::IsValid() const {
    if (!default_weights.IsValid()) return false;
    for (const auto& [category, weights] : category_weights) {
        if (category.empty() || !weights.IsValid()) return false;
    }
    if (complexity_normalizer <= 0.0 || occurrence_log_span <= 0.0) return false;
    if (recency_floor < 0.0 || recency_floor > 1.0) return false;
    if (recency_grace_hours < 0.0 || recency_half_life_hours <= 0.0) return false;
    if (freshness_weight < 0.0 || freshness_decay_hours <= 0.0) return false;

    // Bands must be strictly descending within (0, 1]
    if (!(premium_threshold <= 1.0 && premium_threshold > standard_threshold &&
          standard_threshold > archive_threshold && archive_threshold > 0.0)) {
        return false;
    }
    return true;
}

QualityScorer::QualityScorer()
    : QualityScorer(Config{}) {}

QualityScorer::QualityScorer(const Config& config)
    : config_(config) {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid QualityScorer configuration");
    }
    // Keys are matched against normalized categories
    std::map<std::string, QualityWeights> normalized;
    for (const auto& [category, weights] : config_.category_weights) {
        normalized[CoordinateHasher::NormalizeCategory(category)] = weights;
    }
    config_.category_weights = std::move(normalized);
}

const QualityWeights& QualityScorer::WeightsFor(const std::string& category) const {
    auto it = config_.category_weights.find(CoordinateHasher::NormalizeCategory(category));
    if (it != config_.category_weights.end()) {
        return it->second;
    }
    return config_.default_weights;
}

QualityBreakdown QualityScorer::Components(const HarmonicProfile& profile) const {
    const QualityWeights& w = WeightsFor(profile.category);
    const double total = w.Sum();

    double strength = std::clamp(profile.strength, 0.0, 1.0);
    double confidence = std::clamp(profile.confidence, 0.0, 1.0);
    double complexity = std::min(1.0, std::max(0.0, profile.complexity) / config_.complexity_normalizer);
    double occurrences = std::min(
        1.0, std::log10(static_cast<double>(profile.occurrences) + 1.0) / config_.occurrence_log_span);

    QualityBreakdown b;
    b.strength = w.strength / total * strength;
    b.confidence = w.confidence / total * confidence;
    b.complexity = w.complexity / total * complexity;
    b.occurrences = w.occurrences / total * occurrences;
    b.base = std::clamp(b.strength + b.confidence + b.complexity + b.occurrences, 0.0, 1.0);
    return b;
}

double QualityScorer::BaseScore(const HarmonicProfile& profile) const {
    return Components(profile).base;
}

double QualityScorer::RecencyFactor(const Timestamp& last_access, const Timestamp& now) const {
    double idle = HoursBetween(last_access, now) - config_.recency_grace_hours;
    if (idle <= 0.0) {
        return 1.0;
    }
    double decay = std::pow(2.0, -idle / config_.recency_half_life_hours);
    return config_.recency_floor + (1.0 - config_.recency_floor) * decay;
}

double QualityScorer::Freshness(const Timestamp& created_at, const Timestamp& now) const {
    double age = HoursBetween(created_at, now);
    if (age <= 0.0) {
        return 1.0;
    }
    return std::exp(-age / config_.freshness_decay_hours);
}

QualityBreakdown QualityScorer::Score(const Pattern& pattern, const Timestamp& now) const {
    QualityBreakdown b = Components(pattern.profile);

    const Timestamp& last = pattern.access.last_accessed.IsZero()
        ? pattern.access.created_at
        : pattern.access.last_accessed;

    // A pattern with no timestamps at all has just arrived
    b.recency = last.IsZero() ? 1.0 : RecencyFactor(last, now);

    b.freshness = pattern.access.created_at.IsZero() ? 1.0 : Freshness(pattern.access.created_at, now);
    b.freshness_bonus = config_.freshness_weight * b.freshness;

    b.score = std::clamp(b.base * b.recency + b.freshness_bonus, 0.0, 1.0);
    return b;
}

StorageTier QualityScorer::TierFor(double score) const {
    if (std::isnan(score)) return StorageTier::REJECTED;
    if (score >= config_.premium_threshold) return StorageTier::PREMIUM;
    if (score >= config_.standard_threshold) return StorageTier::STANDARD;
    if (score >= config_.archive_threshold) return StorageTier::ARCHIVE;
    return StorageTier::REJECTED;
}

} // namespace dpcm
