// File: tests/memory/quality_scorer_test.cpp
#include "memory/quality_scorer.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <cmath>
#include <random>

namespace dpcm {
namespace {

using testing::MakePattern;
using testing::MakePremiumPattern;
using testing::MakeProfile;

class QualityScorerTest : public ::testing::Test {
protected:
    QualityScorer scorer_;
    Timestamp now_ = Timestamp::FromMicros(1700000000LL * 1000000LL);
};

// ============================================================================
// Base score
// ============================================================================

TEST_F(QualityScorerTest, WeightedMeanOfProfile) {
    double base = scorer_.BaseScore(MakeProfile("performance", 0.95, 0.95, 5.0, 50));
    EXPECT_NEAR(0.8230677632, base, 1e-9);
}

TEST_F(QualityScorerTest, PerfectProfileScoresOne) {
    EXPECT_NEAR(1.0, scorer_.BaseScore(MakeProfile("x", 1.0, 1.0, 100.0, 1000000)), 1e-12);
}

TEST_F(QualityScorerTest, CategoryWeightsOverrideDefaults) {
    HarmonicProfile auth = MakeProfile("auth", 0.8, 0.9, 3.0, 10);
    HarmonicProfile other = MakeProfile("logging", 0.8, 0.9, 3.0, 10);

    EXPECT_NEAR(0.7020696343, scorer_.BaseScore(auth), 1e-9);
    EXPECT_NEAR(0.6581044514, scorer_.BaseScore(other), 1e-9);

    // Lookup is by normalized category
    EXPECT_DOUBLE_EQ(0.40, scorer_.WeightsFor(" Auth").strength);
    EXPECT_DOUBLE_EQ(0.50, scorer_.WeightsFor("crypto").strength);
    EXPECT_DOUBLE_EQ(0.30, scorer_.WeightsFor("error_pattern").occurrences);
    EXPECT_DOUBLE_EQ(0.30, scorer_.WeightsFor("Structural").complexity);
    EXPECT_DOUBLE_EQ(0.25, scorer_.WeightsFor("logging").confidence);
}

TEST_F(QualityScorerTest, ScoreIsMonotonicInEachComponent) {
    HarmonicProfile low = MakeProfile("perf", 0.4, 0.4, 2.0, 3);
    HarmonicProfile stronger = low;
    stronger.strength = 0.6;
    HarmonicProfile more_confident = low;
    more_confident.confidence = 0.6;
    HarmonicProfile more_frequent = low;
    more_frequent.occurrences = 30;

    double base = scorer_.BaseScore(low);
    EXPECT_GT(scorer_.BaseScore(stronger), base);
    EXPECT_GT(scorer_.BaseScore(more_confident), base);
    EXPECT_GT(scorer_.BaseScore(more_frequent), base);
}

// ============================================================================
// Recency
// ============================================================================

TEST_F(QualityScorerTest, NoDecayWithinGracePeriod) {
    EXPECT_DOUBLE_EQ(1.0, scorer_.RecencyFactor(now_ - std::chrono::hours(23), now_));
    EXPECT_DOUBLE_EQ(1.0, scorer_.RecencyFactor(now_ + std::chrono::hours(5), now_));
}

TEST_F(QualityScorerTest, DecayHalvesTowardsFloorPerHalfLife) {
    double one_half_life = scorer_.RecencyFactor(now_ - std::chrono::hours(24 + 168), now_);
    EXPECT_NEAR(0.6 + 0.4 * 0.5, one_half_life, 1e-9);

    double forever = scorer_.RecencyFactor(now_ - std::chrono::hours(24 * 3650), now_);
    EXPECT_NEAR(0.6, forever, 1e-6);
}

TEST_F(QualityScorerTest, PremiumPatternDecaysToArchiveAfterThirtyDays) {
    Pattern p = MakePremiumPattern("hot path");
    p.access.created_at = now_;
    p.access.last_accessed = now_;

    QualityBreakdown fresh = scorer_.Score(p, now_);
    EXPECT_EQ(StorageTier::PREMIUM, scorer_.TierFor(fresh.score));

    QualityBreakdown stale = scorer_.Score(p, now_ + std::chrono::hours(24 * 30));
    EXPECT_NEAR(0.5747417658, stale.score, 1e-9);
    EXPECT_EQ(StorageTier::ARCHIVE, scorer_.TierFor(stale.score));
}

TEST_F(QualityScorerTest, FallsBackToCreationTime) {
    Pattern p = MakePremiumPattern("never read");
    p.access.created_at = now_ - std::chrono::hours(24 + 168);

    EXPECT_NEAR(0.8, scorer_.Score(p, now_).recency, 1e-9);
}

TEST_F(QualityScorerTest, NoTimestampsMeansFresh) {
    Pattern p = MakePremiumPattern("new");
    EXPECT_DOUBLE_EQ(1.0, scorer_.Score(p, now_).recency);
}

TEST_F(QualityScorerTest, FreshnessBonusDecaysWithCreationAge) {
    Pattern p = MakePattern("x", MakeProfile("perf", 0.8, 0.8, 4.0, 10));
    p.access.created_at = now_;
    p.access.last_accessed = now_;

    QualityBreakdown created = scorer_.Score(p, now_);
    EXPECT_DOUBLE_EQ(1.0, created.freshness);
    EXPECT_DOUBLE_EQ(0.1, created.freshness_bonus);
    EXPECT_NEAR(created.base + 0.1, created.score, 1e-12);

    // Access does not refresh it; only creation age counts
    p.access.last_accessed = now_ + std::chrono::hours(24);
    QualityBreakdown day_old = scorer_.Score(p, now_ + std::chrono::hours(24));
    EXPECT_NEAR(std::exp(-1.0), day_old.freshness, 1e-9);
    EXPECT_NEAR(0.1 * std::exp(-1.0), day_old.freshness_bonus, 1e-9);
    EXPECT_DOUBLE_EQ(1.0, day_old.recency);
}

TEST_F(QualityScorerTest, FreshnessBonusCanBeDisabled) {
    QualityScorer::Config config;
    config.freshness_weight = 0.0;
    QualityScorer scorer(config);

    Pattern p = MakePattern("x", MakeProfile("perf", 0.8, 0.8, 4.0, 10));
    QualityBreakdown b = scorer.Score(p, now_);
    EXPECT_DOUBLE_EQ(0.0, b.freshness_bonus);
    EXPECT_DOUBLE_EQ(b.base, b.score);
}

TEST_F(QualityScorerTest, FreshBonusNeverLiftsScoreAboveOne) {
    Pattern p = MakePattern("x", MakeProfile("x", 1.0, 1.0, 100.0, 1000000));
    EXPECT_DOUBLE_EQ(1.0, scorer_.Score(p, now_).score);
}

// ============================================================================
// Tier bands
// ============================================================================

TEST_F(QualityScorerTest, TierBands) {
    EXPECT_EQ(StorageTier::PREMIUM, scorer_.TierFor(1.0));
    EXPECT_EQ(StorageTier::PREMIUM, scorer_.TierFor(0.85));
    EXPECT_EQ(StorageTier::STANDARD, scorer_.TierFor(0.8499));
    EXPECT_EQ(StorageTier::STANDARD, scorer_.TierFor(0.70));
    EXPECT_EQ(StorageTier::ARCHIVE, scorer_.TierFor(0.69));
    EXPECT_EQ(StorageTier::ARCHIVE, scorer_.TierFor(0.50));
    EXPECT_EQ(StorageTier::REJECTED, scorer_.TierFor(0.4999));
    EXPECT_EQ(StorageTier::REJECTED, scorer_.TierFor(0.0));
}

TEST_F(QualityScorerTest, HigherScoreNeverMapsToWorseTier) {
    std::mt19937 rng(42);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    for (int i = 0; i < 1000; ++i) {
        double a = unit(rng);
        double b = unit(rng);
        if (a < b) std::swap(a, b);
        EXPECT_GE(TierRank(scorer_.TierFor(a)), TierRank(scorer_.TierFor(b)));
    }
}

TEST_F(QualityScorerTest, InvalidConfigThrows) {
    QualityScorer::Config config;
    config.standard_threshold = 0.9;
    EXPECT_THROW(QualityScorer scorer(config), std::invalid_argument);

    config = QualityScorer::Config{};
    config.default_weights = QualityWeights{0.0, 0.0, 0.0, 0.0};
    EXPECT_THROW(QualityScorer scorer(config), std::invalid_argument);

    config = QualityScorer::Config{};
    config.recency_half_life_hours = 0.0;
    EXPECT_THROW(QualityScorer scorer(config), std::invalid_argument);

    config = QualityScorer::Config{};
    config.freshness_decay_hours = 0.0;
    EXPECT_THROW(QualityScorer scorer(config), std::invalid_argument);
}

} // namespace
} // namespace dpcm
