// File: tests/integration/integration_test.cpp
//
// End-to-end workflows through the MemoryEngine facade.

#include "engine/memory_engine.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <random>
#include <set>
#include <vector>

using namespace dpcm;
using dpcm::testing::MakePattern;
using dpcm::testing::MakeProfile;
using dpcm::testing::ManualClock;
using dpcm::testing::MemoryStores;

// ============================================================================
// Test Utilities
// ============================================================================

namespace {

const std::vector<std::string> kCategories = {
    "auth", "crypto", "performance", "reliability", "injection", "concurrency", "logging", "config",
};

/// Random patterns spread over every category
std::vector<Pattern> GenerateRandomPatterns(size_t count, unsigned int seed = 42) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<size_t> category(0, kCategories.size() - 1);
    std::uniform_real_distribution<double> unit(0.3, 1.0);
    std::uniform_real_distribution<double> complexity(1.0, 10.0);
    std::uniform_int_distribution<uint32_t> occurrences(1, 100);

    std::vector<Pattern> patterns;
    patterns.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        patterns.push_back(MakePattern(
            "pattern " + std::to_string(i),
            MakeProfile(kCategories[category(gen)], unit(gen), unit(gen), complexity(gen), occurrences(gen))));
    }
    return patterns;
}

EngineConfig CreateTestEngineConfig() {
    EngineConfig config;
    config.field.random_seed = 42;
    config.migration.batch_yield = std::chrono::milliseconds(0);
    config.warmer.batch_yield = std::chrono::milliseconds(0);
    config.logging.console = false;
    return config;
}

std::set<PatternID> ToSet(const std::vector<PatternID>& ids) {
    return std::set<PatternID>(ids.begin(), ids.end());
}

} // namespace

// ============================================================================
// Related patterns are found together
// ============================================================================

TEST(IntegrationTest, DiscoveryQueryFindsAuthCluster) {
    ManualClock clock;
    EngineConfig config = CreateTestEngineConfig();
    MemoryEngine engine(config, MemoryStores(), clock.AsClock());

    struct AuthFinding {
        const char* title;
        double strength;
        uint32_t occurrences;
    };
    const std::vector<AuthFinding> findings = {
        {"Session token not rotated on login", 0.90, 10},
        {"Password compared without constant time", 0.85, 15},
        {"JWT signature not verified", 0.95, 5},
    };

    std::set<PatternID> auth_ids;
    std::vector<Coordinate> auth_points;
    for (const auto& f : findings) {
        StoreResult r = engine.Store(MakePattern(f.title, MakeProfile("auth", f.strength, 0.85, 5.0, f.occurrences)));
        ASSERT_TRUE(r.success) << r.error;
        auth_ids.insert(r.id);
        auth_points.push_back(engine.Get(r.id)->coordinate);
    }

    // Same category lands in one neighbourhood
    for (size_t i = 0; i < auth_points.size(); ++i) {
        for (size_t j = i + 1; j < auth_points.size(); ++j) {
            EXPECT_LE(CoordinateHasher::Distance(auth_points[i], auth_points[j]), 0.3);
        }
    }

    for (const auto& p : GenerateRandomPatterns(200, 7)) {
        if (p.profile.category != "auth") {
            engine.Store(p);
        }
    }

    QueryIntent intent;
    intent.type = QueryType::DISCOVERY;
    intent.harmonic_signature = MakeProfile("auth", 0.85, 0.85, 5.0, 15);
    intent.exploration = 0.5;
    intent.limit = 50;

    QueryResult result = engine.Query(intent);

    ASSERT_FALSE(result.matches.empty());
    EXPECT_FALSE(result.IsDegraded());

    std::set<PatternID> found;
    for (const auto& m : result.matches) {
        found.insert(m.pattern.id);
        EXPECT_LE(m.distance, result.field.radius);
    }
    for (PatternID id : auth_ids) {
        EXPECT_TRUE(found.count(id)) << "auth pattern " << id.ToString() << " missing";
    }

    // Every auth pattern outranks every pattern of another category
    size_t last_auth = 0;
    size_t first_other = result.matches.size();
    for (size_t i = 0; i < result.matches.size(); ++i) {
        if (auth_ids.count(result.matches[i].pattern.id)) {
            last_auth = i;
        } else {
            first_other = std::min(first_other, i);
        }
    }
    EXPECT_LT(last_auth, first_other);

    for (size_t i = 1; i < result.matches.size(); ++i) {
        EXPECT_GE(result.matches[i - 1].score, result.matches[i].score);
    }
}

// ============================================================================
// Index stays shallow and exact at scale
// ============================================================================

TEST(IntegrationTest, TenThousandPatternsIndexMatchesLinearScan) {
    ManualClock clock;
    EngineConfig config = CreateTestEngineConfig();
    config.engine.dedup_on_store = false;
    MemoryEngine engine(config, MemoryStores(), clock.AsClock());

    std::vector<Pattern> patterns = GenerateRandomPatterns(10000);
    for (size_t start = 0; start < patterns.size(); start += 1000) {
        std::vector<Pattern> batch(patterns.begin() + start, patterns.begin() + start + 1000);
        BatchStoreResult stored = engine.StoreBatch(std::move(batch));
        ASSERT_EQ(1000u, stored.stored);
    }

    const SpatialIndex& index = engine.GetIndex();
    ASSERT_EQ(10000u, index.Size());
    EXPECT_TRUE(index.Validate());

    auto stats = index.GetStats();
    EXPECT_GE(stats.height, 2u);
    EXPECT_LE(static_cast<double>(stats.height), std::log2(10000.0) + 2.0);

    // Same data answered by scanning every entry
    SpatialIndex::Config scan_config;
    scan_config.linear_scan = true;
    SpatialIndex oracle(scan_config);
    oracle.BulkLoad(index.Entries());

    std::mt19937 gen(99);
    std::uniform_real_distribution<double> axis(-1.0, 1.0);
    std::uniform_real_distribution<double> radius(0.0, 0.3);

    Coordinate fixed(0.1, 0.1, 0.1);
    auto tree_hits = index.RangeQuery(fixed, 0.1);
    EXPECT_EQ(ToSet(oracle.RangeQuery(fixed, 0.1)), ToSet(tree_hits));
    EXPECT_LT(index.GetStats().last_query_nodes_visited, index.GetStats().node_count);

    for (int q = 0; q < 50; ++q) {
        Coordinate center(axis(gen), axis(gen), axis(gen));
        double r = radius(gen);
        EXPECT_EQ(ToSet(oracle.RangeQuery(center, r)), ToSet(index.RangeQuery(center, r)))
            << "query " << q << " at " << center.ToString() << " radius " << r;
    }
}

// ============================================================================
// Unused premium patterns sink
// ============================================================================

TEST(IntegrationTest, PremiumPatternDemotedAfterThirtyDaysIdle) {
    ManualClock clock;
    EngineConfig config = CreateTestEngineConfig();
    MemoryEngine engine(config, MemoryStores(), clock.AsClock());

    StoreResult stored = engine.Store(
        MakePattern("Unparameterized SQL in report export", MakeProfile("injection", 0.95, 0.95, 5.0, 50)));
    ASSERT_TRUE(stored.success);
    ASSERT_TRUE(stored.tier.has_value());
    EXPECT_EQ(StorageTier::PREMIUM, *stored.tier);

    // A day in, nothing moves
    clock.Advance(std::chrono::hours(24));
    MigrationReport early = engine.Migrate();
    EXPECT_EQ(0u, early.demoted);
    EXPECT_EQ(1u, engine.Stats().tier_counts[static_cast<size_t>(StorageTier::PREMIUM)]);

    clock.Advance(std::chrono::hours(24 * 29));
    MigrationReport late = engine.Migrate();
    EXPECT_EQ(1u, late.demoted);

    auto stats = engine.Stats();
    EXPECT_EQ(0u, stats.tier_counts[static_cast<size_t>(StorageTier::PREMIUM)]);
    size_t lower = stats.tier_counts[static_cast<size_t>(StorageTier::STANDARD)] +
                   stats.tier_counts[static_cast<size_t>(StorageTier::ARCHIVE)];
    EXPECT_EQ(1u, lower);

    // Still reachable by id and through the index
    auto pattern = engine.Get(stored.id);
    ASSERT_TRUE(pattern.has_value());
    EXPECT_EQ("Unparameterized SQL in report export", pattern->content.title);
    EXPECT_TRUE(engine.GetIndex().Contains(stored.id));
}
