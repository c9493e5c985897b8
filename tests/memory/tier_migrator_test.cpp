// File: tests/memory/tier_migrator_test.cpp
#include "memory/tier_migrator.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>

namespace dpcm {
namespace {

using testing::FailureSwitch;
using testing::MakeArchivePattern;
using testing::MakePremiumPattern;
using testing::MakeStandardPattern;
using testing::ManualClock;
using testing::MemoryStores;
using testing::StoresWithFailingTier;

class TierMigratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        router_ = std::make_unique<QualityTierRouter>(MemoryStores(), QualityScorer::Config{},
                                                      QualityTierRouter::Config{});
    }

    /// Premium pattern whose last access is the current manual time
    Pattern AccessedNow(uint64_t id) {
        Pattern p = MakePremiumPattern("hot " + std::to_string(id), PatternID(id));
        p.access.created_at = clock_.Now();
        p.access.last_accessed = clock_.Now();
        return p;
    }

    ManualClock clock_;
    std::unique_ptr<QualityTierRouter> router_;
};

TEST_F(TierMigratorTest, EmptyRouterRunsCleanCycle) {
    TierMigrator migrator(*router_, TierMigrator::Config{}, clock_.AsClock());
    MigrationReport report = migrator.RunCycle();
    EXPECT_EQ(0u, report.evaluated);
    EXPECT_EQ(1u, report.cycles);
}

TEST_F(TierMigratorTest, UnusedPremiumPatternDemotesAfterThirtyDays) {
    router_->StorePattern(AccessedNow(1), clock_.Now());
    ASSERT_EQ(StorageTier::PREMIUM, router_->GetPlacement(PatternID(1))->tier);

    clock_.Advance(std::chrono::hours(24 * 30));
    TierMigrator::Config config;
    config.batch_yield = std::chrono::milliseconds(0);
    TierMigrator migrator(*router_, config, clock_.AsClock());
    MigrationReport report = migrator.RunCycle();

    EXPECT_EQ(1u, report.evaluated);
    EXPECT_EQ(1u, report.demoted);
    EXPECT_EQ(0u, report.promoted);

    auto placement = router_->GetPlacement(PatternID(1));
    EXPECT_EQ(StorageTier::ARCHIVE, placement->tier);
    EXPECT_NEAR(0.5747417658, placement->score, 1e-9);

    auto history = migrator.GetHistory();
    ASSERT_EQ(1u, history.size());
    EXPECT_EQ(StorageTier::PREMIUM, history[0].from);
    EXPECT_EQ(StorageTier::ARCHIVE, history[0].to);
    EXPECT_FALSE(history[0].IsPromotion());
}

TEST_F(TierMigratorTest, StrongerProfilePromotes) {
    router_->StorePattern(MakeArchivePattern("weak", PatternID(2)), clock_.Now());
    clock_.Advance(std::chrono::hours(25));

    router_->UpdatePattern(MakePremiumPattern("weak", PatternID(2)));

    TierMigrator::Config config;
    config.batch_yield = std::chrono::milliseconds(0);
    TierMigrator migrator(*router_, config, clock_.AsClock());
    MigrationReport report = migrator.RunCycle();

    EXPECT_EQ(1u, report.promoted);
    EXPECT_EQ(StorageTier::PREMIUM, router_->GetPlacement(PatternID(2))->tier);
    EXPECT_TRUE(migrator.GetHistory().back().IsPromotion());
}

TEST_F(TierMigratorTest, MinimumResidencyHoldsFreshPlacement) {
    router_->StorePattern(MakePremiumPattern("p", PatternID(3)), clock_.Now());
    router_->UpdatePattern(MakeArchivePattern("p", PatternID(3)));

    TierMigrator::Config config;
    config.batch_yield = std::chrono::milliseconds(0);
    TierMigrator migrator(*router_, config, clock_.AsClock());

    MigrationReport held = migrator.RunCycle();
    EXPECT_EQ(1u, held.held);
    EXPECT_EQ(StorageTier::PREMIUM, router_->GetPlacement(PatternID(3))->tier);

    // Residency elapsed; the stale evaluation forces a re-score
    clock_.Advance(std::chrono::hours(25));
    MigrationReport moved = migrator.RunCycle();
    EXPECT_EQ(1u, moved.demoted);
    EXPECT_EQ(StorageTier::ARCHIVE, router_->GetPlacement(PatternID(3))->tier);
}

TEST_F(TierMigratorTest, RecentlyEvaluatedCleanPlacementsAreSkipped) {
    router_->StorePattern(MakeStandardPattern("s", PatternID(4)), clock_.Now());

    TierMigrator::Config config;
    config.batch_yield = std::chrono::milliseconds(0);
    TierMigrator migrator(*router_, config, clock_.AsClock());
    EXPECT_EQ(0u, migrator.RunCycle().evaluated);

    clock_.Advance(std::chrono::hours(2));
    MigrationReport report = migrator.RunCycle();
    EXPECT_EQ(1u, report.evaluated);
    EXPECT_EQ(1u, report.unchanged);
    EXPECT_EQ(clock_.Now(), router_->GetPlacement(PatternID(4))->evaluated_at);
}

TEST_F(TierMigratorTest, BatchesCoverEveryPlacement) {
    for (uint64_t id = 1; id <= 25; ++id) {
        router_->StorePattern(AccessedNow(id), clock_.Now());
    }
    clock_.Advance(std::chrono::hours(24 * 30));

    TierMigrator::Config config;
    config.batch_size = 7;
    config.batch_yield = std::chrono::milliseconds(0);
    TierMigrator migrator(*router_, config, clock_.AsClock());

    MigrationReport report = migrator.RunCycle();
    EXPECT_EQ(25u, report.demoted);
    EXPECT_EQ(25u, router_->TierCounts()[static_cast<size_t>(StorageTier::ARCHIVE)]);
}

TEST_F(TierMigratorTest, HistoryIsBounded) {
    for (uint64_t id = 1; id <= 5; ++id) {
        router_->StorePattern(AccessedNow(id), clock_.Now());
    }
    clock_.Advance(std::chrono::hours(24 * 30));

    TierMigrator::Config config;
    config.history_limit = 2;
    config.batch_yield = std::chrono::milliseconds(0);
    TierMigrator migrator(*router_, config, clock_.AsClock());
    migrator.RunCycle();

    auto history = migrator.GetHistory();
    ASSERT_EQ(2u, history.size());
    EXPECT_EQ(PatternID(5), history.back().id);
    EXPECT_EQ(5u, migrator.GetStats().demoted);
}

TEST_F(TierMigratorTest, UnreadableTierCountsErrors) {
    auto failures = std::make_shared<FailureSwitch>();
    QualityTierRouter router(StoresWithFailingTier(StorageTier::PREMIUM, failures),
                             QualityScorer::Config{}, QualityTierRouter::Config{});
    router.StorePattern(MakePremiumPattern("p", PatternID(1)), clock_.Now());
    router.MarkDirty(PatternID(1));

    failures->FailAll(true);
    TierMigrator migrator(router, TierMigrator::Config{}, clock_.AsClock());
    MigrationReport report = migrator.RunCycle();

    EXPECT_EQ(1u, report.errors);
    EXPECT_EQ(StorageTier::PREMIUM, router.GetPlacement(PatternID(1))->tier);
}

TEST_F(TierMigratorTest, BackgroundCyclesRunUntilStopped) {
    TierMigrator::Config config;
    config.cycle_interval = std::chrono::milliseconds(10);
    TierMigrator migrator(*router_, config, clock_.AsClock());

    std::atomic<int> cycles{0};
    migrator.Start([&cycles](const MigrationReport&) { cycles.fetch_add(1); });
    EXPECT_TRUE(migrator.IsRunning());

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (cycles.load() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    migrator.Stop();

    EXPECT_FALSE(migrator.IsRunning());
    EXPECT_GE(cycles.load(), 2);
    EXPECT_GE(migrator.GetStats().cycles, 2u);
}

TEST_F(TierMigratorTest, StopWakesSleepingLoop) {
    TierMigrator::Config config;
    config.cycle_interval = std::chrono::hours(1);
    TierMigrator migrator(*router_, config, clock_.AsClock());

    auto started = std::chrono::steady_clock::now();
    for (int i = 0; i < 20; ++i) {
        migrator.Start();
        migrator.Stop();
    }
    EXPECT_FALSE(migrator.IsRunning());
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}

TEST_F(TierMigratorTest, InvalidConfigThrows) {
    TierMigrator::Config config;
    config.batch_size = 0;
    EXPECT_THROW(TierMigrator migrator(*router_, config), std::invalid_argument);
}

} // namespace
} // namespace dpcm
