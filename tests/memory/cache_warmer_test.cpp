// File: tests/memory/cache_warmer_test.cpp
#include "memory/cache_warmer.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <map>
#include <thread>

namespace dpcm {
namespace {

using testing::MakePattern;
using testing::MakeProfile;
using testing::ManualClock;

// The default manual clock starts at 2023-11-14 22:13:20 UTC, a Tuesday
TEST(CalendarTest, HourAndDayOfWeek) {
    ManualClock clock;
    EXPECT_EQ(22, HourOfDay(clock.Now()));
    EXPECT_EQ(2, DayOfWeek(clock.Now()));

    EXPECT_EQ(0, HourOfDay(Timestamp::FromMicros(0)));
    EXPECT_EQ(4, DayOfWeek(Timestamp::FromMicros(0)));
    EXPECT_EQ(23, HourOfDay(Timestamp::FromMicros(-1)));
    EXPECT_EQ(3, DayOfWeek(Timestamp::FromMicros(-1)));
}

// ============================================================================
// AccessTracker
// ============================================================================

TEST(AccessTrackerTest, BuildsHistograms) {
    ManualClock clock;
    AccessTracker tracker(3);

    tracker.RecordAccess(PatternID(1), clock.Now());
    clock.Advance(std::chrono::hours(1));
    tracker.RecordAccess(PatternID(1), clock.Now());
    tracker.RecordAccess(PatternID(1), clock.Now());
    tracker.RecordAccess(PatternID(1), clock.Now());

    auto profile = tracker.GetProfile(PatternID(1));
    ASSERT_TRUE(profile.has_value());
    EXPECT_EQ(4u, profile->count);
    EXPECT_EQ(1u, profile->by_hour[22]);
    EXPECT_EQ(3u, profile->by_hour[23]);
    EXPECT_EQ(4u, profile->by_day[2]);
    EXPECT_EQ(3u, profile->recent.size());
    EXPECT_LT(profile->first_access, profile->last_access);
}

TEST(AccessTrackerTest, ForgetAndClear) {
    AccessTracker tracker;
    tracker.RecordAccess(PatternID(1), Timestamp::FromMicros(1));
    tracker.RecordAccess(PatternID(2), Timestamp::FromMicros(2));

    tracker.Forget(PatternID(1));
    EXPECT_FALSE(tracker.GetProfile(PatternID(1)).has_value());
    EXPECT_EQ(1u, tracker.Size());

    tracker.Clear();
    EXPECT_EQ(0u, tracker.Size());
    EXPECT_TRUE(tracker.Snapshot().empty());
}

// ============================================================================
// CacheWarmer
// ============================================================================

class CacheWarmerTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (uint64_t id = 1; id <= 2; ++id) {
            store_[PatternID(id)] = MakePattern("p" + std::to_string(id), MakeProfile("auth"), PatternID(id));
        }
        // Pattern 3 is tracked but never loadable
    }

    CacheWarmer::Loader Loader() {
        return [this](PatternID id) -> std::optional<Pattern> {
            ++loads_;
            auto it = store_.find(id);
            if (it == store_.end()) {
                return std::nullopt;
            }
            return it->second;
        };
    }

    /// Pattern 1: heavy use. Pattern 2: light use, this hour.
    /// Pattern 3: used only in the next hour of the day.
    void RecordTypicalDay(CacheWarmer& warmer) {
        for (int i = 0; i < 120; ++i) {
            warmer.RecordAccess(PatternID(1));
        }
        for (int i = 0; i < 3; ++i) {
            warmer.RecordAccess(PatternID(2));
        }
        clock_.Advance(std::chrono::hours(1));
        warmer.RecordAccess(PatternID(3));
        warmer.RecordAccess(PatternID(3));
        clock_.Advance(std::chrono::hours(-1));
    }

    static CacheWarmer::Config Unthrottled() {
        CacheWarmer::Config config;
        config.batch_yield = std::chrono::milliseconds(0);
        return config;
    }

    ManualClock clock_;
    HotCache cache_{16};
    std::map<PatternID, Pattern> store_;
    int loads_{0};
};

TEST_F(CacheWarmerTest, RanksByPriorityThenScore) {
    CacheWarmer warmer(cache_, Loader(), Unthrottled(), clock_.AsClock());
    RecordTypicalDay(warmer);

    auto candidates = warmer.SelectCandidates();
    ASSERT_EQ(3u, candidates.size());

    EXPECT_EQ(PatternID(1), candidates[0].id);
    EXPECT_EQ(CacheWarmer::Priority::CRITICAL, candidates[0].priority);
    EXPECT_EQ(CacheWarmer::Strategy::FREQUENCY, candidates[0].strategy);

    EXPECT_EQ(PatternID(2), candidates[1].id);
    EXPECT_EQ(CacheWarmer::Priority::HIGH, candidates[1].priority);
    EXPECT_EQ(CacheWarmer::Strategy::TIME_BASED, candidates[1].strategy);

    EXPECT_EQ(PatternID(3), candidates[2].id);
    EXPECT_EQ(CacheWarmer::Priority::HIGH, candidates[2].priority);
    EXPECT_EQ(CacheWarmer::Strategy::PREDICTIVE, candidates[2].strategy);
    EXPECT_DOUBLE_EQ(1.0, candidates[2].score);
}

TEST_F(CacheWarmerTest, NoAccessesNoCandidates) {
    CacheWarmer warmer(cache_, Loader(), Unthrottled(), clock_.AsClock());
    EXPECT_TRUE(warmer.SelectCandidates().empty());
    EXPECT_EQ(0u, warmer.WarmCache().candidates);
}

TEST_F(CacheWarmerTest, WarmsLoadableCandidates) {
    CacheWarmer warmer(cache_, Loader(), Unthrottled(), clock_.AsClock());
    RecordTypicalDay(warmer);

    CacheWarmer::WarmReport first = warmer.WarmCache();
    EXPECT_EQ(3u, first.candidates);
    EXPECT_EQ(2u, first.warmed);
    EXPECT_EQ(1u, first.failed);
    EXPECT_TRUE(cache_.Contains(PatternID(1)));
    EXPECT_TRUE(cache_.Contains(PatternID(2)));

    CacheWarmer::WarmReport second = warmer.WarmCache();
    EXPECT_EQ(0u, second.warmed);
    EXPECT_EQ(2u, second.already_cached);
    EXPECT_EQ(4, loads_);

    auto stats = warmer.GetStats();
    EXPECT_EQ(2u, stats.patterns_warmed);
    EXPECT_EQ(2u, stats.cycles);
    EXPECT_EQ(3u, stats.tracked_patterns);
    EXPECT_EQ(2u, stats.cache_size);
}

TEST_F(CacheWarmerTest, PerCycleLimitKeepsBestCandidates) {
    CacheWarmer::Config config = Unthrottled();
    config.max_per_cycle = 1;
    CacheWarmer warmer(cache_, Loader(), config, clock_.AsClock());
    RecordTypicalDay(warmer);

    CacheWarmer::WarmReport report = warmer.WarmCache();
    EXPECT_EQ(1u, report.warmed);
    EXPECT_TRUE(cache_.Contains(PatternID(1)));
    EXPECT_FALSE(cache_.Contains(PatternID(2)));
}

TEST_F(CacheWarmerTest, ForgetDropsTrackingAndCacheEntry) {
    CacheWarmer warmer(cache_, Loader(), Unthrottled(), clock_.AsClock());
    RecordTypicalDay(warmer);
    warmer.WarmCache();

    warmer.Forget(PatternID(1));
    EXPECT_FALSE(cache_.Contains(PatternID(1)));
    EXPECT_FALSE(warmer.GetTracker().GetProfile(PatternID(1)).has_value());
}

TEST_F(CacheWarmerTest, BackgroundWarming) {
    CacheWarmer::Config config = Unthrottled();
    config.cycle_interval = std::chrono::milliseconds(10);
    CacheWarmer warmer(cache_, Loader(), config, clock_.AsClock());
    warmer.RecordAccess(PatternID(2));

    warmer.Start();
    EXPECT_TRUE(warmer.IsRunning());
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!cache_.Contains(PatternID(2)) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    warmer.Stop();

    EXPECT_FALSE(warmer.IsRunning());
    EXPECT_TRUE(cache_.Contains(PatternID(2)));
}

TEST_F(CacheWarmerTest, StopWakesSleepingLoop) {
    CacheWarmer::Config config = Unthrottled();
    config.cycle_interval = std::chrono::hours(1);
    CacheWarmer warmer(cache_, Loader(), config, clock_.AsClock());

    auto started = std::chrono::steady_clock::now();
    for (int i = 0; i < 20; ++i) {
        warmer.Start();
        warmer.Stop();
    }
    EXPECT_FALSE(warmer.IsRunning());
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}

TEST_F(CacheWarmerTest, PriorityAndStrategyNames) {
    EXPECT_STREQ("critical", ToString(CacheWarmer::Priority::CRITICAL));
    EXPECT_STREQ("predictive", ToString(CacheWarmer::Strategy::PREDICTIVE));
}

TEST_F(CacheWarmerTest, InvalidSetupThrows) {
    CacheWarmer::Config config;
    config.batch_size = 0;
    EXPECT_THROW(CacheWarmer warmer(cache_, Loader(), config), std::invalid_argument);
    EXPECT_THROW(CacheWarmer warmer(cache_, nullptr, CacheWarmer::Config{}), std::invalid_argument);
}

} // namespace
} // namespace dpcm
