// File: tests/storage/lru_cache_test.cpp
#include "storage/lru_cache.hpp"
#include "core/pattern.hpp"
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

namespace dpcm {
namespace {

// ============================================================================
// Basic Operations Tests
// ============================================================================

TEST(LRUCacheTest, ZeroCapacityBecomesOne) {
    LRUCache<int, int> cache(0);
    EXPECT_EQ(1u, cache.Capacity());
    cache.Put(1, 1);
    cache.Put(2, 2);
    EXPECT_EQ(1u, cache.Size());
    EXPECT_TRUE(cache.Contains(2));
}

TEST(LRUCacheTest, PutGetRemove) {
    LRUCache<int, std::string> cache(5);

    EXPECT_FALSE(cache.Put(1, "one").has_value());
    auto result = cache.Get(1);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ("one", *result);

    EXPECT_TRUE(cache.Remove(1));
    EXPECT_FALSE(cache.Remove(1));
    EXPECT_FALSE(cache.Get(1).has_value());
}

TEST(LRUCacheTest, PutRefreshesExistingValue) {
    LRUCache<int, std::string> cache(2);
    cache.Put(1, "one");
    EXPECT_FALSE(cache.Put(1, "ONE").has_value());
    EXPECT_EQ("ONE", *cache.Peek(1));
    EXPECT_EQ(1u, cache.Size());
}

// ============================================================================
// Eviction Tests
// ============================================================================

TEST(LRUCacheTest, PutReturnsEvictedKey) {
    LRUCache<int, std::string> cache(3);
    cache.Put(1, "one");
    cache.Put(2, "two");
    cache.Put(3, "three");

    auto evicted = cache.Put(4, "four");
    ASSERT_TRUE(evicted.has_value());
    EXPECT_EQ(1, *evicted);
    EXPECT_FALSE(cache.Contains(1));
    EXPECT_EQ(1u, cache.GetStats().evictions);
}

TEST(LRUCacheTest, GetProtectsFromEviction) {
    LRUCache<int, std::string> cache(3);
    cache.Put(1, "one");
    cache.Put(2, "two");
    cache.Put(3, "three");

    cache.Get(1);
    EXPECT_EQ(2, *cache.Put(4, "four"));
    EXPECT_TRUE(cache.Contains(1));
}

TEST(LRUCacheTest, PeekLeavesRecencyAndCountersAlone) {
    LRUCache<int, std::string> cache(3);
    cache.Put(1, "one");
    cache.Put(2, "two");
    cache.Put(3, "three");

    EXPECT_EQ("one", *cache.Peek(1));
    EXPECT_FALSE(cache.Peek(9).has_value());

    // 1 is still least recently used
    EXPECT_EQ(1, *cache.Put(4, "four"));

    auto stats = cache.GetStats();
    EXPECT_EQ(0u, stats.hits);
    EXPECT_EQ(0u, stats.misses);
}

TEST(LRUCacheTest, KeysAreMostRecentFirst) {
    LRUCache<int, int> cache(4);
    cache.Put(1, 1);
    cache.Put(2, 2);
    cache.Put(3, 3);
    cache.Get(1);

    EXPECT_EQ((std::vector<int>{1, 3, 2}), cache.Keys());
}

// ============================================================================
// Statistics Tests
// ============================================================================

TEST(LRUCacheTest, StatsReportHitRateAndUtilization) {
    LRUCache<int, std::string> cache(5);
    cache.Put(1, "one");
    cache.Put(2, "two");
    cache.Put(3, "three");

    cache.Get(1);
    cache.Get(4);

    auto stats = cache.GetStats();
    EXPECT_EQ(3u, stats.size);
    EXPECT_EQ(5u, stats.capacity);
    EXPECT_EQ(1u, stats.hits);
    EXPECT_EQ(1u, stats.misses);
    EXPECT_DOUBLE_EQ(0.5, stats.hit_rate);
    EXPECT_DOUBLE_EQ(0.6, stats.utilization);
}

TEST(LRUCacheTest, HitRateZeroWithoutLookups) {
    LRUCache<int, int> cache(5);
    EXPECT_DOUBLE_EQ(0.0, cache.GetStats().hit_rate);
}

TEST(LRUCacheTest, ClearResetsEntriesAndCounters) {
    LRUCache<int, int> cache(1);
    cache.Put(1, 1);
    cache.Put(2, 2);
    cache.Get(2);
    cache.Get(1);

    cache.Clear();

    auto stats = cache.GetStats();
    EXPECT_EQ(0u, stats.size);
    EXPECT_EQ(0u, stats.hits);
    EXPECT_EQ(0u, stats.misses);
    EXPECT_EQ(0u, stats.evictions);
}

// ============================================================================
// Hot pattern cache
// ============================================================================

TEST(LRUCacheTest, CachesPatternsById) {
    LRUCache<PatternID, Pattern> cache(2);

    Pattern p;
    p.id = PatternID(10);
    p.profile.category = "auth";
    p.content.title = "hot";
    cache.Put(p.id, p);

    auto cached = cache.Get(PatternID(10));
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ("hot", cached->content.title);
    EXPECT_FALSE(cache.Get(PatternID(11)).has_value());
}

// ============================================================================
// Thread Safety Tests
// ============================================================================

TEST(LRUCacheTest, ConcurrentMixedOperationsAreSafe) {
    LRUCache<int, int> cache(100);

    std::vector<std::thread> threads;
    for (int t = 0; t < 6; ++t) {
        threads.emplace_back([&cache, t]() {
            for (int i = 0; i < 500; ++i) {
                int key = (t * 37 + i) % 250;
                switch (i % 3) {
                    case 0: cache.Put(key, i); break;
                    case 1: cache.Get(key); break;
                    default: cache.Remove(key); break;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_LE(cache.Size(), cache.Capacity());
    EXPECT_EQ(cache.Size(), cache.Keys().size());
}

} // namespace
} // namespace dpcm
