// File: tests/engine/memory_engine_test.cpp
#include "engine/memory_engine.hpp"
#include "core/errors.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <set>
#include <thread>

namespace dpcm {
namespace {

using testing::FailureSwitch;
using testing::MakeArchivePattern;
using testing::MakePattern;
using testing::MakePremiumPattern;
using testing::MakeProfile;
using testing::MakeRejectedPattern;
using testing::MakeStandardPattern;
using testing::ManualClock;
using testing::MemoryStores;
using testing::StoresWithFailingTier;

class MemoryEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.field.random_seed = 1234;
        config_.migration.batch_yield = std::chrono::milliseconds(0);
        config_.warmer.batch_yield = std::chrono::milliseconds(0);
    }

    std::unique_ptr<MemoryEngine> MakeEngine() {
        return std::make_unique<MemoryEngine>(config_, MemoryStores(), clock_.AsClock());
    }

    std::unique_ptr<MemoryEngine> MakeEngineWithFailing(StorageTier tier) {
        failures_ = std::make_shared<FailureSwitch>();
        return std::make_unique<MemoryEngine>(config_, StoresWithFailingTier(tier, failures_),
                                              clock_.AsClock());
    }

    static Pattern AuthPattern(int n, double strength, double confidence, uint32_t occurrences) {
        return MakePattern("auth check " + std::to_string(n),
                           MakeProfile("auth", strength, confidence, 3.0 + n, occurrences));
    }

    static QueryIntent AuthDiscovery(size_t limit = 20) {
        QueryIntent intent;
        intent.type = QueryType::DISCOVERY;
        intent.harmonic_signature = MakeProfile("auth", 0.8, 0.8, 5.0, 10);
        intent.exploration = 1.0;
        intent.limit = limit;
        return intent;
    }

    static std::set<PatternID> Ids(const QueryResult& result) {
        std::set<PatternID> ids;
        for (const auto& m : result.matches) {
            ids.insert(m.pattern.id);
        }
        return ids;
    }

    EngineConfig config_;
    ManualClock clock_;
    std::shared_ptr<FailureSwitch> failures_;
};

// ============================================================================
// Ingestion
// ============================================================================

TEST_F(MemoryEngineTest, StoreAssignsIdCoordinateAndTier) {
    auto engine = MakeEngine();

    Pattern p = MakePremiumPattern("hot loop");
    p.coordinate = Coordinate(0.9, 0.9, 0.9);  // Ignored
    StoreResult result = engine->Store(p);

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_TRUE(result.id.IsValid());
    ASSERT_TRUE(result.tier.has_value());
    EXPECT_EQ(StorageTier::PREMIUM, *result.tier);
    // Base .923 plus the full freshness bonus, capped
    EXPECT_DOUBLE_EQ(1.0, result.score);

    auto stored = engine->Get(result.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(engine->GetHasher().GenerateSemanticCoordinates(p.profile), stored->coordinate);
    EXPECT_EQ(clock_.Now(), stored->access.created_at);
    EXPECT_TRUE(engine->GetIndex().Contains(result.id));
}

TEST_F(MemoryEngineTest, InvalidPatternIsRefused) {
    auto engine = MakeEngine();

    StoreResult bad_profile = engine->Store(MakePattern("x", MakeProfile("auth", 1.5)));
    EXPECT_FALSE(bad_profile.success);
    EXPECT_FALSE(bad_profile.error.empty());

    StoreResult no_category = engine->Store(MakePattern("x", MakeProfile("")));
    EXPECT_FALSE(no_category.success);
    EXPECT_EQ(0u, engine->GetIndex().Size());
}

TEST_F(MemoryEngineTest, EachScoreBandLandsInItsTier) {
    auto engine = MakeEngine();
    engine->Store(MakePremiumPattern("a"));
    engine->Store(MakeStandardPattern("b"));
    engine->Store(MakeArchivePattern("c"));
    engine->Store(MakeRejectedPattern("d"));

    auto stats = engine->Stats();
    for (size_t count : stats.tier_counts) {
        EXPECT_EQ(1u, count);
    }
    EXPECT_EQ(4u, stats.index.entry_count);
    EXPECT_EQ(4u, stats.stores);
}

TEST_F(MemoryEngineTest, NearIdenticalPatternIsMergedOnStore) {
    auto engine = MakeEngine();
    StoreResult first = engine->Store(MakeStandardPattern("Repeated SQL query in loop"));
    StoreResult second = engine->Store(MakeStandardPattern("Repeated SQL query in loop"));

    ASSERT_TRUE(second.success);
    ASSERT_TRUE(second.merged_into.has_value());
    EXPECT_EQ(first.id, *second.merged_into);
    EXPECT_EQ(1u, engine->GetIndex().Size());

    auto merged = engine->Get(first.id);
    ASSERT_TRUE(merged.has_value());
    EXPECT_EQ(20u, merged->profile.occurrences);
    EXPECT_FALSE(engine->Get(second.id).has_value());
}

TEST_F(MemoryEngineTest, MergeOnStoreCanBeDisabled) {
    config_.engine.dedup_on_store = false;
    auto engine = MakeEngine();
    engine->Store(MakeStandardPattern("Repeated SQL query in loop"));
    StoreResult second = engine->Store(MakeStandardPattern("Repeated SQL query in loop"));

    EXPECT_FALSE(second.merged_into.has_value());
    EXPECT_EQ(2u, engine->GetIndex().Size());
}

TEST_F(MemoryEngineTest, RestoringAnIdReplacesIt) {
    auto engine = MakeEngine();
    StoreResult first = engine->Store(MakePremiumPattern("p", PatternID(500)));
    StoreResult again = engine->Store(MakeArchivePattern("p", PatternID(500)));

    EXPECT_FALSE(again.merged_into.has_value());
    EXPECT_EQ(StorageTier::ARCHIVE, *again.tier);
    EXPECT_EQ(1u, engine->GetIndex().Size());
    EXPECT_EQ(first.id, again.id);
    EXPECT_GT(PatternID::Generate().value(), 500u);
}

TEST_F(MemoryEngineTest, BatchStoreReportsEachPattern) {
    auto engine = MakeEngine();
    engine->Store(MakeStandardPattern("Repeated SQL query in loop"));

    std::vector<Pattern> batch = {
        MakePremiumPattern("fresh premium"),
        MakePattern("broken", MakeProfile("auth", -0.1)),
        MakeStandardPattern("Repeated SQL query in loop"),
        MakeArchivePattern("fresh archive"),
    };
    BatchStoreResult result = engine->StoreBatch(batch);

    ASSERT_EQ(4u, result.results.size());
    EXPECT_EQ(2u, result.stored);
    EXPECT_EQ(1u, result.merged);
    EXPECT_EQ(1u, result.failed);
    EXPECT_EQ(0u, result.queued);
    EXPECT_FALSE(result.results[1].success);
    EXPECT_TRUE(result.results[2].merged_into.has_value());
    EXPECT_EQ(3u, engine->GetIndex().Size());
}

// ============================================================================
// Queries
// ============================================================================

TEST_F(MemoryEngineTest, DiscoveryQueryRanksCategoryCluster) {
    auto engine = MakeEngine();
    std::set<PatternID> auth_ids;
    for (int n = 0; n < 5; ++n) {
        StoreResult r = engine->Store(AuthPattern(n, 0.75 + 0.04 * n, 0.8, 10 + n));
        ASSERT_TRUE(r.success);
        auth_ids.insert(r.id);
    }

    QueryResult result = engine->Query(AuthDiscovery());

    EXPECT_FALSE(result.IsDegraded());
    for (PatternID id : auth_ids) {
        EXPECT_TRUE(Ids(result).count(id)) << id.ToString();
    }
    for (size_t i = 1; i < result.matches.size(); ++i) {
        EXPECT_GE(result.matches[i - 1].score, result.matches[i].score);
    }
    for (const auto& m : result.matches) {
        EXPECT_GT(m.score, 0.0);
        EXPECT_LE(m.score, 1.0);
        EXPECT_LE(m.distance, result.field.radius);
    }
}

TEST_F(MemoryEngineTest, QueryHonoursLimit) {
    auto engine = MakeEngine();
    for (int n = 0; n < 6; ++n) {
        engine->Store(AuthPattern(n, 0.8, 0.8, 12));
    }
    QueryResult result = engine->Query(AuthDiscovery(2));
    EXPECT_EQ(2u, result.matches.size());
    EXPECT_GE(result.candidates, 6u);
}

TEST_F(MemoryEngineTest, RejectedPatternsAreNeverReturned) {
    auto engine = MakeEngine();
    StoreResult rejected = engine->Store(MakePattern("weak auth", MakeProfile("auth", 0.2, 0.2, 1.0, 1)));
    ASSERT_EQ(StorageTier::REJECTED, *rejected.tier);

    QueryResult result = engine->Query(AuthDiscovery());
    EXPECT_FALSE(Ids(result).count(rejected.id));
    EXPECT_TRUE(engine->GetIndex().Contains(rejected.id));
}

TEST_F(MemoryEngineTest, InvalidIntentThrowsBeforeAnyWork) {
    auto engine = MakeEngine();
    QueryIntent intent = AuthDiscovery();
    intent.limit = 0;

    EXPECT_THROW(engine->Query(intent), InvalidIntentError);
    EXPECT_EQ(0u, engine->Stats().queries);
    EXPECT_TRUE(engine->GetQueryContext().recent_queries.empty());
}

TEST_F(MemoryEngineTest, QueriesFeedContextWarmerAndHotCache) {
    config_.engine.recent_query_window = 3;
    auto engine = MakeEngine();
    StoreResult premium = engine->Store(MakePattern("session fixation", MakeProfile("auth", 0.95, 0.95, 5.0, 50)));
    ASSERT_EQ(StorageTier::PREMIUM, *premium.tier);

    for (int i = 0; i < 5; ++i) {
        engine->Query(AuthDiscovery());
    }

    QueryContext context = engine->GetQueryContext();
    EXPECT_EQ(3u, context.recent_queries.size());
    EXPECT_EQ("AUTH", context.recent_queries.back().category);

    auto stats = engine->Stats();
    EXPECT_EQ(5u, stats.queries);
    EXPECT_EQ(1u, stats.warmer.tracked_patterns);
    EXPECT_EQ(1u, stats.cache.size);
    EXPECT_GT(stats.cache.hits, 0u);
}

TEST_F(MemoryEngineTest, WarmingLoadsFrequentlyUsedStandardPattern) {
    auto engine = MakeEngine();
    StoreResult r = engine->Store(MakeStandardPattern("n plus one in order listing"));
    ASSERT_EQ(StorageTier::STANDARD, *r.tier);

    for (int i = 0; i < 200; ++i) {
        ASSERT_TRUE(engine->RecordAccess(r.id));
    }
    CacheWarmer::WarmReport report = engine->WarmCache();

    EXPECT_EQ(1u, report.candidates);
    EXPECT_EQ(1u, report.warmed);
    EXPECT_EQ(0u, report.failed);
    EXPECT_EQ(1u, engine->Stats().cache.size);
    EXPECT_EQ(1u, engine->Stats().tier_counts[static_cast<size_t>(StorageTier::STANDARD)]);

    // A migration that moves nothing keeps the warmed entry
    clock_.Advance(std::chrono::hours(2));
    engine->Migrate();
    EXPECT_EQ(1u, engine->Stats().cache.size);
}

TEST_F(MemoryEngineTest, RejectedPatternIsNeverWarmed) {
    auto engine = MakeEngine();
    StoreResult r = engine->Store(MakeRejectedPattern("noise"));
    ASSERT_EQ(StorageTier::REJECTED, *r.tier);

    for (int i = 0; i < 200; ++i) {
        engine->RecordAccess(r.id);
    }
    CacheWarmer::WarmReport report = engine->WarmCache();

    EXPECT_EQ(0u, report.warmed);
    EXPECT_EQ(0u, engine->Stats().cache.size);
}

TEST_F(MemoryEngineTest, FailingTierDegradesQuery) {
    auto engine = MakeEngineWithFailing(StorageTier::STANDARD);
    StoreResult premium = engine->Store(MakePattern("token reuse", MakeProfile("auth", 0.95, 0.95, 5.0, 50)));
    StoreResult standard = engine->Store(MakePattern("weak hash", MakeProfile("auth", 0.8, 0.8, 5.0, 10)));
    ASSERT_EQ(StorageTier::PREMIUM, *premium.tier);
    ASSERT_EQ(StorageTier::STANDARD, *standard.tier);

    failures_->fail_reads.store(true);
    QueryResult result = engine->Query(AuthDiscovery());

    EXPECT_TRUE(result.IsDegraded());
    EXPECT_EQ(std::vector<StorageTier>{StorageTier::STANDARD}, result.degraded_tiers);
    EXPECT_EQ(std::set<PatternID>{premium.id}, Ids(result));
    EXPECT_EQ(1u, engine->Stats().degraded_queries);
}

TEST_F(MemoryEngineTest, AllCandidateTiersFailingThrows) {
    auto engine = MakeEngineWithFailing(StorageTier::STANDARD);
    engine->Store(MakePattern("weak hash", MakeProfile("auth", 0.8, 0.8, 5.0, 10)));

    failures_->fail_reads.store(true);
    EXPECT_THROW(engine->Query(AuthDiscovery()), TierExhaustedError);
}

TEST_F(MemoryEngineTest, EmptyEngineQueryIsEmptyNotDegraded) {
    auto engine = MakeEngine();
    QueryResult result = engine->Query(AuthDiscovery());
    EXPECT_TRUE(result.matches.empty());
    EXPECT_FALSE(result.IsDegraded());
}

TEST_F(MemoryEngineTest, WorkerPoolFetchesTiersInParallel) {
    config_.engine.use_worker_pool = true;
    config_.workers.max_workers = 4;
    config_.workers.min_workers = 2;
    auto pool = std::make_shared<WorkerPool>(config_.workers);
    MemoryEngine engine(config_, MemoryStores(), clock_.AsClock(), nullptr, pool);

    StoreResult premium = engine.Store(MakePattern("token reuse", MakeProfile("auth", 0.95, 0.95, 5.0, 50)));
    StoreResult standard = engine.Store(MakePattern("weak hash", MakeProfile("auth", 0.8, 0.8, 5.0, 10)));

    QueryResult result = engine.Query(AuthDiscovery());
    EXPECT_FALSE(result.IsDegraded());
    EXPECT_EQ((std::set<PatternID>{premium.id, standard.id}), Ids(result));
    ASSERT_TRUE(engine.Stats().workers.has_value());

    // Counters settle just after the futures do
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (engine.Stats().workers->completed < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    EXPECT_EQ(2u, engine.Stats().workers->completed);
}

// ============================================================================
// Access and removal
// ============================================================================

TEST_F(MemoryEngineTest, RecordAccessPersists) {
    auto engine = MakeEngine();
    StoreResult r = engine->Store(MakeStandardPattern("s"));

    clock_.Advance(std::chrono::hours(3));
    EXPECT_TRUE(engine->RecordAccess(r.id));
    EXPECT_TRUE(engine->RecordAccess(r.id));

    auto stored = engine->Get(r.id);
    EXPECT_EQ(2u, stored->access.access_count);
    EXPECT_EQ(clock_.Now(), stored->access.last_accessed);
    EXPECT_FALSE(engine->RecordAccess(PatternID(999999)));
}

TEST_F(MemoryEngineTest, RemoveDropsPatternEverywhere) {
    auto engine = MakeEngine();
    StoreResult r = engine->Store(MakePremiumPattern("p"));
    engine->Query(AuthDiscovery());

    EXPECT_TRUE(engine->Remove(r.id));
    EXPECT_FALSE(engine->Get(r.id).has_value());
    EXPECT_FALSE(engine->GetIndex().Contains(r.id));
    EXPECT_FALSE(engine->Remove(r.id));
}

// ============================================================================
// Maintenance
// ============================================================================

TEST_F(MemoryEngineTest, QueuedWriteIsIndexedOnceRetried) {
    auto engine = MakeEngineWithFailing(StorageTier::PREMIUM);
    failures_->FailAll(true);

    StoreResult r = engine->Store(MakePremiumPattern("p"));
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(r.queued);
    EXPECT_EQ(TierStatus::UNAVAILABLE, r.status);
    EXPECT_FALSE(engine->GetIndex().Contains(r.id));
    EXPECT_EQ(1u, engine->Stats().pending_writes);
    EXPECT_EQ(std::vector<StorageTier>{StorageTier::PREMIUM}, engine->Stats().unavailable_tiers);

    failures_->FailAll(false);
    clock_.Advance(std::chrono::milliseconds(200));
    engine->Migrate();

    EXPECT_TRUE(engine->GetIndex().Contains(r.id));
    EXPECT_TRUE(engine->Get(r.id).has_value());
    EXPECT_EQ(0u, engine->Stats().pending_writes);
}

TEST_F(MemoryEngineTest, UnusedPremiumPatternIsDemotedAfterThirtyDays) {
    auto engine = MakeEngine();
    StoreResult r = engine->Store(MakePattern("session fixation", MakeProfile("auth", 0.95, 0.95, 5.0, 50)));
    ASSERT_EQ(StorageTier::PREMIUM, *r.tier);
    engine->Query(AuthDiscovery());
    ASSERT_EQ(1u, engine->Stats().cache.size);

    clock_.Advance(std::chrono::hours(24 * 30));
    MigrationReport report = engine->Migrate();

    EXPECT_EQ(1u, report.demoted);
    auto stats = engine->Stats();
    EXPECT_EQ(1u, stats.tier_counts[static_cast<size_t>(StorageTier::ARCHIVE)]);
    EXPECT_EQ(0u, stats.cache.size);
    EXPECT_EQ(0u, stats.index_rebuilds);
    EXPECT_TRUE(engine->GetIndex().Contains(r.id));
}

TEST_F(MemoryEngineTest, DeduplicateMergesAcrossTiers) {
    config_.engine.dedup_on_store = false;
    auto engine = MakeEngine();
    engine->Store(MakeStandardPattern("Repeated SQL query in loop"));
    engine->Store(MakeStandardPattern("Repeated SQL query in loop"));
    engine->Store(MakeArchivePattern("Unbounded retry loop"));

    DeduplicationSummary first = engine->Deduplicate();
    EXPECT_EQ(1u, first.merged);
    EXPECT_GT(first.space_saved, 0u);
    EXPECT_EQ(0u, first.apply_failures);
    EXPECT_EQ(2u, engine->GetIndex().Size());

    DeduplicationSummary second = engine->Deduplicate();
    EXPECT_EQ(0u, second.merged);

    ConsistencyReport consistency = engine->CheckConsistency();
    EXPECT_EQ(consistency.indexed, consistency.placed);
    EXPECT_FALSE(consistency.rebuilt);
}

TEST_F(MemoryEngineTest, RecoversPatternsAlreadyInStores) {
    CoordinateHasher hasher(config_.hasher);
    Pattern persisted = MakeStandardPattern("persisted", PatternID(7000));
    persisted.coordinate = hasher.GenerateSemanticCoordinates(persisted.profile);

    QualityTierRouter::TierStores stores = MemoryStores();
    stores[static_cast<size_t>(StorageTier::STANDARD)]->Put(persisted);

    MemoryEngine engine(config_, std::move(stores), clock_.AsClock());
    EXPECT_EQ(1u, engine.GetIndex().Size());
    EXPECT_TRUE(engine.Get(PatternID(7000)).has_value());
    EXPECT_GT(PatternID::Generate().value(), 7000u);
}

TEST_F(MemoryEngineTest, BackgroundThreadsStartAndStop) {
    config_.migration.cycle_interval = std::chrono::milliseconds(10);
    config_.warmer.cycle_interval = std::chrono::milliseconds(10);
    auto engine = MakeEngine();
    engine->Store(MakePremiumPattern("p"));

    engine->StartBackground();
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (engine->Stats().migration.cycles == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    engine->StopBackground();

    EXPECT_GE(engine->Stats().migration.cycles, 1u);
}

// ============================================================================
// Aggregates
// ============================================================================

class MemoryEngineAggregateTest : public MemoryEngineTest {
protected:
    void SetUp() override {
        MemoryEngineTest::SetUp();
        engine_ = MakeEngine();
        engine_->Store(MakePattern("token reuse", MakeProfile("auth", 0.95, 0.95, 5.0, 50)));
        engine_->Store(MakeStandardPattern("n plus one"));
        engine_->Store(MakeArchivePattern("slow regex"));
        engine_->Store(MakeRejectedPattern("noise"));
    }

    std::unique_ptr<MemoryEngine> engine_;
};

TEST_F(MemoryEngineAggregateTest, TierDistribution) {
    auto result = engine_->Aggregate("tier_distribution");
    ASSERT_TRUE(result.has_value());
    EXPECT_DOUBLE_EQ(1.0, result->at("premium"));
    EXPECT_DOUBLE_EQ(1.0, result->at("standard"));
    EXPECT_DOUBLE_EQ(1.0, result->at("archive"));
    EXPECT_DOUBLE_EQ(1.0, result->at("rejected"));
}

TEST_F(MemoryEngineAggregateTest, CategoryDistributionSkipsRejected) {
    auto result = engine_->Aggregate("category_distribution");
    ASSERT_TRUE(result.has_value());
    EXPECT_DOUBLE_EQ(1.0, result->at("AUTH"));
    EXPECT_DOUBLE_EQ(2.0, result->at("PERFORMANCE"));

    auto auth_only = engine_->Aggregate("category_distribution", {{"category", "auth"}});
    ASSERT_TRUE(auth_only.has_value());
    EXPECT_EQ(1u, auth_only->size());
}

TEST_F(MemoryEngineAggregateTest, ComplexityHotspots) {
    auto all = engine_->Aggregate("complexity_hotspots");
    ASSERT_TRUE(all.has_value());
    EXPECT_DOUBLE_EQ(5.0, all->at("AUTH"));
    EXPECT_DOUBLE_EQ(4.0, all->at("PERFORMANCE"));

    auto hot = engine_->Aggregate("complexity_hotspots", {{"min_complexity", "4.5"}});
    ASSERT_TRUE(hot.has_value());
    EXPECT_EQ(1u, hot->size());
    EXPECT_EQ(1u, hot->count("AUTH"));

    EXPECT_THROW(engine_->Aggregate("complexity_hotspots", {{"min_complexity", "high"}}),
                 std::invalid_argument);
}

TEST_F(MemoryEngineAggregateTest, UnknownViewIsNullopt) {
    EXPECT_FALSE(engine_->Aggregate("median_latency").has_value());
    EXPECT_FALSE(engine_->MaterializeAggregate("median_latency").has_value());
}

TEST_F(MemoryEngineAggregateTest, WritesInvalidateMaterializedViews) {
    engine_->MaterializeAggregate("category_distribution");
    engine_->MaterializeAggregate("tier_distribution");
    EXPECT_EQ(2u, engine_->Stats().materializer.view_count);

    auto cached = engine_->Aggregate("category_distribution");
    EXPECT_EQ(1u, engine_->Stats().materializer.hits);
    EXPECT_DOUBLE_EQ(2.0, cached->at("PERFORMANCE"));

    engine_->Store(MakeStandardPattern("another slow query path"));
    EXPECT_EQ(0u, engine_->Stats().materializer.view_count);

    auto fresh = engine_->Aggregate("category_distribution");
    EXPECT_DOUBLE_EQ(3.0, fresh->at("PERFORMANCE"));
}

// ============================================================================
// Construction from configuration
// ============================================================================

TEST_F(MemoryEngineTest, InvalidConfigThrows) {
    config_.quality.premium_threshold = 0.3;
    EXPECT_THROW(MakeEngine(), std::invalid_argument);
}

TEST_F(MemoryEngineTest, CreateWithSqliteTiersPersists) {
    config_.storage.backend = "sqlite";
    config_.storage.directory = std::filesystem::temp_directory_path().string();
    config_.storage.file_prefix = "engine_test_" + std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count());
    config_.logging.console = false;

    PatternID id;
    {
        auto engine = MemoryEngine::Create(config_, clock_.AsClock());
        StoreResult r = engine->Store(MakeStandardPattern("persisted"));
        ASSERT_TRUE(r.success) << r.error;
        id = r.id;
    }
    {
        auto engine = MemoryEngine::Create(config_, clock_.AsClock());
        auto loaded = engine->Get(id);
        ASSERT_TRUE(loaded.has_value());
        EXPECT_EQ("persisted", loaded->content.title);
        EXPECT_TRUE(engine->GetIndex().Contains(id));
    }

    for (size_t i = 0; i < kStorageTierCount; ++i) {
        std::string path = config_.storage.PathFor(static_cast<StorageTier>(i));
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
}

} // namespace
} // namespace dpcm
