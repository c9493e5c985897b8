// File: src/engine/memory_engine.hpp
//
// MemoryEngine: single entry point of the pattern memory
//
// Composes the coordinate hasher, spatial index, probability-field scorer,
// tier router, migrator, deduplicator, hot cache, cache warmer and query
// materializer, and keeps the index in lock-step with tier placement:
//
//   store   : dedup check -> coordinate -> score -> tier write -> index insert
//   query   : intent -> field -> index range query -> field scoring ->
//             per-tier fetch (degrading by omission) -> ranked results
//
// Writers (store, remove, deduplicate, migrate) are serialized; queries run
// concurrently with them and with each other.
//
// Only InvalidIntentError and TierExhaustedError escape to callers; every
// other backend failure is reported in the returned structs.

#pragma once

#include "concurrency/worker_pool.hpp"
#include "core/pattern.hpp"
#include "core/types.hpp"
#include "engine/engine_config.hpp"
#include "memory/cache_warmer.hpp"
#include "memory/deduplicator.hpp"
#include "memory/quality_tier_router.hpp"
#include "memory/query_materializer.hpp"
#include "memory/tier_migrator.hpp"
#include "query/probability_field.hpp"
#include "spatial/coordinate_hasher.hpp"
#include "spatial/spatial_index.hpp"
#include <spdlog/spdlog.h>
#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace dpcm {

// ============================================================================
// Result types
// ============================================================================

/// Outcome of storing one pattern
struct StoreResult {
    PatternID id;                           ///< Id of the submitted pattern
    bool success{false};                    ///< Visible in its tier and the index
    TierStatus status{TierStatus::OK};
    std::optional<StorageTier> tier;
    double score{0.0};
    bool queued{false};                     ///< Tier write failed, retry pending
    std::optional<PatternID> merged_into;   ///< Folded into an existing near-duplicate
    std::string error;
};

struct BatchStoreResult {
    std::vector<StoreResult> results;       ///< Input order
    size_t stored{0};
    size_t merged{0};
    size_t queued{0};
    size_t failed{0};
};

struct QueryMatch {
    Pattern pattern;
    double score{0.0};                      ///< [0, 1]
    double distance{0.0};                   ///< From the field center
    StorageTier tier{StorageTier::STANDARD};
};

struct QueryResult {
    std::vector<QueryMatch> matches;        ///< Descending score
    ProbabilityField field;
    size_t candidates{0};                   ///< Index hits inside the field
    std::vector<StorageTier> degraded_tiers;    ///< Tiers that failed or timed out
    size_t missing{0};                      ///< Indexed but absent from their tier
    std::chrono::microseconds elapsed{0};

    bool IsDegraded() const { return !degraded_tiers.empty(); }
};

struct DeduplicationSummary {
    size_t candidates_found{0};
    size_t merged{0};
    size_t space_saved{0};
    std::chrono::milliseconds processing_time{0};
    std::vector<StorageTier> skipped_tiers;     ///< Could not be scanned
    size_t apply_failures{0};                   ///< Merges not written back
};

struct ConsistencyReport {
    size_t indexed{0};
    size_t placed{0};
    size_t stale_entries{0};        ///< Indexed, not placed
    size_t missing_entries{0};      ///< Placed, not indexed
    bool structure_valid{true};
    bool rebuilt{false};
    std::vector<StorageTier> skipped_tiers;
};

struct EngineStats {
    std::array<size_t, kStorageTierCount> tier_counts{};
    SpatialIndex::IndexStats index;
    HotCache::Stats cache;
    CacheWarmer::Stats warmer;
    QueryMaterializer::Stats materializer;
    QualityTierRouter::Stats router;
    TierMigrator::Stats migration;
    std::optional<WorkerPool::Stats> workers;
    size_t pending_writes{0};
    std::vector<StorageTier> unavailable_tiers;
    uint64_t stores{0};
    uint64_t queries{0};
    uint64_t degraded_queries{0};
    uint64_t index_rebuilds{0};
};

// ============================================================================
// MemoryEngine
// ============================================================================

class MemoryEngine {
public:
    /// Assemble an engine over the given tier stores
    ///
    /// Patterns already present in the stores are recovered and indexed.
    ///
    /// @param pool Optional pool for parallel per-tier fetches; used only if
    ///        config.engine.use_worker_pool is set
    /// @throws std::invalid_argument if config is invalid or a store is missing
    MemoryEngine(const EngineConfig& config,
                 QualityTierRouter::TierStores stores,
                 Clock clock = SystemClock(),
                 std::shared_ptr<spdlog::logger> logger = nullptr,
                 std::shared_ptr<WorkerPool> pool = nullptr);

    ~MemoryEngine();

    MemoryEngine(const MemoryEngine&) = delete;
    MemoryEngine& operator=(const MemoryEngine&) = delete;

    /// Build stores, logger and worker pool from configuration
    ///
    /// @throws std::invalid_argument if config is invalid
    /// @throws TierUnavailableError if a SQLite tier cannot be opened
    static std::unique_ptr<MemoryEngine> Create(const EngineConfig& config,
                                                Clock clock = SystemClock());

    // ========================================================================
    // Ingestion
    // ========================================================================

    /// Store one pattern
    ///
    /// An invalid id is replaced by a fresh one. Re-storing an existing id
    /// replaces it.
    StoreResult Store(Pattern pattern);

    /// Store several patterns with one write per tier
    BatchStoreResult StoreBatch(std::vector<Pattern> patterns);

    // ========================================================================
    // Retrieval
    // ========================================================================

    /// Ranked approximate search
    ///
    /// @throws InvalidIntentError before any I/O if the intent is malformed
    /// @throws TierExhaustedError if candidates existed but every tier holding
    ///         them failed
    QueryResult Query(const QueryIntent& intent);

    /// Pattern by id, nullopt if absent or its tier is unreachable
    std::optional<Pattern> Get(PatternID id);

    /// Persist one access (count and time) and feed the cache warmer
    ///
    /// @return false if the pattern is unknown or its tier failed
    bool RecordAccess(PatternID id);

    /// @return true if the pattern was removed from its tier and the index
    bool Remove(PatternID id);

    // ========================================================================
    // Maintenance
    // ========================================================================

    /// Flush due retries, then run one migration cycle
    MigrationReport Migrate();

    /// Merge near-duplicates across every tier
    DeduplicationSummary Deduplicate();

    /// Compare the index with the placement table; rebuild it from a tier
    /// scan if they disagree or the tree is malformed
    ConsistencyReport CheckConsistency();

    /// Run one cache warming cycle
    CacheWarmer::WarmReport WarmCache();

    /// Periodic migration and warming on background threads
    void StartBackground();
    void StopBackground();

    // ========================================================================
    // Aggregates
    // ========================================================================

    /// Built-in aggregate views, served through the materializer
    ///
    ///   category_distribution  queryable patterns per category
    ///   tier_distribution      placed patterns per tier
    ///   complexity_hotspots    mean complexity per category
    ///                          (param min_complexity filters categories)
    ///
    /// A "category" param restricts category_distribution and
    /// complexity_hotspots to one category.
    ///
    /// Tiers that cannot be scanned are left out of the counts.
    ///
    /// @return nullopt for an unknown view name
    /// @throws std::invalid_argument if min_complexity is not a number
    std::optional<AggregateResult> Aggregate(const std::string& name, const QueryParams& params = {});

    /// Compute a view now and keep it until its TTL or an invalidating write
    std::optional<AggregateResult> MaterializeAggregate(const std::string& name,
                                                        const QueryParams& params = {},
                                                        bool critical = false);

    // ========================================================================
    // Statistics
    // ========================================================================

    EngineStats Stats() const;

    const EngineConfig& GetConfig() const { return config_; }

    const CoordinateHasher& GetHasher() const { return hasher_; }

    const SpatialIndex& GetIndex() const { return index_; }

    /// Current adaptive query context
    QueryContext GetQueryContext() const;

private:
    struct TierFetch {
        StorageTier tier{StorageTier::STANDARD};
        bool ok{true};
        std::vector<Pattern> patterns;
        size_t missing{0};
    };

    std::optional<Pattern> LoadPattern(PatternID id);
    void PrepareForStore(Pattern& pattern, const Timestamp& now) const;
    std::optional<Pattern> FindDuplicateLocked(const Pattern& pattern);
    StoreResult MergeIntoLocked(const Pattern& incoming, const Pattern& existing);
    void IndexWritten(const std::vector<Pattern>& patterns);
    void InvalidatePatternViews(const std::string& category);
    void DropColdCacheEntries(const MigrationReport& report);
    ConsistencyReport CheckConsistencyLocked();
    void RecordQuery(const QueryIntent& intent, bool hit, std::chrono::microseconds elapsed);
    void ApplyRetries(const RetryOutcome& outcome);
    std::vector<TierFetch> FetchTiers(const std::vector<std::pair<StorageTier, std::vector<PatternID>>>& groups);
    std::optional<AggregateResult> ComputeAggregate(const std::string& name, const QueryParams& params);
    std::optional<std::set<std::string>> AggregateDependencies(const std::string& name,
                                                               const QueryParams& params) const;

    static TierFetch FetchFromTier(QualityTierRouter& router, StorageTier tier,
                                   const std::vector<PatternID>& ids);

    EngineConfig config_;
    Clock clock_;
    std::shared_ptr<spdlog::logger> logger_;

    CoordinateHasher hasher_;
    SpatialIndex index_;
    ProbabilityFieldEngine field_engine_;
    std::shared_ptr<QualityTierRouter> router_;    ///< Shared with in-flight pool tasks
    std::unique_ptr<TierMigrator> migrator_;
    std::unique_ptr<Deduplicator> deduplicator_;
    HotCache hot_cache_;
    std::unique_ptr<CacheWarmer> warmer_;
    QueryMaterializer materializer_;
    std::shared_ptr<WorkerPool> pool_;

    std::mutex write_mutex_;            ///< Serializes index/tier mutations

    mutable std::mutex context_mutex_;
    QueryContext context_;

    std::atomic<uint64_t> stores_{0};
    std::atomic<uint64_t> queries_{0};
    std::atomic<uint64_t> degraded_queries_{0};
    std::atomic<uint64_t> index_rebuilds_{0};
};

} // namespace dpcm
