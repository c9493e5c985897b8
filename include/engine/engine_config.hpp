// File: include/engine/engine_config.hpp
//
// YAML Configuration Support for the DPCM memory engine
// Aggregates the settings of every engine component

#ifndef DPCM_ENGINE_CONFIG_HPP
#define DPCM_ENGINE_CONFIG_HPP

#include "concurrency/worker_pool.hpp"
#include "core/logging.hpp"
#include "core/types.hpp"
#include "memory/cache_warmer.hpp"
#include "memory/deduplicator.hpp"
#include "memory/quality_scorer.hpp"
#include "memory/quality_tier_router.hpp"
#include "memory/query_materializer.hpp"
#include "memory/tier_migrator.hpp"
#include "query/probability_field.hpp"
#include "spatial/coordinate_hasher.hpp"
#include "spatial/spatial_index.hpp"
#include "storage/sqlite_tier_store.hpp"
#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace dpcm {

/// Which backend serves each tier, and where SQLite files go
struct StorageConfig {
    /// Default backend for every tier: "memory" or "sqlite"
    std::string backend = "memory";

    /// Per-tier override, indexed by StorageTier; empty = use `backend`
    std::array<std::string, kStorageTierCount> tier_backends{};

    /// Directory holding one <file_prefix>_<tier>.db per SQLite tier
    std::string directory = ".";
    std::string file_prefix = "dpcm";

    /// Connection settings shared by every SQLite tier (db_path is filled per tier)
    SqliteTierStore::Config sqlite;

    std::string BackendFor(StorageTier tier) const;

    std::string PathFor(StorageTier tier) const;
};

/// Configuration structure for the DPCM memory engine
struct EngineConfig {
    // === Facade Settings ===
    struct Engine {
        bool dedup_on_store = true;                          // Merge near-identical patterns on ingest
        size_t hot_cache_capacity = 1000;                    // Patterns kept in the hot LRU cache
        std::chrono::milliseconds tier_fetch_timeout{1000};  // Per-tier budget when fetching through the pool
        size_t recent_query_window = 20;                     // Queries remembered for field adaptation
        bool use_worker_pool = false;                        // Fetch tiers in parallel on a WorkerPool
        bool check_consistency_on_migrate = true;
    } engine;

    // === Component Settings ===
    CoordinateHasher::Config hasher;
    SpatialIndex::Config index;
    ProbabilityFieldEngine::Config field;
    QualityScorer::Config quality;
    QualityTierRouter::Config router;
    TierMigrator::Config migration;
    Deduplicator::Config dedup;
    CacheWarmer::Config warmer;
    QueryMaterializer::Config materializer;
    WorkerPool::Config workers;

    // === Infrastructure ===
    StorageConfig storage;
    logging::LoggingConfig logging;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @param errors Receives parse and validation errors, if non-null
    /// @return EngineConfig if successful, std::nullopt on error
    static std::optional<EngineConfig> LoadFromFile(const std::string& filepath,
                                                    std::vector<std::string>* errors = nullptr);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @param errors Receives parse and validation errors, if non-null
    /// @return EngineConfig if successful, std::nullopt on error
    static std::optional<EngineConfig> LoadFromString(const std::string& yaml_content,
                                                      std::vector<std::string>* errors = nullptr);

    /// Save configuration to YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// Convert to YAML string
    std::string ToYamlString() const;

    /// Validate configuration values
    bool Validate() const;

    /// Get validation errors (if any)
    std::vector<std::string> GetValidationErrors() const;

    /// Create default configuration
    static EngineConfig Default();
};

} // namespace dpcm

#endif // DPCM_ENGINE_CONFIG_HPP
