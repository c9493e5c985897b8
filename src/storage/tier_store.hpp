// File: src/storage/tier_store.hpp
//
// Storage tier backend interface
//
// Each StorageTier is backed by one ITierStore. The router talks to stores
// only through this interface and never branches on the concrete backend.
//
// Error contract: a backend that cannot complete an operation throws
// TierUnavailableError. A missing id is not an error (nullopt / false).

#pragma once

#include "core/coordinate.hpp"
#include "core/pattern.hpp"
#include "core/types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dpcm {

/// Predicate for ITierStore::Scan
///
/// Empty members match everything. `limit` of 0 means no limit.
struct ScanFilter {
    std::optional<std::string> category;        ///< Compared after NormalizeCategory
    std::optional<BoundingBox> region;
    std::optional<Timestamp> accessed_before;   ///< last_accessed strictly earlier
    size_t limit{0};

    bool Matches(const Pattern& pattern) const;

    static ScanFilter All() { return ScanFilter{}; }
};

/// Abstract backend for one storage tier
class ITierStore {
public:
    virtual ~ITierStore() = default;

    /// Insert or replace the record for pattern.id
    ///
    /// @throws TierUnavailableError if the backend cannot write
    virtual void Put(const Pattern& pattern) = 0;

    /// Insert or replace several records
    ///
    /// Either every record is written or none is.
    ///
    /// @throws TierUnavailableError if the backend cannot write
    virtual void PutBatch(const std::vector<Pattern>& patterns) = 0;

    /// @return Record, or nullopt if absent
    /// @throws TierUnavailableError if the backend cannot read
    virtual std::optional<Pattern> Get(PatternID id) = 0;

    /// @return true if a record was removed
    /// @throws TierUnavailableError if the backend cannot write
    virtual bool Delete(PatternID id) = 0;

    /// Records matching `filter`, ordered by id
    ///
    /// @throws TierUnavailableError if the backend cannot read
    virtual std::vector<Pattern> Scan(const ScanFilter& filter) = 0;

    /// @throws TierUnavailableError if the backend cannot read
    virtual size_t Count() = 0;

    virtual StorageTier GetTier() const = 0;

    virtual std::string GetName() const = 0;
};

// ============================================================================
// Factory Functions
// ============================================================================

/// In-memory store for `tier`
std::unique_ptr<ITierStore> CreateMemoryTierStore(StorageTier tier);

/// SQLite-backed store for `tier` at `db_path`
///
/// @throws TierUnavailableError if the database cannot be opened
std::unique_ptr<ITierStore> CreateSqliteTierStore(StorageTier tier, const std::string& db_path);

} // namespace dpcm
