// File: src/storage/sqlite_tier_store.hpp
#pragma once

#include "storage/tier_store.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <sqlite3.h>

namespace dpcm {

/// SQLite-backed tier store
///
/// One table per database file. The coordinate, category and access stats
/// are stored in their own columns so Scan can filter in SQL; the full
/// pattern is stored as a serialized blob.
///
/// Every SQLite failure surfaces as TierUnavailableError.
class SqliteTierStore : public ITierStore {
public:
    struct Config {
        /// Path to the SQLite database file (":memory:" for a private in-memory db)
        std::string db_path;

        /// Enable Write-Ahead Logging for better concurrency
        bool enable_wal{true};

        /// Cache size in KB (default: 10MB)
        size_t cache_size_kb{10240};

        /// Milliseconds to wait on a locked database
        int busy_timeout_ms{5000};

        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"NORMAL"};

        bool IsValid() const;
    };

    /// @throws std::invalid_argument if config is invalid
    /// @throws TierUnavailableError if the database cannot be opened
    SqliteTierStore(StorageTier tier, const Config& config);
    ~SqliteTierStore() override;

    SqliteTierStore(const SqliteTierStore&) = delete;
    SqliteTierStore& operator=(const SqliteTierStore&) = delete;

    void Put(const Pattern& pattern) override;
    void PutBatch(const std::vector<Pattern>& patterns) override;
    std::optional<Pattern> Get(PatternID id) override;
    bool Delete(PatternID id) override;
    std::vector<Pattern> Scan(const ScanFilter& filter) override;
    size_t Count() override;

    StorageTier GetTier() const override { return tier_; }
    std::string GetName() const override;

    /// Reclaim free pages
    void Compact();

    const Config& GetConfig() const { return config_; }

private:
    void InitializeDatabase();
    void ExecuteSQL(const std::string& sql);
    void PutLocked(const Pattern& pattern);
    [[noreturn]] void Fail(const std::string& what) const;

    StorageTier tier_;
    Config config_;
    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;

    std::atomic<uint64_t> total_reads_{0};
    std::atomic<uint64_t> total_writes_{0};
};

} // namespace dpcm
