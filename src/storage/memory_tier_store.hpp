// File: src/storage/memory_tier_store.hpp
#pragma once

#include "storage/tier_store.hpp"
#include <atomic>
#include <map>
#include <shared_mutex>

namespace dpcm {

/// RAM-resident tier store
///
/// Records are kept in an ordered map so Scan returns them by id without a
/// sort. Reads take a shared lock, writes an exclusive one.
class MemoryTierStore : public ITierStore {
public:
    explicit MemoryTierStore(StorageTier tier);
    ~MemoryTierStore() override = default;

    void Put(const Pattern& pattern) override;
    void PutBatch(const std::vector<Pattern>& patterns) override;
    std::optional<Pattern> Get(PatternID id) override;
    bool Delete(PatternID id) override;
    std::vector<Pattern> Scan(const ScanFilter& filter) override;
    size_t Count() override;

    StorageTier GetTier() const override { return tier_; }
    std::string GetName() const override;

    /// Approximate bytes held
    size_t EstimateMemoryUsage() const;

    uint64_t GetReadCount() const { return reads_.load(std::memory_order_relaxed); }
    uint64_t GetWriteCount() const { return writes_.load(std::memory_order_relaxed); }

private:
    StorageTier tier_;
    std::map<PatternID, Pattern> patterns_;
    mutable std::shared_mutex mutex_;

    mutable std::atomic<uint64_t> reads_{0};
    std::atomic<uint64_t> writes_{0};
};

} // namespace dpcm
