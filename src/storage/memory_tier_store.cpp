// File: src/storage/memory_tier_store.cpp
#include "storage/memory_tier_store.hpp"
#include "spatial/coordinate_hasher.hpp"
#include <mutex>

namespace dpcm {

// ============================================================================
// ScanFilter
// ============================================================================

bool ScanFilter::Matches(const Pattern& pattern) const {
    if (category &&
        CoordinateHasher::NormalizeCategory(*category) !=
            CoordinateHasher::NormalizeCategory(pattern.profile.category)) {
        return false;
    }
    if (region && !region->Contains(pattern.coordinate)) {
        return false;
    }
    if (accessed_before && !(pattern.access.last_accessed < *accessed_before)) {
        return false;
    }
    return true;
}

// ============================================================================
// MemoryTierStore
// ============================================================================

MemoryTierStore::MemoryTierStore(StorageTier tier)
    : tier_(tier) {}

std::string MemoryTierStore::GetName() const {
    return std::string("memory:") + ToString(tier_);
}

void MemoryTierStore::Put(const Pattern& pattern) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    patterns_[pattern.id] = pattern;
    writes_.fetch_add(1, std::memory_order_relaxed);
}

void MemoryTierStore::PutBatch(const std::vector<Pattern>& patterns) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (const auto& p : patterns) {
        patterns_[p.id] = p;
    }
    writes_.fetch_add(patterns.size(), std::memory_order_relaxed);
}

std::optional<Pattern> MemoryTierStore::Get(PatternID id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    reads_.fetch_add(1, std::memory_order_relaxed);
    auto it = patterns_.find(id);
    if (it == patterns_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryTierStore::Delete(PatternID id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    bool removed = patterns_.erase(id) > 0;
    if (removed) {
        writes_.fetch_add(1, std::memory_order_relaxed);
    }
    return removed;
}

std::vector<Pattern> MemoryTierStore::Scan(const ScanFilter& filter) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    reads_.fetch_add(1, std::memory_order_relaxed);

    std::vector<Pattern> result;
    for (const auto& [id, pattern] : patterns_) {
        if (filter.Matches(pattern)) {
            result.push_back(pattern);
            if (filter.limit > 0 && result.size() >= filter.limit) {
                break;
            }
        }
    }
    return result;
}

size_t MemoryTierStore::Count() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return patterns_.size();
}

size_t MemoryTierStore::EstimateMemoryUsage() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    size_t total = sizeof(*this);
    for (const auto& [id, pattern] : patterns_) {
        total += sizeof(id) + pattern.EstimateSize();
    }
    return total;
}

std::unique_ptr<ITierStore> CreateMemoryTierStore(StorageTier tier) {
    return std::make_unique<MemoryTierStore>(tier);
}

} // namespace dpcm
