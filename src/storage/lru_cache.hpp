// File: src/storage/lru_cache.hpp
#pragma once

#include <atomic>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace dpcm {

/// Bounded least-recently-used cache
///
/// O(1) Get/Put/Remove behind a single mutex. Used as the hot set in front
/// of the premium tier: the cache warmer fills it, queries read through it.
///
/// @tparam Key Hashable key type
/// @tparam Value Copyable value type
template<typename Key, typename Value>
class LRUCache {
public:
    struct Stats {
        size_t size{0};
        size_t capacity{0};
        uint64_t hits{0};
        uint64_t misses{0};
        uint64_t evictions{0};
        double hit_rate{0.0};
        double utilization{0.0};   ///< size / capacity
    };

    /// @param capacity Maximum entries (0 is treated as 1)
    explicit LRUCache(size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    /// Lookup and mark as most recently used
    std::optional<Value> Get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = index_.find(key);
        if (it == index_.end()) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }
        hits_.fetch_add(1, std::memory_order_relaxed);
        items_.splice(items_.begin(), items_, it->second);
        return it->second->second;
    }

    /// Lookup without touching recency or hit counters
    std::optional<Value> Peek(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return std::nullopt;
        }
        return it->second->second;
    }

    /// Insert or refresh an entry
    ///
    /// @return Key evicted to make room, if any
    std::optional<Key> Put(const Key& key, const Value& value) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = value;
            items_.splice(items_.begin(), items_, it->second);
            return std::nullopt;
        }

        std::optional<Key> evicted;
        if (items_.size() >= capacity_) {
            evicted = items_.back().first;
            index_.erase(items_.back().first);
            items_.pop_back();
            evictions_.fetch_add(1, std::memory_order_relaxed);
        }

        items_.emplace_front(key, value);
        index_[key] = items_.begin();
        return evicted;
    }

    /// @return true if the key was cached
    bool Remove(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        items_.erase(it->second);
        index_.erase(it);
        return true;
    }

    /// Drop every entry and reset counters
    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.clear();
        index_.clear();
        hits_.store(0, std::memory_order_relaxed);
        misses_.store(0, std::memory_order_relaxed);
        evictions_.store(0, std::memory_order_relaxed);
    }

    bool Contains(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.find(key) != index_.end();
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t Capacity() const { return capacity_; }

    /// Keys from most to least recently used
    std::vector<Key> Keys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Key> keys;
        keys.reserve(items_.size());
        for (const auto& item : items_) {
            keys.push_back(item.first);
        }
        return keys;
    }

    Stats GetStats() const {
        std::lock_guard<std::mutex> lock(mutex_);

        Stats stats;
        stats.size = items_.size();
        stats.capacity = capacity_;
        stats.hits = hits_.load(std::memory_order_relaxed);
        stats.misses = misses_.load(std::memory_order_relaxed);
        stats.evictions = evictions_.load(std::memory_order_relaxed);
        uint64_t total = stats.hits + stats.misses;
        stats.hit_rate = total == 0 ? 0.0 : static_cast<double>(stats.hits) / static_cast<double>(total);
        stats.utilization = static_cast<double>(stats.size) / static_cast<double>(capacity_);
        return stats;
    }

private:
    using Item = std::pair<Key, Value>;

    size_t capacity_;

    // Front = most recently used
    std::list<Item> items_;
    std::unordered_map<Key, typename std::list<Item>::iterator> index_;

    mutable std::mutex mutex_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
};

} // namespace dpcm
