// File: src/memory/cache_warmer.hpp
//
// Access tracking and hot-cache warming
//
// AccessTracker keeps per-pattern access counts plus hour-of-day and
// day-of-week histograms. CacheWarmer turns those into warming candidates
// with three strategies and loads the winners into the hot LRU cache that
// sits in front of the premium tier:
//
//   time-based  patterns usually accessed in the current hour
//   frequency   most accessed patterns overall
//   predictive  patterns likely to be accessed in the next hour
//
// Candidates are ranked by priority, then strategy score, and loaded in
// small batches.

#pragma once

#include "core/pattern.hpp"
#include "core/types.hpp"
#include "storage/lru_cache.hpp"
#include <spdlog/spdlog.h>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace dpcm {

using HotCache = LRUCache<PatternID, Pattern>;

/// Hour of day (0-23, UTC) of a timestamp
int HourOfDay(const Timestamp& t);

/// Day of week (0 = Sunday, UTC) of a timestamp
int DayOfWeek(const Timestamp& t);

class AccessTracker {
public:
    struct Profile {
        uint64_t count{0};
        Timestamp first_access;
        Timestamp last_access;
        std::array<uint32_t, 24> by_hour{};
        std::array<uint32_t, 7> by_day{};
        std::deque<Timestamp> recent;      ///< Most recent accesses, bounded
    };

    /// @param max_recent Accesses kept per pattern for interval estimates
    explicit AccessTracker(size_t max_recent = 168);

    void RecordAccess(PatternID id, const Timestamp& at);

    void Forget(PatternID id);

    std::optional<Profile> GetProfile(PatternID id) const;

    /// Snapshot of every tracked profile
    std::vector<std::pair<PatternID, Profile>> Snapshot() const;

    size_t Size() const;

    void Clear();

private:
    size_t max_recent_;
    mutable std::mutex mutex_;
    std::unordered_map<PatternID, Profile> profiles_;
};

class CacheWarmer {
public:
    enum class Priority : uint8_t {
        NORMAL = 0,
        HIGH = 1,
        CRITICAL = 2,
    };

    enum class Strategy : uint8_t {
        TIME_BASED = 0,
        FREQUENCY = 1,
        PREDICTIVE = 2,
    };

    struct Candidate {
        PatternID id;
        Strategy strategy{Strategy::FREQUENCY};
        Priority priority{Priority::NORMAL};
        double score{0.0};
    };

    struct Config {
        size_t time_based_limit{50};
        size_t frequency_limit{30};
        size_t predictive_limit{40};
        double predictive_min_confidence{0.3};
        double high_priority_share{0.5};        ///< Share of accesses in the slot
        uint64_t critical_access_count{100};
        uint64_t high_access_count{20};
        size_t max_per_cycle{100};
        size_t batch_size{10};
        std::chrono::milliseconds batch_yield{1};
        std::chrono::milliseconds cycle_interval{300000};   ///< Background period
        size_t max_recent_accesses{168};

        bool IsValid() const;
    };

    struct WarmReport {
        size_t candidates{0};
        size_t warmed{0};
        size_t already_cached{0};
        size_t failed{0};
        std::chrono::milliseconds duration{0};
    };

    struct Stats {
        uint64_t patterns_warmed{0};
        uint64_t cycles{0};
        std::chrono::milliseconds total_time{0};
        size_t tracked_patterns{0};
        size_t cache_size{0};
        double cache_hit_rate{0.0};
    };

    /// Loads a pattern from its tier; nullopt if missing or unreachable
    using Loader = std::function<std::optional<Pattern>(PatternID)>;

    CacheWarmer(HotCache& cache,
                Loader loader,
                const Config& config,
                Clock clock = SystemClock(),
                std::shared_ptr<spdlog::logger> logger = nullptr);

    ~CacheWarmer();

    CacheWarmer(const CacheWarmer&) = delete;
    CacheWarmer& operator=(const CacheWarmer&) = delete;

    void RecordAccess(PatternID id);

    /// Stop tracking a pattern and drop it from the cache
    void Forget(PatternID id);

    /// Ranked, de-duplicated candidates for the current time
    std::vector<Candidate> SelectCandidates() const;

    /// Run one warming cycle
    WarmReport WarmCache();

    void Start();
    void Stop();
    bool IsRunning() const { return running_.load(); }

    Stats GetStats() const;

    const AccessTracker& GetTracker() const { return tracker_; }

    const Config& GetConfig() const { return config_; }

private:
    Priority FrequencyPriority(uint64_t count) const;
    void BackgroundLoop();

    HotCache& cache_;
    Loader loader_;
    Config config_;
    Clock clock_;
    std::shared_ptr<spdlog::logger> logger_;
    AccessTracker tracker_;

    std::mutex warm_mutex_;
    std::atomic<uint64_t> patterns_warmed_{0};
    std::atomic<uint64_t> cycles_{0};
    std::atomic<int64_t> total_time_ms_{0};

    std::unique_ptr<std::thread> background_thread_;
    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
};

const char* ToString(CacheWarmer::Priority priority);
const char* ToString(CacheWarmer::Strategy strategy);

} // namespace dpcm
