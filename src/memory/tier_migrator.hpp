// File: src/memory/tier_migrator.hpp
//
// Periodic tier migration
//
// A cycle walks the placement table in batches, re-scores every pattern
// whose access stats changed or whose last evaluation is older than
// rescore_interval, and moves it to the tier its new score maps to.
// Patterns that entered their tier less than min_residency ago stay put, so
// a pattern whose score hovers around a band edge does not bounce between
// tiers every cycle.
//
// The router is only touched one pattern at a time and the cycle yields
// between batches.

#pragma once

#include "core/types.hpp"
#include "memory/quality_tier_router.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace dpcm {

/// One tier transition
struct MigrationRecord {
    PatternID id;
    StorageTier from{StorageTier::REJECTED};
    StorageTier to{StorageTier::REJECTED};
    double old_score{0.0};
    double new_score{0.0};
    Timestamp at;

    bool IsPromotion() const { return IsBetterTier(to, from); }
};

/// Result of one migration cycle
struct MigrationReport {
    size_t evaluated{0};
    size_t promoted{0};
    size_t demoted{0};
    size_t unchanged{0};
    size_t held{0};             ///< Move suppressed by minimum residency
    size_t errors{0};
    uint64_t cycles{0};         ///< Total cycles run, including this one
    std::chrono::milliseconds duration{0};
    std::vector<PatternID> demoted_ids;
};

class TierMigrator {
public:
    struct Config {
        size_t batch_size{100};
        std::chrono::milliseconds batch_yield{1};
        double rescore_interval_hours{1.0};
        double min_residency_hours{24.0};
        size_t history_limit{1000};
        std::chrono::milliseconds cycle_interval{60000};   ///< Background period

        bool IsValid() const;
    };

    struct Stats {
        uint64_t cycles{0};
        uint64_t promoted{0};
        uint64_t demoted{0};
        uint64_t unchanged{0};
        uint64_t errors{0};
        Timestamp last_cycle;
        std::chrono::milliseconds last_duration{0};
    };

    using CycleCallback = std::function<void(const MigrationReport&)>;

    TierMigrator(QualityTierRouter& router,
                 const Config& config,
                 Clock clock = SystemClock(),
                 std::shared_ptr<spdlog::logger> logger = nullptr);

    ~TierMigrator();

    TierMigrator(const TierMigrator&) = delete;
    TierMigrator& operator=(const TierMigrator&) = delete;

    /// Run one cycle now
    MigrationReport RunCycle();

    /// Start periodic cycles on a background thread
    ///
    /// @param on_cycle Invoked after each background cycle
    void Start(CycleCallback on_cycle = nullptr);

    void Stop();

    bool IsRunning() const { return running_.load(); }

    /// Most recent transitions, oldest first
    std::vector<MigrationRecord> GetHistory() const;

    Stats GetStats() const;

    const Config& GetConfig() const { return config_; }

private:
    bool NeedsRescore(const Placement& placement, const Timestamp& now) const;
    void Record(const MigrationRecord& record);
    void BackgroundLoop(CycleCallback on_cycle);

    QualityTierRouter& router_;
    Config config_;
    Clock clock_;
    std::shared_ptr<spdlog::logger> logger_;

    std::mutex cycle_mutex_;            ///< One cycle at a time

    mutable std::mutex history_mutex_;
    std::deque<MigrationRecord> history_;
    Stats stats_;

    std::unique_ptr<std::thread> background_thread_;
    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
};

} // namespace dpcm
