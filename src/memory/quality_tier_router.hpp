// File: src/memory/quality_tier_router.hpp
//
// Quality-based tier placement
//
// The router owns one ITierStore per StorageTier and a placement table
// recording which tier holds each pattern, the score it was placed with and
// when. Backend failures never escape: every TierUnavailableError is caught
// here and reported as TierStatus::UNAVAILABLE.
//
// Writes that fail because a tier is unavailable are queued and retried
// with exponential backoff by ProcessRetries(). A queued pattern is not
// placed (and not visible) until a retry succeeds.

#pragma once

#include "core/pattern.hpp"
#include "core/types.hpp"
#include "memory/quality_scorer.hpp"
#include "storage/tier_store.hpp"
#include <spdlog/spdlog.h>
#include <array>
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace dpcm {

/// Outcome of a single tier call
enum class TierStatus : uint8_t {
    OK = 0,
    NOT_FOUND = 1,
    UNAVAILABLE = 2,
};

const char* ToString(TierStatus status);

/// Where a pattern lives
struct Placement {
    StorageTier tier{StorageTier::REJECTED};
    double score{0.0};          ///< Score at last evaluation
    Timestamp evaluated_at;     ///< Last scoring
    Timestamp tier_since;       ///< Entered current tier
    bool dirty{false};          ///< Access stats changed since evaluation
};

/// Result of placing one pattern
struct PlacementResult {
    PatternID id;
    TierStatus status{TierStatus::OK};
    StorageTier tier{StorageTier::REJECTED};
    double score{0.0};
    bool queued{false};         ///< Write failed and was queued for retry
};

/// Result of reading one pattern
struct FetchResult {
    TierStatus status{TierStatus::NOT_FOUND};
    std::optional<Pattern> pattern;
    std::optional<StorageTier> tier;
};

/// Result of ProcessRetries
struct RetryOutcome {
    std::vector<Pattern> written;       ///< Now placed; caller should index these
    std::vector<PatternID> dropped;     ///< Gave up after max attempts
    size_t pending{0};
};

class QualityTierRouter {
public:
    struct Config {
        size_t max_retry_attempts{5};
        int64_t retry_base_backoff_ms{100};
        int64_t retry_max_backoff_ms{30000};
        size_t max_pending_writes{10000};

        bool IsValid() const;
    };

    using TierStores = std::array<std::unique_ptr<ITierStore>, kStorageTierCount>;

    /// @param stores One store per tier, indexed by static_cast<size_t>(StorageTier)
    /// @throws std::invalid_argument if a store is missing, a store reports the
    ///         wrong tier, or config is invalid
    QualityTierRouter(TierStores stores,
                      const QualityScorer::Config& scoring,
                      const Config& config,
                      std::shared_ptr<spdlog::logger> logger = nullptr);

    // ========================================================================
    // Placement
    // ========================================================================

    /// Score a pattern and write it to its tier
    ///
    /// Replaces any previous placement of the same id.
    PlacementResult StorePattern(const Pattern& pattern, const Timestamp& now);

    /// Score and write several patterns, grouped into one batch per tier
    ///
    /// A failing tier queues its group for retry; other groups are unaffected.
    std::vector<PlacementResult> StorePatterns(const std::vector<Pattern>& patterns,
                                               const Timestamp& now);

    /// Rewrite a pattern in its current tier (access stats, merged content)
    ///
    /// Marks the placement dirty so the next migration cycle re-scores it.
    TierStatus UpdatePattern(const Pattern& pattern);

    /// Remove a pattern from its tier and the placement table
    TierStatus RemovePattern(PatternID id);

    /// Move a pattern to another tier with a new score
    ///
    /// Writes the target before deleting the source. If the source delete
    /// fails the target copy is removed again.
    TierStatus MovePattern(PatternID id, StorageTier to, double score, const Timestamp& now);

    /// Record a re-evaluation that did not change the tier
    void TouchPlacement(PatternID id, double score, const Timestamp& now);

    void MarkDirty(PatternID id);

    // ========================================================================
    // Reads
    // ========================================================================

    FetchResult FetchPattern(PatternID id);

    std::optional<Placement> GetPlacement(PatternID id) const;

    /// Snapshot of the placement table, ordered by id
    std::vector<std::pair<PatternID, Placement>> Placements() const;

    std::vector<PatternID> PatternsInTier(StorageTier tier) const;

    /// Scan one tier through its store
    std::pair<TierStatus, std::vector<Pattern>> ScanTier(StorageTier tier, const ScanFilter& filter);

    /// Placed pattern count per tier
    std::array<size_t, kStorageTierCount> TierCounts() const;

    size_t PlacedCount() const;

    // ========================================================================
    // Recovery
    // ========================================================================

    /// Rebuild the placement table by scanning every tier
    ///
    /// @return Patterns found, for re-indexing; tiers that fail are skipped
    ///         and reported through `unavailable`
    std::vector<Pattern> Recover(const Timestamp& now, std::vector<StorageTier>* unavailable = nullptr);

    /// Retry queued writes whose backoff has elapsed
    RetryOutcome ProcessRetries(const Timestamp& now);

    size_t PendingWrites() const;

    /// Tiers whose most recent call failed
    std::vector<StorageTier> UnavailableTiers() const;

    // ========================================================================
    // Statistics
    // ========================================================================

    struct Stats {
        uint64_t writes{0};
        uint64_t reads{0};
        uint64_t moves{0};
        uint64_t failures{0};
        uint64_t retries_succeeded{0};
        uint64_t retries_dropped{0};
    };

    Stats GetStats() const;

    const QualityScorer& GetScorer() const { return scorer_; }

    const Config& GetConfig() const { return config_; }

private:
    struct PendingWrite {
        Pattern pattern;
        StorageTier tier;
        double score;
        size_t attempts;
        Timestamp next_attempt;
    };

    ITierStore& Store(StorageTier tier) const;
    void MarkAvailability(StorageTier tier, bool available);
    void Enqueue(const Pattern& pattern, StorageTier tier, double score, const Timestamp& now);
    Timestamp NextAttempt(size_t attempts, const Timestamp& now) const;
    void SetPlacementLocked(PatternID id, StorageTier tier, double score, const Timestamp& now);

    TierStores stores_;
    QualityScorer scorer_;
    Config config_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<PatternID, Placement> placements_;

    mutable std::mutex retry_mutex_;
    std::deque<PendingWrite> pending_;

    std::array<std::atomic<bool>, kStorageTierCount> available_;

    std::atomic<uint64_t> writes_{0};
    std::atomic<uint64_t> reads_{0};
    std::atomic<uint64_t> moves_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> retries_succeeded_{0};
    std::atomic<uint64_t> retries_dropped_{0};
};

} // namespace dpcm
