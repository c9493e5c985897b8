// File: src/memory/quality_tier_router.cpp
#include "memory/quality_tier_router.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <chrono>
#include <map>
#include <stdexcept>

namespace dpcm {

const char* ToString(TierStatus status) {
    switch (status) {
        case TierStatus::OK: return "ok";
        case TierStatus::NOT_FOUND: return "not_found";
        case TierStatus::UNAVAILABLE: return "unavailable";
        default: return "unknown";
    }
}

bool QualityTierRouter::Config::IsValid() const {
    return retry_base_backoff_ms > 0 &&
           retry_max_backoff_ms >= retry_base_backoff_ms &&
           max_pending_writes > 0;
}

// ============================================================================
// Construction
// ============================================================================

QualityTierRouter::QualityTierRouter(TierStores stores,
                                     const QualityScorer::Config& scoring,
                                     const Config& config,
                                     std::shared_ptr<spdlog::logger> logger)
    : stores_(std::move(stores)),
      scorer_(scoring),
      config_(config),
      logger_(logging::OrNull(std::move(logger), "tier_router")) {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid QualityTierRouter configuration");
    }
    for (size_t i = 0; i < kStorageTierCount; ++i) {
        if (!stores_[i]) {
            throw std::invalid_argument(std::string("Missing store for tier ") +
                                        ToString(static_cast<StorageTier>(i)));
        }
        if (stores_[i]->GetTier() != static_cast<StorageTier>(i)) {
            throw std::invalid_argument("Store " + stores_[i]->GetName() + " registered under wrong tier");
        }
        available_[i].store(true, std::memory_order_relaxed);
    }
}

ITierStore& QualityTierRouter::Store(StorageTier tier) const {
    return *stores_[static_cast<size_t>(tier)];
}

void QualityTierRouter::MarkAvailability(StorageTier tier, bool available) {
    bool was = available_[static_cast<size_t>(tier)].exchange(available, std::memory_order_relaxed);
    if (was && !available) {
        logger_->warn("Tier {} became unavailable", ToString(tier));
    } else if (!was && available) {
        logger_->info("Tier {} available again", ToString(tier));
    }
}

void QualityTierRouter::SetPlacementLocked(PatternID id, StorageTier tier, double score,
                                           const Timestamp& now) {
    Placement& p = placements_[id];
    if (p.tier != tier || p.tier_since.IsZero()) {
        p.tier_since = now;
    }
    p.tier = tier;
    p.score = score;
    p.evaluated_at = now;
    p.dirty = false;
}

// ============================================================================
// Placement
// ============================================================================

PlacementResult QualityTierRouter::StorePattern(const Pattern& pattern, const Timestamp& now) {
    QualityBreakdown quality = scorer_.Score(pattern, now);
    StorageTier tier = scorer_.TierFor(quality.score);

    PlacementResult result;
    result.id = pattern.id;
    result.tier = tier;
    result.score = quality.score;

    std::unique_lock<std::shared_mutex> lock(mutex_);

    try {
        Store(tier).Put(pattern);
        MarkAvailability(tier, true);
        writes_.fetch_add(1, std::memory_order_relaxed);
    } catch (const TierUnavailableError& e) {
        MarkAvailability(tier, false);
        failures_.fetch_add(1, std::memory_order_relaxed);
        logger_->warn("Write of {} to {} failed, queued for retry: {}",
                      pattern.id.ToString(), ToString(tier), e.what());
        lock.unlock();
        Enqueue(pattern, tier, quality.score, now);
        result.status = TierStatus::UNAVAILABLE;
        result.queued = true;
        return result;
    }

    // Drop a stale copy left in another tier
    auto it = placements_.find(pattern.id);
    if (it != placements_.end() && it->second.tier != tier) {
        StorageTier old_tier = it->second.tier;
        try {
            Store(old_tier).Delete(pattern.id);
        } catch (const TierUnavailableError& e) {
            MarkAvailability(old_tier, false);
            failures_.fetch_add(1, std::memory_order_relaxed);
            logger_->warn("Stale copy of {} left in {}: {}", pattern.id.ToString(),
                          ToString(old_tier), e.what());
        }
    }

    SetPlacementLocked(pattern.id, tier, quality.score, now);
    return result;
}

std::vector<PlacementResult> QualityTierRouter::StorePatterns(const std::vector<Pattern>& patterns,
                                                              const Timestamp& now) {
    std::vector<PlacementResult> results(patterns.size());
    std::map<StorageTier, std::vector<size_t>> groups;

    for (size_t i = 0; i < patterns.size(); ++i) {
        QualityBreakdown quality = scorer_.Score(patterns[i], now);
        results[i].id = patterns[i].id;
        results[i].score = quality.score;
        results[i].tier = scorer_.TierFor(quality.score);
        groups[results[i].tier].push_back(i);
    }

    std::vector<size_t> to_queue;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (const auto& [tier, members] : groups) {
            std::vector<Pattern> batch;
            batch.reserve(members.size());
            for (size_t i : members) {
                batch.push_back(patterns[i]);
            }

            try {
                Store(tier).PutBatch(batch);
                MarkAvailability(tier, true);
                writes_.fetch_add(batch.size(), std::memory_order_relaxed);
            } catch (const TierUnavailableError& e) {
                MarkAvailability(tier, false);
                failures_.fetch_add(1, std::memory_order_relaxed);
                logger_->warn("Batch write of {} patterns to {} failed, queued for retry: {}",
                              batch.size(), ToString(tier), e.what());
                to_queue.insert(to_queue.end(), members.begin(), members.end());
                continue;
            }

            for (size_t i : members) {
                auto it = placements_.find(patterns[i].id);
                if (it != placements_.end() && it->second.tier != tier) {
                    try {
                        Store(it->second.tier).Delete(patterns[i].id);
                    } catch (const TierUnavailableError& e) {
                        MarkAvailability(it->second.tier, false);
                        logger_->warn("Stale copy of {} left in {}: {}", patterns[i].id.ToString(),
                                      ToString(it->second.tier), e.what());
                    }
                }
                SetPlacementLocked(patterns[i].id, tier, results[i].score, now);
            }
        }
    }

    for (size_t i : to_queue) {
        Enqueue(patterns[i], results[i].tier, results[i].score, now);
        results[i].status = TierStatus::UNAVAILABLE;
        results[i].queued = true;
    }
    return results;
}

TierStatus QualityTierRouter::UpdatePattern(const Pattern& pattern) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = placements_.find(pattern.id);
    if (it == placements_.end()) {
        return TierStatus::NOT_FOUND;
    }
    StorageTier tier = it->second.tier;
    try {
        Store(tier).Put(pattern);
        MarkAvailability(tier, true);
        writes_.fetch_add(1, std::memory_order_relaxed);
    } catch (const TierUnavailableError& e) {
        MarkAvailability(tier, false);
        failures_.fetch_add(1, std::memory_order_relaxed);
        logger_->warn("Update of {} in {} failed: {}", pattern.id.ToString(), ToString(tier), e.what());
        return TierStatus::UNAVAILABLE;
    }
    it->second.dirty = true;
    return TierStatus::OK;
}

TierStatus QualityTierRouter::RemovePattern(PatternID id) {
    bool was_pending = false;
    {
        std::lock_guard<std::mutex> lock(retry_mutex_);
        auto before = pending_.size();
        pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                      [id](const PendingWrite& w) { return w.pattern.id == id; }),
                       pending_.end());
        was_pending = pending_.size() != before;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = placements_.find(id);
    if (it == placements_.end()) {
        return was_pending ? TierStatus::OK : TierStatus::NOT_FOUND;
    }

    StorageTier tier = it->second.tier;
    try {
        Store(tier).Delete(id);
        MarkAvailability(tier, true);
    } catch (const TierUnavailableError& e) {
        MarkAvailability(tier, false);
        failures_.fetch_add(1, std::memory_order_relaxed);
        logger_->warn("Delete of {} from {} failed: {}", id.ToString(), ToString(tier), e.what());
        return TierStatus::UNAVAILABLE;
    }
    placements_.erase(it);
    return TierStatus::OK;
}

TierStatus QualityTierRouter::MovePattern(PatternID id, StorageTier to, double score,
                                          const Timestamp& now) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = placements_.find(id);
    if (it == placements_.end()) {
        return TierStatus::NOT_FOUND;
    }
    StorageTier from = it->second.tier;
    if (from == to) {
        SetPlacementLocked(id, to, score, now);
        return TierStatus::OK;
    }

    std::optional<Pattern> pattern;
    try {
        pattern = Store(from).Get(id);
        MarkAvailability(from, true);
    } catch (const TierUnavailableError& e) {
        MarkAvailability(from, false);
        failures_.fetch_add(1, std::memory_order_relaxed);
        logger_->warn("Move of {} aborted, source {} unreadable: {}", id.ToString(), ToString(from), e.what());
        return TierStatus::UNAVAILABLE;
    }
    if (!pattern) {
        logger_->warn("Placement for {} points at {} but the record is missing", id.ToString(), ToString(from));
        return TierStatus::NOT_FOUND;
    }

    try {
        Store(to).Put(*pattern);
        MarkAvailability(to, true);
    } catch (const TierUnavailableError& e) {
        MarkAvailability(to, false);
        failures_.fetch_add(1, std::memory_order_relaxed);
        logger_->warn("Move of {} aborted, target {} unwritable: {}", id.ToString(), ToString(to), e.what());
        return TierStatus::UNAVAILABLE;
    }

    try {
        Store(from).Delete(id);
    } catch (const TierUnavailableError& e) {
        MarkAvailability(from, false);
        failures_.fetch_add(1, std::memory_order_relaxed);
        logger_->warn("Move of {} rolled back, source {} delete failed: {}", id.ToString(),
                      ToString(from), e.what());
        try {
            Store(to).Delete(id);
        } catch (const TierUnavailableError& rollback_error) {
            MarkAvailability(to, false);
            logger_->error("Rollback of {} in {} failed, duplicate copy remains: {}", id.ToString(),
                           ToString(to), rollback_error.what());
        }
        return TierStatus::UNAVAILABLE;
    }

    SetPlacementLocked(id, to, score, now);
    moves_.fetch_add(1, std::memory_order_relaxed);
    return TierStatus::OK;
}

void QualityTierRouter::TouchPlacement(PatternID id, double score, const Timestamp& now) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = placements_.find(id);
    if (it != placements_.end()) {
        it->second.score = score;
        it->second.evaluated_at = now;
        it->second.dirty = false;
    }
}

void QualityTierRouter::MarkDirty(PatternID id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = placements_.find(id);
    if (it != placements_.end()) {
        it->second.dirty = true;
    }
}

// ============================================================================
// Reads
// ============================================================================

FetchResult QualityTierRouter::FetchPattern(PatternID id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    FetchResult result;
    auto it = placements_.find(id);
    if (it == placements_.end()) {
        return result;
    }
    StorageTier tier = it->second.tier;
    result.tier = tier;
    reads_.fetch_add(1, std::memory_order_relaxed);

    try {
        result.pattern = Store(tier).Get(id);
        MarkAvailability(tier, true);
    } catch (const TierUnavailableError& e) {
        MarkAvailability(tier, false);
        failures_.fetch_add(1, std::memory_order_relaxed);
        logger_->warn("Read of {} from {} failed: {}", id.ToString(), ToString(tier), e.what());
        result.status = TierStatus::UNAVAILABLE;
        return result;
    }
    result.status = result.pattern ? TierStatus::OK : TierStatus::NOT_FOUND;
    return result;
}

std::optional<Placement> QualityTierRouter::GetPlacement(PatternID id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = placements_.find(id);
    if (it == placements_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::pair<PatternID, Placement>> QualityTierRouter::Placements() const {
    std::vector<std::pair<PatternID, Placement>> result;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        result.assign(placements_.begin(), placements_.end());
    }
    std::sort(result.begin(), result.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    return result;
}

std::vector<PatternID> QualityTierRouter::PatternsInTier(StorageTier tier) const {
    std::vector<PatternID> ids;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& [id, placement] : placements_) {
            if (placement.tier == tier) {
                ids.push_back(id);
            }
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::pair<TierStatus, std::vector<Pattern>> QualityTierRouter::ScanTier(StorageTier tier,
                                                                        const ScanFilter& filter) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    try {
        auto patterns = Store(tier).Scan(filter);
        MarkAvailability(tier, true);
        return {TierStatus::OK, std::move(patterns)};
    } catch (const TierUnavailableError& e) {
        MarkAvailability(tier, false);
        failures_.fetch_add(1, std::memory_order_relaxed);
        logger_->warn("Scan of {} failed: {}", ToString(tier), e.what());
        return {TierStatus::UNAVAILABLE, {}};
    }
}

std::array<size_t, kStorageTierCount> QualityTierRouter::TierCounts() const {
    std::array<size_t, kStorageTierCount> counts{};
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& [id, placement] : placements_) {
        ++counts[static_cast<size_t>(placement.tier)];
    }
    return counts;
}

size_t QualityTierRouter::PlacedCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return placements_.size();
}

// ============================================================================
// Recovery
// ============================================================================

std::vector<Pattern> QualityTierRouter::Recover(const Timestamp& now,
                                                std::vector<StorageTier>* unavailable) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    placements_.clear();

    std::vector<Pattern> found;
    PatternID::ValueType max_id = 0;

    // Best tier first, so a copy stranded by an interrupted move loses
    static const std::array<StorageTier, kStorageTierCount> order = {
        StorageTier::PREMIUM, StorageTier::STANDARD, StorageTier::ARCHIVE, StorageTier::REJECTED};

    for (StorageTier tier : order) {
        std::vector<Pattern> patterns;
        try {
            patterns = Store(tier).Scan(ScanFilter::All());
            MarkAvailability(tier, true);
        } catch (const TierUnavailableError& e) {
            MarkAvailability(tier, false);
            failures_.fetch_add(1, std::memory_order_relaxed);
            logger_->warn("Recovery skipped tier {}: {}", ToString(tier), e.what());
            if (unavailable) {
                unavailable->push_back(tier);
            }
            continue;
        }

        for (auto& p : patterns) {
            if (placements_.count(p.id)) {
                logger_->warn("Duplicate copy of {} found in {}", p.id.ToString(), ToString(tier));
                continue;
            }
            double score = scorer_.Score(p, now).score;
            SetPlacementLocked(p.id, tier, score, now);
            max_id = std::max(max_id, p.id.value());
            found.push_back(std::move(p));
        }
    }

    PatternID::ReserveUpTo(max_id);
    logger_->info("Recovered {} patterns from storage", found.size());
    return found;
}

Timestamp QualityTierRouter::NextAttempt(size_t attempts, const Timestamp& now) const {
    int64_t backoff = config_.retry_base_backoff_ms;
    for (size_t i = 1; i < attempts && backoff < config_.retry_max_backoff_ms; ++i) {
        backoff *= 2;
    }
    backoff = std::min(backoff, config_.retry_max_backoff_ms);
    return now + std::chrono::milliseconds(backoff);
}

void QualityTierRouter::Enqueue(const Pattern& pattern, StorageTier tier, double score,
                                const Timestamp& now) {
    std::lock_guard<std::mutex> lock(retry_mutex_);

    // A newer write supersedes a queued one
    pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                  [&](const PendingWrite& w) { return w.pattern.id == pattern.id; }),
                   pending_.end());

    if (pending_.size() >= config_.max_pending_writes) {
        logger_->error("Retry queue full, dropping oldest pending write for {}",
                       pending_.front().pattern.id.ToString());
        pending_.pop_front();
        retries_dropped_.fetch_add(1, std::memory_order_relaxed);
    }
    pending_.push_back(PendingWrite{pattern, tier, score, 1, NextAttempt(1, now)});
}

RetryOutcome QualityTierRouter::ProcessRetries(const Timestamp& now) {
    std::deque<PendingWrite> due;
    {
        std::lock_guard<std::mutex> lock(retry_mutex_);
        std::deque<PendingWrite> waiting;
        for (auto& w : pending_) {
            if (w.next_attempt <= now) {
                due.push_back(std::move(w));
            } else {
                waiting.push_back(std::move(w));
            }
        }
        pending_.swap(waiting);
    }

    RetryOutcome outcome;
    std::vector<PendingWrite> requeue;

    for (auto& w : due) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        try {
            Store(w.tier).Put(w.pattern);
            MarkAvailability(w.tier, true);
        } catch (const TierUnavailableError& e) {
            MarkAvailability(w.tier, false);
            failures_.fetch_add(1, std::memory_order_relaxed);
            if (w.attempts >= config_.max_retry_attempts) {
                logger_->error("Giving up on {} after {} attempts: {}", w.pattern.id.ToString(),
                               w.attempts, e.what());
                retries_dropped_.fetch_add(1, std::memory_order_relaxed);
                outcome.dropped.push_back(w.pattern.id);
            } else {
                ++w.attempts;
                w.next_attempt = NextAttempt(w.attempts, now);
                logger_->debug("Retry {} of {} failed, next attempt at {}", w.attempts - 1,
                               w.pattern.id.ToString(), w.next_attempt.ToString());
                requeue.push_back(std::move(w));
            }
            continue;
        }

        SetPlacementLocked(w.pattern.id, w.tier, w.score, now);
        writes_.fetch_add(1, std::memory_order_relaxed);
        retries_succeeded_.fetch_add(1, std::memory_order_relaxed);
        logger_->info("Retried write of {} to {} succeeded", w.pattern.id.ToString(), ToString(w.tier));
        outcome.written.push_back(std::move(w.pattern));
    }

    std::lock_guard<std::mutex> lock(retry_mutex_);
    for (auto& w : requeue) {
        pending_.push_back(std::move(w));
    }
    outcome.pending = pending_.size();
    return outcome;
}

size_t QualityTierRouter::PendingWrites() const {
    std::lock_guard<std::mutex> lock(retry_mutex_);
    return pending_.size();
}

std::vector<StorageTier> QualityTierRouter::UnavailableTiers() const {
    std::vector<StorageTier> tiers;
    for (size_t i = 0; i < kStorageTierCount; ++i) {
        if (!available_[i].load(std::memory_order_relaxed)) {
            tiers.push_back(static_cast<StorageTier>(i));
        }
    }
    return tiers;
}

QualityTierRouter::Stats QualityTierRouter::GetStats() const {
    Stats stats;
    stats.writes = writes_.load(std::memory_order_relaxed);
    stats.reads = reads_.load(std::memory_order_relaxed);
    stats.moves = moves_.load(std::memory_order_relaxed);
    stats.failures = failures_.load(std::memory_order_relaxed);
    stats.retries_succeeded = retries_succeeded_.load(std::memory_order_relaxed);
    stats.retries_dropped = retries_dropped_.load(std::memory_order_relaxed);
    return stats;
}

} // namespace dpcm
