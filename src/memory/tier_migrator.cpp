// File: src/memory/tier_migrator.cpp
#include "memory/tier_migrator.hpp"
#include "core/logging.hpp"
#include <stdexcept>

namespace dpcm {

bool TierMigrator::Config::IsValid() const {
    return batch_size > 0 &&
           batch_yield.count() >= 0 &&
           rescore_interval_hours >= 0.0 &&
           min_residency_hours >= 0.0 &&
           history_limit > 0 &&
           cycle_interval.count() > 0;
}

TierMigrator::TierMigrator(QualityTierRouter& router,
                           const Config& config,
                           Clock clock,
                           std::shared_ptr<spdlog::logger> logger)
    : router_(router),
      config_(config),
      clock_(clock ? std::move(clock) : SystemClock()),
      logger_(logging::OrNull(std::move(logger), "tier_migrator")) {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid TierMigrator configuration");
    }
}

TierMigrator::~TierMigrator() {
    Stop();
}

bool TierMigrator::NeedsRescore(const Placement& placement, const Timestamp& now) const {
    if (placement.dirty || placement.evaluated_at.IsZero()) {
        return true;
    }
    return HoursBetween(placement.evaluated_at, now) >= config_.rescore_interval_hours;
}

// ============================================================================
// Migration cycle
// ============================================================================

MigrationReport TierMigrator::RunCycle() {
    std::lock_guard<std::mutex> cycle_lock(cycle_mutex_);

    auto started = std::chrono::steady_clock::now();
    const Timestamp now = clock_();
    const QualityScorer& scorer = router_.GetScorer();

    MigrationReport report;
    auto placements = router_.Placements();

    for (size_t begin = 0; begin < placements.size(); begin += config_.batch_size) {
        size_t end = std::min(placements.size(), begin + config_.batch_size);

        for (size_t i = begin; i < end; ++i) {
            const PatternID id = placements[i].first;
            const Placement& placement = placements[i].second;

            if (!NeedsRescore(placement, now)) {
                continue;
            }
            ++report.evaluated;

            FetchResult fetched = router_.FetchPattern(id);
            if (fetched.status == TierStatus::NOT_FOUND) {
                // Removed since the snapshot was taken
                continue;
            }
            if (fetched.status != TierStatus::OK) {
                ++report.errors;
                continue;
            }

            double score = scorer.Score(*fetched.pattern, now).score;
            StorageTier target = scorer.TierFor(score);
            StorageTier current = *fetched.tier;

            if (target == current) {
                router_.TouchPlacement(id, score, now);
                ++report.unchanged;
                continue;
            }

            if (HoursBetween(placement.tier_since, now) < config_.min_residency_hours) {
                router_.TouchPlacement(id, score, now);
                ++report.held;
                ++report.unchanged;
                continue;
            }

            TierStatus status = router_.MovePattern(id, target, score, now);
            if (status != TierStatus::OK) {
                ++report.errors;
                continue;
            }

            MigrationRecord record{id, current, target, placement.score, score, now};
            if (record.IsPromotion()) {
                ++report.promoted;
            } else {
                ++report.demoted;
                report.demoted_ids.push_back(id);
            }
            logger_->debug("Migrated {} {} -> {} (score {:.3f} -> {:.3f})", id.ToString(),
                           ToString(current), ToString(target), placement.score, score);
            Record(record);
        }

        if (end < placements.size() && config_.batch_yield.count() > 0) {
            std::this_thread::sleep_for(config_.batch_yield);
        }
    }

    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    {
        std::lock_guard<std::mutex> lock(history_mutex_);
        ++stats_.cycles;
        stats_.promoted += report.promoted;
        stats_.demoted += report.demoted;
        stats_.unchanged += report.unchanged;
        stats_.errors += report.errors;
        stats_.last_cycle = now;
        stats_.last_duration = report.duration;
        report.cycles = stats_.cycles;
    }

    logger_->info("Migration cycle {}: evaluated={} promoted={} demoted={} held={} errors={} ({} ms)",
                  report.cycles, report.evaluated, report.promoted, report.demoted,
                  report.held, report.errors, report.duration.count());
    return report;
}

void TierMigrator::Record(const MigrationRecord& record) {
    std::lock_guard<std::mutex> lock(history_mutex_);
    history_.push_back(record);
    while (history_.size() > config_.history_limit) {
        history_.pop_front();
    }
}

std::vector<MigrationRecord> TierMigrator::GetHistory() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    return std::vector<MigrationRecord>(history_.begin(), history_.end());
}

TierMigrator::Stats TierMigrator::GetStats() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    return stats_;
}

// ============================================================================
// Background thread
// ============================================================================

void TierMigrator::Start(CycleCallback on_cycle) {
    if (running_.exchange(true)) {
        return;  // Already running
    }
    background_thread_ = std::make_unique<std::thread>(&TierMigrator::BackgroundLoop, this,
                                                       std::move(on_cycle));
    logger_->info("Background migration started (every {} ms)", config_.cycle_interval.count());
}

void TierMigrator::Stop() {
    {
        // Held so the loop cannot miss the wakeup between its check and its wait
        std::lock_guard<std::mutex> lock(wake_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    wake_cv_.notify_all();
    if (background_thread_ && background_thread_->joinable()) {
        background_thread_->join();
    }
    background_thread_.reset();
    logger_->info("Background migration stopped");
}

void TierMigrator::BackgroundLoop(CycleCallback on_cycle) {
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait_for(lock, config_.cycle_interval, [this] { return !running_.load(); });
        }
        if (!running_.load()) {
            break;
        }

        MigrationReport report = RunCycle();
        if (on_cycle) {
            on_cycle(report);
        }
    }
}

} // namespace dpcm
