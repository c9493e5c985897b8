// File: src/engine/memory_engine.cpp
#include "engine/memory_engine.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <future>
#include <map>
#include <set>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace dpcm {

namespace {

constexpr const char* kPatternDependency = "pattern";
constexpr const char* kTierDependency = "tier";

std::string CategoryDependency(const std::string& category) {
    return "category:" + CoordinateHasher::NormalizeCategory(category);
}

std::shared_ptr<spdlog::logger> ComponentLogger(const std::shared_ptr<spdlog::logger>& root,
                                                const std::string& name) {
    return root->clone(name);
}

void AddUnique(std::vector<StorageTier>& tiers, StorageTier tier) {
    if (std::find(tiers.begin(), tiers.end(), tier) == tiers.end()) {
        tiers.push_back(tier);
    }
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

MemoryEngine::MemoryEngine(const EngineConfig& config,
                           QualityTierRouter::TierStores stores,
                           Clock clock,
                           std::shared_ptr<spdlog::logger> logger,
                           std::shared_ptr<WorkerPool> pool)
    : config_(config),
      clock_(clock ? std::move(clock) : SystemClock()),
      logger_(logging::OrNull(std::move(logger), "memory_engine")),
      hasher_(config.hasher),
      index_(config.index, ComponentLogger(logger_, "spatial_index")),
      field_engine_(hasher_, config.field, ComponentLogger(logger_, "probability_field")),
      hot_cache_(config.engine.hot_cache_capacity),
      materializer_(config.materializer, clock_, ComponentLogger(logger_, "query_materializer")),
      pool_(config.engine.use_worker_pool ? std::move(pool) : nullptr) {
    if (!config_.Validate()) {
        std::string message = "Invalid EngineConfig configuration";
        for (const auto& error : config_.GetValidationErrors()) {
            message += "; " + error;
        }
        throw std::invalid_argument(message);
    }

    router_ = std::make_shared<QualityTierRouter>(std::move(stores), config_.quality, config_.router,
                                                  ComponentLogger(logger_, "tier_router"));
    migrator_ = std::make_unique<TierMigrator>(*router_, config_.migration, clock_,
                                               ComponentLogger(logger_, "tier_migrator"));
    deduplicator_ = std::make_unique<Deduplicator>(hasher_, router_->GetScorer(), config_.dedup,
                                                   ComponentLogger(logger_, "deduplicator"));

    std::shared_ptr<QualityTierRouter> router = router_;
    warmer_ = std::make_unique<CacheWarmer>(
        hot_cache_,
        [router](PatternID id) -> std::optional<Pattern> {
            FetchResult fetched = router->FetchPattern(id);
            if (fetched.status != TierStatus::OK || fetched.tier == StorageTier::REJECTED) {
                return std::nullopt;
            }
            return fetched.pattern;
        },
        config_.warmer, clock_, ComponentLogger(logger_, "cache_warmer"));

    // Pick up whatever the tiers already hold
    std::vector<StorageTier> unavailable;
    std::vector<Pattern> recovered = router_->Recover(clock_(), &unavailable);
    if (!recovered.empty()) {
        std::vector<SpatialIndex::Entry> entries;
        entries.reserve(recovered.size());
        for (const auto& p : recovered) {
            entries.push_back(SpatialIndex::Entry{p.id, p.coordinate});
        }
        index_.BulkLoad(entries);
        logger_->info("Recovered {} patterns from storage", recovered.size());
    }
    for (StorageTier tier : unavailable) {
        logger_->warn("Tier {} unavailable during recovery; its patterns are not indexed", ToString(tier));
    }
}

MemoryEngine::~MemoryEngine() {
    StopBackground();
}

std::unique_ptr<MemoryEngine> MemoryEngine::Create(const EngineConfig& config, Clock clock) {
    if (!config.Validate()) {
        std::string message = "Invalid EngineConfig configuration";
        for (const auto& error : config.GetValidationErrors()) {
            message += "; " + error;
        }
        throw std::invalid_argument(message);
    }

    auto logger = logging::CreateLogger("dpcm", config.logging);

    QualityTierRouter::TierStores stores;
    for (size_t i = 0; i < kStorageTierCount; ++i) {
        auto tier = static_cast<StorageTier>(i);
        if (config.storage.BackendFor(tier) == "sqlite") {
            SqliteTierStore::Config sqlite = config.storage.sqlite;
            sqlite.db_path = config.storage.PathFor(tier);
            stores[i] = std::make_unique<SqliteTierStore>(tier, sqlite);
            logger->info("Tier {} backed by SQLite at {}", ToString(tier), sqlite.db_path);
        } else {
            stores[i] = CreateMemoryTierStore(tier);
        }
    }

    std::shared_ptr<WorkerPool> pool;
    if (config.engine.use_worker_pool) {
        pool = std::make_shared<WorkerPool>(config.workers, nullptr, logger->clone("worker_pool"));
    }

    return std::make_unique<MemoryEngine>(config, std::move(stores), std::move(clock),
                                          std::move(logger), std::move(pool));
}

// ============================================================================
// Ingestion
// ============================================================================

void MemoryEngine::PrepareForStore(Pattern& pattern, const Timestamp& now) const {
    if (!pattern.id.IsValid()) {
        pattern.id = PatternID::Generate();
    } else {
        PatternID::ReserveUpTo(pattern.id.value());
    }
    if (pattern.access.created_at.IsZero()) {
        pattern.access.created_at = now;
    }
    if (pattern.access.last_accessed.IsZero()) {
        pattern.access.last_accessed = now;
    }
    pattern.coordinate = hasher_.GenerateSemanticCoordinates(pattern.profile);
}

std::optional<Pattern> MemoryEngine::FindDuplicateLocked(const Pattern& pattern) {
    if (!config_.engine.dedup_on_store || !deduplicator_->GetConfig().auto_merge ||
        router_->GetPlacement(pattern.id)) {
        // Re-storing a known id is a replacement, not a duplicate
        return std::nullopt;
    }

    const auto& dedup = deduplicator_->GetConfig();
    std::optional<Pattern> best;
    double best_similarity = 0.0;

    for (const auto& neighbor : index_.RangeQueryWithDistance(pattern.coordinate, dedup.candidate_radius)) {
        auto placement = router_->GetPlacement(neighbor.id);
        if (!placement || placement->tier == StorageTier::REJECTED) {
            continue;
        }
        std::optional<Pattern> existing = LoadPattern(neighbor.id);
        if (!existing) {
            continue;
        }
        double similarity = deduplicator_->Similarity(*existing, pattern).overall;
        if (similarity >= dedup.auto_merge_threshold && similarity > best_similarity) {
            best_similarity = similarity;
            best = std::move(existing);
        }
    }
    return best;
}

StoreResult MemoryEngine::MergeIntoLocked(const Pattern& incoming, const Pattern& existing) {
    StoreResult result;
    result.id = incoming.id;

    Pattern merged = deduplicator_->Merge(existing, incoming);
    TierStatus status = router_->UpdatePattern(merged);
    result.status = status;
    if (status != TierStatus::OK) {
        result.error = std::string("merge target write failed: ") + ToString(status);
        return result;
    }

    index_.Insert(merged.id, merged.coordinate);
    if (hot_cache_.Contains(merged.id)) {
        hot_cache_.Put(merged.id, merged);
    }
    InvalidatePatternViews(merged.profile.category);

    auto placement = router_->GetPlacement(merged.id);
    result.success = true;
    result.merged_into = merged.id;
    if (placement) {
        result.tier = placement->tier;
        result.score = placement->score;
    }
    logger_->debug("Merged incoming {} into existing {}", incoming.id.ToString(), merged.id.ToString());
    return result;
}

StoreResult MemoryEngine::Store(Pattern pattern) {
    StoreResult result;
    result.id = pattern.id;
    if (!pattern.IsValid()) {
        result.error = "invalid pattern profile";
        return result;
    }

    const Timestamp now = clock_();
    PrepareForStore(pattern, now);
    result.id = pattern.id;

    std::lock_guard<std::mutex> lock(write_mutex_);
    stores_.fetch_add(1, std::memory_order_relaxed);

    if (auto existing = FindDuplicateLocked(pattern)) {
        return MergeIntoLocked(pattern, *existing);
    }

    PlacementResult placed = router_->StorePattern(pattern, now);
    result.status = placed.status;
    result.tier = placed.tier;
    result.score = placed.score;
    result.queued = placed.queued;

    if (placed.status != TierStatus::OK) {
        result.error = placed.queued ? "tier unavailable, write queued for retry" : "tier write failed";
        return result;
    }

    index_.Insert(pattern.id, pattern.coordinate);
    hot_cache_.Remove(pattern.id);
    InvalidatePatternViews(pattern.profile.category);
    result.success = true;
    return result;
}

BatchStoreResult MemoryEngine::StoreBatch(std::vector<Pattern> patterns) {
    BatchStoreResult batch;
    batch.results.resize(patterns.size());

    const Timestamp now = clock_();
    std::lock_guard<std::mutex> lock(write_mutex_);
    stores_.fetch_add(patterns.size(), std::memory_order_relaxed);

    std::vector<Pattern> to_place;
    std::vector<size_t> slots;
    to_place.reserve(patterns.size());

    for (size_t i = 0; i < patterns.size(); ++i) {
        Pattern& pattern = patterns[i];
        StoreResult& result = batch.results[i];
        result.id = pattern.id;
        if (!pattern.IsValid()) {
            result.error = "invalid pattern profile";
            continue;
        }
        PrepareForStore(pattern, now);
        result.id = pattern.id;

        if (auto existing = FindDuplicateLocked(pattern)) {
            result = MergeIntoLocked(pattern, *existing);
            continue;
        }
        to_place.push_back(std::move(pattern));
        slots.push_back(i);
    }

    std::vector<PlacementResult> placed = router_->StorePatterns(to_place, now);

    std::set<std::string> categories;
    for (size_t k = 0; k < placed.size(); ++k) {
        StoreResult& result = batch.results[slots[k]];
        result.status = placed[k].status;
        result.tier = placed[k].tier;
        result.score = placed[k].score;
        result.queued = placed[k].queued;
        if (placed[k].status != TierStatus::OK) {
            result.error = placed[k].queued ? "tier unavailable, write queued for retry" : "tier write failed";
            continue;
        }
        index_.Insert(to_place[k].id, to_place[k].coordinate);
        hot_cache_.Remove(to_place[k].id);
        categories.insert(to_place[k].profile.category);
        result.success = true;
    }
    for (const auto& category : categories) {
        InvalidatePatternViews(category);
    }

    for (const auto& result : batch.results) {
        if (result.merged_into) {
            ++batch.merged;
        } else if (result.success) {
            ++batch.stored;
        } else if (result.queued) {
            ++batch.queued;
        } else {
            ++batch.failed;
        }
    }

    logger_->debug("Stored batch of {}: {} stored, {} merged, {} queued, {} failed", patterns.size(),
                   batch.stored, batch.merged, batch.queued, batch.failed);
    return batch;
}

void MemoryEngine::IndexWritten(const std::vector<Pattern>& patterns) {
    std::set<std::string> categories;
    for (const auto& p : patterns) {
        index_.Insert(p.id, p.coordinate);
        hot_cache_.Remove(p.id);
        categories.insert(p.profile.category);
    }
    for (const auto& category : categories) {
        InvalidatePatternViews(category);
    }
}

void MemoryEngine::InvalidatePatternViews(const std::string& category) {
    materializer_.Invalidate(kPatternDependency);
    materializer_.Invalidate(CategoryDependency(category));
}

// ============================================================================
// Retrieval
// ============================================================================

std::optional<Pattern> MemoryEngine::LoadPattern(PatternID id) {
    if (auto cached = hot_cache_.Get(id)) {
        return cached;
    }
    FetchResult fetched = router_->FetchPattern(id);
    if (fetched.status != TierStatus::OK) {
        return std::nullopt;
    }
    return fetched.pattern;
}

std::optional<Pattern> MemoryEngine::Get(PatternID id) {
    return LoadPattern(id);
}

MemoryEngine::TierFetch MemoryEngine::FetchFromTier(QualityTierRouter& router, StorageTier tier,
                                                    const std::vector<PatternID>& ids) {
    TierFetch fetch;
    fetch.tier = tier;
    fetch.patterns.reserve(ids.size());
    for (PatternID id : ids) {
        FetchResult fetched = router.FetchPattern(id);
        if (fetched.status == TierStatus::UNAVAILABLE) {
            fetch.ok = false;
            return fetch;
        }
        if (fetched.status == TierStatus::NOT_FOUND || !fetched.pattern) {
            ++fetch.missing;
            continue;
        }
        fetch.patterns.push_back(std::move(*fetched.pattern));
    }
    return fetch;
}

std::vector<MemoryEngine::TierFetch> MemoryEngine::FetchTiers(
    const std::vector<std::pair<StorageTier, std::vector<PatternID>>>& groups) {
    std::vector<TierFetch> fetches;
    fetches.reserve(groups.size());

    if (!pool_ || groups.size() < 2) {
        for (const auto& [tier, ids] : groups) {
            fetches.push_back(FetchFromTier(*router_, tier, ids));
        }
        return fetches;
    }

    // One task per tier; a tier that misses its budget is omitted
    std::vector<std::future<TierFetch>> futures;
    futures.reserve(groups.size());
    for (const auto& [tier, ids] : groups) {
        std::shared_ptr<QualityTierRouter> router = router_;
        StorageTier t = tier;
        std::vector<PatternID> batch = ids;
        futures.push_back(pool_->Submit(
            [router, t, batch]() { return FetchFromTier(*router, t, batch); },
            config_.engine.tier_fetch_timeout));
    }

    const auto deadline = std::chrono::steady_clock::now() + config_.engine.tier_fetch_timeout;
    for (size_t i = 0; i < futures.size(); ++i) {
        TierFetch fetch;
        fetch.tier = groups[i].first;
        if (futures[i].wait_until(deadline) != std::future_status::ready) {
            logger_->warn("Fetch from tier {} timed out after {} ms", ToString(fetch.tier),
                          config_.engine.tier_fetch_timeout.count());
            fetch.ok = false;
            fetches.push_back(std::move(fetch));
            continue;
        }
        try {
            fetches.push_back(futures[i].get());
        } catch (const TaskTimeoutError& e) {
            logger_->warn("Fetch from tier {} timed out: {}", ToString(fetch.tier), e.what());
            fetch.ok = false;
            fetches.push_back(std::move(fetch));
        } catch (const TaskRejectedError& e) {
            logger_->warn("Fetch from tier {} rejected, reading inline: {}", ToString(fetch.tier), e.what());
            fetches.push_back(FetchFromTier(*router_, fetch.tier, groups[i].second));
        }
    }
    return fetches;
}

QueryResult MemoryEngine::Query(const QueryIntent& intent) {
    intent.Validate();

    const auto started = std::chrono::steady_clock::now();
    queries_.fetch_add(1, std::memory_order_relaxed);

    QueryContext context = GetQueryContext();
    QueryResult result;
    result.field = field_engine_.GenerateField(intent, context);

    // Candidates inside the field that live in a queryable tier
    std::vector<FieldCandidate> candidates;
    std::unordered_map<PatternID, StorageTier> tier_of;
    for (const auto& neighbor : index_.RangeQueryWithDistance(result.field.center, result.field.radius)) {
        auto placement = router_->GetPlacement(neighbor.id);
        if (!placement || placement->tier == StorageTier::REJECTED) {
            continue;
        }
        auto point = index_.GetPoint(neighbor.id);
        if (!point) {
            continue;
        }
        candidates.push_back(FieldCandidate{neighbor.id, *point});
        tier_of[neighbor.id] = placement->tier;
    }
    result.candidates = candidates.size();

    std::vector<FieldScore> ranked = field_engine_.ScoreCandidates(result.field, candidates);

    std::set<StorageTier> failed_tiers;
    std::set<StorageTier> answered_tiers;
    size_t next = 0;

    while (result.matches.size() < intent.limit && next < ranked.size()) {
        // Next slice of ranked candidates, skipping tiers already known to be down
        std::vector<const FieldScore*> slice;
        size_t wanted = intent.limit - result.matches.size();
        while (slice.size() < wanted && next < ranked.size()) {
            const FieldScore& candidate = ranked[next++];
            if (!failed_tiers.count(tier_of[candidate.id])) {
                slice.push_back(&candidate);
            }
        }
        if (slice.empty()) {
            break;
        }

        std::unordered_map<PatternID, Pattern> loaded;
        std::map<StorageTier, std::vector<PatternID>> by_tier;
        for (const FieldScore* candidate : slice) {
            if (auto cached = hot_cache_.Get(candidate->id)) {
                loaded.emplace(candidate->id, std::move(*cached));
            } else {
                by_tier[tier_of[candidate->id]].push_back(candidate->id);
            }
        }

        std::vector<std::pair<StorageTier, std::vector<PatternID>>> groups(by_tier.begin(), by_tier.end());
        for (auto& fetch : FetchTiers(groups)) {
            if (!fetch.ok) {
                failed_tiers.insert(fetch.tier);
                AddUnique(result.degraded_tiers, fetch.tier);
                continue;
            }
            answered_tiers.insert(fetch.tier);
            result.missing += fetch.missing;
            for (auto& p : fetch.patterns) {
                if (fetch.tier == StorageTier::PREMIUM) {
                    hot_cache_.Put(p.id, p);
                }
                PatternID id = p.id;
                loaded.emplace(id, std::move(p));
            }
        }

        for (const FieldScore* candidate : slice) {
            auto it = loaded.find(candidate->id);
            if (it == loaded.end()) {
                continue;
            }
            QueryMatch match;
            match.pattern = std::move(it->second);
            match.score = candidate->score;
            match.distance = candidate->distance;
            match.tier = tier_of[candidate->id];
            result.matches.push_back(std::move(match));
            if (result.matches.size() >= intent.limit) {
                break;
            }
        }
    }

    if (result.missing > 0) {
        logger_->warn("Query found {} indexed patterns missing from their tier", result.missing);
    }

    result.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    if (result.IsDegraded()) {
        degraded_queries_.fetch_add(1, std::memory_order_relaxed);
        if (result.matches.empty() && answered_tiers.empty()) {
            std::string tiers;
            for (StorageTier tier : result.degraded_tiers) {
                if (!tiers.empty()) tiers += ", ";
                tiers += ToString(tier);
            }
            logger_->error("Query failed: every tier holding candidates is unavailable ({})", tiers);
            RecordQuery(intent, false, result.elapsed);
            throw TierExhaustedError(tiers);
        }
    }

    for (const auto& match : result.matches) {
        warmer_->RecordAccess(match.pattern.id);
    }
    RecordQuery(intent, !result.matches.empty(), result.elapsed);
    return result;
}

void MemoryEngine::RecordQuery(const QueryIntent& intent, bool hit, std::chrono::microseconds elapsed) {
    std::lock_guard<std::mutex> lock(context_mutex_);

    QueryContext::RecentQuery recent;
    recent.type = intent.type;
    if (intent.harmonic_signature) {
        recent.category = CoordinateHasher::NormalizeCategory(intent.harmonic_signature->category);
    }
    context_.recent_queries.push_back(recent);
    while (context_.recent_queries.size() > config_.engine.recent_query_window) {
        context_.recent_queries.erase(context_.recent_queries.begin());
    }

    // Exponential moving averages
    constexpr double kAlpha = 0.1;
    context_.hit_rate = (1.0 - kAlpha) * context_.hit_rate + kAlpha * (hit ? 1.0 : 0.0);
    context_.avg_response_ms = (1.0 - kAlpha) * context_.avg_response_ms +
                               kAlpha * (static_cast<double>(elapsed.count()) / 1000.0);
}

QueryContext MemoryEngine::GetQueryContext() const {
    std::lock_guard<std::mutex> lock(context_mutex_);
    return context_;
}

bool MemoryEngine::RecordAccess(PatternID id) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    FetchResult fetched = router_->FetchPattern(id);
    if (fetched.status != TierStatus::OK || !fetched.pattern) {
        return false;
    }
    Pattern pattern = std::move(*fetched.pattern);
    pattern.access.RecordAccess(clock_());

    if (router_->UpdatePattern(pattern) != TierStatus::OK) {
        return false;
    }
    if (hot_cache_.Contains(id)) {
        hot_cache_.Put(id, pattern);
    }
    warmer_->RecordAccess(id);
    return true;
}

bool MemoryEngine::Remove(PatternID id) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    std::optional<Pattern> existing = LoadPattern(id);
    TierStatus status = router_->RemovePattern(id);
    if (status != TierStatus::OK) {
        if (status == TierStatus::UNAVAILABLE) {
            logger_->warn("Remove of {} failed: tier unavailable", id.ToString());
        }
        return false;
    }

    index_.Remove(id);
    warmer_->Forget(id);
    materializer_.Invalidate(kPatternDependency);
    if (existing) {
        materializer_.Invalidate(CategoryDependency(existing->profile.category));
    }
    return true;
}

// ============================================================================
// Maintenance
// ============================================================================

void MemoryEngine::ApplyRetries(const RetryOutcome& outcome) {
    if (!outcome.written.empty()) {
        IndexWritten(outcome.written);
        logger_->info("Indexed {} patterns written on retry", outcome.written.size());
    }
    if (!outcome.dropped.empty()) {
        logger_->error("Dropped {} queued writes after repeated tier failures", outcome.dropped.size());
    }
}

void MemoryEngine::DropColdCacheEntries(const MigrationReport& report) {
    // Warmed patterns may sit in any query-facing tier; demotion still evicts
    for (PatternID id : report.demoted_ids) {
        hot_cache_.Remove(id);
    }
    for (PatternID id : hot_cache_.Keys()) {
        auto placement = router_->GetPlacement(id);
        if (!placement || placement->tier == StorageTier::REJECTED) {
            hot_cache_.Remove(id);
        }
    }
}

MigrationReport MemoryEngine::Migrate() {
    std::lock_guard<std::mutex> lock(write_mutex_);

    ApplyRetries(router_->ProcessRetries(clock_()));

    MigrationReport report = migrator_->RunCycle();
    if (report.promoted + report.demoted > 0) {
        materializer_.Invalidate(kTierDependency);
        DropColdCacheEntries(report);
    }

    if (config_.engine.check_consistency_on_migrate) {
        CheckConsistencyLocked();
    }
    return report;
}

DeduplicationSummary MemoryEngine::Deduplicate() {
    std::lock_guard<std::mutex> lock(write_mutex_);

    DeduplicationSummary summary;
    std::vector<Pattern> patterns;
    for (size_t i = 0; i < kStorageTierCount; ++i) {
        auto tier = static_cast<StorageTier>(i);
        auto [status, scanned] = router_->ScanTier(tier, ScanFilter::All());
        if (status != TierStatus::OK) {
            summary.skipped_tiers.push_back(tier);
            continue;
        }
        patterns.insert(patterns.end(), std::make_move_iterator(scanned.begin()),
                        std::make_move_iterator(scanned.end()));
    }

    DeduplicationResult result = deduplicator_->Deduplicate(patterns, clock_());
    summary.candidates_found = result.candidates_found;
    summary.merged = result.merged;
    summary.space_saved = result.space_saved;
    summary.processing_time = result.processing_time;

    std::unordered_map<PatternID, const Pattern*> survivors;
    for (const auto& p : result.survivors) {
        survivors[p.id] = &p;
    }

    // Keepers first, so a failed removal never loses the merged content
    std::set<std::string> categories;
    for (PatternID id : result.updated) {
        auto it = survivors.find(id);
        if (it == survivors.end()) {
            continue;
        }
        const Pattern& keeper = *it->second;
        if (router_->UpdatePattern(keeper) != TierStatus::OK) {
            ++summary.apply_failures;
            continue;
        }
        index_.Insert(keeper.id, keeper.coordinate);
        if (hot_cache_.Contains(keeper.id)) {
            hot_cache_.Put(keeper.id, keeper);
        }
        categories.insert(keeper.profile.category);
    }

    for (PatternID id : result.removed) {
        if (router_->RemovePattern(id) != TierStatus::OK) {
            ++summary.apply_failures;
            continue;
        }
        index_.Remove(id);
        warmer_->Forget(id);
    }

    if (summary.merged > 0) {
        materializer_.Invalidate(kPatternDependency);
        for (const auto& category : categories) {
            materializer_.Invalidate(CategoryDependency(category));
        }
    }
    if (summary.apply_failures > 0) {
        logger_->warn("Deduplication could not apply {} changes; they will be retried next pass",
                      summary.apply_failures);
    }

    logger_->info("Deduplication: {} candidates, {} merged, {} bytes saved in {} ms",
                  summary.candidates_found, summary.merged, summary.space_saved,
                  summary.processing_time.count());
    return summary;
}

ConsistencyReport MemoryEngine::CheckConsistency() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return CheckConsistencyLocked();
}

ConsistencyReport MemoryEngine::CheckConsistencyLocked() {
    ConsistencyReport report;

    std::vector<SpatialIndex::Entry> indexed = index_.Entries();
    std::vector<std::pair<PatternID, Placement>> placed = router_->Placements();
    report.indexed = indexed.size();
    report.placed = placed.size();

    std::unordered_set<PatternID> placed_ids;
    for (const auto& [id, placement] : placed) {
        placed_ids.insert(id);
    }
    std::unordered_set<PatternID> indexed_ids;
    for (const auto& entry : indexed) {
        indexed_ids.insert(entry.id);
        if (!placed_ids.count(entry.id)) {
            ++report.stale_entries;
        }
    }
    for (PatternID id : placed_ids) {
        if (!indexed_ids.count(id)) {
            ++report.missing_entries;
        }
    }
    report.structure_valid = index_.Validate();

    if (report.stale_entries == 0 && report.missing_entries == 0 && report.structure_valid) {
        return report;
    }

    logger_->warn("Index inconsistency: {} stale entries, {} missing entries, structure {}; rebuilding",
                  report.stale_entries, report.missing_entries,
                  report.structure_valid ? "valid" : "invalid");

    // Rebuild from the authoritative tiers. Placed patterns in a tier that
    // cannot be scanned keep their current index position.
    std::unordered_map<PatternID, Coordinate> points;
    for (const auto& entry : indexed) {
        points[entry.id] = entry.point;
    }

    std::vector<SpatialIndex::Entry> entries;
    entries.reserve(placed.size());
    std::unordered_set<PatternID> covered;
    for (size_t i = 0; i < kStorageTierCount; ++i) {
        auto tier = static_cast<StorageTier>(i);
        auto [status, patterns] = router_->ScanTier(tier, ScanFilter::All());
        if (status != TierStatus::OK) {
            report.skipped_tiers.push_back(tier);
            continue;
        }
        for (const auto& p : patterns) {
            if (placed_ids.count(p.id) && covered.insert(p.id).second) {
                entries.push_back(SpatialIndex::Entry{p.id, p.coordinate});
            }
        }
    }
    for (const auto& [id, placement] : placed) {
        if (covered.count(id)) {
            continue;
        }
        bool tier_skipped = std::find(report.skipped_tiers.begin(), report.skipped_tiers.end(),
                                      placement.tier) != report.skipped_tiers.end();
        auto point = points.find(id);
        if (tier_skipped && point != points.end()) {
            entries.push_back(SpatialIndex::Entry{id, point->second});
        }
    }

    index_.BulkLoad(entries);
    index_rebuilds_.fetch_add(1, std::memory_order_relaxed);
    report.rebuilt = true;
    logger_->warn("Index rebuilt with {} entries", entries.size());
    return report;
}

CacheWarmer::WarmReport MemoryEngine::WarmCache() {
    return warmer_->WarmCache();
}

void MemoryEngine::StartBackground() {
    migrator_->Start([this](const MigrationReport& report) {
        std::lock_guard<std::mutex> lock(write_mutex_);
        ApplyRetries(router_->ProcessRetries(clock_()));
        if (report.promoted + report.demoted > 0) {
            materializer_.Invalidate(kTierDependency);
            DropColdCacheEntries(report);
        }
    });
    warmer_->Start();
    logger_->info("Background migration and cache warming started");
}

void MemoryEngine::StopBackground() {
    bool was_running = migrator_->IsRunning() || warmer_->IsRunning();
    migrator_->Stop();
    warmer_->Stop();
    if (was_running) {
        logger_->info("Background migration and cache warming stopped");
    }
}

// ============================================================================
// Aggregates
// ============================================================================

std::optional<std::set<std::string>> MemoryEngine::AggregateDependencies(const std::string& name,
                                                                         const QueryParams& params) const {
    std::set<std::string> deps{kPatternDependency};
    if (name == "tier_distribution") {
        deps.insert(kTierDependency);
        return deps;
    }
    if (name != "category_distribution" && name != "complexity_hotspots") {
        return std::nullopt;
    }
    if (name == "category_distribution") {
        // Rejected patterns are excluded, so tier moves matter
        deps.insert(kTierDependency);
    }
    auto it = params.find("category");
    if (it != params.end()) {
        deps.insert(CategoryDependency(it->second));
    }
    return deps;
}

std::optional<AggregateResult> MemoryEngine::ComputeAggregate(const std::string& name,
                                                              const QueryParams& params) {
    AggregateResult result;

    if (name == "tier_distribution") {
        auto counts = router_->TierCounts();
        for (size_t i = 0; i < kStorageTierCount; ++i) {
            result[ToString(static_cast<StorageTier>(i))] = static_cast<double>(counts[i]);
        }
        return result;
    }

    ScanFilter filter;
    auto category = params.find("category");
    if (category != params.end()) {
        filter.category = category->second;
    }

    if (name == "category_distribution") {
        for (StorageTier tier : QueryableTiers()) {
            auto [status, patterns] = router_->ScanTier(tier, filter);
            if (status != TierStatus::OK) {
                continue;
            }
            for (const auto& p : patterns) {
                result[CoordinateHasher::NormalizeCategory(p.profile.category)] += 1.0;
            }
        }
        return result;
    }

    if (name == "complexity_hotspots") {
        double min_complexity = 0.0;
        auto threshold = params.find("min_complexity");
        if (threshold != params.end()) {
            min_complexity = std::stod(threshold->second);
        }

        std::map<std::string, std::pair<double, size_t>> sums;
        for (StorageTier tier : QueryableTiers()) {
            auto [status, patterns] = router_->ScanTier(tier, filter);
            if (status != TierStatus::OK) {
                continue;
            }
            for (const auto& p : patterns) {
                auto& [total, count] = sums[CoordinateHasher::NormalizeCategory(p.profile.category)];
                total += p.profile.complexity;
                ++count;
            }
        }
        for (const auto& [key, sum] : sums) {
            double mean = sum.first / static_cast<double>(sum.second);
            if (mean >= min_complexity) {
                result[key] = mean;
            }
        }
        return result;
    }

    return std::nullopt;
}

std::optional<AggregateResult> MemoryEngine::Aggregate(const std::string& name, const QueryParams& params) {
    auto deps = AggregateDependencies(name, params);
    if (!deps) {
        return std::nullopt;
    }
    return materializer_.Execute(name, params,
                                 [this, &name, &params] { return *ComputeAggregate(name, params); },
                                 *deps);
}

std::optional<AggregateResult> MemoryEngine::MaterializeAggregate(const std::string& name,
                                                                  const QueryParams& params,
                                                                  bool critical) {
    auto deps = AggregateDependencies(name, params);
    if (!deps) {
        return std::nullopt;
    }
    return materializer_.Materialize(name, params,
                                     [this, &name, &params] { return *ComputeAggregate(name, params); },
                                     *deps, critical);
}

// ============================================================================
// Statistics
// ============================================================================

EngineStats MemoryEngine::Stats() const {
    EngineStats stats;
    stats.tier_counts = router_->TierCounts();
    stats.index = index_.GetStats();
    stats.cache = hot_cache_.GetStats();
    stats.warmer = warmer_->GetStats();
    stats.materializer = materializer_.GetStats();
    stats.router = router_->GetStats();
    stats.migration = migrator_->GetStats();
    if (pool_) {
        stats.workers = pool_->GetStats();
    }
    stats.pending_writes = router_->PendingWrites();
    stats.unavailable_tiers = router_->UnavailableTiers();
    stats.stores = stores_.load(std::memory_order_relaxed);
    stats.queries = queries_.load(std::memory_order_relaxed);
    stats.degraded_queries = degraded_queries_.load(std::memory_order_relaxed);
    stats.index_rebuilds = index_rebuilds_.load(std::memory_order_relaxed);
    return stats;
}

} // namespace dpcm
