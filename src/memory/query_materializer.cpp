// File: src/memory/query_materializer.cpp
#include "memory/query_materializer.hpp"
#include "core/logging.hpp"
#include <cctype>
#include <stdexcept>

namespace dpcm {

bool QueryMaterializer::Config::IsValid() const {
    return ttl.count() > 0 &&
           max_views > 0 &&
           auto_materialize_min_accesses > 0 &&
           auto_materialize_min_compute.count() >= 0 &&
           max_profiles > 0;
}

QueryMaterializer::QueryMaterializer(const Config& config,
                                     Clock clock,
                                     std::shared_ptr<spdlog::logger> logger)
    : config_(config),
      clock_(clock ? std::move(clock) : SystemClock()),
      logger_(logging::OrNull(std::move(logger), "query_materializer")) {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid QueryMaterializer configuration");
    }
}

std::string QueryMaterializer::CanonicalSignature(const std::string& query, const QueryParams& params) {
    std::string signature;
    signature.reserve(query.size() + 16 * params.size());

    bool pending_space = false;
    for (unsigned char c : query) {
        if (std::isspace(c)) {
            pending_space = !signature.empty();
            continue;
        }
        if (pending_space) {
            signature.push_back(' ');
            pending_space = false;
        }
        signature.push_back(static_cast<char>(std::tolower(c)));
    }

    // std::map iterates in key order
    for (const auto& [key, value] : params) {
        signature += '|';
        signature += key;
        signature += '=';
        signature += value;
    }
    return signature;
}

// ============================================================================
// Storage
// ============================================================================

void QueryMaterializer::EvictLocked() {
    // Least accessed non-critical view goes first
    auto victim = views_.end();
    for (auto it = views_.begin(); it != views_.end(); ++it) {
        if (it->second.critical) {
            continue;
        }
        if (victim == views_.end() || it->second.access_count < victim->second.access_count) {
            victim = it;
        }
    }
    if (victim == views_.end()) {
        // Every view is critical
        victim = views_.begin();
        for (auto it = views_.begin(); it != views_.end(); ++it) {
            if (it->second.access_count < victim->second.access_count) {
                victim = it;
            }
        }
    }
    logger_->debug("Evicting materialized view '{}' ({} accesses)", victim->first,
                   victim->second.access_count);
    views_.erase(victim);
    ++evictions_;
}

void QueryMaterializer::StoreLocked(View view) {
    if (!views_.count(view.signature)) {
        while (views_.size() >= config_.max_views) {
            EvictLocked();
        }
    }
    std::string key = view.signature;
    views_[key] = std::move(view);
}

QueryMaterializer::QueryProfile& QueryMaterializer::ProfileLocked(const std::string& signature) {
    auto it = profiles_.find(signature);
    if (it != profiles_.end()) {
        return it->second;
    }
    if (profiles_.size() >= config_.max_profiles) {
        // Coldest signature makes room
        auto coldest = profiles_.begin();
        for (auto p = profiles_.begin(); p != profiles_.end(); ++p) {
            if (p->second.executions < coldest->second.executions) {
                coldest = p;
            }
        }
        profiles_.erase(coldest);
    }
    return profiles_[signature];
}

uint64_t QueryMaterializer::GenerationLocked(const std::set<std::string>& dependencies) const {
    // Counters only grow, so the sum moves iff one of them did
    uint64_t generation = clear_generation_;
    for (const auto& dependency : dependencies) {
        auto it = generations_.find(dependency);
        if (it != generations_.end()) {
            generation += it->second;
        }
    }
    return generation;
}

AggregateResult QueryMaterializer::Materialize(const std::string& query,
                                               const QueryParams& params,
                                               const ComputeFn& compute,
                                               const std::set<std::string>& dependencies,
                                               bool critical) {
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation = GenerationLocked(dependencies);
    }

    auto started = std::chrono::steady_clock::now();
    AggregateResult result = compute();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    View view;
    view.signature = CanonicalSignature(query, params);
    view.query = query;
    view.result = result;
    view.dependencies = dependencies;
    view.critical = critical;
    view.created_at = clock_();
    view.expires_at = view.created_at + config_.ttl;
    view.compute_time = elapsed;

    std::lock_guard<std::mutex> lock(mutex_);
    if (GenerationLocked(dependencies) != generation) {
        ++discarded_;
        logger_->debug("Not materializing '{}': invalidated during compute", view.signature);
        return result;
    }
    StoreLocked(std::move(view));
    return result;
}

AggregateResult QueryMaterializer::Execute(const std::string& query,
                                           const QueryParams& params,
                                           const ComputeFn& compute,
                                           const std::set<std::string>& dependencies) {
    const std::string signature = CanonicalSignature(query, params);
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation = GenerationLocked(dependencies);
        auto it = views_.find(signature);
        if (it != views_.end()) {
            if (clock_() < it->second.expires_at) {
                ++it->second.access_count;
                ++hits_;
                return it->second.result;
            }
            views_.erase(it);
            ++expirations_;
        }
        ++misses_;
    }

    auto started = std::chrono::steady_clock::now();
    AggregateResult result = compute();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    std::lock_guard<std::mutex> lock(mutex_);
    QueryProfile& profile = ProfileLocked(signature);
    ++profile.executions;
    profile.total_compute += elapsed;

    auto average = profile.total_compute / static_cast<int64_t>(profile.executions);
    if (profile.executions >= config_.auto_materialize_min_accesses &&
        average >= config_.auto_materialize_min_compute) {
        if (GenerationLocked(dependencies) != generation) {
            // Profile is kept; the next execution can materialize
            ++discarded_;
            return result;
        }
        View view;
        view.signature = signature;
        view.query = query;
        view.result = result;
        view.dependencies = dependencies;
        view.created_at = clock_();
        view.expires_at = view.created_at + config_.ttl;
        view.compute_time = elapsed;
        view.access_count = profile.executions;
        StoreLocked(std::move(view));
        profiles_.erase(signature);
        logger_->debug("Auto-materialized '{}'", signature);
    }
    return result;
}

std::optional<AggregateResult> QueryMaterializer::Lookup(const std::string& query,
                                                         const QueryParams& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = views_.find(CanonicalSignature(query, params));
    if (it == views_.end()) {
        ++misses_;
        return std::nullopt;
    }
    if (!(clock_() < it->second.expires_at)) {
        views_.erase(it);
        ++expirations_;
        ++misses_;
        return std::nullopt;
    }
    ++it->second.access_count;
    ++hits_;
    return it->second.result;
}

// ============================================================================
// Invalidation
// ============================================================================

size_t QueryMaterializer::Invalidate(const std::string& dependency) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++generations_[dependency];
    size_t dropped = 0;
    for (auto it = views_.begin(); it != views_.end();) {
        if (it->second.dependencies.count(dependency)) {
            it = views_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    invalidations_ += dropped;
    return dropped;
}

void QueryMaterializer::InvalidateAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++clear_generation_;
    invalidations_ += views_.size();
    views_.clear();
}

size_t QueryMaterializer::PurgeExpired() {
    std::lock_guard<std::mutex> lock(mutex_);
    const Timestamp now = clock_();
    size_t dropped = 0;
    for (auto it = views_.begin(); it != views_.end();) {
        if (!(now < it->second.expires_at)) {
            it = views_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    expirations_ += dropped;
    return dropped;
}

bool QueryMaterializer::HasView(const std::string& query, const QueryParams& params) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = views_.find(CanonicalSignature(query, params));
    return it != views_.end() && clock_() < it->second.expires_at;
}

QueryMaterializer::Stats QueryMaterializer::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats stats;
    stats.view_count = views_.size();
    stats.hits = hits_;
    stats.misses = misses_;
    stats.evictions = evictions_;
    stats.invalidations = invalidations_;
    stats.expirations = expirations_;
    stats.discarded = discarded_;
    stats.profiled_queries = profiles_.size();
    for (const auto& [signature, view] : views_) {
        stats.view_access_counts[signature] = view.access_count;
    }
    return stats;
}

} // namespace dpcm
