// File: src/memory/query_materializer.hpp
//
// Cached aggregate query results
//
// Results are keyed by a canonical signature (lower-cased query text with
// whitespace collapsed, plus the parameters in key order). A view lives for
// `ttl` and is dropped early when a write touches one of its dependency
// keys. A result computed while one of its dependencies was invalidated is
// returned but not stored. Queries that are both frequent and slow to
// compute are materialized automatically after profiling.

#pragma once

#include "core/types.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace dpcm {

using AggregateResult = std::map<std::string, double>;
using QueryParams = std::map<std::string, std::string>;

class QueryMaterializer {
public:
    struct Config {
        std::chrono::seconds ttl{300};
        size_t max_views{100};
        uint64_t auto_materialize_min_accesses{3};
        std::chrono::milliseconds auto_materialize_min_compute{50};
        size_t max_profiles{1000};          ///< Tracked unmaterialized signatures

        bool IsValid() const;
    };

    using ComputeFn = std::function<AggregateResult()>;

    struct View {
        std::string signature;
        std::string query;
        AggregateResult result;
        std::set<std::string> dependencies;
        bool critical{false};
        Timestamp created_at;
        Timestamp expires_at;
        uint64_t access_count{0};
        std::chrono::milliseconds compute_time{0};
    };

    struct Stats {
        size_t view_count{0};
        uint64_t hits{0};
        uint64_t misses{0};
        uint64_t evictions{0};
        uint64_t invalidations{0};
        uint64_t expirations{0};
        uint64_t discarded{0};      ///< Results invalidated while computing
        size_t profiled_queries{0};
        std::map<std::string, uint64_t> view_access_counts;   ///< signature -> accesses
    };

    explicit QueryMaterializer(const Config& config,
                               Clock clock = SystemClock(),
                               std::shared_ptr<spdlog::logger> logger = nullptr);

    static std::string CanonicalSignature(const std::string& query, const QueryParams& params = {});

    /// Compute and store a view, replacing any existing one
    AggregateResult Materialize(const std::string& query,
                                const QueryParams& params,
                                const ComputeFn& compute,
                                const std::set<std::string>& dependencies,
                                bool critical = false);

    /// Serve from a fresh view, or compute
    ///
    /// Computed results are profiled; a query that reaches the access and
    /// compute-time thresholds is materialized.
    AggregateResult Execute(const std::string& query,
                            const QueryParams& params,
                            const ComputeFn& compute,
                            const std::set<std::string>& dependencies);

    /// Fresh cached result, if any
    std::optional<AggregateResult> Lookup(const std::string& query, const QueryParams& params = {});

    /// Drop every view depending on `dependency`
    ///
    /// @return Views dropped
    size_t Invalidate(const std::string& dependency);

    void InvalidateAll();

    /// Drop expired views
    size_t PurgeExpired();

    bool HasView(const std::string& query, const QueryParams& params = {}) const;

    Stats GetStats() const;

    const Config& GetConfig() const { return config_; }

private:
    struct QueryProfile {
        uint64_t executions{0};
        std::chrono::milliseconds total_compute{0};
    };

    void StoreLocked(View view);
    void EvictLocked();
    QueryProfile& ProfileLocked(const std::string& signature);

    /// Changes whenever a view depending on any of `dependencies` would be dropped
    uint64_t GenerationLocked(const std::set<std::string>& dependencies) const;

    Config config_;
    Clock clock_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    std::map<std::string, View> views_;
    std::map<std::string, QueryProfile> profiles_;
    std::map<std::string, uint64_t> generations_;
    uint64_t clear_generation_{0};

    uint64_t hits_{0};
    uint64_t misses_{0};
    uint64_t evictions_{0};
    uint64_t invalidations_{0};
    uint64_t expirations_{0};
    uint64_t discarded_{0};
};

} // namespace dpcm
