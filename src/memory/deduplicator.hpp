// File: src/memory/deduplicator.hpp
//
// Near-duplicate detection and merging
//
// Candidate pairs are patterns whose coordinates lie within
// candidate_radius of each other (found through a temporary SpatialIndex,
// so the pass is O(n log n) rather than all-pairs). Each candidate pair is
// scored by a weighted signature similarity:
//
//   structural  profile category and value closeness
//   semantic    normalized Levenshtein similarity of title + description
//   location    Jaccard overlap of code locations
//   property    tag overlap and classification match
//
// Pairs at or above auto_merge_threshold are merged into the higher-quality
// pattern. Merging repeats until no pair qualifies, so running the pass a
// second time on its own output merges nothing.

#pragma once

#include "core/pattern.hpp"
#include "core/types.hpp"
#include "memory/quality_scorer.hpp"
#include "spatial/coordinate_hasher.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dpcm {

/// Component similarities of one pair
struct SimilarityBreakdown {
    double structural{0.0};
    double semantic{0.0};
    double location{0.0};
    double property{0.0};
    double overall{0.0};     ///< Weighted, normalized to [0, 1]
};

/// One merge
struct MergeRecord {
    PatternID keeper;
    PatternID removed;
    double similarity{0.0};
    size_t bytes_saved{0};
    Timestamp at;
};

/// Result of a deduplication pass
struct DeduplicationResult {
    size_t candidates_found{0};         ///< Distinct pairs at or above min_similarity
    size_t merged{0};                   ///< Patterns merged away
    size_t space_saved{0};              ///< EstimateSize() of merged-away patterns
    std::chrono::milliseconds processing_time{0};

    std::vector<Pattern> survivors;     ///< All remaining patterns, merged keepers updated
    std::vector<PatternID> updated;     ///< Keepers whose content changed
    std::vector<PatternID> removed;     ///< Merged-away ids
    std::vector<MergeRecord> merges;
};

class Deduplicator {
public:
    struct Config {
        double candidate_radius{0.1};
        double min_similarity{0.9};
        double auto_merge_threshold{0.99};
        bool auto_merge{true};

        double structural_weight{0.3};
        double semantic_weight{0.4};
        double location_weight{0.3};
        double property_weight{0.2};

        size_t max_compare_length{512};     ///< Characters fed to Levenshtein
        size_t history_limit{1000};

        bool IsValid() const;
    };

    Deduplicator(const CoordinateHasher& hasher,
                 const QualityScorer& scorer,
                 const Config& config,
                 std::shared_ptr<spdlog::logger> logger = nullptr);

    /// Find and merge near-duplicates
    ///
    /// Input patterns are not modified; the result carries the survivors.
    DeduplicationResult Deduplicate(const std::vector<Pattern>& patterns, const Timestamp& now);

    /// Signature similarity of two patterns
    SimilarityBreakdown Similarity(const Pattern& a, const Pattern& b) const;

    /// Fold `removed` into `keeper`; the coordinate is re-derived from the
    /// merged profile
    Pattern Merge(const Pattern& keeper, const Pattern& removed) const;

    /// Edit distance, counting single-character inserts, deletes and substitutions
    static size_t LevenshteinDistance(const std::string& a, const std::string& b);

    /// 1 - distance / max(len), 1 for two empty strings
    static double LevenshteinSimilarity(const std::string& a, const std::string& b);

    /// Merges from recent passes, oldest first
    std::vector<MergeRecord> GetHistory() const;

    const Config& GetConfig() const { return config_; }

private:
    void Record(const std::vector<MergeRecord>& merges);

    const CoordinateHasher& hasher_;
    const QualityScorer& scorer_;
    Config config_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex history_mutex_;
    std::deque<MergeRecord> history_;
};

} // namespace dpcm
