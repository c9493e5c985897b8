// File: src/memory/deduplicator.cpp
#include "memory/deduplicator.hpp"
#include "core/logging.hpp"
#include "spatial/spatial_index.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <set>
#include <stdexcept>

namespace dpcm {

namespace {

template<typename T>
double Jaccard(const std::set<T>& a, const std::set<T>& b) {
    if (a.empty() && b.empty()) {
        return 1.0;
    }
    size_t common = 0;
    for (const auto& item : a) {
        if (b.count(item)) ++common;
    }
    size_t total = a.size() + b.size() - common;
    return static_cast<double>(common) / static_cast<double>(total);
}

template<typename T>
void AppendMissing(std::vector<T>& into, const std::vector<T>& from) {
    for (const auto& item : from) {
        if (std::find(into.begin(), into.end(), item) == into.end()) {
            into.push_back(item);
        }
    }
}

void DropIds(std::vector<PatternID>& ids, PatternID a, PatternID b) {
    ids.erase(std::remove_if(ids.begin(), ids.end(),
                             [a, b](PatternID id) { return id == a || id == b; }),
              ids.end());
}

std::string SemanticText(const Pattern& p, size_t limit) {
    std::string text = p.content.title + "\n" + p.content.description;
    if (text.size() > limit) {
        text.resize(limit);
    }
    return text;
}

} // anonymous namespace

bool Deduplicator::Config::IsValid() const {
    if (candidate_radius <= 0.0) return false;
    if (min_similarity < 0.0 || min_similarity > 1.0) return false;
    if (auto_merge_threshold < min_similarity || auto_merge_threshold > 1.0) return false;
    if (max_compare_length == 0 || history_limit == 0) return false;
    if (structural_weight < 0.0 || semantic_weight < 0.0 ||
        location_weight < 0.0 || property_weight < 0.0) {
        return false;
    }
    return structural_weight + semantic_weight + location_weight + property_weight > 0.0;
}

Deduplicator::Deduplicator(const CoordinateHasher& hasher,
                           const QualityScorer& scorer,
                           const Config& config,
                           std::shared_ptr<spdlog::logger> logger)
    : hasher_(hasher),
      scorer_(scorer),
      config_(config),
      logger_(logging::OrNull(std::move(logger), "deduplicator")) {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid Deduplicator configuration");
    }
}

// ============================================================================
// Similarity
// ============================================================================

size_t Deduplicator::LevenshteinDistance(const std::string& a, const std::string& b) {
    if (a == b) return 0;
    if (a.empty()) return b.size();
    if (b.empty()) return a.size();

    std::vector<size_t> prev(b.size() + 1);
    std::vector<size_t> curr(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) {
        prev[j] = j;
    }

    for (size_t i = 1; i <= a.size(); ++i) {
        curr[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, curr);
    }
    return prev[b.size()];
}

double Deduplicator::LevenshteinSimilarity(const std::string& a, const std::string& b) {
    size_t longest = std::max(a.size(), b.size());
    if (longest == 0) {
        return 1.0;
    }
    return 1.0 - static_cast<double>(LevenshteinDistance(a, b)) / static_cast<double>(longest);
}

SimilarityBreakdown Deduplicator::Similarity(const Pattern& a, const Pattern& b) const {
    SimilarityBreakdown s;

    if (CoordinateHasher::NormalizeCategory(a.profile.category) ==
        CoordinateHasher::NormalizeCategory(b.profile.category)) {
        const double normalizer = scorer_.GetConfig().complexity_normalizer;
        const double log_span = scorer_.GetConfig().occurrence_log_span;
        auto complexity = [normalizer](const HarmonicProfile& p) {
            return std::min(1.0, std::max(0.0, p.complexity) / normalizer);
        };
        auto occurrences = [log_span](const HarmonicProfile& p) {
            return std::min(1.0, std::log10(static_cast<double>(p.occurrences) + 1.0) / log_span);
        };
        double diff = std::fabs(a.profile.strength - b.profile.strength) +
                      std::fabs(a.profile.confidence - b.profile.confidence) +
                      std::fabs(complexity(a.profile) - complexity(b.profile)) +
                      std::fabs(occurrences(a.profile) - occurrences(b.profile));
        s.structural = std::clamp(1.0 - diff / 4.0, 0.0, 1.0);
    }

    s.semantic = LevenshteinSimilarity(SemanticText(a, config_.max_compare_length),
                                       SemanticText(b, config_.max_compare_length));

    std::set<std::string> loc_a;
    std::set<std::string> loc_b;
    for (const auto& l : a.locations) loc_a.insert(l.Key());
    for (const auto& l : b.locations) loc_b.insert(l.Key());
    s.location = Jaccard(loc_a, loc_b);

    std::set<std::string> tags_a(a.content.tags.begin(), a.content.tags.end());
    std::set<std::string> tags_b(b.content.tags.begin(), b.content.tags.end());
    double classification = a.content.classification == b.content.classification ? 1.0 : 0.0;
    s.property = (Jaccard(tags_a, tags_b) + classification) / 2.0;

    const double total = config_.structural_weight + config_.semantic_weight +
                         config_.location_weight + config_.property_weight;
    s.overall = (config_.structural_weight * s.structural +
                 config_.semantic_weight * s.semantic +
                 config_.location_weight * s.location +
                 config_.property_weight * s.property) / total;
    return s;
}

// ============================================================================
// Merge
// ============================================================================

Pattern Deduplicator::Merge(const Pattern& keeper, const Pattern& removed) const {
    Pattern merged = keeper;

    uint64_t occurrences = static_cast<uint64_t>(keeper.profile.occurrences) + removed.profile.occurrences;
    merged.profile.occurrences = static_cast<uint32_t>(
        std::min<uint64_t>(occurrences, std::numeric_limits<uint32_t>::max()));
    merged.profile.confidence = (keeper.profile.confidence + removed.profile.confidence) / 2.0;
    merged.profile.strength = std::max(keeper.profile.strength, removed.profile.strength);

    AppendMissing(merged.content.tags, removed.content.tags);
    AppendMissing(merged.locations, removed.locations);
    AppendMissing(merged.evidence, removed.evidence);
    AppendMissing(merged.relationships.related, removed.relationships.related);
    AppendMissing(merged.relationships.causes, removed.relationships.causes);
    AppendMissing(merged.relationships.required_by, removed.relationships.required_by);
    DropIds(merged.relationships.related, keeper.id, removed.id);
    DropIds(merged.relationships.causes, keeper.id, removed.id);
    DropIds(merged.relationships.required_by, keeper.id, removed.id);

    merged.access.access_count += removed.access.access_count;
    merged.access.last_accessed = std::max(keeper.access.last_accessed, removed.access.last_accessed);
    if (!removed.access.created_at.IsZero() &&
        (merged.access.created_at.IsZero() || removed.access.created_at < merged.access.created_at)) {
        merged.access.created_at = removed.access.created_at;
    }
    merged.access.relevance_score = std::max(keeper.access.relevance_score,
                                             removed.access.relevance_score);

    merged.coordinate = hasher_.GenerateSemanticCoordinates(merged.profile);
    return merged;
}

// ============================================================================
// Deduplication pass
// ============================================================================

DeduplicationResult Deduplicator::Deduplicate(const std::vector<Pattern>& patterns,
                                              const Timestamp& now) {
    auto started = std::chrono::steady_clock::now();

    DeduplicationResult result;
    std::map<PatternID, Pattern> live;
    for (const auto& p : patterns) {
        live[p.id] = p;
    }

    struct Candidate {
        PatternID a;
        PatternID b;
        double similarity;
    };

    std::set<std::pair<PatternID, PatternID>> candidate_pairs;
    std::set<PatternID> updated;

    // Every round with a mergeable pair removes at least one pattern, so
    // this reaches a fixpoint in at most live.size() rounds
    size_t rounds = 0;
    while (true) {
        ++rounds;
        std::vector<SpatialIndex::Entry> entries;
        entries.reserve(live.size());
        for (const auto& [id, p] : live) {
            entries.push_back(SpatialIndex::Entry{id, p.coordinate});
        }
        SpatialIndex index;
        index.BulkLoad(entries);

        std::vector<Candidate> mergeable;
        for (const auto& [id, p] : live) {
            for (PatternID other : index.RangeQuery(p.coordinate, config_.candidate_radius)) {
                if (!(id < other)) {
                    continue;
                }
                double similarity = Similarity(p, live.at(other)).overall;
                if (similarity < config_.min_similarity) {
                    continue;
                }
                candidate_pairs.insert({id, other});
                if (config_.auto_merge && similarity >= config_.auto_merge_threshold) {
                    mergeable.push_back(Candidate{id, other, similarity});
                }
            }
        }
        if (mergeable.empty()) {
            break;
        }

        std::sort(mergeable.begin(), mergeable.end(), [](const Candidate& x, const Candidate& y) {
            if (x.similarity != y.similarity) return x.similarity > y.similarity;
            if (x.a != y.a) return x.a < y.a;
            return x.b < y.b;
        });

        // Each pattern takes part in at most one merge per round
        std::set<PatternID> touched;
        for (const auto& c : mergeable) {
            if (touched.count(c.a) || touched.count(c.b)) {
                continue;
            }
            const Pattern& pa = live.at(c.a);
            const Pattern& pb = live.at(c.b);
            double qa = scorer_.Score(pa, now).score;
            double qb = scorer_.Score(pb, now).score;
            bool keep_a = qa >= qb;

            const Pattern& keeper = keep_a ? pa : pb;
            const Pattern& loser = keep_a ? pb : pa;

            MergeRecord record{keeper.id, loser.id, c.similarity, loser.EstimateSize(), now};
            Pattern merged = Merge(keeper, loser);

            result.space_saved += record.bytes_saved;
            result.removed.push_back(loser.id);
            result.merges.push_back(record);
            updated.erase(loser.id);
            updated.insert(keeper.id);
            touched.insert(c.a);
            touched.insert(c.b);

            logger_->debug("Merged {} into {} (similarity {:.3f})", record.removed.ToString(),
                           record.keeper.ToString(), record.similarity);

            PatternID loser_id = loser.id;
            live[keeper.id] = std::move(merged);
            live.erase(loser_id);
        }
    }

    result.candidates_found = candidate_pairs.size();
    result.merged = result.removed.size();
    result.updated.assign(updated.begin(), updated.end());
    result.survivors.reserve(live.size());
    for (auto& [id, p] : live) {
        result.survivors.push_back(std::move(p));
    }
    result.processing_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    Record(result.merges);
    if (result.merged > 0) {
        logger_->info("Deduplication merged {} patterns in {} rounds ({} candidates, {} bytes saved)",
                      result.merged, rounds, result.candidates_found, result.space_saved);
    }
    return result;
}

void Deduplicator::Record(const std::vector<MergeRecord>& merges) {
    std::lock_guard<std::mutex> lock(history_mutex_);
    for (const auto& m : merges) {
        history_.push_back(m);
    }
    while (history_.size() > config_.history_limit) {
        history_.pop_front();
    }
}

std::vector<MergeRecord> Deduplicator::GetHistory() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    return std::vector<MergeRecord>(history_.begin(), history_.end());
}

} // namespace dpcm
