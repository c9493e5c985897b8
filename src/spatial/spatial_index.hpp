// File: src/spatial/spatial_index.hpp
//
// R-tree over pattern coordinates
//
// Supports sort-tile-recursive bulk loading, incremental insert with
// quadratic (or linear) node splits, removal with re-insertion of
// underfull nodes, exact radius queries and best-first k-nearest-neighbour
// search. Queries descend only into children whose bounding box touches the
// query region.
//
// Thread safety: queries take a shared lock; structural changes take an
// exclusive lock on a writer-priority mutex, so a stream of queries cannot
// starve inserts.
//
// A linear-scan mode answers every query from the flat entry table instead
// of the tree. It is used to validate the tree and as a fallback while the
// tree is being rebuilt.

#pragma once

#include "core/coordinate.hpp"
#include "core/types.hpp"
#include "concurrency/writer_priority_mutex.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace dpcm {

class SpatialIndex {
public:
    enum class SplitStrategy {
        LINEAR,
        QUADRATIC,
    };

    struct Config {
        size_t max_entries{16};     ///< Node capacity (M)
        size_t min_entries{6};      ///< Minimum fill for non-root nodes (m <= M/2)
        SplitStrategy split_strategy{SplitStrategy::QUADRATIC};
        bool linear_scan{false};    ///< Start in linear-scan mode

        bool IsValid() const;
    };

    /// Indexed item
    struct Entry {
        PatternID id;
        Coordinate point;
    };

    /// Query hit with its distance from the query point
    struct Neighbor {
        PatternID id;
        double distance{0.0};
    };

    struct IndexStats {
        size_t entry_count{0};
        size_t node_count{0};
        size_t leaf_count{0};
        size_t height{0};               ///< Levels, root to leaves
        double avg_occupancy{0.0};      ///< Mean leaf fill ratio [0, 1]
        size_t last_query_nodes_visited{0};
        uint64_t queries{0};
        uint64_t clamped_inserts{0};
        bool linear_scan{false};
    };

    SpatialIndex();
    explicit SpatialIndex(const Config& config,
                          std::shared_ptr<spdlog::logger> logger = nullptr);
    ~SpatialIndex();

    SpatialIndex(const SpatialIndex&) = delete;
    SpatialIndex& operator=(const SpatialIndex&) = delete;

    // ========================================================================
    // Structural operations (exclusive lock)
    // ========================================================================

    /// Replace the contents with `entries`, building a packed tree
    ///
    /// Duplicate ids keep the last occurrence.
    void BulkLoad(const std::vector<Entry>& entries);

    /// Insert or move an entry
    ///
    /// Out-of-range points are clamped to [-1, 1]^3.
    ///
    /// @return true if the id was new, false if an existing entry was moved
    bool Insert(PatternID id, const Coordinate& point);

    /// Remove an entry
    ///
    /// @return true if the id was present
    bool Remove(PatternID id);

    void Clear();

    // ========================================================================
    // Queries (shared lock)
    // ========================================================================

    /// All ids within Euclidean `radius` of `center` (inclusive)
    ///
    /// @throws std::invalid_argument if radius is negative or NaN
    std::vector<PatternID> RangeQuery(const Coordinate& center, double radius) const;

    /// Like RangeQuery, with distances, sorted ascending
    std::vector<Neighbor> RangeQueryWithDistance(const Coordinate& center, double radius) const;

    /// All ids whose point lies inside `box`
    std::vector<PatternID> BoxQuery(const BoundingBox& box) const;

    /// The k closest entries to `point`, ascending by distance (ties by id)
    std::vector<Neighbor> KNearest(const Coordinate& point, size_t k) const;

    /// The k closest entries to an indexed id, excluding the id itself
    ///
    /// @return Empty if the id is not indexed
    std::vector<Neighbor> KNearest(PatternID id, size_t k) const;

    bool Contains(PatternID id) const;

    std::optional<Coordinate> GetPoint(PatternID id) const;

    /// Snapshot of all entries
    std::vector<Entry> Entries() const;

    size_t Size() const;

    bool Empty() const { return Size() == 0; }

    // ========================================================================
    // Diagnostics
    // ========================================================================

    IndexStats GetStats() const;

    /// Answer queries by scanning every entry instead of walking the tree
    void SetLinearScan(bool enabled);

    bool IsLinearScan() const { return linear_scan_.load(std::memory_order_relaxed); }

    /// Check structural invariants
    ///
    /// Boxes are tight and contain their subtree, fan-out is within
    /// [min_entries, max_entries] for non-root nodes, every leaf sits at the
    /// same depth and the tree holds exactly the entries in the id table.
    bool Validate() const;

    /// Rebuild the tree from the id table
    void Rebuild();

    const Config& GetConfig() const { return config_; }

private:
    struct Node;

    // Tree mutation helpers (caller holds the exclusive lock)
    void InsertEntryLocked(const Entry& entry);
    std::unique_ptr<Node> InsertRecursive(Node* node, const Entry& entry);
    Node* ChooseSubtree(Node* node, const Coordinate& point) const;
    std::unique_ptr<Node> SplitNode(Node* node);
    bool RemoveRecursive(Node* node, PatternID id, const Coordinate& point,
                         std::vector<Entry>& orphans);
    void CollectEntries(const Node* node, std::vector<Entry>& out) const;
    bool RemoveLocked(PatternID id);
    void RebuildLocked();
    std::unique_ptr<Node> BuildPacked(std::vector<Entry> entries, size_t& height) const;

    // Query helpers (caller holds a lock)
    int ValidateRecursive(const Node* node, bool is_root, size_t& entries) const;
    void RangeRecursive(const Node* node, const Coordinate& center, double radius_sq,
                        std::vector<Neighbor>& out, size_t& visited) const;
    void BoxRecursive(const Node* node, const BoundingBox& box,
                      std::vector<PatternID>& out, size_t& visited) const;
    std::vector<Neighbor> KNearestLocked(const Coordinate& point, size_t k,
                                         std::optional<PatternID> exclude) const;
    std::vector<Neighbor> LinearRange(const Coordinate& center, double radius_sq) const;
    std::vector<Neighbor> LinearKNearest(const Coordinate& point, size_t k,
                                         std::optional<PatternID> exclude) const;

    Config config_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable WriterPriorityMutex mutex_;
    std::unique_ptr<Node> root_;
    size_t height_{1};
    std::unordered_map<PatternID, Coordinate> points_;

    std::atomic<bool> linear_scan_{false};
    mutable std::atomic<size_t> last_query_nodes_visited_{0};
    mutable std::atomic<uint64_t> queries_{0};
    std::atomic<uint64_t> clamped_inserts_{0};
};

} // namespace dpcm
