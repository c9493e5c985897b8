// File: src/spatial/spatial_index.cpp
#include "spatial/spatial_index.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <mutex>
#include <queue>
#include <shared_mutex>
#include <stdexcept>

namespace dpcm {

// ============================================================================
// Node
// ============================================================================

struct SpatialIndex::Node {
    BoundingBox box;
    bool leaf{true};
    std::vector<Entry> entries;                   // leaf nodes
    std::vector<std::unique_ptr<Node>> children;  // internal nodes

    size_t Count() const { return leaf ? entries.size() : children.size(); }

    void RecomputeBox() {
        if (Count() == 0) {
            box = BoundingBox();
            return;
        }
        if (leaf) {
            box = BoundingBox::FromPoint(entries[0].point);
            for (size_t i = 1; i < entries.size(); ++i) {
                box.Expand(BoundingBox::FromPoint(entries[i].point));
            }
        } else {
            box = children[0]->box;
            for (size_t i = 1; i < children.size(); ++i) {
                box.Expand(children[i]->box);
            }
        }
    }
};

namespace {

// Points give zero-volume boxes; a small margin term keeps the split and
// choose-subtree heuristics meaningful for flat or degenerate groups.
constexpr double kMarginWeight = 1e-3;

double Cost(const BoundingBox& box) {
    return box.Volume() + kMarginWeight * box.Margin();
}

double Growth(const BoundingBox& base, const BoundingBox& add) {
    return Cost(BoundingBox::Union(base, add)) - Cost(base);
}

bool NeighborLess(const SpatialIndex::Neighbor& a, const SpatialIndex::Neighbor& b) {
    if (a.distance != b.distance) {
        return a.distance < b.distance;
    }
    return a.id < b.id;
}

/// Distributes node items into two groups once seeds are chosen, keeping
/// both groups at or above min_fill.
class SplitBuilder {
public:
    SplitBuilder(const std::vector<BoundingBox>& boxes, size_t min_fill)
        : boxes_(boxes), min_fill_(min_fill), assign_(boxes.size(), -1) {}

    void Seed(size_t a, size_t b) {
        Put(a, 0);
        Put(b, 1);
    }

    /// Quadratic PickNext: take the item with the strongest group preference
    void DistributeQuadratic() {
        size_t remaining = Remaining();
        while (remaining > 0) {
            if (ForceFill(remaining)) {
                return;
            }
            size_t best = 0;
            double best_diff = -1.0;
            for (size_t i = 0; i < boxes_.size(); ++i) {
                if (assign_[i] != -1) continue;
                double d0 = Growth(group_box_[0], boxes_[i]);
                double d1 = Growth(group_box_[1], boxes_[i]);
                double diff = std::fabs(d0 - d1);
                if (diff > best_diff) {
                    best_diff = diff;
                    best = i;
                }
            }
            Put(best, Prefer(best));
            --remaining;
        }
    }

    /// Linear distribution: items in index order
    void DistributeLinear() {
        size_t remaining = Remaining();
        for (size_t i = 0; i < boxes_.size() && remaining > 0; ++i) {
            if (assign_[i] != -1) continue;
            if (ForceFill(remaining)) {
                return;
            }
            Put(i, Prefer(i));
            --remaining;
        }
    }

    const std::vector<int>& Assignment() const { return assign_; }

private:
    size_t Remaining() const {
        return static_cast<size_t>(std::count(assign_.begin(), assign_.end(), -1));
    }

    void Put(size_t i, int group) {
        if (count_[group] == 0) {
            group_box_[group] = boxes_[i];
        } else {
            group_box_[group].Expand(boxes_[i]);
        }
        assign_[i] = group;
        ++count_[group];
    }

    // If one group needs every remaining item to reach min_fill, hand them over
    bool ForceFill(size_t remaining) {
        for (int g = 0; g < 2; ++g) {
            if (count_[g] + remaining <= min_fill_) {
                for (size_t i = 0; i < boxes_.size(); ++i) {
                    if (assign_[i] == -1) Put(i, g);
                }
                return true;
            }
        }
        return false;
    }

    int Prefer(size_t i) const {
        double d0 = Growth(group_box_[0], boxes_[i]);
        double d1 = Growth(group_box_[1], boxes_[i]);
        if (d0 != d1) return d0 < d1 ? 0 : 1;
        double c0 = Cost(group_box_[0]);
        double c1 = Cost(group_box_[1]);
        if (c0 != c1) return c0 < c1 ? 0 : 1;
        return count_[0] <= count_[1] ? 0 : 1;
    }

    const std::vector<BoundingBox>& boxes_;
    size_t min_fill_;
    std::vector<int> assign_;
    BoundingBox group_box_[2];
    size_t count_[2] = {0, 0};
};

std::vector<int> QuadraticSplit(const std::vector<BoundingBox>& boxes, size_t min_fill) {
    // Seeds: the pair that would waste the most space together
    size_t s1 = 0, s2 = 1;
    double worst = -std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < boxes.size(); ++i) {
        for (size_t j = i + 1; j < boxes.size(); ++j) {
            double waste = Cost(BoundingBox::Union(boxes[i], boxes[j])) -
                           Cost(boxes[i]) - Cost(boxes[j]);
            if (waste > worst) {
                worst = waste;
                s1 = i;
                s2 = j;
            }
        }
    }
    SplitBuilder builder(boxes, min_fill);
    builder.Seed(s1, s2);
    builder.DistributeQuadratic();
    return builder.Assignment();
}

std::vector<int> LinearSplit(const std::vector<BoundingBox>& boxes, size_t min_fill) {
    // Seeds: greatest normalized separation along any axis
    size_t s1 = 0, s2 = 1;
    double best_sep = -std::numeric_limits<double>::infinity();
    for (size_t axis = 0; axis < 3; ++axis) {
        size_t highest_low = 0, lowest_high = 0;
        double min_low = std::numeric_limits<double>::infinity();
        double max_high = -std::numeric_limits<double>::infinity();
        for (size_t i = 0; i < boxes.size(); ++i) {
            double lo = boxes[i].min[axis];
            double hi = boxes[i].max[axis];
            if (lo > boxes[highest_low].min[axis]) highest_low = i;
            if (hi < boxes[lowest_high].max[axis]) lowest_high = i;
            min_low = std::min(min_low, lo);
            max_high = std::max(max_high, hi);
        }
        if (highest_low == lowest_high) continue;
        double width = max_high - min_low;
        double sep = boxes[highest_low].min[axis] - boxes[lowest_high].max[axis];
        if (width > 0.0) sep /= width;
        if (sep > best_sep) {
            best_sep = sep;
            s1 = lowest_high;
            s2 = highest_low;
        }
    }
    SplitBuilder builder(boxes, min_fill);
    builder.Seed(s1, s2);
    builder.DistributeLinear();
    return builder.Assignment();
}

/// Order items for sort-tile-recursive packing into nodes of `capacity`
template<typename T, typename KeyFn>
void StrOrder(std::vector<T>& items, size_t capacity, KeyFn key) {
    const size_t n = items.size();
    if (n <= capacity) {
        return;
    }
    size_t pages = (n + capacity - 1) / capacity;
    size_t slices = static_cast<size_t>(std::ceil(std::cbrt(static_cast<double>(pages))));
    slices = std::max<size_t>(slices, 1);

    auto by_axis = [&key](size_t axis) {
        return [&key, axis](const T& a, const T& b) { return key(a)[axis] < key(b)[axis]; };
    };

    std::sort(items.begin(), items.end(), by_axis(0));
    size_t slab_size = (n + slices - 1) / slices;
    for (size_t slab = 0; slab < n; slab += slab_size) {
        auto slab_begin = items.begin() + slab;
        auto slab_end = items.begin() + std::min(n, slab + slab_size);
        std::sort(slab_begin, slab_end, by_axis(1));

        size_t slab_n = static_cast<size_t>(slab_end - slab_begin);
        size_t strip_size = (slab_n + slices - 1) / slices;
        for (size_t strip = 0; strip < slab_n; strip += strip_size) {
            auto strip_begin = slab_begin + strip;
            auto strip_end = slab_begin + std::min(slab_n, strip + strip_size);
            std::sort(strip_begin, strip_end, by_axis(2));
        }
    }
}

/// Even partition of n items into ceil(n / capacity) consecutive groups
std::vector<std::pair<size_t, size_t>> EvenChunks(size_t n, size_t capacity) {
    std::vector<std::pair<size_t, size_t>> chunks;
    if (n == 0) return chunks;
    size_t groups = (n + capacity - 1) / capacity;
    for (size_t g = 0; g < groups; ++g) {
        chunks.emplace_back(g * n / groups, (g + 1) * n / groups);
    }
    return chunks;
}

} // anonymous namespace

// ============================================================================
// Config
// ============================================================================

bool SpatialIndex::Config::IsValid() const {
    return max_entries >= 4 && min_entries >= 2 && min_entries * 2 <= max_entries;
}

// ============================================================================
// Construction
// ============================================================================

SpatialIndex::SpatialIndex()
    : SpatialIndex(Config{}) {}

SpatialIndex::SpatialIndex(const Config& config, std::shared_ptr<spdlog::logger> logger)
    : config_(config),
      logger_(logging::OrNull(std::move(logger), "spatial_index")),
      root_(std::make_unique<Node>()) {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid SpatialIndex configuration");
    }
    linear_scan_.store(config_.linear_scan, std::memory_order_relaxed);
}

SpatialIndex::~SpatialIndex() = default;

// ============================================================================
// Structural operations
// ============================================================================

void SpatialIndex::BulkLoad(const std::vector<Entry>& entries) {
    std::unordered_map<PatternID, Coordinate> points;
    points.reserve(entries.size());
    size_t clamped = 0;
    for (const auto& e : entries) {
        Coordinate p = e.point;
        if (!p.IsInRange()) {
            p = p.Clamped();
            ++clamped;
        }
        points[e.id] = p;
    }

    std::vector<Entry> unique;
    unique.reserve(points.size());
    for (const auto& [id, point] : points) {
        unique.push_back(Entry{id, point});
    }

    size_t height = 1;
    auto root = BuildPacked(std::move(unique), height);

    {
        std::unique_lock<WriterPriorityMutex> lock(mutex_);
        root_ = std::move(root);
        height_ = height;
        points_ = std::move(points);
    }

    if (clamped > 0) {
        clamped_inserts_.fetch_add(clamped, std::memory_order_relaxed);
        logger_->warn("Bulk load clamped {} out-of-range points", clamped);
    }
    logger_->info("Bulk loaded {} entries (height {})", entries.size(), height);
}

bool SpatialIndex::Insert(PatternID id, const Coordinate& point) {
    Coordinate p = point;
    if (!p.IsInRange()) {
        p = p.Clamped();
        clamped_inserts_.fetch_add(1, std::memory_order_relaxed);
        logger_->warn("Clamped out-of-range point {} for {}", point.ToString(), id.ToString());
    }

    std::unique_lock<WriterPriorityMutex> lock(mutex_);

    bool is_new = true;
    auto it = points_.find(id);
    if (it != points_.end()) {
        if (it->second == p) {
            return false;
        }
        RemoveLocked(id);
        is_new = false;
    }

    points_[id] = p;
    InsertEntryLocked(Entry{id, p});
    return is_new;
}

bool SpatialIndex::Remove(PatternID id) {
    std::unique_lock<WriterPriorityMutex> lock(mutex_);
    return RemoveLocked(id);
}

void SpatialIndex::Clear() {
    std::unique_lock<WriterPriorityMutex> lock(mutex_);
    root_ = std::make_unique<Node>();
    height_ = 1;
    points_.clear();
}

void SpatialIndex::Rebuild() {
    std::unique_lock<WriterPriorityMutex> lock(mutex_);
    RebuildLocked();
}

void SpatialIndex::RebuildLocked() {
    std::vector<Entry> entries;
    entries.reserve(points_.size());
    for (const auto& [id, point] : points_) {
        entries.push_back(Entry{id, point});
    }
    size_t height = 1;
    root_ = BuildPacked(std::move(entries), height);
    height_ = height;
    logger_->warn("Rebuilt spatial index from {} entries", points_.size());
}

void SpatialIndex::InsertEntryLocked(const Entry& entry) {
    auto sibling = InsertRecursive(root_.get(), entry);
    if (sibling) {
        auto new_root = std::make_unique<Node>();
        new_root->leaf = false;
        new_root->children.push_back(std::move(root_));
        new_root->children.push_back(std::move(sibling));
        new_root->RecomputeBox();
        root_ = std::move(new_root);
        ++height_;
    }
}

std::unique_ptr<SpatialIndex::Node> SpatialIndex::InsertRecursive(Node* node, const Entry& entry) {
    if (node->leaf) {
        node->entries.push_back(entry);
        node->RecomputeBox();
        if (node->entries.size() > config_.max_entries) {
            return SplitNode(node);
        }
        return nullptr;
    }

    Node* child = ChooseSubtree(node, entry.point);
    auto sibling = InsertRecursive(child, entry);
    if (sibling) {
        node->children.push_back(std::move(sibling));
    }
    node->RecomputeBox();
    if (node->children.size() > config_.max_entries) {
        return SplitNode(node);
    }
    return nullptr;
}

SpatialIndex::Node* SpatialIndex::ChooseSubtree(Node* node, const Coordinate& point) const {
    BoundingBox target = BoundingBox::FromPoint(point);
    Node* best = nullptr;
    double best_growth = std::numeric_limits<double>::infinity();
    double best_cost = std::numeric_limits<double>::infinity();
    for (auto& child : node->children) {
        double growth = Growth(child->box, target);
        double cost = Cost(child->box);
        if (growth < best_growth || (growth == best_growth && cost < best_cost)) {
            best = child.get();
            best_growth = growth;
            best_cost = cost;
        }
    }
    return best;
}

std::unique_ptr<SpatialIndex::Node> SpatialIndex::SplitNode(Node* node) {
    std::vector<BoundingBox> boxes;
    boxes.reserve(node->Count());
    if (node->leaf) {
        for (const auto& e : node->entries) boxes.push_back(BoundingBox::FromPoint(e.point));
    } else {
        for (const auto& c : node->children) boxes.push_back(c->box);
    }

    std::vector<int> assign = (config_.split_strategy == SplitStrategy::QUADRATIC)
        ? QuadraticSplit(boxes, config_.min_entries)
        : LinearSplit(boxes, config_.min_entries);

    auto sibling = std::make_unique<Node>();
    sibling->leaf = node->leaf;

    if (node->leaf) {
        std::vector<Entry> keep;
        for (size_t i = 0; i < node->entries.size(); ++i) {
            if (assign[i] == 0) keep.push_back(node->entries[i]);
            else sibling->entries.push_back(node->entries[i]);
        }
        node->entries = std::move(keep);
    } else {
        std::vector<std::unique_ptr<Node>> keep;
        for (size_t i = 0; i < node->children.size(); ++i) {
            if (assign[i] == 0) keep.push_back(std::move(node->children[i]));
            else sibling->children.push_back(std::move(node->children[i]));
        }
        node->children = std::move(keep);
    }

    node->RecomputeBox();
    sibling->RecomputeBox();
    return sibling;
}

bool SpatialIndex::RemoveLocked(PatternID id) {
    auto it = points_.find(id);
    if (it == points_.end()) {
        return false;
    }
    Coordinate point = it->second;
    points_.erase(it);

    std::vector<Entry> orphans;
    if (!RemoveRecursive(root_.get(), id, point, orphans)) {
        logger_->error("Index entry for {} missing from tree; rebuilding", id.ToString());
        RebuildLocked();
        return true;
    }

    // Shrink the tree while the root has a single child
    while (!root_->leaf && root_->children.size() == 1) {
        std::unique_ptr<Node> child = std::move(root_->children[0]);
        root_ = std::move(child);
        --height_;
    }
    if (!root_->leaf && root_->children.empty()) {
        root_ = std::make_unique<Node>();
        height_ = 1;
    }

    for (const auto& orphan : orphans) {
        InsertEntryLocked(orphan);
    }
    return true;
}

bool SpatialIndex::RemoveRecursive(Node* node, PatternID id, const Coordinate& point,
                                   std::vector<Entry>& orphans) {
    if (node->leaf) {
        auto it = std::find_if(node->entries.begin(), node->entries.end(),
                               [&id](const Entry& e) { return e.id == id; });
        if (it == node->entries.end()) {
            return false;
        }
        node->entries.erase(it);
        node->RecomputeBox();
        return true;
    }

    for (size_t i = 0; i < node->children.size(); ++i) {
        Node* child = node->children[i].get();
        if (!child->box.Contains(point)) {
            continue;
        }
        if (!RemoveRecursive(child, id, point, orphans)) {
            continue;
        }
        if (child->Count() < config_.min_entries) {
            CollectEntries(child, orphans);
            node->children.erase(node->children.begin() + static_cast<std::ptrdiff_t>(i));
        }
        node->RecomputeBox();
        return true;
    }
    return false;
}

void SpatialIndex::CollectEntries(const Node* node, std::vector<Entry>& out) const {
    if (node->leaf) {
        out.insert(out.end(), node->entries.begin(), node->entries.end());
        return;
    }
    for (const auto& child : node->children) {
        CollectEntries(child.get(), out);
    }
}

std::unique_ptr<SpatialIndex::Node> SpatialIndex::BuildPacked(std::vector<Entry> entries,
                                                              size_t& height) const {
    height = 1;
    if (entries.empty()) {
        return std::make_unique<Node>();
    }

    const size_t capacity = config_.max_entries;

    StrOrder(entries, capacity, [](const Entry& e) -> const Coordinate& { return e.point; });

    std::vector<std::unique_ptr<Node>> level;
    for (const auto& [begin, end] : EvenChunks(entries.size(), capacity)) {
        auto leaf = std::make_unique<Node>();
        leaf->entries.assign(entries.begin() + static_cast<std::ptrdiff_t>(begin),
                             entries.begin() + static_cast<std::ptrdiff_t>(end));
        leaf->RecomputeBox();
        level.push_back(std::move(leaf));
    }

    while (level.size() > 1) {
        StrOrder(level, capacity,
                 [](const std::unique_ptr<Node>& n) { return n->box.Center(); });

        std::vector<std::unique_ptr<Node>> parents;
        for (const auto& [begin, end] : EvenChunks(level.size(), capacity)) {
            auto parent = std::make_unique<Node>();
            parent->leaf = false;
            for (size_t i = begin; i < end; ++i) {
                parent->children.push_back(std::move(level[i]));
            }
            parent->RecomputeBox();
            parents.push_back(std::move(parent));
        }
        level = std::move(parents);
        ++height;
    }

    return std::move(level.front());
}

// ============================================================================
// Queries
// ============================================================================

std::vector<PatternID> SpatialIndex::RangeQuery(const Coordinate& center, double radius) const {
    std::vector<Neighbor> hits = RangeQueryWithDistance(center, radius);
    std::vector<PatternID> ids;
    ids.reserve(hits.size());
    for (const auto& hit : hits) {
        ids.push_back(hit.id);
    }
    return ids;
}

std::vector<SpatialIndex::Neighbor> SpatialIndex::RangeQueryWithDistance(const Coordinate& center,
                                                                          double radius) const {
    if (std::isnan(radius) || radius < 0.0) {
        throw std::invalid_argument("Range query radius must be non-negative");
    }
    const double radius_sq = radius * radius;

    std::vector<Neighbor> hits;
    size_t visited = 0;
    {
        std::shared_lock<WriterPriorityMutex> lock(mutex_);
        queries_.fetch_add(1, std::memory_order_relaxed);
        if (IsLinearScan()) {
            hits = LinearRange(center, radius_sq);
        } else if (root_->Count() > 0) {
            RangeRecursive(root_.get(), center, radius_sq, hits, visited);
        }
    }
    last_query_nodes_visited_.store(visited, std::memory_order_relaxed);

    std::sort(hits.begin(), hits.end(), NeighborLess);
    return hits;
}

void SpatialIndex::RangeRecursive(const Node* node, const Coordinate& center, double radius_sq,
                                  std::vector<Neighbor>& out, size_t& visited) const {
    ++visited;
    if (node->leaf) {
        for (const auto& e : node->entries) {
            double d_sq = DistanceSquared(e.point, center);
            if (d_sq <= radius_sq) {
                out.push_back(Neighbor{e.id, std::sqrt(d_sq)});
            }
        }
        return;
    }
    for (const auto& child : node->children) {
        if (child->box.MinDistanceSquared(center) <= radius_sq) {
            RangeRecursive(child.get(), center, radius_sq, out, visited);
        }
    }
}

std::vector<PatternID> SpatialIndex::BoxQuery(const BoundingBox& box) const {
    std::vector<PatternID> out;
    size_t visited = 0;
    {
        std::shared_lock<WriterPriorityMutex> lock(mutex_);
        queries_.fetch_add(1, std::memory_order_relaxed);
        if (IsLinearScan()) {
            for (const auto& [id, point] : points_) {
                if (box.Contains(point)) out.push_back(id);
            }
        } else if (root_->Count() > 0) {
            BoxRecursive(root_.get(), box, out, visited);
        }
    }
    last_query_nodes_visited_.store(visited, std::memory_order_relaxed);
    std::sort(out.begin(), out.end());
    return out;
}

void SpatialIndex::BoxRecursive(const Node* node, const BoundingBox& box,
                                std::vector<PatternID>& out, size_t& visited) const {
    ++visited;
    if (node->leaf) {
        for (const auto& e : node->entries) {
            if (box.Contains(e.point)) out.push_back(e.id);
        }
        return;
    }
    for (const auto& child : node->children) {
        if (child->box.Intersects(box)) {
            BoxRecursive(child.get(), box, out, visited);
        }
    }
}

std::vector<SpatialIndex::Neighbor> SpatialIndex::KNearest(const Coordinate& point, size_t k) const {
    std::shared_lock<WriterPriorityMutex> lock(mutex_);
    queries_.fetch_add(1, std::memory_order_relaxed);
    return KNearestLocked(point, k, std::nullopt);
}

std::vector<SpatialIndex::Neighbor> SpatialIndex::KNearest(PatternID id, size_t k) const {
    std::shared_lock<WriterPriorityMutex> lock(mutex_);
    auto it = points_.find(id);
    if (it == points_.end()) {
        return {};
    }
    queries_.fetch_add(1, std::memory_order_relaxed);
    return KNearestLocked(it->second, k, id);
}

std::vector<SpatialIndex::Neighbor> SpatialIndex::KNearestLocked(const Coordinate& point, size_t k,
                                                                  std::optional<PatternID> exclude) const {
    if (k == 0 || points_.empty()) {
        return {};
    }
    if (IsLinearScan()) {
        return LinearKNearest(point, k, exclude);
    }

    // Best-first search. At equal distance, nodes are expanded before
    // entries are emitted so that ties resolve by id.
    struct Item {
        double dist_sq;
        const Node* node;
        const Entry* entry;
    };
    auto greater = [](const Item& a, const Item& b) {
        if (a.dist_sq != b.dist_sq) return a.dist_sq > b.dist_sq;
        bool a_entry = a.entry != nullptr;
        bool b_entry = b.entry != nullptr;
        if (a_entry != b_entry) return a_entry;
        if (a_entry) return a.entry->id > b.entry->id;
        return false;
    };
    std::priority_queue<Item, std::vector<Item>, decltype(greater)> queue(greater);
    queue.push(Item{root_->box.MinDistanceSquared(point), root_.get(), nullptr});

    std::vector<Neighbor> result;
    size_t visited = 0;
    while (!queue.empty() && result.size() < k) {
        Item item = queue.top();
        queue.pop();

        if (item.entry) {
            if (exclude && item.entry->id == *exclude) continue;
            result.push_back(Neighbor{item.entry->id, std::sqrt(item.dist_sq)});
            continue;
        }

        ++visited;
        const Node* node = item.node;
        if (node->leaf) {
            for (const auto& e : node->entries) {
                queue.push(Item{DistanceSquared(e.point, point), nullptr, &e});
            }
        } else {
            for (const auto& child : node->children) {
                queue.push(Item{child->box.MinDistanceSquared(point), child.get(), nullptr});
            }
        }
    }
    last_query_nodes_visited_.store(visited, std::memory_order_relaxed);
    return result;
}

std::vector<SpatialIndex::Neighbor> SpatialIndex::LinearRange(const Coordinate& center,
                                                              double radius_sq) const {
    std::vector<Neighbor> hits;
    for (const auto& [id, point] : points_) {
        double d_sq = DistanceSquared(point, center);
        if (d_sq <= radius_sq) {
            hits.push_back(Neighbor{id, std::sqrt(d_sq)});
        }
    }
    return hits;
}

std::vector<SpatialIndex::Neighbor> SpatialIndex::LinearKNearest(const Coordinate& point, size_t k,
                                                                 std::optional<PatternID> exclude) const {
    std::vector<Neighbor> all;
    all.reserve(points_.size());
    for (const auto& [id, p] : points_) {
        if (exclude && id == *exclude) continue;
        all.push_back(Neighbor{id, std::sqrt(DistanceSquared(p, point))});
    }
    size_t take = std::min(k, all.size());
    std::partial_sort(all.begin(), all.begin() + static_cast<std::ptrdiff_t>(take), all.end(),
                      NeighborLess);
    all.resize(take);
    return all;
}

bool SpatialIndex::Contains(PatternID id) const {
    std::shared_lock<WriterPriorityMutex> lock(mutex_);
    return points_.count(id) > 0;
}

std::optional<Coordinate> SpatialIndex::GetPoint(PatternID id) const {
    std::shared_lock<WriterPriorityMutex> lock(mutex_);
    auto it = points_.find(id);
    if (it == points_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<SpatialIndex::Entry> SpatialIndex::Entries() const {
    std::shared_lock<WriterPriorityMutex> lock(mutex_);
    std::vector<Entry> entries;
    entries.reserve(points_.size());
    for (const auto& [id, point] : points_) {
        entries.push_back(Entry{id, point});
    }
    return entries;
}

size_t SpatialIndex::Size() const {
    std::shared_lock<WriterPriorityMutex> lock(mutex_);
    return points_.size();
}

// ============================================================================
// Diagnostics
// ============================================================================

SpatialIndex::IndexStats SpatialIndex::GetStats() const {
    std::shared_lock<WriterPriorityMutex> lock(mutex_);

    IndexStats stats;
    stats.entry_count = points_.size();
    stats.height = height_;
    stats.last_query_nodes_visited = last_query_nodes_visited_.load(std::memory_order_relaxed);
    stats.queries = queries_.load(std::memory_order_relaxed);
    stats.clamped_inserts = clamped_inserts_.load(std::memory_order_relaxed);
    stats.linear_scan = IsLinearScan();

    size_t leaf_entries = 0;
    std::vector<const Node*> stack{root_.get()};
    while (!stack.empty()) {
        const Node* node = stack.back();
        stack.pop_back();
        ++stats.node_count;
        if (node->leaf) {
            ++stats.leaf_count;
            leaf_entries += node->entries.size();
        } else {
            for (const auto& child : node->children) {
                stack.push_back(child.get());
            }
        }
    }

    if (stats.leaf_count > 0) {
        stats.avg_occupancy = static_cast<double>(leaf_entries) /
            static_cast<double>(stats.leaf_count * config_.max_entries);
    }
    return stats;
}

void SpatialIndex::SetLinearScan(bool enabled) {
    bool previous = linear_scan_.exchange(enabled, std::memory_order_relaxed);
    if (previous != enabled) {
        logger_->info("Spatial index linear-scan mode {}", enabled ? "enabled" : "disabled");
    }
}

bool SpatialIndex::Validate() const {
    std::shared_lock<WriterPriorityMutex> lock(mutex_);
    size_t entries = 0;
    int depth = ValidateRecursive(root_.get(), true, entries);
    if (depth < 0) {
        return false;
    }
    return static_cast<size_t>(depth) == height_ && entries == points_.size();
}

int SpatialIndex::ValidateRecursive(const Node* node, bool is_root, size_t& entries) const {
    size_t count = node->Count();
    if (count > config_.max_entries) return -1;
    if (!is_root && count < config_.min_entries) return -1;

    if (node->leaf) {
        for (const auto& e : node->entries) {
            auto it = points_.find(e.id);
            if (it == points_.end() || it->second != e.point) return -1;
            if (!node->box.Contains(e.point)) return -1;
        }
        if (count > 0) {
            BoundingBox tight = BoundingBox::FromPoint(node->entries[0].point);
            for (const auto& e : node->entries) tight.Expand(BoundingBox::FromPoint(e.point));
            if (!(tight.min == node->box.min && tight.max == node->box.max)) return -1;
        }
        entries += count;
        return 1;
    }

    if (count == 0) return -1;
    if (is_root && count < 2) return -1;

    int child_depth = -1;
    BoundingBox tight = node->children[0]->box;
    for (const auto& child : node->children) {
        if (!node->box.Contains(child->box)) return -1;
        tight.Expand(child->box);
        int d = ValidateRecursive(child.get(), false, entries);
        if (d < 0) return -1;
        if (child_depth == -1) child_depth = d;
        else if (d != child_depth) return -1;
    }
    if (!(tight.min == node->box.min && tight.max == node->box.max)) return -1;
    return child_depth + 1;
}

} // namespace dpcm
