// File: src/spatial/coordinate_hasher.cpp
#include "spatial/coordinate_hasher.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace dpcm {

namespace {

// Key hashed with the category to find its neighbourhood anchor
const char* const kAnchorKey = "category-anchor";

double MapWordToAxis(uint32_t word) {
    constexpr double kMax = static_cast<double>(std::numeric_limits<uint32_t>::max());
    return (static_cast<double>(word) / kMax) * 2.0 - 1.0;
}

} // anonymous namespace

bool CoordinateHasher::Config::IsValid() const {
    if (category_spread <= 0.0 || category_spread > 1.0) return false;
    if (quality_offset_scale < 0.0 || jitter_scale < 0.0) return false;
    if (category_spread + quality_offset_scale + jitter_scale > 1.5) return false;
    if (strength_weight_x < 0.0 || complexity_weight_y < 0.0 || occurrence_weight_z < 0.0) return false;
    if (complexity_normalizer <= 0.0) return false;
    if (composition_precision < 0 || composition_precision > 9) return false;
    return true;
}

CoordinateHasher::CoordinateHasher()
    : CoordinateHasher(Config{}) {}

CoordinateHasher::CoordinateHasher(const Config& config)
    : config_(config) {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid CoordinateHasher configuration");
    }
}

// ============================================================================
// Digest and mapping
// ============================================================================

CoordinateHasher::Digest CoordinateHasher::Hash(const std::string& category,
                                                const std::string& composition) {
    std::string input = NormalizeCategory(category) + ":" + composition;

    Digest digest{};
    unsigned int length = 0;
    if (EVP_Digest(input.data(), input.size(), digest.data(), &length,
                   EVP_sha256(), nullptr) != 1 ||
        length != digest.size()) {
        throw std::runtime_error("SHA-256 digest computation failed");
    }
    return digest;
}

std::string CoordinateHasher::ToHex(const Digest& digest) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t byte : digest) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

Coordinate CoordinateHasher::ToCoordinates(const Digest& digest) {
    uint32_t words[3];
    for (size_t axis = 0; axis < 3; ++axis) {
        uint32_t w = 0;
        for (size_t b = 0; b < 4; ++b) {
            w = (w << 8) | digest[axis * 4 + b];
        }
        words[axis] = w;
    }
    return Coordinate(MapWordToAxis(words[0]), MapWordToAxis(words[1]), MapWordToAxis(words[2]));
}

std::string CoordinateHasher::NormalizeCategory(const std::string& category) {
    auto begin = std::find_if_not(category.begin(), category.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(category.rbegin(), category.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    std::string key = (begin < end) ? std::string(begin, end) : std::string();
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return key;
}

std::string CoordinateHasher::CompositionString(double strength, double complexity,
                                                uint32_t occurrences) const {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::fixed << std::setprecision(config_.composition_precision)
        << "s=" << strength
        << "|c=" << complexity
        << "|o=" << occurrences;
    return oss.str();
}

// ============================================================================
// Semantic placement
// ============================================================================

double CoordinateHasher::NormalizedComplexity(double complexity) const {
    return std::clamp(complexity / config_.complexity_normalizer, 0.0, 1.0);
}

Coordinate CoordinateHasher::CategoryAnchor(const std::string& category) const {
    Coordinate raw = ToCoordinates(Hash(category, kAnchorKey));
    return Coordinate(raw.x * config_.category_spread,
                      raw.y * config_.category_spread,
                      raw.z * config_.category_spread);
}

Coordinate CoordinateHasher::GenerateSemanticCoordinates(const std::string& category,
                                                         double strength,
                                                         double complexity,
                                                         uint32_t occurrences) const {
    Coordinate anchor = CategoryAnchor(category);

    double s = std::clamp(strength, 0.0, 1.0);
    double c = NormalizedComplexity(complexity);
    double occ = static_cast<double>(std::max<uint32_t>(occurrences, 1));

    // Offsets lie in [-0.5, 0.5] (x, y) and [0, 1) (z) before scaling
    double scale = config_.quality_offset_scale;
    double dx = ((s + c) / 2.0 - 0.5) * scale * config_.strength_weight_x;
    double dy = (c - 0.5) * scale * config_.complexity_weight_y;
    double dz = std::tanh(std::log10(occ) / 3.0) * scale * config_.occurrence_weight_z;

    Coordinate jitter = ToCoordinates(Hash(category, CompositionString(strength, complexity, occurrences)));

    Coordinate placed(anchor.x + dx + jitter.x * config_.jitter_scale,
                      anchor.y + dy + jitter.y * config_.jitter_scale,
                      anchor.z + dz + jitter.z * config_.jitter_scale);
    return placed.Clamped();
}

Coordinate CoordinateHasher::GenerateSemanticCoordinates(const HarmonicProfile& profile) const {
    return GenerateSemanticCoordinates(profile.category, profile.strength,
                                       profile.complexity, profile.occurrences);
}

// ============================================================================
// Geometry helpers
// ============================================================================

double CoordinateHasher::Distance(const Coordinate& a, const Coordinate& b) {
    return dpcm::Distance(a, b);
}

BoundingBox CoordinateHasher::BoundingBoxFor(const Coordinate& center, double radius) {
    return BoundingBox::FromSphere(center, radius);
}

bool CoordinateHasher::WithinRadius(const Coordinate& point, const Coordinate& center,
                                    double radius) {
    return DistanceSquared(point, center) <= radius * radius;
}

std::optional<Coordinate> CoordinateHasher::Centroid(const std::vector<Coordinate>& points) {
    if (points.empty()) {
        return std::nullopt;
    }
    Coordinate sum;
    for (const auto& p : points) {
        sum.x += p.x;
        sum.y += p.y;
        sum.z += p.z;
    }
    double n = static_cast<double>(points.size());
    return Coordinate(sum.x / n, sum.y / n, sum.z / n);
}

std::optional<size_t> CoordinateHasher::Nearest(const Coordinate& target,
                                                const std::vector<Coordinate>& candidates) {
    if (candidates.empty()) {
        return std::nullopt;
    }
    size_t best = 0;
    double best_dist = DistanceSquared(target, candidates[0]);
    for (size_t i = 1; i < candidates.size(); ++i) {
        double d = DistanceSquared(target, candidates[i]);
        if (d < best_dist) {
            best_dist = d;
            best = i;
        }
    }
    return best;
}

} // namespace dpcm
