// File: src/spatial/coordinate_hasher.hpp
//
// Deterministic mapping from a pattern's harmonic profile to a point in
// [-1, 1]^3.
//
// Placement = category anchor + bounded quality offset + composition jitter
//
//   anchor  : ToCoordinates(Hash(category, anchor-key)) scaled by category_spread
//   offset  : x <- mean(strength, complexity_norm), y <- complexity_norm,
//             z <- log-scaled occurrences, each scaled by quality_offset_scale
//   jitter  : ToCoordinates(Hash(category, composition)) scaled by jitter_scale
//
// Patterns of one category therefore land in a small neighbourhood, and
// identical profiles always land on the same point. Every function here is
// free of side effects.

#pragma once

#include "core/coordinate.hpp"
#include "core/pattern.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dpcm {

class CoordinateHasher {
public:
    /// SHA-256 digest
    using Digest = std::array<uint8_t, 32>;

    struct Config {
        /// Half-width of the cube category anchors are placed in
        double category_spread{0.85};

        /// Maximum magnitude of the quality offset per axis
        double quality_offset_scale{0.1};

        /// Axis weights of the quality offset
        double strength_weight_x{0.8};
        double complexity_weight_y{0.6};
        double occurrence_weight_z{0.4};

        /// Maximum magnitude of the composition jitter per axis
        double jitter_scale{0.02};

        /// Complexity that maps to complexity_norm = 1
        double complexity_normalizer{10.0};

        /// Decimal places in the composition string
        int composition_precision{3};

        bool IsValid() const;
    };

    CoordinateHasher();
    explicit CoordinateHasher(const Config& config);

    // ========================================================================
    // Digest and mapping
    // ========================================================================

    /// SHA-256 of "CATEGORY:composition"
    ///
    /// @throws std::runtime_error if the digest backend fails
    static Digest Hash(const std::string& category, const std::string& composition);

    /// Lower-case hex rendering of a digest
    static std::string ToHex(const Digest& digest);

    /// Map the first 96 bits of a digest to a point
    ///
    /// The bits are split into three 32-bit big-endian words, one per axis,
    /// each remapped linearly from [0, 2^32 - 1] to [-1, 1].
    static Coordinate ToCoordinates(const Digest& digest);

    /// Trimmed, upper-cased category key
    static std::string NormalizeCategory(const std::string& category);

    /// Canonical composition string for a profile, fixed precision and order
    std::string CompositionString(double strength, double complexity,
                                  uint32_t occurrences) const;

    // ========================================================================
    // Semantic placement
    // ========================================================================

    Coordinate GenerateSemanticCoordinates(const std::string& category,
                                           double strength,
                                           double complexity,
                                           uint32_t occurrences) const;

    Coordinate GenerateSemanticCoordinates(const HarmonicProfile& profile) const;

    /// Anchor point of a category neighbourhood
    Coordinate CategoryAnchor(const std::string& category) const;

    // ========================================================================
    // Geometry helpers
    // ========================================================================

    static double Distance(const Coordinate& a, const Coordinate& b);

    /// Box around a sphere, clamped to [-1, 1]^3
    static BoundingBox BoundingBoxFor(const Coordinate& center, double radius);

    static bool WithinRadius(const Coordinate& point, const Coordinate& center, double radius);

    /// Mean of the points, nullopt for an empty set
    static std::optional<Coordinate> Centroid(const std::vector<Coordinate>& points);

    /// Index of the candidate closest to target, nullopt for an empty set
    static std::optional<size_t> Nearest(const Coordinate& target,
                                         const std::vector<Coordinate>& candidates);

    const Config& GetConfig() const { return config_; }

private:
    double NormalizedComplexity(double complexity) const;

    Config config_;
};

} // namespace dpcm
