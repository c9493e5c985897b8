// File: tests/spatial/coordinate_hasher_test.cpp
#include "spatial/coordinate_hasher.hpp"
#include <gtest/gtest.h>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace dpcm {
namespace {

// ============================================================================
// Digest Tests
// ============================================================================

TEST(CoordinateHasherTest, HashIsSha256OfNormalizedInput) {
    // sha256("AUTH:abc")
    auto digest = CoordinateHasher::Hash("auth", "abc");
    EXPECT_EQ("6632ba08117d6238d175e0c83299ccb7d87e45bbb749b4569529a45f9ccfe8e0",
              CoordinateHasher::ToHex(digest));
}

TEST(CoordinateHasherTest, HashIgnoresCategoryCaseAndWhitespace) {
    EXPECT_EQ(CoordinateHasher::Hash("auth", "x"), CoordinateHasher::Hash("  AUTH ", "x"));
    EXPECT_NE(CoordinateHasher::Hash("auth", "x"), CoordinateHasher::Hash("auth", "y"));
}

TEST(CoordinateHasherTest, EmptyInputsStillHash) {
    // sha256(":")
    EXPECT_EQ("e7ac0786668e0ff0f02b62bd04f45ff636fd82db63b1104601c975dc005f3a67",
              CoordinateHasher::ToHex(CoordinateHasher::Hash("", "")));
}

TEST(CoordinateHasherTest, ToCoordinatesUsesBigEndianWords) {
    Coordinate c = CoordinateHasher::ToCoordinates(CoordinateHasher::Hash("auth", "abc"));
    EXPECT_NEAR(-0.2015769442547, c.x, 1e-9);
    EXPECT_NEAR(-0.8633610941152, c.y, 1e-9);
    EXPECT_NEAR(0.6364098530347, c.z, 1e-9);
}

TEST(CoordinateHasherTest, ToCoordinatesMapsExtremes) {
    CoordinateHasher::Digest zeros{};
    CoordinateHasher::Digest ones;
    ones.fill(0xff);

    EXPECT_EQ(Coordinate(-1.0, -1.0, -1.0), CoordinateHasher::ToCoordinates(zeros));
    EXPECT_EQ(Coordinate(1.0, 1.0, 1.0), CoordinateHasher::ToCoordinates(ones));
}

TEST(CoordinateHasherTest, NormalizeCategory) {
    EXPECT_EQ("AUTH", CoordinateHasher::NormalizeCategory("\tauth \n"));
    EXPECT_EQ("", CoordinateHasher::NormalizeCategory("   "));
    EXPECT_EQ("DATA FLOW", CoordinateHasher::NormalizeCategory("data flow"));
}

TEST(CoordinateHasherTest, CompositionStringUsesFixedPrecision) {
    CoordinateHasher hasher;
    EXPECT_EQ("s=0.900|c=3.000|o=12", hasher.CompositionString(0.9, 3.0, 12));
    // Differences below the precision collapse to one string
    EXPECT_EQ(hasher.CompositionString(0.9, 3.0, 12), hasher.CompositionString(0.90001, 3.0, 12));
}

// ============================================================================
// Semantic Placement Tests
// ============================================================================

TEST(CoordinateHasherTest, PlacementIsDeterministic) {
    CoordinateHasher a;
    CoordinateHasher b;

    Coordinate first = a.GenerateSemanticCoordinates("auth", 0.9, 5.0, 10);
    Coordinate second = b.GenerateSemanticCoordinates("auth", 0.9, 5.0, 10);

    EXPECT_EQ(first, second);
}

TEST(CoordinateHasherTest, PlacementStaysInRangeForExtremeInputs) {
    CoordinateHasher hasher;
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::uniform_real_distribution<double> complexity(0.0, 1000.0);

    for (int i = 0; i < 500; ++i) {
        Coordinate c = hasher.GenerateSemanticCoordinates(
            "cat" + std::to_string(i % 17), unit(rng), complexity(rng),
            static_cast<uint32_t>(1 + rng() % 1000000));
        EXPECT_TRUE(c.IsInRange()) << c.ToString();
    }

    EXPECT_TRUE(hasher.GenerateSemanticCoordinates("", 0.0, 0.0, 0).IsInRange());
}

TEST(CoordinateHasherTest, SameCategoryClustersNearAnchor) {
    CoordinateHasher hasher;
    const auto& config = hasher.GetConfig();

    // Worst-case offset from the anchor, per axis
    double max_axis = config.quality_offset_scale + config.jitter_scale;
    double bound = std::sqrt(3.0) * max_axis;

    Coordinate anchor = hasher.CategoryAnchor("auth");
    for (double s : {0.0, 0.3, 0.7, 1.0}) {
        for (double c : {0.0, 2.0, 9.0, 50.0}) {
            Coordinate p = hasher.GenerateSemanticCoordinates("auth", s, c, 5);
            EXPECT_LE(Distance(anchor, p), bound);
        }
    }
}

TEST(CoordinateHasherTest, DistinctCategoriesGetDistinctAnchors) {
    CoordinateHasher hasher;
    std::set<std::string> seen;
    for (const char* cat : {"auth", "crypto", "performance", "fractal", "concurrency"}) {
        seen.insert(hasher.CategoryAnchor(cat).ToString());
    }
    EXPECT_EQ(5u, seen.size());
}

TEST(CoordinateHasherTest, ProfileOverloadMatchesScalarOverload) {
    CoordinateHasher hasher;
    HarmonicProfile profile;
    profile.category = "crypto";
    profile.strength = 0.6;
    profile.complexity = 2.5;
    profile.occurrences = 9;

    EXPECT_EQ(hasher.GenerateSemanticCoordinates("crypto", 0.6, 2.5, 9),
              hasher.GenerateSemanticCoordinates(profile));
}

TEST(CoordinateHasherTest, InvalidConfigThrows) {
    CoordinateHasher::Config config;
    config.category_spread = 0.0;
    EXPECT_THROW(CoordinateHasher hasher(config), std::invalid_argument);

    config = CoordinateHasher::Config{};
    config.complexity_normalizer = -1.0;
    EXPECT_THROW(CoordinateHasher hasher(config), std::invalid_argument);
}

// ============================================================================
// Geometry Helper Tests
// ============================================================================

TEST(CoordinateHasherTest, WithinRadiusIsInclusive) {
    Coordinate center(0.0, 0.0, 0.0);
    EXPECT_TRUE(CoordinateHasher::WithinRadius(Coordinate(0.5, 0.0, 0.0), center, 0.5));
    EXPECT_FALSE(CoordinateHasher::WithinRadius(Coordinate(0.5001, 0.0, 0.0), center, 0.5));
}

TEST(CoordinateHasherTest, CentroidAndNearest) {
    std::vector<Coordinate> points = {
        Coordinate(0.0, 0.0, 0.0), Coordinate(0.6, 0.0, 0.0), Coordinate(0.0, 0.6, 0.0)};

    auto centroid = CoordinateHasher::Centroid(points);
    ASSERT_TRUE(centroid.has_value());
    EXPECT_NEAR(0.2, centroid->x, 1e-12);
    EXPECT_NEAR(0.2, centroid->y, 1e-12);

    auto nearest = CoordinateHasher::Nearest(Coordinate(0.5, 0.1, 0.0), points);
    ASSERT_TRUE(nearest.has_value());
    EXPECT_EQ(1u, *nearest);

    EXPECT_FALSE(CoordinateHasher::Centroid({}).has_value());
    EXPECT_FALSE(CoordinateHasher::Nearest(Coordinate(), {}).has_value());
}

TEST(CoordinateHasherTest, BoundingBoxForIsClamped) {
    BoundingBox box = CoordinateHasher::BoundingBoxFor(Coordinate(0.95, 0.0, 0.0), 0.2);
    EXPECT_DOUBLE_EQ(1.0, box.max.x);
    EXPECT_NEAR(0.75, box.min.x, 1e-12);
}

} // namespace
} // namespace dpcm
