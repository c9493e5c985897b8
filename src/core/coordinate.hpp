// File: src/core/coordinate.hpp
//
// Points and axis-aligned boxes in the bounded semantic space [-1, 1]^3

#pragma once

#include <string>
#include <algorithm>
#include <cmath>
#include <cstddef>

namespace dpcm {

constexpr double kCoordinateMin = -1.0;
constexpr double kCoordinateMax = 1.0;

/// A point in the semantic coordinate space
struct Coordinate {
    double x{0.0};
    double y{0.0};
    double z{0.0};

    Coordinate() = default;
    Coordinate(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    double operator[](size_t axis) const {
        return axis == 0 ? x : (axis == 1 ? y : z);
    }

    bool operator==(const Coordinate& other) const {
        return x == other.x && y == other.y && z == other.z;
    }
    bool operator!=(const Coordinate& other) const { return !(*this == other); }

    /// True if every component lies within [-1, 1]
    bool IsInRange() const;

    /// Copy with every component clamped to [-1, 1]
    Coordinate Clamped() const;

    std::string ToString() const;
};

double DistanceSquared(const Coordinate& a, const Coordinate& b);

double Distance(const Coordinate& a, const Coordinate& b);

/// Axis-aligned bounding box
struct BoundingBox {
    Coordinate min;
    Coordinate max;

    BoundingBox() = default;
    BoundingBox(const Coordinate& lo, const Coordinate& hi) : min(lo), max(hi) {}

    /// Degenerate box containing a single point
    static BoundingBox FromPoint(const Coordinate& p) { return BoundingBox(p, p); }

    /// Box covering a sphere, clamped to [-1, 1]^3
    static BoundingBox FromSphere(const Coordinate& center, double radius);

    /// Grow to include another box
    void Expand(const BoundingBox& other);

    /// Box covering both inputs
    static BoundingBox Union(const BoundingBox& a, const BoundingBox& b);

    double Volume() const;

    /// Sum of edge lengths. Used as a tie breaker when volumes are zero.
    double Margin() const;

    /// Volume growth if `other` were merged in
    double Enlargement(const BoundingBox& other) const;

    bool Contains(const Coordinate& p) const;
    bool Contains(const BoundingBox& other) const;
    bool Intersects(const BoundingBox& other) const;

    /// Squared distance from a point to the nearest point of the box
    double MinDistanceSquared(const Coordinate& p) const;

    /// True if the sphere (center, radius) touches the box
    bool IntersectsSphere(const Coordinate& center, double radius) const {
        return MinDistanceSquared(center) <= radius * radius;
    }

    Coordinate Center() const;
};

} // namespace dpcm
