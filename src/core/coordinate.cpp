// File: src/core/coordinate.cpp
#include "core/coordinate.hpp"
#include <sstream>
#include <iomanip>

namespace dpcm {

namespace {

double ClampAxis(double v) {
    if (std::isnan(v)) {
        return 0.0;
    }
    return std::clamp(v, kCoordinateMin, kCoordinateMax);
}

} // anonymous namespace

bool Coordinate::IsInRange() const {
    auto in = [](double v) { return v >= kCoordinateMin && v <= kCoordinateMax; };
    return in(x) && in(y) && in(z);
}

Coordinate Coordinate::Clamped() const {
    return Coordinate(ClampAxis(x), ClampAxis(y), ClampAxis(z));
}

std::string Coordinate::ToString() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4)
        << "(" << x << ", " << y << ", " << z << ")";
    return oss.str();
}

double DistanceSquared(const Coordinate& a, const Coordinate& b) {
    double dx = a.x - b.x;
    double dy = a.y - b.y;
    double dz = a.z - b.z;
    return dx * dx + dy * dy + dz * dz;
}

double Distance(const Coordinate& a, const Coordinate& b) {
    return std::sqrt(DistanceSquared(a, b));
}

// ============================================================================
// BoundingBox
// ============================================================================

BoundingBox BoundingBox::FromSphere(const Coordinate& center, double radius) {
    Coordinate lo(center.x - radius, center.y - radius, center.z - radius);
    Coordinate hi(center.x + radius, center.y + radius, center.z + radius);
    return BoundingBox(lo.Clamped(), hi.Clamped());
}

void BoundingBox::Expand(const BoundingBox& other) {
    min.x = std::min(min.x, other.min.x);
    min.y = std::min(min.y, other.min.y);
    min.z = std::min(min.z, other.min.z);
    max.x = std::max(max.x, other.max.x);
    max.y = std::max(max.y, other.max.y);
    max.z = std::max(max.z, other.max.z);
}

BoundingBox BoundingBox::Union(const BoundingBox& a, const BoundingBox& b) {
    BoundingBox result = a;
    result.Expand(b);
    return result;
}

double BoundingBox::Volume() const {
    return (max.x - min.x) * (max.y - min.y) * (max.z - min.z);
}

double BoundingBox::Margin() const {
    return (max.x - min.x) + (max.y - min.y) + (max.z - min.z);
}

double BoundingBox::Enlargement(const BoundingBox& other) const {
    return Union(*this, other).Volume() - Volume();
}

bool BoundingBox::Contains(const Coordinate& p) const {
    return p.x >= min.x && p.x <= max.x &&
           p.y >= min.y && p.y <= max.y &&
           p.z >= min.z && p.z <= max.z;
}

bool BoundingBox::Contains(const BoundingBox& other) const {
    return Contains(other.min) && Contains(other.max);
}

bool BoundingBox::Intersects(const BoundingBox& other) const {
    return min.x <= other.max.x && max.x >= other.min.x &&
           min.y <= other.max.y && max.y >= other.min.y &&
           min.z <= other.max.z && max.z >= other.min.z;
}

double BoundingBox::MinDistanceSquared(const Coordinate& p) const {
    auto axis = [](double v, double lo, double hi) {
        if (v < lo) return lo - v;
        if (v > hi) return v - hi;
        return 0.0;
    };
    double dx = axis(p.x, min.x, max.x);
    double dy = axis(p.y, min.y, max.y);
    double dz = axis(p.z, min.z, max.z);
    return dx * dx + dy * dy + dz * dz;
}

Coordinate BoundingBox::Center() const {
    return Coordinate((min.x + max.x) / 2.0, (min.y + max.y) / 2.0, (min.z + max.z) / 2.0);
}

} // namespace dpcm
