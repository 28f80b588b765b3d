#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <functional>
#include <stdexcept>
#include <string>

namespace topomap {

using NodeId = std::string;
using LinkId = std::string;

/// Raised when the router detects a bug in its own bookkeeping.
/// Never thrown for bad input; callers are not expected to recover.
class InvariantError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

struct Point {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Point() = default;
    constexpr Point(float x_, float y_) : x(x_), y(y_) {}

    constexpr Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
    constexpr Point operator-(const Point& o) const { return {x - o.x, y - o.y}; }
    constexpr Point operator*(float s) const { return {x * s, y * s}; }
    constexpr Point operator/(float s) const { return {x / s, y / s}; }

    float length() const { return std::hypot(x, y); }
    float distanceTo(const Point& o) const { return (*this - o).length(); }
    constexpr float dot(const Point& o) const { return x * o.x + y * o.y; }

    Point normalized() const {
        float len = length();
        return len > 0.0f ? *this / len : Point{0.0f, 0.0f};
    }

    /// a + (b - a) * t
    constexpr Point lerp(const Point& o, float t) const {
        return *this * (1.0f - t) + o * t;
    }

    bool approxEqual(const Point& o, float eps = 1e-4f) const {
        return std::fabs(x - o.x) <= eps && std::fabs(y - o.y) <= eps;
    }

    constexpr bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const Point& o) const { return !(*this == o); }
};

/// Integer grid cell, the unit of the routing space
struct GridPos {
    int x = 0;
    int y = 0;

    /// Largest |x| or |y| accepted from input. Keeps neighbour arithmetic
    /// and segment rasterisation far from int overflow.
    static constexpr int kMaxCoordinate = 1 << 16;

    constexpr GridPos() = default;
    constexpr GridPos(int x_, int y_) : x(x_), y(y_) {}

    constexpr Point toPoint() const {
        return {static_cast<float>(x), static_cast<float>(y)};
    }

    /// True if both coordinates are finite and within kMaxCoordinate
    static bool inRange(const Point& p) {
        constexpr float limit = static_cast<float>(kMaxCoordinate);
        return std::isfinite(p.x) && std::isfinite(p.y) &&
               std::fabs(p.x) <= limit && std::fabs(p.y) <= limit;
    }

    static constexpr bool inRange(int x, int y) {
        return x >= -kMaxCoordinate && x <= kMaxCoordinate &&
               y >= -kMaxCoordinate && y <= kMaxCoordinate;
    }

    /// Round to the nearest cell. `p` must satisfy inRange().
    static GridPos fromPoint(const Point& p) {
        return {static_cast<int>(std::round(p.x)), static_cast<int>(std::round(p.y))};
    }

    constexpr GridPos min(const GridPos& o) const {
        return {std::min(x, o.x), std::min(y, o.y)};
    }
    constexpr GridPos max(const GridPos& o) const {
        return {std::max(x, o.x), std::max(y, o.y)};
    }

    /// max(|dx|, |dy|)
    int chebyshevDistance(const GridPos& o) const {
        return std::max(std::abs(x - o.x), std::abs(y - o.y));
    }

    constexpr GridPos operator+(const GridPos& o) const { return {x + o.x, y + o.y}; }
    constexpr GridPos operator-(const GridPos& o) const { return {x - o.x, y - o.y}; }

    constexpr bool operator==(const GridPos& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const GridPos& o) const { return !(*this == o); }
    constexpr bool operator<(const GridPos& o) const {
        return x < o.x || (x == o.x && y < o.y);
    }
};

struct GridPosHash {
    std::size_t operator()(const GridPos& p) const {
        return std::hash<int>()(p.x) ^ (std::hash<int>()(p.y) << 16);
    }
};

}  // namespace topomap
