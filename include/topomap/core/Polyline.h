#pragma once

#include "Types.h"

#include <initializer_list>
#include <utility>
#include <vector>

namespace topomap {

/// Ordered list of points {p1, ..., pn} read as the segments
/// {p1, p2}, {p2, p3}, ..., {pn-1, pn}.
/// Fewer than two points is a degenerate line.
class Polyline {
public:
    Polyline() = default;
    Polyline(std::initializer_list<Point> points) : points_(points) {}
    explicit Polyline(std::vector<Point> points) : points_(std::move(points)) {}

    // Container access
    std::size_t size() const { return points_.size(); }
    bool empty() const { return points_.empty(); }
    const Point& operator[](std::size_t i) const { return points_[i]; }
    Point& operator[](std::size_t i) { return points_[i]; }
    const Point& front() const { return points_.front(); }
    const Point& back() const { return points_.back(); }
    void push_back(const Point& p) { points_.push_back(p); }
    void clear() { points_.clear(); }
    void reserve(std::size_t n) { points_.reserve(n); }

    std::vector<Point>::const_iterator begin() const { return points_.begin(); }
    std::vector<Point>::const_iterator end() const { return points_.end(); }

    const std::vector<Point>& points() const { return points_; }

    /// Euclidean length, summed pairwise to limit round-off
    float length() const;

    /// Copy without zero-length segments and without NaN points
    Polyline fix() const;

    /// Copy without interior points that continue the previous direction
    /// (unit direction dot product >= kColinearThreshold)
    Polyline simplify() const;

    /// Each segment divided into `count` equal parts
    Polyline subdivide(int count) const;

    /// Point at t * length() along the line, t clamped to [0, 1].
    /// Returns {0, 0} for an empty line.
    Point interpolate(float t) const;

    /// Split at t * length(). Both halves share the split point and keep the
    /// original point order. Two empty lines for an empty input.
    std::pair<Polyline, Polyline> splitAt(float t) const;

    Polyline translated(const Point& offset) const;
    Polyline scaled(float factor) const;

    bool operator==(const Polyline& o) const { return points_ == o.points_; }
    bool operator!=(const Polyline& o) const { return !(*this == o); }

    static constexpr float kColinearThreshold = 0.99f;

private:
    struct SegmentLocation {
        int i = -1;
        int j = -1;
        float t = 0.0f;
    };

    SegmentLocation locate(float t) const;

    std::vector<Point> points_;
};

/// Grid cells covered by the line. Each segment is walked in
/// max(|dx|, |dy|) unit steps, rounding to the nearest cell; consecutive
/// repeats are dropped.
/// @throws std::out_of_range if a point fails GridPos::inRange()
std::vector<GridPos> gridCells(const Polyline& line);

}  // namespace topomap
