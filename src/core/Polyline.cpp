#include "topomap/core/Polyline.h"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace topomap {

namespace {

float pairwiseSum(const float* values, std::size_t count) {
    if (count == 0) return 0.0f;
    if (count == 1) return values[0];
    std::size_t half = count / 2;
    return pairwiseSum(values, half) + pairwiseSum(values + half, count - half);
}

}  // namespace

float Polyline::length() const {
    if (points_.size() <= 1) {
        return 0.0f;
    }

    std::vector<float> lengths;
    lengths.reserve(points_.size() - 1);
    for (std::size_t i = 0; i + 1 < points_.size(); ++i) {
        lengths.push_back(points_[i].distanceTo(points_[i + 1]));
    }
    return pairwiseSum(lengths.data(), lengths.size());
}

Polyline Polyline::fix() const {
    Polyline result;
    if (points_.empty()) {
        return result;
    }
    result.reserve(points_.size());

    for (const Point& p : points_) {
        if (std::isnan(p.x) || std::isnan(p.y)) {
            continue;
        }
        if (result.empty() || result.back() != p) {
            result.push_back(p);
        }
    }
    return result;
}

Polyline Polyline::simplify() const {
    if (points_.size() <= 2) {
        return *this;
    }

    Polyline result;
    result.push_back(points_.front());

    for (std::size_t i = 1; i + 1 < points_.size(); ++i) {
        Point prevDir = (points_[i] - points_[i - 1]).normalized();
        Point nextDir = (points_[i + 1] - points_[i]).normalized();

        if (prevDir.dot(nextDir) < kColinearThreshold) {
            result.push_back(points_[i]);
        }
    }

    result.push_back(points_.back());
    return result;
}

Polyline Polyline::subdivide(int count) const {
    if (count <= 1 || points_.size() < 2) {
        return *this;
    }

    Polyline result;
    result.reserve(points_.size() * static_cast<std::size_t>(count));
    for (std::size_t i = 0; i + 1 < points_.size(); ++i) {
        for (int j = 0; j < count; ++j) {
            float t = static_cast<float>(j) / static_cast<float>(count);
            result.push_back(points_[i].lerp(points_[i + 1], t));
        }
    }
    result.push_back(points_.back());
    return result;
}

Polyline::SegmentLocation Polyline::locate(float t) const {
    if (points_.empty()) {
        return {-1, -1, t};
    }
    if (points_.size() == 1 || t <= 0.0f) {
        return {0, 0, 0.0f};
    }
    if (t >= 1.0f) {
        int last = static_cast<int>(points_.size()) - 1;
        return {last, last, 1.0f};
    }
    if (points_.size() == 2) {
        return {0, 1, t};
    }

    float targetLen = length() * t;
    float curLen = 0.0f;

    for (std::size_t i = 0; i + 1 < points_.size(); ++i) {
        float segLen = points_[i].distanceTo(points_[i + 1]);
        if (segLen == 0.0f) {
            continue;
        }
        float nextLen = curLen + segLen;
        int idx = static_cast<int>(i);
        if (nextLen == targetLen) {
            return {idx + 1, idx + 1, 0.0f};
        }
        if (nextLen > targetLen) {
            return {idx, idx + 1, (targetLen - curLen) / segLen};
        }
        curLen = nextLen;
    }

    // Round-off left targetLen past the accumulated length
    int last = static_cast<int>(points_.size()) - 1;
    return {last, last, 1.0f};
}

Point Polyline::interpolate(float t) const {
    SegmentLocation loc = locate(t);
    if (loc.i < 0) {
        return {};
    }
    if (loc.i == loc.j) {
        return points_[static_cast<std::size_t>(loc.i)];
    }
    return points_[static_cast<std::size_t>(loc.i)].lerp(
        points_[static_cast<std::size_t>(loc.j)], loc.t);
}

std::pair<Polyline, Polyline> Polyline::splitAt(float t) const {
    SegmentLocation loc = locate(t);
    if (loc.i < 0) {
        return {};
    }

    auto i = static_cast<std::size_t>(loc.i);
    auto j = static_cast<std::size_t>(loc.j);

    Polyline first(std::vector<Point>(points_.begin(), points_.begin() + i + 1));
    Polyline second;

    if (i != j) {
        Point split = points_[i].lerp(points_[j], loc.t);
        first.push_back(split);
        second.push_back(split);
    }
    for (std::size_t k = j; k < points_.size(); ++k) {
        second.push_back(points_[k]);
    }
    return {first, second};
}

Polyline Polyline::translated(const Point& offset) const {
    Polyline result;
    result.reserve(points_.size());
    for (const Point& p : points_) {
        result.push_back(p + offset);
    }
    return result;
}

Polyline Polyline::scaled(float factor) const {
    Polyline result;
    result.reserve(points_.size());
    for (const Point& p : points_) {
        result.push_back(p * factor);
    }
    return result;
}

std::vector<GridPos> gridCells(const Polyline& line) {
    std::vector<GridPos> cells;
    if (line.empty()) {
        return cells;
    }

    for (const Point& p : line) {
        if (!GridPos::inRange(p)) {
            throw std::out_of_range(fmt::format(
                "Point ({}, {}) lies outside the routing grid", p.x, p.y));
        }
    }

    auto append = [&cells](const GridPos& pos) {
        if (cells.empty() || cells.back() != pos) {
            cells.push_back(pos);
        }
    };

    append(GridPos::fromPoint(line.front()));
    for (std::size_t i = 0; i + 1 < line.size(); ++i) {
        const Point& a = line[i];
        const Point& b = line[i + 1];
        float span = std::max(std::fabs(b.x - a.x), std::fabs(b.y - a.y));
        int steps = static_cast<int>(std::ceil(span));
        for (int s = 1; s <= steps; ++s) {
            float t = static_cast<float>(s) / static_cast<float>(steps);
            append(GridPos::fromPoint(a.lerp(b, t)));
        }
        append(GridPos::fromPoint(b));
    }
    return cells;
}

}  // namespace topomap
