#include "topomap/core/Topology.h"

#include <algorithm>
#include <cmath>

namespace topomap {

std::pair<Point, Point> Node::bounds() const {
    if (!pos) {
        return {};
    }
    Point center = pos->toPoint();
    if (!isMultiCell()) {
        return {center, center};
    }
    Point half{extents->width / 2.0f, extents->height / 2.0f};
    return {center - half, center + half};
}

std::pair<GridPos, GridPos> Node::footprintRange() const {
    if (!pos) {
        return {};
    }
    if (!isMultiCell()) {
        return {*pos, *pos + GridPos{1, 1}};
    }
    auto [minPt, maxPt] = bounds();
    GridPos minCell{static_cast<int>(std::ceil(minPt.x)), static_cast<int>(std::ceil(minPt.y))};
    GridPos maxCell{static_cast<int>(std::ceil(maxPt.x)), static_cast<int>(std::ceil(maxPt.y))};
    return {minCell, maxCell};
}

std::vector<GridPos> Node::footprint() const {
    std::vector<GridPos> cells;
    if (!pos) {
        return cells;
    }
    auto [minCell, maxCell] = footprintRange();
    for (int x = minCell.x; x < maxCell.x; ++x) {
        for (int y = minCell.y; y < maxCell.y; ++y) {
            cells.push_back({x, y});
        }
    }
    return cells;
}

Node* Topology::findNode(const NodeId& id) {
    auto it = nodes.find(id);
    return it != nodes.end() ? &it->second : nullptr;
}

const Node* Topology::findNode(const NodeId& id) const {
    auto it = nodes.find(id);
    return it != nodes.end() ? &it->second : nullptr;
}

Link* Topology::findLink(const LinkId& id) {
    auto it = links.find(id);
    return it != links.end() ? &it->second : nullptr;
}

const Link* Topology::findLink(const LinkId& id) const {
    auto it = links.find(id);
    return it != links.end() ? &it->second : nullptr;
}

Node& Topology::addNode(Node node) {
    NodeId id = node.id;
    return nodes[id] = std::move(node);
}

Link& Topology::addLink(Link link) {
    LinkId id = link.id;
    return links[id] = std::move(link);
}

std::vector<NodeId> Topology::sortedNodeIds() const {
    std::vector<NodeId> ids;
    ids.reserve(nodes.size());
    for (const auto& [id, node] : nodes) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<LinkId> Topology::sortedLinkIds() const {
    std::vector<LinkId> ids;
    ids.reserve(links.size());
    for (const auto& [id, link] : links) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

}  // namespace topomap
