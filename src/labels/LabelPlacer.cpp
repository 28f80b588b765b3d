#include "topomap/labels/LabelPlacer.h"
#include "topomap/common/Logger.h"

namespace topomap {

void LabelPlacer::buildOccupancy(const Topology& topology, const std::vector<NodeId>& order) {
    occupied_.clear();

    for (const NodeId& id : order) {
        const Node& node = topology.nodes.at(id);
        if (!node.pos) {
            continue;
        }
        for (const GridPos& cell : node.footprint()) {
            occupied_.set(cell, true);
        }

        GridPos labelAt = moveGridPos(*node.pos, node.labelDirection());
        if (labelAt != *node.pos) {
            occupied_.set(labelAt, true);
        }
    }

    for (const auto& [id, link] : topology.links) {
        for (const GridPos& cell : gridCells(link.route)) {
            occupied_.set(cell, true);
        }
    }
}

std::size_t LabelPlacer::place(Topology& topology) {
    const std::vector<NodeId> order = topology.sortedNodeIds();
    buildOccupancy(topology, order);

    std::size_t placed = 0;
    for (const NodeId& id : order) {
        Node& node = topology.nodes.at(id);
        if (!node.pos || !node.labelAt.empty()) {
            continue;
        }

        Direction bestDir = Direction::None;
        float bestScore = 0.0f;
        for (Direction dir : kCompassDirections) {
            GridPos candidate = moveGridPos(*node.pos, dir);
            if (occupied_.contains(candidate)) {
                continue;
            }
            float s = scoreInOrder(topology, order, id, candidate, dir);
            if (bestDir == Direction::None || s < bestScore) {
                bestScore = s;
                bestDir = dir;
            }
        }

        if (bestDir == Direction::None) {
            LOG_DEBUG("No free cell around node '{}', label omitted", id);
            continue;
        }

        node.labelAt = directionToString(bestDir);
        occupied_.set(moveGridPos(*node.pos, bestDir), true);
        ++placed;
    }

    return placed;
}

float LabelPlacer::score(const Topology& topology, const NodeId& id,
                         const GridPos& candidate, Direction dir) const {
    return scoreInOrder(topology, topology.sortedNodeIds(), id, candidate, dir);
}

float LabelPlacer::scoreInOrder(const Topology& topology, const std::vector<NodeId>& order,
                                const NodeId& id, const GridPos& candidate,
                                Direction dir) const {
    const float dirCost = isCardinal(dir) ? CARDINAL_COST : DIAGONAL_COST;
    const Point at = candidate.toPoint();
    float total = 0.0f;

    // Other nodes push the label away: dirCost / d^2
    for (const NodeId& other : order) {
        if (other == id) {
            continue;
        }
        const Node* node = topology.findNode(other);
        if (!node || !node->pos) {
            continue;
        }
        float dist = at.distanceTo(node->pos->toPoint());
        if (dist > 0.0f) {
            total += dirCost / (dist * dist);
        }
    }

    for (Direction around : kCompassDirections) {
        // That cell is the node being labeled
        if (around == opposite(dir)) {
            continue;
        }
        if (!occupied_.contains(moveGridPos(candidate, around))) {
            continue;
        }
        total += (around == Direction::E || around == Direction::W)
                     ? SIDE_NEIGHBOUR_PENALTY
                     : NEIGHBOUR_PENALTY;
    }

    return total;
}

}  // namespace topomap
