#pragma once

#include "Direction.h"
#include "Polyline.h"
#include "Types.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace topomap {

/// Rectangular size of a node in grid cells, centred on the node position
struct NodeExtents {
    float width = 0.0f;
    float height = 0.0f;
};

struct Node {
    NodeId id;
    std::optional<GridPos> pos;
    std::string label;
    std::string labelAt;   ///< Compass direction string, empty when unset
    std::string cssClass;
    std::optional<NodeExtents> extents;

    /// True when the node covers a rectangle of cells instead of one
    bool isMultiCell() const {
        return extents && extents->width > 0.0f && extents->height > 0.0f;
    }

    /// Continuous bounds of the footprint (pos +/- size / 2).
    /// For single-cell nodes both corners are the position.
    std::pair<Point, Point> bounds() const;

    /// Every cell of the footprint, x-major. A single-cell node yields its
    /// position, a node without a position yields nothing.
    std::vector<GridPos> footprint() const;

    /// Cell range of the footprint as [min, max) per axis
    std::pair<GridPos, GridPos> footprintRange() const;

    Direction labelDirection() const { return directionFromString(labelAt); }
};

struct Link {
    LinkId id;
    NodeId from;
    NodeId to;
    std::vector<GridPos> via;        ///< Mandatory waypoints, in order
    std::optional<float> splitAt;    ///< Where the two halves meet when drawn
    std::string cssClass;
    Polyline route;                  ///< Filled in by the router; non-empty on input means fixed

    bool isRouted() const { return !route.empty(); }
};

/// A full map: nodes and the links between them
class Topology {
public:
    std::unordered_map<NodeId, Node> nodes;
    std::unordered_map<LinkId, Link> links;

    Node* findNode(const NodeId& id);
    const Node* findNode(const NodeId& id) const;
    Link* findLink(const LinkId& id);
    const Link* findLink(const LinkId& id) const;

    /// Insert or replace; the id is taken from the value
    Node& addNode(Node node);
    Link& addLink(Link link);

    /// Ids in ascending order. Loops whose order affects output iterate these
    /// instead of the hash maps.
    std::vector<NodeId> sortedNodeIds() const;
    std::vector<LinkId> sortedLinkIds() const;
};

}  // namespace topomap
