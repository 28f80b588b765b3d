#pragma once

#include "topomap/core/Polyline.h"
#include "topomap/core/Topology.h"
#include "topomap/routing/RouterOptions.h"
#include "topomap/routing/SparseGrid.h"

#include <optional>
#include <utility>
#include <vector>

namespace topomap {

/// Outcome of routing a single link
struct RouteResult {
    LinkId id;
    Polyline path;        ///< One point per grid cell, start to goal
    float weight = 0.0f;  ///< Accumulated search cost, used to rank routes
};

/// Routes every link of a topology through a shared grid.
///
/// The router owns three occupancy grids built from the topology at
/// construction: node cells (multi-cell footprints included), node label
/// cells and, per cell, the links passing through it. addRoute, removeRoute
/// and moveRoute are the only operations that change link occupancy; the
/// single-link search only reads it.
///
/// Example:
/// @code
/// topomap::LinkRouter router(topology);
/// auto [lo, hi] = router.extents();
/// router.setExtents(lo.x - 1, lo.y - 1, hi.x + 1, hi.y + 1);
/// router.routeLinks();
/// @endcode
///
/// Not thread-safe; one routing run per instance at a time.
class LinkRouter {
public:
    explicit LinkRouter(Topology& topology, const RouterOptions& options = {});

    const RouterOptions& options() const { return options_; }
    void setOptions(const RouterOptions& options) { options_ = options; }

    /// Override the search bounds (inclusive). Corners may be given in any
    /// order. Nodes or vias outside the bounds make their links unroutable.
    void setExtents(int minX, int minY, int maxX, int maxY);

    /// Inclusive search bounds, derived from nodes, labels, vias and existing
    /// routes unless overridden
    std::pair<GridPos, GridPos> extents() const { return {extentMin_, extentMax_}; }

    bool inExtents(const GridPos& pos) const {
        return pos.x >= extentMin_.x && pos.x <= extentMax_.x &&
               pos.y >= extentMin_.y && pos.y <= extentMax_.y;
    }

    /// Route every link that has no route yet and write the routes back to
    /// the topology. Runs the independent, aware and fix-point passes.
    /// @return Number of links holding a route afterwards
    std::size_t routeLinks();

    /// Run one search for the link against the current occupancy.
    /// Nothing is modified.
    /// @return std::nullopt if the link is malformed, out of bounds or
    ///         no route was found within the search limit
    std::optional<RouteResult> routeLink(const LinkId& id) const;

    /// Register every cell of path as occupied by the link
    void addRoute(const LinkId& id, const Polyline& path);

    /// Release every cell of path held by the link
    void removeRoute(const LinkId& id, const Polyline& path);

    /// removeRoute(oldPath) followed by addRoute(newPath)
    void moveRoute(const LinkId& id, const Polyline& oldPath, const Polyline& newPath);

    const Topology& topology() const { return topology_; }
    const SparseGrid<NodeId>& nodeCells() const { return nodes_; }
    const SparseGrid<bool>& labelCells() const { return nodeLabels_; }
    const SparseGrid<std::vector<LinkId>>& linkCells() const { return links_; }

private:
    void addLinkCell(const GridPos& pos, const LinkId& id);
    void removeLinkCell(const GridPos& pos, const LinkId& id);
    void growExtents(const GridPos& pos);

    Topology& topology_;
    RouterOptions options_;

    SparseGrid<NodeId> nodes_;
    SparseGrid<bool> nodeLabels_;
    SparseGrid<std::vector<LinkId>> links_;

    GridPos extentMin_;
    GridPos extentMax_;
    bool hasExtents_ = false;
};

}  // namespace topomap
