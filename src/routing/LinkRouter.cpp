#include "topomap/routing/LinkRouter.h"
#include "RouteFinder.h"
#include "topomap/common/Logger.h"

#include <algorithm>

namespace topomap {

LinkRouter::LinkRouter(Topology& topology, const RouterOptions& options)
    : topology_(topology), options_(options) {

    // Sorted ids: overlapping nodes resolve the same way on every run
    for (const NodeId& id : topology_.sortedNodeIds()) {
        const Node& node = topology_.nodes.at(id);
        if (!node.pos) {
            continue;
        }
        const GridPos pos = *node.pos;
        growExtents(pos);
        nodes_.set(pos, id);

        if (node.isMultiCell()) {
            for (const GridPos& cell : node.footprint()) {
                nodes_.set(cell, id);
            }
            auto [minCell, maxCell] = node.footprintRange();
            growExtents(minCell);
            growExtents(maxCell);
        }

        GridPos labelAt = moveGridPos(pos, node.labelDirection());
        if (labelAt != pos) {
            nodeLabels_.set(labelAt, true);
            growExtents(labelAt);
        }
    }

    for (const LinkId& id : topology_.sortedLinkIds()) {
        const Link& link = topology_.links.at(id);

        if (link.isRouted()) {
            addRoute(id, link.route);
            continue;
        }

        // Claiming the vias and endpoints up front nudges other links away
        // from them during the first pass
        for (const GridPos& via : link.via) {
            addLinkCell(via, id);
        }
        if (const Node* from = topology_.findNode(link.from); from && from->pos) {
            addLinkCell(*from->pos, id);
        }
        if (const Node* to = topology_.findNode(link.to); to && to->pos) {
            addLinkCell(*to->pos, id);
        }
    }

    LOG_DEBUG("Grid extents ({}, {}) to ({}, {}), {} node cells, {} label cells",
              extentMin_.x, extentMin_.y, extentMax_.x, extentMax_.y,
              nodes_.size(), nodeLabels_.size());
}

void LinkRouter::setExtents(int minX, int minY, int maxX, int maxY) {
    GridPos a{minX, minY};
    GridPos b{maxX, maxY};
    extentMin_ = a.min(b);
    extentMax_ = a.max(b);
    hasExtents_ = true;
}

void LinkRouter::growExtents(const GridPos& pos) {
    if (!hasExtents_) {
        extentMin_ = pos;
        extentMax_ = pos;
        hasExtents_ = true;
        return;
    }
    extentMin_ = extentMin_.min(pos);
    extentMax_ = extentMax_.max(pos);
}

void LinkRouter::addLinkCell(const GridPos& pos, const LinkId& id) {
    links_.appendUnique(pos, id);
    growExtents(pos);
}

void LinkRouter::removeLinkCell(const GridPos& pos, const LinkId& id) {
    links_.removeValue(pos, id);
}

void LinkRouter::addRoute(const LinkId& id, const Polyline& path) {
    for (const GridPos& cell : gridCells(path)) {
        addLinkCell(cell, id);
    }
}

void LinkRouter::removeRoute(const LinkId& id, const Polyline& path) {
    for (const GridPos& cell : gridCells(path)) {
        removeLinkCell(cell, id);
    }
}

void LinkRouter::moveRoute(const LinkId& id, const Polyline& oldPath, const Polyline& newPath) {
    removeRoute(id, oldPath);
    addRoute(id, newPath);
}

std::optional<RouteResult> LinkRouter::routeLink(const LinkId& id) const {
    const Link* link = topology_.findLink(id);
    if (!link) {
        return std::nullopt;
    }

    const Node* start = topology_.findNode(link->from);
    const Node* goal = topology_.findNode(link->to);
    if (!start || !start->pos || !goal || !goal->pos) {
        LOG_DEBUG("Skipping link '{}': endpoint missing or without position", id);
        return std::nullopt;
    }

    if (!inExtents(*start->pos) || !inExtents(*goal->pos)) {
        LOG_DEBUG("Skipping link '{}': endpoint outside the grid extents", id);
        return std::nullopt;
    }
    for (const GridPos& via : link->via) {
        if (!inExtents(via)) {
            LOG_DEBUG("Skipping link '{}': via ({}, {}) outside the grid extents", id, via.x, via.y);
            return std::nullopt;
        }
    }

    algorithms::RouteFinder::Request request;
    request.linkId = id;
    request.goalNode = link->to;
    request.goal = *goal->pos;
    request.vias = link->via;

    // A multi-cell start node can be left from any cell on its boundary
    if (start->isMultiCell()) {
        auto [minCell, maxCell] = start->footprintRange();
        for (int x = minCell.x; x < maxCell.x; ++x) {
            request.starts.push_back({x, minCell.y});
            if (maxCell.y - 1 > minCell.y) {
                request.starts.push_back({x, maxCell.y - 1});
            }
        }
        for (int y = minCell.y + 1; y < maxCell.y - 1; ++y) {
            request.starts.push_back({minCell.x, y});
            if (maxCell.x - 1 > minCell.x) {
                request.starts.push_back({maxCell.x - 1, y});
            }
        }
    } else {
        request.starts.push_back(*start->pos);
    }

    algorithms::RouteFinder finder(*this);
    return finder.find(request);
}

std::size_t LinkRouter::routeLinks() {
    // Pass 1: route each link on its own against whatever is already on
    // the grid, registering every result as soon as it is found.
    std::vector<RouteResult> routes;
    std::size_t pending = 0;
    for (const LinkId& id : topology_.sortedLinkIds()) {
        Link& link = topology_.links.at(id);
        if (link.isRouted()) {
            continue;
        }
        ++pending;

        auto route = routeLink(id);
        if (!route) {
            LOG_DEBUG("No route found for link '{}'", id);
            continue;
        }
        addRoute(id, route->path);
        link.route = route->path;
        routes.push_back(std::move(*route));
    }
    LOG_DEBUG("Independent pass routed {} of {} links", routes.size(), pending);

    // Pass 2: cheapest links first, each re-routed with full knowledge of
    // the others. Its footprint moves immediately so later links see it.
    std::stable_sort(routes.begin(), routes.end(),
                     [](const RouteResult& a, const RouteResult& b) { return a.weight < b.weight; });

    std::vector<RouteResult> refined;
    refined.reserve(routes.size());
    for (const RouteResult& initial : routes) {
        auto route = routeLink(initial.id);
        if (!route) {
            continue;
        }
        moveRoute(initial.id, initial.path, route->path);
        topology_.links.at(initial.id).route = route->path;
        refined.push_back(std::move(*route));
    }

    // Pass 3: favour short links, which have the fewest alternatives, and
    // keep re-routing until a whole round brings no improvement
    auto weightRatio = [](const RouteResult& r) {
        return r.weight > 0.0f ? r.path.length() / r.weight : 0.0f;
    };
    std::stable_sort(refined.begin(), refined.end(),
                     [&](const RouteResult& a, const RouteResult& b) {
                         return weightRatio(a) < weightRatio(b);
                     });

    int rounds = 0;
    bool updated = true;
    while (updated && rounds < options_.routeIterLimit) {
        updated = false;
        ++rounds;
        for (RouteResult& current : refined) {
            auto route = routeLink(current.id);
            if (!route || route->weight >= current.weight) {
                continue;
            }
            moveRoute(current.id, current.path, route->path);
            topology_.links.at(current.id).route = route->path;
            current = std::move(*route);
            updated = true;
        }
    }
    LOG_DEBUG("Fix-point pass finished after {} round(s)", rounds);

    std::size_t routed = 0;
    for (const auto& [id, link] : topology_.links) {
        if (link.isRouted()) {
            ++routed;
        }
    }
    return routed;
}

}  // namespace topomap
