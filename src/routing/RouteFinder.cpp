#include "RouteFinder.h"
#include "topomap/common/Logger.h"
#include "topomap/routing/PriorityQueue.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_set>

namespace topomap {
namespace algorithms {

RouteFinder::RouteFinder(const LinkRouter& router)
    : router_(router) {}

std::optional<RouteResult> RouteFinder::find(const Request& request) {
    request_ = &request;
    cameFrom_.clear();

    if (request.starts.empty()) {
        return std::nullopt;
    }

    const Node* goalNode = router_.topology().findNode(request.goalNode);
    goalIsMulti_ = goalNode && goalNode->isMultiCell();
    goalCells_ = goalIsMulti_ ? goalNode->footprint() : std::vector<GridPos>{};

    // Rough size hint for the search tables
    auto hint = static_cast<std::size_t>(request.starts.front().chebyshevDistance(request.goal)) * 2;
    cameFrom_.reserve(hint);

    PriorityQueue<SearchState> openSet;
    std::unordered_map<SearchState, float, SearchStateHash> weights;
    weights.reserve(hint);

    // Seeding every start cell at cost 0 acts like a virtual source node
    // joined to all of them
    const int viaCount = static_cast<int>(request.vias.size());
    for (const GridPos& start : request.starts) {
        SearchState state{start, 0, 0, viaCount};
        if (weights.emplace(state, 0.0f).second) {
            openSet.push(state, 0);
        }
    }

    const int limit = router_.options().searchLimit;
    int iterations = 0;

    while (!openSet.empty() && iterations < limit) {
        SearchState current = *openSet.popMin();
        const float currentWeight = weights.at(current);

        // Any approach direction is accepted at the goal, so up to eight
        // goal states exist; the first one popped is the cheapest
        if (isGoal(current)) {
            return buildRoute(current, currentWeight);
        }

        forEachNeighbour(current, [&](const SearchState& next) {
            float newWeight = currentWeight + weight(current, next);

            auto it = weights.find(next);
            if (it == weights.end() || newWeight < it->second) {
                cameFrom_[next] = current;
                weights[next] = newWeight;

                // Pending vias are added unweighted. Not admissible, but it
                // pulls the search through the vias early.
                float h = goalDistance(next) + static_cast<float>(next.via);
                int priority = static_cast<int>(std::lround((newWeight + h) * PRIORITY_SCALE));
                openSet.push(next, priority);
            }
        });

        ++iterations;
    }

    LOG_TRACE("Search for link '{}' gave up after {} iterations ({} states)",
              request.linkId, iterations, weights.size());
    return std::nullopt;
}

bool RouteFinder::isGoalCell(const GridPos& pos) const {
    if (pos == request_->goal) {
        return true;
    }
    const NodeId* occupant = router_.nodeCells().find(pos);
    return occupant && *occupant == request_->goalNode;
}

bool RouteFinder::isGoal(const SearchState& state) const {
    return state.via == 0 && isGoalCell(state.pos);
}

std::optional<GridPos> RouteFinder::viaAt(int pending) const {
    const auto& vias = request_->vias;
    if (pending <= 0 || pending > static_cast<int>(vias.size())) {
        return std::nullopt;
    }
    return vias[vias.size() - static_cast<std::size_t>(pending)];
}

template <typename Fn>
void RouteFinder::forEachNeighbour(const SearchState& current, Fn&& fn) const {
    const RouterOptions& options = router_.options();
    // Copied out: fn() inserts into cameFrom_ and may rehash it
    std::optional<SearchState> previous;
    if (auto it = cameFrom_.find(current); it != cameFrom_.end()) {
        previous = it->second;
    }

    auto produce = [&](SearchState next) {
        if (next == current) {
            return;
        }
        if (previous && *previous == next) {
            return;
        }

        if (auto via = viaAt(current.via); via && next.pos == *via) {
            next.via -= 1;
        }

        if (isGoalCell(next.pos)) {
            if (goalIsMulti_ && options.attachMultiCellsCardinal && next.isDiagonal()) {
                return;
            }
            fn(next);
            return;
        }

        if (!router_.inExtents(next.pos)) {
            return;
        }
        if (options.avoidNodes && router_.nodeCells().contains(next.pos)) {
            return;
        }
        if (router_.labelCells().contains(next.pos)) {
            return;
        }
        fn(next);
    };

    if (!current.hasDirection()) {
        // Cardinal departures first: a slight bias towards leaving a node
        // axis-aligned, which matters for multi-cell nodes
        for (int dx = -1; dx <= 1; ++dx) {
            for (int dy = -1; dy <= 1; ++dy) {
                if ((dx == 0) == (dy == 0)) {
                    continue;
                }
                produce({current.pos + GridPos{dx, dy}, dx, dy, current.via});
            }
        }

        if (!options.orthogonal) {
            for (int dx = -1; dx <= 1; dx += 2) {
                for (int dy = -1; dy <= 1; dy += 2) {
                    produce({current.pos + GridPos{dx, dy}, dx, dy, current.via});
                }
            }
        }
        return;
    }

    // Straight on
    produce({current.pos + GridPos{current.dirX, current.dirY},
             current.dirX, current.dirY, current.via});

    // Turns stay on the same cell
    SearchState turn = current;
    if (options.orthogonal) {
        if (current.dirX == 0) {
            turn.dirY = 0;
            turn.dirX = current.dirY;
            produce(turn);
            turn.dirX = -current.dirY;
            produce(turn);
        } else {
            turn.dirX = 0;
            turn.dirY = current.dirX;
            produce(turn);
            turn.dirY = -current.dirX;
            produce(turn);
        }
        return;
    }

    // The two 45 degree turns
    if (current.dirX == 0) {
        turn = current;
        turn.dirX = 1;
        produce(turn);
        turn.dirX = -1;
        produce(turn);
    } else if (current.dirY != 0) {
        turn = current;
        turn.dirX = 0;
        produce(turn);
    }

    if (current.dirY == 0) {
        turn = current;
        turn.dirY = 1;
        produce(turn);
        turn.dirY = -1;
        produce(turn);
    } else if (current.dirX != 0) {
        turn = current;
        turn.dirY = 0;
        produce(turn);
    }
}

float RouteFinder::weight(const SearchState& from, const SearchState& to) const {
    const RouterOptions& options = router_.options();
    const auto& linkCells = router_.linkCells();
    const LinkId& self = request_->linkId;

    float dist = static_cast<float>(from.pos.chebyshevDistance(to.pos)) * STEP_COST;
    float linkPenalty = 0.0f;

    if (from.pos == to.pos) {
        dist = TURN_COST;
        auto previous = cameFrom_.find(from);
        if (previous != cameFrom_.end() && previous->second.pos == from.pos) {
            dist = REPEATED_TURN_COST;
        }
        return dist;
    }

    if (isGoalCell(to.pos)) {
        return dist;
    }

    // Each other link in the cell costs less than the previous one:
    // 1, 1/2, 1/4, ...
    float divisor = 1.0f;
    if (const auto* links = linkCells.find(to.pos)) {
        for (const LinkId& link : *links) {
            if (link != self) {
                linkPenalty += 1.0f / divisor;
                divisor *= 2.0f;
            }
        }
    }

    // A diagonal move from a to b crosses any link that holds both side
    // cells s1 and s2, even when b itself is free:
    //
    //   a  s1
    //   s2 b
    //
    // Only moving states are checked; the first step out of a start cell
    // is never counted as a crossing.
    if (from.isDiagonal()) {
        const auto* side1 = linkCells.find({from.pos.x + from.dirX, from.pos.y});
        const auto* side2 = linkCells.find({from.pos.x, from.pos.y + from.dirY});
        if (side1 && side2) {
            for (const LinkId& link : *side1) {
                if (link == self) {
                    continue;
                }
                if (std::find(side2->begin(), side2->end(), link) != side2->end()) {
                    linkPenalty += 1.0f / divisor;
                    divisor *= 2.0f;
                }
            }
        }
    }

    if (options.spreadLinks) {
        // Small penalty for links just ahead and to the side, so routes
        // fan out from shared endpoints instead of bunching up
        auto spreadPenalty = [&](const GridPos& at) {
            const auto* links = linkCells.find(at);
            if (!links) {
                return;
            }
            float spreadDivisor = SPREAD_PENALTY_DIVISOR;
            for (const LinkId& link : *links) {
                if (link != self) {
                    linkPenalty += 1.0f / spreadDivisor;
                    spreadDivisor *= 2.0f;
                }
            }
        };

        if (to.dirX == 0) {
            spreadPenalty({to.pos.x + 1, to.pos.y + to.dirY});
            spreadPenalty({to.pos.x - 1, to.pos.y + to.dirY});
        } else if (to.dirY != 0) {
            spreadPenalty({to.pos.x, to.pos.y + to.dirY});
        }
        if (to.dirY == 0) {
            spreadPenalty({to.pos.x + to.dirX, to.pos.y + 1});
            spreadPenalty({to.pos.x + to.dirX, to.pos.y - 1});
        } else if (to.dirX != 0) {
            spreadPenalty({to.pos.x + to.dirX, to.pos.y});
        }
    }

    return dist + linkPenalty * options.linkPenaltyWeight;
}

float RouteFinder::goalDistance(const SearchState& state) const {
    if (!goalIsMulti_) {
        return static_cast<float>(state.pos.chebyshevDistance(request_->goal));
    }

    int best = std::numeric_limits<int>::max();
    for (const GridPos& cell : goalCells_) {
        best = std::min(best, state.pos.chebyshevDistance(cell));
    }
    return static_cast<float>(best);
}

std::optional<RouteResult> RouteFinder::buildRoute(const SearchState& goal, float weight) const {
    auto parent = cameFrom_.find(goal);
    if (parent == cameFrom_.end()) {
        // The goal was one of the start cells
        return std::nullopt;
    }

    std::vector<GridPos> cells{goal.pos};
    std::unordered_set<SearchState, SearchStateHash> visited{goal};

    // Every link of the chain is a distinct entry of cameFrom_
    const std::size_t maxSteps = cameFrom_.size() + 1;
    std::size_t steps = 0;

    while (parent != cameFrom_.end()) {
        if (++steps > maxSteps) {
            throw InvariantError("Route reconstruction for link '" + request_->linkId +
                                 "' walked more steps than states explored");
        }
        const SearchState& state = parent->second;
        if (!visited.insert(state).second) {
            throw InvariantError(fmt::format("Loop in parent chain of link '{}' at ({}, {})",
                                             request_->linkId, state.pos.x, state.pos.y));
        }
        cells.push_back(state.pos);
        parent = cameFrom_.find(state);
    }

    Polyline path;
    path.reserve(cells.size());
    for (auto it = cells.rbegin(); it != cells.rend(); ++it) {
        path.push_back(it->toPoint());
    }

    return RouteResult{request_->linkId, path.fix(), weight};
}

}  // namespace algorithms
}  // namespace topomap
