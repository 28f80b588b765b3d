#pragma once

#include "topomap/routing/LinkRouter.h"

#include <optional>
#include <unordered_map>
#include <vector>

namespace topomap {
namespace algorithms {

/// Node of the implicit search graph: a cell, the direction of travel and
/// how many vias are still pending. The same cell and direction with a
/// different via count is a different state, which is what forces the
/// search through the vias in order without copying the grid.
struct SearchState {
    GridPos pos;
    int dirX = 0;
    int dirY = 0;
    int via = 0;

    bool hasDirection() const { return dirX != 0 || dirY != 0; }
    bool isDiagonal() const { return dirX != 0 && dirY != 0; }

    bool operator==(const SearchState& o) const {
        return pos == o.pos && dirX == o.dirX && dirY == o.dirY && via == o.via;
    }
    bool operator!=(const SearchState& o) const { return !(*this == o); }
};

struct SearchStateHash {
    std::size_t operator()(const SearchState& s) const {
        return std::hash<int>()(s.pos.x) ^
               (std::hash<int>()(s.pos.y) << 16) ^
               (std::hash<int>()((s.dirX + 1) * 3 + (s.dirY + 1)) << 24) ^
               (std::hash<int>()(s.via) << 28);
    }
};

/// A* search for a single link over the router's occupancy grids.
///
/// Moving states only continue straight; turning is a separate zero-length
/// edge at the same cell. Start states (no direction) fan out in all four
/// cardinal directions first, then the diagonals unless the router is
/// orthogonal.
class RouteFinder {
public:
    struct Request {
        LinkId linkId;                 ///< Cells held by this link are not penalised
        NodeId goalNode;
        std::vector<GridPos> starts;   ///< Several for multi-cell start nodes
        GridPos goal;
        std::vector<GridPos> vias;     ///< In travel order
    };

    static constexpr float STEP_COST = 1.0f;
    static constexpr float TURN_COST = 2.0f;
    /// A turn right after another turn; two spaced 45 degree turns (4)
    /// beat one in-place 90 degree turn (2 + 4)
    static constexpr float REPEATED_TURN_COST = 4.0f;
    /// First divisor of the side-cell penalty used to spread links
    static constexpr float SPREAD_PENALTY_DIVISOR = 16.0f;
    /// Scale applied to f = g + h before rounding to the integer priority
    static constexpr float PRIORITY_SCALE = 100.0f;

    explicit RouteFinder(const LinkRouter& router);

    /// @return The cheapest route found, or std::nullopt if the goal was not
    ///         reached within options().searchLimit iterations
    /// @throws InvariantError if the parent chain of the goal is corrupt
    std::optional<RouteResult> find(const Request& request);

private:
    template <typename Fn>
    void forEachNeighbour(const SearchState& current, Fn&& fn) const;

    float weight(const SearchState& from, const SearchState& to) const;
    float goalDistance(const SearchState& state) const;
    bool isGoalCell(const GridPos& pos) const;
    bool isGoal(const SearchState& state) const;
    std::optional<GridPos> viaAt(int pending) const;

    std::optional<RouteResult> buildRoute(const SearchState& goal, float weight) const;

    const LinkRouter& router_;
    const Request* request_ = nullptr;
    bool goalIsMulti_ = false;
    std::vector<GridPos> goalCells_;
    std::unordered_map<SearchState, SearchState, SearchStateHash> cameFrom_;
};

}  // namespace algorithms
}  // namespace topomap
