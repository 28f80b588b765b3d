#pragma once

#include "topomap/core/Direction.h"
#include "topomap/core/Topology.h"
#include "topomap/routing/SparseGrid.h"

#include <vector>

namespace topomap {

/// Picks a label direction for every positioned node that has none.
///
/// Candidates are the eight neighbouring cells that are free of nodes,
/// labels and routed links. Each is scored by a direction cost (cardinal
/// cheaper than diagonal), an inverse-square repulsion from every other
/// node and a penalty per occupied cell around it; the lowest score wins.
/// Run it after routing so labels stay off the links.
class LabelPlacer {
public:
    static constexpr float CARDINAL_COST = 50.0f;
    static constexpr float DIAGONAL_COST = 100.0f;
    /// Occupied cell directly east or west of the candidate (text overlap)
    static constexpr float SIDE_NEIGHBOUR_PENALTY = 50.0f;
    static constexpr float NEIGHBOUR_PENALTY = 5.0f;

    /// Assign labelAt for nodes without one.
    /// @return Number of labels placed; nodes with no free cell stay unlabeled
    std::size_t place(Topology& topology);

    /// Score for putting the label of `id` in direction `dir`, i.e. at
    /// `candidate`. Lower is better. Repulsion is summed over `topology`
    /// as passed; neighbour penalties use the occupancy of the last
    /// place() call.
    float score(const Topology& topology, const NodeId& id,
                const GridPos& candidate, Direction dir) const;

    /// Cells occupied before placement started, plus every label placed so far
    const SparseGrid<bool>& occupied() const { return occupied_; }

private:
    void buildOccupancy(const Topology& topology, const std::vector<NodeId>& order);
    float scoreInOrder(const Topology& topology, const std::vector<NodeId>& order,
                       const NodeId& id, const GridPos& candidate, Direction dir) const;

    SparseGrid<bool> occupied_;
};

}  // namespace topomap
