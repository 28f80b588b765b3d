#include <gtest/gtest.h>
#include <topomap/core/Topology.h>

#include <algorithm>

using namespace topomap;

namespace {

Node makeNode(const NodeId& id, GridPos pos) {
    Node node;
    node.id = id;
    node.pos = pos;
    return node;
}

bool containsCell(const std::vector<GridPos>& cells, const GridPos& pos) {
    return std::find(cells.begin(), cells.end(), pos) != cells.end();
}

}  // namespace

// ============================================================================
// Node footprint
// ============================================================================

TEST(TopologyTest, SingleCellFootprintIsPosition) {
    Node node = makeNode("a", {3, -2});

    EXPECT_FALSE(node.isMultiCell());
    ASSERT_EQ(node.footprint().size(), 1u);
    EXPECT_EQ(node.footprint()[0], GridPos(3, -2));
}

TEST(TopologyTest, NodeWithoutPositionHasNoFootprint) {
    Node node;
    node.id = "floating";
    EXPECT_TRUE(node.footprint().empty());
}

TEST(TopologyTest, ZeroExtentsAreSingleCell) {
    Node node = makeNode("a", {0, 0});
    node.extents = NodeExtents{0.0f, 4.0f};
    EXPECT_FALSE(node.isMultiCell());
    EXPECT_EQ(node.footprint().size(), 1u);
}

TEST(TopologyTest, MultiCellFootprintIsCentred) {
    Node node = makeNode("rack", {0, 0});
    node.extents = NodeExtents{3.0f, 10.0f};

    ASSERT_TRUE(node.isMultiCell());
    auto [minCell, maxCell] = node.footprintRange();
    EXPECT_EQ(minCell, GridPos(-1, -5));
    EXPECT_EQ(maxCell, GridPos(2, 5));

    std::vector<GridPos> cells = node.footprint();
    EXPECT_EQ(cells.size(), 30u);
    EXPECT_TRUE(containsCell(cells, {-1, -5}));
    EXPECT_TRUE(containsCell(cells, {1, 4}));
    EXPECT_FALSE(containsCell(cells, {2, 0}));
    EXPECT_FALSE(containsCell(cells, {0, 5}));
}

TEST(TopologyTest, EvenExtentsCoverExactCellCount) {
    Node node = makeNode("sw", {4, 4});
    node.extents = NodeExtents{2.0f, 2.0f};

    auto [lo, hi] = node.bounds();
    EXPECT_EQ(lo, Point(3, 3));
    EXPECT_EQ(hi, Point(5, 5));
    EXPECT_EQ(node.footprint().size(), 4u);
}

TEST(TopologyTest, LabelDirectionParsesLabelAt) {
    Node node = makeNode("a", {0, 0});
    EXPECT_EQ(node.labelDirection(), Direction::None);
    node.labelAt = "sw";
    EXPECT_EQ(node.labelDirection(), Direction::SW);
}

// ============================================================================
// Topology container
// ============================================================================

TEST(TopologyTest, FindAndReplace) {
    Topology topology;
    topology.addNode(makeNode("a", {0, 0}));

    ASSERT_NE(topology.findNode("a"), nullptr);
    EXPECT_EQ(topology.findNode("b"), nullptr);
    EXPECT_EQ(topology.findLink("a-b"), nullptr);

    topology.addNode(makeNode("a", {7, 7}));
    EXPECT_EQ(topology.nodes.size(), 1u);
    EXPECT_EQ(*topology.findNode("a")->pos, GridPos(7, 7));
}

TEST(TopologyTest, SortedIds) {
    Topology topology;
    for (const char* id : {"delta", "alpha", "charlie", "bravo"}) {
        topology.addNode(makeNode(id, {0, 0}));
    }
    Link link;
    link.id = "z";
    topology.addLink(link);
    link.id = "m";
    topology.addLink(link);

    std::vector<NodeId> expectedNodes{"alpha", "bravo", "charlie", "delta"};
    std::vector<LinkId> expectedLinks{"m", "z"};
    EXPECT_EQ(topology.sortedNodeIds(), expectedNodes);
    EXPECT_EQ(topology.sortedLinkIds(), expectedLinks);
}

TEST(TopologyTest, LinkIsRoutedWhenRouteSet) {
    Link link;
    EXPECT_FALSE(link.isRouted());
    link.route = Polyline{{0, 0}, {1, 0}};
    EXPECT_TRUE(link.isRouted());
}
