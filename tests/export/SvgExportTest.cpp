#include <gtest/gtest.h>
#include <topomap/export/SvgExport.h>

#include <cstdio>
#include <fstream>

using namespace topomap;

namespace {

std::size_t countOccurrences(const std::string& text, const std::string& needle) {
    std::size_t count = 0;
    std::size_t pos = 0;
    while ((pos = text.find(needle, pos)) != std::string::npos) {
        ++count;
        ++pos;
    }
    return count;
}

Topology makeRoutedPair() {
    Topology topology;
    Node a;
    a.id = "a";
    a.pos = GridPos{0, 0};
    a.labelAt = "n";
    topology.addNode(a);

    Node b;
    b.id = "b";
    b.pos = GridPos{5, 0};
    b.label = "R&D <lab>";
    b.labelAt = "e";
    topology.addNode(b);

    Link link;
    link.id = "a-b";
    link.from = "a";
    link.to = "b";
    link.cssClass = "backbone";
    link.route = Polyline{{0, 0}, {1, 0}, {2, 0}, {3, 0}, {4, 0}, {5, 0}};
    topology.addLink(link);
    return topology;
}

}  // namespace

// ============================================================================
// SvgExportTest - routed map rendering
// ============================================================================

TEST(SvgExportTest, RoutedPair_ProducesValidSvg) {
    Topology topology = makeRoutedPair();

    SvgExport svg;
    std::string output = svg.exportToString(topology);

    EXPECT_NE(output.find("<?xml"), std::string::npos);
    EXPECT_NE(output.find("<svg"), std::string::npos);
    EXPECT_NE(output.find("</svg>"), std::string::npos);

    EXPECT_EQ(countOccurrences(output, "<circle"), 2u);
    EXPECT_EQ(countOccurrences(output, "<rect"), 1u);  // Background only
    EXPECT_EQ(countOccurrences(output, "<text"), 2u);
}

TEST(SvgExportTest, Link_DrawnAsTwoHalves) {
    Topology topology = makeRoutedPair();

    SvgExportOptions options;
    options.cellSize = 10.0f;
    SvgExport svg(options);
    std::string output = svg.exportToString(topology);

    EXPECT_EQ(countOccurrences(output, "<polyline"), 2u);
    EXPECT_NE(output.find("link link-from backbone"), std::string::npos);
    EXPECT_NE(output.find("link link-to backbone"), std::string::npos);
    // Simplified to a straight line and split in the middle
    EXPECT_NE(output.find("points=\"0,0 25,0\""), std::string::npos);
    EXPECT_NE(output.find("points=\"25,0 50,0\""), std::string::npos);
}

TEST(SvgExportTest, SplitAt_MovesMeetingPoint) {
    Topology topology = makeRoutedPair();
    topology.links.at("a-b").splitAt = 0.2f;

    SvgExportOptions options;
    options.cellSize = 10.0f;
    SvgExport svg(options);
    std::string output = svg.exportToString(topology);

    EXPECT_NE(output.find("points=\"0,0 10,0\""), std::string::npos);
}

TEST(SvgExportTest, UnroutedLink_NotDrawn) {
    Topology topology = makeRoutedPair();
    topology.links.at("a-b").route.clear();

    SvgExport svg;
    EXPECT_EQ(countOccurrences(svg.exportToString(topology), "<polyline"), 0u);
}

TEST(SvgExportTest, Labels_EscapedAndAnchored) {
    Topology topology = makeRoutedPair();

    SvgExport svg;
    std::string output = svg.exportToString(topology);

    EXPECT_NE(output.find("R&amp;D &lt;lab&gt;"), std::string::npos);
    EXPECT_EQ(output.find("R&D"), std::string::npos);
    // Label east of b starts at the node, label north of a is centred
    EXPECT_NE(output.find("text-anchor=\"start\">R&amp;D"), std::string::npos);
    EXPECT_NE(output.find("text-anchor=\"middle\">a<"), std::string::npos);
}

TEST(SvgExportTest, MultiCellNode_IsRect) {
    Topology topology;
    Node rack;
    rack.id = "rack";
    rack.pos = GridPos{0, 0};
    rack.extents = NodeExtents{3.0f, 10.0f};
    rack.labelAt = "c";
    rack.cssClass = "core";
    topology.addNode(rack);

    SvgExportOptions options;
    options.cellSize = 10.0f;
    SvgExport svg(options);
    std::string output = svg.exportToString(topology);

    EXPECT_EQ(countOccurrences(output, "<rect"), 2u);
    EXPECT_EQ(countOccurrences(output, "<circle"), 0u);
    EXPECT_NE(output.find("class=\"node core\""), std::string::npos);
    EXPECT_NE(output.find("width=\"30\" height=\"100\""), std::string::npos);
    // "c" labels sit in the middle of the rectangle
    EXPECT_NE(output.find("x=\"0\" y=\"0\" text-anchor=\"middle\""), std::string::npos);
}

TEST(SvgExportTest, NoStyles_WhenDisabled) {
    SvgExportOptions options;
    options.embedStyles = false;
    SvgExport svg(options);

    EXPECT_EQ(svg.exportToString(makeRoutedPair()).find("<style>"), std::string::npos);
    EXPECT_EQ(svg.fileExtension(), "svg");
    EXPECT_EQ(svg.mimeType(), "image/svg+xml");
}

TEST(SvgExportTest, ExportToFile) {
    SvgExport svg;
    std::string path = ::testing::TempDir() + "topomap_export_test.svg";

    ASSERT_TRUE(svg.exportToFile(makeRoutedPair(), path));
    std::ifstream file(path);
    std::string firstLine;
    std::getline(file, firstLine);
    EXPECT_EQ(firstLine.rfind("<?xml", 0), 0u);
    std::remove(path.c_str());

    EXPECT_FALSE(svg.exportToFile(makeRoutedPair(), "/nonexistent/dir/map.svg"));
}
