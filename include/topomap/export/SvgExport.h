#pragma once

#include "topomap/core/Topology.h"
#include "IExporter.h"

#include <ostream>
#include <string>

namespace topomap {

/// Options for SVG export
struct SvgExportOptions {
    // Canvas settings
    float cellSize = 40.0f;   ///< Pixels per grid cell
    float padding = 20.0f;
    std::string backgroundColor = "white";

    // Node styling
    float nodeRadius = 8.0f;
    std::string nodeFill = "#e0e0e0";
    std::string nodeStroke = "#333333";
    float nodeStrokeWidth = 1.5f;
    float nodeCornerRadius = 8.0f;  ///< Multi-cell nodes

    // Link styling
    std::string linkStroke = "#4a90d9";
    float linkStrokeWidth = 4.0f;
    float defaultSplitAt = 0.5f;

    // Text styling
    std::string textFill = "#000000";
    std::string fontFamily = "Arial, sans-serif";
    float fontSize = 12.0f;

    bool showNodeLabels = true;
    bool embedStyles = true;
};

/// Renders a routed topology. Links are drawn as two polylines meeting at
/// the link's split point; links without a route are skipped.
class SvgExport : public IExporter {
public:
    SvgExport() = default;
    explicit SvgExport(const SvgExportOptions& options);
    ~SvgExport() override = default;

    std::string exportToString(const Topology& topology) override;
    void exportToStream(const Topology& topology, std::ostream& out) override;
    bool exportToFile(const Topology& topology, const std::string& filename) override;

    std::string fileExtension() const override { return "svg"; }
    std::string mimeType() const override { return "image/svg+xml"; }

    void setOptions(const SvgExportOptions& options) { options_ = options; }
    const SvgExportOptions& options() const { return options_; }

private:
    struct Bounds {
        Point min;
        Point max;
    };

    SvgExportOptions options_;

    Bounds computeBounds(const Topology& topology) const;

    void writeHeader(std::ostream& out, const Bounds& bounds);
    void writeStyles(std::ostream& out);
    void writeFooter(std::ostream& out);

    void writeNode(std::ostream& out, const Node& node);
    void writeNodeLabel(std::ostream& out, const Node& node);
    void writeLink(std::ostream& out, const Link& link);
    void writePolyline(std::ostream& out, const Polyline& line, const std::string& cssClass);

    static std::string escapeXml(const std::string& text);
};

}  // namespace topomap
