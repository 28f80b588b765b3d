#include "topomap/export/SvgExport.h"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace topomap {

SvgExport::SvgExport(const SvgExportOptions& options)
    : options_(options) {}

std::string SvgExport::exportToString(const Topology& topology) {
    std::ostringstream out;
    exportToStream(topology, out);
    return out.str();
}

void SvgExport::exportToStream(const Topology& topology, std::ostream& out) {
    writeHeader(out, computeBounds(topology));
    writeStyles(out);

    // Links first so nodes are drawn on top
    for (const LinkId& id : topology.sortedLinkIds()) {
        writeLink(out, topology.links.at(id));
    }

    const auto nodeIds = topology.sortedNodeIds();
    for (const NodeId& id : nodeIds) {
        writeNode(out, topology.nodes.at(id));
    }

    if (options_.showNodeLabels) {
        for (const NodeId& id : nodeIds) {
            writeNodeLabel(out, topology.nodes.at(id));
        }
    }

    writeFooter(out);
}

bool SvgExport::exportToFile(const Topology& topology, const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    exportToStream(topology, file);
    return static_cast<bool>(file);
}

SvgExport::Bounds SvgExport::computeBounds(const Topology& topology) const {
    bool first = true;
    Bounds bounds;
    auto include = [&](const Point& p) {
        if (first) {
            bounds = {p, p};
            first = false;
            return;
        }
        bounds.min = {std::min(bounds.min.x, p.x), std::min(bounds.min.y, p.y)};
        bounds.max = {std::max(bounds.max.x, p.x), std::max(bounds.max.y, p.y)};
    };

    for (const auto& [id, node] : topology.nodes) {
        if (!node.pos) continue;
        auto [lo, hi] = node.bounds();
        include(lo);
        include(hi);
        // Room for the label cell
        include(moveGridPos(*node.pos, node.labelDirection()).toPoint());
    }
    for (const auto& [id, link] : topology.links) {
        for (const Point& p : link.route) {
            include(p);
        }
    }

    const float scale = options_.cellSize;
    const float pad = options_.padding + options_.nodeRadius;
    bounds.min = bounds.min * scale - Point{pad, pad};
    bounds.max = bounds.max * scale + Point{pad, pad};
    return bounds;
}

void SvgExport::writeHeader(std::ostream& out, const Bounds& bounds) {
    const float width = bounds.max.x - bounds.min.x;
    const float height = bounds.max.y - bounds.min.y;

    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out << "<svg xmlns=\"http://www.w3.org/2000/svg\" "
        << "width=\"" << width << "\" "
        << "height=\"" << height << "\" "
        << "viewBox=\"" << bounds.min.x << " " << bounds.min.y << " "
        << width << " " << height << "\">\n";

    out << "  <rect x=\"" << bounds.min.x << "\" y=\"" << bounds.min.y << "\" "
        << "width=\"" << width << "\" height=\"" << height << "\" "
        << "fill=\"" << options_.backgroundColor << "\"/>\n";
}

void SvgExport::writeStyles(std::ostream& out) {
    if (!options_.embedStyles) return;

    out << "  <style>\n";
    out << "    .node { fill: " << options_.nodeFill << "; "
        << "stroke: " << options_.nodeStroke << "; "
        << "stroke-width: " << options_.nodeStrokeWidth << "; }\n";
    out << "    .link { fill: none; "
        << "stroke: " << options_.linkStroke << "; "
        << "stroke-width: " << options_.linkStrokeWidth << "; "
        << "stroke-linejoin: round; }\n";
    out << "    .node-label { fill: " << options_.textFill << "; "
        << "font-family: " << options_.fontFamily << "; "
        << "font-size: " << options_.fontSize << "px; "
        << "dominant-baseline: central; }\n";
    out << "  </style>\n";
}

void SvgExport::writeFooter(std::ostream& out) {
    out << "</svg>\n";
}

void SvgExport::writeNode(std::ostream& out, const Node& node) {
    if (!node.pos) return;

    std::string cssClass = "node";
    if (!node.cssClass.empty()) {
        cssClass += " " + escapeXml(node.cssClass);
    }

    const float scale = options_.cellSize;
    if (node.isMultiCell()) {
        auto [lo, hi] = node.bounds();
        // Footprint edges sit half a cell outside the outermost centres
        Point topLeft = lo * scale;
        Point size = (hi - lo) * scale;
        out << "  <rect class=\"" << cssClass << "\" "
            << "x=\"" << topLeft.x << "\" "
            << "y=\"" << topLeft.y << "\" "
            << "width=\"" << size.x << "\" "
            << "height=\"" << size.y << "\" "
            << "rx=\"" << options_.nodeCornerRadius << "\"/>\n";
        return;
    }

    Point center = node.pos->toPoint() * scale;
    out << "  <circle class=\"" << cssClass << "\" "
        << "cx=\"" << center.x << "\" "
        << "cy=\"" << center.y << "\" "
        << "r=\"" << options_.nodeRadius << "\"/>\n";
}

void SvgExport::writeNodeLabel(std::ostream& out, const Node& node) {
    if (!node.pos) return;

    const float scale = options_.cellSize;
    Direction dir = node.labelDirection();

    Point anchorPoint = node.pos->toPoint() * scale;
    const char* anchor = nullptr;

    if (dir == Direction::None) {
        // "c" and unset labels are only drawn inside multi-cell nodes
        if (!node.isMultiCell() || node.labelAt.empty()) {
            return;
        }
        auto [lo, hi] = node.bounds();
        anchorPoint = (lo + hi) * (scale / 2.0f);
        anchor = "middle";
    } else {
        GridPos offset = directionOffset(dir);
        float dist = options_.nodeRadius + options_.nodeStrokeWidth;
        anchorPoint = anchorPoint + Point{static_cast<float>(offset.x), static_cast<float>(offset.y)}.normalized() * dist;
        if (offset.x > 0) anchor = "start";
        else if (offset.x < 0) anchor = "end";
        else anchor = "middle";
        if (offset.y != 0) {
            anchorPoint.y += static_cast<float>(offset.y) * options_.fontSize / 2.0f;
        }
    }

    const std::string& text = node.label.empty() ? node.id : node.label;
    out << "  <text class=\"node-label\" "
        << "x=\"" << anchorPoint.x << "\" "
        << "y=\"" << anchorPoint.y << "\" "
        << "text-anchor=\"" << anchor << "\">"
        << escapeXml(text) << "</text>\n";
}

void SvgExport::writeLink(std::ostream& out, const Link& link) {
    if (link.route.size() < 2) return;

    std::string extra;
    if (!link.cssClass.empty()) {
        extra = " " + escapeXml(link.cssClass);
    }

    Polyline line = link.route.simplify().scaled(options_.cellSize);
    auto [fromHalf, toHalf] = line.splitAt(link.splitAt.value_or(options_.defaultSplitAt));

    writePolyline(out, fromHalf, "link link-from" + extra);
    writePolyline(out, toHalf, "link link-to" + extra);
}

void SvgExport::writePolyline(std::ostream& out, const Polyline& line, const std::string& cssClass) {
    if (line.size() < 2) return;

    out << "  <polyline class=\"" << cssClass << "\" points=\"";
    for (std::size_t i = 0; i < line.size(); ++i) {
        if (i > 0) out << ' ';
        out << line[i].x << ',' << line[i].y;
    }
    out << "\"/>\n";
}

std::string SvgExport::escapeXml(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default: result += c;
        }
    }
    return result;
}

}  // namespace topomap
