#include "topomap/io/TopologySerializer.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace topomap {

namespace {

GridPos parseGridPos(const json& value, const std::string& what) {
    if (!value.is_array() || value.size() != 2 ||
        !value[0].is_number_integer() || !value[1].is_number_integer()) {
        throw std::runtime_error(what + " must be an array of two integers");
    }
    // get<int> would wrap values beyond int; compare as 64-bit first
    const auto x = value[0].get<std::int64_t>();
    const auto y = value[1].get<std::int64_t>();
    if (std::llabs(x) > GridPos::kMaxCoordinate || std::llabs(y) > GridPos::kMaxCoordinate) {
        throw std::runtime_error(what + " lies outside the routing grid (|x|, |y| <= " +
                                 std::to_string(GridPos::kMaxCoordinate) + ")");
    }
    return {static_cast<int>(x), static_cast<int>(y)};
}

std::string optionalString(const json& value, const char* key, const std::string& what) {
    auto it = value.find(key);
    if (it == value.end() || it->is_null()) {
        return "";
    }
    if (!it->is_string()) {
        throw std::runtime_error(what + ": \"" + key + "\" must be a string");
    }
    return it->get<std::string>();
}

Node parseNode(const json& value, const NodeId& id) {
    const std::string what = "node '" + id + "'";
    if (!value.is_object()) {
        throw std::runtime_error(what + " must be an object");
    }

    Node node;
    node.id = id;
    if (auto it = value.find("pos"); it != value.end() && !it->is_null()) {
        node.pos = parseGridPos(*it, what + ": \"pos\"");
    }
    node.label = optionalString(value, "label", what);
    node.labelAt = optionalString(value, "label_at", what);
    node.cssClass = optionalString(value, "class", what);

    if (auto it = value.find("extents"); it != value.end() && !it->is_null()) {
        if (!it->is_object()) {
            throw std::runtime_error(what + ": \"extents\" must be an object");
        }
        NodeExtents extents;
        extents.width = it->value("width", 0.0f);
        extents.height = it->value("height", 0.0f);
        // A footprint is walked cell by cell, so its size is bounded like a position
        if (!GridPos::inRange(Point{extents.width, extents.height}) ||
            extents.width < 0.0f || extents.height < 0.0f) {
            throw std::runtime_error(what + ": \"extents\" must be non-negative and at most " +
                                     std::to_string(GridPos::kMaxCoordinate));
        }
        node.extents = extents;
    }
    return node;
}

Link parseLink(const json& value, const LinkId& id) {
    const std::string what = "link '" + id + "'";
    if (!value.is_object()) {
        throw std::runtime_error(what + " must be an object");
    }

    Link link;
    link.id = id;
    link.from = optionalString(value, "from", what);
    link.to = optionalString(value, "to", what);
    link.cssClass = optionalString(value, "class", what);

    if (auto it = value.find("via"); it != value.end() && !it->is_null()) {
        if (!it->is_array()) {
            throw std::runtime_error(what + ": \"via\" must be an array");
        }
        for (const auto& via : *it) {
            link.via.push_back(parseGridPos(via, what + ": via point"));
        }
    }

    if (auto it = value.find("split_at"); it != value.end() && !it->is_null()) {
        if (!it->is_number()) {
            throw std::runtime_error(what + ": \"split_at\" must be a number");
        }
        link.splitAt = it->get<float>();
    }

    if (auto it = value.find("route"); it != value.end() && !it->is_null()) {
        if (!it->is_array()) {
            throw std::runtime_error(what + ": \"route\" must be an array");
        }
        for (const auto& point : *it) {
            if (!point.is_array() || point.size() != 2 ||
                !point[0].is_number() || !point[1].is_number()) {
                throw std::runtime_error(what + ": route points must be [x, y] pairs");
            }
            Point p{point[0].get<float>(), point[1].get<float>()};
            if (!GridPos::inRange(p)) {
                throw std::runtime_error(what + ": route point outside the routing grid (|x|, |y| <= " +
                                         std::to_string(GridPos::kMaxCoordinate) + ")");
            }
            link.route.push_back(p);
        }
    }
    return link;
}

void parseNodes(const json& nodes, Topology& topology) {
    if (nodes.is_array()) {
        for (const auto& entry : nodes) {
            if (!entry.is_object() || !entry.contains("id") || !entry["id"].is_string() ||
                entry["id"].get<std::string>().empty()) {
                throw std::runtime_error("Node must have an id");
            }
            NodeId id = entry["id"].get<std::string>();
            if (topology.findNode(id)) {
                throw std::runtime_error("Duplicate node id '" + id + "'");
            }
            topology.addNode(parseNode(entry, id));
        }
    } else if (nodes.is_object()) {
        for (const auto& [id, entry] : nodes.items()) {
            topology.addNode(parseNode(entry, id));
        }
    } else {
        throw std::runtime_error("\"nodes\" must be an array or object");
    }
}

void parseLinks(const json& links, Topology& topology) {
    if (links.is_array()) {
        for (const auto& entry : links) {
            LinkId id = entry.is_object() ? optionalString(entry, "id", "link") : "";
            Link link = parseLink(entry, id);

            if (id.empty()) {
                id = link.from + "-" + link.to;
                for (int n = 2; topology.findLink(id); ++n) {
                    id = link.from + "-" + link.to + "-" + std::to_string(n);
                }
                link.id = id;
            } else if (topology.findLink(id)) {
                throw std::runtime_error("Duplicate link id '" + id + "'");
            }
            topology.addLink(std::move(link));
        }
    } else if (links.is_object()) {
        for (const auto& [id, entry] : links.items()) {
            topology.addLink(parseLink(entry, id));
        }
    } else {
        throw std::runtime_error("\"links\" must be an array or object");
    }
}

std::string readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open '" + path + "'");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

}  // namespace

Topology TopologySerializer::fromJson(const std::string& jsonStr) {
    json j;
    try {
        j = json::parse(jsonStr);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse topology JSON: ") + e.what());
    }

    if (!j.is_object()) {
        throw std::runtime_error("Topology must be a JSON object");
    }

    Topology topology;
    try {
        if (auto it = j.find("nodes"); it != j.end() && !it->is_null()) {
            parseNodes(*it, topology);
        }
        if (auto it = j.find("links"); it != j.end() && !it->is_null()) {
            parseLinks(*it, topology);
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid topology: ") + e.what());
    }
    return topology;
}

Topology TopologySerializer::loadFromFile(const std::string& path) {
    return fromJson(readFile(path));
}

std::string TopologySerializer::toJson(const Topology& topology, int indent) {
    json nodes = json::object();
    for (const auto& [id, node] : topology.nodes) {
        json n = json::object();
        if (node.pos) {
            n["pos"] = {node.pos->x, node.pos->y};
        }
        if (!node.label.empty()) n["label"] = node.label;
        if (!node.labelAt.empty()) n["label_at"] = node.labelAt;
        if (!node.cssClass.empty()) n["class"] = node.cssClass;
        if (node.extents) {
            n["extents"] = {{"width", node.extents->width}, {"height", node.extents->height}};
        }
        nodes[id] = n;
    }

    json links = json::object();
    for (const auto& [id, link] : topology.links) {
        json l = {{"from", link.from}, {"to", link.to}};
        if (!link.via.empty()) {
            json via = json::array();
            for (const GridPos& p : link.via) {
                via.push_back({p.x, p.y});
            }
            l["via"] = via;
        }
        if (link.splitAt) l["split_at"] = *link.splitAt;
        if (!link.cssClass.empty()) l["class"] = link.cssClass;
        if (!link.route.empty()) {
            json route = json::array();
            for (const Point& p : link.route) {
                route.push_back({p.x, p.y});
            }
            l["route"] = route;
        }
        links[id] = l;
    }

    json j = {{"nodes", nodes}, {"links", links}};
    return j.dump(indent);
}

bool TopologySerializer::saveToFile(const Topology& topology, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) return false;
    file << toJson(topology) << '\n';
    return static_cast<bool>(file);
}

RouterOptions TopologySerializer::optionsFromJson(const std::string& jsonStr) {
    RouterOptions options;
    try {
        json j = json::parse(jsonStr);
        if (!j.is_object()) {
            throw std::runtime_error("Router options must be a JSON object");
        }
        options.avoidNodes = j.value("avoid_nodes", options.avoidNodes);
        options.attachMultiCellsCardinal =
            j.value("attach_multi_cells_cardinal", options.attachMultiCellsCardinal);
        options.spreadLinks = j.value("spread_links", options.spreadLinks);
        options.orthogonal = j.value("orthogonal", options.orthogonal);
        options.linkPenaltyWeight = j.value("link_penalty_weight", options.linkPenaltyWeight);
        options.searchLimit = j.value("search_limit", options.searchLimit);
        options.routeIterLimit = j.value("route_iter_limit", options.routeIterLimit);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse router options: ") + e.what());
    }
    return options;
}

std::string TopologySerializer::optionsToJson(const RouterOptions& options, int indent) {
    json j = {
        {"avoid_nodes", options.avoidNodes},
        {"attach_multi_cells_cardinal", options.attachMultiCellsCardinal},
        {"spread_links", options.spreadLinks},
        {"orthogonal", options.orthogonal},
        {"link_penalty_weight", options.linkPenaltyWeight},
        {"search_limit", options.searchLimit},
        {"route_iter_limit", options.routeIterLimit}
    };
    return j.dump(indent);
}

}  // namespace topomap
