#pragma once

/// @file topomap.h
/// @brief Main header for the topomap link router
///
/// topomap draws network topology maps: nodes sit on a grid, links between
/// them are routed with a penalty-aware A* search and node labels are
/// placed in the free cells around each node.
///
/// Example usage:
/// @code
/// #include <topomap/topomap.h>
///
/// auto topology = topomap::TopologySerializer::loadFromFile("net.json");
///
/// topomap::LinkRouter router(topology);
/// router.routeLinks();
///
/// topomap::LabelPlacer labels;
/// labels.place(topology);
///
/// topomap::SvgExport svg;
/// svg.exportToFile(topology, "net.svg");
/// @endcode

// Core module - grid model
#include "core/Types.h"
#include "core/Direction.h"
#include "core/Polyline.h"
#include "core/Topology.h"

// Routing module
#include "routing/RouterOptions.h"
#include "routing/LinkRouter.h"

// Labels module
#include "labels/LabelPlacer.h"

// IO module
#include "io/TopologySerializer.h"

// Export module - Output formats
#include "export/IExporter.h"
#include "export/SvgExport.h"

#include <string>

namespace topomap {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace topomap
