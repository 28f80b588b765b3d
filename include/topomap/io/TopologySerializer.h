#pragma once

#include "topomap/core/Topology.h"
#include "topomap/routing/RouterOptions.h"

#include <string>

namespace topomap {

/// JSON encoding of topologies and router options.
///
/// "nodes" and "links" may each be an array of objects carrying an "id", or
/// an object keyed by id. Links in array form may omit the id; it becomes
/// "<from>-<to>", then "<from>-<to>-2", "<from>-<to>-3", ...
class TopologySerializer {
public:
    /// Parse a topology
    /// @throws std::runtime_error on malformed JSON, missing or duplicate ids
    ///         and fields of the wrong type
    static Topology fromJson(const std::string& json);

    /// @throws std::runtime_error if the file cannot be read or parsed
    static Topology loadFromFile(const std::string& path);

    /// Serialize in object form (keys sorted), routes and label directions
    /// included
    static std::string toJson(const Topology& topology, int indent = 2);

    /// @return true if the file was written
    static bool saveToFile(const Topology& topology, const std::string& path);

    /// Parse router options; missing keys keep their defaults
    /// @throws std::runtime_error on malformed JSON or wrongly typed values
    static RouterOptions optionsFromJson(const std::string& json);

    static std::string optionsToJson(const RouterOptions& options, int indent = 2);
};

}  // namespace topomap
