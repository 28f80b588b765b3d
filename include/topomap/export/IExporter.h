#pragma once

#include <ostream>
#include <string>

namespace topomap {

class Topology;

/// Abstract interface for map exporters
class IExporter {
public:
    virtual ~IExporter() = default;

    virtual std::string exportToString(const Topology& topology) = 0;
    virtual void exportToStream(const Topology& topology, std::ostream& out) = 0;

    /// @return false if the file could not be written
    virtual bool exportToFile(const Topology& topology, const std::string& filename) = 0;

    /// File extension for this format (e.g., "svg")
    virtual std::string fileExtension() const = 0;

    /// MIME type for this format (e.g., "image/svg+xml")
    virtual std::string mimeType() const = 0;
};

}  // namespace topomap
