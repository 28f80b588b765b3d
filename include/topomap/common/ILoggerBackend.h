#pragma once

#include <source_location>
#include <string>

namespace topomap {

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/**
 * @brief Destination for topomap's log lines
 *
 * Logger hands every line to exactly one backend. The default is
 * SpdlogBackend; a host application installs its own with
 * Logger::setBackend(), and the unit tests install one that records
 * lines in memory.
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /// @param message Fully formatted text, without level or location
    /// @param loc Call site of the LOG_* macro
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    /// Lines below this level are dropped by the backend
    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace topomap
