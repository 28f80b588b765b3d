#pragma once

#include "topomap/common/ILoggerBackend.h"

#include <fmt/format.h>

#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace topomap {

/**
 * @brief Static logging entry point used by the LOG_* macros
 *
 * The first line logged without a backend installs a SpdlogBackend whose
 * level comes from levelFromEnvironment().
 *
 * @code
 * topomap::Logger::initialize();
 * LOG_INFO("Routed {} of {} links", routed, total);
 * @endcode
 */
class Logger {
public:
    /// Replace the backend. Passing nullptr reverts to the lazy default.
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /// Install the stderr spdlog backend if none is set
    static void initialize();

    static void setLevel(LogLevel level);

    /// "trace", "debug", "info", "warn"/"warning", "err"/"error",
    /// "critical" or "off", in any case
    static std::optional<LogLevel> parseLevel(std::string_view name);

    /// LOG_LEVEL, else SPDLOG_LEVEL, else Info. Unknown names are ignored.
    static LogLevel levelFromEnvironment();

    static void trace(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void debug(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void info(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void warn(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void error(const std::string& message,
                      const std::source_location& loc = std::source_location::current());

    static void flush();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void write(LogLevel level, const std::string& message,
                      const std::source_location& loc);
};

}  // namespace topomap

// Logging macros, fmt-style format strings
#define LOG_TRACE(...) topomap::Logger::trace(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) topomap::Logger::debug(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  topomap::Logger::info(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  topomap::Logger::warn(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) topomap::Logger::error(fmt::format(__VA_ARGS__), std::source_location::current())
