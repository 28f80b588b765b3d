#include "topomap/common/Logger.h"
#include "topomap/backends/SpdlogBackend.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>

namespace topomap {

std::unique_ptr<ILoggerBackend> Logger::backend_;

namespace {

std::mutex backendMutex;

}  // namespace

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backendMutex);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(backendMutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>(levelFromEnvironment());
    }
}

void Logger::setLevel(LogLevel level) {
    initialize();
    backend_->setLevel(level);
}

std::optional<LogLevel> Logger::parseLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "err" || lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return std::nullopt;
}

LogLevel Logger::levelFromEnvironment() {
    for (const char* variable : {"LOG_LEVEL", "SPDLOG_LEVEL"}) {
        if (const char* value = std::getenv(variable)) {
            if (auto level = parseLevel(value)) {
                return *level;
            }
        }
    }
    return LogLevel::Info;
}

void Logger::trace(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Trace, message, loc);
}

void Logger::debug(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Debug, message, loc);
}

void Logger::info(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Info, message, loc);
}

void Logger::warn(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Warn, message, loc);
}

void Logger::error(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Error, message, loc);
}

void Logger::flush() {
    initialize();
    backend_->flush();
}

void Logger::write(LogLevel level, const std::string& message,
                   const std::source_location& loc) {
    initialize();
    backend_->log(level, message, loc);
}

}  // namespace topomap
