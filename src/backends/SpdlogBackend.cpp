#include "topomap/backends/SpdlogBackend.h"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace topomap {

namespace {

spdlog::level::level_enum toSpdlog(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

}  // namespace

SpdlogBackend::SpdlogBackend(LogLevel level) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%s:%#] %v");

    logger_ = std::make_shared<spdlog::logger>("topomap", std::move(sink));
    logger_->set_level(toSpdlog(level));
}

void SpdlogBackend::log(LogLevel level, const std::string& message,
                        const std::source_location& loc) {
    spdlog::source_loc where{loc.file_name(), static_cast<int>(loc.line()),
                             loc.function_name()};
    logger_->log(where, toSpdlog(level), spdlog::string_view_t(message));
}

void SpdlogBackend::setLevel(LogLevel level) {
    logger_->set_level(toSpdlog(level));
}

void SpdlogBackend::flush() {
    logger_->flush();
}

}  // namespace topomap
