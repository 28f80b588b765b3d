#pragma once

#include "topomap/common/ILoggerBackend.h"

#include <memory>
#include <spdlog/spdlog.h>

namespace topomap {

/**
 * @brief Default backend: one coloured spdlog sink on stderr
 *
 * stdout is reserved for the map document, so nothing is ever written
 * there. Lines carry the source file and line of the LOG_* call.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    explicit SpdlogBackend(LogLevel level = LogLevel::Info);

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace topomap
