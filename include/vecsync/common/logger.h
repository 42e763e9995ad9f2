#ifndef VECSYNC_COMMON_LOGGER_H_
#define VECSYNC_COMMON_LOGGER_H_

#include <memory>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

#include "vecsync/core/config.h"

namespace vecsync {
namespace common {

// Handle passed explicitly to every component constructor.
using LoggerPtr = std::shared_ptr<spdlog::logger>;

class Logger {
public:
    /**
     * @brief Creates a named logger with a console sink and, if
     * config.file is set, a file sink. Not registered globally.
     */
    static LoggerPtr create(const std::string& name, const core::LogConfig& config);

    // Logger that drops everything, for tests and optional collaborators.
    static LoggerPtr null();

    // Unknown names map to info.
    static spdlog::level::level_enum parse_level(const std::string& level);
};

} // namespace common
} // namespace vecsync

#endif // VECSYNC_COMMON_LOGGER_H_
