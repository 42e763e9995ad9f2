#include "vecsync/common/logger.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <iostream>
#include <vector>

namespace vecsync {
namespace common {

LoggerPtr Logger::create(const std::string& name, const core::LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!config.file.empty()) {
        try {
            auto parent = std::filesystem::path(config.file).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file));
        } catch (const std::exception& ex) {
            // Console logging still works, so keep going without the file sink.
            std::cerr << "Log file " << config.file << " unavailable: " << ex.what() << std::endl;
        }
    }

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] [thread %t] %v");
    logger->set_level(parse_level(config.level));
    logger->flush_on(spdlog::level::warn);
    return logger;
}

LoggerPtr Logger::null() {
    auto logger = std::make_shared<spdlog::logger>(
        "null", std::make_shared<spdlog::sinks::null_sink_mt>());
    logger->set_level(spdlog::level::off);
    return logger;
}

spdlog::level::level_enum Logger::parse_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace common
} // namespace vecsync
