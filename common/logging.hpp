#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <string>

namespace framesplice {
namespace logging {

inline spdlog::level::level_enum parse_level(const std::string& level) {
    if (level == "trace") {
        return spdlog::level::trace;
    } else if (level == "debug") {
        return spdlog::level::debug;
    } else if (level == "warn") {
        return spdlog::level::warn;
    } else if (level == "error") {
        return spdlog::level::err;
    } else if (level == "off") {
        return spdlog::level::off;
    }
    return spdlog::level::info;
}

inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::stderr_color_mt("framesplice");
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

        // Set log level from environment variable
        const char* level_env = std::getenv("FRAMESPLICE_LOG_LEVEL");
        if (level_env) {
            log->set_level(parse_level(level_env));
        } else {
            log->set_level(spdlog::level::info);
        }

        return log;
    }();
    return logger;
}

}  // namespace logging
}  // namespace framesplice
