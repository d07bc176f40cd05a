#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace indoorgml {
namespace logging {

// Maps "trace", "debug", "info", "warn", "error" and "off" to spdlog levels.
inline std::optional<spdlog::level::level_enum> parse_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "off") return spdlog::level::off;
    return std::nullopt;
}

// Shared stderr logger. Initial level comes from INDOORGML_LOG_LEVEL
// (unknown values fall back to info).
inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::stderr_color_mt("indoorgml");
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

        auto level = spdlog::level::info;
        if (const char* level_env = std::getenv("INDOORGML_LOG_LEVEL")) {
            level = parse_level(level_env).value_or(spdlog::level::info);
        }
        log->set_level(level);

        return log;
    }();
    return logger;
}

inline void set_level(const std::string& level) {
    auto parsed = parse_level(level);
    if (!parsed) {
        throw std::invalid_argument("Unknown log level: " + level);
    }
    get_logger()->set_level(*parsed);
}

}  // namespace logging
}  // namespace indoorgml
