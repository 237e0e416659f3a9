#pragma once

#include <spdlog/spdlog.h>

#include <string>

// Logging macros. These use fmt-style formatting:
//
// TTT_LOG_INFO("Computer plays ({}, {})", row, col);
//
// Statements below SPDLOG_ACTIVE_LEVEL are compiled out. The build sets it to
// trace, so filtering is done at runtime via Logging::Params::level.

#define TTT_LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define TTT_LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define TTT_LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define TTT_LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define TTT_LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)

namespace ttt::util {

struct Logging {
    struct Params {
        std::string log_filename;
        std::string level = "warn";
        bool append_mode = false;
        bool omit_timestamps = false;
    };

    // Installs a default logger writing to stderr and, if log_filename is set,
    // to that file. Throws std::invalid_argument on an unknown level name.
    static void init(const Params& params);

    static spdlog::level::level_enum parse_level(const std::string& name);
};

} // namespace ttt::util
