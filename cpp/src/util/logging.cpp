#include "../../include/util/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <stdexcept>
#include <vector>

namespace ttt::util {

void Logging::init(const Params& params) {
    auto level = parse_level(params.level);

    std::vector<spdlog::sink_ptr> sinks;
    const char* pattern = params.omit_timestamps ? "[%l] %v" : "%Y-%m-%d %H:%M:%S.%f [%l] %v";

    // Stdout belongs to the game, so the console sink is stderr
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern(pattern);
    sinks.push_back(console_sink);

    if (!params.log_filename.empty()) {
        auto file_sink =
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(params.log_filename, !params.append_mode);
        file_sink->set_pattern(pattern);
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("ttt", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

spdlog::level::level_enum Logging::parse_level(const std::string& name) {
    // from_str() maps unknown names to off, so off is checked by name
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        throw std::invalid_argument("Unknown log level: " + name);
    }
    return level;
}

} // namespace ttt::util
