#include "core/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace elrelay::core {

void init_logger() {
    static bool initialized = false;
    if (initialized) return;
    initialized = true;

    auto logger = spdlog::stderr_color_mt("elrelay");
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::info);
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    if (name.empty()) {
        return spdlog::level::info;
    }
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

} // namespace elrelay::core
