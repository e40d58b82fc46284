#pragma once
#include <spdlog/spdlog.h>
#include <string>

namespace elrelay::core {

// Initialize logging with console output on stderr (stdout carries MCP traffic)
void init_logger();

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Parse a level name ("debug", "info", "warn", ...); info on unknown names
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace elrelay::core
