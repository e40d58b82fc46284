#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace elrelay::core::config {

// Parse one KEY=VALUE line of a .env file. Comments, blank lines and lines
// without '=' yield nullopt. Surrounding quotes on the value are stripped.
std::optional<std::pair<std::string, std::string>> parse_env_line(const std::string& line);

// Load environment variables from the first .env file found (idempotent).
// Variables already present in the environment win.
void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths = {});

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

// Integer variable within [min_value, max_value]; falls back (with a warning)
// when missing, malformed or out of range.
int64_t get_env_int(const std::string& key, int64_t fallback,
                    int64_t min_value, int64_t max_value);

// Comma-separated list of TCP ports; falls back when any entry is invalid.
std::vector<uint16_t> get_env_ports(const std::string& key, const std::vector<uint16_t>& fallback);

} // namespace elrelay::core::config
