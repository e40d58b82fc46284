#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace elrelay::core::paths {

// Best-effort directory of the current executable; empty if unavailable.
std::filesystem::path executable_dir();

// Per-user configuration directory ($XDG_CONFIG_HOME/elrelay or ~/.config/elrelay);
// empty if neither variable is set.
std::filesystem::path user_config_dir();

// Directories searched for a .env file, most specific first, without duplicates.
std::vector<std::filesystem::path> config_search_paths();

} // namespace elrelay::core::paths
