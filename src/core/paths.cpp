#include "core/paths.hpp"
#include <algorithm>
#include <cstdlib>
#include <limits.h>
#include <system_error>
#include <unistd.h>

namespace elrelay::core::paths {

std::filesystem::path executable_dir() {
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return {};
    }
    buf[len] = '\0';
    return std::filesystem::path(buf).parent_path();
}

std::filesystem::path user_config_dir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "elrelay";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "elrelay";
    }
    return {};
}

std::vector<std::filesystem::path> config_search_paths() {
    std::vector<std::filesystem::path> roots;

    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
        roots.push_back(cwd);
        roots.push_back(cwd.parent_path());
    }

    auto exe_dir = executable_dir();
    if (!exe_dir.empty()) {
        roots.push_back(exe_dir);
        roots.push_back(exe_dir.parent_path());
    }

    roots.push_back(user_config_dir());

    std::vector<std::filesystem::path> unique;
    for (const auto& p : roots) {
        if (p.empty()) continue;
        if (std::find(unique.begin(), unique.end(), p) == unique.end()) {
            unique.push_back(p);
        }
    }
    return unique;
}

} // namespace elrelay::core::paths
