#include "core/config.hpp"
#include "core/paths.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace elrelay::core::config {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::optional<int64_t> parse_int(const std::string& text) {
    if (text.empty()) return std::nullopt;
    try {
        size_t consumed = 0;
        long long value = std::stoll(text, &consumed, 10);
        if (consumed != text.size()) return std::nullopt;
        return static_cast<int64_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

std::optional<std::pair<std::string, std::string>> parse_env_line(const std::string& raw) {
    std::string line = trim(raw);
    if (line.empty() || line[0] == '#') return std::nullopt;

    if (line.rfind("export ", 0) == 0) {
        line = trim(line.substr(7));
    }

    size_t eq_pos = line.find('=');
    if (eq_pos == std::string::npos) return std::nullopt;

    std::string key = trim(line.substr(0, eq_pos));
    std::string value = trim(line.substr(eq_pos + 1));
    if (key.empty()) return std::nullopt;

    if (value.size() >= 2) {
        if ((value.front() == '"' && value.back() == '"') ||
            (value.front() == '\'' && value.back() == '\'')) {
            value = value.substr(1, value.size() - 2);
        }
    }
    return std::make_pair(key, value);
}

void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths) {
    static bool loaded = false;
    if (loaded) return;
    loaded = true;

    std::vector<std::filesystem::path> search_paths = paths::config_search_paths();
    for (const auto& p : extra_search_paths) {
        search_paths.push_back(p);
    }

    for (const auto& base : search_paths) {
        auto env_path = base / ".env";
        std::error_code ec;
        if (!std::filesystem::is_regular_file(env_path, ec)) {
            continue;
        }

        std::ifstream file(env_path);
        std::string line;
        int applied = 0;
        while (std::getline(file, line)) {
            auto entry = parse_env_line(line);
            if (!entry) continue;
            if (std::getenv(entry->first.c_str()) == nullptr) {
                setenv(entry->first.c_str(), entry->second.c_str(), 0);
                applied++;
            }
        }
        spdlog::debug("Loaded {} setting(s) from {}", applied, env_path.string());
        break;
    }
}

std::string get_env(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : std::string();
}

std::string get_env_or(const std::string& key, const std::string& fallback) {
    auto value = get_env(key);
    return value.empty() ? fallback : value;
}

int64_t get_env_int(const std::string& key, int64_t fallback,
                    int64_t min_value, int64_t max_value) {
    auto text = trim(get_env(key));
    if (text.empty()) return fallback;

    auto value = parse_int(text);
    if (!value || *value < min_value || *value > max_value) {
        spdlog::warn("Ignoring {}='{}' (expected integer in [{}, {}]), using {}",
                     key, text, min_value, max_value, fallback);
        return fallback;
    }
    return *value;
}

std::vector<uint16_t> get_env_ports(const std::string& key, const std::vector<uint16_t>& fallback) {
    auto text = trim(get_env(key));
    if (text.empty()) return fallback;

    std::vector<uint16_t> ports;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto value = parse_int(trim(item));
        if (!value || *value < 1 || *value > 65535) {
            spdlog::warn("Ignoring {}='{}' (bad port '{}')", key, text, item);
            return fallback;
        }
        ports.push_back(static_cast<uint16_t>(*value));
    }
    return ports;
}

} // namespace elrelay::core::config
