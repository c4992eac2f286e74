#include "core/config.hpp"
#include "core/paths.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace zero::core::config {

namespace {

std::string trim(const std::string& s, const char* ws = " \t\r\n") {
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return {};
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

} // namespace

std::optional<std::pair<std::string, std::string>> parse_dotenv_line(const std::string& raw) {
    std::string line = trim(raw);
    if (line.empty() || line[0] == '#') {
        return std::nullopt;
    }

    size_t eq_pos = line.find('=');
    if (eq_pos == std::string::npos) {
        return std::nullopt;
    }

    std::string key = trim(line.substr(0, eq_pos));
    std::string value = trim(line.substr(eq_pos + 1));
    if (key.empty()) {
        return std::nullopt;
    }

    // Strip matching quotes
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
        value = value.substr(1, value.size() - 2);
    }
    return std::make_pair(key, value);
}

void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths) {
    static bool loaded = false;
    if (loaded) return;
    loaded = true;

    auto roots = paths::search_roots();
    roots.insert(roots.end(), extra_search_paths.begin(), extra_search_paths.end());

    for (const auto& base : roots) {
        auto env_path = base / ".env";
        if (!std::filesystem::exists(env_path)) {
            continue;
        }

        std::ifstream file(env_path);
        std::string line;
        int applied = 0;
        while (std::getline(file, line)) {
            auto entry = parse_dotenv_line(line);
            if (!entry) continue;
            if (std::getenv(entry->first.c_str()) == nullptr) {
                setenv(entry->first.c_str(), entry->second.c_str(), 0);
                ++applied;
            }
        }
        spdlog::debug("Loaded {} variables from {}", applied, env_path.string());
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

nlohmann::json load_json_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("cannot open config file " + path.string());
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("invalid JSON in " + path.string() + ": " + e.what());
    }
}

} // namespace zero::core::config
