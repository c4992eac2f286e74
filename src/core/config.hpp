#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace zero::core::config {

// Load KEY=VALUE pairs from the first .env found under the search roots.
// Existing environment variables win. Idempotent.
void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths = {});

// Parse one .env line; nullopt for blanks, comments and malformed lines.
std::optional<std::pair<std::string, std::string>> parse_dotenv_line(const std::string& line);

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

// Read and parse a JSON document; throws std::runtime_error with the path on failure.
nlohmann::json load_json_file(const std::filesystem::path& path);

} // namespace zero::core::config
