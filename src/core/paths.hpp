#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace zero::core::paths {

// Directory of the running executable; empty if /proc is unavailable.
std::filesystem::path executable_dir();

// Roots searched for .env and config files: cwd, the executable dir, and their parents.
std::vector<std::filesystem::path> search_roots();

// First existing `relative` under any search root.
std::optional<std::filesystem::path> find_relative(const std::string& relative);

} // namespace zero::core::paths
