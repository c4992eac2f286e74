#include "core/paths.hpp"
#include <algorithm>
#include <climits>
#include <unistd.h>

namespace zero::core::paths {

std::filesystem::path executable_dir() {
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return {};
    }
    buf[len] = '\0';
    return std::filesystem::path(buf).parent_path();
}

std::vector<std::filesystem::path> search_roots() {
    std::vector<std::filesystem::path> candidates;
    auto cwd = std::filesystem::current_path();
    candidates.push_back(cwd);
    candidates.push_back(cwd.parent_path());

    auto exe_dir = executable_dir();
    if (!exe_dir.empty()) {
        candidates.push_back(exe_dir);
        candidates.push_back(exe_dir.parent_path());
    }

    std::vector<std::filesystem::path> roots;
    for (const auto& p : candidates) {
        if (p.empty()) continue;
        if (std::find(roots.begin(), roots.end(), p) == roots.end()) {
            roots.push_back(p);
        }
    }
    return roots;
}

std::optional<std::filesystem::path> find_relative(const std::string& relative) {
    for (const auto& base : search_roots()) {
        auto candidate = base / relative;
        if (std::filesystem::exists(candidate)) {
            return std::filesystem::canonical(candidate);
        }
    }
    return std::nullopt;
}

} // namespace zero::core::paths
