#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/config.hpp"

namespace zero::supervisor {

struct SupervisorConfig {
    kernel::KernelConfig kernel;
    std::string log_level = "info";
    std::string log_file;
    uint64_t pending_timeout_ms = 5000;
    size_t keystore_max_pending = 256;
    size_t max_messages_per_step = 64;      // per service, per round
    std::vector<std::string> services = {"vfs", "keystore", "identity"};
    nlohmann::json storage_seed = nlohmann::json::object();
    nlohmann::json keystore_seed = nlohmann::json::object();

    static SupervisorConfig from_json(const nlohmann::json& j);
    static SupervisorConfig load(const std::filesystem::path& path);
    nlohmann::json to_json() const;

    // ZERO_LOG_LEVEL, ZERO_LOG_FILE, ZERO_PENDING_TIMEOUT_MS plus the kernel's own
    void apply_env_overrides();

    uint64_t pending_timeout_ns() const { return pending_timeout_ms * 1000000ull; }
};

} // namespace zero::supervisor
