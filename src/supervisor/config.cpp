#include "supervisor/config.hpp"
#include "core/config.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace zero::supervisor {

SupervisorConfig SupervisorConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("supervisor config must be a JSON object");
    }

    SupervisorConfig config;
    if (j.contains("kernel")) {
        config.kernel = kernel::KernelConfig::from_json(j["kernel"]);
    }
    config.log_level = j.value("log_level", config.log_level);
    config.log_file = j.value("log_file", config.log_file);
    config.pending_timeout_ms = j.value("pending_timeout_ms", config.pending_timeout_ms);
    config.keystore_max_pending = j.value("keystore_max_pending", config.keystore_max_pending);
    config.max_messages_per_step = j.value("max_messages_per_step", config.max_messages_per_step);
    if (j.contains("services")) {
        config.services = j["services"].get<std::vector<std::string>>();
    }
    if (j.contains("storage_seed")) {
        config.storage_seed = j["storage_seed"];
    }
    if (j.contains("keystore_seed")) {
        config.keystore_seed = j["keystore_seed"];
    }

    if (config.max_messages_per_step == 0) {
        throw std::invalid_argument("max_messages_per_step must be positive");
    }
    return config;
}

SupervisorConfig SupervisorConfig::load(const std::filesystem::path& path) {
    auto j = core::config::load_json_file(path);
    try {
        return from_json(j);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid config " + path.string() + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Invalid config " + path.string() + ": " + e.what());
    }
}

nlohmann::json SupervisorConfig::to_json() const {
    nlohmann::json j;
    j["kernel"] = kernel.to_json();
    j["log_level"] = log_level;
    j["log_file"] = log_file;
    j["pending_timeout_ms"] = pending_timeout_ms;
    j["keystore_max_pending"] = keystore_max_pending;
    j["max_messages_per_step"] = max_messages_per_step;
    j["services"] = services;
    j["storage_seed"] = storage_seed;
    j["keystore_seed"] = keystore_seed;
    return j;
}

void SupervisorConfig::apply_env_overrides() {
    kernel.apply_env_overrides();

    auto level = core::config::get_env("ZERO_LOG_LEVEL");
    if (!level.empty()) {
        log_level = level;
    }

    auto file = core::config::get_env("ZERO_LOG_FILE");
    if (!file.empty()) {
        log_file = file;
    }

    auto timeout = core::config::get_env("ZERO_PENDING_TIMEOUT_MS");
    if (!timeout.empty()) {
        try {
            pending_timeout_ms = std::stoull(timeout);
        } catch (const std::exception& e) {
            spdlog::warn("Ignoring ZERO_PENDING_TIMEOUT_MS='{}': {}", timeout, e.what());
        }
    }
}

} // namespace zero::supervisor
