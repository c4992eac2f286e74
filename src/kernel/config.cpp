#include "kernel/config.hpp"
#include "core/config.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace zero::kernel {

KernelConfig KernelConfig::from_json(const nlohmann::json& j) {
    KernelConfig config;
    config.endpoint_capacity = j.value("endpoint_capacity", config.endpoint_capacity);
    config.max_caps_per_space = j.value("max_caps_per_space", config.max_caps_per_space);
    config.validate();
    return config;
}

void KernelConfig::validate() const {
    if (endpoint_capacity == 0) {
        throw std::invalid_argument("endpoint_capacity must be positive");
    }
    // Every process needs a slot for its inbox
    if (max_caps_per_space == 0) {
        throw std::invalid_argument("max_caps_per_space must be positive");
    }
}

nlohmann::json KernelConfig::to_json() const {
    nlohmann::json j;
    j["endpoint_capacity"] = endpoint_capacity;
    j["max_caps_per_space"] = max_caps_per_space;
    return j;
}

void KernelConfig::apply_env_overrides() {
    auto capacity = core::config::get_env("ZERO_ENDPOINT_CAPACITY");
    if (!capacity.empty()) {
        try {
            size_t value = std::stoul(capacity);
            if (value > 0) {
                endpoint_capacity = value;
            } else {
                spdlog::warn("Ignoring ZERO_ENDPOINT_CAPACITY=0");
            }
        } catch (const std::exception& e) {
            spdlog::warn("Ignoring ZERO_ENDPOINT_CAPACITY='{}': {}", capacity, e.what());
        }
    }

    auto max_caps = core::config::get_env("ZERO_MAX_CAPS");
    if (!max_caps.empty()) {
        try {
            size_t value = std::stoul(max_caps);
            if (value > 0) {
                max_caps_per_space = value;
            } else {
                spdlog::warn("Ignoring ZERO_MAX_CAPS=0");
            }
        } catch (const std::exception& e) {
            spdlog::warn("Ignoring ZERO_MAX_CAPS='{}': {}", max_caps, e.what());
        }
    }
}

} // namespace zero::kernel
