#pragma once
#include <cstddef>
#include <nlohmann/json.hpp>
#include "kernel/types.hpp"

namespace zero::kernel {

// Kernel configuration (recorded in the Boot commit so replay reproduces it)
struct KernelConfig {
    size_t endpoint_capacity = DEFAULT_ENDPOINT_CAPACITY;    // CREATE_ENDPOINT with capacity 0
    size_t max_caps_per_space = DEFAULT_MAX_CAPS_PER_SPACE;

    static KernelConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    // Throws std::invalid_argument for a zero capacity or quota
    void validate() const;

    // ZERO_ENDPOINT_CAPACITY, ZERO_MAX_CAPS
    void apply_env_overrides();
};

} // namespace zero::kernel
