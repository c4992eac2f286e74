#pragma once
#include <string>
#include "axiom/commit_log.hpp"
#include "kernel/kernel_state.hpp"

namespace zero::kernel {

// Canonical byte serialisation of the kernel state (metrics excluded)
Bytes serialize_state(const KernelState& state);

// SHA-256 over serialize_state()
axiom::StateHash hash_state(const KernelState& state);

std::string hash_to_hex(const axiom::StateHash& hash);

} // namespace zero::kernel
