/**
 * Zero Replay
 *
 * Rebuilds a kernel from a commit log. Top-level commits (process
 * creation, syscall requests, supervisor deliveries, faults, wakes, reaps, ticks)
 * are re-executed; every commit they emit is regenerated and compared
 * with the recorded one.
 */
#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "axiom/commit_log.hpp"
#include "kernel/kernel.hpp"

namespace zero::kernel {

struct ReplayError {
    uint64_t commit_id = 0;
    std::string reason;
};

struct ReplayResult {
    bool success = false;
    std::optional<ReplayError> error;
    size_t commits_applied = 0;
    axiom::StateHash final_hash{};
    std::unique_ptr<Kernel> kernel;
};

// True for commit types that start a top-level step
bool is_top_level(axiom::CommitType type);

// Builds a replay-mode kernel from a Boot commit. Throws std::runtime_error
// when the commit is not a Boot commit or its config is unreadable.
std::unique_ptr<Kernel> boot_from(const axiom::Commit& boot);

// Re-executes one top-level commit against the kernel. Informational commits
// are no-ops and return false. Throws WireError on a malformed payload.
bool apply_commit(Kernel& kernel, const axiom::Commit& commit);

// Applies every commit in order without checking hashes
ReplayResult replay(const axiom::CommitLog& log);

// As replay(), failing at the first commit whose regenerated form differs
ReplayResult replay_and_verify(const axiom::CommitLog& log);

} // namespace zero::kernel
