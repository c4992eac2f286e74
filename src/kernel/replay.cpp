#include "kernel/replay.hpp"
#include "kernel/state_hasher.hpp"
#include "kernel/wire.hpp"
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace zero::kernel {

namespace {

std::optional<std::string> compare(const axiom::Commit& recorded, const axiom::Commit& regenerated) {
    if (recorded.commit_id != regenerated.commit_id) {
        return fmt::format("commit id {} replayed as {}", recorded.commit_id, regenerated.commit_id);
    }
    if (recorded.commit_type != regenerated.commit_type) {
        return fmt::format("expected {}, replay produced {}",
                           axiom::commit_type_to_string(recorded.commit_type),
                           axiom::commit_type_to_string(regenerated.commit_type));
    }
    if (recorded.pre_state_hash != regenerated.pre_state_hash) {
        return fmt::format("pre-state hash mismatch (recorded {}, replayed {})",
                           hash_to_hex(recorded.pre_state_hash), hash_to_hex(regenerated.pre_state_hash));
    }
    if (recorded.payload != regenerated.payload) {
        return std::string("payload mismatch");
    }
    if (recorded.post_state_hash != regenerated.post_state_hash) {
        return fmt::format("post-state hash mismatch (recorded {}, replayed {})",
                           hash_to_hex(recorded.post_state_hash), hash_to_hex(regenerated.post_state_hash));
    }
    return std::nullopt;
}

ReplayResult fail(ReplayResult result, uint64_t commit_id, std::string reason) {
    spdlog::warn("Replay diverged at commit {}: {}", commit_id, reason);
    result.success = false;
    result.error = ReplayError{commit_id, std::move(reason)};
    if (result.kernel) {
        result.final_hash = result.kernel->state_hash();
    }
    return result;
}

} // namespace

bool is_top_level(axiom::CommitType type) {
    switch (type) {
        case axiom::CommitType::PROCESS_CREATED:
        case axiom::CommitType::SYSCALL_REQUEST:
        case axiom::CommitType::MESSAGE_DELIVERED:
        case axiom::CommitType::PROCESS_FAULTED:
        case axiom::CommitType::PROCESS_REAPED:
        case axiom::CommitType::PROCESS_WOKEN:
        case axiom::CommitType::TICK:
            return true;
        default:
            return false;
    }
}

std::unique_ptr<Kernel> boot_from(const axiom::Commit& boot) {
    if (boot.commit_type != axiom::CommitType::BOOT) {
        throw std::runtime_error(fmt::format("first commit is {}, not BOOT",
                                             axiom::commit_type_to_string(boot.commit_type)));
    }

    KernelConfig config;
    try {
        config = KernelConfig::from_json(nlohmann::json::parse(to_string(boot.payload)));
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(fmt::format("unreadable boot config: {}", e.what()));
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(fmt::format("invalid boot config: {}", e.what()));
    }
    return std::make_unique<Kernel>(config, nullptr);
}

bool apply_commit(Kernel& kernel, const axiom::Commit& commit) {
    ByteReader r(commit.payload);

    switch (commit.commit_type) {
        case axiom::CommitType::SYSCALL_REQUEST: {
            SyscallRequest request;
            SyscallEnv env;
            decode_request(commit.payload, request, env);
            kernel.execute(request, env);
            return true;
        }
        case axiom::CommitType::PROCESS_CREATED: {
            r.u64();    // pid is re-derived from the counter
            ProcessId parent = r.u64();
            std::string name = r.str();
            uint64_t now = r.u64();
            kernel.spawn_at(name, parent, now);
            return true;
        }
        case axiom::CommitType::MESSAGE_DELIVERED: {
            ProcessId pid = r.u64();
            r.u64();    // always the kernel
            uint32_t tag = r.u32();
            Bytes data = r.bytes();
            uint64_t now = r.u64();
            return kernel.post_at(pid, tag, data, now);
        }
        case axiom::CommitType::PROCESS_FAULTED: {
            ProcessId pid = r.u64();
            std::string reason = r.str();
            uint64_t now = r.u64();
            return kernel.fault_at(pid, reason, now);
        }
        case axiom::CommitType::PROCESS_REAPED: {
            ProcessId pid = r.u64();
            uint64_t now = r.u64();
            return kernel.reap_at(pid, now);
        }
        case axiom::CommitType::PROCESS_WOKEN: {
            ProcessId pid = r.u64();
            uint64_t now = r.u64();
            return kernel.wake_at(pid, now);
        }
        case axiom::CommitType::TICK:
            kernel.tick_at(r.u64());
            return true;
        default:
            return false;
    }
}

ReplayResult replay(const axiom::CommitLog& log) {
    ReplayResult result;
    if (log.empty()) {
        result.error = ReplayError{0, "empty log"};
        return result;
    }

    try {
        result.kernel = boot_from(log.at(0));
    } catch (const std::runtime_error& e) {
        result.error = ReplayError{0, e.what()};
        return result;
    }
    result.commits_applied = 1;

    for (const auto& commit : log.commits()) {
        // Commits already regenerated by an earlier step need no action
        if (commit.commit_id < result.kernel->log().size()) {
            continue;
        }
        try {
            apply_commit(*result.kernel, commit);
        } catch (const WireError& e) {
            result.error = ReplayError{commit.commit_id, fmt::format("malformed payload: {}", e.what())};
            result.final_hash = result.kernel->state_hash();
            return result;
        }
        result.commits_applied++;
    }

    result.success = true;
    result.final_hash = result.kernel->state_hash();
    return result;
}

ReplayResult replay_and_verify(const axiom::CommitLog& log) {
    ReplayResult result;
    if (log.empty()) {
        return fail(std::move(result), 0, "empty log");
    }

    try {
        result.kernel = boot_from(log.at(0));
    } catch (const std::runtime_error& e) {
        return fail(std::move(result), 0, e.what());
    }

    for (const auto& recorded : log.commits()) {
        Kernel& kernel = *result.kernel;

        if (recorded.commit_id >= kernel.log().size()) {
            if (!is_top_level(recorded.commit_type)) {
                return fail(std::move(result), recorded.commit_id,
                            fmt::format("unexpected {} commit",
                                        axiom::commit_type_to_string(recorded.commit_type)));
            }
            try {
                apply_commit(kernel, recorded);
            } catch (const WireError& e) {
                return fail(std::move(result), recorded.commit_id,
                            fmt::format("malformed payload: {}", e.what()));
            }
            if (recorded.commit_id >= kernel.log().size()) {
                return fail(std::move(result), recorded.commit_id,
                            fmt::format("{} had no effect on replay",
                                        axiom::commit_type_to_string(recorded.commit_type)));
            }
        }

        if (auto mismatch = compare(recorded, kernel.log().at(recorded.commit_id))) {
            return fail(std::move(result), recorded.commit_id, *mismatch);
        }
        result.commits_applied++;
    }

    if (result.kernel->log().size() > log.size()) {
        return fail(std::move(result), log.size(), "log ends inside a syscall");
    }

    result.success = true;
    result.final_hash = result.kernel->state_hash();
    spdlog::info("Replay verified {} commits, final state {}", result.commits_applied,
                 hash_to_hex(result.final_hash));
    return result;
}

} // namespace zero::kernel
