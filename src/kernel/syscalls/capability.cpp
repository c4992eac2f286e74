#include "kernel/syscall_handlers.hpp"
#include "kernel/syscall_router.hpp"
#include <spdlog/spdlog.h>

namespace zero::kernel {

namespace {

CapInfo to_info(CapSlot slot, const axiom::Capability& cap) {
    CapInfo info;
    info.slot = slot;
    info.cap_id = cap.id;
    info.object_type = cap.object_type;
    info.object_id = cap.object_id;
    info.permissions = cap.permissions;
    info.generation = cap.generation;
    info.expires_at = cap.expires_at;
    return info;
}

} // namespace

void CapabilitySyscalls::register_syscalls(SyscallRouter& router) {
    router.register_handler(SyscallNum::SYS_CAP_GRANT,
        [this](const SyscallRequest& req) { return handle_grant(req); });
    router.register_handler(SyscallNum::SYS_CAP_REVOKE,
        [this](const SyscallRequest& req) { return handle_revoke(req); });
    router.register_handler(SyscallNum::SYS_CAP_DELETE,
        [this](const SyscallRequest& req) { return handle_delete(req); });
    router.register_handler(SyscallNum::SYS_CAP_INSPECT,
        [this](const SyscallRequest& req) { return handle_inspect(req); });
    router.register_handler(SyscallNum::SYS_CAP_DERIVE,
        [this](const SyscallRequest& req) { return handle_derive(req); });
    router.register_handler(SyscallNum::SYS_CAP_LIST,
        [this](const SyscallRequest& req) { return handle_list(req); });
}

// args: [0] slot, [1] target pid, [2] requested permissions
SyscallResult CapabilitySyscalls::handle_grant(const SyscallRequest& req) {
    auto slot = static_cast<CapSlot>(req.args[0]);
    auto target = static_cast<ProcessId>(req.args[1]);
    auto requested = static_cast<Permissions>(req.args[2]);

    auto check = context_.check_any(req.pid, slot, perm::GRANT);
    if (!check.success) {
        return SyscallResult::err(check.error);
    }

    if (!context_.state.find_live_process(target)) {
        return SyscallResult::err(KernelError::PROCESS_NOT_FOUND);
    }

    // Attenuation only: never more than the source holds
    auto granted = KernelContext::transferable(check.cap.object_type,
                                               static_cast<Permissions>(check.cap.permissions & requested));
    auto new_slot = context_.install_cap(target, check.cap.object_type, check.cap.object_id,
                                         granted, check.cap.generation, check.cap.expires_at);
    if (!new_slot) {
        return SyscallResult::err(KernelError::QUOTA_EXCEEDED);
    }

    spdlog::debug("PID {} granted {} {} [{}] to PID {} at slot {}", req.pid,
                  object_type_to_string(check.cap.object_type), check.cap.object_id,
                  permissions_to_string(granted), target, *new_slot);
    return SyscallResult::ok(*new_slot);
}

// args: [0] slot. Returns the revoker's replacement slot.
SyscallResult CapabilitySyscalls::handle_revoke(const SyscallRequest& req) {
    auto slot = static_cast<CapSlot>(req.args[0]);
    auto check = context_.check_any(req.pid, slot, perm::REVOKE);
    if (!check.success) {
        return SyscallResult::err(check.error);
    }

    auto replacement = context_.revoke_object(req.pid, slot, check.cap);
    if (!replacement) {
        return SyscallResult::err(KernelError::QUOTA_EXCEEDED);
    }
    return SyscallResult::ok(*replacement);
}

// args: [0] slot. Own space only, no permission needed.
SyscallResult CapabilitySyscalls::handle_delete(const SyscallRequest& req) {
    auto slot = static_cast<CapSlot>(req.args[0]);
    auto& space = context_.state.cap_spaces.at(req.pid);
    if (!space.remove(slot)) {
        return SyscallResult::err(KernelError::INVALID_CAPABILITY);
    }
    return SyscallResult::ok();
}

// args: [0] slot
SyscallResult CapabilitySyscalls::handle_inspect(const SyscallRequest& req) {
    auto slot = static_cast<CapSlot>(req.args[0]);
    auto check = context_.check_any(req.pid, slot, perm::INSPECT);
    if (!check.success) {
        return SyscallResult::err(check.error);
    }

    SyscallResult result;
    result.kind = ResultKind::CAP_INFO;
    result.caps.push_back(to_info(slot, check.cap));
    return result;
}

// args: [0] slot, [1] permissions for the copy (masked by what the slot holds)
SyscallResult CapabilitySyscalls::handle_derive(const SyscallRequest& req) {
    auto slot = static_cast<CapSlot>(req.args[0]);
    auto requested = static_cast<Permissions>(req.args[1]);

    auto check = context_.check_any(req.pid, slot, 0);
    if (!check.success) {
        return SyscallResult::err(check.error);
    }

    auto derived = static_cast<Permissions>(check.cap.permissions & requested);
    auto new_slot = context_.install_cap(req.pid, check.cap.object_type, check.cap.object_id,
                                         derived, check.cap.generation, check.cap.expires_at);
    if (!new_slot) {
        return SyscallResult::err(KernelError::QUOTA_EXCEEDED);
    }
    return SyscallResult::ok(*new_slot);
}

SyscallResult CapabilitySyscalls::handle_list(const SyscallRequest& req) {
    SyscallResult result;
    result.kind = ResultKind::CAP_LIST;
    for (const auto& [slot, cap] : context_.state.cap_spaces.at(req.pid).slots()) {
        result.caps.push_back(to_info(slot, cap));
    }
    return result;
}

} // namespace zero::kernel
