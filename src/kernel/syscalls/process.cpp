#include "kernel/syscall_handlers.hpp"
#include "kernel/syscall_router.hpp"
#include "kernel/wire.hpp"
#include <spdlog/spdlog.h>

namespace zero::kernel {

void ProcessSyscalls::register_syscalls(SyscallRouter& router) {
    router.register_handler(SyscallNum::SYS_CREATE_ENDPOINT,
        [this](const SyscallRequest& req) { return handle_create_endpoint(req); });
    router.register_handler(SyscallNum::SYS_DELETE_ENDPOINT,
        [this](const SyscallRequest& req) { return handle_delete_endpoint(req); });
    router.register_handler(SyscallNum::SYS_KILL,
        [this](const SyscallRequest& req) { return handle_kill(req); });
    router.register_handler(SyscallNum::SYS_EXIT,
        [this](const SyscallRequest& req) { return handle_exit(req); });
    router.register_handler(SyscallNum::SYS_REGISTER_PROCESS,
        [this](const SyscallRequest& req) { return handle_register_process(req); });
    router.register_handler(SyscallNum::SYS_CREATE_ENDPOINT_FOR,
        [this](const SyscallRequest& req) { return handle_create_endpoint_for(req); });
    router.register_handler(SyscallNum::SYS_GRANT_ENDPOINT_TO,
        [this](const SyscallRequest& req) { return handle_grant_endpoint_to(req); });
    router.register_handler(SyscallNum::SYS_PS,
        [this](const SyscallRequest& req) { return handle_ps(req); });
}

// args: [0] capacity (0 = default). Returns Ok(slot, endpoint id).
SyscallResult ProcessSyscalls::handle_create_endpoint(const SyscallRequest& req) {
    auto& space = context_.state.cap_spaces.at(req.pid);
    if (space.full()) {
        return SyscallResult::err(KernelError::QUOTA_EXCEEDED);
    }

    EndpointId id = context_.create_endpoint(req.pid, static_cast<size_t>(req.args[0]));
    auto slot = context_.install_cap(req.pid, ObjectType::ENDPOINT, id, perm::ALL,
                                     context_.state.generations.current(ObjectType::ENDPOINT, id));

    Process* proc = context_.state.find_live_process(req.pid);
    if (proc->inbox == 0) {
        proc->inbox = id;
    }
    return SyscallResult::ok(*slot, id);
}

// args: [0] endpoint slot. Owner only.
SyscallResult ProcessSyscalls::handle_delete_endpoint(const SyscallRequest& req) {
    auto slot = static_cast<CapSlot>(req.args[0]);
    auto check = context_.check(req.pid, slot, ObjectType::ENDPOINT, perm::RECEIVE);
    if (!check.success) {
        return SyscallResult::err(check.error);
    }

    const Endpoint* ep = context_.state.find_endpoint(check.cap.object_id);
    if (!ep) {
        return SyscallResult::err(KernelError::ENDPOINT_NOT_FOUND);
    }
    if (ep->owner != req.pid) {
        return SyscallResult::err(KernelError::PERMISSION_DENIED);
    }

    context_.close_endpoint(check.cap.object_id);
    context_.state.cap_spaces.at(req.pid).remove(slot);
    return SyscallResult::ok();
}

// args: [0] process slot. Init may pass slot 0 and the target pid in args[1].
SyscallResult ProcessSyscalls::handle_kill(const SyscallRequest& req) {
    auto slot = static_cast<CapSlot>(req.args[0]);
    ProcessId target = 0;

    if (req.pid == INIT_PID && slot == NULL_SLOT) {
        target = static_cast<ProcessId>(req.args[1]);
    } else {
        auto check = context_.check(req.pid, slot, ObjectType::PROCESS, perm::KILL);
        if (!check.success) {
            return SyscallResult::err(check.error);
        }
        target = check.cap.object_id;
    }

    if (target == KERNEL_PID || !context_.state.find_live_process(target)) {
        return SyscallResult::err(KernelError::PROCESS_NOT_FOUND);
    }

    spdlog::info("PID {} killed PID {}", req.pid, target);
    context_.terminate_process(target, EXIT_KILLED);
    return SyscallResult::ok();
}

// args: [0] exit code
SyscallResult ProcessSyscalls::handle_exit(const SyscallRequest& req) {
    context_.terminate_process(req.pid, static_cast<int64_t>(req.args[0]));
    return SyscallResult::ok();
}

// data: process name. Returns Ok(pid, caller slot of a Process cap on it).
SyscallResult ProcessSyscalls::handle_register_process(const SyscallRequest& req) {
    if (req.pid != INIT_PID) {
        return SyscallResult::err(KernelError::PERMISSION_DENIED);
    }
    if (req.data.empty()) {
        return SyscallResult::err(KernelError::INVALID_ARGUMENT);
    }

    std::string name = to_string(req.data);
    ProcessId pid = context_.create_process(name, req.pid);

    ByteWriter w;
    w.u64(pid);
    w.u64(req.pid);
    w.str(name);
    w.u64(context_.env.now);
    context_.record(axiom::CommitType::PROCESS_CREATED, w.take());

    auto slot = context_.install_cap(req.pid, ObjectType::PROCESS, pid, perm::ALL,
                                     context_.state.generations.current(ObjectType::PROCESS, pid));
    return SyscallResult::ok(pid, slot.value_or(NULL_SLOT));
}

// args: [0] target pid. Returns Ok(slot in the target's space, endpoint id).
SyscallResult ProcessSyscalls::handle_create_endpoint_for(const SyscallRequest& req) {
    if (req.pid != INIT_PID) {
        return SyscallResult::err(KernelError::PERMISSION_DENIED);
    }

    auto target = static_cast<ProcessId>(req.args[0]);
    Process* proc = context_.state.find_live_process(target);
    if (!proc) {
        return SyscallResult::err(KernelError::PROCESS_NOT_FOUND);
    }
    if (context_.state.cap_spaces.at(target).full()) {
        return SyscallResult::err(KernelError::QUOTA_EXCEEDED);
    }

    EndpointId id = context_.create_endpoint(target, context_.config.endpoint_capacity);
    auto slot = context_.install_cap(target, ObjectType::ENDPOINT, id, perm::ALL,
                                     context_.state.generations.current(ObjectType::ENDPOINT, id));
    return SyscallResult::ok(*slot, id);
}

// args: [0] init's endpoint slot, [1] target pid, [2] permissions.
// Used to lay out the slot convention before a new process runs; no Grant needed.
SyscallResult ProcessSyscalls::handle_grant_endpoint_to(const SyscallRequest& req) {
    if (req.pid != INIT_PID) {
        return SyscallResult::err(KernelError::PERMISSION_DENIED);
    }

    auto slot = static_cast<CapSlot>(req.args[0]);
    auto target = static_cast<ProcessId>(req.args[1]);
    auto requested = static_cast<Permissions>(req.args[2]);

    auto check = context_.check(req.pid, slot, ObjectType::ENDPOINT, 0);
    if (!check.success) {
        return SyscallResult::err(check.error);
    }
    if (!context_.state.find_live_process(target)) {
        return SyscallResult::err(KernelError::PROCESS_NOT_FOUND);
    }

    auto new_slot = context_.install_cap(target, ObjectType::ENDPOINT, check.cap.object_id,
                                         KernelContext::transferable(ObjectType::ENDPOINT,
                                             static_cast<Permissions>(check.cap.permissions & requested)),
                                         check.cap.generation, check.cap.expires_at);
    if (!new_slot) {
        return SyscallResult::err(KernelError::QUOTA_EXCEEDED);
    }
    return SyscallResult::ok(*new_slot);
}

SyscallResult ProcessSyscalls::handle_ps(const SyscallRequest&) {
    SyscallResult result;
    result.kind = ResultKind::PROCESS_LIST;
    for (const auto& [pid, proc] : context_.state.processes) {
        result.processes.push_back(ProcessInfo{pid, proc.name, proc.state});
    }
    return result;
}

} // namespace zero::kernel
