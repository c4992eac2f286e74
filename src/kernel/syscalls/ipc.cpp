#include "kernel/syscall_handlers.hpp"
#include "kernel/syscall_router.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace zero::kernel {

void IpcSyscalls::register_syscalls(SyscallRouter& router) {
    router.register_handler(SyscallNum::SYS_SEND,
        [this](const SyscallRequest& req) { return handle_send(req); });
    router.register_handler(SyscallNum::SYS_SEND_CAP,
        [this](const SyscallRequest& req) { return handle_send_cap(req); });
    router.register_handler(SyscallNum::SYS_RECV,
        [this](const SyscallRequest& req) { return handle_recv(req); });
    router.register_handler(SyscallNum::SYS_REPLY,
        [this](const SyscallRequest& req) { return handle_reply(req); });
}

// args: [0] endpoint slot, [1] tag, [2] flags
SyscallResult IpcSyscalls::handle_send(const SyscallRequest& req) {
    auto slot = static_cast<CapSlot>(req.args[0]);
    auto check = context_.check(req.pid, slot, ObjectType::ENDPOINT, perm::SEND);
    if (!check.success) {
        return SyscallResult::err(check.error);
    }

    if (req.data.size() > MAX_MESSAGE_SIZE) {
        return SyscallResult::err(KernelError::MESSAGE_TOO_LARGE);
    }

    Endpoint* ep = context_.state.find_endpoint(check.cap.object_id);
    if (!ep) {
        return SyscallResult::err(KernelError::ENDPOINT_NOT_FOUND);
    }

    Message msg;
    msg.tag = static_cast<uint32_t>(req.args[1]);
    msg.from_pid = req.pid;
    msg.data = req.data;
    return deliver(req.pid, *ep, std::move(msg), (req.args[2] & FLAG_NONBLOCK) != 0);
}

// args: [0] endpoint slot, [1] tag, [2] flags, [3] permission mask for transferred caps (0 = as held)
SyscallResult IpcSyscalls::handle_send_cap(const SyscallRequest& req) {
    auto slot = static_cast<CapSlot>(req.args[0]);
    auto check = context_.check(req.pid, slot, ObjectType::ENDPOINT, perm::SEND);
    if (!check.success) {
        return SyscallResult::err(check.error);
    }

    // The sender must be able to grant everything it transfers
    auto mask = static_cast<Permissions>(req.args[3]);
    std::vector<TransferredCap> caps;
    for (CapSlot cap_slot : req.cap_slots) {
        auto grant = context_.check_any(req.pid, cap_slot, perm::GRANT);
        if (!grant.success) {
            return SyscallResult::err(grant.error);
        }
        Permissions perms = mask == 0 ? grant.cap.permissions
                                      : static_cast<Permissions>(grant.cap.permissions & mask);
        caps.push_back(TransferredCap::from(grant.cap, KernelContext::transferable(grant.cap.object_type, perms)));
    }

    if (req.data.size() > MAX_MESSAGE_SIZE || caps.size() > MAX_CAPS_PER_MESSAGE) {
        return SyscallResult::err(KernelError::MESSAGE_TOO_LARGE);
    }

    Endpoint* ep = context_.state.find_endpoint(check.cap.object_id);
    if (!ep) {
        return SyscallResult::err(KernelError::ENDPOINT_NOT_FOUND);
    }

    Message msg;
    msg.tag = static_cast<uint32_t>(req.args[1]);
    msg.from_pid = req.pid;
    msg.data = req.data;
    msg.caps = std::move(caps);
    return deliver(req.pid, *ep, std::move(msg), (req.args[2] & FLAG_NONBLOCK) != 0);
}

// args: [0] endpoint slot, [1] flags
SyscallResult IpcSyscalls::handle_recv(const SyscallRequest& req) {
    auto slot = static_cast<CapSlot>(req.args[0]);
    auto check = context_.check(req.pid, slot, ObjectType::ENDPOINT, perm::RECEIVE);
    if (!check.success) {
        return SyscallResult::err(check.error);
    }

    Endpoint* ep = context_.state.find_endpoint(check.cap.object_id);
    if (!ep) {
        return SyscallResult::err(KernelError::ENDPOINT_NOT_FOUND);
    }
    if (ep->owner != req.pid) {
        spdlog::warn("PID {} tried to receive on endpoint {} owned by PID {}", req.pid, ep->id, ep->owner);
        return SyscallResult::err(KernelError::PERMISSION_DENIED);
    }

    Process* proc = context_.state.find_live_process(req.pid);

    if (ep->queue.empty()) {
        if (req.args[1] & FLAG_NONBLOCK) {
            return SyscallResult::err(KernelError::WOULD_BLOCK);
        }
        if (std::find(ep->recv_waiters.begin(), ep->recv_waiters.end(), req.pid) == ep->recv_waiters.end()) {
            ep->recv_waiters.push_back(req.pid);
        }
        proc->state = ProcessState::BLOCKED;
        return SyscallResult::blocked();
    }

    Message msg = context_.take_message(*ep);
    ep->recv_waiters.erase(std::remove(ep->recv_waiters.begin(), ep->recv_waiters.end(), req.pid),
                           ep->recv_waiters.end());

    ReceivedMessage received;
    received.tag = msg.tag;
    received.from_pid = msg.from_pid;
    received.data = std::move(msg.data);
    for (const auto& cap : msg.caps) {
        auto installed = context_.install_cap(req.pid, cap.object_type, cap.object_id,
                                              cap.permissions, cap.generation, cap.expires_at);
        if (installed) {
            received.cap_slots.push_back(*installed);
        } else {
            spdlog::warn("PID {} capability space full, dropping transferred {} {}",
                         req.pid, object_type_to_string(cap.object_type), cap.object_id);
        }
    }

    if (received.from_pid != KERNEL_PID) {
        proc->reply_credits[received.from_pid]++;
    }
    proc->metrics.ipc_received++;
    proc->metrics.ipc_bytes_received += received.data.size();

    spdlog::debug("PID {} received tag 0x{:x} from PID {} ({} bytes, {} caps)", req.pid,
                  received.tag, received.from_pid, received.data.size(), received.cap_slots.size());
    return SyscallResult::with_message(std::move(received));
}

// args: [0] caller pid, [1] tag, [2] flags (ignored: a reply never waits)
SyscallResult IpcSyscalls::handle_reply(const SyscallRequest& req) {
    auto caller = static_cast<ProcessId>(req.args[0]);

    Process* self = context_.state.find_live_process(req.pid);
    auto credit = self->reply_credits.find(caller);
    if (credit == self->reply_credits.end()) {
        return SyscallResult::err(KernelError::PERMISSION_DENIED);
    }

    if (req.data.size() > MAX_MESSAGE_SIZE) {
        return SyscallResult::err(KernelError::MESSAGE_TOO_LARGE);
    }

    Process* target = context_.state.find_live_process(caller);
    if (!target || target->inbox == 0) {
        return SyscallResult::err(KernelError::PROCESS_NOT_FOUND);
    }
    Endpoint* ep = context_.state.find_endpoint(target->inbox);
    if (!ep) {
        return SyscallResult::err(KernelError::ENDPOINT_NOT_FOUND);
    }

    // A full caller inbox leaves the credit in place for a later attempt
    Message msg;
    msg.tag = static_cast<uint32_t>(req.args[1]);
    msg.from_pid = req.pid;
    msg.data = req.data;
    auto result = deliver(req.pid, *ep, std::move(msg), true);

    if (result.kind == ResultKind::OK) {
        if (--credit->second == 0) {
            self->reply_credits.erase(credit);
        }
    }
    return result;
}

SyscallResult IpcSyscalls::deliver(ProcessId sender, Endpoint& ep, Message msg, bool nonblocking) {
    Process* proc = context_.state.find_live_process(sender);
    size_t bytes = msg.data.size();
    uint32_t tag = msg.tag;

    if (context_.can_enqueue(ep)) {
        context_.enqueue(ep, std::move(msg));
        proc->metrics.ipc_sent++;
        proc->metrics.ipc_bytes_sent += bytes;
        spdlog::debug("PID {} sent tag 0x{:x} to endpoint {} ({} bytes)", sender, tag, ep.id, bytes);
        return SyscallResult::ok();
    }

    if (nonblocking) {
        return SyscallResult::err(KernelError::WOULD_BLOCK);
    }

    ep.send_waiters.push_back(PendingSend{sender, std::move(msg)});
    proc->state = ProcessState::BLOCKED;
    proc->metrics.ipc_sent++;
    proc->metrics.ipc_bytes_sent += bytes;
    spdlog::debug("PID {} blocked sending to full endpoint {}", sender, ep.id);
    return SyscallResult::blocked();
}

} // namespace zero::kernel
