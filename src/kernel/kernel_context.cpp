#include "kernel/kernel_context.hpp"
#include "kernel/state_hasher.hpp"
#include "kernel/wire.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace zero::kernel {

KernelContext::KernelContext(const KernelConfig& config, axiom::CommitLog& log, Hal* hal)
    : config(config)
    , log(log)
    , hal(hal) {}

axiom::StateHash KernelContext::hash() const {
    return hash_state(state);
}

void KernelContext::record(axiom::CommitType type, Bytes payload) {
    if (!in_syscall) {
        return;
    }
    auto current = hash();
    log.append(type, std::move(payload), current, current);
}

axiom::CheckResult KernelContext::check(ProcessId pid, CapSlot slot, ObjectType type,
                                        Permissions required) {
    auto it = state.cap_spaces.find(pid);
    if (it == state.cap_spaces.end()) {
        axiom::CheckResult result;
        result.error = KernelError::PROCESS_NOT_FOUND;
        return result;
    }
    auto result = gate.check(it->second, slot, type, required, env.now);
    if (!result.success) {
        spdlog::debug("PID {} denied on slot {}: {}", pid, slot, kernel_error_to_string(result.error));
    }
    return result;
}

axiom::CheckResult KernelContext::check_any(ProcessId pid, CapSlot slot, Permissions required) {
    ObjectType type = ObjectType::ENDPOINT;
    auto it = state.cap_spaces.find(pid);
    if (it != state.cap_spaces.end()) {
        if (const auto* cap = it->second.get(slot)) {
            type = cap->object_type;
        }
    }
    return check(pid, slot, type, required);
}

ProcessId KernelContext::create_process(const std::string& name, ProcessId parent) {
    ProcessId pid = state.next_pid++;

    Process proc;
    proc.pid = pid;
    proc.name = name;
    proc.parent = parent;
    proc.state = ProcessState::RUNNING;
    proc.metrics.start_time_ns = env.now;
    proc.metrics.last_active_ns = env.now;
    state.processes.emplace(pid, std::move(proc));
    state.cap_spaces.emplace(pid, axiom::CapabilitySpace(config.max_caps_per_space));

    EndpointId inbox = create_endpoint(pid, config.endpoint_capacity);
    auto slot = install_cap(pid, ObjectType::ENDPOINT, inbox, perm::ALL,
                            state.generations.current(ObjectType::ENDPOINT, inbox));
    if (!slot) {
        spdlog::error("Process {} '{}' has no room for its inbox capability", pid, name);
    }
    state.processes.at(pid).inbox = inbox;

    spdlog::info("Created process {} '{}' (parent {}, inbox {})", pid, name, parent, inbox);
    return pid;
}

EndpointId KernelContext::create_endpoint(ProcessId owner, size_t capacity) {
    EndpointId id = state.next_endpoint_id++;

    Endpoint ep;
    ep.id = id;
    ep.owner = owner;
    ep.capacity = capacity == 0 ? config.endpoint_capacity : capacity;
    state.endpoints.emplace(id, std::move(ep));

    spdlog::debug("Endpoint {} created for PID {} (capacity {})", id, owner,
                  state.endpoints.at(id).capacity);
    return id;
}

std::optional<CapSlot> KernelContext::install_cap(ProcessId pid, ObjectType type, uint64_t object_id,
                                                  Permissions perms, uint32_t generation,
                                                  uint64_t expires_at) {
    auto it = state.cap_spaces.find(pid);
    if (it == state.cap_spaces.end() || it->second.full()) {
        return std::nullopt;
    }

    axiom::Capability cap;
    cap.id = state.next_cap_id;
    cap.object_type = type;
    cap.object_id = object_id;
    cap.permissions = perms;
    cap.generation = generation;
    cap.expires_at = expires_at;

    auto slot = it->second.insert(cap);
    if (slot) {
        ++state.next_cap_id;
    }
    return slot;
}

Permissions KernelContext::transferable(ObjectType type, Permissions perms) {
    if (type == ObjectType::ENDPOINT) {
        return static_cast<Permissions>(perms & ~perm::RECEIVE);
    }
    return perms;
}

bool KernelContext::can_enqueue(const Endpoint& ep) const {
    return !ep.full() && ep.send_waiters.empty();
}

void KernelContext::enqueue(Endpoint& ep, Message msg) {
    ByteWriter w;
    w.u64(ep.id);
    w.u64(msg.from_pid);
    w.u32(msg.tag);
    w.bytes(msg.data);
    w.u32(static_cast<uint32_t>(msg.caps.size()));

    ep.metrics.total_messages++;
    ep.metrics.total_bytes += msg.data.size();
    ep.queue.push_back(std::move(msg));
    ep.metrics.queue_depth = ep.queue.size();
    ep.metrics.queue_high_water = std::max(ep.metrics.queue_high_water, ep.queue.size());

    wake_receiver(ep);
    record(axiom::CommitType::MESSAGE_DELIVERED, w.take());
}

Message KernelContext::take_message(Endpoint& ep) {
    Message msg = std::move(ep.queue.front());
    ep.queue.pop_front();
    ep.metrics.queue_depth = ep.queue.size();
    refill(ep);
    return msg;
}

bool KernelContext::post_to_inbox(ProcessId pid, uint32_t tag, Bytes data) {
    Process* proc = state.find_live_process(pid);
    if (!proc || proc->inbox == 0) {
        return false;
    }
    Endpoint* ep = state.find_endpoint(proc->inbox);
    if (!ep) {
        return false;
    }

    Message msg;
    msg.tag = tag;
    msg.from_pid = KERNEL_PID;
    msg.data = std::move(data);

    if (can_enqueue(*ep)) {
        enqueue(*ep, std::move(msg));
    } else {
        // Kernel messages never block anyone; they wait behind other senders
        ep->send_waiters.push_back(PendingSend{KERNEL_PID, std::move(msg)});
    }
    return true;
}

void KernelContext::close_endpoint(EndpointId id) {
    Endpoint* ep = state.find_endpoint(id);
    if (!ep) {
        return;
    }

    state.generations.bump(ObjectType::ENDPOINT, id);

    std::vector<ProcessId> parked;
    for (const auto& waiter : ep->send_waiters) {
        parked.push_back(waiter.pid);
    }
    std::deque<ProcessId> receivers = std::move(ep->recv_waiters);
    size_t dropped = ep->queue.size() + ep->send_waiters.size();
    state.endpoints.erase(id);

    for (ProcessId pid : parked) {
        release_sender(pid);
    }
    // Blocked receivers wake up and see InvalidCapability on their next RECV
    for (ProcessId pid : receivers) {
        Process* proc = state.find_live_process(pid);
        if (proc && proc->state == ProcessState::BLOCKED) {
            proc->state = ProcessState::RUNNING;
        }
    }

    for (auto& [pid, proc] : state.processes) {
        if (proc.inbox == id) {
            proc.inbox = 0;
        }
    }

    spdlog::debug("Endpoint {} closed, {} pending messages dropped", id, dropped);
}

bool KernelContext::interrupt_receive(ProcessId pid) {
    Process* proc = state.find_live_process(pid);
    if (!proc || proc->state != ProcessState::BLOCKED || is_parked(pid)) {
        return false;
    }
    for (auto& [id, ep] : state.endpoints) {
        ep.recv_waiters.erase(std::remove(ep.recv_waiters.begin(), ep.recv_waiters.end(), pid),
                              ep.recv_waiters.end());
    }
    proc->state = ProcessState::RUNNING;
    return true;
}

void KernelContext::terminate_process(ProcessId pid, int64_t exit_code) {
    Process* proc = state.find_live_process(pid);
    if (!proc) {
        return;
    }

    std::vector<EndpointId> owned;
    for (const auto& [id, ep] : state.endpoints) {
        if (ep.owner == pid) {
            owned.push_back(id);
        }
    }
    for (EndpointId id : owned) {
        close_endpoint(id);
    }

    state.generations.bump(ObjectType::PROCESS, pid);

    for (auto& [id, ep] : state.endpoints) {
        auto from_pid = [pid](const Message& m) { return m.from_pid == pid; };
        ep.queue.erase(std::remove_if(ep.queue.begin(), ep.queue.end(), from_pid), ep.queue.end());
        ep.send_waiters.erase(
            std::remove_if(ep.send_waiters.begin(), ep.send_waiters.end(),
                           [pid](const PendingSend& w) { return w.pid == pid || w.msg.from_pid == pid; }),
            ep.send_waiters.end());
        ep.recv_waiters.erase(std::remove(ep.recv_waiters.begin(), ep.recv_waiters.end(), pid),
                              ep.recv_waiters.end());
        ep.metrics.queue_depth = ep.queue.size();
        refill(ep);
    }

    for (auto& [other_pid, other] : state.processes) {
        other.reply_credits.erase(pid);
    }

    state.cap_spaces.at(pid).clear();

    pending_io.erase(std::remove_if(pending_io.begin(), pending_io.end(),
                                    [pid](const IoRequest& io) { return io.pid == pid; }),
                     pending_io.end());

    proc = state.find_process(pid);
    proc->state = ProcessState::ZOMBIE;
    proc->exit_code = exit_code;
    proc->inbox = 0;
    proc->reply_credits.clear();

    ByteWriter w;
    w.u64(pid);
    w.u64(static_cast<uint64_t>(exit_code));
    record(axiom::CommitType::PROCESS_EXITED, w.take());

    spdlog::info("Process {} '{}' exited with code {}", pid, proc->name, exit_code);
}

std::optional<CapSlot> KernelContext::revoke_object(ProcessId revoker, CapSlot slot,
                                                    const axiom::Capability& cap) {
    uint32_t old_generation = state.generations.current(cap.object_type, cap.object_id);
    uint32_t new_generation = state.generations.bump(cap.object_type, cap.object_id);

    // Notify every other process that held a then-valid capability on the object
    std::vector<std::pair<ProcessId, CapSlot>> holders;
    for (const auto& [pid, space] : state.cap_spaces) {
        if (pid == revoker) continue;
        for (const auto& [held_slot, held] : space.slots()) {
            if (held.object_type == cap.object_type && held.object_id == cap.object_id &&
                held.generation == old_generation) {
                holders.emplace_back(pid, held_slot);
                break;
            }
        }
    }

    for (const auto& [pid, held_slot] : holders) {
        ByteWriter w;
        w.u32(held_slot);
        w.u8(static_cast<uint8_t>(cap.object_type));
        w.u64(cap.object_id);
        if (!post_to_inbox(pid, MSG_CAP_REVOKED, w.take())) {
            spdlog::debug("Revocation notice for PID {} dropped (no inbox)", pid);
        }
    }

    state.cap_spaces.at(revoker).remove(slot);
    auto replacement = install_cap(revoker, cap.object_type, cap.object_id, cap.permissions,
                                   new_generation, cap.expires_at);

    ByteWriter w;
    w.u8(static_cast<uint8_t>(cap.object_type));
    w.u64(cap.object_id);
    w.u32(new_generation);
    w.u64(revoker);
    w.u32(static_cast<uint32_t>(holders.size()));
    record(axiom::CommitType::CAP_REVOKED, w.take());

    spdlog::info("PID {} revoked {} {} (generation {} -> {}, {} holders notified)",
                 revoker, object_type_to_string(cap.object_type), cap.object_id,
                 old_generation, new_generation, holders.size());
    return replacement;
}

void KernelContext::wake_receiver(Endpoint& ep) {
    while (!ep.recv_waiters.empty()) {
        ProcessId pid = ep.recv_waiters.front();
        ep.recv_waiters.pop_front();
        Process* proc = state.find_live_process(pid);
        if (proc && proc->state == ProcessState::BLOCKED) {
            proc->state = ProcessState::RUNNING;
            return;
        }
    }
}

void KernelContext::refill(Endpoint& ep) {
    while (!ep.full() && !ep.send_waiters.empty()) {
        PendingSend waiter = std::move(ep.send_waiters.front());
        ep.send_waiters.pop_front();
        enqueue(ep, std::move(waiter.msg));
        release_sender(waiter.pid);
    }
}

void KernelContext::release_sender(ProcessId pid) {
    if (pid == KERNEL_PID || is_parked(pid)) {
        return;
    }
    Process* proc = state.find_live_process(pid);
    if (proc && proc->state == ProcessState::BLOCKED) {
        proc->state = ProcessState::RUNNING;
    }
}

bool KernelContext::is_parked(ProcessId pid) const {
    for (const auto& [id, ep] : state.endpoints) {
        for (const auto& waiter : ep.send_waiters) {
            if (waiter.pid == pid) {
                return true;
            }
        }
    }
    return false;
}

} // namespace zero::kernel
