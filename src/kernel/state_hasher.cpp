#include "kernel/state_hasher.hpp"
#include "kernel/wire.hpp"
#include <openssl/sha.h>
#include <stdexcept>

namespace zero::kernel {

namespace {

void write_message(ByteWriter& w, const Message& msg) {
    w.u32(msg.tag);
    w.u64(msg.from_pid);
    w.bytes(msg.data);
    w.u32(static_cast<uint32_t>(msg.caps.size()));
    for (const auto& cap : msg.caps) {
        w.u8(static_cast<uint8_t>(cap.object_type));
        w.u64(cap.object_id);
        w.u8(cap.permissions);
        w.u32(cap.generation);
        w.u64(cap.expires_at);
    }
}

} // namespace

Bytes serialize_state(const KernelState& state) {
    ByteWriter w;

    w.u64(state.next_pid);
    w.u64(state.next_endpoint_id);
    w.u64(state.next_cap_id);
    w.u64(state.last_tick_ns);

    w.u32(static_cast<uint32_t>(state.processes.size()));
    for (const auto& [pid, proc] : state.processes) {
        w.u64(pid);
        w.str(proc.name);
        w.u64(proc.parent);
        w.u8(static_cast<uint8_t>(proc.state));
        w.u64(proc.inbox);
        w.u32(proc.next_request_id);
        w.u64(static_cast<uint64_t>(proc.exit_code));
        w.u32(static_cast<uint32_t>(proc.reply_credits.size()));
        for (const auto& [caller, credits] : proc.reply_credits) {
            w.u64(caller);
            w.u32(credits);
        }
    }

    w.u32(static_cast<uint32_t>(state.endpoints.size()));
    for (const auto& [id, ep] : state.endpoints) {
        w.u64(id);
        w.u64(ep.owner);
        w.u64(ep.capacity);
        w.u32(static_cast<uint32_t>(ep.queue.size()));
        for (const auto& msg : ep.queue) {
            write_message(w, msg);
        }
        w.u32(static_cast<uint32_t>(ep.send_waiters.size()));
        for (const auto& waiter : ep.send_waiters) {
            w.u64(waiter.pid);
            write_message(w, waiter.msg);
        }
        w.u32(static_cast<uint32_t>(ep.recv_waiters.size()));
        for (ProcessId pid : ep.recv_waiters) {
            w.u64(pid);
        }
    }

    w.u32(static_cast<uint32_t>(state.cap_spaces.size()));
    for (const auto& [pid, space] : state.cap_spaces) {
        w.u64(pid);
        w.u32(space.next_slot());
        w.u32(static_cast<uint32_t>(space.size()));
        for (const auto& [slot, cap] : space.slots()) {
            w.u32(slot);
            w.u64(cap.id);
            w.u8(static_cast<uint8_t>(cap.object_type));
            w.u64(cap.object_id);
            w.u8(cap.permissions);
            w.u32(cap.generation);
            w.u64(cap.expires_at);
        }
    }

    w.u32(static_cast<uint32_t>(state.generations.entries().size()));
    for (const auto& [key, generation] : state.generations.entries()) {
        w.u8(static_cast<uint8_t>(key.type));
        w.u64(key.id);
        w.u32(generation);
    }

    return w.take();
}

axiom::StateHash hash_state(const KernelState& state) {
    Bytes data = serialize_state(state);
    axiom::StateHash hash{};
    if (SHA256(data.data(), data.size(), hash.data()) == nullptr) {
        throw std::runtime_error("SHA256 failed while hashing kernel state");
    }
    return hash;
}

std::string hash_to_hex(const axiom::StateHash& hash) {
    return to_hex(hash.data(), hash.size());
}

} // namespace zero::kernel
