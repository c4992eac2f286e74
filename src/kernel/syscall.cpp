#include "kernel/syscall.hpp"
#include "kernel/wire.hpp"
#include <fmt/format.h>

namespace zero::kernel {

std::string syscall_to_string(SyscallNum num) {
    switch (num) {
        case SyscallNum::SYS_DEBUG:               return "SYS_DEBUG";
        case SyscallNum::SYS_YIELD:               return "SYS_YIELD";
        case SyscallNum::SYS_EXIT:                return "SYS_EXIT";
        case SyscallNum::SYS_TIME:                return "SYS_TIME";
        case SyscallNum::SYS_RANDOM:              return "SYS_RANDOM";
        case SyscallNum::SYS_CONSOLE_WRITE:       return "SYS_CONSOLE_WRITE";
        case SyscallNum::SYS_CREATE_ENDPOINT:     return "SYS_CREATE_ENDPOINT";
        case SyscallNum::SYS_DELETE_ENDPOINT:     return "SYS_DELETE_ENDPOINT";
        case SyscallNum::SYS_KILL:                return "SYS_KILL";
        case SyscallNum::SYS_REGISTER_PROCESS:    return "SYS_REGISTER_PROCESS";
        case SyscallNum::SYS_CREATE_ENDPOINT_FOR: return "SYS_CREATE_ENDPOINT_FOR";
        case SyscallNum::SYS_GRANT_ENDPOINT_TO:   return "SYS_GRANT_ENDPOINT_TO";
        case SyscallNum::SYS_CAP_GRANT:           return "SYS_CAP_GRANT";
        case SyscallNum::SYS_CAP_REVOKE:          return "SYS_CAP_REVOKE";
        case SyscallNum::SYS_CAP_DELETE:          return "SYS_CAP_DELETE";
        case SyscallNum::SYS_CAP_INSPECT:         return "SYS_CAP_INSPECT";
        case SyscallNum::SYS_CAP_DERIVE:          return "SYS_CAP_DERIVE";
        case SyscallNum::SYS_CAP_LIST:            return "SYS_CAP_LIST";
        case SyscallNum::SYS_SEND:                return "SYS_SEND";
        case SyscallNum::SYS_RECV:                return "SYS_RECV";
        case SyscallNum::SYS_REPLY:               return "SYS_REPLY";
        case SyscallNum::SYS_SEND_CAP:            return "SYS_SEND_CAP";
        case SyscallNum::SYS_PS:                  return "SYS_PS";
        case SyscallNum::SYS_STORAGE_READ:        return "SYS_STORAGE_READ";
        case SyscallNum::SYS_STORAGE_WRITE:       return "SYS_STORAGE_WRITE";
        case SyscallNum::SYS_STORAGE_DELETE:      return "SYS_STORAGE_DELETE";
        case SyscallNum::SYS_STORAGE_LIST:        return "SYS_STORAGE_LIST";
        case SyscallNum::SYS_STORAGE_EXISTS:      return "SYS_STORAGE_EXISTS";
        case SyscallNum::SYS_KEYSTORE_READ:       return "SYS_KEYSTORE_READ";
        case SyscallNum::SYS_KEYSTORE_WRITE:      return "SYS_KEYSTORE_WRITE";
        case SyscallNum::SYS_KEYSTORE_DELETE:     return "SYS_KEYSTORE_DELETE";
        case SyscallNum::SYS_KEYSTORE_LIST:       return "SYS_KEYSTORE_LIST";
        case SyscallNum::SYS_KEYSTORE_EXISTS:     return "SYS_KEYSTORE_EXISTS";
        default: return fmt::format("SYS_UNKNOWN(0x{:02x})", static_cast<uint32_t>(num));
    }
}

SyscallResult SyscallResult::ok(uint64_t value, uint64_t aux) {
    SyscallResult r;
    r.kind = ResultKind::OK;
    r.value = value;
    r.aux = aux;
    return r;
}

SyscallResult SyscallResult::err(KernelError error) {
    SyscallResult r;
    r.kind = ResultKind::ERR;
    r.error = error;
    return r;
}

SyscallResult SyscallResult::blocked() {
    SyscallResult r;
    r.kind = ResultKind::BLOCKED;
    return r;
}

SyscallResult SyscallResult::with_message(ReceivedMessage msg) {
    SyscallResult r;
    r.kind = ResultKind::MESSAGE;
    r.message = std::move(msg);
    return r;
}

SyscallResult SyscallResult::with_bytes(Bytes bytes) {
    SyscallResult r;
    r.kind = ResultKind::BYTES;
    r.bytes = std::move(bytes);
    return r;
}

Bytes SyscallResult::encode() const {
    ByteWriter w;
    w.u8(static_cast<uint8_t>(kind));
    switch (kind) {
        case ResultKind::OK:
            w.u64(value);
            w.u64(aux);
            break;
        case ResultKind::ERR:
            w.u8(static_cast<uint8_t>(error));
            break;
        case ResultKind::BLOCKED:
            break;
        case ResultKind::MESSAGE:
            w.u32(message->tag);
            w.u64(message->from_pid);
            w.bytes(message->data);
            w.u32(static_cast<uint32_t>(message->cap_slots.size()));
            for (CapSlot slot : message->cap_slots) {
                w.u32(slot);
            }
            break;
        case ResultKind::CAP_INFO:
        case ResultKind::CAP_LIST:
            w.u32(static_cast<uint32_t>(caps.size()));
            for (const auto& cap : caps) {
                w.u32(cap.slot);
                w.u64(cap.cap_id);
                w.u8(static_cast<uint8_t>(cap.object_type));
                w.u64(cap.object_id);
                w.u8(cap.permissions);
                w.u32(cap.generation);
                w.u64(cap.expires_at);
            }
            break;
        case ResultKind::PROCESS_LIST:
            w.u32(static_cast<uint32_t>(processes.size()));
            for (const auto& proc : processes) {
                w.u64(proc.pid);
                w.str(proc.name);
                w.u8(static_cast<uint8_t>(proc.state));
            }
            break;
        case ResultKind::BYTES:
            w.bytes(bytes);
            break;
    }
    return w.take();
}

std::string SyscallResult::describe() const {
    switch (kind) {
        case ResultKind::OK:           return fmt::format("Ok({})", value);
        case ResultKind::ERR:          return fmt::format("Err({})", kernel_error_to_string(error));
        case ResultKind::BLOCKED:      return "Blocked";
        case ResultKind::MESSAGE:      return fmt::format("Message(tag=0x{:x}, from={}, {} bytes)",
                                                          message->tag, message->from_pid, message->data.size());
        case ResultKind::CAP_INFO:     return "CapInfo";
        case ResultKind::CAP_LIST:     return fmt::format("CapList({})", caps.size());
        case ResultKind::PROCESS_LIST: return fmt::format("ProcessList({})", processes.size());
        case ResultKind::BYTES:        return fmt::format("Bytes({})", bytes.size());
        default: return "Unknown";
    }
}

Bytes encode_request(const SyscallRequest& request, const SyscallEnv& env) {
    ByteWriter w;
    w.u64(request.pid);
    w.u32(static_cast<uint32_t>(request.num));
    for (uint64_t arg : request.args) {
        w.u64(arg);
    }
    w.bytes(request.data);
    w.u32(static_cast<uint32_t>(request.cap_slots.size()));
    for (CapSlot slot : request.cap_slots) {
        w.u32(slot);
    }
    w.u64(env.now);
    w.bytes(env.entropy);
    return w.take();
}

void decode_request(const Bytes& payload, SyscallRequest& request, SyscallEnv& env) {
    ByteReader r(payload);
    request.pid = r.u64();
    request.num = static_cast<SyscallNum>(r.u32());
    for (auto& arg : request.args) {
        arg = r.u64();
    }
    request.data = r.bytes();
    uint32_t cap_count = r.u32();
    if (cap_count > r.remaining() / 4) {
        throw WireError("cap slot count exceeds payload");
    }
    request.cap_slots.clear();
    for (uint32_t i = 0; i < cap_count; ++i) {
        request.cap_slots.push_back(r.u32());
    }
    env.now = r.u64();
    env.entropy = r.bytes();
    if (!r.done()) {
        throw WireError("trailing bytes after syscall request");
    }
}

} // namespace zero::kernel
