#include "runtime/syscalls.hpp"
#include "kernel/wire.hpp"

namespace zero::runtime {

using kernel::SyscallNum;

SyscallResult Syscalls::call(SyscallNum num, uint64_t a0, uint64_t a1, uint64_t a2, uint64_t a3,
                             Bytes data, std::vector<CapSlot> cap_slots) {
    kernel::SyscallRequest request;
    request.pid = pid_;
    request.num = num;
    request.args = {a0, a1, a2, a3};
    request.data = std::move(data);
    request.cap_slots = std::move(cap_slots);
    return kernel_.dispatch(request);
}

SyscallResult Syscalls::send(CapSlot slot, uint32_t tag, const Bytes& data, uint64_t flags) {
    return call(SyscallNum::SYS_SEND, slot, tag, flags, 0, data);
}

SyscallResult Syscalls::send_cap(CapSlot slot, uint32_t tag, const Bytes& data,
                                 const std::vector<CapSlot>& caps, Permissions mask, uint64_t flags) {
    return call(SyscallNum::SYS_SEND_CAP, slot, tag, flags, mask, data, caps);
}

SyscallResult Syscalls::recv(CapSlot slot, bool blocking) {
    return call(SyscallNum::SYS_RECV, slot, blocking ? 0 : kernel::FLAG_NONBLOCK);
}

SyscallResult Syscalls::reply(ProcessId caller, uint32_t tag, const Bytes& data, uint64_t flags) {
    return call(SyscallNum::SYS_REPLY, caller, tag, flags, 0, data);
}

SyscallResult Syscalls::cap_grant(CapSlot slot, ProcessId to_pid, Permissions perms) {
    return call(SyscallNum::SYS_CAP_GRANT, slot, to_pid, perms);
}

SyscallResult Syscalls::cap_revoke(CapSlot slot) {
    return call(SyscallNum::SYS_CAP_REVOKE, slot);
}

SyscallResult Syscalls::cap_delete(CapSlot slot) {
    return call(SyscallNum::SYS_CAP_DELETE, slot);
}

SyscallResult Syscalls::cap_inspect(CapSlot slot) {
    return call(SyscallNum::SYS_CAP_INSPECT, slot);
}

SyscallResult Syscalls::cap_derive(CapSlot slot, Permissions perms) {
    return call(SyscallNum::SYS_CAP_DERIVE, slot, perms);
}

SyscallResult Syscalls::cap_list() {
    return call(SyscallNum::SYS_CAP_LIST);
}

SyscallResult Syscalls::create_endpoint(size_t capacity) {
    return call(SyscallNum::SYS_CREATE_ENDPOINT, capacity);
}

SyscallResult Syscalls::delete_endpoint(CapSlot slot) {
    return call(SyscallNum::SYS_DELETE_ENDPOINT, slot);
}

SyscallResult Syscalls::kill(CapSlot slot, ProcessId pid) {
    return call(SyscallNum::SYS_KILL, slot, pid);
}

SyscallResult Syscalls::exit(int64_t code) {
    return call(SyscallNum::SYS_EXIT, static_cast<uint64_t>(code));
}

SyscallResult Syscalls::register_process(const std::string& name) {
    return call(SyscallNum::SYS_REGISTER_PROCESS, 0, 0, 0, 0, kernel::to_bytes(name));
}

SyscallResult Syscalls::create_endpoint_for(ProcessId pid) {
    return call(SyscallNum::SYS_CREATE_ENDPOINT_FOR, pid);
}

SyscallResult Syscalls::grant_endpoint_to(CapSlot slot, ProcessId pid, Permissions perms) {
    return call(SyscallNum::SYS_GRANT_ENDPOINT_TO, slot, pid, perms);
}

SyscallResult Syscalls::ps() {
    return call(SyscallNum::SYS_PS);
}

SyscallResult Syscalls::debug(const std::string& text) {
    return call(SyscallNum::SYS_DEBUG, 0, 0, 0, 0, kernel::to_bytes(text));
}

SyscallResult Syscalls::console_write(const std::string& text) {
    return call(SyscallNum::SYS_CONSOLE_WRITE, 0, 0, 0, 0, kernel::to_bytes(text));
}

SyscallResult Syscalls::time() {
    return call(SyscallNum::SYS_TIME);
}

SyscallResult Syscalls::random(size_t count) {
    return call(SyscallNum::SYS_RANDOM, count);
}

SyscallResult Syscalls::yield() {
    return call(SyscallNum::SYS_YIELD);
}

SyscallResult Syscalls::io(kernel::IoChannel channel, kernel::IoOp op,
                           const std::string& key, const Bytes& value) {
    bool storage = channel == kernel::IoChannel::STORAGE;
    SyscallNum num = SyscallNum::SYS_STORAGE_READ;
    switch (op) {
        case kernel::IoOp::READ:
            num = storage ? SyscallNum::SYS_STORAGE_READ : SyscallNum::SYS_KEYSTORE_READ;
            break;
        case kernel::IoOp::WRITE:
            num = storage ? SyscallNum::SYS_STORAGE_WRITE : SyscallNum::SYS_KEYSTORE_WRITE;
            break;
        case kernel::IoOp::DELETE:
            num = storage ? SyscallNum::SYS_STORAGE_DELETE : SyscallNum::SYS_KEYSTORE_DELETE;
            break;
        case kernel::IoOp::LIST:
            num = storage ? SyscallNum::SYS_STORAGE_LIST : SyscallNum::SYS_KEYSTORE_LIST;
            break;
        case kernel::IoOp::EXISTS:
            num = storage ? SyscallNum::SYS_STORAGE_EXISTS : SyscallNum::SYS_KEYSTORE_EXISTS;
            break;
    }

    Bytes data = op == kernel::IoOp::WRITE ? kernel::encode_write_request(key, value)
                                           : kernel::to_bytes(key);
    return call(num, 0, 0, 0, 0, std::move(data));
}

} // namespace zero::runtime
