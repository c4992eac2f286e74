#include "kernel/syscall_handlers.hpp"
#include "kernel/syscall_router.hpp"
#include "kernel/wire.hpp"
#include <spdlog/spdlog.h>

namespace zero::kernel {

void StorageSyscalls::register_syscalls(SyscallRouter& router) {
    struct Route {
        SyscallNum num;
        IoChannel channel;
        IoOp op;
    };
    static const Route routes[] = {
        {SyscallNum::SYS_STORAGE_READ,    IoChannel::STORAGE,  IoOp::READ},
        {SyscallNum::SYS_STORAGE_WRITE,   IoChannel::STORAGE,  IoOp::WRITE},
        {SyscallNum::SYS_STORAGE_DELETE,  IoChannel::STORAGE,  IoOp::DELETE},
        {SyscallNum::SYS_STORAGE_LIST,    IoChannel::STORAGE,  IoOp::LIST},
        {SyscallNum::SYS_STORAGE_EXISTS,  IoChannel::STORAGE,  IoOp::EXISTS},
        {SyscallNum::SYS_KEYSTORE_READ,   IoChannel::KEYSTORE, IoOp::READ},
        {SyscallNum::SYS_KEYSTORE_WRITE,  IoChannel::KEYSTORE, IoOp::WRITE},
        {SyscallNum::SYS_KEYSTORE_DELETE, IoChannel::KEYSTORE, IoOp::DELETE},
        {SyscallNum::SYS_KEYSTORE_LIST,   IoChannel::KEYSTORE, IoOp::LIST},
        {SyscallNum::SYS_KEYSTORE_EXISTS, IoChannel::KEYSTORE, IoOp::EXISTS},
    };

    for (const auto& route : routes) {
        router.register_handler(route.num,
            [this, route](const SyscallRequest& req) { return submit(req, route.channel, route.op); });
    }
}

// data: key (prefix for LIST), or [key_len u32][key][value] for WRITE.
// Returns Ok(request_id) immediately; never suspends.
SyscallResult StorageSyscalls::submit(const SyscallRequest& req, IoChannel channel, IoOp op) {
    IoRequest io;
    io.pid = req.pid;
    io.channel = channel;
    io.op = op;

    if (op == IoOp::WRITE) {
        if (!decode_write_request(req.data, io.key, io.value)) {
            return SyscallResult::err(KernelError::INVALID_ARGUMENT);
        }
    } else {
        io.key = to_string(req.data);
    }

    if (op != IoOp::LIST && io.key.empty()) {
        return SyscallResult::err(KernelError::INVALID_ARGUMENT);
    }
    if (channel == IoChannel::KEYSTORE && io.key.rfind(KEYSTORE_PREFIX, 0) != 0) {
        spdlog::warn("PID {} keystore {} outside {}: '{}'", req.pid, io_op_to_string(op),
                     KEYSTORE_PREFIX, io.key);
        return SyscallResult::err(KernelError::INVALID_ARGUMENT);
    }

    Process* proc = context_.state.find_live_process(req.pid);
    io.request_id = proc->next_request_id++;

    spdlog::debug("PID {} {} {} '{}' -> request {}", req.pid,
                  channel == IoChannel::STORAGE ? "storage" : "keystore",
                  io_op_to_string(op), io.key, io.request_id);
    context_.pending_io.push_back(std::move(io));
    return SyscallResult::ok(proc->next_request_id - 1);
}

} // namespace zero::kernel
