#include "kernel/syscall_handlers.hpp"
#include "kernel/syscall_router.hpp"
#include "kernel/wire.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace zero::kernel {

void SystemSyscalls::register_syscalls(SyscallRouter& router) {
    router.register_handler(SyscallNum::SYS_DEBUG,
        [this](const SyscallRequest& req) { return handle_debug(req); });
    router.register_handler(SyscallNum::SYS_YIELD,
        [this](const SyscallRequest& req) { return handle_yield(req); });
    router.register_handler(SyscallNum::SYS_TIME,
        [this](const SyscallRequest& req) { return handle_time(req); });
    router.register_handler(SyscallNum::SYS_RANDOM,
        [this](const SyscallRequest& req) { return handle_random(req); });
    router.register_handler(SyscallNum::SYS_CONSOLE_WRITE,
        [this](const SyscallRequest& req) { return handle_console_write(req); });
}

SyscallResult SystemSyscalls::handle_debug(const SyscallRequest& req) {
    if (context_.hal) {
        spdlog::debug("[pid {}] {}", req.pid, to_string(req.data));
    }
    return SyscallResult::ok();
}

SyscallResult SystemSyscalls::handle_yield(const SyscallRequest&) {
    return SyscallResult::ok();
}

SyscallResult SystemSyscalls::handle_time(const SyscallRequest&) {
    return SyscallResult::ok(context_.env.now);
}

// args: [0] byte count, clamped to MAX_RANDOM_BYTES
SyscallResult SystemSyscalls::handle_random(const SyscallRequest& req) {
    size_t wanted = std::min<size_t>(static_cast<size_t>(req.args[0]), MAX_RANDOM_BYTES);
    if (context_.env.entropy.size() != wanted) {
        return SyscallResult::err(KernelError::HAL);
    }
    return SyscallResult::with_bytes(context_.env.entropy);
}

SyscallResult SystemSyscalls::handle_console_write(const SyscallRequest& req) {
    if (req.data.size() > MAX_MESSAGE_SIZE) {
        return SyscallResult::err(KernelError::MESSAGE_TOO_LARGE);
    }
    if (context_.hal) {
        context_.hal->console_write(req.pid, to_string(req.data));
    }
    return SyscallResult::ok(req.data.size());
}

} // namespace zero::kernel
