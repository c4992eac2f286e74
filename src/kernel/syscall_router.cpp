#include "kernel/syscall_router.hpp"
#include <spdlog/spdlog.h>

namespace zero::kernel {

SyscallResult SyscallRouter::handle(const SyscallRequest& request) const {
    auto it = handlers_.find(request.num);
    if (it != handlers_.end()) {
        return it->second(request);
    }

    spdlog::warn("PID {} issued unknown syscall 0x{:02x}", request.pid,
                 static_cast<uint32_t>(request.num));
    return SyscallResult::err(KernelError::INVALID_SYSCALL);
}

void SyscallRouter::register_handler(SyscallNum num, Handler handler) {
    if (handlers_.count(num)) {
        spdlog::warn("Replacing handler for {}", syscall_to_string(num));
    }
    handlers_[num] = std::move(handler);
}

} // namespace zero::kernel
