#pragma once
#include <functional>
#include <unordered_map>
#include "kernel/syscall.hpp"

namespace zero::kernel {

// Syscall number -> handler table. Unknown numbers yield InvalidSyscall.
class SyscallRouter {
public:
    using Handler = std::function<SyscallResult(const SyscallRequest&)>;

    SyscallRouter() = default;

    SyscallResult handle(const SyscallRequest& request) const;
    void register_handler(SyscallNum num, Handler handler);
    size_t handler_count() const { return handlers_.size(); }

private:
    std::unordered_map<SyscallNum, Handler> handlers_;
};

} // namespace zero::kernel
