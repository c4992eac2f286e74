#pragma once

namespace zero::kernel {

class SyscallRouter;

// A group of syscalls sharing the KernelContext; registers its handlers once at boot
class KernelModule {
public:
    virtual ~KernelModule() = default;
    virtual const char* name() const = 0;
    virtual void register_syscalls(SyscallRouter& router) = 0;
};

} // namespace zero::kernel
