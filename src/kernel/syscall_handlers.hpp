#pragma once
#include "kernel/kernel_context.hpp"
#include "kernel/module.hpp"
#include "kernel/syscall.hpp"

namespace zero::kernel {

class SyscallRouter;

// SEND, RECV, REPLY, SEND_CAP
class IpcSyscalls : public KernelModule {
public:
    explicit IpcSyscalls(KernelContext& context) : context_(context) {}
    const char* name() const override { return "ipc"; }
    void register_syscalls(SyscallRouter& router) override;

private:
    SyscallResult handle_send(const SyscallRequest& req);
    SyscallResult handle_send_cap(const SyscallRequest& req);
    SyscallResult handle_recv(const SyscallRequest& req);
    SyscallResult handle_reply(const SyscallRequest& req);

    // Shared tail of SEND/SEND_CAP/REPLY once the target endpoint is resolved
    SyscallResult deliver(ProcessId sender, Endpoint& ep, Message msg, bool nonblocking);

    KernelContext& context_;
};

// CAP_GRANT, CAP_REVOKE, CAP_DELETE, CAP_INSPECT, CAP_DERIVE, CAP_LIST
class CapabilitySyscalls : public KernelModule {
public:
    explicit CapabilitySyscalls(KernelContext& context) : context_(context) {}
    const char* name() const override { return "capability"; }
    void register_syscalls(SyscallRouter& router) override;

private:
    SyscallResult handle_grant(const SyscallRequest& req);
    SyscallResult handle_revoke(const SyscallRequest& req);
    SyscallResult handle_delete(const SyscallRequest& req);
    SyscallResult handle_inspect(const SyscallRequest& req);
    SyscallResult handle_derive(const SyscallRequest& req);
    SyscallResult handle_list(const SyscallRequest& req);

    KernelContext& context_;
};

// CREATE_ENDPOINT, DELETE_ENDPOINT, KILL, EXIT, PS and the init-only spawn protocol
class ProcessSyscalls : public KernelModule {
public:
    explicit ProcessSyscalls(KernelContext& context) : context_(context) {}
    const char* name() const override { return "process"; }
    void register_syscalls(SyscallRouter& router) override;

private:
    SyscallResult handle_create_endpoint(const SyscallRequest& req);
    SyscallResult handle_delete_endpoint(const SyscallRequest& req);
    SyscallResult handle_kill(const SyscallRequest& req);
    SyscallResult handle_exit(const SyscallRequest& req);
    SyscallResult handle_register_process(const SyscallRequest& req);
    SyscallResult handle_create_endpoint_for(const SyscallRequest& req);
    SyscallResult handle_grant_endpoint_to(const SyscallRequest& req);
    SyscallResult handle_ps(const SyscallRequest& req);

    KernelContext& context_;
};

// DEBUG, YIELD, TIME, RANDOM, CONSOLE_WRITE
class SystemSyscalls : public KernelModule {
public:
    explicit SystemSyscalls(KernelContext& context) : context_(context) {}
    const char* name() const override { return "system"; }
    void register_syscalls(SyscallRouter& router) override;

private:
    SyscallResult handle_debug(const SyscallRequest& req);
    SyscallResult handle_yield(const SyscallRequest& req);
    SyscallResult handle_time(const SyscallRequest& req);
    SyscallResult handle_random(const SyscallRequest& req);
    SyscallResult handle_console_write(const SyscallRequest& req);

    KernelContext& context_;
};

// STORAGE_* and KEYSTORE_*: return a request id now, complete via the inbox later
class StorageSyscalls : public KernelModule {
public:
    explicit StorageSyscalls(KernelContext& context) : context_(context) {}
    const char* name() const override { return "storage"; }
    void register_syscalls(SyscallRouter& router) override;

private:
    SyscallResult submit(const SyscallRequest& req, IoChannel channel, IoOp op);

    KernelContext& context_;
};

} // namespace zero::kernel
