#pragma once
#include <string>
#include <vector>
#include "kernel/io.hpp"
#include "kernel/kernel.hpp"
#include "kernel/syscall.hpp"

namespace zero::runtime {

using kernel::Bytes;
using kernel::CapSlot;
using kernel::Permissions;
using kernel::ProcessId;
using kernel::SyscallResult;

// Slot convention for processes spawned through init
constexpr CapSlot INBOX_SLOT = 1;
constexpr CapSlot INIT_SLOT = 2;
constexpr CapSlot VFS_SLOT = 3;
constexpr CapSlot VFS_RESPONSE_SLOT = 4;
constexpr CapSlot KEYSTORE_SLOT = 5;

// User-space syscall wrappers bound to one process
class Syscalls {
public:
    Syscalls(kernel::Kernel& kernel, ProcessId pid) : kernel_(kernel), pid_(pid) {}

    ProcessId pid() const { return pid_; }
    kernel::Kernel& kernel() { return kernel_; }

    SyscallResult call(kernel::SyscallNum num, uint64_t a0 = 0, uint64_t a1 = 0,
                       uint64_t a2 = 0, uint64_t a3 = 0, Bytes data = {},
                       std::vector<CapSlot> cap_slots = {});

    // IPC
    SyscallResult send(CapSlot slot, uint32_t tag, const Bytes& data, uint64_t flags = 0);
    SyscallResult send_cap(CapSlot slot, uint32_t tag, const Bytes& data,
                           const std::vector<CapSlot>& caps, Permissions mask = 0, uint64_t flags = 0);
    SyscallResult recv(CapSlot slot, bool blocking = true);
    SyscallResult reply(ProcessId caller, uint32_t tag, const Bytes& data, uint64_t flags = 0);

    // Capabilities
    SyscallResult cap_grant(CapSlot slot, ProcessId to_pid, Permissions perms);
    SyscallResult cap_revoke(CapSlot slot);
    SyscallResult cap_delete(CapSlot slot);
    SyscallResult cap_inspect(CapSlot slot);
    SyscallResult cap_derive(CapSlot slot, Permissions perms);
    SyscallResult cap_list();

    // Processes and endpoints
    SyscallResult create_endpoint(size_t capacity = 0);
    SyscallResult delete_endpoint(CapSlot slot);
    SyscallResult kill(CapSlot slot, ProcessId pid = 0);
    SyscallResult exit(int64_t code);
    SyscallResult register_process(const std::string& name);
    SyscallResult create_endpoint_for(ProcessId pid);
    SyscallResult grant_endpoint_to(CapSlot slot, ProcessId pid, Permissions perms);
    SyscallResult ps();

    // Misc
    SyscallResult debug(const std::string& text);
    SyscallResult console_write(const std::string& text);
    SyscallResult time();
    SyscallResult random(size_t count);
    SyscallResult yield();

    // Async storage/keystore: Ok(request_id) or an error
    SyscallResult io(kernel::IoChannel channel, kernel::IoOp op,
                     const std::string& key, const Bytes& value = {});

private:
    kernel::Kernel& kernel_;
    ProcessId pid_;
};

} // namespace zero::runtime
