#pragma once
#include <deque>
#include <optional>
#include <string>
#include "axiom/capability.hpp"
#include "axiom/commit_log.hpp"
#include "kernel/config.hpp"
#include "kernel/hal.hpp"
#include "kernel/io.hpp"
#include "kernel/kernel_state.hpp"
#include "kernel/syscall.hpp"

namespace zero::kernel {

/**
 * Kernel state plus the primitives syscall modules share: capability
 * checks, object creation, message delivery and process teardown.
 *
 * Commits recorded through record() are only written while a syscall is
 * executing; top-level operations record their own commit around the
 * whole mutation.
 */
class KernelContext {
public:
    KernelContext(const KernelConfig& config, axiom::CommitLog& log, Hal* hal);

    KernelContext(const KernelContext&) = delete;
    KernelContext& operator=(const KernelContext&) = delete;

    KernelState state;
    axiom::AxiomGate gate{state.generations};
    const KernelConfig config;
    axiom::CommitLog& log;
    Hal* hal;                           // null while replaying
    SyscallEnv env;                     // HAL values for the current operation
    bool in_syscall = false;
    std::deque<IoRequest> pending_io;   // not part of the hashed state
    uint64_t dropped_io_results = 0;

    axiom::StateHash hash() const;

    // Records an informational commit emitted from inside a syscall
    void record(axiom::CommitType type, Bytes payload);

    // The Axiom gate against pid's capability space
    axiom::CheckResult check(ProcessId pid, CapSlot slot, ObjectType type, Permissions required);

    // Gate check whose object type is taken from the slot itself
    axiom::CheckResult check_any(ProcessId pid, CapSlot slot, Permissions required);

    // Creates a Running process with its inbox endpoint at slot 1
    ProcessId create_process(const std::string& name, ProcessId parent);

    EndpointId create_endpoint(ProcessId owner, size_t capacity);

    std::optional<CapSlot> install_cap(ProcessId pid, ObjectType type, uint64_t object_id,
                                       Permissions perms, uint32_t generation,
                                       uint64_t expires_at = 0);

    // What a capability keeps when it lands in another space: RECEIVE on an
    // endpoint stays with the owner
    static Permissions transferable(ObjectType type, Permissions perms);

    // True when a new message can go straight into the queue
    bool can_enqueue(const Endpoint& ep) const;

    // Appends to the queue, updates metrics and wakes one blocked receiver
    void enqueue(Endpoint& ep, Message msg);

    // Pops the head and refills from the send-wait list in FIFO order
    Message take_message(Endpoint& ep);

    // Kernel-originated message to pid's inbox; false when it had to be dropped
    bool post_to_inbox(ProcessId pid, uint32_t tag, Bytes data);

    void close_endpoint(EndpointId id);

    // Takes a process blocked in RECV back to Running. False for parked senders.
    bool interrupt_receive(ProcessId pid);

    // Exit/kill cleanup; leaves the process as a Zombie
    void terminate_process(ProcessId pid, int64_t exit_code);

    // Bumps the object's generation and notifies every other holder.
    // Returns the revoker's replacement slot.
    std::optional<CapSlot> revoke_object(ProcessId revoker, CapSlot slot, const axiom::Capability& cap);

private:
    void wake_receiver(Endpoint& ep);
    void refill(Endpoint& ep);
    void release_sender(ProcessId pid);
    bool is_parked(ProcessId pid) const;
};

} // namespace zero::kernel
