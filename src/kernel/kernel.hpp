/**
 * Zero Kernel
 *
 * Owns the kernel state, the commit log and the syscall modules. Every
 * entry point is a single atomic step that leaves a commit behind:
 * - dispatch()            SyscallRequest ... SyscallResponse
 * - spawn_process()       ProcessCreated
 * - post_message()        MessageDelivered (supervisor, I/O completions)
 * - fault_process()       ProcessFaulted
 * - wake()                ProcessWoken
 * - reap()                ProcessReaped
 * - tick()                Tick
 *
 * Constructing a kernel with a null HAL puts it in replay mode: time and
 * entropy then only come from recorded commits.
 */
#pragma once
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "axiom/commit_log.hpp"
#include "kernel/config.hpp"
#include "kernel/hal.hpp"
#include "kernel/io.hpp"
#include "kernel/kernel_context.hpp"
#include "kernel/module.hpp"
#include "kernel/syscall.hpp"
#include "kernel/syscall_router.hpp"
#include "metrics/metrics.hpp"

namespace zero::kernel {

class Kernel;

// Re-applies one recorded top-level commit (see replay.hpp)
bool apply_commit(Kernel& kernel, const axiom::Commit& commit);

class Kernel {
public:
    explicit Kernel(const KernelConfig& config = KernelConfig{},
                    std::shared_ptr<Hal> hal = std::make_shared<HostHal>());
    ~Kernel();

    Kernel(const Kernel&) = delete;
    Kernel& operator=(const Kernel&) = delete;

    // Runs one syscall to completion (or to a Blocked result)
    SyscallResult dispatch(const SyscallRequest& request);

    // Boot-time process creation, outside any syscall
    ProcessId spawn_process(const std::string& name, ProcessId parent = KERNEL_PID);

    // Kernel-originated message to pid's inbox (sender PID 0)
    bool post_message(ProcessId pid, uint32_t tag, const Bytes& data);

    // Completion of an async storage/keystore request. Results for dead
    // processes are dropped and counted.
    bool deliver_io_result(ProcessId pid, IoChannel channel, const IoResult& result);

    bool fault_process(ProcessId pid, const std::string& reason);

    // Interrupts a blocked RECV so the host can act as pid. A blocked
    // process makes no syscalls until it is woken.
    bool wake(ProcessId pid);

    // Removes a zombie from the process table
    bool reap(ProcessId pid);

    void tick();

    // Hands queued storage/keystore requests to the supervisor
    std::vector<IoRequest> take_pending_io();
    size_t pending_io_count() const { return context_.pending_io.size(); }

    const KernelState& state() const { return context_.state; }
    const axiom::CommitLog& log() const { return log_; }
    axiom::CommitLog& log() { return log_; }
    const axiom::AxiomGate& gate() const { return context_.gate; }
    const KernelConfig& config() const { return context_.config; }
    axiom::StateHash state_hash() const { return context_.hash(); }
    bool replaying() const { return !hal_; }

    metrics::SystemMetrics metrics() const;
    nlohmann::json process_table() const;
    nlohmann::json endpoint_detail(EndpointId id) const;

private:
    friend bool apply_commit(Kernel& kernel, const axiom::Commit& commit);

    // Time for a new top-level step: HAL clock live, 0 while replaying
    uint64_t read_clock();

    SyscallResult execute(const SyscallRequest& request, const SyscallEnv& env);
    ProcessId spawn_at(const std::string& name, ProcessId parent, uint64_t now);
    bool post_at(ProcessId pid, uint32_t tag, const Bytes& data, uint64_t now);
    bool fault_at(ProcessId pid, const std::string& reason, uint64_t now);
    bool wake_at(ProcessId pid, uint64_t now);
    bool reap_at(ProcessId pid, uint64_t now);
    void tick_at(uint64_t now);

    void begin_step(uint64_t now);

    std::shared_ptr<Hal> hal_;
    axiom::CommitLog log_;
    KernelContext context_;
    SyscallRouter router_;
    std::vector<std::unique_ptr<KernelModule>> modules_;
    uint64_t last_now_ = 0;
};

} // namespace zero::kernel
