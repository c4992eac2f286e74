/**
 * Zero Supervisor
 *
 * Host side of the system. Owns the kernel, the storage backends and the
 * service programs, and drives them cooperatively:
 *   1. start newly spawned programs
 *   2. step every Running service until its inbox is empty
 *   3. execute queued storage/keystore requests and deliver the results
 *   4. expire service operations older than the pending timeout
 *   5. reap zombies and tick
 * Everything runs on one thread; the kernel is never re-entered.
 */
#pragma once
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "kernel/kernel.hpp"
#include "runtime/memory_storage.hpp"
#include "runtime/service.hpp"
#include "services/init_service.hpp"
#include "supervisor/config.hpp"

namespace zero::supervisor {

using kernel::ProcessId;

// Builds the program for a process spawned under a name; nullptr for plain processes
using ProgramFactory = std::function<std::unique_ptr<runtime::Service>(
    kernel::Kernel& kernel, ProcessId pid, const std::string& name, const SupervisorConfig& config)>;

// vfs, identity and keystore
std::unique_ptr<runtime::Service> make_builtin_service(kernel::Kernel& kernel, ProcessId pid,
                                                       const std::string& name,
                                                       const SupervisorConfig& config);

struct RoundStats {
    size_t started = 0;
    size_t messages = 0;
    size_t io_completed = 0;
    size_t expired = 0;
    size_t reaped = 0;
    size_t faulted = 0;

    bool progressed() const { return started + messages + io_completed + expired + reaped + faulted > 0; }
};

class Supervisor {
public:
    explicit Supervisor(const SupervisorConfig& config = SupervisorConfig{},
                        std::shared_ptr<kernel::Hal> hal = std::make_shared<kernel::HostHal>(),
                        ProgramFactory factory = make_builtin_service);

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    // Spawns init, then each configured service through init, letting each
    // one register before the next is wired
    void boot();

    // Spawns a process through init (slot layout included)
    std::optional<ProcessId> spawn(const std::string& name);

    // KILL through init's Process capability on pid
    kernel::SyscallResult kill(ProcessId pid);

    // Makes pid runnable so the host can issue syscalls as it. False when
    // pid is dead or parked on a full endpoint.
    bool wake(ProcessId pid);

    RoundStats run_round();

    // Rounds until nothing progresses; returns the number of rounds run
    size_t run_until_idle(size_t max_rounds = 1000);

    // Executes queued I/O; held back while paused
    size_t complete_io();
    void set_io_paused(bool paused) { io_paused_ = paused; }
    size_t held_io() const { return held_io_.size(); }

    kernel::Kernel& kernel() { return *kernel_; }
    const kernel::Kernel& kernel() const { return *kernel_; }
    services::InitService& init() { return *init_; }
    runtime::MemoryStorage& storage() { return storage_; }
    runtime::MemoryStorage& keystore() { return keystore_; }
    const SupervisorConfig& config() const { return config_; }

    runtime::Service* program(ProcessId pid);
    std::optional<ProcessId> pid_of(const std::string& name) const;

    nlohmann::json status() const;

private:
    void attach(ProcessId pid, const std::string& name);
    size_t start_programs();
    size_t step_services(RoundStats& stats);
    size_t expire_pending();
    size_t reap_zombies();

    SupervisorConfig config_;
    std::shared_ptr<kernel::Hal> hal_;
    ProgramFactory factory_;
    std::unique_ptr<kernel::Kernel> kernel_;
    std::unique_ptr<services::InitService> init_;
    std::map<ProcessId, std::unique_ptr<runtime::Service>> programs_;
    std::map<std::string, ProcessId> names_;
    std::vector<ProcessId> starting_;
    runtime::MemoryStorage storage_;
    runtime::MemoryStorage keystore_;
    std::vector<kernel::IoRequest> held_io_;
    bool io_paused_ = false;
    bool booted_ = false;
};

} // namespace zero::supervisor
