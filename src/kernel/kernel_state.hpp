#pragma once
#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include "axiom/capability.hpp"
#include "kernel/message.hpp"
#include "kernel/types.hpp"

namespace zero::kernel {

struct ProcessMetrics {
    uint64_t ipc_sent = 0;
    uint64_t ipc_received = 0;
    uint64_t ipc_bytes_sent = 0;
    uint64_t ipc_bytes_received = 0;
    uint64_t syscall_count = 0;
    uint64_t start_time_ns = 0;
    uint64_t last_active_ns = 0;
};

struct Process {
    ProcessId pid = 0;
    std::string name;
    ProcessId parent = KERNEL_PID;
    ProcessState state = ProcessState::RUNNING;
    EndpointId inbox = 0;                          // 0 = no inbox yet
    RequestId next_request_id = 1;
    int64_t exit_code = 0;
    std::map<ProcessId, uint32_t> reply_credits;   // senders owed a REPLY
    ProcessMetrics metrics;
};

// A sender parked on a full endpoint together with the message it tried to send
struct PendingSend {
    ProcessId pid = 0;
    Message msg;
};

struct EndpointMetrics {
    size_t queue_depth = 0;
    size_t queue_high_water = 0;
    uint64_t total_messages = 0;
    uint64_t total_bytes = 0;
};

struct Endpoint {
    EndpointId id = 0;
    ProcessId owner = 0;                // sole Receive holder
    size_t capacity = DEFAULT_ENDPOINT_CAPACITY;
    std::deque<Message> queue;
    std::deque<PendingSend> send_waiters;
    std::deque<ProcessId> recv_waiters;
    EndpointMetrics metrics;

    bool full() const { return queue.size() >= capacity; }
};

/**
 * Everything the kernel owns. Ordered maps keep iteration (and therefore
 * the state hash) independent of insertion history.
 */
struct KernelState {
    std::map<ProcessId, Process> processes;
    std::map<EndpointId, Endpoint> endpoints;
    std::map<ProcessId, axiom::CapabilitySpace> cap_spaces;
    axiom::GenerationTable generations;

    ProcessId next_pid = 1;
    EndpointId next_endpoint_id = 1;
    uint64_t next_cap_id = 1;
    uint64_t last_tick_ns = 0;

    Process* find_process(ProcessId pid) {
        auto it = processes.find(pid);
        return it == processes.end() ? nullptr : &it->second;
    }
    const Process* find_process(ProcessId pid) const {
        auto it = processes.find(pid);
        return it == processes.end() ? nullptr : &it->second;
    }

    // Live means present and not a zombie
    Process* find_live_process(ProcessId pid) {
        Process* proc = find_process(pid);
        return (proc && proc->state != ProcessState::ZOMBIE) ? proc : nullptr;
    }
    const Process* find_live_process(ProcessId pid) const {
        const Process* proc = find_process(pid);
        return (proc && proc->state != ProcessState::ZOMBIE) ? proc : nullptr;
    }

    Endpoint* find_endpoint(EndpointId id) {
        auto it = endpoints.find(id);
        return it == endpoints.end() ? nullptr : &it->second;
    }
    const Endpoint* find_endpoint(EndpointId id) const {
        auto it = endpoints.find(id);
        return it == endpoints.end() ? nullptr : &it->second;
    }
};

} // namespace zero::kernel
