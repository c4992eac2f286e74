#include "metrics/metrics.hpp"
#include <algorithm>

namespace zero::metrics {

// ============================================================================
// JSON Conversion
// ============================================================================

nlohmann::json SystemMetrics::to_json() const {
    return nlohmann::json{
        {"processes", {
            {"live", process_count},
            {"zombies", zombie_count}
        }},
        {"ipc", {
            {"endpoints", endpoint_count},
            {"pending_messages", total_pending_messages},
            {"total_messages", total_ipc_messages},
            {"total_bytes", total_ipc_bytes}
        }},
        {"io", {
            {"pending", pending_io},
            {"dropped_results", dropped_io_results}
        }},
        {"capability_checks", capability_checks},
        {"commits", commit_count},
        {"uptime_ns", uptime_ns}
    };
}

nlohmann::json ProcessSnapshot::to_json() const {
    return nlohmann::json{
        {"pid", pid},
        {"name", name},
        {"state", state},
        {"capabilities", capability_count},
        {"ipc", {
            {"sent", metrics.ipc_sent},
            {"received", metrics.ipc_received},
            {"bytes_sent", metrics.ipc_bytes_sent},
            {"bytes_received", metrics.ipc_bytes_received}
        }},
        {"syscalls", metrics.syscall_count},
        {"start_time_ns", metrics.start_time_ns},
        {"last_active_ns", metrics.last_active_ns}
    };
}

nlohmann::json EndpointDetail::to_json() const {
    nlohmann::json queue = nlohmann::json::array();
    for (const auto& msg : queued) {
        queue.push_back({
            {"tag", msg.tag},
            {"from", msg.from_pid},
            {"size", msg.size},
            {"caps", msg.cap_count}
        });
    }

    return nlohmann::json{
        {"id", id},
        {"owner", owner},
        {"capacity", capacity},
        {"queue_depth", metrics.queue_depth},
        {"queue_high_water", metrics.queue_high_water},
        {"total_messages", metrics.total_messages},
        {"total_bytes", metrics.total_bytes},
        {"blocked_senders", blocked_senders},
        {"blocked_receivers", blocked_receivers},
        {"queued", queue}
    };
}

// ============================================================================
// Collection
// ============================================================================

SystemMetrics collect_system(const kernel::KernelState& state) {
    SystemMetrics m;
    for (const auto& [pid, proc] : state.processes) {
        if (proc.state == kernel::ProcessState::ZOMBIE) {
            m.zombie_count++;
        } else {
            m.process_count++;
        }
    }
    m.endpoint_count = state.endpoints.size();
    for (const auto& [id, ep] : state.endpoints) {
        m.total_pending_messages += ep.queue.size() + ep.send_waiters.size();
        m.total_ipc_messages += ep.metrics.total_messages;
        m.total_ipc_bytes += ep.metrics.total_bytes;
    }
    return m;
}

std::vector<ProcessSnapshot> collect_processes(const kernel::KernelState& state) {
    std::vector<ProcessSnapshot> result;
    for (const auto& [pid, proc] : state.processes) {
        ProcessSnapshot snap;
        snap.pid = pid;
        snap.name = proc.name;
        snap.state = kernel::process_state_to_string(proc.state);
        auto space = state.cap_spaces.find(pid);
        if (space != state.cap_spaces.end()) {
            snap.capability_count = space->second.size();
        }
        snap.metrics = proc.metrics;
        result.push_back(std::move(snap));
    }
    return result;
}

EndpointDetail collect_endpoint(const kernel::Endpoint& ep) {
    EndpointDetail detail;
    detail.id = ep.id;
    detail.owner = ep.owner;
    detail.capacity = ep.capacity;
    detail.blocked_senders = ep.send_waiters.size();
    detail.blocked_receivers = ep.recv_waiters.size();
    detail.metrics = ep.metrics;

    size_t count = std::min(ep.queue.size(), EndpointDetail::MAX_QUEUED_SUMMARIES);
    for (size_t i = 0; i < count; ++i) {
        const auto& msg = ep.queue[i];
        detail.queued.push_back(MessageSummary{msg.tag, msg.from_pid, msg.data.size(), msg.caps.size()});
    }
    return detail;
}

} // namespace zero::metrics
