/**
 * Zero Metrics
 *
 * Read-only snapshots of kernel counters for the CLI and tests. Nothing
 * here is part of the hashed kernel state.
 */
#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/kernel_state.hpp"

namespace zero::metrics {

/**
 * System-wide counters
 */
struct SystemMetrics {
    uint64_t process_count = 0;             // live processes
    uint64_t zombie_count = 0;
    uint64_t endpoint_count = 0;
    uint64_t total_pending_messages = 0;    // queued plus parked senders
    uint64_t total_ipc_messages = 0;        // ever enqueued
    uint64_t total_ipc_bytes = 0;
    uint64_t dropped_io_results = 0;
    uint64_t pending_io = 0;
    uint64_t capability_checks = 0;
    uint64_t commit_count = 0;
    uint64_t uptime_ns = 0;

    nlohmann::json to_json() const;
};

struct ProcessSnapshot {
    kernel::ProcessId pid = 0;
    std::string name;
    std::string state;
    size_t capability_count = 0;
    kernel::ProcessMetrics metrics;

    nlohmann::json to_json() const;
};

// One queued message, payload truncated for display
struct MessageSummary {
    uint32_t tag = 0;
    kernel::ProcessId from_pid = 0;
    size_t size = 0;
    size_t cap_count = 0;
};

struct EndpointDetail {
    kernel::EndpointId id = 0;
    kernel::ProcessId owner = 0;
    size_t capacity = 0;
    size_t blocked_senders = 0;
    size_t blocked_receivers = 0;
    kernel::EndpointMetrics metrics;
    std::vector<MessageSummary> queued;     // first MAX_QUEUED_SUMMARIES entries

    static constexpr size_t MAX_QUEUED_SUMMARIES = 10;

    nlohmann::json to_json() const;
};

SystemMetrics collect_system(const kernel::KernelState& state);
std::vector<ProcessSnapshot> collect_processes(const kernel::KernelState& state);
EndpointDetail collect_endpoint(const kernel::Endpoint& ep);

} // namespace zero::metrics
