#pragma once
#include <cstdint>
#include <vector>
#include "axiom/capability.hpp"
#include "kernel/types.hpp"

namespace zero::kernel {

// Kernel-originated message tags
constexpr uint32_t MSG_CAP_REVOKED     = 0x0F00;
constexpr uint32_t MSG_CONSOLE_INPUT   = 0x0F01;
constexpr uint32_t MSG_STORAGE_RESULT  = 0x0F10;
constexpr uint32_t MSG_KEYSTORE_RESULT = 0x0F11;

// Request tag T is answered with T | 1
constexpr uint32_t response_tag(uint32_t request_tag) { return request_tag | 1u; }

// Capability carried inside a message, materialised in the receiver's space on RECV
struct TransferredCap {
    ObjectType object_type = ObjectType::ENDPOINT;
    uint64_t object_id = 0;
    Permissions permissions = 0;
    uint32_t generation = 0;
    uint64_t expires_at = 0;

    static TransferredCap from(const axiom::Capability& cap, Permissions perms) {
        return TransferredCap{cap.object_type, cap.object_id, perms, cap.generation, cap.expires_at};
    }
};

struct Message {
    uint32_t tag = 0;
    ProcessId from_pid = KERNEL_PID;
    Bytes data;
    std::vector<TransferredCap> caps;
};

// A message as seen by the receiver: transferred caps resolved to local slots
struct ReceivedMessage {
    uint32_t tag = 0;
    ProcessId from_pid = KERNEL_PID;
    Bytes data;
    std::vector<CapSlot> cap_slots;
};

} // namespace zero::kernel
