/**
 * Zero Kernel Types
 *
 * Identifiers, object kinds, permission bits and the kernel error
 * taxonomy shared by the kernel, the Axiom layer and user-space services.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace zero::kernel {

using Bytes = std::vector<uint8_t>;

using ProcessId = uint64_t;
using EndpointId = uint64_t;
using CapSlot = uint32_t;
using RequestId = uint32_t;
using Permissions = uint8_t;

// PID 0 is the kernel itself (sender of kernel and supervisor messages)
constexpr ProcessId KERNEL_PID = 0;
constexpr ProcessId INIT_PID = 1;

constexpr CapSlot NULL_SLOT = 0;

// Exit codes the kernel assigns itself
constexpr int64_t EXIT_KILLED = -1;
constexpr int64_t EXIT_FAULTED = -2;

constexpr size_t MAX_MESSAGE_SIZE = 4096;
constexpr size_t MAX_CAPS_PER_MESSAGE = 4;
constexpr size_t MAX_RANDOM_BYTES = 256;
constexpr size_t DEFAULT_ENDPOINT_CAPACITY = 64;
constexpr size_t DEFAULT_MAX_CAPS_PER_SPACE = 1024;

enum class ObjectType : uint8_t {
    ENDPOINT    = 1,
    PROCESS     = 2,
    STORAGE_KEY = 3,
    KEYSTORE    = 4,
    CONSOLE     = 5
};

namespace perm {
constexpr Permissions SEND    = 1u << 0;
constexpr Permissions RECEIVE = 1u << 1;
constexpr Permissions GRANT   = 1u << 2;
constexpr Permissions REVOKE  = 1u << 3;
constexpr Permissions INSPECT = 1u << 4;
constexpr Permissions KILL    = 1u << 5;
constexpr Permissions ALL     = SEND | RECEIVE | GRANT | REVOKE | INSPECT | KILL;
} // namespace perm

enum class ProcessState : uint8_t {
    RUNNING = 0,
    BLOCKED = 1,
    ZOMBIE  = 2
};

enum class KernelError : uint8_t {
    PROCESS_NOT_FOUND  = 1,
    ENDPOINT_NOT_FOUND = 2,
    INVALID_CAPABILITY = 3,
    PERMISSION_DENIED  = 4,
    WOULD_BLOCK        = 5,
    QUOTA_EXCEEDED     = 6,
    MESSAGE_TOO_LARGE  = 7,
    INVALID_SYSCALL    = 8,
    INVALID_ARGUMENT   = 9,
    HAL                = 10
};

inline std::string object_type_to_string(ObjectType type) {
    switch (type) {
        case ObjectType::ENDPOINT:    return "Endpoint";
        case ObjectType::PROCESS:     return "Process";
        case ObjectType::STORAGE_KEY: return "StorageKey";
        case ObjectType::KEYSTORE:    return "Keystore";
        case ObjectType::CONSOLE:     return "Console";
        default: return "Unknown";
    }
}

inline std::string process_state_to_string(ProcessState state) {
    switch (state) {
        case ProcessState::RUNNING: return "Running";
        case ProcessState::BLOCKED: return "Blocked";
        case ProcessState::ZOMBIE:  return "Zombie";
        default: return "Unknown";
    }
}

inline std::string kernel_error_to_string(KernelError error) {
    switch (error) {
        case KernelError::PROCESS_NOT_FOUND:  return "ProcessNotFound";
        case KernelError::ENDPOINT_NOT_FOUND: return "EndpointNotFound";
        case KernelError::INVALID_CAPABILITY: return "InvalidCapability";
        case KernelError::PERMISSION_DENIED:  return "PermissionDenied";
        case KernelError::WOULD_BLOCK:        return "WouldBlock";
        case KernelError::QUOTA_EXCEEDED:     return "QuotaExceeded";
        case KernelError::MESSAGE_TOO_LARGE:  return "MessageTooLarge";
        case KernelError::INVALID_SYSCALL:    return "InvalidSyscall";
        case KernelError::INVALID_ARGUMENT:   return "InvalidArgument";
        case KernelError::HAL:                return "Hal";
        default: return "Unknown";
    }
}

// Render a permission set as "SRGVIK" style flags, '-' for missing bits
inline std::string permissions_to_string(Permissions perms) {
    std::string out = "------";
    if (perms & perm::SEND)    out[0] = 'S';
    if (perms & perm::RECEIVE) out[1] = 'R';
    if (perms & perm::GRANT)   out[2] = 'G';
    if (perms & perm::REVOKE)  out[3] = 'V';
    if (perms & perm::INSPECT) out[4] = 'I';
    if (perms & perm::KILL)    out[5] = 'K';
    return out;
}

} // namespace zero::kernel
