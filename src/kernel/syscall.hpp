/**
 * Zero Syscall ABI
 *
 * Stable syscall numbers, the request record handed to the dispatcher and
 * the typed result it returns. Both are serialised into the commit log.
 */
#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "kernel/message.hpp"
#include "kernel/types.hpp"

namespace zero::kernel {

enum class SyscallNum : uint32_t {
    // Misc
    SYS_DEBUG               = 0x01,
    SYS_YIELD               = 0x02,
    SYS_EXIT                = 0x03,
    SYS_TIME                = 0x04,
    SYS_RANDOM              = 0x05,
    SYS_CONSOLE_WRITE       = 0x07,

    // Process and endpoint lifecycle
    SYS_CREATE_ENDPOINT     = 0x11,
    SYS_DELETE_ENDPOINT     = 0x12,
    SYS_KILL                = 0x13,
    SYS_REGISTER_PROCESS    = 0x14,   // init only
    SYS_CREATE_ENDPOINT_FOR = 0x15,   // init only
    SYS_GRANT_ENDPOINT_TO   = 0x16,   // init only

    // Capabilities
    SYS_CAP_GRANT           = 0x30,
    SYS_CAP_REVOKE          = 0x31,
    SYS_CAP_DELETE          = 0x32,
    SYS_CAP_INSPECT         = 0x33,
    SYS_CAP_DERIVE          = 0x34,
    SYS_CAP_LIST            = 0x35,

    // IPC
    SYS_SEND                = 0x40,
    SYS_RECV                = 0x41,
    SYS_REPLY               = 0x43,
    SYS_SEND_CAP            = 0x44,

    SYS_PS                  = 0x50,

    // Async storage
    SYS_STORAGE_READ        = 0x70,
    SYS_STORAGE_WRITE       = 0x71,
    SYS_STORAGE_DELETE      = 0x72,
    SYS_STORAGE_LIST        = 0x73,
    SYS_STORAGE_EXISTS      = 0x74,

    // Async keystore
    SYS_KEYSTORE_READ       = 0x80,
    SYS_KEYSTORE_WRITE      = 0x81,
    SYS_KEYSTORE_DELETE     = 0x82,
    SYS_KEYSTORE_LIST       = 0x83,
    SYS_KEYSTORE_EXISTS     = 0x84
};

std::string syscall_to_string(SyscallNum num);

// SEND args[2] / RECV args[1]
constexpr uint64_t FLAG_NONBLOCK = 1;

struct SyscallRequest {
    ProcessId pid = 0;
    SyscallNum num = SyscallNum::SYS_YIELD;
    std::array<uint64_t, 4> args{};
    Bytes data;
    std::vector<CapSlot> cap_slots;    // SEND_CAP only
};

// Values the kernel observed from the HAL while running one syscall
struct SyscallEnv {
    uint64_t now = 0;
    Bytes entropy;
};

struct CapInfo {
    CapSlot slot = 0;
    uint64_t cap_id = 0;
    ObjectType object_type = ObjectType::ENDPOINT;
    uint64_t object_id = 0;
    Permissions permissions = 0;
    uint32_t generation = 0;
    uint64_t expires_at = 0;
};

struct ProcessInfo {
    ProcessId pid = 0;
    std::string name;
    ProcessState state = ProcessState::RUNNING;
};

enum class ResultKind : uint8_t {
    OK           = 0,
    ERR          = 1,
    BLOCKED      = 2,
    MESSAGE      = 3,
    CAP_INFO     = 4,
    CAP_LIST     = 5,
    PROCESS_LIST = 6,
    BYTES        = 7
};

struct SyscallResult {
    ResultKind kind = ResultKind::OK;
    KernelError error = KernelError::INVALID_SYSCALL;
    uint64_t value = 0;
    uint64_t aux = 0;
    std::optional<ReceivedMessage> message;
    std::vector<CapInfo> caps;
    std::vector<ProcessInfo> processes;
    Bytes bytes;

    static SyscallResult ok(uint64_t value = 0, uint64_t aux = 0);
    static SyscallResult err(KernelError error);
    static SyscallResult blocked();
    static SyscallResult with_message(ReceivedMessage msg);
    static SyscallResult with_bytes(Bytes bytes);

    bool is_ok() const { return kind != ResultKind::ERR && kind != ResultKind::BLOCKED; }
    bool is_err(KernelError e) const { return kind == ResultKind::ERR && error == e; }

    Bytes encode() const;
    std::string describe() const;
};

// Commit payload for a SyscallRequest: the request plus the HAL values it consumed
Bytes encode_request(const SyscallRequest& request, const SyscallEnv& env);
void decode_request(const Bytes& payload, SyscallRequest& request, SyscallEnv& env);

} // namespace zero::kernel
