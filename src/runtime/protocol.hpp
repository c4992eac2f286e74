#pragma once
#include <cstdint>

// Service message tags. A request tag T is answered with T | 1.
namespace zero::runtime::msg {

// Init service registry (0x1000 - 0x100F)
constexpr uint32_t REGISTER_SERVICE  = 0x1000;
constexpr uint32_t REGISTER_RESPONSE = 0x1001;
constexpr uint32_t LOOKUP_SERVICE    = 0x1002;
constexpr uint32_t LOOKUP_RESPONSE   = 0x1003;
constexpr uint32_t SPAWN_SERVICE     = 0x1004;
constexpr uint32_t SPAWN_RESPONSE    = 0x1005;
constexpr uint32_t SERVICE_READY     = 0x1006;

// Identity (0x7000 - 0x703F)
constexpr uint32_t IDENTITY_GET_PREFERENCES        = 0x7020;
constexpr uint32_t IDENTITY_SET_DEFAULT_KEY_SCHEME = 0x7022;

// VFS (0x8000 - 0x803F)
constexpr uint32_t VFS_MKDIR   = 0x8000;
constexpr uint32_t VFS_RMDIR   = 0x8002;
constexpr uint32_t VFS_READDIR = 0x8004;
constexpr uint32_t VFS_WRITE   = 0x8010;
constexpr uint32_t VFS_READ    = 0x8012;
constexpr uint32_t VFS_UNLINK  = 0x8014;
constexpr uint32_t VFS_STAT    = 0x8020;
constexpr uint32_t VFS_EXISTS  = 0x8022;

// Keystore (0xA000 - 0xA00F)
constexpr uint32_t KEYSTORE_READ   = 0xA000;
constexpr uint32_t KEYSTORE_WRITE  = 0xA002;
constexpr uint32_t KEYSTORE_DELETE = 0xA004;
constexpr uint32_t KEYSTORE_EXISTS = 0xA006;
constexpr uint32_t KEYSTORE_LIST   = 0xA008;

constexpr bool is_registry_response(uint32_t tag) {
    return tag == REGISTER_RESPONSE || tag == LOOKUP_RESPONSE || tag == SPAWN_RESPONSE;
}

} // namespace zero::runtime::msg
