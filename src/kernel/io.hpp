#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "kernel/types.hpp"

namespace zero::kernel {

enum class IoChannel : uint8_t {
    STORAGE  = 0,
    KEYSTORE = 1
};

enum class IoOp : uint8_t {
    READ   = 0,
    WRITE  = 1,
    DELETE = 2,
    LIST   = 3,
    EXISTS = 4
};

enum class IoResultType : uint8_t {
    READ_OK        = 0,
    READ_NOT_FOUND = 1,
    READ_ERR       = 2,
    WRITE_OK       = 3,
    WRITE_ERR      = 4,
    DELETE_OK      = 5,
    DELETE_ERR     = 6,
    EXISTS_TRUE    = 7,
    EXISTS_FALSE   = 8,
    LIST_OK        = 9,
    LIST_ERR       = 10
};

std::string io_op_to_string(IoOp op);
std::string io_result_type_to_string(IoResultType type);

// An async storage/keystore request waiting for the supervisor to execute it
struct IoRequest {
    ProcessId pid = 0;
    RequestId request_id = 0;
    IoChannel channel = IoChannel::STORAGE;
    IoOp op = IoOp::READ;
    std::string key;       // key, or prefix for LIST
    Bytes value;           // WRITE only
};

/**
 * Completion payload carried by MSG_STORAGE_RESULT / MSG_KEYSTORE_RESULT:
 *   [request_id u32 LE][result_type u8][data_len u32 LE][data]
 * LIST_OK data is a sequence of u32-length-prefixed keys.
 */
struct IoResult {
    RequestId request_id = 0;
    IoResultType type = IoResultType::READ_ERR;
    Bytes data;

    bool is_error() const {
        return type == IoResultType::READ_ERR || type == IoResultType::WRITE_ERR ||
               type == IoResultType::DELETE_ERR || type == IoResultType::LIST_ERR;
    }

    Bytes encode() const;
    static std::optional<IoResult> parse(const Bytes& payload);
};

Bytes encode_key_list(const std::vector<std::string>& keys);
std::vector<std::string> decode_key_list(const Bytes& data);

// SYS_STORAGE_WRITE data: [key_len u32][key][value]
Bytes encode_write_request(const std::string& key, const Bytes& value);
bool decode_write_request(const Bytes& data, std::string& key, Bytes& value);

constexpr const char* KEYSTORE_PREFIX = "/keys/";

} // namespace zero::kernel
