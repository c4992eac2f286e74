#include "kernel/io.hpp"
#include "kernel/wire.hpp"

namespace zero::kernel {

std::string io_op_to_string(IoOp op) {
    switch (op) {
        case IoOp::READ:   return "read";
        case IoOp::WRITE:  return "write";
        case IoOp::DELETE: return "delete";
        case IoOp::LIST:   return "list";
        case IoOp::EXISTS: return "exists";
        default: return "unknown";
    }
}

std::string io_result_type_to_string(IoResultType type) {
    switch (type) {
        case IoResultType::READ_OK:        return "READ_OK";
        case IoResultType::READ_NOT_FOUND: return "READ_NOT_FOUND";
        case IoResultType::READ_ERR:       return "READ_ERR";
        case IoResultType::WRITE_OK:       return "WRITE_OK";
        case IoResultType::WRITE_ERR:      return "WRITE_ERR";
        case IoResultType::DELETE_OK:      return "DELETE_OK";
        case IoResultType::DELETE_ERR:     return "DELETE_ERR";
        case IoResultType::EXISTS_TRUE:    return "EXISTS_TRUE";
        case IoResultType::EXISTS_FALSE:   return "EXISTS_FALSE";
        case IoResultType::LIST_OK:        return "LIST_OK";
        case IoResultType::LIST_ERR:       return "LIST_ERR";
        default: return "UNKNOWN";
    }
}

Bytes IoResult::encode() const {
    ByteWriter w;
    w.u32(request_id);
    w.u8(static_cast<uint8_t>(type));
    w.bytes(data);
    return w.take();
}

std::optional<IoResult> IoResult::parse(const Bytes& payload) {
    try {
        ByteReader r(payload);
        IoResult result;
        result.request_id = r.u32();
        uint8_t type = r.u8();
        if (type > static_cast<uint8_t>(IoResultType::LIST_ERR)) {
            return std::nullopt;
        }
        result.type = static_cast<IoResultType>(type);
        result.data = r.bytes();
        return result;
    } catch (const WireError&) {
        return std::nullopt;
    }
}

Bytes encode_key_list(const std::vector<std::string>& keys) {
    ByteWriter w;
    for (const auto& key : keys) {
        w.str(key);
    }
    return w.take();
}

std::vector<std::string> decode_key_list(const Bytes& data) {
    std::vector<std::string> keys;
    ByteReader r(data);
    while (!r.done()) {
        keys.push_back(r.str());
    }
    return keys;
}

Bytes encode_write_request(const std::string& key, const Bytes& value) {
    ByteWriter w;
    w.str(key);
    w.raw(value.data(), value.size());
    return w.take();
}

bool decode_write_request(const Bytes& data, std::string& key, Bytes& value) {
    try {
        ByteReader r(data);
        key = r.str();
        value = r.raw(r.remaining());
        return true;
    } catch (const WireError&) {
        return false;
    }
}

} // namespace zero::kernel
