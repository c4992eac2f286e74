#include "runtime/memory_storage.hpp"
#include <stdexcept>
#include "kernel/wire.hpp"

namespace zero::runtime {

using kernel::IoOp;
using kernel::IoResult;
using kernel::IoResultType;

IoResult MemoryStorage::execute(const kernel::IoRequest& request) {
    IoResult result;
    result.request_id = request.request_id;

    switch (request.op) {
        case IoOp::READ: {
            auto it = entries_.find(request.key);
            if (it == entries_.end()) {
                result.type = IoResultType::READ_NOT_FOUND;
            } else {
                result.type = IoResultType::READ_OK;
                result.data = it->second;
            }
            break;
        }
        case IoOp::WRITE:
            if (read_only_) {
                result.type = IoResultType::WRITE_ERR;
                result.data = kernel::to_bytes("storage is read-only");
                break;
            }
            entries_[request.key] = request.value;
            result.type = IoResultType::WRITE_OK;
            break;
        case IoOp::DELETE:
            if (read_only_) {
                result.type = IoResultType::DELETE_ERR;
                result.data = kernel::to_bytes("storage is read-only");
                break;
            }
            entries_.erase(request.key);
            result.type = IoResultType::DELETE_OK;
            break;
        case IoOp::EXISTS:
            result.type = entries_.count(request.key) ? IoResultType::EXISTS_TRUE
                                                      : IoResultType::EXISTS_FALSE;
            break;
        case IoOp::LIST:
            result.type = IoResultType::LIST_OK;
            result.data = kernel::encode_key_list(keys(request.key));
            break;
    }
    return result;
}

void MemoryStorage::put(const std::string& key, const kernel::Bytes& value) {
    entries_[key] = value;
}

std::optional<kernel::Bytes> MemoryStorage::get(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> MemoryStorage::keys(const std::string& prefix) const {
    std::vector<std::string> out;
    for (auto it = entries_.lower_bound(prefix); it != entries_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        out.push_back(it->first);
    }
    return out;
}

void MemoryStorage::seed(const nlohmann::json& entries) {
    if (entries.is_null()) {
        return;
    }
    if (!entries.is_object()) {
        throw std::invalid_argument("storage seed must be an object of key/value strings");
    }
    for (auto it = entries.begin(); it != entries.end(); ++it) {
        const auto& value = it.value();
        entries_[it.key()] = kernel::to_bytes(value.is_string() ? value.get<std::string>() : value.dump());
    }
}

nlohmann::json MemoryStorage::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [key, value] : entries_) {
        j[key] = kernel::to_string(value);
    }
    return j;
}

} // namespace zero::runtime
