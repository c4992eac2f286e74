/**
 * In-memory storage backend
 *
 * Executes the IoRequests the kernel queues for SYS_STORAGE_* and
 * SYS_KEYSTORE_* and produces the matching IoResult. One instance backs
 * each channel.
 */
#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/io.hpp"

namespace zero::runtime {

class MemoryStorage {
public:
    kernel::IoResult execute(const kernel::IoRequest& request);

    void put(const std::string& key, const kernel::Bytes& value);
    std::optional<kernel::Bytes> get(const std::string& key) const;
    bool contains(const std::string& key) const { return entries_.count(key) > 0; }

    // Keys starting with prefix, in lexicographic order
    std::vector<std::string> keys(const std::string& prefix = "") const;

    size_t size() const { return entries_.size(); }

    // Writes and deletes fail with WRITE_ERR / DELETE_ERR while set
    void set_read_only(bool read_only) { read_only_ = read_only; }

    // {"key": "utf-8 value", ...}
    void seed(const nlohmann::json& entries);
    nlohmann::json to_json() const;

private:
    std::map<std::string, kernel::Bytes> entries_;
    bool read_only_ = false;
};

} // namespace zero::runtime
