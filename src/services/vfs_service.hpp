/**
 * VFS Service
 *
 * Hierarchical filesystem over the async storage syscalls. Every path has
 * an inode record under "inode:<path>" (JSON) and files keep their bytes
 * under "content:<path>". The root directory is implicit.
 *
 * Requests are JSON {"path": ..., "content": ...}; responses are the
 * standard {"success": ...} bodies on tag T | 1.
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "runtime/correlator.hpp"
#include "runtime/service.hpp"

namespace zero::services {

constexpr size_t MAX_PATH_LENGTH = 1024;

// Absolute, no empty, "." or ".." components, no trailing slash except "/"
bool valid_path(const std::string& path);
std::string parent_path(const std::string& path);
std::string base_name(const std::string& path);

std::string inode_key(const std::string& path);
std::string content_key(const std::string& path);

struct Inode {
    std::string path;
    std::string name;
    std::string parent;
    bool directory = false;
    uint64_t size = 0;
    uint64_t created_at = 0;
    uint64_t modified_at = 0;

    static Inode new_directory(const std::string& path, uint64_t now);
    static Inode new_file(const std::string& path, uint64_t size, uint64_t now);
    static Inode root();

    nlohmann::json to_json() const;
    static std::optional<Inode> parse(const kernel::Bytes& data);
};

// Per-request state carried through a continuation chain
struct VfsRequest {
    runtime::ReplyTarget target;
    uint32_t response_tag = 0;
    std::string path;
    kernel::Bytes content;
    uint64_t started_at = 0;
    std::optional<Inode> existing;
    std::vector<std::string> children;
    size_t next_child = 0;
    nlohmann::json entries = nlohmann::json::array();
};

class VfsService : public runtime::Service {
public:
    VfsService(kernel::Kernel& kernel, kernel::ProcessId pid);

    void on_start() override;

    size_t expire_pending(uint64_t now, uint64_t timeout_ns) override;
    bool has_expired(uint64_t now, uint64_t timeout_ns) const override {
        return !storage_.expired(now, timeout_ns).empty();
    }
    size_t pending_count() const override { return storage_.pending_count(); }

    const runtime::Correlator<VfsRequest>& correlator() const { return storage_; }

protected:
    bool handles(uint32_t tag) const override;
    void dispatch_request(const kernel::ReceivedMessage& message) override;
    void on_storage_result(const kernel::IoResult& result) override;

private:
    using Step = runtime::Step<VfsRequest>;

    void handle_mkdir(VfsRequest request);
    void handle_rmdir(VfsRequest request);
    void handle_readdir(VfsRequest request);
    void handle_write(VfsRequest request);
    void handle_read(VfsRequest request);
    void handle_unlink(VfsRequest request);
    void handle_stat(VfsRequest request);
    void handle_exists(VfsRequest request);

    // Continuations
    Step mkdir_after_exists(const kernel::IoResult& result, VfsRequest& request);
    Step mkdir_after_parent(const kernel::IoResult& result, VfsRequest& request);
    Step rmdir_after_inode(const kernel::IoResult& result, VfsRequest& request);
    Step rmdir_after_list(const kernel::IoResult& result, VfsRequest& request);
    Step readdir_after_inode(const kernel::IoResult& result, VfsRequest& request);
    Step readdir_after_list(const kernel::IoResult& result, VfsRequest& request);
    Step readdir_after_child(const kernel::IoResult& result, VfsRequest& request);
    Step write_after_parent(const kernel::IoResult& result, VfsRequest& request);
    Step write_after_inode(const kernel::IoResult& result, VfsRequest& request);
    Step write_after_content(const kernel::IoResult& result, VfsRequest& request);
    Step read_after_content(const kernel::IoResult& result, VfsRequest& request);
    Step read_after_inode(const kernel::IoResult& result, VfsRequest& request);
    Step unlink_after_inode(const kernel::IoResult& result, VfsRequest& request);
    Step unlink_after_content(const kernel::IoResult& result, VfsRequest& request);
    Step stat_after_inode(const kernel::IoResult& result, VfsRequest& request);
    Step exists_after_check(const kernel::IoResult& result, VfsRequest& request);

    // Responds and ends the chain
    Step finish(const VfsRequest& request, const nlohmann::json& body);
    Step fail(const VfsRequest& request, runtime::ServiceError error, const std::string& message = "");
    Step storage_failure(const VfsRequest& request, const kernel::IoResult& result);

    Step next_child(VfsRequest& request);

    template <typename Method>
    runtime::NextStep<VfsRequest> then(Method method) {
        return [this, method](const kernel::IoResult& result, VfsRequest& request) {
            return (this->*method)(result, request);
        };
    }

    runtime::Correlator<VfsRequest> storage_;
};

} // namespace zero::services
