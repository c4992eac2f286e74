#include "services/vfs_service.hpp"
#include <algorithm>
#include "kernel/wire.hpp"
#include "runtime/protocol.hpp"
#include <spdlog/spdlog.h>

namespace zero::services {

namespace msg = runtime::msg;
using kernel::IoResult;
using kernel::IoResultType;
using runtime::ServiceError;

bool valid_path(const std::string& path) {
    if (path.empty() || path.size() > MAX_PATH_LENGTH || path.front() != '/') {
        return false;
    }
    if (path == "/") {
        return true;
    }
    if (path.back() == '/') {
        return false;
    }

    size_t start = 1;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        std::string component = path.substr(start, end - start);
        if (component.empty() || component == "." || component == "..") {
            return false;
        }
        if (component.find('\0') != std::string::npos) {
            return false;
        }
        start = end + 1;
    }
    return true;
}

std::string parent_path(const std::string& path) {
    auto pos = path.rfind('/');
    if (pos == std::string::npos || pos == 0) {
        return "/";
    }
    return path.substr(0, pos);
}

std::string base_name(const std::string& path) {
    auto pos = path.rfind('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string inode_key(const std::string& path) {
    return "inode:" + path;
}

std::string content_key(const std::string& path) {
    return "content:" + path;
}

Inode Inode::new_directory(const std::string& path, uint64_t now) {
    Inode inode;
    inode.path = path;
    inode.name = base_name(path);
    inode.parent = parent_path(path);
    inode.directory = true;
    inode.created_at = now;
    inode.modified_at = now;
    return inode;
}

Inode Inode::new_file(const std::string& path, uint64_t size, uint64_t now) {
    Inode inode = new_directory(path, now);
    inode.directory = false;
    inode.size = size;
    return inode;
}

Inode Inode::root() {
    Inode inode = new_directory("/", 0);
    inode.name = "";
    return inode;
}

nlohmann::json Inode::to_json() const {
    return {
        {"path", path},
        {"name", name},
        {"parent", parent},
        {"type", directory ? "directory" : "file"},
        {"size", size},
        {"created_at", created_at},
        {"modified_at", modified_at}
    };
}

std::optional<Inode> Inode::parse(const kernel::Bytes& data) {
    auto j = runtime::decode_json(data);
    if (!j) {
        return std::nullopt;
    }
    try {
        Inode inode;
        inode.path = j->at("path").get<std::string>();
        inode.name = j->value("name", base_name(inode.path));
        inode.parent = j->value("parent", parent_path(inode.path));
        inode.directory = j->at("type").get<std::string>() == "directory";
        inode.size = j->value("size", uint64_t{0});
        inode.created_at = j->value("created_at", uint64_t{0});
        inode.modified_at = j->value("modified_at", inode.created_at);
        return inode;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

VfsService::VfsService(kernel::Kernel& kernel, kernel::ProcessId pid)
    : Service(kernel, pid, "vfs")
    , storage_(sys_, kernel::IoChannel::STORAGE) {}

void VfsService::on_start() {
    register_with_init();
    announce_ready();
}

bool VfsService::handles(uint32_t tag) const {
    switch (tag) {
        case msg::VFS_MKDIR:
        case msg::VFS_RMDIR:
        case msg::VFS_READDIR:
        case msg::VFS_WRITE:
        case msg::VFS_READ:
        case msg::VFS_UNLINK:
        case msg::VFS_STAT:
        case msg::VFS_EXISTS:
            return true;
        default:
            return false;
    }
}

void VfsService::dispatch_request(const kernel::ReceivedMessage& message) {
    VfsRequest request;
    request.target = reply_target(message);
    request.response_tag = kernel::response_tag(message.tag);
    request.started_at = now();

    auto body = runtime::decode_json(message.data);
    if (!body || !body->contains("path") || !(*body)["path"].is_string()) {
        fail(request, ServiceError::INVALID_REQUEST, "expected {\"path\": ...}");
        return;
    }
    request.path = (*body)["path"].get<std::string>();
    if (!valid_path(request.path)) {
        fail(request, ServiceError::INVALID_PATH, request.path);
        return;
    }
    if (message.tag == msg::VFS_WRITE) {
        if (!body->contains("content") || !(*body)["content"].is_string()) {
            fail(request, ServiceError::INVALID_REQUEST, "write needs string content");
            return;
        }
        request.content = kernel::to_bytes((*body)["content"].get<std::string>());
    }

    spdlog::debug("[vfs] 0x{:x} {} from PID {}", message.tag, request.path, message.from_pid);

    switch (message.tag) {
        case msg::VFS_MKDIR:   handle_mkdir(std::move(request)); break;
        case msg::VFS_RMDIR:   handle_rmdir(std::move(request)); break;
        case msg::VFS_READDIR: handle_readdir(std::move(request)); break;
        case msg::VFS_WRITE:   handle_write(std::move(request)); break;
        case msg::VFS_READ:    handle_read(std::move(request)); break;
        case msg::VFS_UNLINK:  handle_unlink(std::move(request)); break;
        case msg::VFS_STAT:    handle_stat(std::move(request)); break;
        case msg::VFS_EXISTS:  handle_exists(std::move(request)); break;
        default: break;
    }
}

void VfsService::on_storage_result(const IoResult& result) {
    storage_.on_result(result, now());
}

size_t VfsService::expire_pending(uint64_t now, uint64_t timeout_ns) {
    size_t expired = 0;
    for (auto rid : storage_.expired(now, timeout_ns)) {
        auto request = storage_.take(rid);
        if (!request) {
            continue;
        }
        spdlog::warn("[vfs] storage request {} for {} timed out", rid, request->path);
        fail(*request, ServiceError::TIMEOUT, "storage did not answer");
        expired++;
    }
    return expired;
}

VfsService::Step VfsService::finish(const VfsRequest& request, const nlohmann::json& body) {
    respond(request.target, request.response_tag, runtime::ok_response(body));
    return Step::done();
}

VfsService::Step VfsService::fail(const VfsRequest& request, ServiceError error, const std::string& message) {
    respond_error(request.target, request.response_tag, error, message);
    return Step::done();
}

VfsService::Step VfsService::storage_failure(const VfsRequest& request, const IoResult& result) {
    std::string detail = result.data.empty() ? kernel::io_result_type_to_string(result.type)
                                             : kernel::to_string(result.data);
    return fail(request, ServiceError::STORAGE_ERROR, detail);
}

// ============================================================================
// MKDIR: exists? -> parent is a directory? -> write inode
// ============================================================================

void VfsService::handle_mkdir(VfsRequest request) {
    if (request.path == "/") {
        fail(request, ServiceError::ALREADY_EXISTS, "/");
        return;
    }
    storage_.begin(Step::exists(inode_key(request.path), then(&VfsService::mkdir_after_exists)),
                   std::move(request), now());
}

VfsService::Step VfsService::mkdir_after_exists(const IoResult& result, VfsRequest& request) {
    if (result.type == IoResultType::EXISTS_TRUE) {
        return fail(request, ServiceError::ALREADY_EXISTS, request.path);
    }
    if (result.type != IoResultType::EXISTS_FALSE) {
        return storage_failure(request, result);
    }

    std::string parent = parent_path(request.path);
    if (parent == "/") {
        auto inode = Inode::new_directory(request.path, request.started_at);
        return Step::write(inode_key(request.path), runtime::encode_json(inode.to_json()),
                           [this](const IoResult& written, VfsRequest& req) {
                               if (written.type != IoResultType::WRITE_OK) {
                                   return storage_failure(req, written);
                               }
                               return finish(req, {{"path", req.path}});
                           });
    }
    return Step::read(inode_key(parent), then(&VfsService::mkdir_after_parent));
}

VfsService::Step VfsService::mkdir_after_parent(const IoResult& result, VfsRequest& request) {
    if (result.type == IoResultType::READ_NOT_FOUND) {
        return fail(request, ServiceError::NOT_FOUND, parent_path(request.path));
    }
    if (result.type != IoResultType::READ_OK) {
        return storage_failure(request, result);
    }
    auto parent = Inode::parse(result.data);
    if (!parent) {
        return fail(request, ServiceError::STORAGE_ERROR, "corrupt inode for " + parent_path(request.path));
    }
    if (!parent->directory) {
        return fail(request, ServiceError::NOT_A_DIRECTORY, parent->path);
    }

    auto inode = Inode::new_directory(request.path, request.started_at);
    return Step::write(inode_key(request.path), runtime::encode_json(inode.to_json()),
                       [this](const IoResult& written, VfsRequest& req) {
                           if (written.type != IoResultType::WRITE_OK) {
                               return storage_failure(req, written);
                           }
                           return finish(req, {{"path", req.path}});
                       });
}

// ============================================================================
// RMDIR: inode is a directory? -> no children? -> delete inode
// ============================================================================

void VfsService::handle_rmdir(VfsRequest request) {
    if (request.path == "/") {
        fail(request, ServiceError::PERMISSION_DENIED, "cannot remove /");
        return;
    }
    storage_.begin(Step::read(inode_key(request.path), then(&VfsService::rmdir_after_inode)),
                   std::move(request), now());
}

VfsService::Step VfsService::rmdir_after_inode(const IoResult& result, VfsRequest& request) {
    if (result.type == IoResultType::READ_NOT_FOUND) {
        return fail(request, ServiceError::NOT_FOUND, request.path);
    }
    if (result.type != IoResultType::READ_OK) {
        return storage_failure(request, result);
    }
    auto inode = Inode::parse(result.data);
    if (!inode) {
        return fail(request, ServiceError::STORAGE_ERROR, "corrupt inode for " + request.path);
    }
    if (!inode->directory) {
        return fail(request, ServiceError::NOT_A_DIRECTORY, request.path);
    }
    return Step::list(inode_key(request.path) + "/", then(&VfsService::rmdir_after_list));
}

VfsService::Step VfsService::rmdir_after_list(const IoResult& result, VfsRequest& request) {
    if (result.type != IoResultType::LIST_OK) {
        return storage_failure(request, result);
    }
    if (!kernel::decode_key_list(result.data).empty()) {
        return fail(request, ServiceError::DIRECTORY_NOT_EMPTY, request.path);
    }
    return Step::remove(inode_key(request.path), [this](const IoResult& removed, VfsRequest& req) {
        if (removed.type != IoResultType::DELETE_OK) {
            return storage_failure(req, removed);
        }
        return finish(req, {{"path", req.path}});
    });
}

// ============================================================================
// READDIR: inode is a directory? -> list direct children -> read each inode
// ============================================================================

void VfsService::handle_readdir(VfsRequest request) {
    std::string prefix = request.path == "/" ? inode_key("/") : inode_key(request.path) + "/";
    if (request.path == "/") {
        storage_.begin(Step::list(prefix, then(&VfsService::readdir_after_list)), std::move(request), now());
        return;
    }
    storage_.begin(Step::read(inode_key(request.path), then(&VfsService::readdir_after_inode)),
                   std::move(request), now());
}

VfsService::Step VfsService::readdir_after_inode(const IoResult& result, VfsRequest& request) {
    if (result.type == IoResultType::READ_NOT_FOUND) {
        return fail(request, ServiceError::NOT_FOUND, request.path);
    }
    if (result.type != IoResultType::READ_OK) {
        return storage_failure(request, result);
    }
    auto inode = Inode::parse(result.data);
    if (!inode || !inode->directory) {
        return fail(request, ServiceError::NOT_A_DIRECTORY, request.path);
    }
    return Step::list(inode_key(request.path) + "/", then(&VfsService::readdir_after_list));
}

VfsService::Step VfsService::readdir_after_list(const IoResult& result, VfsRequest& request) {
    if (result.type != IoResultType::LIST_OK) {
        return storage_failure(request, result);
    }

    std::string prefix = request.path == "/" ? inode_key("/") : inode_key(request.path) + "/";
    for (const auto& key : kernel::decode_key_list(result.data)) {
        std::string rest = key.substr(prefix.size());
        // Only direct children: deeper keys share the prefix too
        if (!rest.empty() && rest.find('/') == std::string::npos) {
            request.children.push_back(key.substr(std::string("inode:").size()));
        }
    }
    std::sort(request.children.begin(), request.children.end());
    request.next_child = 0;
    return next_child(request);
}

VfsService::Step VfsService::next_child(VfsRequest& request) {
    if (request.next_child >= request.children.size()) {
        return finish(request, {{"path", request.path}, {"entries", request.entries}});
    }
    return Step::read(inode_key(request.children[request.next_child]),
                      then(&VfsService::readdir_after_child));
}

VfsService::Step VfsService::readdir_after_child(const IoResult& result, VfsRequest& request) {
    const std::string& child = request.children[request.next_child];
    if (result.type == IoResultType::READ_OK) {
        if (auto inode = Inode::parse(result.data)) {
            request.entries.push_back({
                {"name", inode->name},
                {"path", inode->path},
                {"type", inode->directory ? "directory" : "file"},
                {"size", inode->size}
            });
        } else {
            spdlog::warn("[vfs] skipping corrupt inode {}", child);
        }
    } else if (result.type != IoResultType::READ_NOT_FOUND) {
        return storage_failure(request, result);
    }
    request.next_child++;
    return next_child(request);
}

// ============================================================================
// WRITE: parent is a directory? -> target not a directory? -> content -> inode
// ============================================================================

void VfsService::handle_write(VfsRequest request) {
    if (request.path == "/") {
        fail(request, ServiceError::NOT_A_FILE, "/");
        return;
    }
    std::string parent = parent_path(request.path);
    if (parent == "/") {
        storage_.begin(Step::read(inode_key(request.path), then(&VfsService::write_after_inode)),
                       std::move(request), now());
        return;
    }
    storage_.begin(Step::read(inode_key(parent), then(&VfsService::write_after_parent)),
                   std::move(request), now());
}

VfsService::Step VfsService::write_after_parent(const IoResult& result, VfsRequest& request) {
    if (result.type == IoResultType::READ_NOT_FOUND) {
        return fail(request, ServiceError::NOT_FOUND, parent_path(request.path));
    }
    if (result.type != IoResultType::READ_OK) {
        return storage_failure(request, result);
    }
    auto parent = Inode::parse(result.data);
    if (!parent || !parent->directory) {
        return fail(request, ServiceError::NOT_A_DIRECTORY, parent_path(request.path));
    }
    return Step::read(inode_key(request.path), then(&VfsService::write_after_inode));
}

VfsService::Step VfsService::write_after_inode(const IoResult& result, VfsRequest& request) {
    if (result.type == IoResultType::READ_OK) {
        auto inode = Inode::parse(result.data);
        if (inode && inode->directory) {
            return fail(request, ServiceError::NOT_A_FILE, request.path);
        }
        request.existing = inode;
    } else if (result.type != IoResultType::READ_NOT_FOUND) {
        return storage_failure(request, result);
    }
    return Step::write(content_key(request.path), request.content, then(&VfsService::write_after_content));
}

VfsService::Step VfsService::write_after_content(const IoResult& result, VfsRequest& request) {
    if (result.type != IoResultType::WRITE_OK) {
        return storage_failure(request, result);
    }

    auto inode = Inode::new_file(request.path, request.content.size(), request.started_at);
    if (request.existing) {
        inode.created_at = request.existing->created_at;
    }
    return Step::write(inode_key(request.path), runtime::encode_json(inode.to_json()),
                       [this](const IoResult& written, VfsRequest& req) {
                           if (written.type != IoResultType::WRITE_OK) {
                               return storage_failure(req, written);
                           }
                           return finish(req, {{"path", req.path}, {"size", req.content.size()}});
                       });
}

// ============================================================================
// READ: content -> (missing) inode decides between empty file and error
// ============================================================================

void VfsService::handle_read(VfsRequest request) {
    storage_.begin(Step::read(content_key(request.path), then(&VfsService::read_after_content)),
                   std::move(request), now());
}

VfsService::Step VfsService::read_after_content(const IoResult& result, VfsRequest& request) {
    if (result.type == IoResultType::READ_OK) {
        return finish(request, {{"path", request.path}, {"content", kernel::to_string(result.data)}});
    }
    if (result.type != IoResultType::READ_NOT_FOUND) {
        return storage_failure(request, result);
    }
    if (request.path == "/") {
        return fail(request, ServiceError::NOT_A_FILE, "/");
    }
    return Step::read(inode_key(request.path), then(&VfsService::read_after_inode));
}

VfsService::Step VfsService::read_after_inode(const IoResult& result, VfsRequest& request) {
    if (result.type == IoResultType::READ_NOT_FOUND) {
        return fail(request, ServiceError::NOT_FOUND, request.path);
    }
    if (result.type != IoResultType::READ_OK) {
        return storage_failure(request, result);
    }
    auto inode = Inode::parse(result.data);
    if (inode && inode->directory) {
        return fail(request, ServiceError::NOT_A_FILE, request.path);
    }
    return finish(request, {{"path", request.path}, {"content", ""}});
}

// ============================================================================
// UNLINK: inode is a file? -> delete content -> delete inode
// ============================================================================

void VfsService::handle_unlink(VfsRequest request) {
    if (request.path == "/") {
        fail(request, ServiceError::NOT_A_FILE, "/");
        return;
    }
    storage_.begin(Step::read(inode_key(request.path), then(&VfsService::unlink_after_inode)),
                   std::move(request), now());
}

VfsService::Step VfsService::unlink_after_inode(const IoResult& result, VfsRequest& request) {
    if (result.type == IoResultType::READ_NOT_FOUND) {
        return fail(request, ServiceError::NOT_FOUND, request.path);
    }
    if (result.type != IoResultType::READ_OK) {
        return storage_failure(request, result);
    }
    auto inode = Inode::parse(result.data);
    if (inode && inode->directory) {
        return fail(request, ServiceError::NOT_A_FILE, request.path);
    }
    return Step::remove(content_key(request.path), then(&VfsService::unlink_after_content));
}

VfsService::Step VfsService::unlink_after_content(const IoResult& result, VfsRequest& request) {
    if (result.type != IoResultType::DELETE_OK) {
        return storage_failure(request, result);
    }
    return Step::remove(inode_key(request.path), [this](const IoResult& removed, VfsRequest& req) {
        if (removed.type != IoResultType::DELETE_OK) {
            return storage_failure(req, removed);
        }
        return finish(req, {{"path", req.path}});
    });
}

// ============================================================================
// STAT / EXISTS
// ============================================================================

void VfsService::handle_stat(VfsRequest request) {
    if (request.path == "/") {
        finish(request, {{"inode", Inode::root().to_json()}});
        return;
    }
    storage_.begin(Step::read(inode_key(request.path), then(&VfsService::stat_after_inode)),
                   std::move(request), now());
}

VfsService::Step VfsService::stat_after_inode(const IoResult& result, VfsRequest& request) {
    if (result.type == IoResultType::READ_NOT_FOUND) {
        return fail(request, ServiceError::NOT_FOUND, request.path);
    }
    if (result.type != IoResultType::READ_OK) {
        return storage_failure(request, result);
    }
    auto inode = Inode::parse(result.data);
    if (!inode) {
        return fail(request, ServiceError::STORAGE_ERROR, "corrupt inode for " + request.path);
    }
    return finish(request, {{"inode", inode->to_json()}});
}

void VfsService::handle_exists(VfsRequest request) {
    if (request.path == "/") {
        finish(request, {{"path", "/"}, {"exists", true}});
        return;
    }
    storage_.begin(Step::exists(inode_key(request.path), then(&VfsService::exists_after_check)),
                   std::move(request), now());
}

VfsService::Step VfsService::exists_after_check(const IoResult& result, VfsRequest& request) {
    if (result.type != IoResultType::EXISTS_TRUE && result.type != IoResultType::EXISTS_FALSE) {
        return storage_failure(request, result);
    }
    return finish(request, {{"path", request.path}, {"exists", result.type == IoResultType::EXISTS_TRUE}});
}

} // namespace zero::services
