#include "services/keystore_service.hpp"
#include "kernel/wire.hpp"
#include "runtime/protocol.hpp"
#include <spdlog/spdlog.h>

namespace zero::services {

namespace msg = runtime::msg;
using kernel::IoOp;
using kernel::IoResult;
using kernel::IoResultType;
using runtime::ServiceError;

namespace {

IoOp op_for_tag(uint32_t tag) {
    switch (tag) {
        case msg::KEYSTORE_WRITE:  return IoOp::WRITE;
        case msg::KEYSTORE_DELETE: return IoOp::DELETE;
        case msg::KEYSTORE_EXISTS: return IoOp::EXISTS;
        case msg::KEYSTORE_LIST:   return IoOp::LIST;
        default: return IoOp::READ;
    }
}

bool is_keystore_path(const std::string& key) {
    std::string prefix = kernel::KEYSTORE_PREFIX;
    return key.size() >= prefix.size() && key.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

KeystoreService::KeystoreService(kernel::Kernel& kernel, kernel::ProcessId pid, size_t max_pending)
    : Service(kernel, pid, "keystore")
    , keystore_(sys_, kernel::IoChannel::KEYSTORE)
    , max_pending_(max_pending) {}

void KeystoreService::on_start() {
    register_with_init();
    announce_ready();
}

bool KeystoreService::handles(uint32_t tag) const {
    return tag == msg::KEYSTORE_READ || tag == msg::KEYSTORE_WRITE || tag == msg::KEYSTORE_DELETE ||
           tag == msg::KEYSTORE_EXISTS || tag == msg::KEYSTORE_LIST;
}

void KeystoreService::dispatch_request(const kernel::ReceivedMessage& message) {
    KeystoreRequest request;
    request.target = reply_target(message);
    request.response_tag = kernel::response_tag(message.tag);

    if (keystore_.pending_count() >= max_pending_) {
        rejected_busy_++;
        spdlog::warn("[keystore] {} operations pending, rejecting request from PID {}",
                     keystore_.pending_count(), message.from_pid);
        respond_error(request.target, request.response_tag, ServiceError::BUSY, "too many pending operations");
        return;
    }

    IoOp op = op_for_tag(message.tag);
    const char* field = op == IoOp::LIST ? "prefix" : "key";

    auto body = runtime::decode_json(message.data);
    if (!body || !body->contains(field) || !(*body)[field].is_string()) {
        respond_error(request.target, request.response_tag, ServiceError::INVALID_REQUEST,
                      std::string("missing ") + field);
        return;
    }
    request.key = (*body)[field].get<std::string>();
    if (!is_keystore_path(request.key)) {
        respond_error(request.target, request.response_tag, ServiceError::INVALID_PATH,
                      "keys live under " + std::string(kernel::KEYSTORE_PREFIX));
        return;
    }

    kernel::Bytes value;
    if (op == IoOp::WRITE) {
        if (!body->contains("value_hex") || !(*body)["value_hex"].is_string()) {
            respond_error(request.target, request.response_tag, ServiceError::INVALID_REQUEST,
                          "missing value_hex");
            return;
        }
        try {
            value = kernel::from_hex((*body)["value_hex"].get<std::string>());
        } catch (const kernel::WireError& e) {
            respond_error(request.target, request.response_tag, ServiceError::INVALID_REQUEST, e.what());
            return;
        }
    }

    spdlog::debug("[keystore] {} {} for PID {}", kernel::io_op_to_string(op), request.key, message.from_pid);

    auto next = [this](const IoResult& result, KeystoreRequest& req) { return complete(result, req); };
    auto started = keystore_.start(op, request.key, value, request, next, now());
    if (!started.success) {
        respond_error(request.target, request.response_tag, ServiceError::STORAGE_ERROR,
                      kernel::kernel_error_to_string(started.error));
    }
}

void KeystoreService::on_keystore_result(const IoResult& result) {
    keystore_.on_result(result, now());
}

size_t KeystoreService::expire_pending(uint64_t now, uint64_t timeout_ns) {
    size_t expired = 0;
    for (auto rid : keystore_.expired(now, timeout_ns)) {
        if (auto request = keystore_.take(rid)) {
            spdlog::warn("[keystore] request {} for {} timed out", rid, request->key);
            respond_error(request->target, request->response_tag, ServiceError::TIMEOUT,
                          "keystore did not answer");
            expired++;
        }
    }
    return expired;
}

KeystoreService::Step KeystoreService::complete(const IoResult& result, KeystoreRequest& request) {
    nlohmann::json body;
    body["key"] = request.key;

    switch (result.type) {
        case IoResultType::READ_OK:
            body["value_hex"] = kernel::to_hex(result.data);
            break;
        case IoResultType::READ_NOT_FOUND:
            respond_error(request.target, request.response_tag, ServiceError::NOT_FOUND, request.key);
            return Step::done();
        case IoResultType::WRITE_OK:
        case IoResultType::DELETE_OK:
            break;
        case IoResultType::EXISTS_TRUE:
        case IoResultType::EXISTS_FALSE:
            body["exists"] = result.type == IoResultType::EXISTS_TRUE;
            break;
        case IoResultType::LIST_OK:
            body.erase("key");
            body["prefix"] = request.key;
            body["keys"] = kernel::decode_key_list(result.data);
            break;
        default:
            respond_error(request.target, request.response_tag, ServiceError::STORAGE_ERROR,
                          result.data.empty() ? kernel::io_result_type_to_string(result.type)
                                              : kernel::to_string(result.data));
            return Step::done();
    }

    respond(request.target, request.response_tag, runtime::ok_response(body));
    return Step::done();
}

} // namespace zero::services
