#include "supervisor/client.hpp"
#include "kernel/wire.hpp"
#include "runtime/protocol.hpp"
#include <spdlog/spdlog.h>

namespace zero::supervisor {

namespace msg = runtime::msg;
using kernel::ResultKind;
using runtime::ServiceError;

Client::Client(Supervisor& supervisor, ProcessId pid)
    : supervisor_(supervisor)
    , sys_(supervisor.kernel(), pid) {}

std::optional<Client> Client::spawn(Supervisor& supervisor, const std::string& name) {
    auto pid = supervisor.spawn(name);
    if (!pid) {
        return std::nullopt;
    }
    return Client(supervisor, *pid);
}

bool Client::has_response_endpoint() {
    if (!response_endpoint_) {
        auto info = sys_.cap_inspect(runtime::VFS_RESPONSE_SLOT);
        response_endpoint_ = info.kind == ResultKind::CAP_INFO && !info.caps.empty() &&
                             info.caps.front().object_type == kernel::ObjectType::ENDPOINT &&
                             (info.caps.front().permissions & kernel::perm::RECEIVE);
    }
    return *response_endpoint_;
}

std::optional<kernel::CapSlot> Client::service_slot(const std::string& name) {
    auto cached = slots_.find(name);
    if (cached != slots_.end()) {
        return cached->second;
    }

    std::optional<kernel::CapSlot> wired;
    if (name == "vfs") {
        wired = runtime::VFS_SLOT;
    } else if (name == "keystore") {
        wired = runtime::KEYSTORE_SLOT;
    } else if (name == "init") {
        wired = runtime::INIT_SLOT;
    }
    if (wired) {
        auto info = sys_.cap_inspect(*wired);
        if (info.kind == ResultKind::ERR) {
            // A Send-only slot answers PermissionDenied, an empty one InvalidCapability
            if (!info.is_err(kernel::KernelError::PERMISSION_DENIED)) {
                wired.reset();
            }
        }
    }
    if (wired) {
        slots_[name] = *wired;
        return wired;
    }
    return lookup(name);
}

std::optional<kernel::CapSlot> Client::lookup(const std::string& name) {
    nlohmann::json request;
    request["name"] = name;
    auto sent = sys_.send(runtime::INIT_SLOT, msg::LOOKUP_SERVICE, runtime::encode_json(request));
    if (sent.kind == ResultKind::ERR) {
        spdlog::warn("PID {} lookup '{}' failed: {}", pid(), name, kernel::kernel_error_to_string(sent.error));
        return std::nullopt;
    }

    supervisor_.run_until_idle();
    auto reply = receive_tag(runtime::INBOX_SLOT, msg::LOOKUP_RESPONSE);
    if (!reply) {
        return std::nullopt;
    }
    auto body = runtime::decode_json(reply->data);
    if (!body || !body->value("success", false) || !body->contains("slot")) {
        spdlog::debug("PID {} lookup '{}': {}", pid(), name, kernel::to_string(reply->data));
        return std::nullopt;
    }

    auto slot = (*body)["slot"].get<kernel::CapSlot>();
    slots_[name] = slot;
    return slot;
}

nlohmann::json Client::request(const std::string& service, uint32_t tag, const nlohmann::json& body) {
    auto slot = service_slot(service);
    if (!slot) {
        return runtime::error_response(ServiceError::NOT_FOUND, "no service '" + service + "'");
    }
    return request(*slot, tag, body);
}

nlohmann::json Client::request(kernel::CapSlot slot, uint32_t tag, const nlohmann::json& body) {
    if (!send_request(slot, tag, body)) {
        return runtime::error_response(ServiceError::PERMISSION_DENIED, "request could not be sent");
    }
    supervisor_.run_until_idle();
    return await_response(kernel::response_tag(tag));
}

bool Client::send_request(kernel::CapSlot slot, uint32_t tag, const nlohmann::json& body) {
    kernel::SyscallResult sent;
    if (has_response_endpoint()) {
        sent = sys_.send_cap(slot, tag, runtime::encode_json(body), {runtime::VFS_RESPONSE_SLOT},
                             kernel::perm::SEND, kernel::FLAG_NONBLOCK);
    } else {
        sent = sys_.send(slot, tag, runtime::encode_json(body), kernel::FLAG_NONBLOCK);
    }
    if (sent.kind == ResultKind::ERR) {
        spdlog::warn("PID {} request 0x{:x} on slot {} failed: {}", pid(), tag, slot,
                     kernel::kernel_error_to_string(sent.error));
        return false;
    }
    return true;
}

nlohmann::json Client::await_response(uint32_t tag) {
    kernel::CapSlot slot = has_response_endpoint() ? runtime::VFS_RESPONSE_SLOT : runtime::INBOX_SLOT;
    auto reply = receive_tag(slot, tag);
    if (!reply) {
        return runtime::error_response(ServiceError::TIMEOUT, "no response");
    }
    auto body = runtime::decode_json(reply->data);
    if (!body) {
        return runtime::error_response(ServiceError::INVALID_REQUEST, "response is not JSON");
    }
    return *body;
}

std::optional<kernel::ReceivedMessage> Client::receive_tag(kernel::CapSlot slot, uint32_t tag) {
    // A client left blocked in RECV gets nothing until it is woken
    if (!supervisor_.wake(pid())) {
        spdlog::warn("PID {} cannot run to collect 0x{:x}", pid(), tag);
        return std::nullopt;
    }
    while (true) {
        auto received = sys_.recv(slot, false);
        if (received.kind != ResultKind::MESSAGE) {
            return std::nullopt;
        }
        if (received.message->tag == tag) {
            return received.message;
        }
        spdlog::debug("PID {} skipping message 0x{:x} while waiting for 0x{:x}", pid(),
                      received.message->tag, tag);
    }
}

} // namespace zero::supervisor
