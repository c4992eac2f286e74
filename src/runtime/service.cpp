#include "runtime/service.hpp"
#include "kernel/wire.hpp"
#include "runtime/protocol.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace zero::runtime {

std::string service_error_to_string(ServiceError error) {
    switch (error) {
        case ServiceError::NOT_FOUND:           return "NotFound";
        case ServiceError::ALREADY_EXISTS:      return "AlreadyExists";
        case ServiceError::NOT_A_DIRECTORY:     return "NotADirectory";
        case ServiceError::NOT_A_FILE:          return "NotAFile";
        case ServiceError::DIRECTORY_NOT_EMPTY: return "DirectoryNotEmpty";
        case ServiceError::INVALID_PATH:        return "InvalidPath";
        case ServiceError::INVALID_REQUEST:     return "InvalidRequest";
        case ServiceError::STORAGE_ERROR:       return "StorageError";
        case ServiceError::ENCRYPTION_ERROR:    return "EncryptionError";
        case ServiceError::PERMISSION_DENIED:   return "PermissionDenied";
        case ServiceError::TIMEOUT:             return "Timeout";
        case ServiceError::BUSY:                return "Busy";
        default: return "Unknown";
    }
}

nlohmann::json ok_response(nlohmann::json body) {
    body["success"] = true;
    return body;
}

nlohmann::json error_response(ServiceError error, const std::string& message) {
    nlohmann::json body;
    body["success"] = false;
    body["error"] = service_error_to_string(error);
    if (!message.empty()) {
        body["message"] = message;
    }
    return body;
}

Bytes encode_json(const nlohmann::json& body) {
    return kernel::to_bytes(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

std::optional<nlohmann::json> decode_json(const Bytes& data) {
    auto body = nlohmann::json::parse(data.begin(), data.end(), nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return std::nullopt;
    }
    return body;
}

Service::Service(kernel::Kernel& kernel, ProcessId pid, std::string name)
    : sys_(kernel, pid)
    , name_(std::move(name)) {}

MessageClass Service::classify(uint32_t tag) const {
    if (tag == kernel::MSG_STORAGE_RESULT) {
        return MessageClass::STORAGE_RESULT;
    }
    if (tag == kernel::MSG_KEYSTORE_RESULT) {
        return MessageClass::KEYSTORE_RESULT;
    }
    if (tag == kernel::MSG_CAP_REVOKED || tag == kernel::MSG_CONSOLE_INPUT ||
        msg::is_registry_response(tag)) {
        return MessageClass::CONTROL;
    }
    if (handles(tag)) {
        return MessageClass::CLIENT_REQUEST;
    }
    return MessageClass::UNKNOWN;
}

bool Service::step() {
    auto result = sys_.recv(INBOX_SLOT);
    if (result.kind == kernel::ResultKind::BLOCKED) {
        return false;
    }
    if (result.kind != kernel::ResultKind::MESSAGE) {
        spdlog::warn("[{}] receive failed: {}", name_, result.describe());
        return false;
    }

    auto clock = sys_.time();
    if (clock.is_ok()) {
        now_ = clock.value;
    }

    const auto& message = *result.message;
    MessageClass kind = classify(message.tag);

    // Completions only ever come from the kernel
    if ((kind == MessageClass::STORAGE_RESULT || kind == MessageClass::KEYSTORE_RESULT) &&
        message.from_pid != kernel::KERNEL_PID) {
        kind = MessageClass::UNKNOWN;
    }

    switch (kind) {
        case MessageClass::STORAGE_RESULT:
        case MessageClass::KEYSTORE_RESULT: {
            auto io = kernel::IoResult::parse(message.data);
            if (!io) {
                spdlog::warn("[{}] malformed I/O result ({} bytes)", name_, message.data.size());
                break;
            }
            if (kind == MessageClass::STORAGE_RESULT) {
                on_storage_result(*io);
            } else {
                on_keystore_result(*io);
            }
            break;
        }
        case MessageClass::CLIENT_REQUEST:
            requests_handled_++;
            dispatch_request(message);
            break;
        case MessageClass::CONTROL:
            on_control(message);
            break;
        case MessageClass::UNKNOWN:
            if (message.from_pid == kernel::KERNEL_PID) {
                spdlog::warn("[{}] ignoring kernel message 0x{:x}", name_, message.tag);
            } else {
                spdlog::warn("[{}] unknown message 0x{:x} from PID {}", name_, message.tag, message.from_pid);
                respond_error(reply_target(message), kernel::response_tag(message.tag),
                              ServiceError::INVALID_REQUEST,
                              fmt::format("unknown message tag 0x{:x}", message.tag));
            }
            break;
    }

    // Only the first transferred capability is ever kept, as the reply endpoint
    release_caps(message, kind == MessageClass::CONTROL ? 0 : 1);
    return true;
}

void Service::release_caps(const kernel::ReceivedMessage& message, size_t first) {
    for (size_t i = first; i < message.cap_slots.size(); ++i) {
        auto released = sys_.cap_delete(message.cap_slots[i]);
        if (released.kind == kernel::ResultKind::ERR) {
            spdlog::warn("[{}] could not release slot {} from PID {}: {}", name_, message.cap_slots[i],
                         message.from_pid, kernel::kernel_error_to_string(released.error));
        }
    }
}

size_t Service::expire_pending(uint64_t, uint64_t) {
    return 0;
}

void Service::on_storage_result(const kernel::IoResult& result) {
    spdlog::warn("[{}] unexpected storage result for request {}", name_, result.request_id);
}

void Service::on_keystore_result(const kernel::IoResult& result) {
    spdlog::warn("[{}] unexpected keystore result for request {}", name_, result.request_id);
}

void Service::on_control(const kernel::ReceivedMessage& message) {
    switch (message.tag) {
        case kernel::MSG_CAP_REVOKED:
            spdlog::info("[{}] capability revoked ({} bytes notice)", name_, message.data.size());
            break;
        case msg::REGISTER_RESPONSE:
            spdlog::debug("[{}] registration acknowledged: {}", name_, kernel::to_string(message.data));
            break;
        default:
            spdlog::debug("[{}] control message 0x{:x} from PID {}", name_, message.tag, message.from_pid);
            break;
    }
}

ReplyTarget Service::reply_target(const kernel::ReceivedMessage& message) const {
    ReplyTarget target;
    target.pid = message.from_pid;
    if (!message.cap_slots.empty()) {
        target.cap_slot = message.cap_slots.front();
    }
    return target;
}

void Service::respond(const ReplyTarget& target, uint32_t tag, const nlohmann::json& body) {
    Bytes data = encode_json(body);

    // Responses never park the service behind a slow client
    if (target.cap_slot) {
        auto sent = sys_.send(*target.cap_slot, tag, data, kernel::FLAG_NONBLOCK);
        if (sent.kind == kernel::ResultKind::ERR) {
            spdlog::warn("[{}] response 0x{:x} to PID {} via slot {} failed: {}", name_, tag,
                         target.pid, *target.cap_slot, kernel::kernel_error_to_string(sent.error));
        }
        auto released = sys_.cap_delete(*target.cap_slot);
        if (released.kind == kernel::ResultKind::ERR) {
            spdlog::warn("[{}] could not release reply slot {}: {}", name_, *target.cap_slot,
                         kernel::kernel_error_to_string(released.error));
        }
        return;
    }

    auto replied = sys_.reply(target.pid, tag, data);
    if (replied.kind == kernel::ResultKind::ERR && replied.error == kernel::KernelError::WOULD_BLOCK) {
        spdlog::warn("[{}] reply 0x{:x} dropped: PID {} inbox is full", name_, tag, target.pid);
        replies_dropped_++;
    } else if (replied.kind == kernel::ResultKind::ERR) {
        spdlog::warn("[{}] reply 0x{:x} to PID {} failed: {}", name_, tag, target.pid,
                     kernel::kernel_error_to_string(replied.error));
    }
}

void Service::respond_error(const ReplyTarget& target, uint32_t tag, ServiceError error,
                            const std::string& message) {
    respond(target, tag, error_response(error, message));
}

void Service::register_with_init() {
    nlohmann::json request;
    request["name"] = name_;
    auto result = sys_.send_cap(INIT_SLOT, msg::REGISTER_SERVICE, encode_json(request),
                                {INBOX_SLOT}, kernel::perm::SEND | kernel::perm::GRANT);
    if (result.kind == kernel::ResultKind::ERR) {
        spdlog::error("[{}] registration with init failed: {}", name_,
                      kernel::kernel_error_to_string(result.error));
    }
}

void Service::announce_ready() {
    nlohmann::json notice;
    notice["name"] = name_;
    auto result = sys_.send(INIT_SLOT, msg::SERVICE_READY, encode_json(notice));
    if (result.kind == kernel::ResultKind::ERR) {
        spdlog::warn("[{}] ready notice to init failed: {}", name_,
                     kernel::kernel_error_to_string(result.error));
    }
}

} // namespace zero::runtime
