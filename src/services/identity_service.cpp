#include "services/identity_service.hpp"
#include "kernel/wire.hpp"
#include "runtime/protocol.hpp"
#include "services/vfs_service.hpp"
#include <spdlog/spdlog.h>

namespace zero::services {

namespace msg = runtime::msg;
using kernel::IoResult;
using kernel::IoResultType;
using runtime::ServiceError;

std::string key_scheme_to_string(KeyScheme scheme) {
    switch (scheme) {
        case KeyScheme::ED25519_X25519: return "Ed25519X25519";
        case KeyScheme::PQ_HYBRID:      return "PqHybrid";
        default: return "Unknown";
    }
}

std::optional<KeyScheme> parse_key_scheme(const std::string& name) {
    if (name == "Ed25519X25519") return KeyScheme::ED25519_X25519;
    if (name == "PqHybrid") return KeyScheme::PQ_HYBRID;
    return std::nullopt;
}

nlohmann::json IdentityPreferences::to_json() const {
    return {{"default_key_scheme", key_scheme_to_string(default_key_scheme)}};
}

IdentityPreferences IdentityPreferences::parse(const kernel::Bytes& data) {
    IdentityPreferences prefs;
    auto j = runtime::decode_json(data);
    if (!j) {
        return prefs;
    }
    auto it = j->find("default_key_scheme");
    if (it != j->end() && it->is_string()) {
        if (auto scheme = parse_key_scheme(it->get<std::string>())) {
            prefs.default_key_scheme = *scheme;
        }
    }
    return prefs;
}

std::string IdentityPreferences::storage_path(const std::string& user_id) {
    return "/home/" + user_id + "/.zos/identity/preferences.json";
}

IdentityService::IdentityService(kernel::Kernel& kernel, kernel::ProcessId pid)
    : Service(kernel, pid, "identity")
    , storage_(sys_, kernel::IoChannel::STORAGE) {}

void IdentityService::on_start() {
    register_with_init();
    announce_ready();
}

bool IdentityService::handles(uint32_t tag) const {
    return tag == msg::IDENTITY_GET_PREFERENCES || tag == msg::IDENTITY_SET_DEFAULT_KEY_SCHEME;
}

void IdentityService::dispatch_request(const kernel::ReceivedMessage& message) {
    IdentityRequest request;
    request.target = reply_target(message);
    request.response_tag = kernel::response_tag(message.tag);
    request.started_at = now();

    auto body = runtime::decode_json(message.data);
    if (!body || !body->contains("user_id")) {
        fail(request, ServiceError::INVALID_REQUEST, "expected {\"user_id\": ...}");
        return;
    }
    const auto& user = (*body)["user_id"];
    if (user.is_string() && !user.get<std::string>().empty()) {
        request.user_id = user.get<std::string>();
    } else if (user.is_number_unsigned() || (user.is_number_integer() && user.get<int64_t>() >= 0)) {
        request.user_id = std::to_string(user.get<uint64_t>());
    } else {
        fail(request, ServiceError::INVALID_REQUEST, "user_id must be a string or unsigned number");
        return;
    }
    if (!valid_path(IdentityPreferences::storage_path(request.user_id))) {
        fail(request, ServiceError::INVALID_PATH, request.user_id);
        return;
    }

    if (message.tag == msg::IDENTITY_GET_PREFERENCES) {
        handle_get_preferences(std::move(request));
        return;
    }

    auto scheme_field = body->find("key_scheme");
    if (scheme_field == body->end() || !scheme_field->is_string()) {
        fail(request, ServiceError::INVALID_REQUEST, "missing key_scheme");
        return;
    }
    auto scheme = parse_key_scheme(scheme_field->get<std::string>());
    if (!scheme) {
        fail(request, ServiceError::INVALID_REQUEST, "unknown key scheme " + scheme_field->get<std::string>());
        return;
    }
    request.new_scheme = *scheme;
    handle_set_default_key_scheme(std::move(request));
}

void IdentityService::on_storage_result(const IoResult& result) {
    storage_.on_result(result, now());
}

size_t IdentityService::expire_pending(uint64_t now, uint64_t timeout_ns) {
    size_t expired = 0;
    for (auto rid : storage_.expired(now, timeout_ns)) {
        if (auto request = storage_.take(rid)) {
            spdlog::warn("[identity] storage request {} for user {} timed out", rid, request->user_id);
            fail(*request, ServiceError::TIMEOUT, "storage did not answer");
            expired++;
        }
    }
    return expired;
}

IdentityService::Step IdentityService::fail(const IdentityRequest& request, ServiceError error,
                                            const std::string& message) {
    respond_error(request.target, request.response_tag, error, message);
    return Step::done();
}

void IdentityService::handle_get_preferences(IdentityRequest request) {
    std::string key = content_key(IdentityPreferences::storage_path(request.user_id));
    storage_.begin(Step::read(key, [this](const IoResult& result, IdentityRequest& req) {
                       return respond_preferences(result, req);
                   }),
                   std::move(request), now());
}

IdentityService::Step IdentityService::respond_preferences(const IoResult& result, IdentityRequest& request) {
    IdentityPreferences prefs;
    if (result.type == IoResultType::READ_OK) {
        prefs = IdentityPreferences::parse(result.data);
    } else if (result.type != IoResultType::READ_NOT_FOUND) {
        spdlog::warn("[identity] preferences for user {} unreadable ({}), using defaults", request.user_id,
                     kernel::io_result_type_to_string(result.type));
    }
    respond(request.target, request.response_tag, runtime::ok_response({{"preferences", prefs.to_json()}}));
    return Step::done();
}

// read -> merge -> write content -> write inode -> respond
void IdentityService::handle_set_default_key_scheme(IdentityRequest request) {
    std::string key = content_key(IdentityPreferences::storage_path(request.user_id));
    spdlog::debug("[identity] user {} default key scheme -> {}", request.user_id,
                  key_scheme_to_string(request.new_scheme));
    storage_.begin(Step::read(key, [this](const IoResult& result, IdentityRequest& req) {
                       return update_preferences(result, req);
                   }),
                   std::move(request), now());
}

IdentityService::Step IdentityService::update_preferences(const IoResult& result, IdentityRequest& request) {
    if (result.type == IoResultType::READ_OK) {
        request.preferences = IdentityPreferences::parse(result.data);
    } else if (result.type == IoResultType::READ_NOT_FOUND) {
        request.preferences = IdentityPreferences{};
    } else {
        return fail(request, ServiceError::STORAGE_ERROR, kernel::to_string(result.data));
    }

    request.preferences.default_key_scheme = request.new_scheme;
    std::string key = content_key(IdentityPreferences::storage_path(request.user_id));
    return Step::write(key, runtime::encode_json(request.preferences.to_json()),
                       [this](const IoResult& written, IdentityRequest& req) {
                           return write_preferences_inode(written, req);
                       });
}

IdentityService::Step IdentityService::write_preferences_inode(const IoResult& result, IdentityRequest& request) {
    if (result.type != IoResultType::WRITE_OK) {
        return fail(request, ServiceError::STORAGE_ERROR, "preferences write failed");
    }

    std::string path = IdentityPreferences::storage_path(request.user_id);
    auto size = runtime::encode_json(request.preferences.to_json()).size();
    auto inode = Inode::new_file(path, size, request.started_at);
    return Step::write(inode_key(path), runtime::encode_json(inode.to_json()),
                       [this](const IoResult& written, IdentityRequest& req) {
                           return confirm_update(written, req);
                       });
}

IdentityService::Step IdentityService::confirm_update(const IoResult& result, IdentityRequest& request) {
    if (result.type != IoResultType::WRITE_OK) {
        return fail(request, ServiceError::STORAGE_ERROR, "preferences inode write failed");
    }
    spdlog::info("[identity] user {} now defaults to {}", request.user_id,
                 key_scheme_to_string(request.preferences.default_key_scheme));
    respond(request.target, request.response_tag,
            runtime::ok_response({{"preferences", request.preferences.to_json()}}));
    return Step::done();
}

} // namespace zero::services
