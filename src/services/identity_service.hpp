/**
 * Identity Service
 *
 * Per-user identity preferences, stored as a VFS file at
 * /home/<user>/.zos/identity/preferences.json. Reads and writes go straight
 * to the storage keys the VFS uses, so the file is visible through it.
 */
#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "runtime/correlator.hpp"
#include "runtime/service.hpp"

namespace zero::services {

enum class KeyScheme {
    ED25519_X25519,
    PQ_HYBRID
};

std::string key_scheme_to_string(KeyScheme scheme);
std::optional<KeyScheme> parse_key_scheme(const std::string& name);

struct IdentityPreferences {
    KeyScheme default_key_scheme = KeyScheme::ED25519_X25519;

    nlohmann::json to_json() const;
    // Missing or unreadable documents yield the defaults
    static IdentityPreferences parse(const kernel::Bytes& data);

    static std::string storage_path(const std::string& user_id);
};

struct IdentityRequest {
    runtime::ReplyTarget target;
    uint32_t response_tag = 0;
    std::string user_id;
    KeyScheme new_scheme = KeyScheme::ED25519_X25519;
    IdentityPreferences preferences;
    uint64_t started_at = 0;
};

class IdentityService : public runtime::Service {
public:
    IdentityService(kernel::Kernel& kernel, kernel::ProcessId pid);

    void on_start() override;

    size_t expire_pending(uint64_t now, uint64_t timeout_ns) override;
    bool has_expired(uint64_t now, uint64_t timeout_ns) const override {
        return !storage_.expired(now, timeout_ns).empty();
    }
    size_t pending_count() const override { return storage_.pending_count(); }

protected:
    bool handles(uint32_t tag) const override;
    void dispatch_request(const kernel::ReceivedMessage& message) override;
    void on_storage_result(const kernel::IoResult& result) override;

private:
    using Step = runtime::Step<IdentityRequest>;

    void handle_get_preferences(IdentityRequest request);
    void handle_set_default_key_scheme(IdentityRequest request);

    Step respond_preferences(const kernel::IoResult& result, IdentityRequest& request);
    Step update_preferences(const kernel::IoResult& result, IdentityRequest& request);
    Step write_preferences_inode(const kernel::IoResult& result, IdentityRequest& request);
    Step confirm_update(const kernel::IoResult& result, IdentityRequest& request);

    Step fail(const IdentityRequest& request, runtime::ServiceError error, const std::string& message);

    runtime::Correlator<IdentityRequest> storage_;
};

} // namespace zero::services
