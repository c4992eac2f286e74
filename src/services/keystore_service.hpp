/**
 * Keystore Service
 *
 * Key material storage isolated from the filesystem. Clients send JSON
 * requests naming "/keys/..." paths; the service forwards them to the
 * keystore syscalls and answers once the supervisor has completed them.
 * Values travel hex encoded ("value_hex").
 */
#pragma once
#include <string>
#include "runtime/correlator.hpp"
#include "runtime/service.hpp"

namespace zero::services {

constexpr size_t DEFAULT_KEYSTORE_MAX_PENDING = 256;

struct KeystoreRequest {
    runtime::ReplyTarget target;
    uint32_t response_tag = 0;
    std::string key;
};

class KeystoreService : public runtime::Service {
public:
    KeystoreService(kernel::Kernel& kernel, kernel::ProcessId pid,
                    size_t max_pending = DEFAULT_KEYSTORE_MAX_PENDING);

    void on_start() override;

    size_t expire_pending(uint64_t now, uint64_t timeout_ns) override;
    bool has_expired(uint64_t now, uint64_t timeout_ns) const override {
        return !keystore_.expired(now, timeout_ns).empty();
    }
    size_t pending_count() const override { return keystore_.pending_count(); }

    uint64_t rejected_busy() const { return rejected_busy_; }

protected:
    bool handles(uint32_t tag) const override;
    void dispatch_request(const kernel::ReceivedMessage& message) override;
    void on_keystore_result(const kernel::IoResult& result) override;

private:
    using Step = runtime::Step<KeystoreRequest>;

    Step complete(const kernel::IoResult& result, KeystoreRequest& request);

    runtime::Correlator<KeystoreRequest> keystore_;
    size_t max_pending_;
    uint64_t rejected_busy_ = 0;
};

} // namespace zero::services
