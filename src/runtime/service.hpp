/**
 * Zero Service Skeleton
 *
 * Single-threaded event loop shared by every user-space service. step()
 * receives one message from the service inbox and routes it:
 * - MSG_STORAGE_RESULT / MSG_KEYSTORE_RESULT -> correlator continuations
 * - requests the service understands         -> dispatch_request()
 * - kernel and registry notifications         -> on_control()
 * - anything else                             -> InvalidRequest reply
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "kernel/io.hpp"
#include "kernel/message.hpp"
#include "runtime/syscalls.hpp"

namespace zero::runtime {

enum class ServiceError {
    NOT_FOUND,
    ALREADY_EXISTS,
    NOT_A_DIRECTORY,
    NOT_A_FILE,
    DIRECTORY_NOT_EMPTY,
    INVALID_PATH,
    INVALID_REQUEST,
    STORAGE_ERROR,
    ENCRYPTION_ERROR,
    PERMISSION_DENIED,
    TIMEOUT,
    BUSY
};

std::string service_error_to_string(ServiceError error);

enum class MessageClass {
    STORAGE_RESULT,
    KEYSTORE_RESULT,
    CLIENT_REQUEST,
    CONTROL,
    UNKNOWN
};

// Where a response goes: a reply endpoint the client transferred, or REPLY to its inbox
struct ReplyTarget {
    ProcessId pid = 0;
    std::optional<CapSlot> cap_slot;
};

// {"success": true, ...}
nlohmann::json ok_response(nlohmann::json body = nlohmann::json::object());

// {"success": false, "error": "<Kind>", "message": "..."}
nlohmann::json error_response(ServiceError error, const std::string& message = "");

// Response bodies never throw on non-UTF-8 content
Bytes encode_json(const nlohmann::json& body);

// Request body as a JSON object; nullopt when the payload is not one
std::optional<nlohmann::json> decode_json(const Bytes& data);

class Service {
public:
    Service(kernel::Kernel& kernel, ProcessId pid, std::string name);
    virtual ~Service() = default;

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    const std::string& name() const { return name_; }
    ProcessId pid() const { return sys_.pid(); }
    Syscalls& sys() { return sys_; }

    // Runs once after the process is wired up, before the first step()
    virtual void on_start() {}

    // Receives and handles one message. False when the inbox was empty
    // (the process is now Blocked) or the receive failed.
    bool step();

    // Fails pending storage operations older than timeout_ns
    virtual size_t expire_pending(uint64_t now, uint64_t timeout_ns);
    virtual bool has_expired(uint64_t, uint64_t) const { return false; }

    virtual size_t pending_count() const { return 0; }

    MessageClass classify(uint32_t tag) const;

    uint64_t requests_handled() const { return requests_handled_; }
    uint64_t replies_dropped() const { return replies_dropped_; }

protected:
    // True for request tags this service answers
    virtual bool handles(uint32_t tag) const = 0;

    virtual void dispatch_request(const kernel::ReceivedMessage& message) = 0;
    virtual void on_storage_result(const kernel::IoResult& result);
    virtual void on_keystore_result(const kernel::IoResult& result);
    virtual void on_control(const kernel::ReceivedMessage& message);

    ReplyTarget reply_target(const kernel::ReceivedMessage& message) const;

    // Sends the response and releases a transferred reply capability
    void respond(const ReplyTarget& target, uint32_t tag, const nlohmann::json& body);
    void respond_error(const ReplyTarget& target, uint32_t tag, ServiceError error,
                       const std::string& message = "");

    // Registers this service's inbox with init under name()
    void register_with_init();

    // Tells init the service is accepting requests
    void announce_ready();

    uint64_t now() const { return now_; }

    Syscalls sys_;
    std::string name_;

private:
    void release_caps(const kernel::ReceivedMessage& message, size_t first);

    uint64_t now_ = 0;
    uint64_t requests_handled_ = 0;
    uint64_t replies_dropped_ = 0;
};

} // namespace zero::runtime
