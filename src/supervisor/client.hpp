#pragma once
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "runtime/syscalls.hpp"
#include "supervisor/supervisor.hpp"

namespace zero::supervisor {

/**
 * A program-less process driven from the host: scripted workloads and
 * tests use it to talk to services the way an application would. Each
 * call runs the supervisor until the answer arrives (or nothing moves).
 */
class Client {
public:
    Client(Supervisor& supervisor, ProcessId pid);

    // Spawns a plain process through init and wraps it
    static std::optional<Client> spawn(Supervisor& supervisor, const std::string& name);

    ProcessId pid() const { return sys_.pid(); }
    runtime::Syscalls& sys() { return sys_; }

    // Endpoint slot for a service: the standard slot when wired, else asks init
    std::optional<kernel::CapSlot> service_slot(const std::string& name);

    // LOOKUP through init; the granted slot is cached
    std::optional<kernel::CapSlot> lookup(const std::string& name);

    // Sends a JSON request and waits for the T | 1 response body
    nlohmann::json request(const std::string& service, uint32_t tag, const nlohmann::json& body);
    nlohmann::json request(kernel::CapSlot slot, uint32_t tag, const nlohmann::json& body);

    // Sends a request without waiting; the answer is collected by await_response
    bool send_request(kernel::CapSlot slot, uint32_t tag, const nlohmann::json& body);
    nlohmann::json await_response(uint32_t tag);

private:
    bool has_response_endpoint();
    std::optional<kernel::ReceivedMessage> receive_tag(kernel::CapSlot slot, uint32_t tag);

    Supervisor& supervisor_;
    runtime::Syscalls sys_;
    std::map<std::string, kernel::CapSlot> slots_;
    std::optional<bool> response_endpoint_;
};

} // namespace zero::supervisor
