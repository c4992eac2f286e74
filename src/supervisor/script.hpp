#pragma once
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "supervisor/client.hpp"
#include "supervisor/supervisor.hpp"

namespace zero::supervisor {

// "vfs.write", "identity.set_default_key_scheme", ... or a raw number
std::optional<uint32_t> parse_message_tag(const nlohmann::json& tag);

/**
 * Runs a JSON workload against a booted supervisor. Steps:
 *   {"op": "spawn", "name": "app"}
 *   {"op": "request", "as": "app", "service": "vfs", "tag": "vfs.write", "body": {...}}
 *   {"op": "lookup", "as": "app", "service": "identity"}
 *   {"op": "kill", "name": "app"}      {"op": "exit", "as": "app", "code": 0}
 *   {"op": "random", "as": "app", "count": 16}
 *   {"op": "console", "as": "app", "text": "..."}
 *   {"op": "run"}                       {"op": "status"}
 * Throws std::invalid_argument for malformed steps.
 */
class ScriptRunner {
public:
    explicit ScriptRunner(Supervisor& supervisor) : supervisor_(supervisor) {}

    // Accepts {"steps": [...]} or a bare array; returns one result per step
    nlohmann::json run(const nlohmann::json& script);
    nlohmann::json run_step(const nlohmann::json& step);

    static nlohmann::json demo_script();

private:
    Client& client(const std::string& name);

    Supervisor& supervisor_;
    std::map<std::string, Client> clients_;
};

} // namespace zero::supervisor
