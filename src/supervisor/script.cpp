#include "supervisor/script.hpp"
#include "kernel/wire.hpp"
#include "runtime/protocol.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace zero::supervisor {

namespace msg = runtime::msg;

std::optional<uint32_t> parse_message_tag(const nlohmann::json& tag) {
    if (tag.is_number_unsigned() || (tag.is_number_integer() && tag.get<int64_t>() >= 0)) {
        return tag.get<uint32_t>();
    }
    if (!tag.is_string()) {
        return std::nullopt;
    }

    static const std::map<std::string, uint32_t> names = {
        {"vfs.mkdir", msg::VFS_MKDIR},
        {"vfs.rmdir", msg::VFS_RMDIR},
        {"vfs.readdir", msg::VFS_READDIR},
        {"vfs.write", msg::VFS_WRITE},
        {"vfs.read", msg::VFS_READ},
        {"vfs.unlink", msg::VFS_UNLINK},
        {"vfs.stat", msg::VFS_STAT},
        {"vfs.exists", msg::VFS_EXISTS},
        {"identity.get_preferences", msg::IDENTITY_GET_PREFERENCES},
        {"identity.set_default_key_scheme", msg::IDENTITY_SET_DEFAULT_KEY_SCHEME},
        {"keystore.read", msg::KEYSTORE_READ},
        {"keystore.write", msg::KEYSTORE_WRITE},
        {"keystore.delete", msg::KEYSTORE_DELETE},
        {"keystore.exists", msg::KEYSTORE_EXISTS},
        {"keystore.list", msg::KEYSTORE_LIST},
        {"init.lookup", msg::LOOKUP_SERVICE},
        {"init.spawn", msg::SPAWN_SERVICE}
    };
    auto it = names.find(tag.get<std::string>());
    if (it == names.end()) {
        return std::nullopt;
    }
    return it->second;
}

namespace {

std::string required_string(const nlohmann::json& step, const char* field) {
    auto it = step.find(field);
    if (it == step.end() || !it->is_string()) {
        throw std::invalid_argument(std::string("step needs string field '") + field + "': " + step.dump());
    }
    return it->get<std::string>();
}

} // namespace

Client& ScriptRunner::client(const std::string& name) {
    auto it = clients_.find(name);
    if (it == clients_.end()) {
        throw std::invalid_argument("no spawned process named '" + name + "'");
    }
    return it->second;
}

nlohmann::json ScriptRunner::run(const nlohmann::json& script) {
    const nlohmann::json& steps = script.is_object() ? script.value("steps", nlohmann::json::array()) : script;
    if (!steps.is_array()) {
        throw std::invalid_argument("script steps must be an array");
    }

    nlohmann::json results = nlohmann::json::array();
    for (const auto& step : steps) {
        results.push_back(run_step(step));
    }
    return results;
}

nlohmann::json ScriptRunner::run_step(const nlohmann::json& step) {
    if (!step.is_object()) {
        throw std::invalid_argument("script step must be an object: " + step.dump());
    }
    std::string op = required_string(step, "op");
    nlohmann::json result;
    result["op"] = op;

    if (op == "spawn") {
        std::string name = required_string(step, "name");
        auto spawned = Client::spawn(supervisor_, name);
        supervisor_.run_until_idle();
        result["name"] = name;
        result["success"] = spawned.has_value();
        if (spawned) {
            result["pid"] = spawned->pid();
            clients_.erase(name);
            clients_.emplace(name, *spawned);
        }
    } else if (op == "request") {
        auto& from = client(required_string(step, "as"));
        auto tag = parse_message_tag(step.value("tag", nlohmann::json()));
        if (!tag) {
            throw std::invalid_argument("unknown message tag in " + step.dump());
        }
        result["service"] = required_string(step, "service");
        result["tag"] = *tag;
        result["response"] = from.request(result["service"].get<std::string>(), *tag,
                                          step.value("body", nlohmann::json::object()));
    } else if (op == "lookup") {
        auto& from = client(required_string(step, "as"));
        auto slot = from.lookup(required_string(step, "service"));
        result["success"] = slot.has_value();
        if (slot) {
            result["slot"] = *slot;
        }
    } else if (op == "kill") {
        std::string name = required_string(step, "name");
        auto pid = supervisor_.pid_of(name);
        auto slot = pid ? supervisor_.init().process_slot(*pid) : std::nullopt;
        if (!slot) {
            throw std::invalid_argument("init holds no process capability for '" + name + "'");
        }
        auto killed = supervisor_.kill(*pid);
        result["name"] = name;
        result["success"] = killed.kind == kernel::ResultKind::OK;
        if (!killed.is_ok()) {
            result["error"] = kernel::kernel_error_to_string(killed.error);
        }
        supervisor_.run_until_idle();
    } else if (op == "exit") {
        auto& from = client(required_string(step, "as"));
        auto exited = from.sys().exit(step.value("code", int64_t{0}));
        result["success"] = exited.kind == kernel::ResultKind::OK;
        supervisor_.run_until_idle();
    } else if (op == "random") {
        auto& from = client(required_string(step, "as"));
        auto random = from.sys().random(step.value("count", size_t{16}));
        result["success"] = random.is_ok();
        result["hex"] = kernel::to_hex(random.bytes);
    } else if (op == "console") {
        auto& from = client(required_string(step, "as"));
        auto written = from.sys().console_write(required_string(step, "text"));
        result["success"] = written.is_ok();
    } else if (op == "run") {
        result["rounds"] = supervisor_.run_until_idle(step.value("rounds", size_t{1000}));
    } else if (op == "status") {
        result["status"] = supervisor_.status();
    } else {
        throw std::invalid_argument("unknown script op '" + op + "'");
    }

    spdlog::debug("script: {}", result.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    return result;
}

nlohmann::json ScriptRunner::demo_script() {
    return nlohmann::json::parse(R"({
        "steps": [
            {"op": "spawn", "name": "shell"},
            {"op": "request", "as": "shell", "service": "vfs", "tag": "vfs.mkdir", "body": {"path": "/docs"}},
            {"op": "request", "as": "shell", "service": "vfs", "tag": "vfs.write",
             "body": {"path": "/docs/hello.txt", "content": "hello from zero"}},
            {"op": "request", "as": "shell", "service": "vfs", "tag": "vfs.read", "body": {"path": "/docs/hello.txt"}},
            {"op": "request", "as": "shell", "service": "vfs", "tag": "vfs.readdir", "body": {"path": "/docs"}},
            {"op": "request", "as": "shell", "service": "identity", "tag": "identity.set_default_key_scheme",
             "body": {"user_id": "1000", "key_scheme": "PqHybrid"}},
            {"op": "request", "as": "shell", "service": "identity", "tag": "identity.get_preferences",
             "body": {"user_id": "1000"}},
            {"op": "request", "as": "shell", "service": "keystore", "tag": "keystore.write",
             "body": {"key": "/keys/1000/identity/public.key", "value_hex": "deadbeef"}},
            {"op": "request", "as": "shell", "service": "keystore", "tag": "keystore.list",
             "body": {"prefix": "/keys/1000/"}},
            {"op": "random", "as": "shell", "count": 16},
            {"op": "exit", "as": "shell", "code": 0},
            {"op": "status"}
        ]
    })");
}

} // namespace zero::supervisor
