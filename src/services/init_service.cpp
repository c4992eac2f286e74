#include "services/init_service.hpp"
#include "runtime/protocol.hpp"
#include <spdlog/spdlog.h>

namespace zero::services {

namespace msg = runtime::msg;
using kernel::KernelError;
using kernel::ResultKind;
using runtime::ReplyTarget;
using runtime::ServiceError;

nlohmann::json ServiceEntry::to_json() const {
    return {
        {"name", name},
        {"pid", owner_pid},
        {"slot", slot},
        {"ready", ready}
    };
}

const ServiceEntry* ServiceRegistry::find(const std::string& name) const {
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : &it->second;
}

void ServiceRegistry::put(const ServiceEntry& entry) {
    entries_[entry.name] = entry;
}

bool ServiceRegistry::erase(const std::string& name) {
    return entries_.erase(name) > 0;
}

std::optional<std::string> ServiceRegistry::mark_ready(ProcessId pid) {
    std::optional<std::string> first;
    for (auto& [name, entry] : entries_) {
        if (entry.owner_pid == pid) {
            entry.ready = true;
            if (!first) {
                first = name;
            }
        }
    }
    return first;
}

std::vector<std::string> ServiceRegistry::names() const {
    std::vector<std::string> out;
    for (const auto& [name, entry] : entries_) {
        out.push_back(name);
    }
    return out;
}

nlohmann::json ServiceRegistry::to_json() const {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& [name, entry] : entries_) {
        j.push_back(entry.to_json());
    }
    return j;
}

InitService::InitService(kernel::Kernel& kernel, ProcessId pid)
    : Service(kernel, pid, "init") {}

bool InitService::handles(uint32_t tag) const {
    return tag == msg::REGISTER_SERVICE || tag == msg::LOOKUP_SERVICE ||
           tag == msg::SPAWN_SERVICE || tag == msg::SERVICE_READY;
}

void InitService::dispatch_request(const kernel::ReceivedMessage& message) {
    switch (message.tag) {
        case msg::REGISTER_SERVICE: handle_register(message); break;
        case msg::LOOKUP_SERVICE:   handle_lookup(message); break;
        case msg::SPAWN_SERVICE:    handle_spawn(message); break;
        case msg::SERVICE_READY:    handle_ready(message); break;
        default: break;
    }
}

void InitService::handle_register(const kernel::ReceivedMessage& message) {
    // The transferred capability is the service inbox, so answer by REPLY
    ReplyTarget caller{message.from_pid, std::nullopt};

    auto body = runtime::decode_json(message.data);
    if (!body || !body->contains("name") || !(*body)["name"].is_string() ||
        (*body)["name"].get<std::string>().empty()) {
        if (!message.cap_slots.empty() && sys_.cap_delete(message.cap_slots.front()).kind == ResultKind::ERR) {
            spdlog::warn("[init] could not release slot {} from a bad registration", message.cap_slots.front());
        }
        respond_error(caller, msg::REGISTER_RESPONSE, ServiceError::INVALID_REQUEST, "missing service name");
        return;
    }
    std::string name = (*body)["name"].get<std::string>();

    if (message.cap_slots.empty()) {
        respond_error(caller, msg::REGISTER_RESPONSE, ServiceError::INVALID_REQUEST,
                      "registration must carry an endpoint capability");
        return;
    }
    CapSlot slot = message.cap_slots.front();

    if (const ServiceEntry* existing = registry_.find(name)) {
        if (existing->owner_pid != message.from_pid && owner_alive(existing->owner_pid)) {
            spdlog::warn("[init] PID {} tried to take '{}' from live PID {}", message.from_pid, name,
                         existing->owner_pid);
            auto released = sys_.cap_delete(slot);
            if (released.kind == ResultKind::ERR) {
                spdlog::warn("[init] could not release rejected slot {}", slot);
            }
            respond_error(caller, msg::REGISTER_RESPONSE, ServiceError::ALREADY_EXISTS,
                          "service '" + name + "' is registered");
            return;
        }
        auto released = sys_.cap_delete(existing->slot);
        if (released.kind == ResultKind::ERR) {
            spdlog::debug("[init] stale slot {} for '{}' already gone", existing->slot, name);
        }
        spdlog::info("[init] '{}' re-registered by PID {} (was PID {})", name, message.from_pid,
                     existing->owner_pid);
    } else {
        spdlog::info("[init] '{}' registered by PID {} (slot {})", name, message.from_pid, slot);
    }

    registry_.put(ServiceEntry{name, message.from_pid, slot, false});

    nlohmann::json response;
    response["name"] = name;
    respond(caller, msg::REGISTER_RESPONSE, runtime::ok_response(response));
}

void InitService::handle_lookup(const kernel::ReceivedMessage& message) {
    ReplyTarget target = reply_target(message);

    auto body = runtime::decode_json(message.data);
    if (!body || !body->contains("name") || !(*body)["name"].is_string()) {
        respond_error(target, msg::LOOKUP_RESPONSE, ServiceError::INVALID_REQUEST, "missing service name");
        return;
    }
    std::string name = (*body)["name"].get<std::string>();

    const ServiceEntry* entry = registry_.find(name);
    if (!entry) {
        spdlog::debug("[init] lookup '{}' from PID {}: not found", name, message.from_pid);
        respond_error(target, msg::LOOKUP_RESPONSE, ServiceError::NOT_FOUND, "no service '" + name + "'");
        return;
    }

    auto granted = sys_.cap_grant(entry->slot, message.from_pid, kernel::perm::SEND);
    if (granted.kind == ResultKind::ERR) {
        // A dead owner leaves a stale capability behind
        if (granted.error == KernelError::INVALID_CAPABILITY) {
            respond_error(target, msg::LOOKUP_RESPONSE, ServiceError::NOT_FOUND,
                          "service '" + name + "' is gone");
        } else {
            respond_error(target, msg::LOOKUP_RESPONSE, ServiceError::PERMISSION_DENIED,
                          kernel::kernel_error_to_string(granted.error));
        }
        return;
    }

    spdlog::debug("[init] lookup '{}' from PID {}: slot {}", name, message.from_pid, granted.value);

    nlohmann::json response;
    response["name"] = name;
    response["pid"] = entry->owner_pid;
    response["slot"] = granted.value;
    response["ready"] = entry->ready;
    respond(target, msg::LOOKUP_RESPONSE, runtime::ok_response(response));
}

void InitService::handle_spawn(const kernel::ReceivedMessage& message) {
    ReplyTarget target = reply_target(message);

    auto body = runtime::decode_json(message.data);
    if (!body || !body->contains("name") || !(*body)["name"].is_string() ||
        (*body)["name"].get<std::string>().empty()) {
        respond_error(target, msg::SPAWN_RESPONSE, ServiceError::INVALID_REQUEST, "missing service name");
        return;
    }
    std::string name = (*body)["name"].get<std::string>();

    spdlog::info("[init] spawn '{}' requested by PID {}", name, message.from_pid);
    auto pid = spawn(name);
    if (!pid) {
        respond_error(target, msg::SPAWN_RESPONSE, ServiceError::INVALID_REQUEST,
                      "could not spawn '" + name + "'");
        return;
    }

    nlohmann::json response;
    response["name"] = name;
    response["pid"] = *pid;
    respond(target, msg::SPAWN_RESPONSE, runtime::ok_response(response));
}

void InitService::handle_ready(const kernel::ReceivedMessage& message) {
    auto name = registry_.mark_ready(message.from_pid);
    if (name) {
        spdlog::info("[init] '{}' (PID {}) is ready", *name, message.from_pid);
    } else {
        spdlog::warn("[init] ready signal from unregistered PID {}", message.from_pid);
    }
}

std::optional<ProcessId> InitService::spawn(const std::string& name) {
    auto created = sys_.register_process(name);
    if (created.kind != ResultKind::OK) {
        spdlog::error("[init] REGISTER_PROCESS '{}' failed: {}", name, created.describe());
        return std::nullopt;
    }

    auto pid = static_cast<ProcessId>(created.value);
    children_[pid] = static_cast<CapSlot>(created.aux);
    wire_slots(pid, name);

    if (spawn_hook_) {
        spawn_hook_(pid, name);
    }
    return pid;
}

std::optional<CapSlot> InitService::process_slot(ProcessId pid) const {
    auto it = children_.find(pid);
    if (it == children_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InitService::wire_slots(ProcessId pid, const std::string& name) {
    using runtime::INBOX_SLOT;

    if (!grant_expected(INBOX_SLOT, pid, kernel::perm::SEND, runtime::INIT_SLOT)) {
        return;
    }

    const ServiceEntry* vfs = registry_.find("vfs");
    if (!vfs || !grant_expected(vfs->slot, pid, kernel::perm::SEND, runtime::VFS_SLOT)) {
        spdlog::debug("[init] '{}' (PID {}) wired without VFS", name, pid);
        return;
    }

    auto response = sys_.create_endpoint_for(pid);
    if (response.kind != ResultKind::OK || response.value != runtime::VFS_RESPONSE_SLOT) {
        spdlog::warn("[init] VFS response endpoint for PID {} failed: {}", pid, response.describe());
        return;
    }

    const ServiceEntry* keystore = registry_.find("keystore");
    if (!keystore || !grant_expected(keystore->slot, pid, kernel::perm::SEND, runtime::KEYSTORE_SLOT)) {
        spdlog::debug("[init] '{}' (PID {}) wired without keystore", name, pid);
        return;
    }
    spdlog::debug("[init] '{}' (PID {}) fully wired", name, pid);
}

bool InitService::grant_expected(CapSlot from, ProcessId pid, kernel::Permissions perms, CapSlot expected) {
    auto granted = sys_.grant_endpoint_to(from, pid, perms);
    if (granted.kind != ResultKind::OK) {
        spdlog::warn("[init] wiring slot {} for PID {} failed: {}", expected, pid, granted.describe());
        return false;
    }
    if (granted.value != expected) {
        spdlog::warn("[init] PID {} got slot {} where {} was expected", pid, granted.value, expected);
        return false;
    }
    return true;
}

bool InitService::owner_alive(ProcessId pid) {
    auto listing = sys_.ps();
    if (listing.kind != ResultKind::PROCESS_LIST) {
        return false;
    }
    for (const auto& info : listing.processes) {
        if (info.pid == pid) {
            return info.state != kernel::ProcessState::ZOMBIE;
        }
    }
    return false;
}

} // namespace zero::services
