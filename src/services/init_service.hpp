/**
 * Init Service (PID 1)
 *
 * Owns the service registry and the spawn protocol. Services register
 * their inbox by transferring a capability to it; clients look names up
 * and receive a Send capability of their own. Processes spawned through
 * init get the standard slot layout:
 *   1 inbox, 2 init, 3 VFS, 4 VFS response endpoint, 5 keystore
 * Wiring stops at the first service that is not registered, so a slot
 * number never refers to the wrong service.
 */
#pragma once
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "runtime/service.hpp"

namespace zero::services {

using kernel::CapSlot;
using kernel::ProcessId;

struct ServiceEntry {
    std::string name;
    ProcessId owner_pid = 0;
    CapSlot slot = 0;           // init's capability on the service inbox
    bool ready = false;

    nlohmann::json to_json() const;
};

class ServiceRegistry {
public:
    const ServiceEntry* find(const std::string& name) const;

    // Inserts or replaces the entry for entry.name
    void put(const ServiceEntry& entry);
    bool erase(const std::string& name);

    // Marks every entry owned by pid ready; returns the first such name
    std::optional<std::string> mark_ready(ProcessId pid);

    std::vector<std::string> names() const;
    size_t size() const { return entries_.size(); }
    nlohmann::json to_json() const;

private:
    std::map<std::string, ServiceEntry> entries_;
};

class InitService : public runtime::Service {
public:
    // Called once a spawned process is wired, so its program can be attached
    using SpawnHook = std::function<void(ProcessId pid, const std::string& name)>;

    explicit InitService(kernel::Kernel& kernel, ProcessId pid = kernel::INIT_PID);

    void set_spawn_hook(SpawnHook hook) { spawn_hook_ = std::move(hook); }

    // REGISTER_PROCESS plus slot wiring; nullopt when the kernel refuses
    std::optional<ProcessId> spawn(const std::string& name);

    // Init's Process capability on a child it spawned
    std::optional<CapSlot> process_slot(ProcessId pid) const;

    const ServiceRegistry& registry() const { return registry_; }

protected:
    bool handles(uint32_t tag) const override;
    void dispatch_request(const kernel::ReceivedMessage& message) override;

private:
    void handle_register(const kernel::ReceivedMessage& message);
    void handle_lookup(const kernel::ReceivedMessage& message);
    void handle_spawn(const kernel::ReceivedMessage& message);
    void handle_ready(const kernel::ReceivedMessage& message);

    void wire_slots(ProcessId pid, const std::string& name);
    bool grant_expected(CapSlot from, ProcessId pid, kernel::Permissions perms, CapSlot expected);
    bool owner_alive(ProcessId pid);

    ServiceRegistry registry_;
    std::map<ProcessId, CapSlot> children_;
    SpawnHook spawn_hook_;
};

} // namespace zero::services
