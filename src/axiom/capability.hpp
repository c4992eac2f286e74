/**
 * Axiom Capability Layer
 *
 * Capabilities, per-process capability spaces, the object generation
 * table and the single authority gate every syscall goes through.
 */
#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include "kernel/types.hpp"

namespace zero::axiom {

using kernel::CapSlot;
using kernel::KernelError;
using kernel::ObjectType;
using kernel::Permissions;

struct Capability {
    uint64_t id = 0;
    ObjectType object_type = ObjectType::ENDPOINT;
    uint64_t object_id = 0;
    Permissions permissions = 0;
    uint32_t generation = 0;
    uint64_t expires_at = 0;    // ns since boot, 0 = never

    bool has(Permissions required) const {
        return (permissions & required) == required;
    }
};

struct ObjectKey {
    ObjectType type;
    uint64_t id;

    bool operator<(const ObjectKey& other) const {
        if (type != other.type) return type < other.type;
        return id < other.id;
    }
};

// Live generation of every kernel object; objects never seen read as 0
class GenerationTable {
public:
    uint32_t current(ObjectType type, uint64_t id) const;
    uint32_t bump(ObjectType type, uint64_t id);

    const std::map<ObjectKey, uint32_t>& entries() const { return generations_; }

private:
    std::map<ObjectKey, uint32_t> generations_;
};

class CapabilitySpace {
public:
    explicit CapabilitySpace(size_t max_slots = kernel::DEFAULT_MAX_CAPS_PER_SPACE)
        : max_slots_(max_slots) {}

    // Returns the new slot, or nullopt when the space is full
    std::optional<CapSlot> insert(const Capability& cap);

    const Capability* get(CapSlot slot) const;
    bool remove(CapSlot slot);

    // Drops every capability; next_slot keeps counting
    void clear();

    size_t size() const { return slots_.size(); }
    bool full() const { return slots_.size() >= max_slots_; }
    CapSlot next_slot() const { return next_slot_; }
    const std::map<CapSlot, Capability>& slots() const { return slots_; }

private:
    std::map<CapSlot, Capability> slots_;
    CapSlot next_slot_ = 1;
    size_t max_slots_;
};

struct CheckResult {
    bool success = false;
    Capability cap;
    KernelError error = KernelError::INVALID_CAPABILITY;
};

/**
 * The one code path for authority verification.
 *
 * Order: slot lookup, object type, permissions, generation, expiry.
 */
class AxiomGate {
public:
    explicit AxiomGate(const GenerationTable& generations) : generations_(generations) {}

    CheckResult check(const CapabilitySpace& space, CapSlot slot,
                      ObjectType required_type, Permissions required,
                      uint64_t now) const;

    uint64_t check_count() const { return check_count_; }

private:
    const GenerationTable& generations_;
    mutable uint64_t check_count_ = 0;
};

} // namespace zero::axiom
