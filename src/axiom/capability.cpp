#include "axiom/capability.hpp"
#include <spdlog/spdlog.h>

namespace zero::axiom {

uint32_t GenerationTable::current(ObjectType type, uint64_t id) const {
    auto it = generations_.find(ObjectKey{type, id});
    return it == generations_.end() ? 0 : it->second;
}

uint32_t GenerationTable::bump(ObjectType type, uint64_t id) {
    return ++generations_[ObjectKey{type, id}];
}

std::optional<CapSlot> CapabilitySpace::insert(const Capability& cap) {
    if (full()) {
        return std::nullopt;
    }
    CapSlot slot = next_slot_++;
    slots_.emplace(slot, cap);
    return slot;
}

const Capability* CapabilitySpace::get(CapSlot slot) const {
    auto it = slots_.find(slot);
    return it == slots_.end() ? nullptr : &it->second;
}

bool CapabilitySpace::remove(CapSlot slot) {
    return slots_.erase(slot) > 0;
}

void CapabilitySpace::clear() {
    slots_.clear();
}

CheckResult AxiomGate::check(const CapabilitySpace& space, CapSlot slot,
                             ObjectType required_type, Permissions required,
                             uint64_t now) const {
    ++check_count_;
    CheckResult result;

    const Capability* cap = space.get(slot);
    if (!cap) {
        result.error = KernelError::INVALID_CAPABILITY;
        return result;
    }

    if (cap->object_type != required_type) {
        spdlog::debug("axiom: slot {} holds {} but {} required", slot,
                      kernel::object_type_to_string(cap->object_type),
                      kernel::object_type_to_string(required_type));
        result.error = KernelError::INVALID_CAPABILITY;
        return result;
    }

    if (!cap->has(required)) {
        result.error = KernelError::PERMISSION_DENIED;
        return result;
    }

    uint32_t live = generations_.current(cap->object_type, cap->object_id);
    if (cap->generation != live) {
        spdlog::debug("axiom: slot {} is stale (gen {} != {})", slot, cap->generation, live);
        result.error = KernelError::INVALID_CAPABILITY;
        return result;
    }

    if (cap->expires_at != 0 && now > cap->expires_at) {
        result.error = KernelError::INVALID_CAPABILITY;
        return result;
    }

    result.success = true;
    result.cap = *cap;
    return result;
}

} // namespace zero::axiom
