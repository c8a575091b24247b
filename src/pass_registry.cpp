// =============================================================================
// pass_registry.cpp - Per-target pass capability handles
// =============================================================================

#include "podium/pass_registry.hpp"

#include <mutex>

namespace podium {

// =============================================================================
// PassRegistry
// =============================================================================

std::string PassRegistry::symbol_for(const Address& target) {
    return "PASS-" + to_hex(target).substr(2);
}

PassHandle PassRegistry::get_or_create(const Address& target) {
    {
        std::shared_lock lock(mutex_);
        auto it = handles_.find(target);
        if (it != handles_.end()) return it->second;
    }

    std::unique_lock lock(mutex_);
    return handles_.try_emplace(target, target, symbol_for(target), store_).first->second;
}

std::optional<PassHandle> PassRegistry::find(const Address& target) const {
    std::shared_lock lock(mutex_);
    auto it = handles_.find(target);
    if (it == handles_.end()) return std::nullopt;
    return it->second;
}

size_t PassRegistry::size() const {
    std::shared_lock lock(mutex_);
    return handles_.size();
}

} // namespace podium
