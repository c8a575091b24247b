#ifndef PODIUM_PASS_REGISTRY_HPP
#define PODIUM_PASS_REGISTRY_HPP

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "types.hpp"
#include "ports.hpp"

namespace podium {

// =============================================================================
// PassHandle - mint/burn/transfer capability for one target's passes
// =============================================================================

class PassHandle {
public:
    PassHandle(const Address& target, std::string symbol, IFungibleStore& store)
        : target_(target), symbol_(std::move(symbol)), store_(&store) {}

    const Address& target() const { return target_; }
    const std::string& symbol() const { return symbol_; }

    void mint(const Address& to, Units amount) const { store_->mint(symbol_, to, amount); }
    void burn(const Address& from, Units amount) const { store_->burn(symbol_, from, amount); }
    void transfer(const Address& from, const Address& to, Units amount) const {
        store_->transfer(symbol_, from, to, amount);
    }
    Units balance(const Address& account) const { return store_->balance(symbol_, account); }

private:
    Address target_;
    std::string symbol_;
    IFungibleStore* store_;
};

// =============================================================================
// PassRegistry - target -> handle, created on first buy
// =============================================================================

class PassRegistry {
public:
    explicit PassRegistry(IFungibleStore& store) : store_(store) {}

    // Non-copyable
    PassRegistry(const PassRegistry&) = delete;
    PassRegistry& operator=(const PassRegistry&) = delete;

    PassHandle get_or_create(const Address& target);
    std::optional<PassHandle> find(const Address& target) const;
    size_t size() const;

    // "PASS-" + the 64 hex digits of the target
    static std::string symbol_for(const Address& target);

private:
    IFungibleStore& store_;
    std::unordered_map<Address, PassHandle, AddressHasher> handles_;
    mutable std::shared_mutex mutex_;
};

} // namespace podium

#endif // PODIUM_PASS_REGISTRY_HPP
