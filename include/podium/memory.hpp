#ifndef PODIUM_MEMORY_HPP
#define PODIUM_MEMORY_HPP

#include <atomic>
#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "types.hpp"
#include "ports.hpp"

namespace podium {

// =============================================================================
// In-memory collaborators for embedding and tests
// =============================================================================

class MemoryCoinBank : public ICoinBank {
public:
    MemoryCoinBank() = default;

    bool is_registered(const Address& account) const override;
    void register_account(const Address& account) override;
    Amount balance(const Address& account) const override;
    void transfer(const Address& from, const Address& to, Amount amount) override;

    // Credits new coins, registering the account if needed
    void mint(const Address& to, Amount amount);

    // Sum of all balances; constant across transfers
    Amount total_supply() const;

private:
    std::unordered_set<Address, AddressHasher> registered_;
    std::unordered_map<Address, Amount, AddressHasher> balances_;
    mutable std::shared_mutex mutex_;
};

class MemoryPassStore : public IFungibleStore {
public:
    MemoryPassStore() = default;

    void mint(const std::string& symbol, const Address& to, Units amount) override;
    void burn(const std::string& symbol, const Address& from, Units amount) override;
    void transfer(const std::string& symbol, const Address& from,
                  const Address& to, Units amount) override;
    Units balance(const std::string& symbol, const Address& account) const override;

    Units circulating(const std::string& symbol) const;

private:
    // symbol -> holder -> units
    std::map<std::string, std::unordered_map<Address, Units, AddressHasher>> balances_;
    mutable std::shared_mutex mutex_;
};

// Test clock, starts at `start` and only moves when told to
class ManualClock : public IClock {
public:
    explicit ManualClock(uint64_t start = 1700000000) : now_(start) {}

    uint64_t now() const override { return now_.load(); }
    void set(uint64_t t) { now_.store(t); }
    void advance(uint64_t seconds) { now_.fetch_add(seconds); }

private:
    std::atomic<uint64_t> now_;
};

} // namespace podium

#endif // PODIUM_MEMORY_HPP
