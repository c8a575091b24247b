#ifndef PODIUM_LEDGER_HPP
#define PODIUM_LEDGER_HPP

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace podium {

// =============================================================================
// Pass Stats (one per target)
// =============================================================================

struct PassStats {
    Units total_supply = 0;
    Amount last_price = constants::INITIAL_PRICE;
};

// =============================================================================
// PassLedger - per-target supply and last traded price
// =============================================================================

class PassLedger {
public:
    PassLedger() = default;

    // Non-copyable
    PassLedger(const PassLedger&) = delete;
    PassLedger& operator=(const PassLedger&) = delete;

    // Returns the entry, creating (supply 0, INITIAL_PRICE) on first touch
    PassStats get_or_create(const Address& target);

    std::optional<PassStats> get(const Address& target) const;
    Units total_supply(const Address& target) const;
    bool contains(const Address& target) const;
    std::vector<Address> targets() const;

    // supply += amount; throws InvalidAmount past MAX_SUPPLY
    void record_buy(const Address& target, Units amount, Amount price);

    // Throws SupplyUnderflow when amount > supply
    void record_sell(const Address& target, Units amount, Amount price);

    // Writes an entry back verbatim (used to undo a record_* call)
    void restore(const Address& target, const PassStats& stats);

private:
    std::unordered_map<Address, PassStats, AddressHasher> stats_;
    mutable std::shared_mutex mutex_;
};

} // namespace podium

#endif // PODIUM_LEDGER_HPP
