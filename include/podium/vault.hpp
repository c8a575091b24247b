#ifndef PODIUM_VAULT_HPP
#define PODIUM_VAULT_HPP

#include <cstdint>
#include <shared_mutex>

#include "types.hpp"

namespace podium {

// =============================================================================
// RedemptionVault - pooled base prices backing sell-side payouts
//
// Every buy deposits exactly its curve price and every sell withdraws exactly
// its curve price, so the balance equals the summed curve prices of all
// outstanding passes. Fee portions never pass through here.
// =============================================================================

class RedemptionVault {
public:
    RedemptionVault() = default;
    ~RedemptionVault() = default;

    // Non-copyable
    RedemptionVault(const RedemptionVault&) = delete;
    RedemptionVault& operator=(const RedemptionVault&) = delete;

    // Throws ArithmeticOverflow past 64 bits
    void deposit(Amount amount);

    // All or nothing: throws InsufficientVaultBalance when amount > balance.
    // Returns the amount released for disbursement.
    Amount withdraw(Amount amount);

    Amount balance() const;

    struct Stats {
        Amount balance;
        Amount total_deposited;
        Amount total_withdrawn;
        uint64_t deposits;
        uint64_t withdrawals;
    };
    Stats get_stats() const;

private:
    Amount balance_{0};
    Amount total_deposited_{0};
    Amount total_withdrawn_{0};
    uint64_t deposits_{0};
    uint64_t withdrawals_{0};
    mutable std::shared_mutex mutex_;
};

} // namespace podium

#endif // PODIUM_VAULT_HPP
