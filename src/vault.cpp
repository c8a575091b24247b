// =============================================================================
// vault.cpp - Redemption vault ledger
// =============================================================================

#include "podium/vault.hpp"
#include "podium/math.hpp"

#include <mutex>

namespace podium {

void RedemptionVault::deposit(Amount amount) {
    std::unique_lock lock(mutex_);
    Amount new_balance = math::checked_add(balance_, amount, "vault balance");
    balance_ = new_balance;
    // Lifetime counters saturate rather than fail a valid deposit
    total_deposited_ = (total_deposited_ > UINT64_MAX - amount) ? UINT64_MAX : total_deposited_ + amount;
    ++deposits_;
}

Amount RedemptionVault::withdraw(Amount amount) {
    // Hold the lock across check and update
    std::unique_lock lock(mutex_);
    if (amount > balance_) {
        throw PodiumError(ErrorKind::INSUFFICIENT_VAULT_BALANCE,
                          "withdraw " + std::to_string(amount) +
                          " exceeds vault balance " + std::to_string(balance_));
    }
    balance_ -= amount;
    total_withdrawn_ = (total_withdrawn_ > UINT64_MAX - amount) ? UINT64_MAX : total_withdrawn_ + amount;
    ++withdrawals_;
    return amount;
}

Amount RedemptionVault::balance() const {
    std::shared_lock lock(mutex_);
    return balance_;
}

RedemptionVault::Stats RedemptionVault::get_stats() const {
    std::shared_lock lock(mutex_);
    return Stats{balance_, total_deposited_, total_withdrawn_, deposits_, withdrawals_};
}

} // namespace podium
