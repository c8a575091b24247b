// =============================================================================
// memory.cpp - In-memory coin bank and pass store
// =============================================================================

#include "podium/memory.hpp"
#include "podium/error.hpp"
#include "podium/math.hpp"

#include <mutex>
#include <stdexcept>

namespace podium {

// =============================================================================
// MemoryCoinBank
// =============================================================================

bool MemoryCoinBank::is_registered(const Address& account) const {
    std::shared_lock lock(mutex_);
    return registered_.count(account) > 0;
}

void MemoryCoinBank::register_account(const Address& account) {
    std::unique_lock lock(mutex_);
    registered_.insert(account);
}

Amount MemoryCoinBank::balance(const Address& account) const {
    std::shared_lock lock(mutex_);
    auto it = balances_.find(account);
    return (it != balances_.end()) ? it->second : 0;
}

void MemoryCoinBank::transfer(const Address& from, const Address& to, Amount amount) {
    std::unique_lock lock(mutex_);

    if (registered_.count(to) == 0) {
        throw std::invalid_argument("recipient not registered: " + to_hex(to));
    }

    Amount& from_balance = balances_[from];
    if (from_balance < amount) {
        throw PodiumError(ErrorKind::INSUFFICIENT_CALLER_BALANCE,
                          to_hex(from) + " holds " + std::to_string(from_balance) +
                          ", needs " + std::to_string(amount));
    }

    Amount& to_balance = balances_[to];
    if (from != to) {
        Amount credited = math::checked_add(to_balance, amount, "coin balance");
        from_balance -= amount;
        to_balance = credited;
    }
}

void MemoryCoinBank::mint(const Address& to, Amount amount) {
    std::unique_lock lock(mutex_);
    registered_.insert(to);
    Amount& bal = balances_[to];
    bal = math::checked_add(bal, amount, "coin balance");
}

Amount MemoryCoinBank::total_supply() const {
    std::shared_lock lock(mutex_);
    U128 total = 0;
    for (const auto& [account, bal] : balances_) {
        total += bal;
    }
    return math::narrow(total, "coin supply");
}

// =============================================================================
// MemoryPassStore
// =============================================================================

void MemoryPassStore::mint(const std::string& symbol, const Address& to, Units amount) {
    std::unique_lock lock(mutex_);
    Units& bal = balances_[symbol][to];
    bal = math::checked_add(bal, amount, "pass balance");
}

void MemoryPassStore::burn(const std::string& symbol, const Address& from, Units amount) {
    std::unique_lock lock(mutex_);
    Units& bal = balances_[symbol][from];
    if (bal < amount) {
        throw PodiumError(ErrorKind::INSUFFICIENT_CALLER_BALANCE,
                          to_hex(from) + " holds " + std::to_string(bal) + " " + symbol +
                          ", burning " + std::to_string(amount));
    }
    bal -= amount;
}

void MemoryPassStore::transfer(const std::string& symbol, const Address& from,
                               const Address& to, Units amount) {
    std::unique_lock lock(mutex_);
    auto& holders = balances_[symbol];
    Units& from_bal = holders[from];
    if (from_bal < amount) {
        throw PodiumError(ErrorKind::INSUFFICIENT_CALLER_BALANCE,
                          to_hex(from) + " holds " + std::to_string(from_bal) + " " + symbol +
                          ", sending " + std::to_string(amount));
    }
    if (from == to) return;
    Units& to_bal = holders[to];
    Units credited = math::checked_add(to_bal, amount, "pass balance");
    from_bal -= amount;
    to_bal = credited;
}

Units MemoryPassStore::balance(const std::string& symbol, const Address& account) const {
    std::shared_lock lock(mutex_);
    auto sym = balances_.find(symbol);
    if (sym == balances_.end()) return 0;
    auto it = sym->second.find(account);
    return (it != sym->second.end()) ? it->second : 0;
}

Units MemoryPassStore::circulating(const std::string& symbol) const {
    std::shared_lock lock(mutex_);
    auto sym = balances_.find(symbol);
    if (sym == balances_.end()) return 0;
    Units total = 0;
    for (const auto& [holder, bal] : sym->second) {
        total += bal;
    }
    return total;
}

} // namespace podium
