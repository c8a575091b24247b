// =============================================================================
// ledger.cpp - Pass supply ledger
// =============================================================================

#include "podium/ledger.hpp"
#include "podium/error.hpp"

#include <mutex>

namespace podium {

PassStats PassLedger::get_or_create(const Address& target) {
    std::unique_lock lock(mutex_);
    return stats_.try_emplace(target).first->second;
}

std::optional<PassStats> PassLedger::get(const Address& target) const {
    std::shared_lock lock(mutex_);
    auto it = stats_.find(target);
    if (it == stats_.end()) return std::nullopt;
    return it->second;
}

Units PassLedger::total_supply(const Address& target) const {
    std::shared_lock lock(mutex_);
    auto it = stats_.find(target);
    return (it != stats_.end()) ? it->second.total_supply : 0;
}

bool PassLedger::contains(const Address& target) const {
    std::shared_lock lock(mutex_);
    return stats_.find(target) != stats_.end();
}

std::vector<Address> PassLedger::targets() const {
    std::shared_lock lock(mutex_);
    std::vector<Address> result;
    result.reserve(stats_.size());
    for (const auto& [target, stats] : stats_) {
        result.push_back(target);
    }
    return result;
}

void PassLedger::record_buy(const Address& target, Units amount, Amount price) {
    std::unique_lock lock(mutex_);
    PassStats& stats = stats_.try_emplace(target).first->second;

    if (amount > constants::MAX_SUPPLY || stats.total_supply > constants::MAX_SUPPLY - amount) {
        throw PodiumError(ErrorKind::INVALID_AMOUNT,
                          "supply " + std::to_string(stats.total_supply) + " + " +
                          std::to_string(amount) + " exceeds MAX_SUPPLY");
    }

    stats.total_supply += amount;
    stats.last_price = price;
}

void PassLedger::record_sell(const Address& target, Units amount, Amount price) {
    std::unique_lock lock(mutex_);
    PassStats& stats = stats_.try_emplace(target).first->second;

    if (amount > stats.total_supply) {
        throw PodiumError(ErrorKind::SUPPLY_UNDERFLOW,
                          "sell " + std::to_string(amount) + " exceeds supply " +
                          std::to_string(stats.total_supply));
    }

    stats.total_supply -= amount;
    stats.last_price = price;
}

void PassLedger::restore(const Address& target, const PassStats& stats) {
    std::unique_lock lock(mutex_);
    stats_[target] = stats;
}

} // namespace podium
