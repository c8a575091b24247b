// =============================================================================
// subscription.cpp - Tier table and subscriber state machine
// =============================================================================

#include "podium/subscription.hpp"
#include "podium/error.hpp"

namespace podium {

namespace {

PodiumError tier_not_found(uint32_t tier_id) {
    return PodiumError(ErrorKind::TIER_NOT_FOUND, "tier " + std::to_string(tier_id));
}

} // namespace

// =============================================================================
// Tiers
// =============================================================================

uint32_t SubscriptionBook::create_tier(const std::string& name, Amount price, DurationClass duration) {
    // Rejects anything outside WEEK/MONTH/YEAR
    duration_seconds(duration);

    if (price == 0) {
        throw PodiumError(ErrorKind::INVALID_AMOUNT, "tier price must be positive");
    }
    if (tier_names_.count(name) > 0) {
        throw PodiumError(ErrorKind::TIER_NAME_EXISTS, "tier name '" + name + "'");
    }

    uint32_t tier_id = static_cast<uint32_t>(tiers_.size());
    tiers_.push_back(SubscriptionTier{tier_id, name, price, duration});
    tier_names_.insert(name);
    return tier_id;
}

void SubscriptionBook::update_tier(uint32_t tier_id, Amount price, DurationClass duration) {
    duration_seconds(duration);

    if (!has_tier(tier_id)) throw tier_not_found(tier_id);
    if (price == 0) {
        throw PodiumError(ErrorKind::INVALID_AMOUNT, "tier price must be positive");
    }

    SubscriptionTier& t = tiers_[tier_id];
    t.price = price;
    t.duration = duration;
}

const SubscriptionTier& SubscriptionBook::tier(uint32_t tier_id) const {
    if (!has_tier(tier_id)) throw tier_not_found(tier_id);
    return tiers_[tier_id];
}

// =============================================================================
// Subscriptions
// =============================================================================

const Subscription& SubscriptionBook::subscribe(const Address& subscriber, uint32_t tier_id, uint64_t now) {
    const SubscriptionTier& t = tier(tier_id);

    if (subscriptions_.count(subscriber) > 0) {
        throw PodiumError(ErrorKind::ALREADY_SUBSCRIBED, to_hex(subscriber));
    }

    Subscription record{tier_id, now, now + duration_seconds(t.duration)};
    return subscriptions_.emplace(subscriber, record).first->second;
}

Subscription SubscriptionBook::cancel(const Address& subscriber) {
    auto it = subscriptions_.find(subscriber);
    if (it == subscriptions_.end()) {
        throw PodiumError(ErrorKind::SUBSCRIPTION_NOT_FOUND, to_hex(subscriber));
    }
    Subscription removed = it->second;
    subscriptions_.erase(it);
    return removed;
}

void SubscriptionBook::restore(const Address& subscriber, const std::optional<Subscription>& record) {
    if (record) {
        subscriptions_[subscriber] = *record;
    } else {
        subscriptions_.erase(subscriber);
    }
}

std::optional<Subscription> SubscriptionBook::find(const Address& subscriber) const {
    auto it = subscriptions_.find(subscriber);
    if (it == subscriptions_.end()) return std::nullopt;
    return it->second;
}

SubscriptionState SubscriptionBook::state(const Address& subscriber, uint64_t now) const {
    auto it = subscriptions_.find(subscriber);
    if (it == subscriptions_.end()) return SubscriptionState::NONE;
    return it->second.is_expired(now) ? SubscriptionState::EXPIRED : SubscriptionState::ACTIVE;
}

bool SubscriptionBook::is_active(const Address& subscriber, uint32_t tier_id, uint64_t now) const {
    auto it = subscriptions_.find(subscriber);
    if (it == subscriptions_.end()) return false;
    return it->second.tier_id == tier_id && now < it->second.end_time;
}

size_t SubscriptionBook::active_count(uint64_t now) const {
    size_t count = 0;
    for (const auto& [subscriber, record] : subscriptions_) {
        if (!record.is_expired(now)) ++count;
    }
    return count;
}

} // namespace podium
