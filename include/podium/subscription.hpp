#ifndef PODIUM_SUBSCRIPTION_HPP
#define PODIUM_SUBSCRIPTION_HPP

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace podium {

// =============================================================================
// Subscription Types
// =============================================================================

struct SubscriptionTier {
    uint32_t tier_id;           // insertion index, stable
    std::string name;
    Amount price;
    DurationClass duration;
};

struct Subscription {
    uint32_t tier_id;
    uint64_t start_time;
    uint64_t end_time;          // start_time + duration_seconds(tier.duration)

    bool is_expired(uint64_t now) const { return now >= end_time; }
};

enum class SubscriptionState : uint8_t {
    NONE = 0,
    ACTIVE = 1,
    EXPIRED = 2     // record still present, end_time passed
};

// =============================================================================
// SubscriptionBook - one outpost's tiers and subscriber records
//
// Per subscriber: NONE -> ACTIVE -> (cancel -> NONE | time -> EXPIRED).
// An EXPIRED record still blocks subscribe() until it is cancelled.
// Not thread-safe; the owning outpost's entity lock serializes access.
// =============================================================================

class SubscriptionBook {
public:
    SubscriptionBook() = default;

    // Returns the new tier_id. Throws TierNameExists, InvalidAmount (zero price).
    uint32_t create_tier(const std::string& name, Amount price, DurationClass duration);

    // Throws TierNotFound, InvalidAmount
    void update_tier(uint32_t tier_id, Amount price, DurationClass duration);

    // Throws TierNotFound
    const SubscriptionTier& tier(uint32_t tier_id) const;
    bool has_tier(uint32_t tier_id) const { return tier_id < tiers_.size(); }
    uint32_t tier_count() const { return static_cast<uint32_t>(tiers_.size()); }
    const std::vector<SubscriptionTier>& tiers() const { return tiers_; }

    // Throws TierNotFound, AlreadySubscribed (even when the record expired)
    const Subscription& subscribe(const Address& subscriber, uint32_t tier_id, uint64_t now);

    // Removes the record. Throws SubscriptionNotFound.
    Subscription cancel(const Address& subscriber);

    // Puts a record back verbatim (used to undo cancel/subscribe)
    void restore(const Address& subscriber, const std::optional<Subscription>& record);

    std::optional<Subscription> find(const Address& subscriber) const;
    SubscriptionState state(const Address& subscriber, uint64_t now) const;

    // Record exists, tier matches, and now < end_time
    bool is_active(const Address& subscriber, uint32_t tier_id, uint64_t now) const;

    size_t subscriber_count() const { return subscriptions_.size(); }
    size_t active_count(uint64_t now) const;

private:
    std::vector<SubscriptionTier> tiers_;
    std::set<std::string> tier_names_;
    std::unordered_map<Address, Subscription, AddressHasher> subscriptions_;
};

} // namespace podium

#endif // PODIUM_SUBSCRIPTION_HPP
