#ifndef PODIUM_PROTOCOL_HPP
#define PODIUM_PROTOCOL_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "types.hpp"
#include "config.hpp"
#include "curve.hpp"
#include "fees.hpp"
#include "vault.hpp"
#include "ledger.hpp"
#include "ports.hpp"
#include "pass_registry.hpp"
#include "events.hpp"
#include "outpost.hpp"
#include "subscription.hpp"

namespace podium {

// =============================================================================
// EntityLocks - one mutex per target / outpost address
// =============================================================================

class EntityLocks {
public:
    EntityLocks() = default;

    // Non-copyable
    EntityLocks(const EntityLocks&) = delete;
    EntityLocks& operator=(const EntityLocks&) = delete;

    // Creates the lock on first use. Stable for the lifetime of this object.
    std::mutex& for_entity(const Address& id);

    // Existing lock or nullptr; never inserts
    std::mutex* find(const Address& id) const;

    size_t size() const;

private:
    std::unordered_map<Address, std::unique_ptr<std::mutex>, AddressHasher> locks_;
    mutable std::shared_mutex mutex_;
};

// Result of a committed buy
struct BuyResult {
    BuySplit split;
    Amount total_paid;
    Units new_supply;
};

// Result of a committed sell
struct SellResult {
    SellSplit split;
    Units new_supply;
};

// =============================================================================
// Protocol - the injected context every call runs against
//
// Owns the config, redemption vault, pass ledger, pass registry and outposts.
// Coins, pass balances, time and event delivery come from the host.
//
// Each mutating call:
//   1. snapshots the config
//   2. holds the entity lock of its target or outpost while it mutates
//   3. runs inside a Transaction, so it commits fully or throws with no effect
//   4. publishes its events after the lock is released, so a sink may call
//      back into the protocol
// =============================================================================

class Protocol {
public:
    // Throws PodiumError(InvalidFeeValue / InvalidWeight) on a bad config
    Protocol(ProtocolConfig config, ICoinBank& bank, IFungibleStore& passes,
             IClock& clock, EventSink& events);
    ~Protocol() = default;

    // Non-copyable
    Protocol(const Protocol&) = delete;
    Protocol& operator=(const Protocol&) = delete;

    // =========================================================================
    // Pass Trading
    // =========================================================================

    // Buyer pays curve price + fees. Throws InvalidAmount, EmergencyPause,
    // InsufficientCallerBalance, ArithmeticOverflow.
    BuyResult buy_pass(const Address& buyer, const Address& target, Units amount,
                       const std::optional<Address>& referrer = std::nullopt);

    // Seller receives curve price - fees from the vault. Throws InvalidAmount,
    // EmergencyPause, SupplyUnderflow, InsufficientCallerBalance.
    SellResult sell_pass(const Address& seller, const Address& target, Units amount);

    // =========================================================================
    // Quotes & Views
    // =========================================================================

    Amount calculate_buy_price(const Address& target, Units amount) const;

    // Throws SupplyUnderflow when amount exceeds the outstanding supply
    Amount calculate_sell_price(const Address& target, Units amount) const;

    BuySplit quote_buy(const Address& target, Units amount, bool has_referrer) const;
    SellSplit quote_sell(const Address& target, Units amount) const;

    PassStats get_pass_stats(const Address& target) const;
    Units total_supply(const Address& target) const;
    Units pass_balance(const Address& account, const Address& target) const;
    Amount vault_balance() const;
    RedemptionVault::Stats vault_stats() const;
    ProtocolConfig config() const;

    // Outpost owner for an outpost target, the target itself otherwise
    Address pass_subject(const Address& target) const;

    // Targets and outposts that have an entity lock. Views and rejected
    // calls never add one.
    size_t entity_lock_count() const;

    // =========================================================================
    // Outposts
    // =========================================================================

    // Charges outpost_purchase_price to the treasury. Returns the new address.
    Address create_outpost(const Address& creator, const std::string& name,
                           const std::string& description, const std::string& uri);

    void update_outpost_price(const Address& caller, const Address& outpost, Amount price);
    bool toggle_pause(const Address& caller, const Address& outpost);
    void transfer_outpost_ownership(const Address& caller, const Address& outpost,
                                    const Address& new_owner);
    void set_royalty(const Address& caller, const Address& outpost, uint64_t numerator);

    std::optional<OutpostInfo> get_outpost(const Address& outpost) const;
    std::vector<OutpostInfo> list_outposts() const;
    std::vector<OutpostInfo> outposts_owned_by(const Address& owner) const;

    // =========================================================================
    // Subscriptions
    // =========================================================================

    uint32_t create_tier(const Address& caller, const Address& outpost, const std::string& name,
                         Amount price, DurationClass duration);
    void update_tier(const Address& caller, const Address& outpost, uint32_t tier_id,
                     Amount price, DurationClass duration);

    Subscription subscribe(const Address& subscriber, const Address& outpost, uint32_t tier_id,
                           const std::optional<Address>& referrer = std::nullopt);
    void cancel_subscription(const Address& subscriber, const Address& outpost);

    bool is_active(const Address& subscriber, const Address& outpost, uint32_t tier_id) const;
    std::optional<Subscription> get_subscription(const Address& subscriber,
                                                 const Address& outpost) const;
    SubscriptionTier get_tier(const Address& outpost, uint32_t tier_id) const;
    uint32_t tier_count(const Address& outpost) const;
    std::vector<SubscriptionTier> list_tiers(const Address& outpost) const;

    // =========================================================================
    // Admin
    // =========================================================================

    void update_fee_config(const Address& caller, uint32_t protocol_bps, uint32_t subject_bps,
                           uint32_t referral_bps);
    void update_subscription_fee_config(const Address& caller, uint32_t protocol_bps,
                                        uint32_t referrer_bps);
    void update_curve_weights(const Address& caller, uint64_t a, uint64_t b, uint64_t c);
    void update_treasury(const Address& caller, const Address& treasury);
    void update_outpost_purchase_price(const Address& caller, Amount price);
    void transfer_admin(const Address& caller, const Address& new_admin);

    // Admin override of an outpost's pause flag
    void emergency_pause(const Address& caller, const Address& outpost, bool paused);

private:
    ProtocolConfig snapshot() const;
    void require_admin(const Address& caller) const;

    // Outpost owner when `target` is an outpost; caller holds the target lock
    Address subject_of(const Address& target) const;
    void require_target_not_paused(const Address& target) const;

    // Lock of an existing outpost; throws OutpostNotFound without creating one
    std::mutex& outpost_lock(const Address& outpost) const;

    ProtocolConfig config_;
    mutable std::shared_mutex config_mutex_;

    ICoinBank& bank_;
    IClock& clock_;
    EventSink& events_;

    RedemptionVault vault_;
    PassLedger ledger_;
    PassRegistry registry_;
    OutpostRegistry outposts_;
    mutable EntityLocks locks_;
};

} // namespace podium

#endif // PODIUM_PROTOCOL_HPP
