// =============================================================================
// protocol.cpp - Pass trading, outposts, subscriptions and admin
// =============================================================================

#include "podium/protocol.hpp"
#include "podium/error.hpp"
#include "podium/logging.hpp"
#include "podium/transaction.hpp"

#include <utility>

namespace podium {

using namespace observability;

namespace {

// Logs a rejected call with its error kind, then lets the error through
template <typename Fn>
auto logged(const char* operation, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const PodiumError& e) {
        PODIUM_LOG_WARN("operation rejected",
                        {string_field("op", operation),
                         string_field("kind", to_string(e.kind())),
                         string_field("detail", e.what())});
        throw;
    }
}

void require_positive(Units amount) {
    if (amount == 0) {
        throw PodiumError(ErrorKind::INVALID_AMOUNT, "amount must be positive");
    }
}

void require_supply_cap(Units supply, Units amount) {
    if (amount > constants::MAX_SUPPLY || supply > constants::MAX_SUPPLY - amount) {
        throw PodiumError(ErrorKind::INVALID_AMOUNT,
                          "supply " + std::to_string(supply) + " + " + std::to_string(amount) +
                          " exceeds MAX_SUPPLY");
    }
}

void require_supply(Units supply, Units amount) {
    if (amount > supply) {
        throw PodiumError(ErrorKind::SUPPLY_UNDERFLOW,
                          "sell " + std::to_string(amount) + " exceeds supply " +
                          std::to_string(supply));
    }
}

void require_funds(const ICoinBank& bank, const Address& account, Amount needed) {
    Amount available = bank.balance(account);
    if (available < needed) {
        throw PodiumError(ErrorKind::INSUFFICIENT_CALLER_BALANCE,
                          to_hex(account) + " holds " + std::to_string(available) +
                          ", needs " + std::to_string(needed));
    }
}

// Pays and registers the reverse transfer with the journal
void pay_journaled(Transaction& tx, ICoinBank& bank, const Address& from, const Address& to,
                   Amount amount) {
    if (amount == 0 || from == to) return;
    pay(bank, from, to, amount);
    tx.on_rollback([&bank, from, to, amount] { bank.transfer(to, from, amount); });
}

FeeUpdated fee_change(const char* parameter, uint64_t old_value, uint64_t new_value) {
    return FeeUpdated{parameter, old_value, new_value, ZERO_ADDRESS, ZERO_ADDRESS};
}

} // namespace

// =============================================================================
// EntityLocks
// =============================================================================

std::mutex& EntityLocks::for_entity(const Address& id) {
    if (std::mutex* existing = find(id)) return *existing;

    std::unique_lock lock(mutex_);
    auto& slot = locks_[id];
    if (!slot) slot = std::make_unique<std::mutex>();
    return *slot;
}

std::mutex* EntityLocks::find(const Address& id) const {
    std::shared_lock lock(mutex_);
    auto it = locks_.find(id);
    return it != locks_.end() ? it->second.get() : nullptr;
}

size_t EntityLocks::size() const {
    std::shared_lock lock(mutex_);
    return locks_.size();
}

// =============================================================================
// Construction & Config
// =============================================================================

Protocol::Protocol(ProtocolConfig config, ICoinBank& bank, IFungibleStore& passes,
                   IClock& clock, EventSink& events)
    : config_(std::move(config))
    , bank_(bank)
    , clock_(clock)
    , events_(events)
    , registry_(passes) {
    config_.validate();
    if (!bank_.is_registered(config_.vault_account)) {
        bank_.register_account(config_.vault_account);
    }
    PODIUM_LOG_INFO("protocol initialized",
                    {address_field("admin", config_.admin),
                     address_field("treasury", config_.treasury),
                     uint_field("protocol_fee_bps", config_.fees.protocol_fee_bps),
                     uint_field("subject_fee_bps", config_.fees.subject_fee_bps),
                     uint_field("referral_fee_bps", config_.fees.referral_fee_bps)});
}

ProtocolConfig Protocol::snapshot() const {
    std::shared_lock lock(config_mutex_);
    return config_;
}

ProtocolConfig Protocol::config() const {
    return snapshot();
}

void Protocol::require_admin(const Address& caller) const {
    // Caller holds config_mutex_
    if (caller != config_.admin) {
        throw PodiumError(ErrorKind::NOT_ADMIN, to_hex(caller));
    }
}

Address Protocol::subject_of(const Address& target) const {
    if (outposts_.exists(target)) return outposts_.get(target).owner;
    return target;
}

void Protocol::require_target_not_paused(const Address& target) const {
    if (outposts_.exists(target)) {
        OutpostRegistry::require_not_paused(outposts_.get(target));
    }
}

std::mutex& Protocol::outpost_lock(const Address& outpost) const {
    // Every outpost got its lock when it was created
    std::mutex* lock = outposts_.exists(outpost) ? locks_.find(outpost) : nullptr;
    if (lock == nullptr) {
        throw PodiumError(ErrorKind::OUTPOST_NOT_FOUND, to_hex(outpost));
    }
    return *lock;
}

Address Protocol::pass_subject(const Address& target) const {
    // No lock means the target was never traded and is not an outpost
    std::mutex* entity = locks_.find(target);
    if (entity == nullptr) return target;

    std::lock_guard lock(*entity);
    return subject_of(target);
}

size_t Protocol::entity_lock_count() const {
    return locks_.size();
}

// =============================================================================
// Pass Trading
// =============================================================================

BuyResult Protocol::buy_pass(const Address& buyer, const Address& target, Units amount,
                             const std::optional<Address>& referrer) {
    return logged("buy_pass", [&] {
        require_positive(amount);

        const ProtocolConfig cfg = snapshot();
        BondingCurve curve(cfg.weights);
        FeeSplitter fees(cfg);

        // Reject what already fails at the current supply before a lock exists for the target
        const Units seen = ledger_.total_supply(target);
        require_supply_cap(seen, amount);
        require_funds(bank_, buyer,
                      fees.split_buy(curve.buy_price(seen, amount), referrer.has_value()).total());

        std::vector<Event> committed;
        BuyResult result{};
        {
            std::lock_guard lock(locks_.for_entity(target));
            require_target_not_paused(target);

            const PassStats before = ledger_.get_or_create(target);
            require_supply_cap(before.total_supply, amount);

            Amount price = curve.buy_price(before.total_supply, amount);
            BuySplit split = fees.split_buy(price, referrer.has_value());
            Amount total = split.total();
            require_funds(bank_, buyer, total);

            Address subject = subject_of(target);
            PassHandle passes = registry_.get_or_create(target);

            Transaction tx;

            pay_journaled(tx, bank_, buyer, cfg.vault_account, split.base);
            vault_.deposit(split.base);
            tx.on_rollback([this, base = split.base] { vault_.withdraw(base); });

            pay_journaled(tx, bank_, buyer, cfg.treasury, split.protocol_fee);
            pay_journaled(tx, bank_, buyer, subject, split.subject_fee);
            if (referrer) {
                pay_journaled(tx, bank_, buyer, *referrer, split.referral_fee);
            }

            passes.mint(buyer, amount);
            tx.on_rollback([passes, buyer, amount] { passes.burn(buyer, amount); });

            ledger_.record_buy(target, amount, price);
            tx.on_rollback([this, target, before] { ledger_.restore(target, before); });

            Units new_supply = before.total_supply + amount;
            tx.emit(PassPurchased{buyer, target, amount, price, split.protocol_fee,
                                  split.subject_fee, split.referral_fee, referrer, new_supply});
            committed = tx.commit();

            PODIUM_LOG_INFO("pass bought",
                            {address_field("buyer", buyer), address_field("target", target),
                             uint_field("amount", amount), uint_field("price", price),
                             uint_field("total_paid", total), uint_field("supply", new_supply)});
            result = BuyResult{split, total, new_supply};
        }

        publish_all(events_, committed);
        return result;
    });
}

SellResult Protocol::sell_pass(const Address& seller, const Address& target, Units amount) {
    return logged("sell_pass", [&] {
        require_positive(amount);

        const ProtocolConfig cfg = snapshot();
        require_supply(ledger_.total_supply(target), amount);

        std::vector<Event> committed;
        SellResult result{};
        {
            std::lock_guard lock(locks_.for_entity(target));
            require_target_not_paused(target);

            const PassStats before = ledger_.get_or_create(target);
            require_supply(before.total_supply, amount);

            PassHandle passes = registry_.get_or_create(target);
            Units held = passes.balance(seller);
            if (held < amount) {
                throw PodiumError(ErrorKind::INSUFFICIENT_CALLER_BALANCE,
                                  to_hex(seller) + " holds " + std::to_string(held) + " passes");
            }

            BondingCurve curve(cfg.weights);
            Amount price = curve.sell_price(before.total_supply, amount);
            SellSplit split = FeeSplitter(cfg).split_sell(price);
            Address subject = subject_of(target);

            Transaction tx;

            vault_.withdraw(price);
            tx.on_rollback([this, price] { vault_.deposit(price); });

            pay_journaled(tx, bank_, cfg.vault_account, cfg.treasury, split.protocol_fee);
            pay_journaled(tx, bank_, cfg.vault_account, subject, split.subject_fee);
            pay_journaled(tx, bank_, cfg.vault_account, seller, split.net_to_seller);

            passes.burn(seller, amount);
            tx.on_rollback([passes, seller, amount] { passes.mint(seller, amount); });

            ledger_.record_sell(target, amount, price);
            tx.on_rollback([this, target, before] { ledger_.restore(target, before); });

            Units new_supply = before.total_supply - amount;
            tx.emit(PassSold{seller, target, amount, price, split.protocol_fee, split.subject_fee,
                             split.net_to_seller, new_supply});
            committed = tx.commit();

            PODIUM_LOG_INFO("pass sold",
                            {address_field("seller", seller), address_field("target", target),
                             uint_field("amount", amount), uint_field("price", price),
                             uint_field("net", split.net_to_seller),
                             uint_field("supply", new_supply)});
            result = SellResult{split, new_supply};
        }

        publish_all(events_, committed);
        return result;
    });
}

// =============================================================================
// Quotes & Views
// =============================================================================

Amount Protocol::calculate_buy_price(const Address& target, Units amount) const {
    BondingCurve curve(snapshot().weights);
    return curve.buy_price(ledger_.total_supply(target), amount);
}

Amount Protocol::calculate_sell_price(const Address& target, Units amount) const {
    Units supply = ledger_.total_supply(target);
    require_supply(supply, amount);
    BondingCurve curve(snapshot().weights);
    return curve.sell_price(supply, amount);
}

BuySplit Protocol::quote_buy(const Address& target, Units amount, bool has_referrer) const {
    const ProtocolConfig cfg = snapshot();
    Amount price = BondingCurve(cfg.weights).buy_price(ledger_.total_supply(target), amount);
    return FeeSplitter(cfg).split_buy(price, has_referrer);
}

SellSplit Protocol::quote_sell(const Address& target, Units amount) const {
    const ProtocolConfig cfg = snapshot();
    Amount price = calculate_sell_price(target, amount);
    return FeeSplitter(cfg).split_sell(price);
}

PassStats Protocol::get_pass_stats(const Address& target) const {
    return ledger_.get(target).value_or(PassStats{});
}

Units Protocol::total_supply(const Address& target) const {
    return ledger_.total_supply(target);
}

Units Protocol::pass_balance(const Address& account, const Address& target) const {
    auto passes = registry_.find(target);
    return passes ? passes->balance(account) : 0;
}

Amount Protocol::vault_balance() const {
    return vault_.balance();
}

RedemptionVault::Stats Protocol::vault_stats() const {
    return vault_.get_stats();
}

// =============================================================================
// Outposts
// =============================================================================

Address Protocol::create_outpost(const Address& creator, const std::string& name,
                                 const std::string& description, const std::string& uri) {
    return logged("create_outpost", [&] {
        const ProtocolConfig cfg = snapshot();
        Address id = OutpostRegistry::derive_address(creator, name);

        // Taken names and unfunded creators never get a lock
        if (outposts_.exists(id)) {
            throw PodiumError(ErrorKind::OUTPOST_EXISTS, "'" + name + "' by " + to_hex(creator));
        }
        require_funds(bank_, creator, cfg.outpost_purchase_price);

        std::vector<Event> committed;
        {
            std::lock_guard lock(locks_.for_entity(id));
            if (outposts_.exists(id)) {
                throw PodiumError(ErrorKind::OUTPOST_EXISTS,
                                  "'" + name + "' by " + to_hex(creator));
            }
            require_funds(bank_, creator, cfg.outpost_purchase_price);

            Transaction tx;
            pay_journaled(tx, bank_, creator, cfg.treasury, cfg.outpost_purchase_price);

            outposts_.create(creator, name, description, uri, cfg.outpost_purchase_price,
                             clock_.now());
            tx.on_rollback([this, id] { outposts_.remove(id); });

            tx.emit(OutpostCreated{id, creator, name, cfg.outpost_purchase_price});
            committed = tx.commit();
        }

        publish_all(events_, committed);
        PODIUM_LOG_INFO("outpost created",
                        {address_field("outpost", id), address_field("owner", creator),
                         string_field("name", name),
                         uint_field("paid", cfg.outpost_purchase_price)});
        return id;
    });
}

void Protocol::update_outpost_price(const Address& caller, const Address& outpost, Amount price) {
    logged("update_outpost_price", [&] {
        std::vector<Event> committed;
        {
            std::lock_guard lock(outpost_lock(outpost));
            Transaction tx;
            outposts_.update_price(caller, outpost, price);
            tx.emit(OutpostUpdated{outpost, caller, OutpostUpdated::Field::PRICE, price,
                                   ZERO_ADDRESS});
            committed = tx.commit();
        }

        publish_all(events_, committed);
        PODIUM_LOG_INFO("outpost price updated",
                        {address_field("outpost", outpost), uint_field("price", price)});
    });
}

bool Protocol::toggle_pause(const Address& caller, const Address& outpost) {
    return logged("toggle_pause", [&] {
        std::vector<Event> committed;
        bool paused = false;
        {
            std::lock_guard lock(outpost_lock(outpost));
            Transaction tx;
            paused = outposts_.toggle_pause(caller, outpost);
            tx.emit(OutpostUpdated{outpost, caller, OutpostUpdated::Field::PAUSE,
                                   paused ? 1u : 0u, ZERO_ADDRESS});
            committed = tx.commit();
        }

        publish_all(events_, committed);
        PODIUM_LOG_INFO("outpost pause toggled",
                        {address_field("outpost", outpost), bool_field("paused", paused)});
        return paused;
    });
}

void Protocol::transfer_outpost_ownership(const Address& caller, const Address& outpost,
                                          const Address& new_owner) {
    logged("transfer_outpost_ownership", [&] {
        std::vector<Event> committed;
        {
            std::lock_guard lock(outpost_lock(outpost));
            Transaction tx;
            outposts_.transfer_ownership(caller, outpost, new_owner);
            tx.emit(OutpostUpdated{outpost, caller, OutpostUpdated::Field::OWNER, 0, new_owner});
            committed = tx.commit();
        }

        publish_all(events_, committed);
        PODIUM_LOG_INFO("outpost ownership transferred",
                        {address_field("outpost", outpost), address_field("from", caller),
                         address_field("to", new_owner)});
    });
}

void Protocol::set_royalty(const Address& caller, const Address& outpost, uint64_t numerator) {
    logged("set_royalty", [&] {
        std::vector<Event> committed;
        {
            std::lock_guard lock(outpost_lock(outpost));
            Transaction tx;
            outposts_.set_royalty(caller, outpost, numerator);
            tx.emit(OutpostUpdated{outpost, caller, OutpostUpdated::Field::ROYALTY, numerator,
                                   ZERO_ADDRESS});
            committed = tx.commit();
        }

        publish_all(events_, committed);
        PODIUM_LOG_INFO("outpost royalty updated",
                        {address_field("outpost", outpost), uint_field("numerator", numerator)});
    });
}

std::optional<OutpostInfo> Protocol::get_outpost(const Address& outpost) const {
    std::mutex* entity = locks_.find(outpost);
    if (entity == nullptr) return std::nullopt;

    std::lock_guard lock(*entity);
    return outposts_.info(outpost);
}

std::vector<OutpostInfo> Protocol::list_outposts() const {
    std::vector<OutpostInfo> result;
    for (const auto& id : outposts_.ids()) {
        if (auto info = get_outpost(id)) result.push_back(std::move(*info));
    }
    return result;
}

std::vector<OutpostInfo> Protocol::outposts_owned_by(const Address& owner) const {
    std::vector<OutpostInfo> result;
    for (auto& info : list_outposts()) {
        if (info.owner == owner) result.push_back(std::move(info));
    }
    return result;
}

// =============================================================================
// Subscriptions
// =============================================================================

uint32_t Protocol::create_tier(const Address& caller, const Address& outpost,
                               const std::string& name, Amount price, DurationClass duration) {
    return logged("create_tier", [&] {
        std::vector<Event> committed;
        uint32_t tier_id = 0;
        {
            std::lock_guard lock(outpost_lock(outpost));
            Outpost& op = outposts_.get(outpost);
            OutpostRegistry::require_owner(op, caller);
            OutpostRegistry::require_not_paused(op);

            Transaction tx;
            tier_id = op.book.create_tier(name, price, duration);
            tx.emit(TierUpdated{outpost, tier_id, name, price, duration, true});
            committed = tx.commit();
        }

        publish_all(events_, committed);
        PODIUM_LOG_INFO("tier created",
                        {address_field("outpost", outpost), uint_field("tier_id", tier_id),
                         string_field("name", name), uint_field("price", price),
                         string_field("duration", to_string(duration))});
        return tier_id;
    });
}

void Protocol::update_tier(const Address& caller, const Address& outpost, uint32_t tier_id,
                           Amount price, DurationClass duration) {
    logged("update_tier", [&] {
        std::vector<Event> committed;
        {
            std::lock_guard lock(outpost_lock(outpost));
            Outpost& op = outposts_.get(outpost);
            OutpostRegistry::require_owner(op, caller);
            OutpostRegistry::require_not_paused(op);

            Transaction tx;
            op.book.update_tier(tier_id, price, duration);
            tx.emit(TierUpdated{outpost, tier_id, op.book.tier(tier_id).name, price, duration,
                                false});
            committed = tx.commit();
        }

        publish_all(events_, committed);
        PODIUM_LOG_INFO("tier updated",
                        {address_field("outpost", outpost), uint_field("tier_id", tier_id),
                         uint_field("price", price),
                         string_field("duration", to_string(duration))});
    });
}

Subscription Protocol::subscribe(const Address& subscriber, const Address& outpost,
                                 uint32_t tier_id, const std::optional<Address>& referrer) {
    return logged("subscribe", [&] {
        const ProtocolConfig cfg = snapshot();

        std::vector<Event> committed;
        Subscription record{};
        {
            std::lock_guard lock(outpost_lock(outpost));
            Outpost& op = outposts_.get(outpost);
            OutpostRegistry::require_not_paused(op);

            const SubscriptionTier tier = op.book.tier(tier_id);
            if (op.book.find(subscriber)) {
                throw PodiumError(ErrorKind::ALREADY_SUBSCRIBED, to_hex(subscriber));
            }

            SubscriptionSplit split =
                FeeSplitter(cfg).split_subscription(tier.price, referrer.has_value());
            require_funds(bank_, subscriber, tier.price);

            Transaction tx;
            pay_journaled(tx, bank_, subscriber, cfg.treasury, split.protocol_fee);
            if (referrer) {
                pay_journaled(tx, bank_, subscriber, *referrer, split.referral_fee);
            }
            pay_journaled(tx, bank_, subscriber, op.owner, split.owner_share);

            record = op.book.subscribe(subscriber, tier_id, clock_.now());
            tx.on_rollback([&op, subscriber] { op.book.restore(subscriber, std::nullopt); });

            tx.emit(SubscriptionCreated{subscriber, outpost, tier_id, split.price,
                                        split.protocol_fee, split.referral_fee,
                                        split.owner_share, referrer, record.start_time,
                                        record.end_time});
            committed = tx.commit();

            PODIUM_LOG_INFO("subscribed",
                            {address_field("subscriber", subscriber),
                             address_field("outpost", outpost), uint_field("tier_id", tier_id),
                             uint_field("price", tier.price),
                             uint_field("end_time", record.end_time)});
        }

        publish_all(events_, committed);
        return record;
    });
}

void Protocol::cancel_subscription(const Address& subscriber, const Address& outpost) {
    logged("cancel_subscription", [&] {
        std::vector<Event> committed;
        Subscription removed{};
        {
            std::lock_guard lock(outpost_lock(outpost));
            Outpost& op = outposts_.get(outpost);
            OutpostRegistry::require_not_paused(op);

            Transaction tx;
            removed = op.book.cancel(subscriber);
            tx.emit(SubscriptionCancelled{subscriber, outpost, removed.tier_id});
            committed = tx.commit();
        }

        publish_all(events_, committed);
        PODIUM_LOG_INFO("subscription cancelled",
                        {address_field("subscriber", subscriber),
                         address_field("outpost", outpost), uint_field("tier_id", removed.tier_id)});
    });
}

bool Protocol::is_active(const Address& subscriber, const Address& outpost,
                         uint32_t tier_id) const {
    std::mutex* entity = locks_.find(outpost);
    if (entity == nullptr) return false;

    std::lock_guard lock(*entity);
    if (!outposts_.exists(outpost)) return false;
    return outposts_.get(outpost).book.is_active(subscriber, tier_id, clock_.now());
}

std::optional<Subscription> Protocol::get_subscription(const Address& subscriber,
                                                       const Address& outpost) const {
    std::mutex* entity = locks_.find(outpost);
    if (entity == nullptr) return std::nullopt;

    std::lock_guard lock(*entity);
    if (!outposts_.exists(outpost)) return std::nullopt;
    return outposts_.get(outpost).book.find(subscriber);
}

SubscriptionTier Protocol::get_tier(const Address& outpost, uint32_t tier_id) const {
    std::lock_guard lock(outpost_lock(outpost));
    return outposts_.get(outpost).book.tier(tier_id);
}

uint32_t Protocol::tier_count(const Address& outpost) const {
    std::lock_guard lock(outpost_lock(outpost));
    return outposts_.get(outpost).book.tier_count();
}

std::vector<SubscriptionTier> Protocol::list_tiers(const Address& outpost) const {
    std::lock_guard lock(outpost_lock(outpost));
    return outposts_.get(outpost).book.tiers();
}

// =============================================================================
// Admin
//
// Config changes hold config_mutex_ exclusively; their events are published
// after it is released.
// =============================================================================

void Protocol::update_fee_config(const Address& caller, uint32_t protocol_bps,
                                 uint32_t subject_bps, uint32_t referral_bps) {
    logged("update_fee_config", [&] {
        std::vector<Event> committed;
        {
            std::unique_lock lock(config_mutex_);
            require_admin(caller);
            validate_fee_bps(protocol_bps, "protocol_fee_bps");
            validate_fee_bps(subject_bps, "subject_fee_bps");
            validate_fee_bps(referral_bps, "referral_fee_bps");

            Transaction tx;
            FeeConfig& fees = config_.fees;
            tx.emit(fee_change("protocol_fee_bps", fees.protocol_fee_bps, protocol_bps));
            tx.emit(fee_change("subject_fee_bps", fees.subject_fee_bps, subject_bps));
            tx.emit(fee_change("referral_fee_bps", fees.referral_fee_bps, referral_bps));
            fees.protocol_fee_bps = protocol_bps;
            fees.subject_fee_bps = subject_bps;
            fees.referral_fee_bps = referral_bps;
            committed = tx.commit();
        }
        publish_all(events_, committed);
    });
}

void Protocol::update_subscription_fee_config(const Address& caller, uint32_t protocol_bps,
                                              uint32_t referrer_bps) {
    logged("update_subscription_fee_config", [&] {
        std::vector<Event> committed;
        {
            std::unique_lock lock(config_mutex_);
            require_admin(caller);
            validate_fee_bps(protocol_bps, "protocol_subscription_fee_bps");
            validate_fee_bps(referrer_bps, "referrer_fee_bps");

            Transaction tx;
            SubscriptionFeeConfig& fees = config_.subscription_fees;
            tx.emit(fee_change("protocol_subscription_fee_bps", fees.protocol_fee_bps,
                               protocol_bps));
            tx.emit(fee_change("referrer_fee_bps", fees.referrer_fee_bps, referrer_bps));
            fees.protocol_fee_bps = protocol_bps;
            fees.referrer_fee_bps = referrer_bps;
            committed = tx.commit();
        }
        publish_all(events_, committed);
    });
}

void Protocol::update_curve_weights(const Address& caller, uint64_t a, uint64_t b, uint64_t c) {
    logged("update_curve_weights", [&] {
        std::vector<Event> committed;
        {
            std::unique_lock lock(config_mutex_);
            require_admin(caller);
            CurveWeights weights{a, b, c};
            weights.validate();

            Transaction tx;
            tx.emit(fee_change("weight_a", config_.weights.weight_a, a));
            tx.emit(fee_change("weight_b", config_.weights.weight_b, b));
            tx.emit(fee_change("weight_c", config_.weights.weight_c, c));
            config_.weights = weights;
            committed = tx.commit();
        }
        publish_all(events_, committed);
    });
}

void Protocol::update_treasury(const Address& caller, const Address& treasury) {
    logged("update_treasury", [&] {
        std::vector<Event> committed;
        {
            std::unique_lock lock(config_mutex_);
            require_admin(caller);

            Transaction tx;
            tx.emit(FeeUpdated{"treasury", 0, 0, config_.treasury, treasury});
            config_.treasury = treasury;
            committed = tx.commit();
        }
        publish_all(events_, committed);
    });
}

void Protocol::update_outpost_purchase_price(const Address& caller, Amount price) {
    logged("update_outpost_purchase_price", [&] {
        std::vector<Event> committed;
        {
            std::unique_lock lock(config_mutex_);
            require_admin(caller);

            Transaction tx;
            tx.emit(fee_change("outpost_purchase_price", config_.outpost_purchase_price, price));
            config_.outpost_purchase_price = price;
            committed = tx.commit();
        }
        publish_all(events_, committed);
    });
}

void Protocol::transfer_admin(const Address& caller, const Address& new_admin) {
    logged("transfer_admin", [&] {
        std::vector<Event> committed;
        {
            std::unique_lock lock(config_mutex_);
            require_admin(caller);

            Transaction tx;
            tx.emit(FeeUpdated{"admin", 0, 0, config_.admin, new_admin});
            config_.admin = new_admin;
            committed = tx.commit();
        }
        publish_all(events_, committed);
    });
}

void Protocol::emergency_pause(const Address& caller, const Address& outpost, bool paused) {
    logged("emergency_pause", [&] {
        {
            std::shared_lock config_lock(config_mutex_);
            require_admin(caller);
        }

        std::vector<Event> committed;
        {
            std::lock_guard lock(outpost_lock(outpost));
            Transaction tx;
            outposts_.set_paused(outpost, paused);
            tx.emit(OutpostUpdated{outpost, caller, OutpostUpdated::Field::PAUSE,
                                   paused ? 1u : 0u, ZERO_ADDRESS});
            committed = tx.commit();
        }

        publish_all(events_, committed);
        PODIUM_LOG_WARN("emergency pause",
                        {address_field("outpost", outpost), bool_field("paused", paused)});
    });
}

} // namespace podium
