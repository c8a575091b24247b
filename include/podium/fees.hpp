#ifndef PODIUM_FEES_HPP
#define PODIUM_FEES_HPP

#include <cstdint>

#include "types.hpp"
#include "config.hpp"

namespace podium {

// =============================================================================
// Fee Splits
// =============================================================================

// Buy fees are surcharges on top of the curve price. The base goes to the
// redemption vault untouched.
struct BuySplit {
    Amount base;
    Amount protocol_fee;
    Amount subject_fee;
    Amount referral_fee;

    // base + all fees; throws ArithmeticOverflow past 64 bits
    Amount total() const;
};

// Sell fees are deducted from the curve price
struct SellSplit {
    Amount price;
    Amount protocol_fee;
    Amount subject_fee;
    Amount net_to_seller;
};

// Subscription fees are deducted from the tier price; the owner keeps the rest
struct SubscriptionSplit {
    Amount price;
    Amount protocol_fee;
    Amount referral_fee;
    Amount owner_share;
};

// =============================================================================
// FeeSplitter - stateless, reads the fee bps it was built with
// =============================================================================

class FeeSplitter {
public:
    FeeSplitter(const FeeConfig& trade_fees, const SubscriptionFeeConfig& subscription_fees)
        : trade_fees_(trade_fees), subscription_fees_(subscription_fees) {}

    explicit FeeSplitter(const ProtocolConfig& config)
        : FeeSplitter(config.fees, config.subscription_fees) {}

    BuySplit split_buy(Amount price, bool has_referrer) const;

    // Throws InvalidAmount if nothing would be left for the seller
    SellSplit split_sell(Amount price) const;

    // Throws InvalidAmount if the fees consume the whole price
    SubscriptionSplit split_subscription(Amount price, bool has_referrer) const;

private:
    FeeConfig trade_fees_;
    SubscriptionFeeConfig subscription_fees_;
};

} // namespace podium

#endif // PODIUM_FEES_HPP
