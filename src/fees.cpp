// =============================================================================
// fees.cpp - Basis-point fee splitting
// =============================================================================

#include "podium/fees.hpp"
#include "podium/math.hpp"

namespace podium {

Amount BuySplit::total() const {
    U128 sum = static_cast<U128>(base) + protocol_fee + subject_fee + referral_fee;
    return math::narrow(sum, "buyer payment");
}

BuySplit FeeSplitter::split_buy(Amount price, bool has_referrer) const {
    BuySplit split{};
    split.base = price;
    split.protocol_fee = math::bps_of(price, trade_fees_.protocol_fee_bps);
    split.subject_fee = math::bps_of(price, trade_fees_.subject_fee_bps);
    split.referral_fee = has_referrer ? math::bps_of(price, trade_fees_.referral_fee_bps) : 0;
    return split;
}

SellSplit FeeSplitter::split_sell(Amount price) const {
    SellSplit split{};
    split.price = price;
    split.protocol_fee = math::bps_of(price, trade_fees_.protocol_fee_bps);
    split.subject_fee = math::bps_of(price, trade_fees_.subject_fee_bps);

    U128 fees = static_cast<U128>(split.protocol_fee) + split.subject_fee;
    if (fees >= price) {
        throw PodiumError(ErrorKind::INVALID_AMOUNT,
                          "sell fees consume the whole price " + std::to_string(price));
    }
    split.net_to_seller = price - static_cast<Amount>(fees);
    return split;
}

SubscriptionSplit FeeSplitter::split_subscription(Amount price, bool has_referrer) const {
    SubscriptionSplit split{};
    split.price = price;
    split.protocol_fee = math::bps_of(price, subscription_fees_.protocol_fee_bps);
    split.referral_fee = has_referrer ? math::bps_of(price, subscription_fees_.referrer_fee_bps) : 0;

    U128 fees = static_cast<U128>(split.protocol_fee) + split.referral_fee;
    if (fees >= price) {
        throw PodiumError(ErrorKind::INVALID_AMOUNT,
                          "subscription fees consume the whole price " + std::to_string(price));
    }
    split.owner_share = price - static_cast<Amount>(fees);
    return split;
}

} // namespace podium
