// =============================================================================
// curve.cpp - Bonding curve pricing
// =============================================================================

#include "podium/curve.hpp"
#include "podium/math.hpp"

#include <algorithm>

namespace podium {

BondingCurve::BondingCurve(const CurveWeights& weights) : weights_(weights) {
    weights_.validate();
}

Amount BondingCurve::unit_price(Units supply) const {
    if (supply == 0) {
        return constants::INITIAL_PRICE;
    }
    if (supply > constants::MAX_SUPPLY) {
        throw PodiumError(ErrorKind::INVALID_AMOUNT,
                          "supply " + std::to_string(supply) + " above MAX_SUPPLY");
    }

    // n = supply + c - 1; weight_c >= 1 so this never underflows
    uint64_t n = supply + weights_.weight_c - 1;
    if (n <= 1) {
        return constants::INITIAL_PRICE;
    }

    U128 s = math::summation(n);
    U128 step1 = s * weights_.weight_a / constants::BPS;
    U128 step2 = step1 * weights_.weight_b / constants::BPS;
    U128 price = step2 * constants::UNIT_SCALE;

    return std::max(math::narrow(price, "unit price"), constants::INITIAL_PRICE);
}

Amount BondingCurve::total_price(Units supply, Units amount, bool is_sell) const {
    U128 total = 0;

    for (Units i = 0; i < amount; ++i) {
        Units level;
        if (is_sell) {
            level = (supply > i + 1) ? supply - i - 1 : 0;
        } else {
            level = supply + i;
        }
        total += unit_price(level);
    }

    return math::narrow(total, "total price");
}

} // namespace podium
