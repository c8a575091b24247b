#ifndef PODIUM_CURVE_HPP
#define PODIUM_CURVE_HPP

#include <cstdint>

#include "types.hpp"
#include "config.hpp"

namespace podium {

// =============================================================================
// BondingCurve - deterministic pass pricing
//
//   unit_price(s) = max(INITIAL_PRICE,
//                       ((S(s + c - 1) * a / BPS) * b / BPS) * UNIT_SCALE)
//
// where S(n) is the sum of squares 1..n. Supply 0 (and any supply with
// n <= 1) is priced at INITIAL_PRICE.
// =============================================================================

class BondingCurve {
public:
    explicit BondingCurve(const CurveWeights& weights);

    const CurveWeights& weights() const { return weights_; }

    // Price of the next unit when `supply` units are outstanding
    Amount unit_price(Units supply) const;

    // Sum of unit prices for `amount` units.
    //   buy:  unit i is priced at supply + i
    //   sell: unit i is priced at supply - i - 1 (0 once supply - i <= 1)
    // so buying k units from s and selling them back from s + k walk the
    // same supply levels.
    Amount total_price(Units supply, Units amount, bool is_sell) const;

    Amount buy_price(Units supply, Units amount) const { return total_price(supply, amount, false); }
    Amount sell_price(Units supply, Units amount) const { return total_price(supply, amount, true); }

private:
    CurveWeights weights_;
};

} // namespace podium

#endif // PODIUM_CURVE_HPP
