#ifndef PODIUM_MATH_HPP
#define PODIUM_MATH_HPP

#include <cstdint>
#include <limits>
#include <string>

#include "types.hpp"
#include "error.hpp"

namespace podium {

// =============================================================================
// Fixed-Point Helpers
// =============================================================================

namespace math {

constexpr U128 U64_MAX_WIDE = static_cast<U128>(std::numeric_limits<uint64_t>::max());

// S(n) = n(n+1)(2n+1)/6, the sum of squares 1..n.
//
// The factors 2 and 3 are removed from n or from inner = 2n^2 + 3n + 1
// before the final multiply. Exactly one of {n, n+1} is even and
// inner = (n+1)(2n+1), so when n is odd inner is even; likewise one of
// {n, n+1, 2n+1} is a multiple of 3, and the last two live in inner.
inline U128 summation(uint64_t n) {
    if (n == 0) return 0;

    U128 a = n;
    U128 inner = 2 * a * a + 3 * a + 1;

    if (a % 2 == 0) {
        a /= 2;
    } else {
        inner /= 2;
    }

    if (a % 3 == 0) {
        a /= 3;
    } else {
        inner /= 3;
    }

    return a * inner;
}

// value * bps / 10000, truncating
inline Amount bps_of(Amount value, uint64_t bps) {
    return static_cast<Amount>(static_cast<U128>(value) * bps / constants::BPS);
}

inline Amount narrow(U128 value, const char* what) {
    if (value > U64_MAX_WIDE) {
        throw PodiumError(ErrorKind::ARITHMETIC_OVERFLOW,
                          std::string(what) + " exceeds 64 bits");
    }
    return static_cast<Amount>(value);
}

inline Amount checked_add(Amount a, Amount b, const char* what) {
    return narrow(static_cast<U128>(a) + b, what);
}

} // namespace math

} // namespace podium

#endif // PODIUM_MATH_HPP
