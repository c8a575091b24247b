#ifndef PODIUM_TYPES_HPP
#define PODIUM_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>

namespace podium {

// =============================================================================
// Account Addresses (32-byte, Move-style)
// =============================================================================

using Address = std::array<uint8_t, 32>;

// Settlement currency in its smallest unit, and pass units
using Amount = uint64_t;
using Units = uint64_t;

// Wide intermediates for pricing math
using U128 = unsigned __int128;

inline constexpr Address ZERO_ADDRESS{};

// Short addresses for tests and fixtures: value is stored big-endian in the
// trailing 8 bytes, so address_from_u64(0x123) prints as 0x...0123
constexpr Address address_from_u64(uint64_t value) {
    Address addr{};
    for (size_t i = 0; i < 8; ++i) {
        addr[31 - i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
    }
    return addr;
}

constexpr bool is_zero_address(const Address& a) {
    for (auto b : a) {
        if (b != 0) return false;
    }
    return true;
}

inline uint64_t address_hash(const Address& a) {
    uint64_t h = 0;
    for (auto b : a) h = h * 31 + b;
    return h;
}

struct AddressHasher {
    size_t operator()(const Address& a) const { return static_cast<size_t>(address_hash(a)); }
};

// "0x" + 64 lowercase hex digits
std::string to_hex(const Address& a);

// Accepts an optional 0x prefix and up to 64 hex digits (left-padded with
// zeros, as Move addresses are). Throws std::invalid_argument on bad input.
Address address_from_hex(const std::string& hex);

// =============================================================================
// Protocol Constants
// =============================================================================

namespace constants {

constexpr uint64_t BPS = 10000;                    // 100% in basis points
constexpr uint64_t OCTA = 100000000;               // 10^8 smallest units per coin
constexpr uint64_t UNIT_SCALE = OCTA;              // curve value -> settlement units
constexpr Amount INITIAL_PRICE = OCTA;             // price floor, one full coin

// Supply ceiling per target. Keeps n = supply + weight_c - 1 below 2^20 so
// n^2 < 2^41 and S(n) < 2^61.
constexpr Units MAX_SUPPLY = 1000000;

constexpr uint64_t MIN_WEIGHT = 1;
constexpr uint64_t MAX_WEIGHT_AB = 10000;
constexpr uint64_t MAX_WEIGHT_C = 100;

constexpr uint64_t ROYALTY_DENOMINATOR = 100;
constexpr uint64_t DEFAULT_ROYALTY_NUMERATOR = 5;

constexpr uint64_t SECONDS_PER_WEEK = 604800;
constexpr uint64_t SECONDS_PER_MONTH = 2592000;   // 30 days
constexpr uint64_t SECONDS_PER_YEAR = 31536000;   // 365 days

// Deployed defaults
constexpr uint32_t DEFAULT_PROTOCOL_FEE_BPS = 400;
constexpr uint32_t DEFAULT_SUBJECT_FEE_BPS = 800;
constexpr uint32_t DEFAULT_REFERRAL_FEE_BPS = 200;
constexpr uint32_t DEFAULT_PROTOCOL_SUBSCRIPTION_FEE_BPS = 500;
constexpr uint32_t DEFAULT_REFERRER_FEE_BPS = 1000;
constexpr uint64_t DEFAULT_WEIGHT_A = 173;
constexpr uint64_t DEFAULT_WEIGHT_B = 257;
constexpr uint64_t DEFAULT_WEIGHT_C = 23;
constexpr Amount DEFAULT_OUTPOST_PURCHASE_PRICE = 30 * OCTA;

} // namespace constants

// =============================================================================
// Subscription Duration Classes
// =============================================================================

enum class DurationClass : uint8_t {
    WEEK = 1,
    MONTH = 2,
    YEAR = 3
};

// Throws PodiumError(InvalidDuration) for anything but WEEK/MONTH/YEAR
uint64_t duration_seconds(DurationClass duration);

// Decodes the wire value (1/2/3); throws PodiumError(InvalidDuration)
DurationClass duration_from_u8(uint8_t value);

const char* to_string(DurationClass duration);

} // namespace podium

#endif // PODIUM_TYPES_HPP
