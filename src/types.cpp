// =============================================================================
// types.cpp - Addresses, durations and error names
// =============================================================================

#include "podium/types.hpp"
#include "podium/error.hpp"

namespace podium {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

// =============================================================================
// Addresses
// =============================================================================

std::string to_hex(const Address& a) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + a.size() * 2);
    for (auto b : a) {
        out.push_back(kHex[(b >> 4) & 0x0F]);
        out.push_back(kHex[b & 0x0F]);
    }
    return out;
}

Address address_from_hex(const std::string& hex) {
    std::string digits = hex;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (digits.empty() || digits.size() > 64) {
        throw std::invalid_argument("invalid address: " + hex);
    }

    // Left-pad to a full 32 bytes
    digits = std::string(64 - digits.size(), '0') + digits;

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(digits[2 * i]);
        int lo = hex_value(digits[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid address: " + hex);
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

// =============================================================================
// Durations
// =============================================================================

uint64_t duration_seconds(DurationClass duration) {
    switch (duration) {
        case DurationClass::WEEK:  return constants::SECONDS_PER_WEEK;
        case DurationClass::MONTH: return constants::SECONDS_PER_MONTH;
        case DurationClass::YEAR:  return constants::SECONDS_PER_YEAR;
    }
    throw PodiumError(ErrorKind::INVALID_DURATION,
                      "unknown duration class " + std::to_string(static_cast<int>(duration)));
}

DurationClass duration_from_u8(uint8_t value) {
    switch (value) {
        case 1: return DurationClass::WEEK;
        case 2: return DurationClass::MONTH;
        case 3: return DurationClass::YEAR;
        default:
            throw PodiumError(ErrorKind::INVALID_DURATION,
                              "unknown duration class " + std::to_string(value));
    }
}

const char* to_string(DurationClass duration) {
    switch (duration) {
        case DurationClass::WEEK:  return "week";
        case DurationClass::MONTH: return "month";
        case DurationClass::YEAR:  return "year";
    }
    return "unknown";
}

// =============================================================================
// Errors
// =============================================================================

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NOT_ADMIN:                   return "NotAdmin";
        case ErrorKind::NOT_OWNER:                   return "NotOwner";
        case ErrorKind::INVALID_AMOUNT:              return "InvalidAmount";
        case ErrorKind::INVALID_FEE_VALUE:           return "InvalidFeeValue";
        case ErrorKind::INVALID_WEIGHT:              return "InvalidWeight";
        case ErrorKind::INVALID_DURATION:            return "InvalidDuration";
        case ErrorKind::TIER_NOT_FOUND:              return "TierNotFound";
        case ErrorKind::TIER_NAME_EXISTS:            return "TierNameExists";
        case ErrorKind::SUBSCRIPTION_NOT_FOUND:      return "SubscriptionNotFound";
        case ErrorKind::ALREADY_SUBSCRIBED:          return "AlreadySubscribed";
        case ErrorKind::OUTPOST_NOT_FOUND:           return "OutpostNotFound";
        case ErrorKind::OUTPOST_EXISTS:              return "OutpostExists";
        case ErrorKind::EMERGENCY_PAUSE:             return "EmergencyPause";
        case ErrorKind::INSUFFICIENT_VAULT_BALANCE:  return "InsufficientVaultBalance";
        case ErrorKind::INSUFFICIENT_CALLER_BALANCE: return "InsufficientCallerBalance";
        case ErrorKind::SUPPLY_UNDERFLOW:            return "SupplyUnderflow";
        case ErrorKind::ARITHMETIC_OVERFLOW:         return "ArithmeticOverflow";
    }
    return "Unknown";
}

} // namespace podium
