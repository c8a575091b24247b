#ifndef PODIUM_ERROR_HPP
#define PODIUM_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace podium {

// =============================================================================
// Error Kinds
// =============================================================================

enum class ErrorKind : int32_t {
    NOT_ADMIN = -1,
    NOT_OWNER = -2,
    INVALID_AMOUNT = -3,
    INVALID_FEE_VALUE = -4,
    INVALID_WEIGHT = -5,
    INVALID_DURATION = -6,
    TIER_NOT_FOUND = -10,
    TIER_NAME_EXISTS = -11,
    SUBSCRIPTION_NOT_FOUND = -12,
    ALREADY_SUBSCRIBED = -13,
    OUTPOST_NOT_FOUND = -20,
    OUTPOST_EXISTS = -21,
    EMERGENCY_PAUSE = -22,
    INSUFFICIENT_VAULT_BALANCE = -30,
    INSUFFICIENT_CALLER_BALANCE = -31,
    SUPPLY_UNDERFLOW = -32,
    ARITHMETIC_OVERFLOW = -33
};

const char* to_string(ErrorKind kind);

// Every rejected operation throws this. The kind is the structured part;
// the message is for logs.
class PodiumError : public std::runtime_error {
public:
    PodiumError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(std::string(to_string(kind)) + ": " + msg), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }
    int32_t code() const noexcept { return static_cast<int32_t>(kind_); }

private:
    ErrorKind kind_;
};

} // namespace podium

#endif // PODIUM_ERROR_HPP
