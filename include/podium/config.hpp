#ifndef PODIUM_CONFIG_HPP
#define PODIUM_CONFIG_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"

namespace podium {

// =============================================================================
// Fee Configuration
// =============================================================================

// Pass trading fees
struct FeeConfig {
    uint32_t protocol_fee_bps = constants::DEFAULT_PROTOCOL_FEE_BPS;
    uint32_t subject_fee_bps = constants::DEFAULT_SUBJECT_FEE_BPS;
    uint32_t referral_fee_bps = constants::DEFAULT_REFERRAL_FEE_BPS;
};

// Subscription fees
struct SubscriptionFeeConfig {
    uint32_t protocol_fee_bps = constants::DEFAULT_PROTOCOL_SUBSCRIPTION_FEE_BPS;
    uint32_t referrer_fee_bps = constants::DEFAULT_REFERRER_FEE_BPS;
};

// Bonding-curve weights, all in basis points of 10000 except c which is a
// supply offset
struct CurveWeights {
    uint64_t weight_a = constants::DEFAULT_WEIGHT_A;
    uint64_t weight_b = constants::DEFAULT_WEIGHT_B;
    uint64_t weight_c = constants::DEFAULT_WEIGHT_C;

    // Throws PodiumError(InvalidWeight)
    void validate() const;
};

// =============================================================================
// ProtocolConfig - global protocol parameters
// =============================================================================

class ProtocolConfig {
public:
    Address admin{};
    Address treasury{};
    Address vault_account{};    // settlement account holding redemption funds
    FeeConfig fees;
    SubscriptionFeeConfig subscription_fees;
    CurveWeights weights;
    Amount outpost_purchase_price = constants::DEFAULT_OUTPOST_PURCHASE_PRICE;

    ProtocolConfig() = default;

    static ProtocolConfig create(const Address& admin_addr, const Address& treasury_addr) {
        ProtocolConfig cfg;
        cfg.admin = admin_addr;
        cfg.treasury = treasury_addr;
        cfg.vault_account = default_vault_account();
        return cfg;
    }

    // Reserved settlement account for the redemption vault
    static Address default_vault_account();

    // Throws PodiumError(InvalidFeeValue / InvalidWeight)
    void validate() const;

    ProtocolConfig& with_fees(uint32_t protocol_bps, uint32_t subject_bps, uint32_t referral_bps) {
        fees.protocol_fee_bps = protocol_bps;
        fees.subject_fee_bps = subject_bps;
        fees.referral_fee_bps = referral_bps;
        return *this;
    }

    ProtocolConfig& with_subscription_fees(uint32_t protocol_bps, uint32_t referrer_bps) {
        subscription_fees.protocol_fee_bps = protocol_bps;
        subscription_fees.referrer_fee_bps = referrer_bps;
        return *this;
    }

    ProtocolConfig& with_weights(uint64_t a, uint64_t b, uint64_t c) {
        weights.weight_a = a;
        weights.weight_b = b;
        weights.weight_c = c;
        return *this;
    }

    ProtocolConfig& with_treasury(const Address& addr) {
        treasury = addr;
        return *this;
    }

    ProtocolConfig& with_vault_account(const Address& addr) {
        vault_account = addr;
        return *this;
    }

    ProtocolConfig& with_outpost_purchase_price(Amount price) {
        outpost_purchase_price = price;
        return *this;
    }
};

// Throws PodiumError(InvalidFeeValue) unless bps is within [0, 10000]
void validate_fee_bps(uint64_t bps, const char* name);

// =============================================================================
// Runtime Settings
// =============================================================================

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
    std::string logger_name = "podium";
};

// =============================================================================
// PodiumConfig - everything a host loads at startup
// =============================================================================

class PodiumConfig {
public:
    ProtocolConfig protocol;
    LoggingConfig logging;

    PodiumConfig() = default;

    // Load from a JSON file. Missing keys keep their defaults.
    static PodiumConfig from_file(std::string_view path);

    // Load from a JSON document
    static PodiumConfig from_json_string(std::string_view content);
    static PodiumConfig from_json(const nlohmann::json& doc);

    nlohmann::json to_json() const;
};

} // namespace podium

#endif // PODIUM_CONFIG_HPP
