// =============================================================================
// config.cpp - Protocol configuration, validation and JSON loading
// =============================================================================

#include "podium/config.hpp"
#include "podium/error.hpp"

#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace podium {

using json = nlohmann::json;

namespace {

void read_if_present(const json& obj, const char* key, std::string& out) {
    auto it = obj.find(key);
    if (it != obj.end() && !it->is_null()) {
        out = it->get<std::string>();
    }
}

// Only non-negative integers that fit T; no wrapping or truncation
template <typename T>
void read_if_present(const json& obj, const char* key, T& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return;

    if (!it->is_number_unsigned()) {
        throw std::runtime_error(std::string("Invalid config value: ") + key + " = " +
                                 it->dump() + " is not a non-negative integer");
    }
    uint64_t value = it->get<uint64_t>();
    if (value > std::numeric_limits<T>::max()) {
        throw std::runtime_error(std::string("Invalid config value: ") + key + " = " +
                                 it->dump() + " out of range");
    }
    out = static_cast<T>(value);
}

void read_address_if_present(const json& obj, const char* key, Address& out) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_string()) {
        out = address_from_hex(it->get<std::string>());
    }
}

} // namespace

// =============================================================================
// Validation
// =============================================================================

void validate_fee_bps(uint64_t bps, const char* name) {
    if (bps > constants::BPS) {
        throw PodiumError(ErrorKind::INVALID_FEE_VALUE,
                          std::string(name) + " = " + std::to_string(bps) + " outside [0, 10000]");
    }
}

void CurveWeights::validate() const {
    if (weight_a < constants::MIN_WEIGHT || weight_a > constants::MAX_WEIGHT_AB) {
        throw PodiumError(ErrorKind::INVALID_WEIGHT,
                          "weight_a = " + std::to_string(weight_a) + " outside [1, 10000]");
    }
    if (weight_b < constants::MIN_WEIGHT || weight_b > constants::MAX_WEIGHT_AB) {
        throw PodiumError(ErrorKind::INVALID_WEIGHT,
                          "weight_b = " + std::to_string(weight_b) + " outside [1, 10000]");
    }
    if (weight_c < constants::MIN_WEIGHT || weight_c > constants::MAX_WEIGHT_C) {
        throw PodiumError(ErrorKind::INVALID_WEIGHT,
                          "weight_c = " + std::to_string(weight_c) + " outside [1, 100]");
    }
}

void ProtocolConfig::validate() const {
    validate_fee_bps(fees.protocol_fee_bps, "protocol_fee_bps");
    validate_fee_bps(fees.subject_fee_bps, "subject_fee_bps");
    validate_fee_bps(fees.referral_fee_bps, "referral_fee_bps");
    validate_fee_bps(subscription_fees.protocol_fee_bps, "protocol_subscription_fee_bps");
    validate_fee_bps(subscription_fees.referrer_fee_bps, "referrer_fee_bps");
    weights.validate();
}

Address ProtocolConfig::default_vault_account() {
    // 0x...7661756c74 ("vault")
    return address_from_hex("0x7661756c74");
}

// =============================================================================
// JSON Loading
// =============================================================================

PodiumConfig PodiumConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json_string(buffer.str());
}

PodiumConfig PodiumConfig::from_json_string(std::string_view content) {
    json doc;
    try {
        doc = json::parse(content.begin(), content.end());
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid config JSON: ") + e.what());
    }
    return from_json(doc);
}

PodiumConfig PodiumConfig::from_json(const json& doc) {
    PodiumConfig config;
    config.protocol.vault_account = ProtocolConfig::default_vault_account();

    try {
        if (auto it = doc.find("protocol"); it != doc.end()) {
            const json& p = *it;
            ProtocolConfig& proto = config.protocol;

            read_address_if_present(p, "admin", proto.admin);
            read_address_if_present(p, "treasury", proto.treasury);
            read_address_if_present(p, "vault_account", proto.vault_account);
            read_if_present(p, "protocol_fee_bps", proto.fees.protocol_fee_bps);
            read_if_present(p, "subject_fee_bps", proto.fees.subject_fee_bps);
            read_if_present(p, "referral_fee_bps", proto.fees.referral_fee_bps);
            read_if_present(p, "protocol_subscription_fee_bps", proto.subscription_fees.protocol_fee_bps);
            read_if_present(p, "referrer_fee_bps", proto.subscription_fees.referrer_fee_bps);
            read_if_present(p, "outpost_purchase_price", proto.outpost_purchase_price);

            if (auto w = p.find("weights"); w != p.end()) {
                read_if_present(*w, "a", proto.weights.weight_a);
                read_if_present(*w, "b", proto.weights.weight_b);
                read_if_present(*w, "c", proto.weights.weight_c);
            }
        }

        if (auto it = doc.find("logging"); it != doc.end()) {
            read_if_present(*it, "level", config.logging.level);
            read_if_present(*it, "pattern", config.logging.pattern);
            read_if_present(*it, "logger_name", config.logging.logger_name);
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    config.protocol.validate();
    return config;
}

json PodiumConfig::to_json() const {
    json doc;
    doc["protocol"] = {
        {"admin", podium::to_hex(protocol.admin)},
        {"treasury", podium::to_hex(protocol.treasury)},
        {"vault_account", podium::to_hex(protocol.vault_account)},
        {"protocol_fee_bps", protocol.fees.protocol_fee_bps},
        {"subject_fee_bps", protocol.fees.subject_fee_bps},
        {"referral_fee_bps", protocol.fees.referral_fee_bps},
        {"protocol_subscription_fee_bps", protocol.subscription_fees.protocol_fee_bps},
        {"referrer_fee_bps", protocol.subscription_fees.referrer_fee_bps},
        {"outpost_purchase_price", protocol.outpost_purchase_price},
        {"weights", {
            {"a", protocol.weights.weight_a},
            {"b", protocol.weights.weight_b},
            {"c", protocol.weights.weight_c}
        }}
    };
    doc["logging"] = {
        {"level", logging.level},
        {"pattern", logging.pattern},
        {"logger_name", logging.logger_name}
    };
    return doc;
}

} // namespace podium
