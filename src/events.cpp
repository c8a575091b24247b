// =============================================================================
// events.cpp - Event names and sinks
// =============================================================================

#include "podium/events.hpp"
#include "podium/logging.hpp"

#include <exception>
#include <type_traits>

namespace podium {

using namespace observability;

namespace {

const char* field_name(OutpostUpdated::Field field) {
    switch (field) {
        case OutpostUpdated::Field::PRICE:   return "price";
        case OutpostUpdated::Field::PAUSE:   return "paused";
        case OutpostUpdated::Field::OWNER:   return "owner";
        case OutpostUpdated::Field::ROYALTY: return "royalty";
    }
    return "unknown";
}

std::string referrer_text(const std::optional<Address>& referrer) {
    return referrer ? to_hex(*referrer) : std::string("none");
}

} // namespace

const char* event_name(const Event& event) {
    return std::visit([](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, PassPurchased>) return "pass_purchased";
        else if constexpr (std::is_same_v<T, PassSold>) return "pass_sold";
        else if constexpr (std::is_same_v<T, OutpostCreated>) return "outpost_created";
        else if constexpr (std::is_same_v<T, OutpostUpdated>) return "outpost_updated";
        else if constexpr (std::is_same_v<T, TierUpdated>) return "tier_updated";
        else if constexpr (std::is_same_v<T, SubscriptionCreated>) return "subscription_created";
        else if constexpr (std::is_same_v<T, SubscriptionCancelled>) return "subscription_cancelled";
        else return "fee_updated";
    }, event);
}

void publish_all(EventSink& sink, const std::vector<Event>& events) {
    for (const auto& event : events) {
        try {
            sink.publish(event);
        } catch (const std::exception& e) {
            log_warn("event sink rejected event",
                     {string_field("event", event_name(event)), string_field("error", e.what())});
        }
    }
}

// =============================================================================
// LoggingEventSink
// =============================================================================

void LoggingEventSink::publish(const Event& event) {
    std::visit([&event](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        const char* name = event_name(event);

        if constexpr (std::is_same_v<T, PassPurchased>) {
            log_info(name, {address_field("buyer", e.buyer), address_field("target", e.target),
                            uint_field("amount", e.amount), uint_field("price", e.price),
                            uint_field("protocol_fee", e.protocol_fee),
                            uint_field("subject_fee", e.subject_fee),
                            uint_field("referral_fee", e.referral_fee),
                            string_field("referrer", referrer_text(e.referrer)),
                            uint_field("supply", e.new_supply)});
        } else if constexpr (std::is_same_v<T, PassSold>) {
            log_info(name, {address_field("seller", e.seller), address_field("target", e.target),
                            uint_field("amount", e.amount), uint_field("price", e.price),
                            uint_field("protocol_fee", e.protocol_fee),
                            uint_field("subject_fee", e.subject_fee),
                            uint_field("net", e.net_to_seller),
                            uint_field("supply", e.new_supply)});
        } else if constexpr (std::is_same_v<T, OutpostCreated>) {
            log_info(name, {address_field("outpost", e.outpost), address_field("owner", e.owner),
                            string_field("name", e.name), uint_field("paid", e.purchase_price)});
        } else if constexpr (std::is_same_v<T, OutpostUpdated>) {
            if (e.field == OutpostUpdated::Field::OWNER) {
                log_info(name, {address_field("outpost", e.outpost),
                                string_field("field", field_name(e.field)),
                                address_field("new_owner", e.new_owner)});
            } else {
                log_info(name, {address_field("outpost", e.outpost),
                                string_field("field", field_name(e.field)),
                                uint_field("value", e.value)});
            }
        } else if constexpr (std::is_same_v<T, TierUpdated>) {
            log_info(name, {address_field("outpost", e.outpost), uint_field("tier_id", e.tier_id),
                            string_field("name", e.name), uint_field("price", e.price),
                            string_field("duration", to_string(e.duration)),
                            bool_field("created", e.created)});
        } else if constexpr (std::is_same_v<T, SubscriptionCreated>) {
            log_info(name, {address_field("subscriber", e.subscriber),
                            address_field("outpost", e.outpost), uint_field("tier_id", e.tier_id),
                            uint_field("price", e.price), uint_field("protocol_fee", e.protocol_fee),
                            uint_field("referral_fee", e.referral_fee),
                            uint_field("owner_share", e.owner_share),
                            uint_field("end_time", e.end_time)});
        } else if constexpr (std::is_same_v<T, SubscriptionCancelled>) {
            log_info(name, {address_field("subscriber", e.subscriber),
                            address_field("outpost", e.outpost), uint_field("tier_id", e.tier_id)});
        } else if (!is_zero_address(e.new_address)) {
            log_info(name, {string_field("parameter", e.parameter),
                            address_field("old", e.old_address),
                            address_field("new", e.new_address)});
        } else {
            log_info(name, {string_field("parameter", e.parameter),
                            uint_field("old", e.old_value), uint_field("new", e.new_value)});
        }
    }, event);
}

// =============================================================================
// RecordingEventSink
// =============================================================================

void RecordingEventSink::publish(const Event& event) {
    std::lock_guard lock(mutex_);
    events_.push_back(event);
}

std::vector<Event> RecordingEventSink::events() const {
    std::lock_guard lock(mutex_);
    return events_;
}

size_t RecordingEventSink::size() const {
    std::lock_guard lock(mutex_);
    return events_.size();
}

void RecordingEventSink::clear() {
    std::lock_guard lock(mutex_);
    events_.clear();
}

} // namespace podium
