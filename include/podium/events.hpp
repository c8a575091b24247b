#ifndef PODIUM_EVENTS_HPP
#define PODIUM_EVENTS_HPP

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "types.hpp"

namespace podium {

// =============================================================================
// Protocol Events
// =============================================================================

struct PassPurchased {
    Address buyer;
    Address target;
    Units amount;
    Amount price;
    Amount protocol_fee;
    Amount subject_fee;
    Amount referral_fee;
    std::optional<Address> referrer;
    Units new_supply;
};

struct PassSold {
    Address seller;
    Address target;
    Units amount;
    Amount price;
    Amount protocol_fee;
    Amount subject_fee;
    Amount net_to_seller;
    Units new_supply;
};

struct OutpostCreated {
    Address outpost;
    Address owner;
    std::string name;
    Amount purchase_price;
};

struct OutpostUpdated {
    enum class Field : uint8_t { PRICE, PAUSE, OWNER, ROYALTY };
    Address outpost;
    Address caller;
    Field field;
    uint64_t value;             // new price / pause flag / royalty numerator
    Address new_owner;          // OWNER only
};

struct TierUpdated {
    Address outpost;
    uint32_t tier_id;
    std::string name;
    Amount price;
    DurationClass duration;
    bool created;
};

struct SubscriptionCreated {
    Address subscriber;
    Address outpost;
    uint32_t tier_id;
    Amount price;
    Amount protocol_fee;
    Amount referral_fee;
    Amount owner_share;
    std::optional<Address> referrer;
    uint64_t start_time;
    uint64_t end_time;
};

struct SubscriptionCancelled {
    Address subscriber;
    Address outpost;
    uint32_t tier_id;
};

struct FeeUpdated {
    std::string parameter;      // e.g. "protocol_fee_bps", "weight_a", "treasury"
    uint64_t old_value;
    uint64_t new_value;
    Address old_address{};      // "treasury" / "admin" only
    Address new_address{};
};

using Event = std::variant<PassPurchased, PassSold, OutpostCreated, OutpostUpdated,
                           TierUpdated, SubscriptionCreated, SubscriptionCancelled,
                           FeeUpdated>;

const char* event_name(const Event& event);

// =============================================================================
// Event Sinks (fire-and-forget)
// =============================================================================

class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void publish(const Event& event) = 0;
};

// Hands committed events to the sink in order. A sink that throws is logged
// and skipped. Call with no protocol lock held: sinks may query the protocol.
void publish_all(EventSink& sink, const std::vector<Event>& events);

// No-op sink for when notifications aren't needed
class NullEventSink : public EventSink {
public:
    void publish(const Event&) override {}
};

// Writes each event as one structured log line
class LoggingEventSink : public EventSink {
public:
    void publish(const Event& event) override;
};

// Keeps every event, for tests and replay
class RecordingEventSink : public EventSink {
public:
    void publish(const Event& event) override;

    std::vector<Event> events() const;
    size_t size() const;
    void clear();

    // Events of one alternative, in publish order
    template <typename T>
    std::vector<T> of_type() const {
        std::lock_guard lock(mutex_);
        std::vector<T> out;
        for (const auto& e : events_) {
            if (const T* p = std::get_if<T>(&e)) out.push_back(*p);
        }
        return out;
    }

private:
    std::vector<Event> events_;
    mutable std::mutex mutex_;
};

} // namespace podium

#endif // PODIUM_EVENTS_HPP
