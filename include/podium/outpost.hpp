#ifndef PODIUM_OUTPOST_HPP
#define PODIUM_OUTPOST_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "types.hpp"
#include "subscription.hpp"

namespace podium {

// =============================================================================
// Outpost - an ownable venue
// =============================================================================

struct OutpostInfo {
    Address id;
    Address owner;
    std::string name;
    std::string description;
    std::string uri;
    Amount purchase_price;      // paid to the treasury at creation
    Amount price;               // current listed price
    bool paused;
    uint64_t royalty_numerator; // over ROYALTY_DENOMINATOR
    uint64_t created_at;
    uint32_t tier_count;
};

struct Outpost {
    Address id{};
    Address owner{};
    std::string name;
    std::string description;
    std::string uri;
    Amount purchase_price = 0;
    Amount price = 0;
    bool paused = false;
    uint64_t royalty_numerator = constants::DEFAULT_ROYALTY_NUMERATOR;
    uint64_t created_at = 0;
    SubscriptionBook book;

    OutpostInfo info() const;
};

// =============================================================================
// OutpostRegistry - creation, lookup and owner-gated lifecycle changes
//
// The map itself is guarded internally. Reads or writes of one Outpost's
// fields must happen under that outpost's entity lock (see Protocol).
// =============================================================================

class OutpostRegistry {
public:
    OutpostRegistry() = default;

    // Non-copyable
    OutpostRegistry(const OutpostRegistry&) = delete;
    OutpostRegistry& operator=(const OutpostRegistry&) = delete;

    // Deterministic address for (creator, name)
    static Address derive_address(const Address& creator, const std::string& name);

    // Throws OutpostExists
    Outpost& create(const Address& creator, const std::string& name,
                    const std::string& description, const std::string& uri,
                    Amount purchase_price, uint64_t now);

    // Drops an outpost (undo of create only)
    void remove(const Address& id);

    // Throws OutpostNotFound
    Outpost& get(const Address& id);
    const Outpost& get(const Address& id) const;

    bool exists(const Address& id) const;
    std::optional<OutpostInfo> info(const Address& id) const;
    std::vector<Address> ids() const;
    size_t size() const;

    // =========================================================================
    // Owner Operations
    // =========================================================================

    // Owner only, not while paused
    void update_price(const Address& caller, const Address& id, Amount new_price);

    // Owner only, allowed while paused. Returns the new flag.
    bool toggle_pause(const Address& caller, const Address& id);

    // Owner only, allowed while paused
    void transfer_ownership(const Address& caller, const Address& id, const Address& new_owner);

    // Owner only, not while paused; numerator <= ROYALTY_DENOMINATOR
    void set_royalty(const Address& caller, const Address& id, uint64_t numerator);

    // Admin override; authorization is the caller's job
    void set_paused(const Address& id, bool paused);

    // Throws NotOwner / EmergencyPause
    static void require_owner(const Outpost& outpost, const Address& caller);
    static void require_not_paused(const Outpost& outpost);

private:
    std::unordered_map<Address, std::unique_ptr<Outpost>, AddressHasher> outposts_;
    mutable std::shared_mutex mutex_;
};

} // namespace podium

#endif // PODIUM_OUTPOST_HPP
