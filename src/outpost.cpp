// =============================================================================
// outpost.cpp - Outpost registry and owner operations
// =============================================================================

#include "podium/outpost.hpp"
#include "podium/error.hpp"

#include <mutex>

namespace podium {

namespace {

constexpr const char* COLLECTION_NAME = "PodiumOutposts";

} // namespace

OutpostInfo Outpost::info() const {
    return OutpostInfo{id, owner, name, description, uri, purchase_price, price,
                       paused, royalty_numerator, created_at, book.tier_count()};
}

// =============================================================================
// Addressing
// =============================================================================

Address OutpostRegistry::derive_address(const Address& creator, const std::string& name) {
    // Four FNV-1a lanes over creator || collection || "::" || name
    Address addr{};
    for (size_t lane = 0; lane < 4; ++lane) {
        uint64_t h = 14695981039346656037ULL ^ lane;
        auto mix = [&h](uint8_t b) {
            h ^= b;
            h *= 1099511628211ULL;
        };
        for (auto b : creator) mix(b);
        for (const char* p = COLLECTION_NAME; *p; ++p) mix(static_cast<uint8_t>(*p));
        mix(':');
        mix(':');
        for (char c : name) mix(static_cast<uint8_t>(c));

        for (size_t i = 0; i < 8; ++i) {
            addr[lane * 8 + i] = static_cast<uint8_t>((h >> (56 - 8 * i)) & 0xFF);
        }
    }
    return addr;
}

// =============================================================================
// Registry
// =============================================================================

Outpost& OutpostRegistry::create(const Address& creator, const std::string& name,
                                 const std::string& description, const std::string& uri,
                                 Amount purchase_price, uint64_t now) {
    Address id = derive_address(creator, name);

    std::unique_lock lock(mutex_);
    if (outposts_.find(id) != outposts_.end()) {
        throw PodiumError(ErrorKind::OUTPOST_EXISTS, "'" + name + "' by " + to_hex(creator));
    }

    auto outpost = std::make_unique<Outpost>();
    outpost->id = id;
    outpost->owner = creator;
    outpost->name = name;
    outpost->description = description;
    outpost->uri = uri;
    outpost->purchase_price = purchase_price;
    outpost->price = purchase_price;
    outpost->created_at = now;

    Outpost& ref = *outpost;
    outposts_.emplace(id, std::move(outpost));
    return ref;
}

void OutpostRegistry::remove(const Address& id) {
    std::unique_lock lock(mutex_);
    outposts_.erase(id);
}

Outpost& OutpostRegistry::get(const Address& id) {
    std::shared_lock lock(mutex_);
    auto it = outposts_.find(id);
    if (it == outposts_.end()) {
        throw PodiumError(ErrorKind::OUTPOST_NOT_FOUND, to_hex(id));
    }
    return *it->second;
}

const Outpost& OutpostRegistry::get(const Address& id) const {
    std::shared_lock lock(mutex_);
    auto it = outposts_.find(id);
    if (it == outposts_.end()) {
        throw PodiumError(ErrorKind::OUTPOST_NOT_FOUND, to_hex(id));
    }
    return *it->second;
}

bool OutpostRegistry::exists(const Address& id) const {
    std::shared_lock lock(mutex_);
    return outposts_.find(id) != outposts_.end();
}

std::optional<OutpostInfo> OutpostRegistry::info(const Address& id) const {
    std::shared_lock lock(mutex_);
    auto it = outposts_.find(id);
    if (it == outposts_.end()) return std::nullopt;
    return it->second->info();
}

std::vector<Address> OutpostRegistry::ids() const {
    std::shared_lock lock(mutex_);
    std::vector<Address> result;
    result.reserve(outposts_.size());
    for (const auto& [id, outpost] : outposts_) {
        result.push_back(id);
    }
    return result;
}

size_t OutpostRegistry::size() const {
    std::shared_lock lock(mutex_);
    return outposts_.size();
}

// =============================================================================
// Owner Operations
// =============================================================================

void OutpostRegistry::require_owner(const Outpost& outpost, const Address& caller) {
    if (outpost.owner != caller) {
        throw PodiumError(ErrorKind::NOT_OWNER,
                          to_hex(caller) + " does not own " + to_hex(outpost.id));
    }
}

void OutpostRegistry::require_not_paused(const Outpost& outpost) {
    if (outpost.paused) {
        throw PodiumError(ErrorKind::EMERGENCY_PAUSE, to_hex(outpost.id) + " is paused");
    }
}

void OutpostRegistry::update_price(const Address& caller, const Address& id, Amount new_price) {
    Outpost& outpost = get(id);
    require_owner(outpost, caller);
    require_not_paused(outpost);
    outpost.price = new_price;
}

bool OutpostRegistry::toggle_pause(const Address& caller, const Address& id) {
    Outpost& outpost = get(id);
    require_owner(outpost, caller);
    outpost.paused = !outpost.paused;
    return outpost.paused;
}

void OutpostRegistry::transfer_ownership(const Address& caller, const Address& id,
                                         const Address& new_owner) {
    Outpost& outpost = get(id);
    require_owner(outpost, caller);
    outpost.owner = new_owner;
}

void OutpostRegistry::set_royalty(const Address& caller, const Address& id, uint64_t numerator) {
    Outpost& outpost = get(id);
    require_owner(outpost, caller);
    require_not_paused(outpost);
    if (numerator > constants::ROYALTY_DENOMINATOR) {
        throw PodiumError(ErrorKind::INVALID_AMOUNT,
                          "royalty " + std::to_string(numerator) + "/100");
    }
    outpost.royalty_numerator = numerator;
}

void OutpostRegistry::set_paused(const Address& id, bool paused) {
    get(id).paused = paused;
}

} // namespace podium
