#ifndef PODIUM_PORTS_HPP
#define PODIUM_PORTS_HPP

#include <cstdint>
#include <string>

#include "types.hpp"

namespace podium {

// =============================================================================
// Collaborator Interfaces
//
// The engine prices, splits and accounts. Moving settlement currency, keeping
// fungible pass balances and telling time belong to the host.
// =============================================================================

// Settlement currency. Recipients may not be registered yet.
class ICoinBank {
public:
    virtual ~ICoinBank() = default;

    virtual bool is_registered(const Address& account) const = 0;
    virtual void register_account(const Address& account) = 0;
    virtual Amount balance(const Address& account) const = 0;

    // Throws PodiumError(InsufficientCallerBalance) if `from` is short.
    // Throws std::invalid_argument if `to` is not registered.
    virtual void transfer(const Address& from, const Address& to, Amount amount) = 0;
};

// Registers `to` on first use, then transfers. Zero amounts are no-ops.
void pay(ICoinBank& bank, const Address& from, const Address& to, Amount amount);

// Fungible units keyed by symbol
class IFungibleStore {
public:
    virtual ~IFungibleStore() = default;

    virtual void mint(const std::string& symbol, const Address& to, Units amount) = 0;

    // Throws PodiumError(InsufficientCallerBalance) if `from` holds less
    virtual void burn(const std::string& symbol, const Address& from, Units amount) = 0;
    virtual void transfer(const std::string& symbol, const Address& from,
                          const Address& to, Units amount) = 0;
    virtual Units balance(const std::string& symbol, const Address& account) const = 0;
};

// Wall clock in seconds
class IClock {
public:
    virtual ~IClock() = default;
    virtual uint64_t now() const = 0;
};

class SystemClock : public IClock {
public:
    uint64_t now() const override;
};

} // namespace podium

#endif // PODIUM_PORTS_HPP
