// =============================================================================
// ports.cpp - System clock and settlement helper
// =============================================================================

#include "podium/ports.hpp"

#include <chrono>

namespace podium {

// =============================================================================
// Clock & Settlement
// =============================================================================

uint64_t SystemClock::now() const {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

void pay(ICoinBank& bank, const Address& from, const Address& to, Amount amount) {
    if (amount == 0) return;
    if (!bank.is_registered(to)) {
        bank.register_account(to);
    }
    bank.transfer(from, to, amount);
}

} // namespace podium
