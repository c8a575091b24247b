#ifndef PODIUM_TEST_SUPPORT_HPP
#define PODIUM_TEST_SUPPORT_HPP

#include <stdexcept>
#include <string>

#include <catch2/matchers/catch_matchers.hpp>

#include "podium/podium.hpp"

namespace podium::test {

// Matches a PodiumError of one kind
class HasKind : public Catch::Matchers::MatcherBase<PodiumError> {
public:
    explicit HasKind(ErrorKind kind) : kind_(kind) {}

    bool match(const PodiumError& e) const override { return e.kind() == kind_; }

    std::string describe() const override {
        return std::string("has kind ") + to_string(kind_);
    }

private:
    ErrorKind kind_;
};

// Well-known test accounts
constexpr Address ADMIN = address_from_u64(0xA0);
constexpr Address TREASURY = address_from_u64(0xA1);
constexpr Address ALICE = address_from_u64(0x10);
constexpr Address BOB = address_from_u64(0x11);
constexpr Address CAROL = address_from_u64(0x12);
constexpr Address DAVE = address_from_u64(0x13);
constexpr Address SUBJECT = address_from_u64(0x20);

constexpr Amount COIN = constants::OCTA;

// Protocol wired to in-memory collaborators
struct ProtocolFixture {
    MemoryCoinBank bank;
    MemoryPassStore passes;
    ManualClock clock;
    RecordingEventSink events;
    Protocol protocol;

    explicit ProtocolFixture(ProtocolConfig config = ProtocolConfig::create(ADMIN, TREASURY))
        : protocol(config, bank, passes, clock, events) {
        bank.mint(ALICE, 1000 * COIN);
        bank.mint(BOB, 1000 * COIN);
        bank.mint(CAROL, 1000 * COIN);
    }

    Address vault_account() const { return protocol.config().vault_account; }
};

// Delegates to a MemoryCoinBank but refuses credits to one account
class FlakyCoinBank : public ICoinBank {
public:
    explicit FlakyCoinBank(const Address& refused) : refused_(refused) {}

    bool is_registered(const Address& account) const override { return inner.is_registered(account); }
    void register_account(const Address& account) override { inner.register_account(account); }
    Amount balance(const Address& account) const override { return inner.balance(account); }

    void transfer(const Address& from, const Address& to, Amount amount) override {
        if (to == refused_) throw std::runtime_error("transfer refused: " + to_hex(to));
        inner.transfer(from, to, amount);
    }

    MemoryCoinBank inner;

private:
    Address refused_;
};

} // namespace podium::test

#define REQUIRE_PODIUM_ERROR(expr, expected_kind) \
    REQUIRE_THROWS_MATCHES(expr, ::podium::PodiumError, ::podium::test::HasKind(expected_kind))

#endif // PODIUM_TEST_SUPPORT_HPP
