// Podium - Pass Ledger & Registry Tests

#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"

using namespace podium;
using namespace podium::test;

TEST_CASE("Ledger entries are created lazily", "[ledger]") {
    PassLedger ledger;
    REQUIRE_FALSE(ledger.contains(SUBJECT));
    REQUIRE(ledger.total_supply(SUBJECT) == 0);
    REQUIRE_FALSE(ledger.get(SUBJECT).has_value());

    PassStats stats = ledger.get_or_create(SUBJECT);
    REQUIRE(stats.total_supply == 0);
    REQUIRE(stats.last_price == constants::INITIAL_PRICE);
    REQUIRE(ledger.contains(SUBJECT));
    REQUIRE(ledger.targets().size() == 1);
}

TEST_CASE("Ledger buys and sells", "[ledger]") {
    PassLedger ledger;

    ledger.record_buy(SUBJECT, 5, 700);
    REQUIRE(ledger.total_supply(SUBJECT) == 5);
    REQUIRE(ledger.get(SUBJECT)->last_price == 700);

    ledger.record_sell(SUBJECT, 2, 300);
    REQUIRE(ledger.total_supply(SUBJECT) == 3);
    REQUIRE(ledger.get(SUBJECT)->last_price == 300);

    SECTION("Selling more than the supply fails and changes nothing") {
        REQUIRE_PODIUM_ERROR(ledger.record_sell(SUBJECT, 4, 1), ErrorKind::SUPPLY_UNDERFLOW);
        REQUIRE(ledger.total_supply(SUBJECT) == 3);
        REQUIRE(ledger.get(SUBJECT)->last_price == 300);
    }

    SECTION("Selling from an untouched target underflows") {
        REQUIRE_PODIUM_ERROR(ledger.record_sell(ALICE, 1, 1), ErrorKind::SUPPLY_UNDERFLOW);
    }

    SECTION("Supply is capped") {
        REQUIRE_PODIUM_ERROR(ledger.record_buy(SUBJECT, constants::MAX_SUPPLY, 1),
                             ErrorKind::INVALID_AMOUNT);
        REQUIRE(ledger.total_supply(SUBJECT) == 3);
    }

    SECTION("Restore writes the entry back") {
        ledger.restore(SUBJECT, PassStats{1, 42});
        REQUIRE(ledger.total_supply(SUBJECT) == 1);
        REQUIRE(ledger.get(SUBJECT)->last_price == 42);
    }
}

TEST_CASE("Pass registry hands out one symbol per target", "[ledger][registry]") {
    MemoryPassStore store;
    PassRegistry registry(store);

    REQUIRE_FALSE(registry.find(SUBJECT).has_value());

    PassHandle passes = registry.get_or_create(SUBJECT);
    REQUIRE(passes.target() == SUBJECT);
    REQUIRE(passes.symbol() == "PASS-" + to_hex(SUBJECT).substr(2));
    REQUIRE(registry.get_or_create(SUBJECT).symbol() == passes.symbol());
    REQUIRE(registry.size() == 1);

    // Short addresses must not collide
    REQUIRE(PassRegistry::symbol_for(address_from_u64(1)) !=
            PassRegistry::symbol_for(address_from_u64(2)));

    passes.mint(ALICE, 3);
    passes.transfer(ALICE, BOB, 1);
    REQUIRE(passes.balance(ALICE) == 2);
    REQUIRE(passes.balance(BOB) == 1);
    REQUIRE(store.circulating(passes.symbol()) == 3);

    passes.burn(ALICE, 2);
    REQUIRE(passes.balance(ALICE) == 0);
    REQUIRE_PODIUM_ERROR(passes.burn(BOB, 2), ErrorKind::INSUFFICIENT_CALLER_BALANCE);
    REQUIRE_PODIUM_ERROR(passes.transfer(ALICE, BOB, 1), ErrorKind::INSUFFICIENT_CALLER_BALANCE);
}

TEST_CASE("Coin bank registers recipients on pay", "[ledger][bank]") {
    MemoryCoinBank bank;
    bank.mint(ALICE, 100);
    REQUIRE(bank.is_registered(ALICE));
    REQUIRE_FALSE(bank.is_registered(BOB));

    REQUIRE_THROWS_AS(bank.transfer(ALICE, BOB, 10), std::invalid_argument);

    pay(bank, ALICE, BOB, 10);
    REQUIRE(bank.is_registered(BOB));
    REQUIRE(bank.balance(ALICE) == 90);
    REQUIRE(bank.balance(BOB) == 10);
    REQUIRE(bank.total_supply() == 100);

    pay(bank, ALICE, CAROL, 0);
    REQUIRE_FALSE(bank.is_registered(CAROL));

    REQUIRE_PODIUM_ERROR(pay(bank, BOB, ALICE, 11), ErrorKind::INSUFFICIENT_CALLER_BALANCE);
}
