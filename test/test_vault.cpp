// Podium - Redemption Vault Tests

#include <catch2/catch_test_macros.hpp>

#include <thread>
#include <vector>

#include "test_support.hpp"

using namespace podium;

TEST_CASE("Vault deposit and withdraw", "[vault]") {
    RedemptionVault vault;
    REQUIRE(vault.balance() == 0);

    vault.deposit(500);
    vault.deposit(250);
    REQUIRE(vault.balance() == 750);

    REQUIRE(vault.withdraw(700) == 700);
    REQUIRE(vault.balance() == 50);

    auto stats = vault.get_stats();
    REQUIRE(stats.balance == 50);
    REQUIRE(stats.total_deposited == 750);
    REQUIRE(stats.total_withdrawn == 700);
    REQUIRE(stats.deposits == 2);
    REQUIRE(stats.withdrawals == 1);
}

TEST_CASE("Vault withdrawals are all or nothing", "[vault]") {
    RedemptionVault vault;
    vault.deposit(100);

    REQUIRE_PODIUM_ERROR(vault.withdraw(101), ErrorKind::INSUFFICIENT_VAULT_BALANCE);
    REQUIRE(vault.balance() == 100);
    REQUIRE(vault.get_stats().withdrawals == 0);

    REQUIRE(vault.withdraw(100) == 100);
    REQUIRE(vault.balance() == 0);
    REQUIRE_PODIUM_ERROR(vault.withdraw(1), ErrorKind::INSUFFICIENT_VAULT_BALANCE);
}

TEST_CASE("Vault balance cannot pass 64 bits", "[vault]") {
    RedemptionVault vault;
    vault.deposit(UINT64_MAX);
    REQUIRE_PODIUM_ERROR(vault.deposit(1), ErrorKind::ARITHMETIC_OVERFLOW);
    REQUIRE(vault.balance() == UINT64_MAX);
}

TEST_CASE("Vault under concurrent use", "[vault][concurrency]") {
    RedemptionVault vault;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&vault] {
            for (int i = 0; i < 1000; ++i) {
                vault.deposit(3);
                vault.withdraw(1);
            }
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(vault.balance() == 4 * 1000 * 2);
    REQUIRE(vault.get_stats().deposits == 4000);
}
