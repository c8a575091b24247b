// Podium - Math Tests

#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"

using namespace podium;

namespace {

U128 naive_summation(uint64_t n) {
    U128 wide = n;
    return wide * (wide + 1) * (2 * wide + 1) / 6;
}

} // namespace

TEST_CASE("Sum of squares", "[math]") {
    SECTION("Small values") {
        REQUIRE((math::summation(0) == 0));
        REQUIRE((math::summation(1) == 1));
        REQUIRE((math::summation(2) == 5));
        REQUIRE((math::summation(3) == 14));
        REQUIRE((math::summation(23) == 4324));
    }

    SECTION("Matches the closed form for every residue mod 6") {
        for (uint64_t n = 1; n <= 600; ++n) {
            REQUIRE((math::summation(n) == naive_summation(n)));
        }
    }

    SECTION("Largest supply level stays exact") {
        uint64_t n = constants::MAX_SUPPLY + constants::MAX_WEIGHT_C - 1;
        REQUIRE((math::summation(n) == naive_summation(n)));
        REQUIRE((math::summation(n) == static_cast<U128>(333432843233828350ULL)));
    }
}

TEST_CASE("Basis point helpers", "[math]") {
    REQUIRE(math::bps_of(100, 400) == 4);
    REQUIRE(math::bps_of(100, 800) == 8);
    REQUIRE(math::bps_of(99, 100) == 0);
    REQUIRE(math::bps_of(constants::OCTA, constants::BPS) == constants::OCTA);

    // No intermediate overflow at the top of the range
    REQUIRE(math::bps_of(UINT64_MAX, constants::BPS) == UINT64_MAX);
}

TEST_CASE("Narrowing to 64 bits", "[math]") {
    REQUIRE(math::narrow(static_cast<U128>(UINT64_MAX), "x") == UINT64_MAX);
    REQUIRE_PODIUM_ERROR(math::narrow(static_cast<U128>(UINT64_MAX) + 1, "x"),
                         ErrorKind::ARITHMETIC_OVERFLOW);
    REQUIRE(math::checked_add(1, 2, "x") == 3);
    REQUIRE_PODIUM_ERROR(math::checked_add(UINT64_MAX, 1, "x"), ErrorKind::ARITHMETIC_OVERFLOW);
}

TEST_CASE("Address helpers", "[math][types]") {
    Address a = address_from_u64(0x123);
    REQUIRE(to_hex(a) == "0x0000000000000000000000000000000000000000000000000000000000000123");
    REQUIRE(address_from_hex("0x123") == a);
    REQUIRE(address_from_hex(to_hex(a)) == a);
    REQUIRE(is_zero_address(ZERO_ADDRESS));
    REQUIRE_FALSE(is_zero_address(a));
    REQUIRE_THROWS_AS(address_from_hex("0xzz"), std::invalid_argument);
    REQUIRE_THROWS_AS(address_from_hex(""), std::invalid_argument);
}

TEST_CASE("Duration classes", "[math][types]") {
    REQUIRE(duration_seconds(DurationClass::WEEK) == 604800);
    REQUIRE(duration_seconds(DurationClass::MONTH) == 2592000);
    REQUIRE(duration_seconds(DurationClass::YEAR) == 31536000);
    REQUIRE(duration_from_u8(2) == DurationClass::MONTH);
    REQUIRE_PODIUM_ERROR(duration_from_u8(0), ErrorKind::INVALID_DURATION);
    REQUIRE_PODIUM_ERROR(duration_from_u8(4), ErrorKind::INVALID_DURATION);
    REQUIRE_PODIUM_ERROR(duration_seconds(static_cast<DurationClass>(9)),
                         ErrorKind::INVALID_DURATION);
}
