// Podium - Fee Splitter Tests

#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"

using namespace podium;

namespace {

FeeSplitter splitter(uint32_t protocol_bps, uint32_t subject_bps, uint32_t referral_bps,
                     uint32_t sub_protocol_bps = 500, uint32_t sub_referrer_bps = 1000) {
    FeeConfig trade{protocol_bps, subject_bps, referral_bps};
    SubscriptionFeeConfig subscription{sub_protocol_bps, sub_referrer_bps};
    return FeeSplitter(trade, subscription);
}

} // namespace

TEST_CASE("Buy fees are surcharges", "[fees]") {
    FeeSplitter fees = splitter(400, 800, 200);

    SECTION("Without referrer") {
        BuySplit split = fees.split_buy(100000000, false);
        REQUIRE(split.base == 100000000);
        REQUIRE(split.protocol_fee == 4000000);
        REQUIRE(split.subject_fee == 8000000);
        REQUIRE(split.referral_fee == 0);
        REQUIRE(split.total() == 112000000);
    }

    SECTION("With referrer") {
        BuySplit split = fees.split_buy(100000000, true);
        REQUIRE(split.referral_fee == 2000000);
        REQUIRE(split.total() == 114000000);
    }

    SECTION("Truncates each share independently") {
        BuySplit split = fees.split_buy(99, true);
        REQUIRE(split.protocol_fee == 3);
        REQUIRE(split.subject_fee == 7);
        REQUIRE(split.referral_fee == 1);
        REQUIRE(split.total() == 99 + 3 + 7 + 1);
    }

    SECTION("Total is exact across fee settings") {
        for (uint32_t bps : {0u, 1u, 250u, 5000u, 10000u}) {
            FeeSplitter f = splitter(bps, bps, bps);
            for (Amount price : {Amount{1}, Amount{7}, Amount{12345}, Amount{100000000}}) {
                BuySplit split = f.split_buy(price, true);
                REQUIRE(split.base == price);
                REQUIRE(split.total() ==
                        split.base + split.protocol_fee + split.subject_fee + split.referral_fee);
            }
        }
    }

    SECTION("Total past 64 bits overflows loudly") {
        BuySplit split = splitter(10000, 0, 0).split_buy(UINT64_MAX / 2 + 1, false);
        REQUIRE_PODIUM_ERROR(split.total(), ErrorKind::ARITHMETIC_OVERFLOW);
    }
}

TEST_CASE("Sell fees are deductions", "[fees]") {
    FeeSplitter fees = splitter(400, 800, 200);

    SECTION("Basic split") {
        SellSplit split = fees.split_sell(100);
        REQUIRE(split.price == 100);
        REQUIRE(split.protocol_fee == 4);
        REQUIRE(split.subject_fee == 8);
        REQUIRE(split.net_to_seller == 88);
    }

    SECTION("Nothing left for the seller") {
        REQUIRE_PODIUM_ERROR(splitter(5000, 5000, 0).split_sell(100), ErrorKind::INVALID_AMOUNT);
        REQUIRE_PODIUM_ERROR(fees.split_sell(0), ErrorKind::INVALID_AMOUNT);
    }

    SECTION("Zero fees pass the price through") {
        SellSplit split = splitter(0, 0, 0).split_sell(100);
        REQUIRE(split.net_to_seller == 100);
    }
}

TEST_CASE("Subscription fees are deductions", "[fees]") {
    SECTION("Protocol and referrer shares") {
        FeeSplitter fees = splitter(0, 0, 0, 400, 800);
        SubscriptionSplit split = fees.split_subscription(100, true);
        REQUIRE(split.protocol_fee == 4);
        REQUIRE(split.referral_fee == 8);
        REQUIRE(split.owner_share == 88);
    }

    SECTION("No referrer leaves the referrer share with the owner") {
        FeeSplitter fees = splitter(0, 0, 0, 400, 800);
        SubscriptionSplit split = fees.split_subscription(100, false);
        REQUIRE(split.protocol_fee == 4);
        REQUIRE(split.referral_fee == 0);
        REQUIRE(split.owner_share == 96);
    }

    SECTION("Fees that eat the whole price are rejected") {
        FeeSplitter fees = splitter(0, 0, 0, 6000, 4000);
        REQUIRE_PODIUM_ERROR(fees.split_subscription(100, true), ErrorKind::INVALID_AMOUNT);
        REQUIRE_NOTHROW(fees.split_subscription(100, false));
    }

    SECTION("Built from a protocol config") {
        FeeSplitter fees(ProtocolConfig::create(test::ADMIN, test::TREASURY));
        SubscriptionSplit split = fees.split_subscription(10000, true);
        REQUIRE(split.protocol_fee == 500);
        REQUIRE(split.referral_fee == 1000);
        REQUIRE(split.owner_share == 8500);
    }
}
