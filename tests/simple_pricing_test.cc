// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "strikeopt/simple/simple.hpp"
#include <cmath>

namespace {

// ===========================================================================
// price() tests
// ===========================================================================

TEST(SimplePricingTest, ATMCall) {
    auto result = strikeopt::simple::price(
        100.0,  // spot
        100.0,  // strike
        0.05,   // rate
        365.0,  // days
        0.20,   // volatility
        true);

    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_NEAR(*result, 10.450583572185565, 1e-9);
}

TEST(SimplePricingTest, ATMPut) {
    auto result = strikeopt::simple::price(100.0, 100.0, 0.05, 365.0, 0.20, false);
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_NEAR(*result, 5.573526022256971, 1e-9);
}

TEST(SimplePricingTest, DeepOTMPut) {
    auto result = strikeopt::simple::price(
        200.0,  // spot (deep OTM for put)
        100.0,  // strike
        0.05,   // rate
        90.0,   // short expiry
        0.20,   // volatility
        false);

    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_NEAR(*result, 0.0, 1e-6);
}

TEST(SimplePricingTest, InvalidSpotReturnsError) {
    auto result = strikeopt::simple::price(-1.0, 100.0, 0.05, 365.0, 0.20, true);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, strikeopt::NumericErrorCode::InvalidSpot);
}

TEST(SimplePricingTest, ZeroDaysReturnsError) {
    auto result = strikeopt::simple::price(100.0, 100.0, 0.05, 0.0, 0.20, true);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, strikeopt::NumericErrorCode::InvalidDays);
}

// ===========================================================================
// optimize() tests
// ===========================================================================

TEST(SimpleOptimizeTest, DefaultScenario) {
    auto result = strikeopt::simple::optimize(
        280.0,   // spot
        0.0063,  // rate
        180.0,   // days
        0.4,     // volatility
        0.3);    // expected movement

    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(result->option_type, strikeopt::OptionType::CALL);
    EXPECT_NEAR(result->best_strike, 296.228228228228, 1e-9);
    EXPECT_NEAR(result->best_profit_ratio, 1.705865442994, 1e-9);
}

TEST(SimpleOptimizeTest, CustomSampleCount) {
    auto result = strikeopt::simple::optimize(280.0, 0.0063, 180.0, 0.4, 0.3, 100);
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(result->evaluated_count, 100u);
    EXPECT_NEAR(result->best_strike, 298.666666666667, 1e-9);
}

TEST(SimpleOptimizeTest, BearishMove) {
    auto result = strikeopt::simple::optimize(280.0, 0.0063, 180.0, 0.4, -0.3);
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(result->option_type, strikeopt::OptionType::PUT);
    EXPECT_LT(result->best_strike, 280.0);
}

TEST(SimpleOptimizeTest, SingleSampleRejected) {
    auto result = strikeopt::simple::optimize(280.0, 0.0063, 180.0, 0.4, 0.3, 1);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, strikeopt::NumericErrorCode::InvalidSampleCount);
}

TEST(SimpleOptimizeTest, ZeroVolatilityRejected) {
    auto result = strikeopt::simple::optimize(280.0, 0.0063, 180.0, 0.0, 0.3);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, strikeopt::NumericErrorCode::InvalidVolatility);
}

}  // namespace
