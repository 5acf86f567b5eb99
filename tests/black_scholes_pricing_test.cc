// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "strikeopt/pricing/black_scholes.hpp"
#include "strikeopt/math/black_scholes_analytics.hpp"
#include <cmath>
#include <limits>

using namespace strikeopt;

namespace {

MarketParams textbook_market() {
    return MarketParams{.spot = 100.0, .rate = 0.05, .days = 365.0, .volatility = 0.20};
}

}  // namespace

TEST(BlackScholesPricingTest, TextbookCall) {
    auto call = price_european(textbook_market(), 100.0, OptionType::CALL);
    ASSERT_TRUE(call.has_value()) << call.error();
    EXPECT_NEAR(*call, 10.450583572185565, 1e-9);
}

TEST(BlackScholesPricingTest, TextbookPut) {
    auto put = price_european(textbook_market(), 100.0, OptionType::PUT);
    ASSERT_TRUE(put.has_value()) << put.error();
    EXPECT_NEAR(*put, 5.573526022256971, 1e-9);
}

TEST(BlackScholesPricingTest, DefaultScenarioNearTheMoney) {
    // S=280, X=300, r=0.0063, 180 days, v=0.4
    MarketParams market;
    auto call = price_european(market, 300.0, OptionType::CALL);
    auto put = price_european(market, 300.0, OptionType::PUT);
    ASSERT_TRUE(call.has_value());
    ASSERT_TRUE(put.has_value());
    EXPECT_NEAR(*call, 23.684229599318215, 1e-8);
    EXPECT_NEAR(*put, 42.75362118341647, 1e-8);
}

TEST(BlackScholesPricingTest, PutCallParityAcrossStrikes) {
    MarketParams market;
    const double t = years_from_days(market.days);
    for (double strike = 28.0; strike <= 840.0; strike += 37.0) {
        auto call = price_european(market, strike, OptionType::CALL);
        auto put = price_european(market, strike, OptionType::PUT);
        ASSERT_TRUE(call.has_value());
        ASSERT_TRUE(put.has_value());
        const double gap = put_call_parity_gap(*call, *put, market.spot, strike, market.rate, t);
        EXPECT_NEAR(gap, 0.0, 1e-6) << "strike=" << strike;
    }
}

TEST(BlackScholesPricingTest, CallDecreasesAndPutIncreasesWithStrike) {
    MarketParams market;
    double prev_call = std::numeric_limits<double>::infinity();
    double prev_put = -1.0;
    for (double strike = 50.0; strike <= 600.0; strike += 25.0) {
        const double call = *price_european(market, strike, OptionType::CALL);
        const double put = *price_european(market, strike, OptionType::PUT);
        EXPECT_LT(call, prev_call) << "strike=" << strike;
        EXPECT_GT(put, prev_put) << "strike=" << strike;
        prev_call = call;
        prev_put = put;
    }
}

TEST(BlackScholesPricingTest, PricesStayWithinNoArbitrageBounds) {
    MarketParams market;
    const double discount = std::exp(-market.rate * years_from_days(market.days));
    for (double strike : {28.0, 150.0, 280.0, 500.0, 840.0}) {
        const double call = *price_european(market, strike, OptionType::CALL);
        const double put = *price_european(market, strike, OptionType::PUT);
        EXPECT_GE(call, std::max(0.0, market.spot - strike * discount) - 1e-9);
        EXPECT_LE(call, market.spot);
        EXPECT_GE(put, std::max(0.0, strike * discount - market.spot) - 1e-9);
        EXPECT_LE(put, strike * discount + 1e-9);
    }
}

TEST(BlackScholesPricingTest, TinyStrikeCallApproachesSpot) {
    auto call = price_european(textbook_market(), 1e-6, OptionType::CALL);
    ASSERT_TRUE(call.has_value());
    EXPECT_NEAR(*call, 100.0, 1e-5);
}

TEST(BlackScholesPricingTest, HugeStrikeCallIsZero) {
    auto call = price_european(textbook_market(), 1e6, OptionType::CALL);
    ASSERT_TRUE(call.has_value());
    EXPECT_EQ(*call, 0.0);
}

TEST(BlackScholesPricingTest, HigherVolatilityRaisesPremium) {
    MarketParams low;
    MarketParams high = low;
    high.volatility = 0.8;
    EXPECT_GT(*price_european(high, 300.0, OptionType::CALL),
              *price_european(low, 300.0, OptionType::CALL));
    EXPECT_GT(*price_european(high, 250.0, OptionType::PUT),
              *price_european(low, 250.0, OptionType::PUT));
}

TEST(BlackScholesPricingTest, ZeroDaysRejected) {
    MarketParams market;
    market.days = 0.0;
    auto result = price_european(market, 300.0, OptionType::CALL);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, NumericErrorCode::InvalidDays);
}

TEST(BlackScholesPricingTest, ZeroVolatilityRejected) {
    MarketParams market;
    market.volatility = 0.0;
    auto result = price_european(market, 300.0, OptionType::PUT);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, NumericErrorCode::InvalidVolatility);
}

TEST(BlackScholesPricingTest, NonPositiveStrikeRejected) {
    auto result = price_european(MarketParams{}, 0.0, OptionType::CALL);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, NumericErrorCode::InvalidStrike);
}

TEST(BlackScholesPricingTest, UnderflowingDenominatorReported) {
    // Both inputs are valid but v·√t underflows to exactly zero
    MarketParams market{.spot = 100.0, .rate = 0.0, .days = 1e-300, .volatility = 1e-200};
    auto result = price_european(market, 100.0, OptionType::CALL);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, NumericErrorCode::ZeroDenominator);
}

TEST(BlackScholesPricingTest, OverflowingDiscountReported) {
    // e^(-rt) overflows while Φ(d2) underflows, giving inf · 0
    MarketParams market{.spot = 100.0, .rate = -1000.0, .days = 365.0, .volatility = 0.2};
    auto result = price_european(market, 100.0, OptionType::CALL);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, NumericErrorCode::NonFinitePremium);
}

TEST(BlackScholesPricingTest, PrevalidatedMatchesValidated) {
    MarketParams market;
    for (double strike : {28.0, 296.0, 840.0}) {
        EXPECT_DOUBLE_EQ(*price_european(market, strike, OptionType::CALL),
                         *price_european_prevalidated(market, strike, OptionType::CALL));
    }
}
