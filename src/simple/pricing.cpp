// SPDX-License-Identifier: MIT
#include "strikeopt/simple/pricing.hpp"
#include "strikeopt/pricing/black_scholes.hpp"

namespace strikeopt::simple {

std::expected<double, NumericError> price(
    double spot, double strike, double rate,
    double days, double volatility, bool is_call)
{
    MarketParams market;
    market.spot = spot;
    market.rate = rate;
    market.days = days;
    market.volatility = volatility;

    return price_european(market, strike, is_call ? OptionType::CALL : OptionType::PUT);
}

std::expected<OptimizationResult, NumericError> optimize(
    double spot, double rate, double days, double volatility,
    double expected_movement,
    size_t sample_count)
{
    StrikeOptimizerConfig config;
    config.market.spot = spot;
    config.market.rate = rate;
    config.market.days = days;
    config.market.volatility = volatility;
    config.expected_movement = expected_movement;
    config.sample_count = sample_count;

    auto optimizer = StrikeOptimizer::create(config);
    if (!optimizer.has_value()) {
        return std::unexpected(optimizer.error());
    }
    return optimizer->solve();
}

}  // namespace strikeopt::simple
