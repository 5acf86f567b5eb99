// SPDX-License-Identifier: MIT
#include "strikeopt/pricing/black_scholes.hpp"
#include "strikeopt/math/black_scholes_analytics.hpp"
#include "strikeopt/support/strikeopt_trace.h"
#include <cmath>

namespace strikeopt {

std::expected<double, NumericError> price_european(const MarketParams& market,
                                                   double strike,
                                                   OptionType type) {
    auto validation = validate_market_params(market);
    if (!validation.has_value()) {
        return std::unexpected(validation.error());
    }
    return price_european_prevalidated(market, strike, type);
}

std::expected<double, NumericError> price_european_prevalidated(const MarketParams& market,
                                                                double strike,
                                                                OptionType type) {
    auto strike_ok = validate_strike(strike);
    if (!strike_ok.has_value()) {
        return std::unexpected(strike_ok.error());
    }

    const double tau = years_from_days(market.days);
    const double sigma_sqrt_tau = market.volatility * std::sqrt(tau);
    if (sigma_sqrt_tau == 0.0) {
        // Positive inputs can still underflow (e.g. v = 1e-200)
        STRIKEOPT_TRACE_PRICING_ERROR(static_cast<int>(NumericErrorCode::ZeroDenominator),
                                      strike, sigma_sqrt_tau);
        return std::unexpected(NumericError(NumericErrorCode::ZeroDenominator, market.volatility));
    }

    const double premium = bs_price(market.spot, strike, tau, market.volatility, market.rate, type);
    if (!std::isfinite(premium)) {
        STRIKEOPT_TRACE_PRICING_ERROR(static_cast<int>(NumericErrorCode::NonFinitePremium),
                                      strike, premium);
        return std::unexpected(NumericError(NumericErrorCode::NonFinitePremium, premium));
    }
    return premium;
}

}  // namespace strikeopt
