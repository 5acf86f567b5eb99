// SPDX-License-Identifier: MIT
/**
 * @file black_scholes.hpp
 * @brief Validated Black-Scholes pricing of European options without dividends
 */

#pragma once

#include "strikeopt/option/option_spec.hpp"
#include "strikeopt/support/error_types.hpp"
#include <expected>

namespace strikeopt {

/**
 * @brief Theoretical premium of a European option (Black-Scholes, no dividends)
 *
 * t = days / 365
 * d1 = [ln(S/X) + (r + v²/2)t] / (v√t)
 * d2 = [ln(S/X) + (r - v²/2)t] / (v√t)
 * CALL: S·Φ(d1) - X·e^(-rt)·Φ(d2)
 * PUT:  X·e^(-rt)·Φ(-d2) - S·Φ(-d1)
 *
 * Precondition violations (non-positive spot/strike/days/volatility, non-finite
 * rate) are rejected before computing. A zero v·√t or a non-finite result is
 * reported as an error rather than returned as NaN/Inf.
 *
 * Pure and thread-safe.
 *
 * @param market Spot, rate, days to expiration, volatility
 * @param strike Strike price
 * @param type CALL or PUT
 * @return Premium, or NumericError
 */
std::expected<double, NumericError> price_european(const MarketParams& market,
                                                   double strike,
                                                   OptionType type);

/// Same as price_european() but skips the market checks
///
/// For callers that validated the MarketParams once and price many strikes.
/// The strike and the numerics are still checked.
std::expected<double, NumericError> price_european_prevalidated(const MarketParams& market,
                                                                double strike,
                                                                OptionType type);

}  // namespace strikeopt
