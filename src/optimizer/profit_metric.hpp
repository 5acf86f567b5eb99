// SPDX-License-Identifier: MIT
/**
 * @file profit_metric.hpp
 * @brief Return on premium of a directional option trade
 */

#pragma once

#include "strikeopt/option/option_spec.hpp"
#include "strikeopt/support/error_types.hpp"
#include <expected>

namespace strikeopt {

/// One evaluated candidate of a strike sweep
struct ProfitPoint {
    double strike;        ///< Candidate strike
    double premium;       ///< Premium paid today
    double profit_ratio;  ///< (payoff - premium) / premium
};

/**
 * @brief Payoff at the assumed future price minus the premium
 *
 * CALL: (future - strike) - premium
 * PUT:  (strike - future) - premium
 *
 * The payoff is not floored at zero: a strike on the wrong side of the
 * future price loses more than the premium, which drives the ratio below -1.
 */
double raw_profit(OptionType type, double future_price, double strike, double premium);

/**
 * @brief Profit ratio raw_profit / premium
 *
 * A non-positive premium makes the ratio meaningless and is reported as
 * ZeroPremium; a non-finite premium or ratio is reported as well. The
 * error index is left at 0 for the caller to fill in.
 */
std::expected<double, NumericError> profit_ratio(OptionType type, double future_price,
                                                 double strike, double premium);

}  // namespace strikeopt
