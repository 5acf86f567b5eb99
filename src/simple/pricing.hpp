// SPDX-License-Identifier: MIT
#pragma once

#include "strikeopt/optimizer/strike_optimizer.hpp"
#include "strikeopt/option/option_spec.hpp"
#include "strikeopt/support/error_types.hpp"
#include <cstddef>
#include <expected>

namespace strikeopt::simple {

using strikeopt::NumericError;
using strikeopt::OptimizationResult;
using strikeopt::OptionType;

/// Price a European option with Black-Scholes (no dividends)
///
/// @param spot Current underlying price (> 0)
/// @param strike Strike price (> 0)
/// @param rate Risk-free rate (decimal, continuously compounded)
/// @param days Calendar days to expiration (> 0)
/// @param volatility Annualized volatility (decimal, > 0)
/// @param is_call True for a call, false for a put
/// @return Premium or NumericError
std::expected<double, NumericError> price(
    double spot, double strike, double rate,
    double days, double volatility, bool is_call);

/// Find the strike maximizing return on premium for an expected move
///
/// Searches `sample_count` evenly spaced strikes on [0.1 × spot, 3.0 × spot],
/// buying calls when expected_movement > 0 and puts otherwise.
///
/// @param spot Current underlying price (> 0)
/// @param rate Risk-free rate (decimal)
/// @param days Calendar days to expiration (> 0)
/// @param volatility Annualized volatility (decimal, > 0)
/// @param expected_movement Assumed move before expiry (0.3 = +30%)
/// @param sample_count Number of candidate strikes (>= 2)
/// @return Best strike, its profit ratio and the profit curve, or NumericError
std::expected<OptimizationResult, NumericError> optimize(
    double spot, double rate, double days, double volatility,
    double expected_movement,
    size_t sample_count = kDefaultSampleCount);

}  // namespace strikeopt::simple
