// SPDX-License-Identifier: MIT
/**
 * @file option_spec.hpp
 * @brief Market inputs and option type for a single-trade strike search
 */

#pragma once

#include "strikeopt/support/error_types.hpp"
#include <expected>

namespace strikeopt {

/// Calendar days per year used to convert days to expiration into years
inline constexpr double kDaysPerYear = 365.0;

/**
 * Option type enumeration.
 */
enum class OptionType {
    CALL,
    PUT
};

/// "CALL" or "PUT"
inline const char* option_type_name(OptionType type) {
    return type == OptionType::CALL ? "CALL" : "PUT";
}

/// Directional choice: calls for an expected rise, puts otherwise
///
/// A zero movement selects PUT.
inline OptionType option_type_for_movement(double expected_movement) {
    return expected_movement > 0.0 ? OptionType::CALL : OptionType::PUT;
}

/// Convert calendar days to years (t = days / 365)
inline double years_from_days(double days) {
    return days / kDaysPerYear;
}

/**
 * @brief Market state of the underlying shared by every candidate strike
 *
 * All parameters are in consistent units:
 * - Prices in dollars
 * - Time in calendar days
 * - Rates and volatility as decimals (e.g., 0.05 for 5%)
 */
struct MarketParams {
    double spot = 280.0;          ///< Current underlying price (S)
    double rate = 0.0063;         ///< Risk-free rate, continuously compounded
    double days = 180.0;          ///< Calendar days to expiration
    double volatility = 0.4;      ///< Annualized volatility of log returns
};

/**
 * @brief Validate market parameters
 *
 * Checks for:
 * - Positive, finite spot
 * - Positive, finite days to expiration
 * - Positive, finite volatility
 * - Finite rate (negative rates are tolerated)
 *
 * @param params Market parameters to validate
 * @return void on success, NumericError on failure
 */
std::expected<void, NumericError> validate_market_params(const MarketParams& params);

/// Validate a single strike (positive and finite)
std::expected<void, NumericError> validate_strike(double strike);

}  // namespace strikeopt
