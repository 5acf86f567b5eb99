// SPDX-License-Identifier: MIT
#pragma once

#include <cmath>

#include "strikeopt/option/option_spec.hpp"

namespace strikeopt {

/// Standard normal PDF: φ(x) = exp(-x²/2) / sqrt(2π)
inline double norm_pdf(double x) {
    static constexpr double kInvSqrt2Pi = 0.3989422804014327;  // 1/sqrt(2π)
    return kInvSqrt2Pi * std::exp(-0.5 * x * x);
}

/// Standard normal CDF: Φ(x) = erfc(-x/√2) / 2
///
/// erfc keeps full relative precision in the lower tail, where
/// 1 + erf(x) would cancel.
inline double norm_cdf(double x) {
    return 0.5 * std::erfc(-x * M_SQRT1_2);
}

/// Black-Scholes d1 term
/// d1 = [ln(S/K) + (r + σ²/2)τ] / (σ√τ)
inline double bs_d1(double spot, double strike, double tau, double sigma, double rate) {
    double sigma_sqrt_tau = sigma * std::sqrt(tau);
    return (std::log(spot / strike) + (rate + 0.5 * sigma * sigma) * tau) / sigma_sqrt_tau;
}

/// Black-Scholes d2 term
/// d2 = [ln(S/K) + (r - σ²/2)τ] / (σ√τ)
inline double bs_d2(double spot, double strike, double tau, double sigma, double rate) {
    double sigma_sqrt_tau = sigma * std::sqrt(tau);
    return (std::log(spot / strike) + (rate - 0.5 * sigma * sigma) * tau) / sigma_sqrt_tau;
}

/// Black-Scholes European option price, no dividends
///
/// No input checks: callers must pass spot, strike, tau, sigma > 0.
/// See price_european() for the validated entry point.
///
/// @param spot Current underlying price
/// @param strike Strike price
/// @param tau Time to expiry in years
/// @param sigma Volatility
/// @param rate Risk-free rate
/// @param option_type PUT or CALL
/// @return European option price
inline double bs_price(double spot, double strike, double tau, double sigma, double rate,
                       OptionType option_type) {
    double d1 = bs_d1(spot, strike, tau, sigma, rate);
    double d2 = bs_d2(spot, strike, tau, sigma, rate);
    double exp_rt = std::exp(-rate * tau);

    if (option_type == OptionType::PUT) {
        return strike * exp_rt * norm_cdf(-d2) - spot * norm_cdf(-d1);
    } else {
        return spot * norm_cdf(d1) - strike * exp_rt * norm_cdf(d2);
    }
}

/// Put-call parity gap: C - P - (S - K·e^(-rτ))
///
/// Zero (up to rounding) for any consistent European pricer without dividends.
inline double put_call_parity_gap(double call, double put, double spot, double strike,
                                  double rate, double tau) {
    return call - put - (spot - strike * std::exp(-rate * tau));
}

}  // namespace strikeopt
