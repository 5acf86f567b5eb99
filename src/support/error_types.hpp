// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <ostream>
#include <sstream>
#include <string>

namespace strikeopt {

/// Error codes for pricing and strike search failures
///
/// The first group are precondition violations, rejected before any
/// computation. The second group are numeric degeneracies raised while
/// evaluating a single candidate.
enum class NumericErrorCode {
    // Precondition violations
    InvalidSpot,
    InvalidStrike,
    InvalidRate,
    InvalidDays,
    InvalidVolatility,
    InvalidMovement,
    InvalidSampleCount,
    InvalidStrikeRange,

    // Numeric degeneracy
    ZeroDenominator,
    ZeroPremium,
    NonFinitePremium,
    NonFiniteProfit,
    NoValidCandidates
};

/// Detailed numeric error passed through the expected failure path
struct NumericError {
    NumericErrorCode code;
    double value;   // The offending value (input, premium or ratio)
    size_t index;   // Candidate index for sweep errors (0 if not applicable)

    NumericError(NumericErrorCode code,
                 double value = 0.0,
                 size_t index = 0)
        : code(code), value(value), index(index) {}
};

/// True for errors caused by invalid inputs rather than by the numerics
inline bool is_precondition_error(NumericErrorCode code) {
    switch (code) {
        case NumericErrorCode::InvalidSpot:
        case NumericErrorCode::InvalidStrike:
        case NumericErrorCode::InvalidRate:
        case NumericErrorCode::InvalidDays:
        case NumericErrorCode::InvalidVolatility:
        case NumericErrorCode::InvalidMovement:
        case NumericErrorCode::InvalidSampleCount:
        case NumericErrorCode::InvalidStrikeRange:
            return true;
        case NumericErrorCode::ZeroDenominator:
        case NumericErrorCode::ZeroPremium:
        case NumericErrorCode::NonFinitePremium:
        case NumericErrorCode::NonFiniteProfit:
        case NumericErrorCode::NoValidCandidates:
            return false;
    }
    return false;
}

/// Short identifier of an error code, e.g. "InvalidVolatility"
inline const char* error_code_name(NumericErrorCode code) {
    switch (code) {
        case NumericErrorCode::InvalidSpot:         return "InvalidSpot";
        case NumericErrorCode::InvalidStrike:       return "InvalidStrike";
        case NumericErrorCode::InvalidRate:         return "InvalidRate";
        case NumericErrorCode::InvalidDays:         return "InvalidDays";
        case NumericErrorCode::InvalidVolatility:   return "InvalidVolatility";
        case NumericErrorCode::InvalidMovement:     return "InvalidMovement";
        case NumericErrorCode::InvalidSampleCount:  return "InvalidSampleCount";
        case NumericErrorCode::InvalidStrikeRange:  return "InvalidStrikeRange";
        case NumericErrorCode::ZeroDenominator:     return "ZeroDenominator";
        case NumericErrorCode::ZeroPremium:         return "ZeroPremium";
        case NumericErrorCode::NonFinitePremium:    return "NonFinitePremium";
        case NumericErrorCode::NonFiniteProfit:     return "NonFiniteProfit";
        case NumericErrorCode::NoValidCandidates:   return "NoValidCandidates";
    }
    return "Unknown";
}

/// Human-readable description of an error, suitable for CLI output
inline std::string describe(const NumericError& err) {
    std::ostringstream oss;
    switch (err.code) {
        case NumericErrorCode::InvalidSpot:
            oss << "spot price must be positive and finite (got " << err.value << ")";
            break;
        case NumericErrorCode::InvalidStrike:
            oss << "strike price must be positive and finite (got " << err.value << ")";
            break;
        case NumericErrorCode::InvalidRate:
            oss << "risk-free rate must be finite (got " << err.value << ")";
            break;
        case NumericErrorCode::InvalidDays:
            oss << "days to expiration must be positive and finite (got " << err.value << ")";
            break;
        case NumericErrorCode::InvalidVolatility:
            oss << "volatility must be positive and finite (got " << err.value << ")";
            break;
        case NumericErrorCode::InvalidMovement:
            oss << "expected price movement must be finite (got " << err.value << ")";
            break;
        case NumericErrorCode::InvalidSampleCount:
            oss << "sample count must be at least 2 (got " << err.value << ")";
            break;
        case NumericErrorCode::InvalidStrikeRange:
            oss << "strike range fractions must be positive, finite and increasing (got "
                << err.value << ")";
            break;
        case NumericErrorCode::ZeroDenominator:
            oss << "volatility * sqrt(t) evaluated to zero (volatility " << err.value << ")";
            break;
        case NumericErrorCode::ZeroPremium:
            oss << "premium is not positive at candidate " << err.index
                << " (premium " << err.value << ")";
            break;
        case NumericErrorCode::NonFinitePremium:
            oss << "premium is not finite at candidate " << err.index;
            break;
        case NumericErrorCode::NonFiniteProfit:
            oss << "profit ratio is not finite at candidate " << err.index;
            break;
        case NumericErrorCode::NoValidCandidates:
            oss << "no valid candidates among " << err.index << " strikes";
            break;
    }
    return oss.str();
}

/// Output stream operator for NumericError
inline std::ostream& operator<<(std::ostream& os, const NumericError& err) {
    os << "NumericError{code=" << error_code_name(err.code)
       << ", value=" << err.value
       << ", index=" << err.index << "}";
    return os;
}

}  // namespace strikeopt
