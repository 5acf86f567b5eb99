// SPDX-License-Identifier: MIT
#include "strikeopt/optimizer/profit_metric.hpp"
#include <cmath>

namespace strikeopt {

double raw_profit(OptionType type, double future_price, double strike, double premium) {
    switch (type) {
        case OptionType::CALL:
            return (future_price - strike) - premium;
        case OptionType::PUT:
            return (strike - future_price) - premium;
    }
    return std::nan("");
}

std::expected<double, NumericError> profit_ratio(OptionType type, double future_price,
                                                 double strike, double premium) {
    if (!std::isfinite(premium)) {
        return std::unexpected(NumericError(NumericErrorCode::NonFinitePremium, premium));
    }
    if (premium <= 0.0) {
        return std::unexpected(NumericError(NumericErrorCode::ZeroPremium, premium));
    }

    const double ratio = raw_profit(type, future_price, strike, premium) / premium;
    if (!std::isfinite(ratio)) {
        return std::unexpected(NumericError(NumericErrorCode::NonFiniteProfit, ratio));
    }
    return ratio;
}

}  // namespace strikeopt
