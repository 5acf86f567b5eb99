// SPDX-License-Identifier: MIT
#include "strikeopt/optimizer/profit_curve.hpp"
#include <utility>

namespace strikeopt {

// ===========================================================================
// ProfitModel
// ===========================================================================

ProfitModel::ProfitModel(StrikeGrid grid, OptionType type, double future_price,
                         PremiumFunction premium)
    : grid_(grid)
    , type_(type)
    , future_price_(future_price)
    , premium_(std::move(premium))
{}

std::expected<ProfitPoint, NumericError> ProfitModel::evaluate(size_t index) const {
    const double strike = grid_[index];

    auto premium = premium_(strike);
    if (!premium.has_value()) {
        NumericError err = premium.error();
        err.index = index;
        return std::unexpected(err);
    }

    auto ratio = profit_ratio(type_, future_price_, strike, *premium);
    if (!ratio.has_value()) {
        NumericError err = ratio.error();
        err.index = index;
        return std::unexpected(err);
    }

    return ProfitPoint{
        .strike = strike,
        .premium = *premium,
        .profit_ratio = *ratio,
    };
}

// ===========================================================================
// ProfitCurve
// ===========================================================================

ProfitCurve::iterator::iterator(const ProfitModel* model, size_t index)
    : model_(model)
{
    seek(index);
}

void ProfitCurve::iterator::seek(size_t index) {
    const size_t n = model_->grid().size();
    for (index_ = index; index_ < n; ++index_) {
        auto point = model_->evaluate(index_);
        if (point.has_value() && point->profit_ratio > kMinProfitRatio) {
            current_ = *point;
            return;
        }
    }
}

ProfitCurve::iterator ProfitCurve::begin() const {
    if (!model_) {
        return iterator();
    }
    return iterator(model_.get(), 0);
}

ProfitCurve::iterator ProfitCurve::end() const {
    iterator it;
    if (model_) {
        it.model_ = model_.get();
        it.index_ = model_->grid().size();
    }
    return it;
}

std::vector<ProfitPoint> ProfitCurve::materialize() const {
    std::vector<ProfitPoint> points;
    for (const ProfitPoint& point : *this) {
        points.push_back(point);
    }
    return points;
}

}  // namespace strikeopt
