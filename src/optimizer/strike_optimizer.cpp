// SPDX-License-Identifier: MIT
#include "strikeopt/optimizer/strike_optimizer.hpp"
#include "strikeopt/pricing/black_scholes.hpp"
#include "strikeopt/support/parallel.hpp"
#include "strikeopt/support/strikeopt_trace.h"
#include <cmath>
#include <cstdint>
#include <utility>
#include <vector>

namespace strikeopt {

namespace {

std::expected<void, NumericError> reject(NumericErrorCode code, double value) {
    STRIKEOPT_TRACE_VALIDATION_ERROR(MODULE_STRIKE_OPTIMIZER, static_cast<int>(code), value);
    return std::unexpected(NumericError(code, value));
}

/// Running best of a sweep, fed in grid order
class SweepAccumulator {
public:
    void add([[maybe_unused]] size_t index, const std::expected<ProfitPoint, NumericError>& point) {
        if (!point.has_value()) {
            ++excluded_;
            STRIKEOPT_TRACE_CANDIDATE_EXCLUDED(index, point.error().value,
                                               static_cast<int>(point.error().code));
            return;
        }
        // Strict comparison: the first candidate keeps a tie
        if (!has_best_ || point->profit_ratio > best_.profit_ratio) {
            best_ = *point;
            has_best_ = true;
            STRIKEOPT_TRACE_NEW_BEST(index, best_.strike, best_.profit_ratio);
        }
    }

    bool has_best() const { return has_best_; }
    const ProfitPoint& best() const { return best_; }
    size_t excluded() const { return excluded_; }

private:
    ProfitPoint best_{0.0, 0.0, 0.0};
    bool has_best_ = false;
    size_t excluded_ = 0;
};

std::expected<OptimizationResult, NumericError>
finish(const SweepAccumulator& acc, const std::shared_ptr<const ProfitModel>& model) {
    const size_t n = model->grid().size();
    STRIKEOPT_TRACE_SWEEP_COMPLETE(acc.best().strike, acc.best().profit_ratio,
                                   n - acc.excluded(), acc.excluded());
    if (!acc.has_best()) {
        return std::unexpected(NumericError(NumericErrorCode::NoValidCandidates, 0.0, n));
    }
    return OptimizationResult{
        .best_strike = acc.best().strike,
        .best_profit_ratio = acc.best().profit_ratio,
        .option_type = model->option_type(),
        .future_price = model->future_price(),
        .evaluated_count = n,
        .excluded_count = acc.excluded(),
        .curve = ProfitCurve(model),
    };
}

}  // namespace

std::expected<void, NumericError> validate_optimizer_config(const StrikeOptimizerConfig& config) {
    auto market = validate_market_params(config.market);
    if (!market.has_value()) {
        return market;
    }

    if (!std::isfinite(config.expected_movement)) {
        return reject(NumericErrorCode::InvalidMovement, config.expected_movement);
    }

    // A sweep needs at least two points to compare
    if (config.sample_count < 2) {
        return reject(NumericErrorCode::InvalidSampleCount,
                      static_cast<double>(config.sample_count));
    }

    if (!(config.min_strike_fraction > 0.0) || !std::isfinite(config.min_strike_fraction)) {
        return reject(NumericErrorCode::InvalidStrikeRange, config.min_strike_fraction);
    }
    if (!std::isfinite(config.max_strike_fraction) ||
        !(config.max_strike_fraction > config.min_strike_fraction)) {
        return reject(NumericErrorCode::InvalidStrikeRange, config.max_strike_fraction);
    }

    // Products can still underflow or overflow for extreme spots
    const double lower = config.min_strike_fraction * config.market.spot;
    const double upper = config.max_strike_fraction * config.market.spot;
    if (!(lower > 0.0) || !std::isfinite(upper) || !(upper > lower)) {
        return reject(NumericErrorCode::InvalidStrikeRange, lower);
    }

    return {};
}

StrikeOptimizer::StrikeOptimizer(const StrikeOptimizerConfig& config,
                                 std::shared_ptr<const ProfitModel> model)
    : config_(config)
    , model_(std::move(model))
{}

std::expected<StrikeOptimizer, NumericError>
StrikeOptimizer::create(const StrikeOptimizerConfig& config) {
    return create(config, PremiumFunction{});
}

std::expected<StrikeOptimizer, NumericError>
StrikeOptimizer::create(const StrikeOptimizerConfig& config, PremiumFunction premium) {
    auto validation = validate_optimizer_config(config);
    if (!validation.has_value()) {
        return std::unexpected(validation.error());
    }

    const OptionType type = option_type_for_movement(config.expected_movement);
    if (!premium) {
        // Market params were validated above; only strikes remain to check
        premium = [market = config.market, type](double strike) {
            return price_european_prevalidated(market, strike, type);
        };
    }

    StrikeGrid grid(config.min_strike_fraction * config.market.spot,
                    config.max_strike_fraction * config.market.spot,
                    config.sample_count);
    const double future_price = config.market.spot * (1.0 + config.expected_movement);

    auto model = std::make_shared<const ProfitModel>(grid, type, future_price, std::move(premium));
    return StrikeOptimizer(config, std::move(model));
}

std::expected<OptimizationResult, NumericError> StrikeOptimizer::solve() const {
    [[maybe_unused]] const StrikeGrid& g = model_->grid();
    STRIKEOPT_TRACE_SWEEP_START(g.size(), g.lower(), g.upper(),
                                static_cast<int>(model_->option_type()));
    return config_.parallel ? solve_parallel() : solve_sequential();
}

std::expected<OptimizationResult, NumericError> StrikeOptimizer::solve_sequential() const {
    SweepAccumulator acc;
    const size_t n = model_->grid().size();
    for (size_t i = 0; i < n; ++i) {
        acc.add(i, model_->evaluate(i));
    }
    return finish(acc, model_);
}

std::expected<OptimizationResult, NumericError> StrikeOptimizer::solve_parallel() const {
    const size_t n = model_->grid().size();
    std::vector<std::expected<ProfitPoint, NumericError>> evaluations(
        n, std::unexpected(NumericError(NumericErrorCode::NoValidCandidates)));

    const ProfitModel& model = *model_;
    const int64_t count = static_cast<int64_t>(n);
    STRIKEOPT_PRAGMA_PARALLEL_FOR_STATIC
    for (int64_t i = 0; i < count; ++i) {
        evaluations[static_cast<size_t>(i)] = model.evaluate(static_cast<size_t>(i));
    }

    // Single-threaded reduction keeps the first-wins tie-break
    SweepAccumulator acc;
    for (size_t i = 0; i < n; ++i) {
        acc.add(i, evaluations[i]);
    }
    return finish(acc, model_);
}

}  // namespace strikeopt
