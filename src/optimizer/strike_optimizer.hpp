// SPDX-License-Identifier: MIT
/**
 * @file strike_optimizer.hpp
 * @brief Grid search for the strike that maximizes return on premium
 */

#pragma once

#include "strikeopt/optimizer/profit_curve.hpp"
#include "strikeopt/optimizer/strike_grid.hpp"
#include "strikeopt/option/option_spec.hpp"
#include "strikeopt/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <memory>

namespace strikeopt {

/// Sample count giving a stable optimum on the default range
inline constexpr size_t kDefaultSampleCount = 1000;

/**
 * @brief Strike search configuration
 *
 * Candidates are `sample_count` evenly spaced strikes on
 * [min_strike_fraction × spot, max_strike_fraction × spot].
 */
struct StrikeOptimizerConfig {
    MarketParams market;                        ///< Spot, rate, days, volatility
    double expected_movement = 0.3;             ///< Assumed move, e.g. 0.3 = +30%
    size_t sample_count = kDefaultSampleCount;  ///< Number of candidate strikes (>= 2)
    double min_strike_fraction = 0.1;           ///< Lower bound of the range, × spot
    double max_strike_fraction = 3.0;           ///< Upper bound of the range, × spot
    bool parallel = false;                      ///< Price candidates concurrently
};

/**
 * @brief Validate strike search configuration
 *
 * Checks the market parameters, a finite movement, sample_count >= 2 and a
 * positive, finite, strictly increasing strike range.
 */
std::expected<void, NumericError> validate_optimizer_config(const StrikeOptimizerConfig& config);

/// Outcome of a strike sweep
struct OptimizationResult {
    double best_strike;        ///< Strike with the highest profit ratio
    double best_profit_ratio;  ///< Its profit ratio (1.0 = +100%)
    OptionType option_type;    ///< CALL for an expected rise, PUT otherwise
    double future_price;       ///< spot × (1 + expected_movement)
    size_t evaluated_count;    ///< Candidates visited (= sample_count)
    size_t excluded_count;     ///< Candidates dropped as degenerate
    ProfitCurve curve;         ///< Lazy (strike, ratio) pairs with ratio > -1
};

/**
 * @brief Exhaustive search over candidate strikes
 *
 * For each strike X on the grid the premium is priced and the profit ratio
 * computed against the future price S·(1 + movement). The strict maximum
 * wins; on ties the lower strike (first visited) is kept.
 *
 * A candidate whose premium fails to price, is not positive, or yields a
 * non-finite ratio is excluded from the comparison and from the curve. The
 * sweep fails only when every candidate is excluded.
 *
 * With config.parallel the candidates are priced concurrently (OpenMP when
 * enabled) and reduced afterwards in grid order, giving the same result as
 * the sequential scan.
 *
 * Thread-safety: solve() and profit_curve() are const and may be called
 * concurrently.
 */
class StrikeOptimizer {
public:
    /// Factory using the Black-Scholes premium
    static std::expected<StrikeOptimizer, NumericError>
    create(const StrikeOptimizerConfig& config);

    /// Factory with a custom premium (an empty function selects Black-Scholes)
    static std::expected<StrikeOptimizer, NumericError>
    create(const StrikeOptimizerConfig& config, PremiumFunction premium);

    /// Run the sweep
    std::expected<OptimizationResult, NumericError> solve() const;

    /// Lazy curve over the same candidates, without running the search
    ProfitCurve profit_curve() const { return ProfitCurve(model_); }

    const StrikeOptimizerConfig& config() const { return config_; }
    const StrikeGrid& grid() const { return model_->grid(); }
    OptionType option_type() const { return model_->option_type(); }
    double future_price() const { return model_->future_price(); }

private:
    StrikeOptimizer(const StrikeOptimizerConfig& config,
                    std::shared_ptr<const ProfitModel> model);

    std::expected<OptimizationResult, NumericError> solve_sequential() const;
    std::expected<OptimizationResult, NumericError> solve_parallel() const;

    StrikeOptimizerConfig config_;
    std::shared_ptr<const ProfitModel> model_;
};

}  // namespace strikeopt
