// SPDX-License-Identifier: MIT
/**
 * @file profit_curve.hpp
 * @brief Per-candidate profit evaluation and the lazy profit curve
 */

#pragma once

#include "strikeopt/optimizer/profit_metric.hpp"
#include "strikeopt/optimizer/strike_grid.hpp"
#include "strikeopt/option/option_spec.hpp"
#include "strikeopt/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <functional>
#include <iterator>
#include <memory>
#include <utility>
#include <vector>

namespace strikeopt {

/// Premium of the traded option at a given strike
///
/// Must be pure: the sweep may call it concurrently and the profit curve
/// calls it again every time it is iterated.
using PremiumFunction = std::function<std::expected<double, NumericError>(double strike)>;

/**
 * @brief Everything needed to evaluate one candidate of a sweep
 *
 * Immutable after construction and shared between the optimizer and
 * the curves it hands out.
 */
class ProfitModel {
public:
    ProfitModel(StrikeGrid grid, OptionType type, double future_price, PremiumFunction premium);

    /// Price candidate `index` and compute its profit ratio
    ///
    /// Errors carry the candidate index.
    std::expected<ProfitPoint, NumericError> evaluate(size_t index) const;

    const StrikeGrid& grid() const { return grid_; }
    OptionType option_type() const { return type_; }
    double future_price() const { return future_price_; }

private:
    StrikeGrid grid_;
    OptionType type_;
    double future_price_;
    PremiumFunction premium_;
};

/**
 * @brief Lazy view of (strike, profit ratio) pairs for plotting
 *
 * Yields, in strike order, every candidate that prices without error and
 * whose profit ratio is above kMinProfitRatio (the trade loses at most the
 * premium). Nothing is stored: each pass re-evaluates the candidates, so
 * the view can be iterated any number of times with identical output.
 *
 * Satisfies std::ranges::forward_range.
 */
class ProfitCurve {
public:
    /// Candidates at or below this ratio lose more than the premium
    static constexpr double kMinProfitRatio = -1.0;

    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using iterator_concept = std::forward_iterator_tag;
        using value_type = ProfitPoint;
        using difference_type = std::ptrdiff_t;
        using pointer = const ProfitPoint*;
        using reference = const ProfitPoint&;

        iterator() = default;

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        iterator& operator++() {
            seek(index_ + 1);
            return *this;
        }

        iterator operator++(int) {
            iterator tmp = *this;
            ++*this;
            return tmp;
        }

        friend bool operator==(const iterator& a, const iterator& b) {
            return a.index_ == b.index_;
        }

    private:
        friend class ProfitCurve;

        iterator(const ProfitModel* model, size_t index);

        /// Move to the first reportable candidate at or after `index`
        void seek(size_t index);

        const ProfitModel* model_ = nullptr;
        size_t index_ = 0;
        ProfitPoint current_{0.0, 0.0, 0.0};
    };

    /// Empty curve
    ProfitCurve() = default;

    explicit ProfitCurve(std::shared_ptr<const ProfitModel> model)
        : model_(std::move(model))
    {}

    iterator begin() const;
    iterator end() const;

    /// Evaluate the whole curve into a vector
    std::vector<ProfitPoint> materialize() const;

private:
    std::shared_ptr<const ProfitModel> model_;
};

}  // namespace strikeopt
