// SPDX-License-Identifier: MIT
/**
 * @file strike_grid.hpp
 * @brief Evenly spaced candidate strikes over a closed interval
 */

#pragma once

#include <cstddef>

namespace strikeopt {

/**
 * @brief Ordered, evenly spaced sample points on [lower, upper]
 *
 * Point i is lower + i·(upper - lower)/(n - 1); the last point is exactly
 * `upper`. Points are computed on demand, so the grid is a value type
 * that can be copied into lazy views.
 *
 * Requires n >= 2 and lower < upper (checked by the optimizer config).
 */
class StrikeGrid {
public:
    StrikeGrid(double lower, double upper, size_t n)
        : lower_(lower)
        , upper_(upper)
        , n_(n)
        , step_((upper - lower) / static_cast<double>(n - 1))
    {}

    /// Candidate strike at index i (i < size())
    double operator[](size_t i) const {
        if (i + 1 == n_) {
            return upper_;
        }
        return lower_ + static_cast<double>(i) * step_;
    }

    size_t size() const { return n_; }
    double lower() const { return lower_; }
    double upper() const { return upper_; }
    double step() const { return step_; }

private:
    double lower_;
    double upper_;
    size_t n_;
    double step_;
};

}  // namespace strikeopt
