// SPDX-License-Identifier: MIT
/**
 * @file report.hpp
 * @brief Console summary and plot data for a strike search
 */

#pragma once

#include "strikeopt/optimizer/profit_curve.hpp"
#include "strikeopt/optimizer/strike_grid.hpp"
#include "strikeopt/optimizer/strike_optimizer.hpp"
#include <cstddef>
#include <expected>
#include <ostream>
#include <string>

namespace strikeopt::cli {

/// "Searching between exercise prices 28.00 and 840.00..."
std::string format_search_range(const StrikeGrid& grid);

/// "Best exercise price is 296.23, profit is 170.59%."
std::string format_result(const OptimizationResult& result);

/// Plot title annotated with the inputs:
/// "S: 280, predicted movement: 0.3, time: 180, v: 0.4"
std::string plot_title(const StrikeOptimizerConfig& config);

/**
 * @brief Write the profit curve as whitespace-separated columns
 *
 * Layout (gnuplot and numpy.loadtxt read it as is):
 *   # <title>
 *   # Exercise Price  Profit (%)
 *   <strike> <profit ratio × 100>
 *   ...
 *
 * @return Number of data rows written
 */
size_t write_plot_data(std::ostream& os, const std::string& title, const ProfitCurve& curve);

/// write_plot_data() into a file; fails if the file cannot be written
std::expected<size_t, std::string> write_plot_file(const std::string& path,
                                                   const std::string& title,
                                                   const ProfitCurve& curve);

}  // namespace strikeopt::cli
