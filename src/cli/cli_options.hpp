// SPDX-License-Identifier: MIT
/**
 * @file cli_options.hpp
 * @brief Command-line configuration of the strike_optimizer tool
 */

#pragma once

#include "strikeopt/optimizer/strike_optimizer.hpp"
#include <expected>
#include <string>
#include <vector>

namespace strikeopt::cli {

/**
 * @brief Everything the command line can set
 *
 * Defaults reproduce the reference scenario: S = 280, r = 0.0063,
 * 180 days, v = 0.4, +30% expected move, 1000 candidates.
 */
struct CliOptions {
    StrikeOptimizerConfig optimizer;             ///< Economic inputs and search settings
    bool plot = false;                           ///< Write the profit curve for plotting
    std::string plot_file = "profit_curve.dat";  ///< Destination of the plot data
    bool show_help = false;                      ///< --help was given
};

/**
 * @brief Parse command-line arguments (without the program name)
 *
 * Accepts `--name=value` and `--name value`; booleans also accept the bare
 * `--name` and `--noname` forms. Bounds checked here are the command-line
 * ones (e.g. --days_to_expiration >= 1); the core re-validates the rest.
 *
 * @return Parsed options or a descriptive error
 */
std::expected<CliOptions, std::string> parse_cli_options(const std::vector<std::string>& args);

/// Convenience overload for main()
std::expected<CliOptions, std::string> parse_cli_options(int argc, const char* const* argv);

/// Usage text listing every flag with its default
std::string usage(const std::string& program);

}  // namespace strikeopt::cli
