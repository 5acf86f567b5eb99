// SPDX-License-Identifier: MIT
/**
 * @file strike_optimizer_main.cc
 * @brief Finds the exercise price to buy given an expected price movement
 *        and a number of days until expiration
 *
 * Example:
 *   strike_optimizer --current_price=280 --expected_price_movement=0.3 \
 *       --days_to_expiration=180 --volatility=0.4 --plot
 */

#include "strikeopt/cli/cli_options.hpp"
#include "strikeopt/cli/report.hpp"
#include "strikeopt/optimizer/strike_optimizer.hpp"
#include <cstdlib>
#include <iostream>

int main(int argc, char** argv) {
    using namespace strikeopt;

    const std::string program = argc > 0 ? argv[0] : "strike_optimizer";
    auto options = cli::parse_cli_options(argc, argv);
    if (!options.has_value()) {
        std::cerr << "Error: " << options.error() << "\n\n" << cli::usage(program);
        return EXIT_FAILURE;
    }
    if (options->show_help) {
        std::cout << cli::usage(program);
        return EXIT_SUCCESS;
    }

    auto optimizer = StrikeOptimizer::create(options->optimizer);
    if (!optimizer.has_value()) {
        std::cerr << "Error: " << describe(optimizer.error()) << '\n';
        return EXIT_FAILURE;
    }

    std::cout << cli::format_search_range(optimizer->grid()) << std::endl;

    auto result = optimizer->solve();
    if (!result.has_value()) {
        std::cerr << "Error: " << describe(result.error()) << '\n';
        return EXIT_FAILURE;
    }

    std::cout << cli::format_result(*result) << '\n';
    if (result->excluded_count > 0) {
        std::cout << "Skipped " << result->excluded_count
                  << " candidate(s) with a degenerate premium.\n";
    }

    if (options->plot) {
        auto rows = cli::write_plot_file(options->plot_file,
                                         cli::plot_title(options->optimizer),
                                         result->curve);
        if (!rows.has_value()) {
            std::cerr << "Error: " << rows.error() << '\n';
            return EXIT_FAILURE;
        }
        std::cout << "Wrote " << *rows << " points to " << options->plot_file << '\n';
    }

    return EXIT_SUCCESS;
}
