// SPDX-License-Identifier: MIT
#include "strikeopt/cli/report.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>

namespace strikeopt::cli {

std::string format_search_range(const StrikeGrid& grid) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << "Searching between exercise prices " << grid.lower()
        << " and " << grid.upper() << "...";
    return oss.str();
}

std::string format_result(const OptimizationResult& result) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << "Best exercise price is " << result.best_strike
        << ", profit is " << result.best_profit_ratio * 100.0 << "%.";
    return oss.str();
}

std::string plot_title(const StrikeOptimizerConfig& config) {
    std::ostringstream oss;
    oss << "S: " << config.market.spot
        << ", predicted movement: " << config.expected_movement
        << ", time: " << config.market.days
        << ", v: " << config.market.volatility;
    return oss.str();
}

size_t write_plot_data(std::ostream& os, const std::string& title, const ProfitCurve& curve) {
    os << "# " << title << '\n'
       << "# Exercise Price  Profit (%)\n";

    size_t rows = 0;
    const std::streamsize saved_precision = os.precision(10);
    for (const ProfitPoint& point : curve) {
        os << point.strike << ' ' << point.profit_ratio * 100.0 << '\n';
        ++rows;
    }
    os.precision(saved_precision);
    return rows;
}

std::expected<size_t, std::string> write_plot_file(const std::string& path,
                                                   const std::string& title,
                                                   const ProfitCurve& curve) {
    std::ofstream out(path);
    if (!out) {
        return std::unexpected("cannot open '" + path + "' for writing");
    }
    const size_t rows = write_plot_data(out, title, curve);
    out.flush();
    if (!out) {
        return std::unexpected("failed writing '" + path + "'");
    }
    return rows;
}

}  // namespace strikeopt::cli
