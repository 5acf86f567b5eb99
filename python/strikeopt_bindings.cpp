// SPDX-License-Identifier: MIT
/**
 * @file strikeopt_bindings.cpp
 * @brief Python bindings for strikeopt using pybind11
 *
 * Lets a Python plotting stack consume the profit curve directly:
 *
 *   import strikeopt, matplotlib.pyplot as plt
 *   r = strikeopt.optimize(280.0, 0.0063, 180.0, 0.4, 0.3)
 *   xs, ys = zip(*[(k, 100 * p) for k, p in r.curve()])
 *   plt.plot(xs, ys)
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "strikeopt/cli/report.hpp"
#include "strikeopt/simple/pricing.hpp"
#include "strikeopt/optimizer/strike_optimizer.hpp"
#include <string>
#include <utility>
#include <vector>

namespace py = pybind11;

namespace {

[[noreturn]] void raise(const strikeopt::NumericError& err) {
    throw py::value_error(strikeopt::describe(err));
}

}  // namespace

PYBIND11_MODULE(strikeopt, m) {
    m.doc() = "Strike search maximizing return on premium for an expected price move";

    // OptionType enum
    py::enum_<strikeopt::OptionType>(m, "OptionType")
        .value("CALL", strikeopt::OptionType::CALL)
        .value("PUT", strikeopt::OptionType::PUT);

    // MarketParams structure
    py::class_<strikeopt::MarketParams>(m, "MarketParams")
        .def(py::init<>())
        .def_readwrite("spot", &strikeopt::MarketParams::spot)
        .def_readwrite("rate", &strikeopt::MarketParams::rate)
        .def_readwrite("days", &strikeopt::MarketParams::days)
        .def_readwrite("volatility", &strikeopt::MarketParams::volatility);

    // StrikeOptimizerConfig structure
    py::class_<strikeopt::StrikeOptimizerConfig>(m, "StrikeOptimizerConfig")
        .def(py::init<>())
        .def_readwrite("market", &strikeopt::StrikeOptimizerConfig::market)
        .def_readwrite("expected_movement", &strikeopt::StrikeOptimizerConfig::expected_movement)
        .def_readwrite("sample_count", &strikeopt::StrikeOptimizerConfig::sample_count)
        .def_readwrite("min_strike_fraction", &strikeopt::StrikeOptimizerConfig::min_strike_fraction)
        .def_readwrite("max_strike_fraction", &strikeopt::StrikeOptimizerConfig::max_strike_fraction)
        .def_readwrite("parallel", &strikeopt::StrikeOptimizerConfig::parallel)
        .def("title", &strikeopt::cli::plot_title,
            "Plot title annotated with the inputs");

    // OptimizationResult (curve evaluated on demand)
    py::class_<strikeopt::OptimizationResult>(m, "OptimizationResult")
        .def_readonly("best_strike", &strikeopt::OptimizationResult::best_strike)
        .def_readonly("best_profit_ratio", &strikeopt::OptimizationResult::best_profit_ratio)
        .def_readonly("option_type", &strikeopt::OptimizationResult::option_type)
        .def_readonly("future_price", &strikeopt::OptimizationResult::future_price)
        .def_readonly("evaluated_count", &strikeopt::OptimizationResult::evaluated_count)
        .def_readonly("excluded_count", &strikeopt::OptimizationResult::excluded_count)
        .def("curve", [](const strikeopt::OptimizationResult& r) {
            std::vector<std::pair<double, double>> points;
            for (const auto& point : r.curve) {
                points.emplace_back(point.strike, point.profit_ratio);
            }
            return points;
        }, "List of (strike, profit_ratio) with profit_ratio > -1")
        .def("__repr__", [](const strikeopt::OptimizationResult& r) {
            return "<OptimizationResult best_strike=" + std::to_string(r.best_strike) +
                   " best_profit_ratio=" + std::to_string(r.best_profit_ratio) +
                   " type=" + strikeopt::option_type_name(r.option_type) + ">";
        });

    m.def("price", [](double spot, double strike, double rate, double days,
                      double volatility, bool is_call) {
        auto result = strikeopt::simple::price(spot, strike, rate, days, volatility, is_call);
        if (!result.has_value()) {
            raise(result.error());
        }
        return *result;
    }, py::arg("spot"), py::arg("strike"), py::arg("rate"), py::arg("days"),
       py::arg("volatility"), py::arg("is_call") = true,
       "Black-Scholes premium of a European option (no dividends)");

    m.def("optimize", [](double spot, double rate, double days, double volatility,
                         double expected_movement, size_t sample_count) {
        auto result = strikeopt::simple::optimize(spot, rate, days, volatility,
                                                  expected_movement, sample_count);
        if (!result.has_value()) {
            raise(result.error());
        }
        return std::move(*result);
    }, py::arg("spot"), py::arg("rate"), py::arg("days"), py::arg("volatility"),
       py::arg("expected_movement"), py::arg("sample_count") = strikeopt::kDefaultSampleCount,
       "Strike maximizing return on premium over [0.1 x spot, 3 x spot]");

    m.def("optimize_config", [](const strikeopt::StrikeOptimizerConfig& config) {
        auto optimizer = strikeopt::StrikeOptimizer::create(config);
        if (!optimizer.has_value()) {
            raise(optimizer.error());
        }
        auto result = optimizer->solve();
        if (!result.has_value()) {
            raise(result.error());
        }
        return std::move(*result);
    }, py::arg("config"), "Strike search with a full configuration");
}
