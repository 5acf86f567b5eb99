// SPDX-License-Identifier: MIT
/// @file strike_sweep_benchmark.cc
/// @brief Latency of the pricing function and of full strike sweeps
///
/// Compares the sequential scan against the parallel evaluation path across
/// sample counts, and measures the cost of re-walking the lazy profit curve.
///
/// Usage:
///   ./build/benchmarks/strike_sweep_benchmark --benchmark_filter=Sweep

#include "strikeopt/math/black_scholes_analytics.hpp"
#include "strikeopt/optimizer/strike_optimizer.hpp"
#include "strikeopt/pricing/black_scholes.hpp"
#include <benchmark/benchmark.h>
#include <stdexcept>

using namespace strikeopt;

namespace {

// Reference scenario
constexpr double S = 280.0, rate = 0.0063, days = 180.0, sigma = 0.4, movement = 0.3;

StrikeOptimizerConfig MakeConfig(size_t samples, bool parallel) {
    StrikeOptimizerConfig config;
    config.market = MarketParams{.spot = S, .rate = rate, .days = days, .volatility = sigma};
    config.expected_movement = movement;
    config.sample_count = samples;
    config.parallel = parallel;
    return config;
}

// ===========================================================================
// Pricing
// ===========================================================================

static void BM_BsPrice_Unchecked(benchmark::State& state) {
    const double tau = years_from_days(days);
    for (auto _ : state) {
        benchmark::DoNotOptimize(bs_price(S, 300.0, tau, sigma, rate, OptionType::CALL));
    }
}
BENCHMARK(BM_BsPrice_Unchecked);

static void BM_PriceEuropean_Validated(benchmark::State& state) {
    const MarketParams market{.spot = S, .rate = rate, .days = days, .volatility = sigma};
    for (auto _ : state) {
        benchmark::DoNotOptimize(price_european(market, 300.0, OptionType::CALL));
    }
}
BENCHMARK(BM_PriceEuropean_Validated);

// ===========================================================================
// Sweeps
// ===========================================================================

static void BM_Sweep(benchmark::State& state, bool parallel) {
    const size_t samples = static_cast<size_t>(state.range(0));
    auto optimizer = StrikeOptimizer::create(MakeConfig(samples, parallel));
    if (!optimizer) throw std::runtime_error("Sweep: invalid config");

    for (auto _ : state) {
        auto result = optimizer->solve();
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(samples));
}

static void BM_Sweep_Sequential(benchmark::State& state) { BM_Sweep(state, false); }
BENCHMARK(BM_Sweep_Sequential)->Arg(100)->Arg(1000)->Arg(10000)->Arg(100000);

static void BM_Sweep_Parallel(benchmark::State& state) { BM_Sweep(state, true); }
BENCHMARK(BM_Sweep_Parallel)->Arg(100)->Arg(1000)->Arg(10000)->Arg(100000);

static void BM_ProfitCurve_Walk(benchmark::State& state) {
    auto optimizer = StrikeOptimizer::create(MakeConfig(kDefaultSampleCount, false));
    if (!optimizer) throw std::runtime_error("ProfitCurve: invalid config");
    const ProfitCurve curve = optimizer->profit_curve();

    for (auto _ : state) {
        size_t rows = 0;
        for (const ProfitPoint& point : curve) {
            benchmark::DoNotOptimize(point.profit_ratio);
            ++rows;
        }
        benchmark::DoNotOptimize(rows);
    }
}
BENCHMARK(BM_ProfitCurve_Walk);

}  // namespace

BENCHMARK_MAIN();
