// backtest_runner_test.cpp - end-to-end runs: validation, alignment, analytics

#include <gtest/gtest.h>

#include "backtest/backtest_runner.hpp"
#include "core/errors.hpp"
#include "test_price_helpers.hpp"

#include <cmath>
#include <string>
#include <thread>
#include <vector>

using namespace test_helpers;

namespace {

constexpr int NUM_DATES = 80;

BacktestRequest base_request() {
    auto dates = trading_days(MONDAY_20240101, NUM_DATES);
    BacktestRequest req;
    req.holdings = {{"A", 0.6}, {"B", 0.4}};
    req.prices = {make_series("A", dates, geometric_prices(NUM_DATES, 100.0, 0.002)),
                  make_series("B", dates, wavy_prices(NUM_DATES, 50.0, 0.03))};
    req.config.frequency = RebalanceFrequency::MONTHLY;
    return req;
}

PriceSeries benchmark_series(const std::string& symbol, double daily_return) {
    auto dates = trading_days(MONDAY_20240101, NUM_DATES);
    return make_series(symbol, dates, geometric_prices(NUM_DATES, 400.0, daily_return));
}

template <typename Fn>
std::string config_error_parameter(Fn&& fn) {
    try {
        fn();
    } catch (const InvalidConfigError& e) {
        return e.parameter();
    }
    return "";
}

}  // namespace

// ===========================================================================
// 1. Full run
// ===========================================================================
class BacktestRunnerTest : public ::testing::Test {};

TEST_F(BacktestRunnerTest, BuyAndHoldProducesCompleteResult) {
    auto result = BacktestRunner::run(base_request());

    EXPECT_EQ(result.strategy_name, "buy_and_hold");
    EXPECT_TRUE(result.strategy_parameters.empty());
    EXPECT_EQ(result.symbols, std::vector<std::string>({"A", "B"}));
    ASSERT_EQ(result.num_dates(), static_cast<size_t>(NUM_DATES));
    EXPECT_EQ(result.portfolio_values.size(), result.num_dates());
    EXPECT_EQ(result.returns.size(), result.num_dates());
    EXPECT_EQ(result.drawdown.size(), result.num_dates());
    ASSERT_EQ(result.weights.size(), 2u);
    EXPECT_EQ(result.weights[0].size(), result.num_dates());
    EXPECT_DOUBLE_EQ(result.portfolio_values.front(), 10000.0);
    EXPECT_NEAR(result.weights[0][0], 0.6, 1e-12);

    EXPECT_EQ(result.metrics.num_periods, NUM_DATES - 1);
    EXPECT_DOUBLE_EQ(result.metrics.final_value, result.portfolio_values.back());
    EXPECT_FALSE(result.benchmark.has_value());
    ASSERT_EQ(result.asset_contributions.size(), 2u);
    EXPECT_TRUE(result.asset_contributions[0].is_estimate);

    // Jan 1, Feb 1, Mar 1, Apr 1 within 80 weekdays from 2024-01-01.
    EXPECT_EQ(result.rebalance_dates,
              std::vector<int>({20240101, 20240201, 20240301, 20240401}));
    EXPECT_EQ(result.diagnostics.rebalance_count, 4);
}

TEST_F(BacktestRunnerTest, StrategyParametersReported) {
    auto req = base_request();
    req.strategy = StrategyConfig(MomentumParams{20, 1});
    auto result = BacktestRunner::run(req);
    EXPECT_EQ(result.strategy_name, "momentum");
    ASSERT_EQ(result.strategy_parameters.size(), 2u);
    EXPECT_EQ(result.strategy_parameters[0].second, "20");
}

TEST_F(BacktestRunnerTest, DateWindowRestrictsAxis) {
    auto req = base_request();
    req.config.start_date = 20240201;
    req.config.end_date = 20240229;
    auto result = BacktestRunner::run(req);
    EXPECT_EQ(result.dates.front(), 20240201);
    EXPECT_EQ(result.dates.back(), 20240229);
    EXPECT_EQ(result.num_dates(), 21u);
}

TEST_F(BacktestRunnerTest, HoldingOrderDefinesSymbolOrder) {
    auto req = base_request();
    req.holdings = {{"B", 0.4}, {"A", 0.6}};
    auto result = BacktestRunner::run(req);
    EXPECT_EQ(result.symbols, std::vector<std::string>({"B", "A"}));
    EXPECT_NEAR(result.weights[1][0], 0.6, 1e-12);
}

// ===========================================================================
// 2. Validation
// ===========================================================================
class BacktestRunnerValidationTest : public ::testing::Test {};

TEST_F(BacktestRunnerValidationTest, CapitalCheckedFirst) {
    auto req = base_request();
    req.config.initial_capital = -5.0;
    req.holdings = {};
    EXPECT_EQ(config_error_parameter([&] { BacktestRunner::run(req); }), "initial_capital");
}

TEST_F(BacktestRunnerValidationTest, AllocationsMustSumToOne) {
    auto req = base_request();
    req.holdings = {{"A", 0.6}, {"B", 0.3}};
    EXPECT_EQ(config_error_parameter([&] { BacktestRunner::run(req); }), "allocation");
}

TEST_F(BacktestRunnerValidationTest, MissingHoldingPricesNamesSymbol) {
    auto req = base_request();
    req.holdings = {{"A", 0.5}, {"C", 0.5}};
    try {
        BacktestRunner::run(req);
        FAIL() << "expected InsufficientDataError";
    } catch (const InsufficientDataError& e) {
        EXPECT_EQ(e.symbol(), "C");
    }
}

TEST_F(BacktestRunnerValidationTest, RelativeStrengthNeedsBenchmarkSeries) {
    auto req = base_request();
    req.strategy = StrategyConfig(RelativeStrengthParams{10, 1, "SPY"});
    EXPECT_EQ(config_error_parameter([&] { BacktestRunner::run(req); }), "benchmark_symbol");
}

TEST_F(BacktestRunnerValidationTest, WindowWithOneDateRejected) {
    auto req = base_request();
    req.config.start_date = 20240105;
    req.config.end_date = 20240105;
    EXPECT_THROW(BacktestRunner::run(req), InsufficientDataError);
}

TEST_F(BacktestRunnerValidationTest, InvalidPriceSurfacesAsBacktestError) {
    auto req = base_request();
    for (auto& p : req.prices[0].points) p.close = 0.0;
    EXPECT_THROW(BacktestRunner::run(req), InvalidPriceError);
}

// ===========================================================================
// 3. Benchmark and reference series
// ===========================================================================
class BacktestRunnerBenchmarkTest : public ::testing::Test {};

TEST_F(BacktestRunnerBenchmarkTest, BenchmarkComparisonAttached) {
    auto req = base_request();
    req.benchmark = benchmark_series("SPY", 0.001);
    req.config.rolling_window = 20;
    auto result = BacktestRunner::run(req);

    ASSERT_TRUE(result.benchmark.has_value());
    EXPECT_EQ(result.benchmark->benchmark_symbol, "SPY");
    EXPECT_EQ(result.benchmark->rolling_window, 20);
    EXPECT_EQ(result.benchmark->rolling_beta.size(), result.num_dates());
    EXPECT_NEAR(result.benchmark->benchmark_total_return,
                std::pow(1.001, NUM_DATES - 1) - 1.0, 1e-9);
}

TEST_F(BacktestRunnerBenchmarkTest, HoldingAsOwnBenchmark) {
    auto req = base_request();
    req.holdings = {{"B", 1.0}};
    req.benchmark = req.prices[1];
    auto result = BacktestRunner::run(req);
    ASSERT_TRUE(result.benchmark.has_value());
    EXPECT_NEAR(result.benchmark->beta, 1.0, 1e-9);
    EXPECT_NEAR(result.benchmark->correlation, 1.0, 1e-9);
}

TEST_F(BacktestRunnerBenchmarkTest, RelativeStrengthUsesReferenceSeries) {
    auto req = base_request();
    req.strategy = StrategyConfig(RelativeStrengthParams{10, 1, "SPY"});
    req.references = {benchmark_series("SPY", 0.0005)};
    auto result = BacktestRunner::run(req);
    EXPECT_EQ(result.strategy_name, "relative_strength");
    EXPECT_EQ(result.symbols.size(), 2u);
}

TEST_F(BacktestRunnerBenchmarkTest, RelativeStrengthUsesUnheldPriceSeries) {
    auto req = base_request();
    req.strategy = StrategyConfig(RelativeStrengthParams{10, 1, "SPY"});
    req.prices.push_back(benchmark_series("SPY", 0.0005));
    EXPECT_NO_THROW(BacktestRunner::run(req));
}

TEST_F(BacktestRunnerBenchmarkTest, NonOverlappingExtraSeriesIgnored) {
    auto req = base_request();
    req.prices.push_back(make_series("OLD", {20200102, 20200103}, {10.0, 11.0}));
    auto result = BacktestRunner::run(req);
    EXPECT_EQ(result.symbols.size(), 2u);
}

TEST_F(BacktestRunnerBenchmarkTest, NonOverlappingBenchmarkRejected) {
    auto req = base_request();
    req.benchmark = make_series("OLD", {20200102, 20200103}, {10.0, 11.0});
    EXPECT_THROW(BacktestRunner::run(req), InsufficientDataError);
}

TEST_F(BacktestRunnerBenchmarkTest, LateStartingBenchmarkRejected) {
    auto req = base_request();
    auto dates = trading_days(MONDAY_20240101, NUM_DATES);
    req.benchmark = make_series("SPY", {dates[NUM_DATES - 3], dates[NUM_DATES - 2],
                                        dates[NUM_DATES - 1]},
                                {400.0, 402.0, 401.0});
    try {
        BacktestRunner::run(req);
        FAIL() << "expected InsufficientDataError";
    } catch (const InsufficientDataError& e) {
        EXPECT_EQ(e.symbol(), "SPY");
    }
}

TEST_F(BacktestRunnerBenchmarkTest, LateStartingExtraSeriesIgnored) {
    auto req = base_request();
    auto dates = trading_days(MONDAY_20240101, NUM_DATES);
    req.prices.push_back(make_series("LATE", {dates[NUM_DATES - 2], dates[NUM_DATES - 1]},
                                     {10.0, 11.0}));
    auto result = BacktestRunner::run(req);
    EXPECT_EQ(result.symbols.size(), 2u);
}

TEST_F(BacktestRunnerTest, HeldSymbolWithOneQuoteRejected) {
    auto req = base_request();
    auto dates = trading_days(MONDAY_20240101, NUM_DATES);
    req.prices[1] = make_series("B", {dates[40]}, {50.0});
    try {
        BacktestRunner::run(req);
        FAIL() << "expected InsufficientDataError";
    } catch (const InsufficientDataError& e) {
        EXPECT_EQ(e.symbol(), "B");
    }
}

// ===========================================================================
// 4. Determinism and concurrency
// ===========================================================================
class BacktestRunnerDeterminismTest : public ::testing::Test {};

TEST_F(BacktestRunnerDeterminismTest, RepeatedRunsAreBitIdentical) {
    auto req = base_request();
    req.strategy = StrategyConfig(RiskParityParams{20, 0.1, 0.9});
    req.config.frequency = RebalanceFrequency::WEEKLY;
    auto a = BacktestRunner::run(req);
    auto b = BacktestRunner::run(req);
    EXPECT_EQ(a.portfolio_values, b.portfolio_values);
    EXPECT_EQ(a.weights, b.weights);
    EXPECT_EQ(a.metrics.sharpe_ratio, b.metrics.sharpe_ratio);
}

TEST_F(BacktestRunnerDeterminismTest, ConcurrentRunsMatchSerialRuns) {
    std::vector<BacktestRequest> requests;
    for (const char* type : {"buy_and_hold", "momentum", "mean_reversion", "rotation"}) {
        auto req = base_request();
        req.strategy = strategy_config::parse(type, {});
        if (std::string(type) != "buy_and_hold") {
            req.strategy = strategy_config::parse(
                type, {{std::string(type) == "mean_reversion" ? "ma_period" : "lookback_period",
                        "10"}});
        }
        req.config.frequency = RebalanceFrequency::WEEKLY;
        requests.push_back(req);
    }

    std::vector<BacktestResult> serial;
    for (const auto& r : requests) serial.push_back(BacktestRunner::run(r));

    std::vector<BacktestResult> parallel(requests.size());
    std::vector<std::thread> threads;
    for (size_t i = 0; i < requests.size(); ++i) {
        threads.emplace_back([&, i] { parallel[i] = BacktestRunner::run(requests[i]); });
    }
    for (auto& t : threads) t.join();

    for (size_t i = 0; i < requests.size(); ++i) {
        EXPECT_EQ(parallel[i].strategy_name, serial[i].strategy_name);
        EXPECT_EQ(parallel[i].portfolio_values, serial[i].portfolio_values);
    }
}
