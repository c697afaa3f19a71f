#pragma once

#include "analysis/asset_contribution.hpp"
#include "analysis/benchmark_comparison.hpp"
#include "analysis/performance_metrics.hpp"
#include "sim/rebalance_schedule.hpp"
#include "sim/simulation_engine.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// BacktestResult - everything one backtest run hands back to its caller
// ---------------------------------------------------------------------------
struct BacktestResult {
    std::string strategy_name;
    std::vector<std::pair<std::string, std::string>> strategy_parameters;
    RebalanceFrequency frequency = RebalanceFrequency::MONTHLY;
    double initial_capital = 0.0;
    double risk_free_rate = 0.0;

    std::vector<std::string> symbols;
    std::vector<int> dates;
    std::vector<double> portfolio_values;
    std::vector<double> returns;
    std::vector<double> drawdown;
    std::vector<std::vector<double>> weights;  // weights[symbol][date_idx]
    std::vector<int> rebalance_dates;

    PerformanceMetrics metrics;
    std::optional<BenchmarkComparison> benchmark;
    std::vector<AssetContribution> asset_contributions;
    SimulationDiagnostics diagnostics;

    size_t num_dates() const { return dates.size(); }
};
