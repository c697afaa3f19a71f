#pragma once

#include "analysis/asset_contribution.hpp"
#include "analysis/benchmark_comparison.hpp"
#include "analysis/performance_metrics.hpp"
#include "backtest/backtest_result.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include "data/price_alignment.hpp"
#include "data/price_series.hpp"
#include "portfolio/holding.hpp"
#include "sim/simulation_engine.hpp"
#include "strategy/strategy_config.hpp"
#include "strategy/strategy_factory.hpp"

#include <cmath>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// BacktestRequest - inputs for one run
//
// `prices` must contain a series for every holding; series for other symbols
// are kept as reference data (e.g. a relative-strength benchmark). The
// optional `benchmark` drives the benchmark comparison and is also visible
// to strategies as a reference.
// ---------------------------------------------------------------------------
struct BacktestRequest {
    std::vector<HoldingSpec> holdings;
    StrategyConfig strategy;
    std::vector<PriceSeries> prices;
    std::optional<PriceSeries> benchmark;
    std::vector<PriceSeries> references;
    BacktestConfig config;
};

// ---------------------------------------------------------------------------
// BacktestRunner - validate, align, simulate, measure
//
// Stateless: concurrent runs on separate requests share nothing but the
// logger.
// ---------------------------------------------------------------------------
class BacktestRunner {
public:
    static BacktestResult run(const BacktestRequest& req) {
        const auto& cfg = req.config;
        if (!std::isfinite(cfg.initial_capital) || cfg.initial_capital <= 0.0) {
            throw InvalidConfigError("initial_capital", "must be a positive number");
        }
        validate_holdings(req.holdings);

        // Held series in holding order.
        std::map<std::string, const PriceSeries*> by_symbol;
        for (const auto& s : req.prices) by_symbol[s.symbol] = &s;
        std::vector<PriceSeries> held;
        std::set<std::string> held_symbols;
        for (const auto& h : req.holdings) {
            auto it = by_symbol.find(h.symbol);
            if (it == by_symbol.end()) {
                throw InsufficientDataError("No price history for " + h.symbol, h.symbol);
            }
            held.push_back(*it->second);
            held_symbols.insert(h.symbol);
        }

        check_benchmark_available(req, held_symbols, by_symbol);

        auto matrix = alignment::align_prices(held, cfg.start_date, cfg.end_date);
        auto references = align_references(req, held_symbols, matrix.dates);

        auto strategy = StrategyFactory::create(req.strategy, req.holdings);
        if (!strategy) {
            throw InvalidConfigError("strategy", "unhandled strategy type");
        }
        SimulationEngine engine(cfg, *strategy);
        auto sim = engine.run(matrix, references);

        BacktestResult result;
        result.strategy_name = strategy->name();
        result.strategy_parameters = strategy_config::describe(req.strategy);
        result.frequency = cfg.frequency;
        result.initial_capital = cfg.initial_capital;
        result.risk_free_rate = cfg.risk_free_rate;
        result.symbols = sim.symbols;
        result.dates = sim.dates;
        result.portfolio_values = sim.values;
        result.returns = sim.returns;
        result.drawdown = sim.drawdown;
        result.weights = sim.weights;
        result.rebalance_dates = sim.rebalance_dates;
        result.diagnostics = sim.diagnostics;

        result.metrics = metrics::compute(sim.values, sim.returns, sim.drawdown,
                                          cfg.risk_free_rate);
        if (!result.metrics.degenerate_fields.empty()) {
            basket_log::logger()->debug("{} metrics clamped to 0",
                                        result.metrics.degenerate_fields.size());
        }

        if (req.benchmark) {
            auto it = references.find(req.benchmark->symbol);
            auto bench_returns = benchmark::returns_from_prices(it->second.prices);
            result.benchmark = benchmark::compare(sim.returns, bench_returns,
                                                  req.benchmark->symbol, cfg.risk_free_rate,
                                                  cfg.rolling_window);
        }

        result.asset_contributions = contribution::estimate(sim.symbols, sim.weights, sim.prices);
        return result;
    }

private:
    static void check_benchmark_available(
        const BacktestRequest& req, const std::set<std::string>& held_symbols,
        const std::map<std::string, const PriceSeries*>& by_symbol) {
        if (req.strategy.type() != StrategyType::RELATIVE_STRENGTH) return;
        const auto& symbol = req.strategy.get<RelativeStrengthParams>().benchmark_symbol;
        if (held_symbols.count(symbol) || by_symbol.count(symbol)) return;
        if (req.benchmark && req.benchmark->symbol == symbol) return;
        for (const auto& r : req.references) {
            if (r.symbol == symbol) return;
        }
        throw InvalidConfigError("benchmark_symbol",
                                 "no price series supplied for benchmark " + symbol);
    }

    // Reference series aligned on the simulation axis with bad ticks replaced.
    // The benchmark and explicit references must align; unheld extras from
    // `prices` are dropped with a warning when they do not cover the period.
    static std::map<std::string, AlignedSeries> align_references(
        const BacktestRequest& req, const std::set<std::string>& held_symbols,
        const std::vector<int>& axis) {
        std::map<std::string, AlignedSeries> out;
        auto add = [&](const PriceSeries& series) {
            auto aligned = alignment::align_to_axis(series, axis);
            SimulationEngine::clean_reference(aligned, axis);
            out[series.symbol] = std::move(aligned);
        };

        for (const auto& s : req.prices) {
            if (held_symbols.count(s.symbol)) continue;
            try {
                add(s);
            } catch (const BacktestError& e) {
                basket_log::logger()->warn("Ignoring reference series {}: {}", s.symbol,
                                           e.what());
            }
        }
        for (const auto& r : req.references) add(r);
        if (req.benchmark) add(*req.benchmark);
        return out;
    }
};
