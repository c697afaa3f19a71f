#pragma once

#include "core/errors.hpp"
#include "core/log.hpp"
#include "data/price_alignment.hpp"
#include "date_utils.hpp"
#include "sim/rebalance_schedule.hpp"
#include "strategy/market_view.hpp"
#include "strategy/strategy.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// BacktestConfig - run-level settings shared by the engine and the runner
// ---------------------------------------------------------------------------
struct BacktestConfig {
    double initial_capital = 10000.0;
    RebalanceFrequency frequency = RebalanceFrequency::MONTHLY;
    double risk_free_rate = 0.02;
    int rolling_window = 60;  // benchmark rolling beta/correlation
    int start_date = 0;       // YYYYMMDD, 0 = open
    int end_date = 0;
};

struct SimulationDiagnostics {
    int stale_price_fallbacks = 0;    // bad ticks replaced by a valid price
    int renormalized_rebalances = 0;  // strategy weights off by more than tolerance
    int rebalance_count = 0;          // including the initial allocation
};

// ---------------------------------------------------------------------------
// SimulationOutput - per-date series emitted by one engine run
// ---------------------------------------------------------------------------
struct SimulationOutput {
    std::vector<int> dates;
    std::vector<std::string> symbols;
    std::vector<double> values;
    std::vector<double> returns;   // returns[0] = 0
    std::vector<double> drawdown;  // <= 0
    std::vector<std::vector<double>> weights;  // weights[symbol][date_idx], post-trade
    std::vector<std::vector<double>> prices;   // prices actually used, bad ticks replaced
    std::vector<int> rebalance_dates;
    SimulationDiagnostics diagnostics;
};

// ---------------------------------------------------------------------------
// SimulationEngine - frictionless day-by-day portfolio replay
//
// Day 0 allocates the initial capital from the strategy's first call. On each
// later day the held share counts are marked to the close; on rebalance dates
// the shares are then resized to the strategy's target weights.
// ---------------------------------------------------------------------------
class SimulationEngine {
public:
    static constexpr double WEIGHT_SUM_TOLERANCE = 1e-6;

    SimulationEngine(const BacktestConfig& cfg, const Strategy& strategy)
        : cfg_(cfg), strategy_(strategy) {}

    SimulationOutput run(const AlignedPriceMatrix& matrix,
                         const std::map<std::string, AlignedSeries>& references = {}) const {
        if (!matrix.is_consistent()) {
            throw std::invalid_argument("AlignedPriceMatrix columns do not match the date axis");
        }
        if (matrix.num_dates() < alignment::MIN_ALIGNED_DATES) {
            throw InsufficientDataError("Fewer than 2 aligned trading dates");
        }
        if (matrix.num_symbols() == 0) {
            throw InsufficientDataError("No symbols to simulate");
        }
        if (!(cfg_.initial_capital > 0.0) || !std::isfinite(cfg_.initial_capital)) {
            throw InvalidConfigError("initial_capital", "must be a positive number");
        }

        const size_t n = matrix.num_dates();
        const size_t m = matrix.num_symbols();
        auto log = basket_log::logger();
        log->info("Simulating {} with {} symbols over {} dates ({} .. {}), rebalance {}",
                  strategy_.name(), m, n, date_utils::format_date(matrix.dates.front()),
                  date_utils::format_date(matrix.dates.back()),
                  rebalance::to_string(cfg_.frequency));

        SimulationOutput out;
        out.dates = matrix.dates;
        out.symbols = matrix.symbols;

        // Working copy with bad ticks replaced; strategies only see clean prices.
        AlignedPriceMatrix clean = matrix;
        out.diagnostics.stale_price_fallbacks = clean_prices(clean);
        std::map<std::string, AlignedSeries> clean_refs = references;
        for (auto& [symbol, series] : clean_refs) clean_reference(series, matrix.dates);

        out.values.assign(n, 0.0);
        out.returns.assign(n, 0.0);
        out.drawdown.assign(n, 0.0);
        out.weights.assign(m, std::vector<double>(n, 0.0));

        // Initial allocation.
        std::vector<double> shares(m, 0.0);
        std::vector<double> current(m, 0.0);
        double value = cfg_.initial_capital;
        {
            MarketView view(clean, clean_refs, 0);
            auto target = checked_weights(strategy_.select_weights(view, current), m,
                                          clean.dates[0], out.diagnostics);
            resize(shares, target, value, clean, 0);
            out.rebalance_dates.push_back(clean.dates[0]);
            out.diagnostics.rebalance_count++;
        }
        out.values[0] = value;
        record_weights(out, shares, clean, 0, value, current);

        double peak = value;
        for (size_t t = 1; t < n; ++t) {
            value = mark_to_market(shares, clean, t);

            if (rebalance::is_rebalance_date(clean.dates[t - 1], clean.dates[t], cfg_.frequency)) {
                MarketView view(clean, clean_refs, t);
                auto target = checked_weights(strategy_.select_weights(view, current), m,
                                              clean.dates[t], out.diagnostics);
                resize(shares, target, value, clean, t);
                out.rebalance_dates.push_back(clean.dates[t]);
                out.diagnostics.rebalance_count++;
                log->debug("Rebalanced {} at {} value={:.2f}", strategy_.name(),
                           clean.dates[t], value);
            }

            out.values[t] = value;
            double prev = out.values[t - 1];
            out.returns[t] = prev > 0.0 ? (value - prev) / prev : 0.0;
            if (value > peak) peak = value;
            out.drawdown[t] = peak > 0.0 ? std::min(0.0, (value - peak) / peak) : 0.0;
            record_weights(out, shares, clean, t, value, current);
        }

        out.prices = std::move(clean.prices);
        log->info("Finished {}: final value {:.2f}, {} rebalances, {} price fallbacks",
                  strategy_.name(), out.values.back(), out.diagnostics.rebalance_count,
                  out.diagnostics.stale_price_fallbacks);
        return out;
    }

    // Replace non-positive / non-finite cells with the last valid price of the
    // symbol (its first valid price for leading cells). Returns the number of
    // cells replaced.
    static int clean_prices(AlignedPriceMatrix& matrix) {
        const size_t n = matrix.num_dates();
        const size_t m = matrix.num_symbols();

        for (size_t i = 0; i < m; ++i) {
            if (first_valid(matrix.prices[i]) == n) {
                throw InvalidPriceError("No valid price for " + matrix.symbols[i],
                                        matrix.symbols[i], 0);
            }
        }
        for (size_t t = 0; t < n; ++t) {
            bool any_valid = false;
            for (size_t i = 0; i < m; ++i) {
                if (is_valid_price(matrix.prices[i][t])) any_valid = true;
            }
            if (!any_valid) {
                throw InvalidPriceError("Every symbol has an invalid price on " +
                                            date_utils::format_date(matrix.dates[t]),
                                        "", matrix.dates[t]);
            }
        }

        int replaced = 0;
        for (size_t i = 0; i < m; ++i) {
            replaced += fill_bad_ticks(matrix.prices[i], matrix.symbols[i], matrix.dates);
        }
        return replaced;
    }

    // Same replacement for a reference series aligned on the axis.
    static void clean_reference(AlignedSeries& series, const std::vector<int>& dates) {
        if (first_valid(series.prices) == series.prices.size()) {
            throw InvalidPriceError("No valid price for " + series.symbol, series.symbol, 0);
        }
        fill_bad_ticks(series.prices, series.symbol, dates);
    }

private:
    BacktestConfig cfg_;
    const Strategy& strategy_;

    static size_t first_valid(const std::vector<double>& prices) {
        for (size_t t = 0; t < prices.size(); ++t) {
            if (is_valid_price(prices[t])) return t;
        }
        return prices.size();
    }

    static int fill_bad_ticks(std::vector<double>& prices, const std::string& symbol,
                              const std::vector<int>& dates) {
        size_t first = first_valid(prices);
        if (first == prices.size()) return 0;
        int replaced = 0;
        double last = prices[first];
        for (size_t t = 0; t < prices.size(); ++t) {
            if (is_valid_price(prices[t])) {
                last = prices[t];
                continue;
            }
            basket_log::logger()->warn("Invalid price {} for {} on {}, using {}", prices[t],
                                       symbol, date_utils::format_date(dates[t]), last);
            prices[t] = last;
            ++replaced;
        }
        return replaced;
    }

    // Enforce non-negative weights summing to 1. Small drift is renormalized
    // with a warning; unusable output is an internal error.
    std::vector<double> checked_weights(std::vector<double> w, size_t expected, int date,
                                        SimulationDiagnostics& diag) const {
        if (w.size() != expected) {
            throw std::runtime_error(strategy_.name() + " returned the wrong number of weights");
        }
        double sum = 0.0;
        for (auto& x : w) {
            if (!std::isfinite(x)) {
                throw std::runtime_error(strategy_.name() + " returned a non-finite weight on " +
                                         date_utils::format_date(date));
            }
            if (x < 0.0) x = 0.0;
            sum += x;
        }
        if (sum <= 0.0) {
            throw std::runtime_error(strategy_.name() + " returned all-zero weights on " +
                                     date_utils::format_date(date));
        }
        if (std::abs(sum - 1.0) > WEIGHT_SUM_TOLERANCE) {
            basket_log::logger()->warn("{} weights sum to {:.8f} on {}, renormalizing",
                                       strategy_.name(), sum, date_utils::format_date(date));
            diag.renormalized_rebalances++;
            for (auto& x : w) x /= sum;
        }
        return w;
    }

    static void resize(std::vector<double>& shares, const std::vector<double>& target,
                       double value, const AlignedPriceMatrix& prices, size_t t) {
        for (size_t i = 0; i < shares.size(); ++i) {
            shares[i] = value * target[i] / prices.prices[i][t];
        }
    }

    static double mark_to_market(const std::vector<double>& shares,
                                 const AlignedPriceMatrix& prices, size_t t) {
        double value = 0.0;
        for (size_t i = 0; i < shares.size(); ++i) value += shares[i] * prices.prices[i][t];
        return value;
    }

    static void record_weights(SimulationOutput& out, const std::vector<double>& shares,
                               const AlignedPriceMatrix& prices, size_t t, double value,
                               std::vector<double>& current) {
        for (size_t i = 0; i < shares.size(); ++i) {
            double w = value > 0.0 ? shares[i] * prices.prices[i][t] / value : 0.0;
            out.weights[i][t] = w;
            current[i] = w;
        }
    }
};
