#pragma once

#include "core/errors.hpp"
#include "strategy/indicators.hpp"
#include "strategy/strategy.hpp"
#include "strategy/strategy_config.hpp"

// ---------------------------------------------------------------------------
// RelativeStrengthStrategy - equal weight on the top_n symbols by return
// relative to a benchmark: (1 + r_symbol) / (1 + r_benchmark) - 1
// ---------------------------------------------------------------------------
class RelativeStrengthStrategy : public StrategyBase {
public:
    RelativeStrengthStrategy(std::vector<HoldingSpec> holdings, RelativeStrengthParams params)
        : StrategyBase(std::move(holdings)), params_(std::move(params)) {}

    std::vector<double> select_weights(const MarketView& view,
                                       const std::vector<double>&) const override {
        const int lookback = params_.lookback_period;
        PriceColumn bench = view.find_column(params_.benchmark_symbol);
        if (!bench) {
            throw InvalidConfigError("benchmark_symbol",
                                     "no price series for " + params_.benchmark_symbol);
        }
        auto candidates = eligible(view, lookback);
        if (candidates.empty() || !view.column_has_history(bench, lookback)) {
            return warm_up(view, lookback);
        }

        double bench_return = indicators::trailing_return(*bench.prices, view.index(), lookback);
        std::vector<double> scores(view.num_symbols(), 0.0);
        for (size_t i : candidates) {
            double r = indicators::trailing_return(*view.column(i).prices, view.index(), lookback);
            scores[i] = (1.0 + bench_return) != 0.0 ? (1.0 + r) / (1.0 + bench_return) - 1.0 : r;
        }
        auto selected = indicators::top_n(candidates, scores, params_.top_n);
        return indicators::equal_weights(selected, view.num_symbols());
    }

    std::string name() const override { return "relative_strength"; }

    const RelativeStrengthParams& params() const { return params_; }

private:
    RelativeStrengthParams params_;
};
