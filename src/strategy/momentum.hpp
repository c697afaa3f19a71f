#pragma once

#include "strategy/indicators.hpp"
#include "strategy/strategy.hpp"
#include "strategy/strategy_config.hpp"

// ---------------------------------------------------------------------------
// MomentumStrategy - equal weight on the top_n trailing-return symbols
// ---------------------------------------------------------------------------
class MomentumStrategy : public StrategyBase {
public:
    MomentumStrategy(std::vector<HoldingSpec> holdings, MomentumParams params)
        : StrategyBase(std::move(holdings)), params_(params) {}

    std::vector<double> select_weights(const MarketView& view,
                                       const std::vector<double>&) const override {
        auto candidates = eligible(view, params_.lookback_period);
        if (candidates.empty()) return warm_up(view, params_.lookback_period);

        std::vector<double> scores(view.num_symbols(), 0.0);
        for (size_t i : candidates) {
            scores[i] = indicators::trailing_return(*view.column(i).prices, view.index(),
                                                    params_.lookback_period);
        }
        auto selected = indicators::top_n(candidates, scores, params_.top_n);
        return indicators::equal_weights(selected, view.num_symbols());
    }

    std::string name() const override { return "momentum"; }

    const MomentumParams& params() const { return params_; }

private:
    MomentumParams params_;
};
