#pragma once

#include "strategy/indicators.hpp"
#include "strategy/strategy.hpp"
#include "strategy/strategy_config.hpp"

#include <algorithm>
#include <cmath>

// ---------------------------------------------------------------------------
// MeanReversionStrategy - tilt the holding weights against the deviation
// from each symbol's moving average
//
// d = (p - MA) / MA. Beyond the threshold the weight becomes base * (1 - d),
// so a symbol 20% below its average gets 1.2x its base weight and one 20%
// above gets 0.8x. Weights are floored at 0 and renormalized.
// ---------------------------------------------------------------------------
class MeanReversionStrategy : public StrategyBase {
public:
    MeanReversionStrategy(std::vector<HoldingSpec> holdings, MeanReversionParams params)
        : StrategyBase(std::move(holdings)), params_(params) {}

    std::vector<double> select_weights(const MarketView& view,
                                       const std::vector<double>&) const override {
        // An MA over P prices needs P - 1 price changes of history.
        const int days = params_.ma_period - 1;
        auto candidates = eligible(view, days);
        if (candidates.empty()) return warm_up(view, days);

        std::vector<double> w = base_weights_;
        for (size_t i : candidates) {
            const auto& prices = *view.column(i).prices;
            double ma = indicators::moving_average(prices, view.index(), params_.ma_period);
            if (ma <= 0.0) continue;
            double d = (prices[view.index()] - ma) / ma;
            if (std::abs(d) > params_.deviation_threshold) {
                w[i] = std::max(0.0, base_weights_[i] * (1.0 - d));
            }
        }
        auto out = indicators::normalized(w);
        double sum = 0.0;
        for (double x : out) sum += x;
        return sum > 0.0 ? out : base_weights_;
    }

    std::string name() const override { return "mean_reversion"; }

    const MeanReversionParams& params() const { return params_; }

private:
    MeanReversionParams params_;
};
