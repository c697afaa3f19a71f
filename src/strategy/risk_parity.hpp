#pragma once

#include "strategy/indicators.hpp"
#include "strategy/strategy.hpp"
#include "strategy/strategy_config.hpp"

#include <algorithm>

// ---------------------------------------------------------------------------
// RiskParityStrategy - inverse-volatility weights bounded to [min, max]
// ---------------------------------------------------------------------------
class RiskParityStrategy : public StrategyBase {
public:
    RiskParityStrategy(std::vector<HoldingSpec> holdings, RiskParityParams params)
        : StrategyBase(std::move(holdings)), params_(params) {}

    std::vector<double> select_weights(const MarketView& view,
                                       const std::vector<double>&) const override {
        auto candidates = eligible(view, params_.volatility_window);
        if (candidates.empty()) return warm_up(view, params_.volatility_window);

        std::vector<double> inverse_vol;
        inverse_vol.reserve(candidates.size());
        for (size_t i : candidates) {
            double vol = indicators::trailing_volatility(*view.column(i).prices, view.index(),
                                                         params_.volatility_window);
            inverse_vol.push_back(1.0 / std::max(vol, indicators::VOLATILITY_FLOOR));
        }
        auto bounded = indicators::project_to_bounds(indicators::normalized(inverse_vol),
                                                     params_.min_weight, params_.max_weight);

        std::vector<double> w(view.num_symbols(), 0.0);
        for (size_t k = 0; k < candidates.size(); ++k) w[candidates[k]] = bounded[k];
        return w;
    }

    std::string name() const override { return "risk_parity"; }

    const RiskParityParams& params() const { return params_; }

private:
    RiskParityParams params_;
};
