#pragma once

#include "strategy/indicators.hpp"
#include "strategy/strategy.hpp"
#include "strategy/strategy_config.hpp"

// ---------------------------------------------------------------------------
// RotationStrategy - rotate into number_of_sectors symbols chosen by one of
// three sub-rules, equal weighted
// ---------------------------------------------------------------------------
class RotationStrategy : public StrategyBase {
public:
    using Model = RotationParams::Model;

    RotationStrategy(std::vector<HoldingSpec> holdings, RotationParams params)
        : StrategyBase(std::move(holdings)), params_(params) {}

    std::vector<double> select_weights(const MarketView& view,
                                       const std::vector<double>&) const override {
        const int lookback = params_.lookback_period;
        auto candidates = eligible(view, lookback);
        if (candidates.empty()) return warm_up(view, lookback);

        auto scores = score(view, candidates);
        auto selected = indicators::top_n(candidates, scores, params_.number_of_sectors);
        return indicators::equal_weights(selected, view.num_symbols());
    }

    std::string name() const override { return "rotation"; }

    const RotationParams& params() const { return params_; }

    // Higher is better for every model.
    std::vector<double> score(const MarketView& view, const std::vector<size_t>& candidates) const {
        const int lookback = params_.lookback_period;
        const size_t t = view.index();
        std::vector<double> scores(view.num_symbols(), 0.0);

        switch (params_.rotation_model) {
            case Model::MOMENTUM_BASED:
                for (size_t i : candidates) {
                    scores[i] = indicators::trailing_return(*view.column(i).prices, t, lookback);
                }
                break;
            case Model::MEAN_REVERSION:
                // Most oversold first: negated deviation from the lookback average.
                for (size_t i : candidates) {
                    const auto& prices = *view.column(i).prices;
                    double ma = indicators::moving_average(prices, t, lookback);
                    scores[i] = ma > 0.0 ? -(prices[t] - ma) / ma : 0.0;
                }
                break;
            case Model::RELATIVE_STRENGTH: {
                double avg = 0.0;
                for (size_t i : candidates) {
                    scores[i] = indicators::trailing_return(*view.column(i).prices, t, lookback);
                    avg += scores[i];
                }
                avg /= static_cast<double>(candidates.size());
                if (1.0 + avg != 0.0) {
                    for (size_t i : candidates) scores[i] = (1.0 + scores[i]) / (1.0 + avg) - 1.0;
                }
                break;
            }
        }
        return scores;
    }

private:
    RotationParams params_;
};
