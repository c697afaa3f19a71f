#pragma once

#include "strategy/indicators.hpp"
#include "strategy/strategy.hpp"
#include "strategy/strategy_config.hpp"

#include <algorithm>
#include <cmath>

// ---------------------------------------------------------------------------
// TacticalAllocationStrategy - regime switch between an equity bucket and a
// defensive bucket
//
// The first holding is the regime signal. The first max(1, n/2) holdings form
// the equity bucket, the rest the defensive bucket. Risk-on gives equity
// risk_on_allocation, risk-off gives it risk_off_allocation. Inside each
// bucket the holding weights keep their relative proportions.
// ---------------------------------------------------------------------------
class TacticalAllocationStrategy : public StrategyBase {
public:
    using Indicator = TacticalAllocationParams::Indicator;

    TacticalAllocationStrategy(std::vector<HoldingSpec> holdings, TacticalAllocationParams params)
        : StrategyBase(std::move(holdings)), params_(params) {}

    std::vector<double> select_weights(const MarketView& view,
                                       const std::vector<double>&) const override {
        const int days = required_history();
        if (!view.has_history(SIGNAL_INDEX, days)) return warm_up(view, days);

        bool on = risk_on(view);
        basket_log::logger()->debug("{}: {} regime at {}", name(), on ? "risk-on" : "risk-off",
                                    view.date());
        return bucket_weights(on ? params_.risk_on_allocation : params_.risk_off_allocation);
    }

    std::string name() const override { return "tactical_allocation"; }

    const TacticalAllocationParams& params() const { return params_; }

    size_t equity_bucket_size() const {
        return std::max<size_t>(1, holdings_.size() / 2);
    }

    bool risk_on(const MarketView& view) const {
        const auto& prices = *view.column(SIGNAL_INDEX).prices;
        size_t t = view.index();
        switch (params_.indicator) {
            case Indicator::MOVING_AVERAGE:
                return prices[t] > indicators::moving_average(prices, t, params_.ma_period);
            case Indicator::VOLATILITY: {
                double vol = indicators::trailing_volatility(prices, t, volatility_window()) *
                             std::sqrt(indicators::TRADING_DAYS_PER_YEAR);
                return vol < params_.volatility_threshold;
            }
            case Indicator::MOMENTUM:
                return indicators::trailing_return(prices, t, params_.ma_period) > 0.0;
        }
        return false;
    }

    // Equity bucket share -> full weight vector in holding order.
    std::vector<double> bucket_weights(double equity_share) const {
        size_t n = holdings_.size();
        size_t split = equity_bucket_size();
        if (split >= n) equity_share = 1.0;

        std::vector<double> w(n, 0.0);
        spread(w, 0, split, equity_share);
        spread(w, split, n, 1.0 - equity_share);
        return w;
    }

private:
    static constexpr size_t SIGNAL_INDEX = 0;

    TacticalAllocationParams params_;

    int volatility_window() const { return std::max(2, params_.ma_period); }

    int required_history() const {
        switch (params_.indicator) {
            case Indicator::MOVING_AVERAGE: return params_.ma_period - 1;
            case Indicator::VOLATILITY:     return volatility_window();
            case Indicator::MOMENTUM:       return params_.ma_period;
        }
        return params_.ma_period;
    }

    // Distribute `share` over [begin, end) in proportion to the holding
    // weights, or equally when those are all zero.
    void spread(std::vector<double>& w, size_t begin, size_t end, double share) const {
        if (begin >= end || share <= 0.0) return;
        double base = 0.0;
        for (size_t i = begin; i < end; ++i) base += base_weights_[i];
        for (size_t i = begin; i < end; ++i) {
            w[i] = base > 0.0 ? share * base_weights_[i] / base
                              : share / static_cast<double>(end - begin);
        }
    }
};
