#pragma once

#include "core/log.hpp"
#include "portfolio/holding.hpp"
#include "strategy/market_view.hpp"

#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// Strategy - maps the market history up to a rebalance date to target weights
//
// Weights are returned in holding order, non-negative, summing to 1.
// Implementations are stateless beyond their parameters.
// ---------------------------------------------------------------------------
class Strategy {
public:
    virtual ~Strategy() = default;
    virtual std::vector<double> select_weights(const MarketView& view,
                                               const std::vector<double>& current) const = 0;
    virtual std::string name() const = 0;
};

// ---------------------------------------------------------------------------
// StrategyBase - holdings bookkeeping shared by every strategy
// ---------------------------------------------------------------------------
class StrategyBase : public Strategy {
public:
    explicit StrategyBase(std::vector<HoldingSpec> holdings)
        : holdings_(std::move(holdings)), base_weights_(holding_weights(holdings_)) {}

    const std::vector<HoldingSpec>& holdings() const { return holdings_; }
    const std::vector<double>& base_weights() const { return base_weights_; }

protected:
    std::vector<HoldingSpec> holdings_;
    std::vector<double> base_weights_;

    // Held symbols with at least `days` of real history at the view's date.
    std::vector<size_t> eligible(const MarketView& view, int days) const {
        std::vector<size_t> out;
        for (size_t i = 0; i < view.num_symbols(); ++i) {
            if (view.has_history(i, days)) out.push_back(i);
        }
        return out;
    }

    // Not enough history for the rule yet: hold the configured allocation.
    std::vector<double> warm_up(const MarketView& view, int days) const {
        basket_log::logger()->debug("{}: no symbol has {} days of history at {}, using holding weights",
                                    name(), days, view.date());
        return base_weights_;
    }
};
