#pragma once

#include "strategy/strategy.hpp"

class BuyAndHoldStrategy : public StrategyBase {
public:
    explicit BuyAndHoldStrategy(std::vector<HoldingSpec> holdings)
        : StrategyBase(std::move(holdings)) {}

    std::vector<double> select_weights(const MarketView&,
                                       const std::vector<double>&) const override {
        return base_weights_;
    }

    std::string name() const override { return "buy_and_hold"; }
};
