#pragma once

#include "portfolio/holding.hpp"
#include "strategy/buy_and_hold.hpp"
#include "strategy/mean_reversion.hpp"
#include "strategy/momentum.hpp"
#include "strategy/relative_strength.hpp"
#include "strategy/risk_parity.hpp"
#include "strategy/rotation.hpp"
#include "strategy/strategy_config.hpp"
#include "strategy/tactical_allocation.hpp"

#include <memory>
#include <vector>

class StrategyFactory {
public:
    static std::unique_ptr<Strategy> create(const StrategyConfig& config,
                                            const std::vector<HoldingSpec>& holdings) {
        switch (config.type()) {
            case StrategyType::BUY_AND_HOLD:
                return std::make_unique<BuyAndHoldStrategy>(holdings);
            case StrategyType::MOMENTUM:
                return std::make_unique<MomentumStrategy>(holdings, config.get<MomentumParams>());
            case StrategyType::RELATIVE_STRENGTH:
                return std::make_unique<RelativeStrengthStrategy>(
                    holdings, config.get<RelativeStrengthParams>());
            case StrategyType::MEAN_REVERSION:
                return std::make_unique<MeanReversionStrategy>(
                    holdings, config.get<MeanReversionParams>());
            case StrategyType::RISK_PARITY:
                return std::make_unique<RiskParityStrategy>(holdings,
                                                            config.get<RiskParityParams>());
            case StrategyType::TACTICAL_ALLOCATION:
                return std::make_unique<TacticalAllocationStrategy>(
                    holdings, config.get<TacticalAllocationParams>());
            case StrategyType::ROTATION:
                return std::make_unique<RotationStrategy>(holdings, config.get<RotationParams>());
        }
        return nullptr;
    }
};
