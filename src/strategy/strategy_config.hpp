#pragma once

#include "core/errors.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <map>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

// ---------------------------------------------------------------------------
// Per-strategy parameter sets
// ---------------------------------------------------------------------------
enum class StrategyType {
    BUY_AND_HOLD,
    MOMENTUM,
    RELATIVE_STRENGTH,
    MEAN_REVERSION,
    RISK_PARITY,
    TACTICAL_ALLOCATION,
    ROTATION,
};

struct BuyAndHoldParams {};

struct MomentumParams {
    int lookback_period = 60;
    int top_n = 3;
};

struct RelativeStrengthParams {
    int lookback_period = 126;
    int top_n = 2;
    std::string benchmark_symbol = "SPY";
};

struct MeanReversionParams {
    int ma_period = 50;
    double deviation_threshold = 0.1;
};

struct RiskParityParams {
    int volatility_window = 60;
    double min_weight = 0.05;
    double max_weight = 0.5;
};

struct TacticalAllocationParams {
    enum class Indicator { MOVING_AVERAGE, VOLATILITY, MOMENTUM };

    Indicator indicator = Indicator::MOVING_AVERAGE;
    int ma_period = 200;
    double risk_on_allocation = 0.8;
    double risk_off_allocation = 0.2;
    double volatility_threshold = 0.20;  // annualized
};

struct RotationParams {
    enum class Model { MOMENTUM_BASED, MEAN_REVERSION, RELATIVE_STRENGTH };

    Model rotation_model = Model::MOMENTUM_BASED;
    int number_of_sectors = 3;
    int lookback_period = 90;
};

using StrategyParams = std::variant<BuyAndHoldParams, MomentumParams, RelativeStrengthParams,
                                    MeanReversionParams, RiskParityParams,
                                    TacticalAllocationParams, RotationParams>;

namespace strategy_config {

constexpr int MIN_PERIOD = 1;
constexpr int MAX_PERIOD = 500;
constexpr int MIN_VOLATILITY_WINDOW = 2;
constexpr int MAX_SELECTION = 1000;
constexpr double RISK_SPLIT_TOLERANCE = 1e-4;
constexpr double MAX_VOLATILITY_THRESHOLD = 5.0;

inline const char* type_name(StrategyType t) {
    switch (t) {
        case StrategyType::BUY_AND_HOLD:        return "buy_and_hold";
        case StrategyType::MOMENTUM:            return "momentum";
        case StrategyType::RELATIVE_STRENGTH:   return "relative_strength";
        case StrategyType::MEAN_REVERSION:      return "mean_reversion";
        case StrategyType::RISK_PARITY:         return "risk_parity";
        case StrategyType::TACTICAL_ALLOCATION: return "tactical_allocation";
        case StrategyType::ROTATION:            return "rotation";
    }
    return "unknown";
}

inline StrategyType parse_type(const std::string& name) {
    if (name == "buy_and_hold" || name == "buy_hold") return StrategyType::BUY_AND_HOLD;
    if (name == "momentum") return StrategyType::MOMENTUM;
    if (name == "relative_strength") return StrategyType::RELATIVE_STRENGTH;
    if (name == "mean_reversion") return StrategyType::MEAN_REVERSION;
    if (name == "risk_parity") return StrategyType::RISK_PARITY;
    if (name == "tactical_allocation") return StrategyType::TACTICAL_ALLOCATION;
    if (name == "rotation") return StrategyType::ROTATION;
    throw InvalidConfigError("strategy", "unknown strategy type '" + name + "'");
}

inline const char* indicator_name(TacticalAllocationParams::Indicator i) {
    switch (i) {
        case TacticalAllocationParams::Indicator::MOVING_AVERAGE: return "moving_average";
        case TacticalAllocationParams::Indicator::VOLATILITY:     return "volatility";
        case TacticalAllocationParams::Indicator::MOMENTUM:       return "momentum";
    }
    return "unknown";
}

inline const char* rotation_model_name(RotationParams::Model m) {
    switch (m) {
        case RotationParams::Model::MOMENTUM_BASED:    return "momentum_based";
        case RotationParams::Model::MEAN_REVERSION:    return "mean_reversion";
        case RotationParams::Model::RELATIVE_STRENGTH: return "relative_strength";
    }
    return "unknown";
}

namespace detail {

inline void check_range(const char* name, int value, int lo, int hi) {
    if (value < lo || value > hi) {
        throw InvalidConfigError(name, "must be in [" + std::to_string(lo) + ", " +
                                           std::to_string(hi) + "], got " +
                                           std::to_string(value));
    }
}

inline void check_unit(const char* name, double value) {
    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        throw InvalidConfigError(name, "must be in [0, 1], got " + std::to_string(value));
    }
}

inline void check(const BuyAndHoldParams&) {}

inline void check(const MomentumParams& p) {
    check_range("lookback_period", p.lookback_period, MIN_PERIOD, MAX_PERIOD);
    check_range("top_n", p.top_n, 1, MAX_SELECTION);
}

inline void check(const RelativeStrengthParams& p) {
    check_range("lookback_period", p.lookback_period, MIN_PERIOD, MAX_PERIOD);
    check_range("top_n", p.top_n, 1, MAX_SELECTION);
    if (p.benchmark_symbol.empty()) {
        throw InvalidConfigError("benchmark_symbol", "must not be empty");
    }
}

inline void check(const MeanReversionParams& p) {
    check_range("ma_period", p.ma_period, MIN_PERIOD, MAX_PERIOD);
    if (!std::isfinite(p.deviation_threshold) || p.deviation_threshold <= 0.0 ||
        p.deviation_threshold > 1.0) {
        throw InvalidConfigError("deviation_threshold",
                                 "must be in (0, 1], got " +
                                     std::to_string(p.deviation_threshold));
    }
}

inline void check(const RiskParityParams& p) {
    check_range("volatility_window", p.volatility_window, MIN_VOLATILITY_WINDOW, MAX_PERIOD);
    check_unit("min_weight", p.min_weight);
    check_unit("max_weight", p.max_weight);
    if (p.min_weight >= p.max_weight) {
        throw InvalidConfigError("min_weight", "must be below max_weight");
    }
}

inline void check(const TacticalAllocationParams& p) {
    check_range("ma_period", p.ma_period, MIN_PERIOD, MAX_PERIOD);
    check_unit("risk_on_allocation", p.risk_on_allocation);
    check_unit("risk_off_allocation", p.risk_off_allocation);
    if (std::abs(p.risk_on_allocation + p.risk_off_allocation - 1.0) > RISK_SPLIT_TOLERANCE) {
        throw InvalidConfigError("risk_on_allocation",
                                 "risk_on_allocation + risk_off_allocation must sum to 1.0");
    }
    if (!std::isfinite(p.volatility_threshold) || p.volatility_threshold <= 0.0 ||
        p.volatility_threshold > MAX_VOLATILITY_THRESHOLD) {
        throw InvalidConfigError("volatility_threshold",
                                 "must be in (0, 5], got " +
                                     std::to_string(p.volatility_threshold));
    }
}

inline void check(const RotationParams& p) {
    check_range("number_of_sectors", p.number_of_sectors, 1, MAX_SELECTION);
    check_range("lookback_period", p.lookback_period, MIN_PERIOD, MAX_PERIOD);
}

}  // namespace detail

}  // namespace strategy_config

// ---------------------------------------------------------------------------
// StrategyConfig - tagged strategy parameters, validated on construction
// ---------------------------------------------------------------------------
class StrategyConfig {
public:
    StrategyConfig() : StrategyConfig(BuyAndHoldParams{}) {}

    // Throws InvalidConfigError when a parameter is outside its bounds.
    explicit StrategyConfig(StrategyParams params) : params_(std::move(params)) {
        std::visit([](const auto& p) { strategy_config::detail::check(p); }, params_);
    }

    StrategyType type() const { return static_cast<StrategyType>(params_.index()); }
    const char* type_name() const { return strategy_config::type_name(type()); }
    const StrategyParams& params() const { return params_; }

    template <typename T>
    const T& get() const { return std::get<T>(params_); }

private:
    StrategyParams params_;
};

namespace strategy_config {

namespace detail {

inline int parse_int(const std::string& key, const std::string& text) {
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(text.c_str(), &end, 10);
    if (text.empty() || end == nullptr || *end != '\0') {
        throw InvalidConfigError(key, "expected an integer, got '" + text + "'");
    }
    if (errno == ERANGE || v < std::numeric_limits<int>::min() ||
        v > std::numeric_limits<int>::max()) {
        throw InvalidConfigError(key, "integer out of range: '" + text + "'");
    }
    return static_cast<int>(v);
}

inline double parse_double(const std::string& key, const std::string& text) {
    char* end = nullptr;
    double v = std::strtod(text.c_str(), &end);
    if (text.empty() || end == nullptr || *end != '\0') {
        throw InvalidConfigError(key, "expected a number, got '" + text + "'");
    }
    return v;
}

inline TacticalAllocationParams::Indicator parse_indicator(const std::string& text) {
    if (text == "moving_average") return TacticalAllocationParams::Indicator::MOVING_AVERAGE;
    if (text == "volatility") return TacticalAllocationParams::Indicator::VOLATILITY;
    if (text == "momentum") return TacticalAllocationParams::Indicator::MOMENTUM;
    throw InvalidConfigError("indicator", "unknown indicator '" + text + "'");
}

inline RotationParams::Model parse_rotation_model(const std::string& text) {
    if (text == "momentum_based") return RotationParams::Model::MOMENTUM_BASED;
    if (text == "mean_reversion") return RotationParams::Model::MEAN_REVERSION;
    if (text == "relative_strength") return RotationParams::Model::RELATIVE_STRENGTH;
    throw InvalidConfigError("rotation_model", "unknown rotation model '" + text + "'");
}

inline void unknown_key(const std::string& key, StrategyType type) {
    throw InvalidConfigError(key, std::string("not a parameter of ") + type_name(type));
}

}  // namespace detail

// Build a config from string key/value pairs; missing keys keep their defaults.
inline StrategyConfig parse(const std::string& type_text,
                            const std::map<std::string, std::string>& values) {
    StrategyType type = parse_type(type_text);
    using namespace detail;

    switch (type) {
        case StrategyType::BUY_AND_HOLD: {
            for (const auto& [key, _] : values) unknown_key(key, type);
            return StrategyConfig(BuyAndHoldParams{});
        }
        case StrategyType::MOMENTUM: {
            MomentumParams p;
            for (const auto& [key, text] : values) {
                if (key == "lookback_period") p.lookback_period = parse_int(key, text);
                else if (key == "top_n") p.top_n = parse_int(key, text);
                else unknown_key(key, type);
            }
            return StrategyConfig(p);
        }
        case StrategyType::RELATIVE_STRENGTH: {
            RelativeStrengthParams p;
            for (const auto& [key, text] : values) {
                if (key == "lookback_period") p.lookback_period = parse_int(key, text);
                else if (key == "top_n") p.top_n = parse_int(key, text);
                else if (key == "benchmark_symbol") p.benchmark_symbol = text;
                else unknown_key(key, type);
            }
            return StrategyConfig(p);
        }
        case StrategyType::MEAN_REVERSION: {
            MeanReversionParams p;
            for (const auto& [key, text] : values) {
                if (key == "ma_period") p.ma_period = parse_int(key, text);
                else if (key == "deviation_threshold") p.deviation_threshold = parse_double(key, text);
                else unknown_key(key, type);
            }
            return StrategyConfig(p);
        }
        case StrategyType::RISK_PARITY: {
            RiskParityParams p;
            for (const auto& [key, text] : values) {
                if (key == "volatility_window") p.volatility_window = parse_int(key, text);
                else if (key == "min_weight") p.min_weight = parse_double(key, text);
                else if (key == "max_weight") p.max_weight = parse_double(key, text);
                else unknown_key(key, type);
            }
            return StrategyConfig(p);
        }
        case StrategyType::TACTICAL_ALLOCATION: {
            TacticalAllocationParams p;
            for (const auto& [key, text] : values) {
                if (key == "indicator") p.indicator = parse_indicator(text);
                else if (key == "ma_period") p.ma_period = parse_int(key, text);
                else if (key == "risk_on_allocation") p.risk_on_allocation = parse_double(key, text);
                else if (key == "risk_off_allocation") p.risk_off_allocation = parse_double(key, text);
                else if (key == "volatility_threshold") p.volatility_threshold = parse_double(key, text);
                else unknown_key(key, type);
            }
            return StrategyConfig(p);
        }
        case StrategyType::ROTATION: {
            RotationParams p;
            for (const auto& [key, text] : values) {
                if (key == "rotation_model") p.rotation_model = parse_rotation_model(text);
                else if (key == "number_of_sectors") p.number_of_sectors = parse_int(key, text);
                else if (key == "lookback_period") p.lookback_period = parse_int(key, text);
                else unknown_key(key, type);
            }
            return StrategyConfig(p);
        }
    }
    throw InvalidConfigError("strategy", "unhandled strategy type");
}

// Parameter key/value pairs, in declaration order, for reporting.
inline std::vector<std::pair<std::string, std::string>> describe(const StrategyConfig& config) {
    using Pairs = std::vector<std::pair<std::string, std::string>>;
    auto num = [](double v) {
        std::string s = std::to_string(v);
        while (s.size() > 1 && s.back() == '0') s.pop_back();
        if (!s.empty() && s.back() == '.') s.pop_back();
        return s;
    };
    switch (config.type()) {
        case StrategyType::BUY_AND_HOLD:
            return {};
        case StrategyType::MOMENTUM: {
            const auto& p = config.get<MomentumParams>();
            return Pairs{{"lookback_period", std::to_string(p.lookback_period)},
                         {"top_n", std::to_string(p.top_n)}};
        }
        case StrategyType::RELATIVE_STRENGTH: {
            const auto& p = config.get<RelativeStrengthParams>();
            return Pairs{{"lookback_period", std::to_string(p.lookback_period)},
                         {"top_n", std::to_string(p.top_n)},
                         {"benchmark_symbol", p.benchmark_symbol}};
        }
        case StrategyType::MEAN_REVERSION: {
            const auto& p = config.get<MeanReversionParams>();
            return Pairs{{"ma_period", std::to_string(p.ma_period)},
                         {"deviation_threshold", num(p.deviation_threshold)}};
        }
        case StrategyType::RISK_PARITY: {
            const auto& p = config.get<RiskParityParams>();
            return Pairs{{"volatility_window", std::to_string(p.volatility_window)},
                         {"min_weight", num(p.min_weight)},
                         {"max_weight", num(p.max_weight)}};
        }
        case StrategyType::TACTICAL_ALLOCATION: {
            const auto& p = config.get<TacticalAllocationParams>();
            return Pairs{{"indicator", indicator_name(p.indicator)},
                         {"ma_period", std::to_string(p.ma_period)},
                         {"risk_on_allocation", num(p.risk_on_allocation)},
                         {"risk_off_allocation", num(p.risk_off_allocation)},
                         {"volatility_threshold", num(p.volatility_threshold)}};
        }
        case StrategyType::ROTATION: {
            const auto& p = config.get<RotationParams>();
            return Pairs{{"rotation_model", rotation_model_name(p.rotation_model)},
                         {"number_of_sectors", std::to_string(p.number_of_sectors)},
                         {"lookback_period", std::to_string(p.lookback_period)}};
        }
    }
    return {};
}

}  // namespace strategy_config
