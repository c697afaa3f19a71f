#pragma once

#include "core/errors.hpp"

#include <cmath>
#include <set>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// HoldingSpec - one symbol and its target allocation
// ---------------------------------------------------------------------------
struct HoldingSpec {
    std::string symbol;
    double allocation = 0.0;  // fraction of capital, [0, 1]
};

constexpr double ALLOCATION_SUM_TOLERANCE = 1e-4;

inline void validate_holdings(const std::vector<HoldingSpec>& holdings) {
    if (holdings.empty()) {
        throw InvalidConfigError("holdings", "at least one holding is required");
    }
    std::set<std::string> seen;
    double sum = 0.0;
    for (const auto& h : holdings) {
        if (h.symbol.empty()) {
            throw InvalidConfigError("holdings", "holding with empty symbol");
        }
        if (!seen.insert(h.symbol).second) {
            throw InvalidConfigError("holdings", "duplicate symbol " + h.symbol);
        }
        if (!std::isfinite(h.allocation) || h.allocation < 0.0 || h.allocation > 1.0) {
            throw InvalidConfigError("allocation",
                                     h.symbol + " allocation must be in [0, 1], got " +
                                         std::to_string(h.allocation));
        }
        sum += h.allocation;
    }
    if (std::abs(sum - 1.0) > ALLOCATION_SUM_TOLERANCE) {
        throw InvalidConfigError("allocation",
                                 "allocations must sum to 1.0, got " + std::to_string(sum));
    }
}

inline std::vector<std::string> holding_symbols(const std::vector<HoldingSpec>& holdings) {
    std::vector<std::string> out;
    out.reserve(holdings.size());
    for (const auto& h : holdings) out.push_back(h.symbol);
    return out;
}

inline std::vector<double> holding_weights(const std::vector<HoldingSpec>& holdings) {
    std::vector<double> out;
    out.reserve(holdings.size());
    for (const auto& h : holdings) out.push_back(h.allocation);
    return out;
}

// Rescale so allocations sum to exactly 1. All-zero input is left alone.
inline std::vector<HoldingSpec> normalize_allocations(std::vector<HoldingSpec> holdings) {
    double sum = 0.0;
    for (const auto& h : holdings) sum += h.allocation;
    if (sum <= 0.0) return holdings;
    for (auto& h : holdings) h.allocation /= sum;
    return holdings;
}
