#pragma once

#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// AssetContribution - approximate share of the portfolio return per holding
//
// contribution_estimate = average weight x the asset's own total return.
// It ignores the timing of weight changes, so the estimates do not sum to
// the portfolio return in general and must not be read as exact attribution.
// ---------------------------------------------------------------------------
struct AssetContribution {
    std::string symbol;
    double initial_weight = 0.0;
    double final_weight = 0.0;
    double average_weight = 0.0;
    double time_invested = 0.0;  // fraction of dates with weight > INVESTED_THRESHOLD
    double asset_total_return = 0.0;
    double contribution_estimate = 0.0;
    bool is_estimate = true;
    std::string method;
};

namespace contribution {

constexpr double INVESTED_THRESHOLD = 0.001;
inline const std::string METHOD = "average_weight_x_asset_return";

// `weights[i]` and `prices[i]` are per-date columns for symbols[i].
inline std::vector<AssetContribution> estimate(const std::vector<std::string>& symbols,
                                               const std::vector<std::vector<double>>& weights,
                                               const std::vector<std::vector<double>>& prices) {
    if (weights.size() != symbols.size() || prices.size() != symbols.size()) {
        throw std::invalid_argument("Contribution inputs do not match the symbol list");
    }

    std::vector<AssetContribution> out;
    out.reserve(symbols.size());
    for (size_t i = 0; i < symbols.size(); ++i) {
        const auto& w = weights[i];
        const auto& p = prices[i];
        AssetContribution c;
        c.symbol = symbols[i];
        c.method = METHOD;
        if (w.empty() || p.size() != w.size()) {
            out.push_back(c);
            continue;
        }

        double sum = 0.0;
        int invested = 0;
        for (double x : w) {
            sum += x;
            if (x > INVESTED_THRESHOLD) ++invested;
        }
        c.initial_weight = w.front();
        c.final_weight = w.back();
        c.average_weight = sum / static_cast<double>(w.size());
        c.time_invested = static_cast<double>(invested) / static_cast<double>(w.size());
        c.asset_total_return = p.front() > 0.0 ? p.back() / p.front() - 1.0 : 0.0;
        c.contribution_estimate = c.average_weight * c.asset_total_return;
        out.push_back(c);
    }
    return out;
}

}  // namespace contribution
