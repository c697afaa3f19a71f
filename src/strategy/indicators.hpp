#pragma once

#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>

// ---------------------------------------------------------------------------
// Trailing-window indicators over a price column ending at index t
// ---------------------------------------------------------------------------
namespace indicators {

constexpr double TRADING_DAYS_PER_YEAR = 252.0;
constexpr double VOLATILITY_FLOOR = 1e-12;
constexpr int MAX_SCALE_DOUBLINGS = 128;
constexpr int BISECTION_ITERATIONS = 200;

// p[t] / p[t - lookback] - 1
inline double trailing_return(const std::vector<double>& prices, size_t t, int lookback) {
    size_t start = t - static_cast<size_t>(lookback);
    if (prices[start] == 0.0) return 0.0;
    return prices[t] / prices[start] - 1.0;
}

// Mean of the `period` prices ending at t.
inline double moving_average(const std::vector<double>& prices, size_t t, int period) {
    size_t start = t + 1 - static_cast<size_t>(period);
    double sum = 0.0;
    for (size_t k = start; k <= t; ++k) sum += prices[k];
    return sum / static_cast<double>(period);
}

// Sample standard deviation of the last `window` simple returns ending at t.
inline double trailing_volatility(const std::vector<double>& prices, size_t t, int window) {
    if (window < 2) return 0.0;
    size_t start = t - static_cast<size_t>(window);
    double sum = 0.0;
    double sum_sq = 0.0;
    int n = 0;
    for (size_t k = start + 1; k <= t; ++k) {
        double ret = prices[k - 1] != 0.0 ? prices[k] / prices[k - 1] - 1.0 : 0.0;
        sum += ret;
        sum_sq += ret * ret;
        ++n;
    }
    double mean = sum / static_cast<double>(n);
    double var = (sum_sq - static_cast<double>(n) * mean * mean) / static_cast<double>(n - 1);
    return std::sqrt(std::max(var, 0.0));
}

// Indices of the `n` highest scores among `candidates`, ties kept in candidate order.
inline std::vector<size_t> top_n(const std::vector<size_t>& candidates,
                                 const std::vector<double>& scores, int n) {
    std::vector<size_t> ranked = candidates;
    std::stable_sort(ranked.begin(), ranked.end(),
                     [&](size_t a, size_t b) { return scores[a] > scores[b]; });
    if (static_cast<int>(ranked.size()) > n) ranked.resize(static_cast<size_t>(n));
    return ranked;
}

inline std::vector<double> equal_weights(const std::vector<size_t>& selected, size_t num_symbols) {
    std::vector<double> w(num_symbols, 0.0);
    if (selected.empty()) return w;
    double share = 1.0 / static_cast<double>(selected.size());
    for (size_t i : selected) w[i] = share;
    return w;
}

// Scale non-negative weights to sum to 1. All-zero input stays all zero.
inline std::vector<double> normalized(std::vector<double> w) {
    double sum = std::accumulate(w.begin(), w.end(), 0.0);
    if (sum <= 0.0) return w;
    for (auto& x : w) x /= sum;
    return w;
}

// Project raw non-negative scores onto weights in [lo, hi] summing to 1:
// w_i = clamp(c * raw_i, lo, hi) with the scale c found by bisection, so
// weights keep the ordering of the scores and never exceed hi.
inline std::vector<double> project_to_bounds(const std::vector<double>& raw, double lo,
                                             double hi) {
    size_t n = raw.size();
    if (n == 0) return {};
    // Infeasible bounds: the uniform split is the closest feasible point.
    if (lo * static_cast<double>(n) > 1.0 || hi * static_cast<double>(n) < 1.0) {
        return std::vector<double>(n, 1.0 / static_cast<double>(n));
    }
    if (*std::max_element(raw.begin(), raw.end()) <= 0.0) {
        return std::vector<double>(n, 1.0 / static_cast<double>(n));
    }

    auto clamped_sum = [&](double c) {
        double sum = 0.0;
        for (double r : raw) sum += std::clamp(c * r, lo, hi);
        return sum;
    };

    double c_lo = 0.0;
    double c_hi = 1.0;
    for (int i = 0; i < MAX_SCALE_DOUBLINGS && clamped_sum(c_hi) < 1.0; ++i) c_hi *= 2.0;
    for (int i = 0; i < BISECTION_ITERATIONS; ++i) {
        double mid = 0.5 * (c_lo + c_hi);
        if (clamped_sum(mid) < 1.0) c_lo = mid;
        else c_hi = mid;
    }

    std::vector<double> w(n);
    for (size_t i = 0; i < n; ++i) w[i] = std::clamp(c_hi * raw[i], lo, hi);
    return w;
}

}  // namespace indicators
