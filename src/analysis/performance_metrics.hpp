#pragma once

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// PerformanceMetrics - risk/return statistics of one value trajectory
//
// Every field is finite. A field whose computation hit a zero denominator or
// a NaN/Inf intermediate is reported as 0 and named in degenerate_fields.
// ---------------------------------------------------------------------------
struct PerformanceMetrics {
    double total_return = 0.0;
    double annualized_return = 0.0;
    double volatility = 0.0;
    double sharpe_ratio = 0.0;
    double sortino_ratio = 0.0;
    double calmar_ratio = 0.0;
    double max_drawdown = 0.0;       // <= 0
    int max_drawdown_duration = 0;   // trading days
    double var_95 = 0.0;
    double cvar_95 = 0.0;
    double win_rate = 0.0;
    double profit_factor = 0.0;
    bool profit_factor_sentinel = false;  // no losing periods
    int num_periods = 0;
    double final_value = 0.0;
    double best_period_return = 0.0;
    double worst_period_return = 0.0;
    double tail_ratio = 0.0;
    std::vector<std::string> degenerate_fields;

    bool is_degenerate(const std::string& field) const {
        return std::find(degenerate_fields.begin(), degenerate_fields.end(), field) !=
               degenerate_fields.end();
    }
};

namespace metrics {

constexpr double TRADING_DAYS_PER_YEAR = 252.0;
constexpr double DEFAULT_RISK_FREE_RATE = 0.02;
constexpr double VAR_CONFIDENCE = 0.05;
constexpr double TAIL_FRACTION = 0.10;
constexpr double PROFIT_FACTOR_SENTINEL = 999.0;

// ---------------------------------------------------------------------------
// Sample statistics
// ---------------------------------------------------------------------------
inline double mean(const std::vector<double>& xs) {
    if (xs.empty()) return 0.0;
    return std::accumulate(xs.begin(), xs.end(), 0.0) / static_cast<double>(xs.size());
}

// Sample (n - 1) standard deviation; 0 for fewer than two values.
inline double sample_stddev(const std::vector<double>& xs) {
    if (xs.size() < 2) return 0.0;
    double m = mean(xs);
    double sum_sq = 0.0;
    for (double x : xs) sum_sq += (x - m) * (x - m);
    return std::sqrt(sum_sq / static_cast<double>(xs.size() - 1));
}

// Linear-interpolated quantile of unsorted data, q in [0, 1].
inline double quantile(std::vector<double> xs, double q) {
    if (xs.empty()) return 0.0;
    std::sort(xs.begin(), xs.end());
    double pos = q * static_cast<double>(xs.size() - 1);
    size_t lo = static_cast<size_t>(std::floor(pos));
    size_t hi = std::min(lo + 1, xs.size() - 1);
    double frac = pos - static_cast<double>(lo);
    return xs[lo] + (xs[hi] - xs[lo]) * frac;
}

inline double annualize(double total_return, int periods) {
    if (periods <= 0) return std::nan("");
    return std::pow(1.0 + total_return, TRADING_DAYS_PER_YEAR / periods) - 1.0;
}

// Longest run of consecutive days strictly below the running peak.
inline int max_drawdown_duration(const std::vector<double>& values) {
    int longest = 0;
    int current = 0;
    double peak = values.empty() ? 0.0 : values.front();
    for (double v : values) {
        if (v >= peak) {
            peak = v;
            current = 0;
        } else {
            ++current;
            longest = std::max(longest, current);
        }
    }
    return longest;
}

// mean(top 10%) / |mean(bottom 10%)|, at least one observation per tail.
inline double tail_ratio(std::vector<double> xs) {
    if (xs.empty()) return std::nan("");
    std::sort(xs.begin(), xs.end());
    size_t k = std::max<size_t>(1, static_cast<size_t>(static_cast<double>(xs.size()) *
                                                      TAIL_FRACTION));
    double bottom = std::accumulate(xs.begin(), xs.begin() + static_cast<long>(k), 0.0) /
                    static_cast<double>(k);
    double top = std::accumulate(xs.end() - static_cast<long>(k), xs.end(), 0.0) /
                 static_cast<double>(k);
    if (bottom == 0.0) return std::nan("");
    return top / std::abs(bottom);
}

namespace detail {

// Report `value` if finite, otherwise 0 with the field flagged.
inline double finite_or_flag(double value, const char* field, PerformanceMetrics& m) {
    if (std::isfinite(value)) return value;
    m.degenerate_fields.emplace_back(field);
    return 0.0;
}

inline double ratio_or_flag(double num, double den, const char* field, PerformanceMetrics& m) {
    if (den == 0.0 || !std::isfinite(den)) {
        m.degenerate_fields.emplace_back(field);
        return 0.0;
    }
    return finite_or_flag(num / den, field, m);
}

}  // namespace detail

// ---------------------------------------------------------------------------
// compute - metrics over the return periods t = 1..n-1 of a value series
//
// `returns[0]` is the day-0 placeholder and is ignored. `drawdown` is the
// engine's drawdown series (same length as values).
// ---------------------------------------------------------------------------
inline PerformanceMetrics compute(const std::vector<double>& values,
                                  const std::vector<double>& returns,
                                  const std::vector<double>& drawdown,
                                  double risk_free_rate = DEFAULT_RISK_FREE_RATE) {
    using detail::finite_or_flag;
    using detail::ratio_or_flag;

    PerformanceMetrics m;
    if (values.empty()) {
        m.degenerate_fields.emplace_back("num_periods");
        return m;
    }

    std::vector<double> period_returns;
    if (returns.size() > 1) period_returns.assign(returns.begin() + 1, returns.end());
    m.num_periods = static_cast<int>(period_returns.size());
    m.final_value = values.back();

    m.total_return = finite_or_flag(
        values.front() != 0.0 ? values.back() / values.front() - 1.0 : std::nan(""),
        "total_return", m);
    m.annualized_return = finite_or_flag(annualize(m.total_return, m.num_periods),
                                         "annualized_return", m);

    if (m.num_periods < 2) {
        m.degenerate_fields.emplace_back("volatility");
    }
    m.volatility = finite_or_flag(
        sample_stddev(period_returns) * std::sqrt(TRADING_DAYS_PER_YEAR), "volatility", m);
    m.sharpe_ratio = ratio_or_flag(m.annualized_return - risk_free_rate, m.volatility,
                                   "sharpe_ratio", m);

    // Downside deviation over the losing periods only.
    std::vector<double> losses;
    for (double r : period_returns) {
        if (r < 0.0) losses.push_back(r);
    }
    double downside = sample_stddev(losses) * std::sqrt(TRADING_DAYS_PER_YEAR);
    m.sortino_ratio = ratio_or_flag(m.annualized_return - risk_free_rate, downside,
                                    "sortino_ratio", m);

    m.max_drawdown = drawdown.empty() ? 0.0 : *std::min_element(drawdown.begin(), drawdown.end());
    m.max_drawdown = finite_or_flag(m.max_drawdown, "max_drawdown", m);
    m.max_drawdown_duration = max_drawdown_duration(values);
    m.calmar_ratio = ratio_or_flag(m.annualized_return, std::abs(m.max_drawdown),
                                   "calmar_ratio", m);

    if (period_returns.empty()) {
        for (const char* f : {"var_95", "cvar_95", "win_rate", "profit_factor", "tail_ratio"}) {
            m.degenerate_fields.emplace_back(f);
        }
        return m;
    }

    m.var_95 = finite_or_flag(quantile(period_returns, VAR_CONFIDENCE), "var_95", m);
    std::vector<double> tail;
    for (double r : period_returns) {
        if (r <= m.var_95) tail.push_back(r);
    }
    m.cvar_95 = finite_or_flag(tail.empty() ? m.var_95 : mean(tail), "cvar_95", m);

    int wins = 0;
    double gains = 0.0;
    double loss_sum = 0.0;
    for (double r : period_returns) {
        if (r > 0.0) {
            ++wins;
            gains += r;
        } else if (r < 0.0) {
            loss_sum += r;
        }
    }
    m.win_rate = static_cast<double>(wins) / static_cast<double>(period_returns.size());
    if (loss_sum < 0.0) {
        m.profit_factor = finite_or_flag(gains / std::abs(loss_sum), "profit_factor", m);
    } else if (gains > 0.0) {
        m.profit_factor = PROFIT_FACTOR_SENTINEL;
        m.profit_factor_sentinel = true;
    }

    auto [worst, best] = std::minmax_element(period_returns.begin(), period_returns.end());
    m.best_period_return = *best;
    m.worst_period_return = *worst;
    m.tail_ratio = finite_or_flag(tail_ratio(period_returns), "tail_ratio", m);
    return m;
}

}  // namespace metrics
