#pragma once

#include "analysis/performance_metrics.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// BenchmarkComparison - portfolio statistics relative to a benchmark series
// ---------------------------------------------------------------------------
struct BenchmarkComparison {
    std::string benchmark_symbol;
    double benchmark_total_return = 0.0;
    double benchmark_annualized_return = 0.0;
    double benchmark_volatility = 0.0;
    double benchmark_sharpe = 0.0;
    double excess_return = 0.0;  // annualized portfolio - annualized benchmark
    double alpha = 0.0;
    double beta = 0.0;
    double correlation = 0.0;
    double tracking_error = 0.0;
    double information_ratio = 0.0;
    double treynor_ratio = 0.0;
    double up_capture = 0.0;
    double down_capture = 0.0;
    int rolling_window = 0;
    std::vector<double> rolling_beta;         // one per date, 0 until the window fills
    std::vector<double> rolling_correlation;
    std::vector<std::string> degenerate_fields;
};

namespace benchmark {

// Simple returns of a price column, with the day-0 placeholder 0.
inline std::vector<double> returns_from_prices(const std::vector<double>& prices) {
    std::vector<double> out(prices.size(), 0.0);
    for (size_t t = 1; t < prices.size(); ++t) {
        out[t] = prices[t - 1] != 0.0 ? prices[t] / prices[t - 1] - 1.0 : 0.0;
    }
    return out;
}

// Sample covariance over [begin, end). Variance is covariance(x, x), so both
// go through the same arithmetic.
inline double covariance(const std::vector<double>& x, const std::vector<double>& y,
                         size_t begin, size_t end) {
    if (end <= begin + 1) return 0.0;
    double n = static_cast<double>(end - begin);
    double mx = 0.0, my = 0.0;
    for (size_t i = begin; i < end; ++i) {
        mx += x[i];
        my += y[i];
    }
    mx /= n;
    my /= n;
    double sum = 0.0;
    for (size_t i = begin; i < end; ++i) sum += (x[i] - mx) * (y[i] - my);
    return sum / (n - 1.0);
}

inline double compounded(const std::vector<double>& returns) {
    double growth = 1.0;
    for (size_t t = 1; t < returns.size(); ++t) growth *= 1.0 + returns[t];
    return growth - 1.0;
}

// Mean portfolio return over the days where `select` holds for the benchmark
// return, divided by the benchmark's own mean on those days.
template <typename Pred>
double capture_ratio(const std::vector<double>& p, const std::vector<double>& b, Pred select) {
    double sum_p = 0.0, sum_b = 0.0;
    int count = 0;
    for (size_t t = 1; t < b.size(); ++t) {
        if (!select(b[t])) continue;
        sum_p += p[t];
        sum_b += b[t];
        ++count;
    }
    if (count == 0 || sum_b == 0.0) return std::nan("");
    return sum_p / sum_b;
}

// Rolling beta and correlation over `window` return periods ending at t.
inline void fill_rolling(BenchmarkComparison& cmp, const std::vector<double>& p,
                         const std::vector<double>& b, int window) {
    size_t n = p.size();
    cmp.rolling_beta.assign(n, 0.0);
    cmp.rolling_correlation.assign(n, 0.0);
    if (window < 2) return;
    size_t w = static_cast<size_t>(window);
    for (size_t t = w; t < n; ++t) {
        size_t begin = t + 1 - w;
        double cov = covariance(p, b, begin, t + 1);
        double var_b = covariance(b, b, begin, t + 1);
        double var_p = covariance(p, p, begin, t + 1);
        if (var_b > 0.0) cmp.rolling_beta[t] = cov / var_b;
        if (var_b > 0.0 && var_p > 0.0) {
            cmp.rolling_correlation[t] = cov / (std::sqrt(var_p) * std::sqrt(var_b));
        }
    }
}

// ---------------------------------------------------------------------------
// compare - both return series share the date axis and carry the day-0
// placeholder at index 0
// ---------------------------------------------------------------------------
inline BenchmarkComparison compare(const std::vector<double>& portfolio_returns,
                                   const std::vector<double>& benchmark_returns,
                                   const std::string& symbol,
                                   double risk_free_rate = metrics::DEFAULT_RISK_FREE_RATE,
                                   int rolling_window = 60) {
    if (portfolio_returns.size() != benchmark_returns.size()) {
        throw std::invalid_argument("Benchmark returns not aligned with portfolio returns");
    }
    const auto& p = portfolio_returns;
    const auto& b = benchmark_returns;
    const size_t n = p.size();
    const int periods = n > 0 ? static_cast<int>(n - 1) : 0;

    BenchmarkComparison cmp;
    cmp.benchmark_symbol = symbol;
    cmp.rolling_window = rolling_window;

    auto flag = [&](double value, const char* field) {
        if (std::isfinite(value)) return value;
        cmp.degenerate_fields.emplace_back(field);
        return 0.0;
    };
    auto ratio = [&](double num, double den, const char* field) {
        if (den == 0.0 || !std::isfinite(den)) {
            cmp.degenerate_fields.emplace_back(field);
            return 0.0;
        }
        return flag(num / den, field);
    };

    double ann_p = flag(metrics::annualize(compounded(p), periods), "annualized_return");
    cmp.benchmark_total_return = flag(compounded(b), "benchmark_total_return");
    cmp.benchmark_annualized_return =
        flag(metrics::annualize(cmp.benchmark_total_return, periods),
             "benchmark_annualized_return");

    double var_p = covariance(p, p, 1, n);
    double var_b = covariance(b, b, 1, n);
    double cov = covariance(p, b, 1, n);
    const double annual = std::sqrt(metrics::TRADING_DAYS_PER_YEAR);

    cmp.benchmark_volatility = std::sqrt(var_b) * annual;
    cmp.benchmark_sharpe = ratio(cmp.benchmark_annualized_return - risk_free_rate,
                                 cmp.benchmark_volatility, "benchmark_sharpe");
    cmp.excess_return = ann_p - cmp.benchmark_annualized_return;

    cmp.beta = ratio(cov, var_b, "beta");
    cmp.alpha = ann_p - cmp.beta * cmp.benchmark_annualized_return;
    cmp.correlation = ratio(cov, std::sqrt(var_p) * std::sqrt(var_b), "correlation");

    std::vector<double> diff(n, 0.0);
    for (size_t t = 1; t < n; ++t) diff[t] = p[t] - b[t];
    cmp.tracking_error = std::sqrt(covariance(diff, diff, 1, n)) * annual;
    cmp.information_ratio = ratio(cmp.alpha, cmp.tracking_error, "information_ratio");
    cmp.treynor_ratio = ratio(ann_p - risk_free_rate, cmp.beta, "treynor_ratio");

    cmp.up_capture = flag(capture_ratio(p, b, [](double r) { return r > 0.0; }), "up_capture");
    cmp.down_capture =
        flag(capture_ratio(p, b, [](double r) { return r < 0.0; }), "down_capture");

    fill_rolling(cmp, p, b, rolling_window);
    return cmp;
}

}  // namespace benchmark
