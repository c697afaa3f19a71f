#pragma once

#include "backtest/backtest_result.hpp"
#include "date_utils.hpp"
#include "sim/rebalance_schedule.hpp"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace result_io {

// Escape a string for JSON output
inline std::string json_escape(const std::string& s) {
    std::string result;
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

// Round-trippable number, or null when not finite.
inline std::string num(double v) {
    if (!std::isfinite(v)) return "null";
    std::ostringstream ss;
    ss << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
    return ss.str();
}

inline std::string quoted(const std::string& s) { return "\"" + json_escape(s) + "\""; }

inline void write_array(std::ostringstream& ss, const std::vector<double>& xs) {
    ss << "[";
    for (size_t i = 0; i < xs.size(); ++i) {
        if (i > 0) ss << ",";
        ss << num(xs[i]);
    }
    ss << "]";
}

inline void write_dates(std::ostringstream& ss, const std::vector<int>& dates) {
    ss << "[";
    for (size_t i = 0; i < dates.size(); ++i) {
        if (i > 0) ss << ",";
        ss << quoted(date_utils::format_date(dates[i]));
    }
    ss << "]";
}

inline void write_strings(std::ostringstream& ss, const std::vector<std::string>& xs) {
    ss << "[";
    for (size_t i = 0; i < xs.size(); ++i) {
        if (i > 0) ss << ",";
        ss << quoted(xs[i]);
    }
    ss << "]";
}

inline std::string metrics_json(const PerformanceMetrics& m) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"total_return\":" << num(m.total_return);
    ss << ",\"annualized_return\":" << num(m.annualized_return);
    ss << ",\"volatility\":" << num(m.volatility);
    ss << ",\"sharpe_ratio\":" << num(m.sharpe_ratio);
    ss << ",\"sortino_ratio\":" << num(m.sortino_ratio);
    ss << ",\"calmar_ratio\":" << num(m.calmar_ratio);
    ss << ",\"max_drawdown\":" << num(m.max_drawdown);
    ss << ",\"max_drawdown_duration\":" << m.max_drawdown_duration;
    ss << ",\"var_95\":" << num(m.var_95);
    ss << ",\"cvar_95\":" << num(m.cvar_95);
    ss << ",\"win_rate\":" << num(m.win_rate);
    ss << ",\"profit_factor\":" << num(m.profit_factor);
    ss << ",\"profit_factor_sentinel\":" << (m.profit_factor_sentinel ? "true" : "false");
    ss << ",\"num_periods\":" << m.num_periods;
    ss << ",\"final_value\":" << num(m.final_value);
    ss << ",\"best_period_return\":" << num(m.best_period_return);
    ss << ",\"worst_period_return\":" << num(m.worst_period_return);
    ss << ",\"tail_ratio\":" << num(m.tail_ratio);
    ss << ",\"degenerate_fields\":";
    write_strings(ss, m.degenerate_fields);
    ss << "}";
    return ss.str();
}

inline std::string benchmark_json(const BenchmarkComparison& b) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"symbol\":" << quoted(b.benchmark_symbol);
    ss << ",\"benchmark_total_return\":" << num(b.benchmark_total_return);
    ss << ",\"benchmark_annualized_return\":" << num(b.benchmark_annualized_return);
    ss << ",\"benchmark_volatility\":" << num(b.benchmark_volatility);
    ss << ",\"benchmark_sharpe\":" << num(b.benchmark_sharpe);
    ss << ",\"excess_return\":" << num(b.excess_return);
    ss << ",\"alpha\":" << num(b.alpha);
    ss << ",\"beta\":" << num(b.beta);
    ss << ",\"correlation\":" << num(b.correlation);
    ss << ",\"tracking_error\":" << num(b.tracking_error);
    ss << ",\"information_ratio\":" << num(b.information_ratio);
    ss << ",\"treynor_ratio\":" << num(b.treynor_ratio);
    ss << ",\"up_capture\":" << num(b.up_capture);
    ss << ",\"down_capture\":" << num(b.down_capture);
    ss << ",\"rolling_window\":" << b.rolling_window;
    ss << ",\"rolling_beta\":";
    write_array(ss, b.rolling_beta);
    ss << ",\"rolling_correlation\":";
    write_array(ss, b.rolling_correlation);
    ss << ",\"degenerate_fields\":";
    write_strings(ss, b.degenerate_fields);
    ss << "}";
    return ss.str();
}

// Serialize a BacktestResult to flat JSON
inline std::string to_json(const BacktestResult& r) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"strategy\":" << quoted(r.strategy_name);
    ss << ",\"parameters\":{";
    for (size_t i = 0; i < r.strategy_parameters.size(); ++i) {
        if (i > 0) ss << ",";
        ss << quoted(r.strategy_parameters[i].first) << ":"
           << quoted(r.strategy_parameters[i].second);
    }
    ss << "}";
    ss << ",\"rebalancing_frequency\":" << quoted(rebalance::to_string(r.frequency));
    ss << ",\"initial_capital\":" << num(r.initial_capital);
    ss << ",\"risk_free_rate\":" << num(r.risk_free_rate);
    ss << ",\"symbols\":";
    write_strings(ss, r.symbols);
    ss << ",\"dates\":";
    write_dates(ss, r.dates);
    ss << ",\"portfolio_values\":";
    write_array(ss, r.portfolio_values);
    ss << ",\"returns\":";
    write_array(ss, r.returns);
    ss << ",\"drawdown\":";
    write_array(ss, r.drawdown);

    ss << ",\"weights\":{";
    for (size_t i = 0; i < r.symbols.size(); ++i) {
        if (i > 0) ss << ",";
        ss << quoted(r.symbols[i]) << ":";
        write_array(ss, r.weights[i]);
    }
    ss << "}";

    ss << ",\"rebalance_dates\":";
    write_dates(ss, r.rebalance_dates);
    ss << ",\"metrics\":" << metrics_json(r.metrics);
    if (r.benchmark) {
        ss << ",\"benchmark\":" << benchmark_json(*r.benchmark);
    }

    ss << ",\"asset_contributions\":[";
    for (size_t i = 0; i < r.asset_contributions.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& c = r.asset_contributions[i];
        ss << "{";
        ss << "\"symbol\":" << quoted(c.symbol);
        ss << ",\"initial_weight\":" << num(c.initial_weight);
        ss << ",\"final_weight\":" << num(c.final_weight);
        ss << ",\"average_weight\":" << num(c.average_weight);
        ss << ",\"time_invested\":" << num(c.time_invested);
        ss << ",\"asset_total_return\":" << num(c.asset_total_return);
        ss << ",\"contribution_estimate\":" << num(c.contribution_estimate);
        ss << ",\"is_estimate\":" << (c.is_estimate ? "true" : "false");
        ss << ",\"method\":" << quoted(c.method);
        ss << "}";
    }
    ss << "]";

    ss << ",\"diagnostics\":{";
    ss << "\"stale_price_fallbacks\":" << r.diagnostics.stale_price_fallbacks;
    ss << ",\"renormalized_rebalances\":" << r.diagnostics.renormalized_rebalances;
    ss << ",\"rebalance_count\":" << r.diagnostics.rebalance_count;
    ss << "}";

    ss << "}";
    return ss.str();
}

// One row per date: date,value,return,drawdown,weight_<symbol>...
inline std::string to_csv(const BacktestResult& r) {
    std::ostringstream ss;
    ss << "date,portfolio_value,return,drawdown";
    for (const auto& s : r.symbols) ss << ",weight_" << s;
    ss << "\n";
    for (size_t t = 0; t < r.dates.size(); ++t) {
        ss << date_utils::format_date(r.dates[t]) << "," << num(r.portfolio_values[t]) << ","
           << num(r.returns[t]) << "," << num(r.drawdown[t]);
        for (size_t i = 0; i < r.symbols.size(); ++i) ss << "," << num(r.weights[i][t]);
        ss << "\n";
    }
    return ss.str();
}

inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open output file: " + path);
    }
    out << content;
    if (!out) {
        throw std::runtime_error("Failed writing output file: " + path);
    }
}

}  // namespace result_io
