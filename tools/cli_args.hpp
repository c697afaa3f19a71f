#pragma once

// Shared flag parsing for the backtest command-line tools.

#include "backtest/backtest_runner.hpp"
#include "date_utils.hpp"
#include "io/csv_price_loader.hpp"
#include "portfolio/holding.hpp"
#include "sim/rebalance_schedule.hpp"
#include "strategy/strategy_config.hpp"

#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Bad command line: the tool prints usage and exits 1.
class UsageError : public std::invalid_argument {
public:
    explicit UsageError(const std::string& what) : std::invalid_argument(what) {}
};

struct CliOptions {
    std::string prices_dir;
    std::vector<std::pair<std::string, std::string>> price_files;  // SYM=path
    std::vector<HoldingSpec> holdings;
    std::string strategy = "buy_and_hold";
    std::map<std::string, std::string> params;
    std::string frequency = "monthly";
    double capital = 10000.0;
    int start_date = 0;
    int end_date = 0;
    double risk_free_rate = 0.02;
    int rolling_window = 60;
    std::optional<std::pair<std::string, std::string>> benchmark;  // SYM=path
    std::string output;
    std::string csv;
    std::string log_level;  // empty keeps SPDLOG_LEVEL or the default
    bool help = false;
};

namespace cli {

inline std::pair<std::string, std::string> split_pair(const std::string& flag,
                                                      const std::string& text) {
    auto eq = text.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == text.size()) {
        throw UsageError(flag + " expects KEY=VALUE, got '" + text + "'");
    }
    return {text.substr(0, eq), text.substr(eq + 1)};
}

inline double to_double(const std::string& flag, const std::string& text) {
    char* end = nullptr;
    double v = std::strtod(text.c_str(), &end);
    if (text.empty() || *end != '\0') {
        throw UsageError(flag + " expects a number, got '" + text + "'");
    }
    return v;
}

inline int to_date(const std::string& flag, const std::string& text) {
    int d = date_utils::parse_date(text);
    if (d == 0) throw UsageError(flag + " expects YYYY-MM-DD, got '" + text + "'");
    return d;
}

inline CliOptions parse(int argc, char* argv[]) {
    CliOptions opt;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            opt.help = true;
            continue;
        }
        if (i + 1 >= argc) throw UsageError("Missing value for " + arg);
        std::string value = argv[++i];

        if (arg == "--prices") {
            opt.prices_dir = value;
        } else if (arg == "--price") {
            opt.price_files.push_back(split_pair(arg, value));
        } else if (arg == "--holding") {
            auto [sym, w] = split_pair(arg, value);
            opt.holdings.push_back({sym, to_double(arg, w)});
        } else if (arg == "--strategy") {
            opt.strategy = value;
        } else if (arg == "--param") {
            auto [key, v] = split_pair(arg, value);
            opt.params[key] = v;
        } else if (arg == "--frequency") {
            opt.frequency = value;
        } else if (arg == "--capital") {
            opt.capital = to_double(arg, value);
        } else if (arg == "--start") {
            opt.start_date = to_date(arg, value);
        } else if (arg == "--end") {
            opt.end_date = to_date(arg, value);
        } else if (arg == "--risk-free") {
            opt.risk_free_rate = to_double(arg, value);
        } else if (arg == "--rolling-window") {
            opt.rolling_window = static_cast<int>(to_double(arg, value));
        } else if (arg == "--benchmark") {
            opt.benchmark = split_pair(arg, value);
        } else if (arg == "--output") {
            opt.output = value;
        } else if (arg == "--csv") {
            opt.csv = value;
        } else if (arg == "--log-level") {
            opt.log_level = value;
        } else {
            throw UsageError("Unknown argument: " + arg);
        }
    }
    if (opt.help) return opt;
    if (opt.holdings.empty()) throw UsageError("Missing required argument: --holding");
    if (opt.prices_dir.empty() && opt.price_files.empty()) {
        throw UsageError("Missing required argument: --prices or --price");
    }
    return opt;
}

// Loads the price files and assembles the request. Throws BacktestError for
// bad strategy/frequency settings and std::runtime_error for unreadable files.
inline BacktestRequest build_request(const CliOptions& opt) {
    BacktestRequest req;
    req.holdings = opt.holdings;
    req.strategy = strategy_config::parse(opt.strategy, opt.params);
    req.config.frequency = rebalance::parse(opt.frequency);
    req.config.initial_capital = opt.capital;
    req.config.start_date = opt.start_date;
    req.config.end_date = opt.end_date;
    req.config.risk_free_rate = opt.risk_free_rate;
    req.config.rolling_window = opt.rolling_window;

    if (!opt.prices_dir.empty()) req.prices = csv_prices::load_directory(opt.prices_dir);
    for (const auto& [sym, path] : opt.price_files) {
        req.prices.push_back(csv_prices::load(path, sym));
    }
    if (opt.benchmark) {
        req.benchmark = csv_prices::load(opt.benchmark->second, opt.benchmark->first);
    }
    return req;
}

inline void print_common_usage(std::ostream& os) {
    os << "  --prices <dir>          Directory of <SYMBOL>.csv files (date,close|adj_close)\n"
       << "  --price SYM=path        Price file for one symbol (repeatable)\n"
       << "  --holding SYM=weight    Holding and target allocation (repeatable)\n"
       << "  --strategy <type>       buy_and_hold, momentum, relative_strength, mean_reversion,\n"
       << "                          risk_parity, tactical_allocation, rotation\n"
       << "  --param key=value       Strategy parameter (repeatable)\n"
       << "  --frequency <f>         daily, weekly, monthly, quarterly, yearly, none\n"
       << "  --capital <amount>      Initial capital (default 10000)\n"
       << "  --start / --end <date>  Date range, YYYY-MM-DD\n"
       << "  --risk-free <rate>      Annual risk-free rate (default 0.02)\n"
       << "  --rolling-window <n>    Benchmark rolling window (default 60)\n"
       << "  --benchmark SYM=path    Benchmark price file\n"
       << "  --log-level <level>     trace, debug, info, warn, error, off\n";
}

}  // namespace cli
