// portfolio_backtest.cpp - run one basket backtest from CSV price files
//
// Writes the full result as JSON (to --output or stdout) and optionally the
// per-date series as CSV. Exit codes: 0 success, 1 usage or I/O error,
// 2 backtest error (bad config, insufficient data, invalid prices).

#include "backtest/backtest_runner.hpp"
#include "cli_args.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include "io/result_json.hpp"

#include <spdlog/cfg/env.h>

#include <iostream>
#include <string>

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --holding SYM=weight... (--prices <dir> | --price SYM=path...) [options]\n"
              << "\n";
    cli::print_common_usage(std::cerr);
    std::cerr << "  --output <path>         JSON result file (default: stdout)\n"
              << "  --csv <path>            Per-date CSV series\n";
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    spdlog::cfg::load_env_levels();

    CliOptions opt;
    try {
        opt = cli::parse(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }
    if (opt.help) {
        print_usage(argv[0]);
        return 0;
    }
    if (!opt.log_level.empty()) basket_log::set_level(opt.log_level);

    try {
        auto req = cli::build_request(opt);
        auto result = BacktestRunner::run(req);

        auto json = result_io::to_json(result);
        if (opt.output.empty()) {
            std::cout << json << "\n";
        } else {
            result_io::write_file(opt.output, json);
            basket_log::logger()->info("Wrote {}", opt.output);
        }
        if (!opt.csv.empty()) {
            result_io::write_file(opt.csv, result_io::to_csv(result));
            basket_log::logger()->info("Wrote {}", opt.csv);
        }
    } catch (const BacktestError& e) {
        basket_log::logger()->error("Backtest failed: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        basket_log::logger()->error("{}", e.what());
        return 1;
    }
    return 0;
}
