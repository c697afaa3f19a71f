// backtest_parquet_export.cpp - run one basket backtest and write the
// per-date series (date, value, return, drawdown, weights) as Parquet.
//
// Same flags as portfolio_backtest; --output must name a .parquet file.

#include "backtest/backtest_runner.hpp"
#include "cli_args.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include "io/result_parquet.hpp"

#include <spdlog/cfg/env.h>

#include <filesystem>
#include <iostream>
#include <string>

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --holding SYM=weight... (--prices <dir> | --price SYM=path...)"
              << " --output <file.parquet> [options]\n"
              << "\n";
    cli::print_common_usage(std::cerr);
    std::cerr << "  --output <path>         Parquet output file (.parquet)\n";
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
    if (opt.output.empty()) {
        std::cerr << "Missing required argument: --output\n";
        print_usage(argv[0]);
        return 1;
    }
    if (std::filesystem::path(opt.output).extension() != ".parquet") {
        std::cerr << "Unsupported output format. Use a .parquet extension.\n";
        return 1;
    }
    if (!opt.log_level.empty()) basket_log::set_level(opt.log_level);

    try {
        auto result = BacktestRunner::run(cli::build_request(opt));
        result_parquet::write(result, opt.output);
        basket_log::logger()->info("Wrote {} rows to {}", result.num_dates(), opt.output);
    } catch (const BacktestError& e) {
        basket_log::logger()->error("Backtest failed: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        basket_log::logger()->error("{}", e.what());
        return 1;
    }
    return 0;
}
