// portfolio_backtest_cli_test.cpp - command-line behaviour of the backtest tools
//
// Runs the built binaries; tests skip when the tools have not been built.

#include <gtest/gtest.h>

#include "test_cli_helpers.hpp"
#include "test_price_helpers.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace test_helpers;
using cli_test_helpers::BACKTEST_BINARY;
using cli_test_helpers::PARQUET_BINARY;
using cli_test_helpers::binary_available;
using cli_test_helpers::read_all_lines;
using cli_test_helpers::run_command;

namespace {

constexpr int NUM_DATES = 50;

std::string read_file(const std::string& path) {
    std::ifstream f(path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

}  // namespace

class PortfolioBacktestCliTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!binary_available(BACKTEST_BINARY)) {
            GTEST_SKIP() << BACKTEST_BINARY << " not built";
        }
        dir_ = std::filesystem::temp_directory_path() / "portfolio_backtest_cli_test";
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_ / "prices");

        auto dates = trading_days(MONDAY_20240101, NUM_DATES);
        write_price_csv((dir_ / "prices" / "AAA.csv").string(),
                        make_series("AAA", dates, geometric_prices(NUM_DATES, 100.0, 0.002)));
        write_price_csv((dir_ / "prices" / "BBB.csv").string(),
                        make_series("BBB", dates, wavy_prices(NUM_DATES, 40.0, 0.03)));
        write_price_csv((dir_ / "SPY.csv").string(),
                        make_series("SPY", dates, geometric_prices(NUM_DATES, 400.0, 0.001)));
    }

    void TearDown() override {
        if (!dir_.empty()) std::filesystem::remove_all(dir_);
    }

    std::string path(const std::string& name) const { return (dir_ / name).string(); }

    std::string base_args() const {
        return " --prices " + path("prices") + " --holding AAA=0.6 --holding BBB=0.4";
    }

    std::filesystem::path dir_;
};

TEST_F(PortfolioBacktestCliTest, HelpExitsZero) {
    auto r = run_command(BACKTEST_BINARY + " --help");
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_NE(r.output.find("--holding"), std::string::npos);
}

TEST_F(PortfolioBacktestCliTest, MissingHoldingIsUsageError) {
    auto r = run_command(BACKTEST_BINARY + " --prices " + path("prices"));
    EXPECT_EQ(r.exit_code, 1);
    EXPECT_NE(r.output.find("Usage"), std::string::npos);
}

TEST_F(PortfolioBacktestCliTest, UnknownFlagIsUsageError) {
    auto r = run_command(BACKTEST_BINARY + base_args() + " --leverage 2");
    EXPECT_EQ(r.exit_code, 1);
}

TEST_F(PortfolioBacktestCliTest, WritesJsonAndCsv) {
    auto r = run_command(BACKTEST_BINARY + base_args() +
                         " --strategy momentum --param lookback_period=10 --param top_n=1"
                         " --frequency weekly --benchmark SPY=" + path("SPY.csv") +
                         " --output " + path("out.json") + " --csv " + path("out.csv"));
    ASSERT_EQ(r.exit_code, 0) << r.output;

    auto json = read_file(path("out.json"));
    EXPECT_NE(json.find("\"strategy\":\"momentum\""), std::string::npos);
    EXPECT_NE(json.find("\"rebalancing_frequency\":\"weekly\""), std::string::npos);
    EXPECT_NE(json.find("\"benchmark\":{\"symbol\":\"SPY\""), std::string::npos);

    auto lines = read_all_lines(path("out.csv"));
    ASSERT_EQ(lines.size(), static_cast<size_t>(NUM_DATES + 1));
    EXPECT_EQ(lines[0], "date,portfolio_value,return,drawdown,weight_AAA,weight_BBB");
}

TEST_F(PortfolioBacktestCliTest, BadAllocationExitsTwo) {
    auto r = run_command(BACKTEST_BINARY + " --prices " + path("prices") +
                         " --holding AAA=0.6 --holding BBB=0.6");
    EXPECT_EQ(r.exit_code, 2);
    EXPECT_NE(r.output.find("allocation"), std::string::npos);
}

TEST_F(PortfolioBacktestCliTest, UnknownStrategyExitsTwo) {
    auto r = run_command(BACKTEST_BINARY + base_args() + " --strategy martingale");
    EXPECT_EQ(r.exit_code, 2);
}

TEST_F(PortfolioBacktestCliTest, DuplicatePriceSeriesExitsTwo) {
    auto r = run_command(BACKTEST_BINARY + base_args() + " --price AAA=" +
                         path("prices/AAA.csv"));
    EXPECT_EQ(r.exit_code, 2);
    EXPECT_NE(r.output.find("duplicate"), std::string::npos);
}

TEST_F(PortfolioBacktestCliTest, MissingPriceFileExitsOne) {
    auto r = run_command(BACKTEST_BINARY + " --price AAA=" + path("nope.csv") +
                         " --holding AAA=1.0");
    EXPECT_EQ(r.exit_code, 1);
}

TEST_F(PortfolioBacktestCliTest, ParquetToolRequiresParquetExtension) {
    if (!binary_available(PARQUET_BINARY)) {
        GTEST_SKIP() << PARQUET_BINARY << " not built";
    }
    auto r = run_command(PARQUET_BINARY + base_args() + " --output " + path("out.csv"));
    EXPECT_EQ(r.exit_code, 1);

    auto ok = run_command(PARQUET_BINARY + base_args() + " --output " + path("out.parquet"));
    EXPECT_EQ(ok.exit_code, 0) << ok.output;
    EXPECT_TRUE(std::filesystem::exists(path("out.parquet")));
}
