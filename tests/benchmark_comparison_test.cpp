// benchmark_comparison_test.cpp - portfolio statistics relative to a benchmark

#include <gtest/gtest.h>

#include "analysis/benchmark_comparison.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace {

// Day-0 placeholder followed by an alternating pattern.
std::vector<double> sample_returns(size_t n) {
    std::vector<double> r(n, 0.0);
    const double pattern[] = {0.01, -0.005, 0.02, -0.015, 0.007};
    for (size_t t = 1; t < n; ++t) r[t] = pattern[t % 5];
    return r;
}

bool flagged(const BenchmarkComparison& c, const std::string& field) {
    return std::find(c.degenerate_fields.begin(), c.degenerate_fields.end(), field) !=
           c.degenerate_fields.end();
}

}  // namespace

// ===========================================================================
// 1. Helpers
// ===========================================================================
class BenchmarkHelperTest : public ::testing::Test {};

TEST_F(BenchmarkHelperTest, ReturnsFromPrices) {
    auto r = benchmark::returns_from_prices({100.0, 110.0, 99.0});
    ASSERT_EQ(r.size(), 3u);
    EXPECT_DOUBLE_EQ(r[0], 0.0);
    EXPECT_NEAR(r[1], 0.1, 1e-12);
    EXPECT_NEAR(r[2], -0.1, 1e-12);
}

TEST_F(BenchmarkHelperTest, CovarianceOfSelfIsSampleVariance) {
    std::vector<double> x = {1.0, 2.0, 3.0, 4.0};
    EXPECT_NEAR(benchmark::covariance(x, x, 0, 4), 5.0 / 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(benchmark::covariance(x, x, 2, 3), 0.0);
}

TEST_F(BenchmarkHelperTest, CompoundedSkipsPlaceholder) {
    EXPECT_NEAR(benchmark::compounded({0.5, 0.1, 0.1}), 0.21, 1e-12);
}

// ===========================================================================
// 2. compare
// ===========================================================================
class BenchmarkCompareTest : public ::testing::Test {};

TEST_F(BenchmarkCompareTest, SelfComparison) {
    auto r = sample_returns(60);
    auto c = benchmark::compare(r, r, "SPY", 0.02, 20);

    EXPECT_EQ(c.benchmark_symbol, "SPY");
    EXPECT_NEAR(c.beta, 1.0, 1e-12);
    EXPECT_NEAR(c.alpha, 0.0, 1e-12);
    EXPECT_NEAR(c.correlation, 1.0, 1e-12);
    EXPECT_NEAR(c.excess_return, 0.0, 1e-12);
    EXPECT_DOUBLE_EQ(c.tracking_error, 0.0);
    EXPECT_DOUBLE_EQ(c.information_ratio, 0.0);
    EXPECT_TRUE(flagged(c, "information_ratio"));
    EXPECT_NEAR(c.up_capture, 1.0, 1e-12);
    EXPECT_NEAR(c.down_capture, 1.0, 1e-12);
}

TEST_F(BenchmarkCompareTest, LeveragedPortfolioHasBetaTwo) {
    auto b = sample_returns(60);
    std::vector<double> p(b.size());
    for (size_t t = 0; t < b.size(); ++t) p[t] = 2.0 * b[t];
    auto c = benchmark::compare(p, b, "SPY");

    EXPECT_NEAR(c.beta, 2.0, 1e-12);
    EXPECT_NEAR(c.correlation, 1.0, 1e-12);
    EXPECT_GT(c.tracking_error, 0.0);
    double ann_p = metrics::annualize(benchmark::compounded(p), 59);
    EXPECT_NEAR(c.treynor_ratio, (ann_p - 0.02) / 2.0, 1e-9);
}

TEST_F(BenchmarkCompareTest, CaptureRatios) {
    std::vector<double> b = {0.0, 0.01, -0.02, 0.03};
    std::vector<double> p = {0.0, 0.02, -0.01, 0.03};
    auto c = benchmark::compare(p, b, "SPY");
    EXPECT_NEAR(c.up_capture, 1.25, 1e-12);
    EXPECT_NEAR(c.down_capture, 0.5, 1e-12);
}

TEST_F(BenchmarkCompareTest, NoDownDaysFlagsDownCapture) {
    std::vector<double> b = {0.0, 0.01, 0.02, 0.03};
    std::vector<double> p = {0.0, 0.02, 0.01, 0.03};
    auto c = benchmark::compare(p, b, "SPY");
    EXPECT_DOUBLE_EQ(c.down_capture, 0.0);
    EXPECT_TRUE(flagged(c, "down_capture"));
}

TEST_F(BenchmarkCompareTest, FlatBenchmarkFlagsBeta) {
    auto p = sample_returns(30);
    std::vector<double> b(30, 0.0);
    auto c = benchmark::compare(p, b, "CASH");
    EXPECT_DOUBLE_EQ(c.beta, 0.0);
    EXPECT_TRUE(flagged(c, "beta"));
    EXPECT_TRUE(flagged(c, "correlation"));
    EXPECT_TRUE(flagged(c, "treynor_ratio"));
    EXPECT_TRUE(flagged(c, "benchmark_sharpe"));
}

TEST_F(BenchmarkCompareTest, RollingSeriesFillAfterWindow) {
    auto r = sample_returns(40);
    auto c = benchmark::compare(r, r, "SPY", 0.02, 10);
    ASSERT_EQ(c.rolling_beta.size(), 40u);
    ASSERT_EQ(c.rolling_correlation.size(), 40u);
    for (size_t t = 0; t < 10; ++t) EXPECT_DOUBLE_EQ(c.rolling_beta[t], 0.0);
    for (size_t t = 10; t < 40; ++t) {
        EXPECT_NEAR(c.rolling_beta[t], 1.0, 1e-12);
        EXPECT_NEAR(c.rolling_correlation[t], 1.0, 1e-12);
    }
}

TEST_F(BenchmarkCompareTest, WindowLongerThanSeriesLeavesZeros) {
    auto r = sample_returns(8);
    auto c = benchmark::compare(r, r, "SPY", 0.02, 60);
    EXPECT_EQ(c.rolling_beta, std::vector<double>(8, 0.0));
}

TEST_F(BenchmarkCompareTest, MismatchedLengthsRejected) {
    EXPECT_THROW(benchmark::compare(sample_returns(10), sample_returns(9), "SPY"),
                 std::invalid_argument);
}
