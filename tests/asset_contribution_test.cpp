// asset_contribution_test.cpp - per-holding contribution estimates

#include <gtest/gtest.h>

#include "analysis/asset_contribution.hpp"

#include <stdexcept>
#include <string>
#include <vector>

class AssetContributionTest : public ::testing::Test {};

TEST_F(AssetContributionTest, AverageWeightTimesAssetReturn) {
    std::vector<std::string> symbols = {"A", "B"};
    std::vector<std::vector<double>> weights = {{0.6, 0.65, 0.7, 0.65}, {0.4, 0.35, 0.3, 0.35}};
    std::vector<std::vector<double>> prices = {{100.0, 110.0, 120.0, 115.0},
                                               {50.0, 48.0, 45.0, 47.5}};
    auto out = contribution::estimate(symbols, weights, prices);
    ASSERT_EQ(out.size(), 2u);

    EXPECT_EQ(out[0].symbol, "A");
    EXPECT_DOUBLE_EQ(out[0].initial_weight, 0.6);
    EXPECT_DOUBLE_EQ(out[0].final_weight, 0.65);
    EXPECT_NEAR(out[0].average_weight, 0.65, 1e-12);
    EXPECT_NEAR(out[0].asset_total_return, 0.15, 1e-12);
    EXPECT_NEAR(out[0].contribution_estimate, 0.65 * 0.15, 1e-12);

    EXPECT_NEAR(out[1].asset_total_return, -0.05, 1e-12);
    EXPECT_NEAR(out[1].contribution_estimate, 0.35 * -0.05, 1e-12);
}

TEST_F(AssetContributionTest, LabelledAsEstimate) {
    auto out = contribution::estimate({"A"}, {{1.0, 1.0}}, {{10.0, 11.0}});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_TRUE(out[0].is_estimate);
    EXPECT_EQ(out[0].method, "average_weight_x_asset_return");
}

TEST_F(AssetContributionTest, TimeInvestedIgnoresDustWeights) {
    auto out = contribution::estimate({"A"}, {{0.0, 0.0005, 0.2, 0.3}}, {{10.0, 10.0, 10.0, 10.0}});
    EXPECT_NEAR(out[0].time_invested, 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(out[0].contribution_estimate, 0.0);
}

TEST_F(AssetContributionTest, MismatchedInputsRejected) {
    EXPECT_THROW(contribution::estimate({"A", "B"}, {{1.0}}, {{10.0}, {20.0}}),
                 std::invalid_argument);
}
