#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "eurofolio/backtest/backtest_coordinator.hpp"
#include "test_price_utils.hpp"

using namespace eurofolio;
using namespace eurofolio::backtest;
using namespace eurofolio::testing;

class BacktestCoordinatorTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        start_ = Date(2022, 1, 1);
        end_ = Date(2022, 6, 30);
        prices_["SPY"] = make_growth_series(start_, end_, 400.0, 0.0003);
        prices_["AGG"] = make_flat_series(start_, end_, 100.0);
        params_ = make_params(start_, end_, 10000.0, RebalanceFrequency::MONTHLY);
    }

    BacktestCoordinator coordinator_;
    PriceSeriesMap prices_;
    BacktestParams params_;
    Date start_;
    Date end_;
};

TEST_F(BacktestCoordinatorTest, RescaleAllocations) {
    auto rescaled = BacktestCoordinator::rescale_allocations({{"A", 50.0}, {"B", 30.0}});
    ASSERT_EQ(rescaled.size(), 2u);
    EXPECT_EQ(rescaled[0].asset_id, "A");
    EXPECT_NEAR(rescaled[0].percentage, 62.5, 1e-12);
    EXPECT_NEAR(rescaled[1].percentage, 37.5, 1e-12);

    EXPECT_TRUE(BacktestCoordinator::rescale_allocations({}).empty());
}

TEST_F(BacktestCoordinatorTest, FullCoverage) {
    auto result = coordinator_.run({{"SPY", 60.0}, {"AGG", 40.0}}, prices_, params_);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const auto& coordinated = result.value();
    EXPECT_TRUE(coordinated.skipped_assets.empty());
    EXPECT_EQ(coordinated.assets_analyzed, 2);
    EXPECT_EQ(coordinated.total_assets, 2);
    EXPECT_DOUBLE_EQ(coordinated.data_completeness, 1.0);
    EXPECT_NEAR(coordinated.effective_allocations[0].percentage, 60.0, 1e-12);
    EXPECT_EQ(coordinated.results.total_days, 181);
}

TEST_F(BacktestCoordinatorTest, SkipsAssetsWithoutData) {
    prices_["EMPTY"] = PriceSeries();

    auto result = coordinator_.run({{"SPY", 50.0}, {"AGG", 30.0}, {"GLD", 10.0}, {"EMPTY", 10.0}},
                                   prices_, params_);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const auto& coordinated = result.value();
    ASSERT_EQ(coordinated.skipped_assets.size(), 2u);
    EXPECT_EQ(coordinated.skipped_assets[0], "GLD");
    EXPECT_EQ(coordinated.skipped_assets[1], "EMPTY");
    EXPECT_EQ(coordinated.assets_analyzed, 2);
    EXPECT_EQ(coordinated.total_assets, 4);
    EXPECT_DOUBLE_EQ(coordinated.data_completeness, 0.5);

    ASSERT_EQ(coordinated.effective_allocations.size(), 2u);
    EXPECT_NEAR(coordinated.effective_allocations[0].percentage, 62.5, 1e-12);
    EXPECT_NEAR(coordinated.effective_allocations[1].percentage, 37.5, 1e-12);

    nlohmann::json j = coordinated.to_json(false);
    EXPECT_EQ(j["assets_analyzed"], 2);
    EXPECT_EQ(j["skipped_assets"].size(), 2u);
    EXPECT_FALSE(j.contains("performance_data"));
}

TEST_F(BacktestCoordinatorTest, EmptyPortfolio) {
    auto result = coordinator_.run({}, prices_, params_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(BacktestCoordinatorTest, NoPriceData) {
    auto result = coordinator_.run({{"GLD", 100.0}}, prices_, params_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::MISSING_DATA);
}

TEST_F(BacktestCoordinatorTest, EngineErrorsPassThrough) {
    params_.end_date = Date(2021, 12, 1);
    auto result = coordinator_.run({{"SPY", 100.0}}, prices_, params_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::VALIDATION_ERROR);
}
