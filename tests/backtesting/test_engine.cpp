#include <gtest/gtest.h>
#include <cmath>
#include <thread>
#include <vector>
#include "../core/test_base.hpp"
#include "eurofolio/backtest/backtest_engine.hpp"
#include "test_price_utils.hpp"

using namespace eurofolio;
using namespace eurofolio::backtest;
using namespace eurofolio::testing;

class BacktestEngineTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        start_ = Date(2021, 1, 1);
        end_ = Date(2022, 12, 31);
        prices_["EQUITY"] = make_growth_series(start_, end_, 100.0, 0.0004);
        prices_["BOND"] = make_growth_series(start_, end_, 50.0, 0.0001);
    }

    BacktestEngine engine_;
    PriceSeriesMap prices_;
    Date start_;
    Date end_;
};

TEST_F(BacktestEngineTest, FlatPortfolio) {
    PriceSeriesMap flat;
    flat["A"] = make_flat_series(start_, end_, 100.0);
    flat["B"] = make_flat_series(start_, end_, 100.0);
    auto params = make_params(start_, end_, 10000.0, RebalanceFrequency::NEVER);

    auto result = engine_.run({{"A", 60.0}, {"B", 40.0}}, flat, params);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const auto& results = result.value();
    EXPECT_EQ(results.total_days, 730);
    EXPECT_EQ(results.performance_data.size(), 730u);
    EXPECT_NEAR(results.final_value, 10000.0, 1e-9);
    EXPECT_NEAR(results.metrics.total_return, 0.0, 1e-12);
    EXPECT_DOUBLE_EQ(results.metrics.volatility, 0.0);
    EXPECT_DOUBLE_EQ(results.metrics.max_drawdown, 0.0);
    EXPECT_DOUBLE_EQ(results.metrics.sharpe_ratio, 0.0);
}

TEST_F(BacktestEngineTest, ResultCarriesRunParameters) {
    auto params = make_params(start_, end_, 25000.0, RebalanceFrequency::QUARTERLY);
    params.portfolio_id = "balanced";

    auto result = engine_.run({{"EQUITY", 70.0}, {"BOND", 30.0}}, prices_, params);
    ASSERT_TRUE(result.is_ok());

    const auto& results = result.value();
    EXPECT_EQ(results.portfolio_id, "balanced");
    EXPECT_EQ(results.start_date, start_);
    EXPECT_EQ(results.end_date, end_);
    EXPECT_DOUBLE_EQ(results.initial_investment, 25000.0);
    EXPECT_EQ(results.rebalance_frequency, RebalanceFrequency::QUARTERLY);
    EXPECT_DOUBLE_EQ(results.final_value, results.performance_data.back().value);
    EXPECT_NEAR(results.metrics.total_return, results.final_value / 25000.0 - 1.0, 1e-12);
    EXPECT_GT(results.metrics.total_return, 0.0);
    EXPECT_EQ(results.performance_data.front().date, start_);
    EXPECT_EQ(results.performance_data.back().date, end_);
}

TEST_F(BacktestEngineTest, ScenarioDrawdown) {
    Date start(2023, 3, 1);
    PriceSeriesMap prices;
    prices["A"] = make_daily_series(start, {100.0, 110.0, 90.0, 120.0});
    auto params = make_params(start, start.add_days(3), 1000.0, RebalanceFrequency::NEVER);

    auto result = engine_.run({{"A", 100.0}}, prices, params);
    ASSERT_TRUE(result.is_ok());

    const auto& results = result.value();
    ASSERT_EQ(results.performance_data.size(), 4u);
    EXPECT_DOUBLE_EQ(results.performance_data[2].value, 900.0);
    EXPECT_DOUBLE_EQ(results.final_value, 1200.0);
    EXPECT_NEAR(results.metrics.max_drawdown, 0.1818, 1e-4);
    ASSERT_EQ(results.metrics.drawdown_periods.size(), 1u);
    EXPECT_TRUE(results.metrics.drawdown_periods[0].recovered);
    EXPECT_EQ(results.metrics.drawdown_periods[0].start_date, Date(2023, 3, 2));
    EXPECT_EQ(results.metrics.drawdown_periods[0].end_date, Date(2023, 3, 4));
}

TEST_F(BacktestEngineTest, ValidationErrorsBeforeSimulation) {
    auto params = make_params(start_, end_, 10000.0, RebalanceFrequency::NEVER);

    auto bad_sum = engine_.run({{"EQUITY", 99.0}}, prices_, params);
    ASSERT_TRUE(bad_sum.is_error());
    EXPECT_EQ(bad_sum.error()->code(), ErrorCode::VALIDATION_ERROR);

    auto near_hundred = engine_.run({{"EQUITY", 100.005}}, prices_, params);
    EXPECT_TRUE(near_hundred.is_ok());

    params.initial_investment = 0.0;
    auto no_money = engine_.run({{"EQUITY", 100.0}}, prices_, params);
    ASSERT_TRUE(no_money.is_error());
    EXPECT_EQ(no_money.error()->code(), ErrorCode::VALIDATION_ERROR);
}

TEST_F(BacktestEngineTest, MissingDataError) {
    auto params = make_params(start_, end_, 10000.0, RebalanceFrequency::NEVER);

    auto result = engine_.run({{"EQUITY", 50.0}, {"GOLD", 50.0}}, prices_, params);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::MISSING_DATA);
    EXPECT_NE(std::string(result.error()->what()).find("GOLD"), std::string::npos);
}

TEST_F(BacktestEngineTest, RebalancingChangesOutcome) {
    auto never = engine_.run({{"EQUITY", 50.0}, {"BOND", 50.0}}, prices_,
                             make_params(start_, end_, 10000.0, RebalanceFrequency::NEVER));
    auto monthly = engine_.run({{"EQUITY", 50.0}, {"BOND", 50.0}}, prices_,
                               make_params(start_, end_, 10000.0, RebalanceFrequency::MONTHLY));
    ASSERT_TRUE(never.is_ok());
    ASSERT_TRUE(monthly.is_ok());

    // Rebalancing sells the faster grower, so buy and hold ends higher
    EXPECT_GT(never.value().final_value, monthly.value().final_value);
    EXPECT_DOUBLE_EQ(never.value().performance_data[29].value,
                     monthly.value().performance_data[29].value);
}

TEST_F(BacktestEngineTest, ConcurrentRunsAgree) {
    auto params = make_params(start_, end_, 10000.0, RebalanceFrequency::QUARTERLY);
    std::vector<Allocation> allocations = {{"EQUITY", 65.0}, {"BOND", 35.0}};

    auto reference = engine_.run(allocations, prices_, params);
    ASSERT_TRUE(reference.is_ok());
    double expected = reference.value().final_value;

    std::vector<double> finals(4, 0.0);
    std::vector<std::thread> threads;
    for (size_t t = 0; t < finals.size(); ++t) {
        threads.emplace_back([&, t]() {
            auto result = engine_.run(allocations, prices_, params);
            if (result.is_ok()) {
                finals[t] = result.value().final_value;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (double value : finals) {
        EXPECT_EQ(value, expected);
    }
}

TEST_F(BacktestEngineTest, ResultsSerializeToJson) {
    auto result = engine_.run({{"EQUITY", 100.0}}, prices_,
                              make_params(start_, end_, 10000.0, RebalanceFrequency::ANNUALLY));
    ASSERT_TRUE(result.is_ok());

    nlohmann::json full = result.value().to_json();
    EXPECT_EQ(full["portfolio_id"], "test_portfolio");
    EXPECT_EQ(full["rebalance_frequency"], "ANNUALLY");
    EXPECT_EQ(full["total_days"], 730);
    EXPECT_EQ(full["performance_data"].size(), 730u);
    EXPECT_EQ(full["performance_data"][0]["date"], "2021-01-01");
    EXPECT_TRUE(full["metrics"].contains("sharpe_ratio"));
    EXPECT_TRUE(full["metrics"].contains("monthly_returns"));

    // Rising prices only: no losing day, so gain-to-loss is infinite
    EXPECT_TRUE(full["metrics"]["gain_to_loss_ratio"].is_null());

    nlohmann::json summary = result.value().to_json(false);
    EXPECT_FALSE(summary.contains("performance_data"));
}
