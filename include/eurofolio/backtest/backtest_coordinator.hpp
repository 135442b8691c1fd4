// include/eurofolio/backtest/backtest_coordinator.hpp
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "eurofolio/backtest/backtest_engine.hpp"
#include "eurofolio/backtest/backtest_types.hpp"
#include "eurofolio/core/error.hpp"

namespace eurofolio {
namespace backtest {

/**
 * @brief Engine results plus a report of which assets had data
 */
struct CoordinatedBacktest {
    BacktestResults results;
    std::vector<Allocation> effective_allocations;  // Rescaled to sum to 100
    std::vector<std::string> skipped_assets;
    int assets_analyzed{0};
    int total_assets{0};
    double data_completeness{0.0};  // assets_analyzed / total_assets

    nlohmann::json to_json(bool include_series = true) const;
};

/**
 * @brief Runs a stored portfolio against whatever price data is available
 *
 * Assets without price data are dropped and the remaining weights are
 * rescaled to 100 before the engine runs, so a partially covered
 * portfolio still produces a backtest. The completeness figures tell the
 * caller how much of the portfolio was actually simulated.
 */
class BacktestCoordinator {
public:
    BacktestCoordinator();
    ~BacktestCoordinator();

    BacktestEngine* get_engine() {
        return engine_.get();
    }

    /**
     * @brief Run the portfolio over the assets that have prices
     * @param portfolio_allocations Allocations as stored with the portfolio
     * @param price_series Available price series, keyed by asset id
     * @param params Date range, capital and rebalance schedule
     * @return INVALID_ARGUMENT if the portfolio has no allocations,
     *         MISSING_DATA if no allocated asset has prices,
     *         otherwise whatever the engine returns
     */
    Result<CoordinatedBacktest> run(const std::vector<Allocation>& portfolio_allocations,
                                    const PriceSeriesMap& price_series,
                                    const BacktestParams& params) const;

    /**
     * @brief Scale percentages proportionally so they sum to 100
     */
    static std::vector<Allocation> rescale_allocations(const std::vector<Allocation>& allocations);

private:
    std::unique_ptr<BacktestEngine> engine_;
};

}  // namespace backtest
}  // namespace eurofolio
