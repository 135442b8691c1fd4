// include/eurofolio/backtest/backtest_engine.hpp
#pragma once

#include <vector>
#include "eurofolio/backtest/backtest_metrics_calculator.hpp"
#include "eurofolio/backtest/backtest_types.hpp"
#include "eurofolio/backtest/input_normalizer.hpp"
#include "eurofolio/backtest/valuation_simulator.hpp"
#include "eurofolio/core/error.hpp"

namespace eurofolio {
namespace backtest {

/**
 * @brief Backtest of a fixed-weight portfolio over historical daily prices
 *
 * Runs the pipeline normalize -> simulate -> aggregate. The engine never
 * fetches prices; the caller supplies them. It keeps no state between runs,
 * so one instance may serve concurrent calls from several threads.
 */
class BacktestEngine {
public:
    BacktestEngine() = default;
    ~BacktestEngine() = default;

    /**
     * @brief Run a backtest
     * @param allocations Target weights, summing to 100
     * @param price_series Daily closes per asset id, ascending by date
     * @param params Date range, capital and rebalance schedule
     * @return Results, or VALIDATION_ERROR / MISSING_DATA raised before simulation
     */
    Result<BacktestResults> run(const std::vector<Allocation>& allocations,
                                const PriceSeriesMap& price_series,
                                const BacktestParams& params) const;

private:
    InputNormalizer normalizer_;
    ValuationSimulator simulator_;
    BacktestMetricsCalculator metrics_calculator_;
};

}  // namespace backtest
}  // namespace eurofolio
