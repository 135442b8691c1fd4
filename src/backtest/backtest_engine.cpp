// src/backtest/backtest_engine.cpp

#include "eurofolio/backtest/backtest_engine.hpp"
#include <iomanip>
#include "eurofolio/core/logger.hpp"

namespace eurofolio {
namespace backtest {

Result<BacktestResults> BacktestEngine::run(const std::vector<Allocation>& allocations,
                                            const PriceSeriesMap& price_series,
                                            const BacktestParams& params) const {
    auto input_result = normalizer_.normalize(allocations, price_series, params);
    if (input_result.is_error()) {
        ERROR("Backtest input rejected for portfolio " << params.portfolio_id << ": "
                                                       << input_result.error()->what());
        return forward_error<BacktestResults>(input_result);
    }
    const NormalizedInput& input = input_result.value();

    DEBUG("Running backtest for portfolio " << params.portfolio_id << " from "
                                            << input.start_date << " to " << input.end_date
                                            << " (" << input.total_days << " days, "
                                            << input.allocations.size() << " assets, rebalance "
                                            << rebalance_frequency_to_string(
                                                   input.rebalance_frequency)
                                            << ")");

    BacktestResults results;
    results.portfolio_id = params.portfolio_id;
    results.start_date = input.start_date;
    results.end_date = input.end_date;
    results.initial_investment = input.initial_investment;
    results.rebalance_frequency = input.rebalance_frequency;

    results.performance_data =
        simulator_.simulate(input.allocations, price_series, input.start_date, input.end_date,
                            input.initial_investment, input.rebalance_frequency);

    results.metrics =
        metrics_calculator_.calculate_all_metrics(results.performance_data, input.initial_investment);
    results.final_value = results.performance_data.empty()
                              ? input.initial_investment
                              : results.performance_data.back().value;
    results.total_days = static_cast<int>(results.performance_data.size());

    INFO("Backtest complete for portfolio "
         << params.portfolio_id << ": final value " << std::fixed << std::setprecision(2)
         << results.final_value << ", total return " << results.metrics.total_return * 100.0
         << "%, max drawdown " << results.metrics.max_drawdown * 100.0 << "%, sharpe "
         << results.metrics.sharpe_ratio);

    return results;
}

}  // namespace backtest
}  // namespace eurofolio
