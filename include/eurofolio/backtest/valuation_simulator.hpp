// include/eurofolio/backtest/valuation_simulator.hpp
#pragma once

#include <vector>
#include "eurofolio/backtest/backtest_types.hpp"
#include "eurofolio/backtest/price_resolver.hpp"

namespace eurofolio {
namespace backtest {

/**
 * @brief Daily mark-to-market of a buy-and-hold portfolio with periodic rebalancing
 *
 * Walks every calendar day of the range, weekends and holidays included.
 * Prices come from PriceResolver, so gaps carry the last known close.
 * Rebalancing is frictionless: no transaction costs, slippage or cash drag.
 *
 * The simulator holds no state between calls and does not validate its
 * input; run InputNormalizer first.
 */
class ValuationSimulator {
public:
    ValuationSimulator() = default;
    ~ValuationSimulator() = default;

    /**
     * @brief Produce one performance point per calendar day
     * @param allocations Target weights in percent
     * @param price_series Price series per asset id, ascending by date
     * @param start_date First simulated day
     * @param end_date Last simulated day (inclusive)
     * @param initial_investment Capital invested on start_date
     * @param rebalance_frequency Schedule for resetting target weights
     * @return Points for start_date..end_date, empty if end_date < start_date
     */
    std::vector<PerformancePoint> simulate(const std::vector<Allocation>& allocations,
                                           const PriceSeriesMap& price_series,
                                           const Date& start_date, const Date& end_date,
                                           double initial_investment,
                                           RebalanceFrequency rebalance_frequency) const;

    /**
     * @brief Share counts bought on start_date
     *
     * Assets without a resolvable price are left out and hold nothing.
     */
    ShareHolding initial_shares(const std::vector<Allocation>& allocations,
                                const PriceResolver& prices, const Date& start_date,
                                double initial_investment) const;

    /**
     * @brief Whether a rebalance falls on the given day offset
     *
     * Fixed modulus on days since the start (30 / 90 / 365). Offset 0
     * also matches; rebalance_offsets() leaves it out.
     */
    static bool is_rebalance_day(RebalanceFrequency frequency, int days_since_start);

    /**
     * @brief Day offsets at which simulate() rebalances over a range
     *
     * Ascending, starting at the first period; the start date itself never
     * rebalances.
     */
    static std::vector<int> rebalance_offsets(RebalanceFrequency frequency,
                                              const Date& start_date, const Date& end_date);

private:
    double portfolio_value(const ShareHolding& holdings, const PriceResolver& prices,
                           const Date& date) const;

    void rebalance(ShareHolding& holdings, const std::vector<Allocation>& allocations,
                   const PriceResolver& prices, const Date& date) const;
};

}  // namespace backtest
}  // namespace eurofolio
