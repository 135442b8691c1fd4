// include/eurofolio/backtest/input_normalizer.hpp
#pragma once

#include <vector>
#include "eurofolio/backtest/backtest_types.hpp"
#include "eurofolio/core/error.hpp"

namespace eurofolio {
namespace backtest {

/**
 * @brief Validated input of one backtest run
 */
struct NormalizedInput {
    std::vector<Allocation> allocations;
    Date start_date;
    Date end_date;
    double initial_investment{0.0};
    RebalanceFrequency rebalance_frequency{RebalanceFrequency::NEVER};
    double allocation_sum{0.0};
    int total_days{0};  // Calendar days in [start_date, end_date]
};

/**
 * @brief Upfront validation of backtest input
 *
 * Checks run once, before any simulation:
 * - VALIDATION_ERROR: no allocations, malformed allocation, weights not summing
 *   to 100 within ALLOCATION_TOLERANCE, non-positive investment, start date not
 *   before end date, price series out of date order or with non-positive closes
 * - MISSING_DATA: an allocated asset has no price series or an empty one
 *
 * Nothing is dropped or rescaled here; callers that want to skip assets
 * without data do so before (see BacktestCoordinator).
 */
class InputNormalizer {
public:
    InputNormalizer() = default;

    Result<NormalizedInput> normalize(const std::vector<Allocation>& allocations,
                                      const PriceSeriesMap& price_series,
                                      const BacktestParams& params) const;

    Result<void> validate_allocations(const std::vector<Allocation>& allocations) const;

    Result<void> validate_params(const BacktestParams& params) const;

    Result<void> validate_price_data(const std::vector<Allocation>& allocations,
                                     const PriceSeriesMap& price_series) const;

    static double allocation_sum(const std::vector<Allocation>& allocations);
};

}  // namespace backtest
}  // namespace eurofolio
