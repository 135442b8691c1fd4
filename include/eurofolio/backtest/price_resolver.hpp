// include/eurofolio/backtest/price_resolver.hpp
#pragma once

#include <string>
#include "eurofolio/backtest/backtest_types.hpp"
#include "eurofolio/core/error.hpp"

namespace eurofolio {
namespace backtest {

/**
 * Resolves the close price of an asset on an arbitrary calendar day.
 *
 * Resolution order:
 * - the close on that exact date
 * - else the most recent earlier close (carries prices over weekends,
 *   holidays and vendor gaps)
 * - else the earliest later close (range starts before the data does)
 *
 * The resolver only borrows the price map; it must not outlive it.
 * Series are expected in ascending date order (checked by InputNormalizer).
 */
class PriceResolver {
public:
    explicit PriceResolver(const PriceSeriesMap& price_series)
        : price_series_(price_series) {}

    /**
     * Get the resolved close for an asset on a date
     * @return Price, or DATA_NOT_FOUND if the asset has no series or an empty one
     */
    Result<double> get_price(const std::string& asset_id, const Date& date) const;

    /**
     * Resolve a date against a single series
     * @return Index of the point used, or -1 for an empty series
     */
    static long resolve_index(const PriceSeries& series, const Date& date);

    bool has_prices(const std::string& asset_id) const;

private:
    const PriceSeriesMap& price_series_;
};

}  // namespace backtest
}  // namespace eurofolio
