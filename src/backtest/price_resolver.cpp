// src/backtest/price_resolver.cpp

#include "eurofolio/backtest/price_resolver.hpp"
#include <algorithm>

namespace eurofolio {
namespace backtest {

long PriceResolver::resolve_index(const PriceSeries& series, const Date& date) {
    if (series.empty()) {
        return -1;
    }

    // First point strictly after the date; the one before it is the exact
    // match or the most recent earlier close
    auto after = std::upper_bound(
        series.begin(), series.end(), date,
        [](const Date& target, const PricePoint& point) { return target < point.date; });

    if (after != series.begin()) {
        return static_cast<long>(std::distance(series.begin(), after) - 1);
    }

    // No earlier data: fall back to the nearest later close
    return 0;
}

Result<double> PriceResolver::get_price(const std::string& asset_id, const Date& date) const {
    auto it = price_series_.find(asset_id);
    if (it == price_series_.end()) {
        return make_error<double>(ErrorCode::DATA_NOT_FOUND,
                                  "No price series for asset: " + asset_id, "PriceResolver");
    }

    long index = resolve_index(it->second, date);
    if (index < 0) {
        return make_error<double>(ErrorCode::DATA_NOT_FOUND,
                                  "Empty price series for asset: " + asset_id, "PriceResolver");
    }
    return it->second[static_cast<size_t>(index)].close_price;
}

bool PriceResolver::has_prices(const std::string& asset_id) const {
    auto it = price_series_.find(asset_id);
    return it != price_series_.end() && !it->second.empty();
}

}  // namespace backtest
}  // namespace eurofolio
