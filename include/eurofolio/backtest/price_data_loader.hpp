// include/eurofolio/backtest/price_data_loader.hpp
#pragma once

#include <string>
#include <vector>
#include "eurofolio/backtest/backtest_types.hpp"
#include "eurofolio/core/error.hpp"

namespace eurofolio {
namespace backtest {

/**
 * @brief Reads daily close prices from CSV files
 *
 * Expected format, one file per asset:
 *
 *     date,open,high,low,close,volume
 *     2023-01-02,101.2,103.0,100.8,102.5,120000
 *
 * Columns are located by header name. The close column is the first of
 * close_price, close or adjusted_close present. open, high, low,
 * adjusted_close and volume are copied onto each point when the cell is
 * numeric; any other column is ignored.
 * Rows with an unparsable date or a non-numeric or non-positive close are
 * skipped with a warning. When a date repeats, the last row wins.
 */
class PriceDataLoader {
public:
    PriceDataLoader() = default;

    /**
     * @brief Load one asset's series from a CSV file
     * @param path CSV file path
     * @param asset_id Asset id used in log messages
     * @return Series sorted by date, FILE_NOT_FOUND if the file cannot be opened,
     *         INVALID_DATA if the header lacks the required columns or no row is valid
     */
    Result<PriceSeries> load_csv(const std::string& path, const std::string& asset_id) const;

    /**
     * @brief Load <directory>/<asset_id>.csv for every asset, trimmed to [start, end]
     *
     * Assets with a missing file, an unusable file or no prices inside the
     * range are left out of the map.
     * @return FILE_NOT_FOUND if the directory does not exist
     */
    Result<PriceSeriesMap> load_directory(const std::string& directory,
                                          const std::vector<std::string>& asset_ids,
                                          const Date& start_date, const Date& end_date) const;

    /**
     * @brief Keep the points with start_date <= date <= end_date
     */
    static PriceSeries trim_to_range(const PriceSeries& series, const Date& start_date,
                                     const Date& end_date);

private:
    static std::vector<std::string> split(const std::string& line, char delimiter);
    static std::string trim(const std::string& text);
    static std::string to_lower(std::string text);
};

}  // namespace backtest
}  // namespace eurofolio
