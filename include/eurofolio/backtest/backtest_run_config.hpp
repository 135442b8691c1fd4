// include/eurofolio/backtest/backtest_run_config.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "eurofolio/backtest/backtest_types.hpp"
#include "eurofolio/core/config_base.hpp"
#include "eurofolio/core/logger.hpp"

namespace eurofolio {
namespace backtest {

/**
 * @brief Everything a command line backtest run needs
 *
 * {
 *     "logger": { ... LoggerConfig ... },
 *     "backtest": { ... BacktestParams ... },
 *     "allocations": [{"asset_id": "VWCE.XETRA", "percentage": 60}, ...],
 *     "price_data_directory": "data/prices",
 *     "output_directory": "results"
 * }
 */
struct BacktestRunConfig : public ConfigBase {
    LoggerConfig logger;
    BacktestParams backtest;
    std::vector<Allocation> allocations;
    std::string price_data_directory{"data/prices"};
    std::string output_directory{"results"};

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    std::vector<std::string> asset_ids() const;
};

}  // namespace backtest
}  // namespace eurofolio
