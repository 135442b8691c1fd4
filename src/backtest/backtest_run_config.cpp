// src/backtest/backtest_run_config.cpp

#include "eurofolio/backtest/backtest_run_config.hpp"

namespace eurofolio {
namespace backtest {

nlohmann::json BacktestRunConfig::to_json() const {
    nlohmann::json j;
    j["logger"] = logger.to_json();
    j["backtest"] = backtest.to_json();

    nlohmann::json allocation_list = nlohmann::json::array();
    for (const auto& allocation : allocations) {
        allocation_list.push_back(
            {{"asset_id", allocation.asset_id}, {"percentage", allocation.percentage}});
    }
    j["allocations"] = allocation_list;
    j["price_data_directory"] = price_data_directory;
    j["output_directory"] = output_directory;
    j["version"] = version;
    return j;
}

void BacktestRunConfig::from_json(const nlohmann::json& j) {
    if (j.contains("logger"))
        logger.from_json(j.at("logger"));
    if (j.contains("backtest"))
        backtest.from_json(j.at("backtest"));
    if (j.contains("allocations")) {
        allocations.clear();
        for (const auto& item : j.at("allocations")) {
            allocations.emplace_back(item.at("asset_id").get<std::string>(),
                                     item.at("percentage").get<double>());
        }
    }
    if (j.contains("price_data_directory"))
        price_data_directory = j.at("price_data_directory").get<std::string>();
    if (j.contains("output_directory"))
        output_directory = j.at("output_directory").get<std::string>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

std::vector<std::string> BacktestRunConfig::asset_ids() const {
    std::vector<std::string> ids;
    ids.reserve(allocations.size());
    for (const auto& allocation : allocations) {
        ids.push_back(allocation.asset_id);
    }
    return ids;
}

}  // namespace backtest
}  // namespace eurofolio
