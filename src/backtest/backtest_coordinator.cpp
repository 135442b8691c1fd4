// src/backtest/backtest_coordinator.cpp

#include "eurofolio/backtest/backtest_coordinator.hpp"
#include "eurofolio/backtest/input_normalizer.hpp"
#include "eurofolio/backtest/price_resolver.hpp"
#include "eurofolio/core/logger.hpp"

namespace eurofolio {
namespace backtest {

nlohmann::json CoordinatedBacktest::to_json(bool include_series) const {
    nlohmann::json j = results.to_json(include_series);

    nlohmann::json allocations = nlohmann::json::array();
    for (const auto& allocation : effective_allocations) {
        allocations.push_back(
            {{"asset_id", allocation.asset_id}, {"percentage", allocation.percentage}});
    }
    j["effective_allocations"] = allocations;
    j["skipped_assets"] = skipped_assets;
    j["assets_analyzed"] = assets_analyzed;
    j["total_assets"] = total_assets;
    j["data_completeness"] = data_completeness;
    return j;
}

BacktestCoordinator::BacktestCoordinator() : engine_(std::make_unique<BacktestEngine>()) {}

BacktestCoordinator::~BacktestCoordinator() = default;

std::vector<Allocation> BacktestCoordinator::rescale_allocations(
    const std::vector<Allocation>& allocations) {
    std::vector<Allocation> rescaled;
    double total = InputNormalizer::allocation_sum(allocations);
    if (total <= 0.0) {
        return rescaled;
    }

    rescaled.reserve(allocations.size());
    for (const auto& allocation : allocations) {
        rescaled.emplace_back(allocation.asset_id, allocation.percentage / total * 100.0);
    }
    return rescaled;
}

Result<CoordinatedBacktest> BacktestCoordinator::run(
    const std::vector<Allocation>& portfolio_allocations, const PriceSeriesMap& price_series,
    const BacktestParams& params) const {
    if (portfolio_allocations.empty()) {
        return make_error<CoordinatedBacktest>(
            ErrorCode::INVALID_ARGUMENT,
            "Portfolio " + params.portfolio_id + " has no allocations", "BacktestCoordinator");
    }

    PriceResolver prices(price_series);
    std::vector<Allocation> covered;
    std::vector<std::string> skipped;
    for (const auto& allocation : portfolio_allocations) {
        if (!prices.has_prices(allocation.asset_id)) {
            skipped.push_back(allocation.asset_id);
        } else {
            covered.push_back(allocation);
        }
    }

    if (covered.empty()) {
        return make_error<CoordinatedBacktest>(
            ErrorCode::MISSING_DATA,
            "No price data available for any asset of portfolio " + params.portfolio_id,
            "BacktestCoordinator");
    }

    if (!skipped.empty()) {
        std::string names;
        for (const auto& id : skipped) {
            names += (names.empty() ? "" : ", ") + id;
        }
        WARN("Skipping " << skipped.size() << " assets without price data: " << names);
    }

    CoordinatedBacktest coordinated;
    coordinated.effective_allocations = rescale_allocations(covered);
    coordinated.skipped_assets = skipped;
    coordinated.assets_analyzed = static_cast<int>(covered.size());
    coordinated.total_assets = static_cast<int>(portfolio_allocations.size());
    coordinated.data_completeness = static_cast<double>(coordinated.assets_analyzed) /
                                    static_cast<double>(coordinated.total_assets);

    auto results = engine_->run(coordinated.effective_allocations, price_series, params);
    if (results.is_error()) {
        return forward_error<CoordinatedBacktest>(results);
    }
    coordinated.results = results.take_value();

    return coordinated;
}

}  // namespace backtest
}  // namespace eurofolio
