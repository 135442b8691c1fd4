// src/backtest/input_normalizer.cpp

#include "eurofolio/backtest/input_normalizer.hpp"
#include <cmath>
#include <numeric>
#include <set>
#include <sstream>

namespace eurofolio {
namespace backtest {

namespace {
const char* const kComponent = "InputNormalizer";
}

double InputNormalizer::allocation_sum(const std::vector<Allocation>& allocations) {
    return std::accumulate(allocations.begin(), allocations.end(), 0.0,
                           [](double sum, const Allocation& a) { return sum + a.percentage; });
}

Result<void> InputNormalizer::validate_allocations(
    const std::vector<Allocation>& allocations) const {
    if (allocations.empty()) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                "Portfolio must have at least one allocation", kComponent);
    }

    std::set<std::string> seen;
    for (const auto& allocation : allocations) {
        if (allocation.asset_id.empty()) {
            return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                    "Allocation with empty asset id", kComponent);
        }
        if (!(allocation.percentage > 0.0 &&
              allocation.percentage <= 100.0 + ALLOCATION_TOLERANCE)) {
            std::ostringstream oss;
            oss << "Allocation for asset " << allocation.asset_id
                << " must be in (0, 100], got " << allocation.percentage;
            return make_error<void>(ErrorCode::VALIDATION_ERROR, oss.str(), kComponent);
        }
        if (!seen.insert(allocation.asset_id).second) {
            return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                    "Duplicate allocation for asset " + allocation.asset_id,
                                    kComponent);
        }
    }

    double total = allocation_sum(allocations);
    if (std::abs(total - 100.0) > ALLOCATION_TOLERANCE) {
        std::ostringstream oss;
        oss << "Portfolio allocations must sum to 100%, got " << total << "%";
        return make_error<void>(ErrorCode::VALIDATION_ERROR, oss.str(), kComponent);
    }

    return Result<void>();
}

Result<void> InputNormalizer::validate_params(const BacktestParams& params) const {
    if (!(params.initial_investment > 0.0) || !std::isfinite(params.initial_investment)) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                "Initial investment must be greater than 0", kComponent);
    }
    if (!params.start_date.is_valid() || !params.end_date.is_valid()) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR, "Invalid start or end date",
                                kComponent);
    }
    if (params.start_date >= params.end_date) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                "Start date " + params.start_date.to_string() +
                                    " must be before end date " + params.end_date.to_string(),
                                kComponent);
    }
    return Result<void>();
}

Result<void> InputNormalizer::validate_price_data(const std::vector<Allocation>& allocations,
                                                  const PriceSeriesMap& price_series) const {
    for (const auto& allocation : allocations) {
        auto it = price_series.find(allocation.asset_id);
        if (it == price_series.end() || it->second.empty()) {
            return make_error<void>(ErrorCode::MISSING_DATA,
                                    "No price data found for asset " + allocation.asset_id,
                                    kComponent);
        }

        const PriceSeries& series = it->second;
        for (size_t i = 0; i < series.size(); ++i) {
            if (!(series[i].close_price > 0.0) || !std::isfinite(series[i].close_price)) {
                return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                        "Non-positive close for asset " + allocation.asset_id +
                                            " on " + series[i].date.to_string(),
                                        kComponent);
            }
            if (i > 0 && series[i].date < series[i - 1].date) {
                return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                        "Price series for asset " + allocation.asset_id +
                                            " is not in ascending date order",
                                        kComponent);
            }
            if (i > 0 && series[i].date == series[i - 1].date) {
                return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                        "Price series for asset " + allocation.asset_id +
                                            " has two closes on " + series[i].date.to_string(),
                                        kComponent);
            }
        }
    }
    return Result<void>();
}

Result<NormalizedInput> InputNormalizer::normalize(const std::vector<Allocation>& allocations,
                                                   const PriceSeriesMap& price_series,
                                                   const BacktestParams& params) const {
    auto allocation_check = validate_allocations(allocations);
    if (allocation_check.is_error()) {
        return forward_error<NormalizedInput>(allocation_check);
    }

    auto params_check = validate_params(params);
    if (params_check.is_error()) {
        return forward_error<NormalizedInput>(params_check);
    }

    auto data_check = validate_price_data(allocations, price_series);
    if (data_check.is_error()) {
        return forward_error<NormalizedInput>(data_check);
    }

    NormalizedInput input;
    input.allocations = allocations;
    input.start_date = params.start_date;
    input.end_date = params.end_date;
    input.initial_investment = params.initial_investment;
    input.rebalance_frequency = params.rebalance_frequency;
    input.allocation_sum = allocation_sum(allocations);
    input.total_days = static_cast<int>(days_between(params.start_date, params.end_date)) + 1;
    return input;
}

}  // namespace backtest
}  // namespace eurofolio
