// src/backtest/valuation_simulator.cpp

#include "eurofolio/backtest/valuation_simulator.hpp"
#include "eurofolio/core/logger.hpp"

namespace eurofolio {
namespace backtest {

bool ValuationSimulator::is_rebalance_day(RebalanceFrequency frequency, int days_since_start) {
    int period = rebalance_period_days(frequency);
    if (period <= 0) {
        return false;
    }
    return days_since_start % period == 0;
}

std::vector<int> ValuationSimulator::rebalance_offsets(RebalanceFrequency frequency,
                                                       const Date& start_date,
                                                       const Date& end_date) {
    std::vector<int> offsets;
    int64_t span = days_between(start_date, end_date);
    for (int64_t i = 1; i <= span; ++i) {
        if (is_rebalance_day(frequency, static_cast<int>(i))) {
            offsets.push_back(static_cast<int>(i));
        }
    }
    return offsets;
}

ShareHolding ValuationSimulator::initial_shares(const std::vector<Allocation>& allocations,
                                                const PriceResolver& prices,
                                                const Date& start_date,
                                                double initial_investment) const {
    ShareHolding holdings;
    for (const auto& allocation : allocations) {
        auto price_result = prices.get_price(allocation.asset_id, start_date);
        if (price_result.is_error() || price_result.value() <= 0.0) {
            DEBUG("No price for " << allocation.asset_id << " on " << start_date
                                  << ", asset starts with no shares");
            continue;
        }

        double price = price_result.value();
        double amount = (allocation.percentage / 100.0) * initial_investment;
        double shares = amount / price;
        holdings[allocation.asset_id] = shares;

        DEBUG("Initial purchase " << allocation.asset_id << ": " << shares << " shares @ "
                                  << price << " (" << allocation.percentage << "%, " << amount
                                  << ")");
    }
    return holdings;
}

double ValuationSimulator::portfolio_value(const ShareHolding& holdings,
                                           const PriceResolver& prices,
                                           const Date& date) const {
    double value = 0.0;
    for (const auto& [asset_id, shares] : holdings) {
        auto price_result = prices.get_price(asset_id, date);
        if (price_result.is_ok()) {
            value += shares * price_result.value();
        }
    }
    return value;
}

void ValuationSimulator::rebalance(ShareHolding& holdings,
                                   const std::vector<Allocation>& allocations,
                                   const PriceResolver& prices, const Date& date) const {
    double current_value = portfolio_value(holdings, prices, date);
    DEBUG("Rebalancing on " << date << " at portfolio value " << current_value);

    for (const auto& allocation : allocations) {
        auto price_result = prices.get_price(allocation.asset_id, date);
        if (price_result.is_error() || price_result.value() <= 0.0) {
            continue;
        }

        double target_value = (allocation.percentage / 100.0) * current_value;
        double shares = target_value / price_result.value();
        TRACE("  " << allocation.asset_id << ": " << holdings[allocation.asset_id] << " -> "
                   << shares << " shares");
        holdings[allocation.asset_id] = shares;
    }
}

std::vector<PerformancePoint> ValuationSimulator::simulate(
    const std::vector<Allocation>& allocations, const PriceSeriesMap& price_series,
    const Date& start_date, const Date& end_date, double initial_investment,
    RebalanceFrequency rebalance_frequency) const {
    std::vector<PerformancePoint> performance;
    if (end_date < start_date) {
        return performance;
    }

    PriceResolver prices(price_series);
    ShareHolding holdings = initial_shares(allocations, prices, start_date, initial_investment);

    std::vector<int> schedule = rebalance_offsets(rebalance_frequency, start_date, end_date);
    auto next_rebalance = schedule.begin();
    DEBUG(schedule.size() << " rebalances scheduled ("
                          << rebalance_frequency_to_string(rebalance_frequency) << ")");

    int64_t span = days_between(start_date, end_date);
    performance.reserve(static_cast<size_t>(span + 1));

    double previous_value = initial_investment;
    for (int64_t i = 0; i <= span; ++i) {
        Date date = start_date.add_days(i);

        if (next_rebalance != schedule.end() && *next_rebalance == i) {
            rebalance(holdings, allocations, prices, date);
            ++next_rebalance;
        }

        PerformancePoint point;
        point.date = date;
        point.value = portfolio_value(holdings, prices, date);
        if (i > 0 && previous_value != 0.0) {
            point.daily_return = (point.value - previous_value) / previous_value;
        }
        if (initial_investment != 0.0) {
            point.cumulative_return = (point.value - initial_investment) / initial_investment;
        }

        performance.push_back(point);
        previous_value = point.value;
    }

    return performance;
}

}  // namespace backtest
}  // namespace eurofolio
