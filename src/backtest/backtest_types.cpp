// src/backtest/backtest_types.cpp

#include "eurofolio/backtest/backtest_types.hpp"
#include <cmath>

namespace eurofolio {
namespace backtest {

namespace {

// JSON has no infinity or NaN
nlohmann::json finite_or_null(double value) {
    if (!std::isfinite(value)) {
        return nullptr;
    }
    return value;
}

Date date_from_json(const nlohmann::json& j, const std::string& key) {
    auto parsed = Date::parse(j.at(key).get<std::string>());
    if (parsed.is_error()) {
        throw EngineError(ErrorCode::VALIDATION_ERROR,
                          key + ": " + parsed.error()->what(), "BacktestParams");
    }
    return parsed.value();
}

}  // namespace

std::string rebalance_frequency_to_string(RebalanceFrequency frequency) {
    switch (frequency) {
        case RebalanceFrequency::NEVER:
            return "NEVER";
        case RebalanceFrequency::MONTHLY:
            return "MONTHLY";
        case RebalanceFrequency::QUARTERLY:
            return "QUARTERLY";
        case RebalanceFrequency::ANNUALLY:
            return "ANNUALLY";
        default:
            return "UNKNOWN";
    }
}

RebalanceFrequency rebalance_frequency_from_string(const std::string& name) {
    if (name == "NEVER")
        return RebalanceFrequency::NEVER;
    if (name == "MONTHLY")
        return RebalanceFrequency::MONTHLY;
    if (name == "QUARTERLY")
        return RebalanceFrequency::QUARTERLY;
    if (name == "ANNUALLY")
        return RebalanceFrequency::ANNUALLY;
    throw EngineError(ErrorCode::VALIDATION_ERROR, "Unknown rebalance frequency: " + name,
                      "RebalanceFrequency");
}

int rebalance_period_days(RebalanceFrequency frequency) {
    switch (frequency) {
        case RebalanceFrequency::MONTHLY:
            return 30;
        case RebalanceFrequency::QUARTERLY:
            return 90;
        case RebalanceFrequency::ANNUALLY:
            return 365;
        case RebalanceFrequency::NEVER:
        default:
            return 0;
    }
}

nlohmann::json BacktestParams::to_json() const {
    nlohmann::json j;
    j["portfolio_id"] = portfolio_id;
    j["start_date"] = start_date.to_string();
    j["end_date"] = end_date.to_string();
    j["initial_investment"] = initial_investment;
    j["rebalance_frequency"] = rebalance_frequency_to_string(rebalance_frequency);
    j["version"] = version;
    return j;
}

void BacktestParams::from_json(const nlohmann::json& j) {
    if (j.contains("portfolio_id"))
        portfolio_id = j.at("portfolio_id").get<std::string>();
    if (j.contains("start_date"))
        start_date = date_from_json(j, "start_date");
    if (j.contains("end_date"))
        end_date = date_from_json(j, "end_date");
    if (j.contains("initial_investment"))
        initial_investment = j.at("initial_investment").get<double>();
    if (j.contains("rebalance_frequency"))
        rebalance_frequency =
            rebalance_frequency_from_string(j.at("rebalance_frequency").get<std::string>());
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

nlohmann::json to_json(const PerformancePoint& point) {
    return nlohmann::json{{"date", point.date.to_string()},
                          {"value", point.value},
                          {"daily_return", point.daily_return},
                          {"cumulative_return", point.cumulative_return}};
}

nlohmann::json to_json(const DrawdownPeriod& period) {
    nlohmann::json j;
    j["start_date"] = period.start_date.to_string();
    j["end_date"] = period.end_date.to_string();
    j["peak_value"] = period.peak_value;
    j["trough_value"] = period.trough_value;
    j["drawdown_percentage"] = period.drawdown_percentage;
    j["duration"] = period.duration;
    j["recovered"] = period.recovered;
    if (period.recovery_date) {
        j["recovery_date"] = period.recovery_date->to_string();
    }
    return j;
}

nlohmann::json to_json(const MonthlyReturn& month) {
    return nlohmann::json{{"year", month.year},
                          {"month", month.month},
                          {"month_name", month.month_name},
                          {"return", month.period_return},
                          {"value", month.value},
                          {"days_in_month", month.days_in_month}};
}

nlohmann::json to_json(const YearlyReturn& year) {
    return nlohmann::json{
        {"year", year.year}, {"return", year.period_return}, {"value", year.value}};
}

nlohmann::json to_json(const BacktestMetrics& metrics) {
    nlohmann::json j;
    j["total_return"] = metrics.total_return;
    j["annualized_return"] = metrics.annualized_return;
    j["volatility"] = metrics.volatility;
    j["downside_deviation"] = metrics.downside_deviation;
    j["max_drawdown"] = metrics.max_drawdown;
    j["sharpe_ratio"] = metrics.sharpe_ratio;
    j["sortino_ratio"] = metrics.sortino_ratio;
    j["calmar_ratio"] = metrics.calmar_ratio;
    j["recovery_factor"] = metrics.recovery_factor;
    j["risk_grade"] = {{"grade", metrics.risk_grade.grade},
                       {"description", metrics.risk_grade.description}};
    j["gain_to_loss_ratio"] = finite_or_null(metrics.gain_to_loss_ratio);
    j["uptime_percentage"] = metrics.uptime_percentage;
    j["average_drawdown_duration"] = metrics.average_drawdown_duration;
    j["max_drawdown_duration"] = metrics.max_drawdown_duration;
    j["positive_months"] = metrics.positive_months;
    j["negative_months"] = metrics.negative_months;
    j["win_rate"] = metrics.win_rate;
    j["best_month"] = {{"date", metrics.best_month.date},
                       {"return", metrics.best_month.period_return}};
    j["worst_month"] = {{"date", metrics.worst_month.date},
                        {"return", metrics.worst_month.period_return}};
    j["best_year"] = metrics.best_year ? nlohmann::json(*metrics.best_year) : nullptr;
    j["worst_year"] = metrics.worst_year ? nlohmann::json(*metrics.worst_year) : nullptr;

    nlohmann::json periods = nlohmann::json::array();
    for (const auto& period : metrics.drawdown_periods) {
        periods.push_back(to_json(period));
    }
    j["drawdown_periods"] = periods;

    nlohmann::json months = nlohmann::json::array();
    for (const auto& month : metrics.monthly_returns) {
        months.push_back(to_json(month));
    }
    j["monthly_returns"] = months;

    nlohmann::json years = nlohmann::json::array();
    for (const auto& year : metrics.yearly_returns) {
        years.push_back(to_json(year));
    }
    j["yearly_returns"] = years;

    return j;
}

nlohmann::json BacktestResults::to_json(bool include_series) const {
    nlohmann::json j;
    j["portfolio_id"] = portfolio_id;
    j["start_date"] = start_date.to_string();
    j["end_date"] = end_date.to_string();
    j["initial_investment"] = initial_investment;
    j["rebalance_frequency"] = rebalance_frequency_to_string(rebalance_frequency);
    j["final_value"] = final_value;
    j["total_days"] = total_days;
    j["metrics"] = backtest::to_json(metrics);

    if (include_series) {
        nlohmann::json series = nlohmann::json::array();
        for (const auto& point : performance_data) {
            series.push_back(backtest::to_json(point));
        }
        j["performance_data"] = series;
    }
    return j;
}

}  // namespace backtest
}  // namespace eurofolio
