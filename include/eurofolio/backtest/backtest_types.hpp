// include/eurofolio/backtest/backtest_types.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "eurofolio/core/config_base.hpp"
#include "eurofolio/core/date.hpp"

namespace eurofolio {
namespace backtest {

// Annual risk-free rate used by Sharpe and Sortino
constexpr double RISK_FREE_RATE = 0.02;
// Annualization factor applied to daily volatility
constexpr double TRADING_DAYS_PER_YEAR = 252.0;
// Year length used to annualize returns over the calendar-day series
constexpr double CALENDAR_DAYS_PER_YEAR = 365.0;
// Allowed distance of the allocation sum from 100%
constexpr double ALLOCATION_TOLERANCE = 0.01;

/**
 * @brief How often holdings are reset to the target weights
 *
 * The schedule is a fixed modulus on days since the start date
 * (30 / 90 / 365), not a calendar month, quarter or year boundary.
 */
enum class RebalanceFrequency {
    NEVER,
    MONTHLY,
    QUARTERLY,
    ANNUALLY
};

std::string rebalance_frequency_to_string(RebalanceFrequency frequency);

/**
 * @throws EngineError with VALIDATION_ERROR for unknown names
 */
RebalanceFrequency rebalance_frequency_from_string(const std::string& name);

/**
 * @brief Days between scheduled rebalances, 0 for NEVER
 */
int rebalance_period_days(RebalanceFrequency frequency);

/**
 * @brief Target weight of one asset in the portfolio
 */
struct Allocation {
    std::string asset_id;
    double percentage{0.0};  // In (0, 100]

    Allocation() = default;
    Allocation(std::string id, double pct) : asset_id(std::move(id)), percentage(pct) {}
};

/**
 * @brief One daily close of an asset
 *
 * Only close_price drives the simulation. The other fields are filled by
 * PriceDataLoader when the source file has those columns.
 */
struct PricePoint {
    Date date;
    double close_price{0.0};
    std::optional<double> open;
    std::optional<double> high;
    std::optional<double> low;
    std::optional<double> adjusted_close;
    std::optional<double> volume;

    PricePoint() = default;
    PricePoint(Date d, double close) : date(d), close_price(close) {}
};

// Ascending by date, gaps allowed
using PriceSeries = std::vector<PricePoint>;
using PriceSeriesMap = std::unordered_map<std::string, PriceSeries>;

// asset id -> share count, only alive during one simulation
using ShareHolding = std::map<std::string, double>;

/**
 * @brief Portfolio value on one calendar day
 */
struct PerformancePoint {
    Date date;
    double value{0.0};
    double daily_return{0.0};
    double cumulative_return{0.0};
};

/**
 * @brief Decline from a running peak until a new peak (or series end)
 */
struct DrawdownPeriod {
    Date start_date;  // Date of the peak
    Date end_date;
    double peak_value{0.0};
    double trough_value{0.0};
    double drawdown_percentage{0.0};
    int duration{0};  // In days
    bool recovered{false};
    std::optional<Date> recovery_date;
};

struct MonthlyReturn {
    int year{0};
    int month{0};
    std::string month_name;
    double period_return{0.0};  // 0 for the first month of the series
    double value{0.0};          // Last value of the month
    int days_in_month{0};       // Points of the series falling in the month
};

struct YearlyReturn {
    int year{0};
    double period_return{0.0};  // 0 for the first year of the series
    double value{0.0};
};

/**
 * @brief Best or worst month, with an approximate date into the series
 */
struct MonthHighlight {
    std::string date;  // Empty when no month qualifies
    double period_return{0.0};
};

struct RiskGrade {
    std::string grade;
    std::string description;
};

/**
 * @brief Parameters of one backtest run
 */
struct BacktestParams : public ConfigBase {
    std::string portfolio_id;
    Date start_date;
    Date end_date;
    double initial_investment{10000.0};
    RebalanceFrequency rebalance_frequency{RebalanceFrequency::ANNUALLY};

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Statistics derived from a performance series
 */
struct BacktestMetrics {
    // Returns
    double total_return{0.0};
    double annualized_return{0.0};

    // Risk
    double volatility{0.0};
    double downside_deviation{0.0};
    double max_drawdown{0.0};

    // Risk-adjusted
    double sharpe_ratio{0.0};
    double sortino_ratio{0.0};
    double calmar_ratio{0.0};
    double recovery_factor{0.0};
    RiskGrade risk_grade;

    // Daily statistics
    double gain_to_loss_ratio{0.0};  // +inf when there are gains and no losses
    double uptime_percentage{0.0};

    // Drawdown periods
    std::vector<DrawdownPeriod> drawdown_periods;
    double average_drawdown_duration{0.0};
    int max_drawdown_duration{0};

    // Monthly / yearly breakdown
    std::vector<MonthlyReturn> monthly_returns;
    std::vector<YearlyReturn> yearly_returns;
    int positive_months{0};
    int negative_months{0};
    double win_rate{0.0};
    MonthHighlight best_month;
    MonthHighlight worst_month;
    std::optional<double> best_year;
    std::optional<double> worst_year;
};

/**
 * @brief Complete output of one backtest run
 */
struct BacktestResults {
    std::string portfolio_id;
    Date start_date;
    Date end_date;
    double initial_investment{0.0};
    RebalanceFrequency rebalance_frequency{RebalanceFrequency::NEVER};
    double final_value{0.0};
    int total_days{0};

    BacktestMetrics metrics;
    std::vector<PerformancePoint> performance_data;

    /**
     * @brief Serialize for the persistence collaborator
     * @param include_series Include the daily performance series
     */
    nlohmann::json to_json(bool include_series = true) const;
};

nlohmann::json to_json(const PerformancePoint& point);
nlohmann::json to_json(const DrawdownPeriod& period);
nlohmann::json to_json(const MonthlyReturn& month);
nlohmann::json to_json(const YearlyReturn& year);
nlohmann::json to_json(const BacktestMetrics& metrics);

}  // namespace backtest
}  // namespace eurofolio
