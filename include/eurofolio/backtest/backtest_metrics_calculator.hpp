// include/eurofolio/backtest/backtest_metrics_calculator.hpp
#pragma once

#include <vector>
#include "eurofolio/backtest/backtest_types.hpp"

namespace eurofolio {
namespace backtest {

/**
 * @brief Pure stateless calculation component for backtest metrics
 *
 * Turns a daily performance series into return, risk, drawdown and
 * calendar statistics. All methods are const and have no side effects.
 *
 * Conventions:
 * - Daily returns exclude the first point (it has no prior day)
 * - Standard deviations are population deviations annualized with sqrt(252)
 * - Returns are annualized over calendar days with 365 / N
 * - Degenerate input (empty series, zero volatility, no drawdown) yields 0
 *   rather than an error
 */
class BacktestMetricsCalculator {
public:
    BacktestMetricsCalculator() = default;
    ~BacktestMetricsCalculator() = default;

    // ========== Return Calculations ==========

    /**
     * @brief Calculate total return between two portfolio values
     * @return Total return as decimal (0.10 = 10%), 0 if start_value is not positive
     */
    double calculate_total_return(double start_value, double end_value) const;

    /**
     * @brief Compound a total return to a yearly rate
     * @param total_return Total return as decimal
     * @param num_points Number of calendar days in the series
     * @return (1 + total_return)^(365 / num_points) - 1, or 0 if num_points is 0
     */
    double calculate_annualized_return(double total_return, size_t num_points) const;

    /**
     * @brief Daily returns of the series, first point excluded
     */
    std::vector<double> extract_daily_returns(
        const std::vector<PerformancePoint>& performance) const;

    // ========== Volatility Metrics ==========

    /**
     * @brief Annualized population standard deviation of daily returns
     */
    double calculate_volatility(const std::vector<double>& returns) const;

    /**
     * @brief Annualized population standard deviation of the negative daily returns
     *
     * Deviation is taken around the mean of the negative returns, not around 0.
     * @return 0 if there are no negative returns
     */
    double calculate_downside_deviation(const std::vector<double>& returns) const;

    // ========== Risk-Adjusted Return Metrics ==========

    /**
     * @brief (annualized_return - risk_free_rate) / volatility, 0 if volatility is 0
     */
    double calculate_sharpe_ratio(double annualized_return, double volatility,
                                  double risk_free_rate = RISK_FREE_RATE) const;

    /**
     * @brief (annualized_return - risk_free_rate) / downside_deviation, 0 if no downside
     */
    double calculate_sortino_ratio(double annualized_return, double downside_deviation,
                                   double risk_free_rate = RISK_FREE_RATE) const;

    /**
     * @brief |annualized_return / max_drawdown|, 0 if there was no drawdown
     */
    double calculate_calmar_ratio(double annualized_return, double max_drawdown) const;

    /**
     * @brief Series total return divided by the maximum drawdown
     *
     * The total return here is measured from the first point of the series,
     * not from the invested amount.
     */
    double calculate_recovery_factor(const std::vector<PerformancePoint>& performance,
                                     double max_drawdown) const;

    /**
     * @brief Letter grade for a Sharpe ratio
     */
    static RiskGrade risk_grade(double sharpe_ratio);

    // ========== Drawdown Metrics ==========

    /**
     * @brief Largest decline from a running peak, as decimal
     */
    double calculate_max_drawdown(const std::vector<PerformancePoint>& performance) const;

    /**
     * @brief Split the series into drawdown periods
     *
     * A period starts at the peak preceding the first lower value and ends on
     * the first value strictly above that peak. A period still open at the end
     * of the series is reported with recovered = false.
     */
    std::vector<DrawdownPeriod> analyze_drawdown_periods(
        const std::vector<PerformancePoint>& performance) const;

    // ========== Daily Statistics ==========

    /**
     * @brief Mean gain over absolute mean loss of daily returns
     * @return +infinity with gains and no losses, 0 without gains
     */
    double calculate_gain_to_loss_ratio(const std::vector<double>& returns) const;

    /**
     * @brief Share of daily returns that are strictly positive
     */
    double calculate_uptime_percentage(const std::vector<double>& returns) const;

    // ========== Calendar Breakdown ==========

    /**
     * @brief Month-end values and month-over-month returns
     *
     * One entry per calendar month present in the series, in order. The first
     * entry has return 0.
     */
    std::vector<MonthlyReturn> calculate_monthly_returns(
        const std::vector<PerformancePoint>& performance) const;

    /**
     * @brief Year-end values and year-over-year returns, first year with return 0
     */
    std::vector<YearlyReturn> calculate_yearly_returns(
        const std::vector<PerformancePoint>& performance) const;

    /**
     * @brief Best month-over-month return with an approximate date
     *
     * The date is the point at the same relative position in the daily series
     * as the month in the list of month-over-month returns.
     */
    MonthHighlight find_best_month(const std::vector<PerformancePoint>& performance,
                                   const std::vector<MonthlyReturn>& monthly_returns) const;

    MonthHighlight find_worst_month(const std::vector<PerformancePoint>& performance,
                                    const std::vector<MonthlyReturn>& monthly_returns) const;

    // ========== Composite Calculation ==========

    /**
     * @brief Calculate every metric of a performance series
     * @param performance Daily series produced by ValuationSimulator
     * @param initial_investment Amount invested on the first day
     */
    BacktestMetrics calculate_all_metrics(const std::vector<PerformancePoint>& performance,
                                          double initial_investment) const;

private:
    // ========== Helper Methods ==========

    double calculate_mean(const std::vector<double>& values) const;

    double calculate_std_dev(const std::vector<double>& values, double mean) const;

    /**
     * @brief Month-over-month returns, first month dropped
     */
    std::vector<double> month_over_month(const std::vector<MonthlyReturn>& monthly_returns) const;

    MonthHighlight make_highlight(const std::vector<PerformancePoint>& performance,
                                  const std::vector<double>& returns, size_t rank) const;
};

}  // namespace backtest
}  // namespace eurofolio
