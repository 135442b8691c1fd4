// src/backtest/backtest_metrics_calculator.cpp

#include "eurofolio/backtest/backtest_metrics_calculator.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <map>
#include <numeric>
#include <utility>

namespace eurofolio {
namespace backtest {

// ========== Return Calculations ==========

double BacktestMetricsCalculator::calculate_total_return(double start_value,
                                                         double end_value) const {
    if (start_value <= 0.0) {
        return 0.0;
    }
    return (end_value - start_value) / start_value;
}

double BacktestMetricsCalculator::calculate_annualized_return(double total_return,
                                                              size_t num_points) const {
    if (num_points == 0) {
        return 0.0;
    }
    return std::pow(1.0 + total_return,
                    CALENDAR_DAYS_PER_YEAR / static_cast<double>(num_points)) -
           1.0;
}

std::vector<double> BacktestMetricsCalculator::extract_daily_returns(
    const std::vector<PerformancePoint>& performance) const {
    std::vector<double> returns;
    if (performance.size() < 2) {
        return returns;
    }

    returns.reserve(performance.size() - 1);
    for (size_t i = 1; i < performance.size(); ++i) {
        returns.push_back(performance[i].daily_return);
    }
    return returns;
}

// ========== Volatility Metrics ==========

double BacktestMetricsCalculator::calculate_volatility(const std::vector<double>& returns) const {
    if (returns.empty()) {
        return 0.0;
    }

    double mean_return = calculate_mean(returns);
    return calculate_std_dev(returns, mean_return) * std::sqrt(TRADING_DAYS_PER_YEAR);
}

double BacktestMetricsCalculator::calculate_downside_deviation(
    const std::vector<double>& returns) const {
    std::vector<double> negative_returns;
    std::copy_if(returns.begin(), returns.end(), std::back_inserter(negative_returns),
                 [](double r) { return r < 0.0; });

    if (negative_returns.empty()) {
        return 0.0;
    }

    double mean_negative = calculate_mean(negative_returns);
    return calculate_std_dev(negative_returns, mean_negative) *
           std::sqrt(TRADING_DAYS_PER_YEAR);
}

// ========== Risk-Adjusted Return Metrics ==========

double BacktestMetricsCalculator::calculate_sharpe_ratio(double annualized_return,
                                                         double volatility,
                                                         double risk_free_rate) const {
    if (volatility <= 0.0) {
        return 0.0;
    }
    return (annualized_return - risk_free_rate) / volatility;
}

double BacktestMetricsCalculator::calculate_sortino_ratio(double annualized_return,
                                                          double downside_deviation,
                                                          double risk_free_rate) const {
    if (downside_deviation <= 0.0) {
        return 0.0;
    }
    return (annualized_return - risk_free_rate) / downside_deviation;
}

double BacktestMetricsCalculator::calculate_calmar_ratio(double annualized_return,
                                                         double max_drawdown) const {
    if (max_drawdown <= 0.0) {
        return 0.0;
    }
    return std::abs(annualized_return / max_drawdown);
}

double BacktestMetricsCalculator::calculate_recovery_factor(
    const std::vector<PerformancePoint>& performance, double max_drawdown) const {
    if (performance.empty() || max_drawdown <= 0.0) {
        return 0.0;
    }
    double series_return =
        calculate_total_return(performance.front().value, performance.back().value);
    return series_return / max_drawdown;
}

RiskGrade BacktestMetricsCalculator::risk_grade(double sharpe_ratio) {
    if (sharpe_ratio >= 2.0) {
        return {"A+", "Excellent"};
    } else if (sharpe_ratio >= 1.5) {
        return {"A", "Very Good"};
    } else if (sharpe_ratio >= 1.0) {
        return {"B+", "Good"};
    } else if (sharpe_ratio >= 0.5) {
        return {"B", "Fair"};
    } else if (sharpe_ratio >= 0.0) {
        return {"C", "Poor"};
    }
    return {"D", "Very Poor"};
}

// ========== Drawdown Metrics ==========

double BacktestMetricsCalculator::calculate_max_drawdown(
    const std::vector<PerformancePoint>& performance) const {
    if (performance.empty()) {
        return 0.0;
    }

    double max_drawdown = 0.0;
    double peak = performance.front().value;

    for (const auto& point : performance) {
        if (point.value > peak) {
            peak = point.value;
        }
        if (peak > 0.0) {
            double drawdown = (peak - point.value) / peak;
            max_drawdown = std::max(max_drawdown, drawdown);
        }
    }
    return max_drawdown;
}

std::vector<DrawdownPeriod> BacktestMetricsCalculator::analyze_drawdown_periods(
    const std::vector<PerformancePoint>& performance) const {
    std::vector<DrawdownPeriod> periods;
    if (performance.empty()) {
        return periods;
    }

    double peak = performance.front().value;
    size_t peak_index = 0;
    bool in_drawdown = false;
    size_t start_index = 0;
    double trough = peak;

    auto drawdown_of = [](double peak_value, double trough_value) {
        return peak_value > 0.0 ? (peak_value - trough_value) / peak_value : 0.0;
    };

    for (size_t i = 1; i < performance.size(); ++i) {
        const auto& current = performance[i];

        if (current.value > peak) {
            if (in_drawdown) {
                DrawdownPeriod period;
                period.start_date = performance[start_index].date;
                period.end_date = current.date;
                period.peak_value = peak;
                period.trough_value = trough;
                period.drawdown_percentage = drawdown_of(peak, trough);
                period.duration = static_cast<int>(i - start_index);
                period.recovered = true;
                period.recovery_date = current.date;
                periods.push_back(period);
                in_drawdown = false;
            }
            peak = current.value;
            peak_index = i;
        } else if (current.value < peak) {
            if (!in_drawdown) {
                in_drawdown = true;
                start_index = peak_index;
                trough = current.value;
            } else if (current.value < trough) {
                trough = current.value;
            }
        }
    }

    if (in_drawdown) {
        DrawdownPeriod period;
        period.start_date = performance[start_index].date;
        period.end_date = performance.back().date;
        period.peak_value = peak;
        period.trough_value = trough;
        period.drawdown_percentage = drawdown_of(peak, trough);
        period.duration = static_cast<int>(performance.size() - start_index);
        period.recovered = false;
        periods.push_back(period);
    }

    return periods;
}

// ========== Daily Statistics ==========

double BacktestMetricsCalculator::calculate_gain_to_loss_ratio(
    const std::vector<double>& returns) const {
    std::vector<double> gains;
    std::vector<double> losses;
    for (double r : returns) {
        if (r > 0.0) {
            gains.push_back(r);
        } else if (r < 0.0) {
            losses.push_back(r);
        }
    }

    if (losses.empty()) {
        return gains.empty() ? 0.0 : std::numeric_limits<double>::infinity();
    }
    if (gains.empty()) {
        return 0.0;
    }

    double average_gain = calculate_mean(gains);
    double average_loss = std::abs(calculate_mean(losses));
    return average_gain / average_loss;
}

double BacktestMetricsCalculator::calculate_uptime_percentage(
    const std::vector<double>& returns) const {
    if (returns.empty()) {
        return 0.0;
    }
    auto positive = std::count_if(returns.begin(), returns.end(), [](double r) { return r > 0.0; });
    return static_cast<double>(positive) / static_cast<double>(returns.size());
}

// ========== Calendar Breakdown ==========

std::vector<MonthlyReturn> BacktestMetricsCalculator::calculate_monthly_returns(
    const std::vector<PerformancePoint>& performance) const {
    // (year, month) -> (last value, point count)
    std::map<std::pair<int, int>, std::pair<double, int>> months;
    for (const auto& point : performance) {
        auto& entry = months[{point.date.year, point.date.month}];
        entry.first = point.value;
        entry.second += 1;
    }

    std::vector<MonthlyReturn> monthly_returns;
    monthly_returns.reserve(months.size());

    double previous_value = 0.0;
    bool first = true;
    for (const auto& [key, entry] : months) {
        MonthlyReturn month;
        month.year = key.first;
        month.month = key.second;
        month.month_name = month_short_name(key.second);
        month.value = entry.first;
        month.days_in_month = entry.second;
        if (!first && previous_value != 0.0) {
            month.period_return = (entry.first - previous_value) / previous_value;
        }
        monthly_returns.push_back(month);

        previous_value = entry.first;
        first = false;
    }
    return monthly_returns;
}

std::vector<YearlyReturn> BacktestMetricsCalculator::calculate_yearly_returns(
    const std::vector<PerformancePoint>& performance) const {
    std::map<int, double> year_end_values;
    for (const auto& point : performance) {
        year_end_values[point.date.year] = point.value;
    }

    std::vector<YearlyReturn> yearly_returns;
    yearly_returns.reserve(year_end_values.size());

    double previous_value = 0.0;
    bool first = true;
    for (const auto& [year, value] : year_end_values) {
        YearlyReturn entry;
        entry.year = year;
        entry.value = value;
        if (!first && previous_value != 0.0) {
            entry.period_return = (value - previous_value) / previous_value;
        }
        yearly_returns.push_back(entry);

        previous_value = value;
        first = false;
    }
    return yearly_returns;
}

MonthHighlight BacktestMetricsCalculator::find_best_month(
    const std::vector<PerformancePoint>& performance,
    const std::vector<MonthlyReturn>& monthly_returns) const {
    std::vector<double> returns = month_over_month(monthly_returns);
    if (returns.empty()) {
        return MonthHighlight();
    }
    auto best = std::max_element(returns.begin(), returns.end());
    return make_highlight(performance, returns,
                          static_cast<size_t>(std::distance(returns.begin(), best)));
}

MonthHighlight BacktestMetricsCalculator::find_worst_month(
    const std::vector<PerformancePoint>& performance,
    const std::vector<MonthlyReturn>& monthly_returns) const {
    std::vector<double> returns = month_over_month(monthly_returns);
    if (returns.empty()) {
        return MonthHighlight();
    }
    auto worst = std::min_element(returns.begin(), returns.end());
    return make_highlight(performance, returns,
                          static_cast<size_t>(std::distance(returns.begin(), worst)));
}

// ========== Composite Calculation ==========

BacktestMetrics BacktestMetricsCalculator::calculate_all_metrics(
    const std::vector<PerformancePoint>& performance, double initial_investment) const {
    BacktestMetrics metrics;

    std::vector<double> daily_returns = extract_daily_returns(performance);
    double final_value = performance.empty() ? initial_investment : performance.back().value;

    // Returns
    metrics.total_return = calculate_total_return(initial_investment, final_value);
    metrics.annualized_return =
        calculate_annualized_return(metrics.total_return, performance.size());

    // Risk
    metrics.volatility = calculate_volatility(daily_returns);
    metrics.downside_deviation = calculate_downside_deviation(daily_returns);
    metrics.max_drawdown = calculate_max_drawdown(performance);

    // Risk-adjusted
    metrics.sharpe_ratio = calculate_sharpe_ratio(metrics.annualized_return, metrics.volatility);
    metrics.sortino_ratio =
        calculate_sortino_ratio(metrics.annualized_return, metrics.downside_deviation);
    metrics.calmar_ratio = calculate_calmar_ratio(metrics.annualized_return, metrics.max_drawdown);
    metrics.recovery_factor = calculate_recovery_factor(performance, metrics.max_drawdown);
    metrics.risk_grade = risk_grade(metrics.sharpe_ratio);

    // Daily statistics
    metrics.gain_to_loss_ratio = calculate_gain_to_loss_ratio(daily_returns);
    metrics.uptime_percentage = calculate_uptime_percentage(daily_returns);

    // Drawdown periods
    metrics.drawdown_periods = analyze_drawdown_periods(performance);
    if (!metrics.drawdown_periods.empty()) {
        int total_duration = 0;
        for (const auto& period : metrics.drawdown_periods) {
            total_duration += period.duration;
            metrics.max_drawdown_duration = std::max(metrics.max_drawdown_duration, period.duration);
        }
        metrics.average_drawdown_duration =
            static_cast<double>(total_duration) /
            static_cast<double>(metrics.drawdown_periods.size());
    }

    // Monthly breakdown
    metrics.monthly_returns = calculate_monthly_returns(performance);
    std::vector<double> month_returns = month_over_month(metrics.monthly_returns);
    metrics.positive_months = static_cast<int>(
        std::count_if(month_returns.begin(), month_returns.end(), [](double r) { return r > 0.0; }));
    metrics.negative_months = static_cast<int>(
        std::count_if(month_returns.begin(), month_returns.end(), [](double r) { return r < 0.0; }));
    if (!month_returns.empty()) {
        metrics.win_rate = static_cast<double>(metrics.positive_months) /
                           static_cast<double>(month_returns.size());
    }
    metrics.best_month = find_best_month(performance, metrics.monthly_returns);
    metrics.worst_month = find_worst_month(performance, metrics.monthly_returns);

    // Yearly breakdown
    metrics.yearly_returns = calculate_yearly_returns(performance);
    if (metrics.yearly_returns.size() > 1) {
        auto first = metrics.yearly_returns.begin() + 1;
        auto by_return = [](const YearlyReturn& a, const YearlyReturn& b) {
            return a.period_return < b.period_return;
        };
        metrics.best_year = std::max_element(first, metrics.yearly_returns.end(), by_return)->period_return;
        metrics.worst_year = std::min_element(first, metrics.yearly_returns.end(), by_return)->period_return;
    }

    return metrics;
}

// ========== Helper Methods ==========

double BacktestMetricsCalculator::calculate_mean(const std::vector<double>& values) const {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double BacktestMetricsCalculator::calculate_std_dev(const std::vector<double>& values,
                                                    double mean) const {
    if (values.empty()) {
        return 0.0;
    }
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - mean) * (v - mean);
    }
    return std::sqrt(sum_sq / static_cast<double>(values.size()));
}

std::vector<double> BacktestMetricsCalculator::month_over_month(
    const std::vector<MonthlyReturn>& monthly_returns) const {
    std::vector<double> returns;
    for (size_t i = 1; i < monthly_returns.size(); ++i) {
        returns.push_back(monthly_returns[i].period_return);
    }
    return returns;
}

MonthHighlight BacktestMetricsCalculator::make_highlight(
    const std::vector<PerformancePoint>& performance, const std::vector<double>& returns,
    size_t rank) const {
    MonthHighlight highlight;
    highlight.period_return = returns[rank];

    size_t index = performance.size() * (rank + 1) / returns.size();
    if (index < performance.size()) {
        highlight.date = performance[index].date.to_string();
    }
    return highlight;
}

}  // namespace backtest
}  // namespace eurofolio
