// include/eurofolio/backtest/backtest_csv_exporter.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "eurofolio/backtest/backtest_types.hpp"
#include "eurofolio/core/error.hpp"

namespace eurofolio {
namespace backtest {

/**
 * Writes a finished backtest into an output directory:
 *   performance.csv      date,value,daily_return,cumulative_return
 *   monthly_returns.csv  year,month,month_name,return,value,days_in_month
 *   drawdowns.csv        one row per drawdown period
 *   summary.json         results without the daily series
 */
class BacktestCSVExporter {
public:
    explicit BacktestCSVExporter(const std::string& output_directory);
    ~BacktestCSVExporter() = default;

    Result<void> export_results(const BacktestResults& results) const;

    /**
     * @brief Export with a caller supplied summary document
     */
    Result<void> export_results(const BacktestResults& results,
                                const nlohmann::json& summary) const;

    Result<void> write_performance(const std::vector<PerformancePoint>& performance) const;
    Result<void> write_monthly_returns(const std::vector<MonthlyReturn>& monthly_returns) const;
    Result<void> write_drawdowns(const std::vector<DrawdownPeriod>& drawdown_periods) const;
    Result<void> write_summary(const nlohmann::json& summary) const;

    const std::string& output_directory() const {
        return output_directory_;
    }

private:
    std::string output_directory_;

    Result<void> ensure_directory() const;
    std::string file_path(const std::string& name) const;
};

}  // namespace backtest
}  // namespace eurofolio
