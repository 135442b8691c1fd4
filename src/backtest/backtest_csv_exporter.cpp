// src/backtest/backtest_csv_exporter.cpp
#include "eurofolio/backtest/backtest_csv_exporter.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include "eurofolio/core/logger.hpp"

namespace eurofolio {
namespace backtest {

namespace {
const char* const kComponent = "BacktestCSVExporter";

Result<void> open_for_writing(std::ofstream& out, const std::string& path) {
    out.open(path);
    if (!out.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open " + path + " for writing", kComponent);
    }
    out << std::fixed << std::setprecision(6);
    return Result<void>();
}

Result<void> check_written(const std::ofstream& out, const std::string& path) {
    if (!out.good()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing " + path, kComponent);
    }
    return Result<void>();
}
}  // namespace

BacktestCSVExporter::BacktestCSVExporter(const std::string& output_directory)
    : output_directory_(output_directory) {}

std::string BacktestCSVExporter::file_path(const std::string& name) const {
    return (std::filesystem::path(output_directory_) / name).string();
}

Result<void> BacktestCSVExporter::ensure_directory() const {
    std::error_code ec;
    std::filesystem::create_directories(output_directory_, ec);
    if (ec) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to create output directory " + output_directory_ + ": " +
                                    ec.message(),
                                kComponent);
    }
    return Result<void>();
}

Result<void> BacktestCSVExporter::write_performance(
    const std::vector<PerformancePoint>& performance) const {
    std::string path = file_path("performance.csv");
    std::ofstream out;
    auto open_result = open_for_writing(out, path);
    if (open_result.is_error())
        return open_result;

    out << "date,value,daily_return,cumulative_return\n";
    for (const auto& point : performance) {
        out << point.date << "," << point.value << "," << point.daily_return << ","
            << point.cumulative_return << "\n";
    }
    return check_written(out, path);
}

Result<void> BacktestCSVExporter::write_monthly_returns(
    const std::vector<MonthlyReturn>& monthly_returns) const {
    std::string path = file_path("monthly_returns.csv");
    std::ofstream out;
    auto open_result = open_for_writing(out, path);
    if (open_result.is_error())
        return open_result;

    out << "year,month,month_name,return,value,days_in_month\n";
    for (const auto& month : monthly_returns) {
        out << month.year << "," << month.month << "," << month.month_name << ","
            << month.period_return << "," << month.value << "," << month.days_in_month << "\n";
    }
    return check_written(out, path);
}

Result<void> BacktestCSVExporter::write_drawdowns(
    const std::vector<DrawdownPeriod>& drawdown_periods) const {
    std::string path = file_path("drawdowns.csv");
    std::ofstream out;
    auto open_result = open_for_writing(out, path);
    if (open_result.is_error())
        return open_result;

    out << "start_date,end_date,peak_value,trough_value,drawdown_percentage,duration,recovered,"
           "recovery_date\n";
    for (const auto& period : drawdown_periods) {
        out << period.start_date << "," << period.end_date << "," << period.peak_value << ","
            << period.trough_value << "," << period.drawdown_percentage << "," << period.duration
            << "," << (period.recovered ? "true" : "false") << ","
            << (period.recovery_date ? period.recovery_date->to_string() : "") << "\n";
    }
    return check_written(out, path);
}

Result<void> BacktestCSVExporter::write_summary(const nlohmann::json& summary) const {
    std::string path = file_path("summary.json");
    std::ofstream out(path);
    if (!out.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open " + path + " for writing", kComponent);
    }
    out << summary.dump(4) << "\n";
    return check_written(out, path);
}

Result<void> BacktestCSVExporter::export_results(const BacktestResults& results) const {
    return export_results(results, results.to_json(false));
}

Result<void> BacktestCSVExporter::export_results(const BacktestResults& results,
                                                 const nlohmann::json& summary) const {
    auto dir_result = ensure_directory();
    if (dir_result.is_error())
        return dir_result;

    auto performance_result = write_performance(results.performance_data);
    if (performance_result.is_error())
        return performance_result;

    auto monthly_result = write_monthly_returns(results.metrics.monthly_returns);
    if (monthly_result.is_error())
        return monthly_result;

    auto drawdown_result = write_drawdowns(results.metrics.drawdown_periods);
    if (drawdown_result.is_error())
        return drawdown_result;

    auto summary_result = write_summary(summary);
    if (summary_result.is_error())
        return summary_result;

    INFO("Exported backtest results for portfolio " << results.portfolio_id << " to "
                                                    << output_directory_);
    return Result<void>();
}

}  // namespace backtest
}  // namespace eurofolio
