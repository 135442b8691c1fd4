#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include "eurofolio/backtest/backtest_coordinator.hpp"
#include "eurofolio/backtest/backtest_csv_exporter.hpp"
#include "eurofolio/backtest/backtest_run_config.hpp"
#include "eurofolio/backtest/price_data_loader.hpp"
#include "eurofolio/core/logger.hpp"
#include "eurofolio/core/time_utils.hpp"

using namespace eurofolio;
using namespace eurofolio::backtest;

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <config.json>" << std::endl;
        return 1;
    }
    const std::string config_filename = argv[1];

    try {
        BacktestRunConfig config;
        auto config_result = config.load_from_file(config_filename);
        if (config_result.is_error()) {
            std::cerr << "Failed to load config " << config_filename << ": "
                      << config_result.error()->what() << std::endl;
            return 1;
        }

        auto& logger = Logger::instance();
        logger.initialize(config.logger);
        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }
        Logger::register_component("bt_portfolio");

        INFO("Backtesting portfolio " << config.backtest.portfolio_id << " ("
                                      << config.allocations.size() << " assets) from "
                                      << config.backtest.start_date << " to "
                                      << config.backtest.end_date);

        if (config.backtest.end_date > core::local_today()) {
            WARN("End date " << config.backtest.end_date
                             << " is in the future, last known closes carry forward");
        }

        // Load price data
        PriceDataLoader loader;
        auto prices_result =
            loader.load_directory(config.price_data_directory, config.asset_ids(),
                                  config.backtest.start_date, config.backtest.end_date);
        if (prices_result.is_error()) {
            ERROR("Failed to load price data: " << prices_result.error()->what());
            std::cerr << "Failed to load price data: " << prices_result.error()->what()
                      << std::endl;
            return 1;
        }

        // Run backtest
        BacktestCoordinator coordinator;
        auto run_result =
            coordinator.run(config.allocations, prices_result.value(), config.backtest);
        if (run_result.is_error()) {
            ERROR("Backtest failed: " << run_result.error()->to_string());
            std::cerr << "Backtest failed: " << run_result.error()->to_string() << std::endl;
            return 1;
        }
        const CoordinatedBacktest& coordinated = run_result.value();
        const BacktestResults& results = coordinated.results;

        // Export results
        BacktestCSVExporter exporter(config.output_directory);
        nlohmann::json summary = coordinated.to_json(false);
        summary["generated_at"] = core::get_formatted_time("%Y-%m-%d %H:%M:%S");
        auto export_result = exporter.export_results(results, summary);
        if (export_result.is_error()) {
            ERROR("Failed to export results: " << export_result.error()->what());
            std::cerr << "Failed to export results: " << export_result.error()->what()
                      << std::endl;
            return 1;
        }

        const BacktestMetrics& metrics = results.metrics;
        std::cout << std::fixed << std::setprecision(2);
        std::cout << "\n======= Backtest Results =======" << std::endl;
        std::cout << "Portfolio:          " << results.portfolio_id << std::endl;
        std::cout << "Period:             " << results.start_date << " to " << results.end_date
                  << " (" << results.total_days << " days)" << std::endl;
        std::cout << "Assets analyzed:    " << coordinated.assets_analyzed << " of "
                  << coordinated.total_assets << " (" << coordinated.data_completeness * 100.0
                  << "% complete)" << std::endl;
        std::cout << "Initial investment: " << results.initial_investment << std::endl;
        std::cout << "Final value:        " << results.final_value << std::endl;
        std::cout << "Total return:       " << metrics.total_return * 100.0 << "%" << std::endl;
        std::cout << "Annualized return:  " << metrics.annualized_return * 100.0 << "%"
                  << std::endl;
        std::cout << "Volatility:         " << metrics.volatility * 100.0 << "%" << std::endl;
        std::cout << "Max drawdown:       " << metrics.max_drawdown * 100.0 << "%" << std::endl;
        std::cout << "Sharpe ratio:       " << metrics.sharpe_ratio << " ("
                  << metrics.risk_grade.grade << ", " << metrics.risk_grade.description << ")"
                  << std::endl;
        std::cout << "Sortino ratio:      " << metrics.sortino_ratio << std::endl;
        std::cout << "Win rate:           " << metrics.win_rate * 100.0 << "% ("
                  << metrics.positive_months << " up / " << metrics.negative_months
                  << " down months)" << std::endl;
        std::cout << "Results written to: " << config.output_directory << std::endl;

        INFO("Backtest finished, results in " << config.output_directory);
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        if (Logger::instance().is_initialized()) {
            ERROR("Unexpected error: " << e.what());
        }
        return 1;
    }
}
