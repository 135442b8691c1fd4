// src/backtest/price_data_loader.cpp

#include "eurofolio/backtest/price_data_loader.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include "eurofolio/core/logger.hpp"

namespace eurofolio {
namespace backtest {

namespace {
const char* const kComponent = "PriceDataLoader";
const char* const kCloseColumns[] = {"close_price", "close", "adjusted_close"};

// Whole-token number parse, no trailing characters
bool parse_number(const std::string& text, double& out) {
    try {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed != text.size()) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::optional<double> optional_column(const std::vector<std::string>& tokens, long column) {
    double value = 0.0;
    if (column < 0 || static_cast<size_t>(column) >= tokens.size() ||
        !parse_number(tokens[static_cast<size_t>(column)], value) || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}
}  // namespace

std::vector<std::string> PriceDataLoader::split(const std::string& line, char delimiter) {
    std::vector<std::string> tokens;
    std::stringstream ss(line);
    std::string token;
    while (std::getline(ss, token, delimiter)) {
        tokens.push_back(trim(token));
    }
    return tokens;
}

std::string PriceDataLoader::trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n\"");
    if (start == std::string::npos)
        return "";
    size_t end = text.find_last_not_of(" \t\r\n\"");
    return text.substr(start, end - start + 1);
}

std::string PriceDataLoader::to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

Result<PriceSeries> PriceDataLoader::load_csv(const std::string& path,
                                              const std::string& asset_id) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error<PriceSeries>(ErrorCode::FILE_NOT_FOUND,
                                       "Failed to open price file: " + path, kComponent);
    }

    std::string line;
    if (!std::getline(file, line)) {
        return make_error<PriceSeries>(ErrorCode::INVALID_DATA,
                                       "Price file is empty: " + path, kComponent);
    }

    // UTF-8 byte order mark
    if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        line.erase(0, 3);
    }

    auto header = split(line, ',');
    auto column_of = [&header](const std::string& name) {
        for (size_t i = 0; i < header.size(); ++i) {
            if (to_lower(header[i]) == name)
                return static_cast<long>(i);
        }
        return -1L;
    };
    long date_column = column_of("date");
    long close_column = -1;
    for (const char* name : kCloseColumns) {
        close_column = column_of(name);
        if (close_column >= 0)
            break;
    }
    const long open_column = column_of("open");
    const long high_column = column_of("high");
    const long low_column = column_of("low");
    const long adjusted_column = column_of("adjusted_close");
    const long volume_column = column_of("volume");

    if (date_column < 0 || close_column < 0) {
        return make_error<PriceSeries>(
            ErrorCode::INVALID_DATA,
            "Price file " + path + " needs a date column and a close_price, close or "
                                   "adjusted_close column",
            kComponent);
    }

    size_t required_columns = static_cast<size_t>(std::max(date_column, close_column)) + 1;

    // Later rows for a date overwrite earlier ones
    std::map<Date, PricePoint> points;
    size_t line_num = 1;
    size_t skipped = 0;
    while (std::getline(file, line)) {
        ++line_num;
        if (trim(line).empty())
            continue;

        auto tokens = split(line, ',');
        if (tokens.size() < required_columns) {
            WARN("Skipping line " << line_num << " in " << path << ": insufficient columns");
            ++skipped;
            continue;
        }

        auto date_result = Date::parse(tokens[static_cast<size_t>(date_column)]);
        if (date_result.is_error()) {
            WARN("Skipping line " << line_num << " in " << path << ": "
                                  << date_result.error()->what());
            ++skipped;
            continue;
        }

        const std::string& close_text = tokens[static_cast<size_t>(close_column)];
        double close = 0.0;
        if (!parse_number(close_text, close)) {
            WARN("Skipping line " << line_num << " in " << path << ": bad close '" << close_text
                                  << "'");
            ++skipped;
            continue;
        }

        if (!(close > 0.0) || !std::isfinite(close)) {
            WARN("Skipping line " << line_num << " in " << path << ": non-positive close "
                                  << close);
            ++skipped;
            continue;
        }

        PricePoint point(date_result.value(), close);
        point.open = optional_column(tokens, open_column);
        point.high = optional_column(tokens, high_column);
        point.low = optional_column(tokens, low_column);
        point.adjusted_close = optional_column(tokens, adjusted_column);
        point.volume = optional_column(tokens, volume_column);
        points[point.date] = point;
    }

    if (file.bad()) {
        return make_error<PriceSeries>(ErrorCode::FILE_IO_ERROR,
                                       "Error while reading price file: " + path, kComponent);
    }

    if (points.empty()) {
        return make_error<PriceSeries>(ErrorCode::INVALID_DATA,
                                       "No valid price rows in " + path, kComponent);
    }

    PriceSeries series;
    series.reserve(points.size());
    for (const auto& entry : points) {
        series.push_back(entry.second);
    }

    DEBUG("Loaded " << series.size() << " prices for " << asset_id << " from " << path
                    << " (" << skipped << " rows skipped)");
    return series;
}

PriceSeries PriceDataLoader::trim_to_range(const PriceSeries& series, const Date& start_date,
                                           const Date& end_date) {
    PriceSeries trimmed;
    std::copy_if(series.begin(), series.end(), std::back_inserter(trimmed),
                 [&](const PricePoint& point) {
                     return point.date >= start_date && point.date <= end_date;
                 });
    return trimmed;
}

Result<PriceSeriesMap> PriceDataLoader::load_directory(const std::string& directory,
                                                       const std::vector<std::string>& asset_ids,
                                                       const Date& start_date,
                                                       const Date& end_date) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        return make_error<PriceSeriesMap>(ErrorCode::FILE_NOT_FOUND,
                                          "Price data directory not found: " + directory,
                                          kComponent);
    }

    PriceSeriesMap price_series;
    for (const auto& asset_id : asset_ids) {
        std::filesystem::path path = std::filesystem::path(directory) / (asset_id + ".csv");
        auto series_result = load_csv(path.string(), asset_id);
        if (series_result.is_error()) {
            if (series_result.error()->code() == ErrorCode::FILE_IO_ERROR) {
                return forward_error<PriceSeriesMap>(series_result);
            }
            WARN("No usable price data for " << asset_id << ": "
                                             << series_result.error()->what());
            continue;
        }

        PriceSeries trimmed = trim_to_range(series_result.value(), start_date, end_date);
        if (trimmed.empty()) {
            WARN("No prices for " << asset_id << " between " << start_date << " and "
                                  << end_date);
            continue;
        }
        price_series.emplace(asset_id, std::move(trimmed));
    }

    INFO("Loaded price data for " << price_series.size() << " of " << asset_ids.size()
                                  << " assets from " << directory);
    return price_series;
}

}  // namespace backtest
}  // namespace eurofolio
