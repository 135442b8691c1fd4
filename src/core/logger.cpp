// src/core/logger.cpp

#include "eurofolio/core/logger.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <utility>
#include <vector>
#include "eurofolio/core/time_utils.hpp"

namespace eurofolio {

thread_local std::string Logger::current_component_;

namespace {
const std::pair<LogLevel, const char*> kLevelNames[] = {
    {LogLevel::TRACE, "TRACE"},     {LogLevel::DEBUG, "DEBUG"}, {LogLevel::INFO, "INFO"},
    {LogLevel::WARNING, "WARNING"}, {LogLevel::ERR, "ERROR"},   {LogLevel::FATAL, "FATAL"}};

const std::pair<LogDestination, const char*> kDestinationNames[] = {
    {LogDestination::CONSOLE, "CONSOLE"},
    {LogDestination::FILE, "FILE"},
    {LogDestination::BOTH, "BOTH"}};
}  // namespace

std::string level_to_string(LogLevel level) {
    for (const auto& [value, name] : kLevelNames) {
        if (value == level)
            return name;
    }
    return "UNKNOWN";
}

std::string log_destination_to_string(LogDestination dest) {
    for (const auto& [value, name] : kDestinationNames) {
        if (value == dest)
            return name;
    }
    return "UNKNOWN";
}

LogLevel level_from_string(const std::string& level_str) {
    if (level_str == "WARN")
        return LogLevel::WARNING;
    for (const auto& [value, name] : kLevelNames) {
        if (level_str == name)
            return value;
    }
    throw EngineError(ErrorCode::INVALID_ARGUMENT, "Unknown log level: " + level_str,
                      "LoggerConfig");
}

LogDestination log_destination_from_string(const std::string& dest_str) {
    for (const auto& [value, name] : kDestinationNames) {
        if (dest_str == name)
            return value;
    }
    throw EngineError(ErrorCode::INVALID_ARGUMENT, "Unknown log destination: " + dest_str,
                      "LoggerConfig");
}

nlohmann::json LoggerConfig::to_json() const {
    return {{"min_level", level_to_string(min_level)},
            {"destination", log_destination_to_string(destination)},
            {"log_directory", log_directory},
            {"filename_prefix", filename_prefix},
            {"include_timestamp", include_timestamp},
            {"include_level", include_level},
            {"max_file_size", max_file_size},
            {"max_files", max_files},
            {"version", version}};
}

void LoggerConfig::from_json(const nlohmann::json& j) {
    if (j.contains("min_level"))
        min_level = level_from_string(j.at("min_level").get<std::string>());
    if (j.contains("destination"))
        destination = log_destination_from_string(j.at("destination").get<std::string>());
    log_directory = j.value("log_directory", log_directory);
    filename_prefix = j.value("filename_prefix", filename_prefix);
    include_timestamp = j.value("include_timestamp", include_timestamp);
    include_level = j.value("include_level", include_level);
    max_file_size = j.value("max_file_size", max_file_size);
    max_files = j.value("max_files", max_files);
    version = j.value("version", version);
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    min_level_.store(config_.min_level, std::memory_order_relaxed);

    if (log_file_.is_open()) {
        log_file_.close();
    }

    if (config_.destination == LogDestination::FILE ||
        config_.destination == LogDestination::BOTH) {
        std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);

        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to create log directory: " + log_dir.string() +
                                     " - " + ec.message());
        }

        // Retention runs before the new file so the total never exceeds max_files
        enforce_retention();

        current_session_timestamp_ = core::get_formatted_time("%Y%m%d_%H%M%S");
        current_part_number_ = 1;
        open_current_part();

        if (!log_file_.is_open()) {
            throw std::runtime_error("Failed to open log file in: " + log_dir.string());
        }
    }

    initialized_.store(true, std::memory_order_release);
}

void Logger::reset_for_tests() {
    Logger& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.initialized_.store(false, std::memory_order_release);
    if (logger.log_file_.is_open()) {
        logger.log_file_.close();
    }
    logger.current_session_timestamp_.clear();
    logger.current_part_number_ = 1;
    current_component_.clear();
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!initialized_.load(std::memory_order_acquire)) {
        std::cerr << "WARNING: Logger not initialized. Message: " << message << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (level < min_level_.load(std::memory_order_relaxed)) {
        return;
    }

    std::string formatted_message = format_message(level, message);

    if (config_.destination == LogDestination::CONSOLE ||
        config_.destination == LogDestination::BOTH) {
        write_to_console_unsafe(formatted_message);
    }

    if (config_.destination == LogDestination::FILE ||
        config_.destination == LogDestination::BOTH) {
        write_to_file_unsafe(formatted_message);
    }
}

std::string Logger::format_message(LogLevel level, const std::string& message) {
    std::ostringstream ss;

    if (config_.include_timestamp) {
        ss << core::get_formatted_time("%Y-%m-%d %H:%M:%S") << " ";
    }

    if (config_.include_level) {
        ss << "[" << level_to_string(level) << "] ";
    }

    if (!current_component_.empty()) {
        ss << "[" << current_component_ << "] ";
    }

    ss << message;
    return ss.str();
}

void Logger::write_to_console_unsafe(const std::string& message) {
    // Assumes mutex is already held
    std::cout << message << std::endl;
}

void Logger::write_to_file_unsafe(const std::string& message) {
    // Assumes mutex is already held
    if (!log_file_.is_open()) {
        return;
    }

    log_file_ << message << std::endl;

    if (log_file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
        rotate_log_files();
    }
}

void Logger::enforce_retention() {
    std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);

    // Only files this logger names: <prefix>_..._partN.log
    const std::string prefix = config_.filename_prefix + "_";
    std::vector<std::filesystem::path> log_files;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".log") {
            continue;
        }
        if (entry.path().filename().string().compare(0, prefix.size(), prefix) == 0) {
            log_files.push_back(entry.path());
        }
    }

    std::sort(log_files.begin(), log_files.end(), [](const auto& a, const auto& b) {
        return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
    });

    while (!log_files.empty() && log_files.size() >= config_.max_files) {
        std::error_code ec;
        std::filesystem::remove(log_files.front(), ec);
        log_files.erase(log_files.begin());
    }
}

void Logger::open_current_part() {
    std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);

    // prefix_YYYYMMDD_HHMMSS_partN.log
    std::filesystem::path log_path =
        log_dir / (config_.filename_prefix + "_" + current_session_timestamp_ + "_part" +
                   std::to_string(current_part_number_) + ".log");

    log_file_.open(log_path, std::ios::app);
}

void Logger::rotate_log_files() {
    log_file_.close();
    enforce_retention();
    current_part_number_++;
    open_current_part();
}

}  // namespace eurofolio
