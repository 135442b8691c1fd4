// include/eurofolio/core/logger.hpp
#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "eurofolio/core/config_base.hpp"

namespace eurofolio {

// Ordered by severity; messages below LoggerConfig::min_level are dropped
enum class LogLevel {
    TRACE,  // Per-asset simulation detail
    DEBUG,
    INFO,
    WARNING,
    ERR,  // ERROR collides with the macro below
    FATAL
};

enum class LogDestination {
    CONSOLE,  // stdout
    FILE,     // <log_directory>/<prefix>_<session>_partN.log
    BOTH
};

std::string level_to_string(LogLevel level);
std::string log_destination_to_string(LogDestination dest);

/**
 * @brief Parse a level name as written by level_to_string ("WARN" is also accepted)
 * @throws EngineError with INVALID_ARGUMENT for unknown names
 */
LogLevel level_from_string(const std::string& level_str);

/**
 * @throws EngineError with INVALID_ARGUMENT for unknown names
 */
LogDestination log_destination_from_string(const std::string& dest_str);

/**
 * @brief The "logger" section of a run config
 *
 * Files rotate once they reach max_file_size; at most max_files log files
 * are kept in log_directory, oldest removed first.
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"eurofolio"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{50 * 1024 * 1024};
    size_t max_files{10};

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Process-wide logger shared by the backtest components
 *
 * All writes go through one mutex. The component tag is per thread, so
 * concurrent backtests on different threads can tag their own lines.
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Apply a configuration, opening a fresh log file for FILE and BOTH
     * @throws std::runtime_error if the log directory or file cannot be created
     */
    void initialize(const LoggerConfig& config);

    // Back to the uninitialized state, closing any open file
    static void reset_for_tests();

    // Before initialize() the message goes to stderr with a warning instead
    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
        min_level_.store(level, std::memory_order_relaxed);
    }

    // Read by the LOG macro on every call, so kept outside the mutex
    LogLevel get_min_level() const {
        return min_level_.load(std::memory_order_relaxed);
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Tag subsequent messages from the calling thread with a component name
     */
    static void register_component(const std::string& component) {
        current_component_ = component;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    void enforce_retention();
    void open_current_part();
    void rotate_log_files();
    void write_to_file_unsafe(const std::string& message);
    void write_to_console_unsafe(const std::string& message);
    std::string format_message(LogLevel level, const std::string& message);

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};
    std::atomic<LogLevel> min_level_{LogLevel::INFO};
    static thread_local std::string current_component_;

    std::string current_session_timestamp_;  // YYYYMMDD_HHMMSS
    int current_part_number_{1};
};

// LOG(LogLevel::INFO, "Loaded " << count << " prices"); the stream expression
// is only evaluated when the level passes the filter
#define LOG(level, message)                                                      \
    do {                                                                         \
        if (level >= ::eurofolio::Logger::instance().get_min_level()) {          \
            std::ostringstream os;                                               \
            os << message;                                                       \
            ::eurofolio::Logger::instance().log(level, os.str());                \
        }                                                                        \
    } while (0)

#define TRACE(message) LOG(::eurofolio::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::eurofolio::LogLevel::DEBUG, message)
#define INFO(message) LOG(::eurofolio::LogLevel::INFO, message)
#define WARN(message) LOG(::eurofolio::LogLevel::WARNING, message)
#define ERROR(message) LOG(::eurofolio::LogLevel::ERR, message)
#define FATAL(message) LOG(::eurofolio::LogLevel::FATAL, message)

}  // namespace eurofolio
