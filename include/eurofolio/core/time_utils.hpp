// include/eurofolio/core/time_utils.hpp
#pragma once

#include <time.h>
#include <chrono>
#include <ctime>
#include <string>
#include "eurofolio/core/date.hpp"

namespace eurofolio {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Get current wall-clock time as a string with specified format
 *
 * Only used for log lines and export metadata, never by the simulation.
 *
 * @param format Format string compatible with strftime
 * @return Formatted time string
 */
inline std::string get_formatted_time(const char* format) {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    std::tm result{};
    safe_localtime(&now_c, &result);

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

/**
 * @brief Today's calendar date in local time
 */
inline Date local_today() {
    auto now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm result{};
    safe_localtime(&now_c, &result);
    return Date(result.tm_year + 1900, result.tm_mon + 1, result.tm_mday);
}

}  // namespace core
}  // namespace eurofolio
