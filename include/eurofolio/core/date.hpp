// include/eurofolio/core/date.hpp
#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include "eurofolio/core/error.hpp"

namespace eurofolio {

/**
 * @brief Calendar date in the proleptic Gregorian calendar
 *
 * Day arithmetic goes through a serial day number (days since 1970-01-01),
 * so differences between dates are exact and independent of time zones.
 */
struct Date {
    int year{1970};
    int month{1};
    int day{1};

    Date() = default;
    Date(int y, int m, int d) : year(y), month(m), day(d) {}

    /**
     * @brief Parse an ISO date string
     * @param text Date in "YYYY-MM-DD" form (a trailing time part is ignored)
     * @return Parsed date or INVALID_DATA error
     */
    static Result<Date> parse(const std::string& text);

    /**
     * @brief Build a date from its serial day number
     * @param serial Days since 1970-01-01 (may be negative)
     */
    static Date from_serial(int64_t serial);

    /**
     * @brief Days since 1970-01-01
     */
    int64_t serial() const;

    /**
     * @brief Date shifted by a number of days
     */
    Date add_days(int64_t days) const;

    /**
     * @brief Check that month and day are in range for the year
     */
    bool is_valid() const;

    /**
     * @brief Format as "YYYY-MM-DD"
     */
    std::string to_string() const;

    static bool is_leap_year(int year);
    static int days_in_month(int year, int month);
};

/**
 * @brief Signed number of days from one date to another
 */
inline int64_t days_between(const Date& from, const Date& to) {
    return to.serial() - from.serial();
}

/**
 * @brief Short English month name ("Jan" ... "Dec")
 */
std::string month_short_name(int month);

inline bool operator==(const Date& lhs, const Date& rhs) {
    return lhs.year == rhs.year && lhs.month == rhs.month && lhs.day == rhs.day;
}

inline bool operator!=(const Date& lhs, const Date& rhs) {
    return !(lhs == rhs);
}

inline bool operator<(const Date& lhs, const Date& rhs) {
    if (lhs.year != rhs.year)
        return lhs.year < rhs.year;
    if (lhs.month != rhs.month)
        return lhs.month < rhs.month;
    return lhs.day < rhs.day;
}

inline bool operator>(const Date& lhs, const Date& rhs) {
    return rhs < lhs;
}

inline bool operator<=(const Date& lhs, const Date& rhs) {
    return !(rhs < lhs);
}

inline bool operator>=(const Date& lhs, const Date& rhs) {
    return !(lhs < rhs);
}

inline std::ostream& operator<<(std::ostream& os, const Date& date) {
    return os << date.to_string();
}

}  // namespace eurofolio
