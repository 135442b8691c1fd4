// src/core/date.cpp

#include "eurofolio/core/date.hpp"
#include <array>
#include <cctype>
#include <cstdio>

namespace eurofolio {

namespace {

// Civil date <-> day count conversion over 400-year eras
int64_t days_from_civil(int64_t y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

bool parse_fixed_digits(const std::string& text, size_t pos, size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}

}  // namespace

Result<Date> Date::parse(const std::string& text) {
    int y = 0, m = 0, d = 0;
    bool shape_ok = text.size() >= 10 && text[4] == '-' && text[7] == '-' &&
                    parse_fixed_digits(text, 0, 4, y) && parse_fixed_digits(text, 5, 2, m) &&
                    parse_fixed_digits(text, 8, 2, d);
    if (shape_ok && text.size() > 10 && text[10] != 'T' && text[10] != ' ') {
        shape_ok = false;
    }
    if (!shape_ok) {
        return make_error<Date>(ErrorCode::INVALID_DATA,
                                "Invalid date '" + text + "', expected YYYY-MM-DD", "Date");
    }

    Date date(y, m, d);
    if (!date.is_valid()) {
        return make_error<Date>(ErrorCode::INVALID_DATA, "Date out of range: " + text, "Date");
    }
    return date;
}

Date Date::from_serial(int64_t serial) {
    const int64_t z = serial + 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    const int d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    const int m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    const int64_t y = yoe + era * 400 + (m <= 2 ? 1 : 0);
    return Date(static_cast<int>(y), m, d);
}

int64_t Date::serial() const {
    return days_from_civil(year, month, day);
}

Date Date::add_days(int64_t days) const {
    return from_serial(serial() + days);
}

bool Date::is_leap_year(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int Date::days_in_month(int y, int m) {
    static const std::array<int, 12> kDays = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m < 1 || m > 12) {
        return 0;
    }
    if (m == 2 && is_leap_year(y)) {
        return 29;
    }
    return kDays[m - 1];
}

bool Date::is_valid() const {
    return month >= 1 && month <= 12 && day >= 1 && day <= days_in_month(year, month);
}

std::string Date::to_string() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return std::string(buffer);
}

std::string month_short_name(int month) {
    static const std::array<const char*, 12> kNames = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                                       "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    if (month < 1 || month > 12) {
        return "";
    }
    return kNames[month - 1];
}

}  // namespace eurofolio
