#include <gtest/gtest.h>
#include <ctime>
#include <regex>
#include "eurofolio/core/date.hpp"
#include "eurofolio/core/time_utils.hpp"

using namespace eurofolio;
using namespace eurofolio::core;

class TimeUtilsTest : public ::testing::Test {};

TEST_F(TimeUtilsTest, SafeLocaltimeValidInput) {
    std::time_t now = std::time(nullptr);
    std::tm result;

    std::tm* ret = safe_localtime(&now, &result);

    ASSERT_NE(ret, nullptr);
    EXPECT_EQ(ret, &result);
    EXPECT_GE(result.tm_year, 100);
    EXPECT_GE(result.tm_mon, 0);
    EXPECT_LE(result.tm_mon, 11);
    EXPECT_GE(result.tm_mday, 1);
    EXPECT_LE(result.tm_mday, 31);
}

TEST_F(TimeUtilsTest, FormattedTimeMatchesPattern) {
    std::string stamp = get_formatted_time("%Y%m%d_%H%M%S");
    EXPECT_TRUE(std::regex_match(stamp, std::regex("\\d{8}_\\d{6}"))) << stamp;
}

TEST_F(TimeUtilsTest, LocalTodayIsValidDate) {
    Date today = local_today();
    EXPECT_TRUE(today.is_valid());
    EXPECT_GE(today.year, 2000);
}

class DateTest : public ::testing::Test {};

TEST_F(DateTest, ParseIsoDate) {
    auto result = Date::parse("2024-02-29");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), Date(2024, 2, 29));
    EXPECT_EQ(result.value().to_string(), "2024-02-29");
}

TEST_F(DateTest, ParseIgnoresTimePart) {
    auto with_t = Date::parse("2023-06-15T00:00:00Z");
    ASSERT_TRUE(with_t.is_ok());
    EXPECT_EQ(with_t.value(), Date(2023, 6, 15));

    auto with_space = Date::parse("2023-06-15 16:30:00");
    ASSERT_TRUE(with_space.is_ok());
    EXPECT_EQ(with_space.value(), Date(2023, 6, 15));
}

TEST_F(DateTest, ParseRejectsMalformed) {
    for (const char* text : {"", "2023-6-15", "2023/06/15", "20230615", "2023-06-15x",
                             "abcd-ef-gh"}) {
        auto result = Date::parse(text);
        ASSERT_TRUE(result.is_error()) << text;
        EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
    }
}

TEST_F(DateTest, ParseRejectsOutOfRange) {
    EXPECT_TRUE(Date::parse("2023-02-29").is_error());
    EXPECT_TRUE(Date::parse("2023-13-01").is_error());
    EXPECT_TRUE(Date::parse("2023-04-31").is_error());
    EXPECT_TRUE(Date::parse("2000-02-29").is_ok());
    EXPECT_TRUE(Date::parse("1900-02-29").is_error());
}

TEST_F(DateTest, SerialArithmetic) {
    EXPECT_EQ(Date(1970, 1, 1).serial(), 0);
    EXPECT_EQ(Date(1970, 1, 2).serial(), 1);
    EXPECT_EQ(Date(1969, 12, 31).serial(), -1);
    EXPECT_EQ(Date::from_serial(Date(2024, 3, 1).serial()), Date(2024, 3, 1));

    EXPECT_EQ(Date(2024, 2, 28).add_days(1), Date(2024, 2, 29));
    EXPECT_EQ(Date(2024, 2, 28).add_days(2), Date(2024, 3, 1));
    EXPECT_EQ(Date(2023, 12, 31).add_days(1), Date(2024, 1, 1));
    EXPECT_EQ(Date(2024, 1, 1).add_days(-1), Date(2023, 12, 31));
}

TEST_F(DateTest, DaysBetween) {
    EXPECT_EQ(days_between(Date(2020, 1, 1), Date(2021, 1, 1)), 366);
    EXPECT_EQ(days_between(Date(2021, 1, 1), Date(2022, 1, 1)), 365);
    EXPECT_EQ(days_between(Date(2022, 1, 1), Date(2021, 1, 1)), -365);
}

TEST_F(DateTest, Ordering) {
    EXPECT_LT(Date(2023, 12, 31), Date(2024, 1, 1));
    EXPECT_LT(Date(2024, 1, 31), Date(2024, 2, 1));
    EXPECT_GT(Date(2024, 1, 2), Date(2024, 1, 1));
    EXPECT_LE(Date(2024, 1, 1), Date(2024, 1, 1));
    EXPECT_NE(Date(2024, 1, 1), Date(2024, 1, 2));
}

TEST_F(DateTest, MonthHelpers) {
    EXPECT_EQ(month_short_name(1), "Jan");
    EXPECT_EQ(month_short_name(12), "Dec");
    EXPECT_EQ(month_short_name(13), "");
    EXPECT_EQ(Date::days_in_month(2024, 2), 29);
    EXPECT_EQ(Date::days_in_month(2023, 2), 28);
}
