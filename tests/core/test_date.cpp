/// @file tests/core/test_date.cpp
/// @brief Unit tests for the calendar-date helpers.

#include <gtest/gtest.h>
#include "finplan/date.hpp"

using namespace finplan;

TEST(Date, MakeDateRejectsImpossibleDays) {
    EXPECT_TRUE(make_date(2024, 2, 29).has_value());
    EXPECT_FALSE(make_date(2023, 2, 29).has_value());
    EXPECT_FALSE(make_date(2023, 13, 1).has_value());
    EXPECT_FALSE(make_date(2023, 4, 31).has_value());
}

TEST(Date, AddDaysCrossesMonthAndYear) {
    const Date d = *make_date(2023, 12, 31);
    EXPECT_EQ(add_days(d, 1), *make_date(2024, 1, 1));
    EXPECT_EQ(add_days(*make_date(2024, 3, 1), -1), *make_date(2024, 2, 29));
    EXPECT_EQ(add_days(d, -7), *make_date(2023, 12, 24));
}

TEST(Date, DaysBetweenIsSigned) {
    const Date a = *make_date(2024, 1, 1);
    const Date b = *make_date(2024, 3, 1);
    EXPECT_EQ(days_between(a, b), 60);
    EXPECT_EQ(days_between(b, a), -60);
    EXPECT_EQ(days_between(a, a), 0);
}

TEST(Date, IsoRoundTrip) {
    const Date d = *make_date(2024, 3, 5);
    EXPECT_EQ(to_iso(d), "2024-03-05");
    EXPECT_EQ(parse_iso("2024-03-05"), d);
}

TEST(Date, ParseIsoIsStrict) {
    EXPECT_FALSE(parse_iso("2024-3-05").has_value());
    EXPECT_FALSE(parse_iso("2024/03/05").has_value());
    EXPECT_FALSE(parse_iso("2024-02-30").has_value());
    EXPECT_FALSE(parse_iso("2024-00-10").has_value());
    EXPECT_FALSE(parse_iso(" 2024-03-05").has_value());
    EXPECT_FALSE(parse_iso("").has_value());
}

TEST(Date, TodayIsAValidDate) {
    EXPECT_TRUE(today().ok());
}
