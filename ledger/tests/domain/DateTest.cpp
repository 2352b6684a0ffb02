#include <gtest/gtest.h>
#include "domain/Date.hpp"
#include "domain/Timestamp.hpp"
#include <stdexcept>

using namespace ledger::domain;

TEST(DateTest, FromString_ParsesIsoDate) {
    auto date = Date::fromString("2024-08-15");

    EXPECT_EQ(date.year, 2024);
    EXPECT_EQ(date.month, 8);
    EXPECT_EQ(date.day, 15);
    EXPECT_EQ(date.toString(), "2024-08-15");
}

TEST(DateTest, FromString_AcceptsTimeSuffix) {
    EXPECT_EQ(Date::fromString("2024-08-15T10:30:00Z"), Date(2024, 8, 15));
    EXPECT_EQ(Date::fromString("2024-08-15 00:00:00"), Date(2024, 8, 15));
}

TEST(DateTest, FromString_RejectsGarbage) {
    EXPECT_THROW(Date::fromString("15/08/2024"), std::invalid_argument);
    EXPECT_THROW(Date::fromString("2024-8-15"), std::invalid_argument);
    EXPECT_THROW(Date::fromString(""), std::invalid_argument);
    EXPECT_THROW(Date::fromString("2024-08-15x"), std::invalid_argument);
}

TEST(DateTest, Constructor_RejectsNonExistentDay) {
    EXPECT_THROW(Date(2023, 2, 29), std::invalid_argument);
    EXPECT_THROW(Date(2024, 4, 31), std::invalid_argument);
    EXPECT_THROW(Date(2024, 13, 1), std::invalid_argument);
    EXPECT_NO_THROW(Date(2024, 2, 29));
}

TEST(DateTest, EndOfMonth_HandlesLeapYears) {
    EXPECT_EQ(Date(2024, 2, 10).endOfMonth(), Date(2024, 2, 29));
    EXPECT_EQ(Date(2100, 2, 10).endOfMonth(), Date(2100, 2, 28));
    EXPECT_EQ(Date(2000, 2, 10).endOfMonth(), Date(2000, 2, 29));
}

TEST(DateTest, Ordering) {
    EXPECT_LT(Date(2024, 6, 30), Date(2024, 7, 1));
    EXPECT_LT(Date(2023, 12, 31), Date(2024, 1, 1));
    EXPECT_GE(Date(2024, 7, 1), Date(2024, 7, 1));
}

TEST(TimestampTest, ToStringAndBack_SecondPrecision) {
    auto ts = Timestamp::fromString("2025-12-16T10:30:00Z");

    EXPECT_EQ(ts.toString(), "2025-12-16T10:30:00Z");
    EXPECT_EQ(Timestamp::fromString("2025-12-16 10:30:00"), ts);
}

TEST(TimestampTest, FromUnixSeconds) {
    EXPECT_EQ(Timestamp::fromUnixSeconds(0).toString(), "1970-01-01T00:00:00Z");
    EXPECT_EQ(Timestamp::fromString("2024-02-29T00:00:00Z").toUnixSeconds(), 1709164800);
}
