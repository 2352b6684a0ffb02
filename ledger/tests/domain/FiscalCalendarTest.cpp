#include <gtest/gtest.h>
#include "domain/FiscalCalendar.hpp"
#include <stdexcept>

using namespace ledger::domain;

class FiscalCalendarTest : public ::testing::Test {
protected:
    FiscalCalendar july{7};
};

// ============================================================================
// PERIOD OF DATE
// ============================================================================

TEST_F(FiscalCalendarTest, PeriodOf_FirstDayOfStartMonth_IsPeriodOneOfNextYear) {
    auto period = july.periodOf(Date(2024, 7, 1));

    EXPECT_EQ(period.fiscalYear, 2025);
    EXPECT_EQ(period.period, 1);
}

TEST_F(FiscalCalendarTest, PeriodOf_DayBeforeStart_IsPeriodTwelve) {
    auto period = july.periodOf(Date(2024, 6, 30));

    EXPECT_EQ(period.fiscalYear, 2024);
    EXPECT_EQ(period.period, 12);
}

TEST_F(FiscalCalendarTest, PeriodOf_DecemberWithJulyStart_IsPeriodSix) {
    auto period = july.periodOf(Date(2024, 12, 31));

    EXPECT_EQ(period.fiscalYear, 2025);
    EXPECT_EQ(period.period, 6);
}

TEST_F(FiscalCalendarTest, PeriodOf_January_IsPeriodSeven) {
    auto period = july.periodOf(Date(2025, 1, 15));

    EXPECT_EQ(period.fiscalYear, 2025);
    EXPECT_EQ(period.period, 7);
}

TEST_F(FiscalCalendarTest, PeriodOf_JanuaryStart_MatchesCalendarYear) {
    FiscalCalendar calendar(1);

    EXPECT_EQ(calendar.periodOf(Date(2024, 1, 1)), (FiscalPeriod{2024, 1}));
    EXPECT_EQ(calendar.periodOf(Date(2024, 12, 31)), (FiscalPeriod{2024, 12}));
}

TEST_F(FiscalCalendarTest, PeriodOf_AllStartMonths_PeriodOneOnStartAndTwelveBefore) {
    for (int start = 1; start <= 12; ++start) {
        FiscalCalendar calendar(start);

        auto first = calendar.periodOf(Date(2024, start, 1));
        EXPECT_EQ(first.period, 1) << "start month " << start;
        EXPECT_EQ(first.fiscalYear, start == 1 ? 2024 : 2025) << "start month " << start;

        // Последний день предыдущего месяца закрывает предыдущий год
        Date previous = start == 1 ? Date(2023, 12, 31) : Date(2024, start - 1, 1).endOfMonth();
        auto last = calendar.periodOf(previous);
        EXPECT_EQ(last.period, 12) << "start month " << start;
        EXPECT_EQ(last.fiscalYear, first.fiscalYear - 1) << "start month " << start;
    }
}

TEST_F(FiscalCalendarTest, PeriodOf_EveryMonth_PeriodsAreConsecutive) {
    for (int start = 1; start <= 12; ++start) {
        FiscalCalendar calendar(start);
        for (int offset = 0; offset < 12; ++offset) {
            int month = (start - 1 + offset) % 12 + 1;
            int year = 2024 + (start - 1 + offset) / 12;
            auto period = calendar.periodOf(Date(year, month, 10));
            EXPECT_EQ(period.period, offset + 1) << "start " << start << " month " << month;
        }
    }
}

// ============================================================================
// PERIOD BOUNDARIES
// ============================================================================

TEST_F(FiscalCalendarTest, PeriodStartAndEnd_JulyStart) {
    EXPECT_EQ(july.periodStart(2025, 1), Date(2024, 7, 1));
    EXPECT_EQ(july.periodEnd(2025, 1), Date(2024, 7, 31));
    EXPECT_EQ(july.periodStart(2025, 6), Date(2024, 12, 1));
    EXPECT_EQ(july.periodStart(2025, 7), Date(2025, 1, 1));
    EXPECT_EQ(july.periodEnd(2024, 8), Date(2024, 2, 29));
}

TEST_F(FiscalCalendarTest, YearStartAndEnd_JulyStart) {
    EXPECT_EQ(july.yearStart(2025), Date(2024, 7, 1));
    EXPECT_EQ(july.yearEnd(2025), Date(2025, 6, 30));
}

TEST_F(FiscalCalendarTest, PeriodStart_RoundTripsThroughPeriodOf) {
    for (int start = 1; start <= 12; ++start) {
        FiscalCalendar calendar(start);
        for (int period = 1; period <= 12; ++period) {
            auto date = calendar.periodStart(2026, period);
            EXPECT_EQ(calendar.periodOf(date), (FiscalPeriod{2026, period}))
                << "start " << start << " period " << period;
        }
    }
}

TEST_F(FiscalCalendarTest, PeriodStart_InvalidPeriod_Throws) {
    EXPECT_THROW(july.periodStart(2025, 0), std::invalid_argument);
    EXPECT_THROW(july.periodEnd(2025, 13), std::invalid_argument);
}

TEST_F(FiscalCalendarTest, Constructor_InvalidStartMonth_Throws) {
    EXPECT_THROW(FiscalCalendar(0), std::invalid_argument);
    EXPECT_THROW(FiscalCalendar(13), std::invalid_argument);
}
