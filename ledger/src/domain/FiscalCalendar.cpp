#include "domain/FiscalCalendar.hpp"
#include <stdexcept>
#include <string>

namespace ledger::domain {

FiscalCalendar::FiscalCalendar(int startMonth) : startMonth_(startMonth) {
    if (startMonth < 1 || startMonth > 12) {
        throw std::invalid_argument("Fiscal year start month must be 1..12, got " +
                                    std::to_string(startMonth));
    }
}

FiscalPeriod FiscalCalendar::periodOf(const Date& date) const {
    FiscalPeriod result;
    if (date.month >= startMonth_) {
        // Год стартовал в этом календарном году; при старте в январе он в нём же и закончится
        result.fiscalYear = startMonth_ == 1 ? date.year : date.year + 1;
        result.period = date.month - startMonth_ + 1;
    } else {
        result.fiscalYear = date.year;
        result.period = date.month + 12 - startMonth_ + 1;
    }
    return result;
}

Date FiscalCalendar::periodStart(int fiscalYear, int period) const {
    if (period < 1 || period > 12) {
        throw std::invalid_argument("Fiscal period must be 1..12, got " + std::to_string(period));
    }
    int startYear = startMonth_ == 1 ? fiscalYear : fiscalYear - 1;
    int monthIndex = (startMonth_ - 1) + (period - 1);   // 0-based от января startYear
    return Date(startYear + monthIndex / 12, monthIndex % 12 + 1, 1);
}

Date FiscalCalendar::periodEnd(int fiscalYear, int period) const {
    return periodStart(fiscalYear, period).endOfMonth();
}

} // namespace ledger::domain
