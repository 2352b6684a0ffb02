#pragma once

#include "Date.hpp"

namespace ledger::domain {

/**
 * @brief Финансовый год и период даты
 */
struct FiscalPeriod {
    int fiscalYear = 0;
    int period = 0;     ///< 1..12

    bool operator==(const FiscalPeriod& other) const {
        return fiscalYear == other.fiscalYear && period == other.period;
    }
    bool operator!=(const FiscalPeriod& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Финансовый календарь с началом года в произвольном месяце
 *
 * Период 1 начинается 1-го числа стартового месяца. Финансовый год
 * называется по календарному году, в котором он заканчивается:
 * при старте в июле июль 2024 - это FY2025 период 1,
 * июнь 2024 - FY2024 период 12.
 */
class FiscalCalendar {
public:
    /**
     * @param startMonth Стартовый месяц 1..12
     * @throws std::invalid_argument если месяц вне диапазона
     */
    explicit FiscalCalendar(int startMonth = 7);

    int startMonth() const { return startMonth_; }

    /**
     * @brief Финансовый год и период для даты
     */
    FiscalPeriod periodOf(const Date& date) const;

    /**
     * @brief Первый день периода
     * @throws std::invalid_argument если period вне 1..12
     */
    Date periodStart(int fiscalYear, int period) const;

    /**
     * @brief Последний день периода
     * @throws std::invalid_argument если period вне 1..12
     */
    Date periodEnd(int fiscalYear, int period) const;

    Date yearStart(int fiscalYear) const { return periodStart(fiscalYear, 1); }
    Date yearEnd(int fiscalYear) const { return periodEnd(fiscalYear, 12); }

private:
    int startMonth_;
};

} // namespace ledger::domain
