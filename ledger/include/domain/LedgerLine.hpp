#pragma once

#include "enums/JournalStatus.hpp"
#include "Date.hpp"
#include "JournalLine.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Проведённая строка в карточке счёта
 */
struct LedgerLine {
    std::string journalId;
    std::string journalNumber;
    Date date;
    int fiscalYear = 0;
    int fiscalPeriod = 0;
    JournalStatus journalStatus = JournalStatus::POSTED;
    JournalLine line;
    double runningBalance = 0.0;   ///< Нарастающее сальдо после строки
};

/**
 * @brief Обороты счёта за финансовый период
 */
struct PeriodActivity {
    std::string accountId;
    std::string accountCode;
    double debit = 0.0;
    double credit = 0.0;
};

} // namespace ledger::domain
