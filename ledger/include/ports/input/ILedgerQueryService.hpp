#pragma once

#include "domain/JournalEntry.hpp"
#include "domain/JournalRequest.hpp"
#include "domain/LedgerLine.hpp"
#include <string>
#include <vector>

namespace ledger::ports::input {

/**
 * @brief Интерфейс чтения проведённых данных главной книги
 *
 * Единственная точка, через которую модули бюджета, денежных потоков
 * и отчётности читают проводки. Учитываются проводки в статусах
 * POSTED и REVERSED: сторнированная проводка и её сторно остаются в истории.
 */
class ILedgerQueryService {
public:
    virtual ~ILedgerQueryService() = default;

    /**
     * @brief Проведённые строки счёта за период [from, to]
     *
     * Упорядочены по дате, затем по номеру проводки, с нарастающим сальдо.
     *
     * @throws domain::NotFoundError счёт не найден
     */
    virtual std::vector<domain::LedgerLine> getPostedLines(
        const std::string& companyId,
        const std::string& accountId,
        const domain::Date& from,
        const domain::Date& to
    ) = 0;

    /**
     * @brief Проведённые проводки, затрагивающие счёт, новые первыми
     */
    virtual std::vector<domain::JournalEntry> getAccountLedger(
        const std::string& companyId,
        const std::string& accountId,
        const domain::JournalFilter& filter
    ) = 0;

    /**
     * @brief Сальдо счёта по проведённым строкам на дату включительно
     *
     * @throws domain::NotFoundError счёт не найден
     */
    virtual double getBalanceAsOf(
        const std::string& companyId,
        const std::string& accountId,
        const domain::Date& asOfDate
    ) = 0;

    /**
     * @brief Обороты по счетам за финансовый период, отсортированы по коду
     */
    virtual std::vector<domain::PeriodActivity> getPeriodActivity(
        const std::string& companyId,
        int fiscalYear,
        int fiscalPeriod
    ) = 0;
};

} // namespace ledger::ports::input
