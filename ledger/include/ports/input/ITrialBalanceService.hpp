#pragma once

#include "domain/TrialBalance.hpp"
#include <optional>
#include <string>

namespace ledger::ports::input {

/**
 * @brief Интерфейс генератора оборотно-сальдовой ведомости
 */
class ITrialBalanceService {
public:
    virtual ~ITrialBalanceService() = default;

    /**
     * @brief Построить ведомость по активным проводимым счетам
     *
     * Строки берутся из текущих снимков сальдо, а не из истории проводок:
     * asOfDate только подписывает отчёт и задаёт финансовый год по умолчанию.
     * Сальдо на прошлую дату даёт ILedgerQueryService::getBalanceAsOf().
     *
     * @param asOfDate Дата отчёта
     * @param fiscalYear По умолчанию финансовый год asOfDate
     */
    virtual domain::TrialBalance generate(
        const std::string& companyId,
        const std::string& userId,
        const domain::Date& asOfDate,
        std::optional<int> fiscalYear = std::nullopt,
        std::optional<int> fiscalPeriod = std::nullopt
    ) = 0;
};

} // namespace ledger::ports::input
