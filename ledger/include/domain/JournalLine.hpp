#pragma once

#include <optional>
#include <string>

namespace ledger::domain {

/**
 * @brief Аналитические разрезы строки
 */
struct LineDimensions {
    std::optional<std::string> departmentId;
    std::optional<std::string> projectId;
    std::optional<std::string> costCenterId;

    bool empty() const {
        return !departmentId && !projectId && !costCenterId;
    }
};

/**
 * @brief Строка журнальной проводки
 *
 * Код и имя счёта копируются на момент создания строки:
 * переименование счёта не меняет историю.
 */
struct JournalLine {
    std::string id;
    int lineNumber = 0;
    std::string accountId;
    std::string accountCode;   ///< Снимок кода счёта
    std::string accountName;   ///< Снимок имени счёта
    std::string description;
    double debit = 0.0;
    double credit = 0.0;
    std::string currency;
    double exchangeRate = 1.0;
    double functionalDebit = 0.0;
    double functionalCredit = 0.0;
    LineDimensions dimensions;
};

} // namespace ledger::domain
