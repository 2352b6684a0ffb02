#pragma once

#include "enums/AccountType.hpp"
#include "Date.hpp"
#include "Timestamp.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledger::domain {

/**
 * @brief Строка оборотно-сальдовой ведомости
 */
struct TrialBalanceEntry {
    std::string accountId;
    std::string accountCode;
    std::string accountName;
    AccountType accountType = AccountType::ASSET;
    double debit = 0.0;
    double credit = 0.0;
    double balance = 0.0;      ///< Сальдо со знаком по нормальной стороне
    bool isAbnormal = false;   ///< Сальдо на стороне, противоположной нормальной
};

/**
 * @brief Оборотно-сальдовая ведомость на дату
 */
struct TrialBalance {
    std::string companyId;
    Date asOfDate;
    int fiscalYear = 0;
    std::optional<int> fiscalPeriod;
    std::vector<TrialBalanceEntry> entries;
    double totalDebits = 0.0;
    double totalCredits = 0.0;
    bool isBalanced = false;
    int abnormalCount = 0;
    Timestamp generatedAt;
    std::string generatedBy;

    /**
     * @brief Сериализовать в JSON для модулей отчётности
     */
    std::string toJson() const;
};

} // namespace ledger::domain
