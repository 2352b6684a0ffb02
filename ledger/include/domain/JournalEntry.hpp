#pragma once

#include "enums/JournalStatus.hpp"
#include "enums/JournalType.hpp"
#include "Date.hpp"
#include "JournalLine.hpp"
#include "Timestamp.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledger::domain {

/**
 * @brief Запись истории согласования
 */
struct ApprovalRecord {
    std::string action;     ///< "approved" / "rejected"
    std::string userId;
    Timestamp timestamp;
    std::string comments;
};

/**
 * @brief Журнальная проводка
 *
 * Содержимое меняется только в DRAFT. После POSTED проводку можно
 * лишь сторнировать встречной записью.
 */
struct JournalEntry {
    std::string id;
    std::string companyId;
    std::string journalNumber;      ///< JE-<fiscalYear>-<000001>
    Date date;
    int fiscalYear = 0;
    int fiscalPeriod = 0;           ///< 1..12

    JournalType type = JournalType::STANDARD;
    JournalSource source = JournalSource::MANUAL;
    std::optional<std::string> sourceId;
    std::optional<std::string> sourceReference;
    std::string description;

    std::vector<JournalLine> lines;
    double totalDebits = 0.0;
    double totalCredits = 0.0;
    double functionalTotalDebits = 0.0;
    double functionalTotalCredits = 0.0;
    bool isBalanced = false;

    std::string currency;
    double exchangeRate = 1.0;

    JournalStatus status = JournalStatus::DRAFT;
    bool isReversal = false;
    std::optional<std::string> reversalOfId;
    std::optional<std::string> reversedById;
    std::optional<Date> autoReverseDate;

    std::vector<ApprovalRecord> approvalHistory;

    std::string createdBy;
    Timestamp createdAt;
    std::string updatedBy;
    Timestamp updatedAt;
    std::optional<std::string> postedBy;
    std::optional<Timestamp> postedAt;

    /**
     * @brief Затрагивает ли проводка счёт
     */
    bool touchesAccount(const std::string& accountId) const {
        for (const auto& line : lines) {
            if (line.accountId == accountId) {
                return true;
            }
        }
        return false;
    }
};

} // namespace ledger::domain
