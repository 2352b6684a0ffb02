#pragma once

#include "enums/AccountType.hpp"
#include "enums/AccountLevel.hpp"
#include "enums/AccountStatus.hpp"
#include "Timestamp.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledger::domain {

/**
 * @brief Снимок сальдо счёта
 *
 * Материализованный кэш всех проведённых строк по счёту.
 * Меняется только через PostingEngine.
 */
struct AccountBalance {
    double debit = 0.0;              ///< Сумма дебетовых оборотов
    double credit = 0.0;             ///< Сумма кредитовых оборотов
    double balance = 0.0;            ///< Сальдо с учётом нормальной стороны
    double functionalBalance = 0.0;  ///< Сальдо в функциональной валюте
    Timestamp updatedAt;

    bool isZero() const {
        return balance == 0.0;
    }
};

/**
 * @brief Счёт плана счетов компании
 */
struct Account {
    std::string id;                     ///< ID документа
    std::string companyId;              ///< Компания-владелец
    std::string code;                   ///< Код фиксированной длины ("110001")
    std::string name;
    std::string description;
    AccountType type = AccountType::ASSET;
    std::string subType;                ///< Уточнение класса ("current_asset")
    AccountLevel level = AccountLevel::TYPE;

    std::optional<std::string> parentId;
    std::vector<std::string> ancestorIds;  ///< От корня до родителя
    std::string path;                      ///< Коды через "/" ("100000/110000/110001")

    bool isHeader = false;     ///< Заголовочный счёт, проводки запрещены
    bool isPostable = true;
    bool isSystem = false;     ///< Защищён от архивации
    std::optional<std::string> systemKey;
    std::string currency;

    AccountBalance balance;
    AccountStatus status = AccountStatus::ACTIVE;
    std::vector<std::string> tags;

    std::string createdBy;
    Timestamp createdAt;
    std::string updatedBy;
    Timestamp updatedAt;

    Account() = default;

    Account(
        const std::string& id,
        const std::string& companyId,
        const std::string& code,
        const std::string& name,
        AccountType type,
        const std::string& currency
    ) : id(id), companyId(companyId), code(code), name(name), type(type),
        path(code), currency(currency),
        createdAt(Timestamp::now()), updatedAt(Timestamp::now()) {}

    NormalBalance normalBalance() const {
        return normalBalanceOf(type);
    }

    bool isActive() const {
        return status == AccountStatus::ACTIVE;
    }

    bool isArchived() const {
        return status == AccountStatus::ARCHIVED;
    }

    /**
     * @brief Принимает ли счёт обороты (проводимый, не группирующий, не в архиве)
     */
    bool acceptsPostings() const {
        return isPostable && !isHeader && !isArchived();
    }

    /**
     * @brief Является ли счёт потомком указанного
     */
    bool isDescendantOf(const std::string& accountId) const {
        for (const auto& ancestor : ancestorIds) {
            if (ancestor == accountId) {
                return true;
            }
        }
        return false;
    }
};

/**
 * @brief Узел дерева плана счетов
 */
struct AccountTreeNode {
    Account account;
    std::vector<AccountTreeNode> children;
};

} // namespace ledger::domain
