#pragma once

#include "enums/AccountType.hpp"
#include "enums/AccountStatus.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledger::domain {

/**
 * @brief Данные для создания счёта
 */
struct AccountCreateRequest {
    std::string code;
    std::string name;
    std::string description;
    AccountType type = AccountType::ASSET;
    std::string subType;
    std::optional<std::string> parentId;
    bool isHeader = false;
    std::optional<bool> isPostable;     ///< По умолчанию !isHeader
    std::optional<std::string> currency; ///< По умолчанию функциональная валюта
    std::vector<std::string> tags;
};

/**
 * @brief Частичное обновление счёта
 *
 * Незаполненные поля не меняются. parentId задаётся отдельно:
 * changeParent = true и пустой parentId переносят счёт в корень.
 */
struct AccountUpdateRequest {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<std::string> subType;
    std::optional<bool> isHeader;
    std::optional<bool> isPostable;
    std::optional<AccountStatus> status;
    std::optional<std::vector<std::string>> tags;

    bool changeParent = false;
    std::optional<std::string> parentId;
};

/**
 * @brief Фильтр выборки счетов
 */
struct AccountFilter {
    std::vector<AccountType> types;
    std::vector<AccountStatus> statuses;
    std::optional<bool> isHeader;
    std::optional<bool> isPostable;
    std::optional<std::string> parentId;
    std::optional<std::string> currency;
    std::string search;                 ///< По коду, имени и описанию
};

} // namespace ledger::domain
