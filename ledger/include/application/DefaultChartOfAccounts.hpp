#pragma once

#include "domain/enums/AccountType.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledger::application {

/**
 * @brief Шаблон счёта стандартного плана счетов
 */
struct DefaultAccountTemplate {
    std::string code;
    std::string name;
    domain::AccountType type;
    std::string subType;
    std::optional<std::string> parentCode;  ///< Родитель объявлен раньше в списке
    bool isHeader = false;
    std::optional<std::string> systemKey;   ///< Есть у всех системных счетов
    std::optional<std::string> currency;    ///< По умолчанию функциональная валюта
};

/**
 * @brief Стандартный план счетов: заголовочные группы и системные счета
 */
const std::vector<DefaultAccountTemplate>& defaultChartOfAccounts();

} // namespace ledger::application
