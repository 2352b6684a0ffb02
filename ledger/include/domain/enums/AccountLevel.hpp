#pragma once

#include <algorithm>
#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Уровень счёта в дереве
 *
 * Корень дерева имеет уровень TYPE, глубже DETAIL уровень не растёт.
 */
enum class AccountLevel {
    TYPE = 1,
    SUBTYPE = 2,
    GROUP = 3,
    DETAIL = 4
};

inline std::string toString(AccountLevel level) {
    switch (level) {
        case AccountLevel::TYPE:    return "type";
        case AccountLevel::SUBTYPE: return "subtype";
        case AccountLevel::GROUP:   return "group";
        case AccountLevel::DETAIL:  return "detail";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline AccountLevel accountLevelFromString(const std::string& str) {
    if (str == "type")    return AccountLevel::TYPE;
    if (str == "subtype") return AccountLevel::SUBTYPE;
    if (str == "group")   return AccountLevel::GROUP;
    if (str == "detail")  return AccountLevel::DETAIL;
    throw std::invalid_argument("Unknown AccountLevel: " + str);
}

/**
 * @brief Уровень дочернего счёта: min(parent + 1, DETAIL)
 */
inline AccountLevel childLevelOf(AccountLevel parent) {
    int next = std::min(static_cast<int>(parent) + 1, static_cast<int>(AccountLevel::DETAIL));
    return static_cast<AccountLevel>(next);
}

} // namespace ledger::domain
