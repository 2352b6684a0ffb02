#pragma once

#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Статус счёта
 */
enum class AccountStatus {
    ACTIVE,     ///< Участвует в проводках и отчётах
    INACTIVE,   ///< Скрыт из дерева, но не архивирован
    ARCHIVED    ///< Мягко удалён
};

inline std::string toString(AccountStatus status) {
    switch (status) {
        case AccountStatus::ACTIVE:   return "active";
        case AccountStatus::INACTIVE: return "inactive";
        case AccountStatus::ARCHIVED: return "archived";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline AccountStatus accountStatusFromString(const std::string& str) {
    if (str == "active")   return AccountStatus::ACTIVE;
    if (str == "inactive") return AccountStatus::INACTIVE;
    if (str == "archived") return AccountStatus::ARCHIVED;
    throw std::invalid_argument("Unknown AccountStatus: " + str);
}

} // namespace ledger::domain
