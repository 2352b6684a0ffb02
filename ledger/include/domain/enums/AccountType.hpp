#pragma once

#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Класс счёта в плане счетов
 */
enum class AccountType {
    ASSET,      ///< Активы
    LIABILITY,  ///< Обязательства
    EQUITY,     ///< Капитал
    REVENUE,    ///< Доходы
    EXPENSE     ///< Расходы
};

/**
 * @brief Нормальная сторона сальдо
 */
enum class NormalBalance {
    DEBIT,
    CREDIT
};

/**
 * @brief Преобразовать в строку
 */
inline std::string toString(AccountType type) {
    switch (type) {
        case AccountType::ASSET:     return "asset";
        case AccountType::LIABILITY: return "liability";
        case AccountType::EQUITY:    return "equity";
        case AccountType::REVENUE:   return "revenue";
        case AccountType::EXPENSE:   return "expense";
    }
    return "unknown";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline AccountType accountTypeFromString(const std::string& str) {
    if (str == "asset")     return AccountType::ASSET;
    if (str == "liability") return AccountType::LIABILITY;
    if (str == "equity")    return AccountType::EQUITY;
    if (str == "revenue")   return AccountType::REVENUE;
    if (str == "expense")   return AccountType::EXPENSE;
    throw std::invalid_argument("Unknown AccountType: " + str);
}

/**
 * @brief Нормальная сторона для класса счёта
 *
 * Активы и расходы растут по дебету, остальные по кредиту.
 */
inline NormalBalance normalBalanceOf(AccountType type) {
    switch (type) {
        case AccountType::ASSET:
        case AccountType::EXPENSE:
            return NormalBalance::DEBIT;
        case AccountType::LIABILITY:
        case AccountType::EQUITY:
        case AccountType::REVENUE:
            return NormalBalance::CREDIT;
    }
    return NormalBalance::DEBIT;
}

inline bool isDebitNormal(AccountType type) {
    return normalBalanceOf(type) == NormalBalance::DEBIT;
}

/**
 * @brief Вклад оборота в сальдо с учётом нормальной стороны
 *
 * Для дебетовых счетов debit - credit, для кредитовых credit - debit.
 */
inline double signedContribution(AccountType type, double debit, double credit) {
    return isDebitNormal(type) ? debit - credit : credit - debit;
}

} // namespace ledger::domain
