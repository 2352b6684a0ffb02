#pragma once

#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Статус журнальной проводки
 *
 * Переходы:
 *   DRAFT -> APPROVED -> POSTED -> REVERSED
 *   DRAFT / APPROVED -> VOID
 */
enum class JournalStatus {
    DRAFT,      ///< Черновик, можно редактировать
    APPROVED,   ///< Утверждена, ждёт проведения
    POSTED,     ///< Проведена, влияет на сальдо
    REVERSED,   ///< Сторнирована встречной проводкой
    VOID        ///< Аннулирована без влияния на сальдо
};

inline std::string toString(JournalStatus status) {
    switch (status) {
        case JournalStatus::DRAFT:    return "draft";
        case JournalStatus::APPROVED: return "approved";
        case JournalStatus::POSTED:   return "posted";
        case JournalStatus::REVERSED: return "reversed";
        case JournalStatus::VOID:     return "void";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline JournalStatus journalStatusFromString(const std::string& str) {
    if (str == "draft")    return JournalStatus::DRAFT;
    if (str == "approved") return JournalStatus::APPROVED;
    if (str == "posted")   return JournalStatus::POSTED;
    if (str == "reversed") return JournalStatus::REVERSED;
    if (str == "void")     return JournalStatus::VOID;
    throw std::invalid_argument("Unknown JournalStatus: " + str);
}

/**
 * @brief Можно ли менять содержимое проводки
 */
inline bool isEditable(JournalStatus status) {
    return status == JournalStatus::DRAFT;
}

/**
 * @brief Можно ли провести проводку
 */
inline bool canPost(JournalStatus status) {
    return status == JournalStatus::DRAFT || status == JournalStatus::APPROVED;
}

/**
 * @brief Можно ли аннулировать проводку
 */
inline bool canVoid(JournalStatus status) {
    return status == JournalStatus::DRAFT || status == JournalStatus::APPROVED;
}

/**
 * @brief Влияет ли проводка на сальдо счетов
 *
 * Сторнированная проводка была проведена, её эффект снимает встречная.
 */
inline bool affectsBalances(JournalStatus status) {
    return status == JournalStatus::POSTED || status == JournalStatus::REVERSED;
}

} // namespace ledger::domain
