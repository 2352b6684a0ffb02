#pragma once

#include "Account.hpp"
#include "AccountRequest.hpp"
#include "JournalEntry.hpp"
#include "JournalRequest.hpp"
#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace ledger::domain {

/**
 * @brief Регистронезависимый поиск подстроки
 */
inline bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) {
        return true;
    }
    auto it = std::search(
        haystack.begin(), haystack.end(),
        needle.begin(), needle.end(),
        [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) ==
                   std::tolower(static_cast<unsigned char>(b));
        });
    return it != haystack.end();
}

template <typename T>
bool inListOrEmpty(const std::vector<T>& list, const T& value) {
    return list.empty() || std::find(list.begin(), list.end(), value) != list.end();
}

inline bool matchesFilter(const Account& account, const AccountFilter& filter) {
    if (!inListOrEmpty(filter.types, account.type)) return false;
    if (!inListOrEmpty(filter.statuses, account.status)) return false;
    if (filter.isHeader && *filter.isHeader != account.isHeader) return false;
    if (filter.isPostable && *filter.isPostable != account.isPostable) return false;
    if (filter.parentId && account.parentId != filter.parentId) return false;
    if (filter.currency && *filter.currency != account.currency) return false;

    if (!filter.search.empty()) {
        return containsIgnoreCase(account.code, filter.search) ||
               containsIgnoreCase(account.name, filter.search) ||
               containsIgnoreCase(account.description, filter.search);
    }
    return true;
}

inline bool matchesFilter(const JournalEntry& entry, const JournalFilter& filter) {
    if (filter.fiscalYear && *filter.fiscalYear != entry.fiscalYear) return false;
    if (filter.fiscalPeriod && *filter.fiscalPeriod != entry.fiscalPeriod) return false;
    if (!inListOrEmpty(filter.types, entry.type)) return false;
    if (!inListOrEmpty(filter.sources, entry.source)) return false;
    if (!inListOrEmpty(filter.statuses, entry.status)) return false;
    if (filter.dateFrom && entry.date < *filter.dateFrom) return false;
    if (filter.dateTo && entry.date > *filter.dateTo) return false;

    if (!filter.search.empty()) {
        return containsIgnoreCase(entry.journalNumber, filter.search) ||
               containsIgnoreCase(entry.description, filter.search) ||
               (entry.sourceReference && containsIgnoreCase(*entry.sourceReference, filter.search));
    }
    return true;
}

/**
 * @brief Порядок выдачи проводок: дата по убыванию, затем номер по убыванию
 */
inline bool newerFirst(const JournalEntry& a, const JournalEntry& b) {
    if (a.date != b.date) {
        return a.date > b.date;
    }
    return a.journalNumber > b.journalNumber;
}

} // namespace ledger::domain
