#pragma once

#include "enums/JournalStatus.hpp"
#include "enums/JournalType.hpp"
#include "Date.hpp"
#include "JournalLine.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledger::domain {

/**
 * @brief Строка во входных данных проводки
 */
struct JournalLineRequest {
    std::string accountId;
    std::string description;
    double debit = 0.0;
    double credit = 0.0;
    LineDimensions dimensions;

    JournalLineRequest() = default;

    JournalLineRequest(const std::string& accountId, double debit, double credit,
                       const std::string& description = "")
        : accountId(accountId), description(description), debit(debit), credit(credit) {}
};

/**
 * @brief Данные для создания проводки
 */
struct JournalEntryCreateRequest {
    Date date;
    std::string description;
    JournalType type = JournalType::STANDARD;
    JournalSource source = JournalSource::MANUAL;
    std::optional<std::string> sourceId;
    std::optional<std::string> sourceReference;
    std::optional<std::string> currency;   ///< По умолчанию функциональная валюта
    std::optional<double> exchangeRate;    ///< По умолчанию 1
    std::vector<JournalLineRequest> lines;
    std::optional<Date> autoReverseDate;
};

/**
 * @brief Частичное обновление черновика
 */
struct JournalEntryUpdateRequest {
    std::optional<Date> date;
    std::optional<std::string> description;
    std::optional<std::string> sourceReference;
    std::optional<std::vector<JournalLineRequest>> lines;
};

/**
 * @brief Фильтр выборки проводок
 */
struct JournalFilter {
    std::optional<int> fiscalYear;
    std::optional<int> fiscalPeriod;
    std::vector<JournalType> types;
    std::vector<JournalSource> sources;
    std::vector<JournalStatus> statuses;
    std::optional<Date> dateFrom;
    std::optional<Date> dateTo;
    std::string search;          ///< По номеру, описанию и ссылке
};

} // namespace ledger::domain
