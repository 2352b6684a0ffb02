#pragma once

#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Вид проводки
 */
enum class JournalType {
    STANDARD,
    ADJUSTING,
    REVERSING,
    CLOSING,
    OPENING,
    RECURRING
};

/**
 * @brief Источник проводки
 */
enum class JournalSource {
    MANUAL,
    INVOICE,
    BILL,
    PAYMENT,
    PAYROLL,
    SYSTEM
};

inline std::string toString(JournalType type) {
    switch (type) {
        case JournalType::STANDARD:  return "standard";
        case JournalType::ADJUSTING: return "adjusting";
        case JournalType::REVERSING: return "reversing";
        case JournalType::CLOSING:   return "closing";
        case JournalType::OPENING:   return "opening";
        case JournalType::RECURRING: return "recurring";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline JournalType journalTypeFromString(const std::string& str) {
    if (str == "standard")  return JournalType::STANDARD;
    if (str == "adjusting") return JournalType::ADJUSTING;
    if (str == "reversing") return JournalType::REVERSING;
    if (str == "closing")   return JournalType::CLOSING;
    if (str == "opening")   return JournalType::OPENING;
    if (str == "recurring") return JournalType::RECURRING;
    throw std::invalid_argument("Unknown JournalType: " + str);
}

inline std::string toString(JournalSource source) {
    switch (source) {
        case JournalSource::MANUAL:  return "manual";
        case JournalSource::INVOICE: return "invoice";
        case JournalSource::BILL:    return "bill";
        case JournalSource::PAYMENT: return "payment";
        case JournalSource::PAYROLL: return "payroll";
        case JournalSource::SYSTEM:  return "system";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline JournalSource journalSourceFromString(const std::string& str) {
    if (str == "manual")  return JournalSource::MANUAL;
    if (str == "invoice") return JournalSource::INVOICE;
    if (str == "bill")    return JournalSource::BILL;
    if (str == "payment") return JournalSource::PAYMENT;
    if (str == "payroll") return JournalSource::PAYROLL;
    if (str == "system")  return JournalSource::SYSTEM;
    throw std::invalid_argument("Unknown JournalSource: " + str);
}

} // namespace ledger::domain
