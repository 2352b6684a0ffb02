#pragma once

#include <string>

namespace ledger::settings {

/**
 * @brief Настройки учётного ядра компании
 */
class ILedgerSettings {
public:
    virtual ~ILedgerSettings() = default;

    /// Месяц начала финансового года, 1..12
    virtual int getFiscalYearStartMonth() const = 0;

    /// Функциональная валюта (ISO 4217)
    virtual std::string getFunctionalCurrency() const = 0;

    /// Длина кода счёта в цифрах
    virtual int getAccountCodeLength() const = 0;

    /// Допуск сравнения дебета и кредита
    virtual double getBalanceTolerance() const = 0;

    /// Хранилище: "memory" или "postgres"
    virtual std::string getStorage() const = 0;
};

} // namespace ledger::settings
