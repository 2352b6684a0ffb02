// include/settings/LedgerSettings.hpp
#pragma once

#include "settings/ILedgerSettings.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

namespace ledger::settings {

/**
 * @brief Настройки учётного ядра
 *
 * Значения по умолчанию: финансовый год с июля, валюта UGX,
 * шестизначные коды счетов, допуск 0.01, хранилище в памяти.
 *
 * Источники:
 * - переменные окружения LEDGER_* (конструктор по умолчанию);
 * - JSON-документ (fromJson / fromFile), отсутствующие ключи берутся по умолчанию.
 */
class LedgerSettings : public ILedgerSettings {
public:
    /**
     * @brief Прочитать настройки из переменных окружения
     * @throws std::invalid_argument при недопустимых значениях
     */
    LedgerSettings()
        : LedgerSettings(
              std::stoi(getEnvOrDefault("LEDGER_FISCAL_YEAR_START_MONTH", "7")),
              getEnvOrDefault("LEDGER_FUNCTIONAL_CURRENCY", "UGX"),
              std::stoi(getEnvOrDefault("LEDGER_ACCOUNT_CODE_LENGTH", "6")),
              std::stod(getEnvOrDefault("LEDGER_BALANCE_TOLERANCE", "0.01")),
              getEnvOrDefault("LEDGER_STORAGE", "memory")) {}

    /**
     * @throws std::invalid_argument при недопустимых значениях
     */
    LedgerSettings(int fiscalYearStartMonth,
                   std::string functionalCurrency,
                   int accountCodeLength = 6,
                   double balanceTolerance = 0.01,
                   std::string storage = "memory")
        : fiscalYearStartMonth_(fiscalYearStartMonth)
        , functionalCurrency_(std::move(functionalCurrency))
        , accountCodeLength_(accountCodeLength)
        , balanceTolerance_(balanceTolerance)
        , storage_(std::move(storage))
    {
        validate();
    }

    static LedgerSettings fromJson(const nlohmann::json& j) {
        return LedgerSettings(
            j.value("fiscalYearStartMonth", 7),
            j.value("functionalCurrency", std::string("UGX")),
            j.value("accountCodeLength", 6),
            j.value("balanceTolerance", 0.01),
            j.value("storage", std::string("memory")));
    }

    /**
     * @throws std::runtime_error если файл не открывается
     */
    static LedgerSettings fromFile(const std::string& path) {
        std::ifstream in(path);
        if (!in.is_open()) {
            throw std::runtime_error("Cannot open settings file: " + path);
        }
        return fromJson(nlohmann::json::parse(in));
    }

    int getFiscalYearStartMonth() const override { return fiscalYearStartMonth_; }
    std::string getFunctionalCurrency() const override { return functionalCurrency_; }
    int getAccountCodeLength() const override { return accountCodeLength_; }
    double getBalanceTolerance() const override { return balanceTolerance_; }
    std::string getStorage() const override { return storage_; }

private:
    int fiscalYearStartMonth_;
    std::string functionalCurrency_;
    int accountCodeLength_;
    double balanceTolerance_;
    std::string storage_;

    void validate() const {
        if (fiscalYearStartMonth_ < 1 || fiscalYearStartMonth_ > 12) {
            throw std::invalid_argument(
                "Fiscal year start month must be 1..12, got " + std::to_string(fiscalYearStartMonth_));
        }
        if (functionalCurrency_.size() != 3) {
            throw std::invalid_argument("Functional currency must be a 3-letter code: " + functionalCurrency_);
        }
        if (accountCodeLength_ < 1) {
            throw std::invalid_argument("Account code length must be positive");
        }
        if (balanceTolerance_ <= 0.0) {
            throw std::invalid_argument("Balance tolerance must be positive");
        }
        if (storage_ != "memory" && storage_ != "postgres") {
            throw std::invalid_argument("Unknown storage: " + storage_);
        }
    }

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace ledger::settings
