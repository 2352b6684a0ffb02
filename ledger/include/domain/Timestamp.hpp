#pragma once

#include <string>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <cstdint>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Временная метка в ISO 8601 формате (UTC)
 *
 * Используется для аудиторских полей: createdAt, updatedAt, postedAt.
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    /**
     * @brief Создать Timestamp с текущим временем
     */
    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Создать Timestamp из ISO 8601 строки
     * @param isoString Строка формата "2025-12-16T10:30:00Z" или "2025-12-16 10:30:00"
     * @throws std::invalid_argument если строка не распознана
     */
    static Timestamp fromString(const std::string& isoString) {
        std::string normalized = isoString;
        if (normalized.size() > 10 && normalized[10] == ' ') {
            normalized[10] = 'T';
        }

        std::tm tm = {};
        std::istringstream ss(normalized);
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");

        if (ss.fail()) {
            throw std::invalid_argument("Invalid timestamp: " + isoString);
        }

        return Timestamp(std::chrono::system_clock::from_time_t(toUtcTime(tm)));
    }

    /**
     * @brief Преобразовать в ISO 8601 строку
     */
    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = *std::gmtime(&time_t_val);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    /**
     * @brief Получить Unix timestamp (секунды с 1970)
     */
    int64_t toUnixSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            value.time_since_epoch()
        ).count();
    }

    /**
     * @brief Создать из Unix timestamp
     */
    static Timestamp fromUnixSeconds(int64_t seconds) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::seconds(seconds)
        ));
    }

    // Операторы сравнения
    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }

private:
    // Аналог timegm() без зависимости от часового пояса процесса
    static std::time_t toUtcTime(const std::tm& tm) {
        int year = tm.tm_year + 1900;
        int month = tm.tm_mon + 1;
        if (month <= 2) {
            year -= 1;
            month += 12;
        }
        // Дни от 1970-01-01 по формуле для пролептического григорианского календаря
        int64_t days = 365LL * year + year / 4 - year / 100 + year / 400
                     + (153 * (month - 3) + 2) / 5 + tm.tm_mday - 719469;
        return static_cast<std::time_t>(
            days * 86400 + tm.tm_hour * 3600 + tm.tm_min * 60 + tm.tm_sec);
    }
};

} // namespace ledger::domain
