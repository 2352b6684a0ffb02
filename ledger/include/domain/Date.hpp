#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <string>

namespace ledger::domain {

/**
 * @brief Календарная дата без времени и часового пояса
 *
 * Дата проводки, дата отчёта. Сравнивается лексикографически
 * по (year, month, day).
 */
struct Date {
    int year = 1970;
    int month = 1;   ///< 1..12
    int day = 1;     ///< 1..daysInMonth

    Date() = default;

    /**
     * @throws std::invalid_argument если дата не существует
     */
    Date(int y, int m, int d) : year(y), month(m), day(d) {
        if (m < 1 || m > 12) {
            throw std::invalid_argument("Invalid month: " + std::to_string(m));
        }
        if (d < 1 || d > daysInMonth(y, m)) {
            throw std::invalid_argument("Invalid day: " + std::to_string(y) + "-" +
                                        std::to_string(m) + "-" + std::to_string(d));
        }
    }

    static bool isLeapYear(int y) {
        return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    }

    static int daysInMonth(int y, int m) {
        static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (m == 2 && isLeapYear(y)) {
            return 29;
        }
        return days[m - 1];
    }

    /**
     * @brief Последний день того же месяца
     */
    Date endOfMonth() const {
        return Date(year, month, daysInMonth(year, month));
    }

    /**
     * @brief Сегодняшняя дата (UTC)
     */
    static Date today() {
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm = *std::gmtime(&now);
        return Date(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
    }

    /**
     * @brief Разобрать строку "YYYY-MM-DD"
     * @throws std::invalid_argument если строка не распознана
     */
    static Date fromString(const std::string& str) {
        if (str.size() < 10 || str[4] != '-' || str[7] != '-') {
            throw std::invalid_argument("Invalid date: " + str);
        }
        for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
            if (str[i] < '0' || str[i] > '9') {
                throw std::invalid_argument("Invalid date: " + str);
            }
        }
        // Допускаем хвост времени "2024-08-15T00:00:00Z" и "2024-08-15 00:00:00"
        if (str.size() > 10 && str[10] != 'T' && str[10] != ' ') {
            throw std::invalid_argument("Invalid date: " + str);
        }
        return Date(std::stoi(str.substr(0, 4)),
                    std::stoi(str.substr(5, 2)),
                    std::stoi(str.substr(8, 2)));
    }

    /**
     * @brief Преобразовать в "YYYY-MM-DD"
     */
    std::string toString() const {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
        return std::string(buf);
    }

    int toOrdinal() const {
        return year * 10000 + month * 100 + day;
    }

    bool operator==(const Date& other) const { return toOrdinal() == other.toOrdinal(); }
    bool operator!=(const Date& other) const { return toOrdinal() != other.toOrdinal(); }
    bool operator<(const Date& other) const { return toOrdinal() < other.toOrdinal(); }
    bool operator>(const Date& other) const { return toOrdinal() > other.toOrdinal(); }
    bool operator<=(const Date& other) const { return toOrdinal() <= other.toOrdinal(); }
    bool operator>=(const Date& other) const { return toOrdinal() >= other.toOrdinal(); }
};

} // namespace ledger::domain
