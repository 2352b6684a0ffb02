#pragma once

#include <stdexcept>
#include <string>

/**
 * @file LedgerException.hpp
 * @brief Базовое исключение учётного ядра
 */

 /**
  * @brief Исключение, выбрасываемое при нарушении правил учёта
  *
  * Все доменные ошибки (валидация, отсутствие сущности, конфликт статусов)
  * наследуются от него, чтобы вызывающий код мог перехватить их одним catch.
  */
class LedgerException : public std::runtime_error {
public:
    explicit LedgerException(const std::string& message)
        : std::runtime_error(message) {}
};
