#pragma once

#include <LedgerException.hpp>
#include <string>

namespace ledger::domain {

/**
 * @brief Некорректный или дублирующийся ввод (повтор кода счёта, пустая проводка)
 */
class ValidationError : public LedgerException {
public:
    explicit ValidationError(const std::string& message)
        : LedgerException(message) {}
};

/**
 * @brief Ссылка на отсутствующий счёт или проводку
 */
class NotFoundError : public LedgerException {
public:
    explicit NotFoundError(const std::string& message)
        : LedgerException(message) {}
};

/**
 * @brief Нарушение инварианта учёта (класс счёта, непроводимый счёт)
 */
class InvariantError : public LedgerException {
public:
    explicit InvariantError(const std::string& message)
        : LedgerException(message) {}
};

/**
 * @brief Дебет не равен кредиту
 */
class ImbalanceError : public InvariantError {
public:
    ImbalanceError(double totalDebits, double totalCredits)
        : InvariantError("Journal entry is not balanced: debits " + std::to_string(totalDebits) +
                         " != credits " + std::to_string(totalCredits))
        , totalDebits_(totalDebits)
        , totalCredits_(totalCredits) {}

    double totalDebits() const { return totalDebits_; }
    double totalCredits() const { return totalCredits_; }

private:
    double totalDebits_;
    double totalCredits_;
};

/**
 * @brief Операция недопустима в текущем состоянии сущности
 */
class ConflictError : public LedgerException {
public:
    explicit ConflictError(const std::string& message)
        : LedgerException(message) {}
};

/**
 * @brief Попытка изменить защищённые поля системного счёта
 */
class ForbiddenError : public LedgerException {
public:
    explicit ForbiddenError(const std::string& message)
        : LedgerException(message) {}
};

} // namespace ledger::domain
