#pragma once

#include "domain/JournalEntry.hpp"
#include "domain/JournalRequest.hpp"
#include <string>
#include <vector>
#include <optional>

namespace ledger::ports::input {

/**
 * @brief Интерфейс сервиса журнальных проводок
 *
 * Жизненный цикл:
 *   DRAFT -> APPROVED -> POSTED -> REVERSED
 *   DRAFT | APPROVED -> VOID
 */
class IJournalService {
public:
    virtual ~IJournalService() = default;

    /**
     * @brief Создать черновик проводки
     *
     * @throws domain::ValidationError нет строк, отрицательные суммы, неверный курс
     * @throws domain::NotFoundError счёт строки не найден
     * @throws domain::InvariantError счёт не проводимый
     * @throws domain::ImbalanceError дебет не равен кредиту
     */
    virtual domain::JournalEntry create(
        const std::string& companyId,
        const std::string& userId,
        const domain::JournalEntryCreateRequest& request
    ) = 0;

    /**
     * @brief Изменить черновик
     *
     * @throws domain::ConflictError проводка не в DRAFT
     */
    virtual domain::JournalEntry update(
        const std::string& companyId,
        const std::string& journalId,
        const std::string& userId,
        const domain::JournalEntryUpdateRequest& request
    ) = 0;

    /**
     * @brief Утвердить черновик
     *
     * @throws domain::ConflictError проводка не в DRAFT
     */
    virtual domain::JournalEntry approve(
        const std::string& companyId,
        const std::string& journalId,
        const std::string& userId,
        const std::string& comments
    ) = 0;

    /**
     * @brief Провести проводку: применить строки к сальдо счетов
     *
     * @throws domain::ConflictError проводка не в DRAFT или APPROVED либо является сторно
     * @throws domain::InvariantError счёт строки больше не принимает оборотов
     */
    virtual domain::JournalEntry post(
        const std::string& companyId,
        const std::string& journalId,
        const std::string& userId
    ) = 0;

    /**
     * @brief Сторнировать проведённую проводку
     *
     * Создаёт и сразу проводит встречную проводку с переставленными
     * дебетом и кредитом, датированную reversalDate.
     *
     * @return Сторнирующая проводка
     * @throws domain::ConflictError проводка не POSTED или уже сторнирована
     */
    virtual domain::JournalEntry reverse(
        const std::string& companyId,
        const std::string& journalId,
        const std::string& userId,
        const domain::Date& reversalDate,
        const std::optional<std::string>& description = std::nullopt
    ) = 0;

    /**
     * @brief Аннулировать черновик или утверждённую проводку
     *
     * @throws domain::ConflictError проводка POSTED, REVERSED или уже VOID
     * @throws domain::ValidationError пустая причина
     */
    virtual domain::JournalEntry voidEntry(
        const std::string& companyId,
        const std::string& journalId,
        const std::string& userId,
        const std::string& reason
    ) = 0;

    virtual std::optional<domain::JournalEntry> getById(
        const std::string& companyId,
        const std::string& journalId
    ) = 0;

    virtual std::optional<domain::JournalEntry> getByNumber(
        const std::string& companyId,
        const std::string& journalNumber
    ) = 0;

    /**
     * @brief Выборка проводок, новые первыми
     */
    virtual std::vector<domain::JournalEntry> list(
        const std::string& companyId,
        const domain::JournalFilter& filter
    ) = 0;
};

} // namespace ledger::ports::input
