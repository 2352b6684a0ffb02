#pragma once

#include "domain/JournalEntry.hpp"
#include "domain/JournalRequest.hpp"
#include <string>
#include <optional>
#include <vector>

namespace ledger::ports::output {

/**
 * @brief Интерфейс репозитория журнальных проводок
 */
class IJournalRepository {
public:
    virtual ~IJournalRepository() = default;

    /**
     * @brief Сохранить новую проводку
     *
     * @throws domain::ValidationError если номер уже занят в компании
     */
    virtual void save(const domain::JournalEntry& entry) = 0;

    /**
     * @brief Перезаписать существующую проводку
     *
     * @throws domain::NotFoundError если проводка не найдена
     */
    virtual void update(const domain::JournalEntry& entry) = 0;

    virtual std::optional<domain::JournalEntry> findById(
        const std::string& companyId,
        const std::string& id
    ) = 0;

    virtual std::optional<domain::JournalEntry> findByNumber(
        const std::string& companyId,
        const std::string& journalNumber
    ) = 0;

    /**
     * @brief Выборка проводок, отсортированная по дате (новые первыми)
     */
    virtual std::vector<domain::JournalEntry> findAll(
        const std::string& companyId,
        const domain::JournalFilter& filter
    ) = 0;

    /**
     * @brief Выдать следующий порядковый номер для (компания, финансовый год)
     *
     * Атомарный счётчик: два вызова никогда не получают одно значение.
     * Первый вызов для года возвращает 1.
     */
    virtual int nextJournalSequence(const std::string& companyId, int fiscalYear) = 0;
};

} // namespace ledger::ports::output
