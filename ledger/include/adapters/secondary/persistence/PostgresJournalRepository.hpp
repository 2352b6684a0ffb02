// include/adapters/secondary/persistence/PostgresJournalRepository.hpp
#pragma once

#include "ports/output/IJournalRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>

namespace ledger::adapters::secondary {

/**
 * @brief PostgreSQL реализация репозитория журнальных проводок
 *
 * Таблицы:
 * - journals: строки и история согласования хранятся как JSONB,
 *   (company_id, journal_number) UNIQUE
 * - journal_sequences: (company_id, fiscal_year) PRIMARY KEY, last_value
 *
 * Номер выдаётся одним INSERT ... ON CONFLICT DO UPDATE ... RETURNING,
 * поэтому конкурентные создатели не получают одинаковых номеров.
 */
class PostgresJournalRepository : public ports::output::IJournalRepository {
public:
    explicit PostgresJournalRepository(std::shared_ptr<settings::DbSettings> settings);

    void save(const domain::JournalEntry& entry) override;
    void update(const domain::JournalEntry& entry) override;

    std::optional<domain::JournalEntry> findById(
        const std::string& companyId,
        const std::string& id
    ) override;

    std::optional<domain::JournalEntry> findByNumber(
        const std::string& companyId,
        const std::string& journalNumber
    ) override;

    std::vector<domain::JournalEntry> findAll(
        const std::string& companyId,
        const domain::JournalFilter& filter
    ) override;

    int nextJournalSequence(const std::string& companyId, int fiscalYear) override;

private:
    std::shared_ptr<settings::DbSettings> settings_;

    void initSchema();
    static domain::JournalEntry rowToEntry(const pqxx::row& row);
};

} // namespace ledger::adapters::secondary
