// include/adapters/secondary/persistence/PostgresAccountRepository.hpp
#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>

namespace ledger::adapters::secondary {

/**
 * @brief PostgreSQL реализация репозитория плана счетов
 *
 * Таблица: accounts
 * - id VARCHAR(64) PRIMARY KEY
 * - company_id + code UNIQUE
 * - ancestor_ids, tags JSONB
 * - balance_debit, balance_credit, balance, functional_balance DOUBLE PRECISION
 *
 * Сальдо меняется только атомарными инкрементами
 * (SET balance = balance + $n) в одной транзакции на проводку.
 */
class PostgresAccountRepository : public ports::output::IAccountRepository {
public:
    explicit PostgresAccountRepository(std::shared_ptr<settings::DbSettings> settings);

    void save(const domain::Account& account) override;
    void saveBatch(const std::vector<domain::Account>& accounts) override;
    void update(const domain::Account& account) override;

    std::optional<domain::Account> findById(
        const std::string& companyId,
        const std::string& id
    ) override;

    std::optional<domain::Account> findByCode(
        const std::string& companyId,
        const std::string& code
    ) override;

    std::vector<domain::Account> findAll(
        const std::string& companyId,
        const domain::AccountFilter& filter
    ) override;

    void applyBalanceDeltas(
        const std::string& companyId,
        const std::vector<domain::BalanceDelta>& deltas
    ) override;

    void replaceBalances(
        const std::string& companyId,
        const std::vector<domain::BalanceDelta>& totals
    ) override;

private:
    std::shared_ptr<settings::DbSettings> settings_;

    void initSchema();
    static void insertAccount(pqxx::work& txn, const domain::Account& account);
    static bool accountExists(pqxx::work& txn, const std::string& companyId, const std::string& id);
    static domain::Account rowToAccount(const pqxx::row& row);
};

} // namespace ledger::adapters::secondary
