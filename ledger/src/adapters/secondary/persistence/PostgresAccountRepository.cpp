#include "adapters/secondary/persistence/PostgresAccountRepository.hpp"

#include "domain/Filters.hpp"
#include "domain/LedgerErrors.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace ledger::adapters::secondary {

namespace {

const char* SELECT_COLUMNS =
    "SELECT id, company_id, code, name, description, type, sub_type, level, "
    "parent_id, ancestor_ids::text AS ancestor_ids, path, is_header, is_postable, is_system, "
    "system_key, currency, status, tags::text AS tags, "
    "balance_debit, balance_credit, balance, functional_balance, "
    "balance_updated_at::text AS balance_updated_at, "
    "created_by, created_at::text AS created_at, updated_by, updated_at::text AS updated_at "
    "FROM accounts ";

std::optional<std::string> optionalText(const pqxx::field& field) {
    if (field.is_null()) {
        return std::nullopt;
    }
    return field.as<std::string>();
}

} // namespace

PostgresAccountRepository::PostgresAccountRepository(std::shared_ptr<settings::DbSettings> settings)
    : settings_(std::move(settings))
{
    initSchema();
}

void PostgresAccountRepository::save(const domain::Account& account) {
    try {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);
        insertAccount(txn, account);
        txn.commit();
        std::cout << "[PostgresAccountRepository] Saved account " << account.code << std::endl;

    } catch (const pqxx::unique_violation&) {
        throw domain::ValidationError("Account code already exists: " + account.code);
    } catch (const std::exception& e) {
        std::cerr << "[PostgresAccountRepository] save error: " << e.what() << std::endl;
        throw;
    }
}

void PostgresAccountRepository::saveBatch(const std::vector<domain::Account>& accounts) {
    try {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);
        for (const auto& account : accounts) {
            insertAccount(txn, account);
        }
        txn.commit();
        std::cout << "[PostgresAccountRepository] Saved batch of " << accounts.size() << " accounts" << std::endl;

    } catch (const pqxx::unique_violation& e) {
        throw domain::ValidationError(std::string("Account code already exists: ") + e.what());
    } catch (const std::exception& e) {
        std::cerr << "[PostgresAccountRepository] saveBatch error: " << e.what() << std::endl;
        throw;
    }
}

void PostgresAccountRepository::update(const domain::Account& account) {
    pqxx::result result;
    bool exists = false;
    try {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);

        // Сальдо здесь не пишется: только PostingEngine
        result = txn.exec_params(
            "UPDATE accounts SET "
            "name = $3, description = $4, sub_type = $5, level = $6, parent_id = $7, "
            "ancestor_ids = $8::jsonb, path = $9, is_header = $10, is_postable = $11, "
            "status = $12, tags = $13::jsonb, updated_by = $14, updated_at = $15 "
            "WHERE id = $1 AND company_id = $2 AND ($16::boolean OR balance = 0) "
            "RETURNING id",
            account.id,
            account.companyId,
            account.name,
            account.description,
            account.subType,
            static_cast<int>(account.level),
            account.parentId,
            nlohmann::json(account.ancestorIds).dump(),
            account.path,
            account.isHeader,
            account.isPostable,
            domain::toString(account.status),
            nlohmann::json(account.tags).dump(),
            account.updatedBy,
            account.updatedAt.toString(),
            account.acceptsPostings()
        );

        if (!result.empty()) {
            txn.commit();
        } else {
            exists = accountExists(txn, account.companyId, account.id);
        }

    } catch (const std::exception& e) {
        std::cerr << "[PostgresAccountRepository] update error: " << e.what() << std::endl;
        throw;
    }

    if (result.empty() && exists) {
        throw domain::ConflictError("Account " + account.code +
                                    " has a non-zero balance and must keep accepting postings");
    }
    if (result.empty()) {
        throw domain::NotFoundError("Account not found: " + account.id);
    }
}

std::optional<domain::Account> PostgresAccountRepository::findById(
    const std::string& companyId,
    const std::string& id
) {
    try {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            std::string(SELECT_COLUMNS) + "WHERE company_id = $1 AND id = $2",
            companyId,
            id
        );

        if (result.empty()) {
            return std::nullopt;
        }
        return rowToAccount(result[0]);

    } catch (const std::exception& e) {
        std::cerr << "[PostgresAccountRepository] findById error: " << e.what() << std::endl;
        throw;
    }
}

std::optional<domain::Account> PostgresAccountRepository::findByCode(
    const std::string& companyId,
    const std::string& code
) {
    try {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            std::string(SELECT_COLUMNS) + "WHERE company_id = $1 AND code = $2",
            companyId,
            code
        );

        if (result.empty()) {
            return std::nullopt;
        }
        return rowToAccount(result[0]);

    } catch (const std::exception& e) {
        std::cerr << "[PostgresAccountRepository] findByCode error: " << e.what() << std::endl;
        throw;
    }
}

std::vector<domain::Account> PostgresAccountRepository::findAll(
    const std::string& companyId,
    const domain::AccountFilter& filter
) {
    std::vector<domain::Account> accounts;
    try {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            std::string(SELECT_COLUMNS) + "WHERE company_id = $1 ORDER BY code ASC",
            companyId
        );

        for (const auto& row : result) {
            auto account = rowToAccount(row);
            if (domain::matchesFilter(account, filter)) {
                accounts.push_back(std::move(account));
            }
        }

    } catch (const std::exception& e) {
        std::cerr << "[PostgresAccountRepository] findAll error: " << e.what() << std::endl;
        throw;
    }
    return accounts;
}

void PostgresAccountRepository::applyBalanceDeltas(
    const std::string& companyId,
    const std::vector<domain::BalanceDelta>& deltas
) {
    std::string missing;
    std::string rejected;
    try {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);

        // Атомарные инкременты, все счета в одной транзакции
        for (const auto& delta : deltas) {
            bool movesBalance = delta.debit != 0.0 || delta.credit != 0.0 ||
                                delta.balance != 0.0 || delta.functionalBalance != 0.0;
            auto result = txn.exec_params(
                "UPDATE accounts "
                "SET balance_debit = balance_debit + $3, "
                "    balance_credit = balance_credit + $4, "
                "    balance = balance + $5, "
                "    functional_balance = functional_balance + $6, "
                "    balance_updated_at = NOW() "
                "WHERE id = $1 AND company_id = $2 "
                "  AND (NOT $7::boolean OR (is_postable AND NOT is_header AND status <> 'archived')) "
                "RETURNING id",
                delta.accountId,
                companyId,
                delta.debit,
                delta.credit,
                delta.balance,
                delta.functionalBalance,
                movesBalance
            );

            if (result.empty()) {
                // Транзакция откатится при выходе из области видимости
                if (accountExists(txn, companyId, delta.accountId)) {
                    rejected = delta.accountId;
                } else {
                    missing = delta.accountId;
                }
                break;
            }
        }

        if (missing.empty() && rejected.empty()) {
            txn.commit();
            std::cout << "[PostgresAccountRepository] Applied " << deltas.size()
                      << " balance deltas" << std::endl;
        }

    } catch (const std::exception& e) {
        std::cerr << "[PostgresAccountRepository] applyBalanceDeltas error: " << e.what() << std::endl;
        throw;
    }

    if (!missing.empty()) {
        throw domain::NotFoundError("Account not found: " + missing);
    }
    if (!rejected.empty()) {
        throw domain::InvariantError("Account " + rejected + " is not postable");
    }
}

void PostgresAccountRepository::replaceBalances(
    const std::string& companyId,
    const std::vector<domain::BalanceDelta>& totals
) {
    std::string missing;
    try {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);

        txn.exec_params(
            "UPDATE accounts "
            "SET balance_debit = 0, balance_credit = 0, balance = 0, functional_balance = 0, "
            "    balance_updated_at = NOW() "
            "WHERE company_id = $1",
            companyId
        );

        for (const auto& total : totals) {
            auto result = txn.exec_params(
                "UPDATE accounts "
                "SET balance_debit = $3, balance_credit = $4, balance = $5, functional_balance = $6 "
                "WHERE id = $1 AND company_id = $2 "
                "RETURNING id",
                total.accountId,
                companyId,
                total.debit,
                total.credit,
                total.balance,
                total.functionalBalance
            );

            if (result.empty()) {
                missing = total.accountId;
                break;
            }
        }

        if (missing.empty()) {
            txn.commit();
            std::cout << "[PostgresAccountRepository] Replaced balances for company " << companyId << std::endl;
        }

    } catch (const std::exception& e) {
        std::cerr << "[PostgresAccountRepository] replaceBalances error: " << e.what() << std::endl;
        throw;
    }

    if (!missing.empty()) {
        throw domain::NotFoundError("Account not found: " + missing);
    }
}

void PostgresAccountRepository::initSchema() {
    try {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS accounts (
                id VARCHAR(64) PRIMARY KEY,
                company_id VARCHAR(64) NOT NULL,
                code VARCHAR(16) NOT NULL,
                name VARCHAR(255) NOT NULL,
                description TEXT NOT NULL DEFAULT '',
                type VARCHAR(16) NOT NULL,
                sub_type VARCHAR(64) NOT NULL DEFAULT '',
                level INTEGER NOT NULL,
                parent_id VARCHAR(64),
                ancestor_ids JSONB NOT NULL DEFAULT '[]',
                path TEXT NOT NULL,
                is_header BOOLEAN NOT NULL DEFAULT FALSE,
                is_postable BOOLEAN NOT NULL DEFAULT TRUE,
                is_system BOOLEAN NOT NULL DEFAULT FALSE,
                system_key VARCHAR(64),
                currency VARCHAR(3) NOT NULL,
                status VARCHAR(16) NOT NULL DEFAULT 'active',
                tags JSONB NOT NULL DEFAULT '[]',
                balance_debit DOUBLE PRECISION NOT NULL DEFAULT 0,
                balance_credit DOUBLE PRECISION NOT NULL DEFAULT 0,
                balance DOUBLE PRECISION NOT NULL DEFAULT 0,
                functional_balance DOUBLE PRECISION NOT NULL DEFAULT 0,
                balance_updated_at TIMESTAMP NOT NULL DEFAULT NOW(),
                created_by VARCHAR(64) NOT NULL,
                created_at TIMESTAMP NOT NULL DEFAULT NOW(),
                updated_by VARCHAR(64) NOT NULL,
                updated_at TIMESTAMP NOT NULL DEFAULT NOW(),
                UNIQUE (company_id, code)
            )
        )");

        txn.exec(R"(
            CREATE INDEX IF NOT EXISTS idx_accounts_company_parent
            ON accounts (company_id, parent_id)
        )");

        txn.commit();
        std::cout << "[PostgresAccountRepository] Schema initialized" << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "[PostgresAccountRepository] initSchema error: " << e.what() << std::endl;
        throw;
    }
}

bool PostgresAccountRepository::accountExists(
    pqxx::work& txn,
    const std::string& companyId,
    const std::string& id
) {
    auto result = txn.exec_params(
        "SELECT 1 FROM accounts WHERE id = $1 AND company_id = $2",
        id,
        companyId
    );
    return !result.empty();
}

void PostgresAccountRepository::insertAccount(pqxx::work& txn, const domain::Account& account) {
    txn.exec_params(
        "INSERT INTO accounts (id, company_id, code, name, description, type, sub_type, level, "
        "parent_id, ancestor_ids, path, is_header, is_postable, is_system, system_key, currency, "
        "status, tags, balance_debit, balance_credit, balance, functional_balance, "
        "created_by, created_at, updated_by, updated_at) "
        "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10::jsonb, $11, $12, $13, $14, $15, $16, "
        "$17, $18::jsonb, $19, $20, $21, $22, $23, $24, $25, $26)",
        account.id,
        account.companyId,
        account.code,
        account.name,
        account.description,
        domain::toString(account.type),
        account.subType,
        static_cast<int>(account.level),
        account.parentId,
        nlohmann::json(account.ancestorIds).dump(),
        account.path,
        account.isHeader,
        account.isPostable,
        account.isSystem,
        account.systemKey,
        account.currency,
        domain::toString(account.status),
        nlohmann::json(account.tags).dump(),
        account.balance.debit,
        account.balance.credit,
        account.balance.balance,
        account.balance.functionalBalance,
        account.createdBy,
        account.createdAt.toString(),
        account.updatedBy,
        account.updatedAt.toString()
    );
}

domain::Account PostgresAccountRepository::rowToAccount(const pqxx::row& row) {
    domain::Account account;
    account.id = row["id"].as<std::string>();
    account.companyId = row["company_id"].as<std::string>();
    account.code = row["code"].as<std::string>();
    account.name = row["name"].as<std::string>();
    account.description = row["description"].as<std::string>();
    account.type = domain::accountTypeFromString(row["type"].as<std::string>());
    account.subType = row["sub_type"].as<std::string>();
    account.level = static_cast<domain::AccountLevel>(row["level"].as<int>());
    account.parentId = optionalText(row["parent_id"]);
    account.ancestorIds = nlohmann::json::parse(row["ancestor_ids"].as<std::string>())
                              .get<std::vector<std::string>>();
    account.path = row["path"].as<std::string>();
    account.isHeader = row["is_header"].as<bool>();
    account.isPostable = row["is_postable"].as<bool>();
    account.isSystem = row["is_system"].as<bool>();
    account.systemKey = optionalText(row["system_key"]);
    account.currency = row["currency"].as<std::string>();
    account.status = domain::accountStatusFromString(row["status"].as<std::string>());
    account.tags = nlohmann::json::parse(row["tags"].as<std::string>()).get<std::vector<std::string>>();

    account.balance.debit = row["balance_debit"].as<double>();
    account.balance.credit = row["balance_credit"].as<double>();
    account.balance.balance = row["balance"].as<double>();
    account.balance.functionalBalance = row["functional_balance"].as<double>();
    account.balance.updatedAt = domain::Timestamp::fromString(row["balance_updated_at"].as<std::string>());

    account.createdBy = row["created_by"].as<std::string>();
    account.createdAt = domain::Timestamp::fromString(row["created_at"].as<std::string>());
    account.updatedBy = row["updated_by"].as<std::string>();
    account.updatedAt = domain::Timestamp::fromString(row["updated_at"].as<std::string>());
    return account;
}

} // namespace ledger::adapters::secondary
