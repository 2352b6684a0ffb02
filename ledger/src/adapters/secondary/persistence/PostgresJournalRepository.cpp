#include "adapters/secondary/persistence/PostgresJournalRepository.hpp"

#include "domain/Filters.hpp"
#include "domain/JsonSerialization.hpp"
#include "domain/LedgerErrors.hpp"
#include <iostream>

namespace ledger::adapters::secondary {

namespace {

const char* SELECT_COLUMNS =
    "SELECT id, company_id, journal_number, date::text AS date, fiscal_year, fiscal_period, "
    "type, source, source_id, source_reference, description, lines::text AS lines, "
    "total_debits, total_credits, functional_total_debits, functional_total_credits, is_balanced, "
    "currency, exchange_rate, status, is_reversal, reversal_of_id, reversed_by_id, "
    "auto_reverse_date::text AS auto_reverse_date, approval_history::text AS approval_history, "
    "created_by, created_at::text AS created_at, updated_by, updated_at::text AS updated_at, "
    "posted_by, posted_at::text AS posted_at "
    "FROM journals ";

std::optional<std::string> optionalText(const pqxx::field& field) {
    if (field.is_null()) {
        return std::nullopt;
    }
    return field.as<std::string>();
}

std::optional<std::string> optionalDate(const std::optional<domain::Date>& date) {
    if (!date) {
        return std::nullopt;
    }
    return date->toString();
}

std::optional<std::string> optionalTimestamp(const std::optional<domain::Timestamp>& ts) {
    if (!ts) {
        return std::nullopt;
    }
    return ts->toString();
}

} // namespace

PostgresJournalRepository::PostgresJournalRepository(std::shared_ptr<settings::DbSettings> settings)
    : settings_(std::move(settings))
{
    initSchema();
}

void PostgresJournalRepository::save(const domain::JournalEntry& entry) {
    try {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);

        txn.exec_params(
            "INSERT INTO journals (id, company_id, journal_number, date, fiscal_year, fiscal_period, "
            "type, source, source_id, source_reference, description, lines, "
            "total_debits, total_credits, functional_total_debits, functional_total_credits, is_balanced, "
            "currency, exchange_rate, status, is_reversal, reversal_of_id, reversed_by_id, "
            "auto_reverse_date, approval_history, created_by, created_at, updated_by, updated_at, "
            "posted_by, posted_at) "
            "VALUES ($1, $2, $3, $4::date, $5, $6, $7, $8, $9, $10, $11, $12::jsonb, "
            "$13, $14, $15, $16, $17, $18, $19, $20, $21, $22, $23, "
            "$24::date, $25::jsonb, $26, $27, $28, $29, $30, $31)",
            entry.id,
            entry.companyId,
            entry.journalNumber,
            entry.date.toString(),
            entry.fiscalYear,
            entry.fiscalPeriod,
            domain::toString(entry.type),
            domain::toString(entry.source),
            entry.sourceId,
            entry.sourceReference,
            entry.description,
            nlohmann::json(entry.lines).dump(),
            entry.totalDebits,
            entry.totalCredits,
            entry.functionalTotalDebits,
            entry.functionalTotalCredits,
            entry.isBalanced,
            entry.currency,
            entry.exchangeRate,
            domain::toString(entry.status),
            entry.isReversal,
            entry.reversalOfId,
            entry.reversedById,
            optionalDate(entry.autoReverseDate),
            nlohmann::json(entry.approvalHistory).dump(),
            entry.createdBy,
            entry.createdAt.toString(),
            entry.updatedBy,
            entry.updatedAt.toString(),
            entry.postedBy,
            optionalTimestamp(entry.postedAt)
        );

        txn.commit();
        std::cout << "[PostgresJournalRepository] Saved " << entry.journalNumber << std::endl;

    } catch (const pqxx::unique_violation&) {
        throw domain::ValidationError("Journal number already exists: " + entry.journalNumber);
    } catch (const std::exception& e) {
        std::cerr << "[PostgresJournalRepository] save error: " << e.what() << std::endl;
        throw;
    }
}

void PostgresJournalRepository::update(const domain::JournalEntry& entry) {
    pqxx::result result;
    try {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);

        result = txn.exec_params(
            "UPDATE journals SET "
            "date = $3::date, fiscal_year = $4, fiscal_period = $5, source_reference = $6, "
            "description = $7, lines = $8::jsonb, total_debits = $9, total_credits = $10, "
            "functional_total_debits = $11, functional_total_credits = $12, is_balanced = $13, "
            "status = $14, is_reversal = $15, reversal_of_id = $16, reversed_by_id = $17, "
            "approval_history = $18::jsonb, updated_by = $19, updated_at = $20, "
            "posted_by = $21, posted_at = $22 "
            "WHERE id = $1 AND company_id = $2 "
            "RETURNING id",
            entry.id,
            entry.companyId,
            entry.date.toString(),
            entry.fiscalYear,
            entry.fiscalPeriod,
            entry.sourceReference,
            entry.description,
            nlohmann::json(entry.lines).dump(),
            entry.totalDebits,
            entry.totalCredits,
            entry.functionalTotalDebits,
            entry.functionalTotalCredits,
            entry.isBalanced,
            domain::toString(entry.status),
            entry.isReversal,
            entry.reversalOfId,
            entry.reversedById,
            nlohmann::json(entry.approvalHistory).dump(),
            entry.updatedBy,
            entry.updatedAt.toString(),
            entry.postedBy,
            optionalTimestamp(entry.postedAt)
        );

        if (!result.empty()) {
            txn.commit();
        }

    } catch (const std::exception& e) {
        std::cerr << "[PostgresJournalRepository] update error: " << e.what() << std::endl;
        throw;
    }

    if (result.empty()) {
        throw domain::NotFoundError("Journal entry not found: " + entry.id);
    }
}

std::optional<domain::JournalEntry> PostgresJournalRepository::findById(
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
        return rowToEntry(result[0]);

    } catch (const std::exception& e) {
        std::cerr << "[PostgresJournalRepository] findById error: " << e.what() << std::endl;
        throw;
    }
}

std::optional<domain::JournalEntry> PostgresJournalRepository::findByNumber(
    const std::string& companyId,
    const std::string& journalNumber
) {
    try {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            std::string(SELECT_COLUMNS) + "WHERE company_id = $1 AND journal_number = $2",
            companyId,
            journalNumber
        );

        if (result.empty()) {
            return std::nullopt;
        }
        return rowToEntry(result[0]);

    } catch (const std::exception& e) {
        std::cerr << "[PostgresJournalRepository] findByNumber error: " << e.what() << std::endl;
        throw;
    }
}

std::vector<domain::JournalEntry> PostgresJournalRepository::findAll(
    const std::string& companyId,
    const domain::JournalFilter& filter
) {
    std::vector<domain::JournalEntry> entries;
    try {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);

        // Год и период фильтруются в SQL, остальное в domain::matchesFilter
        std::optional<int> fiscalYear = filter.fiscalYear;
        std::optional<int> fiscalPeriod = filter.fiscalPeriod;
        auto result = txn.exec_params(
            std::string(SELECT_COLUMNS) +
            "WHERE company_id = $1 "
            "AND ($2::int IS NULL OR fiscal_year = $2) "
            "AND ($3::int IS NULL OR fiscal_period = $3) "
            "ORDER BY date DESC, journal_number DESC",
            companyId,
            fiscalYear,
            fiscalPeriod
        );

        for (const auto& row : result) {
            auto entry = rowToEntry(row);
            if (domain::matchesFilter(entry, filter)) {
                entries.push_back(std::move(entry));
            }
        }

    } catch (const std::exception& e) {
        std::cerr << "[PostgresJournalRepository] findAll error: " << e.what() << std::endl;
        throw;
    }
    return entries;
}

int PostgresJournalRepository::nextJournalSequence(const std::string& companyId, int fiscalYear) {
    try {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            "INSERT INTO journal_sequences (company_id, fiscal_year, last_value) "
            "VALUES ($1, $2, 1) "
            "ON CONFLICT (company_id, fiscal_year) DO UPDATE "
            "SET last_value = journal_sequences.last_value + 1 "
            "RETURNING last_value",
            companyId,
            fiscalYear
        );

        txn.commit();
        return result[0]["last_value"].as<int>();

    } catch (const std::exception& e) {
        std::cerr << "[PostgresJournalRepository] nextJournalSequence error: " << e.what() << std::endl;
        throw;
    }
}

void PostgresJournalRepository::initSchema() {
    try {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS journals (
                id VARCHAR(64) PRIMARY KEY,
                company_id VARCHAR(64) NOT NULL,
                journal_number VARCHAR(32) NOT NULL,
                date DATE NOT NULL,
                fiscal_year INTEGER NOT NULL,
                fiscal_period INTEGER NOT NULL,
                type VARCHAR(16) NOT NULL,
                source VARCHAR(16) NOT NULL,
                source_id VARCHAR(64),
                source_reference VARCHAR(255),
                description TEXT NOT NULL DEFAULT '',
                lines JSONB NOT NULL,
                total_debits DOUBLE PRECISION NOT NULL,
                total_credits DOUBLE PRECISION NOT NULL,
                functional_total_debits DOUBLE PRECISION NOT NULL,
                functional_total_credits DOUBLE PRECISION NOT NULL,
                is_balanced BOOLEAN NOT NULL,
                currency VARCHAR(3) NOT NULL,
                exchange_rate DOUBLE PRECISION NOT NULL DEFAULT 1,
                status VARCHAR(16) NOT NULL,
                is_reversal BOOLEAN NOT NULL DEFAULT FALSE,
                reversal_of_id VARCHAR(64),
                reversed_by_id VARCHAR(64),
                auto_reverse_date DATE,
                approval_history JSONB NOT NULL DEFAULT '[]',
                created_by VARCHAR(64) NOT NULL,
                created_at TIMESTAMP NOT NULL DEFAULT NOW(),
                updated_by VARCHAR(64) NOT NULL,
                updated_at TIMESTAMP NOT NULL DEFAULT NOW(),
                posted_by VARCHAR(64),
                posted_at TIMESTAMP,
                UNIQUE (company_id, journal_number)
            )
        )");

        txn.exec(R"(
            CREATE INDEX IF NOT EXISTS idx_journals_company_period
            ON journals (company_id, fiscal_year, fiscal_period)
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS journal_sequences (
                company_id VARCHAR(64) NOT NULL,
                fiscal_year INTEGER NOT NULL,
                last_value INTEGER NOT NULL,
                PRIMARY KEY (company_id, fiscal_year)
            )
        )");

        txn.commit();
        std::cout << "[PostgresJournalRepository] Schema initialized" << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "[PostgresJournalRepository] initSchema error: " << e.what() << std::endl;
        throw;
    }
}

domain::JournalEntry PostgresJournalRepository::rowToEntry(const pqxx::row& row) {
    domain::JournalEntry entry;
    entry.id = row["id"].as<std::string>();
    entry.companyId = row["company_id"].as<std::string>();
    entry.journalNumber = row["journal_number"].as<std::string>();
    entry.date = domain::Date::fromString(row["date"].as<std::string>());
    entry.fiscalYear = row["fiscal_year"].as<int>();
    entry.fiscalPeriod = row["fiscal_period"].as<int>();
    entry.type = domain::journalTypeFromString(row["type"].as<std::string>());
    entry.source = domain::journalSourceFromString(row["source"].as<std::string>());
    entry.sourceId = optionalText(row["source_id"]);
    entry.sourceReference = optionalText(row["source_reference"]);
    entry.description = row["description"].as<std::string>();
    entry.lines = nlohmann::json::parse(row["lines"].as<std::string>())
                      .get<std::vector<domain::JournalLine>>();
    entry.totalDebits = row["total_debits"].as<double>();
    entry.totalCredits = row["total_credits"].as<double>();
    entry.functionalTotalDebits = row["functional_total_debits"].as<double>();
    entry.functionalTotalCredits = row["functional_total_credits"].as<double>();
    entry.isBalanced = row["is_balanced"].as<bool>();
    entry.currency = row["currency"].as<std::string>();
    entry.exchangeRate = row["exchange_rate"].as<double>();
    entry.status = domain::journalStatusFromString(row["status"].as<std::string>());
    entry.isReversal = row["is_reversal"].as<bool>();
    entry.reversalOfId = optionalText(row["reversal_of_id"]);
    entry.reversedById = optionalText(row["reversed_by_id"]);
    if (auto autoReverse = optionalText(row["auto_reverse_date"])) {
        entry.autoReverseDate = domain::Date::fromString(*autoReverse);
    }
    entry.approvalHistory = nlohmann::json::parse(row["approval_history"].as<std::string>())
                                .get<std::vector<domain::ApprovalRecord>>();
    entry.createdBy = row["created_by"].as<std::string>();
    entry.createdAt = domain::Timestamp::fromString(row["created_at"].as<std::string>());
    entry.updatedBy = row["updated_by"].as<std::string>();
    entry.updatedAt = domain::Timestamp::fromString(row["updated_at"].as<std::string>());
    entry.postedBy = optionalText(row["posted_by"]);
    if (auto postedAt = optionalText(row["posted_at"])) {
        entry.postedAt = domain::Timestamp::fromString(*postedAt);
    }
    return entry;
}

} // namespace ledger::adapters::secondary
