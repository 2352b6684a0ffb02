#pragma once

#include "ports/input/IJournalService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IJournalRepository.hpp"
#include "ports/output/IEventBus.hpp"
#include "settings/ILedgerSettings.hpp"
#include "application/PostingEngine.hpp"
#include "domain/FiscalCalendar.hpp"
#include "domain/LedgerErrors.hpp"
#include "domain/events/JournalPostedEvent.hpp"
#include "domain/events/JournalReversedEvent.hpp"
#include "domain/events/JournalVoidedEvent.hpp"
#include "utils/UuidGenerator.hpp"
#include <KeyedMutex.hpp>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <memory>

namespace ledger::application {

/**
 * @brief Сервис журнальных проводок
 *
 * Реализует IJournalService. Переходы одной проводки сериализуются
 * через KeyedMutex по её ID; разные проводки не блокируют друг друга,
 * а общие счета защищает атомарность applyBalanceDeltas().
 *
 * События публикуются только после записи нового статуса.
 */
class JournalService : public ports::input::IJournalService {
public:
    JournalService(
        std::shared_ptr<ports::output::IJournalRepository> journalRepository,
        std::shared_ptr<ports::output::IAccountRepository> accountRepository,
        std::shared_ptr<PostingEngine> postingEngine,
        std::shared_ptr<ports::output::IEventBus> eventBus,
        std::shared_ptr<settings::ILedgerSettings> settings
    ) : journalRepository_(std::move(journalRepository))
      , accountRepository_(std::move(accountRepository))
      , postingEngine_(std::move(postingEngine))
      , eventBus_(std::move(eventBus))
      , settings_(std::move(settings))
      , calendar_(settings_->getFiscalYearStartMonth())
    {}

    domain::JournalEntry create(
        const std::string& companyId,
        const std::string& userId,
        const domain::JournalEntryCreateRequest& request
    ) override {
        domain::JournalEntry entry;
        entry.id = utils::UuidGenerator::generate();
        entry.companyId = companyId;
        entry.type = request.type;
        entry.source = request.source;
        entry.sourceId = request.sourceId;
        entry.sourceReference = request.sourceReference;
        entry.description = request.description;
        entry.autoReverseDate = request.autoReverseDate;
        entry.createdBy = userId;
        entry.updatedBy = userId;

        entry.currency = request.currency.value_or(settings_->getFunctionalCurrency());
        entry.exchangeRate = request.exchangeRate.value_or(1.0);
        if (entry.exchangeRate <= 0.0) {
            throw domain::ValidationError("Exchange rate must be positive");
        }
        if (entry.currency == settings_->getFunctionalCurrency()) {
            entry.exchangeRate = 1.0;
        }

        setDate(entry, request.date);
        entry.lines = buildLines(companyId, request.lines, entry.currency, entry.exchangeRate);
        computeTotals(entry);

        persistNew(entry);
        std::cout << "[JournalService] Created " << entry.journalNumber << " (draft, "
                  << entry.lines.size() << " lines, " << entry.totalDebits << ")" << std::endl;
        return entry;
    }

    domain::JournalEntry update(
        const std::string& companyId,
        const std::string& journalId,
        const std::string& userId,
        const domain::JournalEntryUpdateRequest& request
    ) override {
        auto guard = transitions_.lock(journalId);
        auto entry = requireEntry(companyId, journalId);

        if (!domain::isEditable(entry.status)) {
            throw domain::ConflictError("Only draft journal entries can be updated: " +
                                        entry.journalNumber + " is " + domain::toString(entry.status));
        }

        // Номер проводки сохраняется, даже если дата уходит в другой финансовый год
        if (request.date) setDate(entry, *request.date);
        if (request.description) entry.description = *request.description;
        if (request.sourceReference) entry.sourceReference = *request.sourceReference;
        if (request.lines) {
            entry.lines = buildLines(companyId, *request.lines, entry.currency, entry.exchangeRate);
            computeTotals(entry);
        }

        entry.updatedBy = userId;
        entry.updatedAt = domain::Timestamp::now();
        journalRepository_->update(entry);
        return entry;
    }

    domain::JournalEntry approve(
        const std::string& companyId,
        const std::string& journalId,
        const std::string& userId,
        const std::string& comments
    ) override {
        auto guard = transitions_.lock(journalId);
        auto entry = requireEntry(companyId, journalId);

        if (entry.status != domain::JournalStatus::DRAFT) {
            throw domain::ConflictError("Only draft journal entries can be approved: " +
                                        entry.journalNumber + " is " + domain::toString(entry.status));
        }

        auto now = domain::Timestamp::now();
        entry.status = domain::JournalStatus::APPROVED;
        entry.approvalHistory.push_back({"approved", userId, now, comments});
        entry.updatedBy = userId;
        entry.updatedAt = now;
        journalRepository_->update(entry);

        std::cout << "[JournalService] Approved " << entry.journalNumber << std::endl;
        return entry;
    }

    domain::JournalEntry post(
        const std::string& companyId,
        const std::string& journalId,
        const std::string& userId
    ) override {
        auto guard = transitions_.lock(journalId);
        auto entry = requireEntry(companyId, journalId);

        if (!domain::canPost(entry.status)) {
            throw domain::ConflictError("Only draft or approved journal entries can be posted: " +
                                        entry.journalNumber + " is " + domain::toString(entry.status));
        }
        if (entry.isReversal) {
            throw domain::ConflictError("Reversal entries are posted only by reversing the original: " +
                                        entry.journalNumber);
        }

        auto deltas = postLocked(entry, userId);
        publishPosted(entry, deltas);
        return entry;
    }

    domain::JournalEntry reverse(
        const std::string& companyId,
        const std::string& journalId,
        const std::string& userId,
        const domain::Date& reversalDate,
        const std::optional<std::string>& description
    ) override {
        auto guard = transitions_.lock(journalId);
        auto original = requireEntry(companyId, journalId);

        if (original.reversedById) {
            throw domain::ConflictError("Journal " + original.journalNumber + " has already been reversed");
        }
        if (original.status != domain::JournalStatus::POSTED) {
            throw domain::ConflictError("Only posted journal entries can be reversed: " +
                                        original.journalNumber + " is " + domain::toString(original.status));
        }

        auto reversal = buildReversal(original, userId, reversalDate, description);
        persistNew(reversal);
        std::vector<domain::BalanceDelta> deltas;
        try {
            deltas = postLocked(reversal, userId);
        } catch (const std::exception& e) {
            std::cerr << "[JournalService] Failed to post reversal " << reversal.journalNumber
                      << " of " << original.journalNumber << ": " << e.what() << std::endl;
            // Приращения уже откатил postLocked
            rollbackReversal(reversal, userId, false);
            throw;
        }

        original.status = domain::JournalStatus::REVERSED;
        original.reversedById = reversal.id;
        original.updatedBy = userId;
        original.updatedAt = domain::Timestamp::now();
        try {
            journalRepository_->update(original);
        } catch (const std::exception& e) {
            std::cerr << "[JournalService] Failed to mark " << original.journalNumber
                      << " reversed, rolling back " << reversal.journalNumber << ": " << e.what() << std::endl;
            rollbackReversal(reversal, userId, true);
            throw;
        }

        std::cout << "[JournalService] Reversed " << original.journalNumber << " with "
                  << reversal.journalNumber << " dated " << reversal.date.toString() << std::endl;

        publishPosted(reversal, deltas);

        domain::JournalReversedEvent event;
        event.eventId = utils::UuidGenerator::generate();
        event.companyId = companyId;
        event.originalId = original.id;
        event.originalNumber = original.journalNumber;
        event.reversalId = reversal.id;
        event.reversalNumber = reversal.journalNumber;
        event.reversalDate = reversal.date;
        event.reversedBy = userId;
        eventBus_->publish(event);

        return reversal;
    }

    domain::JournalEntry voidEntry(
        const std::string& companyId,
        const std::string& journalId,
        const std::string& userId,
        const std::string& reason
    ) override {
        auto guard = transitions_.lock(journalId);
        auto entry = requireEntry(companyId, journalId);

        if (entry.status == domain::JournalStatus::POSTED) {
            throw domain::ConflictError("Posted journals must be reversed, not voided: " + entry.journalNumber);
        }
        if (entry.status == domain::JournalStatus::VOID) {
            throw domain::ConflictError("Journal " + entry.journalNumber + " is already void");
        }
        if (!domain::canVoid(entry.status)) {
            throw domain::ConflictError("Journal " + entry.journalNumber + " cannot be voided from " +
                                        domain::toString(entry.status));
        }
        if (reason.find_first_not_of(" \t\r\n") == std::string::npos) {
            throw domain::ValidationError("Void reason is required");
        }

        auto now = domain::Timestamp::now();
        entry.status = domain::JournalStatus::VOID;
        entry.approvalHistory.push_back({"rejected", userId, now, "Voided: " + reason});
        entry.updatedBy = userId;
        entry.updatedAt = now;
        journalRepository_->update(entry);

        std::cout << "[JournalService] Voided " << entry.journalNumber << ": " << reason << std::endl;

        domain::JournalVoidedEvent event;
        event.eventId = utils::UuidGenerator::generate();
        event.companyId = companyId;
        event.journalId = entry.id;
        event.journalNumber = entry.journalNumber;
        event.reason = reason;
        event.voidedBy = userId;
        eventBus_->publish(event);

        return entry;
    }

    std::optional<domain::JournalEntry> getById(
        const std::string& companyId,
        const std::string& journalId
    ) override {
        return journalRepository_->findById(companyId, journalId);
    }

    std::optional<domain::JournalEntry> getByNumber(
        const std::string& companyId,
        const std::string& journalNumber
    ) override {
        return journalRepository_->findByNumber(companyId, journalNumber);
    }

    std::vector<domain::JournalEntry> list(
        const std::string& companyId,
        const domain::JournalFilter& filter
    ) override {
        return journalRepository_->findAll(companyId, filter);
    }

    /**
     * @brief Номер проводки: JE-<fiscalYear>-<6 цифр>
     */
    static std::string formatJournalNumber(int fiscalYear, int sequence) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "JE-%d-%06d", fiscalYear, sequence);
        return std::string(buf);
    }

private:
    std::shared_ptr<ports::output::IJournalRepository> journalRepository_;
    std::shared_ptr<ports::output::IAccountRepository> accountRepository_;
    std::shared_ptr<PostingEngine> postingEngine_;
    std::shared_ptr<ports::output::IEventBus> eventBus_;
    std::shared_ptr<settings::ILedgerSettings> settings_;
    domain::FiscalCalendar calendar_;
    KeyedMutex transitions_;

    domain::JournalEntry requireEntry(const std::string& companyId, const std::string& journalId) {
        auto entry = journalRepository_->findById(companyId, journalId);
        if (!entry) {
            throw domain::NotFoundError("Journal " + journalId + " not found");
        }
        return *entry;
    }

    void setDate(domain::JournalEntry& entry, const domain::Date& date) const {
        auto period = calendar_.periodOf(date);
        entry.date = date;
        entry.fiscalYear = period.fiscalYear;
        entry.fiscalPeriod = period.period;
    }

    /**
     * @brief Проверить строки и снять снимок кода и имени счёта
     */
    std::vector<domain::JournalLine> buildLines(
        const std::string& companyId,
        const std::vector<domain::JournalLineRequest>& requests,
        const std::string& currency,
        double exchangeRate
    ) {
        if (requests.empty()) {
            throw domain::ValidationError("Journal entry must have at least one line");
        }

        bool functional = currency == settings_->getFunctionalCurrency();
        std::vector<domain::JournalLine> lines;
        lines.reserve(requests.size());

        for (const auto& request : requests) {
            if (request.debit < 0.0 || request.credit < 0.0) {
                throw domain::ValidationError("Line amounts must be non-negative (account " +
                                              request.accountId + ")");
            }

            auto account = accountRepository_->findById(companyId, request.accountId);
            if (!account) {
                throw domain::NotFoundError("Account " + request.accountId + " not found");
            }
            if (!account->acceptsPostings()) {
                throw domain::InvariantError("Account " + account->code + " is not postable");
            }

            domain::JournalLine line;
            line.id = utils::UuidGenerator::generate();
            line.lineNumber = static_cast<int>(lines.size()) + 1;
            line.accountId = account->id;
            line.accountCode = account->code;
            line.accountName = account->name;
            line.description = request.description;
            line.debit = request.debit;
            line.credit = request.credit;
            line.currency = currency;
            line.exchangeRate = exchangeRate;
            line.functionalDebit = functional ? request.debit : request.debit * exchangeRate;
            line.functionalCredit = functional ? request.credit : request.credit * exchangeRate;
            line.dimensions = request.dimensions;
            lines.push_back(line);
        }
        return lines;
    }

    /**
     * @throws domain::ImbalanceError |debits - credits| >= tolerance
     */
    void computeTotals(domain::JournalEntry& entry) const {
        entry.totalDebits = 0.0;
        entry.totalCredits = 0.0;
        entry.functionalTotalDebits = 0.0;
        entry.functionalTotalCredits = 0.0;
        for (const auto& line : entry.lines) {
            entry.totalDebits += line.debit;
            entry.totalCredits += line.credit;
            entry.functionalTotalDebits += line.functionalDebit;
            entry.functionalTotalCredits += line.functionalCredit;
        }

        if (std::abs(entry.totalDebits - entry.totalCredits) >= settings_->getBalanceTolerance()) {
            throw domain::ImbalanceError(entry.totalDebits, entry.totalCredits);
        }
        entry.isBalanced = true;
    }

    void persistNew(domain::JournalEntry& entry) {
        int sequence = journalRepository_->nextJournalSequence(entry.companyId, entry.fiscalYear);
        entry.journalNumber = formatJournalNumber(entry.fiscalYear, sequence);
        entry.status = domain::JournalStatus::DRAFT;
        entry.createdAt = domain::Timestamp::now();
        entry.updatedAt = entry.createdAt;
        journalRepository_->save(entry);
    }

    /**
     * @brief Провести проводку под уже захваченной блокировкой
     *
     * Если запись статуса не удалась, движок откатывает приращения
     * и исключение уходит вызывающему.
     */
    std::vector<domain::BalanceDelta> postLocked(domain::JournalEntry& entry, const std::string& userId) {
        auto deltas = postingEngine_->post(entry.companyId, entry.lines);

        auto now = domain::Timestamp::now();
        entry.status = domain::JournalStatus::POSTED;
        entry.postedBy = userId;
        entry.postedAt = now;
        entry.updatedBy = userId;
        entry.updatedAt = now;
        try {
            journalRepository_->update(entry);
        } catch (const std::exception& e) {
            std::cerr << "[JournalService] Failed to record posting of " << entry.journalNumber
                      << ", reverting balances: " << e.what() << std::endl;
            postingEngine_->unpost(entry.companyId, entry.lines);
            throw;
        }

        std::cout << "[JournalService] Posted " << entry.journalNumber << " by " << userId << std::endl;
        return deltas;
    }

    domain::JournalEntry buildReversal(
        const domain::JournalEntry& original,
        const std::string& userId,
        const domain::Date& reversalDate,
        const std::optional<std::string>& description
    ) const {
        domain::JournalEntry reversal;
        reversal.id = utils::UuidGenerator::generate();
        reversal.companyId = original.companyId;
        reversal.type = domain::JournalType::REVERSING;
        reversal.source = original.source;
        reversal.sourceId = original.id;
        reversal.sourceReference = "Reversal of " + original.journalNumber;
        reversal.description = description.value_or(
            "Reversal of " + original.journalNumber + ": " + original.description);
        reversal.currency = original.currency;
        reversal.exchangeRate = original.exchangeRate;
        reversal.isReversal = true;
        reversal.reversalOfId = original.id;
        reversal.createdBy = userId;
        reversal.updatedBy = userId;
        setDate(reversal, reversalDate);

        for (const auto& line : original.lines) {
            domain::JournalLine swapped = line;
            swapped.id = utils::UuidGenerator::generate();
            swapped.description = "Reversal: " + line.description;
            swapped.debit = line.credit;
            swapped.credit = line.debit;
            swapped.functionalDebit = line.functionalCredit;
            swapped.functionalCredit = line.functionalDebit;
            reversal.lines.push_back(swapped);
        }

        reversal.totalDebits = original.totalCredits;
        reversal.totalCredits = original.totalDebits;
        reversal.functionalTotalDebits = original.functionalTotalCredits;
        reversal.functionalTotalCredits = original.functionalTotalDebits;
        reversal.isBalanced = original.isBalanced;
        return reversal;
    }

    /**
     * @brief Аннулировать несостоявшуюся сторно-проводку
     *
     * Проводка переводится в VOID, чтобы черновик не остался в журнале.
     * Сбой отката только логируется: вызывающий пробрасывает исходную ошибку.
     *
     * @param balancesApplied приращения сторно ещё применены и их нужно откатить
     */
    void rollbackReversal(domain::JournalEntry& reversal, const std::string& userId, bool balancesApplied) {
        try {
            if (balancesApplied) {
                postingEngine_->unpost(reversal.companyId, reversal.lines);
            }
            reversal.postedBy.reset();
            reversal.postedAt.reset();
            reversal.status = domain::JournalStatus::VOID;
            reversal.approvalHistory.push_back(
                {"rejected", userId, domain::Timestamp::now(), "Voided: reversal could not be recorded"});
            journalRepository_->update(reversal);
        } catch (const std::exception& e) {
            std::cerr << "[JournalService] Rollback of " << reversal.journalNumber
                      << " failed: " << e.what() << std::endl;
        }
    }

    void publishPosted(const domain::JournalEntry& entry, const std::vector<domain::BalanceDelta>& deltas) {
        domain::JournalPostedEvent event;
        event.eventId = utils::UuidGenerator::generate();
        event.companyId = entry.companyId;
        event.journalId = entry.id;
        event.journalNumber = entry.journalNumber;
        event.date = entry.date;
        event.fiscalYear = entry.fiscalYear;
        event.fiscalPeriod = entry.fiscalPeriod;
        event.postedBy = entry.postedBy.value_or("");
        event.deltas = deltas;
        eventBus_->publish(event);
    }
};

} // namespace ledger::application
