#pragma once

#include "ports/input/ILedgerQueryService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IJournalRepository.hpp"
#include "domain/Filters.hpp"
#include "domain/LedgerErrors.hpp"
#include <algorithm>
#include <map>
#include <memory>

namespace ledger::application {

/**
 * @brief Чтение проведённых строк главной книги
 *
 * Считает по самим проводкам, а не по снимку сальдо: даёт сальдо
 * на произвольную дату и обороты за период.
 */
class LedgerQueryService : public ports::input::ILedgerQueryService {
public:
    LedgerQueryService(
        std::shared_ptr<ports::output::IJournalRepository> journalRepository,
        std::shared_ptr<ports::output::IAccountRepository> accountRepository
    ) : journalRepository_(std::move(journalRepository))
      , accountRepository_(std::move(accountRepository))
    {}

    std::vector<domain::LedgerLine> getPostedLines(
        const std::string& companyId,
        const std::string& accountId,
        const domain::Date& from,
        const domain::Date& to
    ) override {
        auto account = requireAccount(companyId, accountId);

        domain::JournalFilter filter = postedFilter();
        filter.dateTo = to;
        auto journals = journalRepository_->findAll(companyId, filter);

        // Хронологический порядок: дата, затем номер
        std::sort(journals.begin(), journals.end(),
                  [](const domain::JournalEntry& a, const domain::JournalEntry& b) {
                      return domain::newerFirst(b, a);
                  });

        // Сальдо открытия складывается из строк до from
        double running = 0.0;
        std::vector<domain::LedgerLine> result;
        for (const auto& journal : journals) {
            for (const auto& line : journal.lines) {
                if (line.accountId != accountId) {
                    continue;
                }
                running += domain::signedContribution(account.type, line.debit, line.credit);
                if (journal.date < from) {
                    continue;
                }

                domain::LedgerLine ledgerLine;
                ledgerLine.journalId = journal.id;
                ledgerLine.journalNumber = journal.journalNumber;
                ledgerLine.date = journal.date;
                ledgerLine.fiscalYear = journal.fiscalYear;
                ledgerLine.fiscalPeriod = journal.fiscalPeriod;
                ledgerLine.journalStatus = journal.status;
                ledgerLine.line = line;
                ledgerLine.runningBalance = running;
                result.push_back(ledgerLine);
            }
        }
        return result;
    }

    std::vector<domain::JournalEntry> getAccountLedger(
        const std::string& companyId,
        const std::string& accountId,
        const domain::JournalFilter& filter
    ) override {
        domain::JournalFilter posted = filter;
        posted.statuses.erase(
            std::remove_if(posted.statuses.begin(), posted.statuses.end(),
                           [](domain::JournalStatus s) { return !domain::affectsBalances(s); }),
            posted.statuses.end());
        if (posted.statuses.empty()) {
            posted.statuses = postedFilter().statuses;
        }

        auto journals = journalRepository_->findAll(companyId, posted);
        journals.erase(
            std::remove_if(journals.begin(), journals.end(),
                           [&](const domain::JournalEntry& j) { return !j.touchesAccount(accountId); }),
            journals.end());
        return journals;
    }

    double getBalanceAsOf(
        const std::string& companyId,
        const std::string& accountId,
        const domain::Date& asOfDate
    ) override {
        auto account = requireAccount(companyId, accountId);

        domain::JournalFilter filter = postedFilter();
        filter.dateTo = asOfDate;

        double balance = 0.0;
        for (const auto& journal : journalRepository_->findAll(companyId, filter)) {
            for (const auto& line : journal.lines) {
                if (line.accountId == accountId) {
                    balance += domain::signedContribution(account.type, line.debit, line.credit);
                }
            }
        }
        return balance;
    }

    std::vector<domain::PeriodActivity> getPeriodActivity(
        const std::string& companyId,
        int fiscalYear,
        int fiscalPeriod
    ) override {
        domain::JournalFilter filter = postedFilter();
        filter.fiscalYear = fiscalYear;
        filter.fiscalPeriod = fiscalPeriod;

        std::map<std::string, domain::PeriodActivity> byCode;
        for (const auto& journal : journalRepository_->findAll(companyId, filter)) {
            for (const auto& line : journal.lines) {
                auto& activity = byCode[line.accountCode];
                activity.accountId = line.accountId;
                activity.accountCode = line.accountCode;
                activity.debit += line.debit;
                activity.credit += line.credit;
            }
        }

        std::vector<domain::PeriodActivity> result;
        result.reserve(byCode.size());
        for (auto& entry : byCode) {
            result.push_back(entry.second);
        }
        return result;
    }

private:
    std::shared_ptr<ports::output::IJournalRepository> journalRepository_;
    std::shared_ptr<ports::output::IAccountRepository> accountRepository_;

    static domain::JournalFilter postedFilter() {
        domain::JournalFilter filter;
        filter.statuses = {domain::JournalStatus::POSTED, domain::JournalStatus::REVERSED};
        return filter;
    }

    domain::Account requireAccount(const std::string& companyId, const std::string& accountId) {
        auto account = accountRepository_->findById(companyId, accountId);
        if (!account) {
            throw domain::NotFoundError("Account " + accountId + " not found");
        }
        return *account;
    }
};

} // namespace ledger::application
