#pragma once

#include "ports/input/ITrialBalanceService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "settings/ILedgerSettings.hpp"
#include "domain/FiscalCalendar.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>

namespace ledger::application {

/**
 * @brief Генератор оборотно-сальдовой ведомости
 *
 * Читает снимки сальдо активных проводимых счетов. Сальдо раскладывается
 * в колонку дебета или кредита по нормальной стороне класса счёта:
 * отрицательное сальдо уходит в противоположную колонку и помечается
 * как isAbnormal, но не отбрасывается.
 */
class TrialBalanceService : public ports::input::ITrialBalanceService {
public:
    TrialBalanceService(
        std::shared_ptr<ports::output::IAccountRepository> accountRepository,
        std::shared_ptr<settings::ILedgerSettings> settings
    ) : accountRepository_(std::move(accountRepository))
      , settings_(std::move(settings))
      , calendar_(settings_->getFiscalYearStartMonth())
    {}

    domain::TrialBalance generate(
        const std::string& companyId,
        const std::string& userId,
        const domain::Date& asOfDate,
        std::optional<int> fiscalYear,
        std::optional<int> fiscalPeriod
    ) override {
        domain::AccountFilter filter;
        filter.statuses = {domain::AccountStatus::ACTIVE};
        filter.isPostable = true;
        auto accounts = accountRepository_->findAll(companyId, filter);

        domain::TrialBalance report;
        report.companyId = companyId;
        report.asOfDate = asOfDate;
        report.fiscalYear = fiscalYear.value_or(calendar_.periodOf(asOfDate).fiscalYear);
        report.fiscalPeriod = fiscalPeriod;
        report.generatedAt = domain::Timestamp::now();
        report.generatedBy = userId;

        for (const auto& account : accounts) {
            double balance = account.balance.balance;
            if (balance == 0.0) {
                continue;
            }

            domain::TrialBalanceEntry row;
            row.accountId = account.id;
            row.accountCode = account.code;
            row.accountName = account.name;
            row.accountType = account.type;
            row.balance = balance;
            row.isAbnormal = balance < 0.0;

            bool debitNormal = domain::isDebitNormal(account.type);
            if (balance > 0.0) {
                (debitNormal ? row.debit : row.credit) = balance;
            } else {
                (debitNormal ? row.credit : row.debit) = -balance;
            }

            report.totalDebits += row.debit;
            report.totalCredits += row.credit;
            if (row.isAbnormal) {
                ++report.abnormalCount;
                std::cerr << "[TrialBalanceService] Abnormal balance on " << account.code << " "
                          << account.name << ": " << balance << std::endl;
            }
            report.entries.push_back(row);
        }

        std::sort(report.entries.begin(), report.entries.end(),
                  [](const domain::TrialBalanceEntry& a, const domain::TrialBalanceEntry& b) {
                      return a.accountCode < b.accountCode;
                  });

        report.isBalanced =
            std::abs(report.totalDebits - report.totalCredits) < settings_->getBalanceTolerance();

        std::cout << "[TrialBalanceService] Generated trial balance for " << companyId << " as of "
                  << asOfDate.toString() << ": " << report.entries.size() << " rows, "
                  << (report.isBalanced ? "balanced" : "NOT balanced") << std::endl;
        return report;
    }

private:
    std::shared_ptr<ports::output::IAccountRepository> accountRepository_;
    std::shared_ptr<settings::ILedgerSettings> settings_;
    domain::FiscalCalendar calendar_;
};

} // namespace ledger::application
