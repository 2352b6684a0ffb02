/**
 * @file LedgerScenarioTest.cpp
 * @brief Сквозные сценарии через собранное DI-ядро (хранилище в памяти)
 */

#include <gtest/gtest.h>
#include "LedgerApp.hpp"
#include "ports/input/IAccountService.hpp"
#include "ports/input/IJournalService.hpp"
#include "ports/input/ILedgerQueryService.hpp"
#include "ports/input/ITrialBalanceService.hpp"
#include "ports/output/IEventBus.hpp"
#include "application/PostingEngine.hpp"
#include "settings/LedgerSettings.hpp"

using namespace ledger;

class LedgerScenarioTest : public ::testing::Test {
protected:
    void SetUp() override {
        app_ = std::make_unique<LedgerApp>(std::make_shared<settings::LedgerSettings>(7, "UGX"));

        app_->eventBus()->subscribe("journal.posted", [this](const domain::DomainEvent&) { ++postedEvents_; });
        app_->eventBus()->subscribe("journal.reversed", [this](const domain::DomainEvent&) { ++reversedEvents_; });

        app_->accountService()->initializeDefaultAccounts(COMPANY, USER);
        cash_ = app_->accountService()->getByCode(COMPANY, "110001")->id;
        sales_ = app_->accountService()->getByCode(COMPANY, "410001")->id;
        rent_ = app_->accountService()->getByCode(COMPANY, "520002")->id;
    }

    domain::JournalEntry postEntry(const domain::Date& date, const std::string& description,
                                   const std::string& debitAccount, const std::string& creditAccount,
                                   double amount) {
        domain::JournalEntryCreateRequest request;
        request.date = date;
        request.description = description;
        request.lines = {
            domain::JournalLineRequest(debitAccount, amount, 0.0),
            domain::JournalLineRequest(creditAccount, 0.0, amount)
        };
        auto draft = app_->journalService()->create(COMPANY, USER, request);
        return app_->journalService()->post(COMPANY, draft.id, USER);
    }

    double balanceOf(const std::string& accountId) {
        return app_->accountService()->getById(COMPANY, accountId)->balance.balance;
    }

    static constexpr const char* COMPANY = "company-1";
    static constexpr const char* USER = "accountant";

    std::unique_ptr<LedgerApp> app_;
    std::string cash_;
    std::string sales_;
    std::string rent_;
    int postedEvents_ = 0;
    int reversedEvents_ = 0;
};

TEST_F(LedgerScenarioTest, CashSale_PostedAndReflectedInTrialBalance) {
    auto sale = postEntry(domain::Date(2024, 8, 15), "Cash sale", cash_, sales_, 1000.0);

    EXPECT_EQ(sale.journalNumber, "JE-2025-000001");
    EXPECT_EQ(sale.fiscalYear, 2025);
    EXPECT_EQ(sale.fiscalPeriod, 2);
    EXPECT_DOUBLE_EQ(balanceOf(cash_), 1000.0);
    EXPECT_DOUBLE_EQ(balanceOf(sales_), 1000.0);
    EXPECT_EQ(postedEvents_, 1);

    auto report = app_->trialBalanceService()->generate(COMPANY, USER, domain::Date(2024, 8, 31));

    EXPECT_EQ(report.fiscalYear, 2025);
    ASSERT_EQ(report.entries.size(), 2u);
    EXPECT_EQ(report.entries[0].accountCode, "110001");
    EXPECT_DOUBLE_EQ(report.entries[0].debit, 1000.0);
    EXPECT_EQ(report.entries[1].accountCode, "410001");
    EXPECT_DOUBLE_EQ(report.entries[1].credit, 1000.0);
    EXPECT_TRUE(report.isBalanced);
}

TEST_F(LedgerScenarioTest, ReversalAfterSpending_LeavesAbnormalButBalancedLedger) {
    auto sale = postEntry(domain::Date(2024, 8, 15), "Cash sale", cash_, sales_, 1000.0);
    postEntry(domain::Date(2024, 8, 20), "August rent", rent_, cash_, 300.0);

    auto reversal = app_->journalService()->reverse(COMPANY, sale.id, USER, domain::Date(2024, 9, 1));

    EXPECT_EQ(reversal.journalNumber, "JE-2025-000003");
    EXPECT_EQ(reversal.fiscalPeriod, 3);
    EXPECT_DOUBLE_EQ(balanceOf(cash_), -300.0);
    EXPECT_DOUBLE_EQ(balanceOf(sales_), 0.0);
    EXPECT_EQ(postedEvents_, 3);
    EXPECT_EQ(reversedEvents_, 1);

    auto report = app_->trialBalanceService()->generate(COMPANY, USER, domain::Date(2024, 9, 30));

    ASSERT_EQ(report.entries.size(), 2u);
    EXPECT_EQ(report.entries[0].accountCode, "110001");
    EXPECT_TRUE(report.entries[0].isAbnormal);
    EXPECT_DOUBLE_EQ(report.entries[0].credit, 300.0);
    EXPECT_EQ(report.entries[1].accountCode, "520002");
    EXPECT_DOUBLE_EQ(report.entries[1].debit, 300.0);
    EXPECT_EQ(report.abnormalCount, 1);
    EXPECT_TRUE(report.isBalanced);

    // История по дате не зависит от текущего снимка
    EXPECT_DOUBLE_EQ(app_->ledgerQueryService()->getBalanceAsOf(COMPANY, cash_, domain::Date(2024, 8, 31)), 700.0);

    auto august = app_->ledgerQueryService()->getPeriodActivity(COMPANY, 2025, 2);
    EXPECT_EQ(august.size(), 3u);
}

TEST_F(LedgerScenarioTest, RebuildBalances_MatchesIncrementalSnapshots) {
    auto sale = postEntry(domain::Date(2024, 8, 15), "Cash sale", cash_, sales_, 1000.0);
    postEntry(domain::Date(2024, 8, 20), "August rent", rent_, cash_, 300.0);
    app_->journalService()->reverse(COMPANY, sale.id, USER, domain::Date(2024, 9, 1));

    double cashBefore = balanceOf(cash_);
    double rentBefore = balanceOf(rent_);

    app_->postingEngine()->rebuildBalances(COMPANY);

    EXPECT_DOUBLE_EQ(balanceOf(cash_), cashBefore);
    EXPECT_DOUBLE_EQ(balanceOf(rent_), rentBefore);
    EXPECT_DOUBLE_EQ(balanceOf(sales_), 0.0);
}

TEST_F(LedgerScenarioTest, AccountWithBalance_CannotBeArchived) {
    postEntry(domain::Date(2024, 8, 15), "Cash sale", cash_, sales_, 1000.0);

    EXPECT_THROW(app_->accountService()->archive(COMPANY, cash_, USER), domain::ConflictError);
}

TEST_F(LedgerScenarioTest, Companies_AreIsolated) {
    postEntry(domain::Date(2024, 8, 15), "Cash sale", cash_, sales_, 1000.0);

    app_->accountService()->initializeDefaultAccounts("company-2", USER);
    auto otherCash = app_->accountService()->getByCode("company-2", "110001");
    ASSERT_TRUE(otherCash.has_value());
    EXPECT_NE(otherCash->id, cash_);
    EXPECT_DOUBLE_EQ(otherCash->balance.balance, 0.0);

    auto report = app_->trialBalanceService()->generate("company-2", USER, domain::Date(2024, 8, 31));
    EXPECT_TRUE(report.entries.empty());
    EXPECT_FALSE(app_->journalService()->getByNumber("company-2", "JE-2025-000001").has_value());
}
