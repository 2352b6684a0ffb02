#include <gtest/gtest.h>
#include "adapters/secondary/persistence/InMemoryAccountRepository.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace ledger;
using namespace ledger::adapters::secondary;

// ============================================================================
// TEST FIXTURE
// ============================================================================

class InMemoryAccountRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        repo_ = std::make_shared<InMemoryAccountRepository>();
    }

    domain::Account makeAccount(const std::string& id, const std::string& code,
                                domain::AccountType type = domain::AccountType::ASSET,
                                const std::string& companyId = "company-1") {
        return domain::Account(id, companyId, code, "Account " + code, type, "UGX");
    }

    domain::BalanceDelta delta(const std::string& accountId, double debit, double credit, double balance) {
        domain::BalanceDelta d;
        d.accountId = accountId;
        d.debit = debit;
        d.credit = credit;
        d.balance = balance;
        d.functionalBalance = balance;
        return d;
    }

    std::shared_ptr<InMemoryAccountRepository> repo_;
};

// ============================================================================
// SAVE / FIND
// ============================================================================

TEST_F(InMemoryAccountRepositoryTest, SaveAndFindByIdAndCode) {
    repo_->save(makeAccount("acc-1", "110001"));

    auto byId = repo_->findById("company-1", "acc-1");
    ASSERT_TRUE(byId.has_value());
    EXPECT_EQ(byId->code, "110001");

    auto byCode = repo_->findByCode("company-1", "110001");
    ASSERT_TRUE(byCode.has_value());
    EXPECT_EQ(byCode->id, "acc-1");
}

TEST_F(InMemoryAccountRepositoryTest, Find_OtherCompany_ReturnsNothing) {
    repo_->save(makeAccount("acc-1", "110001"));

    EXPECT_FALSE(repo_->findById("company-2", "acc-1").has_value());
    EXPECT_FALSE(repo_->findByCode("company-2", "110001").has_value());
}

TEST_F(InMemoryAccountRepositoryTest, Save_DuplicateCode_Throws) {
    repo_->save(makeAccount("acc-1", "110001"));

    EXPECT_THROW(repo_->save(makeAccount("acc-2", "110001")), domain::ValidationError);
    // Тот же код в другой компании допустим
    EXPECT_NO_THROW(repo_->save(makeAccount("acc-3", "110001", domain::AccountType::ASSET, "company-2")));
}

TEST_F(InMemoryAccountRepositoryTest, Save_DuplicateId_ThrowsAndReleasesCode) {
    repo_->save(makeAccount("acc-1", "110001"));

    EXPECT_THROW(repo_->save(makeAccount("acc-1", "110002")), domain::ValidationError);
    EXPECT_FALSE(repo_->findByCode("company-1", "110002").has_value());
    EXPECT_EQ(repo_->findById("company-1", "acc-1")->code, "110001");

    EXPECT_NO_THROW(repo_->save(makeAccount("acc-2", "110002")));
}

TEST_F(InMemoryAccountRepositoryTest, SaveBatch_DuplicateInsideBatch_SavesNothing) {
    std::vector<domain::Account> batch{
        makeAccount("acc-1", "110001"),
        makeAccount("acc-2", "110002"),
        makeAccount("acc-3", "110001")
    };

    EXPECT_THROW(repo_->saveBatch(batch), domain::ValidationError);
    EXPECT_EQ(repo_->size(), 0u);
}

TEST_F(InMemoryAccountRepositoryTest, FindAll_SortedByCodeAndFiltered) {
    repo_->save(makeAccount("acc-3", "410001", domain::AccountType::REVENUE));
    repo_->save(makeAccount("acc-1", "110001"));
    repo_->save(makeAccount("acc-2", "210001", domain::AccountType::LIABILITY));

    auto all = repo_->findAll("company-1", domain::AccountFilter{});
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].code, "110001");
    EXPECT_EQ(all[2].code, "410001");

    domain::AccountFilter filter;
    filter.types = {domain::AccountType::REVENUE, domain::AccountType::LIABILITY};
    auto some = repo_->findAll("company-1", filter);
    ASSERT_EQ(some.size(), 2u);
    EXPECT_EQ(some[0].code, "210001");

    domain::AccountFilter search;
    search.search = "account 4100";
    EXPECT_EQ(repo_->findAll("company-1", search).size(), 1u);
}

TEST_F(InMemoryAccountRepositoryTest, Update_KeepsBalanceSnapshot) {
    repo_->save(makeAccount("acc-1", "110001"));
    repo_->applyBalanceDeltas("company-1", {delta("acc-1", 500.0, 0.0, 500.0)});

    auto account = *repo_->findById("company-1", "acc-1");
    account.name = "Petty Cash";
    account.balance = domain::AccountBalance{};
    repo_->update(account);

    auto stored = repo_->findById("company-1", "acc-1");
    EXPECT_EQ(stored->name, "Petty Cash");
    EXPECT_DOUBLE_EQ(stored->balance.balance, 500.0);
}

TEST_F(InMemoryAccountRepositoryTest, Update_Unknown_Throws) {
    EXPECT_THROW(repo_->update(makeAccount("missing", "110001")), domain::NotFoundError);
}

TEST_F(InMemoryAccountRepositoryTest, Update_ArchiveWithBalance_Throws) {
    repo_->save(makeAccount("acc-1", "110001"));
    repo_->applyBalanceDeltas("company-1", {delta("acc-1", 500.0, 0.0, 500.0)});

    auto account = *repo_->findById("company-1", "acc-1");
    account.status = domain::AccountStatus::ARCHIVED;
    account.balance = domain::AccountBalance{};
    EXPECT_THROW(repo_->update(account), domain::ConflictError);
    EXPECT_EQ(repo_->findById("company-1", "acc-1")->status, domain::AccountStatus::ACTIVE);

    repo_->applyBalanceDeltas("company-1", {delta("acc-1", 0.0, 500.0, -500.0)});
    EXPECT_NO_THROW(repo_->update(account));
    EXPECT_TRUE(repo_->findById("company-1", "acc-1")->isArchived());
}

TEST_F(InMemoryAccountRepositoryTest, Update_HeaderWithBalance_Throws) {
    repo_->save(makeAccount("acc-1", "110001"));
    repo_->applyBalanceDeltas("company-1", {delta("acc-1", 20.0, 0.0, 20.0)});

    auto account = *repo_->findById("company-1", "acc-1");
    account.isHeader = true;
    account.isPostable = false;

    EXPECT_THROW(repo_->update(account), domain::ConflictError);
    EXPECT_FALSE(repo_->findById("company-1", "acc-1")->isHeader);
}

// ============================================================================
// BALANCES
// ============================================================================

TEST_F(InMemoryAccountRepositoryTest, ApplyBalanceDeltas_Accumulates) {
    repo_->save(makeAccount("acc-1", "110001"));
    repo_->save(makeAccount("acc-2", "410001", domain::AccountType::REVENUE));

    repo_->applyBalanceDeltas("company-1", {
        delta("acc-1", 1000.0, 0.0, 1000.0),
        delta("acc-2", 0.0, 1000.0, 1000.0)
    });
    repo_->applyBalanceDeltas("company-1", {delta("acc-1", 0.0, 300.0, -300.0)});

    auto cash = repo_->findById("company-1", "acc-1");
    EXPECT_DOUBLE_EQ(cash->balance.debit, 1000.0);
    EXPECT_DOUBLE_EQ(cash->balance.credit, 300.0);
    EXPECT_DOUBLE_EQ(cash->balance.balance, 700.0);
    EXPECT_DOUBLE_EQ(repo_->findById("company-1", "acc-2")->balance.balance, 1000.0);
}

TEST_F(InMemoryAccountRepositoryTest, ApplyBalanceDeltas_UnknownAccount_AppliesNothing) {
    repo_->save(makeAccount("acc-1", "110001"));

    EXPECT_THROW(repo_->applyBalanceDeltas("company-1", {
                     delta("acc-1", 100.0, 0.0, 100.0),
                     delta("ghost", 0.0, 100.0, 100.0)
                 }),
                 domain::NotFoundError);

    EXPECT_DOUBLE_EQ(repo_->findById("company-1", "acc-1")->balance.balance, 0.0);
}

TEST_F(InMemoryAccountRepositoryTest, ApplyBalanceDeltas_ArchivedAccount_AppliesNothing) {
    repo_->save(makeAccount("acc-1", "110001"));
    auto old = makeAccount("acc-2", "110009");
    old.status = domain::AccountStatus::ARCHIVED;
    repo_->save(old);

    EXPECT_THROW(repo_->applyBalanceDeltas("company-1", {
                     delta("acc-1", 100.0, 0.0, 100.0),
                     delta("acc-2", 0.0, 100.0, -100.0)
                 }),
                 domain::InvariantError);

    EXPECT_DOUBLE_EQ(repo_->findById("company-1", "acc-1")->balance.balance, 0.0);
    EXPECT_DOUBLE_EQ(repo_->findById("company-1", "acc-2")->balance.credit, 0.0);

    // Нулевое приращение допустимо
    EXPECT_NO_THROW(repo_->applyBalanceDeltas("company-1", {delta("acc-2", 0.0, 0.0, 0.0)}));
}

TEST_F(InMemoryAccountRepositoryTest, ApplyBalanceDeltas_HeaderAccount_Throws) {
    auto group = makeAccount("acc-1", "110000");
    group.isHeader = true;
    group.isPostable = false;
    repo_->save(group);

    EXPECT_THROW(repo_->applyBalanceDeltas("company-1", {delta("acc-1", 10.0, 0.0, 10.0)}),
                 domain::InvariantError);
}

TEST_F(InMemoryAccountRepositoryTest, ArchiveRacingDeltas_NeverArchivesNonZeroBalance) {
    repo_->save(makeAccount("acc-1", "110001"));

    std::atomic<int> rejectedDeltas(0);
    std::thread writer([this, &rejectedDeltas]() {
        for (int i = 0; i < 500; ++i) {
            try {
                repo_->applyBalanceDeltas("company-1", {delta("acc-1", 1.0, 0.0, 1.0)});
            } catch (const domain::InvariantError&) {
                rejectedDeltas++;
                break;
            }
            repo_->applyBalanceDeltas("company-1", {delta("acc-1", 0.0, 1.0, -1.0)});
        }
    });

    std::thread archiver([this]() {
        while (true) {
            auto account = *repo_->findById("company-1", "acc-1");
            account.status = domain::AccountStatus::ARCHIVED;
            try {
                repo_->update(account);
                return;
            } catch (const domain::ConflictError&) {
                std::this_thread::yield();
            }
        }
    });

    writer.join();
    archiver.join();

    auto stored = repo_->findById("company-1", "acc-1");
    EXPECT_TRUE(stored->isArchived());
    EXPECT_DOUBLE_EQ(stored->balance.balance, 0.0);
    EXPECT_LE(rejectedDeltas.load(), 1);
}

TEST_F(InMemoryAccountRepositoryTest, ApplyBalanceDeltas_ConcurrentWriters_NoLostUpdates) {
    repo_->save(makeAccount("acc-1", "110001"));
    repo_->save(makeAccount("acc-2", "410001", domain::AccountType::REVENUE));

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this]() {
            for (int i = 0; i < 250; ++i) {
                repo_->applyBalanceDeltas("company-1", {
                    delta("acc-1", 1.0, 0.0, 1.0),
                    delta("acc-2", 0.0, 1.0, 1.0)
                });
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_DOUBLE_EQ(repo_->findById("company-1", "acc-1")->balance.balance, 2000.0);
    EXPECT_DOUBLE_EQ(repo_->findById("company-1", "acc-2")->balance.balance, 2000.0);
}

TEST_F(InMemoryAccountRepositoryTest, ReplaceBalances_ZeroesAccountsNotListed) {
    repo_->save(makeAccount("acc-1", "110001"));
    repo_->save(makeAccount("acc-2", "120001"));
    repo_->applyBalanceDeltas("company-1", {delta("acc-2", 50.0, 0.0, 50.0)});

    repo_->replaceBalances("company-1", {delta("acc-1", 10.0, 0.0, 10.0)});

    EXPECT_DOUBLE_EQ(repo_->findById("company-1", "acc-1")->balance.balance, 10.0);
    EXPECT_DOUBLE_EQ(repo_->findById("company-1", "acc-2")->balance.balance, 0.0);
    EXPECT_DOUBLE_EQ(repo_->findById("company-1", "acc-2")->balance.debit, 0.0);
}
