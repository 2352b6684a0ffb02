#include <gtest/gtest.h>
#include "adapters/secondary/persistence/InMemoryJournalRepository.hpp"
#include <algorithm>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace ledger;
using namespace ledger::adapters::secondary;

// ============================================================================
// TEST FIXTURE
// ============================================================================

class InMemoryJournalRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        repo_ = std::make_shared<InMemoryJournalRepository>();
    }

    domain::JournalEntry makeEntry(const std::string& id, const std::string& number,
                                   const domain::Date& date,
                                   domain::JournalStatus status = domain::JournalStatus::DRAFT) {
        domain::JournalEntry entry;
        entry.id = id;
        entry.companyId = "company-1";
        entry.journalNumber = number;
        entry.date = date;
        entry.fiscalYear = 2025;
        entry.fiscalPeriod = 2;
        entry.status = status;
        entry.description = "Entry " + number;
        return entry;
    }

    std::shared_ptr<InMemoryJournalRepository> repo_;
};

// ============================================================================
// SAVE / FIND
// ============================================================================

TEST_F(InMemoryJournalRepositoryTest, SaveAndFindByIdAndNumber) {
    repo_->save(makeEntry("je-1", "JE-2025-000001", domain::Date(2024, 8, 15)));

    ASSERT_TRUE(repo_->findById("company-1", "je-1").has_value());
    auto byNumber = repo_->findByNumber("company-1", "JE-2025-000001");
    ASSERT_TRUE(byNumber.has_value());
    EXPECT_EQ(byNumber->id, "je-1");
    EXPECT_FALSE(repo_->findByNumber("company-2", "JE-2025-000001").has_value());
}

TEST_F(InMemoryJournalRepositoryTest, Save_DuplicateNumber_Throws) {
    repo_->save(makeEntry("je-1", "JE-2025-000001", domain::Date(2024, 8, 15)));

    EXPECT_THROW(repo_->save(makeEntry("je-2", "JE-2025-000001", domain::Date(2024, 8, 16))),
                 domain::ValidationError);
}

TEST_F(InMemoryJournalRepositoryTest, Save_DuplicateId_ThrowsAndKeepsOriginal) {
    repo_->save(makeEntry("je-1", "JE-2025-000001", domain::Date(2024, 8, 15)));

    EXPECT_THROW(repo_->save(makeEntry("je-1", "JE-2025-000002", domain::Date(2024, 8, 16))),
                 domain::ValidationError);

    EXPECT_EQ(repo_->findById("company-1", "je-1")->journalNumber, "JE-2025-000001");
    EXPECT_FALSE(repo_->findByNumber("company-1", "JE-2025-000002").has_value());
    EXPECT_NO_THROW(repo_->save(makeEntry("je-2", "JE-2025-000002", domain::Date(2024, 8, 16))));
}

TEST_F(InMemoryJournalRepositoryTest, Update_ReplacesStoredEntry) {
    repo_->save(makeEntry("je-1", "JE-2025-000001", domain::Date(2024, 8, 15)));

    auto entry = *repo_->findById("company-1", "je-1");
    entry.status = domain::JournalStatus::POSTED;
    repo_->update(entry);

    EXPECT_EQ(repo_->findById("company-1", "je-1")->status, domain::JournalStatus::POSTED);
    EXPECT_THROW(repo_->update(makeEntry("je-9", "JE-2025-000009", domain::Date(2024, 8, 15))),
                 domain::NotFoundError);
}

TEST_F(InMemoryJournalRepositoryTest, FindAll_NewestFirstThenNumberDescending) {
    repo_->save(makeEntry("je-1", "JE-2025-000001", domain::Date(2024, 8, 10)));
    repo_->save(makeEntry("je-2", "JE-2025-000002", domain::Date(2024, 8, 20)));
    repo_->save(makeEntry("je-3", "JE-2025-000003", domain::Date(2024, 8, 10)));

    auto all = repo_->findAll("company-1", domain::JournalFilter{});

    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, "je-2");
    EXPECT_EQ(all[1].id, "je-3");
    EXPECT_EQ(all[2].id, "je-1");
}

TEST_F(InMemoryJournalRepositoryTest, FindAll_FiltersByStatusDateAndSearch) {
    repo_->save(makeEntry("je-1", "JE-2025-000001", domain::Date(2024, 8, 10), domain::JournalStatus::POSTED));
    repo_->save(makeEntry("je-2", "JE-2025-000002", domain::Date(2024, 8, 20), domain::JournalStatus::DRAFT));
    repo_->save(makeEntry("je-3", "JE-2025-000003", domain::Date(2024, 9, 1), domain::JournalStatus::POSTED));

    domain::JournalFilter posted;
    posted.statuses = {domain::JournalStatus::POSTED};
    posted.dateTo = domain::Date(2024, 8, 31);
    auto result = repo_->findAll("company-1", posted);
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0].id, "je-1");

    domain::JournalFilter search;
    search.search = "000002";
    ASSERT_EQ(repo_->findAll("company-1", search).size(), 1u);
}

// ============================================================================
// SEQUENCES
// ============================================================================

TEST_F(InMemoryJournalRepositoryTest, NextJournalSequence_PerCompanyAndYear) {
    EXPECT_EQ(repo_->nextJournalSequence("company-1", 2025), 1);
    EXPECT_EQ(repo_->nextJournalSequence("company-1", 2025), 2);
    EXPECT_EQ(repo_->nextJournalSequence("company-1", 2026), 1);
    EXPECT_EQ(repo_->nextJournalSequence("company-2", 2025), 1);
}

TEST_F(InMemoryJournalRepositoryTest, NextJournalSequence_ConcurrentCallers_UniqueValues) {
    std::mutex resultsMutex;
    std::set<int> values;
    std::vector<std::thread> threads;

    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 100; ++i) {
                int value = repo_->nextJournalSequence("company-1", 2025);
                std::lock_guard<std::mutex> lock(resultsMutex);
                values.insert(value);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(values.size(), 800u);
    EXPECT_EQ(*values.begin(), 1);
    EXPECT_EQ(*values.rbegin(), 800);
}
