// include/adapters/secondary/persistence/InMemoryJournalRepository.hpp
#pragma once

#include "ports/output/IJournalRepository.hpp"
#include "domain/Filters.hpp"
#include "domain/LedgerErrors.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <mutex>
#include <unordered_map>

namespace ledger::adapters::secondary {

/**
 * @brief In-memory реализация репозитория журнальных проводок
 *
 * Счётчик номеров хранится отдельно от проводок: (компания, год) -> последнее
 * выданное значение. Номер не переиспользуется, даже если проводка не сохранена.
 */
class InMemoryJournalRepository : public ports::output::IJournalRepository {
public:
    InMemoryJournalRepository() = default;

    void save(const domain::JournalEntry& entry) override {
        std::lock_guard<std::mutex> lock(indexMutex_);
        auto key = numberKey(entry.companyId, entry.journalNumber);
        if (!numberIndex_.emplace(key, entry.id).second) {
            throw domain::ValidationError("Journal number already exists: " + entry.journalNumber);
        }
        if (!journals_.insertIfAbsent(entry.id, std::make_shared<domain::JournalEntry>(entry))) {
            numberIndex_.erase(key);
            throw domain::ValidationError("Journal entry already exists: " + entry.id);
        }
    }

    void update(const domain::JournalEntry& entry) override {
        auto existing = journals_.find(entry.id);
        if (!existing || existing->companyId != entry.companyId) {
            throw domain::NotFoundError("Journal entry not found: " + entry.id);
        }
        journals_.insert(entry.id, std::make_shared<domain::JournalEntry>(entry));
    }

    std::optional<domain::JournalEntry> findById(
        const std::string& companyId,
        const std::string& id
    ) override {
        auto entry = journals_.find(id);
        if (!entry || entry->companyId != companyId) {
            return std::nullopt;
        }
        return *entry;
    }

    std::optional<domain::JournalEntry> findByNumber(
        const std::string& companyId,
        const std::string& journalNumber
    ) override {
        std::string id;
        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            auto it = numberIndex_.find(numberKey(companyId, journalNumber));
            if (it == numberIndex_.end()) {
                return std::nullopt;
            }
            id = it->second;
        }
        return findById(companyId, id);
    }

    std::vector<domain::JournalEntry> findAll(
        const std::string& companyId,
        const domain::JournalFilter& filter
    ) override {
        auto matches = journals_.select([&](const domain::JournalEntry& entry) {
            return entry.companyId == companyId && domain::matchesFilter(entry, filter);
        });

        std::vector<domain::JournalEntry> result;
        result.reserve(matches.size());
        for (const auto& entry : matches) {
            result.push_back(*entry);
        }
        std::sort(result.begin(), result.end(), domain::newerFirst);
        return result;
    }

    int nextJournalSequence(const std::string& companyId, int fiscalYear) override {
        std::lock_guard<std::mutex> lock(sequenceMutex_);
        return ++sequences_[companyId + "/" + std::to_string(fiscalYear)];
    }

    size_t size() const {
        return journals_.size();
    }

    void clear() {
        journals_.clear();
        std::lock_guard<std::mutex> indexLock(indexMutex_);
        numberIndex_.clear();
        std::lock_guard<std::mutex> sequenceLock(sequenceMutex_);
        sequences_.clear();
    }

private:
    ThreadSafeMap<std::string, domain::JournalEntry> journals_;

    mutable std::mutex indexMutex_;
    std::unordered_map<std::string, std::string> numberIndex_;  // companyId/number -> journalId

    std::mutex sequenceMutex_;
    std::unordered_map<std::string, int> sequences_;  // companyId/fiscalYear -> last value

    static std::string numberKey(const std::string& companyId, const std::string& number) {
        return companyId + "/" + number;
    }
};

} // namespace ledger::adapters::secondary
