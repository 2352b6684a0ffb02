// include/adapters/secondary/persistence/InMemoryAccountRepository.hpp
#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "domain/Filters.hpp"
#include "domain/LedgerErrors.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <iostream>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>

namespace ledger::adapters::secondary {

/**
 * @brief In-memory реализация репозитория плана счетов
 *
 * Документы хранятся в ThreadSafeMap как неизменяемые снимки.
 * Все записи идут под уникальной блокировкой stateMutex_, чтения
 * под разделяемой: многосчётное применение сальдо видно целиком или никак.
 *
 * Счёт, не принимающий оборотов, держит нулевое сальдо: applyBalanceDeltas()
 * отклоняет для него ненулевые приращения, а update() не снимает
 * проводимость со счёта с ненулевым сальдо.
 */
class InMemoryAccountRepository : public ports::output::IAccountRepository {
public:
    InMemoryAccountRepository() = default;

    void save(const domain::Account& account) override {
        std::unique_lock<std::shared_mutex> lock(stateMutex_);
        insertLocked(account);
    }

    void saveBatch(const std::vector<domain::Account>& accounts) override {
        std::unique_lock<std::shared_mutex> lock(stateMutex_);

        // Проверяем все коды до первой вставки
        std::unordered_map<std::string, std::string> pending;
        std::unordered_set<std::string> pendingIds;
        for (const auto& account : accounts) {
            auto key = codeKey(account.companyId, account.code);
            if (codeIndex_.count(key) > 0 || !pending.emplace(key, account.id).second) {
                throw domain::ValidationError("Account code already exists: " + account.code);
            }
            if (accounts_.contains(account.id) || !pendingIds.insert(account.id).second) {
                throw domain::ValidationError("Account already exists: " + account.id);
            }
        }

        for (const auto& account : accounts) {
            insertLocked(account);
        }
        std::cout << "[InMemoryAccountRepository] Saved batch of " << accounts.size()
                  << " accounts" << std::endl;
    }

    void update(const domain::Account& account) override {
        std::unique_lock<std::shared_mutex> lock(stateMutex_);

        auto existing = accounts_.find(account.id);
        if (!existing || existing->companyId != account.companyId) {
            throw domain::NotFoundError("Account not found: " + account.id);
        }

        // Проверка и запись под одной блокировкой с applyBalanceDeltas()
        if (!account.acceptsPostings() && !existing->balance.isZero()) {
            throw domain::ConflictError("Account " + account.code +
                                        " has a non-zero balance and must keep accepting postings");
        }

        auto updated = std::make_shared<domain::Account>(account);
        updated->balance = existing->balance;
        accounts_.insert(account.id, updated);
    }

    std::optional<domain::Account> findById(
        const std::string& companyId,
        const std::string& id
    ) override {
        std::shared_lock<std::shared_mutex> lock(stateMutex_);
        auto account = accounts_.find(id);
        if (!account || account->companyId != companyId) {
            return std::nullopt;
        }
        return *account;
    }

    std::optional<domain::Account> findByCode(
        const std::string& companyId,
        const std::string& code
    ) override {
        std::shared_lock<std::shared_mutex> lock(stateMutex_);
        auto it = codeIndex_.find(codeKey(companyId, code));
        if (it == codeIndex_.end()) {
            return std::nullopt;
        }
        auto account = accounts_.find(it->second);
        return account ? std::optional<domain::Account>(*account) : std::nullopt;
    }

    std::vector<domain::Account> findAll(
        const std::string& companyId,
        const domain::AccountFilter& filter
    ) override {
        std::shared_lock<std::shared_mutex> lock(stateMutex_);

        auto matches = accounts_.select([&](const domain::Account& account) {
            return account.companyId == companyId && domain::matchesFilter(account, filter);
        });

        std::vector<domain::Account> result;
        result.reserve(matches.size());
        for (const auto& account : matches) {
            result.push_back(*account);
        }
        std::sort(result.begin(), result.end(),
                  [](const domain::Account& a, const domain::Account& b) { return a.code < b.code; });
        return result;
    }

    void applyBalanceDeltas(
        const std::string& companyId,
        const std::vector<domain::BalanceDelta>& deltas
    ) override {
        std::unique_lock<std::shared_mutex> lock(stateMutex_);

        std::vector<std::shared_ptr<domain::Account>> updated;
        updated.reserve(deltas.size());
        auto now = domain::Timestamp::now();

        for (const auto& delta : deltas) {
            auto current = accounts_.find(delta.accountId);
            if (!current || current->companyId != companyId) {
                throw domain::NotFoundError("Account not found: " + delta.accountId);
            }
            if (!current->acceptsPostings() && movesBalance(delta)) {
                throw domain::InvariantError("Account " + current->code + " is not postable");
            }
            auto next = std::make_shared<domain::Account>(*current);
            next->balance.debit += delta.debit;
            next->balance.credit += delta.credit;
            next->balance.balance += delta.balance;
            next->balance.functionalBalance += delta.functionalBalance;
            next->balance.updatedAt = now;
            updated.push_back(next);
        }

        for (const auto& account : updated) {
            accounts_.insert(account->id, account);
        }
    }

    void replaceBalances(
        const std::string& companyId,
        const std::vector<domain::BalanceDelta>& totals
    ) override {
        std::unique_lock<std::shared_mutex> lock(stateMutex_);

        std::unordered_map<std::string, const domain::BalanceDelta*> byAccount;
        for (const auto& total : totals) {
            auto current = accounts_.find(total.accountId);
            if (!current || current->companyId != companyId) {
                throw domain::NotFoundError("Account not found: " + total.accountId);
            }
            byAccount[total.accountId] = &total;
        }

        auto now = domain::Timestamp::now();
        auto companyAccounts = accounts_.select([&](const domain::Account& account) {
            return account.companyId == companyId;
        });

        for (const auto& current : companyAccounts) {
            auto next = std::make_shared<domain::Account>(*current);
            next->balance = domain::AccountBalance{};
            auto it = byAccount.find(current->id);
            if (it != byAccount.end()) {
                next->balance.debit = it->second->debit;
                next->balance.credit = it->second->credit;
                next->balance.balance = it->second->balance;
                next->balance.functionalBalance = it->second->functionalBalance;
            }
            next->balance.updatedAt = now;
            accounts_.insert(next->id, next);
        }
        std::cout << "[InMemoryAccountRepository] Replaced balances for " << companyAccounts.size()
                  << " accounts of company " << companyId << std::endl;
    }

    size_t size() const {
        return accounts_.size();
    }

    void clear() {
        std::unique_lock<std::shared_mutex> lock(stateMutex_);
        accounts_.clear();
        codeIndex_.clear();
    }

private:
    ThreadSafeMap<std::string, domain::Account> accounts_;
    std::unordered_map<std::string, std::string> codeIndex_;  // companyId/code -> accountId
    mutable std::shared_mutex stateMutex_;

    static bool movesBalance(const domain::BalanceDelta& delta) {
        return delta.debit != 0.0 || delta.credit != 0.0 ||
               delta.balance != 0.0 || delta.functionalBalance != 0.0;
    }

    static std::string codeKey(const std::string& companyId, const std::string& code) {
        return companyId + "/" + code;
    }

    void insertLocked(const domain::Account& account) {
        auto key = codeKey(account.companyId, account.code);
        if (!codeIndex_.emplace(key, account.id).second) {
            throw domain::ValidationError("Account code already exists: " + account.code);
        }
        if (!accounts_.insertIfAbsent(account.id, std::make_shared<domain::Account>(account))) {
            codeIndex_.erase(key);
            throw domain::ValidationError("Account already exists: " + account.id);
        }
    }
};

} // namespace ledger::adapters::secondary
