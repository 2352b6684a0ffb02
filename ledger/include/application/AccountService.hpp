#pragma once

#include "ports/input/IAccountService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "settings/ILedgerSettings.hpp"
#include "application/DefaultChartOfAccounts.hpp"
#include "domain/LedgerErrors.hpp"
#include "utils/UuidGenerator.hpp"
#include <KeyedMutex.hpp>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <unordered_map>
#include <unordered_set>

namespace ledger::application {

/**
 * @brief Сервис плана счетов
 *
 * Реализует IAccountService: создание, изменение и архивация счетов,
 * построение дерева. Инварианты дерева:
 * - класс дочернего счёта совпадает с классом родителя;
 * - level = min(parent.level + 1, DETAIL), у корня TYPE;
 * - ancestorIds идут от корня к родителю, path - коды через "/".
 *
 * Изменения структуры плана одной компании сериализуются через KeyedMutex
 * по companyId: проверка родителя, пересчёт поддерева и архивация видят
 * согласованное дерево. Сальдо при этом не блокируется; атомарность
 * "нулевое сальдо и архивация" обеспечивает IAccountRepository::update().
 */
class AccountService : public ports::input::IAccountService {
public:
    AccountService(
        std::shared_ptr<ports::output::IAccountRepository> accountRepository,
        std::shared_ptr<settings::ILedgerSettings> settings
    ) : accountRepository_(std::move(accountRepository))
      , settings_(std::move(settings))
    {}

    domain::Account create(
        const std::string& companyId,
        const std::string& userId,
        const domain::AccountCreateRequest& request
    ) override {
        validateCode(request.code);
        if (request.name.empty()) {
            throw domain::ValidationError("Account name is required");
        }

        bool isPostable = request.isPostable.value_or(!request.isHeader);
        validateFlags(request.isHeader, isPostable);

        auto guard = structure_.lock(companyId);
        if (accountRepository_->findByCode(companyId, request.code)) {
            throw domain::ValidationError("Account with code " + request.code + " already exists");
        }

        domain::Account account(
            utils::UuidGenerator::generate(),
            companyId,
            request.code,
            request.name,
            request.type,
            request.currency.value_or(settings_->getFunctionalCurrency())
        );
        account.description = request.description;
        account.subType = request.subType;
        account.isHeader = request.isHeader;
        account.isPostable = isPostable;
        account.tags = request.tags;
        account.createdBy = userId;
        account.updatedBy = userId;

        if (request.parentId) {
            auto parent = requireAccount(companyId, *request.parentId, "Parent account");
            if (parent.type != request.type) {
                throw domain::InvariantError("Child account must have same type as parent: " +
                                             domain::toString(request.type) + " != " +
                                             domain::toString(parent.type));
            }
            attachToParent(account, parent);
        }

        accountRepository_->save(account);
        std::cout << "[AccountService] Created account " << account.code << " " << account.name
                  << " (" << domain::toString(account.type) << ")" << std::endl;
        return account;
    }

    domain::Account update(
        const std::string& companyId,
        const std::string& accountId,
        const std::string& userId,
        const domain::AccountUpdateRequest& request
    ) override {
        auto guard = structure_.lock(companyId);
        auto account = requireAccount(companyId, accountId, "Account");

        if (request.status == domain::AccountStatus::ARCHIVED && !account.isArchived()) {
            ensureArchivable(companyId, account);
        }

        if (request.name) {
            if (request.name->empty()) {
                throw domain::ValidationError("Account name is required");
            }
            account.name = *request.name;
        }
        if (request.description) account.description = *request.description;
        if (request.subType) account.subType = *request.subType;
        if (request.isHeader) account.isHeader = *request.isHeader;
        if (request.isPostable) account.isPostable = *request.isPostable;
        if (request.status) account.status = *request.status;
        if (request.tags) account.tags = *request.tags;
        validateFlags(account.isHeader, account.isPostable);
        if (!account.acceptsPostings() && !account.balance.isZero()) {
            throw domain::ConflictError("Account " + account.code +
                                        " has a non-zero balance and must stay postable");
        }

        std::vector<domain::Account> movedSubtree;
        if (request.changeParent && request.parentId != account.parentId) {
            movedSubtree = reparent(companyId, account, request.parentId);
        }

        account.updatedBy = userId;
        account.updatedAt = domain::Timestamp::now();
        accountRepository_->update(account);

        for (auto& descendant : movedSubtree) {
            descendant.updatedBy = userId;
            descendant.updatedAt = account.updatedAt;
            accountRepository_->update(descendant);
        }

        std::cout << "[AccountService] Updated account " << account.code;
        if (!movedSubtree.empty()) {
            std::cout << " (moved subtree of " << movedSubtree.size() << " accounts)";
        }
        std::cout << std::endl;
        return account;
    }

    domain::Account archive(
        const std::string& companyId,
        const std::string& accountId,
        const std::string& userId
    ) override {
        auto guard = structure_.lock(companyId);
        auto account = requireAccount(companyId, accountId, "Account");
        if (account.isArchived()) {
            throw domain::ConflictError("Account " + account.code + " is already archived");
        }
        ensureArchivable(companyId, account);

        account.status = domain::AccountStatus::ARCHIVED;
        account.updatedBy = userId;
        account.updatedAt = domain::Timestamp::now();
        accountRepository_->update(account);

        std::cout << "[AccountService] Archived account " << account.code << std::endl;
        return account;
    }

    std::optional<domain::Account> getById(
        const std::string& companyId,
        const std::string& accountId
    ) override {
        return accountRepository_->findById(companyId, accountId);
    }

    std::optional<domain::Account> getByCode(
        const std::string& companyId,
        const std::string& code
    ) override {
        return accountRepository_->findByCode(companyId, code);
    }

    std::vector<domain::Account> getAll(
        const std::string& companyId,
        const domain::AccountFilter& filter
    ) override {
        return accountRepository_->findAll(companyId, filter);
    }

    std::vector<domain::AccountTreeNode> getTree(const std::string& companyId) override {
        domain::AccountFilter filter;
        filter.statuses = {domain::AccountStatus::ACTIVE};
        auto accounts = accountRepository_->findAll(companyId, filter);

        std::unordered_set<std::string> ids;
        for (const auto& account : accounts) {
            ids.insert(account.id);
        }

        // Счёт с неактивным родителем поднимается в корень
        std::unordered_map<std::string, std::vector<const domain::Account*>> childrenOf;
        std::vector<const domain::Account*> roots;
        for (const auto& account : accounts) {
            if (account.parentId && ids.count(*account.parentId) > 0) {
                childrenOf[*account.parentId].push_back(&account);
            } else {
                roots.push_back(&account);
            }
        }

        return buildLevel(roots, childrenOf);
    }

    std::vector<domain::Account> initializeDefaultAccounts(
        const std::string& companyId,
        const std::string& userId
    ) override {
        auto guard = structure_.lock(companyId);
        if (!accountRepository_->findAll(companyId, domain::AccountFilter{}).empty()) {
            throw domain::ConflictError("Company " + companyId + " already has a chart of accounts");
        }

        std::vector<domain::Account> accounts;
        std::unordered_map<std::string, size_t> byCode;

        for (const auto& tpl : defaultChartOfAccounts()) {
            domain::Account account(
                utils::UuidGenerator::generate(),
                companyId,
                tpl.code,
                tpl.name,
                tpl.type,
                tpl.currency.value_or(settings_->getFunctionalCurrency())
            );
            account.subType = tpl.subType;
            account.isHeader = tpl.isHeader;
            account.isPostable = !tpl.isHeader;
            account.isSystem = tpl.systemKey.has_value();
            account.systemKey = tpl.systemKey;
            account.createdBy = userId;
            account.updatedBy = userId;

            if (tpl.parentCode) {
                auto it = byCode.find(*tpl.parentCode);
                if (it == byCode.end()) {
                    throw domain::InvariantError("Default chart parent " + *tpl.parentCode +
                                                 " is declared after " + tpl.code);
                }
                attachToParent(account, accounts[it->second]);
            }

            byCode[account.code] = accounts.size();
            accounts.push_back(account);
        }

        accountRepository_->saveBatch(accounts);
        std::cout << "[AccountService] Initialized " << accounts.size()
                  << " default accounts for company " << companyId << std::endl;
        return accounts;
    }

private:
    std::shared_ptr<ports::output::IAccountRepository> accountRepository_;
    std::shared_ptr<settings::ILedgerSettings> settings_;
    KeyedMutex structure_;

    domain::Account requireAccount(
        const std::string& companyId,
        const std::string& accountId,
        const std::string& what
    ) {
        auto account = accountRepository_->findById(companyId, accountId);
        if (!account) {
            throw domain::NotFoundError(what + " " + accountId + " not found");
        }
        return *account;
    }

    void validateCode(const std::string& code) const {
        auto length = static_cast<size_t>(settings_->getAccountCodeLength());
        bool digits = std::all_of(code.begin(), code.end(),
                                  [](unsigned char c) { return std::isdigit(c) != 0; });
        if (code.size() != length || !digits) {
            throw domain::ValidationError("Account code must be " + std::to_string(length) +
                                          " digits: '" + code + "'");
        }
    }

    static void validateFlags(bool isHeader, bool isPostable) {
        if (isHeader && isPostable) {
            throw domain::ValidationError("Header account cannot be postable");
        }
    }

    static void attachToParent(domain::Account& account, const domain::Account& parent) {
        account.parentId = parent.id;
        account.level = domain::childLevelOf(parent.level);
        account.ancestorIds = parent.ancestorIds;
        account.ancestorIds.push_back(parent.id);
        account.path = parent.path + "/" + account.code;
    }

    static void detachToRoot(domain::Account& account) {
        account.parentId.reset();
        account.level = domain::AccountLevel::TYPE;
        account.ancestorIds.clear();
        account.path = account.code;
    }

    /**
     * @throws domain::ForbiddenError системный счёт
     * @throws domain::ConflictError ненулевое сальдо или неархивные дочерние счета
     */
    void ensureArchivable(const std::string& companyId, const domain::Account& account) {
        if (account.isSystem) {
            throw domain::ForbiddenError("Cannot archive system account " + account.code);
        }
        if (!account.balance.isZero()) {
            throw domain::ConflictError("Cannot archive account " + account.code +
                                        " with non-zero balance");
        }

        domain::AccountFilter filter;
        filter.parentId = account.id;
        filter.statuses = {domain::AccountStatus::ACTIVE, domain::AccountStatus::INACTIVE};
        if (!accountRepository_->findAll(companyId, filter).empty()) {
            throw domain::ConflictError("Cannot archive account " + account.code +
                                        " with child accounts");
        }
    }

    /**
     * @brief Перенести счёт под нового родителя
     * @return Потомки с пересчитанными level, ancestorIds и path
     */
    std::vector<domain::Account> reparent(
        const std::string& companyId,
        domain::Account& account,
        const std::optional<std::string>& newParentId
    ) {
        if (newParentId) {
            auto parent = requireAccount(companyId, *newParentId, "Parent account");
            if (parent.id == account.id || parent.isDescendantOf(account.id)) {
                throw domain::InvariantError("Account " + account.code +
                                             " cannot be moved under its own subtree");
            }
            if (parent.type != account.type) {
                throw domain::InvariantError("Parent must have same account type: " +
                                             domain::toString(account.type) + " != " +
                                             domain::toString(parent.type));
            }
            attachToParent(account, parent);
        } else {
            detachToRoot(account);
        }

        auto descendants = accountRepository_->findAll(companyId, domain::AccountFilter{});
        descendants.erase(
            std::remove_if(descendants.begin(), descendants.end(),
                           [&](const domain::Account& a) { return !a.isDescendantOf(account.id); }),
            descendants.end());

        // Родитель пересчитывается раньше своих детей
        std::sort(descendants.begin(), descendants.end(),
                  [](const domain::Account& a, const domain::Account& b) {
                      return a.ancestorIds.size() < b.ancestorIds.size();
                  });

        std::unordered_map<std::string, const domain::Account*> recomputed;
        recomputed[account.id] = &account;
        for (auto& descendant : descendants) {
            auto parentIt = recomputed.find(*descendant.parentId);
            if (parentIt == recomputed.end()) {
                throw domain::InvariantError("Broken ancestry for account " + descendant.code);
            }
            attachToParent(descendant, *parentIt->second);
            recomputed[descendant.id] = &descendant;
        }
        return descendants;
    }

    static std::vector<domain::AccountTreeNode> buildLevel(
        std::vector<const domain::Account*> accounts,
        const std::unordered_map<std::string, std::vector<const domain::Account*>>& childrenOf
    ) {
        std::sort(accounts.begin(), accounts.end(),
                  [](const domain::Account* a, const domain::Account* b) { return a->code < b->code; });

        std::vector<domain::AccountTreeNode> nodes;
        nodes.reserve(accounts.size());
        for (const auto* account : accounts) {
            domain::AccountTreeNode node;
            node.account = *account;
            auto it = childrenOf.find(account->id);
            if (it != childrenOf.end()) {
                node.children = buildLevel(it->second, childrenOf);
            }
            nodes.push_back(std::move(node));
        }
        return nodes;
    }
};

} // namespace ledger::application
