#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IJournalRepository.hpp"
#include "domain/BalanceDelta.hpp"
#include "domain/JournalLine.hpp"
#include "domain/LedgerErrors.hpp"
#include <iostream>
#include <memory>
#include <unordered_map>
#include <vector>

namespace ledger::application {

/**
 * @brief Движок проведения: единственный путь записи сальдо счетов
 *
 * Строки проводки сворачиваются в одно приращение на счёт и применяются
 * одной атомарной операцией репозитория. Повторный вызов для той же
 * проводки движок не отсекает: это делает статусный шлюз JournalService.
 */
class PostingEngine {
public:
    PostingEngine(
        std::shared_ptr<ports::output::IAccountRepository> accountRepository,
        std::shared_ptr<ports::output::IJournalRepository> journalRepository
    ) : accountRepository_(std::move(accountRepository))
      , journalRepository_(std::move(journalRepository))
    {}

    /**
     * @brief Свернуть строки в приращения по счетам
     *
     * Порядок приращений совпадает с порядком первого появления счёта в строках.
     *
     * @throws domain::NotFoundError счёт строки не найден
     */
    std::vector<domain::BalanceDelta> computeDeltas(
        const std::string& companyId,
        const std::vector<domain::JournalLine>& lines
    ) {
        return aggregate(companyId, lines, false);
    }

    /**
     * @brief Применить строки к сальдо
     *
     * Проводимость счетов проверяется заново: счёт мог быть архивирован
     * или стать группирующим после создания черновика.
     *
     * @return Применённые приращения
     * @throws domain::InvariantError счёт строки не проводимый
     */
    std::vector<domain::BalanceDelta> post(
        const std::string& companyId,
        const std::vector<domain::JournalLine>& lines
    ) {
        auto deltas = aggregate(companyId, lines, true);
        accountRepository_->applyBalanceDeltas(companyId, deltas);
        std::cout << "[PostingEngine] Applied " << deltas.size() << " balance deltas for company "
                  << companyId << std::endl;
        return deltas;
    }

    /**
     * @brief Откатить ранее применённые строки точными обратными приращениями
     */
    std::vector<domain::BalanceDelta> unpost(
        const std::string& companyId,
        const std::vector<domain::JournalLine>& lines
    ) {
        auto deltas = computeDeltas(companyId, lines);
        std::vector<domain::BalanceDelta> inverse;
        inverse.reserve(deltas.size());
        for (const auto& delta : deltas) {
            inverse.push_back(delta.inverted());
        }
        accountRepository_->applyBalanceDeltas(companyId, inverse);
        std::cout << "[PostingEngine] Reverted " << inverse.size() << " balance deltas for company "
                  << companyId << std::endl;
        return inverse;
    }

    /**
     * @brief Пересчитать снимки сальдо компании с нуля
     *
     * Проигрывает строки всех проводок в статусах POSTED и REVERSED
     * и заменяет снимки одной операцией.
     *
     * @return Итоговые сальдо по счетам, у которых были обороты
     */
    std::vector<domain::BalanceDelta> rebuildBalances(const std::string& companyId) {
        domain::JournalFilter filter;
        filter.statuses = {domain::JournalStatus::POSTED, domain::JournalStatus::REVERSED};
        auto journals = journalRepository_->findAll(companyId, filter);

        std::vector<domain::JournalLine> allLines;
        for (const auto& journal : journals) {
            allLines.insert(allLines.end(), journal.lines.begin(), journal.lines.end());
        }

        auto totals = computeDeltas(companyId, allLines);
        accountRepository_->replaceBalances(companyId, totals);
        std::cout << "[PostingEngine] Rebuilt balances from " << journals.size()
                  << " journals for company " << companyId << std::endl;
        return totals;
    }

private:
    std::shared_ptr<ports::output::IAccountRepository> accountRepository_;
    std::shared_ptr<ports::output::IJournalRepository> journalRepository_;

    std::vector<domain::BalanceDelta> aggregate(
        const std::string& companyId,
        const std::vector<domain::JournalLine>& lines,
        bool requirePostable
    ) {
        std::vector<domain::BalanceDelta> deltas;
        std::unordered_map<std::string, size_t> index;
        std::unordered_map<std::string, domain::AccountType> types;

        for (const auto& line : lines) {
            auto typeIt = types.find(line.accountId);
            if (typeIt == types.end()) {
                auto account = accountRepository_->findById(companyId, line.accountId);
                if (!account) {
                    throw domain::NotFoundError("Account not found: " + line.accountId);
                }
                if (requirePostable && !account->acceptsPostings()) {
                    throw domain::InvariantError("Account " + account->code + " is not postable");
                }
                typeIt = types.emplace(line.accountId, account->type).first;
            }

            auto [slot, inserted] = index.emplace(line.accountId, deltas.size());
            if (inserted) {
                domain::BalanceDelta delta;
                delta.accountId = line.accountId;
                deltas.push_back(delta);
            }

            auto& delta = deltas[slot->second];
            delta.debit += line.debit;
            delta.credit += line.credit;
            delta.balance += domain::signedContribution(typeIt->second, line.debit, line.credit);
            delta.functionalBalance += domain::signedContribution(
                typeIt->second, line.functionalDebit, line.functionalCredit);
        }
        return deltas;
    }
};

} // namespace ledger::application
