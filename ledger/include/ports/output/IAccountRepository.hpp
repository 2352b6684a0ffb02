#pragma once

#include "domain/Account.hpp"
#include "domain/AccountRequest.hpp"
#include "domain/BalanceDelta.hpp"
#include <string>
#include <optional>
#include <vector>

namespace ledger::ports::output {

/**
 * @brief Интерфейс репозитория плана счетов
 *
 * Output Port для хранения счетов компании. Все методы могут
 * блокироваться на вводе-выводе.
 *
 * Сальдо счетов меняется только через applyBalanceDeltas()
 * и replaceBalances(); update() сальдо не трогает.
 */
class IAccountRepository {
public:
    virtual ~IAccountRepository() = default;

    /**
     * @brief Сохранить новый счёт
     *
     * @throws domain::ValidationError если код уже занят в компании
     */
    virtual void save(const domain::Account& account) = 0;

    /**
     * @brief Сохранить набор новых счетов одной операцией
     *
     * Либо сохраняются все счета, либо ни один.
     *
     * @throws domain::ValidationError если хотя бы один код уже занят
     */
    virtual void saveBatch(const std::vector<domain::Account>& accounts) = 0;

    /**
     * @brief Обновить атрибуты счёта (без сальдо)
     *
     * Проверка сальдо и запись выполняются атомарно относительно
     * applyBalanceDeltas().
     *
     * @throws domain::NotFoundError если счёт не найден
     * @throws domain::ConflictError счёт с ненулевым сальдо перестаёт принимать обороты
     */
    virtual void update(const domain::Account& account) = 0;

    /**
     * @brief Найти счёт по ID
     *
     * @return Account или nullopt, если счёт отсутствует или принадлежит другой компании
     */
    virtual std::optional<domain::Account> findById(
        const std::string& companyId,
        const std::string& id
    ) = 0;

    /**
     * @brief Найти счёт по коду
     */
    virtual std::optional<domain::Account> findByCode(
        const std::string& companyId,
        const std::string& code
    ) = 0;

    /**
     * @brief Выборка счетов компании, отсортированная по коду
     */
    virtual std::vector<domain::Account> findAll(
        const std::string& companyId,
        const domain::AccountFilter& filter
    ) = 0;

    /**
     * @brief Атомарно применить приращения сальдо
     *
     * Каждый счёт читается и записывается ровно один раз. Если хотя бы
     * один счёт отсутствует или не принимает оборотов, не применяется
     * ни одно приращение.
     *
     * @throws domain::NotFoundError если счёт не найден
     * @throws domain::InvariantError ненулевое приращение на счёт, не принимающий оборотов
     */
    virtual void applyBalanceDeltas(
        const std::string& companyId,
        const std::vector<domain::BalanceDelta>& deltas
    ) = 0;

    /**
     * @brief Атомарно заменить снимки сальдо всех счетов компании
     *
     * Счета, которых нет в totals, обнуляются.
     */
    virtual void replaceBalances(
        const std::string& companyId,
        const std::vector<domain::BalanceDelta>& totals
    ) = 0;
};

} // namespace ledger::ports::output
