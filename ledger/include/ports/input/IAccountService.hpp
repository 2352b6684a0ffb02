#pragma once

#include "domain/AccountRequest.hpp"
#include "domain/Account.hpp"
#include <string>
#include <vector>
#include <optional>

namespace ledger::ports::input {

/**
 * @brief Интерфейс сервиса плана счетов
 *
 * Input Port для ведения дерева счетов компании. Сальдо счетов
 * здесь только читается: единственный путь записи - PostingEngine.
 */
class IAccountService {
public:
    virtual ~IAccountService() = default;

    /**
     * @brief Создать счёт
     *
     * @throws domain::ValidationError код занят или некорректен
     * @throws domain::NotFoundError родитель не найден
     * @throws domain::InvariantError класс счёта не совпадает с родителем
     */
    virtual domain::Account create(
        const std::string& companyId,
        const std::string& userId,
        const domain::AccountCreateRequest& request
    ) = 0;

    /**
     * @brief Изменить атрибуты счёта
     *
     * При смене родителя пересчитываются level, ancestorIds и path
     * для счёта и всего его поддерева.
     *
     * @throws domain::ForbiddenError архивация системного счёта
     * @throws domain::InvariantError несовпадение класса или цикл в дереве
     */
    virtual domain::Account update(
        const std::string& companyId,
        const std::string& accountId,
        const std::string& userId,
        const domain::AccountUpdateRequest& request
    ) = 0;

    /**
     * @brief Архивировать счёт (мягкое удаление)
     *
     * @throws domain::ConflictError ненулевое сальдо или есть дочерние счета
     * @throws domain::ForbiddenError системный счёт
     */
    virtual domain::Account archive(
        const std::string& companyId,
        const std::string& accountId,
        const std::string& userId
    ) = 0;

    virtual std::optional<domain::Account> getById(
        const std::string& companyId,
        const std::string& accountId
    ) = 0;

    virtual std::optional<domain::Account> getByCode(
        const std::string& companyId,
        const std::string& code
    ) = 0;

    /**
     * @brief Выборка счетов, отсортированная по коду
     */
    virtual std::vector<domain::Account> getAll(
        const std::string& companyId,
        const domain::AccountFilter& filter
    ) = 0;

    /**
     * @brief Лес активных счетов, братья отсортированы по коду
     */
    virtual std::vector<domain::AccountTreeNode> getTree(const std::string& companyId) = 0;

    /**
     * @brief Заполнить стандартный план счетов
     *
     * @throws domain::ConflictError у компании уже есть счета
     */
    virtual std::vector<domain::Account> initializeDefaultAccounts(
        const std::string& companyId,
        const std::string& userId
    ) = 0;
};

} // namespace ledger::ports::input
