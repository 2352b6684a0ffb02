#pragma once

#include <string>

namespace ledger::domain {

/**
 * @brief Приращение сальдо одного счёта за одну проводку
 *
 * Все поля складываются с текущим снимком AccountBalance.
 * balance и functionalBalance уже ориентированы по нормальной стороне счёта.
 */
struct BalanceDelta {
    std::string accountId;
    double debit = 0.0;
    double credit = 0.0;
    double balance = 0.0;
    double functionalBalance = 0.0;

    /**
     * @brief Обратное приращение (для отката проведения)
     */
    BalanceDelta inverted() const {
        BalanceDelta result;
        result.accountId = accountId;
        result.debit = -debit;
        result.credit = -credit;
        result.balance = -balance;
        result.functionalBalance = -functionalBalance;
        return result;
    }
};

} // namespace ledger::domain
