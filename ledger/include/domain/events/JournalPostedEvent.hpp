// include/domain/events/JournalPostedEvent.hpp
#pragma once

#include "DomainEvent.hpp"
#include "domain/BalanceDelta.hpp"
#include "domain/Date.hpp"
#include <string>
#include <vector>

namespace ledger::domain {

/**
 * @brief Событие: проводка проведена, сальдо счетов изменены
 */
struct JournalPostedEvent : public DomainEvent {
    std::string journalId;
    std::string journalNumber;
    Date date;
    int fiscalYear = 0;
    int fiscalPeriod = 0;
    std::string postedBy;
    std::vector<BalanceDelta> deltas;   ///< Применённые приращения по счетам

    JournalPostedEvent() : DomainEvent("journal.posted") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<JournalPostedEvent>(*this);
    }
};

} // namespace ledger::domain
