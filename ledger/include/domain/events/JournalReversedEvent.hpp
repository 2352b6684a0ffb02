// include/domain/events/JournalReversedEvent.hpp
#pragma once

#include "DomainEvent.hpp"
#include "domain/Date.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Событие: проводка сторнирована
 */
struct JournalReversedEvent : public DomainEvent {
    std::string originalId;
    std::string originalNumber;
    std::string reversalId;
    std::string reversalNumber;
    Date reversalDate;
    std::string reversedBy;

    JournalReversedEvent() : DomainEvent("journal.reversed") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<JournalReversedEvent>(*this);
    }
};

} // namespace ledger::domain
