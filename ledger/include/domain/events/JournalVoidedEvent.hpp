// include/domain/events/JournalVoidedEvent.hpp
#pragma once

#include "DomainEvent.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Событие: черновик или утверждённая проводка аннулированы
 */
struct JournalVoidedEvent : public DomainEvent {
    std::string journalId;
    std::string journalNumber;
    std::string reason;
    std::string voidedBy;

    JournalVoidedEvent() : DomainEvent("journal.voided") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<JournalVoidedEvent>(*this);
    }
};

} // namespace ledger::domain
