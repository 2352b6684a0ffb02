#include "domain/events/JournalVoidedEvent.hpp"
#include <nlohmann/json.hpp>

namespace ledger::domain {

std::string JournalVoidedEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["companyId"] = companyId;
    j["journalId"] = journalId;
    j["journalNumber"] = journalNumber;
    j["reason"] = reason;
    j["voidedBy"] = voidedBy;
    return j.dump();
}

} // namespace ledger::domain
