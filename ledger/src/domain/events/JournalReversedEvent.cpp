#include "domain/events/JournalReversedEvent.hpp"
#include <nlohmann/json.hpp>

namespace ledger::domain {

std::string JournalReversedEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["companyId"] = companyId;
    j["originalId"] = originalId;
    j["originalNumber"] = originalNumber;
    j["reversalId"] = reversalId;
    j["reversalNumber"] = reversalNumber;
    j["reversalDate"] = reversalDate.toString();
    j["reversedBy"] = reversedBy;
    return j.dump();
}

} // namespace ledger::domain
