#include "domain/events/JournalPostedEvent.hpp"
#include <nlohmann/json.hpp>

namespace ledger::domain {

std::string JournalPostedEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["companyId"] = companyId;
    j["journalId"] = journalId;
    j["journalNumber"] = journalNumber;
    j["date"] = date.toString();
    j["fiscalYear"] = fiscalYear;
    j["fiscalPeriod"] = fiscalPeriod;
    j["postedBy"] = postedBy;

    j["deltas"] = nlohmann::json::array();
    for (const auto& delta : deltas) {
        nlohmann::json item;
        item["accountId"] = delta.accountId;
        item["debit"] = delta.debit;
        item["credit"] = delta.credit;
        item["balance"] = delta.balance;
        item["functionalBalance"] = delta.functionalBalance;
        j["deltas"].push_back(item);
    }
    return j.dump();
}

} // namespace ledger::domain
