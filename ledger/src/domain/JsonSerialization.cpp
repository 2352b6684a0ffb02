#include "domain/JsonSerialization.hpp"

namespace ledger::domain {

namespace {

void putOptional(nlohmann::json& j, const char* key, const std::optional<std::string>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

std::optional<std::string> getOptional(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<std::string>();
}

} // namespace

void to_json(nlohmann::json& j, const LineDimensions& dimensions) {
    j = nlohmann::json::object();
    putOptional(j, "departmentId", dimensions.departmentId);
    putOptional(j, "projectId", dimensions.projectId);
    putOptional(j, "costCenterId", dimensions.costCenterId);
}

void from_json(const nlohmann::json& j, LineDimensions& dimensions) {
    dimensions.departmentId = getOptional(j, "departmentId");
    dimensions.projectId = getOptional(j, "projectId");
    dimensions.costCenterId = getOptional(j, "costCenterId");
}

void to_json(nlohmann::json& j, const JournalLine& line) {
    j = nlohmann::json{
        {"id", line.id},
        {"lineNumber", line.lineNumber},
        {"accountId", line.accountId},
        {"accountCode", line.accountCode},
        {"accountName", line.accountName},
        {"description", line.description},
        {"debit", line.debit},
        {"credit", line.credit},
        {"currency", line.currency},
        {"exchangeRate", line.exchangeRate},
        {"functionalDebit", line.functionalDebit},
        {"functionalCredit", line.functionalCredit}
    };
    j["dimensions"] = line.dimensions;
}

void from_json(const nlohmann::json& j, JournalLine& line) {
    line.id = j.value("id", "");
    line.lineNumber = j.value("lineNumber", 0);
    line.accountId = j.at("accountId").get<std::string>();
    line.accountCode = j.value("accountCode", "");
    line.accountName = j.value("accountName", "");
    line.description = j.value("description", "");
    line.debit = j.value("debit", 0.0);
    line.credit = j.value("credit", 0.0);
    line.currency = j.value("currency", "");
    line.exchangeRate = j.value("exchangeRate", 1.0);
    line.functionalDebit = j.value("functionalDebit", line.debit);
    line.functionalCredit = j.value("functionalCredit", line.credit);
    if (j.contains("dimensions") && j["dimensions"].is_object()) {
        line.dimensions = j["dimensions"].get<LineDimensions>();
    }
}

void to_json(nlohmann::json& j, const ApprovalRecord& record) {
    j = nlohmann::json{
        {"action", record.action},
        {"userId", record.userId},
        {"timestamp", record.timestamp.toString()},
        {"comments", record.comments}
    };
}

void from_json(const nlohmann::json& j, ApprovalRecord& record) {
    record.action = j.value("action", "");
    record.userId = j.value("userId", "");
    if (j.contains("timestamp")) {
        record.timestamp = Timestamp::fromString(j["timestamp"].get<std::string>());
    }
    record.comments = j.value("comments", "");
}

void to_json(nlohmann::json& j, const TrialBalanceEntry& entry) {
    j = nlohmann::json{
        {"accountId", entry.accountId},
        {"accountCode", entry.accountCode},
        {"accountName", entry.accountName},
        {"accountType", toString(entry.accountType)},
        {"debit", entry.debit},
        {"credit", entry.credit},
        {"balance", entry.balance},
        {"isAbnormal", entry.isAbnormal}
    };
}

std::string TrialBalance::toJson() const {
    nlohmann::json j;
    j["companyId"] = companyId;
    j["asOfDate"] = asOfDate.toString();
    j["fiscalYear"] = fiscalYear;
    if (fiscalPeriod) {
        j["fiscalPeriod"] = *fiscalPeriod;
    } else {
        j["fiscalPeriod"] = nullptr;
    }
    j["entries"] = entries;
    j["totalDebits"] = totalDebits;
    j["totalCredits"] = totalCredits;
    j["isBalanced"] = isBalanced;
    j["abnormalCount"] = abnormalCount;
    j["generatedAt"] = generatedAt.toString();
    j["generatedBy"] = generatedBy;
    return j.dump();
}

} // namespace ledger::domain
