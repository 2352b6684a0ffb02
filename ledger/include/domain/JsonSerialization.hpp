// include/domain/JsonSerialization.hpp
#pragma once

#include "domain/JournalEntry.hpp"
#include "domain/TrialBalance.hpp"
#include <nlohmann/json.hpp>

namespace ledger::domain {

/**
 * @brief Конвертеры nlohmann::json для вложенных структур
 *
 * Строки проводки и история согласования хранятся в PostgreSQL как JSONB,
 * ведомость отдаётся модулям отчётности как JSON.
 */
void to_json(nlohmann::json& j, const LineDimensions& dimensions);
void from_json(const nlohmann::json& j, LineDimensions& dimensions);

void to_json(nlohmann::json& j, const JournalLine& line);
void from_json(const nlohmann::json& j, JournalLine& line);

void to_json(nlohmann::json& j, const ApprovalRecord& record);
void from_json(const nlohmann::json& j, ApprovalRecord& record);

void to_json(nlohmann::json& j, const TrialBalanceEntry& entry);

} // namespace ledger::domain
