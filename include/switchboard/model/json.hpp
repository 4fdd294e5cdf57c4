#pragma once

#include <nlohmann/json.hpp>

#include "switchboard/model/types.hpp"

namespace switchboard {

void to_json(nlohmann::json& out, const Session& session);
// Throws nlohmann::json::exception for missing fields and InvalidValue for unknown enum values.
void from_json(const nlohmann::json& in, Session& session);
void to_json(nlohmann::json& out, const CallHistoryRecord& record);
void to_json(nlohmann::json& out, const HistoryStats& stats);
void to_json(nlohmann::json& out, const ParkingSlot& slot);
void to_json(nlohmann::json& out, const PendingTransfer& transfer);
void to_json(nlohmann::json& out, const TargetedRinging& ringing);
void to_json(nlohmann::json& out, const AgentPresence& presence);
void to_json(nlohmann::json& out, const AgentDailyMetrics& metrics);

}
