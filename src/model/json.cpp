#include "switchboard/model/json.hpp"

namespace switchboard {

namespace {

template <typename T>
nlohmann::json optional_value(const std::optional<T>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

template <typename T>
void read_optional(const nlohmann::json& in, const char* key, std::optional<T>& target) {
    const auto it = in.find(key);
    if (it == in.end() || it->is_null()) {
        target.reset();
        return;
    }
    target = it->get<T>();
}

}

void to_json(nlohmann::json& out, const Session& session) {
    out = nlohmann::json{
        {"id", session.id},
        {"tenant_id", session.tenant_id},
        {"provider_call_id", session.provider_call_id},
        {"direction", to_string(session.direction)},
        {"from", session.from},
        {"from_name", optional_value(session.from_name)},
        {"to", session.to},
        {"to_name", optional_value(session.to_name)},
        {"state", to_string(session.state)},
        {"assigned_agent", optional_value(session.assigned_agent)},
        {"previous_agent", optional_value(session.previous_agent)},
        {"parking_slot", optional_value(session.parking_slot)},
        {"agent_leg_id", optional_value(session.agent_leg_id)},
        {"conference_name", optional_value(session.conference_name)},
        {"started_at", session.started_at},
        {"answered_at", optional_value(session.answered_at)},
        {"ended_at", optional_value(session.ended_at)},
        {"hold_started_at", optional_value(session.hold_started_at)},
        {"hold_accumulated_ms", session.hold_accumulated_ms},
        {"is_recording", session.is_recording},
        {"recording_id", optional_value(session.recording_id)},
        {"notes", optional_value(session.notes)},
        {"correlation_id", optional_value(session.correlation_id)},
    };
}

void from_json(const nlohmann::json& in, Session& session) {
    session.id = in.at("id").get<SessionId>();
    session.tenant_id = in.at("tenant_id").get<std::string>();
    session.provider_call_id = in.at("provider_call_id").get<std::string>();
    session.direction = parse_direction(in.at("direction").get<std::string>());
    session.from = in.at("from").get<std::string>();
    read_optional(in, "from_name", session.from_name);
    session.to = in.at("to").get<std::string>();
    read_optional(in, "to_name", session.to_name);
    session.state = parse_session_state(in.at("state").get<std::string>());
    read_optional(in, "assigned_agent", session.assigned_agent);
    read_optional(in, "previous_agent", session.previous_agent);
    read_optional(in, "parking_slot", session.parking_slot);
    read_optional(in, "agent_leg_id", session.agent_leg_id);
    read_optional(in, "conference_name", session.conference_name);
    session.started_at = in.at("started_at").get<TimestampMs>();
    read_optional(in, "answered_at", session.answered_at);
    read_optional(in, "ended_at", session.ended_at);
    read_optional(in, "hold_started_at", session.hold_started_at);
    session.hold_accumulated_ms = in.value("hold_accumulated_ms", TimestampMs{0});
    session.is_recording = in.value("is_recording", false);
    read_optional(in, "recording_id", session.recording_id);
    read_optional(in, "notes", session.notes);
    read_optional(in, "correlation_id", session.correlation_id);
}

void to_json(nlohmann::json& out, const CallHistoryRecord& record) {
    out = nlohmann::json{
        {"id", record.id},
        {"tenant_id", record.tenant_id},
        {"provider_call_id", record.provider_call_id},
        {"direction", to_string(record.direction)},
        {"from", record.from},
        {"from_name", optional_value(record.from_name)},
        {"to", record.to},
        {"to_name", optional_value(record.to_name)},
        {"outcome", to_string(record.outcome)},
        {"handled_by_agent", optional_value(record.handled_by_agent)},
        {"transferred_from_agent", optional_value(record.transferred_from_agent)},
        {"started_at", record.started_at},
        {"answered_at", optional_value(record.answered_at)},
        {"ended_at", record.ended_at},
        {"duration_sec", record.duration_sec},
        {"talk_time_sec", record.talk_time_sec},
        {"hold_time_sec", record.hold_time_sec},
        {"notes", optional_value(record.notes)},
    };
}

void to_json(nlohmann::json& out, const HistoryStats& stats) {
    out = nlohmann::json{
        {"tenant_id", stats.tenant_id},
        {"from", stats.from},
        {"to", stats.to},
        {"agent_id", optional_value(stats.agent_id)},
        {"total_calls", stats.total_calls},
        {"inbound_answered", stats.inbound_answered},
        {"inbound_missed", stats.inbound_missed},
        {"outbound", stats.outbound},
        {"total_talk_time_sec", stats.total_talk_time_sec},
        {"average_talk_time_sec", stats.average_talk_time_sec},
    };
}

void to_json(nlohmann::json& out, const ParkingSlot& slot) {
    out = nlohmann::json{
        {"tenant_id", slot.tenant_id},
        {"slot_number", slot.slot_number},
        {"occupied", slot.occupied},
        {"session_id", optional_value(slot.session_id)},
        {"parked_by_agent", optional_value(slot.parked_by_agent)},
        {"parked_at", optional_value(slot.parked_at)},
        {"conference_name", optional_value(slot.conference_name)},
        {"caller_number", optional_value(slot.caller_number)},
        {"caller_name", optional_value(slot.caller_name)},
    };
}

void to_json(nlohmann::json& out, const PendingTransfer& transfer) {
    out = nlohmann::json{
        {"id", transfer.id},
        {"tenant_id", transfer.tenant_id},
        {"session_id", transfer.session_id},
        {"provider_call_id", transfer.provider_call_id},
        {"source_agent", optional_value(transfer.source_agent)},
        {"target_agent", transfer.target_agent},
        {"target_leg_id", optional_value(transfer.target_leg_id)},
        {"status", to_string(transfer.status)},
        {"kind", to_string(transfer.kind)},
        {"return_to_slot", optional_value(transfer.return_to_slot)},
        {"created_at", transfer.created_at},
        {"expires_at", transfer.expires_at},
    };
}

void to_json(nlohmann::json& out, const TargetedRinging& ringing) {
    out = nlohmann::json{
        {"id", ringing.id},
        {"tenant_id", ringing.tenant_id},
        {"target_agent", ringing.target_agent},
        {"caller_number", ringing.caller_number},
        {"caller_name", optional_value(ringing.caller_name)},
        {"caller_leg_id", ringing.caller_leg_id},
        {"agent_leg_id", optional_value(ringing.agent_leg_id)},
        {"status", to_string(ringing.status)},
        {"created_at", ringing.created_at},
        {"expires_at", ringing.expires_at},
    };
}

void to_json(nlohmann::json& out, const AgentPresence& presence) {
    out = nlohmann::json{
        {"tenant_id", presence.tenant_id},
        {"agent_id", presence.agent_id},
        {"status", to_string(presence.status)},
        {"status_message", optional_value(presence.status_message)},
        {"last_heartbeat", presence.last_heartbeat},
        {"current_session", optional_value(presence.current_session)},
    };
}

void to_json(nlohmann::json& out, const AgentDailyMetrics& metrics) {
    out = nlohmann::json{
        {"tenant_id", metrics.tenant_id},
        {"agent_id", metrics.agent_id},
        {"date", metrics.date},
        {"calls_accepted", metrics.calls_accepted},
        {"inbound_accepted", metrics.inbound_accepted},
        {"outbound_made", metrics.outbound_made},
        {"talk_time_sec", metrics.talk_time_sec},
    };
}

}
