#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace switchboard {

using SessionId = std::int64_t;
using TransferId = std::int64_t;
using RingingId = std::int64_t;
using TimestampMs = std::int64_t;

enum class SessionState {
    Ringing,
    Connecting,
    Connected,
    OnHold,
    Parked,
    Transferring,
    Ended
};

enum class Direction {
    Inbound,
    Outbound
};

enum class CallOutcome {
    Answered,
    Voicemail,
    Missed,
    Busy,
    Failed,
    Cancelled
};

enum class AgentStatus {
    Available,
    Busy,
    OnCall,
    OnBreak,
    Offline
};

enum class TransferStatus {
    Ringing,
    Accepted,
    Declined,
    Timeout
};

enum class TransferKind {
    Direct,
    FromPark
};

enum class RingingStatus {
    Ringing,
    Accepted,
    Declined,
    Expired
};

const char* to_string(SessionState state);
const char* to_string(Direction direction);
const char* to_string(CallOutcome outcome);
const char* to_string(AgentStatus status);
const char* to_string(TransferStatus status);
const char* to_string(TransferKind kind);
const char* to_string(RingingStatus status);

// Each parser throws InvalidValue for anything outside the enumeration.
SessionState parse_session_state(const std::string& value);
Direction parse_direction(const std::string& value);
CallOutcome parse_call_outcome(const std::string& value);
AgentStatus parse_agent_status(const std::string& value);
TransferStatus parse_transfer_status(const std::string& value);
TransferKind parse_transfer_kind(const std::string& value);
RingingStatus parse_ringing_status(const std::string& value);

struct Session {
    SessionId id = 0;
    std::string tenant_id;
    std::string provider_call_id;
    Direction direction = Direction::Inbound;
    std::string from;
    std::optional<std::string> from_name;
    std::string to;
    std::optional<std::string> to_name;
    SessionState state = SessionState::Ringing;
    std::optional<std::string> assigned_agent;
    std::optional<std::string> previous_agent;
    std::optional<int> parking_slot;
    std::optional<std::string> agent_leg_id;
    std::optional<std::string> conference_name;
    TimestampMs started_at = 0;
    std::optional<TimestampMs> answered_at;
    std::optional<TimestampMs> ended_at;
    std::optional<TimestampMs> hold_started_at;
    TimestampMs hold_accumulated_ms = 0;
    bool is_recording = false;
    std::optional<std::string> recording_id;
    std::optional<std::string> notes;
    std::optional<std::string> correlation_id;

    // The counterparty is whoever is not the agent.
    const std::string& counterparty() const {
        return direction == Direction::Inbound ? from : to;
    }
};

struct CallHistoryRecord {
    std::int64_t id = 0;
    std::string tenant_id;
    std::string provider_call_id;
    Direction direction = Direction::Inbound;
    std::string from;
    std::optional<std::string> from_name;
    std::string to;
    std::optional<std::string> to_name;
    CallOutcome outcome = CallOutcome::Answered;
    std::optional<std::string> handled_by_agent;
    std::optional<std::string> transferred_from_agent;
    TimestampMs started_at = 0;
    std::optional<TimestampMs> answered_at;
    TimestampMs ended_at = 0;
    std::int64_t duration_sec = 0;
    std::int64_t talk_time_sec = 0;
    std::int64_t hold_time_sec = 0;
    std::optional<std::string> notes;
};

// Aggregates over call_history rows whose ended_at falls in [from, to).
struct HistoryStats {
    std::string tenant_id;
    TimestampMs from = 0;
    TimestampMs to = 0;
    std::optional<std::string> agent_id;
    std::int64_t total_calls = 0;
    std::int64_t inbound_answered = 0;
    std::int64_t inbound_missed = 0;
    std::int64_t outbound = 0;
    std::int64_t total_talk_time_sec = 0;
    // Over answered calls only; zero when none were answered.
    double average_talk_time_sec = 0.0;
};

struct ParkingSlot {
    std::string tenant_id;
    int slot_number = 0;
    bool occupied = false;
    std::optional<SessionId> session_id;
    std::optional<std::string> parked_by_agent;
    std::optional<TimestampMs> parked_at;
    std::optional<std::string> conference_name;
    std::optional<std::string> caller_number;
    std::optional<std::string> caller_name;
};

struct PendingTransfer {
    TransferId id = 0;
    std::string tenant_id;
    SessionId session_id = 0;
    std::string provider_call_id;
    std::optional<std::string> source_agent;
    std::string target_agent;
    std::optional<std::string> target_leg_id;
    TransferStatus status = TransferStatus::Ringing;
    TransferKind kind = TransferKind::Direct;
    std::optional<int> return_to_slot;
    TimestampMs created_at = 0;
    TimestampMs expires_at = 0;

    bool is_expired(TimestampMs now) const {
        return status == TransferStatus::Ringing && expires_at <= now;
    }
};

struct TargetedRinging {
    RingingId id = 0;
    std::string tenant_id;
    std::string target_agent;
    std::string caller_number;
    std::optional<std::string> caller_name;
    std::string caller_leg_id;
    std::optional<std::string> agent_leg_id;
    RingingStatus status = RingingStatus::Ringing;
    TimestampMs created_at = 0;
    TimestampMs expires_at = 0;

    bool is_expired(TimestampMs now) const {
        return status == RingingStatus::Ringing && expires_at <= now;
    }
};

struct AgentPresence {
    std::string tenant_id;
    std::string agent_id;
    AgentStatus status = AgentStatus::Offline;
    std::optional<std::string> status_message;
    TimestampMs last_heartbeat = 0;
    std::optional<SessionId> current_session;
};

struct AgentDailyMetrics {
    std::string tenant_id;
    std::string agent_id;
    std::string date;
    int calls_accepted = 0;
    int inbound_accepted = 0;
    int outbound_made = 0;
    std::int64_t talk_time_sec = 0;
};

}
