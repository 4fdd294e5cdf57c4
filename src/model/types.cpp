#include "switchboard/model/types.hpp"

#include <array>
#include <utility>

#include "switchboard/errors.hpp"

namespace switchboard {

namespace {

template <typename Enum, std::size_t N>
Enum parse_enum(const std::array<std::pair<const char*, Enum>, N>& table,
                const std::string& value,
                const char* what) {
    for (const auto& entry : table) {
        if (value == entry.first) {
            return entry.second;
        }
    }
    throw InvalidValue(std::string("unknown ") + what + ": '" + value + "'");
}

const std::array<std::pair<const char*, SessionState>, 7> kSessionStates = {{
    {"ringing", SessionState::Ringing},
    {"connecting", SessionState::Connecting},
    {"connected", SessionState::Connected},
    {"on_hold", SessionState::OnHold},
    {"parked", SessionState::Parked},
    {"transferring", SessionState::Transferring},
    {"ended", SessionState::Ended},
}};

const std::array<std::pair<const char*, Direction>, 2> kDirections = {{
    {"inbound", Direction::Inbound},
    {"outbound", Direction::Outbound},
}};

const std::array<std::pair<const char*, CallOutcome>, 6> kOutcomes = {{
    {"answered", CallOutcome::Answered},
    {"voicemail", CallOutcome::Voicemail},
    {"missed", CallOutcome::Missed},
    {"busy", CallOutcome::Busy},
    {"failed", CallOutcome::Failed},
    {"cancelled", CallOutcome::Cancelled},
}};

const std::array<std::pair<const char*, AgentStatus>, 5> kAgentStatuses = {{
    {"available", AgentStatus::Available},
    {"busy", AgentStatus::Busy},
    {"on_call", AgentStatus::OnCall},
    {"on_break", AgentStatus::OnBreak},
    {"offline", AgentStatus::Offline},
}};

const std::array<std::pair<const char*, TransferStatus>, 4> kTransferStatuses = {{
    {"ringing", TransferStatus::Ringing},
    {"accepted", TransferStatus::Accepted},
    {"declined", TransferStatus::Declined},
    {"timeout", TransferStatus::Timeout},
}};

const std::array<std::pair<const char*, TransferKind>, 2> kTransferKinds = {{
    {"direct", TransferKind::Direct},
    {"from_park", TransferKind::FromPark},
}};

const std::array<std::pair<const char*, RingingStatus>, 4> kRingingStatuses = {{
    {"ringing", RingingStatus::Ringing},
    {"accepted", RingingStatus::Accepted},
    {"declined", RingingStatus::Declined},
    {"expired", RingingStatus::Expired},
}};

template <typename Enum, std::size_t N>
const char* name_of(const std::array<std::pair<const char*, Enum>, N>& table, Enum value) {
    for (const auto& entry : table) {
        if (entry.second == value) {
            return entry.first;
        }
    }
    return "unknown";
}

}

const char* to_string(SessionState state) {
    return name_of(kSessionStates, state);
}

const char* to_string(Direction direction) {
    return name_of(kDirections, direction);
}

const char* to_string(CallOutcome outcome) {
    return name_of(kOutcomes, outcome);
}

const char* to_string(AgentStatus status) {
    return name_of(kAgentStatuses, status);
}

const char* to_string(TransferStatus status) {
    return name_of(kTransferStatuses, status);
}

const char* to_string(TransferKind kind) {
    return name_of(kTransferKinds, kind);
}

const char* to_string(RingingStatus status) {
    return name_of(kRingingStatuses, status);
}

SessionState parse_session_state(const std::string& value) {
    return parse_enum(kSessionStates, value, "session state");
}

Direction parse_direction(const std::string& value) {
    return parse_enum(kDirections, value, "direction");
}

CallOutcome parse_call_outcome(const std::string& value) {
    return parse_enum(kOutcomes, value, "call outcome");
}

AgentStatus parse_agent_status(const std::string& value) {
    return parse_enum(kAgentStatuses, value, "agent status");
}

TransferStatus parse_transfer_status(const std::string& value) {
    return parse_enum(kTransferStatuses, value, "transfer status");
}

TransferKind parse_transfer_kind(const std::string& value) {
    return parse_enum(kTransferKinds, value, "transfer kind");
}

RingingStatus parse_ringing_status(const std::string& value) {
    return parse_enum(kRingingStatuses, value, "ringing status");
}

}
