#include "switchboard/store/record_store.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include "switchboard/errors.hpp"
#include "switchboard/logging.hpp"
#include "switchboard/metrics.hpp"
#include "switchboard/model/json.hpp"

namespace switchboard {

using store::Statement;
using store::Transaction;

namespace {

constexpr const char* kSchema = R"(
CREATE TABLE IF NOT EXISTS sessions (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  tenant_id TEXT NOT NULL,
  provider_call_id TEXT NOT NULL UNIQUE,
  direction TEXT NOT NULL CHECK (direction IN ('inbound', 'outbound')),
  from_address TEXT NOT NULL,
  from_name TEXT,
  to_address TEXT NOT NULL,
  to_name TEXT,
  state TEXT NOT NULL CHECK (state IN ('ringing', 'connecting', 'connected', 'on_hold',
                                       'parked', 'transferring')),
  assigned_agent TEXT,
  previous_agent TEXT,
  parking_slot INTEGER,
  agent_leg_id TEXT,
  conference_name TEXT,
  started_at INTEGER NOT NULL,
  answered_at INTEGER,
  ended_at INTEGER,
  hold_started_at INTEGER,
  hold_accumulated_ms INTEGER NOT NULL DEFAULT 0,
  is_recording INTEGER NOT NULL DEFAULT 0,
  recording_id TEXT,
  notes TEXT,
  correlation_id TEXT,
  CHECK ((state = 'parked') = (parking_slot IS NOT NULL)),
  CHECK (state <> 'parked' OR assigned_agent IS NULL)
);
CREATE INDEX IF NOT EXISTS sessions_by_tenant_state ON sessions(tenant_id, state);
CREATE INDEX IF NOT EXISTS sessions_by_agent ON sessions(tenant_id, assigned_agent);
CREATE INDEX IF NOT EXISTS sessions_by_agent_leg ON sessions(agent_leg_id);

CREATE TABLE IF NOT EXISTS parking_slots (
  tenant_id TEXT NOT NULL,
  slot_number INTEGER NOT NULL CHECK (slot_number > 0),
  occupied INTEGER NOT NULL DEFAULT 0,
  session_id INTEGER UNIQUE,
  parked_by_agent TEXT,
  parked_at INTEGER,
  conference_name TEXT,
  caller_number TEXT,
  caller_name TEXT,
  PRIMARY KEY (tenant_id, slot_number),
  CHECK (occupied = (session_id IS NOT NULL))
);

CREATE TABLE IF NOT EXISTS pending_transfers (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  tenant_id TEXT NOT NULL,
  session_id INTEGER NOT NULL,
  provider_call_id TEXT NOT NULL,
  source_agent TEXT,
  target_agent TEXT NOT NULL,
  target_leg_id TEXT,
  status TEXT NOT NULL CHECK (status IN ('ringing', 'accepted', 'declined', 'timeout')),
  kind TEXT NOT NULL CHECK (kind IN ('direct', 'from_park')),
  return_to_slot INTEGER,
  created_at INTEGER NOT NULL,
  expires_at INTEGER NOT NULL,
  CHECK (expires_at > created_at)
);
CREATE INDEX IF NOT EXISTS transfers_by_target ON pending_transfers(tenant_id, target_agent, status);
CREATE INDEX IF NOT EXISTS transfers_by_expiry ON pending_transfers(status, expires_at);

CREATE TABLE IF NOT EXISTS targeted_ringing (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  tenant_id TEXT NOT NULL,
  target_agent TEXT NOT NULL,
  caller_number TEXT NOT NULL,
  caller_name TEXT,
  caller_leg_id TEXT NOT NULL,
  agent_leg_id TEXT,
  status TEXT NOT NULL CHECK (status IN ('ringing', 'accepted', 'declined', 'expired')),
  created_at INTEGER NOT NULL,
  expires_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS ringing_by_target ON targeted_ringing(tenant_id, target_agent, status);
CREATE INDEX IF NOT EXISTS ringing_by_caller_leg ON targeted_ringing(caller_leg_id);

CREATE TABLE IF NOT EXISTS call_history (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  tenant_id TEXT NOT NULL,
  provider_call_id TEXT NOT NULL UNIQUE,
  direction TEXT NOT NULL,
  from_address TEXT NOT NULL,
  from_name TEXT,
  to_address TEXT NOT NULL,
  to_name TEXT,
  outcome TEXT NOT NULL,
  handled_by_agent TEXT,
  transferred_from_agent TEXT,
  started_at INTEGER NOT NULL,
  answered_at INTEGER,
  ended_at INTEGER NOT NULL,
  duration_sec INTEGER NOT NULL,
  talk_time_sec INTEGER NOT NULL,
  hold_time_sec INTEGER NOT NULL,
  notes TEXT
);
CREATE INDEX IF NOT EXISTS history_by_tenant ON call_history(tenant_id, ended_at);
)";

constexpr const char* kSessionColumns =
    "id, tenant_id, provider_call_id, direction, from_address, from_name, to_address, to_name, "
    "state, assigned_agent, previous_agent, parking_slot, agent_leg_id, conference_name, "
    "started_at, answered_at, ended_at, hold_started_at, hold_accumulated_ms, is_recording, "
    "recording_id, notes, correlation_id";

constexpr const char* kTransferColumns =
    "id, tenant_id, session_id, provider_call_id, source_agent, target_agent, target_leg_id, "
    "status, kind, return_to_slot, created_at, expires_at";

constexpr const char* kRingingColumns =
    "id, tenant_id, target_agent, caller_number, caller_name, caller_leg_id, agent_leg_id, "
    "status, created_at, expires_at";

constexpr const char* kSlotColumns =
    "tenant_id, slot_number, occupied, session_id, parked_by_agent, parked_at, conference_name, "
    "caller_number, caller_name";

constexpr const char* kHistoryColumns =
    "id, tenant_id, provider_call_id, direction, from_address, from_name, to_address, to_name, "
    "outcome, handled_by_agent, transferred_from_agent, started_at, answered_at, ended_at, "
    "duration_sec, talk_time_sec, hold_time_sec, notes";

Session row_to_session(const Statement& row) {
    Session session;
    session.id = row.column_int64(0);
    session.tenant_id = row.column_text(1);
    session.provider_call_id = row.column_text(2);
    session.direction = parse_direction(row.column_text(3));
    session.from = row.column_text(4);
    session.from_name = row.column_optional_text(5);
    session.to = row.column_text(6);
    session.to_name = row.column_optional_text(7);
    session.state = parse_session_state(row.column_text(8));
    session.assigned_agent = row.column_optional_text(9);
    session.previous_agent = row.column_optional_text(10);
    session.parking_slot = row.column_optional_int(11);
    session.agent_leg_id = row.column_optional_text(12);
    session.conference_name = row.column_optional_text(13);
    session.started_at = row.column_int64(14);
    session.answered_at = row.column_optional_int64(15);
    session.ended_at = row.column_optional_int64(16);
    session.hold_started_at = row.column_optional_int64(17);
    session.hold_accumulated_ms = row.column_int64(18);
    session.is_recording = row.column_int(19) != 0;
    session.recording_id = row.column_optional_text(20);
    session.notes = row.column_optional_text(21);
    session.correlation_id = row.column_optional_text(22);
    return session;
}

PendingTransfer row_to_transfer(const Statement& row) {
    PendingTransfer transfer;
    transfer.id = row.column_int64(0);
    transfer.tenant_id = row.column_text(1);
    transfer.session_id = row.column_int64(2);
    transfer.provider_call_id = row.column_text(3);
    transfer.source_agent = row.column_optional_text(4);
    transfer.target_agent = row.column_text(5);
    transfer.target_leg_id = row.column_optional_text(6);
    transfer.status = parse_transfer_status(row.column_text(7));
    transfer.kind = parse_transfer_kind(row.column_text(8));
    transfer.return_to_slot = row.column_optional_int(9);
    transfer.created_at = row.column_int64(10);
    transfer.expires_at = row.column_int64(11);
    return transfer;
}

TargetedRinging row_to_ringing(const Statement& row) {
    TargetedRinging ringing;
    ringing.id = row.column_int64(0);
    ringing.tenant_id = row.column_text(1);
    ringing.target_agent = row.column_text(2);
    ringing.caller_number = row.column_text(3);
    ringing.caller_name = row.column_optional_text(4);
    ringing.caller_leg_id = row.column_text(5);
    ringing.agent_leg_id = row.column_optional_text(6);
    ringing.status = parse_ringing_status(row.column_text(7));
    ringing.created_at = row.column_int64(8);
    ringing.expires_at = row.column_int64(9);
    return ringing;
}

ParkingSlot row_to_slot(const Statement& row) {
    ParkingSlot slot;
    slot.tenant_id = row.column_text(0);
    slot.slot_number = row.column_int(1);
    slot.occupied = row.column_int(2) != 0;
    slot.session_id = row.column_optional_int64(3);
    slot.parked_by_agent = row.column_optional_text(4);
    slot.parked_at = row.column_optional_int64(5);
    slot.conference_name = row.column_optional_text(6);
    slot.caller_number = row.column_optional_text(7);
    slot.caller_name = row.column_optional_text(8);
    return slot;
}

CallHistoryRecord row_to_history(const Statement& row) {
    CallHistoryRecord record;
    record.id = row.column_int64(0);
    record.tenant_id = row.column_text(1);
    record.provider_call_id = row.column_text(2);
    record.direction = parse_direction(row.column_text(3));
    record.from = row.column_text(4);
    record.from_name = row.column_optional_text(5);
    record.to = row.column_text(6);
    record.to_name = row.column_optional_text(7);
    record.outcome = parse_call_outcome(row.column_text(8));
    record.handled_by_agent = row.column_optional_text(9);
    record.transferred_from_agent = row.column_optional_text(10);
    record.started_at = row.column_int64(11);
    record.answered_at = row.column_optional_int64(12);
    record.ended_at = row.column_int64(13);
    record.duration_sec = row.column_int64(14);
    record.talk_time_sec = row.column_int64(15);
    record.hold_time_sec = row.column_int64(16);
    record.notes = row.column_optional_text(17);
    return record;
}

template <typename T>
ChangeEvent make_event(const std::string& tenant_id,
                       const char* entity,
                       const char* op,
                       const T& record) {
    ChangeEvent event;
    event.tenant_id = tenant_id;
    event.entity = entity;
    event.op = op;
    event.record = record;
    return event;
}

struct ProviderStatus {
    const char* name;
    bool terminal;
    std::optional<CallOutcome> outcome;
};

const ProviderStatus kProviderStatuses[] = {
    {"initiated", false, std::nullopt},
    {"queued", false, std::nullopt},
    {"ringing", false, std::nullopt},
    {"in-progress", false, std::nullopt},
    {"completed", true, CallOutcome::Answered},
    {"busy", true, CallOutcome::Busy},
    {"failed", true, CallOutcome::Failed},
    {"no-answer", true, CallOutcome::Missed},
    {"canceled", true, CallOutcome::Cancelled},
};

const ProviderStatus& lookup_provider_status(const std::string& status) {
    for (const auto& entry : kProviderStatuses) {
        if (status == entry.name) {
            return entry;
        }
    }
    throw InvalidValue("unknown provider status: '" + status + "'");
}

}

std::string parking_conference_name(const std::string& tenant_id, int slot) {
    return "park-" + tenant_id + "-" + std::to_string(slot);
}

class SessionRecordStore::Outbox {
public:
    void add(ChangeEvent event) { events_.push_back(std::move(event)); }

    void session(const Session& session) {
        add(make_event(session.tenant_id, "session", "upsert", session));
    }

    void session_removed(const Session& session) {
        add(make_event(session.tenant_id, "session", "remove", session));
    }

    void presence(std::string what, std::function<void(PresenceRecorder&)> call) {
        presence_.emplace_back(std::move(what), std::move(call));
    }

    const std::vector<ChangeEvent>& events() const { return events_; }
    const std::vector<std::pair<std::string, std::function<void(PresenceRecorder&)>>>&
    presence_calls() const {
        return presence_;
    }

private:
    std::vector<ChangeEvent> events_;
    std::vector<std::pair<std::string, std::function<void(PresenceRecorder&)>>> presence_;
};

SessionRecordStore::SessionRecordStore(std::shared_ptr<store::Database> db,
                                       std::shared_ptr<ChangeFeed> feed,
                                       RecordStoreOptions options,
                                       utils::Clock clock)
    : db_(std::move(db)),
      feed_(std::move(feed)),
      options_(options),
      clock_(std::move(clock)) {
    if (!db_) {
        throw StoreError("record store requires a database");
    }
    if (options_.parking_slots <= 0) {
        throw InvalidValue("parking lot size must be positive");
    }
    initialize_schema();
}

void SessionRecordStore::set_presence_recorder(std::shared_ptr<PresenceRecorder> recorder) {
    presence_ = std::move(recorder);
}

void SessionRecordStore::initialize_schema() {
    auto lock = db_->lock();
    db_->exec(kSchema);
}

void SessionRecordStore::dispatch(Outbox& outbox) {
    if (feed_) {
        for (const auto& event : outbox.events()) {
            feed_->publish(event);
        }
    }
    if (!presence_) {
        return;
    }
    for (const auto& call : outbox.presence_calls()) {
        try {
            call.second(*presence_);
        } catch (const std::exception& ex) {
            logging::warn("Presence update failed", {kv("update", call.first), kv("error", ex.what())});
        }
    }
}

std::optional<Session> SessionRecordStore::load_session(SessionId id) {
    Statement stmt(*db_, std::string("SELECT ") + kSessionColumns + " FROM sessions WHERE id = ?1");
    stmt.bind(1, id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return row_to_session(stmt);
}

std::optional<Session> SessionRecordStore::load_session_by_call(
    const std::string& provider_call_id) {
    Statement stmt(*db_, std::string("SELECT ") + kSessionColumns +
                             " FROM sessions WHERE provider_call_id = ?1");
    stmt.bind(1, provider_call_id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return row_to_session(stmt);
}

std::vector<Session> SessionRecordStore::query_sessions(
    const std::string& where, const std::function<void(Statement&)>& bind) {
    auto lock = db_->lock();
    Statement stmt(*db_, std::string("SELECT ") + kSessionColumns + " FROM sessions WHERE " +
                             where + " ORDER BY started_at ASC, id ASC");
    bind(stmt);
    std::vector<Session> sessions;
    while (stmt.step()) {
        sessions.push_back(row_to_session(stmt));
    }
    return sessions;
}

void SessionRecordStore::write_session(const Session& session) {
    Statement stmt(*db_,
                   "UPDATE sessions SET state = ?2, assigned_agent = ?3, previous_agent = ?4, "
                   "parking_slot = ?5, agent_leg_id = ?6, conference_name = ?7, "
                   "answered_at = ?8, ended_at = ?9, hold_started_at = ?10, "
                   "hold_accumulated_ms = ?11, is_recording = ?12, recording_id = ?13, "
                   "notes = ?14 WHERE id = ?1");
    stmt.bind(1, session.id)
        .bind(2, to_string(session.state))
        .bind(3, session.assigned_agent)
        .bind(4, session.previous_agent)
        .bind(5, session.parking_slot)
        .bind(6, session.agent_leg_id)
        .bind(7, session.conference_name)
        .bind(8, session.answered_at)
        .bind(9, session.ended_at)
        .bind(10, session.hold_started_at)
        .bind(11, session.hold_accumulated_ms)
        .bind(12, session.is_recording)
        .bind(13, session.recording_id)
        .bind(14, session.notes);
    stmt.run();
    if (db_->changes() != 1) {
        throw NotFound("session " + std::to_string(session.id) + " not found");
    }
}

Session SessionRecordStore::create_inbound(const NewSession& request) {
    if (request.tenant_id.empty() || request.provider_call_id.empty()) {
        throw InvalidValue("tenant and provider call id are required");
    }
    Outbox outbox;
    Session session;
    {
        auto lock = db_->lock();
        Transaction txn(*db_);
        if (auto existing = load_session_by_call(request.provider_call_id)) {
            return *existing;
        }
        Statement stmt(*db_,
                       "INSERT INTO sessions (tenant_id, provider_call_id, direction, from_address, "
                       "from_name, to_address, to_name, state, agent_leg_id, started_at) "
                       "VALUES (?1, ?2, 'inbound', ?3, ?4, ?5, ?6, 'ringing', ?7, ?8)");
        stmt.bind(1, request.tenant_id)
            .bind(2, request.provider_call_id)
            .bind(3, request.from)
            .bind(4, request.from_name)
            .bind(5, request.to)
            .bind(6, request.to_name)
            .bind(7, request.agent_leg_id)
            .bind(8, clock_());
        stmt.run();
        session = *load_session(db_->last_insert_id());
        txn.commit();
    }
    outbox.session(session);
    dispatch(outbox);
    Metrics::instance().increment_session_created("inbound");
    logging::info("Inbound session created",
                  {kv("session", session.id),
                   kv("tenant", session.tenant_id),
                   kv("call_id", session.provider_call_id),
                   kv("from", session.from)});
    return session;
}

Session SessionRecordStore::create_outbound(const NewSession& request) {
    if (request.tenant_id.empty() || request.provider_call_id.empty()) {
        throw InvalidValue("tenant and provider call id are required");
    }
    if (!request.agent || request.agent->empty()) {
        throw InvalidValue("outbound sessions require the dialing agent");
    }
    Outbox outbox;
    Session session;
    {
        auto lock = db_->lock();
        Transaction txn(*db_);
        if (auto existing = load_session_by_call(request.provider_call_id)) {
            return *existing;
        }
        Statement stmt(*db_,
                       "INSERT INTO sessions (tenant_id, provider_call_id, direction, from_address, "
                       "from_name, to_address, to_name, state, assigned_agent, agent_leg_id, "
                       "started_at, correlation_id) "
                       "VALUES (?1, ?2, 'outbound', ?3, ?4, ?5, ?6, 'connecting', ?7, ?8, ?9, "
                       "?10)");
        stmt.bind(1, request.tenant_id)
            .bind(2, request.provider_call_id)
            .bind(3, request.from)
            .bind(4, request.from_name)
            .bind(5, request.to)
            .bind(6, request.to_name)
            .bind(7, *request.agent)
            .bind(8, request.agent_leg_id)
            .bind(9, clock_())
            .bind(10, request.correlation_id);
        stmt.run();
        session = *load_session(db_->last_insert_id());
        txn.commit();
    }
    outbox.session(session);
    const auto tenant = session.tenant_id;
    const auto agent = *session.assigned_agent;
    const auto id = session.id;
    outbox.presence("outbound_dialed", [tenant, agent](PresenceRecorder& recorder) {
        recorder.outbound_dialed(tenant, agent);
    });
    outbox.presence("agent_engaged", [tenant, agent, id](PresenceRecorder& recorder) {
        recorder.agent_engaged(tenant, agent, id);
    });
    dispatch(outbox);
    Metrics::instance().increment_session_created("outbound");
    logging::info("Outbound session created",
                  {kv("session", session.id),
                   kv("tenant", session.tenant_id),
                   kv("agent", agent),
                   kv("to", session.to)});
    return session;
}

std::optional<Session> SessionRecordStore::get(const std::string& provider_call_id) {
    auto lock = db_->lock();
    return load_session_by_call(provider_call_id);
}

std::optional<Session> SessionRecordStore::get_by_id(SessionId id) {
    auto lock = db_->lock();
    return load_session(id);
}

Session SessionRecordStore::require(SessionId id) {
    auto session = get_by_id(id);
    if (!session) {
        throw NotFound("session " + std::to_string(id) + " not found");
    }
    return *session;
}

std::optional<Session> SessionRecordStore::find_by_leg(const std::string& leg_id) {
    auto lock = db_->lock();
    if (auto session = load_session_by_call(leg_id)) {
        return session;
    }
    Statement stmt(*db_, std::string("SELECT ") + kSessionColumns +
                             " FROM sessions WHERE agent_leg_id = ?1 ORDER BY id DESC LIMIT 1");
    stmt.bind(1, leg_id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return row_to_session(stmt);
}

std::vector<Session> SessionRecordStore::list_by_tenant(const std::string& tenant_id) {
    return query_sessions("tenant_id = ?1", [&](Statement& stmt) { stmt.bind(1, tenant_id); });
}

std::vector<Session> SessionRecordStore::list_by_state(const std::string& tenant_id,
                                                       SessionState state) {
    return query_sessions("tenant_id = ?1 AND state = ?2", [&](Statement& stmt) {
        stmt.bind(1, tenant_id).bind(2, to_string(state));
    });
}

std::vector<Session> SessionRecordStore::list_by_agent(const std::string& tenant_id,
                                                       const std::string& agent_id) {
    return query_sessions("tenant_id = ?1 AND assigned_agent = ?2", [&](Statement& stmt) {
        stmt.bind(1, tenant_id).bind(2, agent_id);
    });
}

std::vector<Session> SessionRecordStore::list_ringing(const std::string& tenant_id) {
    return list_by_state(tenant_id, SessionState::Ringing);
}

std::vector<Session> SessionRecordStore::list_parked(const std::string& tenant_id) {
    return list_by_state(tenant_id, SessionState::Parked);
}

bool SessionRecordStore::agent_has_live_sessions(const std::string& tenant_id,
                                                 const std::string& agent_id) {
    Statement stmt(*db_,
                   "SELECT COUNT(*) FROM sessions WHERE tenant_id = ?1 AND "
                   "(assigned_agent = ?2 OR (previous_agent = ?2 AND state = 'transferring'))");
    stmt.bind(1, tenant_id).bind(2, agent_id);
    stmt.step();
    return stmt.column_int64(0) > 0;
}

void SessionRecordStore::presence_effects(const Session& before,
                                          const Session& after,
                                          TransitionKind kind,
                                          Outbox& outbox) {
    const auto tenant = after.tenant_id;
    const auto id = after.id;

    std::optional<std::string> released;
    std::optional<std::string> engaged;
    switch (kind) {
    case TransitionKind::BeginTransfer:
    case TransitionKind::RevertTransfer:
        // The source keeps the call until the target accepts.
        if (kind == TransitionKind::RevertTransfer && !after.assigned_agent &&
            before.previous_agent) {
            released = before.previous_agent;
        }
        break;
    case TransitionKind::AcceptTransfer:
        if (before.previous_agent && before.previous_agent != after.assigned_agent) {
            released = before.previous_agent;
        }
        engaged = after.assigned_agent;
        break;
    default:
        if (before.assigned_agent != after.assigned_agent) {
            released = before.assigned_agent;
            engaged = after.assigned_agent;
        }
        break;
    }

    if (released && !agent_has_live_sessions(tenant, *released)) {
        const auto agent = *released;
        outbox.presence("agent_released", [tenant, agent](PresenceRecorder& recorder) {
            recorder.agent_released(tenant, agent);
        });
    }
    if (engaged) {
        const auto agent = *engaged;
        outbox.presence("agent_engaged", [tenant, agent, id](PresenceRecorder& recorder) {
            recorder.agent_engaged(tenant, agent, id);
        });
    }
    if (kind == TransitionKind::Answer && after.assigned_agent) {
        const auto agent = *after.assigned_agent;
        const auto direction = after.direction;
        outbox.presence("call_accepted", [tenant, agent, direction](PresenceRecorder& recorder) {
            recorder.call_accepted(tenant, agent, direction);
        });
    }
}

Session SessionRecordStore::transition_locked(const Session& current,
                                              const Transition& transition,
                                              const std::string& actor,
                                              Outbox& outbox) {
    if (transition.kind == TransitionKind::End) {
        throw StateConflict("ending a session goes through finalize");
    }
    auto next = state_machine::apply(current, transition, clock_());
    write_session(next);
    presence_effects(current, next, transition.kind, outbox);
    outbox.session(next);
    logging::info("Session transition",
                  {kv("session", current.id),
                   kv("transition", to_string(transition.kind)),
                   kv("from", to_string(current.state)),
                   kv("to", to_string(next.state)),
                   kv("actor", actor)});
    return next;
}

Session SessionRecordStore::apply_transition(SessionId id,
                                             const Transition& transition,
                                             const std::string& actor) {
    const auto started = std::chrono::steady_clock::now();
    Outbox outbox;
    Session next;
    {
        auto lock = db_->lock();
        Transaction txn(*db_);
        auto current = load_session(id);
        if (!current) {
            throw NotFound("session " + std::to_string(id) + " not found");
        }
        if (transition.kind == TransitionKind::Park || transition.kind == TransitionKind::Unpark ||
            transition.kind == TransitionKind::ReturnToPark ||
            transition.kind == TransitionKind::BeginTransfer) {
            throw StateConflict(std::string(to_string(transition.kind)) +
                                " must go through its coordinator");
        }
        next = transition_locked(*current, transition, actor, outbox);
        txn.commit();
    }
    dispatch(outbox);
    if (transition.kind == TransitionKind::Answer) {
        Metrics::instance().increment_session_answered();
    }
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
    Metrics::instance().observe_transition(to_string(transition.kind), elapsed.count());
    return next;
}

Session SessionRecordStore::set_agent_leg(SessionId id, std::optional<std::string> leg_id) {
    Outbox outbox;
    Session session;
    {
        auto lock = db_->lock();
        Transaction txn(*db_);
        auto current = load_session(id);
        if (!current) {
            throw NotFound("session " + std::to_string(id) + " not found");
        }
        session = *current;
        session.agent_leg_id = std::move(leg_id);
        write_session(session);
        txn.commit();
    }
    outbox.session(session);
    dispatch(outbox);
    return session;
}

Session SessionRecordStore::set_conference(SessionId id,
                                           std::optional<std::string> conference_name) {
    Outbox outbox;
    Session session;
    {
        auto lock = db_->lock();
        Transaction txn(*db_);
        auto current = load_session(id);
        if (!current) {
            throw NotFound("session " + std::to_string(id) + " not found");
        }
        if (current->state == SessionState::Parked) {
            throw StateConflict("a parked session stays in its slot conference");
        }
        session = *current;
        session.conference_name = std::move(conference_name);
        write_session(session);
        txn.commit();
    }
    outbox.session(session);
    dispatch(outbox);
    return session;
}

CallHistoryRecord SessionRecordStore::finalize_locked(const Session& session,
                                                      std::optional<CallOutcome> outcome,
                                                      std::optional<std::int64_t> duration_sec,
                                                      Outbox& outbox) {
    const auto ended = state_machine::apply(session, Transition::end(), clock_());

    if (session.state == SessionState::Parked && session.parking_slot) {
        if (release_slot(session.tenant_id, *session.parking_slot, session.id)) {
            if (auto slot = load_slot(session.tenant_id, *session.parking_slot)) {
                outbox.add(make_event(session.tenant_id, "parking_slot", "upsert", *slot));
            }
        }
    }

    CallHistoryRecord record;
    record.tenant_id = ended.tenant_id;
    record.provider_call_id = ended.provider_call_id;
    record.direction = ended.direction;
    record.from = ended.from;
    record.from_name = ended.from_name;
    record.to = ended.to;
    record.to_name = ended.to_name;
    record.outcome = outcome ? *outcome : state_machine::derive_outcome(ended);
    if (record.outcome == CallOutcome::Answered && !ended.answered_at) {
        record.outcome = state_machine::derive_outcome(ended);
    }
    if (session.state == SessionState::Transferring || !ended.assigned_agent) {
        // An unaccepted transfer target never handled the call.
        record.handled_by_agent = ended.previous_agent;
    } else {
        record.handled_by_agent = ended.assigned_agent;
        if (ended.previous_agent != ended.assigned_agent) {
            record.transferred_from_agent = ended.previous_agent;
        }
    }
    record.started_at = ended.started_at;
    record.answered_at = ended.answered_at;
    record.ended_at = *ended.ended_at;
    record.duration_sec = duration_sec ? *duration_sec
                                       : (record.ended_at - record.started_at) / 1000;
    record.talk_time_sec = ended.answered_at ? (record.ended_at - *ended.answered_at) / 1000 : 0;
    record.hold_time_sec = ended.hold_accumulated_ms / 1000;
    record.notes = ended.notes;

    Statement insert(*db_, std::string("INSERT INTO call_history (") + kHistoryColumns +
                               ") VALUES (NULL, ?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, "
                               "?12, ?13, ?14, ?15, ?16, ?17)");
    insert.bind(1, record.tenant_id)
        .bind(2, record.provider_call_id)
        .bind(3, to_string(record.direction))
        .bind(4, record.from)
        .bind(5, record.from_name)
        .bind(6, record.to)
        .bind(7, record.to_name)
        .bind(8, to_string(record.outcome))
        .bind(9, record.handled_by_agent)
        .bind(10, record.transferred_from_agent)
        .bind(11, record.started_at)
        .bind(12, record.answered_at)
        .bind(13, record.ended_at)
        .bind(14, record.duration_sec)
        .bind(15, record.talk_time_sec)
        .bind(16, record.hold_time_sec)
        .bind(17, record.notes);
    insert.run();
    record.id = db_->last_insert_id();

    Statement remove(*db_, "DELETE FROM sessions WHERE id = ?1");
    remove.bind(1, session.id);
    remove.run();

    Statement expire(*db_,
                     "UPDATE targeted_ringing SET status = 'expired' "
                     "WHERE caller_leg_id = ?1 AND status = 'ringing'");
    expire.bind(1, session.provider_call_id);
    expire.run();

    outbox.session_removed(ended);
    outbox.add(make_event(record.tenant_id, "history", "upsert", record));

    const auto tenant = record.tenant_id;
    if (record.handled_by_agent && record.talk_time_sec > 0) {
        const auto agent = *record.handled_by_agent;
        const auto seconds = record.talk_time_sec;
        outbox.presence("talk_time", [tenant, agent, seconds](PresenceRecorder& recorder) {
            recorder.talk_time(tenant, agent, seconds);
        });
    }
    for (const auto& agent : {session.assigned_agent, session.previous_agent}) {
        if (agent && !agent_has_live_sessions(tenant, *agent)) {
            const auto agent_id = *agent;
            outbox.presence("agent_released", [tenant, agent_id](PresenceRecorder& recorder) {
                recorder.agent_released(tenant, agent_id);
            });
        }
        if (session.state != SessionState::Transferring) {
            break;
        }
    }
    return record;
}

std::optional<CallHistoryRecord> SessionRecordStore::finalize(
    SessionId id, std::optional<CallOutcome> outcome, std::optional<std::int64_t> duration_sec) {
    Outbox outbox;
    CallHistoryRecord record;
    {
        auto lock = db_->lock();
        Transaction txn(*db_);
        auto session = load_session(id);
        if (!session) {
            logging::debug("Finalize ignored for missing session", {kv("session", id)});
            return std::nullopt;
        }
        record = finalize_locked(*session, outcome, duration_sec, outbox);
        txn.commit();
    }
    dispatch(outbox);
    Metrics::instance().increment_session_finalized(to_string(record.outcome));
    logging::info("Session finalized",
                  {kv("session", id),
                   kv("call_id", record.provider_call_id),
                   kv("outcome", to_string(record.outcome)),
                   kv("duration", record.duration_sec),
                   kv("talk_time", record.talk_time_sec)});
    return record;
}

void SessionRecordStore::reconcile_provider_status(const std::string& leg_id,
                                                   const std::string& status,
                                                   std::optional<std::int64_t> duration_sec) {
    const auto& mapped = lookup_provider_status(status);
    auto session = find_by_leg(leg_id);
    if (!session) {
        logging::warn("Status callback for unknown call", {kv("leg", leg_id), kv("status", status)});
        return;
    }

    const bool agent_leg = session->agent_leg_id == leg_id && session->provider_call_id != leg_id;
    if (!mapped.terminal) {
        if (status == "in-progress" && !agent_leg && session->state == SessionState::Connecting) {
            try {
                apply_transition(session->id, Transition::connect(), "provider");
            } catch (const StateConflict& ex) {
                logging::debug("Connect callback raced another transition",
                               {kv("session", session->id), kv("error", ex.what())});
            }
        }
        return;
    }

    if (agent_leg) {
        if (session->state == SessionState::Parked ||
            session->state == SessionState::Transferring) {
            logging::debug("Agent leg ended while caller is held",
                           {kv("session", session->id), kv("state", to_string(session->state))});
            return;
        }
    }

    std::optional<CallOutcome> outcome = mapped.outcome;
    if (outcome == CallOutcome::Answered && !session->answered_at) {
        outcome.reset();
    }
    finalize(session->id, outcome, duration_sec);
}

void SessionRecordStore::require_slot_in_range(int slot) const {
    if (slot < 1 || slot > options_.parking_slots) {
        throw InvalidValue("parking slot " + std::to_string(slot) + " is outside 1.." +
                           std::to_string(options_.parking_slots));
    }
}

void SessionRecordStore::initialize_slots(const std::string& tenant_id, int count) {
    if (count <= 0 || count > options_.parking_slots) {
        throw InvalidValue("slot count must be within the parking lot size");
    }
    auto lock = db_->lock();
    Transaction txn(*db_);
    for (int slot = 1; slot <= count; ++slot) {
        Statement stmt(*db_,
                       "INSERT OR IGNORE INTO parking_slots (tenant_id, slot_number, occupied, "
                       "conference_name) VALUES (?1, ?2, 0, ?3)");
        stmt.bind(1, tenant_id).bind(2, slot).bind(3, parking_conference_name(tenant_id, slot));
        stmt.run();
    }
    txn.commit();
}

std::optional<ParkingSlot> SessionRecordStore::load_slot(const std::string& tenant_id, int slot) {
    Statement stmt(*db_, std::string("SELECT ") + kSlotColumns +
                             " FROM parking_slots WHERE tenant_id = ?1 AND slot_number = ?2");
    stmt.bind(1, tenant_id).bind(2, slot);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return row_to_slot(stmt);
}

std::optional<ParkingSlot> SessionRecordStore::get_slot(const std::string& tenant_id, int slot) {
    require_slot_in_range(slot);
    auto lock = db_->lock();
    if (auto existing = load_slot(tenant_id, slot)) {
        return existing;
    }
    ParkingSlot empty;
    empty.tenant_id = tenant_id;
    empty.slot_number = slot;
    empty.conference_name = parking_conference_name(tenant_id, slot);
    return empty;
}

std::vector<ParkingSlot> SessionRecordStore::list_slots(const std::string& tenant_id) {
    auto lock = db_->lock();
    std::vector<ParkingSlot> slots;
    for (int number = 1; number <= options_.parking_slots; ++number) {
        if (auto slot = load_slot(tenant_id, number)) {
            slots.push_back(*slot);
            continue;
        }
        ParkingSlot empty;
        empty.tenant_id = tenant_id;
        empty.slot_number = number;
        empty.conference_name = parking_conference_name(tenant_id, number);
        slots.push_back(empty);
    }
    return slots;
}

std::optional<int> SessionRecordStore::lowest_free_slot(const std::string& tenant_id) {
    Statement stmt(*db_,
                   "SELECT slot_number FROM parking_slots WHERE tenant_id = ?1 AND occupied = 1");
    stmt.bind(1, tenant_id);
    std::vector<bool> taken(static_cast<size_t>(options_.parking_slots) + 1, false);
    while (stmt.step()) {
        const int number = stmt.column_int(0);
        if (number >= 1 && number <= options_.parking_slots) {
            taken[static_cast<size_t>(number)] = true;
        }
    }
    for (int number = 1; number <= options_.parking_slots; ++number) {
        if (!taken[static_cast<size_t>(number)]) {
            return number;
        }
    }
    return std::nullopt;
}

std::optional<int> SessionRecordStore::first_free_slot(const std::string& tenant_id) {
    auto lock = db_->lock();
    return lowest_free_slot(tenant_id);
}

bool SessionRecordStore::occupy_slot(const Session& session,
                                     int slot,
                                     const std::optional<std::string>& parked_by,
                                     TimestampMs now) {
    Statement create(*db_,
                     "INSERT OR IGNORE INTO parking_slots (tenant_id, slot_number, occupied, "
                     "conference_name) VALUES (?1, ?2, 0, ?3)");
    create.bind(1, session.tenant_id)
        .bind(2, slot)
        .bind(3, parking_conference_name(session.tenant_id, slot));
    create.run();

    Statement claim(*db_,
                    "UPDATE parking_slots SET occupied = 1, session_id = ?3, parked_by_agent = ?4, "
                    "parked_at = ?5, caller_number = ?6, caller_name = ?7 "
                    "WHERE tenant_id = ?1 AND slot_number = ?2 AND occupied = 0");
    const bool inbound = session.direction == Direction::Inbound;
    claim.bind(1, session.tenant_id)
        .bind(2, slot)
        .bind(3, session.id)
        .bind(4, parked_by)
        .bind(5, now)
        .bind(6, session.counterparty())
        .bind(7, inbound ? session.from_name : session.to_name);
    claim.run();
    return db_->changes() == 1;
}

bool SessionRecordStore::release_slot(const std::string& tenant_id, int slot, SessionId session_id) {
    Statement stmt(*db_,
                   "UPDATE parking_slots SET occupied = 0, session_id = NULL, "
                   "parked_by_agent = NULL, parked_at = NULL, caller_number = NULL, "
                   "caller_name = NULL "
                   "WHERE tenant_id = ?1 AND slot_number = ?2 AND session_id = ?3");
    stmt.bind(1, tenant_id).bind(2, slot).bind(3, session_id);
    stmt.run();
    return db_->changes() == 1;
}

Session SessionRecordStore::park_session(SessionId id, int slot, const std::string& actor) {
    require_slot_in_range(slot);
    const auto started = std::chrono::steady_clock::now();
    Outbox outbox;
    Session next;
    {
        auto lock = db_->lock();
        Transaction txn(*db_);
        auto current = load_session(id);
        if (!current) {
            throw NotFound("session " + std::to_string(id) + " not found");
        }
        if (!state_machine::is_allowed(current->state, TransitionKind::Park)) {
            throw StateConflict("cannot park session " + std::to_string(id) + " in state " +
                                to_string(current->state));
        }
        const auto now = clock_();
        if (!occupy_slot(*current, slot, current->assigned_agent, now)) {
            throw SlotConflict("parking slot " + std::to_string(slot) + " is occupied");
        }
        next = transition_locked(
            *current,
            Transition::park(slot, parking_conference_name(current->tenant_id, slot)),
            actor,
            outbox);
        outbox.add(make_event(next.tenant_id, "parking_slot", "upsert",
                              *load_slot(next.tenant_id, slot)));
        txn.commit();
    }
    dispatch(outbox);
    Metrics::instance().increment_park();
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
    Metrics::instance().observe_transition("park", elapsed.count());
    return next;
}

Session SessionRecordStore::unpark_session(const std::string& tenant_id,
                                           int slot,
                                           const std::string& agent_id,
                                           std::optional<std::string> agent_leg_id) {
    require_slot_in_range(slot);
    const auto started = std::chrono::steady_clock::now();
    Outbox outbox;
    Session next;
    {
        auto lock = db_->lock();
        Transaction txn(*db_);
        auto slot_record = load_slot(tenant_id, slot);
        if (!slot_record || !slot_record->occupied || !slot_record->session_id) {
            throw StateConflict("parking slot " + std::to_string(slot) + " is empty");
        }
        auto current = load_session(*slot_record->session_id);
        if (!current) {
            throw NotFound("parked session " + std::to_string(*slot_record->session_id) +
                           " not found");
        }
        if (!release_slot(tenant_id, slot, current->id)) {
            throw SlotConflict("parking slot " + std::to_string(slot) + " changed hands");
        }
        auto unparked = state_machine::apply(*current, Transition::unpark(slot, agent_id), clock_());
        if (agent_leg_id) {
            unparked.agent_leg_id = agent_leg_id;
        }
        write_session(unparked);
        presence_effects(*current, unparked, TransitionKind::Unpark, outbox);
        next = unparked;
        outbox.session(next);
        outbox.add(make_event(tenant_id, "parking_slot", "upsert", *load_slot(tenant_id, slot)));
        logging::info("Session unparked",
                      {kv("session", next.id), kv("slot", slot), kv("agent", agent_id)});
        txn.commit();
    }
    dispatch(outbox);
    Metrics::instance().increment_unpark();
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
    Metrics::instance().observe_transition("unpark", elapsed.count());
    return next;
}

std::optional<PendingTransfer> SessionRecordStore::load_transfer(TransferId id) {
    Statement stmt(*db_, std::string("SELECT ") + kTransferColumns +
                             " FROM pending_transfers WHERE id = ?1");
    stmt.bind(1, id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return row_to_transfer(stmt);
}

PendingTransfer SessionRecordStore::begin_transfer(const NewTransfer& request,
                                                   const std::string& actor) {
    if (request.target_agent.empty()) {
        throw InvalidValue("transfer target is required");
    }
    if (request.ring_timeout_ms <= 0) {
        throw InvalidValue("ring timeout must be positive");
    }
    Outbox outbox;
    PendingTransfer transfer;
    {
        auto lock = db_->lock();
        Transaction txn(*db_);
        auto current = load_session(request.session_id);
        if (!current) {
            throw NotFound("session " + std::to_string(request.session_id) + " not found");
        }
        const bool parked = current->state == SessionState::Parked;
        if (request.kind == TransferKind::FromPark && !parked) {
            throw StateConflict("session " + std::to_string(current->id) + " is not parked");
        }
        if (request.kind == TransferKind::Direct && parked) {
            throw StateConflict("parked sessions transfer from their slot");
        }

        Statement pending(*db_,
                          "SELECT COUNT(*) FROM pending_transfers "
                          "WHERE session_id = ?1 AND status = 'ringing'");
        pending.bind(1, current->id);
        pending.step();
        if (pending.column_int64(0) > 0) {
            throw StateConflict("session " + std::to_string(current->id) +
                                " already has a transfer ringing");
        }

        auto next = transition_locked(*current, Transition::begin_transfer(request.target_agent),
                                      actor, outbox);
        if (parked && current->parking_slot) {
            release_slot(current->tenant_id, *current->parking_slot, current->id);
            outbox.add(make_event(current->tenant_id, "parking_slot", "upsert",
                                  *load_slot(current->tenant_id, *current->parking_slot)));
        }

        const auto now = clock_();
        Statement insert(*db_,
                         "INSERT INTO pending_transfers (tenant_id, session_id, provider_call_id, "
                         "source_agent, target_agent, target_leg_id, status, kind, "
                         "return_to_slot, created_at, expires_at) "
                         "VALUES (?1, ?2, ?3, ?4, ?5, ?6, 'ringing', ?7, ?8, ?9, ?10)");
        insert.bind(1, next.tenant_id)
            .bind(2, next.id)
            .bind(3, next.provider_call_id)
            .bind(4, current->assigned_agent)
            .bind(5, request.target_agent)
            .bind(6, request.target_leg_id)
            .bind(7, to_string(request.kind))
            .bind(8, parked ? current->parking_slot : std::optional<int>())
            .bind(9, now)
            .bind(10, now + request.ring_timeout_ms);
        insert.run();
        transfer = *load_transfer(db_->last_insert_id());
        outbox.add(make_event(transfer.tenant_id, "transfer", "upsert", transfer));
        txn.commit();
    }
    dispatch(outbox);
    logging::info("Transfer ringing",
                  {kv("transfer", transfer.id),
                   kv("session", transfer.session_id),
                   kv("kind", to_string(transfer.kind)),
                   kv("source", transfer.source_agent),
                   kv("target", transfer.target_agent)});
    return transfer;
}

PendingTransfer SessionRecordStore::set_transfer_leg(TransferId id, const std::string& leg_id) {
    Outbox outbox;
    PendingTransfer transfer;
    {
        auto lock = db_->lock();
        Transaction txn(*db_);
        Statement stmt(*db_, "UPDATE pending_transfers SET target_leg_id = ?2 WHERE id = ?1");
        stmt.bind(1, id).bind(2, leg_id);
        stmt.run();
        if (db_->changes() != 1) {
            throw NotFound("transfer " + std::to_string(id) + " not found");
        }
        transfer = *load_transfer(id);
        outbox.add(make_event(transfer.tenant_id, "transfer", "upsert", transfer));
        txn.commit();
    }
    dispatch(outbox);
    return transfer;
}

std::optional<PendingTransfer> SessionRecordStore::get_transfer(TransferId id) {
    auto lock = db_->lock();
    return load_transfer(id);
}

std::vector<PendingTransfer> SessionRecordStore::list_ringing_transfers_for(
    const std::string& tenant_id, const std::string& agent_id) {
    auto lock = db_->lock();
    Statement stmt(*db_, std::string("SELECT ") + kTransferColumns +
                             " FROM pending_transfers WHERE tenant_id = ?1 AND target_agent = ?2 "
                             "AND status = 'ringing' ORDER BY created_at ASC");
    stmt.bind(1, tenant_id).bind(2, agent_id);
    std::vector<PendingTransfer> transfers;
    while (stmt.step()) {
        transfers.push_back(row_to_transfer(stmt));
    }
    return transfers;
}

std::vector<PendingTransfer> SessionRecordStore::list_expired_transfers() {
    auto lock = db_->lock();
    Statement stmt(*db_, std::string("SELECT ") + kTransferColumns +
                             " FROM pending_transfers WHERE status = 'ringing' AND expires_at <= ?1 "
                             "ORDER BY expires_at ASC");
    stmt.bind(1, clock_());
    std::vector<PendingTransfer> transfers;
    while (stmt.step()) {
        transfers.push_back(row_to_transfer(stmt));
    }
    return transfers;
}

TransferResolution SessionRecordStore::resolve_transfer(TransferId id,
                                                        TransferStatus resolution,
                                                        const std::optional<std::string>& actor) {
    if (resolution == TransferStatus::Ringing) {
        throw InvalidValue("a transfer cannot be resolved back to ringing");
    }
    Outbox outbox;
    TransferResolution result;
    {
        auto lock = db_->lock();
        Transaction txn(*db_);
        auto transfer = load_transfer(id);
        if (!transfer) {
            throw NotFound("transfer " + std::to_string(id) + " not found");
        }
        if (transfer->status != TransferStatus::Ringing) {
            throw StateConflict("Transfer is no longer pending");
        }
        if (resolution == TransferStatus::Accepted && actor && *actor != transfer->target_agent) {
            throw StateConflict("only the transfer target can accept");
        }

        const auto now = clock_();
        auto session = load_session(transfer->session_id);
        if (session && session->state != SessionState::Transferring) {
            session.reset();
        }
        auto status = resolution;
        if (status == TransferStatus::Accepted && (transfer->is_expired(now) || !session)) {
            status = TransferStatus::Timeout;
        }

        Statement cas(*db_,
                      "UPDATE pending_transfers SET status = ?2 WHERE id = ?1 AND status = 'ringing'");
        cas.bind(1, id).bind(2, to_string(status));
        cas.run();
        if (db_->changes() != 1) {
            throw StateConflict("Transfer is no longer pending");
        }
        transfer->status = status;

        const auto ringing_status = status == TransferStatus::Accepted   ? RingingStatus::Accepted
                                    : status == TransferStatus::Declined ? RingingStatus::Declined
                                                                         : RingingStatus::Expired;
        Statement ringing(*db_,
                          "UPDATE targeted_ringing SET status = ?3 WHERE caller_leg_id = ?1 AND "
                          "target_agent = ?2 AND status = 'ringing'");
        ringing.bind(1, transfer->provider_call_id)
            .bind(2, transfer->target_agent)
            .bind(3, to_string(ringing_status));
        ringing.run();

        const std::string by = actor ? *actor : std::string("system");
        if (session) {
            if (status == TransferStatus::Accepted) {
                auto next = transition_locked(*session, Transition::accept_transfer(), by, outbox);
                if (transfer->target_leg_id) {
                    next.agent_leg_id = transfer->target_leg_id;
                    write_session(next);
                }
                result.session = next;
            } else if (transfer->kind == TransferKind::FromPark) {
                std::optional<int> slot;
                if (transfer->return_to_slot) {
                    auto origin = load_slot(transfer->tenant_id, *transfer->return_to_slot);
                    if (!origin || !origin->occupied) {
                        slot = transfer->return_to_slot;
                    }
                }
                if (!slot) {
                    slot = lowest_free_slot(transfer->tenant_id);
                }
                if (slot && occupy_slot(*session, *slot, std::nullopt, now)) {
                    result.session = transition_locked(
                        *session,
                        Transition::return_to_park(*slot,
                                                   parking_conference_name(session->tenant_id, *slot)),
                        by,
                        outbox);
                    outbox.add(make_event(transfer->tenant_id, "parking_slot", "upsert",
                                          *load_slot(transfer->tenant_id, *slot)));
                } else {
                    logging::warn("Parking lot full, holding returned caller",
                                  {kv("transfer", id), kv("session", session->id)});
                    result.session = transition_locked(*session, Transition::revert_transfer(), by,
                                                       outbox);
                }
            } else {
                result.session = transition_locked(*session, Transition::revert_transfer(), by,
                                                   outbox);
            }
        }
        result.transfer = *transfer;
        outbox.add(make_event(transfer->tenant_id, "transfer", "upsert", *transfer));
        txn.commit();
    }
    dispatch(outbox);
    Metrics::instance().increment_transfer(to_string(result.transfer.status));
    logging::info("Transfer resolved",
                  {kv("transfer", id),
                   kv("status", to_string(result.transfer.status)),
                   kv("session_state",
                      result.session ? to_string(result.session->state) : "gone")});
    return result;
}

std::optional<TargetedRinging> SessionRecordStore::load_ringing(RingingId id) {
    Statement stmt(*db_, std::string("SELECT ") + kRingingColumns +
                             " FROM targeted_ringing WHERE id = ?1");
    stmt.bind(1, id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return row_to_ringing(stmt);
}

TargetedRinging SessionRecordStore::create_ringing(const NewRinging& request) {
    if (request.ttl_ms <= 0) {
        throw InvalidValue("ringing ttl must be positive");
    }
    Outbox outbox;
    TargetedRinging ringing;
    {
        auto lock = db_->lock();
        Transaction txn(*db_);
        Statement stale(*db_, std::string("SELECT ") + kRingingColumns +
                                  " FROM targeted_ringing WHERE caller_leg_id = ?1");
        stale.bind(1, request.caller_leg_id);
        while (stale.step()) {
            outbox.add(make_event(request.tenant_id, "ringing", "remove", row_to_ringing(stale)));
        }
        Statement remove(*db_, "DELETE FROM targeted_ringing WHERE caller_leg_id = ?1");
        remove.bind(1, request.caller_leg_id);
        remove.run();

        const auto now = clock_();
        Statement insert(*db_,
                         "INSERT INTO targeted_ringing (tenant_id, target_agent, caller_number, "
                         "caller_name, caller_leg_id, agent_leg_id, status, created_at, expires_at) "
                         "VALUES (?1, ?2, ?3, ?4, ?5, ?6, 'ringing', ?7, ?8)");
        insert.bind(1, request.tenant_id)
            .bind(2, request.target_agent)
            .bind(3, request.caller_number)
            .bind(4, request.caller_name)
            .bind(5, request.caller_leg_id)
            .bind(6, request.agent_leg_id)
            .bind(7, now)
            .bind(8, now + request.ttl_ms);
        insert.run();
        ringing = *load_ringing(db_->last_insert_id());
        outbox.add(make_event(ringing.tenant_id, "ringing", "upsert", ringing));
        txn.commit();
    }
    dispatch(outbox);
    return ringing;
}

std::optional<TargetedRinging> SessionRecordStore::get_ringing(RingingId id) {
    auto lock = db_->lock();
    return load_ringing(id);
}

TargetedRinging SessionRecordStore::set_ringing_agent_leg(RingingId id, const std::string& leg_id) {
    Outbox outbox;
    TargetedRinging ringing;
    {
        auto lock = db_->lock();
        Transaction txn(*db_);
        Statement stmt(*db_, "UPDATE targeted_ringing SET agent_leg_id = ?2 WHERE id = ?1");
        stmt.bind(1, id).bind(2, leg_id);
        stmt.run();
        if (db_->changes() != 1) {
            throw NotFound("ringing entry " + std::to_string(id) + " not found");
        }
        ringing = *load_ringing(id);
        outbox.add(make_event(ringing.tenant_id, "ringing", "upsert", ringing));
        txn.commit();
    }
    dispatch(outbox);
    return ringing;
}

TargetedRinging SessionRecordStore::resolve_ringing(RingingId id, RingingStatus status) {
    if (status == RingingStatus::Ringing) {
        throw InvalidValue("a ringing entry cannot be resolved back to ringing");
    }
    Outbox outbox;
    TargetedRinging ringing;
    {
        auto lock = db_->lock();
        Transaction txn(*db_);
        auto current = load_ringing(id);
        if (!current) {
            throw NotFound("ringing entry " + std::to_string(id) + " not found");
        }
        if (current->status != RingingStatus::Ringing) {
            throw StateConflict("ringing entry " + std::to_string(id) + " is already " +
                                to_string(current->status));
        }
        auto next_status = status;
        if (status == RingingStatus::Accepted && current->is_expired(clock_())) {
            next_status = RingingStatus::Expired;
        }
        Statement stmt(*db_,
                       "UPDATE targeted_ringing SET status = ?2 WHERE id = ?1 AND status = 'ringing'");
        stmt.bind(1, id).bind(2, to_string(next_status));
        stmt.run();
        ringing = *current;
        ringing.status = next_status;
        outbox.add(make_event(ringing.tenant_id, "ringing", "upsert", ringing));
        txn.commit();
    }
    dispatch(outbox);
    return ringing;
}

std::vector<TargetedRinging> SessionRecordStore::list_ringing_for(const std::string& tenant_id,
                                                                  const std::string& agent_id) {
    auto lock = db_->lock();
    Statement stmt(*db_, std::string("SELECT ") + kRingingColumns +
                             " FROM targeted_ringing WHERE tenant_id = ?1 AND target_agent = ?2 "
                             "AND status = 'ringing' AND expires_at > ?3 ORDER BY created_at ASC");
    stmt.bind(1, tenant_id).bind(2, agent_id).bind(3, clock_());
    std::vector<TargetedRinging> entries;
    while (stmt.step()) {
        entries.push_back(row_to_ringing(stmt));
    }
    return entries;
}

std::vector<TargetedRinging> SessionRecordStore::expire_ringing() {
    Outbox outbox;
    std::vector<TargetedRinging> expired;
    {
        auto lock = db_->lock();
        Transaction txn(*db_);
        const auto now = clock_();
        Statement select(*db_, std::string("SELECT ") + kRingingColumns +
                                   " FROM targeted_ringing WHERE status = 'ringing' "
                                   "AND expires_at <= ?1");
        select.bind(1, now);
        while (select.step()) {
            auto entry = row_to_ringing(select);
            entry.status = RingingStatus::Expired;
            expired.push_back(entry);
        }
        Statement update(*db_,
                         "UPDATE targeted_ringing SET status = 'expired' "
                         "WHERE status = 'ringing' AND expires_at <= ?1");
        update.bind(1, now);
        update.run();
        for (const auto& entry : expired) {
            outbox.add(make_event(entry.tenant_id, "ringing", "upsert", entry));
        }
        txn.commit();
    }
    dispatch(outbox);
    return expired;
}

int SessionRecordStore::cleanup_ringing() {
    auto lock = db_->lock();
    Statement stmt(*db_,
                   "DELETE FROM targeted_ringing WHERE status <> 'ringing' OR expires_at <= ?1");
    stmt.bind(1, clock_());
    stmt.run();
    return db_->changes();
}

std::vector<CallHistoryRecord> SessionRecordStore::list_history(const std::string& tenant_id,
                                                                int limit) {
    auto lock = db_->lock();
    Statement stmt(*db_, std::string("SELECT ") + kHistoryColumns +
                             " FROM call_history WHERE tenant_id = ?1 "
                             "ORDER BY ended_at DESC, id DESC LIMIT ?2");
    stmt.bind(1, tenant_id).bind(2, limit);
    std::vector<CallHistoryRecord> records;
    while (stmt.step()) {
        records.push_back(row_to_history(stmt));
    }
    return records;
}

std::optional<CallHistoryRecord> SessionRecordStore::history_for(
    const std::string& provider_call_id) {
    auto lock = db_->lock();
    Statement stmt(*db_, std::string("SELECT ") + kHistoryColumns +
                             " FROM call_history WHERE provider_call_id = ?1");
    stmt.bind(1, provider_call_id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return row_to_history(stmt);
}

HistoryStats SessionRecordStore::history_stats(const std::string& tenant_id,
                                               TimestampMs from,
                                               TimestampMs to,
                                               const std::optional<std::string>& agent_id) {
    if (from > to) {
        throw InvalidValue("history window starts after it ends");
    }
    HistoryStats stats;
    stats.tenant_id = tenant_id;
    stats.from = from;
    stats.to = to;
    stats.agent_id = agent_id;

    auto lock = db_->lock();
    Statement stmt(*db_,
                   "SELECT COUNT(*), "
                   "COALESCE(SUM(CASE WHEN direction = 'inbound' AND outcome = 'answered' "
                   "THEN 1 ELSE 0 END), 0), "
                   "COALESCE(SUM(CASE WHEN direction = 'inbound' AND outcome = 'missed' "
                   "THEN 1 ELSE 0 END), 0), "
                   "COALESCE(SUM(CASE WHEN direction = 'outbound' THEN 1 ELSE 0 END), 0), "
                   "COALESCE(SUM(talk_time_sec), 0), "
                   "COALESCE(SUM(CASE WHEN outcome = 'answered' THEN 1 ELSE 0 END), 0) "
                   "FROM call_history WHERE tenant_id = ?1 AND ended_at >= ?2 AND ended_at < ?3 "
                   "AND (?4 IS NULL OR handled_by_agent = ?4)");
    stmt.bind(1, tenant_id).bind(2, from).bind(3, to).bind(4, agent_id);
    if (stmt.step()) {
        stats.total_calls = stmt.column_int64(0);
        stats.inbound_answered = stmt.column_int64(1);
        stats.inbound_missed = stmt.column_int64(2);
        stats.outbound = stmt.column_int64(3);
        stats.total_talk_time_sec = stmt.column_int64(4);
        const auto answered = stmt.column_int64(5);
        if (answered > 0) {
            stats.average_talk_time_sec =
                static_cast<double>(stats.total_talk_time_sec) / static_cast<double>(answered);
        }
    }
    return stats;
}

}
