#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "switchboard/feed/change_feed.hpp"
#include "switchboard/model/types.hpp"
#include "switchboard/presence/recorder.hpp"
#include "switchboard/session/state_machine.hpp"
#include "switchboard/store/database.hpp"
#include "switchboard/utils/time.hpp"

namespace switchboard {

struct NewSession {
    std::string tenant_id;
    std::string provider_call_id;
    std::string from;
    std::optional<std::string> from_name;
    std::string to;
    std::optional<std::string> to_name;
    // Dialing agent; required for outbound sessions.
    std::optional<std::string> agent;
    std::optional<std::string> agent_leg_id;
    // Client-generated id echoed back on the record for optimistic reconciliation.
    std::optional<std::string> correlation_id;
};

struct NewTransfer {
    SessionId session_id = 0;
    std::string target_agent;
    TransferKind kind = TransferKind::Direct;
    std::optional<std::string> target_leg_id;
    std::int64_t ring_timeout_ms = 30000;
};

struct TransferResolution {
    PendingTransfer transfer;
    // Absent when the session already ended.
    std::optional<Session> session;
};

struct NewRinging {
    std::string tenant_id;
    std::string target_agent;
    std::string caller_number;
    std::optional<std::string> caller_name;
    std::string caller_leg_id;
    std::optional<std::string> agent_leg_id;
    std::int64_t ttl_ms = 30000;
};

struct RecordStoreOptions {
    int parking_slots = 10;
};

std::string parking_conference_name(const std::string& tenant_id, int slot);

// Durable record of live sessions, parking lot, transfers, ringing entries and history.
// Every mutation runs in one SQLite transaction; change events and presence side effects
// are delivered after commit.
class SessionRecordStore {
public:
    SessionRecordStore(std::shared_ptr<store::Database> db,
                       std::shared_ptr<ChangeFeed> feed,
                       RecordStoreOptions options = {},
                       utils::Clock clock = utils::now_ms);

    void set_presence_recorder(std::shared_ptr<PresenceRecorder> recorder);

    const RecordStoreOptions& options() const { return options_; }
    TimestampMs now() const { return clock_(); }

    Session create_inbound(const NewSession& request);
    Session create_outbound(const NewSession& request);

    std::optional<Session> get(const std::string& provider_call_id);
    std::optional<Session> get_by_id(SessionId id);
    Session require(SessionId id);
    // Matches either the caller leg or the agent leg.
    std::optional<Session> find_by_leg(const std::string& leg_id);

    std::vector<Session> list_by_tenant(const std::string& tenant_id);
    std::vector<Session> list_by_state(const std::string& tenant_id, SessionState state);
    std::vector<Session> list_by_agent(const std::string& tenant_id, const std::string& agent_id);
    std::vector<Session> list_ringing(const std::string& tenant_id);
    std::vector<Session> list_parked(const std::string& tenant_id);

    Session apply_transition(SessionId id, const Transition& transition, const std::string& actor);
    Session set_agent_leg(SessionId id, std::optional<std::string> leg_id);
    Session set_conference(SessionId id, std::optional<std::string> conference_name);

    // Moves the session to history. Returns nothing when it was already finalized.
    std::optional<CallHistoryRecord> finalize(SessionId id,
                                              std::optional<CallOutcome> outcome = std::nullopt,
                                              std::optional<std::int64_t> duration_sec = std::nullopt);

    // Applies an out-of-band provider status callback. Unknown legs are logged and ignored.
    // Throws InvalidValue for a status outside the provider's vocabulary.
    void reconcile_provider_status(const std::string& leg_id,
                                   const std::string& status,
                                   std::optional<std::int64_t> duration_sec = std::nullopt);

    void initialize_slots(const std::string& tenant_id, int count);
    std::optional<ParkingSlot> get_slot(const std::string& tenant_id, int slot);
    std::vector<ParkingSlot> list_slots(const std::string& tenant_id);
    std::optional<int> first_free_slot(const std::string& tenant_id);

    // Slot compare-and-set plus connected/on_hold -> parked. Throws SlotConflict if taken.
    Session park_session(SessionId id, int slot, const std::string& actor);
    // Slot compare-and-set plus parked -> connected under the agent.
    Session unpark_session(const std::string& tenant_id,
                           int slot,
                           const std::string& agent_id,
                           std::optional<std::string> agent_leg_id = std::nullopt);

    PendingTransfer begin_transfer(const NewTransfer& request, const std::string& actor);
    PendingTransfer set_transfer_leg(TransferId id, const std::string& leg_id);
    std::optional<PendingTransfer> get_transfer(TransferId id);
    std::vector<PendingTransfer> list_ringing_transfers_for(const std::string& tenant_id,
                                                            const std::string& agent_id);
    std::vector<PendingTransfer> list_expired_transfers();
    // Accept on an expired transfer, or on a session that already ended, resolves to timeout.
    // Throws StateConflict when the transfer is no longer ringing.
    TransferResolution resolve_transfer(TransferId id,
                                        TransferStatus resolution,
                                        const std::optional<std::string>& actor);

    TargetedRinging create_ringing(const NewRinging& request);
    std::optional<TargetedRinging> get_ringing(RingingId id);
    TargetedRinging set_ringing_agent_leg(RingingId id, const std::string& leg_id);
    TargetedRinging resolve_ringing(RingingId id, RingingStatus status);
    std::vector<TargetedRinging> list_ringing_for(const std::string& tenant_id,
                                                  const std::string& agent_id);
    std::vector<TargetedRinging> expire_ringing();
    int cleanup_ringing();

    std::vector<CallHistoryRecord> list_history(const std::string& tenant_id, int limit = 50);
    std::optional<CallHistoryRecord> history_for(const std::string& provider_call_id);
    // Throws InvalidValue when from is after to.
    HistoryStats history_stats(const std::string& tenant_id,
                               TimestampMs from,
                               TimestampMs to,
                               const std::optional<std::string>& agent_id = std::nullopt);

private:
    class Outbox;

    void initialize_schema();
    void dispatch(Outbox& outbox);

    std::optional<Session> load_session(SessionId id);
    std::optional<Session> load_session_by_call(const std::string& provider_call_id);
    std::vector<Session> query_sessions(const std::string& where,
                                        const std::function<void(store::Statement&)>& bind);
    void write_session(const Session& session);
    std::optional<PendingTransfer> load_transfer(TransferId id);
    std::optional<TargetedRinging> load_ringing(RingingId id);
    std::optional<ParkingSlot> load_slot(const std::string& tenant_id, int slot);
    bool occupy_slot(const Session& session, int slot, const std::optional<std::string>& parked_by,
                     TimestampMs now);
    bool release_slot(const std::string& tenant_id, int slot, SessionId session_id);
    std::optional<int> lowest_free_slot(const std::string& tenant_id);
    bool agent_has_live_sessions(const std::string& tenant_id, const std::string& agent_id);
    void require_slot_in_range(int slot) const;

    Session transition_locked(const Session& current,
                              const Transition& transition,
                              const std::string& actor,
                              Outbox& outbox);
    void presence_effects(const Session& before,
                          const Session& after,
                          TransitionKind kind,
                          Outbox& outbox);
    CallHistoryRecord finalize_locked(const Session& session,
                                      std::optional<CallOutcome> outcome,
                                      std::optional<std::int64_t> duration_sec,
                                      Outbox& outbox);

    std::shared_ptr<store::Database> db_;
    std::shared_ptr<ChangeFeed> feed_;
    RecordStoreOptions options_;
    utils::Clock clock_;
    std::shared_ptr<PresenceRecorder> presence_;
};

}
