#include "switchboard/session/state_machine.hpp"

#include <array>
#include <vector>
#include <utility>

#include "switchboard/errors.hpp"

namespace switchboard {

namespace {

struct TransitionRule {
    TransitionKind kind;
    const char* name;
    std::vector<SessionState> from;
};

const std::array<TransitionRule, 11> kRules = {{
    {TransitionKind::Answer, "answer", {SessionState::Ringing, SessionState::Connecting}},
    {TransitionKind::Connect, "connect", {SessionState::Connecting}},
    {TransitionKind::Hold, "hold", {SessionState::Connected}},
    {TransitionKind::Resume, "resume", {SessionState::OnHold}},
    {TransitionKind::Park, "park", {SessionState::Connected, SessionState::OnHold}},
    {TransitionKind::Unpark, "unpark", {SessionState::Parked}},
    {TransitionKind::BeginTransfer, "begin_transfer",
     {SessionState::Connected, SessionState::OnHold, SessionState::Parked}},
    {TransitionKind::AcceptTransfer, "accept_transfer", {SessionState::Transferring}},
    {TransitionKind::RevertTransfer, "revert_transfer", {SessionState::Transferring}},
    {TransitionKind::ReturnToPark, "return_to_park", {SessionState::Transferring}},
    {TransitionKind::End, "end",
     {SessionState::Ringing, SessionState::Connecting, SessionState::Connected,
      SessionState::OnHold, SessionState::Parked, SessionState::Transferring}},
}};

const TransitionRule& rule_for(TransitionKind kind) {
    for (const auto& rule : kRules) {
        if (rule.kind == kind) {
            return rule;
        }
    }
    throw InvalidValue("unknown transition kind");
}

StateConflict conflict(const Session& session, const Transition& transition,
                       const std::string& reason) {
    return StateConflict(std::string("cannot ") + to_string(transition.kind) + " session " +
                         std::to_string(session.id) + " in state " +
                         to_string(session.state) + ": " + reason);
}

void accrue_hold(Session& session, TimestampMs now) {
    if (session.hold_started_at) {
        if (now > *session.hold_started_at) {
            session.hold_accumulated_ms += now - *session.hold_started_at;
        }
        session.hold_started_at.reset();
    }
}

void mark_answered(Session& session, TimestampMs now) {
    if (!session.answered_at) {
        session.answered_at = now;
    }
}

}

const char* to_string(TransitionKind kind) {
    return rule_for(kind).name;
}

TransitionKind parse_transition_kind(const std::string& value) {
    for (const auto& rule : kRules) {
        if (value == rule.name) {
            return rule.kind;
        }
    }
    throw InvalidValue("unknown transition: '" + value + "'");
}

Transition Transition::answer(std::string agent) {
    Transition transition;
    transition.kind = TransitionKind::Answer;
    transition.agent = std::move(agent);
    return transition;
}

Transition Transition::connect() {
    Transition transition;
    transition.kind = TransitionKind::Connect;
    return transition;
}

Transition Transition::hold() {
    Transition transition;
    transition.kind = TransitionKind::Hold;
    return transition;
}

Transition Transition::resume(std::optional<std::string> agent) {
    Transition transition;
    transition.kind = TransitionKind::Resume;
    transition.agent = std::move(agent);
    return transition;
}

Transition Transition::park(int slot, std::optional<std::string> conference_name) {
    Transition transition;
    transition.kind = TransitionKind::Park;
    transition.slot = slot;
    transition.conference_name = std::move(conference_name);
    return transition;
}

Transition Transition::unpark(int slot, std::string agent) {
    Transition transition;
    transition.kind = TransitionKind::Unpark;
    transition.slot = slot;
    transition.agent = std::move(agent);
    return transition;
}

Transition Transition::begin_transfer(std::string target_agent) {
    Transition transition;
    transition.kind = TransitionKind::BeginTransfer;
    transition.agent = std::move(target_agent);
    return transition;
}

Transition Transition::accept_transfer(std::optional<std::string> agent) {
    Transition transition;
    transition.kind = TransitionKind::AcceptTransfer;
    transition.agent = std::move(agent);
    return transition;
}

Transition Transition::revert_transfer() {
    Transition transition;
    transition.kind = TransitionKind::RevertTransfer;
    return transition;
}

Transition Transition::return_to_park(int slot, std::optional<std::string> conference_name) {
    Transition transition;
    transition.kind = TransitionKind::ReturnToPark;
    transition.slot = slot;
    transition.conference_name = std::move(conference_name);
    return transition;
}

Transition Transition::end() {
    return Transition{};
}

namespace state_machine {

bool is_live(SessionState state) {
    return state != SessionState::Ended;
}

bool is_allowed(SessionState from, TransitionKind kind) {
    for (const auto state : rule_for(kind).from) {
        if (state == from) {
            return true;
        }
    }
    return false;
}

Session apply(const Session& session, const Transition& transition, TimestampMs now) {
    if (!is_allowed(session.state, transition.kind)) {
        throw conflict(session, transition, "transition not allowed");
    }

    Session next = session;
    switch (transition.kind) {
    case TransitionKind::Answer:
        if (!transition.agent || transition.agent->empty()) {
            throw conflict(session, transition, "an answering agent is required");
        }
        next.assigned_agent = transition.agent;
        mark_answered(next, now);
        next.state = SessionState::Connected;
        break;
    case TransitionKind::Connect:
        mark_answered(next, now);
        next.state = SessionState::Connected;
        break;
    case TransitionKind::Hold:
        next.hold_started_at = now;
        next.state = SessionState::OnHold;
        break;
    case TransitionKind::Resume:
        accrue_hold(next, now);
        if (transition.agent) {
            next.assigned_agent = transition.agent;
        }
        if (!next.assigned_agent) {
            throw conflict(session, transition, "no agent to resume with");
        }
        next.state = SessionState::Connected;
        break;
    case TransitionKind::Park:
    case TransitionKind::ReturnToPark:
        if (!transition.slot || *transition.slot <= 0) {
            throw conflict(session, transition, "a parking slot is required");
        }
        if (transition.kind == TransitionKind::Park && next.assigned_agent) {
            next.previous_agent = next.assigned_agent;
        }
        if (transition.kind == TransitionKind::ReturnToPark) {
            accrue_hold(next, now);
        }
        if (!next.hold_started_at) {
            next.hold_started_at = now;
        }
        next.assigned_agent.reset();
        next.parking_slot = transition.slot;
        next.conference_name = transition.conference_name;
        next.state = SessionState::Parked;
        break;
    case TransitionKind::Unpark:
        if (!transition.agent || transition.agent->empty()) {
            throw conflict(session, transition, "an unparking agent is required");
        }
        if (!transition.slot || session.parking_slot != transition.slot) {
            throw conflict(session, transition, "session is not parked in that slot");
        }
        accrue_hold(next, now);
        next.parking_slot.reset();
        next.conference_name.reset();
        next.assigned_agent = transition.agent;
        next.state = SessionState::Connected;
        break;
    case TransitionKind::BeginTransfer:
        if (!transition.agent || transition.agent->empty()) {
            throw conflict(session, transition, "a transfer target is required");
        }
        if (session.assigned_agent == transition.agent) {
            throw conflict(session, transition, "target already owns the session");
        }
        next.previous_agent = session.assigned_agent;
        next.assigned_agent = transition.agent;
        next.parking_slot.reset();
        next.conference_name.reset();
        if (!next.hold_started_at) {
            next.hold_started_at = now;
        }
        next.state = SessionState::Transferring;
        break;
    case TransitionKind::AcceptTransfer:
        if (transition.agent && transition.agent != session.assigned_agent) {
            throw conflict(session, transition, "only the transfer target can accept");
        }
        accrue_hold(next, now);
        mark_answered(next, now);
        next.state = SessionState::Connected;
        break;
    case TransitionKind::RevertTransfer:
        next.assigned_agent = session.previous_agent;
        next.previous_agent.reset();
        if (next.assigned_agent) {
            accrue_hold(next, now);
            next.state = SessionState::Connected;
        } else {
            if (!next.hold_started_at) {
                next.hold_started_at = now;
            }
            next.state = SessionState::OnHold;
        }
        break;
    case TransitionKind::End:
        accrue_hold(next, now);
        next.ended_at = now;
        next.state = SessionState::Ended;
        next.parking_slot.reset();
        next.conference_name.reset();
        break;
    }

    check_invariants(next);
    return next;
}

void check_invariants(const Session& session) {
    const bool parked = session.state == SessionState::Parked;
    if (parked != session.parking_slot.has_value()) {
        throw StateConflict("session " + std::to_string(session.id) +
                            ": parking slot must be set exactly when parked");
    }
    if (parked && session.assigned_agent) {
        throw StateConflict("session " + std::to_string(session.id) +
                            ": a parked session cannot have an assigned agent");
    }
}

CallOutcome derive_outcome(const Session& session) {
    if (session.answered_at) {
        return CallOutcome::Answered;
    }
    return session.direction == Direction::Inbound ? CallOutcome::Missed
                                                   : CallOutcome::Cancelled;
}

}

}
