#pragma once

#include <optional>
#include <string>

#include "switchboard/model/types.hpp"

namespace switchboard {

enum class TransitionKind {
    Answer,
    Connect,
    Hold,
    Resume,
    Park,
    Unpark,
    BeginTransfer,
    AcceptTransfer,
    RevertTransfer,
    ReturnToPark,
    End
};

const char* to_string(TransitionKind kind);
TransitionKind parse_transition_kind(const std::string& value);

struct Transition {
    TransitionKind kind = TransitionKind::End;
    // Answering, resuming or unparking agent; transfer target for BeginTransfer.
    std::optional<std::string> agent;
    std::optional<int> slot;
    std::optional<std::string> conference_name;

    static Transition answer(std::string agent);
    static Transition connect();
    static Transition hold();
    static Transition resume(std::optional<std::string> agent = std::nullopt);
    static Transition park(int slot, std::optional<std::string> conference_name = std::nullopt);
    static Transition unpark(int slot, std::string agent);
    static Transition begin_transfer(std::string target_agent);
    static Transition accept_transfer(std::optional<std::string> agent = std::nullopt);
    static Transition revert_transfer();
    static Transition return_to_park(int slot,
                                     std::optional<std::string> conference_name = std::nullopt);
    static Transition end();
};

namespace state_machine {

bool is_live(SessionState state);
bool is_allowed(SessionState from, TransitionKind kind);

// Validates the transition against the current record and returns the updated copy.
// Throws StateConflict without touching the input when the transition is not legal.
Session apply(const Session& session, const Transition& transition, TimestampMs now);

// Throws StateConflict when parking and assignment overlap.
void check_invariants(const Session& session);

// Outcome used by finalize when the caller supplies none.
CallOutcome derive_outcome(const Session& session);

}

}
