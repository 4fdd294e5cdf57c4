#include <catch2/catch_message.hpp>
#include <catch2/catch_test_macros.hpp>

#include "switchboard/errors.hpp"
#include "switchboard/session/state_machine.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <utility>

namespace {

switchboard::Session ringing_session() {
    switchboard::Session session;
    session.id = 7;
    session.tenant_id = "acme";
    session.provider_call_id = "CA7";
    session.from = "+15550100";
    session.to = "+15550199";
    session.started_at = 1000;
    return session;
}

std::vector<switchboard::Session> live_samples() {
    using switchboard::SessionState;
    std::vector<switchboard::Session> samples;

    samples.push_back(ringing_session());

    auto connecting = ringing_session();
    connecting.direction = switchboard::Direction::Outbound;
    connecting.state = SessionState::Connecting;
    connecting.assigned_agent = "alice";
    samples.push_back(connecting);

    auto connected = ringing_session();
    connected.state = SessionState::Connected;
    connected.assigned_agent = "alice";
    connected.answered_at = 1500;
    samples.push_back(connected);

    auto on_hold = connected;
    on_hold.state = SessionState::OnHold;
    on_hold.hold_started_at = 1800;
    samples.push_back(on_hold);

    auto parked = connected;
    parked.state = SessionState::Parked;
    parked.assigned_agent.reset();
    parked.previous_agent = "alice";
    parked.parking_slot = 2;
    parked.conference_name = "park-acme-2";
    parked.hold_started_at = 1800;
    samples.push_back(parked);

    auto transferring = connected;
    transferring.state = SessionState::Transferring;
    transferring.previous_agent = "alice";
    transferring.assigned_agent = "bob";
    transferring.hold_started_at = 1800;
    samples.push_back(transferring);

    return samples;
}

std::vector<switchboard::Transition> every_transition() {
    using switchboard::Transition;
    return {Transition::answer("carol"),
            Transition::connect(),
            Transition::hold(),
            Transition::resume(),
            Transition::park(4, std::string("park-acme-4")),
            Transition::unpark(2, "carol"),
            Transition::begin_transfer("carol"),
            Transition::accept_transfer(),
            Transition::revert_transfer(),
            Transition::return_to_park(3, std::string("park-acme-3")),
            Transition::end()};
}

bool same_session(const switchboard::Session& a, const switchboard::Session& b) {
    return a.state == b.state && a.assigned_agent == b.assigned_agent &&
           a.previous_agent == b.previous_agent && a.parking_slot == b.parking_slot &&
           a.conference_name == b.conference_name && a.answered_at == b.answered_at &&
           a.ended_at == b.ended_at && a.hold_started_at == b.hold_started_at &&
           a.hold_accumulated_ms == b.hold_accumulated_ms;
}

}

TEST_CASE("answer assigns the agent and stamps answered_at once") {
    using switchboard::Transition;
    const auto answered =
        switchboard::state_machine::apply(ringing_session(), Transition::answer("alice"), 2000);
    REQUIRE(answered.state == switchboard::SessionState::Connected);
    REQUIRE(answered.assigned_agent == std::optional<std::string>("alice"));
    REQUIRE(answered.answered_at == std::optional<switchboard::TimestampMs>(2000));

    const auto held = switchboard::state_machine::apply(answered, Transition::hold(), 3000);
    const auto resumed = switchboard::state_machine::apply(held, Transition::resume(), 4500);
    REQUIRE(resumed.answered_at == std::optional<switchboard::TimestampMs>(2000));
    REQUIRE(resumed.hold_accumulated_ms == 1500);
    REQUIRE_FALSE(resumed.hold_started_at);
}

TEST_CASE("illegal transitions raise StateConflict and leave the input alone") {
    using switchboard::Transition;
    const auto session = ringing_session();
    REQUIRE_THROWS_AS(switchboard::state_machine::apply(session, Transition::hold(), 2000),
                      switchboard::StateConflict);
    REQUIRE_THROWS_AS(switchboard::state_machine::apply(session, Transition::unpark(1, "bob"), 2000),
                      switchboard::StateConflict);
    REQUIRE(session.state == switchboard::SessionState::Ringing);

    auto ended = switchboard::state_machine::apply(session, Transition::end(), 2000);
    REQUIRE(ended.state == switchboard::SessionState::Ended);
    REQUIRE_THROWS_AS(switchboard::state_machine::apply(ended, Transition::end(), 3000),
                      switchboard::StateConflict);
}

TEST_CASE("parking clears the agent and remembers who parked") {
    using switchboard::Transition;
    const auto answered =
        switchboard::state_machine::apply(ringing_session(), Transition::answer("alice"), 2000);
    const auto parked =
        switchboard::state_machine::apply(answered, Transition::park(2, "park-acme-2"), 3000);
    REQUIRE(parked.state == switchboard::SessionState::Parked);
    REQUIRE_FALSE(parked.assigned_agent);
    REQUIRE(parked.previous_agent == std::optional<std::string>("alice"));
    REQUIRE(parked.parking_slot == std::optional<int>(2));

    REQUIRE_THROWS_AS(
        switchboard::state_machine::apply(parked, Transition::unpark(3, "bob"), 4000),
        switchboard::StateConflict);
    const auto unparked =
        switchboard::state_machine::apply(parked, Transition::unpark(2, "bob"), 5000);
    REQUIRE(unparked.state == switchboard::SessionState::Connected);
    REQUIRE(unparked.assigned_agent == std::optional<std::string>("bob"));
    REQUIRE_FALSE(unparked.parking_slot);
    REQUIRE(unparked.hold_accumulated_ms == 2000);
}

TEST_CASE("a transfer target must differ from the owner") {
    using switchboard::Transition;
    const auto answered =
        switchboard::state_machine::apply(ringing_session(), Transition::answer("alice"), 2000);
    REQUIRE_THROWS_AS(
        switchboard::state_machine::apply(answered, Transition::begin_transfer("alice"), 3000),
        switchboard::StateConflict);

    const auto transferring =
        switchboard::state_machine::apply(answered, Transition::begin_transfer("bob"), 3000);
    REQUIRE(transferring.state == switchboard::SessionState::Transferring);
    REQUIRE(transferring.previous_agent == std::optional<std::string>("alice"));

    REQUIRE_THROWS_AS(switchboard::state_machine::apply(
                          transferring, Transition::accept_transfer(std::string("carol")), 4000),
                      switchboard::StateConflict);
    const auto reverted =
        switchboard::state_machine::apply(transferring, Transition::revert_transfer(), 4000);
    REQUIRE(reverted.state == switchboard::SessionState::Connected);
    REQUIRE(reverted.assigned_agent == std::optional<std::string>("alice"));
}

TEST_CASE("reverting an unowned transfer leaves the caller on hold") {
    using switchboard::Transition;
    auto session = ringing_session();
    session.state = switchboard::SessionState::Transferring;
    session.assigned_agent = "bob";
    const auto reverted =
        switchboard::state_machine::apply(session, Transition::revert_transfer(), 4000);
    REQUIRE(reverted.state == switchboard::SessionState::OnHold);
    REQUIRE_FALSE(reverted.assigned_agent);
    REQUIRE(reverted.hold_started_at == std::optional<switchboard::TimestampMs>(4000));
}

TEST_CASE("derive_outcome depends on answer and direction") {
    auto session = ringing_session();
    REQUIRE(switchboard::state_machine::derive_outcome(session) ==
            switchboard::CallOutcome::Missed);
    session.direction = switchboard::Direction::Outbound;
    REQUIRE(switchboard::state_machine::derive_outcome(session) ==
            switchboard::CallOutcome::Cancelled);
    session.answered_at = 5;
    REQUIRE(switchboard::state_machine::derive_outcome(session) ==
            switchboard::CallOutcome::Answered);
}

TEST_CASE("transition names round trip and unknown names are rejected") {
    REQUIRE(switchboard::parse_transition_kind("return_to_park") ==
            switchboard::TransitionKind::ReturnToPark);
    REQUIRE_THROWS_AS(switchboard::parse_transition_kind("teleport"), switchboard::InvalidValue);
    REQUIRE_THROWS_AS(switchboard::parse_session_state("limbo"), switchboard::InvalidValue);
}

TEST_CASE("ending a parked session clears its slot") {
    using switchboard::Transition;
    const auto answered =
        switchboard::state_machine::apply(ringing_session(), Transition::answer("alice"), 2000);
    const auto parked =
        switchboard::state_machine::apply(answered, Transition::park(2, "park-acme-2"), 3000);
    const auto ended = switchboard::state_machine::apply(parked, Transition::end(), 4000);
    REQUIRE(ended.state == switchboard::SessionState::Ended);
    REQUIRE_FALSE(ended.parking_slot);
    REQUIRE_FALSE(ended.conference_name);
    REQUIRE(ended.hold_accumulated_ms == 1000);
    REQUIRE_NOTHROW(switchboard::state_machine::check_invariants(ended));
}

TEST_CASE("every transition from every live state either conflicts or keeps the invariants") {
    for (const auto& session : live_samples()) {
        for (const auto& transition : every_transition()) {
            CAPTURE(switchboard::to_string(session.state), switchboard::to_string(transition.kind));
            const auto before = session;
            try {
                const auto next = switchboard::state_machine::apply(session, transition, 5000);
                REQUIRE(switchboard::state_machine::is_allowed(session.state, transition.kind));
                REQUIRE_NOTHROW(switchboard::state_machine::check_invariants(next));
            } catch (const switchboard::StateConflict&) {
                REQUIRE(same_session(session, before));
            }
        }
    }
}

TEST_CASE("end succeeds from every live state") {
    for (const auto& session : live_samples()) {
        CAPTURE(switchboard::to_string(session.state));
        const auto ended =
            switchboard::state_machine::apply(session, switchboard::Transition::end(), 5000);
        REQUIRE(ended.state == switchboard::SessionState::Ended);
        REQUIRE(ended.ended_at == std::optional<switchboard::TimestampMs>(5000));
        REQUIRE_FALSE(ended.parking_slot);
        REQUIRE_FALSE(ended.hold_started_at);
        REQUIRE_NOTHROW(switchboard::state_machine::check_invariants(ended));
    }
}

TEST_CASE("short transition sequences never break the invariants") {
    std::vector<switchboard::Session> frontier = live_samples();
    std::size_t visited = 0;
    for (int depth = 0; depth < 3; ++depth) {
        std::vector<switchboard::Session> next_frontier;
        for (const auto& session : frontier) {
            for (const auto& transition : every_transition()) {
                switchboard::Session next;
                try {
                    next = switchboard::state_machine::apply(session, transition,
                                                             6000 + depth * 1000);
                } catch (const switchboard::StateConflict&) {
                    continue;
                }
                CAPTURE(depth, switchboard::to_string(session.state),
                        switchboard::to_string(transition.kind));
                REQUIRE_NOTHROW(switchboard::state_machine::check_invariants(next));
                ++visited;
                if (switchboard::state_machine::is_live(next.state)) {
                    next_frontier.push_back(next);
                }
            }
        }
        frontier = std::move(next_frontier);
    }
    REQUIRE(visited > 0);
}
