#include <catch2/catch_test_macros.hpp>

#include "support/harness.hpp"
#include "switchboard/errors.hpp"
#include "switchboard/utils/time.hpp"

#include <optional>
#include <string>

TEST_CASE("create_inbound is idempotent per provider call id") {
    switchboard::testing::Harness h;
    const auto first = h.inbound("CA1");
    const auto second = h.inbound("CA1");
    REQUIRE(first.id == second.id);
    REQUIRE(first.state == switchboard::SessionState::Ringing);
    REQUIRE(h.store->list_ringing(h.tenant).size() == 1);
    REQUIRE(h.count_events("session", "upsert") == 1);
}

TEST_CASE("create_outbound requires the dialing agent and keeps the correlation id") {
    switchboard::testing::Harness h;
    switchboard::NewSession request;
    request.tenant_id = h.tenant;
    request.provider_call_id = "leg-9";
    request.from = "+15550199";
    request.to = "+15550123";
    REQUIRE_THROWS_AS(h.store->create_outbound(request), switchboard::InvalidValue);

    request.agent = "alice";
    request.correlation_id = "acme-alice-1";
    const auto session = h.store->create_outbound(request);
    REQUIRE(session.state == switchboard::SessionState::Connecting);
    REQUIRE(session.direction == switchboard::Direction::Outbound);
    REQUIRE(session.correlation_id == std::optional<std::string>("acme-alice-1"));
    REQUIRE(h.store->get("leg-9")->correlation_id == session.correlation_id);

    const auto presence = h.presence->get(h.tenant, "alice");
    REQUIRE(presence);
    REQUIRE(presence->status == switchboard::AgentStatus::OnCall);
    const auto metrics = h.presence->daily_metrics(h.tenant, "alice",
                                                   switchboard::utils::utc_date(h.clock.now));
    REQUIRE(metrics);
    REQUIRE(metrics->outbound_made == 1);
}

TEST_CASE("apply_transition rejects coordinator-only transitions") {
    switchboard::testing::Harness h;
    const auto session = h.connected("CA1", "alice");
    REQUIRE_THROWS_AS(
        h.store->apply_transition(session.id, switchboard::Transition::park(1), "alice"),
        switchboard::StateConflict);
    REQUIRE_THROWS_AS(
        h.store->apply_transition(session.id, switchboard::Transition::end(), "alice"),
        switchboard::StateConflict);
    REQUIRE_THROWS_AS(
        h.store->apply_transition(999, switchboard::Transition::hold(), "alice"),
        switchboard::NotFound);
}

TEST_CASE("a second answer loses the race") {
    switchboard::testing::Harness h;
    const auto session = h.inbound("CA1");
    h.store->apply_transition(session.id, switchboard::Transition::answer("alice"), "alice");
    REQUIRE_THROWS_AS(
        h.store->apply_transition(session.id, switchboard::Transition::answer("bob"), "bob"),
        switchboard::StateConflict);
    REQUIRE(h.store->require(session.id).assigned_agent == std::optional<std::string>("alice"));
}

TEST_CASE("finalize writes history once and removes the live record") {
    switchboard::testing::Harness h;
    const auto session = h.inbound("CA1");
    h.clock.now += 2000;
    h.store->apply_transition(session.id, switchboard::Transition::answer("alice"), "alice");
    h.clock.now += 1000;
    h.store->apply_transition(session.id, switchboard::Transition::hold(), "alice");
    h.clock.now += 4000;
    h.store->apply_transition(session.id, switchboard::Transition::resume(), "alice");
    h.clock.now += 5000;

    const auto record = h.store->finalize(session.id);
    REQUIRE(record);
    REQUIRE(record->outcome == switchboard::CallOutcome::Answered);
    REQUIRE(record->handled_by_agent == std::optional<std::string>("alice"));
    REQUIRE(record->duration_sec == 12);
    REQUIRE(record->talk_time_sec == 10);
    REQUIRE(record->hold_time_sec == 4);

    REQUIRE_FALSE(h.store->get_by_id(session.id));
    REQUIRE_FALSE(h.store->finalize(session.id));
    REQUIRE(h.store->list_history(h.tenant).size() == 1);
    REQUIRE(h.count_events("session", "remove") == 1);
    REQUIRE(h.presence->get(h.tenant, "alice")->status == switchboard::AgentStatus::Available);
}

TEST_CASE("unanswered inbound calls finalize as missed") {
    switchboard::testing::Harness h;
    const auto session = h.inbound("CA1");
    const auto record = h.store->finalize(session.id, switchboard::CallOutcome::Answered);
    REQUIRE(record);
    REQUIRE(record->outcome == switchboard::CallOutcome::Missed);
    REQUIRE_FALSE(record->handled_by_agent);
}

TEST_CASE("reconcile_provider_status maps provider vocabulary") {
    switchboard::testing::Harness h;
    h.inbound("CA1");
    h.store->reconcile_provider_status("CA1", "ringing");
    REQUIRE(h.store->get("CA1"));

    h.store->reconcile_provider_status("CA1", "busy", 3);
    REQUIRE_FALSE(h.store->get("CA1"));
    const auto record = h.store->history_for("CA1");
    REQUIRE(record);
    REQUIRE(record->outcome == switchboard::CallOutcome::Busy);
    REQUIRE(record->duration_sec == 3);

    h.store->reconcile_provider_status("CA1", "completed");
    h.store->reconcile_provider_status("unknown-leg", "completed");
    REQUIRE(h.store->list_history(h.tenant).size() == 1);
    REQUIRE_THROWS_AS(h.store->reconcile_provider_status("CA1", "exploded"),
                      switchboard::InvalidValue);
}

TEST_CASE("in-progress connects an outbound session") {
    switchboard::testing::Harness h;
    switchboard::NewSession request;
    request.tenant_id = h.tenant;
    request.provider_call_id = "leg-1";
    request.from = "+15550199";
    request.to = "+15550123";
    request.agent = "alice";
    request.agent_leg_id = "leg-2";
    h.store->create_outbound(request);

    h.store->reconcile_provider_status("leg-2", "in-progress");
    REQUIRE(h.store->get("leg-1")->state == switchboard::SessionState::Connecting);
    h.store->reconcile_provider_status("leg-1", "in-progress");
    const auto session = h.store->get("leg-1");
    REQUIRE(session->state == switchboard::SessionState::Connected);
    REQUIRE(session->answered_at);
}

TEST_CASE("an agent leg ending while the caller is parked keeps the session") {
    switchboard::testing::Harness h;
    auto session = h.connected("CA1", "alice");
    session = h.store->set_agent_leg(session.id, std::string("leg-7"));
    h.store->park_session(session.id, 1, "alice");
    h.store->reconcile_provider_status("leg-7", "completed");
    REQUIRE(h.store->get("CA1")->state == switchboard::SessionState::Parked);
}

TEST_CASE("ringing entries expire and resolve once") {
    switchboard::testing::Harness h;
    switchboard::NewRinging request;
    request.tenant_id = h.tenant;
    request.target_agent = "alice";
    request.caller_number = "+15550100";
    request.caller_leg_id = "CA1";
    request.ttl_ms = 1000;
    const auto entry = h.store->create_ringing(request);
    REQUIRE(h.store->list_ringing_for(h.tenant, "alice").size() == 1);

    const auto accepted = h.store->resolve_ringing(entry.id, switchboard::RingingStatus::Accepted);
    REQUIRE(accepted.status == switchboard::RingingStatus::Accepted);
    REQUIRE_THROWS_AS(h.store->resolve_ringing(entry.id, switchboard::RingingStatus::Declined),
                      switchboard::StateConflict);

    request.caller_leg_id = "CA2";
    const auto late = h.store->create_ringing(request);
    h.clock.now += 1000;
    REQUIRE(h.store->list_ringing_for(h.tenant, "alice").empty());
    const auto expired = h.store->expire_ringing();
    REQUIRE(expired.size() == 1);
    REQUIRE(expired.front().id == late.id);
    REQUIRE(h.store->cleanup_ringing() == 2);
}

TEST_CASE("list_history is newest first and tenant scoped") {
    switchboard::testing::Harness h;
    const auto first = h.inbound("CA1");
    h.store->finalize(first.id);
    h.clock.now += 1000;
    const auto second = h.inbound("CA2");
    h.store->finalize(second.id);

    switchboard::NewSession other;
    other.tenant_id = "globex";
    other.provider_call_id = "CA3";
    other.from = "+1";
    other.to = "+2";
    h.store->finalize(h.store->create_inbound(other).id);

    const auto history = h.store->list_history(h.tenant);
    REQUIRE(history.size() == 2);
    REQUIRE(history[0].provider_call_id == "CA2");
    REQUIRE(h.store->list_history(h.tenant, 1).size() == 1);
}

TEST_CASE("history_stats counts outcomes and talk time inside the window") {
    switchboard::testing::Harness h;
    const auto window_start = h.clock.now;

    const auto alice_call = h.connected("CA1", "alice");
    h.clock.now += 60000;
    h.store->finalize(alice_call.id);

    h.store->finalize(h.inbound("CA2").id);

    switchboard::NewSession outbound;
    outbound.tenant_id = h.tenant;
    outbound.provider_call_id = "leg-1";
    outbound.from = "+15550199";
    outbound.to = "+15550123";
    outbound.agent = "bob";
    h.store->finalize(h.store->create_outbound(outbound).id);

    const auto bob_call = h.connected("CA3", "bob");
    h.clock.now += 30000;
    h.store->finalize(bob_call.id);

    const auto window_end = h.clock.now + 1;
    const auto stats = h.store->history_stats(h.tenant, window_start, window_end);
    REQUIRE(stats.total_calls == 4);
    REQUIRE(stats.inbound_answered == 2);
    REQUIRE(stats.inbound_missed == 1);
    REQUIRE(stats.outbound == 1);
    REQUIRE(stats.total_talk_time_sec == 90);
    REQUIRE(stats.average_talk_time_sec == 45.0);

    const auto alice = h.store->history_stats(h.tenant, window_start, window_end,
                                              std::string("alice"));
    REQUIRE(alice.total_calls == 1);
    REQUIRE(alice.inbound_answered == 1);
    REQUIRE(alice.total_talk_time_sec == 60);
    REQUIRE(alice.agent_id == std::optional<std::string>("alice"));

    const auto later = h.store->history_stats(h.tenant, window_end, window_end + 1000);
    REQUIRE(later.total_calls == 0);
    REQUIRE(later.average_talk_time_sec == 0.0);
    REQUIRE(h.store->history_stats("globex", window_start, window_end).total_calls == 0);

    REQUIRE_THROWS_AS(h.store->history_stats(h.tenant, window_end, window_start),
                      switchboard::InvalidValue);
}
