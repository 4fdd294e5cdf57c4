#include <catch2/catch_test_macros.hpp>

#include "support/harness.hpp"
#include "switchboard/errors.hpp"
#include "switchboard/utils/time.hpp"

#include <string>

TEST_CASE("heartbeat creates an available agent and revives an offline one") {
    switchboard::testing::Harness h;
    const auto first = h.presence->heartbeat(h.tenant, "alice");
    REQUIRE(first.status == switchboard::AgentStatus::Available);
    REQUIRE(first.last_heartbeat == h.clock.now);

    h.presence->go_offline(h.tenant, "alice");
    REQUIRE(h.presence->get(h.tenant, "alice")->status == switchboard::AgentStatus::Offline);
    h.presence->heartbeat(h.tenant, "alice");
    REQUIRE(h.presence->get(h.tenant, "alice")->status == switchboard::AgentStatus::Available);
}

TEST_CASE("a stale heartbeat reads as offline") {
    switchboard::testing::Harness h;
    h.presence->set_status(h.tenant, "alice", switchboard::AgentStatus::OnBreak,
                           std::string("lunch"));
    h.clock.now += 30000;
    REQUIRE(h.presence->get(h.tenant, "alice")->status == switchboard::AgentStatus::OnBreak);
    h.clock.now += 1;
    const auto stale = h.presence->get(h.tenant, "alice");
    REQUIRE(stale->status == switchboard::AgentStatus::Offline);
    REQUIRE(stale->status_message == std::optional<std::string>("lunch"));
    REQUIRE(h.presence->list(h.tenant).front().status == switchboard::AgentStatus::Offline);
    REQUIRE_FALSE(h.presence->get(h.tenant, "nobody"));
}

TEST_CASE("answering counts toward the agent's daily metrics") {
    switchboard::testing::Harness h;
    const auto session = h.connected("CA1", "alice");
    REQUIRE(h.presence->get(h.tenant, "alice")->current_session ==
            std::optional<switchboard::SessionId>(session.id));

    h.clock.now += 65000;
    h.store->finalize(session.id);
    const auto metrics = h.presence->daily_metrics(h.tenant, "alice",
                                                   switchboard::utils::utc_date(h.clock.now));
    REQUIRE(metrics);
    REQUIRE(metrics->calls_accepted == 1);
    REQUIRE(metrics->inbound_accepted == 1);
    REQUIRE(metrics->talk_time_sec == 65);
    const auto presence = h.presence->get(h.tenant, "alice");
    REQUIRE(presence->status == switchboard::AgentStatus::Available);
    REQUIRE_FALSE(presence->current_session);
}

TEST_CASE("an agent with two calls stays on call until both end") {
    switchboard::testing::Harness h;
    const auto first = h.connected("CA1", "alice");
    h.connected("CA2", "alice");
    h.store->finalize(first.id);
    REQUIRE(h.presence->get(h.tenant, "alice")->status == switchboard::AgentStatus::OnCall);
}

TEST_CASE("presence requires tenant and agent") {
    switchboard::testing::Harness h;
    REQUIRE_THROWS_AS(h.presence->heartbeat("", "alice"), switchboard::InvalidValue);
    REQUIRE(switchboard::utils::utc_date(0) == "1970-01-01");
}
