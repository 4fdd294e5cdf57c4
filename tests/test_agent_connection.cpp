#include <catch2/catch_test_macros.hpp>

#include "support/harness.hpp"
#include "switchboard/client/agent_connection.hpp"
#include "switchboard/client/store_session_sync.hpp"
#include "switchboard/errors.hpp"

#include <chrono>
#include <memory>
#include <string>

using namespace std::chrono_literals;

namespace {

class NoopSignaling : public switchboard::SignalingTransport {
public:
    bool reregister() override { return true; }
    bool reinitialize() override { return true; }
};

const switchboard::AgentIdentity kAlice{"acme", "alice"};

std::unique_ptr<switchboard::AgentConnection> connect(switchboard::testing::Harness& h,
                                                      std::shared_ptr<switchboard::SessionSync> sync) {
    switchboard::AgentConnectionOptions options;
    options.max_concurrent_calls = 2;
    options.heartbeat_interval = 10000ms;
    auto presence = h.presence;
    auto connection = std::make_unique<switchboard::AgentConnection>(
        kAlice, h.provider, std::make_shared<NoopSignaling>(), std::move(sync), h.feed,
        [presence] { presence->heartbeat("acme", "alice"); },
        [presence] { presence->go_offline("acme", "alice"); }, options, h.clock.fn());
    connection->start();
    return connection;
}

}

TEST_CASE("an outbound dial is confirmed when its record reaches the feed") {
    switchboard::testing::Harness h;
    auto connection =
        connect(h, std::make_shared<switchboard::StoreSessionSync>(h.store, kAlice));

    const auto correlation_id = connection->dial("+15550123");
    REQUIRE_FALSE(connection->is_outbound_pending(correlation_id));
    const auto entries = connection->outbound_entries();
    REQUIRE(entries.size() == 1);
    REQUIRE(entries.front().id > 0);
    REQUIRE(entries.front().provider_call_id == "leg-1");
    REQUIRE(entries.front().correlation_id == std::optional<std::string>(correlation_id));
    REQUIRE(h.store->list_by_agent("acme", "alice").size() == 1);
}

TEST_CASE("an outbound dial stays pending until a record carries its correlation id") {
    switchboard::testing::Harness h;
    auto connection = connect(h, nullptr);

    const auto correlation_id = connection->dial("+15550123");
    REQUIRE(connection->is_outbound_pending(correlation_id));
    REQUIRE(connection->outbound_entries().front().id == 0);

    switchboard::NewSession unrelated;
    unrelated.tenant_id = "acme";
    unrelated.provider_call_id = "leg-1";
    unrelated.from = "acme-alice";
    unrelated.to = "+15550123";
    unrelated.agent = std::string("alice");
    h.store->create_outbound(unrelated);
    REQUIRE(connection->is_outbound_pending(correlation_id));

    auto matching = unrelated;
    matching.provider_call_id = "provider-77";
    matching.correlation_id = correlation_id;
    h.store->create_outbound(matching);
    REQUIRE_FALSE(connection->is_outbound_pending(correlation_id));
    REQUIRE(connection->outbound_entries().front().provider_call_id == "provider-77");
}

TEST_CASE("a failed dial rolls back its pending entry") {
    switchboard::testing::Harness h;
    auto connection = connect(h, nullptr);
    h.provider->fail_on = {"ring"};

    REQUIRE_THROWS_AS(connection->dial("+15550123"), switchboard::TransportError);
    REQUIRE(connection->pending_outbound() == 0);
    REQUIRE(connection->outbound_entries().empty());
    REQUIRE(connection->calls().count() == 0);
}

TEST_CASE("answering on the device claims the shared session") {
    switchboard::testing::Harness h;
    auto connection =
        connect(h, std::make_shared<switchboard::StoreSessionSync>(h.store, kAlice));
    const auto session = h.inbound("CA1");

    switchboard::ProviderEvent incoming;
    incoming.type = switchboard::LegEventType::Incoming;
    incoming.leg_id = "CA1";
    incoming.remote = "+15550100";
    connection->handle_event(incoming);
    REQUIRE(connection->calls().answer("CA1"));

    const auto claimed = h.store->get_by_id(session.id);
    REQUIRE(claimed->state == switchboard::SessionState::Connected);
    REQUIRE(claimed->assigned_agent == std::optional<std::string>("alice"));
    REQUIRE(h.presence->get("acme", "alice")->status == switchboard::AgentStatus::OnCall);
}

TEST_CASE("stopping the connection reports the agent offline") {
    switchboard::testing::Harness h;
    auto connection = connect(h, nullptr);
    connection->stop();
    REQUIRE(h.presence->get("acme", "alice")->status == switchboard::AgentStatus::Offline);
}

TEST_CASE("connection options follow the tenant configuration") {
    switchboard::Config config;
    config.max_concurrent_calls = 3;
    config.tenant_max_concurrent_calls["acme"] = 5;
    config.reconnect_base_delay_ms = 250;
    config.reconnect_max_attempts = 4;
    config.heartbeat_interval_ms = 2000;

    const auto acme = switchboard::agent_connection_options(config, "acme");
    REQUIRE(acme.max_concurrent_calls == 5);
    REQUIRE(acme.reconnect.base_delay == 250ms);
    REQUIRE(acme.reconnect.max_attempts == 4);
    REQUIRE(acme.heartbeat_interval == 2000ms);
    REQUIRE(switchboard::agent_connection_options(config, "globex").max_concurrent_calls == 3);
}
