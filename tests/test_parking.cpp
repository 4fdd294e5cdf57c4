#include <catch2/catch_test_macros.hpp>

#include "support/harness.hpp"
#include "switchboard/errors.hpp"
#include "switchboard/parking/parking_coordinator.hpp"

#include <memory>
#include <string>

namespace {

std::shared_ptr<switchboard::ParkingCoordinator> make_parking(switchboard::testing::Harness& h) {
    return std::make_shared<switchboard::ParkingCoordinator>(h.store, h.provider,
                                                             switchboard::testing::agent_address);
}

}

TEST_CASE("park moves the caller into the slot conference") {
    switchboard::testing::Harness h;
    auto parking = make_parking(h);
    auto session = h.connected("CA1", "alice");
    session = h.store->set_agent_leg(session.id, std::string("leg-agent"));

    const auto parked = parking->park(session.id, 2, "alice");
    REQUIRE(parked.state == switchboard::SessionState::Parked);
    REQUIRE(parked.parking_slot == std::optional<int>(2));
    REQUIRE(parked.conference_name == std::optional<std::string>("park-acme-2"));
    REQUIRE(h.provider->conference("CA1") == "park-acme-2");
    REQUIRE(h.provider->was_disconnected("leg-agent"));

    const auto slot = h.store->get_slot(h.tenant, 2);
    REQUIRE(slot->occupied);
    REQUIRE(slot->session_id == std::optional<switchboard::SessionId>(session.id));
    REQUIRE(slot->parked_by_agent == std::optional<std::string>("alice"));
    REQUIRE(slot->caller_number == std::optional<std::string>("+15550100"));
    REQUIRE(h.presence->get(h.tenant, "alice")->status == switchboard::AgentStatus::Available);
}

TEST_CASE("parking into an occupied slot changes nothing") {
    switchboard::testing::Harness h;
    auto parking = make_parking(h);
    const auto first = h.connected("CA1", "alice");
    const auto second = h.connected("CA2", "bob");
    parking->park(first.id, 1, "alice");
    const auto joins = h.provider->count("join_conference");

    REQUIRE_THROWS_AS(parking->park(second.id, 1, "bob"), switchboard::SlotConflict);
    REQUIRE(h.provider->count("join_conference") == joins);
    REQUIRE(h.store->require(second.id).state == switchboard::SessionState::Connected);
    REQUIRE(h.store->get_slot(h.tenant, 1)->session_id ==
            std::optional<switchboard::SessionId>(first.id));
}

TEST_CASE("park rejects slots outside the lot and sessions that cannot park") {
    switchboard::testing::Harness h;
    auto parking = make_parking(h);
    const auto ringing = h.inbound("CA1");
    REQUIRE_THROWS_AS(parking->park(ringing.id, 1, "alice"), switchboard::StateConflict);
    const auto connected = h.connected("CA2", "alice");
    REQUIRE_THROWS_AS(parking->park(connected.id, 4, "alice"), switchboard::InvalidValue);
    REQUIRE_THROWS_AS(parking->park(connected.id, 0, "alice"), switchboard::InvalidValue);
}

TEST_CASE("park_any takes the lowest free slot and fails when the lot is full") {
    switchboard::testing::Harness h(2);
    auto parking = make_parking(h);
    const auto a = h.connected("CA1", "alice");
    const auto b = h.connected("CA2", "alice");
    const auto c = h.connected("CA3", "alice");
    parking->park(a.id, 2, "alice");
    REQUIRE(parking->park_any(b.id, "alice").parking_slot == std::optional<int>(1));
    REQUIRE_THROWS_AS(parking->park_any(c.id, "alice"), switchboard::SlotConflict);
}

TEST_CASE("unpark bridges the new agent and frees the slot") {
    switchboard::testing::Harness h;
    auto parking = make_parking(h);
    const auto session = h.connected("CA1", "alice");
    parking->park(session.id, 3, "alice");

    const auto unparked = parking->unpark(h.tenant, 3, "bob");
    REQUIRE(unparked.state == switchboard::SessionState::Connected);
    REQUIRE(unparked.assigned_agent == std::optional<std::string>("bob"));
    REQUIRE(unparked.previous_agent == std::optional<std::string>("alice"));
    REQUIRE_FALSE(unparked.parking_slot);
    REQUIRE(unparked.conference_name ==
            std::optional<std::string>(switchboard::bridge_conference_name(h.tenant, session.id)));
    REQUIRE(h.provider->rung.back() == switchboard::testing::agent_address(h.tenant, "bob"));
    REQUIRE(unparked.agent_leg_id);
    REQUIRE(h.provider->conference(*unparked.agent_leg_id) == *unparked.conference_name);
    REQUIRE_FALSE(h.store->get_slot(h.tenant, 3)->occupied);
    REQUIRE(h.presence->get(h.tenant, "bob")->status == switchboard::AgentStatus::OnCall);

    REQUIRE_THROWS_AS(parking->unpark(h.tenant, 3, "carol"), switchboard::StateConflict);
}

TEST_CASE("a failed bridge on unpark leaves the caller parked") {
    switchboard::testing::Harness h;
    auto parking = make_parking(h);
    const auto session = h.connected("CA1", "alice");
    parking->park(session.id, 1, "alice");

    h.provider->fail_on.insert("create_conference");
    REQUIRE_THROWS_AS(parking->unpark(h.tenant, 1, "bob"), switchboard::TransportError);
    h.provider->fail_on.clear();

    REQUIRE(h.store->require(session.id).state == switchboard::SessionState::Parked);
    REQUIRE(h.store->get_slot(h.tenant, 1)->occupied);
    REQUIRE(h.provider->disconnected.size() == 1);
    REQUIRE(h.provider->conference("CA1") == "park-acme-1");
}

TEST_CASE("ending a parked call releases its slot") {
    switchboard::testing::Harness h;
    auto parking = make_parking(h);
    const auto session = h.connected("CA1", "alice");
    parking->park(session.id, 1, "alice");
    h.store->reconcile_provider_status("CA1", "completed");
    REQUIRE_FALSE(h.store->get_slot(h.tenant, 1)->occupied);
    const auto record = h.store->history_for("CA1");
    REQUIRE(record);
    REQUIRE(record->handled_by_agent == std::optional<std::string>("alice"));
}
