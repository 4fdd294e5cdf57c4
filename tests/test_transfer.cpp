#include <catch2/catch_test_macros.hpp>

#include "support/harness.hpp"
#include "switchboard/errors.hpp"
#include "switchboard/parking/parking_coordinator.hpp"
#include "switchboard/transfer/transfer_coordinator.hpp"

#include <memory>
#include <string>

namespace {

struct TransferFixture {
    explicit TransferFixture(int slots = 3) : h(slots) {
        parking = std::make_shared<switchboard::ParkingCoordinator>(
            h.store, h.provider, switchboard::testing::agent_address);
        switchboard::TransferOptions options;
        options.ring_timeout_ms = 30000;
        transfers = std::make_shared<switchboard::TransferCoordinator>(
            h.store, h.provider, switchboard::testing::agent_address, options);
    }

    switchboard::Session owned(const std::string& call_id, const std::string& agent) {
        const auto session = h.connected(call_id, agent);
        return h.store->set_agent_leg(session.id, "agent-" + call_id);
    }

    switchboard::testing::Harness h;
    std::shared_ptr<switchboard::ParkingCoordinator> parking;
    std::shared_ptr<switchboard::TransferCoordinator> transfers;
};

}

TEST_CASE("accepted direct transfer hands the caller to the target") {
    TransferFixture f;
    const auto session = f.owned("CA1", "alice");
    const auto transfer = f.transfers->transfer_direct(session.id, "bob", "alice");
    REQUIRE(transfer.status == switchboard::TransferStatus::Ringing);
    REQUIRE(transfer.kind == switchboard::TransferKind::Direct);
    REQUIRE(transfer.source_agent == std::optional<std::string>("alice"));
    REQUIRE(transfer.target_leg_id);
    REQUIRE(f.h.store->require(session.id).state == switchboard::SessionState::Transferring);
    REQUIRE(f.h.store->list_ringing_for(f.h.tenant, "bob").size() == 1);
    REQUIRE(f.transfers->pending_for(f.h.tenant, "bob").size() == 1);

    const auto result = f.transfers->accept(transfer.id, "bob");
    REQUIRE(result.transfer.status == switchboard::TransferStatus::Accepted);
    REQUIRE(result.session);
    REQUIRE(result.session->state == switchboard::SessionState::Connected);
    REQUIRE(result.session->assigned_agent == std::optional<std::string>("bob"));
    REQUIRE(result.session->agent_leg_id == transfer.target_leg_id);
    REQUIRE(f.h.provider->was_disconnected("agent-CA1"));
    REQUIRE(f.h.provider->conference("CA1") ==
            switchboard::bridge_conference_name(f.h.tenant, session.id));
    REQUIRE(f.h.store->list_ringing_for(f.h.tenant, "bob").empty());
    REQUIRE(f.h.presence->get(f.h.tenant, "alice")->status == switchboard::AgentStatus::Available);
    REQUIRE(f.h.presence->get(f.h.tenant, "bob")->status == switchboard::AgentStatus::OnCall);

    f.h.store->finalize(session.id);
    const auto record = f.h.store->history_for("CA1");
    REQUIRE(record->handled_by_agent == std::optional<std::string>("bob"));
    REQUIRE(record->transferred_from_agent == std::optional<std::string>("alice"));
}

TEST_CASE("only the target resolves a transfer, and only once") {
    TransferFixture f;
    const auto session = f.owned("CA1", "alice");
    const auto transfer = f.transfers->transfer_direct(session.id, "bob", "alice");
    REQUIRE_THROWS_AS(f.transfers->transfer_direct(session.id, "carol", "alice"),
                      switchboard::StateConflict);
    REQUIRE_THROWS_AS(f.transfers->accept(transfer.id, "carol"), switchboard::StateConflict);
    REQUIRE_THROWS_AS(f.transfers->decline(transfer.id, "carol"), switchboard::StateConflict);

    f.transfers->decline(transfer.id, "bob");
    REQUIRE_THROWS_AS(f.transfers->accept(transfer.id, "bob"), switchboard::StateConflict);
    REQUIRE_THROWS_AS(f.transfers->accept(12345, "bob"), switchboard::NotFound);
}

TEST_CASE("an unanswered direct transfer times out back to the source") {
    TransferFixture f;
    const auto session = f.owned("CA1", "alice");
    const auto transfer = f.transfers->transfer_direct(session.id, "bob", "alice");

    f.h.clock.now += 29999;
    REQUIRE(f.transfers->expire_due().empty());
    f.h.clock.now += 1;
    const auto resolved = f.transfers->expire_due();
    REQUIRE(resolved.size() == 1);
    REQUIRE(resolved.front().transfer.status == switchboard::TransferStatus::Timeout);
    REQUIRE(resolved.front().session->state == switchboard::SessionState::Connected);
    REQUIRE(resolved.front().session->assigned_agent == std::optional<std::string>("alice"));
    REQUIRE(f.h.provider->was_disconnected(*transfer.target_leg_id));
    REQUIRE_THROWS_AS(f.transfers->accept(transfer.id, "bob"), switchboard::StateConflict);
}

TEST_CASE("accepting after the deadline times the transfer out") {
    TransferFixture f;
    const auto session = f.owned("CA1", "alice");
    const auto transfer = f.transfers->transfer_direct(session.id, "bob", "alice");
    f.h.clock.now += 30000;

    REQUIRE_THROWS_AS(f.transfers->accept(transfer.id, "bob"), switchboard::StateConflict);
    REQUIRE(f.h.store->get_transfer(transfer.id)->status == switchboard::TransferStatus::Timeout);
    REQUIRE(f.h.store->require(session.id).assigned_agent == std::optional<std::string>("alice"));
}

TEST_CASE("pending_for hides and resolves expired transfers") {
    TransferFixture f;
    const auto session = f.owned("CA1", "alice");
    const auto transfer = f.transfers->transfer_direct(session.id, "bob", "alice");
    f.h.clock.now += 31000;
    REQUIRE(f.transfers->pending_for(f.h.tenant, "bob").empty());
    REQUIRE(f.h.store->get_transfer(transfer.id)->status == switchboard::TransferStatus::Timeout);
}

TEST_CASE("declined transfer from park returns to the original slot") {
    TransferFixture f;
    const auto session = f.owned("CA1", "alice");
    f.parking->park(session.id, 2, "alice");

    const auto transfer = f.transfers->transfer_from_park(f.h.tenant, 2, "bob", "alice");
    REQUIRE(transfer.kind == switchboard::TransferKind::FromPark);
    REQUIRE(transfer.return_to_slot == std::optional<int>(2));
    REQUIRE_FALSE(f.h.store->get_slot(f.h.tenant, 2)->occupied);
    REQUIRE(f.h.provider->conference("CA1") ==
            switchboard::hold_conference_name(f.h.tenant, session.id));

    const auto result = f.transfers->decline(transfer.id, "bob");
    REQUIRE(result.transfer.status == switchboard::TransferStatus::Declined);
    REQUIRE(result.session->state == switchboard::SessionState::Parked);
    REQUIRE(result.session->parking_slot == std::optional<int>(2));
    REQUIRE(f.h.store->get_slot(f.h.tenant, 2)->session_id ==
            std::optional<switchboard::SessionId>(session.id));
    REQUIRE(f.h.provider->conference("CA1") == "park-acme-2");
    REQUIRE(f.h.provider->was_disconnected(*transfer.target_leg_id));
}

TEST_CASE("a taken origin slot sends the caller to the lowest free slot") {
    TransferFixture f;
    const auto session = f.owned("CA1", "alice");
    const auto other = f.owned("CA2", "carol");
    f.parking->park(session.id, 2, "alice");
    const auto transfer = f.transfers->transfer_from_park(f.h.tenant, 2, "bob", "alice");
    f.parking->park(other.id, 2, "carol");

    f.h.clock.now += 30000;
    const auto resolved = f.transfers->expire_due();
    REQUIRE(resolved.size() == 1);
    REQUIRE(resolved.front().transfer.status == switchboard::TransferStatus::Timeout);
    REQUIRE(resolved.front().session->state == switchboard::SessionState::Parked);
    REQUIRE(resolved.front().session->parking_slot == std::optional<int>(1));
    REQUIRE(f.h.provider->conference("CA1") == "park-acme-1");
}

TEST_CASE("a full lot leaves the returned caller on hold") {
    TransferFixture f(1);
    const auto session = f.owned("CA1", "alice");
    const auto other = f.owned("CA2", "carol");
    f.parking->park(session.id, 1, "alice");
    const auto transfer = f.transfers->transfer_from_park(f.h.tenant, 1, "bob", "alice");
    f.parking->park(other.id, 1, "carol");

    const auto result = f.transfers->decline(transfer.id, "bob");
    REQUIRE(result.session->state == switchboard::SessionState::OnHold);
    REQUIRE_FALSE(result.session->assigned_agent);
    REQUIRE_FALSE(result.session->parking_slot);
    REQUIRE(f.h.store->get_slot(f.h.tenant, 1)->session_id ==
            std::optional<switchboard::SessionId>(other.id));
}

TEST_CASE("transfer_from_park needs an occupied slot") {
    TransferFixture f;
    REQUIRE_THROWS_AS(f.transfers->transfer_from_park(f.h.tenant, 1, "bob", "alice"),
                      switchboard::StateConflict);
    const auto session = f.owned("CA1", "alice");
    f.parking->park(session.id, 1, "alice");
    REQUIRE_THROWS_AS(f.transfers->transfer_direct(session.id, "bob", "alice"),
                      switchboard::StateConflict);
}

TEST_CASE("a refused target ring leaves the session untouched") {
    TransferFixture f;
    const auto session = f.owned("CA1", "alice");
    f.h.provider->fail_on.insert("ring");
    REQUIRE_THROWS_AS(f.transfers->transfer_direct(session.id, "bob", "alice"),
                      switchboard::TransportError);
    REQUIRE(f.h.store->require(session.id).state == switchboard::SessionState::Connected);
    REQUIRE(f.h.store->list_ringing_transfers_for(f.h.tenant, "bob").empty());
}
