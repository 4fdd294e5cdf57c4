#include <catch2/catch_test_macros.hpp>

#include "support/harness.hpp"
#include "switchboard/transfer/expiry_sweeper.hpp"
#include "switchboard/transfer/transfer_coordinator.hpp"

#include <chrono>
#include <memory>

TEST_CASE("a sweep times out transfers and expires ringing entries") {
    switchboard::testing::Harness h;
    auto transfers = std::make_shared<switchboard::TransferCoordinator>(
        h.store, h.provider, switchboard::testing::agent_address);
    switchboard::ExpirySweeper sweeper(h.store, transfers, std::chrono::milliseconds(50), 1);

    const auto session = h.connected("CA1", "alice");
    const auto transfer = transfers->transfer_direct(session.id, "bob", "alice");

    switchboard::NewRinging ringing;
    ringing.tenant_id = h.tenant;
    ringing.target_agent = "carol";
    ringing.caller_number = "+15550111";
    ringing.caller_leg_id = "CA9";
    ringing.ttl_ms = 5000;
    const auto entry = h.store->create_ringing(ringing);

    sweeper.sweep();
    REQUIRE(h.store->get_transfer(transfer.id)->status == switchboard::TransferStatus::Ringing);
    REQUIRE(h.store->get_ringing(entry.id)->status == switchboard::RingingStatus::Ringing);

    h.clock.now += 30000;
    sweeper.sweep();
    REQUIRE(h.store->get_transfer(transfer.id)->status == switchboard::TransferStatus::Timeout);
    REQUIRE(h.store->require(session.id).state == switchboard::SessionState::Connected);
    REQUIRE_FALSE(h.store->get_ringing(entry.id));
}

TEST_CASE("the sweeper thread starts and stops cleanly") {
    switchboard::testing::Harness h;
    auto transfers = std::make_shared<switchboard::TransferCoordinator>(
        h.store, h.provider, switchboard::testing::agent_address);
    switchboard::ExpirySweeper sweeper(h.store, transfers, std::chrono::milliseconds(5));
    sweeper.start();
    sweeper.start();
    sweeper.stop();
    sweeper.stop();
    SUCCEED();
}
