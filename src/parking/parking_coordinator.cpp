#include "switchboard/parking/parking_coordinator.hpp"

#include "switchboard/errors.hpp"
#include "switchboard/logging.hpp"

#include <utility>

namespace switchboard {

ParkingCoordinator::ParkingCoordinator(std::shared_ptr<SessionRecordStore> store,
                                       std::shared_ptr<TelephonyProvider> provider,
                                       AgentAddressFn agent_address)
    : store_(std::move(store)),
      provider_(std::move(provider)),
      agent_address_(std::move(agent_address)) {}

void ParkingCoordinator::restore_caller(const Session& session) {
    if (session.conference_name) {
        best_effort("rejoin caller conference", [&] {
            provider_->join_conference(session.provider_call_id, *session.conference_name);
        });
    } else {
        best_effort("leave parking conference",
                    [&] { provider_->leave_conference(session.provider_call_id); });
    }
}

Session ParkingCoordinator::park(SessionId id, int slot, const std::string& actor) {
    const auto session = store_->require(id);
    if (!state_machine::is_allowed(session.state, TransitionKind::Park)) {
        throw StateConflict("cannot park session " + std::to_string(id) + " while " +
                            to_string(session.state));
    }
    const auto current = store_->get_slot(session.tenant_id, slot);
    if (current && current->occupied) {
        throw SlotConflict("parking slot " + std::to_string(slot) + " is occupied");
    }

    const auto conference = parking_conference_name(session.tenant_id, slot);
    provider_->create_conference(conference);
    provider_->join_conference(session.provider_call_id, conference);

    Session parked;
    try {
        parked = store_->park_session(id, slot, actor);
    } catch (const SwitchboardError& ex) {
        logging::warn("Park lost its slot, moving caller back",
                      {kv("session", id), kv("slot", slot), kv("error", ex.what())});
        restore_caller(session);
        throw;
    }

    if (session.agent_leg_id) {
        best_effort("release parking agent leg",
                    [&] { provider_->disconnect(*session.agent_leg_id); });
    }
    logging::info("Session parked",
                  {kv("session", id), kv("slot", slot), kv("actor", actor)});
    return parked;
}

Session ParkingCoordinator::park_any(SessionId id, const std::string& actor) {
    const auto session = store_->require(id);
    const auto slot = store_->first_free_slot(session.tenant_id);
    if (!slot) {
        throw SlotConflict("All parking slots are occupied");
    }
    return park(id, *slot, actor);
}

Session ParkingCoordinator::unpark(const std::string& tenant_id,
                                   int slot,
                                   const std::string& agent_id) {
    const auto slot_record = store_->get_slot(tenant_id, slot);
    if (!slot_record || !slot_record->occupied || !slot_record->session_id) {
        throw StateConflict("parking slot " + std::to_string(slot) + " is empty");
    }
    const auto session = store_->require(*slot_record->session_id);
    const auto park_conference = parking_conference_name(tenant_id, slot);
    const auto bridge = bridge_conference_name(tenant_id, session.id);

    const auto agent_leg = provider_->ring(agent_address_(tenant_id, agent_id));
    try {
        provider_->create_conference(bridge);
        provider_->join_conference(session.provider_call_id, bridge);
        provider_->join_conference(agent_leg, bridge);
    } catch (const TransportError&) {
        best_effort("drop agent leg", [&] { provider_->disconnect(agent_leg); });
        best_effort("return caller to slot", [&] {
            provider_->join_conference(session.provider_call_id, park_conference);
        });
        throw;
    }

    Session unparked;
    try {
        unparked = store_->unpark_session(tenant_id, slot, agent_id, agent_leg);
    } catch (const SwitchboardError&) {
        best_effort("drop agent leg", [&] { provider_->disconnect(agent_leg); });
        best_effort("return caller to slot", [&] {
            provider_->join_conference(session.provider_call_id, park_conference);
        });
        throw;
    }
    return store_->set_conference(unparked.id, bridge);
}

std::vector<ParkingSlot> ParkingCoordinator::slots(const std::string& tenant_id) {
    return store_->list_slots(tenant_id);
}

}
