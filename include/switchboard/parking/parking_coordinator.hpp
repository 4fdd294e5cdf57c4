#pragma once

#include <memory>
#include <string>
#include <vector>

#include "switchboard/store/record_store.hpp"
#include "switchboard/telephony/provider.hpp"

namespace switchboard {

class ParkingCoordinator {
public:
    ParkingCoordinator(std::shared_ptr<SessionRecordStore> store,
                       std::shared_ptr<TelephonyProvider> provider,
                       AgentAddressFn agent_address);

    // Throws SlotConflict when the slot is taken; nothing changes in that case.
    Session park(SessionId id, int slot, const std::string& actor);
    // Parks into the lowest free slot. Throws SlotConflict when the lot is full.
    Session park_any(SessionId id, const std::string& actor);
    Session unpark(const std::string& tenant_id, int slot, const std::string& agent_id);
    std::vector<ParkingSlot> slots(const std::string& tenant_id);

private:
    void restore_caller(const Session& session);

    std::shared_ptr<SessionRecordStore> store_;
    std::shared_ptr<TelephonyProvider> provider_;
    AgentAddressFn agent_address_;
};

}
