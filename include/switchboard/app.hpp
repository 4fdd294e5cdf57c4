#pragma once

#include <atomic>
#include <memory>

#include "switchboard/config.hpp"
#include "switchboard/directory/identity.hpp"
#include "switchboard/feed/change_feed.hpp"
#include "switchboard/parking/parking_coordinator.hpp"
#include "switchboard/presence/presence_tracker.hpp"
#include "switchboard/server/dashboard_feed.hpp"
#include "switchboard/server/rest_server.hpp"
#include "switchboard/session/call_control.hpp"
#include "switchboard/store/database.hpp"
#include "switchboard/store/record_store.hpp"
#include "switchboard/telephony/pjsip/pjsip_provider.hpp"
#include "switchboard/transfer/expiry_sweeper.hpp"
#include "switchboard/transfer/transfer_coordinator.hpp"

namespace switchboard {

class SwitchboardApp {
public:
    explicit SwitchboardApp(Config config);

    void init();
    void run();
    // Makes run() return; safe to call from a signal handler.
    void request_stop();
    void stop();
    const Config& config() const;

private:
    std::string agent_address(const std::string& tenant_id, const std::string& agent_id) const;

    Config config_;
    std::shared_ptr<store::Database> db_;
    std::shared_ptr<ChangeFeed> feed_;
    std::shared_ptr<SessionRecordStore> store_;
    std::shared_ptr<PresenceTracker> presence_;
    std::shared_ptr<pjsip::PjsipProvider> provider_;
    std::shared_ptr<CallControl> calls_;
    std::shared_ptr<ParkingCoordinator> parking_;
    std::shared_ptr<TransferCoordinator> transfers_;
    std::shared_ptr<IdentityResolver> identities_;
    std::unique_ptr<ExpirySweeper> sweeper_;
    std::unique_ptr<RestServer> rest_server_;
    std::unique_ptr<DashboardFeed> dashboard_;
    std::atomic<bool> quitting_{false};
    bool stopped_ = false;
};

}
