#include "switchboard/app.hpp"

#include <chrono>
#include <utility>

#include "switchboard/directory/client.hpp"
#include "switchboard/logging.hpp"
#include "switchboard/utils/address.hpp"

namespace switchboard {

SwitchboardApp::SwitchboardApp(Config config) : config_(std::move(config)) {}

const Config& SwitchboardApp::config() const {
    return config_;
}

std::string SwitchboardApp::agent_address(const std::string& tenant_id,
                                          const std::string& agent_id) const {
    return utils::expand_agent_uri(config_.agent_uri_template,
                                   format_identity({tenant_id, agent_id}),
                                   config_.sip_domain);
}

void SwitchboardApp::init() {
    db_ = std::make_shared<store::Database>(config_.database_path);
    feed_ = std::make_shared<ChangeFeed>();

    RecordStoreOptions store_options;
    store_options.parking_slots = config_.parking_slots;
    store_ = std::make_shared<SessionRecordStore>(db_, feed_, store_options);
    presence_ = std::make_shared<PresenceTracker>(db_, feed_, config_.presence_stale_ms);
    store_->set_presence_recorder(presence_);
    store_->initialize_slots(config_.default_tenant, config_.parking_slots);

    provider_ = std::make_shared<pjsip::PjsipProvider>(config_);
    provider_->init();

    AgentAddressFn address = [this](const std::string& tenant_id, const std::string& agent_id) {
        return agent_address(tenant_id, agent_id);
    };
    calls_ = std::make_shared<CallControl>(store_, provider_, address);
    parking_ = std::make_shared<ParkingCoordinator>(store_, provider_, address);
    TransferOptions transfer_options;
    transfer_options.ring_timeout_ms = config_.transfer_ring_timeout_ms;
    transfers_ = std::make_shared<TransferCoordinator>(store_, provider_, address, transfer_options);

    std::shared_ptr<IdentityLookup> directory;
    if (config_.directory_url) {
        DirectoryRequestOptions directory_options;
        directory_options.connect_timeout =
            std::chrono::seconds(static_cast<int>(config_.directory_timeout));
        directory_options.read_timeout = directory_options.connect_timeout;
        directory = std::make_shared<DirectoryClient>(*config_.directory_url,
                                                      config_.authorization_token,
                                                      directory_options);
    }
    identities_ = std::make_shared<IdentityResolver>(directory);

    TenantResolverFn tenant_for = [this](const std::string& dialed) {
        return config_.tenant_for_number(dialed);
    };
    provider_->set_event_listener([this, tenant_for](const ProviderEvent& event) {
        calls_->handle_event(event, tenant_for);
    });

    sweeper_ = std::make_unique<ExpirySweeper>(
        store_, transfers_, std::chrono::milliseconds(config_.sweep_interval_ms));
    sweeper_->start();

    RestServices services;
    services.store = store_;
    services.calls = calls_;
    services.parking = parking_;
    services.transfers = transfers_;
    services.presence = presence_;
    services.identities = identities_;
    services.tenant_for = tenant_for;
    rest_server_ = std::make_unique<RestServer>(config_, std::move(services));
    rest_server_->start();

    dashboard_ = std::make_unique<DashboardFeed>(config_.dashboard_ws_port, feed_,
                                                 config_.authorization_token);
    dashboard_->start();
}

void SwitchboardApp::run() {
    provider_->run(quitting_);
}

void SwitchboardApp::request_stop() {
    quitting_ = true;
}

void SwitchboardApp::stop() {
    quitting_ = true;
    if (stopped_) {
        return;
    }
    stopped_ = true;
    logging::info("Stopping switchboard");
    if (rest_server_) {
        rest_server_->stop();
    }
    if (dashboard_) {
        dashboard_->stop();
    }
    if (sweeper_) {
        sweeper_->stop();
    }
    if (provider_) {
        provider_->shutdown();
    }
}

}
