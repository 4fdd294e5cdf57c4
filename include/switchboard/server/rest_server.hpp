#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "switchboard/config.hpp"
#include "switchboard/directory/identity.hpp"
#include "switchboard/parking/parking_coordinator.hpp"
#include "switchboard/presence/presence_tracker.hpp"
#include "switchboard/session/call_control.hpp"
#include "switchboard/store/record_store.hpp"
#include "switchboard/transfer/transfer_coordinator.hpp"

namespace switchboard {

struct RestResponse {
    int status = 200;
    nlohmann::json body;
};

struct RestServices {
    std::shared_ptr<SessionRecordStore> store;
    std::shared_ptr<CallControl> calls;
    std::shared_ptr<ParkingCoordinator> parking;
    std::shared_ptr<TransferCoordinator> transfers;
    std::shared_ptr<PresenceTracker> presence;
    std::shared_ptr<IdentityResolver> identities;
    TenantResolverFn tenant_for;
};

class RestServer {
public:
    RestServer(const Config& config, RestServices services);
    ~RestServer();

    void start();
    void stop();

    static constexpr int kDefaultHistoryLimit = 50;
    static constexpr int kMaxHistoryLimit = 500;

    // HTTP status for an exception escaping a handler.
    static int status_for(const std::exception& ex);
    // Digits from a route match; overflow is a client error, not a 500.
    static std::int64_t path_number(const std::string& raw);
    // "limit" query value clamped to 1..kMaxHistoryLimit.
    static int history_limit(const std::optional<std::string>& raw);

private:
    using Handler = std::function<RestResponse(const httplib::Request&, const nlohmann::json&)>;

    void register_routes();
    void get(const std::string& pattern, Handler handler);
    void post(const std::string& pattern, Handler handler);
    void dispatch(const httplib::Request& request,
                  httplib::Response& response,
                  const Handler& handler,
                  bool with_body);
    bool authorize_request(const httplib::Request& request, httplib::Response& response) const;
    void write_json(httplib::Response& response, const RestResponse& payload) const;

    RestResponse voice_webhook(const nlohmann::json& body);
    RestResponse status_webhook(const nlohmann::json& body);

    const Config& config_;
    RestServices services_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

}
