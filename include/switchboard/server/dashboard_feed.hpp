#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "switchboard/feed/change_feed.hpp"

namespace switchboard {

// WebSocket push of change events. Clients connect to "/feed?tenant=<id>" to receive one
// tenant's changes, or to "/feed" for all of them.
class DashboardFeed {
public:
    DashboardFeed(int port,
                  std::shared_ptr<ChangeFeed> feed,
                  std::optional<std::string> authorization_token = std::nullopt);
    ~DashboardFeed();

    DashboardFeed(const DashboardFeed&) = delete;
    DashboardFeed& operator=(const DashboardFeed&) = delete;

    void start();
    void stop();
    std::size_t connection_count() const;

    // Tenant filter carried in a request resource such as "/feed?tenant=acme".
    static std::optional<std::string> tenant_from_resource(const std::string& resource);
    static bool matches(const std::optional<std::string>& filter, const ChangeEvent& event);

private:
    void broadcast(const ChangeEvent& event);

    int port_;
    std::shared_ptr<ChangeFeed> feed_;
    std::optional<std::string> authorization_token_;
    std::optional<ChangeFeed::SubscriptionId> subscription_;
    std::thread worker_;
    struct WsState;
    std::unique_ptr<WsState> ws_state_;
};

}
