#include "switchboard/server/dashboard_feed.hpp"

#include <map>
#include <mutex>
#include <utility>
#include <vector>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "switchboard/logging.hpp"
#include "switchboard/utils/http.hpp"

namespace switchboard {

namespace {

using WsServer = websocketpp::server<websocketpp::config::asio>;

}

struct DashboardFeed::WsState {
    WsServer server;
    mutable std::mutex mutex;
    std::map<websocketpp::connection_hdl,
             std::optional<std::string>,
             std::owner_less<websocketpp::connection_hdl>>
        connections;
};

DashboardFeed::DashboardFeed(int port,
                             std::shared_ptr<ChangeFeed> feed,
                             std::optional<std::string> authorization_token)
    : port_(port),
      feed_(std::move(feed)),
      authorization_token_(std::move(authorization_token)) {}

DashboardFeed::~DashboardFeed() {
    stop();
}

std::optional<std::string> DashboardFeed::tenant_from_resource(const std::string& resource) {
    const auto query_pos = resource.find('?');
    if (query_pos == std::string::npos) {
        return std::nullopt;
    }
    const auto params = utils::parse_query(resource.substr(query_pos + 1));
    const auto it = params.find("tenant");
    if (it == params.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

bool DashboardFeed::matches(const std::optional<std::string>& filter, const ChangeEvent& event) {
    return !filter || *filter == event.tenant_id;
}

void DashboardFeed::start() {
    if (ws_state_) {
        return;
    }
    ws_state_ = std::make_unique<WsState>();
    auto& server = ws_state_->server;
    server.clear_access_channels(websocketpp::log::alevel::all);
    server.clear_error_channels(websocketpp::log::elevel::all);
    server.init_asio();
    server.set_reuse_addr(true);

    server.set_validate_handler([this](websocketpp::connection_hdl hdl) {
        if (!authorization_token_) {
            return true;
        }
        auto connection = ws_state_->server.get_con_from_hdl(hdl);
        const auto resource = connection->get_resource();
        const auto query_pos = resource.find('?');
        if (query_pos != std::string::npos) {
            const auto params = utils::parse_query(resource.substr(query_pos + 1));
            const auto it = params.find("token");
            if (it != params.end() && it->second == *authorization_token_) {
                return true;
            }
        }
        if (connection->get_request_header("Authorization") == "Bearer " + *authorization_token_) {
            return true;
        }
        logging::warn("Dashboard connection refused", {kv("resource", resource)});
        connection->set_status(websocketpp::http::status_code::forbidden);
        return false;
    });

    server.set_open_handler([this](websocketpp::connection_hdl hdl) {
        auto connection = ws_state_->server.get_con_from_hdl(hdl);
        const auto tenant = tenant_from_resource(connection->get_resource());
        {
            std::lock_guard<std::mutex> lock(ws_state_->mutex);
            ws_state_->connections[hdl] = tenant;
        }
        logging::info("Dashboard connected", {kv("tenant", tenant)});
    });

    server.set_close_handler([this](websocketpp::connection_hdl hdl) {
        std::lock_guard<std::mutex> lock(ws_state_->mutex);
        ws_state_->connections.erase(hdl);
    });

    server.set_fail_handler([this](websocketpp::connection_hdl hdl) {
        std::lock_guard<std::mutex> lock(ws_state_->mutex);
        ws_state_->connections.erase(hdl);
    });

    websocketpp::lib::error_code ec;
    server.listen(static_cast<uint16_t>(port_), ec);
    if (ec) {
        logging::error("Dashboard feed failed to listen", {kv("port", port_), kv("error", ec.message())});
        ws_state_.reset();
        return;
    }
    server.start_accept(ec);
    if (ec) {
        logging::error("Dashboard feed failed to accept", {kv("error", ec.message())});
        ws_state_.reset();
        return;
    }

    subscription_ = feed_->subscribe(std::nullopt, [this](const ChangeEvent& event) {
        broadcast(event);
    });
    worker_ = std::thread([this]() {
        logging::info("Dashboard feed listening", {kv("port", port_)});
        ws_state_->server.run();
    });
}

void DashboardFeed::stop() {
    if (subscription_) {
        feed_->unsubscribe(*subscription_);
        subscription_.reset();
    }
    if (!ws_state_) {
        return;
    }
    websocketpp::lib::error_code ec;
    ws_state_->server.stop_listening(ec);
    std::vector<websocketpp::connection_hdl> open;
    {
        std::lock_guard<std::mutex> lock(ws_state_->mutex);
        for (const auto& item : ws_state_->connections) {
            open.push_back(item.first);
        }
    }
    for (const auto& hdl : open) {
        ws_state_->server.close(hdl, websocketpp::close::status::going_away, "shutdown", ec);
    }
    ws_state_->server.stop();
    if (worker_.joinable()) {
        worker_.join();
    }
    ws_state_.reset();
}

std::size_t DashboardFeed::connection_count() const {
    if (!ws_state_) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(ws_state_->mutex);
    return ws_state_->connections.size();
}

void DashboardFeed::broadcast(const ChangeEvent& event) {
    const nlohmann::json payload = event;
    const auto text = payload.dump();
    std::vector<websocketpp::connection_hdl> targets;
    {
        std::lock_guard<std::mutex> lock(ws_state_->mutex);
        for (const auto& item : ws_state_->connections) {
            if (matches(item.second, event)) {
                targets.push_back(item.first);
            }
        }
    }
    for (const auto& hdl : targets) {
        websocketpp::lib::error_code ec;
        ws_state_->server.send(hdl, text, websocketpp::frame::opcode::text, ec);
        if (ec) {
            logging::debug("Dashboard send failed", {kv("error", ec.message())});
        }
    }
}

}
