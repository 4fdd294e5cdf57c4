#include "switchboard/server/rest_server.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "switchboard/errors.hpp"
#include "switchboard/logging.hpp"
#include "switchboard/metrics.hpp"
#include "switchboard/model/json.hpp"
#include "switchboard/utils/address.hpp"
#include "switchboard/utils/http.hpp"

namespace switchboard {

namespace {

class BadRequest : public SwitchboardError {
public:
    explicit BadRequest(const std::string& message) : SwitchboardError(message) {}
};

std::string require_string(const nlohmann::json& body, const char* key) {
    const auto it = body.find(key);
    if (it == body.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw BadRequest(std::string("missing field: ") + key);
    }
    return it->get<std::string>();
}

std::optional<std::string> optional_string(const nlohmann::json& body, const char* key) {
    const auto it = body.find(key);
    if (it == body.end() || !it->is_string() || it->get<std::string>().empty()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

// Webhook fields arrive either snake_case (JSON) or in the provider's PascalCase form fields.
std::optional<std::string> field(const nlohmann::json& body, const char* key, const char* alias) {
    if (auto value = optional_string(body, key)) {
        return value;
    }
    return optional_string(body, alias);
}

std::optional<int> optional_int(const nlohmann::json& body, const char* key) {
    const auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_number_integer()) {
        return it->get<int>();
    }
    if (it->is_string()) {
        try {
            return std::stoi(it->get<std::string>());
        } catch (const std::exception&) {
            throw BadRequest(std::string("not a number: ") + key);
        }
    }
    throw BadRequest(std::string("not a number: ") + key);
}

SessionId path_id(const httplib::Request& request, std::size_t index = 1) {
    return RestServer::path_number(request.matches[index].str());
}

int path_slot(const httplib::Request& request, std::size_t index = 2) {
    const auto slot = RestServer::path_number(request.matches[index].str());
    if (slot > std::numeric_limits<int>::max()) {
        throw BadRequest("slot out of range: " + request.matches[index].str());
    }
    return static_cast<int>(slot);
}

nlohmann::json resolution_json(const TransferResolution& resolution) {
    nlohmann::json body{{"transfer", resolution.transfer}};
    body["session"] = resolution.session ? nlohmann::json(*resolution.session) : nlohmann::json();
    return body;
}

template <typename T>
nlohmann::json list_json(const std::vector<T>& items) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& item : items) {
        result.push_back(item);
    }
    return result;
}

nlohmann::json parse_body(const httplib::Request& request) {
    if (request.body.empty()) {
        return nlohmann::json::object();
    }
    const auto content_type = request.get_header_value("Content-Type");
    if (content_type.find("application/x-www-form-urlencoded") != std::string::npos) {
        nlohmann::json body = nlohmann::json::object();
        for (const auto& item : utils::parse_query(request.body)) {
            body[item.first] = item.second;
        }
        return body;
    }
    auto body = nlohmann::json::parse(request.body);
    if (!body.is_object()) {
        throw BadRequest("request body must be a JSON object");
    }
    return body;
}

}

RestServer::RestServer(const Config& config, RestServices services)
    : config_(config),
      services_(std::move(services)) {}

RestServer::~RestServer() {
    stop();
}

std::int64_t RestServer::path_number(const std::string& raw) {
    std::size_t used = 0;
    std::int64_t value = 0;
    try {
        value = std::stoll(raw, &used);
    } catch (const std::exception&) {
        throw BadRequest("not a valid number: " + raw);
    }
    if (used != raw.size() || value < 0) {
        throw BadRequest("not a valid number: " + raw);
    }
    return value;
}

int RestServer::history_limit(const std::optional<std::string>& raw) {
    if (!raw) {
        return kDefaultHistoryLimit;
    }
    long long limit = 0;
    try {
        limit = std::stoll(*raw);
    } catch (const std::exception&) {
        throw BadRequest("limit must be a number");
    }
    return static_cast<int>(
        std::clamp<long long>(limit, 1, static_cast<long long>(kMaxHistoryLimit)));
}

int RestServer::status_for(const std::exception& ex) {
    if (dynamic_cast<const NotFound*>(&ex)) {
        return 404;
    }
    if (dynamic_cast<const StateConflict*>(&ex) || dynamic_cast<const SlotConflict*>(&ex)) {
        return 409;
    }
    if (dynamic_cast<const ResourceExhausted*>(&ex)) {
        return 429;
    }
    if (dynamic_cast<const TransportError*>(&ex)) {
        return 502;
    }
    if (dynamic_cast<const InvalidValue*>(&ex) || dynamic_cast<const BadRequest*>(&ex) ||
        dynamic_cast<const nlohmann::json::exception*>(&ex)) {
        return 400;
    }
    return 500;
}

void RestServer::start() {
    server_ = std::make_unique<httplib::Server>();

    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        nlohmann::json payload{{"status", "ok"}};
        res.set_content(payload.dump(), "application/json");
        logging::debug("Health check served");
    });

    server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    register_routes();

    server_thread_ = std::thread([this]() {
        logging::info("REST server listening", {kv("port", config_.rest_api_port)});
        if (!server_->listen("0.0.0.0", config_.rest_api_port)) {
            logging::error("REST server failed to listen", {kv("port", config_.rest_api_port)});
        }
    });
}

void RestServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

void RestServer::get(const std::string& pattern, Handler handler) {
    server_->Get(pattern, [this, handler](const httplib::Request& req, httplib::Response& res) {
        dispatch(req, res, handler, false);
    });
}

void RestServer::post(const std::string& pattern, Handler handler) {
    server_->Post(pattern, [this, handler](const httplib::Request& req, httplib::Response& res) {
        dispatch(req, res, handler, true);
    });
}

void RestServer::dispatch(const httplib::Request& request,
                          httplib::Response& response,
                          const Handler& handler,
                          bool with_body) {
    Metrics::instance().increment_http_request();
    if (!authorize_request(request, response)) {
        return;
    }
    nlohmann::json body = nlohmann::json::object();
    if (with_body) {
        try {
            body = parse_body(request);
        } catch (const std::exception& ex) {
            logging::error("Failed to parse request body",
                           {kv("path", request.path), kv("error", ex.what())});
            response.status = 400;
            response.set_content(R"({"message":"invalid request body"})", "application/json");
            return;
        }
    }
    try {
        write_json(response, handler(request, body));
    } catch (const std::exception& ex) {
        const int status = status_for(ex);
        if (status >= 500) {
            logging::error("Request failed",
                           {kv("method", request.method), kv("path", request.path),
                            kv("status", status), kv("error", ex.what())});
        } else {
            logging::info("Request rejected",
                          {kv("method", request.method), kv("path", request.path),
                           kv("status", status), kv("error", ex.what())});
        }
        write_json(response, RestResponse{status, nlohmann::json{{"message", ex.what()}}});
    }
}

void RestServer::register_routes() {
    auto& s = services_;

    get(R"(/tenants/([A-Za-z0-9_.-]+)/sessions)",
        [&s](const httplib::Request& req, const nlohmann::json&) {
            const auto tenant = req.matches[1].str();
            if (req.has_param("state")) {
                const auto state = parse_session_state(req.get_param_value("state"));
                return RestResponse{200, list_json(s.store->list_by_state(tenant, state))};
            }
            if (req.has_param("agent")) {
                return RestResponse{
                    200, list_json(s.store->list_by_agent(tenant, req.get_param_value("agent")))};
            }
            return RestResponse{200, list_json(s.store->list_by_tenant(tenant))};
        });

    get(R"(/sessions/(\d+))", [&s](const httplib::Request& req, const nlohmann::json&) {
        return RestResponse{200, s.store->require(path_id(req))};
    });

    get(R"(/tenants/([A-Za-z0-9_.-]+)/parking)",
        [&s](const httplib::Request& req, const nlohmann::json&) {
            return RestResponse{200, list_json(s.parking->slots(req.matches[1].str()))};
        });

    get(R"(/tenants/([A-Za-z0-9_.-]+)/history)",
        [&s](const httplib::Request& req, const nlohmann::json&) {
            std::optional<std::string> raw;
            if (req.has_param("limit")) {
                raw = req.get_param_value("limit");
            }
            return RestResponse{200, list_json(s.store->list_history(req.matches[1].str(),
                                                                      history_limit(raw)))};
        });

    get(R"(/tenants/([A-Za-z0-9_.-]+)/stats)",
        [&s](const httplib::Request& req, const nlohmann::json&) {
            if (!req.has_param("from") || !req.has_param("to")) {
                throw BadRequest("from and to are required");
            }
            std::optional<std::string> agent;
            if (req.has_param("agent")) {
                agent = req.get_param_value("agent");
            }
            return RestResponse{
                200, s.store->history_stats(req.matches[1].str(),
                                            path_number(req.get_param_value("from")),
                                            path_number(req.get_param_value("to")), agent)};
        });

    get(R"(/tenants/([A-Za-z0-9_.-]+)/agents)",
        [&s](const httplib::Request& req, const nlohmann::json&) {
            return RestResponse{200, list_json(s.presence->list(req.matches[1].str()))};
        });

    get(R"(/tenants/([A-Za-z0-9_.-]+)/agents/([A-Za-z0-9_.-]+)/transfers)",
        [&s](const httplib::Request& req, const nlohmann::json&) {
            return RestResponse{
                200, list_json(s.transfers->pending_for(req.matches[1].str(), req.matches[2].str()))};
        });

    get(R"(/tenants/([A-Za-z0-9_.-]+)/agents/([A-Za-z0-9_.-]+)/ringing)",
        [&s](const httplib::Request& req, const nlohmann::json&) {
            return RestResponse{
                200, list_json(s.store->list_ringing_for(req.matches[1].str(), req.matches[2].str()))};
        });

    post(R"(/sessions/(\d+)/answer)", [&s](const httplib::Request& req, const nlohmann::json& body) {
        return RestResponse{200, s.calls->answer(path_id(req), require_string(body, "agent"))};
    });

    post(R"(/sessions/(\d+)/hold)", [&s](const httplib::Request& req, const nlohmann::json& body) {
        return RestResponse{200, s.calls->hold(path_id(req), require_string(body, "agent"))};
    });

    post(R"(/sessions/(\d+)/resume)", [&s](const httplib::Request& req, const nlohmann::json& body) {
        return RestResponse{200, s.calls->resume(path_id(req), require_string(body, "agent"))};
    });

    post(R"(/sessions/(\d+)/park)", [&s](const httplib::Request& req, const nlohmann::json& body) {
        const auto agent = require_string(body, "agent");
        if (const auto slot = optional_int(body, "slot")) {
            return RestResponse{200, s.parking->park(path_id(req), *slot, agent)};
        }
        return RestResponse{200, s.parking->park_any(path_id(req), agent)};
    });

    post(R"(/sessions/(\d+)/end)", [&s](const httplib::Request& req, const nlohmann::json& body) {
        const auto actor = optional_string(body, "agent").value_or("api");
        const auto record = s.calls->end(path_id(req), actor);
        return RestResponse{200, record ? nlohmann::json(*record) : nlohmann::json()};
    });

    post(R"(/sessions/(\d+)/transfer)",
         [&s](const httplib::Request& req, const nlohmann::json& body) {
             const auto transfer = s.transfers->transfer_direct(
                 path_id(req), require_string(body, "target"),
                 optional_string(body, "agent").value_or("api"));
             return RestResponse{201, transfer};
         });

    post(R"(/tenants/([A-Za-z0-9_.-]+)/parking/(\d+)/unpark)",
         [&s](const httplib::Request& req, const nlohmann::json& body) {
             return RestResponse{200, s.parking->unpark(req.matches[1].str(),
                                                        path_slot(req),
                                                        require_string(body, "agent"))};
         });

    post(R"(/tenants/([A-Za-z0-9_.-]+)/parking/(\d+)/transfer)",
         [&s](const httplib::Request& req, const nlohmann::json& body) {
             const auto transfer = s.transfers->transfer_from_park(
                 req.matches[1].str(), path_slot(req),
                 require_string(body, "target"), optional_string(body, "agent").value_or("api"));
             return RestResponse{201, transfer};
         });

    post(R"(/tenants/([A-Za-z0-9_.-]+)/dial)",
         [this, &s](const httplib::Request& req, const nlohmann::json& body) {
             const auto tenant = req.matches[1].str();
             const auto agent = require_string(body, "agent");
             const auto bound = config_.concurrency_bound_for(tenant);
             if (static_cast<int>(s.store->list_by_agent(tenant, agent).size()) >= bound) {
                 throw ResourceExhausted("Maximum concurrent calls reached (" +
                                         std::to_string(bound) + ")");
             }
             const auto session = s.calls->dial(tenant, agent,
                                                optional_string(body, "from").value_or(agent),
                                                require_string(body, "to"),
                                                optional_string(body, "correlation_id"));
             return RestResponse{201, session};
         });

    post(R"(/transfers/(\d+)/accept)",
         [&s](const httplib::Request& req, const nlohmann::json& body) {
             return RestResponse{
                 200, resolution_json(s.transfers->accept(path_id(req), require_string(body, "agent")))};
         });

    post(R"(/transfers/(\d+)/decline)",
         [&s](const httplib::Request& req, const nlohmann::json& body) {
             return RestResponse{
                 200, resolution_json(s.transfers->decline(path_id(req), require_string(body, "agent")))};
         });

    post(R"(/ringing/(\d+)/(accept|decline))",
         [&s](const httplib::Request& req, const nlohmann::json&) {
             const auto status = req.matches[2].str() == "accept" ? RingingStatus::Accepted
                                                                  : RingingStatus::Declined;
             return RestResponse{200, s.store->resolve_ringing(path_id(req), status)};
         });

    post(R"(/agents/([^/]+)/heartbeat)",
         [&s](const httplib::Request& req, const nlohmann::json&) {
             const auto identity = s.identities->resolve(req.matches[1].str());
             return RestResponse{200, s.presence->heartbeat(identity.tenant_id, identity.agent_id)};
         });

    post(R"(/agents/([^/]+)/status)",
         [&s](const httplib::Request& req, const nlohmann::json& body) {
             const auto identity = s.identities->resolve(req.matches[1].str());
             const auto status = parse_agent_status(require_string(body, "status"));
             return RestResponse{200, s.presence->set_status(identity.tenant_id, identity.agent_id,
                                                             status, optional_string(body, "message"))};
         });

    post("/webhooks/voice", [this](const httplib::Request&, const nlohmann::json& body) {
        return voice_webhook(body);
    });

    post("/webhooks/status", [this](const httplib::Request&, const nlohmann::json& body) {
        return status_webhook(body);
    });
}

RestResponse RestServer::voice_webhook(const nlohmann::json& body) {
    const auto call_id = field(body, "call_id", "CallSid");
    const auto from = field(body, "from", "From");
    const auto to = field(body, "to", "To");
    if (!call_id || !from || !to) {
        throw BadRequest("call_id, from and to are required");
    }
    const auto caller = utils::parse_remote_uri(*from);

    NewSession request;
    request.tenant_id = services_.tenant_for(*to);
    request.provider_call_id = *call_id;
    request.from = utils::normalize_address(caller.number);
    request.from_name = field(body, "from_name", "CallerName");
    if (!request.from_name) {
        request.from_name = caller.display_name;
    }
    request.to = utils::normalize_address(utils::parse_remote_uri(*to).number);
    const auto session = services_.store->create_inbound(request);

    nlohmann::json ringing = nlohmann::json::array();
    for (const auto& agent : services_.presence->list(session.tenant_id)) {
        if (agent.status != AgentStatus::Available) {
            continue;
        }
        NewRinging entry;
        entry.tenant_id = session.tenant_id;
        entry.target_agent = agent.agent_id;
        entry.caller_number = session.from;
        entry.caller_name = session.from_name;
        entry.caller_leg_id = session.provider_call_id;
        entry.ttl_ms = config_.ringing_timeout_ms;
        ringing.push_back(services_.store->create_ringing(entry));
    }
    return RestResponse{200, nlohmann::json{{"session", session}, {"ringing", ringing}}};
}

RestResponse RestServer::status_webhook(const nlohmann::json& body) {
    const auto call_id = field(body, "call_id", "CallSid");
    const auto status = field(body, "status", "CallStatus");
    if (!call_id || !status) {
        throw BadRequest("call_id and status are required");
    }
    std::optional<std::int64_t> duration;
    if (const auto raw = field(body, "duration", "CallDuration")) {
        try {
            duration = std::stoll(*raw);
        } catch (const std::exception&) {
            throw BadRequest("duration must be a number");
        }
    } else if (const auto it = body.find("duration");
               it != body.end() && it->is_number_integer()) {
        duration = it->get<std::int64_t>();
    }
    services_.store->reconcile_provider_status(*call_id, *status, duration);
    return RestResponse{200, nlohmann::json{{"status", "ok"}}};
}

bool RestServer::authorize_request(const httplib::Request& request,
                                   httplib::Response& response) const {
    if (!config_.authorization_token) {
        return true;
    }
    const auto it = request.headers.find("Authorization");
    if (it == request.headers.end()) {
        response.status = 401;
        response.set_content(R"({"message":"missing authorization"})", "application/json");
        return false;
    }
    const auto expected = "Bearer " + *config_.authorization_token;
    if (it->second != expected) {
        response.status = 403;
        response.set_content(R"({"message":"invalid authorization"})", "application/json");
        return false;
    }
    return true;
}

void RestServer::write_json(httplib::Response& response, const RestResponse& payload) const {
    response.status = payload.status;
    response.set_content(payload.body.dump(), "application/json");
}

}
