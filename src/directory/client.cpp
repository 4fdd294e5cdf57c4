#include "switchboard/directory/client.hpp"

#include <utility>

#include "switchboard/errors.hpp"
#include "switchboard/logging.hpp"

namespace switchboard {

DirectoryClient::DirectoryClient(std::string base_url,
                                 std::optional<std::string> authorization_token,
                                 DirectoryRequestOptions options)
    : base_(utils::parse_url(base_url)),
      authorization_token_(std::move(authorization_token)),
      options_(options) {
    if (base_.scheme == "https") {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        client_https_ = std::make_unique<httplib::SSLClient>(base_.host, base_.port);
        apply_timeouts(*client_https_);
#else
        throw TransportError("HTTPS directory requires CPPHTTPLIB_OPENSSL_SUPPORT");
#endif
    } else {
        client_http_ = std::make_unique<httplib::Client>(base_.host, base_.port);
        apply_timeouts(*client_http_);
    }
}

std::string DirectoryClient::build_path(const std::string& path) const {
    auto prefix = base_.path;
    if (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }
    return prefix + path;
}

std::optional<nlohmann::json> DirectoryClient::get_json(const std::string& path) {
    auto headers = httplib::Headers{{"Accept", "application/json"}};
    if (authorization_token_) {
        headers.emplace("Authorization", "Bearer " + *authorization_token_);
    }
    const auto full_path = build_path(path);
    httplib::Result response;
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    if (client_https_) {
        response = client_https_->Get(full_path.c_str(), headers);
    } else {
        response = client_http_->Get(full_path.c_str(), headers);
    }
#else
    response = client_http_->Get(full_path.c_str(), headers);
#endif
    if (!response) {
        throw TransportError("Directory request failed: " + httplib::to_string(response.error()));
    }
    if (response->status == 404) {
        return std::nullopt;
    }
    if (response->status < 200 || response->status >= 300) {
        throw TransportError("Directory returned " + std::to_string(response->status) + ": " +
                             response->body);
    }
    try {
        return nlohmann::json::parse(response->body);
    } catch (const nlohmann::json::exception& ex) {
        throw TransportError(std::string("Directory sent invalid JSON: ") + ex.what());
    }
}

std::optional<AgentIdentity> DirectoryClient::lookup(const std::string& identity) {
    const auto body = get_json("/identities/" + utils::url_encode(identity));
    if (!body) {
        logging::info("Directory does not know identity", {kv("identity", identity)});
        return std::nullopt;
    }
    const auto tenant = body->find("tenant_id");
    const auto agent = body->find("agent_id");
    if (tenant == body->end() || agent == body->end() || !tenant->is_string() ||
        !agent->is_string()) {
        throw TransportError("Directory response lacks tenant_id/agent_id");
    }
    return AgentIdentity{tenant->get<std::string>(), agent->get<std::string>()};
}

}
