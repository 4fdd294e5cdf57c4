#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "switchboard/directory/identity.hpp"
#include "switchboard/utils/http.hpp"

namespace switchboard {

struct DirectoryRequestOptions {
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds read_timeout{10};
};

// Identity service client: GET <base>/identities/<identity> -> {"tenant_id", "agent_id"}.
class DirectoryClient : public IdentityLookup {
public:
    DirectoryClient(std::string base_url,
                    std::optional<std::string> authorization_token,
                    DirectoryRequestOptions options = {});

    std::optional<AgentIdentity> lookup(const std::string& identity) override;

private:
    std::string build_path(const std::string& path) const;
    // Returns nothing on 404; throws TransportError on other failures.
    std::optional<nlohmann::json> get_json(const std::string& path);

    template <typename T>
    void apply_timeouts(T& client) const {
        client.set_connection_timeout(options_.connect_timeout.count(), 0);
        client.set_read_timeout(options_.read_timeout.count(), 0);
    }

    utils::ParsedUrl base_;
    std::optional<std::string> authorization_token_;
    DirectoryRequestOptions options_;
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    std::unique_ptr<httplib::SSLClient> client_https_;
#endif
    std::unique_ptr<httplib::Client> client_http_;
};

}
