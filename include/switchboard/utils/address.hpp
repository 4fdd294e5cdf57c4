#pragma once

#include <optional>
#include <string>

namespace switchboard::utils {

struct RemoteParty {
    std::string number;
    std::optional<std::string> display_name;
};

// Drops spaces, dashes, dots and parentheses; keeps a leading '+'.
std::string normalize_address(const std::string& address);

// Parses a SIP name-addr such as "\"Alice\" <sip:+15550100@host;transport=tcp>".
RemoteParty parse_remote_uri(const std::string& uri);

// Expands {agent} and {domain} in a dial template like "sip:{agent}@{domain}".
std::string expand_agent_uri(const std::string& uri_template,
                             const std::string& agent_id,
                             const std::string& domain);

}
