#include "switchboard/utils/address.hpp"

#include <cctype>

namespace switchboard::utils {

namespace {

std::string trim(const std::string& value) {
    size_t begin = 0;
    size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(begin, end - begin);
}

void replace_all(std::string& text, const std::string& token, const std::string& value) {
    size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), value);
        pos += value.size();
    }
}

}

std::string normalize_address(const std::string& address) {
    std::string normalized;
    normalized.reserve(address.size());
    for (unsigned char ch : trim(address)) {
        if (std::isspace(ch) || ch == '-' || ch == '.' || ch == '(' || ch == ')') {
            continue;
        }
        if (ch == '+' && !normalized.empty()) {
            continue;
        }
        normalized.push_back(static_cast<char>(ch));
    }
    return normalized;
}

RemoteParty parse_remote_uri(const std::string& uri) {
    RemoteParty party;
    std::string working = trim(uri);

    const auto open = working.find('<');
    if (open != std::string::npos) {
        auto name = trim(working.substr(0, open));
        if (name.size() >= 2 && name.front() == '"' && name.back() == '"') {
            name = name.substr(1, name.size() - 2);
        }
        if (!name.empty()) {
            party.display_name = name;
        }
        const auto close = working.find('>', open);
        working = working.substr(open + 1,
                                 close == std::string::npos ? std::string::npos : close - open - 1);
    }

    for (const char* scheme : {"sips:", "sip:", "tel:"}) {
        const std::string prefix(scheme);
        if (working.rfind(prefix, 0) == 0) {
            working = working.substr(prefix.size());
            break;
        }
    }

    const auto at = working.find('@');
    if (at != std::string::npos) {
        working = working.substr(0, at);
    }
    const auto params = working.find(';');
    if (params != std::string::npos) {
        working = working.substr(0, params);
    }
    party.number = normalize_address(working);
    return party;
}

std::string expand_agent_uri(const std::string& uri_template,
                             const std::string& agent_id,
                             const std::string& domain) {
    std::string uri = uri_template;
    replace_all(uri, "{agent}", agent_id);
    replace_all(uri, "{domain}", domain);
    return uri;
}

}
