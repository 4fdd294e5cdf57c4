#include "switchboard/directory/identity.hpp"

#include <utility>

#include "switchboard/errors.hpp"
#include "switchboard/logging.hpp"

namespace switchboard {

AgentIdentity parse_identity(const std::string& identity) {
    const auto dash = identity.find('-');
    if (dash == std::string::npos || dash == 0 || dash + 1 >= identity.size()) {
        throw InvalidValue("identity must look like <tenant>-<agent>: " + identity);
    }
    return AgentIdentity{identity.substr(0, dash), identity.substr(dash + 1)};
}

std::string format_identity(const AgentIdentity& identity) {
    return identity.tenant_id + "-" + identity.agent_id;
}

IdentityResolver::IdentityResolver(std::shared_ptr<IdentityLookup> directory)
    : directory_(std::move(directory)) {}

AgentIdentity IdentityResolver::resolve(const std::string& identity) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = cache_.find(identity);
        if (it != cache_.end()) {
            return it->second;
        }
    }

    AgentIdentity resolved;
    if (directory_) {
        auto found = directory_->lookup(identity);
        if (!found) {
            throw NotFound("Unknown identity: " + identity);
        }
        resolved = std::move(*found);
    } else {
        resolved = parse_identity(identity);
    }
    logging::debug("Identity resolved",
                   {kv("identity", identity), kv("tenant", resolved.tenant_id),
                    kv("agent", resolved.agent_id)});

    std::lock_guard<std::mutex> lock(mutex_);
    cache_[identity] = resolved;
    return resolved;
}

void IdentityResolver::invalidate(const std::string& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.erase(identity);
}

}
