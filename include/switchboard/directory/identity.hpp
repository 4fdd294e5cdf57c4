#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace switchboard {

struct AgentIdentity {
    std::string tenant_id;
    std::string agent_id;

    bool operator==(const AgentIdentity& other) const {
        return tenant_id == other.tenant_id && agent_id == other.agent_id;
    }
};

// Device identities read "<tenant>-<agent>"; the tenant part never contains '-'.
AgentIdentity parse_identity(const std::string& identity);
std::string format_identity(const AgentIdentity& identity);

class IdentityLookup {
public:
    virtual ~IdentityLookup() = default;

    // Returns nothing for an identity the directory does not know.
    virtual std::optional<AgentIdentity> lookup(const std::string& identity) = 0;
};

// Maps opaque identities to (tenant, agent). Uses the directory when one is configured,
// otherwise the identity's own "<tenant>-<agent>" form. Answers are cached.
class IdentityResolver {
public:
    explicit IdentityResolver(std::shared_ptr<IdentityLookup> directory = nullptr);

    // Throws NotFound for an identity the directory rejects, InvalidValue for a malformed one.
    AgentIdentity resolve(const std::string& identity);
    void invalidate(const std::string& identity);

private:
    std::shared_ptr<IdentityLookup> directory_;
    std::mutex mutex_;
    std::map<std::string, AgentIdentity> cache_;
};

}
