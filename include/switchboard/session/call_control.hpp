#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "switchboard/store/record_store.hpp"
#include "switchboard/telephony/provider.hpp"

namespace switchboard {

// Maps a dialed address to the tenant that owns it.
using TenantResolverFn = std::function<std::string(const std::string& dialed)>;

// Server-side answer, hold, resume, dial and hang-up. Provider first, then the store;
// a lost store race undoes the provider step.
class CallControl {
public:
    CallControl(std::shared_ptr<SessionRecordStore> store,
                std::shared_ptr<TelephonyProvider> provider,
                AgentAddressFn agent_address);

    Session answer(SessionId id, const std::string& agent_id);
    Session hold(SessionId id, const std::string& actor);
    Session resume(SessionId id, const std::string& agent_id);
    Session dial(const std::string& tenant_id,
                 const std::string& agent_id,
                 const std::string& from,
                 const std::string& destination,
                 std::optional<std::string> correlation_id = std::nullopt);
    std::optional<CallHistoryRecord> end(SessionId id, const std::string& actor);

    // Single entry point for caller-side provider events.
    void handle_event(const ProviderEvent& event, const TenantResolverFn& tenant_for);

private:
    std::shared_ptr<SessionRecordStore> store_;
    std::shared_ptr<TelephonyProvider> provider_;
    AgentAddressFn agent_address_;
};

}
