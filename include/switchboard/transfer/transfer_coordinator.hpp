#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "switchboard/store/record_store.hpp"
#include "switchboard/telephony/provider.hpp"

namespace switchboard {

struct TransferOptions {
    std::int64_t ring_timeout_ms = 30000;
};

class TransferCoordinator {
public:
    TransferCoordinator(std::shared_ptr<SessionRecordStore> store,
                        std::shared_ptr<TelephonyProvider> provider,
                        AgentAddressFn agent_address,
                        TransferOptions options = {});

    PendingTransfer transfer_direct(SessionId id,
                                    const std::string& target_agent,
                                    const std::string& actor);
    PendingTransfer transfer_from_park(const std::string& tenant_id,
                                       int slot,
                                       const std::string& target_agent,
                                       const std::string& actor);

    // Throws StateConflict when the transfer already resolved or has expired.
    TransferResolution accept(TransferId id, const std::string& agent_id);
    TransferResolution decline(TransferId id, const std::string& agent_id);

    // Times out every ringing transfer past its deadline.
    std::vector<TransferResolution> expire_due();
    // Live transfers ringing for the agent; expired ones are timed out on the way.
    std::vector<PendingTransfer> pending_for(const std::string& tenant_id,
                                             const std::string& agent_id);

private:
    PendingTransfer start(const Session& session,
                          const std::string& target_agent,
                          TransferKind kind,
                          const std::string& actor);
    TransferResolution time_out(TransferId id);
    void settle_unaccepted(const PendingTransfer& before, const TransferResolution& result);

    std::shared_ptr<SessionRecordStore> store_;
    std::shared_ptr<TelephonyProvider> provider_;
    AgentAddressFn agent_address_;
    TransferOptions options_;
};

}
