#pragma once

#include <memory>
#include <string>

#include "switchboard/client/concurrency_manager.hpp"
#include "switchboard/directory/identity.hpp"
#include "switchboard/store/record_store.hpp"

namespace switchboard {

// SessionSync for an agent device running in the same process as the record store.
class StoreSessionSync : public SessionSync {
public:
    StoreSessionSync(std::shared_ptr<SessionRecordStore> store, AgentIdentity agent);

    void claim(const ClientSessionHandle& handle) override;
    void end(const ClientSessionHandle& handle) override;
    void begin_outbound(const ClientSessionHandle& handle) override;

private:
    std::shared_ptr<SessionRecordStore> store_;
    AgentIdentity agent_;
};

}
