#pragma once

#include <cstdint>
#include <string>

#include "switchboard/model/types.hpp"

namespace switchboard {

// Receives assignment and finalize side effects from the record store.
// Calls arrive after commit; failures are logged by the caller and never propagate.
class PresenceRecorder {
public:
    virtual ~PresenceRecorder() = default;

    virtual void agent_engaged(const std::string& tenant_id,
                               const std::string& agent_id,
                               SessionId session_id) = 0;
    virtual void agent_released(const std::string& tenant_id, const std::string& agent_id) = 0;
    virtual void call_accepted(const std::string& tenant_id,
                               const std::string& agent_id,
                               Direction direction) = 0;
    virtual void outbound_dialed(const std::string& tenant_id, const std::string& agent_id) = 0;
    virtual void talk_time(const std::string& tenant_id,
                           const std::string& agent_id,
                           std::int64_t seconds) = 0;
};

}
