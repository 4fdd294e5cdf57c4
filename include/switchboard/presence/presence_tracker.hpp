#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "switchboard/feed/change_feed.hpp"
#include "switchboard/model/types.hpp"
#include "switchboard/presence/recorder.hpp"
#include "switchboard/store/database.hpp"
#include "switchboard/utils/time.hpp"

namespace switchboard {

// Agent status projection and per-day counters, kept in the same database as sessions.
class PresenceTracker : public PresenceRecorder {
public:
    PresenceTracker(std::shared_ptr<store::Database> db,
                    std::shared_ptr<ChangeFeed> feed,
                    std::int64_t stale_after_ms = 30000,
                    utils::Clock clock = utils::now_ms);

    AgentPresence heartbeat(const std::string& tenant_id, const std::string& agent_id);
    AgentPresence set_status(const std::string& tenant_id,
                             const std::string& agent_id,
                             AgentStatus status,
                             std::optional<std::string> message = std::nullopt);
    AgentPresence go_offline(const std::string& tenant_id, const std::string& agent_id);

    // Agents whose last heartbeat is older than the staleness window read as offline.
    std::optional<AgentPresence> get(const std::string& tenant_id, const std::string& agent_id);
    std::vector<AgentPresence> list(const std::string& tenant_id);
    std::optional<AgentDailyMetrics> daily_metrics(const std::string& tenant_id,
                                                   const std::string& agent_id,
                                                   const std::string& date);

    void agent_engaged(const std::string& tenant_id,
                       const std::string& agent_id,
                       SessionId session_id) override;
    void agent_released(const std::string& tenant_id, const std::string& agent_id) override;
    void call_accepted(const std::string& tenant_id,
                       const std::string& agent_id,
                       Direction direction) override;
    void outbound_dialed(const std::string& tenant_id, const std::string& agent_id) override;
    void talk_time(const std::string& tenant_id,
                   const std::string& agent_id,
                   std::int64_t seconds) override;

private:
    AgentPresence upsert(const std::string& tenant_id,
                         const std::string& agent_id,
                         std::optional<AgentStatus> status,
                         bool touch_heartbeat,
                         bool set_session,
                         std::optional<SessionId> session_id,
                         std::optional<std::string> message);
    void bump_metrics(const std::string& tenant_id,
                      const std::string& agent_id,
                      int accepted,
                      int inbound,
                      int outbound,
                      std::int64_t talk_seconds);
    AgentPresence apply_staleness(AgentPresence presence) const;
    void publish(const AgentPresence& presence);

    std::shared_ptr<store::Database> db_;
    std::shared_ptr<ChangeFeed> feed_;
    std::int64_t stale_after_ms_;
    utils::Clock clock_;
};

}
