#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "switchboard/client/concurrency_manager.hpp"
#include "switchboard/client/optimistic.hpp"
#include "switchboard/client/presence_heartbeat.hpp"
#include "switchboard/client/reconnection_supervisor.hpp"
#include "switchboard/config.hpp"
#include "switchboard/directory/identity.hpp"
#include "switchboard/feed/change_feed.hpp"
#include "switchboard/telephony/provider.hpp"
#include "switchboard/utils/time.hpp"

namespace switchboard {

// Re-registration through the telephony provider's own transport.
class ProviderSignaling : public SignalingTransport {
public:
    explicit ProviderSignaling(std::shared_ptr<TelephonyProvider> provider);

    bool reregister() override;
    bool reinitialize() override;

private:
    std::shared_ptr<TelephonyProvider> provider_;
};

struct AgentConnectionOptions {
    int max_concurrent_calls = 3;
    ReconnectOptions reconnect;
    std::chrono::milliseconds heartbeat_interval{10000};
};

AgentConnectionOptions agent_connection_options(const Config& config, const std::string& tenant_id);

// Everything one signed-in agent device runs: the leg set, the reconnect loop and the
// presence heartbeat. Outbound dials show up immediately as pending entries and are
// confirmed when the session record carrying their correlation id appears on the feed.
class AgentConnection {
public:
    AgentConnection(AgentIdentity identity,
                    std::shared_ptr<TelephonyProvider> device,
                    std::shared_ptr<SignalingTransport> transport,
                    std::shared_ptr<SessionSync> sync,
                    std::shared_ptr<ChangeFeed> feed,
                    PresenceHeartbeat::Beat heartbeat,
                    PresenceHeartbeat::Beat offline,
                    AgentConnectionOptions options = {},
                    utils::Clock clock = utils::now_ms);
    ~AgentConnection();

    AgentConnection(const AgentConnection&) = delete;
    AgentConnection& operator=(const AgentConnection&) = delete;

    void start();
    void stop();

    void handle_event(const ProviderEvent& event);
    // Returns the correlation id of the new outbound entry.
    std::string dial(const std::string& destination);

    std::vector<Session> outbound_entries() const;
    std::size_t pending_outbound() const;
    bool is_outbound_pending(const std::string& correlation_id) const;

    const AgentIdentity& identity() const { return identity_; }
    ConcurrencyManager& calls() { return calls_; }
    ReconnectionSupervisor& connection() { return connection_; }

private:
    void on_change(const ChangeEvent& event);
    std::string next_correlation_id();

    AgentIdentity identity_;
    std::shared_ptr<ChangeFeed> feed_;
    utils::Clock clock_;
    ConcurrencyManager calls_;
    ReconnectionSupervisor connection_;
    PresenceHeartbeat heartbeat_;

    mutable std::mutex ledger_mutex_;
    OptimisticLedger<Session> outbound_;
    std::optional<ChangeFeed::SubscriptionId> subscription_;
    std::atomic<std::uint64_t> sequence_{0};
};

}
