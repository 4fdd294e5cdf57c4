#include "switchboard/client/agent_connection.hpp"

#include <utility>

#include "switchboard/logging.hpp"
#include "switchboard/model/json.hpp"

namespace switchboard {

ProviderSignaling::ProviderSignaling(std::shared_ptr<TelephonyProvider> provider)
    : provider_(std::move(provider)) {}

bool ProviderSignaling::reregister() {
    provider_->register_transport();
    return provider_->is_registered();
}

bool ProviderSignaling::reinitialize() {
    // The provider rebuilds its account on a fresh registration.
    provider_->register_transport();
    return provider_->is_registered();
}

AgentConnectionOptions agent_connection_options(const Config& config, const std::string& tenant_id) {
    AgentConnectionOptions options;
    options.max_concurrent_calls = config.concurrency_bound_for(tenant_id);
    options.reconnect.base_delay = std::chrono::milliseconds(config.reconnect_base_delay_ms);
    options.reconnect.max_delay = std::chrono::milliseconds(config.reconnect_max_delay_ms);
    options.reconnect.max_attempts = config.reconnect_max_attempts;
    options.reconnect.hidden_threshold =
        std::chrono::milliseconds(config.reconnect_hidden_threshold_ms);
    options.heartbeat_interval = std::chrono::milliseconds(config.heartbeat_interval_ms);
    return options;
}

AgentConnection::AgentConnection(AgentIdentity identity,
                                 std::shared_ptr<TelephonyProvider> device,
                                 std::shared_ptr<SignalingTransport> transport,
                                 std::shared_ptr<SessionSync> sync,
                                 std::shared_ptr<ChangeFeed> feed,
                                 PresenceHeartbeat::Beat heartbeat,
                                 PresenceHeartbeat::Beat offline,
                                 AgentConnectionOptions options,
                                 utils::Clock clock)
    : identity_(std::move(identity)),
      feed_(std::move(feed)),
      clock_(clock),
      calls_(std::move(device), options.max_concurrent_calls, std::move(sync), clock),
      connection_(std::move(transport), options.reconnect),
      heartbeat_(std::move(heartbeat), std::move(offline), options.heartbeat_interval) {}

AgentConnection::~AgentConnection() {
    stop();
}

void AgentConnection::start() {
    if (feed_ && !subscription_) {
        subscription_ = feed_->subscribe(identity_.tenant_id,
                                         [this](const ChangeEvent& event) { on_change(event); });
    }
    connection_.start();
    heartbeat_.start();
    logging::info("Agent connection started",
                  {kv("tenant", identity_.tenant_id), kv("agent", identity_.agent_id)});
}

void AgentConnection::stop() {
    heartbeat_.stop();
    connection_.stop();
    if (feed_ && subscription_) {
        feed_->unsubscribe(*subscription_);
        subscription_.reset();
    }
}

void AgentConnection::handle_event(const ProviderEvent& event) {
    calls_.handle_event(event);
}

std::string AgentConnection::next_correlation_id() {
    return format_identity(identity_) + "-" + std::to_string(clock_()) + "-" +
           std::to_string(++sequence_);
}

std::string AgentConnection::dial(const std::string& destination) {
    const auto correlation_id = next_correlation_id();
    Session draft;
    draft.tenant_id = identity_.tenant_id;
    draft.direction = Direction::Outbound;
    draft.from = format_identity(identity_);
    draft.to = destination;
    draft.state = SessionState::Connecting;
    draft.assigned_agent = identity_.agent_id;
    draft.started_at = clock_();
    draft.correlation_id = correlation_id;
    {
        std::lock_guard<std::mutex> lock(ledger_mutex_);
        outbound_.add_pending(correlation_id, draft, draft.started_at);
    }
    try {
        calls_.dial(destination, draft.from, correlation_id);
    } catch (const std::exception& ex) {
        logging::warn("Outbound dial failed",
                      {kv("correlation_id", correlation_id), kv("error", ex.what())});
        std::lock_guard<std::mutex> lock(ledger_mutex_);
        outbound_.discard(correlation_id);
        throw;
    }
    return correlation_id;
}

void AgentConnection::on_change(const ChangeEvent& event) {
    if (event.entity != "session" || event.op != "upsert") {
        return;
    }
    const auto it = event.record.find("correlation_id");
    if (it == event.record.end() || !it->is_string()) {
        return;
    }
    const auto correlation_id = it->get<std::string>();
    std::lock_guard<std::mutex> lock(ledger_mutex_);
    if (!outbound_.find(correlation_id)) {
        return;
    }
    try {
        outbound_.confirm(correlation_id, event.record.get<Session>());
    } catch (const std::exception& ex) {
        logging::warn("Unreadable session record on feed",
                      {kv("correlation_id", correlation_id), kv("error", ex.what())});
    }
}

std::vector<Session> AgentConnection::outbound_entries() const {
    std::lock_guard<std::mutex> lock(ledger_mutex_);
    return outbound_.values();
}

std::size_t AgentConnection::pending_outbound() const {
    std::lock_guard<std::mutex> lock(ledger_mutex_);
    return outbound_.pending_count();
}

bool AgentConnection::is_outbound_pending(const std::string& correlation_id) const {
    std::lock_guard<std::mutex> lock(ledger_mutex_);
    return outbound_.is_pending(correlation_id);
}

}
