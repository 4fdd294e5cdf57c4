#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "switchboard/model/types.hpp"

namespace switchboard {

enum class LegEventType {
    Incoming,
    Accepted,
    Disconnected,
    Cancelled,
    Rejected
};

const char* to_string(LegEventType type);

struct ProviderEvent {
    LegEventType type = LegEventType::Incoming;
    std::string leg_id;
    Direction direction = Direction::Inbound;
    // Remote party number and display name as reported by signaling.
    std::string remote;
    std::optional<std::string> remote_name;
    // Dialed address for incoming legs.
    std::string local;
    // Provider status vocabulary for terminal events: completed, busy, failed, no-answer, canceled.
    std::optional<std::string> status;
    std::optional<std::int64_t> duration_sec;
};

// Telephony primitives. Every operation throws TransportError when the provider refuses it.
class TelephonyProvider {
public:
    using EventListener = std::function<void(const ProviderEvent&)>;

    virtual ~TelephonyProvider() = default;

    // Starts an outbound leg and returns its id without waiting for an answer.
    virtual std::string ring(const std::string& destination) = 0;
    virtual void accept(const std::string& leg_id) = 0;
    virtual void reject(const std::string& leg_id) = 0;
    virtual void disconnect(const std::string& leg_id) = 0;
    virtual void mute(const std::string& leg_id, bool muted) = 0;
    virtual void hold(const std::string& leg_id, bool held) = 0;

    virtual void create_conference(const std::string& name) = 0;
    // A leg belongs to at most one conference; joining moves it out of the previous one.
    virtual void join_conference(const std::string& leg_id, const std::string& name) = 0;
    virtual void leave_conference(const std::string& leg_id) = 0;

    virtual void register_transport() = 0;
    virtual bool is_registered() const = 0;

    virtual void set_event_listener(EventListener listener) = 0;
};

// Resolves the dialable address of an agent's device.
using AgentAddressFn = std::function<std::string(const std::string& tenant_id,
                                                 const std::string& agent_id)>;

std::string bridge_conference_name(const std::string& tenant_id, SessionId session_id);
std::string hold_conference_name(const std::string& tenant_id, SessionId session_id);

// Runs a compensating or cleanup provider step; failures are logged, not raised.
void best_effort(const std::string& what, const std::function<void()>& action);

}
