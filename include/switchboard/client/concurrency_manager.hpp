#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "switchboard/model/types.hpp"
#include "switchboard/telephony/provider.hpp"
#include "switchboard/utils/time.hpp"

namespace switchboard {

enum class HandleStatus {
    Pending,
    Connecting,
    Open,
    Closed
};

const char* to_string(HandleStatus status);

// One leg as the agent's device sees it.
struct ClientSessionHandle {
    std::string leg_id;
    HandleStatus status = HandleStatus::Pending;
    Direction direction = Direction::Inbound;
    std::string from;
    std::string to;
    bool is_held = false;
    bool is_muted = false;
    bool is_focused = false;
    TimestampMs started_at = 0;
    std::optional<TimestampMs> answered_at;
    std::optional<std::string> correlation_id;
};

// Mirrors local leg changes onto the shared session record.
class SessionSync {
public:
    virtual ~SessionSync() = default;

    virtual void claim(const ClientSessionHandle& handle) = 0;
    virtual void end(const ClientSessionHandle& handle) = 0;
    virtual void begin_outbound(const ClientSessionHandle& handle) = 0;
};

// Bounded set of simultaneous legs on one agent device, with a single focused leg.
// All operations are serialized; provider failures leave local state untouched and propagate.
class ConcurrencyManager {
public:
    ConcurrencyManager(std::shared_ptr<TelephonyProvider> device,
                       int max_sessions,
                       std::shared_ptr<SessionSync> sync = nullptr,
                       utils::Clock clock = utils::now_ms);

    // Rejects the leg and returns false when already at the bound.
    bool add_session(const std::string& leg_id,
                     Direction direction,
                     const std::string& from,
                     const std::string& to);
    bool answer(const std::string& leg_id, bool hold_others = true);
    bool focus(const std::string& leg_id);
    bool hang_up(const std::string& leg_id);
    bool reject(const std::string& leg_id);
    bool toggle_mute(const std::string& leg_id);
    bool hold(const std::string& leg_id);
    bool unhold(const std::string& leg_id);
    // Throws ResourceExhausted at the bound.
    std::string dial(const std::string& destination,
                     const std::string& from,
                     std::optional<std::string> correlation_id = std::nullopt);
    // Drops every handle without touching the provider, for a transport that is gone.
    void close_all();

    void handle_event(const ProviderEvent& event);

    std::vector<ClientSessionHandle> handles() const;
    std::vector<ClientSessionHandle> pending() const;
    std::vector<ClientSessionHandle> active() const;
    std::optional<ClientSessionHandle> focused() const;
    std::size_t count() const;
    int max_sessions() const { return max_sessions_; }

private:
    ClientSessionHandle* find_locked(const std::string& leg_id);
    ClientSessionHandle* focused_locked();
    // Holds the focused open leg unless it is leg_id; returns the leg it held.
    std::optional<std::string> hold_focused_except_locked(const std::string& leg_id);
    void restore_held_locked(const std::optional<std::string>& leg_id);
    void set_focus_locked(const std::string& leg_id);
    void remove_locked(const std::string& leg_id);
    bool add_locked(const std::string& leg_id,
                    Direction direction,
                    const std::string& from,
                    const std::string& to);

    template <typename Fn>
    void sync(const char* what, const ClientSessionHandle& handle, Fn fn);

    std::shared_ptr<TelephonyProvider> device_;
    int max_sessions_;
    std::shared_ptr<SessionSync> sync_;
    utils::Clock clock_;
    mutable std::mutex mutex_;
    std::vector<ClientSessionHandle> handles_;
};

}
