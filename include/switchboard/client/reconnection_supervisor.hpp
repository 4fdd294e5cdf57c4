#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace switchboard {

// Signaling side of an agent device.
class SignalingTransport {
public:
    virtual ~SignalingTransport() = default;

    // Quick re-registration of the existing transport.
    virtual bool reregister() = 0;
    // Tears down and rebuilds the device.
    virtual bool reinitialize() = 0;
};

enum class ConnectionState {
    Connected,
    Reconnecting,
    Offline,
    ConnectionLost
};

const char* to_string(ConnectionState state);

struct ReconnectOptions {
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    int max_attempts = 10;
    std::chrono::milliseconds hidden_threshold{30000};
};

// Keeps one agent device registered. At most one attempt runs at a time, attempts back off
// exponentially, and past the ceiling the supervisor stays in ConnectionLost until reset.
class ReconnectionSupervisor {
public:
    using StateListener = std::function<void(ConnectionState state, const std::string& error)>;

    ReconnectionSupervisor(std::shared_ptr<SignalingTransport> transport,
                           ReconnectOptions options = {},
                           StateListener listener = {});
    ~ReconnectionSupervisor();

    ReconnectionSupervisor(const ReconnectionSupervisor&) = delete;
    ReconnectionSupervisor& operator=(const ReconnectionSupervisor&) = delete;

    void start();
    void stop();

    static std::chrono::milliseconds backoff_delay(int attempt,
                                                   std::chrono::milliseconds base,
                                                   std::chrono::milliseconds max);

    void on_transport_lost();
    void on_registered();
    void on_network_online();
    void on_network_offline();
    void on_visibility_changed(bool visible, std::chrono::milliseconds hidden_for);
    void reset();

    ConnectionState state() const;
    int attempts() const;
    bool in_flight() const;

private:
    enum class Request {
        None,
        Quick,
        Backoff
    };

    void run();
    void request_locked(Request request);
    void set_state_locked(ConnectionState state, const std::string& error = {});
    bool try_reregister();
    bool try_reinitialize();
    void notify(ConnectionState state, const std::string& error);

    std::shared_ptr<SignalingTransport> transport_;
    ReconnectOptions options_;
    StateListener listener_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    bool running_ = false;
    bool offline_ = false;
    bool in_flight_ = false;
    Request request_ = Request::None;
    int attempts_ = 0;
    ConnectionState state_ = ConnectionState::Connected;
};

}
