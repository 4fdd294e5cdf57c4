#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace switchboard {

// Periodic liveness ping for one agent; the first beat is sent on start.
class PresenceHeartbeat {
public:
    using Beat = std::function<void()>;

    PresenceHeartbeat(Beat beat, Beat on_stop, std::chrono::milliseconds interval);
    ~PresenceHeartbeat();

    PresenceHeartbeat(const PresenceHeartbeat&) = delete;
    PresenceHeartbeat& operator=(const PresenceHeartbeat&) = delete;

    void start();
    void stop();
    bool running() const;

private:
    void run();
    void send(const Beat& beat, const char* what);

    Beat beat_;
    Beat on_stop_;
    std::chrono::milliseconds interval_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool running_ = false;
    std::thread thread_;
};

}
