#include "switchboard/client/presence_heartbeat.hpp"

#include <exception>
#include <utility>

#include "switchboard/logging.hpp"

namespace switchboard {

PresenceHeartbeat::PresenceHeartbeat(Beat beat, Beat on_stop, std::chrono::milliseconds interval)
    : beat_(std::move(beat)),
      on_stop_(std::move(on_stop)),
      interval_(interval) {}

PresenceHeartbeat::~PresenceHeartbeat() {
    stop();
}

void PresenceHeartbeat::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    thread_ = std::thread([this]() { run(); });
}

void PresenceHeartbeat::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    send(on_stop_, "offline");
}

bool PresenceHeartbeat::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void PresenceHeartbeat::send(const Beat& beat, const char* what) {
    if (!beat) {
        return;
    }
    try {
        beat();
    } catch (const std::exception& ex) {
        logging::warn("Presence update failed", {kv("op", what), kv("error", ex.what())});
    }
}

void PresenceHeartbeat::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        lock.unlock();
        send(beat_, "heartbeat");
        lock.lock();
        wake_.wait_for(lock, interval_, [this]() { return !running_; });
    }
}

}
