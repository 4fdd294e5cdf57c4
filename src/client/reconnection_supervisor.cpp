#include "switchboard/client/reconnection_supervisor.hpp"

#include "switchboard/logging.hpp"

#include <algorithm>
#include <utility>

namespace switchboard {

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Connected:
            return "connected";
        case ConnectionState::Reconnecting:
            return "reconnecting";
        case ConnectionState::Offline:
            return "offline";
        case ConnectionState::ConnectionLost:
            return "connection_lost";
    }
    return "connection_lost";
}

ReconnectionSupervisor::ReconnectionSupervisor(std::shared_ptr<SignalingTransport> transport,
                                               ReconnectOptions options,
                                               StateListener listener)
    : transport_(std::move(transport)),
      options_(options),
      listener_(std::move(listener)) {}

ReconnectionSupervisor::~ReconnectionSupervisor() {
    stop();
}

void ReconnectionSupervisor::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    worker_ = std::thread([this]() { run(); });
}

void ReconnectionSupervisor::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::chrono::milliseconds ReconnectionSupervisor::backoff_delay(int attempt,
                                                                std::chrono::milliseconds base,
                                                                std::chrono::milliseconds max) {
    if (attempt <= 0) {
        return std::min(base, max);
    }
    auto delay = base;
    for (int i = 0; i < attempt; ++i) {
        delay *= 2;
        if (delay >= max) {
            return max;
        }
    }
    return delay;
}

void ReconnectionSupervisor::notify(ConnectionState state, const std::string& error) {
    if (state == ConnectionState::ConnectionLost) {
        logging::error("Connection lost", {kv("error", error)});
    } else {
        logging::info("Connection state changed", {kv("state", to_string(state))});
    }
    if (!listener_) {
        return;
    }
    try {
        listener_(state, error);
    } catch (const std::exception& ex) {
        logging::warn("Connection state listener failed", {kv("error", ex.what())});
    }
}

void ReconnectionSupervisor::request_locked(Request request) {
    if (in_flight_ || offline_) {
        return;
    }
    if (request_ != Request::Backoff) {
        request_ = request;
    }
    cv_.notify_all();
}

void ReconnectionSupervisor::on_transport_lost() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ConnectionState::ConnectionLost) {
        return;
    }
    request_locked(Request::Backoff);
}

void ReconnectionSupervisor::on_registered() {
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        attempts_ = 0;
        if (!in_flight_ && state_ != ConnectionState::Connected) {
            state_ = ConnectionState::Connected;
            changed = true;
        }
    }
    if (changed) {
        notify(ConnectionState::Connected, {});
    }
}

void ReconnectionSupervisor::on_network_online() {
    std::lock_guard<std::mutex> lock(mutex_);
    offline_ = false;
    attempts_ = 0;
    request_locked(Request::Backoff);
}

void ReconnectionSupervisor::on_network_offline() {
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        offline_ = true;
        request_ = Request::None;
        if (state_ != ConnectionState::Offline) {
            state_ = ConnectionState::Offline;
            changed = true;
        }
    }
    cv_.notify_all();
    if (changed) {
        notify(ConnectionState::Offline, {});
    }
}

void ReconnectionSupervisor::on_visibility_changed(bool visible,
                                                   std::chrono::milliseconds hidden_for) {
    if (!visible) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ConnectionState::ConnectionLost) {
        return;
    }
    request_locked(hidden_for > options_.hidden_threshold ? Request::Backoff : Request::Quick);
}

void ReconnectionSupervisor::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    attempts_ = 0;
    request_locked(Request::Backoff);
}

ConnectionState ReconnectionSupervisor::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

int ReconnectionSupervisor::attempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempts_;
}

bool ReconnectionSupervisor::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

bool ReconnectionSupervisor::try_reregister() {
    try {
        return transport_->reregister();
    } catch (const std::exception& ex) {
        logging::warn("Re-register failed", {kv("error", ex.what())});
        return false;
    }
}

bool ReconnectionSupervisor::try_reinitialize() {
    try {
        return transport_->reinitialize();
    } catch (const std::exception& ex) {
        logging::warn("Device reinitialize failed", {kv("error", ex.what())});
        return false;
    }
}

void ReconnectionSupervisor::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    auto change_state = [&](ConnectionState state, const std::string& error) {
        if (state_ == state) {
            return;
        }
        state_ = state;
        lock.unlock();
        notify(state, error);
        lock.lock();
    };

    while (running_) {
        cv_.wait(lock, [this]() { return !running_ || (request_ != Request::None && !offline_); });
        if (!running_) {
            break;
        }
        const auto mode = request_;
        request_ = Request::None;
        in_flight_ = true;
        change_state(ConnectionState::Reconnecting, {});

        bool connected = false;
        if (mode == Request::Quick) {
            lock.unlock();
            connected = try_reregister();
            lock.lock();
        }

        while (!connected && running_ && !offline_) {
            if (attempts_ >= options_.max_attempts) {
                change_state(ConnectionState::ConnectionLost,
                             "Connection lost after " + std::to_string(attempts_) + " attempts");
                break;
            }
            const auto delay = backoff_delay(attempts_, options_.base_delay, options_.max_delay);
            ++attempts_;
            logging::debug("Reconnect scheduled",
                           {kv("attempt", attempts_), kv("delay_ms", delay.count())});
            cv_.wait_for(lock, delay, [this]() { return !running_ || offline_; });
            if (!running_ || offline_) {
                break;
            }
            lock.unlock();
            connected = try_reregister() || try_reinitialize();
            lock.lock();
        }

        if (connected) {
            attempts_ = 0;
            change_state(ConnectionState::Connected, {});
        }
        in_flight_ = false;
    }
}

}
