#include <catch2/catch_test_macros.hpp>

#include "switchboard/client/reconnection_supervisor.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

class FakeSignaling : public switchboard::SignalingTransport {
public:
    bool reregister() override { return attempt(reregisters); }
    bool reinitialize() override { return attempt(reinitializes); }

    std::atomic<int> reregisters{0};
    std::atomic<int> reinitializes{0};
    std::atomic<int> failures_left{1000};
    std::atomic<int> max_concurrent{0};

private:
    bool attempt(std::atomic<int>& counter) {
        const int now_running = ++running_;
        int seen = max_concurrent.load();
        while (now_running > seen && !max_concurrent.compare_exchange_weak(seen, now_running)) {
        }
        ++counter;
        std::this_thread::sleep_for(1ms);
        --running_;
        return failures_left.fetch_sub(1) <= 0;
    }

    std::atomic<int> running_{0};
};

bool eventually(const std::function<bool()>& condition) {
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(1ms);
    }
    return condition();
}

switchboard::ReconnectOptions fast_options(int max_attempts) {
    switchboard::ReconnectOptions options;
    options.base_delay = 1ms;
    options.max_delay = 4ms;
    options.max_attempts = max_attempts;
    options.hidden_threshold = 1000ms;
    return options;
}

}

TEST_CASE("backoff doubles up to the ceiling") {
    using switchboard::ReconnectionSupervisor;
    REQUIRE(ReconnectionSupervisor::backoff_delay(0, 1000ms, 30000ms) == 1000ms);
    REQUIRE(ReconnectionSupervisor::backoff_delay(1, 1000ms, 30000ms) == 2000ms);
    REQUIRE(ReconnectionSupervisor::backoff_delay(4, 1000ms, 30000ms) == 16000ms);
    REQUIRE(ReconnectionSupervisor::backoff_delay(5, 1000ms, 30000ms) == 30000ms);
    REQUIRE(ReconnectionSupervisor::backoff_delay(40, 1000ms, 30000ms) == 30000ms);
}

TEST_CASE("the supervisor gives up after the attempt ceiling") {
    auto transport = std::make_shared<FakeSignaling>();
    std::mutex mutex;
    std::vector<switchboard::ConnectionState> seen;
    switchboard::ReconnectionSupervisor supervisor(
        transport, fast_options(3),
        [&](switchboard::ConnectionState state, const std::string&) {
            std::lock_guard<std::mutex> lock(mutex);
            seen.push_back(state);
        });
    supervisor.start();
    supervisor.on_transport_lost();

    REQUIRE(eventually([&] {
        return supervisor.state() == switchboard::ConnectionState::ConnectionLost &&
               !supervisor.in_flight();
    }));
    REQUIRE(supervisor.attempts() == 3);
    REQUIRE(transport->reregisters.load() == 3);
    REQUIRE(transport->reinitializes.load() == 3);

    supervisor.on_transport_lost();
    std::this_thread::sleep_for(20ms);
    REQUIRE(transport->reregisters.load() == 3);

    transport->failures_left = 0;
    supervisor.reset();
    REQUIRE(eventually(
        [&] { return supervisor.state() == switchboard::ConnectionState::Connected; }));
    REQUIRE(supervisor.attempts() == 0);

    std::lock_guard<std::mutex> lock(mutex);
    REQUIRE(seen.front() == switchboard::ConnectionState::Reconnecting);
    REQUIRE(std::find(seen.begin(), seen.end(), switchboard::ConnectionState::ConnectionLost) !=
            seen.end());
    REQUIRE(seen.back() == switchboard::ConnectionState::Connected);
}

TEST_CASE("only one reconnect attempt runs at a time") {
    auto transport = std::make_shared<FakeSignaling>();
    transport->failures_left = 4;
    switchboard::ReconnectionSupervisor supervisor(transport, fast_options(10));
    supervisor.start();

    std::vector<std::thread> triggers;
    for (int i = 0; i < 8; ++i) {
        triggers.emplace_back([&] {
            supervisor.on_transport_lost();
            supervisor.on_visibility_changed(true, 10ms);
        });
    }
    for (auto& thread : triggers) {
        thread.join();
    }
    REQUIRE(eventually([&] {
        return supervisor.state() == switchboard::ConnectionState::Connected &&
               !supervisor.in_flight() && transport->failures_left < 0;
    }));
    REQUIRE(transport->max_concurrent.load() == 1);
}

TEST_CASE("a short absence only re-registers") {
    auto transport = std::make_shared<FakeSignaling>();
    transport->failures_left = 0;
    switchboard::ReconnectionSupervisor supervisor(transport, fast_options(10));
    supervisor.start();
    supervisor.on_visibility_changed(false, 0ms);
    supervisor.on_visibility_changed(true, 50ms);

    REQUIRE(eventually([&] { return transport->reregisters == 1 && !supervisor.in_flight(); }));
    REQUIRE(transport->reinitializes.load() == 0);
    REQUIRE(supervisor.state() == switchboard::ConnectionState::Connected);
}

TEST_CASE("no attempts run while the network is offline") {
    auto transport = std::make_shared<FakeSignaling>();
    transport->failures_left = 0;
    switchboard::ReconnectionSupervisor supervisor(transport, fast_options(10));
    supervisor.start();

    supervisor.on_network_offline();
    REQUIRE(supervisor.state() == switchboard::ConnectionState::Offline);
    supervisor.on_transport_lost();
    std::this_thread::sleep_for(20ms);
    REQUIRE(transport->reregisters.load() == 0);

    supervisor.on_network_online();
    REQUIRE(eventually(
        [&] { return supervisor.state() == switchboard::ConnectionState::Connected; }));
    REQUIRE(transport->reregisters.load() == 1);
    REQUIRE(std::string(switchboard::to_string(switchboard::ConnectionState::ConnectionLost)) ==
            "connection_lost");
}
