#include <catch2/catch_test_macros.hpp>

#include "switchboard/feed/change_feed.hpp"
#include "switchboard/server/dashboard_feed.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <string>
#include <vector>

namespace {

switchboard::ChangeEvent event_for(const std::string& tenant) {
    switchboard::ChangeEvent event;
    event.tenant_id = tenant;
    event.entity = "session";
    event.op = "upsert";
    event.record = nlohmann::json{{"id", 1}};
    return event;
}

}

TEST_CASE("subscribers only see their tenant") {
    switchboard::ChangeFeed feed;
    std::vector<std::string> acme;
    std::vector<std::string> all;
    feed.subscribe(std::string("acme"),
                   [&](const switchboard::ChangeEvent& event) { acme.push_back(event.tenant_id); });
    feed.subscribe(std::nullopt,
                   [&](const switchboard::ChangeEvent& event) { all.push_back(event.tenant_id); });

    feed.publish(event_for("acme"));
    feed.publish(event_for("globex"));
    REQUIRE(acme == std::vector<std::string>{"acme"});
    REQUIRE(all == std::vector<std::string>{"acme", "globex"});
}

TEST_CASE("a failing listener does not stop delivery") {
    switchboard::ChangeFeed feed;
    int delivered = 0;
    const auto failing = feed.subscribe(
        std::nullopt, [](const switchboard::ChangeEvent&) { throw std::runtime_error("boom"); });
    feed.subscribe(std::nullopt, [&](const switchboard::ChangeEvent&) { ++delivered; });
    feed.publish(event_for("acme"));
    REQUIRE(delivered == 1);

    feed.unsubscribe(failing);
    REQUIRE(feed.subscriber_count() == 1);
}

TEST_CASE("unsubscribe waits for a listener that is still running") {
    switchboard::ChangeFeed feed;
    std::mutex mutex;
    std::condition_variable changed;
    bool entered = false;
    bool release = false;
    std::atomic<bool> listener_done{false};

    const auto id = feed.subscribe(std::nullopt, [&](const switchboard::ChangeEvent&) {
        std::unique_lock<std::mutex> lock(mutex);
        entered = true;
        changed.notify_all();
        changed.wait(lock, [&] { return release; });
        listener_done = true;
    });

    std::thread publisher([&] { feed.publish(event_for("acme")); });
    {
        std::unique_lock<std::mutex> lock(mutex);
        changed.wait(lock, [&] { return entered; });
    }

    std::atomic<bool> unsubscribed{false};
    std::thread remover([&] {
        feed.unsubscribe(id);
        unsubscribed = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE_FALSE(unsubscribed);

    {
        std::lock_guard<std::mutex> lock(mutex);
        release = true;
    }
    changed.notify_all();
    remover.join();
    publisher.join();
    REQUIRE(listener_done);
    REQUIRE(unsubscribed);
    REQUIRE(feed.subscriber_count() == 0);

    feed.publish(event_for("acme"));
}

TEST_CASE("a listener can unsubscribe itself") {
    switchboard::ChangeFeed feed;
    int delivered = 0;
    switchboard::ChangeFeed::SubscriptionId id = 0;
    id = feed.subscribe(std::nullopt, [&](const switchboard::ChangeEvent&) {
        ++delivered;
        feed.unsubscribe(id);
    });
    feed.publish(event_for("acme"));
    feed.publish(event_for("acme"));
    REQUIRE(delivered == 1);
    REQUIRE(feed.subscriber_count() == 0);
}

TEST_CASE("change events serialize with tenant entity and op") {
    const nlohmann::json json = event_for("acme");
    REQUIRE(json.at("tenant") == "acme");
    REQUIRE(json.at("entity") == "session");
    REQUIRE(json.at("op") == "upsert");
    REQUIRE(json.at("record").at("id") == 1);
}

TEST_CASE("dashboard connections filter by the tenant query parameter") {
    REQUIRE(switchboard::DashboardFeed::tenant_from_resource("/feed?tenant=acme&token=x") ==
            std::optional<std::string>("acme"));
    REQUIRE_FALSE(switchboard::DashboardFeed::tenant_from_resource("/feed"));
    REQUIRE_FALSE(switchboard::DashboardFeed::tenant_from_resource("/feed?tenant="));

    REQUIRE(switchboard::DashboardFeed::matches(std::nullopt, event_for("globex")));
    REQUIRE(switchboard::DashboardFeed::matches(std::string("acme"), event_for("acme")));
    REQUIRE_FALSE(switchboard::DashboardFeed::matches(std::string("acme"), event_for("globex")));
}
