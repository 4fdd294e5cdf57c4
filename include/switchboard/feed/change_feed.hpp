#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace switchboard {

struct ChangeEvent {
    std::string tenant_id;
    std::string entity;  // session, parking_slot, transfer, ringing, history, presence
    std::string op;      // upsert, remove
    nlohmann::json record;
};

void to_json(nlohmann::json& out, const ChangeEvent& event);

class ChangeFeed {
public:
    using Listener = std::function<void(const ChangeEvent&)>;
    using SubscriptionId = std::uint64_t;

    // An empty tenant subscribes to every tenant.
    SubscriptionId subscribe(std::optional<std::string> tenant_id, Listener listener);
    // Returns once no other thread is inside the listener. Safe to call from the listener.
    void unsubscribe(SubscriptionId id);

    // Listeners run on the publishing thread, outside the feed lock.
    void publish(const ChangeEvent& event);

    std::size_t subscriber_count() const;

private:
    struct Subscription {
        std::optional<std::string> tenant_id;
        Listener listener;
        bool active = true;
        std::vector<std::thread::id> dispatching;
    };

    bool enter_locked(Subscription& subscription);
    void leave(Subscription& subscription);

    mutable std::mutex mutex_;
    std::condition_variable idle_;
    SubscriptionId next_id_ = 1;
    std::map<SubscriptionId, std::shared_ptr<Subscription>> subscriptions_;
};

}
