#include "switchboard/feed/change_feed.hpp"

#include <algorithm>
#include <exception>
#include <utility>
#include <vector>

#include "switchboard/logging.hpp"

namespace switchboard {

namespace {

class OnExit {
public:
    explicit OnExit(std::function<void()> fn) : fn_(std::move(fn)) {}
    ~OnExit() { fn_(); }
    OnExit(const OnExit&) = delete;
    OnExit& operator=(const OnExit&) = delete;

private:
    std::function<void()> fn_;
};

}

void to_json(nlohmann::json& out, const ChangeEvent& event) {
    out = nlohmann::json{
        {"tenant", event.tenant_id},
        {"entity", event.entity},
        {"op", event.op},
        {"record", event.record},
    };
}

ChangeFeed::SubscriptionId ChangeFeed::subscribe(std::optional<std::string> tenant_id,
                                                 Listener listener) {
    auto subscription = std::make_shared<Subscription>();
    subscription->tenant_id = std::move(tenant_id);
    subscription->listener = std::move(listener);
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = next_id_++;
    subscriptions_[id] = std::move(subscription);
    return id;
}

void ChangeFeed::unsubscribe(SubscriptionId id) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto it = subscriptions_.find(id);
    if (it == subscriptions_.end()) {
        return;
    }
    auto subscription = it->second;
    subscriptions_.erase(it);
    subscription->active = false;

    // A listener unsubscribing itself only waits for other threads.
    const auto self = std::this_thread::get_id();
    idle_.wait(lock, [&] {
        return std::all_of(subscription->dispatching.begin(), subscription->dispatching.end(),
                           [&](const std::thread::id& thread) { return thread == self; });
    });
}

bool ChangeFeed::enter_locked(Subscription& subscription) {
    if (!subscription.active) {
        return false;
    }
    subscription.dispatching.push_back(std::this_thread::get_id());
    return true;
}

void ChangeFeed::leave(Subscription& subscription) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& threads = subscription.dispatching;
        auto it = std::find(threads.begin(), threads.end(), std::this_thread::get_id());
        if (it != threads.end()) {
            threads.erase(it);
        }
    }
    idle_.notify_all();
}

void ChangeFeed::publish(const ChangeEvent& event) {
    std::vector<std::shared_ptr<Subscription>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& item : subscriptions_) {
            const auto& subscription = item.second;
            if (!subscription->tenant_id || *subscription->tenant_id == event.tenant_id) {
                targets.push_back(subscription);
            }
        }
    }
    for (const auto& subscription : targets) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!enter_locked(*subscription)) {
                continue;
            }
        }
        OnExit done([&] { leave(*subscription); });
        try {
            subscription->listener(event);
        } catch (const std::exception& ex) {
            logging::warn("Change feed listener failed",
                          {kv("tenant", event.tenant_id),
                           kv("entity", event.entity),
                           kv("error", ex.what())});
        }
    }
}

std::size_t ChangeFeed::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

}
