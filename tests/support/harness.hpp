#pragma once

#include <memory>
#include <string>
#include <vector>

#include "support/fake_provider.hpp"
#include "switchboard/feed/change_feed.hpp"
#include "switchboard/presence/presence_tracker.hpp"
#include "switchboard/store/database.hpp"
#include "switchboard/store/record_store.hpp"

namespace switchboard::testing {

// Store, feed and presence over an in-memory database, on a manual clock.
struct Harness {
    explicit Harness(int parking_slots = 3) {
        db = store::Database::open_in_memory();
        feed = std::make_shared<ChangeFeed>();
        RecordStoreOptions options;
        options.parking_slots = parking_slots;
        store = std::make_shared<SessionRecordStore>(db, feed, options, clock.fn());
        presence = std::make_shared<PresenceTracker>(db, feed, 30000, clock.fn());
        store->set_presence_recorder(presence);
        store->initialize_slots(tenant, parking_slots);
        feed->subscribe(std::nullopt, [this](const ChangeEvent& event) { events.push_back(event); });
    }

    Harness(const Harness&) = delete;
    Harness& operator=(const Harness&) = delete;

    Session inbound(const std::string& call_id, const std::string& from = "+15550100") {
        NewSession request;
        request.tenant_id = tenant;
        request.provider_call_id = call_id;
        request.from = from;
        request.from_name = "Caller";
        request.to = "+15550199";
        return store->create_inbound(request);
    }

    Session connected(const std::string& call_id, const std::string& agent) {
        const auto session = inbound(call_id);
        return store->apply_transition(session.id, Transition::answer(agent), agent);
    }

    std::size_t count_events(const std::string& entity, const std::string& op) const {
        std::size_t total = 0;
        for (const auto& event : events) {
            if (event.entity == entity && event.op == op) {
                ++total;
            }
        }
        return total;
    }

    const std::string tenant = "acme";
    ManualClock clock;
    std::shared_ptr<store::Database> db;
    std::shared_ptr<ChangeFeed> feed;
    std::shared_ptr<SessionRecordStore> store;
    std::shared_ptr<PresenceTracker> presence;
    std::shared_ptr<FakeProvider> provider = std::make_shared<FakeProvider>();
    std::vector<ChangeEvent> events;
};

}
