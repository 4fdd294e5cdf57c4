#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "switchboard/errors.hpp"
#include "switchboard/telephony/provider.hpp"
#include "switchboard/utils/time.hpp"

namespace switchboard::testing {

// In-memory provider recording every call. Operations named in fail_on throw TransportError.
class FakeProvider : public TelephonyProvider {
public:
    std::string ring(const std::string& destination) override {
        std::lock_guard<std::mutex> lock(mutex_);
        check("ring");
        const auto leg = "leg-" + std::to_string(++next_leg_);
        rung.push_back(destination);
        log.push_back("ring " + destination + " " + leg);
        return leg;
    }

    void accept(const std::string& leg_id) override { record("accept", leg_id); }
    void reject(const std::string& leg_id) override { record("reject", leg_id); }

    void disconnect(const std::string& leg_id) override {
        record("disconnect", leg_id);
        std::lock_guard<std::mutex> lock(mutex_);
        disconnected.push_back(leg_id);
        conference_of.erase(leg_id);
    }

    void mute(const std::string& leg_id, bool muted) override {
        record(muted ? "mute" : "unmute", leg_id);
    }

    void hold(const std::string& leg_id, bool held) override {
        record(held ? "hold" : "unhold", leg_id);
    }

    void create_conference(const std::string& name) override {
        record("create_conference", name);
        std::lock_guard<std::mutex> lock(mutex_);
        conferences.insert(name);
    }

    void join_conference(const std::string& leg_id, const std::string& name) override {
        record("join_conference", leg_id + " " + name);
        std::lock_guard<std::mutex> lock(mutex_);
        conference_of[leg_id] = name;
    }

    void leave_conference(const std::string& leg_id) override {
        record("leave_conference", leg_id);
        std::lock_guard<std::mutex> lock(mutex_);
        conference_of.erase(leg_id);
    }

    void register_transport() override {
        record("register_transport", "");
        std::lock_guard<std::mutex> lock(mutex_);
        registered = registration_succeeds;
    }

    bool is_registered() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return registered;
    }

    void set_event_listener(EventListener listener) override { listener_ = std::move(listener); }

    void emit(const ProviderEvent& event) {
        if (listener_) {
            listener_(event);
        }
    }

    std::size_t count(const std::string& op) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t total = 0;
        for (const auto& entry : log) {
            if (entry.rfind(op + " ", 0) == 0 || entry == op) {
                ++total;
            }
        }
        return total;
    }

    bool was_disconnected(const std::string& leg_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& leg : disconnected) {
            if (leg == leg_id) {
                return true;
            }
        }
        return false;
    }

    std::string conference(const std::string& leg_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = conference_of.find(leg_id);
        return it == conference_of.end() ? std::string() : it->second;
    }

    std::set<std::string> fail_on;
    bool registration_succeeds = true;
    bool registered = true;

    std::vector<std::string> log;
    std::vector<std::string> rung;
    std::vector<std::string> disconnected;
    std::set<std::string> conferences;
    std::map<std::string, std::string> conference_of;

private:
    void check(const std::string& op) const {
        if (fail_on.count(op) > 0) {
            throw TransportError("provider refused " + op);
        }
    }

    void record(const std::string& op, const std::string& target) {
        std::lock_guard<std::mutex> lock(mutex_);
        check(op);
        log.push_back(target.empty() ? op : op + " " + target);
    }

    mutable std::mutex mutex_;
    int next_leg_ = 0;
    EventListener listener_;
};

// Manually advanced clock for deadline tests.
struct ManualClock {
    TimestampMs now = 1700000000000;

    utils::Clock fn() {
        return [this]() { return now; };
    }
};

inline std::string agent_address(const std::string& tenant_id, const std::string& agent_id) {
    return "sip:" + tenant_id + "-" + agent_id + "@pbx.test";
}

}
