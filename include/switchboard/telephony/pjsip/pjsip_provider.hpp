#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

#include <pjsua2.hpp>

#include "switchboard/config.hpp"
#include "switchboard/telephony/pjsip/hold_player.hpp"
#include "switchboard/telephony/pjsip/sip_account.hpp"
#include "switchboard/telephony/pjsip/sip_leg.hpp"
#include "switchboard/telephony/provider.hpp"

namespace switchboard::pjsip {

// TelephonyProvider over one registered pjsua2 account. Conferences are sets of legs
// cross-connected on the pjmedia conference bridge; a lone member hears hold music.
// Callbacks from pjsip threads are handed to worker threads before touching provider state.
class PjsipProvider : public TelephonyProvider {
public:
    explicit PjsipProvider(const Config& config);
    ~PjsipProvider() override;

    void init();
    // Polls pjsip until quitting is set.
    void run(const std::atomic<bool>& quitting);
    void shutdown();

    std::string ring(const std::string& destination) override;
    void accept(const std::string& leg_id) override;
    void reject(const std::string& leg_id) override;
    void disconnect(const std::string& leg_id) override;
    void mute(const std::string& leg_id, bool muted) override;
    void hold(const std::string& leg_id, bool held) override;

    void create_conference(const std::string& name) override;
    void join_conference(const std::string& leg_id, const std::string& name) override;
    void leave_conference(const std::string& leg_id) override;

    void register_transport() override;
    bool is_registered() const override;

    void set_event_listener(EventListener listener) override;

    void on_registration(bool registered);
    void on_incoming(int call_id);
    void on_leg_confirmed(const std::string& leg_id);
    void on_leg_disconnected(const std::string& leg_id,
                             int status_code,
                             bool confirmed,
                             std::int64_t duration_sec);
    void on_media_ready(const std::string& leg_id);

private:
    struct Conference {
        std::set<std::string> members;
        std::unique_ptr<HoldPlayer> music;
    };

    int handle_events();
    void init_hold_music();
    std::string to_sip_uri(const std::string& destination) const;
    std::shared_ptr<SipLeg> require_leg_locked(const std::string& leg_id);
    void link_locked(const std::string& leg_id, Conference& conference);
    void unlink_locked(const std::string& leg_id);
    void refresh_music_locked(Conference& conference);
    void emit(const ProviderEvent& event);

    template <typename Fn>
    void guarded(const char* what, const std::string& leg_id, Fn fn);

    const Config& config_;
    std::unique_ptr<pj::Endpoint> endpoint_;
    std::unique_ptr<SipAccount> account_;
    std::optional<std::filesystem::path> hold_music_;

    std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<SipLeg>> legs_;
    std::map<std::string, Conference> conferences_;
    std::unordered_map<std::string, std::string> leg_conference_;

    std::mutex listener_mutex_;
    EventListener listener_;
};

}
