#include "switchboard/telephony/pjsip/pjsip_provider.hpp"

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>
#include <vector>

#include "switchboard/errors.hpp"
#include "switchboard/logging.hpp"
#include "switchboard/telephony/pjsip/pj_thread.hpp"
#include "switchboard/utils/address.hpp"
#include "switchboard/utils/http.hpp"

namespace switchboard::pjsip {

namespace {

// Routes pjsip's own log lines into the process logger.
class PjLogWriter : public pj::LogWriter {
public:
    void write(const pj::LogEntry& entry) override {
        std::string message = entry.msg;
        while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
            message.pop_back();
        }
        logging::log(level_for(entry.level), message,
                     {kv("source", "pjsip"), kv("thread", entry.threadName)});
    }

private:
    static spdlog::level::level_enum level_for(int pj_level) {
        switch (pj_level) {
            case 0:
            case 1:
                return spdlog::level::err;
            case 2:
                return spdlog::level::warn;
            case 3:
                return spdlog::level::info;
            case 4:
                return spdlog::level::debug;
            default:
                return spdlog::level::trace;
        }
    }
};

}

PjsipProvider::PjsipProvider(const Config& config) : config_(config) {}

PjsipProvider::~PjsipProvider() {
    shutdown();
}

template <typename Fn>
void PjsipProvider::guarded(const char* what, const std::string& leg_id, Fn fn) {
    ensure_thread_registered("sb_provider");
    try {
        fn();
    } catch (const pj::Error& err) {
        logging::warn("pjsip operation failed",
                      {kv("op", what), kv("leg", leg_id), kv("reason", err.reason),
                       kv("status", err.status)});
        throw TransportError(std::string(what) + " failed for " + leg_id + ": " + err.reason);
    }
}

void PjsipProvider::init() {
    endpoint_ = std::make_unique<pj::Endpoint>();
    endpoint_->libCreate();

    pj::EpConfig ep_cfg;
    ep_cfg.uaConfig.threadCnt = 1;
    ep_cfg.uaConfig.mainThreadOnly = false;
    ep_cfg.uaConfig.maxCalls = static_cast<unsigned>(config_.sip_max_calls);
    ep_cfg.medConfig.threadCnt = 1;
    ep_cfg.medConfig.hasIoqueue = true;
    ep_cfg.medConfig.sndAutoCloseTime = -1;
    ep_cfg.logConfig.level = static_cast<unsigned>(config_.pjsip_log_level);
    ep_cfg.logConfig.consoleLevel = static_cast<unsigned>(config_.pjsip_log_level);
    ep_cfg.logConfig.decor = 0;
    // The endpoint takes ownership and deletes the writer in libDestroy.
    ep_cfg.logConfig.writer = new PjLogWriter();
    if (!config_.sip_stun_servers.empty()) {
        pj::StringVector stun_servers;
        for (const auto& stun_server : config_.sip_stun_servers) {
            stun_servers.push_back(stun_server);
        }
        ep_cfg.uaConfig.stunServer = stun_servers;
    }
    endpoint_->libInit(ep_cfg);

    for (const auto& codec : endpoint_->codecEnum2()) {
        logging::debug("Supported codec",
                       {kv("codec_id", codec.codecId), kv("priority", static_cast<int>(codec.priority))});
    }
    if (config_.sip_null_device) {
        endpoint_->audDevManager().setNullDev();
    }
    pj::TransportConfig sip_tp_config;
    sip_tp_config.port = static_cast<unsigned>(config_.sip_port);
    endpoint_->transportCreate(PJSIP_TRANSPORT_UDP, sip_tp_config);
    if (config_.sip_use_tcp) {
        endpoint_->transportCreate(PJSIP_TRANSPORT_TCP, sip_tp_config);
    }
    endpoint_->libStart();

    pj::AccountConfig account_cfg;
    if (config_.sip_caller_id) {
        account_cfg.idUri = "\"" + *config_.sip_caller_id + "\" <sip:" + config_.sip_user +
                            "@" + config_.sip_domain + ">";
    } else {
        account_cfg.idUri = "sip:" + config_.sip_user + "@" + config_.sip_domain;
    }
    account_cfg.regConfig.registrarUri =
        "sip:" + config_.sip_domain + (config_.sip_use_tcp ? ";transport=tcp" : "");
    pj::AuthCredInfo cred("digest", "*", config_.sip_login, 0, config_.sip_password);
    account_cfg.sipConfig.authCreds.push_back(cred);
    if (!config_.sip_proxy_servers.empty()) {
        pj::StringVector proxy_servers;
        for (const auto& proxy_server : config_.sip_proxy_servers) {
            proxy_servers.push_back(proxy_server);
        }
        account_cfg.sipConfig.proxies = proxy_servers;
    }

    account_ = std::make_unique<SipAccount>(*this);
    account_->create(account_cfg);
    init_hold_music();
    logging::info("SIP endpoint started",
                  {kv("user", config_.sip_user), kv("domain", config_.sip_domain),
                   kv("port", config_.sip_port)});
}

void PjsipProvider::init_hold_music() {
    if (!config_.hold_music_path) {
        return;
    }
    const auto& path = *config_.hold_music_path;
    if (!std::filesystem::exists(path) && config_.hold_music_url) {
        logging::info("Downloading hold music", {kv("url", *config_.hold_music_url)});
        if (!utils::download_file(*config_.hold_music_url, path)) {
            logging::warn("Hold music download failed; callers will wait in silence");
            return;
        }
    }
    if (!std::filesystem::exists(path)) {
        logging::warn("Hold music file missing", {kv("path", path.string())});
        return;
    }
    hold_music_ = path;
}

void PjsipProvider::run(const std::atomic<bool>& quitting) {
    int consecutive_empty_cycles = 0;
    while (!quitting) {
        const auto processed = handle_events();
        if (processed == 0) {
            ++consecutive_empty_cycles;
            const auto delay =
                consecutive_empty_cycles > 10 ? std::min(config_.async_delay * 2, 0.1)
                                              : config_.async_delay;
            std::this_thread::sleep_for(std::chrono::duration<double>(delay));
        } else {
            consecutive_empty_cycles = 0;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
}

int PjsipProvider::handle_events() {
    if (!endpoint_) {
        return 0;
    }
    try {
        const auto delay_ms = static_cast<unsigned>(config_.events_delay * 1000.0);
        return endpoint_->libHandleEvents(delay_ms);
    } catch (const pj::Error& err) {
        logging::error("PJSIP handle events error",
                       {kv("reason", err.reason), kv("status", err.status)});
    }
    return 0;
}

void PjsipProvider::shutdown() {
    ensure_thread_registered("sb_shutdown");
    std::vector<std::shared_ptr<SipLeg>> legs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& item : legs_) {
            legs.push_back(item.second);
        }
        legs_.clear();
        leg_conference_.clear();
        conferences_.clear();
    }
    for (auto& leg : legs) {
        try {
            leg->hangup(PJSIP_SC_SERVICE_UNAVAILABLE);
        } catch (const pj::Error& err) {
            logging::debug("Hangup during shutdown failed", {kv("reason", err.reason)});
        }
    }
    legs.clear();
    if (account_) {
        account_->shutdown();
        account_.reset();
    }
    if (endpoint_) {
        endpoint_->libDestroy();
        endpoint_.reset();
    }
}

std::string PjsipProvider::to_sip_uri(const std::string& destination) const {
    if (destination.rfind("sip:", 0) == 0 || destination.rfind("sips:", 0) == 0) {
        return destination;
    }
    const auto number = destination.rfind("tel:", 0) == 0 ? destination.substr(4) : destination;
    return "sip:" + utils::normalize_address(number) + "@" + config_.sip_domain +
           (config_.sip_use_tcp ? ";transport=tcp" : "");
}

std::shared_ptr<SipLeg> PjsipProvider::require_leg_locked(const std::string& leg_id) {
    const auto it = legs_.find(leg_id);
    if (it == legs_.end()) {
        throw TransportError("Unknown leg " + leg_id);
    }
    return it->second;
}

std::string PjsipProvider::ring(const std::string& destination) {
    if (!account_) {
        throw TransportError("SIP endpoint is not initialized");
    }
    const auto uri = to_sip_uri(destination);
    auto leg = std::make_shared<SipLeg>(*this, *account_, Direction::Outbound);
    std::string leg_id;
    guarded("ring", uri, [&] { leg_id = leg->make_call(uri); });
    {
        std::lock_guard<std::mutex> lock(mutex_);
        legs_[leg_id] = leg;
    }
    logging::info("Outbound leg ringing", {kv("leg", leg_id), kv("uri", uri)});
    return leg_id;
}

void PjsipProvider::accept(const std::string& leg_id) {
    std::shared_ptr<SipLeg> leg;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        leg = require_leg_locked(leg_id);
    }
    guarded("accept", leg_id, [&] { leg->answer(PJSIP_SC_OK); });
}

void PjsipProvider::reject(const std::string& leg_id) {
    std::shared_ptr<SipLeg> leg;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        leg = require_leg_locked(leg_id);
    }
    guarded("reject", leg_id, [&] { leg->hangup(PJSIP_SC_BUSY_HERE); });
}

void PjsipProvider::disconnect(const std::string& leg_id) {
    std::shared_ptr<SipLeg> leg;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        leg = require_leg_locked(leg_id);
        unlink_locked(leg_id);
    }
    guarded("disconnect", leg_id, [&] { leg->hangup(PJSIP_SC_OK); });
}

void PjsipProvider::mute(const std::string& leg_id, bool muted) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto leg = require_leg_locked(leg_id);
    guarded("mute", leg_id, [&] { leg->set_muted(muted); });
}

void PjsipProvider::hold(const std::string& leg_id, bool held) {
    std::shared_ptr<SipLeg> leg;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        leg = require_leg_locked(leg_id);
    }
    guarded("hold", leg_id, [&] { leg->set_hold(held); });
}

void PjsipProvider::create_conference(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (conferences_.emplace(name, Conference{}).second) {
        logging::debug("Conference created", {kv("conference", name)});
    }
}

void PjsipProvider::join_conference(const std::string& leg_id, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_leg_locked(leg_id);
    const auto it = conferences_.find(name);
    if (it == conferences_.end()) {
        throw TransportError("Unknown conference " + name);
    }
    const auto current = leg_conference_.find(leg_id);
    if (current != leg_conference_.end() && current->second == name) {
        return;
    }
    unlink_locked(leg_id);
    it->second.members.insert(leg_id);
    leg_conference_[leg_id] = name;
    link_locked(leg_id, it->second);
    refresh_music_locked(it->second);
    logging::debug("Leg joined conference", {kv("leg", leg_id), kv("conference", name)});
}

void PjsipProvider::leave_conference(const std::string& leg_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    unlink_locked(leg_id);
}

void PjsipProvider::link_locked(const std::string& leg_id, Conference& conference) {
    const auto leg = legs_.find(leg_id);
    if (leg == legs_.end() || !leg->second->media_ready()) {
        // Connected once media comes up.
        return;
    }
    guarded("link", leg_id, [&] {
        auto media = leg->second->audio();
        for (const auto& other_id : conference.members) {
            if (other_id == leg_id) {
                continue;
            }
            const auto other = legs_.find(other_id);
            if (other == legs_.end() || !other->second->media_ready()) {
                continue;
            }
            auto other_media = other->second->audio();
            media.startTransmit(other_media);
            other_media.startTransmit(media);
        }
    });
}

void PjsipProvider::unlink_locked(const std::string& leg_id) {
    const auto current = leg_conference_.find(leg_id);
    if (current == leg_conference_.end()) {
        return;
    }
    auto conference = conferences_.find(current->second);
    leg_conference_.erase(current);
    if (conference == conferences_.end()) {
        return;
    }
    conference->second.members.erase(leg_id);
    const auto leg = legs_.find(leg_id);
    if (leg != legs_.end() && leg->second->media_ready()) {
        try {
            auto media = leg->second->audio();
            if (conference->second.music) {
                conference->second.music->detach(media);
            }
            for (const auto& other_id : conference->second.members) {
                const auto other = legs_.find(other_id);
                if (other == legs_.end() || !other->second->media_ready()) {
                    continue;
                }
                auto other_media = other->second->audio();
                media.stopTransmit(other_media);
                other_media.stopTransmit(media);
            }
        } catch (const pj::Error& err) {
            logging::debug("Conference unlink failed", {kv("leg", leg_id), kv("reason", err.reason)});
        }
    }
    refresh_music_locked(conference->second);
}

void PjsipProvider::refresh_music_locked(Conference& conference) {
    if (!hold_music_) {
        return;
    }
    std::vector<std::shared_ptr<SipLeg>> ready;
    for (const auto& member : conference.members) {
        const auto leg = legs_.find(member);
        if (leg != legs_.end() && leg->second->media_ready()) {
            ready.push_back(leg->second);
        }
    }
    try {
        if (ready.size() == 1) {
            if (!conference.music) {
                conference.music = std::make_unique<HoldPlayer>(*hold_music_);
            }
            auto media = ready.front()->audio();
            conference.music->attach(media);
            return;
        }
        if (conference.music) {
            for (auto& leg : ready) {
                auto media = leg->audio();
                conference.music->detach(media);
            }
            conference.music.reset();
        }
    } catch (const pj::Error& err) {
        logging::warn("Hold music update failed", {kv("reason", err.reason)});
    } catch (const TransportError& ex) {
        logging::warn("Hold music unavailable", {kv("error", ex.what())});
    }
}

void PjsipProvider::register_transport() {
    if (!account_) {
        throw TransportError("SIP endpoint is not initialized");
    }
    guarded("register", config_.sip_user, [&] { account_->setRegistration(true); });
}

bool PjsipProvider::is_registered() const {
    return account_ && account_->registered();
}

void PjsipProvider::set_event_listener(EventListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

void PjsipProvider::emit(const ProviderEvent& event) {
    EventListener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = listener_;
    }
    if (!listener) {
        return;
    }
    try {
        listener(event);
    } catch (const std::exception& ex) {
        logging::error("Leg event handler failed",
                       {kv("leg", event.leg_id), kv("event", to_string(event.type)),
                        kv("error", ex.what())});
    }
}

void PjsipProvider::on_registration(bool registered) {
    logging::debug("Registration changed", {kv("registered", registered)});
}

void PjsipProvider::on_incoming(int call_id) {
    auto leg = std::make_shared<SipLeg>(*this, *account_, Direction::Inbound, call_id);
    const auto info = leg->getInfo();
    leg->answer(PJSIP_SC_RINGING);

    const auto remote = utils::parse_remote_uri(info.remoteUri);
    ProviderEvent event;
    event.type = LegEventType::Incoming;
    event.leg_id = leg->leg_id();
    event.direction = Direction::Inbound;
    event.remote = utils::normalize_address(remote.number);
    event.remote_name = remote.display_name;
    event.local = utils::normalize_address(utils::parse_remote_uri(info.localUri).number);

    post([this, leg, event]() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            legs_[leg->leg_id()] = leg;
        }
        emit(event);
    });
}

void PjsipProvider::on_leg_confirmed(const std::string& leg_id) {
    post([this, leg_id]() {
        ProviderEvent event;
        event.type = LegEventType::Accepted;
        event.leg_id = leg_id;
        event.status = "in-progress";
        emit(event);
    });
}

void PjsipProvider::on_leg_disconnected(const std::string& leg_id,
                                        int status_code,
                                        bool confirmed,
                                        std::int64_t duration_sec) {
    post([this, leg_id, status_code, confirmed, duration_sec]() {
        std::shared_ptr<SipLeg> leg;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            unlink_locked(leg_id);
            const auto it = legs_.find(leg_id);
            if (it != legs_.end()) {
                leg = it->second;
                legs_.erase(it);
            }
        }
        ProviderEvent event;
        event.leg_id = leg_id;
        event.direction = leg ? leg->direction() : Direction::Inbound;
        if (confirmed) {
            event.type = LegEventType::Disconnected;
        } else if (event.direction == Direction::Inbound) {
            event.type = LegEventType::Cancelled;
        } else {
            event.type = LegEventType::Rejected;
        }
        event.status = status_for_code(status_code, confirmed);
        event.duration_sec = duration_sec;
        logging::info("Leg ended",
                      {kv("leg", leg_id), kv("code", status_code), kv("status", *event.status)});
        emit(event);
    });
}

void PjsipProvider::on_media_ready(const std::string& leg_id) {
    post([this, leg_id]() {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto current = leg_conference_.find(leg_id);
        if (current == leg_conference_.end()) {
            return;
        }
        const auto conference = conferences_.find(current->second);
        if (conference == conferences_.end()) {
            return;
        }
        try {
            link_locked(leg_id, conference->second);
        } catch (const TransportError& ex) {
            logging::warn("Deferred conference link failed", {kv("leg", leg_id), kv("error", ex.what())});
        }
        refresh_music_locked(conference->second);
    });
}

}
