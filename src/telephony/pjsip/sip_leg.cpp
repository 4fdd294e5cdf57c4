#include "switchboard/telephony/pjsip/sip_leg.hpp"

#include "switchboard/logging.hpp"
#include "switchboard/telephony/pjsip/pjsip_provider.hpp"

namespace switchboard::pjsip {

std::string status_for_code(int code, bool confirmed) {
    if (confirmed) {
        return "completed";
    }
    if (code == PJSIP_SC_BUSY_HERE || code == PJSIP_SC_BUSY_EVERYWHERE ||
        code == PJSIP_SC_DECLINE) {
        return "busy";
    }
    if (code == PJSIP_SC_REQUEST_TERMINATED) {
        return "canceled";
    }
    if (code == PJSIP_SC_TEMPORARILY_UNAVAILABLE || code == PJSIP_SC_REQUEST_TIMEOUT) {
        return "no-answer";
    }
    return "failed";
}

SipLeg::SipLeg(PjsipProvider& provider, pj::Account& account, Direction direction, int call_id)
    : pj::Call(account, call_id),
      provider_(provider),
      direction_(direction) {
    if (call_id != PJSUA_INVALID_ID) {
        leg_id_ = getInfo().callIdString;
    }
}

std::string SipLeg::make_call(const std::string& to_uri) {
    pj::CallOpParam prm(true);
    pj::Call::makeCall(to_uri, prm);
    leg_id_ = getInfo().callIdString;
    return leg_id_;
}

void SipLeg::answer(int status_code) {
    pj::CallOpParam prm(true);
    prm.statusCode = static_cast<pjsip_status_code>(status_code);
    pj::Call::answer(prm);
}

void SipLeg::hangup(int status_code) {
    pj::CallOpParam prm(true);
    prm.statusCode = static_cast<pjsip_status_code>(status_code);
    pj::Call::hangup(prm);
}

void SipLeg::set_hold(bool held) {
    pj::CallOpParam prm(true);
    if (held) {
        pj::Call::setHold(prm);
        return;
    }
    prm.opt.flag = PJSUA_CALL_UNHOLD;
    pj::Call::reinvite(prm);
}

void SipLeg::set_muted(bool muted) {
    audio().adjustRxLevel(muted ? 0.0f : 1.0f);
}

pj::AudioMedia SipLeg::audio() {
    return getAudioMedia(-1);
}

void SipLeg::onCallState(pj::OnCallStateParam& prm) {
    (void)prm;
    try {
        const auto info = getInfo();
        logging::debug("Call state changed",
                       {kv("leg", leg_id_),
                        kv("uri", info.remoteUri),
                        kv("state", static_cast<int>(info.state)),
                        kv("state_text", info.stateText)});
        if (info.state == PJSIP_INV_STATE_CONFIRMED && !confirmed_) {
            confirmed_ = true;
            provider_.on_leg_confirmed(leg_id_);
        }
        if (info.state == PJSIP_INV_STATE_DISCONNECTED) {
            const int code = static_cast<int>(info.lastStatusCode);
            provider_.on_leg_disconnected(leg_id_, code, confirmed_,
                                          static_cast<std::int64_t>(info.connectDuration.sec));
        }
    } catch (const pj::Error& err) {
        logging::error("Call state handler pjsip error",
                       {kv("leg", leg_id_), kv("reason", err.reason), kv("status", err.status)});
    } catch (const std::exception& ex) {
        logging::error("Call state handler exception", {kv("leg", leg_id_), kv("error", ex.what())});
    }
}

void SipLeg::onCallMediaState(pj::OnCallMediaStateParam& prm) {
    (void)prm;
    try {
        const auto info = getInfo();
        bool active = false;
        for (const auto& media : info.media) {
            if (media.type == PJMEDIA_TYPE_AUDIO &&
                (media.status == PJSUA_CALL_MEDIA_ACTIVE ||
                 media.status == PJSUA_CALL_MEDIA_REMOTE_HOLD)) {
                active = true;
            }
        }
        logging::debug("Call media state changed", {kv("leg", leg_id_), kv("active", active)});
        if (active && !media_ready_) {
            media_ready_ = true;
            provider_.on_media_ready(leg_id_);
        }
    } catch (const pj::Error& err) {
        logging::error("Call media handler pjsip error",
                       {kv("leg", leg_id_), kv("reason", err.reason), kv("status", err.status)});
    } catch (const std::exception& ex) {
        logging::error("Call media handler exception", {kv("leg", leg_id_), kv("error", ex.what())});
    }
}

}
