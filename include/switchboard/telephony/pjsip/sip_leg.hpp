#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>

#include <pjsua2.hpp>

#include "switchboard/model/types.hpp"

namespace switchboard::pjsip {

class PjsipProvider;

// One SIP dialog. The leg id is the dialog's Call-ID.
class SipLeg : public pj::Call {
public:
    SipLeg(PjsipProvider& provider,
           pj::Account& account,
           Direction direction,
           int call_id = PJSUA_INVALID_ID);

    const std::string& leg_id() const { return leg_id_; }
    Direction direction() const { return direction_; }
    bool confirmed() const { return confirmed_; }
    bool media_ready() const { return media_ready_; }

    std::string make_call(const std::string& to_uri);
    void answer(int status_code);
    void hangup(int status_code);
    void set_hold(bool held);
    void set_muted(bool muted);
    // Conference port of the active audio stream. Throws pj::Error when media is not up.
    pj::AudioMedia audio();

    void onCallState(pj::OnCallStateParam& prm) override;
    void onCallMediaState(pj::OnCallMediaStateParam& prm) override;

private:
    PjsipProvider& provider_;
    Direction direction_;
    std::string leg_id_;
    std::atomic<bool> confirmed_{false};
    std::atomic<bool> media_ready_{false};
};

// Provider status vocabulary for a final SIP status code.
std::string status_for_code(int code, bool confirmed);

}
