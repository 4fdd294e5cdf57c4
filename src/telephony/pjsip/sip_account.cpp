#include "switchboard/telephony/pjsip/sip_account.hpp"

#include <typeinfo>

#include "switchboard/logging.hpp"
#include "switchboard/telephony/pjsip/pjsip_provider.hpp"

namespace switchboard::pjsip {

SipAccount::SipAccount(PjsipProvider& provider) : provider_(provider) {}

void SipAccount::onRegState(pj::OnRegStateParam& prm) {
    try {
        const int status_code = static_cast<int>(prm.code);
        logging::info("SIP registration state",
                      {kv("status", status_code),
                       kv("reason", prm.reason)});
        registered_ = status_code / 100 == 2 && prm.expiration > 0;
        if (status_code / 100 == 5) {
            logging::error("SIP registration server error",
                           {kv("status", status_code),
                            kv("reason", prm.reason)});
        } else if (status_code == 408) {
            logging::warn("SIP registration timeout",
                          {kv("status", status_code),
                           kv("reason", prm.reason)});
        } else if (status_code == 200) {
            pj::PresenceStatus status;
            status.status = PJSUA_BUDDY_STATUS_ONLINE;
            status.note = "Ready to answer";
            setOnlineStatus(status);
            logging::info("SIP registration successful.");
        } else if (status_code != 0) {
            logging::warn("SIP registration failed",
                          {kv("status", status_code),
                           kv("reason", prm.reason)});
        }
        provider_.on_registration(registered_);
    } catch (const std::exception& ex) {
        logging::error("Exception in onRegState",
                       {kv("error_type", typeid(ex).name()),
                        kv("error", ex.what())});
    }
}

void SipAccount::onIncomingCall(pj::OnIncomingCallParam& iprm) {
    logging::info("Incoming call", {kv("call_id", iprm.callId)});
    try {
        provider_.on_incoming(iprm.callId);
    } catch (const pj::Error& err) {
        logging::error("pjsip error in onIncomingCall",
                       {kv("reason", err.reason),
                        kv("status", err.status),
                        kv("call_id", iprm.callId)});
    } catch (const std::exception& ex) {
        logging::error("Exception in onIncomingCall",
                       {kv("error_type", typeid(ex).name()),
                        kv("error", ex.what()),
                        kv("call_id", iprm.callId)});
    }
}

}
