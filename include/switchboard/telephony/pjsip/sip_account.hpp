#pragma once

#include <atomic>

#include <pjsua2.hpp>

namespace switchboard::pjsip {

class PjsipProvider;

class SipAccount : public pj::Account {
public:
    explicit SipAccount(PjsipProvider& provider);

    void onRegState(pj::OnRegStateParam& prm) override;
    void onIncomingCall(pj::OnIncomingCallParam& iprm) override;

    bool registered() const { return registered_; }

private:
    PjsipProvider& provider_;
    std::atomic<bool> registered_{false};
};

}
