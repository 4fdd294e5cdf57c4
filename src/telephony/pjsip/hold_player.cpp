#include "switchboard/telephony/pjsip/hold_player.hpp"

#include "switchboard/errors.hpp"
#include "switchboard/logging.hpp"

namespace switchboard::pjsip {

namespace {

class LoopingPlayer : public pj::AudioMediaPlayer {
public:
    void onEof2() override {
        logging::trace("Hold music looped");
    }
};

}

HoldPlayer::HoldPlayer(const std::filesystem::path& filename)
    : player_(std::make_unique<LoopingPlayer>()) {
    try {
        player_->createPlayer(filename.string(), 0);
    } catch (const pj::Error& err) {
        throw TransportError("Cannot open hold music " + filename.string() + ": " + err.reason);
    }
}

HoldPlayer::~HoldPlayer() = default;

void HoldPlayer::attach(pj::AudioMedia& sink) {
    try {
        player_->startTransmit(sink);
    } catch (const pj::Error& err) {
        logging::warn("Hold music attach failed", {kv("reason", err.reason)});
    }
}

void HoldPlayer::detach(pj::AudioMedia& sink) {
    try {
        player_->stopTransmit(sink);
    } catch (const pj::Error& err) {
        logging::debug("Hold music detach failed", {kv("reason", err.reason)});
    }
}

}
