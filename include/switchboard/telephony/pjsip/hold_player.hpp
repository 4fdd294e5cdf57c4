#pragma once

#include <filesystem>
#include <memory>

#include <pjsua2.hpp>

namespace switchboard::pjsip {

// Looping music source for a conference whose caller waits alone.
class HoldPlayer {
public:
    explicit HoldPlayer(const std::filesystem::path& filename);
    ~HoldPlayer();

    HoldPlayer(const HoldPlayer&) = delete;
    HoldPlayer& operator=(const HoldPlayer&) = delete;

    void attach(pj::AudioMedia& sink);
    void detach(pj::AudioMedia& sink);

private:
    std::unique_ptr<pj::AudioMediaPlayer> player_;
};

}
