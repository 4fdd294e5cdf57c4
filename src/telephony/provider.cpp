#include "switchboard/telephony/provider.hpp"

#include <exception>

#include "switchboard/logging.hpp"

namespace switchboard {

const char* to_string(LegEventType type) {
    switch (type) {
    case LegEventType::Incoming:
        return "incoming";
    case LegEventType::Accepted:
        return "accepted";
    case LegEventType::Disconnected:
        return "disconnected";
    case LegEventType::Cancelled:
        return "cancelled";
    case LegEventType::Rejected:
        return "rejected";
    }
    return "unknown";
}

std::string bridge_conference_name(const std::string& tenant_id, SessionId session_id) {
    return "call-" + tenant_id + "-" + std::to_string(session_id);
}

std::string hold_conference_name(const std::string& tenant_id, SessionId session_id) {
    return "hold-" + tenant_id + "-" + std::to_string(session_id);
}

void best_effort(const std::string& what, const std::function<void()>& action) {
    try {
        action();
    } catch (const std::exception& ex) {
        logging::warn("Provider cleanup failed", {kv("step", what), kv("error", ex.what())});
    }
}

}
