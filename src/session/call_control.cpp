#include "switchboard/session/call_control.hpp"

#include "switchboard/errors.hpp"
#include "switchboard/logging.hpp"

#include <utility>

namespace switchboard {

namespace {

const char* terminal_status(const ProviderEvent& event) {
    switch (event.type) {
    case LegEventType::Cancelled:
        return "canceled";
    case LegEventType::Rejected:
        return "busy";
    default:
        return "completed";
    }
}

}

CallControl::CallControl(std::shared_ptr<SessionRecordStore> store,
                         std::shared_ptr<TelephonyProvider> provider,
                         AgentAddressFn agent_address)
    : store_(std::move(store)),
      provider_(std::move(provider)),
      agent_address_(std::move(agent_address)) {}

Session CallControl::answer(SessionId id, const std::string& agent_id) {
    const auto session = store_->require(id);
    if (!state_machine::is_allowed(session.state, TransitionKind::Answer)) {
        throw StateConflict("session " + std::to_string(id) + " is already " +
                            to_string(session.state));
    }

    const auto bridge = bridge_conference_name(session.tenant_id, session.id);
    const auto agent_leg = provider_->ring(agent_address_(session.tenant_id, agent_id));
    try {
        if (session.direction == Direction::Inbound) {
            provider_->accept(session.provider_call_id);
        }
        provider_->create_conference(bridge);
        provider_->join_conference(session.provider_call_id, bridge);
        provider_->join_conference(agent_leg, bridge);
    } catch (const TransportError&) {
        best_effort("drop agent leg", [&] { provider_->disconnect(agent_leg); });
        throw;
    }

    Session answered;
    try {
        answered = store_->apply_transition(id, Transition::answer(agent_id), agent_id);
    } catch (const SwitchboardError&) {
        best_effort("drop agent leg", [&] { provider_->disconnect(agent_leg); });
        throw;
    }
    store_->set_agent_leg(id, agent_leg);
    return store_->set_conference(id, bridge);
}

Session CallControl::hold(SessionId id, const std::string& actor) {
    const auto session = store_->require(id);
    if (!state_machine::is_allowed(session.state, TransitionKind::Hold)) {
        throw StateConflict("session " + std::to_string(id) + " cannot be held while " +
                            to_string(session.state));
    }
    provider_->hold(session.provider_call_id, true);
    try {
        return store_->apply_transition(id, Transition::hold(), actor);
    } catch (const SwitchboardError&) {
        best_effort("unhold caller", [&] { provider_->hold(session.provider_call_id, false); });
        throw;
    }
}

Session CallControl::resume(SessionId id, const std::string& agent_id) {
    const auto session = store_->require(id);
    if (!state_machine::is_allowed(session.state, TransitionKind::Resume)) {
        throw StateConflict("session " + std::to_string(id) + " is not on hold");
    }
    provider_->hold(session.provider_call_id, false);
    try {
        return store_->apply_transition(id, Transition::resume(agent_id), agent_id);
    } catch (const SwitchboardError&) {
        best_effort("rehold caller", [&] { provider_->hold(session.provider_call_id, true); });
        throw;
    }
}

Session CallControl::dial(const std::string& tenant_id,
                          const std::string& agent_id,
                          const std::string& from,
                          const std::string& destination,
                          std::optional<std::string> correlation_id) {
    const auto caller_leg = provider_->ring(destination);
    std::string agent_leg;
    try {
        agent_leg = provider_->ring(agent_address_(tenant_id, agent_id));
    } catch (const TransportError&) {
        best_effort("drop outbound leg", [&] { provider_->disconnect(caller_leg); });
        throw;
    }

    NewSession request;
    request.tenant_id = tenant_id;
    request.provider_call_id = caller_leg;
    request.from = from;
    request.to = destination;
    request.agent = agent_id;
    request.agent_leg_id = agent_leg;
    request.correlation_id = std::move(correlation_id);
    auto session = store_->create_outbound(request);

    const auto bridge = bridge_conference_name(tenant_id, session.id);
    try {
        provider_->create_conference(bridge);
        provider_->join_conference(caller_leg, bridge);
        provider_->join_conference(agent_leg, bridge);
    } catch (const TransportError& ex) {
        logging::error("Outbound bridge failed", {kv("session", session.id), kv("error", ex.what())});
        best_effort("drop outbound leg", [&] { provider_->disconnect(caller_leg); });
        best_effort("drop agent leg", [&] { provider_->disconnect(agent_leg); });
        store_->finalize(session.id, CallOutcome::Failed);
        throw;
    }
    return store_->set_conference(session.id, bridge);
}

std::optional<CallHistoryRecord> CallControl::end(SessionId id, const std::string& actor) {
    const auto session = store_->get_by_id(id);
    if (!session) {
        return std::nullopt;
    }
    best_effort("hang up caller", [&] { provider_->disconnect(session->provider_call_id); });
    if (session->agent_leg_id) {
        best_effort("hang up agent", [&] { provider_->disconnect(*session->agent_leg_id); });
    }
    logging::info("Session ended by agent", {kv("session", id), kv("actor", actor)});
    return store_->finalize(id);
}

void CallControl::handle_event(const ProviderEvent& event, const TenantResolverFn& tenant_for) {
    switch (event.type) {
    case LegEventType::Incoming: {
        NewSession request;
        request.tenant_id = tenant_for(event.local);
        request.provider_call_id = event.leg_id;
        request.from = event.remote;
        request.from_name = event.remote_name;
        request.to = event.local;
        store_->create_inbound(request);
        break;
    }
    case LegEventType::Accepted:
        store_->reconcile_provider_status(event.leg_id, "in-progress");
        break;
    case LegEventType::Disconnected:
    case LegEventType::Cancelled:
    case LegEventType::Rejected: {
        const auto session = store_->find_by_leg(event.leg_id);
        store_->reconcile_provider_status(
            event.leg_id, event.status ? *event.status : terminal_status(event), event.duration_sec);
        if (!session || store_->get_by_id(session->id)) {
            break;
        }
        // The session ended with this leg; drop whichever side is still up.
        if (session->provider_call_id != event.leg_id) {
            best_effort("hang up caller", [&] { provider_->disconnect(session->provider_call_id); });
        } else if (session->agent_leg_id) {
            best_effort("hang up agent", [&] { provider_->disconnect(*session->agent_leg_id); });
        }
        break;
    }
    }
}

}
