#include "switchboard/client/store_session_sync.hpp"

#include <utility>

#include "switchboard/logging.hpp"

namespace switchboard {

StoreSessionSync::StoreSessionSync(std::shared_ptr<SessionRecordStore> store, AgentIdentity agent)
    : store_(std::move(store)),
      agent_(std::move(agent)) {}

void StoreSessionSync::claim(const ClientSessionHandle& handle) {
    const auto session = store_->find_by_leg(handle.leg_id);
    if (!session) {
        logging::debug("Answered leg has no session", {kv("leg", handle.leg_id)});
        return;
    }
    if (session->state == SessionState::Ringing) {
        store_->apply_transition(session->id, Transition::answer(agent_.agent_id), agent_.agent_id);
    }
    for (const auto& ringing : store_->list_ringing_for(agent_.tenant_id, agent_.agent_id)) {
        if (ringing.caller_leg_id == session->provider_call_id) {
            store_->resolve_ringing(ringing.id, RingingStatus::Accepted);
        }
    }
}

void StoreSessionSync::end(const ClientSessionHandle& handle) {
    store_->reconcile_provider_status(handle.leg_id, "completed");
}

void StoreSessionSync::begin_outbound(const ClientSessionHandle& handle) {
    NewSession request;
    request.tenant_id = agent_.tenant_id;
    request.provider_call_id = handle.leg_id;
    request.from = handle.from;
    request.to = handle.to;
    request.agent = agent_.agent_id;
    request.correlation_id = handle.correlation_id;
    store_->create_outbound(request);
}

}
