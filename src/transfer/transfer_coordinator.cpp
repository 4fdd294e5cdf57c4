#include "switchboard/transfer/transfer_coordinator.hpp"

#include "switchboard/errors.hpp"
#include "switchboard/logging.hpp"

#include <utility>

namespace switchboard {

TransferCoordinator::TransferCoordinator(std::shared_ptr<SessionRecordStore> store,
                                         std::shared_ptr<TelephonyProvider> provider,
                                         AgentAddressFn agent_address,
                                         TransferOptions options)
    : store_(std::move(store)),
      provider_(std::move(provider)),
      agent_address_(std::move(agent_address)),
      options_(options) {
    if (options_.ring_timeout_ms <= 0) {
        throw InvalidValue("transfer ring timeout must be positive");
    }
}

PendingTransfer TransferCoordinator::start(const Session& session,
                                           const std::string& target_agent,
                                           TransferKind kind,
                                           const std::string& actor) {
    if (!state_machine::is_allowed(session.state, TransitionKind::BeginTransfer)) {
        throw StateConflict("cannot transfer session " + std::to_string(session.id) + " while " +
                            to_string(session.state));
    }

    const auto target_leg = provider_->ring(agent_address_(session.tenant_id, target_agent));
    const auto holding = hold_conference_name(session.tenant_id, session.id);
    if (kind == TransferKind::FromPark) {
        try {
            provider_->create_conference(holding);
            provider_->join_conference(session.provider_call_id, holding);
        } catch (const TransportError&) {
            best_effort("drop target leg", [&] { provider_->disconnect(target_leg); });
            throw;
        }
    }

    NewTransfer request;
    request.session_id = session.id;
    request.target_agent = target_agent;
    request.kind = kind;
    request.target_leg_id = target_leg;
    request.ring_timeout_ms = options_.ring_timeout_ms;

    PendingTransfer transfer;
    try {
        transfer = store_->begin_transfer(request, actor);
    } catch (const SwitchboardError&) {
        best_effort("drop target leg", [&] { provider_->disconnect(target_leg); });
        if (kind == TransferKind::FromPark && session.conference_name) {
            best_effort("return caller to slot", [&] {
                provider_->join_conference(session.provider_call_id, *session.conference_name);
            });
        }
        throw;
    }
    if (kind == TransferKind::FromPark) {
        store_->set_conference(session.id, holding);
    }

    NewRinging ringing;
    ringing.tenant_id = session.tenant_id;
    ringing.target_agent = target_agent;
    ringing.caller_number = session.counterparty();
    ringing.caller_name =
        session.direction == Direction::Inbound ? session.from_name : session.to_name;
    ringing.caller_leg_id = session.provider_call_id;
    ringing.agent_leg_id = target_leg;
    ringing.ttl_ms = options_.ring_timeout_ms;
    store_->create_ringing(ringing);
    return transfer;
}

PendingTransfer TransferCoordinator::transfer_direct(SessionId id,
                                                     const std::string& target_agent,
                                                     const std::string& actor) {
    const auto session = store_->require(id);
    if (session.state == SessionState::Parked) {
        throw StateConflict("parked sessions transfer from their slot");
    }
    return start(session, target_agent, TransferKind::Direct, actor);
}

PendingTransfer TransferCoordinator::transfer_from_park(const std::string& tenant_id,
                                                        int slot,
                                                        const std::string& target_agent,
                                                        const std::string& actor) {
    const auto slot_record = store_->get_slot(tenant_id, slot);
    if (!slot_record || !slot_record->occupied || !slot_record->session_id) {
        throw StateConflict("parking slot " + std::to_string(slot) + " is empty");
    }
    return start(store_->require(*slot_record->session_id), target_agent, TransferKind::FromPark,
                 actor);
}

TransferResolution TransferCoordinator::accept(TransferId id, const std::string& agent_id) {
    const auto transfer = store_->get_transfer(id);
    if (!transfer) {
        throw NotFound("transfer " + std::to_string(id) + " not found");
    }
    if (transfer->status != TransferStatus::Ringing) {
        throw StateConflict("Transfer is no longer pending");
    }
    if (transfer->target_agent != agent_id) {
        throw StateConflict("only the transfer target can accept");
    }
    if (transfer->is_expired(store_->now())) {
        time_out(id);
        throw StateConflict("Transfer is no longer pending");
    }

    const auto session = store_->get_by_id(transfer->session_id);
    if (!session) {
        time_out(id);
        throw StateConflict("Transfer is no longer pending");
    }

    const auto bridge = bridge_conference_name(session->tenant_id, session->id);
    provider_->create_conference(bridge);
    provider_->join_conference(session->provider_call_id, bridge);
    if (transfer->target_leg_id) {
        try {
            provider_->join_conference(*transfer->target_leg_id, bridge);
        } catch (const TransportError&) {
            if (session->conference_name) {
                best_effort("return caller", [&] {
                    provider_->join_conference(session->provider_call_id, *session->conference_name);
                });
            }
            throw;
        }
    }

    auto result = store_->resolve_transfer(id, TransferStatus::Accepted, agent_id);
    if (result.transfer.status != TransferStatus::Accepted) {
        settle_unaccepted(*transfer, result);
        throw StateConflict("Transfer is no longer pending");
    }

    if (transfer->kind == TransferKind::Direct && session->agent_leg_id &&
        session->agent_leg_id != transfer->target_leg_id) {
        best_effort("release source agent leg",
                    [&] { provider_->disconnect(*session->agent_leg_id); });
    }
    if (result.session) {
        result.session = store_->set_conference(result.session->id, bridge);
    }
    logging::info("Transfer accepted",
                  {kv("transfer", id), kv("session", transfer->session_id), kv("agent", agent_id)});
    return result;
}

TransferResolution TransferCoordinator::decline(TransferId id, const std::string& agent_id) {
    const auto transfer = store_->get_transfer(id);
    if (!transfer) {
        throw NotFound("transfer " + std::to_string(id) + " not found");
    }
    if (transfer->target_agent != agent_id) {
        throw StateConflict("only the transfer target can decline");
    }
    auto result = store_->resolve_transfer(id, TransferStatus::Declined, agent_id);
    settle_unaccepted(*transfer, result);
    return result;
}

TransferResolution TransferCoordinator::time_out(TransferId id) {
    const auto transfer = store_->get_transfer(id);
    if (!transfer) {
        throw NotFound("transfer " + std::to_string(id) + " not found");
    }
    auto result = store_->resolve_transfer(id, TransferStatus::Timeout, std::nullopt);
    settle_unaccepted(*transfer, result);
    return result;
}

void TransferCoordinator::settle_unaccepted(const PendingTransfer& before,
                                            const TransferResolution& result) {
    if (before.target_leg_id) {
        best_effort("hang up transfer target",
                    [&] { provider_->disconnect(*before.target_leg_id); });
    }
    if (!result.session) {
        return;
    }
    const auto& session = *result.session;
    if (session.state == SessionState::Parked && session.conference_name) {
        best_effort("return caller to slot", [&] {
            provider_->create_conference(*session.conference_name);
            provider_->join_conference(session.provider_call_id, *session.conference_name);
        });
    } else if (session.state == SessionState::OnHold && before.kind == TransferKind::Direct) {
        const auto holding = hold_conference_name(session.tenant_id, session.id);
        best_effort("hold returned caller", [&] {
            provider_->create_conference(holding);
            provider_->join_conference(session.provider_call_id, holding);
        });
    }
}

std::vector<TransferResolution> TransferCoordinator::expire_due() {
    std::vector<TransferResolution> resolved;
    for (const auto& transfer : store_->list_expired_transfers()) {
        try {
            resolved.push_back(time_out(transfer.id));
        } catch (const StateConflict& ex) {
            logging::debug("Transfer resolved before timeout",
                           {kv("transfer", transfer.id), kv("error", ex.what())});
        }
    }
    return resolved;
}

std::vector<PendingTransfer> TransferCoordinator::pending_for(const std::string& tenant_id,
                                                              const std::string& agent_id) {
    std::vector<PendingTransfer> live;
    const auto now = store_->now();
    for (const auto& transfer : store_->list_ringing_transfers_for(tenant_id, agent_id)) {
        if (!transfer.is_expired(now)) {
            live.push_back(transfer);
            continue;
        }
        try {
            time_out(transfer.id);
        } catch (const StateConflict& ex) {
            logging::debug("Transfer resolved before lazy timeout",
                           {kv("transfer", transfer.id), kv("error", ex.what())});
        }
    }
    return live;
}

}
