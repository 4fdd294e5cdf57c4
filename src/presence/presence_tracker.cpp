#include "switchboard/presence/presence_tracker.hpp"

#include "switchboard/errors.hpp"
#include "switchboard/logging.hpp"
#include "switchboard/model/json.hpp"

namespace switchboard {

using store::Statement;
using store::Transaction;

namespace {

constexpr const char* kSchema = R"(
CREATE TABLE IF NOT EXISTS agent_presence (
  tenant_id TEXT NOT NULL,
  agent_id TEXT NOT NULL,
  status TEXT NOT NULL CHECK (status IN ('available', 'busy', 'on_call', 'on_break', 'offline')),
  status_message TEXT,
  last_heartbeat INTEGER NOT NULL DEFAULT 0,
  current_session INTEGER,
  PRIMARY KEY (tenant_id, agent_id)
);

CREATE TABLE IF NOT EXISTS agent_daily_metrics (
  tenant_id TEXT NOT NULL,
  agent_id TEXT NOT NULL,
  date TEXT NOT NULL,
  calls_accepted INTEGER NOT NULL DEFAULT 0,
  inbound_accepted INTEGER NOT NULL DEFAULT 0,
  outbound_made INTEGER NOT NULL DEFAULT 0,
  talk_time_sec INTEGER NOT NULL DEFAULT 0,
  PRIMARY KEY (tenant_id, agent_id, date)
);
)";

constexpr const char* kPresenceColumns =
    "tenant_id, agent_id, status, status_message, last_heartbeat, current_session";

AgentPresence row_to_presence(const Statement& row) {
    AgentPresence presence;
    presence.tenant_id = row.column_text(0);
    presence.agent_id = row.column_text(1);
    presence.status = parse_agent_status(row.column_text(2));
    presence.status_message = row.column_optional_text(3);
    presence.last_heartbeat = row.column_int64(4);
    presence.current_session = row.column_optional_int64(5);
    return presence;
}

std::optional<AgentPresence> load(store::Database& db,
                                  const std::string& tenant_id,
                                  const std::string& agent_id) {
    Statement stmt(db, std::string("SELECT ") + kPresenceColumns +
                           " FROM agent_presence WHERE tenant_id = ?1 AND agent_id = ?2");
    stmt.bind(1, tenant_id).bind(2, agent_id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return row_to_presence(stmt);
}

}

PresenceTracker::PresenceTracker(std::shared_ptr<store::Database> db,
                                 std::shared_ptr<ChangeFeed> feed,
                                 std::int64_t stale_after_ms,
                                 utils::Clock clock)
    : db_(std::move(db)),
      feed_(std::move(feed)),
      stale_after_ms_(stale_after_ms),
      clock_(std::move(clock)) {
    if (!db_) {
        throw StoreError("presence tracker requires a database");
    }
    auto lock = db_->lock();
    db_->exec(kSchema);
}

AgentPresence PresenceTracker::apply_staleness(AgentPresence presence) const {
    if (presence.status != AgentStatus::Offline &&
        clock_() - presence.last_heartbeat > stale_after_ms_) {
        presence.status = AgentStatus::Offline;
    }
    return presence;
}

void PresenceTracker::publish(const AgentPresence& presence) {
    if (!feed_) {
        return;
    }
    ChangeEvent event;
    event.tenant_id = presence.tenant_id;
    event.entity = "presence";
    event.op = "upsert";
    event.record = presence;
    feed_->publish(event);
}

AgentPresence PresenceTracker::upsert(const std::string& tenant_id,
                                      const std::string& agent_id,
                                      std::optional<AgentStatus> status,
                                      bool touch_heartbeat,
                                      bool set_session,
                                      std::optional<SessionId> session_id,
                                      std::optional<std::string> message) {
    if (tenant_id.empty() || agent_id.empty()) {
        throw InvalidValue("tenant and agent are required");
    }
    AgentPresence presence;
    {
        auto lock = db_->lock();
        Transaction txn(*db_);
        const auto now = clock_();
        auto current = load(*db_, tenant_id, agent_id);
        if (!current) {
            presence.tenant_id = tenant_id;
            presence.agent_id = agent_id;
            presence.status = AgentStatus::Available;
            presence.last_heartbeat = now;
        } else {
            presence = *current;
        }
        if (status) {
            presence.status = *status;
        }
        if (touch_heartbeat) {
            presence.last_heartbeat = now;
        }
        if (set_session) {
            presence.current_session = session_id;
        }
        if (message) {
            presence.status_message = message;
        }
        Statement stmt(*db_,
                       "INSERT OR REPLACE INTO agent_presence (tenant_id, agent_id, status, "
                       "status_message, last_heartbeat, current_session) "
                       "VALUES (?1, ?2, ?3, ?4, ?5, ?6)");
        stmt.bind(1, presence.tenant_id)
            .bind(2, presence.agent_id)
            .bind(3, to_string(presence.status))
            .bind(4, presence.status_message)
            .bind(5, presence.last_heartbeat)
            .bind(6, presence.current_session);
        stmt.run();
        txn.commit();
    }
    publish(presence);
    return presence;
}

AgentPresence PresenceTracker::heartbeat(const std::string& tenant_id,
                                         const std::string& agent_id) {
    std::optional<AgentStatus> status;
    {
        auto lock = db_->lock();
        auto current = load(*db_, tenant_id, agent_id);
        if (current && current->status == AgentStatus::Offline) {
            status = AgentStatus::Available;
        }
    }
    return upsert(tenant_id, agent_id, status, true, false, std::nullopt, std::nullopt);
}

AgentPresence PresenceTracker::set_status(const std::string& tenant_id,
                                          const std::string& agent_id,
                                          AgentStatus status,
                                          std::optional<std::string> message) {
    logging::info("Agent status set",
                  {kv("tenant", tenant_id), kv("agent", agent_id), kv("status", to_string(status))});
    return upsert(tenant_id, agent_id, status, true, false, std::nullopt, std::move(message));
}

AgentPresence PresenceTracker::go_offline(const std::string& tenant_id,
                                          const std::string& agent_id) {
    return upsert(tenant_id, agent_id, AgentStatus::Offline, false, true, std::nullopt,
                  std::nullopt);
}

std::optional<AgentPresence> PresenceTracker::get(const std::string& tenant_id,
                                                  const std::string& agent_id) {
    auto lock = db_->lock();
    auto presence = load(*db_, tenant_id, agent_id);
    if (!presence) {
        return std::nullopt;
    }
    return apply_staleness(*presence);
}

std::vector<AgentPresence> PresenceTracker::list(const std::string& tenant_id) {
    auto lock = db_->lock();
    Statement stmt(*db_, std::string("SELECT ") + kPresenceColumns +
                             " FROM agent_presence WHERE tenant_id = ?1 ORDER BY agent_id");
    stmt.bind(1, tenant_id);
    std::vector<AgentPresence> result;
    while (stmt.step()) {
        result.push_back(apply_staleness(row_to_presence(stmt)));
    }
    return result;
}

std::optional<AgentDailyMetrics> PresenceTracker::daily_metrics(const std::string& tenant_id,
                                                                const std::string& agent_id,
                                                                const std::string& date) {
    auto lock = db_->lock();
    Statement stmt(*db_,
                   "SELECT calls_accepted, inbound_accepted, outbound_made, talk_time_sec "
                   "FROM agent_daily_metrics WHERE tenant_id = ?1 AND agent_id = ?2 AND date = ?3");
    stmt.bind(1, tenant_id).bind(2, agent_id).bind(3, date);
    if (!stmt.step()) {
        return std::nullopt;
    }
    AgentDailyMetrics metrics;
    metrics.tenant_id = tenant_id;
    metrics.agent_id = agent_id;
    metrics.date = date;
    metrics.calls_accepted = stmt.column_int(0);
    metrics.inbound_accepted = stmt.column_int(1);
    metrics.outbound_made = stmt.column_int(2);
    metrics.talk_time_sec = stmt.column_int64(3);
    return metrics;
}

void PresenceTracker::bump_metrics(const std::string& tenant_id,
                                   const std::string& agent_id,
                                   int accepted,
                                   int inbound,
                                   int outbound,
                                   std::int64_t talk_seconds) {
    const auto date = utils::utc_date(clock_());
    auto lock = db_->lock();
    Transaction txn(*db_);
    Statement create(*db_,
                     "INSERT OR IGNORE INTO agent_daily_metrics (tenant_id, agent_id, date) "
                     "VALUES (?1, ?2, ?3)");
    create.bind(1, tenant_id).bind(2, agent_id).bind(3, date);
    create.run();
    Statement update(*db_,
                     "UPDATE agent_daily_metrics SET calls_accepted = calls_accepted + ?4, "
                     "inbound_accepted = inbound_accepted + ?5, "
                     "outbound_made = outbound_made + ?6, talk_time_sec = talk_time_sec + ?7 "
                     "WHERE tenant_id = ?1 AND agent_id = ?2 AND date = ?3");
    update.bind(1, tenant_id)
        .bind(2, agent_id)
        .bind(3, date)
        .bind(4, accepted)
        .bind(5, inbound)
        .bind(6, outbound)
        .bind(7, talk_seconds);
    update.run();
    txn.commit();
}

void PresenceTracker::agent_engaged(const std::string& tenant_id,
                                    const std::string& agent_id,
                                    SessionId session_id) {
    upsert(tenant_id, agent_id, AgentStatus::OnCall, false, true, session_id, std::nullopt);
}

void PresenceTracker::agent_released(const std::string& tenant_id, const std::string& agent_id) {
    upsert(tenant_id, agent_id, AgentStatus::Available, false, true, std::nullopt, std::nullopt);
}

void PresenceTracker::call_accepted(const std::string& tenant_id,
                                    const std::string& agent_id,
                                    Direction direction) {
    bump_metrics(tenant_id, agent_id, 1, direction == Direction::Inbound ? 1 : 0, 0, 0);
}

void PresenceTracker::outbound_dialed(const std::string& tenant_id, const std::string& agent_id) {
    bump_metrics(tenant_id, agent_id, 0, 0, 1, 0);
}

void PresenceTracker::talk_time(const std::string& tenant_id,
                                const std::string& agent_id,
                                std::int64_t seconds) {
    bump_metrics(tenant_id, agent_id, 0, 0, 0, seconds);
}

}
