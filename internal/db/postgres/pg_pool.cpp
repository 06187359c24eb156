#include "pg_pool.hpp"

#include "internal/db/sql/schema.hpp"

namespace handoff::db::postgres {

namespace {

std::string Transfers(const std::string& tail) {
  return std::string("SELECT ") + sql::kTransferColumns + " FROM agent_transfers WHERE " + tail;
}

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });
    }
  }
}

void PgPool::Bootstrap() {
  // statements are prepared against the tables, so create them on a
  // connection that is not pooled
  pqxx::connection conn(conninfo_);
  pqxx::work       tx(conn);
  for (const char* ddl : sql::kPostgresSchema) {
    tx.exec(ddl);
  }
  tx.commit();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  // users / teams
  conn.prepare("insert_user",
               "INSERT INTO users(id,organization_id,name,role,is_active,is_available) VALUES($1,$2,$3,$4,$5,$6)");
  conn.prepare("get_user",
               "SELECT id,organization_id,name,role,is_active,is_available FROM users"
               " WHERE id=$1 AND organization_id=$2");
  conn.prepare("insert_team",
               "INSERT INTO teams(id,organization_id,name,assignment_strategy,is_active) VALUES($1,$2,$3,$4,$5)");
  conn.prepare("get_team",
               "SELECT id,organization_id,name,assignment_strategy,is_active FROM teams"
               " WHERE id=$1 AND organization_id=$2");
  conn.prepare("list_teams",
               "SELECT id,organization_id,name,assignment_strategy,is_active FROM teams"
               " WHERE organization_id=$1 ORDER BY name, id");
  conn.prepare("insert_team_member",
               "INSERT INTO team_members(team_id,user_id,role,last_assigned_at) VALUES($1,$2,$3,$4)");
  conn.prepare("list_team_members",
               "SELECT team_id,user_id,role,last_assigned_at FROM team_members WHERE team_id=$1 ORDER BY seq");
  conn.prepare("list_user_team_ids",
               "SELECT m.team_id FROM team_members m JOIN teams tm ON tm.id = m.team_id"
               " WHERE m.user_id=$1 AND tm.organization_id=$2 ORDER BY m.seq");
  conn.prepare("touch_member_assignment",
               "UPDATE team_members SET last_assigned_at=$3 WHERE team_id=$1 AND user_id=$2");

  // contacts / chatbot sessions
  conn.prepare("insert_contact", std::string("INSERT INTO contacts(") + sql::kContactColumns +
                                     ") VALUES($1,$2,$3,$4,$5,$6,$7,$8)");
  conn.prepare("get_contact",
               std::string("SELECT ") + sql::kContactColumns + " FROM contacts WHERE id=$1 AND organization_id=$2");
  conn.prepare("set_contact_assignee", "UPDATE contacts SET assigned_user_id=$3 WHERE id=$1 AND organization_id=$2");
  conn.prepare("set_chatbot_tracking",
               "UPDATE contacts SET chatbot_last_message_at=$3, chatbot_reminder_sent=$4"
               " WHERE id=$1 AND organization_id=$2");
  conn.prepare("mark_chatbot_reminder_sent",
               "UPDATE contacts SET chatbot_reminder_sent=TRUE"
               " WHERE id=$1 AND organization_id=$2 AND chatbot_last_message_at=$3");
  conn.prepare("list_inactivity_candidates",
               std::string("SELECT ") + sql::kContactColumns +
                   " FROM contacts c WHERE c.organization_id=$1 AND c.chatbot_last_message_at IS NOT NULL"
                   " AND NOT EXISTS (SELECT 1 FROM agent_transfers tr WHERE tr.organization_id = c.organization_id"
                   " AND tr.contact_id = c.id AND tr.status = 'active') ORDER BY c.chatbot_last_message_at, c.id");
  conn.prepare("insert_chatbot_session",
               "INSERT INTO chatbot_sessions(id,organization_id,contact_id,status,started_at,completed_at)"
               " VALUES($1,$2,$3,$4,$5,$6)");
  conn.prepare("list_chatbot_sessions",
               "SELECT id,organization_id,contact_id,status,started_at,completed_at FROM chatbot_sessions"
               " WHERE organization_id=$1 AND contact_id=$2 ORDER BY seq");
  conn.prepare("cancel_chatbot_sessions",
               "UPDATE chatbot_sessions SET status='cancelled', completed_at=$3"
               " WHERE organization_id=$1 AND contact_id=$2 AND status='active'");

  // settings
  conn.prepare("upsert_settings",
               "INSERT INTO chatbot_settings(organization_id,account,assign_to_same_agent,allow_agent_queue_pickup,"
               "mask_phone_numbers,sla_enabled,sla,client_inactivity,business_hours,updated_at)"
               " VALUES($1,$2,$3,$4,$5,$6,$7::jsonb,$8::jsonb,$9::jsonb,$10)"
               " ON CONFLICT(organization_id,account) DO UPDATE SET"
               " assign_to_same_agent=excluded.assign_to_same_agent,"
               " allow_agent_queue_pickup=excluded.allow_agent_queue_pickup,"
               " mask_phone_numbers=excluded.mask_phone_numbers, sla_enabled=excluded.sla_enabled,"
               " sla=excluded.sla, client_inactivity=excluded.client_inactivity,"
               " business_hours=excluded.business_hours, updated_at=excluded.updated_at");
  conn.prepare("get_settings", std::string("SELECT ") + sql::kSettingsColumns +
                                   " FROM chatbot_settings WHERE organization_id=$1 AND account=$2");
  conn.prepare("list_sla_settings", std::string("SELECT ") + sql::kSettingsColumns +
                                        " FROM chatbot_settings WHERE sla_enabled ORDER BY organization_id, account");

  // transfers
  conn.prepare("insert_transfer", std::string("INSERT INTO agent_transfers(") + sql::kTransferColumns +
                                      ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18,"
                                      "$19,$20,$21,$22,$23,$24)");
  conn.prepare("get_transfer", Transfers("id=$1 AND organization_id=$2"));
  conn.prepare("find_active_transfer", Transfers("organization_id=$1 AND contact_id=$2 AND status='active' LIMIT 1"));
  conn.prepare("list_transfers", Transfers("organization_id=$1 ORDER BY transferred_at, seq"));
  conn.prepare("list_transfers_by_status", Transfers("organization_id=$1 AND status=$2 ORDER BY transferred_at, seq"));
  conn.prepare("count_agent_active",
               "SELECT COUNT(*) FROM agent_transfers WHERE organization_id=$1 AND agent_id=$2 AND status='active'");
  conn.prepare("update_active_transfer",
               "UPDATE agent_transfers SET organization_id=$2,contact_id=$3,account=$4,phone_number=$5,status=$6,"
               "source=$7,agent_id=$8,team_id=$9,transferred_by=$10,notes=$11,transferred_at=$12,resumed_at=$13,"
               "resumed_by=$14,sla_response_deadline=$15,sla_resolution_deadline=$16,sla_escalation_at=$17,"
               "expires_at=$18,sla_breached=$19,sla_breached_at=$20,escalation_level=$21,escalated_at=$22,"
               "picked_up_at=$23,first_response_at=$24 WHERE id=$1 AND status='active'");

  // lock the first eligible row, skip rows other transactions hold
  conn.prepare("lock_next_queued",
               Transfers("organization_id=$1 AND status='active' AND agent_id IS NULL"
                         " AND ($2 OR ($3 AND team_id IS NULL) OR team_id = ANY($4::text[]))"
                         " ORDER BY transferred_at, seq LIMIT 1 FOR UPDATE SKIP LOCKED"));
  conn.prepare("claim_transfer",
               "UPDATE agent_transfers SET agent_id=$2, transferred_by=COALESCE(transferred_by, $2)"
               " WHERE id=$1 AND status='active' AND agent_id IS NULL");
  conn.prepare("set_first_response",
               "UPDATE agent_transfers SET first_response_at=$3 WHERE id=$1 AND organization_id=$2"
               " AND first_response_at IS NULL");

  // scheduler
  conn.prepare("list_expired",
               Transfers("organization_id=$1 AND status='active' AND expires_at IS NOT NULL AND expires_at < $2"
                         " ORDER BY transferred_at, seq"));
  conn.prepare("expire_transfer",
               "UPDATE agent_transfers SET status='expired', resumed_at=$2, notes=$3 WHERE id=$1 AND status='active'");
  conn.prepare("list_escalation_due",
               Transfers("organization_id=$1 AND status='active' AND sla_escalation_at IS NOT NULL"
                         " AND sla_escalation_at < $2 AND escalation_level < $3 ORDER BY transferred_at, seq"));
  conn.prepare("escalate_transfer",
               "UPDATE agent_transfers SET escalation_level=escalation_level+1, escalated_at=$3,"
               " sla_breached_at=CASE WHEN $4 AND NOT sla_breached THEN $3 ELSE sla_breached_at END,"
               " sla_breached=(sla_breached OR $4)"
               " WHERE id=$1 AND status='active' AND escalation_level=$2 AND escalation_level < $5");
  conn.prepare("mark_unassigned_breached",
               "UPDATE agent_transfers SET sla_breached=TRUE, sla_breached_at=$2"
               " WHERE organization_id=$1 AND status='active' AND NOT sla_breached"
               " AND sla_response_deadline IS NOT NULL AND sla_response_deadline < $2 AND agent_id IS NULL");

  // outbox
  conn.prepare("insert_outbound",
               "INSERT INTO outbound_messages(organization_id,account,contact_id,phone_number,content,created_at)"
               " VALUES($1,$2,$3,$4,$5,$6) RETURNING id");
  conn.prepare("list_outbound",
               "SELECT id,organization_id,account,contact_id,phone_number,content,created_at"
               " FROM outbound_messages WHERE organization_id=$1 ORDER BY id");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace handoff::db::postgres
