#pragma once

namespace handoff::db::sql {

/*
  Bootstrap DDL, applied with CREATE ... IF NOT EXISTS at startup.

  Timestamps are unix milliseconds; NULL means unset.
  The partial unique index enforces one active transfer per contact.
*/

static constexpr const char* kSqliteSchema[] = {
    "CREATE TABLE IF NOT EXISTS users ("
    " id TEXT PRIMARY KEY, organization_id TEXT NOT NULL, name TEXT NOT NULL DEFAULT '',"
    " role TEXT NOT NULL DEFAULT 'agent', is_active INTEGER NOT NULL DEFAULT 1,"
    " is_available INTEGER NOT NULL DEFAULT 1);",

    "CREATE TABLE IF NOT EXISTS teams ("
    " id TEXT PRIMARY KEY, organization_id TEXT NOT NULL, name TEXT NOT NULL DEFAULT '',"
    " assignment_strategy TEXT NOT NULL DEFAULT 'round_robin', is_active INTEGER NOT NULL DEFAULT 1);",

    "CREATE TABLE IF NOT EXISTS team_members ("
    " seq INTEGER PRIMARY KEY AUTOINCREMENT,"
    " team_id TEXT NOT NULL REFERENCES teams(id) ON DELETE CASCADE,"
    " user_id TEXT NOT NULL REFERENCES users(id) ON DELETE CASCADE,"
    " role TEXT NOT NULL DEFAULT 'agent', last_assigned_at INTEGER,"
    " UNIQUE(team_id, user_id));",

    "CREATE TABLE IF NOT EXISTS contacts ("
    " id TEXT PRIMARY KEY, organization_id TEXT NOT NULL, phone_number TEXT NOT NULL DEFAULT '',"
    " profile_name TEXT NOT NULL DEFAULT '', account TEXT NOT NULL DEFAULT '', assigned_user_id TEXT,"
    " chatbot_last_message_at INTEGER, chatbot_reminder_sent INTEGER NOT NULL DEFAULT 0);",

    "CREATE TABLE IF NOT EXISTS chatbot_sessions ("
    " seq INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, organization_id TEXT NOT NULL,"
    " contact_id TEXT NOT NULL, status TEXT NOT NULL, started_at INTEGER NOT NULL, completed_at INTEGER);",

    "CREATE TABLE IF NOT EXISTS chatbot_settings ("
    " organization_id TEXT NOT NULL, account TEXT NOT NULL DEFAULT '',"
    " assign_to_same_agent INTEGER NOT NULL DEFAULT 0, allow_agent_queue_pickup INTEGER NOT NULL DEFAULT 1,"
    " mask_phone_numbers INTEGER NOT NULL DEFAULT 0, sla_enabled INTEGER NOT NULL DEFAULT 0,"
    " sla TEXT NOT NULL DEFAULT '{}', client_inactivity TEXT NOT NULL DEFAULT '{}',"
    " business_hours TEXT NOT NULL DEFAULT '{}', updated_at INTEGER,"
    " PRIMARY KEY (organization_id, account));",

    "CREATE TABLE IF NOT EXISTS agent_transfers ("
    " seq INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, organization_id TEXT NOT NULL,"
    " contact_id TEXT NOT NULL, account TEXT NOT NULL DEFAULT '', phone_number TEXT NOT NULL DEFAULT '',"
    " status TEXT NOT NULL, source TEXT NOT NULL, agent_id TEXT, team_id TEXT, transferred_by TEXT,"
    " notes TEXT NOT NULL DEFAULT '', transferred_at INTEGER NOT NULL, resumed_at INTEGER, resumed_by TEXT,"
    " sla_response_deadline INTEGER, sla_resolution_deadline INTEGER, sla_escalation_at INTEGER,"
    " expires_at INTEGER, sla_breached INTEGER NOT NULL DEFAULT 0, sla_breached_at INTEGER,"
    " escalation_level INTEGER NOT NULL DEFAULT 0, escalated_at INTEGER, picked_up_at INTEGER,"
    " first_response_at INTEGER);",

    "CREATE UNIQUE INDEX IF NOT EXISTS agent_transfers_one_active"
    " ON agent_transfers(organization_id, contact_id) WHERE status = 'active';",

    "CREATE INDEX IF NOT EXISTS agent_transfers_queue"
    " ON agent_transfers(organization_id, status, transferred_at);",

    "CREATE TABLE IF NOT EXISTS outbound_messages ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT, organization_id TEXT NOT NULL, account TEXT NOT NULL,"
    " contact_id TEXT NOT NULL, phone_number TEXT NOT NULL DEFAULT '', content TEXT NOT NULL,"
    " created_at INTEGER NOT NULL);",
};

static constexpr const char* kPostgresSchema[] = {
    "CREATE TABLE IF NOT EXISTS users ("
    " id TEXT PRIMARY KEY, organization_id TEXT NOT NULL, name TEXT NOT NULL DEFAULT '',"
    " role TEXT NOT NULL DEFAULT 'agent', is_active BOOLEAN NOT NULL DEFAULT TRUE,"
    " is_available BOOLEAN NOT NULL DEFAULT TRUE);",

    "CREATE TABLE IF NOT EXISTS teams ("
    " id TEXT PRIMARY KEY, organization_id TEXT NOT NULL, name TEXT NOT NULL DEFAULT '',"
    " assignment_strategy TEXT NOT NULL DEFAULT 'round_robin', is_active BOOLEAN NOT NULL DEFAULT TRUE);",

    "CREATE TABLE IF NOT EXISTS team_members ("
    " seq BIGSERIAL PRIMARY KEY,"
    " team_id TEXT NOT NULL REFERENCES teams(id) ON DELETE CASCADE,"
    " user_id TEXT NOT NULL REFERENCES users(id) ON DELETE CASCADE,"
    " role TEXT NOT NULL DEFAULT 'agent', last_assigned_at BIGINT,"
    " UNIQUE(team_id, user_id));",

    "CREATE TABLE IF NOT EXISTS contacts ("
    " id TEXT PRIMARY KEY, organization_id TEXT NOT NULL, phone_number TEXT NOT NULL DEFAULT '',"
    " profile_name TEXT NOT NULL DEFAULT '', account TEXT NOT NULL DEFAULT '', assigned_user_id TEXT,"
    " chatbot_last_message_at BIGINT, chatbot_reminder_sent BOOLEAN NOT NULL DEFAULT FALSE);",

    "CREATE TABLE IF NOT EXISTS chatbot_sessions ("
    " seq BIGSERIAL PRIMARY KEY, id TEXT NOT NULL UNIQUE, organization_id TEXT NOT NULL,"
    " contact_id TEXT NOT NULL, status TEXT NOT NULL, started_at BIGINT NOT NULL, completed_at BIGINT);",

    "CREATE TABLE IF NOT EXISTS chatbot_settings ("
    " organization_id TEXT NOT NULL, account TEXT NOT NULL DEFAULT '',"
    " assign_to_same_agent BOOLEAN NOT NULL DEFAULT FALSE, allow_agent_queue_pickup BOOLEAN NOT NULL DEFAULT TRUE,"
    " mask_phone_numbers BOOLEAN NOT NULL DEFAULT FALSE, sla_enabled BOOLEAN NOT NULL DEFAULT FALSE,"
    " sla JSONB NOT NULL DEFAULT '{}', client_inactivity JSONB NOT NULL DEFAULT '{}',"
    " business_hours JSONB NOT NULL DEFAULT '{}', updated_at BIGINT,"
    " PRIMARY KEY (organization_id, account));",

    "CREATE TABLE IF NOT EXISTS agent_transfers ("
    " seq BIGSERIAL PRIMARY KEY, id TEXT NOT NULL UNIQUE, organization_id TEXT NOT NULL,"
    " contact_id TEXT NOT NULL, account TEXT NOT NULL DEFAULT '', phone_number TEXT NOT NULL DEFAULT '',"
    " status TEXT NOT NULL, source TEXT NOT NULL, agent_id TEXT, team_id TEXT, transferred_by TEXT,"
    " notes TEXT NOT NULL DEFAULT '', transferred_at BIGINT NOT NULL, resumed_at BIGINT, resumed_by TEXT,"
    " sla_response_deadline BIGINT, sla_resolution_deadline BIGINT, sla_escalation_at BIGINT,"
    " expires_at BIGINT, sla_breached BOOLEAN NOT NULL DEFAULT FALSE, sla_breached_at BIGINT,"
    " escalation_level INTEGER NOT NULL DEFAULT 0, escalated_at BIGINT, picked_up_at BIGINT,"
    " first_response_at BIGINT);",

    "CREATE UNIQUE INDEX IF NOT EXISTS agent_transfers_one_active"
    " ON agent_transfers(organization_id, contact_id) WHERE status = 'active';",

    "CREATE INDEX IF NOT EXISTS agent_transfers_queue"
    " ON agent_transfers(organization_id, status, transferred_at);",

    "CREATE TABLE IF NOT EXISTS outbound_messages ("
    " id BIGSERIAL PRIMARY KEY, organization_id TEXT NOT NULL, account TEXT NOT NULL,"
    " contact_id TEXT NOT NULL, phone_number TEXT NOT NULL DEFAULT '', content TEXT NOT NULL,"
    " created_at BIGINT NOT NULL);",
};

// column list shared by every transfer SELECT; order matches the row readers
static constexpr const char* kTransferColumns =
    "id,organization_id,contact_id,account,phone_number,status,source,agent_id,team_id,transferred_by,"
    "notes,transferred_at,resumed_at,resumed_by,sla_response_deadline,sla_resolution_deadline,"
    "sla_escalation_at,expires_at,sla_breached,sla_breached_at,escalation_level,escalated_at,"
    "picked_up_at,first_response_at";

static constexpr const char* kContactColumns =
    "id,organization_id,phone_number,profile_name,account,assigned_user_id,chatbot_last_message_at,"
    "chatbot_reminder_sent";

static constexpr const char* kSettingsColumns =
    "organization_id,account,assign_to_same_agent,allow_agent_queue_pickup,mask_phone_numbers,"
    "sla,client_inactivity,business_hours,updated_at";

} // namespace handoff::db::sql
