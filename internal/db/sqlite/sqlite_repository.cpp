#include "sqlite_repository.hpp"

#include <stdexcept>

#include "internal/db/sql/json_codec.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/model/transfer.hpp"

namespace handoff::db::sqlite {

using handoff::db::ErrorCode;
using handoff::db::Result;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

Stmt Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Stmt(st);
}

void BindText(sqlite3_stmt* st, int idx, std::string_view s) {
  sqlite3_bind_text(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

// 0 is stored as NULL
void BindTime(sqlite3_stmt* st, int idx, uint64_t ms) {
  if (ms == 0) {
    sqlite3_bind_null(st, idx);
  } else {
    BindU64(st, idx, ms);
  }
}

void BindBool(sqlite3_stmt* st, int idx, bool v) {
  sqlite3_bind_int(st, idx, v ? 1 : 0);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

// NULL reads back as 0
uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

bool ColBool(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col) != 0;
}

model::TransferRecord ReadTransfer(sqlite3_stmt* st) {
  model::TransferRecord r;
  r.id                     = ColText(st, 0);
  r.organization_id        = ColText(st, 1);
  r.contact_id             = ColText(st, 2);
  r.account                = ColText(st, 3);
  r.phone_number           = ColText(st, 4);
  r.status                 = handoff::model::ParseTransferStatus(ColText(st, 5));
  r.source                 = handoff::model::ParseTransferSource(ColText(st, 6));
  r.agent_id               = ColOptText(st, 7);
  r.team_id                = ColOptText(st, 8);
  r.transferred_by         = ColOptText(st, 9);
  r.notes                  = ColText(st, 10);
  r.transferred_at_ms      = ColU64(st, 11);
  r.resumed_at_ms          = ColU64(st, 12);
  r.resumed_by             = ColOptText(st, 13);
  r.response_deadline_ms   = ColU64(st, 14);
  r.resolution_deadline_ms = ColU64(st, 15);
  r.escalation_at_ms       = ColU64(st, 16);
  r.expires_at_ms          = ColU64(st, 17);
  r.sla_breached           = ColBool(st, 18);
  r.sla_breached_at_ms     = ColU64(st, 19);
  r.escalation_level       = sqlite3_column_int(st, 20);
  r.escalated_at_ms        = ColU64(st, 21);
  r.picked_up_at_ms        = ColU64(st, 22);
  r.first_response_at_ms   = ColU64(st, 23);
  return r;
}

// binds every column except id, starting at idx; returns the next index
int BindTransferFields(sqlite3_stmt* st, int idx, const model::TransferRecord& r) {
  BindText(st, idx++, r.organization_id);
  BindText(st, idx++, r.contact_id);
  BindText(st, idx++, r.account);
  BindText(st, idx++, r.phone_number);
  BindText(st, idx++, handoff::model::ToString(r.status));
  BindText(st, idx++, handoff::model::ToString(r.source));
  BindOptText(st, idx++, r.agent_id);
  BindOptText(st, idx++, r.team_id);
  BindOptText(st, idx++, r.transferred_by);
  BindText(st, idx++, r.notes);
  BindU64(st, idx++, r.transferred_at_ms);
  BindTime(st, idx++, r.resumed_at_ms);
  BindOptText(st, idx++, r.resumed_by);
  BindTime(st, idx++, r.response_deadline_ms);
  BindTime(st, idx++, r.resolution_deadline_ms);
  BindTime(st, idx++, r.escalation_at_ms);
  BindTime(st, idx++, r.expires_at_ms);
  BindBool(st, idx++, r.sla_breached);
  BindTime(st, idx++, r.sla_breached_at_ms);
  sqlite3_bind_int(st, idx++, r.escalation_level);
  BindTime(st, idx++, r.escalated_at_ms);
  BindTime(st, idx++, r.picked_up_at_ms);
  BindTime(st, idx++, r.first_response_at_ms);
  return idx;
}

model::ContactRecord ReadContact(sqlite3_stmt* st) {
  model::ContactRecord c;
  c.id                         = ColText(st, 0);
  c.organization_id            = ColText(st, 1);
  c.phone_number               = ColText(st, 2);
  c.profile_name               = ColText(st, 3);
  c.account                    = ColText(st, 4);
  c.assigned_user_id           = ColOptText(st, 5);
  c.chatbot_last_message_at_ms = ColU64(st, 6);
  c.chatbot_reminder_sent      = ColBool(st, 7);
  return c;
}

handoff::model::OrganizationSettings ReadSettings(sqlite3_stmt* st) {
  handoff::model::OrganizationSettings s;
  s.organization_id          = ColText(st, 0);
  s.account                  = ColText(st, 1);
  s.assign_to_same_agent     = ColBool(st, 2);
  s.allow_agent_queue_pickup = ColBool(st, 3);
  s.mask_phone_numbers       = ColBool(st, 4);
  s.sla                      = sql::DecodeSla(ColText(st, 5));
  s.client_inactivity        = sql::DecodeClientInactivity(ColText(st, 6));
  s.business_hours           = sql::DecodeBusinessHours(ColText(st, 7));
  s.updated_at_ms            = ColU64(st, 8);
  return s;
}

// steps until SQLITE_DONE, reading each row
template <typename Reader>
auto Collect(sqlite3* db, sqlite3_stmt* st, Reader read) -> std::vector<decltype(read(st))> {
  std::vector<decltype(read(st))> out;
  int                             rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(read(st));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return out;
}

template <typename Reader>
auto First(sqlite3* db, sqlite3_stmt* st, Reader read) -> std::optional<decltype(read(st))> {
  int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return read(st);
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return std::nullopt;
}

std::string SelectTransfers(const std::string& where) {
  return std::string("SELECT ") + sql::kTransferColumns + " FROM agent_transfers WHERE " + where;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) {
    return Result::Ok(static_cast<uint64_t>(sqlite3_changes(db)));
  }

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Users
// ------------------------------------------------------------------

Result SqliteRepository::InsertUser(Transaction& t, const model::UserRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO users(id,organization_id,name,role,is_active,is_available) VALUES(?,?,?,?,?,?);");
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.organization_id);
  BindText(st.get(), 3, r.name);
  BindText(st.get(), 4, handoff::model::ToString(r.role));
  BindBool(st.get(), 5, r.is_active);
  BindBool(st.get(), 6, r.is_available);
  auto res = Translate(db, sqlite3_step(st.get()));
  if (res.code == ErrorCode::ConstraintViolation) return Result::Err(ErrorCode::AlreadyExists, res.message);
  return res;
}

std::optional<model::UserRecord> SqliteRepository::GetUser(Transaction& t, const std::string& organization_id,
                                                           const std::string& user_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "SELECT id,organization_id,name,role,is_active,is_available FROM users"
                      " WHERE id=? AND organization_id=?;");
  BindText(st.get(), 1, user_id);
  BindText(st.get(), 2, organization_id);
  return First(db, st.get(), [](sqlite3_stmt* s) {
    model::UserRecord u;
    u.id              = ColText(s, 0);
    u.organization_id = ColText(s, 1);
    u.name            = ColText(s, 2);
    u.role            = handoff::model::ParseRole(ColText(s, 3));
    u.is_active       = ColBool(s, 4);
    u.is_available    = ColBool(s, 5);
    return u;
  });
}

// ------------------------------------------------------------------
// Teams
// ------------------------------------------------------------------

namespace {

model::TeamRecord ReadTeam(sqlite3_stmt* s) {
  model::TeamRecord team;
  team.id              = ColText(s, 0);
  team.organization_id = ColText(s, 1);
  team.name            = ColText(s, 2);
  team.strategy        = handoff::model::ParseAssignmentStrategy(ColText(s, 3));
  team.is_active       = ColBool(s, 4);
  return team;
}

} // namespace

Result SqliteRepository::InsertTeam(Transaction& t, const model::TeamRecord& r) {
  auto* db = TX(t).Handle();
  auto  st =
      Prepare(db, "INSERT INTO teams(id,organization_id,name,assignment_strategy,is_active) VALUES(?,?,?,?,?);");
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.organization_id);
  BindText(st.get(), 3, r.name);
  BindText(st.get(), 4, handoff::model::ToString(r.strategy));
  BindBool(st.get(), 5, r.is_active);
  auto res = Translate(db, sqlite3_step(st.get()));
  if (res.code == ErrorCode::ConstraintViolation) return Result::Err(ErrorCode::AlreadyExists, res.message);
  return res;
}

std::optional<model::TeamRecord> SqliteRepository::GetTeam(Transaction& t, const std::string& organization_id,
                                                           const std::string& team_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "SELECT id,organization_id,name,assignment_strategy,is_active FROM teams"
                      " WHERE id=? AND organization_id=?;");
  BindText(st.get(), 1, team_id);
  BindText(st.get(), 2, organization_id);
  return First(db, st.get(), ReadTeam);
}

std::vector<model::TeamRecord> SqliteRepository::ListTeams(Transaction& t, const std::string& organization_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "SELECT id,organization_id,name,assignment_strategy,is_active FROM teams"
                      " WHERE organization_id=? ORDER BY rowid;");
  BindText(st.get(), 1, organization_id);
  return Collect(db, st.get(), ReadTeam);
}

Result SqliteRepository::InsertTeamMember(Transaction& t, const model::TeamMemberRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "INSERT INTO team_members(team_id,user_id,role,last_assigned_at) VALUES(?,?,?,?);");
  BindText(st.get(), 1, r.team_id);
  BindText(st.get(), 2, r.user_id);
  BindText(st.get(), 3, handoff::model::ToString(r.role));
  BindTime(st.get(), 4, r.last_assigned_at_ms);
  auto res = Translate(db, sqlite3_step(st.get()));
  if (res.code == ErrorCode::ConstraintViolation) return Result::Err(ErrorCode::AlreadyExists, res.message);
  return res;
}

std::vector<model::TeamMemberRecord> SqliteRepository::ListTeamMembers(Transaction& t,
                                                                       const std::string& team_id) {
  auto* db = TX(t).Handle();
  auto  st =
      Prepare(db, "SELECT team_id,user_id,role,last_assigned_at FROM team_members WHERE team_id=? ORDER BY seq;");
  BindText(st.get(), 1, team_id);
  return Collect(db, st.get(), [](sqlite3_stmt* s) {
    model::TeamMemberRecord m;
    m.team_id             = ColText(s, 0);
    m.user_id             = ColText(s, 1);
    m.role                = handoff::model::ParseTeamRole(ColText(s, 2));
    m.last_assigned_at_ms = ColU64(s, 3);
    return m;
  });
}

std::vector<std::string> SqliteRepository::ListUserTeamIds(Transaction& t, const std::string& organization_id,
                                                           const std::string& user_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "SELECT m.team_id FROM team_members m JOIN teams tm ON tm.id = m.team_id"
                      " WHERE m.user_id=? AND tm.organization_id=? ORDER BY m.seq;");
  BindText(st.get(), 1, user_id);
  BindText(st.get(), 2, organization_id);
  return Collect(db, st.get(), [](sqlite3_stmt* s) { return ColText(s, 0); });
}

Result SqliteRepository::TouchMemberAssignment(Transaction& t, const std::string& team_id,
                                               const std::string& user_id, uint64_t assigned_at_ms) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "UPDATE team_members SET last_assigned_at=? WHERE team_id=? AND user_id=?;");
  BindTime(st.get(), 1, assigned_at_ms);
  BindText(st.get(), 2, team_id);
  BindText(st.get(), 3, user_id);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Contacts
// ------------------------------------------------------------------

Result SqliteRepository::InsertContact(Transaction& t, const model::ContactRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("INSERT INTO contacts(") + sql::kContactColumns + ") VALUES(?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.organization_id);
  BindText(st.get(), 3, r.phone_number);
  BindText(st.get(), 4, r.profile_name);
  BindText(st.get(), 5, r.account);
  BindOptText(st.get(), 6, r.assigned_user_id);
  BindTime(st.get(), 7, r.chatbot_last_message_at_ms);
  BindBool(st.get(), 8, r.chatbot_reminder_sent);
  auto res = Translate(db, sqlite3_step(st.get()));
  if (res.code == ErrorCode::ConstraintViolation) return Result::Err(ErrorCode::AlreadyExists, res.message);
  return res;
}

std::optional<model::ContactRecord> SqliteRepository::GetContact(Transaction& t, const std::string& organization_id,
                                                                 const std::string& contact_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + sql::kContactColumns +
                             " FROM contacts WHERE id=? AND organization_id=?;");
  BindText(st.get(), 1, contact_id);
  BindText(st.get(), 2, organization_id);
  return First(db, st.get(), ReadContact);
}

Result SqliteRepository::SetContactAssignee(Transaction& t, const std::string& organization_id,
                                            const std::string& contact_id,
                                            const std::optional<std::string>& user_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "UPDATE contacts SET assigned_user_id=? WHERE id=? AND organization_id=?;");
  BindOptText(st.get(), 1, user_id);
  BindText(st.get(), 2, contact_id);
  BindText(st.get(), 3, organization_id);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::SetChatbotTracking(Transaction& t, const std::string& organization_id,
                                            const std::string& contact_id, uint64_t last_message_at_ms,
                                            bool reminder_sent) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "UPDATE contacts SET chatbot_last_message_at=?, chatbot_reminder_sent=?"
                      " WHERE id=? AND organization_id=?;");
  BindTime(st.get(), 1, last_message_at_ms);
  BindBool(st.get(), 2, reminder_sent);
  BindText(st.get(), 3, contact_id);
  BindText(st.get(), 4, organization_id);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::MarkChatbotReminderSent(Transaction& t, const std::string& organization_id,
                                                 const std::string& contact_id, uint64_t last_message_at_ms) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "UPDATE contacts SET chatbot_reminder_sent=1"
                      " WHERE id=? AND organization_id=? AND chatbot_last_message_at=?;");
  BindText(st.get(), 1, contact_id);
  BindText(st.get(), 2, organization_id);
  BindTime(st.get(), 3, last_message_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::ContactRecord> SqliteRepository::ListInactivityCandidates(Transaction& t,
                                                                             const std::string& organization_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + sql::kContactColumns +
                             " FROM contacts c WHERE c.organization_id=? AND c.chatbot_last_message_at IS NOT NULL"
                             " AND NOT EXISTS (SELECT 1 FROM agent_transfers tr WHERE tr.organization_id = "
                             "c.organization_id AND tr.contact_id = c.id AND tr.status = 'active')"
                             " ORDER BY c.rowid;");
  BindText(st.get(), 1, organization_id);
  return Collect(db, st.get(), ReadContact);
}

// ------------------------------------------------------------------
// Chatbot sessions
// ------------------------------------------------------------------

Result SqliteRepository::InsertChatbotSession(Transaction& t, const model::ChatbotSessionRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO chatbot_sessions(id,organization_id,contact_id,status,started_at,completed_at)"
                      " VALUES(?,?,?,?,?,?);");
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.organization_id);
  BindText(st.get(), 3, r.contact_id);
  BindText(st.get(), 4, model::ToString(r.status));
  BindU64(st.get(), 5, r.started_at_ms);
  BindTime(st.get(), 6, r.completed_at_ms);
  auto res = Translate(db, sqlite3_step(st.get()));
  if (res.code == ErrorCode::ConstraintViolation) return Result::Err(ErrorCode::AlreadyExists, res.message);
  return res;
}

std::vector<model::ChatbotSessionRecord> SqliteRepository::ListChatbotSessions(Transaction& t,
                                                                               const std::string& organization_id,
                                                                               const std::string& contact_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "SELECT id,organization_id,contact_id,status,started_at,completed_at FROM chatbot_sessions"
                      " WHERE organization_id=? AND contact_id=? ORDER BY seq;");
  BindText(st.get(), 1, organization_id);
  BindText(st.get(), 2, contact_id);
  return Collect(db, st.get(), [](sqlite3_stmt* s) {
    model::ChatbotSessionRecord r;
    r.id              = ColText(s, 0);
    r.organization_id = ColText(s, 1);
    r.contact_id      = ColText(s, 2);
    r.status          = model::ParseChatbotSessionStatus(ColText(s, 3));
    r.started_at_ms   = ColU64(s, 4);
    r.completed_at_ms = ColU64(s, 5);
    return r;
  });
}

Result SqliteRepository::CancelActiveChatbotSessions(Transaction& t, const std::string& organization_id,
                                                     const std::string& contact_id, uint64_t cancelled_at_ms) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "UPDATE chatbot_sessions SET status='cancelled', completed_at=?"
                      " WHERE organization_id=? AND contact_id=? AND status='active';");
  BindTime(st.get(), 1, cancelled_at_ms);
  BindText(st.get(), 2, organization_id);
  BindText(st.get(), 3, contact_id);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Settings
// ------------------------------------------------------------------

Result SqliteRepository::UpsertSettings(Transaction& t, const handoff::model::OrganizationSettings& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO chatbot_settings(organization_id,account,assign_to_same_agent,"
                      "allow_agent_queue_pickup,mask_phone_numbers,sla_enabled,sla,client_inactivity,"
                      "business_hours,updated_at) VALUES(?,?,?,?,?,?,?,?,?,?)"
                      " ON CONFLICT(organization_id,account) DO UPDATE SET"
                      " assign_to_same_agent=excluded.assign_to_same_agent,"
                      " allow_agent_queue_pickup=excluded.allow_agent_queue_pickup,"
                      " mask_phone_numbers=excluded.mask_phone_numbers,"
                      " sla_enabled=excluded.sla_enabled,"
                      " sla=excluded.sla,"
                      " client_inactivity=excluded.client_inactivity,"
                      " business_hours=excluded.business_hours,"
                      " updated_at=excluded.updated_at;");
  BindText(st.get(), 1, r.organization_id);
  BindText(st.get(), 2, r.account);
  BindBool(st.get(), 3, r.assign_to_same_agent);
  BindBool(st.get(), 4, r.allow_agent_queue_pickup);
  BindBool(st.get(), 5, r.mask_phone_numbers);
  BindBool(st.get(), 6, r.sla.enabled);
  BindText(st.get(), 7, sql::EncodeSla(r.sla));
  BindText(st.get(), 8, sql::EncodeClientInactivity(r.client_inactivity));
  BindText(st.get(), 9, sql::EncodeBusinessHours(r.business_hours));
  BindTime(st.get(), 10, r.updated_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<handoff::model::OrganizationSettings> SqliteRepository::GetSettings(
    Transaction& t, const std::string& organization_id, const std::string& account) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + sql::kSettingsColumns +
                             " FROM chatbot_settings WHERE organization_id=? AND account=?;");
  BindText(st.get(), 1, organization_id);
  BindText(st.get(), 2, account);
  return First(db, st.get(), ReadSettings);
}

std::vector<handoff::model::OrganizationSettings> SqliteRepository::ListSlaEnabledSettings(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + sql::kSettingsColumns +
                             " FROM chatbot_settings WHERE sla_enabled=1 ORDER BY rowid;");
  return Collect(db, st.get(), ReadSettings);
}

// ------------------------------------------------------------------
// Transfers
// ------------------------------------------------------------------

Result SqliteRepository::InsertTransfer(Transaction& t, const model::TransferRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("INSERT INTO agent_transfers(") + sql::kTransferColumns +
                             ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, r.id);
  BindTransferFields(st.get(), 2, r);
  auto res = Translate(db, sqlite3_step(st.get()));
  // the partial unique index rejects a second active transfer for the contact
  if (res.code == ErrorCode::ConstraintViolation) return Result::Err(ErrorCode::Conflict, res.message);
  return res;
}

std::optional<model::TransferRecord> SqliteRepository::GetTransfer(Transaction& t,
                                                                   const std::string& organization_id,
                                                                   const std::string& transfer_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, SelectTransfers("id=? AND organization_id=?;"));
  BindText(st.get(), 1, transfer_id);
  BindText(st.get(), 2, organization_id);
  return First(db, st.get(), ReadTransfer);
}

std::optional<model::TransferRecord> SqliteRepository::FindActiveTransfer(Transaction& t,
                                                                          const std::string& organization_id,
                                                                          const std::string& contact_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, SelectTransfers("organization_id=? AND contact_id=? AND status='active' LIMIT 1;"));
  BindText(st.get(), 1, organization_id);
  BindText(st.get(), 2, contact_id);
  return First(db, st.get(), ReadTransfer);
}

std::vector<model::TransferRecord> SqliteRepository::ListTransfers(
    Transaction& t, const std::string& organization_id, std::optional<handoff::v1::TransferStatus> status) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, SelectTransfers(status ? "organization_id=? AND status=? ORDER BY transferred_at, seq;"
                                                : "organization_id=? ORDER BY transferred_at, seq;"));
  BindText(st.get(), 1, organization_id);
  if (status) BindText(st.get(), 2, handoff::model::ToString(*status));
  return Collect(db, st.get(), ReadTransfer);
}

uint64_t SqliteRepository::CountActiveTransfersForAgent(Transaction& t, const std::string& organization_id,
                                                        const std::string& agent_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "SELECT COUNT(*) FROM agent_transfers WHERE organization_id=? AND agent_id=?"
                      " AND status='active';");
  BindText(st.get(), 1, organization_id);
  BindText(st.get(), 2, agent_id);
  return First(db, st.get(), [](sqlite3_stmt* s) { return ColU64(s, 0); }).value_or(0);
}

Result SqliteRepository::UpdateActiveTransfer(Transaction& t, const model::TransferRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "UPDATE agent_transfers SET organization_id=?,contact_id=?,account=?,phone_number=?,status=?,"
                      "source=?,agent_id=?,team_id=?,transferred_by=?,notes=?,transferred_at=?,resumed_at=?,"
                      "resumed_by=?,sla_response_deadline=?,sla_resolution_deadline=?,sla_escalation_at=?,"
                      "expires_at=?,sla_breached=?,sla_breached_at=?,escalation_level=?,escalated_at=?,"
                      "picked_up_at=?,first_response_at=? WHERE id=? AND status='active';");
  const int next = BindTransferFields(st.get(), 1, r);
  BindText(st.get(), next, r.id);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::TransferRecord> SqliteRepository::ClaimNextQueuedTransfer(Transaction& t,
                                                                               const QueueScope& scope,
                                                                               const std::string& agent_id) {
  auto* db = TX(t).Handle();

  std::string where = "organization_id=? AND status='active' AND agent_id IS NULL";
  if (!scope.any_team) {
    std::string clause;
    if (scope.include_general) clause = "team_id IS NULL";
    if (!scope.team_ids.empty()) {
      if (!clause.empty()) clause += " OR ";
      clause += "team_id IN (";
      for (size_t i = 0; i < scope.team_ids.size(); ++i) clause += i ? ",?" : "?";
      clause += ")";
    }
    if (clause.empty()) return std::nullopt;
    where += " AND (" + clause + ")";
  }

  auto st  = Prepare(db, SelectTransfers(where + " ORDER BY transferred_at, seq LIMIT 1;"));
  int  idx = 1;
  BindText(st.get(), idx++, scope.organization_id);
  if (!scope.any_team) {
    for (const auto& team_id : scope.team_ids) BindText(st.get(), idx++, team_id);
  }
  auto candidate = First(db, st.get(), ReadTransfer);
  if (!candidate) return std::nullopt;

  // compare-and-swap on the unassigned predicate; the transaction mutex
  // makes the select and this update one unit on this connection
  auto claim = Prepare(db,
                       "UPDATE agent_transfers SET agent_id=?, transferred_by=COALESCE(transferred_by, ?)"
                        " WHERE id=? AND status='active' AND agent_id IS NULL;");
  BindText(claim.get(), 1, agent_id);
  BindText(claim.get(), 2, agent_id);
  BindText(claim.get(), 3, candidate->id);
  auto res = Translate(db, sqlite3_step(claim.get()));
  if (!res) {
    throw std::runtime_error("claim transfer failed: " + res.message);
  }
  if (res.rows_affected == 0) return std::nullopt;

  candidate->agent_id = agent_id;
  if (!candidate->transferred_by) candidate->transferred_by = agent_id;
  return candidate;
}

Result SqliteRepository::SetFirstResponse(Transaction& t, const std::string& organization_id,
                                          const std::string& transfer_id, uint64_t at_ms) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "UPDATE agent_transfers SET first_response_at=? WHERE id=? AND organization_id=?"
                      " AND first_response_at IS NULL;");
  BindTime(st.get(), 1, at_ms);
  BindText(st.get(), 2, transfer_id);
  BindText(st.get(), 3, organization_id);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// SLA scheduler
// ------------------------------------------------------------------

std::vector<model::TransferRecord> SqliteRepository::ListExpiredTransfers(Transaction& t,
                                                                          const std::string& organization_id,
                                                                          uint64_t now_ms) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, SelectTransfers("organization_id=? AND status='active' AND expires_at IS NOT NULL"
                                         " AND expires_at < ? ORDER BY transferred_at, seq;"));
  BindText(st.get(), 1, organization_id);
  BindU64(st.get(), 2, now_ms);
  return Collect(db, st.get(), ReadTransfer);
}

Result SqliteRepository::ExpireTransfer(Transaction& t, const std::string& transfer_id, uint64_t now_ms,
                                        const std::string& notes) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "UPDATE agent_transfers SET status='expired', resumed_at=?, notes=?"
                      " WHERE id=? AND status='active';");
  BindTime(st.get(), 1, now_ms);
  BindText(st.get(), 2, notes);
  BindText(st.get(), 3, transfer_id);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::TransferRecord> SqliteRepository::ListEscalationDueTransfers(Transaction& t,
                                                                                const std::string& organization_id,
                                                                                uint64_t now_ms) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, SelectTransfers("organization_id=? AND status='active' AND sla_escalation_at IS NOT NULL"
                                         " AND sla_escalation_at < ? AND escalation_level < ?"
                                         " ORDER BY transferred_at, seq;"));
  BindText(st.get(), 1, organization_id);
  BindU64(st.get(), 2, now_ms);
  sqlite3_bind_int(st.get(), 3, handoff::model::kMaxEscalationLevel);
  return Collect(db, st.get(), ReadTransfer);
}

Result SqliteRepository::EscalateTransfer(Transaction& t, const std::string& transfer_id, int from_level,
                                          uint64_t now_ms, bool mark_breached) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "UPDATE agent_transfers SET escalation_level=escalation_level+1, escalated_at=?,"
                      " sla_breached_at=CASE WHEN ? AND sla_breached=0 THEN ? ELSE sla_breached_at END,"
                      " sla_breached=CASE WHEN ? THEN 1 ELSE sla_breached END"
                      " WHERE id=? AND status='active' AND escalation_level=? AND escalation_level < ?;");
  BindTime(st.get(), 1, now_ms);
  BindBool(st.get(), 2, mark_breached);
  BindTime(st.get(), 3, now_ms);
  BindBool(st.get(), 4, mark_breached);
  BindText(st.get(), 5, transfer_id);
  sqlite3_bind_int(st.get(), 6, from_level);
  sqlite3_bind_int(st.get(), 7, handoff::model::kMaxEscalationLevel);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::MarkUnassignedBreached(Transaction& t, const std::string& organization_id,
                                                uint64_t now_ms) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "UPDATE agent_transfers SET sla_breached=1, sla_breached_at=?"
                      " WHERE organization_id=? AND status='active' AND sla_breached=0"
                      " AND sla_response_deadline IS NOT NULL AND sla_response_deadline < ? AND agent_id IS NULL;");
  BindTime(st.get(), 1, now_ms);
  BindText(st.get(), 2, organization_id);
  BindU64(st.get(), 3, now_ms);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Outbound messages
// ------------------------------------------------------------------

Result SqliteRepository::InsertOutboundMessage(Transaction& t, model::OutboundMessageRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO outbound_messages(organization_id,account,contact_id,phone_number,content,created_at)"
                      " VALUES(?,?,?,?,?,?);");
  BindText(st.get(), 1, r.organization_id);
  BindText(st.get(), 2, r.account);
  BindText(st.get(), 3, r.contact_id);
  BindText(st.get(), 4, r.phone_number);
  BindText(st.get(), 5, r.content);
  BindU64(st.get(), 6, r.created_at_ms);
  auto res = Translate(db, sqlite3_step(st.get()));
  if (res) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return res;
}

std::vector<model::OutboundMessageRecord> SqliteRepository::ListOutboundMessages(
    Transaction& t, const std::string& organization_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "SELECT id,organization_id,account,contact_id,phone_number,content,created_at"
                      " FROM outbound_messages WHERE organization_id=? ORDER BY id;");
  BindText(st.get(), 1, organization_id);
  return Collect(db, st.get(), [](sqlite3_stmt* s) {
    model::OutboundMessageRecord r;
    r.id              = ColU64(s, 0);
    r.organization_id = ColText(s, 1);
    r.account         = ColText(s, 2);
    r.contact_id      = ColText(s, 3);
    r.phone_number    = ColText(s, 4);
    r.content         = ColText(s, 5);
    r.created_at_ms   = ColU64(s, 6);
    return r;
  });
}

} // namespace handoff::db::sqlite
