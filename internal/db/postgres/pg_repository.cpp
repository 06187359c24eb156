#include "pg_repository.hpp"

#include "internal/db/sql/json_codec.hpp"
#include "internal/model/transfer.hpp"

namespace handoff::db::postgres {

namespace {

Result Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

template <typename... Args>
Result Exec(pqxx::work& work, const char* statement, Args&&... args) {
  try {
    auto res = work.exec_prepared(statement, std::forward<Args>(args)...);
    return Result::Ok(static_cast<uint64_t>(res.affected_rows()));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// 0 is stored as NULL
std::optional<int64_t> Ts(uint64_t ms) {
  if (ms == 0) return std::nullopt;
  return static_cast<int64_t>(ms);
}

std::string Str(std::string_view s) {
  return std::string(s);
}

uint64_t ColTs(const pqxx::field& f) {
  return f.is_null() ? 0 : static_cast<uint64_t>(f.as<int64_t>());
}

std::optional<std::string> ColOpt(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

model::TransferRecord ReadTransfer(const pqxx::row& row) {
  model::TransferRecord r;
  r.id                     = row[0].c_str();
  r.organization_id        = row[1].c_str();
  r.contact_id             = row[2].c_str();
  r.account                = row[3].c_str();
  r.phone_number           = row[4].c_str();
  r.status                 = handoff::model::ParseTransferStatus(row[5].c_str());
  r.source                 = handoff::model::ParseTransferSource(row[6].c_str());
  r.agent_id               = ColOpt(row[7]);
  r.team_id                = ColOpt(row[8]);
  r.transferred_by         = ColOpt(row[9]);
  r.notes                  = row[10].c_str();
  r.transferred_at_ms      = ColTs(row[11]);
  r.resumed_at_ms          = ColTs(row[12]);
  r.resumed_by             = ColOpt(row[13]);
  r.response_deadline_ms   = ColTs(row[14]);
  r.resolution_deadline_ms = ColTs(row[15]);
  r.escalation_at_ms       = ColTs(row[16]);
  r.expires_at_ms          = ColTs(row[17]);
  r.sla_breached           = row[18].as<bool>();
  r.sla_breached_at_ms     = ColTs(row[19]);
  r.escalation_level       = row[20].as<int>();
  r.escalated_at_ms        = ColTs(row[21]);
  r.picked_up_at_ms        = ColTs(row[22]);
  r.first_response_at_ms   = ColTs(row[23]);
  return r;
}

model::ContactRecord ReadContact(const pqxx::row& row) {
  model::ContactRecord c;
  c.id                         = row[0].c_str();
  c.organization_id            = row[1].c_str();
  c.phone_number               = row[2].c_str();
  c.profile_name               = row[3].c_str();
  c.account                    = row[4].c_str();
  c.assigned_user_id           = ColOpt(row[5]);
  c.chatbot_last_message_at_ms = ColTs(row[6]);
  c.chatbot_reminder_sent      = row[7].as<bool>();
  return c;
}

model::TeamRecord ReadTeam(const pqxx::row& row) {
  model::TeamRecord team;
  team.id              = row[0].c_str();
  team.organization_id = row[1].c_str();
  team.name            = row[2].c_str();
  team.strategy        = handoff::model::ParseAssignmentStrategy(row[3].c_str());
  team.is_active       = row[4].as<bool>();
  return team;
}

handoff::model::OrganizationSettings ReadSettings(const pqxx::row& row) {
  handoff::model::OrganizationSettings s;
  s.organization_id          = row[0].c_str();
  s.account                  = row[1].c_str();
  s.assign_to_same_agent     = row[2].as<bool>();
  s.allow_agent_queue_pickup = row[3].as<bool>();
  s.mask_phone_numbers       = row[4].as<bool>();
  s.sla                      = sql::DecodeSla(row[5].c_str());
  s.client_inactivity        = sql::DecodeClientInactivity(row[6].c_str());
  s.business_hours           = sql::DecodeBusinessHours(row[7].c_str());
  s.updated_at_ms            = ColTs(row[8]);
  return s;
}

template <typename Reader>
auto ReadAll(const pqxx::result& res, Reader read) -> std::vector<decltype(read(res[0]))> {
  std::vector<decltype(read(res[0]))> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(read(row));
  return out;
}

template <typename Reader>
auto ReadFirst(const pqxx::result& res, Reader read) -> std::optional<decltype(read(res[0]))> {
  if (res.empty()) return std::nullopt;
  return read(res[0]);
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

// ------------------------------------------------------------------
// Users / teams
// ------------------------------------------------------------------

Result PgRepository::InsertUser(Transaction& t, const model::UserRecord& r) {
  return Exec(TX(t).Work(), "insert_user", r.id, r.organization_id, r.name, Str(handoff::model::ToString(r.role)),
              r.is_active, r.is_available);
}

std::optional<model::UserRecord> PgRepository::GetUser(Transaction& t, const std::string& organization_id,
                                                       const std::string& user_id) {
  auto res = TX(t).Work().exec_prepared("get_user", user_id, organization_id);
  return ReadFirst(res, [](const pqxx::row& row) {
    model::UserRecord u;
    u.id              = row[0].c_str();
    u.organization_id = row[1].c_str();
    u.name            = row[2].c_str();
    u.role            = handoff::model::ParseRole(row[3].c_str());
    u.is_active       = row[4].as<bool>();
    u.is_available    = row[5].as<bool>();
    return u;
  });
}

Result PgRepository::InsertTeam(Transaction& t, const model::TeamRecord& r) {
  return Exec(TX(t).Work(), "insert_team", r.id, r.organization_id, r.name,
              Str(handoff::model::ToString(r.strategy)), r.is_active);
}

std::optional<model::TeamRecord> PgRepository::GetTeam(Transaction& t, const std::string& organization_id,
                                                       const std::string& team_id) {
  return ReadFirst(TX(t).Work().exec_prepared("get_team", team_id, organization_id), ReadTeam);
}

std::vector<model::TeamRecord> PgRepository::ListTeams(Transaction& t, const std::string& organization_id) {
  return ReadAll(TX(t).Work().exec_prepared("list_teams", organization_id), ReadTeam);
}

Result PgRepository::InsertTeamMember(Transaction& t, const model::TeamMemberRecord& r) {
  return Exec(TX(t).Work(), "insert_team_member", r.team_id, r.user_id, Str(handoff::model::ToString(r.role)),
              Ts(r.last_assigned_at_ms));
}

std::vector<model::TeamMemberRecord> PgRepository::ListTeamMembers(Transaction& t, const std::string& team_id) {
  return ReadAll(TX(t).Work().exec_prepared("list_team_members", team_id), [](const pqxx::row& row) {
    model::TeamMemberRecord m;
    m.team_id             = row[0].c_str();
    m.user_id             = row[1].c_str();
    m.role                = handoff::model::ParseTeamRole(row[2].c_str());
    m.last_assigned_at_ms = ColTs(row[3]);
    return m;
  });
}

std::vector<std::string> PgRepository::ListUserTeamIds(Transaction& t, const std::string& organization_id,
                                                       const std::string& user_id) {
  return ReadAll(TX(t).Work().exec_prepared("list_user_team_ids", user_id, organization_id),
                 [](const pqxx::row& row) { return std::string(row[0].c_str()); });
}

Result PgRepository::TouchMemberAssignment(Transaction& t, const std::string& team_id, const std::string& user_id,
                                           uint64_t assigned_at_ms) {
  return Exec(TX(t).Work(), "touch_member_assignment", team_id, user_id, Ts(assigned_at_ms));
}

// ------------------------------------------------------------------
// Contacts / chatbot sessions
// ------------------------------------------------------------------

Result PgRepository::InsertContact(Transaction& t, const model::ContactRecord& r) {
  return Exec(TX(t).Work(), "insert_contact", r.id, r.organization_id, r.phone_number, r.profile_name, r.account,
              r.assigned_user_id, Ts(r.chatbot_last_message_at_ms), r.chatbot_reminder_sent);
}

std::optional<model::ContactRecord> PgRepository::GetContact(Transaction& t, const std::string& organization_id,
                                                             const std::string& contact_id) {
  return ReadFirst(TX(t).Work().exec_prepared("get_contact", contact_id, organization_id), ReadContact);
}

Result PgRepository::SetContactAssignee(Transaction& t, const std::string& organization_id,
                                        const std::string& contact_id, const std::optional<std::string>& user_id) {
  return Exec(TX(t).Work(), "set_contact_assignee", contact_id, organization_id, user_id);
}

Result PgRepository::SetChatbotTracking(Transaction& t, const std::string& organization_id,
                                        const std::string& contact_id, uint64_t last_message_at_ms,
                                        bool reminder_sent) {
  return Exec(TX(t).Work(), "set_chatbot_tracking", contact_id, organization_id, Ts(last_message_at_ms),
              reminder_sent);
}

Result PgRepository::MarkChatbotReminderSent(Transaction& t, const std::string& organization_id,
                                             const std::string& contact_id, uint64_t last_message_at_ms) {
  return Exec(TX(t).Work(), "mark_chatbot_reminder_sent", contact_id, organization_id, Ts(last_message_at_ms));
}

std::vector<model::ContactRecord> PgRepository::ListInactivityCandidates(Transaction& t,
                                                                         const std::string& organization_id) {
  return ReadAll(TX(t).Work().exec_prepared("list_inactivity_candidates", organization_id), ReadContact);
}

Result PgRepository::InsertChatbotSession(Transaction& t, const model::ChatbotSessionRecord& r) {
  return Exec(TX(t).Work(), "insert_chatbot_session", r.id, r.organization_id, r.contact_id,
              Str(model::ToString(r.status)), static_cast<int64_t>(r.started_at_ms), Ts(r.completed_at_ms));
}

std::vector<model::ChatbotSessionRecord> PgRepository::ListChatbotSessions(Transaction& t,
                                                                           const std::string& organization_id,
                                                                           const std::string& contact_id) {
  return ReadAll(TX(t).Work().exec_prepared("list_chatbot_sessions", organization_id, contact_id),
                 [](const pqxx::row& row) {
                   model::ChatbotSessionRecord r;
                   r.id              = row[0].c_str();
                   r.organization_id = row[1].c_str();
                   r.contact_id      = row[2].c_str();
                   r.status          = model::ParseChatbotSessionStatus(row[3].c_str());
                   r.started_at_ms   = ColTs(row[4]);
                   r.completed_at_ms = ColTs(row[5]);
                   return r;
                 });
}

Result PgRepository::CancelActiveChatbotSessions(Transaction& t, const std::string& organization_id,
                                                 const std::string& contact_id, uint64_t cancelled_at_ms) {
  return Exec(TX(t).Work(), "cancel_chatbot_sessions", organization_id, contact_id, Ts(cancelled_at_ms));
}

// ------------------------------------------------------------------
// Settings
// ------------------------------------------------------------------

Result PgRepository::UpsertSettings(Transaction& t, const handoff::model::OrganizationSettings& r) {
  return Exec(TX(t).Work(), "upsert_settings", r.organization_id, r.account, r.assign_to_same_agent,
              r.allow_agent_queue_pickup, r.mask_phone_numbers, r.sla.enabled, sql::EncodeSla(r.sla),
              sql::EncodeClientInactivity(r.client_inactivity), sql::EncodeBusinessHours(r.business_hours),
              Ts(r.updated_at_ms));
}

std::optional<handoff::model::OrganizationSettings> PgRepository::GetSettings(Transaction& t,
                                                                              const std::string& organization_id,
                                                                              const std::string& account) {
  return ReadFirst(TX(t).Work().exec_prepared("get_settings", organization_id, account), ReadSettings);
}

std::vector<handoff::model::OrganizationSettings> PgRepository::ListSlaEnabledSettings(Transaction& t) {
  return ReadAll(TX(t).Work().exec_prepared("list_sla_settings"), ReadSettings);
}

// ------------------------------------------------------------------
// Transfers
// ------------------------------------------------------------------

Result PgRepository::InsertTransfer(Transaction& t, const model::TransferRecord& r) {
  auto res = Exec(TX(t).Work(), "insert_transfer", r.id, r.organization_id, r.contact_id, r.account,
                  r.phone_number, Str(handoff::model::ToString(r.status)), Str(handoff::model::ToString(r.source)),
                  r.agent_id, r.team_id, r.transferred_by, r.notes, static_cast<int64_t>(r.transferred_at_ms),
                  Ts(r.resumed_at_ms), r.resumed_by, Ts(r.response_deadline_ms), Ts(r.resolution_deadline_ms),
                  Ts(r.escalation_at_ms), Ts(r.expires_at_ms), r.sla_breached, Ts(r.sla_breached_at_ms),
                  r.escalation_level, Ts(r.escalated_at_ms), Ts(r.picked_up_at_ms), Ts(r.first_response_at_ms));
  // the partial unique index rejects a second active transfer for the contact
  if (res.code == ErrorCode::AlreadyExists) return Result::Err(ErrorCode::Conflict, res.message);
  return res;
}

std::optional<model::TransferRecord> PgRepository::GetTransfer(Transaction& t, const std::string& organization_id,
                                                               const std::string& transfer_id) {
  return ReadFirst(TX(t).Work().exec_prepared("get_transfer", transfer_id, organization_id), ReadTransfer);
}

std::optional<model::TransferRecord> PgRepository::FindActiveTransfer(Transaction& t,
                                                                      const std::string& organization_id,
                                                                      const std::string& contact_id) {
  return ReadFirst(TX(t).Work().exec_prepared("find_active_transfer", organization_id, contact_id), ReadTransfer);
}

std::vector<model::TransferRecord> PgRepository::ListTransfers(Transaction& t, const std::string& organization_id,
                                                               std::optional<handoff::v1::TransferStatus> status) {
  if (status) {
    return ReadAll(TX(t).Work().exec_prepared("list_transfers_by_status", organization_id,
                                              Str(handoff::model::ToString(*status))),
                   ReadTransfer);
  }
  return ReadAll(TX(t).Work().exec_prepared("list_transfers", organization_id), ReadTransfer);
}

uint64_t PgRepository::CountActiveTransfersForAgent(Transaction& t, const std::string& organization_id,
                                                    const std::string& agent_id) {
  auto res = TX(t).Work().exec_prepared("count_agent_active", organization_id, agent_id);
  return res.empty() ? 0 : res[0][0].as<uint64_t>();
}

Result PgRepository::UpdateActiveTransfer(Transaction& t, const model::TransferRecord& r) {
  return Exec(TX(t).Work(), "update_active_transfer", r.id, r.organization_id, r.contact_id, r.account,
              r.phone_number, Str(handoff::model::ToString(r.status)), Str(handoff::model::ToString(r.source)),
              r.agent_id, r.team_id, r.transferred_by, r.notes, static_cast<int64_t>(r.transferred_at_ms),
              Ts(r.resumed_at_ms), r.resumed_by, Ts(r.response_deadline_ms), Ts(r.resolution_deadline_ms),
              Ts(r.escalation_at_ms), Ts(r.expires_at_ms), r.sla_breached, Ts(r.sla_breached_at_ms),
              r.escalation_level, Ts(r.escalated_at_ms), Ts(r.picked_up_at_ms), Ts(r.first_response_at_ms));
}

std::optional<model::TransferRecord> PgRepository::ClaimNextQueuedTransfer(Transaction& t, const QueueScope& scope,
                                                                           const std::string& agent_id) {
  auto& work = TX(t).Work();

  auto candidate = ReadFirst(work.exec_prepared("lock_next_queued", scope.organization_id, scope.any_team,
                                                scope.include_general, scope.team_ids),
                             ReadTransfer);
  if (!candidate) return std::nullopt;

  // the row is locked by this transaction, the guard only protects against misuse
  auto res = work.exec_prepared("claim_transfer", candidate->id, agent_id);
  if (res.affected_rows() == 0) return std::nullopt;

  candidate->agent_id = agent_id;
  if (!candidate->transferred_by) candidate->transferred_by = agent_id;
  return candidate;
}

Result PgRepository::SetFirstResponse(Transaction& t, const std::string& organization_id,
                                      const std::string& transfer_id, uint64_t at_ms) {
  return Exec(TX(t).Work(), "set_first_response", transfer_id, organization_id, Ts(at_ms));
}

// ------------------------------------------------------------------
// SLA scheduler
// ------------------------------------------------------------------

std::vector<model::TransferRecord> PgRepository::ListExpiredTransfers(Transaction& t,
                                                                      const std::string& organization_id,
                                                                      uint64_t now_ms) {
  return ReadAll(TX(t).Work().exec_prepared("list_expired", organization_id, static_cast<int64_t>(now_ms)),
                 ReadTransfer);
}

Result PgRepository::ExpireTransfer(Transaction& t, const std::string& transfer_id, uint64_t now_ms,
                                    const std::string& notes) {
  return Exec(TX(t).Work(), "expire_transfer", transfer_id, static_cast<int64_t>(now_ms), notes);
}

std::vector<model::TransferRecord> PgRepository::ListEscalationDueTransfers(Transaction& t,
                                                                            const std::string& organization_id,
                                                                            uint64_t now_ms) {
  return ReadAll(TX(t).Work().exec_prepared("list_escalation_due", organization_id, static_cast<int64_t>(now_ms),
                                            handoff::model::kMaxEscalationLevel),
                 ReadTransfer);
}

Result PgRepository::EscalateTransfer(Transaction& t, const std::string& transfer_id, int from_level,
                                      uint64_t now_ms, bool mark_breached) {
  return Exec(TX(t).Work(), "escalate_transfer", transfer_id, from_level, static_cast<int64_t>(now_ms),
              mark_breached, handoff::model::kMaxEscalationLevel);
}

Result PgRepository::MarkUnassignedBreached(Transaction& t, const std::string& organization_id, uint64_t now_ms) {
  return Exec(TX(t).Work(), "mark_unassigned_breached", organization_id, static_cast<int64_t>(now_ms));
}

// ------------------------------------------------------------------
// Outbound messages
// ------------------------------------------------------------------

Result PgRepository::InsertOutboundMessage(Transaction& t, model::OutboundMessageRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_outbound", r.organization_id, r.account, r.contact_id,
                                          r.phone_number, r.content, static_cast<int64_t>(r.created_at_ms));
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok(1);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::OutboundMessageRecord> PgRepository::ListOutboundMessages(Transaction& t,
                                                                             const std::string& organization_id) {
  return ReadAll(TX(t).Work().exec_prepared("list_outbound", organization_id), [](const pqxx::row& row) {
    model::OutboundMessageRecord r;
    r.id              = row[0].as<uint64_t>();
    r.organization_id = row[1].c_str();
    r.account         = row[2].c_str();
    r.contact_id      = row[3].c_str();
    r.phone_number    = row[4].c_str();
    r.content         = row[5].c_str();
    r.created_at_ms   = ColTs(row[6]);
    return r;
  });
}

} // namespace handoff::db::postgres
