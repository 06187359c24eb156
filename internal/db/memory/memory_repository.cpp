#include "memory_repository.hpp"

#include <algorithm>
#include <tuple>

#include "internal/model/transfer.hpp"
#include "memory_tx.hpp"

namespace handoff::db::memory {

namespace {

using handoff::v1::TRANSFER_STATUS_ACTIVE;
using handoff::v1::TRANSFER_STATUS_EXPIRED;

std::string MemberKey(const std::string& team_id, const std::string& user_id) {
  return team_id + "#" + user_id;
}

std::string SettingsKey(const std::string& organization_id, const std::string& account) {
  return organization_id + "#" + account;
}

// matching rows in insertion order
template <typename T, typename Pred>
std::vector<T> Collect(const std::map<std::string, Row<T>>& table, Pred pred) {
  std::vector<const Row<T>*> rows;
  for (const auto& [_, row] : table) {
    if (pred(row.value)) rows.push_back(&row);
  }
  std::sort(rows.begin(), rows.end(), [](const Row<T>* a, const Row<T>* b) { return a->seq < b->seq; });

  std::vector<T> out;
  out.reserve(rows.size());
  for (const auto* row : rows) out.push_back(row->value);
  return out;
}

std::vector<model::TransferRecord> Fifo(std::vector<model::TransferRecord> transfers) {
  std::stable_sort(transfers.begin(), transfers.end(), [](const auto& a, const auto& b) {
    return a.transferred_at_ms < b.transferred_at_ms;
  });
  return transfers;
}

template <typename T>
void Put(MemoryTransaction& tx, Table table, std::map<std::string, Row<T>>& map, const std::string& key, T value,
         uint64_t seq) {
  tx.Touch(table, key);
  auto it = map.find(key);
  if (it == map.end()) {
    map.emplace(key, Row<T>{std::move(value), 0, seq});
  } else {
    it->second.value = std::move(value);
  }
}

bool InScope(const model::TransferRecord& t, const QueueScope& scope) {
  if (scope.any_team) return true;
  if (!t.team_id) return scope.include_general;
  return std::find(scope.team_ids.begin(), scope.team_ids.end(), *t.team_id) != scope.team_ids.end();
}

bool IsActive(const model::TransferRecord& t) {
  return t.status == TRANSFER_STATUS_ACTIVE;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ---------------------------------------------------------------------------
// Users
// ---------------------------------------------------------------------------

Result MemoryRepository::InsertUser(Transaction& t, const model::UserRecord& r) {
  auto& tx = TX(t);
  if (tx.View().users.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  Put(tx, Table::kUsers, tx.Mutable().users, r.id, r, NextSeq());
  return Result::Ok(1);
}

std::optional<model::UserRecord> MemoryRepository::GetUser(Transaction& t, const std::string& organization_id,
                                                           const std::string& user_id) {
  const auto& users = TX(t).View().users;
  auto        it    = users.find(user_id);
  if (it == users.end() || it->second.value.organization_id != organization_id) return std::nullopt;
  return it->second.value;
}

// ---------------------------------------------------------------------------
// Teams
// ---------------------------------------------------------------------------

Result MemoryRepository::InsertTeam(Transaction& t, const model::TeamRecord& r) {
  auto& tx = TX(t);
  if (tx.View().teams.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  Put(tx, Table::kTeams, tx.Mutable().teams, r.id, r, NextSeq());
  return Result::Ok(1);
}

std::optional<model::TeamRecord> MemoryRepository::GetTeam(Transaction& t, const std::string& organization_id,
                                                           const std::string& team_id) {
  const auto& teams = TX(t).View().teams;
  auto        it    = teams.find(team_id);
  if (it == teams.end() || it->second.value.organization_id != organization_id) return std::nullopt;
  return it->second.value;
}

std::vector<model::TeamRecord> MemoryRepository::ListTeams(Transaction& t, const std::string& organization_id) {
  return Collect(TX(t).View().teams,
                 [&](const model::TeamRecord& r) { return r.organization_id == organization_id; });
}

Result MemoryRepository::InsertTeamMember(Transaction& t, const model::TeamMemberRecord& r) {
  auto&      tx  = TX(t);
  const auto key = MemberKey(r.team_id, r.user_id);
  if (tx.View().team_members.contains(key)) return Result::Err(ErrorCode::AlreadyExists);
  Put(tx, Table::kTeamMembers, tx.Mutable().team_members, key, r, NextSeq());
  return Result::Ok(1);
}

std::vector<model::TeamMemberRecord> MemoryRepository::ListTeamMembers(Transaction& t, const std::string& team_id) {
  return Collect(TX(t).View().team_members,
                 [&](const model::TeamMemberRecord& r) { return r.team_id == team_id; });
}

std::vector<std::string> MemoryRepository::ListUserTeamIds(Transaction& t, const std::string& organization_id,
                                                           const std::string& user_id) {
  const auto&              view = TX(t).View();
  std::vector<std::string> out;
  for (const auto& member : Collect(view.team_members,
                                    [&](const model::TeamMemberRecord& r) { return r.user_id == user_id; })) {
    auto team = view.teams.find(member.team_id);
    if (team != view.teams.end() && team->second.value.organization_id == organization_id) {
      out.push_back(member.team_id);
    }
  }
  return out;
}

Result MemoryRepository::TouchMemberAssignment(Transaction& t, const std::string& team_id,
                                               const std::string& user_id, uint64_t assigned_at_ms) {
  auto&      tx  = TX(t);
  const auto key = MemberKey(team_id, user_id);
  auto       it  = tx.View().team_members.find(key);
  if (it == tx.View().team_members.end()) return Result::Ok(0);

  auto member                = it->second.value;
  member.last_assigned_at_ms = assigned_at_ms;
  Put(tx, Table::kTeamMembers, tx.Mutable().team_members, key, std::move(member), 0);
  return Result::Ok(1);
}

// ---------------------------------------------------------------------------
// Contacts
// ---------------------------------------------------------------------------

Result MemoryRepository::InsertContact(Transaction& t, const model::ContactRecord& r) {
  auto& tx = TX(t);
  if (tx.View().contacts.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  Put(tx, Table::kContacts, tx.Mutable().contacts, r.id, r, NextSeq());
  return Result::Ok(1);
}

std::optional<model::ContactRecord> MemoryRepository::GetContact(Transaction& t, const std::string& organization_id,
                                                                 const std::string& contact_id) {
  const auto& contacts = TX(t).View().contacts;
  auto        it       = contacts.find(contact_id);
  if (it == contacts.end() || it->second.value.organization_id != organization_id) return std::nullopt;
  return it->second.value;
}

Result MemoryRepository::SetContactAssignee(Transaction& t, const std::string& organization_id,
                                            const std::string& contact_id,
                                            const std::optional<std::string>& user_id) {
  auto contact = GetContact(t, organization_id, contact_id);
  if (!contact) return Result::Ok(0);

  auto& tx                  = TX(t);
  contact->assigned_user_id = user_id;
  Put(tx, Table::kContacts, tx.Mutable().contacts, contact_id, std::move(*contact), 0);
  return Result::Ok(1);
}

Result MemoryRepository::SetChatbotTracking(Transaction& t, const std::string& organization_id,
                                            const std::string& contact_id, uint64_t last_message_at_ms,
                                            bool reminder_sent) {
  auto contact = GetContact(t, organization_id, contact_id);
  if (!contact) return Result::Ok(0);

  auto& tx                            = TX(t);
  contact->chatbot_last_message_at_ms = last_message_at_ms;
  contact->chatbot_reminder_sent      = reminder_sent;
  Put(tx, Table::kContacts, tx.Mutable().contacts, contact_id, std::move(*contact), 0);
  return Result::Ok(1);
}

Result MemoryRepository::MarkChatbotReminderSent(Transaction& t, const std::string& organization_id,
                                                 const std::string& contact_id, uint64_t last_message_at_ms) {
  auto contact = GetContact(t, organization_id, contact_id);
  if (!contact || contact->chatbot_last_message_at_ms != last_message_at_ms) return Result::Ok(0);

  auto& tx                       = TX(t);
  contact->chatbot_reminder_sent = true;
  Put(tx, Table::kContacts, tx.Mutable().contacts, contact_id, std::move(*contact), 0);
  return Result::Ok(1);
}

std::vector<model::ContactRecord> MemoryRepository::ListInactivityCandidates(Transaction& t,
                                                                             const std::string& organization_id) {
  const auto& view = TX(t).View();
  return Collect(view.contacts, [&](const model::ContactRecord& c) {
    if (c.organization_id != organization_id || c.chatbot_last_message_at_ms == 0) return false;
    return std::none_of(view.transfers.begin(), view.transfers.end(), [&](const auto& entry) {
      const auto& tr = entry.second.value;
      return IsActive(tr) && tr.organization_id == organization_id && tr.contact_id == c.id;
    });
  });
}

// ---------------------------------------------------------------------------
// Chatbot sessions
// ---------------------------------------------------------------------------

Result MemoryRepository::InsertChatbotSession(Transaction& t, const model::ChatbotSessionRecord& r) {
  auto& tx = TX(t);
  if (tx.View().chatbot_sessions.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  Put(tx, Table::kChatbotSessions, tx.Mutable().chatbot_sessions, r.id, r, NextSeq());
  return Result::Ok(1);
}

std::vector<model::ChatbotSessionRecord> MemoryRepository::ListChatbotSessions(Transaction& t,
                                                                               const std::string& organization_id,
                                                                               const std::string& contact_id) {
  return Collect(TX(t).View().chatbot_sessions, [&](const model::ChatbotSessionRecord& s) {
    return s.organization_id == organization_id && s.contact_id == contact_id;
  });
}

Result MemoryRepository::CancelActiveChatbotSessions(Transaction& t, const std::string& organization_id,
                                                     const std::string& contact_id, uint64_t cancelled_at_ms) {
  auto&    tx       = TX(t);
  uint64_t affected = 0;
  for (auto session : ListChatbotSessions(t, organization_id, contact_id)) {
    if (session.status != model::ChatbotSessionStatus::kActive) continue;
    session.status          = model::ChatbotSessionStatus::kCancelled;
    session.completed_at_ms = cancelled_at_ms;
    const auto id           = session.id;
    Put(tx, Table::kChatbotSessions, tx.Mutable().chatbot_sessions, id, std::move(session), 0);
    ++affected;
  }
  return Result::Ok(affected);
}

// ---------------------------------------------------------------------------
// Settings
// ---------------------------------------------------------------------------

Result MemoryRepository::UpsertSettings(Transaction& t, const handoff::model::OrganizationSettings& r) {
  auto& tx = TX(t);
  Put(tx, Table::kSettings, tx.Mutable().settings, SettingsKey(r.organization_id, r.account), r, NextSeq());
  return Result::Ok(1);
}

std::optional<handoff::model::OrganizationSettings> MemoryRepository::GetSettings(
    Transaction& t, const std::string& organization_id, const std::string& account) {
  const auto& settings = TX(t).View().settings;
  auto        it       = settings.find(SettingsKey(organization_id, account));
  if (it == settings.end()) return std::nullopt;
  return it->second.value;
}

std::vector<handoff::model::OrganizationSettings> MemoryRepository::ListSlaEnabledSettings(Transaction& t) {
  return Collect(TX(t).View().settings,
                 [](const handoff::model::OrganizationSettings& s) { return s.sla.enabled; });
}

// ---------------------------------------------------------------------------
// Transfers
// ---------------------------------------------------------------------------

Result MemoryRepository::InsertTransfer(Transaction& t, const model::TransferRecord& r) {
  auto& tx = TX(t);
  if (tx.View().transfers.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  if (IsActive(r) && FindActiveTransfer(t, r.organization_id, r.contact_id)) {
    return Result::Err(ErrorCode::Conflict, "contact already has an active transfer");
  }
  Put(tx, Table::kTransfers, tx.Mutable().transfers, r.id, r, NextSeq());
  return Result::Ok(1);
}

std::optional<model::TransferRecord> MemoryRepository::GetTransfer(Transaction& t,
                                                                   const std::string& organization_id,
                                                                   const std::string& transfer_id) {
  const auto& transfers = TX(t).View().transfers;
  auto        it        = transfers.find(transfer_id);
  if (it == transfers.end() || it->second.value.organization_id != organization_id) return std::nullopt;
  return it->second.value;
}

std::optional<model::TransferRecord> MemoryRepository::FindActiveTransfer(Transaction& t,
                                                                          const std::string& organization_id,
                                                                          const std::string& contact_id) {
  for (const auto& [_, row] : TX(t).View().transfers) {
    const auto& r = row.value;
    if (IsActive(r) && r.organization_id == organization_id && r.contact_id == contact_id) return r;
  }
  return std::nullopt;
}

std::vector<model::TransferRecord> MemoryRepository::ListTransfers(
    Transaction& t, const std::string& organization_id, std::optional<handoff::v1::TransferStatus> status) {
  return Fifo(Collect(TX(t).View().transfers, [&](const model::TransferRecord& r) {
    return r.organization_id == organization_id && (!status || r.status == *status);
  }));
}

uint64_t MemoryRepository::CountActiveTransfersForAgent(Transaction& t, const std::string& organization_id,
                                                        const std::string& agent_id) {
  const auto& transfers = TX(t).View().transfers;
  return static_cast<uint64_t>(std::count_if(transfers.begin(), transfers.end(), [&](const auto& entry) {
    const auto& r = entry.second.value;
    return IsActive(r) && r.organization_id == organization_id && r.agent_id == agent_id;
  }));
}

Result MemoryRepository::UpdateActiveTransfer(Transaction& t, const model::TransferRecord& r) {
  auto current = GetTransfer(t, r.organization_id, r.id);
  if (!current) return Result::Err(ErrorCode::NotFound);
  if (!IsActive(*current)) return Result::Ok(0);

  auto& tx = TX(t);
  Put(tx, Table::kTransfers, tx.Mutable().transfers, r.id, r, 0);
  return Result::Ok(1);
}

std::optional<model::TransferRecord> MemoryRepository::ClaimNextQueuedTransfer(Transaction& t,
                                                                               const QueueScope& scope,
                                                                               const std::string& agent_id) {
  auto& tx = TX(t);

  std::scoped_lock                  lock(mutex_);
  const Row<model::TransferRecord>* best = nullptr;
  for (const auto& [id, row] : committed_.transfers) {
    const auto& r = row.value;
    if (r.organization_id != scope.organization_id || !IsActive(r) || r.agent_id) continue;
    if (!InScope(r, scope)) continue;
    // skip, never wait on, rows another transaction has claimed
    if (claims_.contains(id)) continue;
    if (!best || std::tie(r.transferred_at_ms, row.seq) < std::tie(best->value.transferred_at_ms, best->seq)) {
      best = &row;
    }
  }
  if (!best) return std::nullopt;

  const std::string id = best->value.id;
  claims_[id]          = &tx;
  tx.AddClaim(id);

  auto& working = tx.Mutable().transfers;
  working.insert_or_assign(id, *best);
  tx.Rebase(Table::kTransfers, id, best->version);

  auto& claimed    = working.at(id).value;
  claimed.agent_id = agent_id;
  if (!claimed.transferred_by) claimed.transferred_by = agent_id;
  return claimed;
}

Result MemoryRepository::SetFirstResponse(Transaction& t, const std::string& organization_id,
                                          const std::string& transfer_id, uint64_t at_ms) {
  auto current = GetTransfer(t, organization_id, transfer_id);
  if (!current) return Result::Err(ErrorCode::NotFound);
  if (current->first_response_at_ms != 0) return Result::Ok(0);

  auto& tx                      = TX(t);
  current->first_response_at_ms = at_ms;
  Put(tx, Table::kTransfers, tx.Mutable().transfers, transfer_id, std::move(*current), 0);
  return Result::Ok(1);
}

// ---------------------------------------------------------------------------
// SLA scheduler
// ---------------------------------------------------------------------------

// Re-reads a transfer the way a row lock makes an UPDATE re-check its
// predicate against the latest committed row. Rows claimed by another open
// transaction are left alone.
std::optional<model::TransferRecord> MemoryRepository::LatestTransfer(MemoryTransaction& tx,
                                                                      const std::string& transfer_id) {
  std::scoped_lock lock(mutex_);
  auto             claim = claims_.find(transfer_id);
  if (claim != claims_.end() && claim->second != &tx) return std::nullopt;

  auto& working = tx.Mutable().transfers;
  if (!tx.Wrote(Table::kTransfers, transfer_id)) {
    auto committed = committed_.transfers.find(transfer_id);
    if (committed != committed_.transfers.end()) working.insert_or_assign(transfer_id, committed->second);
  }
  auto it = working.find(transfer_id);
  if (it == working.end()) return std::nullopt;
  return it->second.value;
}

std::vector<model::TransferRecord> MemoryRepository::ListExpiredTransfers(Transaction& t,
                                                                          const std::string& organization_id,
                                                                          uint64_t now_ms) {
  return Fifo(Collect(TX(t).View().transfers, [&](const model::TransferRecord& r) {
    return r.organization_id == organization_id && IsActive(r) && r.expires_at_ms != 0 && r.expires_at_ms < now_ms;
  }));
}

Result MemoryRepository::ExpireTransfer(Transaction& t, const std::string& transfer_id, uint64_t now_ms,
                                        const std::string& notes) {
  auto& tx = TX(t);
  auto  r  = LatestTransfer(tx, transfer_id);
  if (!r || !IsActive(*r)) return Result::Ok(0);

  r->status        = TRANSFER_STATUS_EXPIRED;
  r->resumed_at_ms = now_ms;
  r->notes         = notes;
  Put(tx, Table::kTransfers, tx.Mutable().transfers, transfer_id, std::move(*r), 0);
  return Result::Ok(1);
}

std::vector<model::TransferRecord> MemoryRepository::ListEscalationDueTransfers(Transaction& t,
                                                                                const std::string& organization_id,
                                                                                uint64_t now_ms) {
  return Fifo(Collect(TX(t).View().transfers, [&](const model::TransferRecord& r) {
    return r.organization_id == organization_id && IsActive(r) && r.escalation_at_ms != 0 &&
           r.escalation_at_ms < now_ms && r.escalation_level < handoff::model::kMaxEscalationLevel;
  }));
}

Result MemoryRepository::EscalateTransfer(Transaction& t, const std::string& transfer_id, int from_level,
                                          uint64_t now_ms, bool mark_breached) {
  auto& tx = TX(t);
  auto  r  = LatestTransfer(tx, transfer_id);
  if (!r || !IsActive(*r) || r->escalation_level != from_level || from_level >= handoff::model::kMaxEscalationLevel) {
    return Result::Ok(0);
  }

  r->escalation_level = from_level + 1;
  r->escalated_at_ms  = now_ms;
  if (mark_breached && !r->sla_breached) {
    r->sla_breached       = true;
    r->sla_breached_at_ms = now_ms;
  }
  Put(tx, Table::kTransfers, tx.Mutable().transfers, transfer_id, std::move(*r), 0);
  return Result::Ok(1);
}

Result MemoryRepository::MarkUnassignedBreached(Transaction& t, const std::string& organization_id,
                                                uint64_t now_ms) {
  auto& tx  = TX(t);
  auto  due = [&](const model::TransferRecord& r) {
    return r.organization_id == organization_id && IsActive(r) && !r.sla_breached && !r.agent_id &&
           r.response_deadline_ms != 0 && r.response_deadline_ms < now_ms;
  };

  uint64_t affected = 0;
  for (const auto& candidate : Collect(tx.View().transfers, due)) {
    auto r = LatestTransfer(tx, candidate.id);
    if (!r || !due(*r)) continue;
    r->sla_breached       = true;
    r->sla_breached_at_ms = now_ms;
    Put(tx, Table::kTransfers, tx.Mutable().transfers, candidate.id, std::move(*r), 0);
    ++affected;
  }
  return Result::Ok(affected);
}

// ---------------------------------------------------------------------------
// Outbound messages
// ---------------------------------------------------------------------------

Result MemoryRepository::InsertOutboundMessage(Transaction& t, model::OutboundMessageRecord& r) {
  auto& tx = TX(t);
  r.id     = next_outbound_id_.fetch_add(1);
  Put(tx, Table::kOutbound, tx.Mutable().outbound, std::to_string(r.id), r, NextSeq());
  return Result::Ok(1);
}

std::vector<model::OutboundMessageRecord> MemoryRepository::ListOutboundMessages(
    Transaction& t, const std::string& organization_id) {
  return Collect(TX(t).View().outbound, [&](const model::OutboundMessageRecord& r) {
    return r.organization_id == organization_id;
  });
}

} // namespace handoff::db::memory
