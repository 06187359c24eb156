#include "transfer_queue.hpp"

#include <algorithm>

#include "internal/model/state_machine.hpp"
#include "internal/model/transfer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/routing/business_hours.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "sla.hpp"
#include "transfer_events.hpp"

namespace handoff::transfer {

using db::ThrowIfDbError;
using handoff::observability::BoolField;
using handoff::observability::IntField;
using handoff::observability::StringField;

namespace {

bool Contains(const std::vector<std::string>& values, const std::string& value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

void RequireCaller(const model::Caller& caller) {
  util::RequireUuid(caller.organization_id, "organization_id");
  util::RequireUuid(caller.user_id, "user_id");
}

// agents: own transfers plus unassigned ones in their teams or the general queue
// managers: their teams' transfers plus the unassigned general queue
bool Visible(const model::Caller& caller, const std::vector<std::string>& teams, const db::model::TransferRecord& t) {
  switch (caller.role) {
    case v1::ROLE_ADMIN:
      return true;
    case v1::ROLE_MANAGER:
      if (t.team_id && Contains(teams, *t.team_id)) return true;
      return !t.team_id && !t.agent_id;
    default:
      if (t.agent_id) return *t.agent_id == caller.user_id;
      return !t.team_id || Contains(teams, *t.team_id);
  }
}

constexpr int kMaxAttempts = 3;

// reruns fn when its transaction lost a race with a concurrent writer
template <typename Fn>
auto RetryAborted(const char* operation, Fn&& fn) -> decltype(fn()) {
  for (int attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const util::Aborted& e) {
      if (attempt >= kMaxAttempts) throw;
      HANDOFF_LOG_DEBUG("transaction aborted, retrying",
                        {StringField("operation", operation), IntField("attempt", attempt), StringField("error", e.what())});
    }
  }
}

bool MatchesTeamFilter(const std::optional<std::string>& filter, const db::model::TransferRecord& t) {
  if (!filter || filter->empty()) return true;
  if (*filter == model::kGeneralQueue) return !t.team_id;
  return t.team_id && *t.team_id == *filter;
}

} // namespace

TransferQueue::TransferQueue(std::shared_ptr<db::Repository> repository, std::shared_ptr<settings::SettingsCache> settings,
                             std::shared_ptr<routing::AgentSelector> selector, notify::Notifiers notifiers, util::NowFn now)
    : repository_(std::move(repository)),
      settings_(std::move(settings)),
      selector_(std::move(selector)),
      notifiers_(std::move(notifiers)),
      now_(std::move(now)) {
}

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------

db::model::TransferRecord TransferQueue::LoadTransfer(const std::string& organization_id, const std::string& transfer_id) {
  auto tx       = repository_->Begin();
  auto transfer = repository_->GetTransfer(*tx, organization_id, transfer_id);
  tx->Commit();
  if (!transfer) {
    throw util::NotFound("transfer not found");
  }
  return *transfer;
}

void TransferQueue::RequireAvailableAgent(db::Transaction& tx, const std::string& organization_id, const std::string& agent_id) {
  util::RequireUuid(agent_id, "agent_id");
  auto agent = repository_->GetUser(tx, organization_id, agent_id);
  if (!agent) {
    throw util::NotFound("agent not found");
  }
  if (!agent->is_available) {
    throw util::InvalidState("agent is currently away");
  }
}

std::optional<std::string> TransferQueue::ReuseAssignedAgent(db::Transaction& tx, const model::OrganizationSettings& settings,
                                                             const db::model::ContactRecord& contact) {
  if (!settings.assign_to_same_agent || !contact.assigned_user_id) {
    return std::nullopt;
  }
  auto agent = repository_->GetUser(tx, contact.organization_id, *contact.assigned_user_id);
  if (!agent || !agent->is_available) {
    // previous owner is away, the transfer goes to the queue
    return std::nullopt;
  }
  return agent->id;
}

void TransferQueue::InsertWithSideEffects(db::Transaction& tx, const db::model::TransferRecord& record, uint64_t now_ms) {
  ThrowIfDbError(repository_->InsertTransfer(tx, record), "create transfer");

  if (record.agent_id) {
    ThrowIfDbError(repository_->SetContactAssignee(tx, record.organization_id, record.contact_id, record.agent_id), "assign contact");
  }
  ThrowIfDbError(repository_->CancelActiveChatbotSessions(tx, record.organization_id, record.contact_id, now_ms), "cancel chatbot session");
}

void TransferQueue::PublishCreated(const db::model::TransferRecord& record, const db::model::ContactRecord& contact, bool mask) {
  if (notifiers_.broadcaster) {
    notifiers_.broadcaster->NotifyOrg(record.organization_id, kEventCreated, CreatedPayload(record, contact, mask));
  }
  if (notifiers_.dispatcher) {
    notifiers_.dispatcher->Dispatch(record.organization_id, kWebhookCreated, WebhookPayload(record, contact));
  }
}

// ------------------------------------------------------------
// Create
// ------------------------------------------------------------

db::model::TransferRecord TransferQueue::Create(const model::Caller& caller, const CreateTransferParams& params) {
  return RetryAborted("create", [&] { return CreateOnce(caller, params); });
}

db::model::TransferRecord TransferQueue::CreateOnce(const model::Caller& caller, const CreateTransferParams& params) {
  RequireCaller(caller);
  util::RequireUuid(params.contact_id, "contact_id");
  const bool has_team  = params.team_id && !params.team_id->empty();
  const bool has_agent = params.agent_id && !params.agent_id->empty();
  if (has_team) util::RequireUuid(*params.team_id, "team_id");
  if (has_agent) util::RequireUuid(*params.agent_id, "agent_id");

  const auto settings = settings_->Resolve(caller.organization_id, params.account);
  const auto now_ms   = util::ToUnixMillis(now_());

  auto tx      = repository_->Begin();
  auto contact = repository_->GetContact(*tx, caller.organization_id, params.contact_id);
  if (!contact) {
    throw util::NotFound("contact not found");
  }
  if (repository_->FindActiveTransfer(*tx, caller.organization_id, params.contact_id)) {
    throw util::Conflict("contact already has an active transfer");
  }

  if (has_team) {
    auto team = repository_->GetTeam(*tx, caller.organization_id, *params.team_id);
    if (!team || !team->is_active) {
      throw util::NotFound("team not found or inactive");
    }
  }

  std::optional<std::string> agent_id;
  if (has_agent) {
    RequireAvailableAgent(*tx, caller.organization_id, *params.agent_id);
    agent_id = *params.agent_id;
  } else if (has_team) {
    agent_id = selector_->SelectAgent(*tx, *params.team_id, caller.organization_id);
  } else {
    agent_id = ReuseAssignedAgent(*tx, settings, *contact);
  }

  db::model::TransferRecord record;
  record.id                = util::NewId();
  record.organization_id   = caller.organization_id;
  record.contact_id        = contact->id;
  record.account           = params.account;
  record.phone_number      = contact->phone_number;
  record.status            = v1::TRANSFER_STATUS_ACTIVE;
  record.source            = params.source == v1::TRANSFER_SOURCE_UNSPECIFIED ? v1::TRANSFER_SOURCE_MANUAL : params.source;
  record.agent_id          = agent_id;
  record.team_id           = has_team ? params.team_id : std::nullopt;
  record.transferred_by    = caller.user_id;
  record.notes             = params.notes;
  record.transferred_at_ms = now_ms;
  SetSLADeadlines(record, settings, now_ms);

  InsertWithSideEffects(*tx, record, now_ms);
  tx->Commit();

  HANDOFF_LOG_INFO("transfer created", {StringField("transfer_id", record.id), StringField("contact_id", record.contact_id),
                                        StringField("agent_id", record.agent_id.value_or("")),
                                        StringField("team_id", record.team_id.value_or(""))});

  PublishCreated(record, *contact, settings.mask_phone_numbers);
  return record;
}

std::optional<db::model::TransferRecord> TransferQueue::CreateAutomated(const std::string& organization_id, const AutomatedTransferParams& params) {
  return RetryAborted("create_automated", [&] { return CreateAutomatedOnce(organization_id, params); });
}

std::optional<db::model::TransferRecord> TransferQueue::CreateAutomatedOnce(const std::string& organization_id,
                                                                            const AutomatedTransferParams& params) {
  util::RequireUuid(organization_id, "organization_id");
  util::RequireUuid(params.contact_id, "contact_id");

  const auto settings = settings_->Resolve(organization_id, params.account);
  const auto now      = now_();
  const auto now_ms   = util::ToUnixMillis(now);

  auto tx      = repository_->Begin();
  auto contact = repository_->GetContact(*tx, organization_id, params.contact_id);
  if (!contact) {
    throw util::NotFound("contact not found");
  }
  if (repository_->FindActiveTransfer(*tx, organization_id, params.contact_id)) {
    HANDOFF_LOG_DEBUG("contact already has an active transfer, skipping", {StringField("contact_id", params.contact_id)});
    return std::nullopt;
  }

  if (!routing::IsWithinBusinessHours(settings.business_hours, now)) {
    tx->Rollback();
    HANDOFF_LOG_INFO("outside business hours, not transferring", {StringField("contact_id", params.contact_id)});
    const auto& message = settings.business_hours.out_of_hours_message;
    if (!message.empty() && notifiers_.sender) {
      notifiers_.sender->Send(params.account, *contact, message, notify::SendOptions{});
    }
    return std::nullopt;
  }

  std::optional<std::string> agent_id;
  const bool                 has_team = params.team_id && !params.team_id->empty();
  if (has_team) {
    agent_id = selector_->SelectAgent(*tx, *params.team_id, organization_id);
  } else {
    agent_id = ReuseAssignedAgent(*tx, settings, *contact);
  }

  db::model::TransferRecord record;
  record.id                = util::NewId();
  record.organization_id   = organization_id;
  record.contact_id        = contact->id;
  record.account           = params.account;
  record.phone_number      = contact->phone_number;
  record.status            = v1::TRANSFER_STATUS_ACTIVE;
  record.source            = params.source == v1::TRANSFER_SOURCE_UNSPECIFIED ? v1::TRANSFER_SOURCE_FLOW : params.source;
  record.agent_id          = agent_id;
  record.team_id           = has_team ? params.team_id : std::nullopt;
  record.notes             = params.notes;
  record.transferred_at_ms = now_ms;
  SetSLADeadlines(record, settings, now_ms);

  try {
    InsertWithSideEffects(*tx, record, now_ms);
    tx->Commit();
  } catch (const util::Conflict&) {
    // lost a race with another creation for the same contact
    HANDOFF_LOG_DEBUG("concurrent transfer for contact, skipping", {StringField("contact_id", params.contact_id)});
    return std::nullopt;
  }

  HANDOFF_LOG_INFO("automated transfer created", {StringField("transfer_id", record.id), StringField("contact_id", record.contact_id),
                                                  StringField("source", model::ToString(record.source)),
                                                  StringField("agent_id", record.agent_id.value_or(""))});

  PublishCreated(record, *contact, settings.mask_phone_numbers);
  return record;
}

// ------------------------------------------------------------
// Assign / pick
// ------------------------------------------------------------

db::model::TransferRecord TransferQueue::Assign(const model::Caller& caller, const std::string& transfer_id,
                                                const std::optional<std::string>& agent_id) {
  RequireCaller(caller);
  util::RequireUuid(transfer_id, "transfer_id");

  const bool explicit_agent = agent_id && !agent_id->empty();
  if (explicit_agent && caller.IsAgent()) {
    throw util::PermissionDenied("agents cannot assign transfers to others");
  }

  auto tx       = repository_->Begin();
  auto transfer = repository_->GetTransfer(*tx, caller.organization_id, transfer_id);
  if (!transfer) {
    throw util::NotFound("transfer not found");
  }
  if (!model::CanTransition(transfer->status, v1::TRANSFER_STATUS_ACTIVE)) {
    throw util::InvalidState("transfer is not active");
  }

  std::string target = caller.user_id;
  if (explicit_agent) {
    RequireAvailableAgent(*tx, caller.organization_id, *agent_id);
    target = *agent_id;
  }

  transfer->agent_id = target;
  const auto updated = repository_->UpdateActiveTransfer(*tx, *transfer);
  ThrowIfDbError(updated, "assign transfer");
  if (updated.rows_affected == 0) {
    throw util::InvalidState("transfer is not active");
  }
  ThrowIfDbError(repository_->SetContactAssignee(*tx, caller.organization_id, transfer->contact_id, target), "assign contact");

  auto contact = repository_->GetContact(*tx, caller.organization_id, transfer->contact_id);
  tx->Commit();

  HANDOFF_LOG_INFO("transfer assigned", {StringField("transfer_id", transfer->id), StringField("agent_id", target),
                                         StringField("by", caller.user_id)});

  if (notifiers_.broadcaster) {
    notifiers_.broadcaster->NotifyOrg(caller.organization_id, kEventAssigned, AssignedPayload(*transfer));
  }
  if (notifiers_.dispatcher) {
    notifiers_.dispatcher->Dispatch(caller.organization_id, kWebhookAssigned,
                                    WebhookPayload(*transfer, contact.value_or(db::model::ContactRecord{})));
  }
  return *transfer;
}

std::optional<db::model::TransferRecord> TransferQueue::PickNext(const model::Caller& caller, const std::optional<std::string>& team_id) {
  return RetryAborted("pick_next", [&] { return PickNextOnce(caller, team_id); });
}

std::optional<db::model::TransferRecord> TransferQueue::PickNextOnce(const model::Caller& caller,
                                                                     const std::optional<std::string>& team_id) {
  RequireCaller(caller);

  // queue pickup permission lives on the organization default row
  const auto settings = settings_->Resolve(caller.organization_id, "");
  if (caller.IsAgent() && !settings.allow_agent_queue_pickup) {
    throw util::PermissionDenied("queue pickup is not allowed");
  }

  const bool has_filter = team_id && !team_id->empty();
  if (has_filter && *team_id != model::kGeneralQueue) {
    util::RequireUuid(*team_id, "team_id");
  }

  auto       tx    = repository_->Begin();
  const auto teams = repository_->ListUserTeamIds(*tx, caller.organization_id, caller.user_id);

  db::QueueScope scope;
  scope.organization_id = caller.organization_id;
  if (has_filter && *team_id == model::kGeneralQueue) {
    scope.include_general = true;
  } else if (has_filter) {
    if (!caller.IsAdmin() && !Contains(teams, *team_id)) {
      throw util::PermissionDenied("caller is not a member of this team");
    }
    scope.team_ids = {*team_id};
  } else if (caller.IsAdmin()) {
    scope.any_team = true;
  } else {
    scope.include_general = true;
    scope.team_ids        = teams;
  }

  auto claimed = repository_->ClaimNextQueuedTransfer(*tx, scope, caller.user_id);
  if (!claimed) {
    tx->Rollback();
    HANDOFF_LOG_DEBUG("queue empty", {StringField("user_id", caller.user_id), StringField("team_id", team_id.value_or(""))});
    return std::nullopt;
  }

  UpdateSLAOnPickup(*claimed, util::ToUnixMillis(now_()));
  ThrowIfDbError(repository_->UpdateActiveTransfer(*tx, *claimed), "pick transfer");
  ThrowIfDbError(repository_->SetContactAssignee(*tx, caller.organization_id, claimed->contact_id, caller.user_id),
                 "update contact assignment");
  tx->Commit();

  HANDOFF_LOG_INFO("transfer picked", {StringField("transfer_id", claimed->id), StringField("agent_id", caller.user_id),
                                       BoolField("sla_breached", claimed->sla_breached)});

  if (notifiers_.broadcaster) {
    notifiers_.broadcaster->NotifyOrg(caller.organization_id, kEventAssigned, AssignedPayload(*claimed));
  }
  return claimed;
}

// ------------------------------------------------------------
// Resume
// ------------------------------------------------------------

db::model::TransferRecord TransferQueue::Resume(const model::Caller& caller, const std::string& transfer_id) {
  RequireCaller(caller);
  util::RequireUuid(transfer_id, "transfer_id");

  // the account decides which settings row applies
  const auto account  = LoadTransfer(caller.organization_id, transfer_id).account;
  const auto settings = settings_->Resolve(caller.organization_id, account);

  auto tx       = repository_->Begin();
  auto transfer = repository_->GetTransfer(*tx, caller.organization_id, transfer_id);
  if (!transfer) {
    throw util::NotFound("transfer not found");
  }
  if (!model::CanTransition(transfer->status, v1::TRANSFER_STATUS_RESUMED)) {
    throw util::InvalidState("transfer is not active");
  }

  transfer->status        = v1::TRANSFER_STATUS_RESUMED;
  transfer->resumed_at_ms = util::ToUnixMillis(now_());
  transfer->resumed_by    = caller.user_id;

  const auto updated = repository_->UpdateActiveTransfer(*tx, *transfer);
  ThrowIfDbError(updated, "resume transfer");
  if (updated.rows_affected == 0) {
    throw util::InvalidState("transfer is not active");
  }
  if (!settings.assign_to_same_agent) {
    ThrowIfDbError(repository_->SetContactAssignee(*tx, caller.organization_id, transfer->contact_id, std::nullopt), "unassign contact");
  }

  auto contact = repository_->GetContact(*tx, caller.organization_id, transfer->contact_id);
  tx->Commit();

  HANDOFF_LOG_INFO("transfer resumed", {StringField("transfer_id", transfer->id), StringField("by", caller.user_id)});

  if (notifiers_.broadcaster) {
    notifiers_.broadcaster->NotifyOrg(caller.organization_id, kEventResumed, ResumedPayload(*transfer));
  }
  if (notifiers_.dispatcher) {
    notifiers_.dispatcher->Dispatch(caller.organization_id, kWebhookResumed,
                                    WebhookPayload(*transfer, contact.value_or(db::model::ContactRecord{})));
  }
  return *transfer;
}

// ------------------------------------------------------------
// List
// ------------------------------------------------------------

TransferListing TransferQueue::List(const model::Caller& caller, const ListFilter& filter) {
  RequireCaller(caller);

  auto tx = repository_->Begin();

  std::vector<std::string> teams;
  if (!caller.IsAdmin()) {
    teams = repository_->ListUserTeamIds(*tx, caller.organization_id, caller.user_id);
  }

  TransferListing listing;
  for (auto& t : repository_->ListTransfers(*tx, caller.organization_id, filter.status)) {
    if (MatchesTeamFilter(filter.team_id, t) && Visible(caller, teams, t)) {
      listing.transfers.push_back(std::move(t));
    }
  }

  for (const auto& t : repository_->ListTransfers(*tx, caller.organization_id, v1::TRANSFER_STATUS_ACTIVE)) {
    if (t.agent_id) continue;
    if (!t.team_id) {
      ++listing.general_queue_count;
    } else if (caller.IsAdmin() || Contains(teams, *t.team_id)) {
      ++listing.team_queue_counts[*t.team_id];
    }
  }
  tx->Commit();

  HANDOFF_LOG_DEBUG("transfers listed", {StringField("user_id", caller.user_id), StringField("role", model::ToString(caller.role)),
                                         IntField("count", static_cast<int64_t>(listing.transfers.size())),
                                         IntField("general_queue", static_cast<int64_t>(listing.general_queue_count))});
  return listing;
}

// ------------------------------------------------------------
// SLA / chatbot hooks
// ------------------------------------------------------------

db::model::TransferRecord TransferQueue::RecordFirstResponse(const model::Caller& caller, const std::string& transfer_id) {
  RequireCaller(caller);
  util::RequireUuid(transfer_id, "transfer_id");

  auto tx       = repository_->Begin();
  auto transfer = repository_->GetTransfer(*tx, caller.organization_id, transfer_id);
  if (!transfer) {
    throw util::NotFound("transfer not found");
  }

  const auto now_ms = util::ToUnixMillis(now_());
  if (UpdateSLAOnFirstResponse(*transfer, now_ms)) {
    ThrowIfDbError(repository_->SetFirstResponse(*tx, caller.organization_id, transfer_id, now_ms), "record first response");
  }
  tx->Commit();
  return *transfer;
}

std::optional<std::string> TransferQueue::AssignToTeam(const std::string& team_id, const std::string& organization_id) {
  auto tx    = repository_->Begin();
  auto agent = selector_->SelectAgent(*tx, team_id, organization_id);
  tx->Commit();
  return agent;
}

void TransferQueue::TouchChatbotMessage(const std::string& organization_id, const std::string& contact_id) {
  auto       tx     = repository_->Begin();
  const auto result = repository_->SetChatbotTracking(*tx, organization_id, contact_id, util::ToUnixMillis(now_()), false);
  ThrowIfDbError(result, "touch chatbot message");
  if (result.rows_affected == 0) {
    throw util::NotFound("contact not found");
  }
  tx->Commit();
}

void TransferQueue::ClearChatbotTracking(const std::string& organization_id, const std::string& contact_id) {
  auto       tx     = repository_->Begin();
  const auto result = repository_->SetChatbotTracking(*tx, organization_id, contact_id, 0, false);
  ThrowIfDbError(result, "clear chatbot tracking");
  if (result.rows_affected == 0) {
    throw util::NotFound("contact not found");
  }
  tx->Commit();
}

} // namespace handoff::transfer
