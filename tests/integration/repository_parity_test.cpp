#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/uuid.hpp"
#include "support/fixtures.hpp"

#if HANDOFF_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if HANDOFF_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using handoff::db::ErrorCode;
using handoff::db::QueueScope;
using handoff::db::Repository;
using handoff::db::memory::MemoryRepository;
using handoff::db::model::OutboundMessageRecord;
using handoff::db::model::TransferRecord;
using handoff::model::OrganizationSettings;
using handoff::util::NewId;
using namespace handoff::testing;
using namespace handoff::v1;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

TransferRecord Queued(const std::string& org, const std::string& contact_id, uint64_t at_ms) {
  TransferRecord t;
  t.id                = NewId();
  t.organization_id   = org;
  t.contact_id        = contact_id;
  t.account           = "main";
  t.phone_number      = "+15551234567";
  t.transferred_at_ms = at_ms;
  return t;
}

void Insert(Repository& repo, const TransferRecord& t) {
  auto tx = repo.Begin();
  assert(repo.InsertTransfer(*tx, t));
  tx->Commit();
}

void VerifyDirectory(Repository& repo, const std::string& org) {
  const auto team  = SeedTeam(repo, org, handoff::model::AssignmentStrategy::kLoadBalanced);
  const auto first = SeedUser(repo, org, ROLE_AGENT, false);
  const auto second = SeedUser(repo, org, ROLE_MANAGER);
  AddMember(repo, team, first);
  AddMember(repo, team, second, handoff::model::TeamRole::kManager, 42);

  auto tx = repo.Begin();
  const auto user = repo.GetUser(*tx, org, first);
  assert(user && !user->is_available && user->role == ROLE_AGENT);
  assert(!repo.GetUser(*tx, NewId(), first)); // scoped by organization

  const auto stored = repo.GetTeam(*tx, org, team);
  assert(stored && stored->strategy == handoff::model::AssignmentStrategy::kLoadBalanced);

  const auto members = repo.ListTeamMembers(*tx, team);
  assert(members.size() == 2);
  assert(members[0].user_id == first);
  assert(members[1].role == handoff::model::TeamRole::kManager);
  assert(members[1].last_assigned_at_ms == 42);

  assert(repo.TouchMemberAssignment(*tx, team, first, 100));
  assert(repo.ListTeamMembers(*tx, team)[0].last_assigned_at_ms == 100);
  assert(repo.ListUserTeamIds(*tx, org, second) == std::vector<std::string>{team});
  tx->Commit();
}

void VerifyTransferLifecycle(Repository& repo, const std::string& org) {
  const auto contact = SeedContact(repo, org);
  auto       t       = Queued(org, contact, 1000);
  t.notes            = "needs a human";
  t.team_id          = std::nullopt;
  t.expires_at_ms    = 5000;
  Insert(repo, t);

  {
    auto tx = repo.Begin();
    const auto found = repo.FindActiveTransfer(*tx, org, contact);
    assert(found && found->id == t.id);
    assert(found->notes == "needs a human");
    assert(found->source == TRANSFER_SOURCE_MANUAL);
    assert(!found->agent_id && !found->transferred_by);
    assert(repo.InsertTransfer(*tx, Queued(org, contact, 2000)).code == ErrorCode::Conflict);
    tx->Rollback();
  }

  {
    auto tx       = repo.Begin();
    auto stored   = *repo.GetTransfer(*tx, org, t.id);
    stored.agent_id = NewId();
    assert(repo.UpdateActiveTransfer(*tx, stored).rows_affected == 1);
    assert(repo.SetContactAssignee(*tx, org, contact, stored.agent_id));
    assert(repo.CountActiveTransfersForAgent(*tx, org, *stored.agent_id) == 1);
    assert(repo.SetFirstResponse(*tx, org, t.id, 3000));
    assert(repo.SetFirstResponse(*tx, org, t.id, 4000));
    tx->Commit();
  }
  assert(LoadTransfer(repo, org, t.id)->first_response_at_ms == 3000);
  assert(LoadContact(repo, org, contact)->assigned_user_id);

  {
    auto tx = repo.Begin();
    assert(repo.ListExpiredTransfers(*tx, org, 6000).size() == 1);
    assert(repo.ExpireTransfer(*tx, t.id, 6000, "closed").rows_affected == 1);
    assert(repo.ExpireTransfer(*tx, t.id, 7000, "closed").rows_affected == 0);
    tx->Commit();
  }

  const auto expired = LoadTransfer(repo, org, t.id);
  assert(expired->status == TRANSFER_STATUS_EXPIRED);
  assert(expired->resumed_at_ms == 6000);
  assert(expired->notes == "closed");

  auto stale   = *expired;
  stale.status = TRANSFER_STATUS_ACTIVE;
  auto tx      = repo.Begin();
  assert(repo.UpdateActiveTransfer(*tx, stale).rows_affected == 0);
  assert(!repo.FindActiveTransfer(*tx, org, contact));
  assert(repo.InsertTransfer(*tx, Queued(org, contact, 8000))); // a closed transfer frees the contact
  tx->Commit();

  auto list_tx = repo.Begin();
  const auto all = repo.ListTransfers(*list_tx, org, std::nullopt);
  assert(all.size() == 2);
  assert(all[0].id == t.id); // FIFO
  assert(repo.ListTransfers(*list_tx, org, TRANSFER_STATUS_EXPIRED).size() == 1);
  list_tx->Commit();
}

void VerifyClaimOrder(Repository& repo, const std::string& org) {
  const auto team  = NewId();
  auto       late  = Queued(org, SeedContact(repo, org), 300);
  auto       early = Queued(org, SeedContact(repo, org), 100);
  auto       teamed = Queued(org, SeedContact(repo, org), 50);
  teamed.team_id    = team;
  Insert(repo, late);
  Insert(repo, early);
  Insert(repo, teamed);

  QueueScope general;
  general.organization_id = org;
  general.include_general = true;

  const auto agent = NewId();
  auto       tx    = repo.Begin();
  auto       first = repo.ClaimNextQueuedTransfer(*tx, general, agent);
  assert(first && first->id == early.id);
  assert(first->agent_id == agent && first->transferred_by == agent);
  auto second = repo.ClaimNextQueuedTransfer(*tx, general, agent);
  assert(second && second->id == late.id);
  assert(!repo.ClaimNextQueuedTransfer(*tx, general, agent));

  QueueScope any;
  any.organization_id = org;
  any.any_team        = true;
  auto third          = repo.ClaimNextQueuedTransfer(*tx, any, agent);
  assert(third && third->id == teamed.id);
  tx->Commit();

  assert(LoadTransfer(repo, org, early.id)->agent_id == agent);
}

void VerifyParallelClaims(Repository& repo, const std::string& org, bool supports_parallel_transactions) {
  if (!supports_parallel_transactions) {
    return;
  }
  const auto a_row = Queued(org, SeedContact(repo, org), 10);
  const auto b_row = Queued(org, SeedContact(repo, org), 20);
  Insert(repo, a_row);
  Insert(repo, b_row);

  QueueScope scope;
  scope.organization_id = org;
  scope.include_general = true;

  auto a = repo.Begin();
  auto b = repo.Begin();
  auto claimed_a = repo.ClaimNextQueuedTransfer(*a, scope, NewId());
  auto claimed_b = repo.ClaimNextQueuedTransfer(*b, scope, NewId());
  assert(claimed_a && claimed_b);
  assert(claimed_a->id != claimed_b->id);
  a->Commit();
  b->Commit();
}

void VerifySchedulerQueries(Repository& repo, const std::string& org) {
  auto escalating             = Queued(org, SeedContact(repo, org), 1);
  escalating.escalation_at_ms = 100;
  escalating.agent_id         = NewId();
  auto waiting                 = Queued(org, SeedContact(repo, org), 2);
  waiting.response_deadline_ms = 100;
  Insert(repo, escalating);
  Insert(repo, waiting);

  auto tx = repo.Begin();
  assert(repo.ListEscalationDueTransfers(*tx, org, 50).empty());
  assert(repo.ListEscalationDueTransfers(*tx, org, 200).size() == 1);
  assert(repo.EscalateTransfer(*tx, escalating.id, 0, 200, true).rows_affected == 1);
  assert(repo.EscalateTransfer(*tx, escalating.id, 1, 210, false).rows_affected == 1);
  assert(repo.EscalateTransfer(*tx, escalating.id, 2, 220, false).rows_affected == 0);
  assert(repo.ListEscalationDueTransfers(*tx, org, 300).empty());

  assert(repo.MarkUnassignedBreached(*tx, org, 150).rows_affected == 1);
  assert(repo.MarkUnassignedBreached(*tx, org, 400).rows_affected == 0);
  tx->Commit();

  const auto escalated = LoadTransfer(repo, org, escalating.id);
  assert(escalated->escalation_level == 2);
  assert(escalated->escalated_at_ms == 210);
  assert(escalated->sla_breached && escalated->sla_breached_at_ms == 200);
  assert(LoadTransfer(repo, org, waiting.id)->sla_breached_at_ms == 150);
}

void VerifyChatbotTracking(Repository& repo, const std::string& org) {
  const auto idle        = SeedContact(repo, org);
  const auto transferred = SeedContact(repo, org);

  auto tx = repo.Begin();
  assert(repo.SetChatbotTracking(*tx, org, idle, 500, true).rows_affected == 1);
  assert(repo.SetChatbotTracking(*tx, org, transferred, 500, false).rows_affected == 1);
  assert(repo.SetChatbotTracking(*tx, org, NewId(), 500, false).rows_affected == 0);
  assert(repo.InsertTransfer(*tx, Queued(org, transferred, 600)));

  const auto candidates = repo.ListInactivityCandidates(*tx, org);
  assert(candidates.size() == 1);
  assert(candidates[0].id == idle);
  assert(candidates[0].chatbot_last_message_at_ms == 500);
  assert(candidates[0].chatbot_reminder_sent);

  // the reminder mark only lands while the last chatbot message is unchanged
  assert(repo.MarkChatbotReminderSent(*tx, org, transferred, 499).rows_affected == 0);
  assert(!repo.GetContact(*tx, org, transferred)->chatbot_reminder_sent);
  assert(repo.MarkChatbotReminderSent(*tx, org, transferred, 500).rows_affected == 1);
  assert(repo.GetContact(*tx, org, transferred)->chatbot_reminder_sent);

  handoff::db::model::ChatbotSessionRecord session;
  session.id              = NewId();
  session.organization_id = org;
  session.contact_id      = idle;
  session.started_at_ms   = 400;
  assert(repo.InsertChatbotSession(*tx, session));
  assert(repo.CancelActiveChatbotSessions(*tx, org, idle, 700).rows_affected == 1);
  assert(repo.CancelActiveChatbotSessions(*tx, org, idle, 800).rows_affected == 0);
  const auto sessions = repo.ListChatbotSessions(*tx, org, idle);
  assert(sessions.size() == 1);
  assert(sessions[0].status == handoff::db::model::ChatbotSessionStatus::kCancelled);
  assert(sessions[0].completed_at_ms == 700);
  tx->Commit();
}

void VerifySettingsRoundTrip(Repository& repo, const std::string& org) {
  OrganizationSettings settings          = handoff::model::DefaultSettings(org);
  settings.account                       = "sales";
  settings.mask_phone_numbers            = true;
  settings.sla.enabled                   = true;
  settings.sla.response_minutes          = 10;
  settings.sla.auto_close_message        = "Closing";
  settings.sla.escalation_notify_ids     = {NewId(), NewId()};
  settings.client_inactivity.reminder_enabled = true;
  settings.client_inactivity.reminder_message = "Still there?";
  settings.business_hours.enabled        = true;
  settings.business_hours.utc_offset_minutes = -300;
  settings.business_hours.days.push_back({1, true, 540, 1020});
  SaveSettings(repo, settings);

  auto tx     = repo.Begin();
  auto stored = repo.GetSettings(*tx, org, "sales");
  assert(stored);
  assert(stored->mask_phone_numbers);
  assert(stored->sla.response_minutes == 10);
  assert(stored->sla.auto_close_message == "Closing");
  assert(stored->sla.escalation_notify_ids == settings.sla.escalation_notify_ids);
  assert(stored->client_inactivity.reminder_message == "Still there?");
  assert(stored->business_hours.utc_offset_minutes == -300);
  assert(stored->business_hours.days.size() == 1);
  assert(stored->business_hours.days[0].close_minute == 1020);
  assert(!repo.GetSettings(*tx, org, ""));

  const auto enabled = repo.ListSlaEnabledSettings(*tx);
  assert(std::any_of(enabled.begin(), enabled.end(),
                     [&](const OrganizationSettings& s) { return s.organization_id == org && s.account == "sales"; }));
  tx->Commit();

  settings.sla.response_minutes = 20;
  SaveSettings(repo, settings);
  auto check = repo.Begin();
  assert(repo.GetSettings(*check, org, "sales")->sla.response_minutes == 20);
  check->Commit();
}

void VerifyOutbox(Repository& repo, const std::string& org) {
  OutboundMessageRecord message;
  message.organization_id = org;
  message.account         = "main";
  message.contact_id      = SeedContact(repo, org);
  message.phone_number    = "+15551234567";
  message.content         = "hello";
  message.created_at_ms   = NowMs();

  auto tx = repo.Begin();
  assert(repo.InsertOutboundMessage(*tx, message));
  assert(message.id != 0);
  const auto queued = repo.ListOutboundMessages(*tx, org);
  assert(queued.size() == 1);
  assert(queued[0].content == "hello");
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& org) {
  const auto contact = SeedContact(repo, org);
  {
    auto tx = repo.Begin();
    assert(repo.InsertTransfer(*tx, Queued(org, contact, 1)));
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(repo.InsertTransfer(*tx, Queued(org, contact, 1)));
    // no commit, the destructor rolls back
  }
  auto check_tx = repo.Begin();
  assert(!repo.FindActiveTransfer(*check_tx, org, contact));
  check_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }
  const auto org  = NewId();
  auto       repo = backend.make_repository();

  const auto contact = SeedContact(*repo, org, "+15550001111", "Grace");
  auto       t       = Queued(org, contact, 1234);
  t.team_id          = NewId();
  t.escalation_level = 1;
  Insert(*repo, t);

  backend.restart(repo);

  const auto stored = LoadTransfer(*repo, org, t.id);
  assert(stored);
  assert(stored->team_id == t.team_id);
  assert(stored->escalation_level == 1);
  assert(stored->transferred_at_ms == 1234);
  assert(LoadContact(*repo, org, contact)->profile_name == "Grace");
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if HANDOFF_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("handoff_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<handoff::db::sqlite::SqliteDB>(db_path);
    db->Bootstrap();
    return std::make_shared<handoff::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = [db_path]() { std::filesystem::remove(db_path); },
      .supports_parallel_transactions = false,
  };
}
#endif

#if HANDOFF_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("HANDOFF_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("HANDOFF_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<handoff::db::postgres::PgPool>(conninfo);
    pool->Bootstrap();
    return std::make_shared<handoff::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // a fresh organization per run keeps persistent backends independent of old rows
  VerifyDirectory(*repo, NewId());
  VerifyTransferLifecycle(*repo, NewId());
  VerifyClaimOrder(*repo, NewId());
  VerifyParallelClaims(*repo, NewId(), backend.supports_parallel_transactions);
  VerifySchedulerQueries(*repo, NewId());
  VerifyChatbotTracking(*repo, NewId());
  VerifySettingsRoundTrip(*repo, NewId());
  VerifyOutbox(*repo, NewId());
  VerifyRollbackBehavior(*repo, NewId());

  repo.reset();
  VerifyRestartDurability(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if HANDOFF_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if HANDOFF_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "handoff_integration_repository_parity: pass\n";
  return 0;
}
