#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/model/transfer.hpp"
#include "internal/routing/assignment_strategy.hpp"
#include "internal/scheduler/sla_scheduler.hpp"
#include "internal/settings/settings_cache.hpp"
#include "internal/transfer/transfer_events.hpp"
#include "internal/transfer/transfer_queue.hpp"
#include "support/fixtures.hpp"
#include "support/forwarding_repository.hpp"

namespace {

using handoff::db::ErrorCode;
using handoff::db::QueueScope;
using handoff::db::Result;
using handoff::db::Transaction;
using handoff::db::memory::MemoryRepository;
using handoff::db::model::TransferRecord;
using handoff::model::OrganizationSettings;
using handoff::scheduler::SlaScheduler;
using handoff::scheduler::TickReport;
using handoff::transfer::CreateTransferParams;
using handoff::transfer::TransferQueue;
using namespace handoff::testing;
using namespace handoff::v1;
using namespace std::chrono_literals;

constexpr uint64_t kMinute = 60 * 1000;

struct Harness {
  explicit Harness(const OrganizationSettings& settings, std::chrono::milliseconds interval = 1h) {
    SaveSettings(*repo, settings);
    scheduler = std::make_unique<SlaScheduler>(repo, cache, handoff::notify::Notifiers{notifier, notifier, sender}, interval,
                                               clock.Fn());
  }

  handoff::db::model::TransferRecord Create(const std::string& notes = "") {
    CreateTransferParams params;
    params.contact_id = SeedContact(*repo, kOrg);
    params.account    = "main";
    params.notes      = notes;
    return queue.Create(MakeCaller(kOrg, admin, ROLE_ADMIN), params);
  }

  std::shared_ptr<MemoryRepository>                 repo = std::make_shared<MemoryRepository>();
  FakeClock                                         clock;
  uint64_t                                          t0       = clock.NowMs();
  std::shared_ptr<RecordingNotifier>                notifier = std::make_shared<RecordingNotifier>();
  std::shared_ptr<RecordingSender>                  sender   = std::make_shared<RecordingSender>();
  std::shared_ptr<handoff::settings::SettingsCache> cache =
      std::make_shared<handoff::settings::SettingsCache>(repo, 0ms, clock.Fn());
  TransferQueue queue{repo, cache, std::make_shared<handoff::routing::AgentSelector>(repo, clock.Fn()),
                      handoff::notify::Notifiers{notifier, notifier, sender}, clock.Fn()};
  std::string                   admin = SeedUser(*repo, kOrg, ROLE_ADMIN);
  std::unique_ptr<SlaScheduler> scheduler;
};

OrganizationSettings SlaOn() {
  auto settings        = handoff::model::DefaultSettings(kOrg);
  settings.sla.enabled = true;
  return settings;
}

void TestUnassignedTransferBreachesOnce() {
  auto settings                 = SlaOn();
  settings.sla.response_minutes = 10;
  Harness h(settings);

  const auto t = h.Create();
  assert(h.scheduler->RunOnce(h.t0 + 9 * kMinute).breached == 0);

  const auto report = h.scheduler->RunOnce(h.t0 + 11 * kMinute);
  assert(report.organizations == 1);
  assert(report.breached == 1);
  assert(LoadTransfer(*h.repo, kOrg, t.id)->sla_breached_at_ms == h.t0 + 11 * kMinute);

  assert(h.scheduler->RunOnce(h.t0 + 20 * kMinute).breached == 0);
  const auto stored = LoadTransfer(*h.repo, kOrg, t.id);
  assert(stored->sla_breached);
  assert(stored->sla_breached_at_ms == h.t0 + 11 * kMinute);
  assert(stored->status == TRANSFER_STATUS_ACTIVE);
}

void TestEscalationIsCapped() {
  auto settings                      = SlaOn();
  settings.sla.escalation_minutes    = 5;
  settings.sla.warning_message       = "An agent will be with you shortly";
  settings.sla.escalation_notify_ids = {"supervisor"};
  Harness h(settings);

  const auto t = h.Create();
  assert(h.scheduler->RunOnce(h.t0 + 4 * kMinute).escalated == 0);

  assert(h.scheduler->RunOnce(h.t0 + 6 * kMinute).escalated == 1);
  auto stored = LoadTransfer(*h.repo, kOrg, t.id);
  assert(stored->escalation_level == 1);
  assert(stored->escalated_at_ms == h.t0 + 6 * kMinute);
  assert(!stored->sla_breached); // no response deadline configured
  assert(h.sender->CountContent(settings.sla.warning_message) == 1);
  assert(h.sender->Sent().front().options.dispatch_webhook == false);
  assert(h.notifier->CountBroadcasts(handoff::transfer::kEventEscalation) == 1);
  assert(h.notifier->CountBroadcasts(handoff::transfer::kEventEscalated) == 1);

  assert(h.scheduler->RunOnce(h.t0 + 7 * kMinute).escalated == 1);
  assert(LoadTransfer(*h.repo, kOrg, t.id)->escalation_level == 2);
  assert(h.sender->CountContent(settings.sla.warning_message) == 1); // level 1 only

  assert(h.scheduler->RunOnce(h.t0 + 8 * kMinute).escalated == 0);
  assert(h.scheduler->RunOnce(h.t0 + 60 * kMinute).escalated == 0);
  assert(LoadTransfer(*h.repo, kOrg, t.id)->escalation_level == handoff::model::kMaxEscalationLevel);
  assert(h.notifier->CountBroadcasts(handoff::transfer::kEventEscalated) == 2);
}

void TestEscalationMarksOverdueTransfersBreached() {
  auto settings                   = SlaOn();
  settings.sla.escalation_minutes = 15;
  settings.sla.response_minutes   = 10;
  Harness h(settings);

  // assigned, so the breach sweep leaves it alone
  const auto agent = SeedUser(*h.repo, kOrg);
  const auto t     = h.Create();
  h.queue.Assign(MakeCaller(kOrg, h.admin, ROLE_ADMIN), t.id, agent);

  const auto report = h.scheduler->RunOnce(h.t0 + 16 * kMinute);
  assert(report.escalated == 1);
  assert(report.breached == 0);
  const auto stored = LoadTransfer(*h.repo, kOrg, t.id);
  assert(stored->sla_breached);
  assert(stored->sla_breached_at_ms == h.t0 + 16 * kMinute);
}

void TestAutoCloseIsIdempotent() {
  auto settings                   = SlaOn();
  settings.sla.auto_close_hours   = 1;
  settings.sla.auto_close_message = "Closing this conversation";
  Harness h(settings);

  const auto with_notes = h.Create("vip customer");
  const auto bare       = h.Create();
  const auto later      = h.t0 + 61 * kMinute;

  const auto report = h.scheduler->RunOnce(later);
  assert(report.expired == 2);

  auto stored = LoadTransfer(*h.repo, kOrg, with_notes.id);
  assert(stored->status == TRANSFER_STATUS_EXPIRED);
  assert(stored->resumed_at_ms == later);
  assert(stored->notes == std::string("vip customer\n") + handoff::model::kAutoCloseNote);
  assert(LoadTransfer(*h.repo, kOrg, bare.id)->notes == handoff::model::kAutoCloseNote);
  assert(h.sender->CountContent(settings.sla.auto_close_message) == 2);
  assert(h.notifier->CountBroadcasts(handoff::transfer::kEventExpired) == 2);

  assert(h.scheduler->RunOnce(later + kMinute).expired == 0);
  assert(h.sender->CountContent(settings.sla.auto_close_message) == 2);
  assert(LoadTransfer(*h.repo, kOrg, bare.id)->resumed_at_ms == later);
}

void TestResumedTransfersAreLeftAlone() {
  auto settings                 = SlaOn();
  settings.sla.auto_close_hours = 1;
  settings.sla.response_minutes = 10;
  Harness h(settings);

  const auto t = h.Create();
  h.queue.Resume(MakeCaller(kOrg, h.admin, ROLE_ADMIN), t.id);

  const auto report = h.scheduler->RunOnce(h.t0 + 2 * 60 * kMinute);
  assert(report.expired == 0);
  assert(report.breached == 0);
  assert(LoadTransfer(*h.repo, kOrg, t.id)->status == TRANSFER_STATUS_RESUMED);
}

void TestInactivityReminderThenClose() {
  auto settings                                 = SlaOn();
  settings.client_inactivity.reminder_enabled   = true;
  settings.client_inactivity.reminder_minutes   = 5;
  settings.client_inactivity.reminder_message   = "Are you still there?";
  settings.client_inactivity.auto_close_minutes = 15;
  settings.client_inactivity.auto_close_message = "Closing the chat";
  Harness h(settings);

  const auto contact = SeedContact(*h.repo, kOrg);
  h.queue.TouchChatbotMessage(kOrg, contact);

  assert(h.scheduler->RunOnce(h.t0 + 4 * kMinute).reminders == 0);
  assert(h.scheduler->RunOnce(h.t0 + 6 * kMinute).reminders == 1);
  assert(LoadContact(*h.repo, kOrg, contact)->chatbot_reminder_sent);
  assert(LoadContact(*h.repo, kOrg, contact)->chatbot_last_message_at_ms == h.t0);
  assert(h.scheduler->RunOnce(h.t0 + 7 * kMinute).reminders == 0);
  assert(h.sender->CountContent("Are you still there?") == 1);

  assert(h.scheduler->RunOnce(h.t0 + 16 * kMinute).sessions_closed == 1);
  assert(h.sender->CountContent("Closing the chat") == 1);
  const auto closed = LoadContact(*h.repo, kOrg, contact);
  assert(closed->chatbot_last_message_at_ms == 0);
  assert(!closed->chatbot_reminder_sent);

  assert(h.scheduler->RunOnce(h.t0 + 30 * kMinute).sessions_closed == 0);
}

void TestTransferredContactsGetNoReminder() {
  auto settings                               = SlaOn();
  settings.client_inactivity.reminder_enabled = true;
  settings.client_inactivity.reminder_minutes = 5;
  settings.client_inactivity.reminder_message = "Are you still there?";
  Harness h(settings);

  const auto t = h.Create();
  h.queue.TouchChatbotMessage(kOrg, t.contact_id);

  assert(h.scheduler->RunOnce(h.t0 + 10 * kMinute).reminders == 0);
  assert(h.sender->Sent().empty());
}

void TestFailingSenderDoesNotBlockTransitions() {
  auto settings                                 = SlaOn();
  settings.sla.auto_close_hours                 = 1;
  settings.sla.auto_close_message               = "Closing this conversation";
  settings.client_inactivity.reminder_enabled   = true;
  settings.client_inactivity.reminder_minutes   = 5;
  settings.client_inactivity.reminder_message   = "Are you still there?";
  Harness h(settings);
  h.sender->SetFail(true);

  const auto t       = h.Create();
  const auto contact = SeedContact(*h.repo, kOrg);
  h.queue.TouchChatbotMessage(kOrg, contact);

  const auto report = h.scheduler->RunOnce(h.t0 + 61 * kMinute);
  assert(report.expired == 1);
  assert(report.failures == 0);
  assert(LoadTransfer(*h.repo, kOrg, t.id)->status == TRANSFER_STATUS_EXPIRED);

  // an undelivered reminder is retried on the next tick
  assert(report.reminders == 0);
  assert(!LoadContact(*h.repo, kOrg, contact)->chatbot_reminder_sent);

  h.sender->SetFail(false);
  assert(h.scheduler->RunOnce(h.t0 + 62 * kMinute).reminders == 1);
}

void TestDisabledOrganizationsAreSkipped() {
  auto settings                 = handoff::model::DefaultSettings(kOrg);
  settings.sla.response_minutes = 10; // sla.enabled stays false
  Harness h(settings);

  const auto t = h.Create();
  assert(t.response_deadline_ms == 0);
  const auto report = h.scheduler->RunOnce(h.t0 + 60 * kMinute);
  assert(report.organizations == 0);
  assert(!LoadTransfer(*h.repo, kOrg, t.id)->sla_breached);
}

// runs on_claim between claiming a queued row and committing the pick
class HookedClaims final : public ForwardingRepository {
 public:
  using ForwardingRepository::ForwardingRepository;

  std::optional<TransferRecord> ClaimNextQueuedTransfer(Transaction& tx, const QueueScope& scope,
                                                        const std::string& agent_id) override {
    auto claimed = inner_->ClaimNextQueuedTransfer(tx, scope, agent_id);
    if (claimed && on_claim) on_claim();
    return claimed;
  }

  std::function<void()> on_claim;
};

// fails the scheduler writes for one transfer and one contact
class FailingRows final : public ForwardingRepository {
 public:
  using ForwardingRepository::ForwardingRepository;

  Result ExpireTransfer(Transaction& tx, const std::string& id, uint64_t now_ms, const std::string& notes) override {
    if (id == transfer_id) return Result::Err(ErrorCode::IOError, "disk full");
    return inner_->ExpireTransfer(tx, id, now_ms, notes);
  }

  Result MarkChatbotReminderSent(Transaction& tx, const std::string& org, const std::string& id,
                                 uint64_t last_message_at_ms) override {
    if (id == contact_id) return Result::Err(ErrorCode::IOError, "disk full");
    return inner_->MarkChatbotReminderSent(tx, org, id, last_message_at_ms);
  }

  std::string transfer_id;
  std::string contact_id;
};

// the chatbot speaks again while the reminder is on the wire
class TouchingSender final : public handoff::notify::MessageSender {
 public:
  handoff::notify::SendResult Send(const std::string&, const handoff::db::model::ContactRecord& contact, const std::string&,
                                   const handoff::notify::SendOptions&) override {
    ++sent;
    if (queue) queue->TouchChatbotMessage(contact.organization_id, contact.id);
    return {};
  }

  TransferQueue* queue = nullptr;
  int            sent  = 0;
};

void TestPickDuringSweepAndEscalation() {
  auto settings                   = SlaOn();
  settings.sla.response_minutes   = 10;
  settings.sla.escalation_minutes = 5;
  Harness h(settings);

  const auto t   = h.Create();
  const auto now = h.t0 + 11 * kMinute;
  h.clock.Set(now);

  auto       hooked = std::make_shared<HookedClaims>(h.repo);
  TickReport during;
  hooked->on_claim = [&] { std::thread([&] { during = h.scheduler->RunOnce(now); }).join(); };
  TransferQueue picker{hooked, h.cache, std::make_shared<handoff::routing::AgentSelector>(hooked, h.clock.Fn()),
                       handoff::notify::Notifiers{h.notifier, h.notifier, h.sender}, h.clock.Fn()};

  const auto picked = picker.PickNext(MakeCaller(kOrg, h.admin, ROLE_ADMIN), std::nullopt);
  assert(picked && picked->id == t.id);

  // the tick left the claimed row to the picker
  assert(during.breached == 0);
  assert(during.escalated == 0);
  assert(during.failures == 0);

  const auto stored = LoadTransfer(*h.repo, kOrg, t.id);
  assert(stored->agent_id == h.admin);
  assert(stored->picked_up_at_ms == now);
  assert(stored->sla_breached);
  assert(stored->sla_breached_at_ms == now);
  assert(stored->escalation_level == 0);

  // the escalation lands on the next tick
  const auto next = h.scheduler->RunOnce(now + kMinute);
  assert(next.escalated == 1);
  assert(next.breached == 0);
  assert(LoadTransfer(*h.repo, kOrg, t.id)->escalation_level == 1);
}

void TestReminderKeepsNewerChatbotMessage() {
  auto settings                                 = SlaOn();
  settings.client_inactivity.reminder_enabled   = true;
  settings.client_inactivity.reminder_minutes   = 5;
  settings.client_inactivity.reminder_message   = "Are you still there?";
  settings.client_inactivity.auto_close_minutes = 15;
  Harness h(settings);

  auto sender = std::make_shared<TouchingSender>();
  sender->queue = &h.queue;
  SlaScheduler scheduler(h.repo, h.cache, handoff::notify::Notifiers{h.notifier, h.notifier, sender}, 1h, h.clock.Fn());

  const auto contact = SeedContact(*h.repo, kOrg);
  h.queue.TouchChatbotMessage(kOrg, contact);

  const auto touched_at = h.t0 + 6 * kMinute;
  h.clock.Set(touched_at);
  assert(scheduler.RunOnce(touched_at).reminders == 1);

  const auto stored = LoadContact(*h.repo, kOrg, contact);
  assert(stored->chatbot_last_message_at_ms == touched_at);
  assert(!stored->chatbot_reminder_sent);

  // closing is measured from the newer message
  assert(scheduler.RunOnce(h.t0 + 16 * kMinute).sessions_closed == 0);
  assert(LoadContact(*h.repo, kOrg, contact)->chatbot_last_message_at_ms != 0);
  assert(sender->sent == 2); // reminded again 5 minutes after the newer message
}

void TestFailingRowDoesNotStopTheStep() {
  auto settings                               = SlaOn();
  settings.sla.auto_close_hours               = 1;
  settings.client_inactivity.reminder_enabled = true;
  settings.client_inactivity.reminder_minutes = 5;
  settings.client_inactivity.reminder_message = "Are you still there?";
  Harness h(settings);

  const auto broken_transfer = h.Create();
  const auto healthy         = h.Create();
  const auto broken_contact  = SeedContact(*h.repo, kOrg);
  const auto idle_contact    = SeedContact(*h.repo, kOrg);
  h.queue.TouchChatbotMessage(kOrg, broken_contact);
  h.queue.TouchChatbotMessage(kOrg, idle_contact);

  auto failing         = std::make_shared<FailingRows>(h.repo);
  failing->transfer_id = broken_transfer.id;
  failing->contact_id  = broken_contact;
  SlaScheduler scheduler(failing, h.cache, handoff::notify::Notifiers{h.notifier, h.notifier, h.sender}, 1h, h.clock.Fn());

  const auto report = scheduler.RunOnce(h.t0 + 61 * kMinute);
  assert(report.expired == 1);
  assert(report.reminders == 1);
  assert(report.failures == 2);
  assert(LoadTransfer(*h.repo, kOrg, broken_transfer.id)->status == TRANSFER_STATUS_ACTIVE);
  assert(LoadTransfer(*h.repo, kOrg, healthy.id)->status == TRANSFER_STATUS_EXPIRED);
  assert(LoadContact(*h.repo, kOrg, idle_contact)->chatbot_reminder_sent);
  assert(!LoadContact(*h.repo, kOrg, broken_contact)->chatbot_reminder_sent);

  // the failed rows are picked up again once the store recovers
  failing->transfer_id.clear();
  failing->contact_id.clear();
  const auto retry = scheduler.RunOnce(h.t0 + 62 * kMinute);
  assert(retry.expired == 1);
  assert(retry.reminders == 1);
  assert(retry.failures == 0);
}

void TestOrganizationsWithoutStepsAreNotCounted() {
  Harness h(SlaOn()); // enabled, but nothing configured

  h.Create();
  const auto report = h.scheduler->RunOnce(h.t0 + 60 * kMinute);
  assert(report.organizations == 0);
  assert(report.expired == 0);
}

void TestLoopStopsOnToken() {
  auto settings                 = SlaOn();
  settings.sla.auto_close_hours = 1;
  Harness h(settings, 5ms);

  const auto t = h.Create();
  h.clock.AdvanceMinutes(61);

  std::stop_source source;
  h.scheduler->Start(source.get_token());
  assert(h.scheduler->Running());

  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (LoadTransfer(*h.repo, kOrg, t.id)->status != TRANSFER_STATUS_EXPIRED) {
    assert(std::chrono::steady_clock::now() < deadline);
    std::this_thread::sleep_for(5ms);
  }

  source.request_stop();
  h.scheduler->Stop();
  assert(!h.scheduler->Running());

  // restartable after a stop
  h.scheduler->Start();
  h.scheduler->Stop();
}

} // namespace

int main() {
  TestUnassignedTransferBreachesOnce();
  TestEscalationIsCapped();
  TestEscalationMarksOverdueTransfersBreached();
  TestAutoCloseIsIdempotent();
  TestResumedTransfersAreLeftAlone();
  TestInactivityReminderThenClose();
  TestTransferredContactsGetNoReminder();
  TestFailingSenderDoesNotBlockTransitions();
  TestDisabledOrganizationsAreSkipped();
  TestPickDuringSweepAndEscalation();
  TestReminderKeepsNewerChatbotMessage();
  TestFailingRowDoesNotStopTheStep();
  TestOrganizationsWithoutStepsAreNotCounted();
  TestLoopStopsOnToken();

  std::cout << "handoff_unit_sla_scheduler: pass\n";
  return 0;
}
