#include "sla_scheduler.hpp"

#include <exception>
#include <map>
#include <utility>
#include <vector>

#include "internal/model/settings.hpp"
#include "internal/model/transfer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/transfer/transfer_events.hpp"

namespace handoff::scheduler {

using handoff::observability::BoolField;
using handoff::observability::IntField;
using handoff::observability::StringField;

namespace {

using TransferWithContact = std::pair<db::model::TransferRecord, db::model::ContactRecord>;

// one settings row per organization: the default row when present
std::vector<model::OrganizationSettings> PerOrganization(const std::vector<model::OrganizationSettings>& rows) {
  std::map<std::string, model::OrganizationSettings> chosen;
  for (const auto& row : rows) {
    auto it = chosen.find(row.organization_id);
    if (it == chosen.end()) {
      chosen.emplace(row.organization_id, row);
    } else if (row.account.empty() && !it->second.account.empty()) {
      it->second = row;
    }
  }

  std::vector<model::OrganizationSettings> out;
  out.reserve(chosen.size());
  for (auto& [_, settings] : chosen) {
    out.push_back(std::move(settings));
  }
  return out;
}

std::string AppendNote(const std::string& notes) {
  if (notes.empty()) {
    return model::kAutoCloseNote;
  }
  return notes + "\n" + model::kAutoCloseNote;
}

void RowFailed(const char* step, const db::model::TransferRecord& t, const std::exception& e, TickReport& report) {
  ++report.failures;
  HANDOFF_LOG_ERROR("sla row failed", {StringField("step", step), StringField("transfer_id", t.id),
                                       StringField("organization_id", t.organization_id), StringField("error", e.what())});
}

} // namespace

SlaScheduler::SlaScheduler(std::shared_ptr<db::Repository> repository, std::shared_ptr<settings::SettingsCache> settings,
                           notify::Notifiers notifiers, std::chrono::milliseconds interval, util::NowFn now)
    : repository_(std::move(repository)),
      settings_(std::move(settings)),
      notifiers_(std::move(notifiers)),
      inactivity_(repository_, notifiers_.sender),
      interval_(interval),
      now_(std::move(now)) {
}

SlaScheduler::~SlaScheduler() {
  Stop();
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

void SlaScheduler::Start() {
  if (running_.exchange(true)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    stop_requested_ = false;
  }
  thread_ = std::thread(&SlaScheduler::Loop, this);
  HANDOFF_LOG_INFO("sla scheduler started", {IntField("interval_ms", interval_.count())});
}

void SlaScheduler::Start(std::stop_token token) {
  Start();
  stop_callback_.emplace(std::move(token), std::function<void()>([this] { RequestStop(); }));
}

void SlaScheduler::RequestStop() {
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    stop_requested_ = true;
  }
  wake_.notify_all();
}

void SlaScheduler::Stop() {
  stop_callback_.reset();
  RequestStop();
  if (thread_.joinable()) {
    thread_.join();
    HANDOFF_LOG_INFO("sla scheduler stopped");
  }
  running_ = false;
}

void SlaScheduler::Loop() {
  while (true) {
    {
      std::unique_lock<std::mutex> lock(wait_mutex_);
      if (wake_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
        break;
      }
    }

    const auto started = std::chrono::steady_clock::now();
    const auto report  = RunOnce(util::ToUnixMillis(now_()));
    const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();

    observability::Metrics::Instance().ObserveSchedulerTickMs(elapsed);
    HANDOFF_LOG_DEBUG("sla tick", {IntField("organizations", static_cast<int64_t>(report.organizations)),
                                   IntField("expired", static_cast<int64_t>(report.expired)),
                                   IntField("escalated", static_cast<int64_t>(report.escalated)),
                                   IntField("breached", static_cast<int64_t>(report.breached)),
                                   IntField("failures", static_cast<int64_t>(report.failures))});
  }
}

// ------------------------------------------------------------
// Tick
// ------------------------------------------------------------

TickReport SlaScheduler::RunOnce(uint64_t now_ms) {
  observability::SpanScope span("SlaScheduler.Tick");
  TickReport               report;

  std::vector<model::OrganizationSettings> organizations;
  try {
    organizations = PerOrganization(settings_->SlaEnabled());
  } catch (const std::exception& e) {
    HANDOFF_LOG_ERROR("failed to load sla settings", {StringField("error", e.what())});
    span.RecordException(e.what());
    ++report.failures;
    return report;
  }

  for (const auto& settings : organizations) {
    if (!model::NeedsScheduling(settings)) {
      continue;
    }
    ProcessOrganization(settings, now_ms, report);
    ++report.organizations;
  }

  auto& metrics = observability::Metrics::Instance();
  metrics.RecordSlaTransitions("expired", report.expired);
  metrics.RecordSlaTransitions("escalated", report.escalated);
  metrics.RecordSlaTransitions("breached", report.breached);
  metrics.RecordSlaTransitions("reminder", report.reminders);
  metrics.RecordSlaTransitions("inactivity_close", report.sessions_closed);

  span.SetAttribute("organizations", static_cast<std::int64_t>(report.organizations));
  return report;
}

void SlaScheduler::ProcessOrganization(const model::OrganizationSettings& settings, uint64_t now_ms, TickReport& report) {
  const auto& org = settings.organization_id;
  const auto& sla = settings.sla;

  auto step = [&](const char* name, auto&& fn) {
    try {
      fn();
    } catch (const std::exception& e) {
      ++report.failures;
      HANDOFF_LOG_ERROR("sla step failed", {StringField("step", name), StringField("organization_id", org),
                                            StringField("error", e.what())});
    }
  };

  if (sla.auto_close_hours > 0) {
    step("auto_close", [&] { AutoClose(settings, now_ms, report); });
  }
  if (sla.escalation_minutes > 0) {
    step("escalate", [&] { Escalate(settings, now_ms, report); });
  }
  if (sla.response_minutes > 0) {
    step("breach_sweep", [&] { report.breached += SweepBreaches(org, now_ms); });
  }
  if (settings.client_inactivity.reminder_enabled) {
    step("inactivity", [&] {
      const auto result = inactivity_.RunOnce(org, settings, now_ms);
      report.reminders += result.reminders_sent;
      report.sessions_closed += result.sessions_closed;
      report.failures += result.failures;
    });
  }
}

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------

void SlaScheduler::TrySend(const db::model::TransferRecord& transfer, const db::model::ContactRecord& contact,
                           const std::string& content) {
  if (content.empty() || !notifiers_.sender) {
    return;
  }
  try {
    notifiers_.sender->Send(transfer.account, contact, content, notify::SlaSendOptions());
  } catch (const std::exception& e) {
    HANDOFF_LOG_WARN("sla message failed", {StringField("transfer_id", transfer.id), StringField("error", e.what())});
  }
}

void SlaScheduler::Broadcast(const std::string& organization_id, const char* event, const notify::Payload& payload) {
  if (!notifiers_.broadcaster) {
    return;
  }
  try {
    notifiers_.broadcaster->NotifyOrg(organization_id, event, payload);
  } catch (const std::exception& e) {
    HANDOFF_LOG_WARN("broadcast failed", {StringField("event", event), StringField("error", e.what())});
  }
}

// ------------------------------------------------------------
// Steps
// ------------------------------------------------------------

void SlaScheduler::AutoClose(const model::OrganizationSettings& settings, uint64_t now_ms, TickReport& report) {
  const auto& org = settings.organization_id;

  std::vector<TransferWithContact> due;
  {
    auto tx = repository_->Begin();
    for (auto& t : repository_->ListExpiredTransfers(*tx, org, now_ms)) {
      auto contact = repository_->GetContact(*tx, org, t.contact_id);
      due.emplace_back(std::move(t), contact.value_or(db::model::ContactRecord{}));
    }
    tx->Commit();
  }

  for (auto& [t, contact] : due) {
    TrySend(t, contact, settings.sla.auto_close_message);

    const auto notes = AppendNote(t.notes);
    try {
      auto       tx  = repository_->Begin();
      const auto res = repository_->ExpireTransfer(*tx, t.id, now_ms, notes);
      db::ThrowIfDbError(res, "expire transfer");
      if (res.rows_affected == 0) {
        // resumed or closed since the listing
        continue;
      }
      tx->Commit();
    } catch (const std::exception& e) {
      RowFailed("auto_close", t, e, report);
      continue;
    }

    t.status        = v1::TRANSFER_STATUS_EXPIRED;
    t.resumed_at_ms = now_ms;
    t.notes         = notes;
    ++report.expired;

    HANDOFF_LOG_INFO("transfer auto-closed", {StringField("transfer_id", t.id), StringField("organization_id", org)});
    Broadcast(org, transfer::kEventExpired, transfer::StatusPayload(t, contact, settings.mask_phone_numbers));
  }
}

void SlaScheduler::Escalate(const model::OrganizationSettings& settings, uint64_t now_ms, TickReport& report) {
  const auto& org = settings.organization_id;
  const auto& sla = settings.sla;

  std::vector<TransferWithContact> due;
  {
    auto tx = repository_->Begin();
    for (auto& t : repository_->ListEscalationDueTransfers(*tx, org, now_ms)) {
      auto contact = repository_->GetContact(*tx, org, t.contact_id);
      due.emplace_back(std::move(t), contact.value_or(db::model::ContactRecord{}));
    }
    tx->Commit();
  }

  for (auto& [t, contact] : due) {
    if (t.escalation_level >= model::kMaxEscalationLevel) {
      continue;
    }
    const int  level         = t.escalation_level + 1;
    const bool mark_breached = !t.sla_breached && t.response_deadline_ms > 0 && now_ms > t.response_deadline_ms;

    try {
      auto       tx  = repository_->Begin();
      const auto res = repository_->EscalateTransfer(*tx, t.id, t.escalation_level, now_ms, mark_breached);
      db::ThrowIfDbError(res, "escalate transfer");
      if (res.rows_affected == 0) {
        continue;
      }
      tx->Commit();
    } catch (const std::exception& e) {
      RowFailed("escalate", t, e, report);
      continue;
    }

    t.escalation_level = level;
    t.escalated_at_ms  = now_ms;
    if (mark_breached) {
      t.sla_breached       = true;
      t.sla_breached_at_ms = now_ms;
    }
    ++report.escalated;

    HANDOFF_LOG_INFO("transfer escalated", {StringField("transfer_id", t.id), IntField("level", level),
                                                   BoolField("breached", t.sla_breached)});

    if (!sla.escalation_notify_ids.empty()) {
      Broadcast(org, transfer::kEventEscalation,
                transfer::EscalationPayload(t, contact, level, sla.escalation_notify_ids, settings.mask_phone_numbers));
    }
    Broadcast(org, transfer::kEventEscalated, transfer::StatusPayload(t, contact, settings.mask_phone_numbers));

    if (level == 1) {
      TrySend(t, contact, sla.warning_message);
    }
  }
}

uint64_t SlaScheduler::SweepBreaches(const std::string& organization_id, uint64_t now_ms) {
  auto       tx  = repository_->Begin();
  const auto res = repository_->MarkUnassignedBreached(*tx, organization_id, now_ms);
  db::ThrowIfDbError(res, "mark breached");
  tx->Commit();

  if (res.rows_affected > 0) {
    HANDOFF_LOG_INFO("unassigned transfers breached",
                     {StringField("organization_id", organization_id), IntField("count", static_cast<int64_t>(res.rows_affected))});
  }
  return res.rows_affected;
}

} // namespace handoff::scheduler
