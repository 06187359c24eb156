#include "inactivity_monitor.hpp"

#include <exception>
#include <vector>

#include "internal/observability/logging.hpp"

namespace handoff::scheduler {

using handoff::observability::IntField;
using handoff::observability::StringField;

namespace {

constexpr uint64_t kMinuteMs = 60 * 1000;

} // namespace

InactivityMonitor::InactivityMonitor(std::shared_ptr<db::Repository> repository, std::shared_ptr<notify::MessageSender> sender)
    : repository_(std::move(repository)), sender_(std::move(sender)) {
}

bool InactivityMonitor::TrySend(const std::string& account, const db::model::ContactRecord& contact, const std::string& content) {
  if (!sender_) {
    return false;
  }
  try {
    sender_->Send(account, contact, content, notify::SlaSendOptions());
    return true;
  } catch (const std::exception& e) {
    HANDOFF_LOG_WARN("inactivity message failed", {StringField("contact_id", contact.id), StringField("error", e.what())});
    return false;
  }
}

InactivityReport InactivityMonitor::RunOnce(const std::string& organization_id, const model::OrganizationSettings& settings,
                                            uint64_t now_ms) {
  InactivityReport report;

  std::vector<db::model::ContactRecord> candidates;
  {
    auto tx    = repository_->Begin();
    candidates = repository_->ListInactivityCandidates(*tx, organization_id);
    tx->Commit();
  }

  for (const auto& contact : candidates) {
    try {
      Process(organization_id, settings, contact, now_ms, report);
    } catch (const std::exception& e) {
      ++report.failures;
      HANDOFF_LOG_ERROR("inactivity update failed", {StringField("contact_id", contact.id),
                                                     StringField("organization_id", organization_id),
                                                     StringField("error", e.what())});
    }
  }
  return report;
}

void InactivityMonitor::Process(const std::string& organization_id, const model::OrganizationSettings& settings,
                                const db::model::ContactRecord& contact, uint64_t now_ms, InactivityReport& report) {
  const auto&    inactivity   = settings.client_inactivity;
  const uint64_t close_after  = static_cast<uint64_t>(inactivity.auto_close_minutes) * kMinuteMs;
  const uint64_t remind_after = static_cast<uint64_t>(inactivity.reminder_minutes) * kMinuteMs;

  const uint64_t last    = contact.chatbot_last_message_at_ms;
  const uint64_t elapsed = now_ms > last ? now_ms - last : 0;

  if (close_after > 0 && elapsed >= close_after) {
    // the close message is best-effort; tracking is cleared regardless
    if (!inactivity.auto_close_message.empty()) {
      TrySend(contact.account, contact, inactivity.auto_close_message);
    }
    auto tx = repository_->Begin();
    db::ThrowIfDbError(repository_->SetChatbotTracking(*tx, organization_id, contact.id, 0, false), "clear chatbot tracking");
    tx->Commit();
    ++report.sessions_closed;
    HANDOFF_LOG_INFO("chatbot session closed for inactivity",
                     {StringField("contact_id", contact.id), IntField("idle_ms", static_cast<int64_t>(elapsed))});
    return;
  }

  if (remind_after == 0 || contact.chatbot_reminder_sent || elapsed < remind_after) {
    return;
  }
  if (inactivity.reminder_message.empty()) {
    return;
  }
  if (!TrySend(contact.account, contact, inactivity.reminder_message)) {
    return;
  }

  auto       tx     = repository_->Begin();
  const auto marked = repository_->MarkChatbotReminderSent(*tx, organization_id, contact.id, last);
  db::ThrowIfDbError(marked, "mark reminder sent");
  tx->Commit();
  ++report.reminders_sent;
  if (marked.rows_affected == 0) {
    HANDOFF_LOG_DEBUG("chatbot spoke again during the reminder", {StringField("contact_id", contact.id)});
    return;
  }
  HANDOFF_LOG_INFO("inactivity reminder sent", {StringField("contact_id", contact.id)});
}

} // namespace handoff::scheduler
