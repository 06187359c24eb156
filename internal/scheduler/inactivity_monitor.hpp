#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/model/settings.hpp"
#include "internal/notify/notifier.hpp"

namespace handoff::scheduler {

struct InactivityReport {
  uint64_t reminders_sent  = 0;
  uint64_t sessions_closed = 0;
  uint64_t failures        = 0; // contacts whose update threw
};

/*
  Client inactivity pass for automated conversations.

  A contact qualifies while chatbot tracking is set and it has no
  active transfer. Auto-close wins over the reminder when both
  thresholds have passed; closing clears tracking so the contact drops
  out of later passes. A reminder is marked sent only after the send
  succeeded, and only if no newer chatbot message arrived meanwhile. A
  contact whose update fails is logged and skipped.
*/
class InactivityMonitor {
 public:
  InactivityMonitor(std::shared_ptr<db::Repository> repository, std::shared_ptr<notify::MessageSender> sender);

  InactivityReport RunOnce(const std::string& organization_id, const model::OrganizationSettings& settings, uint64_t now_ms);

 private:
  bool TrySend(const std::string& account, const db::model::ContactRecord& contact, const std::string& content);

  void Process(const std::string& organization_id, const model::OrganizationSettings& settings,
               const db::model::ContactRecord& contact, uint64_t now_ms, InactivityReport& report);

  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<notify::MessageSender> sender_;
};

} // namespace handoff::scheduler
