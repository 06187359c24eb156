#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

#include "inactivity_monitor.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/settings/settings_cache.hpp"
#include "internal/util/time.hpp"

namespace handoff::scheduler {

struct TickReport {
  uint64_t organizations   = 0; // organizations with at least one step configured
  uint64_t expired         = 0;
  uint64_t escalated       = 0;
  uint64_t breached        = 0;
  uint64_t reminders       = 0;
  uint64_t sessions_closed = 0;
  uint64_t failures        = 0; // rows or steps that threw and were skipped
};

/*
  Recurring SLA loop.

  Every tick walks the SLA-enabled organizations one after another and
  runs, as configured:

    auto-close    expired deadline -> status expired
    escalate      escalation deadline -> level + 1 (capped)
    breach sweep  unassigned past response deadline -> breached
    inactivity    chatbot reminders and session close

  Customer texts are sent synchronously, never inside a repository
  transaction. A failing row is logged and the step moves on to the
  next one; a failing step is logged and the tick moves on.

  Stop() (or the stop_token given to Start) prevents the next tick; a
  tick in progress runs to completion.
*/
class SlaScheduler {
 public:
  SlaScheduler(std::shared_ptr<db::Repository> repository, std::shared_ptr<settings::SettingsCache> settings,
               notify::Notifiers notifiers, std::chrono::milliseconds interval, util::NowFn now = util::Now);
  ~SlaScheduler();

  SlaScheduler(const SlaScheduler&)            = delete;
  SlaScheduler& operator=(const SlaScheduler&) = delete;

  void Start();
  void Start(std::stop_token token);
  void Stop();

  bool Running() const {
    return running_;
  }

  // one synchronous pass; used by the loop and by tests
  TickReport RunOnce(uint64_t now_ms);

 private:
  void Loop();
  void RequestStop();

  void ProcessOrganization(const model::OrganizationSettings& settings, uint64_t now_ms, TickReport& report);

  void     AutoClose(const model::OrganizationSettings& settings, uint64_t now_ms, TickReport& report);
  void     Escalate(const model::OrganizationSettings& settings, uint64_t now_ms, TickReport& report);
  uint64_t SweepBreaches(const std::string& organization_id, uint64_t now_ms);

  // best-effort customer text; failures are logged only
  void TrySend(const db::model::TransferRecord& transfer, const db::model::ContactRecord& contact, const std::string& content);

  void Broadcast(const std::string& organization_id, const char* event, const notify::Payload& payload);

  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<settings::SettingsCache> settings_;
  notify::Notifiers                        notifiers_;
  InactivityMonitor                        inactivity_;
  std::chrono::milliseconds                interval_;
  util::NowFn                              now_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              wait_mutex_;
  std::condition_variable wake_;
  bool                    stop_requested_ = false;

  std::optional<std::stop_callback<std::function<void()>>> stop_callback_;
};

} // namespace handoff::scheduler
