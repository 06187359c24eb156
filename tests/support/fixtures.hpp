#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/caller.hpp"
#include "internal/model/settings.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/util/time.hpp"

namespace handoff::testing {

/*
  Shared helpers for the unit and integration tests.
*/

// Pinned clock that tests advance by hand.
class FakeClock {
 public:
  explicit FakeClock(uint64_t start_ms = 1'700'000'000'000ULL);

  util::NowFn Fn() const;

  uint64_t NowMs() const;
  void     Set(uint64_t ms);
  void     AdvanceMinutes(uint64_t minutes);

 private:
  std::shared_ptr<uint64_t>   now_ms_;
  std::shared_ptr<std::mutex> mutex_;
};

struct RecordedEvent {
  std::string organization_id;
  std::string type;
  std::string json;
};

class RecordingNotifier final : public notify::Broadcaster, public notify::EventDispatcher {
 public:
  void NotifyOrg(const std::string& organization_id, std::string_view event_type, const notify::Payload& payload) override;
  void Dispatch(const std::string& organization_id, std::string_view event, const notify::Payload& payload) override;

  std::vector<RecordedEvent> Broadcasts() const;
  std::vector<RecordedEvent> Webhooks() const;

  size_t CountBroadcasts(const std::string& type) const;
  size_t CountWebhooks(const std::string& type) const;

  void Clear();

 private:
  mutable std::mutex         mutex_;
  std::vector<RecordedEvent> broadcasts_;
  std::vector<RecordedEvent> webhooks_;
};

struct SentMessage {
  std::string         account;
  std::string         contact_id;
  std::string         content;
  notify::SendOptions options;
};

// Records every send; throws std::runtime_error while `fail` is set.
class RecordingSender final : public notify::MessageSender {
 public:
  notify::SendResult Send(const std::string& account, const db::model::ContactRecord& contact, const std::string& content,
                          const notify::SendOptions& options) override;

  std::vector<SentMessage> Sent() const;
  size_t                   CountContent(const std::string& content) const;

  void SetFail(bool fail);

 private:
  mutable std::mutex       mutex_;
  std::vector<SentMessage> sent_;
  bool                     fail_ = false;
};

// ------------------------------------------------------------
// Seeding; each call runs in its own committed transaction
// ------------------------------------------------------------

inline const std::string kOrg      = "0f3b7a52-9d1e-4c8a-b2f6-1a2b3c4d5e6f";
inline const std::string kOtherOrg = "7c9e6679-7425-40de-944b-e07fc1f90ae7";

std::string SeedUser(db::Repository& repo, const std::string& org, v1::Role role = v1::ROLE_AGENT, bool available = true,
                     bool active = true);

std::string SeedTeam(db::Repository& repo, const std::string& org,
                     model::AssignmentStrategy strategy = model::AssignmentStrategy::kRoundRobin, bool active = true);

void AddMember(db::Repository& repo, const std::string& team_id, const std::string& user_id,
               model::TeamRole role = model::TeamRole::kAgent, uint64_t last_assigned_at_ms = 0);

std::string SeedContact(db::Repository& repo, const std::string& org, const std::string& phone = "+15551234567",
                        const std::string& name = "Ada", std::optional<std::string> assigned_user_id = std::nullopt);

void SaveSettings(db::Repository& repo, const model::OrganizationSettings& settings);

// read-back helpers
std::optional<db::model::TransferRecord> LoadTransfer(db::Repository& repo, const std::string& org, const std::string& id);
std::optional<db::model::ContactRecord>  LoadContact(db::Repository& repo, const std::string& org, const std::string& id);

model::Caller MakeCaller(const std::string& org, const std::string& user_id, v1::Role role);

} // namespace handoff::testing
