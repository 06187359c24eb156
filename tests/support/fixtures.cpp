#include "fixtures.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/util/uuid.hpp"

namespace handoff::testing {

// ------------------------------------------------------------
// FakeClock
// ------------------------------------------------------------

FakeClock::FakeClock(uint64_t start_ms) : now_ms_(std::make_shared<uint64_t>(start_ms)), mutex_(std::make_shared<std::mutex>()) {
}

util::NowFn FakeClock::Fn() const {
  auto now_ms = now_ms_;
  auto mutex  = mutex_;
  return [now_ms, mutex] {
    std::lock_guard<std::mutex> lock(*mutex);
    return util::FromUnixMillis(*now_ms);
  };
}

uint64_t FakeClock::NowMs() const {
  std::lock_guard<std::mutex> lock(*mutex_);
  return *now_ms_;
}

void FakeClock::Set(uint64_t ms) {
  std::lock_guard<std::mutex> lock(*mutex_);
  *now_ms_ = ms;
}

void FakeClock::AdvanceMinutes(uint64_t minutes) {
  std::lock_guard<std::mutex> lock(*mutex_);
  *now_ms_ += minutes * 60 * 1000;
}

// ------------------------------------------------------------
// RecordingNotifier
// ------------------------------------------------------------

void RecordingNotifier::NotifyOrg(const std::string& organization_id, std::string_view event_type, const notify::Payload& payload) {
  std::lock_guard<std::mutex> lock(mutex_);
  broadcasts_.push_back({organization_id, std::string(event_type), notify::ToJson(payload)});
}

void RecordingNotifier::Dispatch(const std::string& organization_id, std::string_view event, const notify::Payload& payload) {
  std::lock_guard<std::mutex> lock(mutex_);
  webhooks_.push_back({organization_id, std::string(event), notify::ToJson(payload)});
}

std::vector<RecordedEvent> RecordingNotifier::Broadcasts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return broadcasts_;
}

std::vector<RecordedEvent> RecordingNotifier::Webhooks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return webhooks_;
}

size_t RecordingNotifier::CountBroadcasts(const std::string& type) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::count_if(broadcasts_.begin(), broadcasts_.end(), [&](const RecordedEvent& e) { return e.type == type; });
}

size_t RecordingNotifier::CountWebhooks(const std::string& type) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::count_if(webhooks_.begin(), webhooks_.end(), [&](const RecordedEvent& e) { return e.type == type; });
}

void RecordingNotifier::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  broadcasts_.clear();
  webhooks_.clear();
}

// ------------------------------------------------------------
// RecordingSender
// ------------------------------------------------------------

notify::SendResult RecordingSender::Send(const std::string& account, const db::model::ContactRecord& contact,
                                         const std::string& content, const notify::SendOptions& options) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fail_) {
    throw std::runtime_error("channel unavailable");
  }
  sent_.push_back({account, contact.id, content, options});
  return notify::SendResult{sent_.size()};
}

std::vector<SentMessage> RecordingSender::Sent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sent_;
}

size_t RecordingSender::CountContent(const std::string& content) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::count_if(sent_.begin(), sent_.end(), [&](const SentMessage& m) { return m.content == content; });
}

void RecordingSender::SetFail(bool fail) {
  std::lock_guard<std::mutex> lock(mutex_);
  fail_ = fail;
}

// ------------------------------------------------------------
// Seeding
// ------------------------------------------------------------

namespace {

void Check(const db::Result& result, const char* what) {
  if (!result) {
    throw std::runtime_error(std::string("seed ") + what + " failed: " + result.message);
  }
}

} // namespace

std::string SeedUser(db::Repository& repo, const std::string& org, v1::Role role, bool available, bool active) {
  db::model::UserRecord user;
  user.id              = util::NewId();
  user.organization_id = org;
  user.name            = "user-" + user.id.substr(0, 8);
  user.role            = role;
  user.is_active       = active;
  user.is_available    = available;

  auto tx = repo.Begin();
  Check(repo.InsertUser(*tx, user), "user");
  tx->Commit();
  return user.id;
}

std::string SeedTeam(db::Repository& repo, const std::string& org, model::AssignmentStrategy strategy, bool active) {
  db::model::TeamRecord team;
  team.id              = util::NewId();
  team.organization_id = org;
  team.name            = "team-" + team.id.substr(0, 8);
  team.strategy        = strategy;
  team.is_active       = active;

  auto tx = repo.Begin();
  Check(repo.InsertTeam(*tx, team), "team");
  tx->Commit();
  return team.id;
}

void AddMember(db::Repository& repo, const std::string& team_id, const std::string& user_id, model::TeamRole role,
               uint64_t last_assigned_at_ms) {
  db::model::TeamMemberRecord member;
  member.team_id             = team_id;
  member.user_id             = user_id;
  member.role                = role;
  member.last_assigned_at_ms = last_assigned_at_ms;

  auto tx = repo.Begin();
  Check(repo.InsertTeamMember(*tx, member), "team member");
  tx->Commit();
}

std::string SeedContact(db::Repository& repo, const std::string& org, const std::string& phone, const std::string& name,
                        std::optional<std::string> assigned_user_id) {
  db::model::ContactRecord contact;
  contact.id               = util::NewId();
  contact.organization_id  = org;
  contact.phone_number     = phone;
  contact.profile_name     = name;
  contact.account          = "main";
  contact.assigned_user_id = std::move(assigned_user_id);

  auto tx = repo.Begin();
  Check(repo.InsertContact(*tx, contact), "contact");
  tx->Commit();
  return contact.id;
}

void SaveSettings(db::Repository& repo, const model::OrganizationSettings& settings) {
  auto tx = repo.Begin();
  Check(repo.UpsertSettings(*tx, settings), "settings");
  tx->Commit();
}

std::optional<db::model::TransferRecord> LoadTransfer(db::Repository& repo, const std::string& org, const std::string& id) {
  auto tx  = repo.Begin();
  auto row = repo.GetTransfer(*tx, org, id);
  tx->Commit();
  return row;
}

std::optional<db::model::ContactRecord> LoadContact(db::Repository& repo, const std::string& org, const std::string& id) {
  auto tx  = repo.Begin();
  auto row = repo.GetContact(*tx, org, id);
  tx->Commit();
  return row;
}

model::Caller MakeCaller(const std::string& org, const std::string& user_id, v1::Role role) {
  model::Caller caller;
  caller.organization_id = org;
  caller.user_id         = user_id;
  caller.role            = role;
  return caller;
}

} // namespace handoff::testing
