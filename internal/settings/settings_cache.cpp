#include "settings_cache.hpp"

#include "internal/observability/logging.hpp"

namespace handoff::settings {

using handoff::observability::IntField;
using handoff::observability::StringField;

SettingsCache::SettingsCache(std::shared_ptr<db::Repository> repository, std::chrono::milliseconds ttl, util::NowFn now)
    : repository_(std::move(repository)), ttl_(ttl), now_(std::move(now)) {
}

std::string SettingsCache::Key(const std::string& organization_id, const std::string& account) {
  return organization_id + "#" + account;
}

bool SettingsCache::Fresh(util::TimePoint loaded_at, util::TimePoint now) const {
  return ttl_.count() > 0 && now - loaded_at < ttl_;
}

// ------------------------------------------------------------
// SLA-enabled list
// ------------------------------------------------------------

std::vector<model::OrganizationSettings> SettingsCache::SlaEnabled() {
  const auto now = now_();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sla_enabled_ && Fresh(sla_loaded_at_, now)) {
      return *sla_enabled_;
    }
  }

  // load outside the lock, a slow store must not block Resolve()
  auto tx   = repository_->Begin();
  auto rows = repository_->ListSlaEnabledSettings(*tx);
  tx->Commit();

  HANDOFF_LOG_DEBUG("sla settings loaded", {IntField("count", static_cast<int64_t>(rows.size()))});

  std::lock_guard<std::mutex> lock(mutex_);
  sla_enabled_   = rows;
  sla_loaded_at_ = now;
  return rows;
}

// ------------------------------------------------------------
// Per-account resolution
// ------------------------------------------------------------

std::optional<model::OrganizationSettings> SettingsCache::Lookup(const std::string& organization_id, const std::string& account) {
  const auto now = now_();
  const auto key = Key(organization_id, account);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = rows_.find(key);
    if (it != rows_.end() && Fresh(it->second.loaded_at, now)) {
      return it->second.value;
    }
  }

  auto tx  = repository_->Begin();
  auto row = repository_->GetSettings(*tx, organization_id, account);
  tx->Commit();

  std::lock_guard<std::mutex> lock(mutex_);
  rows_[key] = Entry{row, now};
  return row;
}

model::OrganizationSettings SettingsCache::Resolve(const std::string& organization_id, const std::string& account) {
  if (!account.empty()) {
    if (auto specific = Lookup(organization_id, account)) {
      return *specific;
    }
  }
  if (auto fallback = Lookup(organization_id, "")) {
    return *fallback;
  }
  return model::DefaultSettings(organization_id);
}

void SettingsCache::Store(const model::OrganizationSettings& settings) {
  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->UpsertSettings(*tx, settings), "store settings");
  tx->Commit();

  Invalidate(settings.organization_id);
  HANDOFF_LOG_INFO("settings stored", {StringField("org_id", settings.organization_id), StringField("account", settings.account)});
}

// ------------------------------------------------------------
// Invalidation
// ------------------------------------------------------------

void SettingsCache::Invalidate(const std::string& organization_id) {
  const auto prefix = organization_id + "#";

  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = rows_.begin(); it != rows_.end();) {
    if (it->first.compare(0, prefix.size(), prefix) == 0) {
      it = rows_.erase(it);
    } else {
      ++it;
    }
  }
  // the list mixes organizations, reload it as a whole
  sla_enabled_.reset();
}

void SettingsCache::InvalidateAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  rows_.clear();
  sla_enabled_.reset();
}

} // namespace handoff::settings
