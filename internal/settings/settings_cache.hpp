#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/settings.hpp"
#include "internal/util/time.hpp"

namespace handoff::settings {

/*
  Read-through cache over the chatbot_settings table.

  Two views are cached with the same TTL:
    - the list of SLA-enabled rows the scheduler walks every tick
    - single (organization, account) rows, including misses

  A TTL of zero disables caching. Callers must not hold an open
  repository transaction while calling in.
*/
class SettingsCache {
 public:
  SettingsCache(std::shared_ptr<db::Repository> repository, std::chrono::milliseconds ttl, util::NowFn now = util::Now);

  std::vector<model::OrganizationSettings> SlaEnabled();

  // account-specific row, else organization default, else built-in defaults
  model::OrganizationSettings Resolve(const std::string& organization_id, const std::string& account);

  // write-through upsert; drops the organization's cached entries
  void Store(const model::OrganizationSettings& settings);

  void Invalidate(const std::string& organization_id);
  void InvalidateAll();

 private:
  struct Entry {
    std::optional<model::OrganizationSettings> value;
    util::TimePoint                            loaded_at;
  };

  static std::string Key(const std::string& organization_id, const std::string& account);

  bool Fresh(util::TimePoint loaded_at, util::TimePoint now) const;

  std::optional<model::OrganizationSettings> Lookup(const std::string& organization_id, const std::string& account);

  std::shared_ptr<db::Repository> repository_;
  std::chrono::milliseconds       ttl_;
  util::NowFn                     now_;

  std::mutex                             mutex_;
  std::unordered_map<std::string, Entry> rows_;

  std::optional<std::vector<model::OrganizationSettings>> sla_enabled_;
  util::TimePoint                                         sla_loaded_at_{};
};

} // namespace handoff::settings
