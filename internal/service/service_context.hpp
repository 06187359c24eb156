#pragma once

#include <memory>

namespace handoff::transfer { class TransferQueue; }
namespace handoff::settings { class SettingsCache; }
namespace handoff::db { class Repository; }

namespace handoff::service {

/*
  Dependency container shared by the services.
*/
struct ServiceContext {
  std::shared_ptr<handoff::transfer::TransferQueue> queue;
  std::shared_ptr<handoff::settings::SettingsCache> settings;
  std::shared_ptr<handoff::db::Repository>          repository;
};

}
