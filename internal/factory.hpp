#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace handoff::db { class Repository; }
namespace handoff::scheduler { class SlaScheduler; }
namespace handoff::settings { class SettingsCache; }
namespace handoff::transfer { class TransferQueue; }

namespace handoff::factory {

/*
  Application

  Owns every long-lived object of the server process.
  The scheduler is built but not started; the caller owns its lifecycle.
*/
struct Application {
  std::shared_ptr<db::Repository>               repository;
  std::shared_ptr<settings::SettingsCache>      settings;
  std::shared_ptr<transfer::TransferQueue>      queue;
  std::shared_ptr<scheduler::SlaScheduler>      scheduler; // null when disabled
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Composition root: the ONLY place that knows concrete repository,
  notifier and sender types.
*/
Application Build(const handoff::runtime::config::RuntimeConfig& config);

} // namespace handoff::factory
