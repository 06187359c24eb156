#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/transfer_server.hpp"
#include "internal/notify/log_notifier.hpp"
#include "internal/notify/outbox_sender.hpp"
#include "internal/observability/logging.hpp"
#include "internal/routing/assignment_strategy.hpp"
#include "internal/scheduler/sla_scheduler.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/transfer_service.hpp"
#include "internal/settings/settings_cache.hpp"
#include "internal/transfer/transfer_queue.hpp"
#include "internal/util/time.hpp"
#if HANDOFF_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if HANDOFF_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace handoff::factory {

using handoff::observability::StringField;

namespace {

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(d.seconds()) +
                                                               std::chrono::nanoseconds(d.nanos()));
}

std::shared_ptr<db::Repository> BuildRepository(const handoff::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if HANDOFF_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    sqlite_db->Bootstrap();
    HANDOFF_LOG_INFO("repository ready", {StringField("backend", "sqlite"), StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if HANDOFF_DB_POSTGRES
    const auto& pg   = database.postgres();
    auto        pool = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), pg.max_connections() > 0 ? pg.max_connections() : 16);
    pool->Bootstrap();
    HANDOFF_LOG_INFO("repository ready", {StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  HANDOFF_LOG_INFO("repository ready", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const handoff::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage and settings
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.settings   = std::make_shared<settings::SettingsCache>(app.repository, ToMillis(config.scheduler().settings_cache_ttl()));

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  auto log_notifier = std::make_shared<notify::LogNotifier>();

  notify::Notifiers notifiers;
  notifiers.broadcaster = log_notifier;
  notifiers.dispatcher  = log_notifier;
  notifiers.sender      = std::make_shared<notify::OutboxMessageSender>(app.repository, log_notifier, log_notifier);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto selector = std::make_shared<routing::AgentSelector>(app.repository);
  app.queue     = std::make_shared<transfer::TransferQueue>(app.repository, app.settings, selector, notifiers);

  if (config.scheduler().enabled()) {
    app.scheduler = std::make_shared<scheduler::SlaScheduler>(app.repository, app.settings, notifiers,
                                                              ToMillis(config.scheduler().interval()));
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.queue      = app.queue;
  ctx.settings   = app.settings;
  ctx.repository = app.repository;

  auto transfer_service = std::make_shared<service::TransferService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::TransferServer>(transfer_service));

  return app;
}

} // namespace handoff::factory
