#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/scheduler/sla_scheduler.hpp"

using handoff::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  handoff::observability::ShutdownLogging();
  handoff::observability::ShutdownMetrics();
  handoff::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: handoff-server <config.yaml> OR handoff-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = handoff::config::ConfigLoader::LoadFromYaml(config_path);

    handoff::observability::InitializeTracing(config);
    handoff::observability::InitializeMetrics(config);
    handoff::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = handoff::factory::Build(config);

    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    if (app.scheduler) {
      app.scheduler->Start();
    }
    HANDOFF_LOG_INFO("handoff started", {handoff::observability::StringField("bind_address", config.server().bind_address()),
                                         handoff::observability::BoolField("scheduler", app.scheduler != nullptr)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    HANDOFF_LOG_INFO("shutting down handoff");

    // stop the scheduler first so no tick runs against a closing server
    if (app.scheduler) {
      app.scheduler->Stop();
    }
    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    HANDOFF_LOG_ERROR("fatal error", {handoff::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
