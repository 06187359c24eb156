#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using handoff::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "handoff_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestEmptyDocumentGetsDefaults() {
  const auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.database().has_memory());
  assert(config.scheduler().enabled());
  assert(config.scheduler().interval().seconds() == 60);
  assert(config.scheduler().settings_cache_ttl().seconds() == 300);
}

void TestFileWithSqliteAndDurations() {
  const auto yaml_path = WriteYaml("sqlite", R"(server:
  bind_address: "127.0.0.1:7000"
database:
  sqlite:
    path: "/var/lib/handoff/handoff.db"
scheduler:
  enabled: true
  interval: "15s"
  settings_cache_ttl: "0s"
logging:
  level: debug
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:7000");
  assert(config.database().sqlite().path() == "/var/lib/handoff/handoff.db");
  assert(config.scheduler().interval().seconds() == 15);
  assert(config.scheduler().settings_cache_ttl().seconds() == 0);
  assert(config.logging().level() == "debug");
}

void TestDisabledSchedulerKeepsDefaultsForTimings() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(scheduler:
  enabled: false
)");
  assert(!config.scheduler().enabled());
  assert(config.scheduler().interval().seconds() == 60);
}

void TestPostgresPoolDefault() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(database:
  postgres:
    connection_uri: "postgresql://handoff@localhost/handoff"
)");
  assert(config.database().postgres().max_connections() == 16);
}

void TestQuotedScalarsStayStrings() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "line1\nline2"
database:
  sqlite:
    path: "C:\\handoff\\\"quoted\"\\db.sqlite"
)");
  assert(config.server().bind_address() == std::string("line1\nline2"));
  assert(config.database().sqlite().path() == "C:\\handoff\\\"quoted\"\\db.sqlite");
}

void TestInvalidConfigurationsAreRejected() {
  assert(Rejects("unknown_field: 123\n"));
  assert(Rejects("database:\n  sqlite:\n    path: \"\"\n"));
  assert(Rejects("database:\n  postgres:\n    max_connections: 4\n"));
  assert(Rejects("scheduler:\n  interval: \"0s\"\n"));
  assert(Rejects("scheduler:\n  interval: \"soon\"\n"));
  assert(Rejects("- just\n- a list\n"));
  assert(Rejects("server: [unterminated\n"));

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/handoff.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEmptyDocumentGetsDefaults();
  TestFileWithSqliteAndDurations();
  TestDisabledSchedulerKeepsDefaultsForTimings();
  TestPostgresPoolDefault();
  TestQuotedScalarsStayStrings();
  TestInvalidConfigurationsAreRejected();

  std::cout << "handoff_unit_config_loader: pass\n";
  return 0;
}
