#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "hive_store_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool FailsStartup(const std::string& test_name, const std::string& yaml_content) {
  const auto yaml_path = WriteYaml(test_name, yaml_content);
  try {
    (void)hive::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const hive::util::StartupError&) {
    return true;
  }
  return false;
}

void TestFullConfigLoads() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
  pattern: "[%l] %v"
database:
  sqlite:
    path: "/tmp/hive.db"
    wal_mode: false
    synchronous: FULL
    cache_size_kb: 4096
    busy_timeout_ms: 250
maintenance:
  sweep_interval_ms: 1500
  expire_ttl_entries: true
  namespaces:
    - namespace: default
      ttl_sec: 86400
      max_entries: 10000
    - namespace: scratch
      max_entries: 5
)");

  auto config = hive::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "[%l] %v");
  assert(config.database().sqlite().path() == "/tmp/hive.db");
  assert(!config.database().sqlite().wal_mode());
  assert(config.database().sqlite().synchronous() == "FULL");
  assert(config.database().sqlite().cache_size_kb() == 4096);
  assert(config.database().sqlite().busy_timeout_ms() == 250);
  assert(config.maintenance().sweep_interval_ms() == 1500);
  assert(config.maintenance().expire_ttl_entries());
  assert(config.maintenance().namespaces_size() == 2);
  assert(config.maintenance().namespaces(0).namespace_() == "default");
  assert(config.maintenance().namespaces(0).ttl_sec() == 86400);
  assert(config.maintenance().namespaces(1).ttl_sec() == 0);
  assert(config.maintenance().namespaces(1).max_entries() == 5);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\hive\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = hive::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\hive\\\"quoted\"\\db.sqlite");
}

void TestQuotedNumbersStayStrings() {
  const auto yaml_path = WriteYaml("quoted_number",
                                   R"(maintenance:
  namespaces:
    - namespace: "2024"
      max_entries: 10
)");

  auto config = hive::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.maintenance().namespaces(0).namespace_() == "2024");
}

void TestUnknownFieldsAreRejected() {
  bool threw = FailsStartup("unknown_field", R"(database:
  sqlite:
    path: "/tmp/data"
unknown_field: 123
)");
  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestInvalidValuesAreRejected() {
  assert(FailsStartup("negative_timeout", R"(database:
  sqlite:
    busy_timeout_ms: -1
)"));

  assert(FailsStartup("duplicate_namespace", R"(maintenance:
  namespaces:
    - namespace: default
      ttl_sec: 10
    - namespace: default
      max_entries: 10
)"));

  assert(FailsStartup("unnamed_namespace", R"(maintenance:
  namespaces:
    - ttl_sec: 10
)"));
}

void TestOmittedSwitchesKeepDefaults() {
  const auto yaml_path = WriteYaml("omitted_switches",
                                   R"(database:
  sqlite:
    path: "/tmp/hive-defaults.db"
maintenance:
  sweep_interval_ms: 500
)");

  auto config = hive::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(!config.database().sqlite().has_wal_mode());
  assert(!config.maintenance().has_expire_ttl_entries());

  assert(hive::factory::ToSqliteOptions(config.database().sqlite()).wal_mode);
  assert(hive::factory::ToSweepOptions(config.maintenance()).expire_ttl_entries);

  // an explicit false still wins
  config.mutable_database()->mutable_sqlite()->set_wal_mode(false);
  config.mutable_maintenance()->set_expire_ttl_entries(false);
  assert(!hive::factory::ToSqliteOptions(config.database().sqlite()).wal_mode);
  assert(!hive::factory::ToSweepOptions(config.maintenance()).expire_ttl_entries);
}

void TestMissingFileIsStartupError() {
  bool threw = false;
  try {
    (void)hive::config::ConfigLoader::LoadFromYaml("/nonexistent/hive-store.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigLoads();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestInvalidValuesAreRejected();
  TestOmittedSwitchesKeepDefaults();
  TestMissingFileIsStartupError();

  std::cout << "hive_store_unit_config_loader: pass\n";
  return 0;
}
