#include "factory.hpp"

#include <chrono>
#include <string>

#include "internal/observability/logging.hpp"

namespace hive::factory {

db::sqlite::SqliteOptions ToSqliteOptions(const hive::runtime::config::SqliteConfig& config) {
  db::sqlite::SqliteOptions options;
  if (!config.path().empty()) options.path = config.path();
  if (config.has_wal_mode()) options.wal_mode = config.wal_mode();
  if (!config.synchronous().empty()) options.synchronous = config.synchronous();
  if (config.cache_size_kb() > 0) options.cache_size_kb = config.cache_size_kb();
  if (config.busy_timeout_ms() > 0) options.busy_timeout_ms = config.busy_timeout_ms();
  options.schema_path = config.schema_path();
  return options;
}

maintenance::SweepOptions ToSweepOptions(const hive::runtime::config::MaintenanceConfig& config) {
  maintenance::SweepOptions options;
  if (config.sweep_interval_ms() > 0) {
    options.interval = std::chrono::milliseconds(config.sweep_interval_ms());
  }
  if (config.has_expire_ttl_entries()) options.expire_ttl_entries = config.expire_ttl_entries();
  for (const auto& ns : config.namespaces()) {
    options.namespaces.push_back(maintenance::NamespacePolicy{ns.namespace_(), ns.ttl_sec(), ns.max_entries()});
  }
  return options;
}

RuntimeDependencies BuildRuntime(const hive::runtime::config::RuntimeConfig& config) {
  RuntimeDependencies deps;

  auto options  = ToSqliteOptions(config.database().sqlite());
  deps.database = std::make_shared<db::sqlite::SqliteDB>(options);
  deps.database->Initialize();

  deps.coordinator = std::make_shared<core::Coordinator>(deps.database);

  if (config.maintenance().sweep_interval_ms() > 0) {
    deps.sweep_worker = std::make_shared<maintenance::SweepWorker>(deps.coordinator, ToSweepOptions(config.maintenance()));
  }

  HIVE_LOG_INFO("Runtime built", {observability::StringField("database", options.path),
                                  observability::BoolField("wal", options.wal_mode),
                                  observability::BoolField("sweep", deps.sweep_worker != nullptr)});
  return deps;
}

} // namespace hive::factory
