#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/coordinator.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/maintenance/sweep_worker.hpp"

namespace hive::factory {

/*
  RuntimeDependencies

  Owns the long-lived objects of one process.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::sqlite::SqliteDB>          database;
  std::shared_ptr<core::Coordinator>             coordinator;

  // null when maintenance.sweep_interval_ms is 0
  std::shared_ptr<maintenance::SweepWorker>      sweep_worker;
};

/*
  BuildRuntime

  Composition root: opens and initializes the database, then wires
  the coordinator and the maintenance worker. The sweep worker is
  built but not started.
*/
RuntimeDependencies BuildRuntime(const hive::runtime::config::RuntimeConfig& config);

db::sqlite::SqliteOptions  ToSqliteOptions(const hive::runtime::config::SqliteConfig& config);
maintenance::SweepOptions  ToSweepOptions(const hive::runtime::config::MaintenanceConfig& config);

} // namespace hive::factory
