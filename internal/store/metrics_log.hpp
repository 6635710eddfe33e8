#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/model/metric_record.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace hive::store {

// Append-only performance samples.
class MetricsLog {
 public:
  explicit MetricsLog(std::shared_ptr<db::sqlite::SqliteDB> db);

  void Append(const db::model::PerformanceMetricRecord& metric);

  // Newest first.
  std::vector<db::model::PerformanceMetricRecord> List(const std::string& swarm_id, const std::string& metric_type,
                                                       std::size_t limit) const;

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_;
};

} // namespace hive::store
