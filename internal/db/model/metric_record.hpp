#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hive::db::model {

// Append-only performance sample.
struct PerformanceMetricRecord {
  std::string id;
  std::string swarm_id;

  std::optional<std::string> agent_id;
  std::optional<std::string> task_id;

  std::string metric_type;
  double      metric_value = 0.0;
  std::string metadata     = "{}";

  uint64_t created_at_ms = 0;
};

struct TableCount {
  std::string table;
  uint64_t    rows = 0;
};

struct HealthReport {
  bool        healthy = false;
  std::string message;

  std::vector<TableCount> tables;
};

} // namespace hive::db::model
