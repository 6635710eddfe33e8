#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/enums.hpp"

namespace hive::db::model {

/*
  Persistent task row.

  completed_at is set exactly when status is terminal
  (completed, failed, cancelled).
*/

struct TaskRecord {
  std::string id;
  std::string swarm_id;
  std::string type;
  std::string description;

  hive::model::TaskStatus   status   = hive::model::TaskStatus::kPending;
  hive::model::TaskPriority priority = hive::model::TaskPriority::kMedium;

  std::optional<std::string> assigned_agent_id;

  // opaque JSON
  std::string                dependencies = "[]";
  std::string                requirements = "{}";
  std::optional<std::string> result;

  uint64_t                created_at_ms = 0;
  std::optional<uint64_t> assigned_at_ms;
  std::optional<uint64_t> started_at_ms;
  std::optional<uint64_t> completed_at_ms;

  // ms
  std::optional<int64_t> estimated_duration;
  std::optional<int64_t> actual_duration;

  std::string metadata = "{}";
};

// Row of the active-task listing.
struct ActiveTask {
  TaskRecord                 task;
  std::optional<std::string> agent_name;
};

} // namespace hive::db::model
