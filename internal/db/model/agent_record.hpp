#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/enums.hpp"

namespace hive::db::model {

struct AgentRecord {
  std::string id;
  std::string swarm_id;
  std::string name;

  hive::model::AgentType   type   = hive::model::AgentType::kSpecialist;
  hive::model::AgentStatus status = hive::model::AgentStatus::kIdle;

  // opaque JSON array
  std::string capabilities = "[]";

  std::optional<std::string> current_task_id;

  // Monotonic counters. Updates may only increment them.
  uint64_t message_count = 0;
  uint64_t error_count   = 0;
  uint64_t success_count = 0;

  uint64_t                created_at_ms = 0;
  std::optional<uint64_t> last_active_at_ms;

  std::string metadata = "{}";
};

struct AgentPerformance {
  uint64_t success_count   = 0;
  uint64_t error_count     = 0;
  uint64_t completed_tasks = 0;
  uint64_t failed_tasks    = 0;

  // ms; empty when no task reported a duration
  std::optional<double> avg_task_duration_ms;
};

} // namespace hive::db::model
