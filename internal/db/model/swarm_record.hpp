#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/enums.hpp"

namespace hive::db::model {

/*
  Persistent swarm row.

  At most one swarm has is_active set; swarms are archived,
  never deleted.
*/

struct SwarmRecord {
  std::string id;
  std::string name;

  hive::model::Topology  topology   = hive::model::Topology::kMesh;
  hive::model::QueenMode queen_mode = hive::model::QueenMode::kCentralized;

  int32_t max_agents          = 8;
  double  consensus_threshold = 0.66;

  // seconds
  int64_t memory_ttl = 86400;

  // opaque JSON
  std::string config = "{}";

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;

  bool is_active = false;

  hive::model::SwarmStatus status = hive::model::SwarmStatus::kActive;
};

struct SwarmSummary {
  SwarmRecord swarm;
  uint64_t    agent_count = 0;
};

struct SwarmStats {
  uint64_t agent_count       = 0;
  uint64_t active_agents     = 0;
  uint64_t busy_agents       = 0;
  uint64_t task_count        = 0;
  uint64_t task_backlog      = 0;  // pending + assigned
  uint64_t completed_tasks   = 0;
  uint64_t failed_tasks      = 0;
  uint64_t recent_messages   = 0;

  // busy / total agents, 0 with no agents
  double utilization = 0.0;
};

// Task outcomes of one topology. Rates are completed / total and
// stay empty when there is nothing to divide by.
struct StrategyPerformance {
  hive::model::Topology topology = hive::model::Topology::kMesh;

  uint64_t total_tasks     = 0;
  uint64_t completed_tasks = 0;

  std::optional<double> success_rate;
  std::optional<double> avg_completion_ms;  // completed_at - created_at
  std::optional<double> avg_actual_duration;

  uint64_t              recent_tasks = 0;
  std::optional<double> recent_success_rate;
};

} // namespace hive::db::model
