#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/agent_record.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/store/update_set.hpp"

namespace hive::store {

class AgentRegistry {
 public:
  explicit AgentRegistry(std::shared_ptr<db::sqlite::SqliteDB> db);

  void Create(const db::model::AgentRecord& agent);

  std::optional<db::model::AgentRecord> Get(const std::string& id) const;

  // Oldest first.
  std::vector<db::model::AgentRecord> ListBySwarm(const std::string& swarm_id) const;

  // Columns are validated against AgentColumns(); unknown ids throw util::NotFound.
  void Update(const std::string& id, const UpdateSet& set);

  void UpdateStatus(const std::string& id, hive::model::AgentStatus status, uint64_t now_ms);

  // Bumps success_count or error_count and last_active_at.
  void RecordOutcome(const std::string& id, bool success, uint64_t now_ms);

  std::optional<db::model::AgentPerformance> Performance(const std::string& id) const;

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_;
};

} // namespace hive::store
