#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/model/agent_record.hpp"
#include "internal/db/model/swarm_record.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/store/agent_registry.hpp"
#include "internal/store/swarm_registry.hpp"

namespace hive::testing {

// Fresh in-memory database with the built-in schema applied.
inline std::shared_ptr<db::sqlite::SqliteDB> OpenMemoryDb() {
  auto db = std::make_shared<db::sqlite::SqliteDB>(db::sqlite::SqliteOptions{});
  db->Initialize();
  return db;
}

inline db::model::SwarmRecord SeedSwarm(const std::shared_ptr<db::sqlite::SqliteDB>& db, const std::string& id,
                                        uint64_t created_at_ms = 1000) {
  db::model::SwarmRecord swarm;
  swarm.id            = id;
  swarm.name          = "swarm " + id;
  swarm.created_at_ms = created_at_ms;
  swarm.updated_at_ms = created_at_ms;
  store::SwarmRegistry(db).Create(swarm);
  return swarm;
}

inline db::model::AgentRecord SeedAgent(const std::shared_ptr<db::sqlite::SqliteDB>& db, const std::string& id,
                                        const std::string& swarm_id, uint64_t created_at_ms = 1000) {
  db::model::AgentRecord agent;
  agent.id            = id;
  agent.swarm_id      = swarm_id;
  agent.name          = "agent " + id;
  agent.type          = model::AgentType::kCoder;
  agent.created_at_ms = created_at_ms;
  store::AgentRegistry(db).Create(agent);
  return agent;
}

} // namespace hive::testing
