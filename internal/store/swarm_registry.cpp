#include "internal/store/swarm_registry.hpp"

#include "internal/db/sql/sql_queries.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/util/errors.hpp"

namespace hive::store {

using db::model::SwarmRecord;
using db::model::SwarmStats;
using db::model::SwarmSummary;

namespace {

SwarmRecord MapSwarm(const db::sql::Row& r) {
  SwarmRecord s;
  s.id                  = r.GetText(0);
  s.name                = r.GetText(1);
  s.topology            = model::ParseTopology(r.GetText(2));
  s.queen_mode          = model::ParseQueenMode(r.GetText(3));
  s.max_agents          = r.GetInt(4);
  s.consensus_threshold = r.GetDouble(5);
  s.memory_ttl          = r.GetInt64(6);
  s.config              = r.GetOptionalText(7).value_or("{}");
  s.created_at_ms       = r.GetU64(8);
  s.updated_at_ms       = r.GetU64(9);
  s.is_active           = r.GetBool(10);
  s.status              = model::ParseSwarmStatus(r.GetText(11));
  return s;
}

} // namespace

SwarmRegistry::SwarmRegistry(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
}

void SwarmRegistry::Create(const SwarmRecord& swarm) {
  db::sqlite::SqliteTransaction tx(db_);

  if (swarm.is_active) {
    db_->Execute("clearActiveSwarms", db::sql::CLEAR_ACTIVE_SWARMS);
  }

  db_->Execute("createSwarm", db::sql::CREATE_SWARM,
               {swarm.id, swarm.name, model::Text(swarm.topology), model::Text(swarm.queen_mode),
                static_cast<int32_t>(swarm.max_agents), swarm.consensus_threshold, swarm.memory_ttl, swarm.config,
                swarm.created_at_ms, swarm.updated_at_ms, static_cast<int32_t>(swarm.is_active ? 1 : 0),
                model::Text(swarm.status)});

  tx.Commit();
}

std::optional<SwarmRecord> SwarmRegistry::Get(const std::string& id) const {
  return db_->QueryOne("getSwarm", db::sql::GET_SWARM, {id}, MapSwarm);
}

std::optional<std::string> SwarmRegistry::GetActiveId() const {
  return db_->QueryOne("getActiveSwarm", db::sql::GET_ACTIVE_SWARM, {},
                       [](const db::sql::Row& r) { return r.GetText(0); });
}

void SwarmRegistry::SetActive(const std::string& id, uint64_t now_ms) {
  db::sqlite::SqliteTransaction tx(db_);

  db_->Execute("clearActiveSwarms", db::sql::CLEAR_ACTIVE_SWARMS);
  if (db_->Execute("activateSwarm", db::sql::ACTIVATE_SWARM, {now_ms, id}) == 0) {
    // tx rolls back on unwind
    throw util::NotFound("swarm not found: " + id);
  }

  tx.Commit();
}

std::vector<SwarmSummary> SwarmRegistry::ListAll() const {
  return db_->QueryAll("getAllSwarms", db::sql::GET_ALL_SWARMS, {}, [](const db::sql::Row& r) {
    SwarmSummary s;
    s.swarm       = MapSwarm(r);
    s.agent_count = r.GetU64(12);
    return s;
  });
}

void SwarmRegistry::UpdateStatus(const std::string& id, model::SwarmStatus status, uint64_t now_ms) {
  if (db_->Execute("updateSwarmStatus", db::sql::UPDATE_SWARM_STATUS, {model::Text(status), now_ms, id}) == 0) {
    throw util::NotFound("swarm not found: " + id);
  }
}

SwarmStats SwarmRegistry::Stats(const std::string& id, uint64_t now_ms, uint64_t window_ms) const {
  if (!Get(id)) {
    throw util::NotFound("swarm not found: " + id);
  }

  const uint64_t cutoff = now_ms > window_ms ? now_ms - window_ms : 0;

  auto stats = db_->QueryOne("getSwarmStats", db::sql::GET_SWARM_STATS, {id, cutoff}, [](const db::sql::Row& r) {
    SwarmStats s;
    s.agent_count     = r.GetU64(0);
    s.active_agents   = r.GetU64(1);
    s.busy_agents     = r.GetU64(2);
    s.task_count      = r.GetU64(3);
    s.task_backlog    = r.GetU64(4);
    s.completed_tasks = r.GetU64(5);
    s.failed_tasks    = r.GetU64(6);
    s.recent_messages = r.GetU64(7);
    return s;
  });

  SwarmStats out = stats.value_or(SwarmStats{});
  if (out.agent_count > 0) {
    out.utilization = static_cast<double>(out.busy_agents) / static_cast<double>(out.agent_count);
  }
  return out;
}

std::vector<db::model::StrategyPerformance> SwarmRegistry::StrategyPerformance(const std::string& id, uint64_t now_ms,
                                                                               uint64_t window_ms) const {
  const uint64_t cutoff = now_ms > window_ms ? now_ms - window_ms : 0;

  auto rows = db_->QueryAll(
      "getStrategyPerformance", db::sql::GET_STRATEGY_PERFORMANCE, {id, cutoff}, [](const db::sql::Row& r) {
        db::model::StrategyPerformance p;
        p.topology            = model::ParseTopology(r.GetText(0));
        p.total_tasks         = r.GetU64(1);
        p.completed_tasks     = r.GetU64(2);
        p.avg_completion_ms   = r.GetOptionalDouble(3);
        p.avg_actual_duration = r.GetOptionalDouble(4);
        p.recent_tasks        = r.GetU64(5);

        const uint64_t recent_completed = r.GetU64(6);
        if (p.total_tasks > 0) {
          p.success_rate = static_cast<double>(p.completed_tasks) / static_cast<double>(p.total_tasks);
        }
        if (p.recent_tasks > 0) {
          p.recent_success_rate = static_cast<double>(recent_completed) / static_cast<double>(p.recent_tasks);
        }
        return p;
      });

  if (rows.empty()) {
    throw util::NotFound("swarm not found: " + id);
  }
  return rows;
}

} // namespace hive::store
