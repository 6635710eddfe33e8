#include "internal/store/agent_registry.hpp"

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace hive::store {

using db::model::AgentPerformance;
using db::model::AgentRecord;

namespace {

AgentRecord MapAgent(const db::sql::Row& r) {
  AgentRecord a;
  a.id                = r.GetText(0);
  a.swarm_id          = r.GetText(1);
  a.name              = r.GetText(2);
  a.type              = model::ParseAgentType(r.GetText(3));
  a.status            = model::ParseAgentStatus(r.GetText(4));
  a.capabilities      = r.GetOptionalText(5).value_or("[]");
  a.current_task_id   = r.GetOptionalText(6);
  a.message_count     = r.GetU64(7);
  a.error_count       = r.GetU64(8);
  a.success_count     = r.GetU64(9);
  a.created_at_ms     = r.GetU64(10);
  a.last_active_at_ms = r.GetOptionalU64(11);
  a.metadata          = r.GetOptionalText(12).value_or("{}");
  return a;
}

} // namespace

AgentRegistry::AgentRegistry(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
}

void AgentRegistry::Create(const AgentRecord& agent) {
  db_->Execute("createAgent", db::sql::CREATE_AGENT,
               {agent.id, agent.swarm_id, agent.name, model::Text(agent.type), model::Text(agent.status),
                agent.capabilities, db::sql::Nullable(agent.current_task_id), agent.message_count, agent.error_count,
                agent.success_count, agent.created_at_ms, db::sql::Nullable(agent.last_active_at_ms), agent.metadata});
}

std::optional<AgentRecord> AgentRegistry::Get(const std::string& id) const {
  return db_->QueryOne("getAgent", db::sql::GET_AGENT, {id}, MapAgent);
}

std::vector<AgentRecord> AgentRegistry::ListBySwarm(const std::string& swarm_id) const {
  return db_->QueryAll("getAgents", db::sql::GET_AGENTS, {swarm_id}, MapAgent);
}

void AgentRegistry::Update(const std::string& id, const UpdateSet& set) {
  auto update = BuildUpdate(AgentColumns(), set, id);
  if (ExecuteUpdate(*db_, update) == 0) {
    throw util::NotFound("agent not found: " + id);
  }
}

void AgentRegistry::UpdateStatus(const std::string& id, model::AgentStatus status, uint64_t now_ms) {
  if (db_->Execute("updateAgentStatus", db::sql::UPDATE_AGENT_STATUS, {model::Text(status), now_ms, id}) == 0) {
    throw util::NotFound("agent not found: " + id);
  }
}

void AgentRegistry::RecordOutcome(const std::string& id, bool success, uint64_t now_ms) {
  const std::size_t changed = success
                                  ? db_->Execute("recordAgentSuccess", db::sql::RECORD_AGENT_SUCCESS, {now_ms, id})
                                  : db_->Execute("recordAgentError", db::sql::RECORD_AGENT_ERROR, {now_ms, id});
  if (changed == 0) {
    throw util::NotFound("agent not found: " + id);
  }
}

std::optional<AgentPerformance> AgentRegistry::Performance(const std::string& id) const {
  return db_->QueryOne("getAgentPerformance", db::sql::GET_AGENT_PERFORMANCE, {id}, [](const db::sql::Row& r) {
    AgentPerformance p;
    p.success_count        = r.GetU64(0);
    p.error_count          = r.GetU64(1);
    p.completed_tasks      = r.GetU64(2);
    p.failed_tasks         = r.GetU64(3);
    p.avg_task_duration_ms = r.GetOptionalDouble(4);
    return p;
  });
}

} // namespace hive::store
