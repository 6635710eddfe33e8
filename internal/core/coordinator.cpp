#include "coordinator.hpp"

#include <stdexcept>
#include <string_view>
#include <type_traits>

#include "internal/db/api/error.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace hive::core {

using namespace hive::db::model;

namespace {

template <typename Fn>
auto Observe(std::string_view op, Fn&& fn) {
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const std::exception& ex) {
    HIVE_LOG_ERROR("Operation failed", {observability::StringField("op", op), observability::StringField("error", ex.what())});
    throw;
  }
}

void FillIdentity(std::string& id, uint64_t& created_at_ms, uint64_t now_ms) {
  if (id.empty()) id = util::GenerateId();
  if (created_at_ms == 0) created_at_ms = now_ms;
}

} // namespace

Coordinator::Coordinator(std::shared_ptr<db::sqlite::SqliteDB> db)
    : db_(std::move(db)), swarms_(db_), agents_(db_), tasks_(db_), memory_(db_), messages_(db_), consensus_(db_), metrics_(db_) {
  if (!db_) {
    throw std::invalid_argument("Coordinator requires a database");
  }
}

// ------------------------------------------------------------
// Swarms
// ------------------------------------------------------------

SwarmRecord Coordinator::CreateSwarm(SwarmRecord swarm) {
  return Observe("createSwarm", [&] {
    FillIdentity(swarm.id, swarm.created_at_ms, util::NowMillis());
    if (swarm.updated_at_ms == 0) swarm.updated_at_ms = swarm.created_at_ms;
    swarms_.Create(swarm);
    HIVE_LOG_INFO("Swarm created", {observability::StringField("swarm_id", swarm.id), observability::StringField("name", swarm.name)});
    return swarm;
  });
}

std::optional<SwarmRecord> Coordinator::GetSwarm(const std::string& id) const {
  return Observe("getSwarm", [&] { return swarms_.Get(id); });
}

std::optional<std::string> Coordinator::GetActiveSwarmId() const {
  return Observe("getActiveSwarm", [&] { return swarms_.GetActiveId(); });
}

void Coordinator::SetActiveSwarm(const std::string& id) {
  Observe("setActiveSwarm", [&] {
    swarms_.SetActive(id, util::NowMillis());
    HIVE_LOG_INFO("Active swarm changed", {observability::StringField("swarm_id", id)});
  });
}

std::vector<SwarmSummary> Coordinator::ListSwarms() const {
  return Observe("getAllSwarms", [&] { return swarms_.ListAll(); });
}

void Coordinator::UpdateSwarmStatus(const std::string& id, model::SwarmStatus status) {
  Observe("updateSwarmStatus", [&] { swarms_.UpdateStatus(id, status, util::NowMillis()); });
}

SwarmStats Coordinator::GetSwarmStats(const std::string& id, uint64_t window_ms) const {
  return Observe("getSwarmStats", [&] { return swarms_.Stats(id, util::NowMillis(), window_ms); });
}

std::vector<db::model::StrategyPerformance> Coordinator::GetStrategyPerformance(const std::string& swarm_id,
                                                                                uint64_t window_ms) const {
  return Observe("getStrategyPerformance",
                 [&] { return swarms_.StrategyPerformance(swarm_id, util::NowMillis(), window_ms); });
}

// ------------------------------------------------------------
// Agents
// ------------------------------------------------------------

AgentRecord Coordinator::CreateAgent(AgentRecord agent) {
  return Observe("createAgent", [&] {
    FillIdentity(agent.id, agent.created_at_ms, util::NowMillis());
    agents_.Create(agent);
    return agent;
  });
}

std::optional<AgentRecord> Coordinator::GetAgent(const std::string& id) const {
  return Observe("getAgent", [&] { return agents_.Get(id); });
}

std::vector<AgentRecord> Coordinator::ListAgents(const std::string& swarm_id) const {
  return Observe("getAgents", [&] { return agents_.ListBySwarm(swarm_id); });
}

void Coordinator::UpdateAgent(const std::string& id, const store::UpdateSet& set) {
  Observe("updateAgent", [&] { agents_.Update(id, set); });
}

void Coordinator::UpdateAgentStatus(const std::string& id, model::AgentStatus status) {
  Observe("updateAgentStatus", [&] { agents_.UpdateStatus(id, status, util::NowMillis()); });
}

void Coordinator::RecordAgentOutcome(const std::string& id, bool success) {
  Observe("recordAgentOutcome", [&] { agents_.RecordOutcome(id, success, util::NowMillis()); });
}

std::optional<AgentPerformance> Coordinator::GetAgentPerformance(const std::string& id) const {
  return Observe("getAgentPerformance", [&] { return agents_.Performance(id); });
}

// ------------------------------------------------------------
// Tasks
// ------------------------------------------------------------

TaskRecord Coordinator::CreateTask(TaskRecord task) {
  return Observe("createTask", [&] {
    FillIdentity(task.id, task.created_at_ms, util::NowMillis());
    tasks_.Create(task);
    return task;
  });
}

std::optional<TaskRecord> Coordinator::GetTask(const std::string& id) const {
  return Observe("getTask", [&] { return tasks_.Get(id); });
}

std::vector<TaskRecord> Coordinator::ListTasks(const std::string& swarm_id) const {
  return Observe("getTasks", [&] { return tasks_.ListBySwarm(swarm_id); });
}

void Coordinator::UpdateTask(const std::string& id, const store::UpdateSet& set) {
  Observe("updateTask", [&] { tasks_.Update(id, set); });
}

void Coordinator::UpdateTaskStatus(const std::string& id, model::TaskStatus status) {
  Observe("updateTaskStatus", [&] { tasks_.UpdateStatus(id, status, util::NowMillis()); });
}

std::vector<TaskRecord> Coordinator::GetPendingTasks(const std::string& swarm_id) const {
  return Observe("getPendingTasks", [&] { return tasks_.ListPending(swarm_id); });
}

std::vector<ActiveTask> Coordinator::GetActiveTasks(const std::string& swarm_id) const {
  return Observe("getActiveTasks", [&] { return tasks_.ListActive(swarm_id); });
}

void Coordinator::ReassignTask(const std::string& id, const std::string& agent_id) {
  Observe("reassignTask", [&] { tasks_.Reassign(id, agent_id, util::NowMillis()); });
}

// ------------------------------------------------------------
// Memory
// ------------------------------------------------------------

void Coordinator::StoreMemory(const std::string& key, const std::string& ns, const std::string& value, const std::string& metadata,
                              std::optional<int64_t> ttl_sec) {
  Observe("storeMemory", [&] {
    MemoryRecord entry;
    entry.key      = key;
    entry.ns       = ns;
    entry.value    = value;
    entry.metadata = metadata;
    entry.ttl_sec  = ttl_sec;
    memory_.Store(entry, util::NowMillis());
  });
}

std::optional<MemoryRecord> Coordinator::GetMemory(const std::string& key, const std::string& ns) {
  return Observe("getMemory", [&] { return memory_.Get(key, ns, util::NowMillis()); });
}

bool Coordinator::TouchMemory(const std::string& key, const std::string& ns) {
  return Observe("updateMemoryAccess", [&] { return memory_.Touch(key, ns, util::NowMillis()); });
}

std::vector<MemoryRecord> Coordinator::SearchMemory(const std::string& ns, const std::string& pattern, std::size_t limit) const {
  return Observe("searchMemory", [&] { return memory_.Search(ns, pattern, limit); });
}

bool Coordinator::DeleteMemory(const std::string& key, const std::string& ns) {
  return Observe("deleteMemory", [&] { return memory_.Delete(key, ns); });
}

std::vector<MemoryRecord> Coordinator::ListMemory(const std::string& ns, std::size_t limit) const {
  return Observe("listMemory", [&] { return memory_.List(ns, limit); });
}

std::vector<std::string> Coordinator::ListNamespaces() const {
  return Observe("listNamespaces", [&] { return memory_.ListNamespaces(); });
}

MemoryStats Coordinator::GetMemoryStats() const {
  return Observe("getMemoryStats", [&] { return memory_.Stats(); });
}

NamespaceStats Coordinator::GetNamespaceStats(const std::string& ns) const {
  return Observe("getNamespaceStats", [&] { return memory_.NamespaceStats(ns); });
}

std::size_t Coordinator::DeleteOldMemory(const std::string& ns, uint64_t ttl_sec) {
  return Observe("deleteOldEntries", [&] { return memory_.DeleteOlderThan(ns, ttl_sec, util::NowMillis()); });
}

std::size_t Coordinator::DeleteExpiredMemory() {
  return Observe("deleteExpiredEntries", [&] { return memory_.DeleteExpired(util::NowMillis()); });
}

std::size_t Coordinator::TrimNamespace(const std::string& ns, uint64_t max_entries) {
  return Observe("trimNamespace", [&] { return memory_.Trim(ns, max_entries); });
}

std::size_t Coordinator::ClearNamespace(const std::string& ns) {
  return Observe("clearNamespace", [&] { return memory_.ClearNamespace(ns); });
}

std::vector<MemoryRecord> Coordinator::GetRecentMemory(std::size_t limit) const {
  return Observe("getRecentMemory", [&] { return memory_.Recent(limit); });
}

std::vector<MemoryRecord> Coordinator::GetOldMemory(uint64_t age_sec, std::size_t limit) const {
  return Observe("getOldMemory", [&] { return memory_.OlderThan(age_sec, util::NowMillis(), limit); });
}

bool Coordinator::RestoreMemory(const MemoryRecord& entry) {
  return Observe("restoreMemoryEntry", [&] { return memory_.Restore(entry, util::NowMillis()); });
}

std::size_t Coordinator::ClearSwarmMemory(const std::string& swarm_id) {
  return Observe("clearSwarmMemory", [&] { return memory_.ClearSwarm(swarm_id); });
}

// ------------------------------------------------------------
// Communications
// ------------------------------------------------------------

CommunicationRecord Coordinator::SendMessage(CommunicationRecord message) {
  return Observe("createCommunication", [&] {
    FillIdentity(message.id, message.created_at_ms, util::NowMillis());
    messages_.Create(message);
    return message;
  });
}

std::optional<CommunicationRecord> Coordinator::GetMessage(const std::string& id) const {
  return Observe("getCommunication", [&] { return messages_.Get(id); });
}

std::vector<CommunicationRecord> Coordinator::GetPendingMessages(const std::string& agent_id) const {
  return Observe("getPendingMessages", [&] { return messages_.PendingFor(agent_id); });
}

void Coordinator::MarkMessageDelivered(const std::string& id, const std::optional<std::string>& recipient) {
  Observe("markMessageDelivered", [&] { messages_.MarkDelivered(id, util::NowMillis(), recipient); });
}

void Coordinator::MarkMessageRead(const std::string& id, const std::optional<std::string>& recipient) {
  Observe("markMessageRead", [&] { messages_.MarkRead(id, util::NowMillis(), recipient); });
}

void Coordinator::MarkMessageAcknowledged(const std::string& id, const std::optional<std::string>& recipient) {
  Observe("markMessageAcknowledged", [&] { messages_.MarkAcknowledged(id, util::NowMillis(), recipient); });
}

std::optional<ReceiptRecord> Coordinator::GetReceipt(const std::string& message_id, const std::string& agent_id) const {
  return Observe("getReceipt", [&] { return messages_.Receipt(message_id, agent_id); });
}

std::vector<CommunicationRecord> Coordinator::GetRecentMessages(const std::string& swarm_id, uint64_t window_ms) const {
  return Observe("getRecentMessages", [&] { return messages_.Recent(swarm_id, window_ms, util::NowMillis()); });
}

std::vector<CommunicationRecord> Coordinator::GetResponses(const std::string& parent_id) const {
  return Observe("getMessageResponses", [&] { return messages_.ResponsesTo(parent_id); });
}

// ------------------------------------------------------------
// Consensus
// ------------------------------------------------------------

ConsensusRecord Coordinator::CreateProposal(ConsensusRecord proposal) {
  return Observe("createConsensusProposal", [&] {
    FillIdentity(proposal.id, proposal.created_at_ms, util::NowMillis());
    consensus_.Create(proposal);
    return proposal;
  });
}

std::optional<ConsensusRecord> Coordinator::GetProposal(const std::string& id) const {
  return Observe("getConsensusProposal", [&] { return consensus_.Get(id); });
}

void Coordinator::SubmitVote(const std::string& proposal_id, const std::string& agent_id, bool vote,
                             const std::optional<std::string>& reason) {
  Observe("submitConsensusVote", [&] { consensus_.SubmitVote(proposal_id, agent_id, vote, reason, util::NowMillis()); });
}

void Coordinator::UpdateProposalStatus(const std::string& id, model::ConsensusStatus status) {
  Observe("updateConsensusStatus", [&] {
    consensus_.UpdateStatus(id, status, util::NowMillis());
    HIVE_LOG_INFO("Proposal resolved", {observability::StringField("proposal_id", id),
                                        observability::StringField("status", model::ToString(status))});
  });
}

model::ConsensusStatus Coordinator::EvaluateProposal(const std::string& id, std::optional<uint64_t> expected_voters) {
  return Observe("evaluateConsensus", [&] { return consensus_.Evaluate(id, util::NowMillis(), expected_voters); });
}

std::vector<ConsensusRecord> Coordinator::ListRecentProposals(const std::string& swarm_id, std::size_t limit) const {
  return Observe("getRecentConsensus", [&] { return consensus_.ListRecent(swarm_id, limit); });
}

std::vector<VoteRecord> Coordinator::GetVotes(const std::string& proposal_id) const {
  return Observe("getConsensusVotes", [&] { return consensus_.Votes(proposal_id); });
}

// ------------------------------------------------------------
// Metrics
// ------------------------------------------------------------

PerformanceMetricRecord Coordinator::RecordMetric(PerformanceMetricRecord metric) {
  return Observe("storePerformanceMetric", [&] {
    FillIdentity(metric.id, metric.created_at_ms, util::NowMillis());
    metrics_.Append(metric);
    return metric;
  });
}

std::vector<PerformanceMetricRecord> Coordinator::ListMetrics(const std::string& swarm_id, const std::string& metric_type,
                                                              std::size_t limit) const {
  return Observe("getPerformanceMetrics", [&] { return metrics_.List(swarm_id, metric_type, limit); });
}

// ------------------------------------------------------------
// Health
// ------------------------------------------------------------

HealthReport Coordinator::HealthCheck() const {
  return Observe("healthCheck", [&] {
    HealthReport report;

    try {
      for (const char* table : db::sql::kCoreTables) {
        auto present = db_->QueryOne("healthTableExists", db::sql::HEALTH_TABLE_EXISTS, {std::string(table)},
                                     [](const db::sql::Row& r) { return r.GetU64(0) > 0; });
        if (!present.value_or(false)) {
          report.message = std::string("missing table: ") + table;
          return report;
        }

        const std::string count_sql = std::string("SELECT COUNT(*) FROM ") + table + ";";
        auto rows = db_->QueryOne(std::string("healthCount:") + table, count_sql, {},
                                  [](const db::sql::Row& r) { return r.GetU64(0); });
        report.tables.push_back(TableCount{table, rows.value_or(0)});
      }

      auto check = db_->QueryOne("healthQuickCheck", db::sql::HEALTH_QUICK_CHECK, {},
                                 [](const db::sql::Row& r) { return r.GetText(0); });
      if (check.value_or("") != "ok") {
        report.message = "integrity check failed: " + check.value_or("no result");
        return report;
      }
    } catch (const db::DbError& e) {
      report.message = e.what();
      HIVE_LOG_WARN("Health check failed", {observability::StringField("error", e.what())});
      return report;
    }

    report.healthy = true;
    report.message = "ok";
    return report;
  });
}

} // namespace hive::core
