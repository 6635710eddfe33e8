#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/agent_record.hpp"
#include "internal/db/model/communication_record.hpp"
#include "internal/db/model/consensus_record.hpp"
#include "internal/db/model/memory_record.hpp"
#include "internal/db/model/metric_record.hpp"
#include "internal/db/model/swarm_record.hpp"
#include "internal/db/model/task_record.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/store/agent_registry.hpp"
#include "internal/store/communication_log.hpp"
#include "internal/store/consensus_engine.hpp"
#include "internal/store/memory_cache.hpp"
#include "internal/store/metrics_log.hpp"
#include "internal/store/swarm_registry.hpp"
#include "internal/store/task_queue.hpp"
#include "internal/store/update_set.hpp"

namespace hive::core {

/*
  Coordinator

  Single entry point over the entity stores. Constructed once by
  the composition root and passed to whoever needs it.

  Create* calls fill in a fresh UUID when id is empty and the
  current time when created_at is zero, then return the stored
  record. Every call logs failures with its operation name and
  rethrows the original exception.
*/
class Coordinator {
 public:
  explicit Coordinator(std::shared_ptr<db::sqlite::SqliteDB> db);

  // swarms
  db::model::SwarmRecord                CreateSwarm(db::model::SwarmRecord swarm);
  std::optional<db::model::SwarmRecord> GetSwarm(const std::string& id) const;
  std::optional<std::string>            GetActiveSwarmId() const;
  void                                  SetActiveSwarm(const std::string& id);
  std::vector<db::model::SwarmSummary>  ListSwarms() const;
  void                                  UpdateSwarmStatus(const std::string& id, hive::model::SwarmStatus status);
  db::model::SwarmStats                 GetSwarmStats(const std::string& id, uint64_t window_ms = kDefaultWindowMs) const;
  std::vector<db::model::StrategyPerformance> GetStrategyPerformance(const std::string& swarm_id,
                                                                     uint64_t window_ms = kStrategyWindowMs) const;

  // agents
  db::model::AgentRecord                     CreateAgent(db::model::AgentRecord agent);
  std::optional<db::model::AgentRecord>      GetAgent(const std::string& id) const;
  std::vector<db::model::AgentRecord>        ListAgents(const std::string& swarm_id) const;
  void                                       UpdateAgent(const std::string& id, const store::UpdateSet& set);
  void                                       UpdateAgentStatus(const std::string& id, hive::model::AgentStatus status);
  void                                       RecordAgentOutcome(const std::string& id, bool success);
  std::optional<db::model::AgentPerformance> GetAgentPerformance(const std::string& id) const;

  // tasks
  db::model::TaskRecord                CreateTask(db::model::TaskRecord task);
  std::optional<db::model::TaskRecord> GetTask(const std::string& id) const;
  std::vector<db::model::TaskRecord>   ListTasks(const std::string& swarm_id) const;
  void                                 UpdateTask(const std::string& id, const store::UpdateSet& set);
  void                                 UpdateTaskStatus(const std::string& id, hive::model::TaskStatus status);
  std::vector<db::model::TaskRecord>   GetPendingTasks(const std::string& swarm_id) const;
  std::vector<db::model::ActiveTask>   GetActiveTasks(const std::string& swarm_id) const;
  void                                 ReassignTask(const std::string& id, const std::string& agent_id);

  // memory
  void StoreMemory(const std::string& key, const std::string& ns, const std::string& value,
                   const std::string& metadata = "{}", std::optional<int64_t> ttl_sec = std::nullopt);
  std::optional<db::model::MemoryRecord> GetMemory(const std::string& key, const std::string& ns);
  bool                                   TouchMemory(const std::string& key, const std::string& ns);
  std::vector<db::model::MemoryRecord>   SearchMemory(const std::string& ns, const std::string& pattern, std::size_t limit = 10) const;
  bool                                   DeleteMemory(const std::string& key, const std::string& ns);
  std::vector<db::model::MemoryRecord>   ListMemory(const std::string& ns, std::size_t limit = 100) const;
  std::vector<std::string>               ListNamespaces() const;
  db::model::MemoryStats                 GetMemoryStats() const;
  db::model::NamespaceStats              GetNamespaceStats(const std::string& ns) const;
  std::size_t                            DeleteOldMemory(const std::string& ns, uint64_t ttl_sec);
  std::size_t                            DeleteExpiredMemory();
  std::size_t                            TrimNamespace(const std::string& ns, uint64_t max_entries);
  std::size_t                            ClearNamespace(const std::string& ns);
  std::vector<db::model::MemoryRecord>   GetRecentMemory(std::size_t limit = 100) const;
  std::vector<db::model::MemoryRecord>   GetOldMemory(uint64_t age_sec, std::size_t limit = 1000) const;
  bool                                   RestoreMemory(const db::model::MemoryRecord& entry);
  std::size_t                            ClearSwarmMemory(const std::string& swarm_id);

  // communications
  db::model::CommunicationRecord                SendMessage(db::model::CommunicationRecord message);
  std::optional<db::model::CommunicationRecord> GetMessage(const std::string& id) const;
  std::vector<db::model::CommunicationRecord>   GetPendingMessages(const std::string& agent_id) const;
  void MarkMessageDelivered(const std::string& id, const std::optional<std::string>& recipient = std::nullopt);
  void MarkMessageRead(const std::string& id, const std::optional<std::string>& recipient = std::nullopt);
  void MarkMessageAcknowledged(const std::string& id, const std::optional<std::string>& recipient = std::nullopt);
  std::optional<db::model::ReceiptRecord>     GetReceipt(const std::string& message_id, const std::string& agent_id) const;
  std::vector<db::model::CommunicationRecord> GetRecentMessages(const std::string& swarm_id, uint64_t window_ms = kDefaultWindowMs) const;
  std::vector<db::model::CommunicationRecord> GetResponses(const std::string& parent_id) const;

  // consensus
  db::model::ConsensusRecord                CreateProposal(db::model::ConsensusRecord proposal);
  std::optional<db::model::ConsensusRecord> GetProposal(const std::string& id) const;
  void SubmitVote(const std::string& proposal_id, const std::string& agent_id, bool vote,
                  const std::optional<std::string>& reason = std::nullopt);
  void UpdateProposalStatus(const std::string& id, hive::model::ConsensusStatus status);
  hive::model::ConsensusStatus EvaluateProposal(const std::string& id, std::optional<uint64_t> expected_voters = std::nullopt);
  std::vector<db::model::ConsensusRecord> ListRecentProposals(const std::string& swarm_id, std::size_t limit = 10) const;
  std::vector<db::model::VoteRecord>      GetVotes(const std::string& proposal_id) const;

  // metrics
  db::model::PerformanceMetricRecord RecordMetric(db::model::PerformanceMetricRecord metric);
  std::vector<db::model::PerformanceMetricRecord> ListMetrics(const std::string& swarm_id, const std::string& metric_type,
                                                             std::size_t limit = 100) const;

  // Row counts of the core tables plus an integrity check.
  db::model::HealthReport HealthCheck() const;

  const std::shared_ptr<db::sqlite::SqliteDB>& Database() const {
    return db_;
  }

  static constexpr uint64_t kDefaultWindowMs  = 3600 * 1000;
  static constexpr uint64_t kStrategyWindowMs = uint64_t{7} * 24 * 3600 * 1000;

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_;

  store::SwarmRegistry    swarms_;
  store::AgentRegistry    agents_;
  store::TaskQueue        tasks_;
  store::MemoryCache      memory_;
  store::CommunicationLog messages_;
  store::ConsensusEngine  consensus_;
  store::MetricsLog       metrics_;
};

} // namespace hive::core
