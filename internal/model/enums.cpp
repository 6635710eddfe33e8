#include "internal/model/enums.hpp"

#include <initializer_list>
#include <utility>

#include "internal/util/errors.hpp"

namespace hive::model {

namespace {

template <typename E>
E ParseOne(std::string_view what, std::string_view s, std::initializer_list<E> values) {
  for (E v : values) {
    if (ToString(v) == s) {
      return v;
    }
  }
  throw util::InvalidArgument("invalid " + std::string(what) + ": '" + std::string(s) + "'");
}

} // namespace

Topology ParseTopology(std::string_view s) {
  return ParseOne("topology", s, {Topology::kMesh, Topology::kHierarchical, Topology::kRing, Topology::kStar});
}

QueenMode ParseQueenMode(std::string_view s) {
  return ParseOne("queen mode", s, {QueenMode::kCentralized, QueenMode::kDistributed});
}

SwarmStatus ParseSwarmStatus(std::string_view s) {
  return ParseOne("swarm status", s, {SwarmStatus::kActive, SwarmStatus::kPaused, SwarmStatus::kArchived});
}

AgentType ParseAgentType(std::string_view s) {
  return ParseOne("agent type", s,
                  {AgentType::kCoordinator, AgentType::kResearcher, AgentType::kCoder, AgentType::kAnalyst,
                   AgentType::kArchitect, AgentType::kTester, AgentType::kReviewer, AgentType::kOptimizer,
                   AgentType::kDocumenter, AgentType::kMonitor, AgentType::kSpecialist});
}

AgentStatus ParseAgentStatus(std::string_view s) {
  return ParseOne("agent status", s,
                  {AgentStatus::kIdle, AgentStatus::kBusy, AgentStatus::kActive, AgentStatus::kError, AgentStatus::kOffline});
}

TaskStatus ParseTaskStatus(std::string_view s) {
  return ParseOne("task status", s,
                  {TaskStatus::kPending, TaskStatus::kAssigned, TaskStatus::kInProgress, TaskStatus::kCompleted,
                   TaskStatus::kFailed, TaskStatus::kCancelled});
}

TaskPriority ParseTaskPriority(std::string_view s) {
  return ParseOne("task priority", s, {TaskPriority::kCritical, TaskPriority::kHigh, TaskPriority::kMedium, TaskPriority::kLow});
}

BroadcastScope ParseBroadcastScope(std::string_view s) {
  return ParseOne("broadcast scope", s, {BroadcastScope::kNone, BroadcastScope::kSwarm, BroadcastScope::kGlobal});
}

MessagePriority ParseMessagePriority(std::string_view s) {
  return ParseOne("message priority", s,
                  {MessagePriority::kUrgent, MessagePriority::kHigh, MessagePriority::kMedium, MessagePriority::kLow});
}

ConsensusStatus ParseConsensusStatus(std::string_view s) {
  return ParseOne("consensus status", s,
                  {ConsensusStatus::kPending, ConsensusStatus::kAchieved, ConsensusStatus::kFailed, ConsensusStatus::kTimeout});
}

} // namespace hive::model
