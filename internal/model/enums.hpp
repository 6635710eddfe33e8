#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace hive::model {

/*
  Closed value sets persisted as TEXT.

  ToString() gives the stored spelling; the Parse* functions accept
  exactly that spelling and throw util::InvalidArgument otherwise.
*/

enum class Topology : std::uint8_t { kMesh, kHierarchical, kRing, kStar };

enum class QueenMode : std::uint8_t { kCentralized, kDistributed };

enum class SwarmStatus : std::uint8_t { kActive, kPaused, kArchived };

enum class AgentType : std::uint8_t {
  kCoordinator,
  kResearcher,
  kCoder,
  kAnalyst,
  kArchitect,
  kTester,
  kReviewer,
  kOptimizer,
  kDocumenter,
  kMonitor,
  kSpecialist,
};

enum class AgentStatus : std::uint8_t { kIdle, kBusy, kActive, kError, kOffline };

enum class TaskStatus : std::uint8_t { kPending, kAssigned, kInProgress, kCompleted, kFailed, kCancelled };

// Declaration order is dispatch order.
enum class TaskPriority : std::uint8_t { kCritical, kHigh, kMedium, kLow };

enum class BroadcastScope : std::uint8_t { kNone, kSwarm, kGlobal };

enum class MessagePriority : std::uint8_t { kUrgent, kHigh, kMedium, kLow };

enum class ConsensusStatus : std::uint8_t { kPending, kAchieved, kFailed, kTimeout };

constexpr std::string_view ToString(Topology v) {
  switch (v) {
    case Topology::kMesh:
      return "mesh";
    case Topology::kHierarchical:
      return "hierarchical";
    case Topology::kRing:
      return "ring";
    case Topology::kStar:
      return "star";
  }
  return "mesh";
}

constexpr std::string_view ToString(QueenMode v) {
  return v == QueenMode::kDistributed ? "distributed" : "centralized";
}

constexpr std::string_view ToString(SwarmStatus v) {
  switch (v) {
    case SwarmStatus::kActive:
      return "active";
    case SwarmStatus::kPaused:
      return "paused";
    case SwarmStatus::kArchived:
      return "archived";
  }
  return "active";
}

constexpr std::string_view ToString(AgentType v) {
  switch (v) {
    case AgentType::kCoordinator:
      return "coordinator";
    case AgentType::kResearcher:
      return "researcher";
    case AgentType::kCoder:
      return "coder";
    case AgentType::kAnalyst:
      return "analyst";
    case AgentType::kArchitect:
      return "architect";
    case AgentType::kTester:
      return "tester";
    case AgentType::kReviewer:
      return "reviewer";
    case AgentType::kOptimizer:
      return "optimizer";
    case AgentType::kDocumenter:
      return "documenter";
    case AgentType::kMonitor:
      return "monitor";
    case AgentType::kSpecialist:
      return "specialist";
  }
  return "specialist";
}

constexpr std::string_view ToString(AgentStatus v) {
  switch (v) {
    case AgentStatus::kIdle:
      return "idle";
    case AgentStatus::kBusy:
      return "busy";
    case AgentStatus::kActive:
      return "active";
    case AgentStatus::kError:
      return "error";
    case AgentStatus::kOffline:
      return "offline";
  }
  return "idle";
}

constexpr std::string_view ToString(TaskStatus v) {
  switch (v) {
    case TaskStatus::kPending:
      return "pending";
    case TaskStatus::kAssigned:
      return "assigned";
    case TaskStatus::kInProgress:
      return "in_progress";
    case TaskStatus::kCompleted:
      return "completed";
    case TaskStatus::kFailed:
      return "failed";
    case TaskStatus::kCancelled:
      return "cancelled";
  }
  return "pending";
}

constexpr std::string_view ToString(TaskPriority v) {
  switch (v) {
    case TaskPriority::kCritical:
      return "critical";
    case TaskPriority::kHigh:
      return "high";
    case TaskPriority::kMedium:
      return "medium";
    case TaskPriority::kLow:
      return "low";
  }
  return "medium";
}

constexpr std::string_view ToString(BroadcastScope v) {
  switch (v) {
    case BroadcastScope::kNone:
      return "none";
    case BroadcastScope::kSwarm:
      return "swarm";
    case BroadcastScope::kGlobal:
      return "global";
  }
  return "none";
}

constexpr std::string_view ToString(MessagePriority v) {
  switch (v) {
    case MessagePriority::kUrgent:
      return "urgent";
    case MessagePriority::kHigh:
      return "high";
    case MessagePriority::kMedium:
      return "medium";
    case MessagePriority::kLow:
      return "low";
  }
  return "medium";
}

constexpr std::string_view ToString(ConsensusStatus v) {
  switch (v) {
    case ConsensusStatus::kPending:
      return "pending";
    case ConsensusStatus::kAchieved:
      return "achieved";
    case ConsensusStatus::kFailed:
      return "failed";
    case ConsensusStatus::kTimeout:
      return "timeout";
  }
  return "pending";
}

// 1 = dispatched first. Matches the CASE ranking in the statement catalog.
constexpr int Rank(TaskPriority v) {
  return static_cast<int>(v) + 1;
}

constexpr int Rank(MessagePriority v) {
  return static_cast<int>(v) + 1;
}

Topology        ParseTopology(std::string_view s);
QueenMode       ParseQueenMode(std::string_view s);
SwarmStatus     ParseSwarmStatus(std::string_view s);
AgentType       ParseAgentType(std::string_view s);
AgentStatus     ParseAgentStatus(std::string_view s);
TaskStatus      ParseTaskStatus(std::string_view s);
TaskPriority    ParseTaskPriority(std::string_view s);
BroadcastScope  ParseBroadcastScope(std::string_view s);
MessagePriority ParseMessagePriority(std::string_view s);
ConsensusStatus ParseConsensusStatus(std::string_view s);

inline std::string Text(Topology v) { return std::string(ToString(v)); }
inline std::string Text(QueenMode v) { return std::string(ToString(v)); }
inline std::string Text(SwarmStatus v) { return std::string(ToString(v)); }
inline std::string Text(AgentType v) { return std::string(ToString(v)); }
inline std::string Text(AgentStatus v) { return std::string(ToString(v)); }
inline std::string Text(TaskStatus v) { return std::string(ToString(v)); }
inline std::string Text(TaskPriority v) { return std::string(ToString(v)); }
inline std::string Text(BroadcastScope v) { return std::string(ToString(v)); }
inline std::string Text(MessagePriority v) { return std::string(ToString(v)); }
inline std::string Text(ConsensusStatus v) { return std::string(ToString(v)); }

} // namespace hive::model
