#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/enums.hpp"

namespace hive::db::model {

/*
  Persistent message row.

  Missing to_agent_id means broadcast. Delivery timestamps only
  move forward: delivered <= read <= acknowledged.
*/

struct CommunicationRecord {
  std::string id;
  std::string swarm_id;
  std::string from_agent_id;

  std::optional<std::string> to_agent_id;

  std::string message_type;
  std::string content;
  std::string metadata = "{}";

  hive::model::BroadcastScope  broadcast_scope = hive::model::BroadcastScope::kNone;
  hive::model::MessagePriority priority        = hive::model::MessagePriority::kMedium;

  uint64_t                created_at_ms = 0;
  std::optional<uint64_t> delivered_at_ms;
  std::optional<uint64_t> read_at_ms;
  std::optional<uint64_t> acknowledged_at_ms;

  bool requires_response = false;

  std::optional<std::string> parent_message_id;

  bool IsBroadcast() const {
    return !to_agent_id.has_value();
  }
};

// Per-recipient delivery state of a broadcast.
struct ReceiptRecord {
  std::string message_id;
  std::string agent_id;

  std::optional<uint64_t> delivered_at_ms;
  std::optional<uint64_t> read_at_ms;
  std::optional<uint64_t> acknowledged_at_ms;
};

} // namespace hive::db::model
