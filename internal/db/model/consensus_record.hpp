#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/enums.hpp"

namespace hive::db::model {

/*
  Persistent proposal row.

  votes_total == votes_for + votes_against at all times.
  The status leaves pending exactly once.
*/

struct ConsensusRecord {
  std::string id;
  std::string swarm_id;
  std::string proposal_type;

  // opaque JSON
  std::string proposal_data = "{}";

  std::string proposed_by;

  double threshold_required = 0.66;

  uint64_t votes_for     = 0;
  uint64_t votes_against = 0;
  uint64_t votes_total   = 0;

  hive::model::ConsensusStatus status = hive::model::ConsensusStatus::kPending;

  uint64_t                created_at_ms = 0;
  std::optional<uint64_t> resolved_at_ms;
  std::optional<uint64_t> timeout_at_ms;
};

struct VoteRecord {
  std::string proposal_id;
  std::string agent_id;
  bool        vote = false;

  std::optional<std::string> reason;

  uint64_t created_at_ms = 0;
};

} // namespace hive::db::model
