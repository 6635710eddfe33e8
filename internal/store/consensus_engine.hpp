#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/consensus_record.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace hive::store {

/*
  Quorum proposals.

  SubmitVote only records the ballot. Resolution is explicit:
  either UpdateStatus with a chosen outcome, or Evaluate, which
  applies the threshold policy:

    achieved  votes_for / electorate >= threshold
    failed    threshold unreachable even if every missing voter says yes
    timeout   still pending at or after timeout_at

  The electorate is expected_voters when given, otherwise the votes
  cast so far (in which case a proposal never fails early).
*/
class ConsensusEngine {
 public:
  explicit ConsensusEngine(std::shared_ptr<db::sqlite::SqliteDB> db);

  void Create(const db::model::ConsensusRecord& proposal);

  std::optional<db::model::ConsensusRecord> Get(const std::string& id) const;

  // util::NotFound for unknown proposals, util::InvalidState once resolved,
  // util::AlreadyExists when agent_id already voted.
  void SubmitVote(const std::string& proposal_id, const std::string& agent_id, bool vote,
                  const std::optional<std::string>& reason, uint64_t now_ms);

  // pending -> achieved | failed | timeout only.
  void UpdateStatus(const std::string& id, hive::model::ConsensusStatus status, uint64_t now_ms);

  hive::model::ConsensusStatus Evaluate(const std::string& id, uint64_t now_ms,
                                        std::optional<uint64_t> expected_voters = std::nullopt);

  std::vector<db::model::ConsensusRecord> ListRecent(const std::string& swarm_id, std::size_t limit) const;

  std::vector<db::model::VoteRecord> Votes(const std::string& proposal_id) const;

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_;
};

// Pure policy step used by Evaluate.
hive::model::ConsensusStatus Decide(const db::model::ConsensusRecord& proposal, uint64_t now_ms,
                                    std::optional<uint64_t> expected_voters);

} // namespace hive::store
