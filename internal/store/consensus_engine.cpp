#include "internal/store/consensus_engine.hpp"

#include "internal/db/api/error.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/errors.hpp"

namespace hive::store {

using db::model::ConsensusRecord;
using db::model::VoteRecord;
using model::ConsensusStatus;

namespace {

ConsensusRecord MapProposal(const db::sql::Row& r) {
  ConsensusRecord c;
  c.id                 = r.GetText(0);
  c.swarm_id           = r.GetText(1);
  c.proposal_type      = r.GetText(2);
  c.proposal_data      = r.GetOptionalText(3).value_or("{}");
  c.proposed_by        = r.GetText(4);
  c.threshold_required = r.GetDouble(5);
  c.votes_for          = r.GetU64(6);
  c.votes_against      = r.GetU64(7);
  c.votes_total        = r.GetU64(8);
  c.status             = model::ParseConsensusStatus(r.GetText(9));
  c.created_at_ms      = r.GetU64(10);
  c.resolved_at_ms     = r.GetOptionalU64(11);
  c.timeout_at_ms      = r.GetOptionalU64(12);
  return c;
}

} // namespace

ConsensusStatus Decide(const ConsensusRecord& proposal, uint64_t now_ms, std::optional<uint64_t> expected_voters) {
  if (model::IsTerminal(proposal.status)) {
    return proposal.status;
  }

  const double threshold = proposal.threshold_required;

  if (expected_voters && *expected_voters > 0) {
    const double electorate = static_cast<double>(*expected_voters);
    if (static_cast<double>(proposal.votes_for) / electorate >= threshold) {
      return ConsensusStatus::kAchieved;
    }
    const uint64_t missing   = *expected_voters > proposal.votes_total ? *expected_voters - proposal.votes_total : 0;
    const double   best_case = static_cast<double>(proposal.votes_for + missing);
    if (best_case / electorate < threshold) {
      return ConsensusStatus::kFailed;
    }
  } else if (proposal.votes_total > 0 &&
             static_cast<double>(proposal.votes_for) / static_cast<double>(proposal.votes_total) >= threshold) {
    return ConsensusStatus::kAchieved;
  }

  if (proposal.timeout_at_ms && now_ms >= *proposal.timeout_at_ms) {
    return ConsensusStatus::kTimeout;
  }
  return ConsensusStatus::kPending;
}

ConsensusEngine::ConsensusEngine(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
}

void ConsensusEngine::Create(const ConsensusRecord& proposal) {
  if (proposal.threshold_required < 0.0 || proposal.threshold_required > 1.0) {
    throw util::InvalidArgument("threshold_required must be within [0, 1]");
  }

  db_->Execute("createConsensusProposal", db::sql::CREATE_CONSENSUS_PROPOSAL,
               {proposal.id, proposal.swarm_id, proposal.proposal_type, proposal.proposal_data, proposal.proposed_by,
                proposal.threshold_required, proposal.votes_for, proposal.votes_against, proposal.votes_total,
                model::Text(proposal.status), proposal.created_at_ms, db::sql::Nullable(proposal.resolved_at_ms),
                db::sql::Nullable(proposal.timeout_at_ms)});
}

std::optional<ConsensusRecord> ConsensusEngine::Get(const std::string& id) const {
  return db_->QueryOne("getConsensusProposal", db::sql::GET_CONSENSUS_PROPOSAL, {id}, MapProposal);
}

void ConsensusEngine::SubmitVote(const std::string& proposal_id, const std::string& agent_id, bool vote,
                                 const std::optional<std::string>& reason, uint64_t now_ms) {
  db::sqlite::SqliteTransaction tx(db_);

  auto proposal = Get(proposal_id);
  if (!proposal) {
    throw util::NotFound("proposal not found: " + proposal_id);
  }
  if (model::IsTerminal(proposal->status)) {
    throw util::InvalidState("proposal " + proposal_id + " already " + model::Text(proposal->status));
  }

  try {
    db_->Execute("recordConsensusVote", db::sql::RECORD_CONSENSUS_VOTE,
                 {proposal_id, agent_id, static_cast<int32_t>(vote ? 1 : 0), db::sql::Nullable(reason), now_ms});
  } catch (const db::DbError& e) {
    if (e.Code() != db::ErrorCode::ConstraintViolation) throw;
    throw util::AlreadyExists("agent " + agent_id + " already voted on " + proposal_id);
  }

  db_->Execute("submitConsensusVote", db::sql::SUBMIT_CONSENSUS_VOTE,
               {static_cast<int32_t>(vote ? 1 : 0), static_cast<int32_t>(vote ? 0 : 1), proposal_id});

  tx.Commit();
}

void ConsensusEngine::UpdateStatus(const std::string& id, ConsensusStatus status, uint64_t now_ms) {
  if (!model::IsTerminal(status)) {
    throw util::InvalidArgument("proposal status can only move to achieved, failed or timeout");
  }

  db::sqlite::SqliteTransaction tx(db_);

  if (db_->Execute("updateConsensusStatus", db::sql::UPDATE_CONSENSUS_STATUS, {model::Text(status), now_ms, id}) == 0) {
    auto current = Get(id);
    if (!current) {
      throw util::NotFound("proposal not found: " + id);
    }
    throw util::InvalidState("proposal " + id + " already " + model::Text(current->status));
  }

  tx.Commit();
}

ConsensusStatus ConsensusEngine::Evaluate(const std::string& id, uint64_t now_ms, std::optional<uint64_t> expected_voters) {
  if (expected_voters && *expected_voters == 0) {
    throw util::InvalidArgument("expected_voters must be positive");
  }

  db::sqlite::SqliteTransaction tx(db_);

  auto proposal = Get(id);
  if (!proposal) {
    throw util::NotFound("proposal not found: " + id);
  }

  const ConsensusStatus next = Decide(*proposal, now_ms, expected_voters);
  if (model::CanTransition(proposal->status, next)) {
    db_->Execute("updateConsensusStatus", db::sql::UPDATE_CONSENSUS_STATUS, {model::Text(next), now_ms, id});
  }

  tx.Commit();
  return next;
}

std::vector<ConsensusRecord> ConsensusEngine::ListRecent(const std::string& swarm_id, std::size_t limit) const {
  if (limit == 0) {
    throw util::InvalidArgument("limit must be positive");
  }
  return db_->QueryAll("getRecentConsensus", db::sql::GET_RECENT_CONSENSUS, {swarm_id, static_cast<uint64_t>(limit)},
                       MapProposal);
}

std::vector<VoteRecord> ConsensusEngine::Votes(const std::string& proposal_id) const {
  return db_->QueryAll("getConsensusVotes", db::sql::GET_CONSENSUS_VOTES, {proposal_id}, [](const db::sql::Row& r) {
    VoteRecord v;
    v.proposal_id   = r.GetText(0);
    v.agent_id      = r.GetText(1);
    v.vote          = r.GetBool(2);
    v.reason        = r.GetOptionalText(3);
    v.created_at_ms = r.GetU64(4);
    return v;
  });
}

} // namespace hive::store
