#include "internal/store/consensus_engine.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "tests/support/store_fixture.hpp"

namespace {

using hive::db::model::ConsensusRecord;
using hive::model::ConsensusStatus;
using hive::store::ConsensusEngine;
using hive::store::Decide;
using hive::testing::OpenMemoryDb;
using hive::testing::SeedSwarm;

ConsensusRecord Proposal(const std::string& id, double threshold, std::optional<uint64_t> timeout_at_ms = std::nullopt,
                         uint64_t created_at_ms = 100) {
  ConsensusRecord p;
  p.id                 = id;
  p.swarm_id           = "s";
  p.proposal_type      = "architecture";
  p.proposal_data      = R"({"choice":"sqlite"})";
  p.proposed_by        = "queen";
  p.threshold_required = threshold;
  p.created_at_ms      = created_at_ms;
  p.timeout_at_ms      = timeout_at_ms;
  return p;
}

void TestDecidePolicy() {
  auto p        = Proposal("p", 0.66);
  p.votes_for   = 2;
  p.votes_total = 2;
  assert(Decide(p, 0, uint64_t{3}) == ConsensusStatus::kAchieved);

  p.votes_for     = 0;
  p.votes_against = 2;
  p.votes_total   = 2;
  // one missing yes cannot reach 0.66 of 3
  assert(Decide(p, 0, uint64_t{3}) == ConsensusStatus::kFailed);

  p.votes_for     = 1;
  p.votes_against = 1;
  p.votes_total   = 2;
  assert(Decide(p, 0, std::nullopt) == ConsensusStatus::kPending);
  assert(Decide(p, 0, uint64_t{4}) == ConsensusStatus::kPending);

  p.timeout_at_ms = 500;
  assert(Decide(p, 499, std::nullopt) == ConsensusStatus::kPending);
  assert(Decide(p, 500, std::nullopt) == ConsensusStatus::kTimeout);

  // without an electorate an empty ballot never achieves
  auto empty = Proposal("e", 0.0);
  assert(Decide(empty, 0, std::nullopt) == ConsensusStatus::kPending);

  auto done   = Proposal("d", 0.5);
  done.status = ConsensusStatus::kFailed;
  assert(Decide(done, 0, uint64_t{1}) == ConsensusStatus::kFailed);
}

// 0.56 * 25 rounds above 14 in binary floating point while 14 / 25 equals 0.56
void TestThresholdIsComparedAsARatio() {
  auto p          = Proposal("r", 0.56);
  p.votes_for     = 14;
  p.votes_against = 11;
  p.votes_total   = 25;
  assert(Decide(p, 0, std::nullopt) == ConsensusStatus::kAchieved);
  assert(Decide(p, 0, uint64_t{25}) == ConsensusStatus::kAchieved);

  p.votes_for     = 13;
  p.votes_against = 12;
  assert(Decide(p, 0, std::nullopt) == ConsensusStatus::kPending);
  assert(Decide(p, 0, uint64_t{25}) == ConsensusStatus::kFailed);

  auto db = OpenMemoryDb();
  SeedSwarm(db, "s");
  ConsensusEngine engine(db);
  engine.Create(Proposal("ratio", 0.56));
  for (int i = 0; i < 25; ++i) {
    engine.SubmitVote("ratio", "agent-" + std::to_string(i), i < 14, std::nullopt, 10 + i);
  }
  assert(engine.Get("ratio")->votes_for == 14);
  assert(engine.Evaluate("ratio", 100, uint64_t{25}) == ConsensusStatus::kAchieved);
  assert(engine.Get("ratio")->status == ConsensusStatus::kAchieved);
}

void TestThresholdMustBeAFraction() {
  auto db = OpenMemoryDb();
  SeedSwarm(db, "s");
  ConsensusEngine engine(db);

  for (double bad : {-0.1, 1.5}) {
    bool threw = false;
    try {
      engine.Create(Proposal("p", bad));
    } catch (const hive::util::InvalidArgument&) {
      threw = true;
    }
    assert(threw);
  }
  engine.Create(Proposal("edge", 1.0));
  assert(engine.Get("edge")->threshold_required == 1.0);
}

void TestVotesAreCountedOncePerAgent() {
  auto db = OpenMemoryDb();
  SeedSwarm(db, "s");
  ConsensusEngine engine(db);
  engine.Create(Proposal("p", 0.5));

  engine.SubmitVote("p", "a", true, std::string("looks good"), 200);
  engine.SubmitVote("p", "b", false, std::nullopt, 210);

  bool duplicate = false;
  try {
    engine.SubmitVote("p", "a", false, std::nullopt, 220);
  } catch (const hive::util::AlreadyExists&) {
    duplicate = true;
  }
  assert(duplicate);

  auto p = engine.Get("p");
  assert(p->votes_for == 1);
  assert(p->votes_against == 1);
  assert(p->votes_total == 2);
  assert(p->status == ConsensusStatus::kPending);

  auto votes = engine.Votes("p");
  assert(votes.size() == 2);
  assert(votes[0].agent_id == "a" && votes[0].vote);
  assert(votes[0].reason == std::string("looks good"));
  assert(votes[1].agent_id == "b" && !votes[1].vote && !votes[1].reason);

  bool missing = false;
  try {
    engine.SubmitVote("ghost", "a", true, std::nullopt, 1);
  } catch (const hive::util::NotFound&) {
    missing = true;
  }
  assert(missing);
}

void TestTerminalStatusIsWrittenOnce() {
  auto db = OpenMemoryDb();
  SeedSwarm(db, "s");
  ConsensusEngine engine(db);
  engine.Create(Proposal("p", 0.5));

  bool not_terminal = false;
  try {
    engine.UpdateStatus("p", ConsensusStatus::kPending, 1);
  } catch (const hive::util::InvalidArgument&) {
    not_terminal = true;
  }
  assert(not_terminal);

  engine.UpdateStatus("p", ConsensusStatus::kAchieved, 300);
  auto p = engine.Get("p");
  assert(p->status == ConsensusStatus::kAchieved);
  assert(p->resolved_at_ms == static_cast<uint64_t>(300));

  bool again = false;
  try {
    engine.UpdateStatus("p", ConsensusStatus::kFailed, 400);
  } catch (const hive::util::InvalidState&) {
    again = true;
  }
  assert(again);
  assert(engine.Get("p")->resolved_at_ms == static_cast<uint64_t>(300));

  bool late_vote = false;
  try {
    engine.SubmitVote("p", "a", true, std::nullopt, 500);
  } catch (const hive::util::InvalidState&) {
    late_vote = true;
  }
  assert(late_vote);
  assert(engine.Votes("p").empty());

  bool missing = false;
  try {
    engine.UpdateStatus("ghost", ConsensusStatus::kFailed, 1);
  } catch (const hive::util::NotFound&) {
    missing = true;
  }
  assert(missing);
}

void TestEvaluateAppliesOutcome() {
  auto db = OpenMemoryDb();
  SeedSwarm(db, "s");
  ConsensusEngine engine(db);

  engine.Create(Proposal("yes", 0.66));
  engine.SubmitVote("yes", "a", true, std::nullopt, 1);
  engine.SubmitVote("yes", "b", true, std::nullopt, 2);
  assert(engine.Evaluate("yes", 10, uint64_t{3}) == ConsensusStatus::kAchieved);
  assert(engine.Get("yes")->status == ConsensusStatus::kAchieved);
  assert(engine.Get("yes")->resolved_at_ms == static_cast<uint64_t>(10));
  // already resolved: reported, not rewritten
  assert(engine.Evaluate("yes", 20) == ConsensusStatus::kAchieved);
  assert(engine.Get("yes")->resolved_at_ms == static_cast<uint64_t>(10));

  engine.Create(Proposal("no", 0.66));
  engine.SubmitVote("no", "a", false, std::nullopt, 1);
  engine.SubmitVote("no", "b", false, std::nullopt, 2);
  assert(engine.Evaluate("no", 10, uint64_t{3}) == ConsensusStatus::kFailed);

  engine.Create(Proposal("slow", 0.66, uint64_t{1000}));
  engine.SubmitVote("slow", "a", true, std::nullopt, 1);
  engine.SubmitVote("slow", "b", false, std::nullopt, 2);
  assert(engine.Evaluate("slow", 999) == ConsensusStatus::kPending);
  assert(engine.Get("slow")->status == ConsensusStatus::kPending);
  assert(engine.Evaluate("slow", 1000) == ConsensusStatus::kTimeout);
  assert(engine.Get("slow")->status == ConsensusStatus::kTimeout);

  bool zero = false;
  try {
    engine.Evaluate("slow", 1, uint64_t{0});
  } catch (const hive::util::InvalidArgument&) {
    zero = true;
  }
  assert(zero);
}

void TestListRecentNewestFirst() {
  auto db = OpenMemoryDb();
  SeedSwarm(db, "s");
  ConsensusEngine engine(db);
  engine.Create(Proposal("first", 0.5, std::nullopt, 1));
  engine.Create(Proposal("second", 0.5, std::nullopt, 2));
  engine.Create(Proposal("third", 0.5, std::nullopt, 3));

  auto recent = engine.ListRecent("s", 2);
  assert(recent.size() == 2);
  assert(recent[0].id == "third" && recent[1].id == "second");
  assert(recent[0].proposal_data == R"({"choice":"sqlite"})");
}

} // namespace

int main() {
  TestDecidePolicy();
  TestThresholdIsComparedAsARatio();
  TestThresholdMustBeAFraction();
  TestVotesAreCountedOncePerAgent();
  TestTerminalStatusIsWrittenOnce();
  TestEvaluateAppliesOutcome();
  TestListRecentNewestFirst();

  std::cout << "hive_store_unit_consensus_engine: pass\n";
  return 0;
}
