#include "internal/store/communication_log.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "tests/support/store_fixture.hpp"

namespace {

using hive::db::model::CommunicationRecord;
using hive::model::BroadcastScope;
using hive::model::MessagePriority;
using hive::store::CommunicationLog;
using hive::testing::OpenMemoryDb;
using hive::testing::SeedAgent;
using hive::testing::SeedSwarm;

CommunicationRecord Direct(const std::string& id, const std::string& from, const std::string& to, uint64_t at,
                           MessagePriority priority = MessagePriority::kMedium) {
  CommunicationRecord m;
  m.id            = id;
  m.swarm_id      = "s";
  m.from_agent_id = from;
  m.to_agent_id   = to;
  m.message_type  = "direct";
  m.content       = "hello " + to;
  m.priority      = priority;
  m.created_at_ms = at;
  return m;
}

CommunicationRecord Broadcast(const std::string& id, const std::string& swarm_id, const std::string& from,
                              BroadcastScope scope, uint64_t at) {
  CommunicationRecord m;
  m.id              = id;
  m.swarm_id        = swarm_id;
  m.from_agent_id   = from;
  m.message_type    = "broadcast";
  m.content         = "all hands";
  m.broadcast_scope = scope;
  m.created_at_ms   = at;
  return m;
}

std::vector<std::string> Ids(const std::vector<CommunicationRecord>& messages) {
  std::vector<std::string> ids;
  for (const auto& m : messages) ids.push_back(m.id);
  return ids;
}

void Seed(const std::shared_ptr<hive::db::sqlite::SqliteDB>& db) {
  SeedSwarm(db, "s");
  SeedSwarm(db, "t");
  SeedAgent(db, "a", "s");
  SeedAgent(db, "b", "s");
  SeedAgent(db, "c", "s");
  SeedAgent(db, "x", "t");
}

void TestPendingOrderedByPriorityThenAge() {
  auto db = OpenMemoryDb();
  Seed(db);
  CommunicationLog log(db);

  log.Create(Direct("m-low", "a", "b", 1, MessagePriority::kLow));
  log.Create(Direct("m-med", "a", "b", 2));
  log.Create(Direct("m-urgent", "a", "b", 3, MessagePriority::kUrgent));
  log.Create(Direct("m-high", "a", "b", 4, MessagePriority::kHigh));
  log.Create(Direct("m-other", "a", "c", 5, MessagePriority::kUrgent));

  const std::vector<std::string> expected = {"m-urgent", "m-high", "m-med", "m-low"};
  assert(Ids(log.PendingFor("b")) == expected);

  log.MarkDelivered("m-urgent", 10);
  assert(log.PendingFor("b").size() == 3);
}

void TestStagesStampOnceAndBackfill() {
  auto db = OpenMemoryDb();
  Seed(db);
  CommunicationLog log(db);
  log.Create(Direct("m", "a", "b", 1));

  log.MarkAcknowledged("m", 50);
  auto m = log.Get("m");
  assert(m->delivered_at_ms == static_cast<uint64_t>(50));
  assert(m->read_at_ms == static_cast<uint64_t>(50));
  assert(m->acknowledged_at_ms == static_cast<uint64_t>(50));

  // repeats never move a timestamp
  log.MarkDelivered("m", 90);
  log.MarkRead("m", 95);
  log.MarkAcknowledged("m", 99);
  m = log.Get("m");
  assert(m->delivered_at_ms == static_cast<uint64_t>(50));
  assert(m->read_at_ms == static_cast<uint64_t>(50));
  assert(m->acknowledged_at_ms == static_cast<uint64_t>(50));

  log.Create(Direct("n", "a", "b", 2));
  log.MarkDelivered("n", 10, std::string("b"));
  log.MarkRead("n", 20);
  m = log.Get("n");
  assert(m->delivered_at_ms == static_cast<uint64_t>(10));
  assert(m->read_at_ms == static_cast<uint64_t>(20));
  assert(!m->acknowledged_at_ms);
}

void TestMarkErrors() {
  auto db = OpenMemoryDb();
  Seed(db);
  CommunicationLog log(db);
  log.Create(Direct("m", "a", "b", 1));

  bool missing = false;
  try {
    log.MarkRead("ghost", 1);
  } catch (const hive::util::NotFound&) {
    missing = true;
  }
  assert(missing);

  bool wrong_recipient = false;
  try {
    log.MarkRead("m", 1, std::string("c"));
  } catch (const hive::util::InvalidArgument&) {
    wrong_recipient = true;
  }
  assert(wrong_recipient);
  assert(!log.Get("m")->read_at_ms);

  bool scopeless = false;
  try {
    log.Create(Broadcast("bad", "s", "a", BroadcastScope::kNone, 1));
  } catch (const hive::util::InvalidArgument&) {
    scopeless = true;
  }
  assert(scopeless);
}

void TestBroadcastReceiptsArePerRecipient() {
  auto db = OpenMemoryDb();
  Seed(db);
  CommunicationLog log(db);
  log.Create(Broadcast("swarm-wide", "s", "a", BroadcastScope::kSwarm, 1));
  log.Create(Broadcast("everyone", "t", "x", BroadcastScope::kGlobal, 2));

  // the sender never sees its own broadcast
  assert(Ids(log.PendingFor("a")) == std::vector<std::string>{"everyone"});
  assert(log.PendingFor("b").size() == 2);
  // swarm scope stays inside the swarm
  assert(log.PendingFor("x").empty());

  log.MarkRead("swarm-wide", 30, std::string("b"));
  assert(Ids(log.PendingFor("b")) == std::vector<std::string>{"everyone"});
  assert(log.PendingFor("c").size() == 2);

  auto receipt = log.Receipt("swarm-wide", "b");
  assert(receipt);
  assert(receipt->delivered_at_ms == static_cast<uint64_t>(30));
  assert(receipt->read_at_ms == static_cast<uint64_t>(30));
  assert(!receipt->acknowledged_at_ms);
  assert(!log.Receipt("swarm-wide", "c"));

  // the message row itself stays open
  assert(!log.Get("swarm-wide")->delivered_at_ms);

  log.MarkAcknowledged("swarm-wide", 40, std::string("b"));
  receipt = log.Receipt("swarm-wide", "b");
  assert(receipt->delivered_at_ms == static_cast<uint64_t>(30));
  assert(receipt->acknowledged_at_ms == static_cast<uint64_t>(40));
}

void TestRecentAndThreads() {
  auto db = OpenMemoryDb();
  Seed(db);
  CommunicationLog log(db);

  log.Create(Direct("old", "a", "b", 100));
  auto question              = Direct("question", "a", "b", 5000);
  question.requires_response = true;
  log.Create(question);

  auto answer              = Direct("answer", "b", "a", 6000);
  answer.parent_message_id = std::string("question");
  log.Create(answer);
  auto follow_up              = Direct("follow-up", "b", "a", 7000);
  follow_up.parent_message_id = std::string("question");
  log.Create(follow_up);

  const std::vector<std::string> recent = {"follow-up", "answer", "question"};
  assert(Ids(log.Recent("s", 5000, 9000)) == recent);
  assert(log.Recent("s", 100000, 9000).size() == 4);
  assert(log.Recent("t", 100000, 9000).empty());

  assert(log.Get("question")->requires_response);
  const std::vector<std::string> replies = {"answer", "follow-up"};
  assert(Ids(log.ResponsesTo("question")) == replies);
}

void TestConcurrentMarksAgree() {
  auto db = OpenMemoryDb();
  Seed(db);
  CommunicationLog log(db);
  log.Create(Direct("m", "a", "b", 1));

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&log, i]() {
      const uint64_t now = 100 + static_cast<uint64_t>(i);
      log.MarkDelivered("m", now);
      log.MarkRead("m", now);
    });
  }
  for (auto& t : threads) t.join();

  auto m = log.Get("m");
  assert(m->delivered_at_ms && m->read_at_ms);
  assert(*m->delivered_at_ms >= 100 && *m->delivered_at_ms <= 107);
  assert(*m->read_at_ms >= 100 && *m->read_at_ms <= 107);

  // once stamped, later marks change nothing
  log.MarkRead("m", 500);
  auto again = log.Get("m");
  assert(again->delivered_at_ms == m->delivered_at_ms);
  assert(again->read_at_ms == m->read_at_ms);
}

} // namespace

int main() {
  TestPendingOrderedByPriorityThenAge();
  TestStagesStampOnceAndBackfill();
  TestMarkErrors();
  TestBroadcastReceiptsArePerRecipient();
  TestRecentAndThreads();
  TestConcurrentMarksAgree();

  std::cout << "hive_store_unit_communication_log: pass\n";
  return 0;
}
