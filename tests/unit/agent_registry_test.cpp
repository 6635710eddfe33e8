#include "internal/store/agent_registry.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/store/task_queue.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/store_fixture.hpp"

namespace {

using hive::model::AgentStatus;
using hive::store::AgentRegistry;
using hive::store::UpdateSet;
using hive::testing::OpenMemoryDb;
using hive::testing::SeedAgent;
using hive::testing::SeedSwarm;

void TestListBySwarmOldestFirst() {
  auto db = OpenMemoryDb();
  SeedSwarm(db, "s");
  SeedSwarm(db, "other");
  SeedAgent(db, "late", "s", 300);
  SeedAgent(db, "early", "s", 100);
  SeedAgent(db, "elsewhere", "other", 50);

  AgentRegistry registry(db);
  auto          agents = registry.ListBySwarm("s");
  assert(agents.size() == 2);
  assert(agents[0].id == "early");
  assert(agents[1].id == "late");
  assert(agents[0].type == hive::model::AgentType::kCoder);
  assert(agents[0].status == AgentStatus::kIdle);
  assert(!agents[0].last_active_at_ms);
}

void TestAgentRequiresExistingSwarm() {
  auto db = OpenMemoryDb();

  bool threw = false;
  try {
    SeedAgent(db, "orphan", "no-such-swarm");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestPartialUpdateWithIncrements() {
  auto db = OpenMemoryDb();
  SeedSwarm(db, "s");
  SeedAgent(db, "a", "s");

  AgentRegistry registry(db);
  UpdateSet     set;
  set.Set("name", std::string("renamed")).Increment("message_count", 3).Set("current_task_id", std::string("t9"));
  registry.Update("a", set);

  UpdateSet again;
  again.Increment("message_count");
  registry.Update("a", again);

  auto agent = registry.Get("a");
  assert(agent->name == "renamed");
  assert(agent->message_count == 4);
  assert(agent->current_task_id == std::string("t9"));
}

void TestMalformedUpdatesAreRejected() {
  auto db = OpenMemoryDb();
  SeedSwarm(db, "s");
  SeedAgent(db, "a", "s");
  AgentRegistry registry(db);

  bool empty_threw = false;
  try {
    registry.Update("a", UpdateSet{});
  } catch (const hive::util::InvalidArgument&) {
    empty_threw = true;
  }
  assert(empty_threw);

  bool counter_threw = false;
  try {
    UpdateSet set;
    set.Set("error_count", static_cast<int64_t>(0));
    registry.Update("a", set);
  } catch (const hive::util::InvalidArgument&) {
    counter_threw = true;
  }
  assert(counter_threw);

  bool missing_threw = false;
  try {
    UpdateSet set;
    set.Set("name", std::string("x"));
    registry.Update("ghost", set);
  } catch (const hive::util::NotFound&) {
    missing_threw = true;
  }
  assert(missing_threw);
}

void TestStatusAndOutcomes() {
  auto db = OpenMemoryDb();
  SeedSwarm(db, "s");
  SeedAgent(db, "a", "s");
  AgentRegistry registry(db);

  registry.UpdateStatus("a", AgentStatus::kBusy, 500);
  registry.RecordOutcome("a", true, 600);
  registry.RecordOutcome("a", true, 700);
  registry.RecordOutcome("a", false, 800);

  auto agent = registry.Get("a");
  assert(agent->status == AgentStatus::kBusy);
  assert(agent->success_count == 2);
  assert(agent->error_count == 1);
  assert(agent->last_active_at_ms == static_cast<uint64_t>(800));

  bool threw = false;
  try {
    registry.RecordOutcome("ghost", true, 1);
  } catch (const hive::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestPerformanceSummary() {
  auto db = OpenMemoryDb();
  SeedSwarm(db, "s");
  SeedAgent(db, "a", "s");
  AgentRegistry          registry(db);
  hive::store::TaskQueue tasks(db);

  auto add_task = [&](const std::string& id, int64_t duration, hive::model::TaskStatus status) {
    hive::db::model::TaskRecord task;
    task.id                = id;
    task.swarm_id          = "s";
    task.description       = id;
    task.assigned_agent_id = "a";
    task.actual_duration   = duration;
    task.created_at_ms     = 1;
    tasks.Create(task);
    tasks.UpdateStatus(id, status, 2);
  };
  add_task("t1", 100, hive::model::TaskStatus::kCompleted);
  add_task("t2", 300, hive::model::TaskStatus::kCompleted);
  add_task("t3", 200, hive::model::TaskStatus::kFailed);

  auto perf = registry.Performance("a");
  assert(perf);
  assert(perf->completed_tasks == 2);
  assert(perf->failed_tasks == 1);
  assert(perf->avg_task_duration_ms && *perf->avg_task_duration_ms == 200.0);

  SeedAgent(db, "idle", "s");
  auto idle = registry.Performance("idle");
  assert(idle && !idle->avg_task_duration_ms);

  assert(!registry.Performance("ghost"));
}

} // namespace

int main() {
  TestListBySwarmOldestFirst();
  TestAgentRequiresExistingSwarm();
  TestPartialUpdateWithIncrements();
  TestMalformedUpdatesAreRejected();
  TestStatusAndOutcomes();
  TestPerformanceSummary();

  std::cout << "hive_store_unit_agent_registry: pass\n";
  return 0;
}
