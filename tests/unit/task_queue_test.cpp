#include "internal/store/task_queue.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "tests/support/store_fixture.hpp"

namespace {

using hive::db::model::TaskRecord;
using hive::model::TaskPriority;
using hive::model::TaskStatus;
using hive::store::TaskQueue;
using hive::testing::OpenMemoryDb;
using hive::testing::SeedAgent;
using hive::testing::SeedSwarm;

TaskRecord MakeTask(const std::string& id, TaskPriority priority, uint64_t created_at_ms) {
  TaskRecord task;
  task.id            = id;
  task.swarm_id      = "s";
  task.type          = "analysis";
  task.description   = "task " + id;
  task.priority      = priority;
  task.created_at_ms = created_at_ms;
  return task;
}

std::vector<std::string> Ids(const std::vector<TaskRecord>& tasks) {
  std::vector<std::string> ids;
  for (const auto& t : tasks) ids.push_back(t.id);
  return ids;
}

void TestPendingOrderIsRankThenFifo() {
  auto db = OpenMemoryDb();
  SeedSwarm(db, "s");
  TaskQueue queue(db);

  queue.Create(MakeTask("low", TaskPriority::kLow, 1));
  queue.Create(MakeTask("med-late", TaskPriority::kMedium, 30));
  queue.Create(MakeTask("crit", TaskPriority::kCritical, 50));
  queue.Create(MakeTask("med-early", TaskPriority::kMedium, 10));
  queue.Create(MakeTask("high", TaskPriority::kHigh, 40));
  // same millisecond: insertion order decides
  queue.Create(MakeTask("med-tie-1", TaskPriority::kMedium, 30));
  queue.Create(MakeTask("med-tie-2", TaskPriority::kMedium, 30));

  auto ids = Ids(queue.ListPending("s"));
  const std::vector<std::string> expected = {"crit", "high", "med-early", "med-late", "med-tie-1", "med-tie-2", "low"};
  assert(ids == expected);
}

void TestPendingExcludesAssigned() {
  auto db = OpenMemoryDb();
  SeedSwarm(db, "s");
  SeedAgent(db, "a", "s");
  TaskQueue queue(db);

  queue.Create(MakeTask("t1", TaskPriority::kHigh, 1));
  queue.Create(MakeTask("t2", TaskPriority::kHigh, 2));
  queue.Reassign("t1", "a", 5);

  auto pending = queue.ListPending("s");
  assert(pending.size() == 1 && pending[0].id == "t2");
}

void TestCompletedAtTracksTerminalStates() {
  auto db = OpenMemoryDb();
  SeedSwarm(db, "s");
  TaskQueue queue(db);
  queue.Create(MakeTask("t", TaskPriority::kMedium, 1));

  queue.UpdateStatus("t", TaskStatus::kInProgress, 10);
  auto task = queue.Get("t");
  assert(task->status == TaskStatus::kInProgress);
  assert(task->started_at_ms == static_cast<uint64_t>(10));
  assert(!task->completed_at_ms);

  queue.UpdateStatus("t", TaskStatus::kCompleted, 20);
  task = queue.Get("t");
  assert(task->completed_at_ms == static_cast<uint64_t>(20));

  // reopened: completed_at cleared, started_at kept
  queue.UpdateStatus("t", TaskStatus::kInProgress, 30);
  task = queue.Get("t");
  assert(!task->completed_at_ms);
  assert(task->started_at_ms == static_cast<uint64_t>(10));

  queue.UpdateStatus("t", TaskStatus::kCancelled, 40);
  assert(queue.Get("t")->completed_at_ms == static_cast<uint64_t>(40));

  bool threw = false;
  try {
    queue.UpdateStatus("ghost", TaskStatus::kFailed, 1);
  } catch (const hive::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestActiveTasksCarryAgentName() {
  auto db = OpenMemoryDb();
  SeedSwarm(db, "s");
  SeedAgent(db, "a", "s");
  TaskQueue queue(db);

  queue.Create(MakeTask("t1", TaskPriority::kMedium, 1));
  queue.Create(MakeTask("t2", TaskPriority::kMedium, 2));
  queue.Create(MakeTask("t3", TaskPriority::kMedium, 3));
  queue.Reassign("t1", "a", 10);
  queue.UpdateStatus("t2", TaskStatus::kInProgress, 11);

  auto active = queue.ListActive("s");
  assert(active.size() == 2);
  assert(active[0].task.id == "t1");
  assert(active[0].agent_name == std::string("agent a"));
  assert(active[0].task.status == TaskStatus::kAssigned);
  assert(active[0].task.assigned_at_ms == static_cast<uint64_t>(10));
  assert(active[1].task.id == "t2");
  assert(!active[1].agent_name);
}

void TestListBySwarmNewestFirstAndPartialUpdate() {
  auto db = OpenMemoryDb();
  SeedSwarm(db, "s");
  TaskQueue queue(db);
  queue.Create(MakeTask("first", TaskPriority::kLow, 1));
  queue.Create(MakeTask("second", TaskPriority::kLow, 2));

  auto ids = Ids(queue.ListBySwarm("s"));
  assert(ids.size() == 2 && ids[0] == "second");

  hive::store::UpdateSet set;
  set.Set("result", std::string(R"({"ok":true})")).Set("priority", std::string("critical"));
  queue.Update("first", set);

  auto task = queue.Get("first");
  assert(task->result == std::string(R"({"ok":true})"));
  assert(task->priority == TaskPriority::kCritical);
}

void TestReassignUnknownTask() {
  auto db = OpenMemoryDb();
  SeedSwarm(db, "s");
  SeedAgent(db, "a", "s");
  TaskQueue queue(db);

  bool threw = false;
  try {
    queue.Reassign("ghost", "a", 1);
  } catch (const hive::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestPendingOrderIsRankThenFifo();
  TestPendingExcludesAssigned();
  TestCompletedAtTracksTerminalStates();
  TestActiveTasksCarryAgentName();
  TestListBySwarmNewestFirstAndPartialUpdate();
  TestReassignUnknownTask();

  std::cout << "hive_store_unit_task_queue: pass\n";
  return 0;
}
