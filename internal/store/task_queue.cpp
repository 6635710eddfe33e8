#include "internal/store/task_queue.hpp"

#include "internal/db/sql/sql_queries.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/errors.hpp"

namespace hive::store {

using db::model::ActiveTask;
using db::model::TaskRecord;

namespace {

TaskRecord MapTask(const db::sql::Row& r) {
  TaskRecord t;
  t.id                 = r.GetText(0);
  t.swarm_id           = r.GetText(1);
  t.type               = r.GetText(2);
  t.description        = r.GetText(3);
  t.status             = model::ParseTaskStatus(r.GetText(4));
  t.priority           = model::ParseTaskPriority(r.GetText(5));
  t.assigned_agent_id  = r.GetOptionalText(6);
  t.dependencies       = r.GetOptionalText(7).value_or("[]");
  t.requirements       = r.GetOptionalText(8).value_or("{}");
  t.result             = r.GetOptionalText(9);
  t.created_at_ms      = r.GetU64(10);
  t.assigned_at_ms     = r.GetOptionalU64(11);
  t.started_at_ms      = r.GetOptionalU64(12);
  t.completed_at_ms    = r.GetOptionalU64(13);
  t.estimated_duration = r.GetOptionalInt64(14);
  t.actual_duration    = r.GetOptionalInt64(15);
  t.metadata           = r.GetOptionalText(16).value_or("{}");
  return t;
}

} // namespace

TaskQueue::TaskQueue(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
}

void TaskQueue::Create(const TaskRecord& task) {
  // completed_at follows the status, not the caller
  std::optional<uint64_t> completed_at;
  if (model::IsTerminal(task.status)) {
    completed_at = task.completed_at_ms.value_or(task.created_at_ms);
  }

  db_->Execute("createTask", db::sql::CREATE_TASK,
               {task.id, task.swarm_id, task.type, task.description, model::Text(task.status), model::Text(task.priority),
                db::sql::Nullable(task.assigned_agent_id), task.dependencies, task.requirements, db::sql::Nullable(task.result),
                task.created_at_ms, db::sql::Nullable(task.assigned_at_ms), db::sql::Nullable(task.started_at_ms),
                db::sql::Nullable(completed_at), db::sql::Nullable(task.estimated_duration), db::sql::Nullable(task.actual_duration),
                task.metadata});
}

std::optional<TaskRecord> TaskQueue::Get(const std::string& id) const {
  return db_->QueryOne("getTask", db::sql::GET_TASK, {id}, MapTask);
}

std::vector<TaskRecord> TaskQueue::ListBySwarm(const std::string& swarm_id) const {
  return db_->QueryAll("getTasks", db::sql::GET_TASKS, {swarm_id}, MapTask);
}

void TaskQueue::Update(const std::string& id, const UpdateSet& set) {
  auto update = BuildUpdate(TaskColumns(), set, id);
  if (ExecuteUpdate(*db_, update) == 0) {
    throw util::NotFound("task not found: " + id);
  }
}

void TaskQueue::UpdateStatus(const std::string& id, model::TaskStatus status, uint64_t now_ms) {
  if (db_->Execute("updateTaskStatus", db::sql::UPDATE_TASK_STATUS, {model::Text(status), now_ms, id}) == 0) {
    throw util::NotFound("task not found: " + id);
  }
}

std::vector<TaskRecord> TaskQueue::ListPending(const std::string& swarm_id) const {
  return db_->QueryAll("getPendingTasks", db::sql::GET_PENDING_TASKS, {swarm_id}, MapTask);
}

std::vector<ActiveTask> TaskQueue::ListActive(const std::string& swarm_id) const {
  return db_->QueryAll("getActiveTasks", db::sql::GET_ACTIVE_TASKS, {swarm_id}, [](const db::sql::Row& r) {
    ActiveTask a;
    a.task       = MapTask(r);
    a.agent_name = r.GetOptionalText(17);
    return a;
  });
}

void TaskQueue::Reassign(const std::string& id, const std::string& agent_id, uint64_t now_ms) {
  if (db_->Execute("reassignTask", db::sql::REASSIGN_TASK, {agent_id, now_ms, id}) == 0) {
    throw util::NotFound("task not found: " + id);
  }
}

} // namespace hive::store
