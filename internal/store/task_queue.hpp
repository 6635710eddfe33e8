#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/task_record.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/store/update_set.hpp"

namespace hive::store {

/*
  Task queue.

  Pending tasks are served by priority rank (critical first) and
  FIFO within a rank. Status changes go through UpdateStatus so
  completed_at tracks terminal states.
*/
class TaskQueue {
 public:
  explicit TaskQueue(std::shared_ptr<db::sqlite::SqliteDB> db);

  void Create(const db::model::TaskRecord& task);

  std::optional<db::model::TaskRecord> Get(const std::string& id) const;

  // Newest first.
  std::vector<db::model::TaskRecord> ListBySwarm(const std::string& swarm_id) const;

  void Update(const std::string& id, const UpdateSet& set);

  void UpdateStatus(const std::string& id, hive::model::TaskStatus status, uint64_t now_ms);

  std::vector<db::model::TaskRecord> ListPending(const std::string& swarm_id) const;

  // assigned + in_progress with the assignee's name, oldest first.
  std::vector<db::model::ActiveTask> ListActive(const std::string& swarm_id) const;

  void Reassign(const std::string& id, const std::string& agent_id, uint64_t now_ms);

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_;
};

} // namespace hive::store
