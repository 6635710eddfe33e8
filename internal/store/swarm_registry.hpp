#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/swarm_record.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace hive::store {

/*
  Swarm registry.

  Owns the exclusive "active swarm" flag: SetActive clears every
  flag and sets the target inside one transaction, so concurrent
  callers always leave exactly one active row.
*/
class SwarmRegistry {
 public:
  explicit SwarmRegistry(std::shared_ptr<db::sqlite::SqliteDB> db);

  // An is_active record takes the flag from whichever swarm held it.
  void Create(const db::model::SwarmRecord& swarm);

  std::optional<db::model::SwarmRecord> Get(const std::string& id) const;

  std::optional<std::string> GetActiveId() const;

  // Throws util::NotFound for an unknown id; the previous active swarm is kept.
  void SetActive(const std::string& id, uint64_t now_ms);

  // Newest first.
  std::vector<db::model::SwarmSummary> ListAll() const;

  // Archiving also clears is_active.
  void UpdateStatus(const std::string& id, hive::model::SwarmStatus status, uint64_t now_ms);

  // recent_messages counts messages created within window_ms before now_ms.
  db::model::SwarmStats Stats(const std::string& id, uint64_t now_ms, uint64_t window_ms) const;

  // Task outcomes grouped by topology; the recent figures only count
  // tasks created within window_ms before now_ms.
  std::vector<db::model::StrategyPerformance> StrategyPerformance(const std::string& id, uint64_t now_ms,
                                                                  uint64_t window_ms) const;

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_;
};

} // namespace hive::store
