#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/memory_record.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace hive::store {

/*
  Namespaced key/value cache.

  Listing, search and trim all rank entries the same way:
    access_count DESC, last_accessed_at DESC, insertion DESC
*/
class MemoryCache {
 public:
  explicit MemoryCache(std::shared_ptr<db::sqlite::SqliteDB> db);

  // Upsert. value, metadata and ttl are replaced; created_at and
  // access_count of an existing entry are kept.
  void Store(const db::model::MemoryRecord& entry, uint64_t now_ms);

  // Touch + read in one transaction. The returned row reflects the touch.
  std::optional<db::model::MemoryRecord> Get(const std::string& key, const std::string& ns, uint64_t now_ms);

  // Reads without counting an access.
  std::optional<db::model::MemoryRecord> Peek(const std::string& key, const std::string& ns) const;

  // false when the entry does not exist.
  bool Touch(const std::string& key, const std::string& ns, uint64_t now_ms);

  // Substring match on key or value; '%' and '_' in pattern match literally.
  std::vector<db::model::MemoryRecord> Search(const std::string& ns, const std::string& pattern, std::size_t limit) const;

  bool Delete(const std::string& key, const std::string& ns);

  std::vector<db::model::MemoryRecord> List(const std::string& ns, std::size_t limit) const;

  std::vector<std::string> ListNamespaces() const;

  db::model::MemoryStats    Stats() const;
  db::model::NamespaceStats NamespaceStats(const std::string& ns) const;

  // Removes entries of ns not updated within ttl_sec; returns the count.
  std::size_t DeleteOlderThan(const std::string& ns, uint64_t ttl_sec, uint64_t now_ms);

  // Removes entries whose own ttl has run out.
  std::size_t DeleteExpired(uint64_t now_ms);

  // Keeps the max_entries best ranked entries of ns.
  std::size_t Trim(const std::string& ns, uint64_t max_entries);

  std::size_t ClearNamespace(const std::string& ns);

  // Most recently read entries of every namespace.
  std::vector<db::model::MemoryRecord> Recent(std::size_t limit) const;

  // Entries created more than age_sec before now_ms, oldest first. Read only.
  std::vector<db::model::MemoryRecord> OlderThan(uint64_t age_sec, uint64_t now_ms, std::size_t limit) const;

  // Writes value, metadata, access_count and last_accessed_at of a saved
  // entry back onto the existing row. false when the row is gone.
  bool Restore(const db::model::MemoryRecord& entry, uint64_t now_ms);

  // Removes every entry whose metadata carries "swarmId":"<swarm_id>".
  std::size_t ClearSwarm(const std::string& swarm_id);

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_;
};

// Escapes LIKE wildcards with '\' and wraps the result in '%'.
std::string LikeContains(const std::string& pattern);

// Saturating "now_ms minus age_sec"; 0 once the age reaches back past the epoch.
uint64_t AgeCutoff(uint64_t age_sec, uint64_t now_ms);

} // namespace hive::store
