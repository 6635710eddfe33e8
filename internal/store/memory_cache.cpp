#include "internal/store/memory_cache.hpp"

#include "internal/db/sql/sql_queries.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/util/errors.hpp"

namespace hive::store {

using db::model::MemoryRecord;
using db::model::MemoryStats;

namespace {

MemoryRecord MapMemory(const db::sql::Row& r) {
  MemoryRecord m;
  m.key                 = r.GetText(0);
  m.ns                  = r.GetText(1);
  m.value               = r.GetText(2);
  m.access_count        = r.GetU64(3);
  m.last_accessed_at_ms = r.GetOptionalU64(4);
  m.created_at_ms       = r.GetU64(5);
  m.updated_at_ms       = r.GetU64(6);
  m.metadata            = r.GetOptionalText(7).value_or("{}");
  m.ttl_sec             = r.GetOptionalInt64(8);
  return m;
}

void RequireLimit(std::size_t limit) {
  if (limit == 0) {
    throw util::InvalidArgument("limit must be positive");
  }
}

} // namespace

std::string LikeContains(const std::string& pattern) {
  std::string out;
  out.reserve(pattern.size() + 2);
  out.push_back('%');
  for (char c : pattern) {
    if (c == '%' || c == '_' || c == '\\') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  out.push_back('%');
  return out;
}

// The comparison happens before multiplying so a huge age cannot wrap.
uint64_t AgeCutoff(uint64_t age_sec, uint64_t now_ms) {
  return age_sec > now_ms / 1000 ? 0 : now_ms - age_sec * 1000;
}

MemoryCache::MemoryCache(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
}

void MemoryCache::Store(const MemoryRecord& entry, uint64_t now_ms) {
  if (entry.key.empty()) {
    throw util::InvalidArgument("memory key must not be empty");
  }
  if (entry.ttl_sec && *entry.ttl_sec < 0) {
    throw util::InvalidArgument("memory ttl must not be negative");
  }

  db_->Execute("storeMemory", db::sql::STORE_MEMORY,
               {entry.key, entry.ns, entry.value, static_cast<int64_t>(0), nullptr, now_ms, now_ms, entry.metadata,
                db::sql::Nullable(entry.ttl_sec)});
}

std::optional<MemoryRecord> MemoryCache::Get(const std::string& key, const std::string& ns, uint64_t now_ms) {
  db::sqlite::SqliteTransaction tx(db_);

  if (db_->Execute("updateMemoryAccess", db::sql::UPDATE_MEMORY_ACCESS, {now_ms, key, ns}) == 0) {
    tx.Commit();
    return std::nullopt;
  }

  auto entry = db_->QueryOne("getMemory", db::sql::GET_MEMORY, {key, ns}, MapMemory);
  tx.Commit();
  return entry;
}

std::optional<MemoryRecord> MemoryCache::Peek(const std::string& key, const std::string& ns) const {
  return db_->QueryOne("getMemory", db::sql::GET_MEMORY, {key, ns}, MapMemory);
}

bool MemoryCache::Touch(const std::string& key, const std::string& ns, uint64_t now_ms) {
  return db_->Execute("updateMemoryAccess", db::sql::UPDATE_MEMORY_ACCESS, {now_ms, key, ns}) > 0;
}

std::vector<MemoryRecord> MemoryCache::Search(const std::string& ns, const std::string& pattern, std::size_t limit) const {
  RequireLimit(limit);
  return db_->QueryAll("searchMemory", db::sql::SEARCH_MEMORY, {ns, LikeContains(pattern), static_cast<uint64_t>(limit)},
                       MapMemory);
}

bool MemoryCache::Delete(const std::string& key, const std::string& ns) {
  return db_->Execute("deleteMemory", db::sql::DELETE_MEMORY, {key, ns}) > 0;
}

std::vector<MemoryRecord> MemoryCache::List(const std::string& ns, std::size_t limit) const {
  RequireLimit(limit);
  return db_->QueryAll("listMemory", db::sql::LIST_MEMORY, {ns, static_cast<uint64_t>(limit)}, MapMemory);
}

std::vector<std::string> MemoryCache::ListNamespaces() const {
  return db_->QueryAll("listNamespaces", db::sql::LIST_NAMESPACES, {},
                       [](const db::sql::Row& r) { return r.GetText(0); });
}

MemoryStats MemoryCache::Stats() const {
  auto stats = db_->QueryOne("getMemoryStats", db::sql::GET_MEMORY_STATS, {}, [](const db::sql::Row& r) {
    MemoryStats s;
    s.total_entries = r.GetU64(0);
    s.total_size    = r.GetU64(1);
    s.namespaces    = r.GetU64(2);
    return s;
  });
  return stats.value_or(MemoryStats{});
}

db::model::NamespaceStats MemoryCache::NamespaceStats(const std::string& ns) const {
  auto stats = db_->QueryOne("getNamespaceStats", db::sql::GET_NAMESPACE_STATS, {ns}, [](const db::sql::Row& r) {
    db::model::NamespaceStats s;
    s.entries             = r.GetU64(0);
    s.size                = r.GetU64(1);
    s.avg_ttl_sec         = r.GetOptionalDouble(2);
    s.avg_access_count    = r.GetOptionalDouble(3);
    s.last_accessed_at_ms = r.GetOptionalU64(4);
    return s;
  });
  return stats.value_or(db::model::NamespaceStats{});
}

std::size_t MemoryCache::DeleteOlderThan(const std::string& ns, uint64_t ttl_sec, uint64_t now_ms) {
  return db_->Execute("deleteOldEntries", db::sql::DELETE_OLD_ENTRIES, {ns, AgeCutoff(ttl_sec, now_ms)});
}

std::size_t MemoryCache::DeleteExpired(uint64_t now_ms) {
  return db_->Execute("deleteExpiredEntries", db::sql::DELETE_EXPIRED_ENTRIES, {now_ms});
}

std::size_t MemoryCache::Trim(const std::string& ns, uint64_t max_entries) {
  return db_->Execute("trimNamespace", db::sql::TRIM_NAMESPACE, {ns, max_entries});
}

std::size_t MemoryCache::ClearNamespace(const std::string& ns) {
  return db_->Execute("clearNamespace", db::sql::CLEAR_NAMESPACE, {ns});
}

std::vector<MemoryRecord> MemoryCache::Recent(std::size_t limit) const {
  RequireLimit(limit);
  return db_->QueryAll("getRecentMemory", db::sql::GET_RECENT_MEMORY, {static_cast<uint64_t>(limit)}, MapMemory);
}

std::vector<MemoryRecord> MemoryCache::OlderThan(uint64_t age_sec, uint64_t now_ms, std::size_t limit) const {
  RequireLimit(limit);
  return db_->QueryAll("getOldMemory", db::sql::GET_OLD_MEMORY, {AgeCutoff(age_sec, now_ms), static_cast<uint64_t>(limit)},
                       MapMemory);
}

bool MemoryCache::Restore(const MemoryRecord& entry, uint64_t now_ms) {
  return db_->Execute("restoreMemoryEntry", db::sql::RESTORE_MEMORY_ENTRY,
                      {entry.value, entry.metadata, entry.access_count, db::sql::Nullable(entry.last_accessed_at_ms),
                       now_ms, entry.key, entry.ns}) > 0;
}

std::size_t MemoryCache::ClearSwarm(const std::string& swarm_id) {
  if (swarm_id.empty()) {
    throw util::InvalidArgument("swarm id must not be empty");
  }
  return db_->Execute("clearSwarmMemory", db::sql::CLEAR_SWARM_MEMORY,
                      {LikeContains("\"swarmId\":\"" + swarm_id + "\"")});
}

} // namespace hive::store
