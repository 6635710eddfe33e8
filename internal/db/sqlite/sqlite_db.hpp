#pragma once

#include <sqlite3.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"

namespace hive::db::sqlite {

struct SqliteOptions {
  std::string path = ":memory:";
  bool        wal_mode = true;
  std::string synchronous = "NORMAL";
  int64_t     cache_size_kb = 20000;
  int         busy_timeout_ms = 5000;

  // Empty means the built-in schema (internal/db/sql/schema.hpp).
  std::string schema_path;
};

/*
  Thin RAII wrapper around sqlite3* + prepared statement cache.

  Statements are compiled once per op key and reused for every
  later call; each call resets and rebinds. All statement use is
  serialized by a recursive mutex that SqliteTransaction also holds
  for its whole lifetime, so one connection can be shared by the
  coordinator and the maintenance worker.
*/
class SqliteDB {
 public:
  explicit SqliteDB(SqliteOptions options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const SqliteOptions& Options() const {
    return options_;
  }

  // Execute a SQL string (used for pragmas/schema/transaction control)
  void Exec(const std::string& sql);

  // Configure PRAGMAs (WAL, synchronous, foreign keys, cache size)
  void Configure();

  // Apply the schema. Idempotent; failures throw util::StartupError.
  void Initialize();

  bool IsInitialized() const {
    return initialized_;
  }

  // Run a cataloged write; returns the number of changed rows.
  std::size_t Execute(const std::string& op_key, const std::string& sql, const sql::Params& params = {});

  // Same as Execute, but the statement is finalized after the call
  // instead of cached. For SQL whose text varies per call.
  std::size_t ExecuteOnce(const std::string& op_key, const std::string& sql, const sql::Params& params = {});

  // Run a cataloged read, invoking on_row for each result row.
  void Query(const std::string& op_key, const std::string& sql, const sql::Params& params,
             const std::function<void(const sql::Row&)>& on_row);

  template <typename Mapper>
  auto QueryOne(const std::string& op_key, const std::string& sql, const sql::Params& params, Mapper&& mapper)
      -> std::optional<decltype(mapper(std::declval<const sql::Row&>()))> {
    std::optional<decltype(mapper(std::declval<const sql::Row&>()))> out;
    Query(op_key, sql, params, [&](const sql::Row& row) {
      if (!out) out = mapper(row);
    });
    return out;
  }

  template <typename Mapper>
  auto QueryAll(const std::string& op_key, const std::string& sql, const sql::Params& params, Mapper&& mapper)
      -> std::vector<decltype(mapper(std::declval<const sql::Row&>()))> {
    std::vector<decltype(mapper(std::declval<const sql::Row&>()))> out;
    Query(op_key, sql, params, [&](const sql::Row& row) { out.push_back(mapper(row)); });
    return out;
  }

  std::unique_lock<std::recursive_mutex> Lock() {
    return std::unique_lock<std::recursive_mutex>(mutex_);
  }

  std::size_t CachedStatementCount() const;

 private:
  sqlite3_stmt* Cached(const std::string& op_key, const std::string& sql);

  struct CachedStatement {
    std::string   sql;
    sqlite3_stmt* stmt = nullptr;
  };

  sqlite3*      db_ = nullptr;
  SqliteOptions options_;
  bool          initialized_ = false;

  mutable std::recursive_mutex                     mutex_;
  std::unordered_map<std::string, CachedStatement> statements_;
};

} // namespace hive::db::sqlite
