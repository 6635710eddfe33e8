#include "sqlite_db.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <type_traits>

#include "internal/db/api/error.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace hive::db::sqlite {

namespace {

ErrorCode Translate(int rc) {
  switch (rc & 0xff) {
    case SQLITE_OK:
    case SQLITE_ROW:
    case SQLITE_DONE:
      return ErrorCode::OK;
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return ErrorCode::Busy;
    case SQLITE_CONSTRAINT:
      return ErrorCode::ConstraintViolation;
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
      return ErrorCode::IOError;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return ErrorCode::Corruption;
    default:
      return ErrorCode::InternalError;
  }
}

void ThrowIf(int rc, sqlite3* db, const std::string& op_key) {
  if (rc != SQLITE_OK) {
    throw DbError(Translate(rc), op_key, sqlite3_errmsg(db));
  }
}

class SqliteRow final : public sql::Row {
 public:
  explicit SqliteRow(sqlite3_stmt* st) : st_(st) {
  }

  std::string GetText(int col) const override {
    const unsigned char* t = sqlite3_column_text(st_, col);
    if (!t) return {};
    return std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(st_, col)));
  }

  int GetInt(int col) const override {
    return sqlite3_column_int(st_, col);
  }

  int64_t GetInt64(int col) const override {
    return sqlite3_column_int64(st_, col);
  }

  double GetDouble(int col) const override {
    return sqlite3_column_double(st_, col);
  }

  bool IsNull(int col) const override {
    return sqlite3_column_type(st_, col) == SQLITE_NULL;
  }

 private:
  sqlite3_stmt* st_;
};

// Leaves a cached statement ready for its next caller.
struct ResetOnExit {
  sqlite3_stmt* st;
  ~ResetOnExit() {
    sqlite3_reset(st);
    sqlite3_clear_bindings(st);
  }
};

void Bind(sqlite3* db, sqlite3_stmt* st, const std::string& op_key, const sql::Params& params) {
  const int expected = sqlite3_bind_parameter_count(st);
  if (expected != static_cast<int>(params.size())) {
    throw DbError(ErrorCode::InternalError, op_key,
                  "expected " + std::to_string(expected) + " parameters, got " + std::to_string(params.size()));
  }

  for (std::size_t i = 0; i < params.size(); ++i) {
    const int idx = static_cast<int>(i) + 1;
    const int rc  = std::visit(
        [&](const auto& v) -> int {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return sqlite3_bind_null(st, idx);
          } else if constexpr (std::is_same_v<T, int32_t>) {
            return sqlite3_bind_int(st, idx, v);
          } else if constexpr (std::is_same_v<T, int64_t>) {
            return sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
          } else if constexpr (std::is_same_v<T, uint64_t>) {
            return sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
          } else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(st, idx, v);
          } else {
            return sqlite3_bind_text(st, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
          }
        },
        params[i]);
    ThrowIf(rc, db, op_key);
  }
}

std::string ReadSchemaFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw util::StartupError("cannot read schema file: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    throw util::StartupError("failed reading schema file: " + path);
  }
  return buffer.str();
}

bool IsValidSynchronous(const std::string& mode) {
  return mode == "OFF" || mode == "NORMAL" || mode == "FULL" || mode == "EXTRA";
}

} // namespace

SqliteDB::SqliteDB(SqliteOptions options) : options_(std::move(options)) {
  int rc = sqlite3_open_v2(options_.path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StartupError("open " + options_.path + ": " + msg);
  }

  try {
    Configure();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  for (auto& [key, cached] : statements_) {
    sqlite3_finalize(cached.stmt);
  }
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  auto  lock = Lock();
  char* err  = nullptr;
  int   rc   = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw DbError(Translate(rc), "exec", msg);
  }
}

void SqliteDB::Configure() {
  if (!IsValidSynchronous(options_.synchronous)) {
    throw util::StartupError("invalid synchronous mode: " + options_.synchronous);
  }

  // WAL enables concurrent readers while writer holds lock
  if (options_.wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }

  Exec("PRAGMA synchronous=" + options_.synchronous + ";");

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, options_.busy_timeout_ms), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-" + std::to_string(options_.cache_size_kb) + ";"); // negative means KB
}

void SqliteDB::Initialize() {
  auto lock = Lock();
  if (initialized_) return;

  try {
    if (options_.schema_path.empty()) {
      for (const char* ddl : sql::kSchema) {
        Exec(ddl);
      }
    } else {
      Exec(ReadSchemaFile(options_.schema_path));
    }
  } catch (const DbError& e) {
    throw util::StartupError(std::string("apply schema: ") + e.what());
  }

  initialized_ = true;
  HIVE_LOG_INFO("Schema applied", {observability::StringField("path", options_.path),
                                   observability::StringField("schema", options_.schema_path.empty() ? "builtin" : options_.schema_path)});
}

sqlite3_stmt* SqliteDB::Cached(const std::string& op_key, const std::string& sql) {
  auto it = statements_.find(op_key);
  if (it != statements_.end()) {
    if (it->second.sql != sql) {
      throw DbError(ErrorCode::InternalError, op_key, "op key already bound to a different statement");
    }
    return it->second.stmt;
  }

  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    sqlite3_finalize(stmt);
    ThrowIf(rc, db_, op_key);
  }

  statements_.emplace(op_key, CachedStatement{sql, stmt});
  return stmt;
}

std::size_t SqliteDB::Execute(const std::string& op_key, const std::string& sql, const sql::Params& params) {
  auto          lock = Lock();
  sqlite3_stmt* st   = Cached(op_key, sql);
  ResetOnExit   reset{st};

  Bind(db_, st, op_key, params);

  int rc = sqlite3_step(st);
  while (rc == SQLITE_ROW) {
    rc = sqlite3_step(st);
  }
  if (rc != SQLITE_DONE) {
    throw DbError(Translate(rc), op_key, sqlite3_errmsg(db_));
  }

  return static_cast<std::size_t>(sqlite3_changes(db_));
}

void SqliteDB::Query(const std::string& op_key, const std::string& sql, const sql::Params& params,
                     const std::function<void(const sql::Row&)>& on_row) {
  auto          lock = Lock();
  sqlite3_stmt* st   = Cached(op_key, sql);
  ResetOnExit   reset{st};

  Bind(db_, st, op_key, params);

  SqliteRow row(st);
  int       rc = SQLITE_OK;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    on_row(row);
  }
  if (rc != SQLITE_DONE) {
    throw DbError(Translate(rc), op_key, sqlite3_errmsg(db_));
  }
}

std::size_t SqliteDB::ExecuteOnce(const std::string& op_key, const std::string& sql, const sql::Params& params) {
  auto lock = Lock();

  sqlite3_stmt* raw = nullptr;
  int           rc  = sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr);
  std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> st(raw, &sqlite3_finalize);
  ThrowIf(rc, db_, op_key);

  Bind(db_, st.get(), op_key, params);

  rc = sqlite3_step(st.get());
  while (rc == SQLITE_ROW) {
    rc = sqlite3_step(st.get());
  }
  if (rc != SQLITE_DONE) {
    throw DbError(Translate(rc), op_key, sqlite3_errmsg(db_));
  }

  return static_cast<std::size_t>(sqlite3_changes(db_));
}

std::size_t SqliteDB::CachedStatementCount() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return statements_.size();
}

} // namespace hive::db::sqlite
