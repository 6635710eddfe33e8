#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace hive::store {

/*
  Partial update of an agent or task row.

  Each entry assigns either a bound value or a SQL expression with
  its own anonymous '?' placeholders. Expressions may not contain
  quotes, numbered or named parameters, or a literal '?'. Columns are checked against a per-table
  allow-list when the statement is built; counters only accept
  non-negative increments (see UpdateSet::Increment).
*/

using ColumnValue = db::sql::Param;

struct RawExpression {
  std::string      expression;
  db::sql::Params  params;
};

using UpdateValue = std::variant<ColumnValue, RawExpression>;

class UpdateSet {
 public:
  UpdateSet& Set(std::string column, ColumnValue value);
  UpdateSet& SetExpression(std::string column, RawExpression expression);

  // column = column + by
  UpdateSet& Increment(const std::string& column, int64_t by = 1);

  bool Empty() const {
    return entries_.empty();
  }

  const std::vector<std::pair<std::string, UpdateValue>>& Entries() const {
    return entries_;
  }

 private:
  std::vector<std::pair<std::string, UpdateValue>> entries_;
};

enum class ColumnKind : uint8_t { kValue, kCounter };

// Validates a TEXT value for an enum-backed column; throws util::InvalidArgument.
using ColumnCheck = void (*)(const std::string&);

struct ColumnRule {
  ColumnKind  kind  = ColumnKind::kValue;
  ColumnCheck check = nullptr;
};

struct TableColumns {
  std::string                       table;
  const char*                       prefix;  // "UPDATE <table> SET "
  std::map<std::string, ColumnRule> columns;
};

const TableColumns& AgentColumns();
const TableColumns& TaskColumns();

struct BuiltUpdate {
  std::string     op_key;
  std::string     sql;
  db::sql::Params params;

  // false when a caller supplied expression is part of the SQL; such
  // statements go through SqliteDB::ExecuteOnce instead of the cache.
  bool cacheable = true;
};

// Runs a built update on the right path; returns the changed row count.
std::size_t ExecuteUpdate(db::sqlite::SqliteDB& db, const BuiltUpdate& update);

// "UPDATE <table> SET a=?, b=b + ? WHERE id=?" with id bound last.
// Throws util::InvalidArgument for an empty set, an unknown or repeated
// column, or a counter assigned anything but an increment.
BuiltUpdate BuildUpdate(const TableColumns& table, const UpdateSet& set, const std::string& id);

} // namespace hive::store
