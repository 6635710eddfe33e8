#include "internal/store/update_set.hpp"

#include <algorithm>
#include <cctype>
#include <set>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/model/enums.hpp"
#include "internal/util/errors.hpp"

namespace hive::store {

namespace {

void CheckAgentType(const std::string& v) {
  (void)model::ParseAgentType(v);
}

void CheckAgentStatus(const std::string& v) {
  (void)model::ParseAgentStatus(v);
}

void CheckTaskPriority(const std::string& v) {
  (void)model::ParseTaskPriority(v);
}

std::string IncrementExpression(const std::string& column) {
  return column + " + ?";
}

// Every '?' is an anonymous placeholder, so quotes (which could hide a
// literal '?'), numbered or named parameters and comments are refused.
void CheckExpressionText(const std::string& column, const std::string& expression) {
  if (expression.empty() || expression.find_first_of(";'\"`:@$") != std::string::npos ||
      expression.find("--") != std::string::npos || expression.find("/*") != std::string::npos) {
    throw util::InvalidArgument("column '" + column + "' has a malformed expression");
  }
  for (std::size_t pos = expression.find('?'); pos != std::string::npos; pos = expression.find('?', pos + 1)) {
    if (pos + 1 < expression.size() && std::isdigit(static_cast<unsigned char>(expression[pos + 1]))) {
      throw util::InvalidArgument("column '" + column + "' uses a numbered placeholder");
    }
  }
}

std::size_t CountPlaceholders(const std::string& expression) {
  return static_cast<std::size_t>(std::count(expression.begin(), expression.end(), '?'));
}

void ValidateCounter(const std::string& column, const UpdateValue& value) {
  const auto* raw = std::get_if<RawExpression>(&value);
  if (!raw || raw->expression != IncrementExpression(column) || raw->params.size() != 1) {
    throw util::InvalidArgument("column '" + column + "' only accepts increments");
  }

  const auto& by = raw->params.front();
  bool        ok = false;
  if (const auto* v = std::get_if<int64_t>(&by)) ok = *v >= 0;
  if (const auto* v = std::get_if<int32_t>(&by)) ok = *v >= 0;
  if (std::holds_alternative<uint64_t>(by)) ok = true;
  if (!ok) {
    throw util::InvalidArgument("column '" + column + "' increment must be a non-negative integer");
  }
}

void ValidateValue(const std::string& column, const ColumnRule& rule, const UpdateValue& value) {
  if (const auto* raw = std::get_if<RawExpression>(&value)) {
    CheckExpressionText(column, raw->expression);
    if (CountPlaceholders(raw->expression) != raw->params.size()) {
      throw util::InvalidArgument("column '" + column + "' expression parameter count mismatch");
    }
    return;
  }

  if (rule.check) {
    const auto& plain = std::get<ColumnValue>(value);
    if (const auto* text = std::get_if<std::string>(&plain)) {
      rule.check(*text);
    } else if (!std::holds_alternative<std::nullptr_t>(plain)) {
      throw util::InvalidArgument("column '" + column + "' expects text");
    }
  }
}

} // namespace

UpdateSet& UpdateSet::Set(std::string column, ColumnValue value) {
  entries_.emplace_back(std::move(column), UpdateValue(std::move(value)));
  return *this;
}

UpdateSet& UpdateSet::SetExpression(std::string column, RawExpression expression) {
  entries_.emplace_back(std::move(column), UpdateValue(std::move(expression)));
  return *this;
}

UpdateSet& UpdateSet::Increment(const std::string& column, int64_t by) {
  return SetExpression(column, RawExpression{IncrementExpression(column), {by}});
}

const TableColumns& AgentColumns() {
  static const TableColumns kColumns{
      "agents",
      db::sql::UPDATE_AGENT_PREFIX,
      {
          {"name", {}},
          {"type", {ColumnKind::kValue, &CheckAgentType}},
          {"status", {ColumnKind::kValue, &CheckAgentStatus}},
          {"capabilities", {}},
          {"current_task_id", {}},
          {"message_count", {ColumnKind::kCounter, nullptr}},
          {"error_count", {ColumnKind::kCounter, nullptr}},
          {"success_count", {ColumnKind::kCounter, nullptr}},
          {"last_active_at", {}},
          {"metadata", {}},
      }};
  return kColumns;
}

// status and completed_at move together through UpdateStatus only.
const TableColumns& TaskColumns() {
  static const TableColumns kColumns{
      "tasks",
      db::sql::UPDATE_TASK_PREFIX,
      {
          {"type", {}},
          {"description", {}},
          {"priority", {ColumnKind::kValue, &CheckTaskPriority}},
          {"assigned_agent_id", {}},
          {"dependencies", {}},
          {"requirements", {}},
          {"result", {}},
          {"assigned_at", {}},
          {"started_at", {}},
          {"estimated_duration", {}},
          {"actual_duration", {}},
          {"metadata", {}},
      }};
  return kColumns;
}

BuiltUpdate BuildUpdate(const TableColumns& table, const UpdateSet& set, const std::string& id) {
  if (set.Empty()) {
    throw util::InvalidArgument("update of " + table.table + " has no columns");
  }

  BuiltUpdate           out;
  std::string           clause;
  std::set<std::string> seen;

  for (const auto& [column, value] : set.Entries()) {
    auto rule = table.columns.find(column);
    if (rule == table.columns.end()) {
      throw util::InvalidArgument("unknown column '" + column + "' for " + table.table);
    }
    if (!seen.insert(column).second) {
      throw util::InvalidArgument("column '" + column + "' set twice");
    }

    if (rule->second.kind == ColumnKind::kCounter) {
      ValidateCounter(column, value);
    } else {
      ValidateValue(column, rule->second, value);
    }

    if (!clause.empty()) clause += ", ";
    clause += column;
    clause += '=';

    if (const auto* raw = std::get_if<RawExpression>(&value)) {
      if (rule->second.kind != ColumnKind::kCounter) out.cacheable = false;
      clause += raw->expression;
      out.params.insert(out.params.end(), raw->params.begin(), raw->params.end());
    } else {
      clause += '?';
      out.params.push_back(std::get<ColumnValue>(value));
    }
  }

  out.sql    = table.prefix + clause + " WHERE id=?;";
  out.op_key = "update:" + table.table + ":" + clause;
  out.params.emplace_back(id);
  return out;
}

std::size_t ExecuteUpdate(db::sqlite::SqliteDB& db, const BuiltUpdate& update) {
  if (update.cacheable) {
    return db.Execute(update.op_key, update.sql, update.params);
  }
  return db.ExecuteOnce(update.op_key, update.sql, update.params);
}

} // namespace hive::store
