#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace hive::db::sql {

/*
  Parameter abstraction.

  SQLite binds ? placeholders in order, so a flat
  ordered vector is all a statement needs.
*/

using Param = std::variant<
    std::nullptr_t,
    int32_t,
    int64_t,
    uint64_t,
    double,
    std::string
>;

using Params = std::vector<Param>;

// Nullable columns: empty optional binds NULL.
template <typename T>
Param Nullable(const std::optional<T>& value) {
  if (!value) return nullptr;
  return Param(*value);
}

}
