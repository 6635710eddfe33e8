#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace hive::db::model {

/*
  Namespaced cache entry. (key, namespace) is the identity.

  access_count and created_at survive overwrites; ttl is
  seconds measured from updated_at.
*/

struct MemoryRecord {
  std::string key;
  std::string ns = "default";

  std::string value;

  uint64_t access_count = 0;

  std::optional<uint64_t> last_accessed_at_ms;
  uint64_t                created_at_ms = 0;
  uint64_t                updated_at_ms = 0;

  std::string metadata = "{}";

  std::optional<int64_t> ttl_sec;
};

struct MemoryStats {
  uint64_t total_entries = 0;
  uint64_t total_size    = 0;  // SUM(LENGTH(value))
  uint64_t namespaces    = 0;
};

struct NamespaceStats {
  uint64_t entries = 0;
  uint64_t size    = 0;

  std::optional<double>   avg_ttl_sec;
  std::optional<double>   avg_access_count;
  std::optional<uint64_t> last_accessed_at_ms;
};

} // namespace hive::db::model
