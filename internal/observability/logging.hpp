#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace hive::runtime::config {
class RuntimeConfig;
}

namespace hive::observability {

/*
  Structured log line: "<message> key=value key=value".

  Text values holding spaces, quotes or '=' are written quoted so
  error messages from sqlite stay one field. Fields are only
  serialized when the level is enabled.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField CountField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

// Level from HIVE_LOG_LEVEL, then logging.level, then "info".
void InitializeLogging(const hive::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace hive::observability

#define HIVE_LOG_DEBUG(message, ...) ::hive::observability::Log(::spdlog::level::debug, (message), ##__VA_ARGS__)
#define HIVE_LOG_INFO(message, ...) ::hive::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define HIVE_LOG_WARN(message, ...) ::hive::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define HIVE_LOG_ERROR(message, ...) ::hive::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
