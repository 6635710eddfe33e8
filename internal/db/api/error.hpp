#pragma once

#include <stdexcept>
#include <string>

namespace hive::db {

/*
  Portable DB error codes.

  The engine translates sqlite return codes into these.
  Upper layers should never depend on sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  Busy,

  ConstraintViolation,

  IOError,
  Corruption,

  Unsupported,
  InternalError
};

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

/*
  Raised for every failed statement. Carries the catalog op key
  ("createSwarm", "trimNamespace", ...) so the caller knows which
  operation failed.
*/
class DbError : public std::runtime_error {
 public:
  DbError(ErrorCode code, std::string op_key, const std::string& message)
      : std::runtime_error(op_key + ": " + message), code_(code), op_key_(std::move(op_key)) {
  }

  ErrorCode Code() const {
    return code_;
  }

  const std::string& OpKey() const {
    return op_key_;
  }

 private:
  ErrorCode   code_;
  std::string op_key_;
};

} // namespace hive::db
