#pragma once

#include <stdexcept>
#include <string>

namespace hive::util {

/*
  Central error types raised by the stores and the coordinator.
  Engine failures use db::DbError instead.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::invalid_argument {
 public:
  explicit InvalidArgument(const std::string& msg) : std::invalid_argument(msg) {
  }
};

// Schema or configuration could not be applied; not recoverable per call.
class StartupError : public std::runtime_error {
 public:
  explicit StartupError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace hive::util
