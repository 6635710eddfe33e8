#pragma once

#include "internal/model/enums.hpp"

namespace hive::model {

constexpr bool IsTerminal(TaskStatus status) {
  return status == TaskStatus::kCompleted || status == TaskStatus::kFailed || status == TaskStatus::kCancelled;
}

constexpr bool IsTerminal(ConsensusStatus status) {
  return status != ConsensusStatus::kPending;
}

// pending -> achieved | failed | timeout, nothing else.
constexpr bool CanTransition(ConsensusStatus from, ConsensusStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  return IsTerminal(to);
}

}  // namespace hive::model
