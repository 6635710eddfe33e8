#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace hive::util {

/*
  UUID helpers

  Record ids are RFC4122 v4 UUIDs in their canonical
  36 character text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Shorthand for ToString(GenerateUUID()).
std::string GenerateId();

} // namespace hive::util
