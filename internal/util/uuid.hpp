#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace circulate::util {

/*
  UUID helpers

  Lock owner tokens, multipart upload ids and task ids are RFC4122 v4 UUIDs
  in their canonical string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Shorthand for ToString(GenerateUUID()).
std::string NewToken();

} // namespace circulate::util
