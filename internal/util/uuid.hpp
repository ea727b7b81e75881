#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace quotecast::util {

/*
  UUID helpers

  Schedule ids are random RFC4122 v4 UUIDs in canonical string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// GenerateUUID() rendered as a string
std::string NewId();

} // namespace quotecast::util
