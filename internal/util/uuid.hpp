#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace trackmatch::util {

/*
  UUID helpers

  Provider search sessions are keyed by an RFC4122 v4 UUID chosen by us.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Fresh v4 UUID in canonical 8-4-4-4-12 form.
std::string GenerateUUIDString();

} // namespace trackmatch::util
