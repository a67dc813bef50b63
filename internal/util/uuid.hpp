#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace docflow::util {

/*
  UUID helpers

  Lock holders identify themselves with a random RFC4122 v4 UUID.
*/

using UUID = std::array<std::uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

} // namespace docflow::util
