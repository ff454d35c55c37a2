#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace jwlmerge::util {

/*
  UUID helpers

  Run ids: raw 16 byte RFC4122 v4 UUIDs, also used to name workspaces.
*/

using UUID = std::array<std::uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

} // namespace jwlmerge::util
