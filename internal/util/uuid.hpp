#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace feedstore::util {

/*
  UUID helpers

  Feed image ids are raw 16 byte RFC4122 UUIDs.
  Text form is the canonical lower-case 8-4-4-4-12 layout.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Accepts upper or lower case hex, with dashes at the canonical positions only.
// Throws std::invalid_argument on anything else.
UUID FromString(const std::string& str);

bool IsValidUUID(const std::string& str);

} // namespace feedstore::util
