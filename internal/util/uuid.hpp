#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace osforge::util {

/*
  UUID helpers

  Build identifiers are RFC4122 version 4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Canonical 8-4-4-4-12 lowercase or uppercase hex.
bool IsCanonicalUUID(std::string_view str);

} // namespace osforge::util
