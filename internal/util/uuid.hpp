#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace cookiesession::util {

/*
  UUID helpers

  Session identifiers are raw 16 byte RFC4122 UUIDs.
*/

using UUID = std::array<uint8_t, 16>;

inline constexpr UUID kNilUUID{};

bool IsNil(const UUID& id);

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

} // namespace cookiesession::util
