#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cookiesession::util {

/*
  Base64, standard alphabet with padding (RFC 4648 section 4).

  Decode is strict: the input length must be a multiple of four, only
  alphabet characters are accepted and '=' may only appear as trailing
  padding, and unused trailing bits must be zero. Anything else yields
  std::nullopt.
*/

std::string Base64Encode(const uint8_t* data, size_t size);
std::string Base64Encode(const std::vector<uint8_t>& data);

std::optional<std::vector<uint8_t>> Base64Decode(std::string_view text);

} // namespace cookiesession::util
