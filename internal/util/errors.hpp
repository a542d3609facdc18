#pragma once

#include <stdexcept>
#include <string>

namespace cookiesession::util {

/*
  Setup-time error types.

  Per-request cookie problems never throw; they are reported through
  session::Result and end in an anonymous session.
*/

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RandomUnavailable : public std::runtime_error {
 public:
  explicit RandomUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace cookiesession::util
