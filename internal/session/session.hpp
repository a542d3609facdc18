#pragma once

#include <string>

#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace cookiesession::session {

/*
  Session

  The unit of trust carried by the cookie. Only `valid` says whether uid
  and real_uid may be treated as authenticated; an invalid session is
  anonymous whatever its fields contain.

  `state` is opaque application bytes.
*/
struct Session {
  bool            valid = false;
  util::TimePoint time{};

  util::UUID sid{};
  util::UUID uid{};
  util::UUID real_uid{};

  std::string state;
};

} // namespace cookiesession::session
