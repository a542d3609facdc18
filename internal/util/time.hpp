#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace cookiesession::util {

/*
  Time utilities — single place to control the clock source.

  The store reads "now" through ClockSource so expiry can be tested
  against a manual clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

class ClockSource {
 public:
  virtual ~ClockSource() = default;

  virtual TimePoint Now() const = 0;
};

class SystemClock final : public ClockSource {
 public:
  TimePoint Now() const override;
};

TimePoint Now();

int64_t   ToUnixSeconds(TimePoint tp);
TimePoint FromUnixSeconds(int64_t seconds);

// Truncates towards negative infinity to a whole second.
TimePoint FloorToSeconds(TimePoint tp);

// IMF-fixdate as used by the HTTP Expires attribute, e.g.
// "Sun, 06 Nov 1994 08:49:37 GMT".
std::string ToHttpDate(TimePoint tp);

} // namespace cookiesession::util
