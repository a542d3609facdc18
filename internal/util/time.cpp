#include "time.hpp"

#include <cstdio>
#include <ctime>

namespace cookiesession::util {

TimePoint SystemClock::Now() const {
  return Clock::now();
}

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixSeconds(TimePoint tp) {
  return std::chrono::floor<std::chrono::seconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixSeconds(int64_t seconds) {
  // Clamp to what the clock's duration can represent.
  constexpr auto kMax = std::chrono::duration_cast<std::chrono::seconds>(TimePoint::max().time_since_epoch()).count();
  constexpr auto kMin = std::chrono::duration_cast<std::chrono::seconds>(TimePoint::min().time_since_epoch()).count();
  if (seconds >= kMax) return TimePoint::max();
  if (seconds <= kMin) return TimePoint::min();
  return TimePoint{} + std::chrono::seconds(seconds);
}

TimePoint FloorToSeconds(TimePoint tp) {
  return FromUnixSeconds(ToUnixSeconds(tp));
}

std::string ToHttpDate(TimePoint tp) {
  static constexpr const char* kDays[]   = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
  static constexpr const char* kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                            "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

  const std::time_t t = static_cast<std::time_t>(ToUnixSeconds(tp));
  std::tm           utc{};
  if (gmtime_r(&t, &utc) == nullptr) {
    return "Thu, 01 Jan 1970 00:00:00 GMT";
  }

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d GMT", kDays[utc.tm_wday], utc.tm_mday,
                kMonths[utc.tm_mon], utc.tm_year + 1900, utc.tm_hour, utc.tm_min, utc.tm_sec);
  return buf;
}

} // namespace cookiesession::util
