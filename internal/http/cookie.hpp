#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/util/time.hpp"

namespace cookiesession::http {

struct Cookie {
  std::string name;
  std::string value;

  std::string path;
  std::string domain;

  std::optional<util::TimePoint> expires;

  // Seconds. Unset omits the attribute; any negative value means
  // "delete now" and is written as Max-Age=0.
  std::optional<int64_t> max_age;

  bool http_only = false;
  bool secure    = false;

  Cookie() = default;
  Cookie(std::string n, std::string v) : name(std::move(n)), value(std::move(v)) {
  }
};

/*
  Serializes a cookie as the value of a Set-Cookie header:

    name=value; Path=/; Domain=d; Expires=<IMF-fixdate>; Max-Age=n; HttpOnly; Secure
*/
std::string FormatSetCookie(const Cookie& cookie);

/*
  Parses a Cookie request header ("a=1; b=2") into name/value pairs.

  Whitespace around names and values is trimmed and a value wrapped in
  double quotes is unwrapped. Pairs without '=' or with an empty name are
  skipped. Order of the header is preserved, duplicates included.
*/
std::vector<Cookie> ParseCookieHeader(std::string_view header);

} // namespace cookiesession::http
