#include "cookie.hpp"

#include <sstream>

namespace cookiesession::http {

namespace {

std::string_view Trim(std::string_view s) {
  const auto first = s.find_first_not_of(" \t");
  if (first == std::string_view::npos) return {};
  const auto last = s.find_last_not_of(" \t");
  return s.substr(first, last - first + 1);
}

std::string_view Unquote(std::string_view s) {
  if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
    return s.substr(1, s.size() - 2);
  }
  return s;
}

} // namespace

std::string FormatSetCookie(const Cookie& cookie) {
  std::ostringstream out;
  out << cookie.name << '=' << cookie.value;

  if (!cookie.path.empty()) out << "; Path=" << cookie.path;
  if (!cookie.domain.empty()) out << "; Domain=" << cookie.domain;
  if (cookie.expires) out << "; Expires=" << util::ToHttpDate(*cookie.expires);

  if (cookie.max_age) {
    out << "; Max-Age=" << (*cookie.max_age < 0 ? 0 : *cookie.max_age);
  }

  if (cookie.http_only) out << "; HttpOnly";
  if (cookie.secure) out << "; Secure";

  return out.str();
}

std::vector<Cookie> ParseCookieHeader(std::string_view header) {
  std::vector<Cookie> cookies;

  while (!header.empty()) {
    const auto       separator = header.find(';');
    std::string_view pair      = header.substr(0, separator);
    header = separator == std::string_view::npos ? std::string_view{} : header.substr(separator + 1);

    const auto equals = pair.find('=');
    if (equals == std::string_view::npos) continue;

    const auto name = Trim(pair.substr(0, equals));
    if (name.empty()) continue;

    Cookie cookie;
    cookie.name  = std::string(name);
    cookie.value = std::string(Unquote(Trim(pair.substr(equals + 1))));
    cookies.push_back(std::move(cookie));
  }

  return cookies;
}

} // namespace cookiesession::http
