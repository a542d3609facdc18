#include "message.hpp"

namespace cookiesession::http {

void Request::AddCookieHeader(std::string_view header) {
  for (auto& cookie : ParseCookieHeader(header)) {
    cookies_.push_back(std::move(cookie));
  }
}

void Request::AddCookie(std::string name, std::string value) {
  http::Cookie cookie;
  cookie.name  = std::move(name);
  cookie.value = std::move(value);
  cookies_.push_back(std::move(cookie));
}

std::optional<std::string> Request::CookieValue(std::string_view name) const {
  for (const auto& cookie : cookies_) {
    if (cookie.name == name) return cookie.value;
  }
  return std::nullopt;
}

void Response::SetCookie(const http::Cookie& cookie) {
  cookies_.push_back(cookie);
}

std::vector<std::string> Response::SetCookieHeaders() const {
  std::vector<std::string> headers;
  headers.reserve(cookies_.size());
  for (const auto& cookie : cookies_) {
    headers.push_back(FormatSetCookie(cookie));
  }
  return headers;
}

} // namespace cookiesession::http
