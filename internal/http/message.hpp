#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cookie.hpp"

namespace cookiesession::http {

/*
  The two HTTP capabilities the session store needs. A server adapts its
  own request/response types to these; Request and Response below are
  plain in-memory implementations.
*/

class CookieSource {
 public:
  virtual ~CookieSource() = default;

  // First cookie with this name, if any.
  virtual std::optional<std::string> CookieValue(std::string_view name) const = 0;
};

class CookieSink {
 public:
  virtual ~CookieSink() = default;

  virtual void SetCookie(const http::Cookie& cookie) = 0;
};

class Request final : public CookieSource {
 public:
  Request() = default;

  // Adds every pair of a raw Cookie header.
  void AddCookieHeader(std::string_view header);
  void AddCookie(std::string name, std::string value);

  std::optional<std::string> CookieValue(std::string_view name) const override;

 private:
  std::vector<http::Cookie> cookies_;
};

class Response final : public CookieSink {
 public:
  void SetCookie(const http::Cookie& cookie) override;

  const std::vector<http::Cookie>& Cookies() const {
    return cookies_;
  }

  // Set-Cookie header values in the order they were set.
  std::vector<std::string> SetCookieHeaders() const;

 private:
  std::vector<http::Cookie> cookies_;
};

} // namespace cookiesession::http
