#pragma once

#include <string>
#include <utility>

namespace cookiesession::session {

/*
  Outcome of a session protocol step.

  Get() converts every non-OK code into an anonymous session, so these
  never reach the application from that path. Save() returns them.
*/

enum class ErrorCode {
  OK = 0,

  // Get
  NoCookie,
  BadEncoding,
  Unauthenticated,
  TooShort,
  MalformedIdentifier,
  Expired,

  // Save
  RandomUnavailable,
  EncryptionFailure
};

const char* ToString(ErrorCode code);

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace cookiesession::session
