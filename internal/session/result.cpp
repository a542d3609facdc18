#include "result.hpp"

namespace cookiesession::session {

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NoCookie:
      return "no_cookie";
    case ErrorCode::BadEncoding:
      return "bad_encoding";
    case ErrorCode::Unauthenticated:
      return "unauthenticated";
    case ErrorCode::TooShort:
      return "too_short";
    case ErrorCode::MalformedIdentifier:
      return "malformed_identifier";
    case ErrorCode::Expired:
      return "expired";
    case ErrorCode::RandomUnavailable:
      return "random_unavailable";
    case ErrorCode::EncryptionFailure:
      return "encryption_failure";
  }
  return "unknown";
}

} // namespace cookiesession::session
