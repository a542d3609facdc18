#include "store.hpp"

#include <algorithm>
#include <string_view>
#include <utility>
#include <vector>

#include "codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/base64.hpp"
#include "internal/util/errors.hpp"

namespace cookiesession::session {

using observability::IntField;
using observability::StringField;

namespace {

// RFC 6265 cookie-name is an RFC 7230 token.
bool IsToken(const std::string& name) {
  static constexpr std::string_view kSeparators = "()<>@,;:\\\"/[]?={} \t";
  if (name.empty()) return false;
  return std::all_of(name.begin(), name.end(), [](char c) {
    const auto u = static_cast<unsigned char>(c);
    return u > 0x20 && u < 0x7f && kSeparators.find(c) == std::string_view::npos;
  });
}

} // namespace

Store::Store(const StoreOptions& options, StoreDependencies deps)
    : name_(options.cookie_name),
      ttl_(options.ttl),
      http_only_(options.http_only),
      secure_(options.secure),
      clock_(std::move(deps.clock)),
      random_(std::move(deps.random)),
      ids_(std::move(deps.ids)) {
  if (!IsToken(name_)) {
    throw util::InvalidConfig("session cookie name must be a non-empty token: '" + name_ + "'");
  }
  if (options.secret.empty()) {
    throw util::InvalidConfig("session secret must not be empty");
  }
  if (ttl_.count() <= 0) {
    throw util::InvalidConfig("session ttl must be positive");
  }

  key_ = crypto::DeriveKey(options.secret);

  if (!clock_) clock_ = std::make_shared<util::SystemClock>();
  if (!random_) random_ = std::make_shared<crypto::OpenSslRandomSource>();
  if (!ids_) ids_ = std::make_shared<RandomUuidScheme>(random_);
}

Session Store::NewSession() const {
  Session session;
  session.sid = ids_->Generate();
  return session;
}

// ------------------------------------------------------------
// Get
// ------------------------------------------------------------

Session Store::Get(const http::CookieSource& request) const {
  Session    session;
  const auto result = Load(request, &session);
  if (result) {
    return session;
  }

  if (result.code != ErrorCode::NoCookie) {
    COOKIESESSION_LOG_DEBUG("Session cookie rejected",
                            {StringField("cookie", name_), StringField("reason", ToString(result.code))});
  }
  return NewSession();
}

Result Store::Load(const http::CookieSource& request, Session* out) const {
  const auto value = request.CookieValue(name_);
  if (!value) {
    return Result::Err(ErrorCode::NoCookie);
  }

  const auto envelope = util::Base64Decode(*value);
  if (!envelope) {
    return Result::Err(ErrorCode::BadEncoding);
  }

  if (envelope->size() < crypto::kNonceSize) {
    return Result::Err(ErrorCode::Unauthenticated, "shorter than nonce");
  }

  crypto::Nonce nonce{};
  std::copy_n(envelope->begin(), crypto::kNonceSize, nonce.begin());

  const auto plaintext =
      crypto::Open(key_, nonce, envelope->data() + crypto::kNonceSize, envelope->size() - crypto::kNonceSize);
  if (!plaintext) {
    return Result::Err(ErrorCode::Unauthenticated);
  }

  auto decoded = Decode(*plaintext, *ids_);
  if (!decoded) {
    return decoded.status;
  }

  // time < now - ttl, i.e. now - time > ttl without overflowing on
  // extreme timestamps.
  if (decoded.session.time < clock_->Now() - ttl_) {
    return Result::Err(ErrorCode::Expired);
  }

  *out = std::move(decoded.session);
  return Result::Ok();
}

// ------------------------------------------------------------
// Save
// ------------------------------------------------------------

Result Store::Save(http::CookieSink& response, Session& session) const {
  crypto::Nonce nonce{};
  if (!random_->Fill(nonce.data(), nonce.size())) {
    COOKIESESSION_LOG_WARN("Session not saved", {StringField("cookie", name_), StringField("reason", "random_unavailable")});
    return Result::Err(ErrorCode::RandomUnavailable, "couldn't get random nonce");
  }

  Session stamped = session;
  stamped.time    = util::FloorToSeconds(clock_->Now());

  const auto plaintext = Encode(stamped);
  const auto sealed    = crypto::Seal(key_, nonce, plaintext.data(), plaintext.size());
  if (!sealed) {
    COOKIESESSION_LOG_WARN("Session not saved", {StringField("cookie", name_), StringField("reason", "encryption_failure")});
    return Result::Err(ErrorCode::EncryptionFailure, "couldn't seal session");
  }

  std::vector<uint8_t> envelope;
  envelope.reserve(nonce.size() + sealed->size());
  envelope.insert(envelope.end(), nonce.begin(), nonce.end());
  envelope.insert(envelope.end(), sealed->begin(), sealed->end());

  auto cookie    = BaseCookie();
  cookie.value   = util::Base64Encode(envelope);
  cookie.expires = stamped.time + ttl_;
  cookie.max_age = ttl_.count();
  response.SetCookie(cookie);

  session.time = stamped.time;

  COOKIESESSION_LOG_DEBUG("Session saved",
                          {StringField("cookie", name_), IntField("bytes", static_cast<int64_t>(cookie.value.size()))});
  return Result::Ok();
}

// ------------------------------------------------------------
// Clear
// ------------------------------------------------------------

void Store::Clear(http::CookieSink& response) const {
  auto cookie    = BaseCookie();
  cookie.expires = util::FromUnixSeconds(0);
  cookie.max_age = -1;
  response.SetCookie(cookie);
}

http::Cookie Store::BaseCookie() const {
  http::Cookie cookie;
  cookie.name      = name_;
  cookie.path      = "/";
  cookie.http_only = http_only_;
  cookie.secure    = secure_;
  return cookie;
}

} // namespace cookiesession::session
