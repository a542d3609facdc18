#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "internal/crypto/random.hpp"
#include "internal/crypto/secretbox.hpp"
#include "internal/http/message.hpp"
#include "internal/util/time.hpp"
#include "id_scheme.hpp"
#include "result.hpp"
#include "session.hpp"

namespace cookiesession::session {

struct StoreOptions {
  std::string          cookie_name;
  std::string          secret;
  std::chrono::seconds ttl{0};

  bool http_only = true;
  bool secure    = false;
};

/*
  Collaborators of the store. Null members are replaced with the system
  clock, OpenSSL's generator and RandomUuidScheme over that generator.
*/
struct StoreDependencies {
  std::shared_ptr<const util::ClockSource>    clock;
  std::shared_ptr<const crypto::RandomSource> random;
  std::shared_ptr<const IdScheme>             ids;
};

/*
  Store

  Stateless cookie sessions. The cookie value is

    base64(nonce[24] || Seal(Encode(session), key, nonce))

  with key = SHA-256(secret). Nothing is kept server side.

  A Store is immutable once constructed and may be shared by any number of
  concurrent requests.
*/
class Store {
 public:
  // Throws util::InvalidConfig for an empty or non-token cookie name, an
  // empty secret or a non-positive ttl.
  explicit Store(const StoreOptions& options, StoreDependencies deps = {});

  /*
    Reads the session cookie from the request.

    Never fails: a missing, malformed, forged or expired cookie yields a
    fresh anonymous session (valid == false, new sid).
  */
  Session Get(const http::CookieSource& request) const;

  /*
    Stamps session.time with the current time and sets the sealed cookie on
    the response, using a new nonce every call.

    Returns RandomUnavailable / EncryptionFailure without touching the
    response or the session when sealing is impossible.
  */
  Result Save(http::CookieSink& response, Session& session) const;

  // Tells the client to drop the cookie.
  void Clear(http::CookieSink& response) const;

  // valid == false, fresh sid, everything else empty.
  Session NewSession() const;

  const std::string& Name() const {
    return name_;
  }
  std::chrono::seconds Ttl() const {
    return ttl_;
  }
  bool HttpOnly() const {
    return http_only_;
  }
  bool Secure() const {
    return secure_;
  }

 private:
  Result Load(const http::CookieSource& request, Session* out) const;

  http::Cookie BaseCookie() const;

  std::string          name_;
  std::chrono::seconds ttl_;
  bool                 http_only_;
  bool                 secure_;
  crypto::Key          key_;

  std::shared_ptr<const util::ClockSource>    clock_;
  std::shared_ptr<const crypto::RandomSource> random_;
  std::shared_ptr<const IdScheme>             ids_;
};

} // namespace cookiesession::session
