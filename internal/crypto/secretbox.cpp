#include "secretbox.hpp"

#include <stdexcept>

#include <openssl/evp.h>
#include <sodium.h>

namespace cookiesession::crypto {

static_assert(kKeySize == crypto_secretbox_KEYBYTES, "secretbox key size");
static_assert(kNonceSize == crypto_secretbox_NONCEBYTES, "secretbox nonce size");
static_assert(kTagSize == crypto_secretbox_MACBYTES, "secretbox tag size");

namespace {

// sodium_init is idempotent and thread-safe; it only has to succeed once.
bool SodiumReady() {
  static const bool ready = sodium_init() >= 0;
  return ready;
}

} // namespace

Key DeriveKey(std::string_view secret) {
  Key          key{};
  unsigned int len = 0;

  if (EVP_Digest(secret.data(), secret.size(), key.data(), &len, EVP_sha256(), nullptr) != 1 || len != kKeySize) {
    throw std::runtime_error("SHA-256 key derivation failed");
  }
  return key;
}

std::optional<std::vector<uint8_t>> Seal(const Key& key, const Nonce& nonce, const uint8_t* plaintext, size_t size) {
  if (!SodiumReady() || size > crypto_secretbox_MESSAGEBYTES_MAX) return std::nullopt;

  static const uint8_t kEmpty = 0;
  if (size == 0) plaintext = &kEmpty;

  std::vector<uint8_t> out(kTagSize + size);
  if (crypto_secretbox_easy(out.data(), plaintext, size, nonce.data(), key.data()) != 0) {
    return std::nullopt;
  }
  return out;
}

std::optional<std::vector<uint8_t>> Open(const Key& key, const Nonce& nonce, const uint8_t* sealed, size_t size) {
  if (!SodiumReady() || size < kTagSize) return std::nullopt;

  // One spare byte keeps data() valid for an empty plaintext.
  std::vector<uint8_t> out(size - kTagSize + 1);
  if (crypto_secretbox_open_easy(out.data(), sealed, size, nonce.data(), key.data()) != 0) {
    return std::nullopt;
  }
  out.resize(size - kTagSize);
  return out;
}

} // namespace cookiesession::crypto
