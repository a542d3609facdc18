#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace cookiesession::crypto {

/*
  Authenticated-encryption envelope.

  One fixed scheme: NaCl secretbox (XSalsa20-Poly1305) with a 24 byte
  nonce. Sealed output is tag || ciphertext, so it is always exactly
  kTagSize bytes longer than the plaintext. The layout matches
  crypto_secretbox_easy and Go's golang.org/x/crypto/nacl/secretbox.

  A nonce must never be reused with the same key.
*/

inline constexpr size_t kKeySize   = 32;
inline constexpr size_t kNonceSize = 24;
inline constexpr size_t kTagSize   = 16;

using Key   = std::array<uint8_t, kKeySize>;
using Nonce = std::array<uint8_t, kNonceSize>;

// SHA-256 of the secret. Deterministic, so the same secret always yields
// the same key.
Key DeriveKey(std::string_view secret);

// std::nullopt only when the cipher backend fails.
std::optional<std::vector<uint8_t>> Seal(const Key& key, const Nonce& nonce, const uint8_t* plaintext, size_t size);

// std::nullopt when the input is truncated, was sealed under another
// key/nonce, or was modified in any way.
std::optional<std::vector<uint8_t>> Open(const Key& key, const Nonce& nonce, const uint8_t* sealed, size_t size);

} // namespace cookiesession::crypto
