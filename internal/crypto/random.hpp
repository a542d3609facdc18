#pragma once

#include <cstddef>
#include <cstdint>

namespace cookiesession::crypto {

/*
  Source of cryptographically secure random bytes.

  Fill returns false when the source cannot deliver; callers must treat
  that as fatal for the operation and never fall back to a weaker source.
*/
class RandomSource {
 public:
  virtual ~RandomSource() = default;

  virtual bool Fill(uint8_t* out, size_t size) const = 0;
};

// OpenSSL's DRBG (RAND_bytes).
class OpenSslRandomSource final : public RandomSource {
 public:
  bool Fill(uint8_t* out, size_t size) const override;
};

} // namespace cookiesession::crypto
