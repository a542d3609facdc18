#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

#include "internal/crypto/random.hpp"
#include "internal/util/uuid.hpp"

namespace cookiesession::session {

/*
  Identifier capability used by the codec and the store.

  Swapping the concrete 128-bit scheme only means providing another
  implementation of this interface.
*/
class IdScheme {
 public:
  virtual ~IdScheme() = default;

  // Fresh, unique, non-nil identifier.
  virtual util::UUID Generate() const = 0;

  // std::nullopt when the bytes are not a well-formed identifier.
  virtual std::optional<util::UUID> Parse(const uint8_t* data, size_t size) const = 0;
};

/*
  RFC4122 version 4 UUIDs drawn from a secure random source.

  Parse accepts any 16 bytes so that the nil UUID (an unset uid) and ids
  minted by other schemes still decode.
*/
class RandomUuidScheme final : public IdScheme {
 public:
  explicit RandomUuidScheme(std::shared_ptr<const crypto::RandomSource> random);

  // Throws util::RandomUnavailable when the random source fails.
  util::UUID Generate() const override;

  std::optional<util::UUID> Parse(const uint8_t* data, size_t size) const override;

 private:
  std::shared_ptr<const crypto::RandomSource> random_;
};

} // namespace cookiesession::session
