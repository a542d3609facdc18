#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "id_scheme.hpp"
#include "result.hpp"
#include "session.hpp"

namespace cookiesession::session {

/*
  Session codec

  Fixed layout, no length prefixes:

    offset  size  field
    0       8     time, Unix seconds, big-endian
    8       16    sid
    24      16    uid
    40      16    real_uid
    56      *     state, to the end of the buffer

  The authenticated-encryption envelope delimits the record, which is why
  state needs no length.
*/

inline constexpr size_t kTimeSize   = 8;
inline constexpr size_t kIdSize     = 16;
inline constexpr size_t kHeaderSize = kTimeSize + 3 * kIdSize;

struct DecodeResult {
  Result  status;
  Session session;

  explicit operator bool() const {
    return static_cast<bool>(status);
  }
};

// Time is truncated to whole seconds.
std::vector<uint8_t> Encode(const Session& session);

/*
  Fails with TooShort below kHeaderSize bytes and MalformedIdentifier when
  the scheme rejects one of the ids. On success the session is marked
  valid; whether it is trusted is the store's decision.

  A time outside what util::TimePoint holds (about +-292 years around the
  epoch) decodes clamped, see util::FromUnixSeconds.
*/
DecodeResult Decode(const uint8_t* data, size_t size, const IdScheme& ids);
DecodeResult Decode(const std::vector<uint8_t>& data, const IdScheme& ids);

} // namespace cookiesession::session
