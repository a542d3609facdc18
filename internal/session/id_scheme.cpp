#include "id_scheme.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace cookiesession::session {

RandomUuidScheme::RandomUuidScheme(std::shared_ptr<const crypto::RandomSource> random) : random_(std::move(random)) {
}

util::UUID RandomUuidScheme::Generate() const {
  util::UUID id{};
  if (!random_ || !random_->Fill(id.data(), id.size())) {
    throw util::RandomUnavailable("couldn't read random bytes for session id");
  }

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::optional<util::UUID> RandomUuidScheme::Parse(const uint8_t* data, size_t size) const {
  if (size != util::UUID{}.size()) return std::nullopt;

  util::UUID id{};
  std::copy_n(data, size, id.begin());
  return id;
}

} // namespace cookiesession::session
