#include "random.hpp"

#include <climits>

#include <openssl/rand.h>

namespace cookiesession::crypto {

bool OpenSslRandomSource::Fill(uint8_t* out, size_t size) const {
  while (size > 0) {
    const int chunk = size > static_cast<size_t>(INT_MAX) ? INT_MAX : static_cast<int>(size);
    if (RAND_bytes(out, chunk) != 1) return false;
    out += chunk;
    size -= static_cast<size_t>(chunk);
  }
  return true;
}

} // namespace cookiesession::crypto
