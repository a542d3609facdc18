#include "base64.hpp"

#include <openssl/evp.h>

namespace cookiesession::util {

namespace {

bool IsAlphabet(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

// Returns the number of padding characters, or -1 when the text is not
// canonical padded base64.
int ValidatePadded(std::string_view text) {
  if (text.size() % 4 != 0) return -1;

  int padding = 0;
  if (!text.empty() && text[text.size() - 1] == '=') ++padding;
  if (text.size() >= 2 && text[text.size() - 2] == '=') ++padding;
  if (padding == 1 && text[text.size() - 2] == '=') return -1;

  for (size_t i = 0; i < text.size() - padding; ++i) {
    if (!IsAlphabet(text[i])) return -1;
  }
  return padding;
}

} // namespace

std::string Base64Encode(const uint8_t* data, size_t size) {
  if (size == 0) return {};

  std::string out(4 * ((size + 2) / 3) + 1, '\0');
  const int   written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data, static_cast<int>(size));
  out.resize(static_cast<size_t>(written));
  return out;
}

std::string Base64Encode(const std::vector<uint8_t>& data) {
  return Base64Encode(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> Base64Decode(std::string_view text) {
  const int padding = ValidatePadded(text);
  if (padding < 0) return std::nullopt;
  if (text.empty()) return std::vector<uint8_t>{};

  std::vector<uint8_t> out(3 * (text.size() / 4));
  const int            decoded = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                                                 static_cast<int>(text.size()));
  if (decoded < 0 || decoded < padding) return std::nullopt;

  // EVP_DecodeBlock counts the zero bytes produced by the padding.
  out.resize(static_cast<size_t>(decoded - padding));

  // Reject non-zero trailing bits so every accepted text has exactly one
  // byte sequence.
  if (Base64Encode(out) != text) return std::nullopt;
  return out;
}

} // namespace cookiesession::util
