#include "internal/crypto/random.hpp"
#include "internal/crypto/secretbox.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using namespace cookiesession::crypto;

std::string Hex(const Key& key) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  for (auto b : key) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

std::vector<uint8_t> Bytes(const std::string& s) {
  return {s.begin(), s.end()};
}

Nonce MakeNonce(uint8_t seed) {
  Nonce nonce{};
  for (size_t i = 0; i < nonce.size(); ++i) nonce[i] = static_cast<uint8_t>(seed + i);
  return nonce;
}

void TestDeriveKeyIsSha256OfSecret() {
  assert(Hex(DeriveKey("abc")) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  assert(DeriveKey("s3cr3t") == DeriveKey("s3cr3t"));
  assert(DeriveKey("s3cr3t") != DeriveKey("s3cr3u"));
}

void TestSealOpenRoundTrip() {
  const auto key   = DeriveKey("key");
  const auto nonce = MakeNonce(7);
  const auto msg   = Bytes("attack at dawn");

  const auto sealed = Seal(key, nonce, msg.data(), msg.size());
  assert(sealed.has_value());
  assert(sealed->size() == msg.size() + kTagSize);

  const auto opened = Open(key, nonce, sealed->data(), sealed->size());
  assert(opened.has_value());
  assert(*opened == msg);
}

// NaCl's secretbox test vector (tests/secretbox.c); sealed = tag || ciphertext.
void TestSealMatchesSecretboxVector() {
  const Key key = {{
    0x1b, 0x27, 0x55, 0x64, 0x73, 0xe9, 0x85, 0xd4, 0x62, 0xcd, 0x51, 0x19,
    0x7a, 0x9a, 0x46, 0xc7, 0x60, 0x09, 0x54, 0x9e, 0xac, 0x64, 0x74, 0xf2,
    0x06, 0xc4, 0xee, 0x08, 0x44, 0xf6, 0x83, 0x89,
  }};
  const Nonce nonce = {{
    0x69, 0x69, 0x6e, 0xe9, 0x55, 0xb6, 0x2b, 0x73, 0xcd, 0x62, 0xbd, 0xa8,
    0x75, 0xfc, 0x73, 0xd6, 0x82, 0x19, 0xe0, 0x03, 0x6b, 0x7a, 0x0b, 0x37,
  }};
  const std::vector<uint8_t> plaintext = {
    0xbe, 0x07, 0x5f, 0xc5, 0x3c, 0x81, 0xf2, 0xd5, 0xcf, 0x14, 0x13, 0x16,
    0xeb, 0xeb, 0x0c, 0x7b, 0x52, 0x28, 0xc5, 0x2a, 0x4c, 0x62, 0xcb, 0xd4,
    0x4b, 0x66, 0x84, 0x9b, 0x64, 0x24, 0x4f, 0xfc, 0xe5, 0xec, 0xba, 0xaf,
    0x33, 0xbd, 0x75, 0x1a, 0x1a, 0xc7, 0x28, 0xd4, 0x5e, 0x6c, 0x61, 0x29,
    0x6c, 0xdc, 0x3c, 0x01, 0x23, 0x35, 0x61, 0xf4, 0x1d, 0xb6, 0x6c, 0xce,
    0x31, 0x4a, 0xdb, 0x31, 0x0e, 0x3b, 0xe8, 0x25, 0x0c, 0x46, 0xf0, 0x6d,
    0xce, 0xea, 0x3a, 0x7f, 0xa1, 0x34, 0x80, 0x57, 0xe2, 0xf6, 0x55, 0x6a,
    0xd6, 0xb1, 0x31, 0x8a, 0x02, 0x4a, 0x83, 0x8f, 0x21, 0xaf, 0x1f, 0xde,
    0x04, 0x89, 0x77, 0xeb, 0x48, 0xf5, 0x9f, 0xfd, 0x49, 0x24, 0xca, 0x1c,
    0x60, 0x90, 0x2e, 0x52, 0xf0, 0xa0, 0x89, 0xbc, 0x76, 0x89, 0x70, 0x40,
    0xe0, 0x82, 0xf9, 0x37, 0x76, 0x38, 0x48, 0x64, 0x5e, 0x07, 0x05,
  };
  const std::vector<uint8_t> expected = {
    0xf3, 0xff, 0xc7, 0x70, 0x3f, 0x94, 0x00, 0xe5, 0x2a, 0x7d, 0xfb, 0x4b,
    0x3d, 0x33, 0x05, 0xd9, 0x8e, 0x99, 0x3b, 0x9f, 0x48, 0x68, 0x12, 0x73,
    0xc2, 0x96, 0x50, 0xba, 0x32, 0xfc, 0x76, 0xce, 0x48, 0x33, 0x2e, 0xa7,
    0x16, 0x4d, 0x96, 0xa4, 0x47, 0x6f, 0xb8, 0xc5, 0x31, 0xa1, 0x18, 0x6a,
    0xc0, 0xdf, 0xc1, 0x7c, 0x98, 0xdc, 0xe8, 0x7b, 0x4d, 0xa7, 0xf0, 0x11,
    0xec, 0x48, 0xc9, 0x72, 0x71, 0xd2, 0xc2, 0x0f, 0x9b, 0x92, 0x8f, 0xe2,
    0x27, 0x0d, 0x6f, 0xb8, 0x63, 0xd5, 0x17, 0x38, 0xb4, 0x8e, 0xee, 0xe3,
    0x14, 0xa7, 0xcc, 0x8a, 0xb9, 0x32, 0x16, 0x45, 0x48, 0xe5, 0x26, 0xae,
    0x90, 0x22, 0x43, 0x68, 0x51, 0x7a, 0xcf, 0xea, 0xbd, 0x6b, 0xb3, 0x73,
    0x2b, 0xc0, 0xe9, 0xda, 0x99, 0x83, 0x2b, 0x61, 0xca, 0x01, 0xb6, 0xde,
    0x56, 0x24, 0x4a, 0x9e, 0x88, 0xd5, 0xf9, 0xb3, 0x79, 0x73, 0xf6, 0x22,
    0xa4, 0x3d, 0x14, 0xa6, 0x59, 0x9b, 0x1f, 0x65, 0x4c, 0xb4, 0x5a, 0x74,
    0xe3, 0x55, 0xa5,
  };

  const auto sealed = Seal(key, nonce, plaintext.data(), plaintext.size());
  assert(sealed.has_value());
  assert(*sealed == expected);

  const auto opened = Open(key, nonce, expected.data(), expected.size());
  assert(opened.has_value());
  assert(*opened == plaintext);
}

void TestEmptyPlaintextStillAuthenticates() {
  const auto key   = DeriveKey("key");
  const auto nonce = MakeNonce(1);

  const auto sealed = Seal(key, nonce, nullptr, 0);
  assert(sealed.has_value());
  assert(sealed->size() == kTagSize);

  const auto opened = Open(key, nonce, sealed->data(), sealed->size());
  assert(opened.has_value());
  assert(opened->empty());
}

void TestOpenRejectsWrongKeyNonceOrModifiedInput() {
  const auto key   = DeriveKey("key");
  const auto nonce = MakeNonce(9);
  const auto msg   = Bytes("message");

  auto sealed = *Seal(key, nonce, msg.data(), msg.size());

  assert(!Open(DeriveKey("other"), nonce, sealed.data(), sealed.size()));
  assert(!Open(key, MakeNonce(10), sealed.data(), sealed.size()));
  assert(!Open(key, nonce, sealed.data(), sealed.size() - 1));
  assert(!Open(key, nonce, sealed.data(), kTagSize - 1));

  for (size_t i = 0; i < sealed.size(); ++i) {
    sealed[i] ^= 0x01;
    assert(!Open(key, nonce, sealed.data(), sealed.size()));
    sealed[i] ^= 0x01;
  }
  assert(Open(key, nonce, sealed.data(), sealed.size()));
}

void TestOpenSslRandomSourceFills() {
  OpenSslRandomSource random;
  Nonce               a{};
  Nonce               b{};
  assert(random.Fill(a.data(), a.size()));
  assert(random.Fill(b.data(), b.size()));
  assert(a != b);
  assert(random.Fill(nullptr, 0));
}

} // namespace

int main() {
  TestDeriveKeyIsSha256OfSecret();
  TestSealOpenRoundTrip();
  TestSealMatchesSecretboxVector();
  TestEmptyPlaintextStillAuthenticates();
  TestOpenRejectsWrongKeyNonceOrModifiedInput();
  TestOpenSslRandomSourceFills();

  std::cout << "cookiesession_unit_secretbox: pass\n";
  return 0;
}
