#include "internal/util/base64.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace cookiesession::util;

std::string Encode(const std::string& s) {
  return Base64Encode(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

std::string Decoded(const std::string& s) {
  const auto bytes = Base64Decode(s);
  assert(bytes.has_value());
  return {bytes->begin(), bytes->end()};
}

void TestBase64KnownVectors() {
  assert(Encode("") == "");
  assert(Encode("f") == "Zg==");
  assert(Encode("fo") == "Zm8=");
  assert(Encode("foo") == "Zm9v");
  assert(Encode("foobar") == "Zm9vYmFy");

  assert(Decoded("") == "");
  assert(Decoded("Zg==") == "f");
  assert(Decoded("Zm8=") == "fo");
  assert(Decoded("Zm9vYmFy") == "foobar");

  const std::vector<uint8_t> binary = {0xFB, 0xFF, 0x00, 0x3E};
  assert(Base64Encode(binary) == "+/8APg==");
  assert(*Base64Decode("+/8APg==") == binary);
}

void TestBase64RejectsNonCanonicalInput() {
  assert(!Base64Decode("Zg="));      // length not a multiple of four
  assert(!Base64Decode("Zg"));       // padding required
  assert(!Base64Decode("Z===="));    // too much padding
  assert(!Base64Decode("Z=g="));     // padding in the middle
  assert(!Base64Decode("Zm9v YmFy")); // whitespace
  assert(!Base64Decode("Zm9-YmFy")); // URL-safe alphabet
  assert(!Base64Decode("===="));
  assert(!Base64Decode("Zh=="));     // non-zero trailing bits
}

void TestUuidTextForm() {
  const auto id = FromString("6ba7b810-9dad-11d1-80b4-00c04fd430c8");
  assert(id[0] == 0x6b);
  assert(id[15] == 0xc8);
  assert(ToString(id) == "6ba7b810-9dad-11d1-80b4-00c04fd430c8");
  assert(FromString("6BA7B8109DAD11D180B400C04FD430C8") == id);

  assert(IsNil(UUID{}));
  assert(!IsNil(id));
  assert(ToString(UUID{}) == "00000000-0000-0000-0000-000000000000");

  bool threw = false;
  try {
    (void)FromString("6ba7b810-9dad-11d1-80b4-00c04fd430cz");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)FromString("6ba7b810");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestFromUnixSecondsClampsToClockRange() {
  assert(FromUnixSeconds(std::numeric_limits<int64_t>::max()) == TimePoint::max());
  assert(FromUnixSeconds(std::numeric_limits<int64_t>::min()) == TimePoint::min());
  assert(FromUnixSeconds(0x0102030405060708LL) == TimePoint::max());

  // The clock's extremes still format as dates.
  assert(ToHttpDate(TimePoint::max()) == "Fri, 11 Apr 2262 23:47:16 GMT");
  assert(ToHttpDate(TimePoint::min()) == "Tue, 21 Sep 1677 00:12:43 GMT");

  // Anything the clock holds round-trips exactly.
  assert(ToUnixSeconds(FromUnixSeconds(0x0000000102030405LL)) == 0x0000000102030405LL);
  assert(ToUnixSeconds(FromUnixSeconds(-4102444800LL)) == -4102444800LL);
}

void TestTimeHelpers() {
  assert(ToHttpDate(FromUnixSeconds(784111777)) == "Sun, 06 Nov 1994 08:49:37 GMT");
  assert(ToHttpDate(FromUnixSeconds(0)) == "Thu, 01 Jan 1970 00:00:00 GMT");

  const auto tp = FromUnixSeconds(100) + std::chrono::milliseconds(750);
  assert(ToUnixSeconds(tp) == 100);
  assert(FloorToSeconds(tp) == FromUnixSeconds(100));

  const auto before_epoch = FromUnixSeconds(0) - std::chrono::milliseconds(250);
  assert(ToUnixSeconds(before_epoch) == -1);
}

} // namespace

int main() {
  TestBase64KnownVectors();
  TestBase64RejectsNonCanonicalInput();
  TestUuidTextForm();
  TestTimeHelpers();
  TestFromUnixSecondsClampsToClockRange();

  std::cout << "cookiesession_unit_util: pass\n";
  return 0;
}
