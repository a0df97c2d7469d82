#include "blake3_util.h"

#include "util.h"

#include <doctest/doctest.h>

#include <string>

namespace {

// Known BLAKE3 hash of "abc"
constexpr blext::blake3_t kExpectedBlake3Abc{ 0x64, 0x37, 0xb3, 0xac, 0x38, 0x46, 0x51,
                                              0x33, 0xff, 0xb6, 0x3b, 0x75, 0x27, 0x3a,
                                              0x8d, 0xb5, 0x48, 0xc5, 0x58, 0x46, 0x5d,
                                              0x79, 0xdb, 0x03, 0xfd, 0x35, 0x9c, 0x6c,
                                              0xd5, 0xbd, 0x9d, 0x85u };

}  // namespace

TEST_CASE("blake3_hash computes known hash") {
  std::string constexpr input{ "abc" };
  auto const digest{ blext::blake3_hash(input.data(), input.size()) };
  CHECK(digest == kExpectedBlake3Abc);
}

TEST_CASE("blake3_fingerprint matches hashing the joined lines") {
  auto const expected{ blext::blake3_hash("a\nbc\n", 5) };
  CHECK(blext::blake3_fingerprint({ "a", "bc" }) ==
        blext::util_bytes_to_hex(expected.data(), expected.size()));
}

TEST_CASE("blake3_fingerprint is order-sensitive") {
  CHECK(blext::blake3_fingerprint({ "a", "b" }) != blext::blake3_fingerprint({ "b", "a" }));
  CHECK(blext::blake3_fingerprint({ "ab" }) != blext::blake3_fingerprint({ "a", "b" }));
}
