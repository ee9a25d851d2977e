#include "ulidtool/codec/base32.h"

#include <catch2/catch.hpp>

#include <array>

using namespace ulidtool::codec;
using ulidtool::core::DecodeErrorCode;

TEST_CASE("kCrockfordAlphabet: excludes I, L, O and U", "[base32]") {
  CHECK(kCrockfordAlphabet.size() == 32u);
  for (const char excluded : {'I', 'L', 'O', 'U'}) {
    CHECK(kCrockfordAlphabet.find(excluded) == std::string_view::npos);
  }
}

TEST_CASE("encode_crockford: zero-fills a partial final quantum", "[base32]") {
  CHECK(encode_crockford(std::array<std::uint8_t, 1>{0xff}) == "ZW");
  CHECK(encode_crockford(std::array<std::uint8_t, 2>{0x00, 0xff}) == "03ZG");
  CHECK(encode_crockford(std::array<std::uint8_t, 6>{}).size() == 10u);
  CHECK(encode_crockford(std::array<std::uint8_t, 10>{}).size() == 16u);
}

TEST_CASE("decode_crockford: reverses encode_crockford", "[base32]") {
  const auto decoded = decode_crockford("03ZG");
  REQUIRE(decoded.has_value());
  CHECK(decoded.value() == std::vector<std::uint8_t>{0x00, 0xff});
}

TEST_CASE("decode_crockford: accepts lower case", "[base32]") {
  const auto upper = decode_crockford("ZW");
  const auto lower = decode_crockford("zw");
  REQUIRE(upper.has_value());
  REQUIRE(lower.has_value());
  CHECK(upper.value() == lower.value());
}

TEST_CASE("decode_crockford: rejects characters outside the alphabet", "[base32]") {
  for (const char* text : {"0I", "0L", "0O", "0U", "0-", "0 "}) {
    const auto decoded = decode_crockford(text);
    REQUIRE_FALSE(decoded.has_value());
    CHECK(decoded.error().code == DecodeErrorCode::kInvalidCharacter);
  }
}

TEST_CASE("decode_crockford: non-zero pad bits are rejected", "[base32]") {
  // "ZW" is 0xff plus two zero pad bits; "ZX" sets the last one.
  const auto padded = decode_crockford("ZX");
  REQUIRE_FALSE(padded.has_value());
  CHECK(padded.error().code == DecodeErrorCode::kInvalidCharacter);
  CHECK(decode_crockford("ZW").has_value());
}

TEST_CASE("encode_hex / decode_hex: lower-case out, either case in", "[base32][hex]") {
  CHECK(encode_hex(std::array<std::uint8_t, 3>{0x0a, 0xbc, 0xff}) == "0abcff");
  const auto decoded = decode_hex("0ABCfF");
  REQUIRE(decoded.has_value());
  CHECK(decoded.value() == std::vector<std::uint8_t>{0x0a, 0xbc, 0xff});
}

TEST_CASE("decode_hex: odd length and bad digits", "[base32][hex]") {
  const auto odd = decode_hex("abc");
  REQUIRE_FALSE(odd.has_value());
  CHECK(odd.error().code == DecodeErrorCode::kInvalidLength);

  const auto bad = decode_hex("zz");
  REQUIRE_FALSE(bad.has_value());
  CHECK(bad.error().code == DecodeErrorCode::kInvalidCharacter);
}
