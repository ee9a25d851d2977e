#include "ulidtool/codec/codec.h"

#include <catch2/catch.hpp>

#include <array>
#include <chrono>

using namespace ulidtool;
using namespace ulidtool::codec;
using ulidtool::core::DecodeErrorCode;
using ulidtool::core::Uint128;

namespace {

constexpr std::uint64_t kTimestamp = 1700000000000ull;  // 0x18bcfe56800
const Uint128 kRandomness{0x0123u, 0x456789abcdef0123ull};
constexpr const char* kText = "065WZSB80004HMASW9NF6YY093";

}  // namespace

// ── Canonical string ────────────────────────────────────────────────────────

TEST_CASE("to_string: ULID is 10 timestamp chars plus 16 randomness chars", "[codec][ulid]") {
  const Ulid id = Ulid::from_fields(kTimestamp, kRandomness);
  const std::string text = to_string(id);
  CHECK(text == kText);
  CHECK(text.substr(0, 10) == encode_timestamp(kTimestamp));
  CHECK(text.substr(10) == encode_randomness(kRandomness));
}

TEST_CASE("to_string: format minimum and maximum", "[codec][ulid]") {
  CHECK(to_string(Ulid::min()) == "00000000000000000000000000");
  // The timestamp segment carries two zero pad bits, so it ends in W rather than Z.
  CHECK(to_string(Ulid::max()) == "ZZZZZZZZZWZZZZZZZZZZZZZZZZ");
}

TEST_CASE("parse_ulid: decodes the canonical string", "[codec][ulid]") {
  const auto parsed = parse_ulid(kText);
  REQUIRE(parsed.has_value());
  CHECK(parsed.value().timestamp() == kTimestamp);
  CHECK(parsed.value().randomness() == kRandomness);
}

TEST_CASE("parse_ulid: is case-insensitive", "[codec][ulid]") {
  const auto parsed = parse_ulid("065wzsb80004hmasw9nf6yy093");
  REQUIRE(parsed.has_value());
  CHECK(to_string(parsed.value()) == kText);
}

TEST_CASE("parse_ulid: wrong length is kInvalidLength", "[codec][ulid]") {
  for (const char* text : {"", "065WZSB80004HMASW9NF6YY09", "065WZSB80004HMASW9NF6YY0933"}) {
    const auto parsed = parse_ulid(text);
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error().code == DecodeErrorCode::kInvalidLength);
  }
}

TEST_CASE("parse_ulid: excluded letters are kInvalidCharacter", "[codec][ulid]") {
  const auto in_timestamp = parse_ulid("065WZSB8O004HMASW9NF6YY093");
  REQUIRE_FALSE(in_timestamp.has_value());
  CHECK(in_timestamp.error().code == DecodeErrorCode::kInvalidCharacter);

  const auto in_randomness = parse_ulid("065WZSB80004HMASW9NF6YY0U3");
  REQUIRE_FALSE(in_randomness.has_value());
  CHECK(in_randomness.error().code == DecodeErrorCode::kInvalidCharacter);
  CHECK(in_randomness.error().detail.find("randomness") != std::string::npos);
}

TEST_CASE("parse_ulid: set pad bits in the timestamp segment are rejected", "[codec][ulid]") {
  // '3' sets both pad bits of the 10th character; decoding would otherwise alias min().
  const auto aliased = parse_ulid("00000000030000000000000000");
  REQUIRE_FALSE(aliased.has_value());
  CHECK(aliased.error().code == DecodeErrorCode::kInvalidCharacter);

  const auto past_max = parse_ulid("ZZZZZZZZZZZZZZZZZZZZZZZZZZ");
  REQUIRE_FALSE(past_max.has_value());
  CHECK(past_max.error().code == DecodeErrorCode::kInvalidCharacter);

  CHECK(parse_ulid("ZZZZZZZZZWZZZZZZZZZZZZZZZZ").has_value());
}

// ── Packed value scenario ───────────────────────────────────────────────────

TEST_CASE("codec: packed 0x16F4D2A1B2C3D4E round-trips through every form", "[codec][ulid]") {
  const Uint128 packed{0u, 0x016F4D2A1B2C3D4Eull};
  const auto id = from_integer<Ulid>(packed);
  REQUIRE(id.has_value());

  const auto bytes = to_bytes(id.value());
  CHECK(bytes == std::array<std::uint8_t, 16>{0, 0, 0, 0, 0, 0, 0, 0, 0x01, 0x6f, 0x4d, 0x2a, 0x1b,
                                              0x2c, 0x3d, 0x4e});
  const auto from_raw = from_bytes<Ulid>(bytes);
  REQUIRE(from_raw.has_value());
  CHECK(from_raw.value() == id.value());

  CHECK(to_integer(id.value()) == packed);

  const std::string text = to_string(id.value());
  CHECK(text == "000000000000002VTD58DJRFAE");
  CHECK(text.find_first_of("ILOU") == std::string::npos);
  const auto from_text = parse_ulid(text);
  REQUIRE(from_text.has_value());
  CHECK(from_text.value() == id.value());
}

// ── Bytes and integer ───────────────────────────────────────────────────────

TEST_CASE("from_bytes: ULID requires exactly 16 bytes", "[codec][ulid]") {
  const std::array<std::uint8_t, 15> short_input{};
  const auto parsed = from_bytes<Ulid>(short_input);
  REQUIRE_FALSE(parsed.has_value());
  CHECK(parsed.error().code == DecodeErrorCode::kInvalidLength);
}

TEST_CASE("from_integer: accepts the full 128-bit range", "[codec][ulid]") {
  const auto parsed = from_integer<Ulid>(Uint128::max());
  REQUIRE(parsed.has_value());
  CHECK(parsed.value() == Ulid::max());
}

TEST_CASE("to_decimal / from_decimal", "[codec][ulid]") {
  const Ulid id = Ulid::from_fields(kTimestamp, kRandomness);
  CHECK(to_decimal(id) == "2055173893344874970004141931685151011");
  const auto parsed = from_decimal<Ulid>("2055173893344874970004141931685151011");
  REQUIRE(parsed.has_value());
  CHECK(parsed.value() == id);

  const auto negative = from_decimal<Ulid>("-1");
  REQUIRE_FALSE(negative.has_value());
  CHECK(negative.error().code == DecodeErrorCode::kOutOfRange);
}

// ── Fields ──────────────────────────────────────────────────────────────────

TEST_CASE("from_interfaces: builds from in-range fields", "[codec][ulid]") {
  const auto id = from_interfaces<Ulid>(kTimestamp, kRandomness);
  REQUIRE(id.has_value());
  CHECK(to_string(id.value()) == kText);
}

TEST_CASE("from_interfaces: rejects oversized fields", "[codec][ulid]") {
  const auto big_timestamp = from_interfaces<Ulid>(std::uint64_t{1} << 48u, 0u);
  REQUIRE_FALSE(big_timestamp.has_value());
  CHECK(big_timestamp.error().code == DecodeErrorCode::kOutOfRange);

  const auto big_randomness = from_interfaces<Ulid>(0u, Uint128{1u} << 80u);
  REQUIRE_FALSE(big_randomness.has_value());
  CHECK(big_randomness.error().code == DecodeErrorCode::kOutOfRange);
}

TEST_CASE("prime: extracts the seed bits under a layout", "[codec][ulid]") {
  const Ulid env = Ulid::from_fields(kTimestamp, (Uint128{0xabu} << 72u) | Uint128{5u});
  CHECK(to_string(env) == "065WZSB800NC00000000000005");
  CHECK(prime(env, SeedLayout{8, 72}) == 0xab);

  const Ulid short_env = Ulid::from_fields(kTimestamp, Uint128{0xa3u});
  CHECK(to_string(short_env) == "065WZSB8000000000000000053");
  CHECK(prime(short_env, SeedLayout{4, 4}) == 0x0a);
}

TEST_CASE("timestamp segment: encode, decode and split", "[codec][ulid]") {
  CHECK(encode_timestamp(kTimestamp) == "065WZSB800");
  const auto decoded = decode_timestamp("065WZSB800");
  REQUIRE(decoded.has_value());
  CHECK(decoded.value() == kTimestamp);

  const auto segments = split_text(kText);
  REQUIRE(segments.has_value());
  CHECK(segments->first == "065WZSB800");
  CHECK(segments->second == "04HMASW9NF6YY093");
  CHECK_FALSE(split_text("short").has_value());
}

TEST_CASE("time points: identifier timestamp converts both ways", "[codec][ulid]") {
  const Ulid id = Ulid::from_fields(kTimestamp, 0u);
  const auto time_point = to_time_point(id);
  CHECK(std::chrono::duration_cast<std::chrono::milliseconds>(time_point.time_since_epoch())
            .count() == 1700000000000);

  const auto back = timestamp_from_time_point(time_point);
  REQUIRE(back.has_value());
  CHECK(back.value() == kTimestamp);

  const auto before_epoch =
      timestamp_from_time_point(std::chrono::system_clock::time_point{std::chrono::milliseconds{-1}});
  REQUIRE_FALSE(before_epoch.has_value());
  CHECK(before_epoch.error().code == DecodeErrorCode::kOutOfRange);
}

// ── Ordering ────────────────────────────────────────────────────────────────

TEST_CASE("Ulid: later timestamp sorts after regardless of randomness", "[codec][ulid]") {
  const Ulid earlier = Ulid::from_fields(kTimestamp, Uint128::low_mask(80));
  const Ulid later = Ulid::from_fields(kTimestamp + 1u, 0u);
  CHECK(earlier < later);
  CHECK(to_string(earlier) < to_string(later));
  CHECK(earlier.bytes() < later.bytes());
}
