#include "ulidtool/codec/representation.h"

#include <catch2/catch.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace ulidtool;
using namespace ulidtool::codec;
using ulidtool::core::Uint128;

namespace {

const Ulid kUlid = Ulid::from_fields(1700000000000ull, Uint128{0x0123u, 0x456789abcdef0123ull});
const Slid kSlid = Slid::from_fields(0x00000170A3C1ull, Uint128{0x0203u});

}  // namespace

TEST_CASE("representation_of: detects each view by shape", "[codec][representation]") {
  CHECK(representation_of<Ulid>("065WZSB80004HMASW9NF6YY093") == Representation::kCanonical);
  CHECK(representation_of<Ulid>("0x18bcfe568000123456789abcdef0123") == Representation::kHex);
  CHECK(representation_of<Ulid>("0o17") == Representation::kOct);
  CHECK(representation_of<Ulid>("0b101") == Representation::kBin);
  CHECK(representation_of<Ulid>("<ULID 065WZSB80004HMASW9NF6YY093>") == Representation::kRepr);
  CHECK(representation_of<Ulid>("garbage") == Representation::kCanonical);
}

TEST_CASE("representation_of: lower-case prefixes win over canonical text",
          "[codec][representation]") {
  // Valid SLID hex for a timestamp past 2350 reads as a bin view.
  CHECK(representation_of<Slid>("0bcdef0123456789") == Representation::kBin);
  CHECK_FALSE(from_text<Slid>("0bcdef0123456789").has_value());
  REQUIRE(from_string<Slid>("0bcdef0123456789").has_value());
  // Upper-case ULID text is never taken for a prefix.
  CHECK(representation_of<Ulid>("0B000000000000000000000000") == Representation::kCanonical);
}

TEST_CASE("from_text: views exactly as long as the canonical text", "[codec][representation]") {
  // Unpadded views of these values have the canonical length: 26 chars for a
  // ULID, 16 for a SLID.
  const std::vector<std::pair<Ulid, Representation>> ulids = {
      {Ulid::from_packed((Uint128{1u} << 23u) | Uint128{1u}), Representation::kBin},
      {Ulid::from_packed((Uint128{1u} << 69u) | Uint128{1u}), Representation::kOct},
      {Ulid::from_packed((Uint128{1u} << 92u) | Uint128{1u}), Representation::kHex},
  };
  for (const auto& [id, r] : ulids) {
    const std::string text = render(id, r);
    CHECK(text.size() == UlidTraits::kTextLength);
    CHECK(representation_of<Ulid>(text) == r);
    const auto decoded = from_text<Ulid>(text);
    REQUIRE(decoded.has_value());
    CHECK(decoded.value() == id);
    CHECK(equals_text(id, text));
  }

  const std::vector<std::pair<Slid, Representation>> slids = {
      {Slid::from_packed((Uint128{1u} << 13u) | Uint128{1u}), Representation::kBin},
      {Slid::from_packed((Uint128{1u} << 39u) | Uint128{1u}), Representation::kOct},
      {Slid::from_packed((Uint128{1u} << 52u) | Uint128{1u}), Representation::kHex},
  };
  for (const auto& [id, r] : slids) {
    const std::string text = render(id, r);
    CHECK(text.size() == SlidTraits::kTextLength);
    CHECK(representation_of<Slid>(text) == r);
    const auto decoded = from_text<Slid>(text);
    REQUIRE(decoded.has_value());
    CHECK(decoded.value() == id);
    CHECK(equals_text(id, text));
  }
}

TEST_CASE("from_text: decodes whichever view it is given", "[codec][representation]") {
  for (const Representation r : {Representation::kCanonical, Representation::kHex,
                                 Representation::kOct, Representation::kBin,
                                 Representation::kRepr}) {
    const std::string text = render(kUlid, r);
    CHECK(representation_of<Ulid>(text) == r);
    const auto decoded = from_text<Ulid>(text);
    REQUIRE(decoded.has_value());
    CHECK(decoded.value() == kUlid);
  }
}

TEST_CASE("from_text: failures propagate the view's error", "[codec][representation]") {
  const auto bad_hex = from_text<Slid>("0xzz");
  REQUIRE_FALSE(bad_hex.has_value());
  CHECK(bad_hex.error().code == core::DecodeErrorCode::kInvalidCharacter);

  const auto bad_canonical = from_text<Slid>("not-a-slid");
  REQUIRE_FALSE(bad_canonical.has_value());
  CHECK(bad_canonical.error().code == core::DecodeErrorCode::kInvalidLength);
}

TEST_CASE("equals_text: compares across representations", "[codec][representation]") {
  CHECK(equals_text(kSlid, "00000170a3c10203"));
  CHECK(equals_text(kSlid, "00000170A3C10203"));
  CHECK(equals_text(kSlid, "0x170a3c10203"));
  CHECK(equals_text(kSlid, "<SLID 00000170a3c10203>"));
  CHECK_FALSE(equals_text(kSlid, "0x170a3c10204"));
  CHECK_FALSE(equals_text(kSlid, "nonsense"));
}

TEST_CASE("to_string(Representation): stable names", "[codec][representation]") {
  CHECK(to_string(Representation::kCanonical) == "canonical");
  CHECK(to_string(Representation::kRepr) == "repr");
}
