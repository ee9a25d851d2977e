#pragma once

#include "ulidtool/codec/codec.h"

#include <string>
#include <string_view>

namespace ulidtool::codec {

// Textual representations an identifier can arrive in.
enum class Representation {
  kCanonical,  // base-32 (ULID) / hex (SLID)
  kHex,        // 0x...
  kOct,        // 0o...
  kBin,        // 0b...
  kRepr,       // <ULID ...>
};

[[nodiscard]] constexpr std::string_view to_string(const Representation representation) {
  switch (representation) {
    case Representation::kCanonical:
      return "canonical";
    case Representation::kHex:
      return "hex";
    case Representation::kOct:
      return "oct";
    case Representation::kBin:
      return "bin";
    case Representation::kRepr:
      return "repr";
  }
  return "unknown";
}

// representation_of decides, from the shape of text, which representation it is in.
// The lower-case prefixes 0x / 0o / 0b and a leading '<' select their views; anything
// else is canonical. Prefixes win over canonical text because the unpadded views can
// have exactly the canonical length. Canonical text that starts with one of these
// prefixes (lower-case ULID text, or a SLID stamped after year 2350) therefore has to
// be passed to from_string directly.
template <typename Id>
[[nodiscard]] Representation representation_of(const std::string_view text) {
  if (text.starts_with("0x")) {
    return Representation::kHex;
  }
  if (text.starts_with("0o")) {
    return Representation::kOct;
  }
  if (text.starts_with("0b")) {
    return Representation::kBin;
  }
  if (text.starts_with('<')) {
    return Representation::kRepr;
  }
  return Representation::kCanonical;
}

// from_text decodes text in whatever representation representation_of detects.
template <typename Id>
[[nodiscard]] DecodeResult<Id> from_text(const std::string_view text) {
  switch (representation_of<Id>(text)) {
    case Representation::kHex:
      return from_hex<Id>(text);
    case Representation::kOct:
      return from_oct<Id>(text);
    case Representation::kBin:
      return from_bin<Id>(text);
    case Representation::kRepr:
      return from_repr<Id>(text);
    case Representation::kCanonical:
      break;
  }
  return from_string<Id>(text);
}

template <typename Traits>
[[nodiscard]] std::string render(const BasicIdentifier<Traits>& id,
                                 const Representation representation) {
  switch (representation) {
    case Representation::kHex:
      return to_hex(id);
    case Representation::kOct:
      return to_oct(id);
    case Representation::kBin:
      return to_bin(id);
    case Representation::kRepr:
      return to_repr(id);
    case Representation::kCanonical:
      break;
  }
  return to_string(id);
}

// equals_text is true when text decodes (in its detected representation) to id.
template <typename Traits>
[[nodiscard]] bool equals_text(const BasicIdentifier<Traits>& id, const std::string_view text) {
  const auto decoded = from_text<BasicIdentifier<Traits>>(text);
  return decoded.has_value() && decoded.value() == id;
}

}  // namespace ulidtool::codec
