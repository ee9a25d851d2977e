#pragma once

#include "ulidtool/core/uint128.h"

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace ulidtool {

// Format traits. Both formats share the 48-bit millisecond timestamp in the
// most significant bits; they differ only in the width of the randomness field.

// ULID: [TIMESTAMP 48 bits][RANDOMNESS 80 bits], 16 bytes, 26 Crockford base-32 chars.
struct UlidTraits {
  static constexpr const char* kName = "ULID";
  static constexpr unsigned kTimestampBits = 48;
  static constexpr unsigned kRandomnessBits = 80;
  static constexpr unsigned kTotalBits = kTimestampBits + kRandomnessBits;
  static constexpr std::size_t kByteLength = kTotalBits / 8;
  static constexpr std::size_t kTextLength = 26;
};

// SLID: [TIMESTAMP 48 bits][RANDOMNESS 16 bits], 8 bytes, 16 hex chars.
struct SlidTraits {
  static constexpr const char* kName = "SLID";
  static constexpr unsigned kTimestampBits = 48;
  static constexpr unsigned kRandomnessBits = 16;
  static constexpr unsigned kTotalBits = kTimestampBits + kRandomnessBits;
  static constexpr std::size_t kByteLength = kTotalBits / 8;
  static constexpr std::size_t kTextLength = 16;
};

// BasicIdentifier is an immutable value holding the packed integer
// (timestamp << randomness_bits) | randomness.
//
// Ordering and equality are unsigned comparison of the packed value, which
// equals lexicographic order of the big-endian bytes: identifiers sort by
// timestamp first, ties broken by the randomness field.
//
// Construction with validation lives in the codec (from_interfaces, from_bytes, ...).
// from_packed() reduces its argument modulo 2^kTotalBits and cannot fail.
template <typename Traits>
class BasicIdentifier {
 public:
  using traits_type = Traits;
  using Bytes = std::array<std::uint8_t, Traits::kByteLength>;

  // All-zero identifier (the format minimum).
  constexpr BasicIdentifier() = default;

  [[nodiscard]] static constexpr BasicIdentifier from_packed(core::Uint128 packed) {
    BasicIdentifier id;
    id.packed_ = packed & core::Uint128::low_mask(Traits::kTotalBits);
    return id;
  }

  // Packs fields without validation; bits beyond each field width are discarded.
  [[nodiscard]] static constexpr BasicIdentifier from_fields(std::uint64_t timestamp,
                                                             core::Uint128 randomness) {
    const core::Uint128 ts = core::Uint128{timestamp} & core::Uint128::low_mask(Traits::kTimestampBits);
    const core::Uint128 rnd = randomness & core::Uint128::low_mask(Traits::kRandomnessBits);
    return from_packed((ts << Traits::kRandomnessBits) | rnd);
  }

  [[nodiscard]] static constexpr BasicIdentifier min() { return BasicIdentifier{}; }
  [[nodiscard]] static constexpr BasicIdentifier max() { return from_packed(core::Uint128::max()); }

  // Milliseconds since the Unix epoch.
  [[nodiscard]] constexpr std::uint64_t timestamp() const {
    return (packed_ >> Traits::kRandomnessBits).lo;
  }

  [[nodiscard]] constexpr core::Uint128 randomness() const {
    return packed_ & core::Uint128::low_mask(Traits::kRandomnessBits);
  }

  // The whole identifier as one unsigned integer.
  [[nodiscard]] constexpr core::Uint128 packed() const { return packed_; }

  [[nodiscard]] constexpr Bytes bytes() const { return core::to_big_endian<Traits::kByteLength>(packed_); }

  friend constexpr auto operator<=>(const BasicIdentifier&, const BasicIdentifier&) = default;
  friend constexpr bool operator==(const BasicIdentifier&, const BasicIdentifier&) = default;

 private:
  core::Uint128 packed_{};
};

using Ulid = BasicIdentifier<UlidTraits>;
using Slid = BasicIdentifier<SlidTraits>;

// SeedLayout describes how a seeded strategy fills the low bits of the
// randomness field: [seed_bits of seed][counter_bits of counter], right-aligned.
// env_lexical is {8, 72}, short_env_lexical {4, 4}, SLID {8, 8}.
struct SeedLayout {
  unsigned seed_bits{0};     // NOLINT(readability-identifier-naming)
  unsigned counter_bits{0};  // NOLINT(readability-identifier-naming)

  friend constexpr bool operator==(const SeedLayout&, const SeedLayout&) = default;
};

}  // namespace ulidtool

// Hash support for std::unordered_map, std::unordered_set
namespace std {
template <typename Traits>
struct hash<ulidtool::BasicIdentifier<Traits>> {
  size_t operator()(const ulidtool::BasicIdentifier<Traits>& id) const noexcept {
    const auto packed = id.packed();
    return hash<uint64_t>{}(packed.hi ^ (packed.lo * 0x9e3779b97f4a7c15ull));
  }
};
}  // namespace std
