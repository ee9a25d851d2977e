#pragma once

#include "ulidtool/core/result.h"
#include "ulidtool/core/uint128.h"
#include "ulidtool/identifier.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

// Bit-exact conversions between identifiers and their external representations.
// Every from_* function is pure and reports malformed input as a DecodeError;
// nothing here retries, normalizes beyond letter case, or guesses.
namespace ulidtool::codec {

template <typename Id>
using DecodeResult = core::Result<Id, core::DecodeError>;

// ── Components ──────────────────────────────────────────────────────────────

// Timestamp segment of a ULID string: 48 bits as 10 unpadded base-32 chars.
[[nodiscard]] std::string encode_timestamp(std::uint64_t timestamp_ms);
[[nodiscard]] core::Result<std::uint64_t, core::DecodeError> decode_timestamp(std::string_view text);

// Randomness segment of a ULID string: 80 bits as 16 base-32 chars.
[[nodiscard]] std::string encode_randomness(core::Uint128 randomness);
[[nodiscard]] core::Result<core::Uint128, core::DecodeError> decode_randomness(
    std::string_view text);

// split_text returns the (timestamp, randomness) segments of a 26-char ULID string,
// or nullopt when the length is wrong. The segments are not validated.
[[nodiscard]] std::optional<std::pair<std::string_view, std::string_view>> split_text(
    std::string_view text);

// Radix helpers shared by the hex/oct/bin views.
// parse_radix accepts an optional prefix (case-insensitive), rejects a leading '-'
// as negative and any value wider than max_bits.
[[nodiscard]] core::Result<core::Uint128, core::DecodeError> parse_radix(std::string_view text,
                                                                         unsigned base,
                                                                         std::string_view prefix,
                                                                         unsigned max_bits);
[[nodiscard]] std::string format_radix(core::Uint128 value, unsigned base, std::string_view prefix);

// from_interfaces builds an identifier from its two fields.
// Fails with kOutOfRange if either value is wider than its field.
template <typename Id>
[[nodiscard]] DecodeResult<Id> from_interfaces(std::uint64_t timestamp_ms, core::Uint128 randomness) {
  using Traits = typename Id::traits_type;
  if (!core::Uint128{timestamp_ms}.fits_in(Traits::kTimestampBits)) {
    return DecodeResult<Id>::err(core::DecodeError{
        core::DecodeErrorCode::kOutOfRange,
        "timestamp " + std::to_string(timestamp_ms) + " exceeds 48 bits"});
  }
  if (!randomness.fits_in(Traits::kRandomnessBits)) {
    return DecodeResult<Id>::err(core::DecodeError{
        core::DecodeErrorCode::kOutOfRange, "randomness " + core::to_string(randomness) +
                                                " exceeds " +
                                                std::to_string(Traits::kRandomnessBits) + " bits"});
  }
  return DecodeResult<Id>::ok(Id::from_fields(timestamp_ms, randomness));
}

// prime returns the seed bits of the randomness field under the given layout.
template <typename Traits>
[[nodiscard]] std::uint8_t prime(const BasicIdentifier<Traits>& id, const SeedLayout layout) {
  const core::Uint128 seed =
      (id.randomness() >> layout.counter_bits) & core::Uint128::low_mask(layout.seed_bits);
  return static_cast<std::uint8_t>(seed.lo);
}

template <typename Traits>
[[nodiscard]] std::chrono::system_clock::time_point to_time_point(
    const BasicIdentifier<Traits>& id) {
  return std::chrono::system_clock::time_point{
      std::chrono::milliseconds{static_cast<std::int64_t>(id.timestamp())}};
}

// Fails with kOutOfRange for instants before the epoch or past the 48-bit range.
[[nodiscard]] core::Result<std::uint64_t, core::DecodeError> timestamp_from_time_point(
    std::chrono::system_clock::time_point time_point);

// ── Bytes ───────────────────────────────────────────────────────────────────

template <typename Id>
[[nodiscard]] DecodeResult<Id> from_bytes(std::span<const std::uint8_t> bytes) {
  using Traits = typename Id::traits_type;
  if (bytes.size() != Traits::kByteLength) {
    return DecodeResult<Id>::err(core::DecodeError{
        core::DecodeErrorCode::kInvalidLength,
        std::string(Traits::kName) + " requires " + std::to_string(Traits::kByteLength) +
            " bytes, got " + std::to_string(bytes.size())});
  }
  core::Uint128 packed;
  for (const std::uint8_t b : bytes) {
    packed = (packed << 8u) | core::Uint128{b};
  }
  return DecodeResult<Id>::ok(Id::from_packed(packed));
}

template <typename Traits>
[[nodiscard]] typename BasicIdentifier<Traits>::Bytes to_bytes(const BasicIdentifier<Traits>& id) {
  return id.bytes();
}

// ── Integer ─────────────────────────────────────────────────────────────────

template <typename Id>
[[nodiscard]] DecodeResult<Id> from_integer(const core::Uint128 value) {
  using Traits = typename Id::traits_type;
  if (!value.fits_in(Traits::kTotalBits)) {
    return DecodeResult<Id>::err(core::DecodeError{
        core::DecodeErrorCode::kOutOfRange, std::string(Traits::kName) + " integer " +
                                                core::to_string(value) + " exceeds " +
                                                std::to_string(Traits::kTotalBits) + " bits"});
  }
  return DecodeResult<Id>::ok(Id::from_packed(value));
}

template <typename Traits>
[[nodiscard]] core::Uint128 to_integer(const BasicIdentifier<Traits>& id) {
  return id.packed();
}

template <typename Traits>
[[nodiscard]] std::string to_decimal(const BasicIdentifier<Traits>& id) {
  return core::to_string(id.packed(), 10);
}

template <typename Id>
[[nodiscard]] DecodeResult<Id> from_decimal(const std::string_view text) {
  const auto value = parse_radix(text, 10, "", Id::traits_type::kTotalBits);
  if (!value.has_value()) {
    return DecodeResult<Id>::err(value.error());
  }
  return DecodeResult<Id>::ok(Id::from_packed(value.value()));
}

// ── Canonical string ────────────────────────────────────────────────────────

// ULID: 26 upper-case Crockford base-32 chars (10 timestamp + 16 randomness).
[[nodiscard]] std::string to_string(const Ulid& id);
// SLID: 16 lower-case hex chars.
[[nodiscard]] std::string to_string(const Slid& id);

// Case-insensitive. Fails on wrong length or characters outside the alphabet.
[[nodiscard]] DecodeResult<Ulid> parse_ulid(std::string_view text);
[[nodiscard]] DecodeResult<Slid> parse_slid(std::string_view text);

template <typename Id>
[[nodiscard]] DecodeResult<Id> from_string(const std::string_view text) {
  if constexpr (std::is_same_v<Id, Ulid>) {
    return parse_ulid(text);
  } else {
    static_assert(std::is_same_v<Id, Slid>, "unsupported identifier format");
    return parse_slid(text);
  }
}

// ── Hex / oct / bin views ───────────────────────────────────────────────────
// Rendered like numeric literals ("0x1f", "0o37", "0b11111"), no zero padding.

template <typename Traits>
[[nodiscard]] std::string to_hex(const BasicIdentifier<Traits>& id) {
  return format_radix(id.packed(), 16, "0x");
}

template <typename Traits>
[[nodiscard]] std::string to_oct(const BasicIdentifier<Traits>& id) {
  return format_radix(id.packed(), 8, "0o");
}

template <typename Traits>
[[nodiscard]] std::string to_bin(const BasicIdentifier<Traits>& id) {
  return format_radix(id.packed(), 2, "0b");
}

template <typename Id>
[[nodiscard]] DecodeResult<Id> from_radix(const std::string_view text, const unsigned base,
                                          const std::string_view prefix) {
  const auto value = parse_radix(text, base, prefix, Id::traits_type::kTotalBits);
  if (!value.has_value()) {
    return DecodeResult<Id>::err(value.error());
  }
  return DecodeResult<Id>::ok(Id::from_packed(value.value()));
}

template <typename Id>
[[nodiscard]] DecodeResult<Id> from_hex(const std::string_view text) {
  return from_radix<Id>(text, 16, "0x");
}

template <typename Id>
[[nodiscard]] DecodeResult<Id> from_oct(const std::string_view text) {
  return from_radix<Id>(text, 8, "0o");
}

template <typename Id>
[[nodiscard]] DecodeResult<Id> from_bin(const std::string_view text) {
  return from_radix<Id>(text, 2, "0b");
}

// ── Repr view ───────────────────────────────────────────────────────────────
// "<ULID 01ARZ3NDEKTSV4RRFFQ69G5FAV>" / "<SLID 00000170a3c10203>"

template <typename Traits>
[[nodiscard]] std::string to_repr(const BasicIdentifier<Traits>& id) {
  return "<" + std::string(Traits::kName) + " " + to_string(id) + ">";
}

template <typename Id>
[[nodiscard]] DecodeResult<Id> from_repr(const std::string_view text) {
  const std::string head = "<" + std::string(Id::traits_type::kName) + " ";
  if (!text.starts_with(head) || !text.ends_with('>')) {
    return DecodeResult<Id>::err(core::DecodeError{
        core::DecodeErrorCode::kInvalidFormat,
        "expected " + head + "...>, got '" + std::string(text) + "'"});
  }
  return from_string<Id>(text.substr(head.size(), text.size() - head.size() - 1u));
}

}  // namespace ulidtool::codec
