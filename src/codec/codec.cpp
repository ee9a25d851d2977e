#include "ulidtool/codec/codec.h"

#include "ulidtool/codec/base32.h"
#include "ulidtool/core/clock.h"

#include <array>

namespace ulidtool::codec {

namespace {

constexpr std::size_t kTimestampBytes = 6;
constexpr std::size_t kRandomnessBytes = 10;
constexpr std::size_t kTimestampChars = 10;
constexpr std::size_t kRandomnessChars = 16;

core::DecodeError invalid_length(const std::string_view what, const std::size_t expected,
                                 const std::size_t actual) {
  return core::DecodeError{core::DecodeErrorCode::kInvalidLength,
                           std::string(what) + " requires " + std::to_string(expected) +
                               " characters, got " + std::to_string(actual)};
}

core::Uint128 to_uint128(const std::vector<std::uint8_t>& bytes) {
  core::Uint128 value;
  for (const std::uint8_t b : bytes) {
    value = (value << 8u) | core::Uint128{b};
  }
  return value;
}

bool starts_with_ignore_case(const std::string_view text, const std::string_view prefix) {
  if (text.size() < prefix.size()) {
    return false;
  }
  for (std::size_t i = 0; i < prefix.size(); ++i) {
    char ch = text[i];
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      ch = static_cast<char>(ch + kCaseOffset);
    }
    if (ch != prefix[i]) {
      return false;
    }
  }
  return true;
}

}  // namespace

// ── Components ──────────────────────────────────────────────────────────────

std::string encode_timestamp(const std::uint64_t timestamp_ms) {
  const auto bytes = core::to_big_endian<kTimestampBytes>(core::Uint128{timestamp_ms});
  return encode_crockford(bytes);
}

core::Result<std::uint64_t, core::DecodeError> decode_timestamp(const std::string_view text) {
  using R = core::Result<std::uint64_t, core::DecodeError>;
  if (text.size() != kTimestampChars) {
    return R::err(invalid_length("timestamp", kTimestampChars, text.size()));
  }
  auto bytes = decode_crockford(text);
  if (!bytes.has_value()) {
    return R::err(bytes.error());
  }
  return R::ok(to_uint128(bytes.value()).lo);
}

std::string encode_randomness(const core::Uint128 randomness) {
  const auto bytes = core::to_big_endian<kRandomnessBytes>(randomness);
  return encode_crockford(bytes);
}

core::Result<core::Uint128, core::DecodeError> decode_randomness(const std::string_view text) {
  using R = core::Result<core::Uint128, core::DecodeError>;
  if (text.size() != kRandomnessChars) {
    return R::err(invalid_length("randomness", kRandomnessChars, text.size()));
  }
  auto bytes = decode_crockford(text);
  if (!bytes.has_value()) {
    return R::err(bytes.error());
  }
  return R::ok(to_uint128(bytes.value()));
}

std::optional<std::pair<std::string_view, std::string_view>> split_text(const std::string_view text) {
  if (text.size() != UlidTraits::kTextLength) {
    return std::nullopt;
  }
  return std::make_pair(text.substr(0, kTimestampChars), text.substr(kTimestampChars));
}

core::Result<std::uint64_t, core::DecodeError> timestamp_from_time_point(
    const std::chrono::system_clock::time_point time_point) {
  using R = core::Result<std::uint64_t, core::DecodeError>;
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(time_point.time_since_epoch()).count();
  if (ms < 0 || static_cast<std::uint64_t>(ms) > core::kMaxTimestampMs) {
    return R::err(core::DecodeError{core::DecodeErrorCode::kOutOfRange,
                                    "time point " + std::to_string(ms) +
                                        " ms is outside the 48-bit timestamp range"});
  }
  return R::ok(static_cast<std::uint64_t>(ms));
}

// ── Radix ───────────────────────────────────────────────────────────────────

core::Result<core::Uint128, core::DecodeError> parse_radix(std::string_view text,
                                                           const unsigned base,
                                                           const std::string_view prefix,
                                                           const unsigned max_bits) {
  using R = core::Result<core::Uint128, core::DecodeError>;
  if (text.starts_with('-')) {
    return R::err(core::DecodeError{core::DecodeErrorCode::kOutOfRange,
                                    "negative value '" + std::string(text) + "'"});
  }
  if (!prefix.empty() && starts_with_ignore_case(text, prefix)) {
    text.remove_prefix(prefix.size());
  }
  if (text.empty()) {
    return R::err(core::DecodeError{core::DecodeErrorCode::kInvalidFormat, "no digits"});
  }

  const auto value = core::parse_uint128(text, base);
  if (!value.has_value()) {
    // Distinguish a bad digit from overflow past 128 bits.
    for (std::size_t i = 0; i < text.size(); ++i) {
      if (!core::parse_uint128(text.substr(i, 1), base).has_value()) {
        return R::err(core::DecodeError{core::DecodeErrorCode::kInvalidCharacter,
                                        "invalid base-" + std::to_string(base) + " digit '" +
                                            std::string(1, text[i]) + "'"});
      }
    }
    return R::err(core::DecodeError{core::DecodeErrorCode::kOutOfRange,
                                    "value exceeds " + std::to_string(max_bits) + " bits"});
  }
  if (!value->fits_in(max_bits)) {
    return R::err(core::DecodeError{core::DecodeErrorCode::kOutOfRange,
                                    "value exceeds " + std::to_string(max_bits) + " bits"});
  }
  return R::ok(*value);
}

std::string format_radix(const core::Uint128 value, const unsigned base,
                         const std::string_view prefix) {
  return std::string(prefix) + core::to_string(value, base);
}

// ── Canonical string ────────────────────────────────────────────────────────

std::string to_string(const Ulid& id) {
  return encode_timestamp(id.timestamp()) + encode_randomness(id.randomness());
}

std::string to_string(const Slid& id) {
  return encode_hex(id.bytes());
}

DecodeResult<Ulid> parse_ulid(const std::string_view text) {
  const auto segments = split_text(text);
  if (!segments.has_value()) {
    return DecodeResult<Ulid>::err(invalid_length("ULID", UlidTraits::kTextLength, text.size()));
  }

  const auto timestamp = decode_timestamp(segments->first);
  if (!timestamp.has_value()) {
    return DecodeResult<Ulid>::err(timestamp.error());
  }
  const auto randomness = decode_randomness(segments->second);
  if (!randomness.has_value()) {
    auto error = randomness.error();
    error.detail += " (randomness segment)";
    return DecodeResult<Ulid>::err(std::move(error));
  }
  return DecodeResult<Ulid>::ok(Ulid::from_fields(timestamp.value(), randomness.value()));
}

DecodeResult<Slid> parse_slid(const std::string_view text) {
  if (text.size() != SlidTraits::kTextLength) {
    return DecodeResult<Slid>::err(invalid_length("SLID", SlidTraits::kTextLength, text.size()));
  }
  const auto bytes = decode_hex(text);
  if (!bytes.has_value()) {
    return DecodeResult<Slid>::err(bytes.error());
  }
  return DecodeResult<Slid>::ok(Slid::from_packed(to_uint128(bytes.value())));
}

}  // namespace ulidtool::codec
