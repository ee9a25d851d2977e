#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ulidtool::core {

// Uint128 is an unsigned 128-bit integer with modular (wrap-around) arithmetic.
// Member order (hi, lo) makes the defaulted comparison numeric.
struct Uint128 {
  std::uint64_t hi{0};  // NOLINT(readability-identifier-naming)
  std::uint64_t lo{0};  // NOLINT(readability-identifier-naming)

  constexpr Uint128() = default;
  constexpr Uint128(std::uint64_t value) : lo(value) {}  // NOLINT(google-explicit-constructor)
  constexpr Uint128(std::uint64_t high, std::uint64_t low) : hi(high), lo(low) {}

  static constexpr Uint128 max() { return Uint128{~std::uint64_t{0}, ~std::uint64_t{0}}; }

  // Value with the low `bits` bits set. bits >= 128 yields max().
  static constexpr Uint128 low_mask(unsigned bits) {
    if (bits >= 128u) {
      return max();
    }
    if (bits >= 64u) {
      return Uint128{bits == 64u ? 0u : (~std::uint64_t{0} >> (128u - bits)), ~std::uint64_t{0}};
    }
    return Uint128{0u, bits == 0u ? 0u : (~std::uint64_t{0} >> (64u - bits))};
  }

  // Number of significant bits (0 for zero).
  [[nodiscard]] constexpr unsigned bit_width() const {
    unsigned width = 0;
    Uint128 v = *this;
    while (v.hi != 0u || v.lo != 0u) {
      ++width;
      v = v >> 1u;
    }
    return width;
  }

  [[nodiscard]] constexpr bool fits_in(unsigned bits) const { return (*this & ~low_mask(bits)) == 0u; }

  friend constexpr auto operator<=>(const Uint128&, const Uint128&) = default;
  friend constexpr bool operator==(const Uint128&, const Uint128&) = default;

  friend constexpr Uint128 operator+(Uint128 a, Uint128 b) {
    const std::uint64_t lo = a.lo + b.lo;
    const std::uint64_t carry = lo < a.lo ? 1u : 0u;
    return Uint128{a.hi + b.hi + carry, lo};
  }

  friend constexpr Uint128 operator-(Uint128 a, Uint128 b) {
    const std::uint64_t lo = a.lo - b.lo;
    const std::uint64_t borrow = a.lo < b.lo ? 1u : 0u;
    return Uint128{a.hi - b.hi - borrow, lo};
  }

  friend constexpr Uint128 operator&(Uint128 a, Uint128 b) { return Uint128{a.hi & b.hi, a.lo & b.lo}; }
  friend constexpr Uint128 operator|(Uint128 a, Uint128 b) { return Uint128{a.hi | b.hi, a.lo | b.lo}; }
  friend constexpr Uint128 operator^(Uint128 a, Uint128 b) { return Uint128{a.hi ^ b.hi, a.lo ^ b.lo}; }
  friend constexpr Uint128 operator~(Uint128 a) { return Uint128{~a.hi, ~a.lo}; }

  friend constexpr Uint128 operator<<(Uint128 a, unsigned n) {
    if (n >= 128u) {
      return Uint128{};
    }
    if (n >= 64u) {
      return Uint128{a.lo << (n - 64u), 0u};
    }
    if (n == 0u) {
      return a;
    }
    return Uint128{(a.hi << n) | (a.lo >> (64u - n)), a.lo << n};
  }

  friend constexpr Uint128 operator>>(Uint128 a, unsigned n) {
    if (n >= 128u) {
      return Uint128{};
    }
    if (n >= 64u) {
      return Uint128{0u, a.hi >> (n - 64u)};
    }
    if (n == 0u) {
      return a;
    }
    return Uint128{a.hi >> n, (a.lo >> n) | (a.hi << (64u - n))};
  }

  constexpr Uint128& operator+=(Uint128 other) { return *this = *this + other; }
  constexpr Uint128& operator-=(Uint128 other) { return *this = *this - other; }
};

// to_string renders value in the given base (2..36), lower-case digits, no prefix, no padding.
[[nodiscard]] std::string to_string(Uint128 value, unsigned base = 10);

// parse_uint128 parses digits in the given base (2..36), case-insensitive.
// Returns nullopt on empty input, an invalid digit, or overflow past 128 bits.
[[nodiscard]] std::optional<Uint128> parse_uint128(std::string_view digits, unsigned base = 10);

// Big-endian (network order) byte conversions of the low `N` bytes.
template <std::size_t N>
[[nodiscard]] constexpr std::array<std::uint8_t, N> to_big_endian(Uint128 value) {
  static_assert(N <= 16, "Uint128 holds at most 16 bytes");
  std::array<std::uint8_t, N> out{};
  for (std::size_t i = 0; i < N; ++i) {
    out[N - 1 - i] = static_cast<std::uint8_t>((value >> static_cast<unsigned>(i * 8u)).lo & 0xffu);
  }
  return out;
}

template <std::size_t N>
[[nodiscard]] constexpr Uint128 from_big_endian(const std::array<std::uint8_t, N>& bytes) {
  static_assert(N <= 16, "Uint128 holds at most 16 bytes");
  Uint128 value;
  for (const std::uint8_t b : bytes) {
    value = (value << 8u) | Uint128{b};
  }
  return value;
}

}  // namespace ulidtool::core
