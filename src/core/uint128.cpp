#include "ulidtool/core/uint128.h"

#include <algorithm>
#include <array>

namespace ulidtool::core {

namespace {

constexpr std::string_view kDigits = "0123456789abcdefghijklmnopqrstuvwxyz";

// Little-endian 32-bit limbs: limbs[0] is least significant.
using Limbs = std::array<std::uint32_t, 4>;

Limbs to_limbs(const Uint128 value) {
  return {static_cast<std::uint32_t>(value.lo), static_cast<std::uint32_t>(value.lo >> 32u),
          static_cast<std::uint32_t>(value.hi), static_cast<std::uint32_t>(value.hi >> 32u)};
}

Uint128 from_limbs(const Limbs& limbs) {
  return Uint128{(static_cast<std::uint64_t>(limbs[3]) << 32u) | limbs[2],
                 (static_cast<std::uint64_t>(limbs[1]) << 32u) | limbs[0]};
}

// Divides limbs in place by divisor, returns remainder.
std::uint32_t divmod_small(Limbs& limbs, const std::uint32_t divisor) {
  std::uint64_t remainder = 0;
  for (std::size_t i = limbs.size(); i-- > 0;) {
    const std::uint64_t current = (remainder << 32u) | limbs[i];
    limbs[i] = static_cast<std::uint32_t>(current / divisor);
    remainder = current % divisor;
  }
  return static_cast<std::uint32_t>(remainder);
}

// limbs = limbs * factor + addend. Returns false on overflow past 128 bits.
bool mul_add_small(Limbs& limbs, const std::uint32_t factor, const std::uint32_t addend) {
  std::uint64_t carry = addend;
  for (auto& limb : limbs) {
    const std::uint64_t product = static_cast<std::uint64_t>(limb) * factor + carry;
    limb = static_cast<std::uint32_t>(product);
    carry = product >> 32u;
  }
  return carry == 0u;
}

int digit_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'z') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'Z') {
    return ch - 'A' + 10;
  }
  return -1;
}

}  // namespace

std::string to_string(const Uint128 value, const unsigned base) {
  if (base < 2u || base > 36u) {
    return {};
  }
  if (value == 0u) {
    return "0";
  }

  Limbs limbs = to_limbs(value);
  std::string out;
  while (from_limbs(limbs) != 0u) {
    out.push_back(kDigits[divmod_small(limbs, base)]);
  }
  std::reverse(out.begin(), out.end());
  return out;
}

std::optional<Uint128> parse_uint128(const std::string_view digits, const unsigned base) {
  if (digits.empty() || base < 2u || base > 36u) {
    return std::nullopt;
  }

  Limbs limbs{};
  for (const char ch : digits) {
    const int digit = digit_value(ch);
    if (digit < 0 || static_cast<unsigned>(digit) >= base) {
      return std::nullopt;
    }
    if (!mul_add_small(limbs, base, static_cast<std::uint32_t>(digit))) {
      return std::nullopt;
    }
  }
  return from_limbs(limbs);
}

}  // namespace ulidtool::core
