#include "ulidtool/codec/base32.h"

#include <array>

namespace ulidtool::codec {

namespace {

using BytesResult = core::Result<std::vector<std::uint8_t>, core::DecodeError>;

// Reverse lookup for the Crockford alphabet, both cases. -1 marks invalid input.
constexpr std::array<std::int8_t, 128> make_crockford_table() {
  std::array<std::int8_t, 128> table{};
  for (auto& entry : table) {
    entry = -1;
  }
  for (std::size_t i = 0; i < kCrockfordAlphabet.size(); ++i) {
    const char upper = kCrockfordAlphabet[i];
    table[static_cast<std::size_t>(upper)] = static_cast<std::int8_t>(i);
    if (upper >= 'A' && upper <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      table[static_cast<std::size_t>(upper + kCaseOffset)] = static_cast<std::int8_t>(i);
    }
  }
  return table;
}

constexpr auto kCrockfordTable = make_crockford_table();

int crockford_value(const char ch) {
  const auto index = static_cast<unsigned char>(ch);
  if (index >= kCrockfordTable.size()) {
    return -1;
  }
  return kCrockfordTable[index];
}

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

core::DecodeError invalid_character(const char ch, const std::size_t position,
                                    const std::string_view alphabet_name) {
  return core::DecodeError{core::DecodeErrorCode::kInvalidCharacter,
                           "invalid " + std::string(alphabet_name) + " character '" +
                               std::string(1, ch) + "' at position " + std::to_string(position)};
}

}  // namespace

std::string encode_crockford(const std::span<const std::uint8_t> data) {
  std::string out;
  out.reserve((data.size() * 8u + 4u) / 5u);

  std::uint32_t buffer = 0;
  unsigned bits = 0;
  for (const std::uint8_t byte : data) {
    buffer = (buffer << 8u) | byte;
    bits += 8u;
    while (bits >= 5u) {
      bits -= 5u;
      out.push_back(kCrockfordAlphabet[(buffer >> bits) & 0x1fu]);
    }
    buffer &= (1u << bits) - 1u;
  }
  if (bits > 0u) {
    out.push_back(kCrockfordAlphabet[(buffer << (5u - bits)) & 0x1fu]);
  }
  return out;
}

BytesResult decode_crockford(const std::string_view text) {
  std::vector<std::uint8_t> out;
  out.reserve(text.size() * 5u / 8u);

  std::uint32_t buffer = 0;
  unsigned bits = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const int value = crockford_value(text[i]);
    if (value < 0) {
      return BytesResult::err(invalid_character(text[i], i, "base32"));
    }
    buffer = (buffer << 5u) | static_cast<std::uint32_t>(value);
    bits += 5u;
    if (bits >= 8u) {
      bits -= 8u;
      out.push_back(static_cast<std::uint8_t>(buffer >> bits));
      buffer &= (1u << bits) - 1u;
    }
  }
  // Leftover bits are padding; encode_crockford always writes them as zero.
  if (buffer != 0u) {
    return BytesResult::err(core::DecodeError{
        core::DecodeErrorCode::kInvalidCharacter,
        "non-zero pad bits in final base32 character '" + std::string(1, text.back()) + "'"});
  }
  return BytesResult::ok(std::move(out));
}

std::string encode_hex(const std::span<const std::uint8_t> data) {
  constexpr std::string_view kHexDigits = "0123456789abcdef";
  std::string out;
  out.reserve(data.size() * 2u);
  for (const std::uint8_t byte : data) {
    out.push_back(kHexDigits[byte >> 4u]);
    out.push_back(kHexDigits[byte & 0x0fu]);
  }
  return out;
}

BytesResult decode_hex(const std::string_view text) {
  if (text.size() % 2u != 0u) {
    return BytesResult::err(core::DecodeError{core::DecodeErrorCode::kInvalidLength,
                                              "hex text must have an even number of characters"});
  }

  std::vector<std::uint8_t> out;
  out.reserve(text.size() / 2u);
  for (std::size_t i = 0; i < text.size(); i += 2u) {
    const int high = hex_value(text[i]);
    if (high < 0) {
      return BytesResult::err(invalid_character(text[i], i, "hex"));
    }
    const int low = hex_value(text[i + 1u]);
    if (low < 0) {
      return BytesResult::err(invalid_character(text[i + 1u], i + 1u, "hex"));
    }
    out.push_back(static_cast<std::uint8_t>((high << 4) | low));
  }
  return BytesResult::ok(std::move(out));
}

}  // namespace ulidtool::codec
