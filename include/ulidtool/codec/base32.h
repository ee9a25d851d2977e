#pragma once

#include "ulidtool/core/result.h"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ulidtool::codec {

// Crockford's base-32 alphabet: digits and upper-case letters without I, L, O, U.
inline constexpr std::string_view kCrockfordAlphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

// encode_crockford encodes data as an unpadded base-32 string, most significant
// bit first. A partial final quantum is zero-filled on the right, so 6 bytes
// produce 10 characters and 10 bytes produce 16.
[[nodiscard]] std::string encode_crockford(std::span<const std::uint8_t> data);

// decode_crockford reverses encode_crockford. Case-insensitive.
// Produces floor(5 * size / 8) bytes. Leftover pad bits must be zero, so each byte
// string has exactly one accepted text (kInvalidCharacter otherwise).
// Fails with kInvalidCharacter on any character outside the alphabet.
[[nodiscard]] core::Result<std::vector<std::uint8_t>, core::DecodeError> decode_crockford(
    std::string_view text);

// Lower-case hexadecimal, two characters per byte.
[[nodiscard]] std::string encode_hex(std::span<const std::uint8_t> data);

// Case-insensitive; fails on odd length (kInvalidLength) or non-hex characters.
[[nodiscard]] core::Result<std::vector<std::uint8_t>, core::DecodeError> decode_hex(
    std::string_view text);

}  // namespace ulidtool::codec
