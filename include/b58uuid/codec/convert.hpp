#pragma once

#include <b58uuid/result.hpp>
#include <array>
#include <cstdint>

namespace b58uuid {

inline constexpr size_t kByteWidth = 16;
inline constexpr size_t kDigitWidth = 22;

// 128-bit unsigned magnitude, big-endian
using Bytes16 = std::array<uint8_t, kByteWidth>;

// Base-58 digit values (0..57), most significant first
using Digits = std::array<uint8_t, kDigitWidth>;

// Always succeeds: 58^21 <= 2^128 - 1 < 58^22, so 22 digits hold any
// 128-bit value. Small magnitudes get leading zero digits.
Digits magnitude_to_digits(const Bytes16& value);

// Fails with Overflow when the digits describe a value >= 2^128, and with
// InvalidArg when a digit is not in 0..57.
Result<Bytes16> digits_to_magnitude(const Digits& digits);

} // namespace b58uuid
