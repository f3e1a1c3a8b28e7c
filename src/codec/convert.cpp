#include <b58uuid/codec/convert.hpp>
#include <b58uuid/codec/alphabet.hpp>

namespace b58uuid {

// ---- Fixed-width base conversion ----
// The magnitude stays a big-endian byte array; division and
// multiply-accumulate walk it one byte at a time with a small carry.

// Divide a big-endian byte array (in-place) by 58, return the remainder.
static uint8_t div_by_58(uint8_t* num, size_t len) {
    uint32_t carry = 0;
    for (size_t i = 0; i < len; ++i) {
        uint32_t cur = carry * 256 + num[i];
        num[i] = static_cast<uint8_t>(cur / kBase);
        carry = cur % kBase;
    }
    return static_cast<uint8_t>(carry);
}

// num = num * 58 + val. Returns the carry out of the most significant byte;
// anything non-zero means the result no longer fits in len bytes.
static uint32_t mul_add_58(uint8_t* num, size_t len, uint8_t val) {
    uint32_t carry = val;
    for (size_t i = len; i-- > 0; ) {
        uint32_t cur = static_cast<uint32_t>(num[i]) * kBase + carry;
        num[i] = static_cast<uint8_t>(cur & 0xFF);
        carry = cur >> 8;
    }
    return carry;
}

Digits magnitude_to_digits(const Bytes16& value) {
    Bytes16 work = value;
    Digits digits{};
    for (size_t i = kDigitWidth; i-- > 0; ) {
        digits[i] = div_by_58(work.data(), work.size());
    }
    return digits;
}

Result<Bytes16> digits_to_magnitude(const Digits& digits) {
    Bytes16 acc{};
    for (size_t i = 0; i < kDigitWidth; ++i) {
        if (digits[i] >= kBase) {
            return B58Error(B58Error::InvalidArg,
                "digit value " + std::to_string(digits[i]) + " out of range at position " +
                std::to_string(i),
                "base-58 digits must be in 0..57");
        }
        if (mul_add_58(acc.data(), acc.size(), digits[i]) != 0) {
            return B58Error(B58Error::Overflow,
                "arithmetic overflow: value exceeds maximum UUID value",
                "a 22-character Base58 UUID must not exceed YcVfxkQb6JRzqk5kF2tNLv");
        }
    }
    return Result<Bytes16>::ok(acc);
}

} // namespace b58uuid
