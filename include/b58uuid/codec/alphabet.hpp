#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace b58uuid {

// Bitcoin Base58 alphabet: alphanumerics without 0, O, I and l.
// Symbol order defines digit values and is part of the wire format.
inline constexpr char kAlphabet[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

inline constexpr size_t kBase = 58;
inline constexpr uint8_t kInvalidDigit = 0xFF;

static_assert(sizeof(kAlphabet) - 1 == kBase, "alphabet must hold 58 symbols");

namespace detail {

constexpr std::array<uint8_t, 256> make_inverse_table() {
    std::array<uint8_t, 256> table{};
    for (size_t i = 0; i < table.size(); ++i) table[i] = kInvalidDigit;
    for (size_t d = 0; d < kBase; ++d) {
        table[static_cast<unsigned char>(kAlphabet[d])] = static_cast<uint8_t>(d);
    }
    return table;
}

} // namespace detail

// symbol -> digit, kInvalidDigit for every byte outside the alphabet
inline constexpr std::array<uint8_t, 256> kInverseAlphabet = detail::make_inverse_table();

// digit must be < 58
constexpr char symbol_for(uint8_t digit) {
    return kAlphabet[digit];
}

std::optional<uint8_t> digit_for(char symbol);

bool is_symbol(char c);

} // namespace b58uuid
