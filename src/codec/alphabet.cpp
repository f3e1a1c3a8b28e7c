#include <b58uuid/codec/alphabet.hpp>

namespace b58uuid {

static_assert(kInverseAlphabet['1'] == 0, "'1' is the zero symbol");
static_assert(kInverseAlphabet['z'] == 57, "'z' is the highest symbol");
static_assert(kInverseAlphabet['0'] == kInvalidDigit, "'0' is excluded");
static_assert(kInverseAlphabet['O'] == kInvalidDigit, "'O' is excluded");
static_assert(kInverseAlphabet['I'] == kInvalidDigit, "'I' is excluded");
static_assert(kInverseAlphabet['l'] == kInvalidDigit, "'l' is excluded");

std::optional<uint8_t> digit_for(char symbol) {
    uint8_t d = kInverseAlphabet[static_cast<unsigned char>(symbol)];
    if (d == kInvalidDigit) return std::nullopt;
    return d;
}

bool is_symbol(char c) {
    return kInverseAlphabet[static_cast<unsigned char>(c)] != kInvalidDigit;
}

} // namespace b58uuid
