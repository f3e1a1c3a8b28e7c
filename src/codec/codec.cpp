#include <b58uuid/codec/codec.hpp>
#include <b58uuid/codec/alphabet.hpp>
#include <b58uuid/log.hpp>
#include <cstdio>

namespace b58uuid {

std::string encode(const Bytes16& bytes) {
    Digits digits = magnitude_to_digits(bytes);
    std::string out(kDigitWidth, symbol_for(0));
    for (size_t i = 0; i < kDigitWidth; ++i) {
        out[i] = symbol_for(digits[i]);
    }
    return out;
}

// Printable rendering of a rejected character for diagnostics.
static std::string describe_char(char c) {
    auto u = static_cast<unsigned char>(c);
    if (u >= 0x20 && u < 0x7F) return std::string("'") + c + "'";
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02x", u);
    return buf;
}

Result<Bytes16> decode(std::string_view s) {
    if (s.size() != kDigitWidth) {
        log::debug("rejecting Base58 UUID of length %zu", s.size());
        return B58Error::invalid_length(kDigitWidth, s.size());
    }

    Digits digits{};
    for (size_t i = 0; i < kDigitWidth; ++i) {
        auto d = digit_for(s[i]);
        if (!d) {
            log::debug("rejecting Base58 UUID: bad character at position %zu", i);
            return B58Error(B58Error::InvalidBase58,
                "invalid character " + describe_char(s[i]) + " at position " +
                std::to_string(i) + " in \"" + std::string(s) + "\"",
                "Base58 excludes 0, O, I and l");
        }
        digits[i] = *d;
    }

    auto magnitude = digits_to_magnitude(digits);
    if (magnitude.is_err()) {
        log::debug("rejecting Base58 UUID \"%.*s\": %s",
                   static_cast<int>(s.size()), s.data(), magnitude.error().message.c_str());
    }
    return magnitude;
}

} // namespace b58uuid
