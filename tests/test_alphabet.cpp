#include <catch2/catch.hpp>
#include <b58uuid/codec/alphabet.hpp>
#include <set>
#include <string>

using namespace b58uuid;

TEST_CASE("alphabet has 58 distinct symbols", "[alphabet]") {
    std::string a(kAlphabet);
    REQUIRE(a.size() == 58);
    std::set<char> unique(a.begin(), a.end());
    REQUIRE(unique.size() == 58);
    REQUIRE(a == "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz");
}

TEST_CASE("symbol_for maps digits in order", "[alphabet]") {
    REQUIRE(symbol_for(0) == '1');
    REQUIRE(symbol_for(8) == '9');
    REQUIRE(symbol_for(9) == 'A');
    REQUIRE(symbol_for(33) == 'a');
    REQUIRE(symbol_for(57) == 'z');
}

TEST_CASE("digit_for inverts symbol_for", "[alphabet]") {
    for (uint8_t d = 0; d < kBase; ++d) {
        auto back = digit_for(symbol_for(d));
        REQUIRE(back.has_value());
        REQUIRE(*back == d);
    }
}

TEST_CASE("digit_for rejects ambiguous glyphs", "[alphabet]") {
    REQUIRE_FALSE(digit_for('0').has_value());
    REQUIRE_FALSE(digit_for('O').has_value());
    REQUIRE_FALSE(digit_for('I').has_value());
    REQUIRE_FALSE(digit_for('l').has_value());
}

TEST_CASE("inverse table covers the full byte range", "[alphabet]") {
    int valid = 0;
    for (int b = 0; b < 256; ++b) {
        char c = static_cast<char>(b);
        if (is_symbol(c)) {
            ++valid;
        } else {
            REQUIRE(kInverseAlphabet[b] == kInvalidDigit);
            REQUIRE_FALSE(digit_for(c).has_value());
        }
    }
    REQUIRE(valid == 58);
    REQUIRE_FALSE(is_symbol('\0'));
    REQUIRE_FALSE(is_symbol(static_cast<char>(0xC3)));
}
