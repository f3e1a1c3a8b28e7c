#include <catch2/catch.hpp>
#include <b58uuid/codec/convert.hpp>

using namespace b58uuid;

static Digits all_digits(uint8_t d) {
    Digits out;
    out.fill(d);
    return out;
}

TEST_CASE("zero magnitude yields 22 zero digits", "[convert]") {
    Bytes16 zero{};
    REQUIRE(magnitude_to_digits(zero) == all_digits(0));
}

TEST_CASE("small magnitudes are left-padded with zero digits", "[convert]") {
    Bytes16 v{};
    v[15] = 58;
    auto d = magnitude_to_digits(v);
    REQUIRE(d[21] == 0);
    REQUIRE(d[20] == 1);
    for (size_t i = 0; i < 20; ++i) REQUIRE(d[i] == 0);
}

TEST_CASE("58^21 is the first magnitude using the top digit", "[convert]") {
    // 58^21 = 0x0819237f3896f2f30bb832ce3da00000
    Bytes16 v = {0x08, 0x19, 0x23, 0x7f, 0x38, 0x96, 0xf2, 0xf3,
                 0x0b, 0xb8, 0x32, 0xce, 0x3d, 0xa0, 0x00, 0x00};
    Digits expected = all_digits(0);
    expected[0] = 1;
    REQUIRE(magnitude_to_digits(v) == expected);

    auto back = digits_to_magnitude(expected);
    REQUIRE(back.is_ok());
    REQUIRE(back.value() == v);
}

TEST_CASE("maximum magnitude fits in 22 digits", "[convert]") {
    Bytes16 max;
    max.fill(0xFF);
    Digits expected = {31, 35, 28, 38, 55, 43, 23, 34, 5, 17, 24,
                       57, 48, 43, 4, 43, 14, 1, 51, 21, 19, 53};
    REQUIRE(magnitude_to_digits(max) == expected);

    auto back = digits_to_magnitude(expected);
    REQUIRE(back.is_ok());
    REQUIRE(back.value() == max);
}

TEST_CASE("one past the maximum overflows", "[convert]") {
    // 2^128 - 1 ends in digit 53; 2^128 ends in 54
    Digits d = {31, 35, 28, 38, 55, 43, 23, 34, 5, 17, 24,
                57, 48, 43, 4, 43, 14, 1, 51, 21, 19, 54};
    auto r = digits_to_magnitude(d);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == B58Error::Overflow);
}

TEST_CASE("all-57 digits overflow", "[convert]") {
    auto r = digits_to_magnitude(all_digits(57));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == B58Error::Overflow);
}

TEST_CASE("leading digit 32 always overflows", "[convert]") {
    // 32 * 58^21 > 2^128 - 1 regardless of the remaining digits
    Digits d = all_digits(0);
    d[0] = 32;
    auto r = digits_to_magnitude(d);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == B58Error::Overflow);
}

TEST_CASE("out-of-range digit is reported, not wrapped", "[convert]") {
    Digits d = all_digits(0);
    d[5] = 58;
    auto r = digits_to_magnitude(d);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == B58Error::InvalidArg);
}
