#include <catch2/catch.hpp>
#include <b58uuid/error.hpp>
#include <string>

using namespace b58uuid;

TEST_CASE("format() with hint", "[error]") {
    B58Error e{B58Error::InvalidBase58, "invalid character '0' at position 3", "Base58 excludes 0"};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[InvalidBase58]") != std::string::npos);
    REQUIRE(formatted.find("position 3") != std::string::npos);
    REQUIRE(formatted.find("hint: Base58 excludes 0") != std::string::npos);
}

TEST_CASE("format() without hint", "[error]") {
    B58Error e{B58Error::Overflow, "arithmetic overflow"};
    auto formatted = e.format();
    REQUIRE(formatted == "error[Overflow]: arithmetic overflow");
}

TEST_CASE("invalid_length() fills expected and got", "[error]") {
    auto e = B58Error::invalid_length(22, 10);
    REQUIRE(e.code == B58Error::InvalidLength);
    REQUIRE(e.expected == 22);
    REQUIRE(e.got == 10);
    REQUIRE(e.message == "invalid length: expected 22, got 10");
}

TEST_CASE("code_name() for all codes", "[error]") {
    REQUIRE(std::string(B58Error::code_name(B58Error::InvalidUUID)) == "InvalidUUID");
    REQUIRE(std::string(B58Error::code_name(B58Error::InvalidBase58)) == "InvalidBase58");
    REQUIRE(std::string(B58Error::code_name(B58Error::InvalidLength)) == "InvalidLength");
    REQUIRE(std::string(B58Error::code_name(B58Error::Overflow)) == "Overflow");
    REQUIRE(std::string(B58Error::code_name(B58Error::Random)) == "Random");
    REQUIRE(std::string(B58Error::code_name(B58Error::IO)) == "IO");
    REQUIRE(std::string(B58Error::code_name(B58Error::Config)) == "Config");
    REQUIRE(std::string(B58Error::code_name(B58Error::InvalidArg)) == "InvalidArg");
}
