#pragma once

#include <b58uuid/codec/convert.hpp>
#include <b58uuid/result.hpp>
#include <string>
#include <string_view>

namespace b58uuid {

struct Uuid {
    Bytes16 bytes{};

    static Uuid nil();

    // Canonical form: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, lowercase
    std::string to_string() const;
    // Hex is case-insensitive; anything else is InvalidUUID
    static Result<Uuid> from_string(std::string_view s);

    // 32 hex digits, no dashes
    std::string to_simple_string() const;
    static Result<Uuid> from_simple_string(std::string_view s);

    std::string encode_base58() const;
    static Result<Uuid> decode_base58(std::string_view s);

    // High nibble of byte 6
    int version() const;
    // Top two bits of byte 8 are 10
    bool is_rfc4122_variant() const;

    bool operator==(const Uuid& other) const;
    bool operator!=(const Uuid& other) const;
};

// Canonical UUID text -> 22-character Base58 string
Result<std::string> encode_uuid(std::string_view text);

// 22-character Base58 string -> canonical lowercase UUID text
Result<std::string> decode_to_uuid(std::string_view b58);

} // namespace b58uuid
