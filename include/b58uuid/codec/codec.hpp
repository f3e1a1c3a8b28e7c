#pragma once

#include <b58uuid/codec/convert.hpp>
#include <b58uuid/result.hpp>
#include <string>
#include <string_view>

namespace b58uuid {

// 16 bytes -> 22 Base58 characters. Total; output length is always 22.
std::string encode(const Bytes16& bytes);

// 22 Base58 characters -> 16 bytes.
// Errors: InvalidLength (size != 22), InvalidBase58 (first character outside
// the alphabet), Overflow (value >= 2^128).
Result<Bytes16> decode(std::string_view s);

} // namespace b58uuid
