#pragma once

#include <cstddef>
#include <string>

namespace b58uuid {

struct B58Error {
    enum Code {
        InvalidUUID,
        InvalidBase58,
        InvalidLength,
        Overflow,
        Random,
        IO,
        Config,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    // Only meaningful for InvalidLength
    size_t expected = 0;
    size_t got = 0;

    B58Error() = default;
    B58Error(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    B58Error(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    static B58Error invalid_length(size_t expected, size_t got);

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace b58uuid
