#include <b58uuid/error.hpp>

namespace b58uuid {

B58Error B58Error::invalid_length(size_t expected, size_t got) {
    B58Error e(InvalidLength,
        "invalid length: expected " + std::to_string(expected) +
        ", got " + std::to_string(got));
    e.expected = expected;
    e.got = got;
    return e;
}

const char* B58Error::code_name(Code c) {
    switch (c) {
        case InvalidUUID:   return "InvalidUUID";
        case InvalidBase58: return "InvalidBase58";
        case InvalidLength: return "InvalidLength";
        case Overflow:      return "Overflow";
        case Random:        return "Random";
        case IO:            return "IO";
        case Config:        return "Config";
        case InvalidArg:    return "InvalidArg";
    }
    return "Unknown";
}

std::string B58Error::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

} // namespace b58uuid
