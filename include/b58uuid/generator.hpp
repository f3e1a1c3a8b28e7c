#pragma once

#include <b58uuid/random.hpp>
#include <b58uuid/result.hpp>
#include <b58uuid/uuid.hpp>
#include <string>

namespace b58uuid {

struct GeneratorOptions {
    // Overwrite the version nibble with 4 and the variant bits with 10
    // (RFC 4122). Leaves 122 random bits instead of 128.
    bool stamp_version4 = false;
};

class Generator {
public:
    explicit Generator(RandomSource& source, GeneratorOptions opts = {});

    Result<Uuid> generate_uuid();
    // 22-character Base58 form of generate_uuid()
    Result<std::string> generate();

    const GeneratorOptions& options() const { return opts_; }

private:
    RandomSource& source_;
    GeneratorOptions opts_;
};

// One-shot helper backed by SystemRandomSource with default options.
Result<std::string> generate();

} // namespace b58uuid
