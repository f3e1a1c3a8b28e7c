#include <b58uuid/generator.hpp>
#include <b58uuid/log.hpp>

namespace b58uuid {

Generator::Generator(RandomSource& source, GeneratorOptions opts)
    : source_(source), opts_(opts) {}

Result<Uuid> Generator::generate_uuid() {
    Uuid u;
    auto filled = source_.fill(u.bytes.data(), u.bytes.size());
    if (filled.is_err()) {
        log::debug("random source failed: %s", filled.error().message.c_str());
        return std::move(filled).error();
    }
    if (opts_.stamp_version4) {
        // Set version 4: bytes[6] high nibble = 0100
        u.bytes[6] = (u.bytes[6] & 0x0F) | 0x40;
        // Set variant 1: bytes[8] top two bits = 10
        u.bytes[8] = (u.bytes[8] & 0x3F) | 0x80;
    }
    return Result<Uuid>::ok(u);
}

Result<std::string> Generator::generate() {
    return generate_uuid().map([](const Uuid& u) { return u.encode_base58(); });
}

Result<std::string> generate() {
    SystemRandomSource source;
    Generator gen(source);
    return gen.generate();
}

} // namespace b58uuid
