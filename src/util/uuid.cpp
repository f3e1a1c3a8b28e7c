#include <b58uuid/uuid.hpp>
#include <b58uuid/codec/codec.hpp>

namespace b58uuid {

// ---- Hex helpers ----

static const char hex_chars[] = "0123456789abcdef";

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static bool is_dash_position(size_t i) {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

static void append_hex(std::string& out, uint8_t b) {
    out += hex_chars[b >> 4];
    out += hex_chars[b & 0x0F];
}

// Parse hex pairs from s into bytes, skipping positions for which skip(i) holds.
template<typename Skip>
static Result<Uuid> parse_hex(std::string_view s, Skip skip) {
    Uuid u;
    size_t byte_idx = 0;
    for (size_t i = 0; i < s.size(); ) {
        if (skip(i)) { ++i; continue; }
        int hi = hex_val(s[i]);
        int lo = hex_val(s[i + 1]);
        if (hi < 0 || lo < 0) {
            size_t bad = hi < 0 ? i : i + 1;
            return B58Error(B58Error::InvalidUUID,
                "UUID string contains invalid hex character",
                "invalid char at position " + std::to_string(bad));
        }
        u.bytes[byte_idx++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return Result<Uuid>::ok(u);
}

Uuid Uuid::nil() {
    return Uuid{};
}

// ---- Canonical form ----

std::string Uuid::to_string() const {
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < kByteWidth; ++i) {
        append_hex(out, bytes[i]);
        if (i == 3 || i == 5 || i == 7 || i == 9) {
            out += '-';
        }
    }
    return out;
}

Result<Uuid> Uuid::from_string(std::string_view s) {
    if (s.size() != 36) {
        return B58Error(B58Error::InvalidUUID,
            "UUID string must be 36 characters, got " + std::to_string(s.size()),
            "expected format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx");
    }
    for (size_t i = 0; i < s.size(); ++i) {
        if (is_dash_position(i) != (s[i] == '-')) {
            return B58Error(B58Error::InvalidUUID,
                "UUID string has invalid dash positions",
                "expected dashes at positions 8, 13, 18, 23 only");
        }
    }
    return parse_hex(s, is_dash_position);
}

// ---- Simple (dashless) form ----

std::string Uuid::to_simple_string() const {
    std::string out;
    out.reserve(32);
    for (uint8_t b : bytes) append_hex(out, b);
    return out;
}

Result<Uuid> Uuid::from_simple_string(std::string_view s) {
    if (s.size() != 32) {
        return B58Error(B58Error::InvalidUUID,
            "simple UUID string must be 32 characters, got " + std::to_string(s.size()),
            "expected 32 hex digits without dashes");
    }
    return parse_hex(s, [](size_t) { return false; });
}

// ---- Base58 ----

std::string Uuid::encode_base58() const {
    return encode(bytes);
}

Result<Uuid> Uuid::decode_base58(std::string_view s) {
    return decode(s).map([](const Bytes16& b) { return Uuid{b}; });
}

// ---- Layout bits ----

int Uuid::version() const {
    return bytes[6] >> 4;
}

bool Uuid::is_rfc4122_variant() const {
    return (bytes[8] & 0xC0) == 0x80;
}

bool Uuid::operator==(const Uuid& other) const {
    return bytes == other.bytes;
}

bool Uuid::operator!=(const Uuid& other) const {
    return bytes != other.bytes;
}

// ---- Text adapters ----

Result<std::string> encode_uuid(std::string_view text) {
    return Uuid::from_string(text).map([](const Uuid& u) { return u.encode_base58(); });
}

Result<std::string> decode_to_uuid(std::string_view b58) {
    return Uuid::decode_base58(b58).map([](const Uuid& u) { return u.to_string(); });
}

} // namespace b58uuid
