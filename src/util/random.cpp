#include <b58uuid/random.hpp>
#include <b58uuid/log.hpp>
#include <cstring>
#include <fstream>

namespace b58uuid {

// ---- SystemRandomSource ----

SystemRandomSource::SystemRandomSource(std::string device)
    : device_(std::move(device)) {}

Status SystemRandomSource::fill(uint8_t* buf, size_t len) {
    std::ifstream dev(device_, std::ios::binary);
    if (!dev.is_open()) {
        return B58Error(B58Error::Random,
            "cannot open random device: " + device_,
            "check that the device exists and is readable");
    }
    dev.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
    auto got = static_cast<size_t>(dev.gcount());
    if (got != len) {
        // Don't leave a partially random buffer behind
        std::memset(buf, 0, len);
        return B58Error(B58Error::Random,
            "short read from " + device_ + ": wanted " + std::to_string(len) +
            " bytes, got " + std::to_string(got));
    }
    log::trace("read %zu bytes from %s", len, device_.c_str());
    return ok_status();
}

// ---- FixedRandomSource ----

FixedRandomSource::FixedRandomSource(std::vector<uint8_t> bytes)
    : bytes_(std::move(bytes)) {}

Status FixedRandomSource::fill(uint8_t* buf, size_t len) {
    if (remaining() < len) {
        return B58Error(B58Error::Random,
            "fixed random source exhausted: wanted " + std::to_string(len) +
            " bytes, " + std::to_string(remaining()) + " left");
    }
    std::memcpy(buf, bytes_.data() + pos_, len);
    pos_ += len;
    return ok_status();
}

} // namespace b58uuid
