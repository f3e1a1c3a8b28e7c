#pragma once

#include <b58uuid/result.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace b58uuid {

// Source of cryptographically secure bytes. fill() either writes all len
// bytes or returns a Random error; it never hands back partial output.
class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual Status fill(uint8_t* buf, size_t len) = 0;
};

// Reads the kernel CSPRNG. The device is opened per call, so a single
// instance may be shared between threads.
class SystemRandomSource : public RandomSource {
public:
    explicit SystemRandomSource(std::string device = "/dev/urandom");

    Status fill(uint8_t* buf, size_t len) override;
    const std::string& device() const { return device_; }

private:
    std::string device_;
};

// Replays a fixed byte sequence; fails once exhausted. For tests.
class FixedRandomSource : public RandomSource {
public:
    explicit FixedRandomSource(std::vector<uint8_t> bytes);

    Status fill(uint8_t* buf, size_t len) override;
    size_t remaining() const { return bytes_.size() - pos_; }

private:
    std::vector<uint8_t> bytes_;
    size_t pos_ = 0;
};

} // namespace b58uuid
