#pragma once

#include <b58uuid/log.hpp>
#include <b58uuid/result.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace b58uuid {

// Layered configuration: global < local.
// Unset fields fall through to the layer below, then to the defaults
// returned by the accessors.
struct Config {
    // [log]
    std::optional<log::Level> log_level;
    std::optional<bool> log_color;

    // [generate]
    std::optional<int64_t> generate_count;
    std::optional<bool> version4;
    std::optional<std::string> random_device;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's set values override this)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    log::Level level_or_default() const { return log_level.value_or(log::Info); }
    int64_t count_or_default() const { return generate_count.value_or(1); }
    bool version4_or_default() const { return version4.value_or(false); }
    std::string device_or_default() const { return random_device.value_or("/dev/urandom"); }
};

// Discover the global config file path: ~/.b58uuid/config.toml
std::string global_config_path();

} // namespace b58uuid
