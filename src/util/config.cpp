#include <b58uuid/config.hpp>
#include <tomlplusplus/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace b58uuid {

static B58Error type_error(const std::string& key, const char* expected) {
    return B58Error(B58Error::Config,
        "config key '" + key + "' must be " + expected);
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return B58Error{B58Error::Config,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto node = (*lg)["level"]) {
            auto s = node.value<std::string>();
            if (!s) return type_error("log.level", "a string");
            auto lvl = log::parse_level(*s);
            B58UUID_TRY(lvl);
            cfg.log_level = lvl.value();
        }
        if (auto node = (*lg)["color"]) {
            auto b = node.value<bool>();
            if (!b) return type_error("log.color", "a boolean");
            cfg.log_color = *b;
        }
    }

    // [generate] section
    if (auto gen = doc["generate"].as_table()) {
        if (auto node = (*gen)["count"]) {
            auto n = node.value<int64_t>();
            if (!n) return type_error("generate.count", "an integer");
            if (*n < 1) {
                return B58Error(B58Error::Config,
                    "config key 'generate.count' must be at least 1, got " +
                    std::to_string(*n));
            }
            cfg.generate_count = *n;
        }
        if (auto node = (*gen)["version4"]) {
            auto b = node.value<bool>();
            if (!b) return type_error("generate.version4", "a boolean");
            cfg.version4 = *b;
        }
        if (auto node = (*gen)["random-device"]) {
            auto s = node.value<std::string>();
            if (!s || s->empty()) return type_error("generate.random-device", "a non-empty string");
            cfg.random_device = *s;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return B58Error{B58Error::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str());
}

void Config::merge(const Config& other) {
    if (other.log_level) log_level = other.log_level;
    if (other.log_color) log_color = other.log_color;
    if (other.generate_count) generate_count = other.generate_count;
    if (other.version4) version4 = other.version4;
    if (other.random_device) random_device = other.random_device;
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.b58uuid/config.toml";
}

} // namespace b58uuid
