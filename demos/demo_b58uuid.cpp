// demo_b58uuid.cpp
//
// Command-line driver for the Base58 UUID codec:
//
//     ./b58uuid-demo generate                      # new identifier(s)
//     ./b58uuid-demo encode 550e8400-e29b-41d4-a716-446655440000
//     ./b58uuid-demo decode BWBeN28Vb7cMEx7Ym8AUzs
//
// Settings come from ~/.b58uuid/config.toml and an optional --config <path>
// given before the command. Results go to stdout, errors to stderr.

#include <b58uuid/config.hpp>
#include <b58uuid/generator.hpp>
#include <b58uuid/log.hpp>
#include <b58uuid/uuid.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace b58uuid;

struct Invocation {
    std::optional<std::string> config_path;
    std::string command;
    std::vector<std::string> args;
};

static Result<Invocation> parse_args(int argc, char** argv) {
    Invocation inv;
    int i = 1;
    if (i + 1 < argc && std::string(argv[i]) == "--config") {
        inv.config_path = argv[i + 1];
        i += 2;
    }
    if (i >= argc) {
        return B58Error{
            B58Error::InvalidArg,
            "no command specified",
            "usage: b58uuid-demo [--config <file>] generate|encode <uuid>|decode <b58>"
        };
    }
    inv.command = argv[i++];
    for (; i < argc; ++i) inv.args.emplace_back(argv[i]);
    return Result<Invocation>::ok(std::move(inv));
}

static Result<Config> load_config(const Invocation& inv) {
    std::optional<Config> global;
    std::string gpath = global_config_path();
    if (!gpath.empty() && std::filesystem::exists(gpath)) {
        auto g = Config::load(gpath);
        B58UUID_TRY(g);
        global = std::move(g).value();
    }

    std::optional<Config> local;
    if (inv.config_path) {
        auto l = Config::load(*inv.config_path);
        B58UUID_TRY(l);
        local = std::move(l).value();
    }

    return Result<Config>::ok(Config::effective(global, local));
}

static Result<std::string> one_arg(const Invocation& inv) {
    if (inv.args.size() != 1) {
        return B58Error{
            B58Error::InvalidArg,
            "'" + inv.command + "' takes exactly one argument, got " +
                std::to_string(inv.args.size())
        };
    }
    return Result<std::string>::ok(inv.args[0]);
}

static Status run(const Invocation& inv, const Config& cfg) {
    if (inv.command == "generate") {
        SystemRandomSource source(cfg.device_or_default());
        GeneratorOptions opts;
        opts.stamp_version4 = cfg.version4_or_default();
        Generator gen(source, opts);

        for (int64_t n = 0; n < cfg.count_or_default(); ++n) {
            auto u = gen.generate_uuid();
            B58UUID_TRY(u);
            std::cout << u.value().encode_base58() << "  " << u.value().to_string() << "\n";
        }
        return ok_status();
    }

    if (inv.command == "encode") {
        auto text = one_arg(inv);
        B58UUID_TRY(text);
        auto encoded = encode_uuid(text.value());
        B58UUID_TRY(encoded);
        std::cout << encoded.value() << "\n";
        return ok_status();
    }

    if (inv.command == "decode") {
        auto text = one_arg(inv);
        B58UUID_TRY(text);
        auto decoded = decode_to_uuid(text.value());
        B58UUID_TRY(decoded);
        std::cout << decoded.value() << "\n";
        return ok_status();
    }

    return B58Error{
        B58Error::InvalidArg,
        "unknown command: " + inv.command,
        "expected generate, encode or decode"
    };
}

int main(int argc, char** argv) {
    auto inv = parse_args(argc, argv);
    if (inv.is_err()) {
        std::cerr << inv.error().format() << "\n";
        return 1;
    }

    auto cfg = load_config(inv.value());
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 1;
    }

    log::set_level(cfg.value().level_or_default());
    if (cfg.value().log_color) log::set_color_enabled(*cfg.value().log_color);
    log::debug("command '%s' with %zu argument(s)",
               inv.value().command.c_str(), inv.value().args.size());

    auto status = run(inv.value(), cfg.value());
    if (status.is_err()) {
        log::error("%s failed", inv.value().command.c_str());
        std::cerr << status.error().format() << "\n";
        return 1;
    }
    return 0;
}
