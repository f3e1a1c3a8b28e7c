#include <b58uuid/log.hpp>
#include <cstdarg>
#include <cstdio>
#include <optional>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace b58uuid::log {

namespace {

struct Settings {
    Level threshold = Info;
    // Unset until the first message or an explicit set_color_enabled()
    std::optional<bool> color;
};

Settings& settings() {
    static Settings s;
    return s;
}

bool color_active() {
    auto& s = settings();
    if (!s.color) s.color = isatty(fileno(stderr)) != 0;
    return *s.color;
}

const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";
        case Debug: return "\033[36m";
        case Info:  return "\033[32m";
        case Warn:  return "\033[33m";
        case Error: return "\033[31m";
    }
    return "";
}

const char* reset_color() {
    return "\033[0m";
}

void emit(Level lvl, const char* fmt, va_list args) {
    if (lvl < settings().threshold) return;

    if (color_active()) {
        std::fprintf(stderr, "%s%s%s: ", level_color(lvl), level_name(lvl), reset_color());
    } else {
        std::fprintf(stderr, "%s: ", level_name(lvl));
    }
    std::vfprintf(stderr, fmt, args);
    std::fprintf(stderr, "\n");
}

} // namespace

void set_level(Level lvl) { settings().threshold = lvl; }
Level get_level() { return settings().threshold; }

void set_color_enabled(bool enabled) { settings().color = enabled; }
bool is_color_enabled() { return color_active(); }

const char* level_name(Level lvl) {
    static const char* const names[] = {"trace", "debug", "info", "warn", "error"};
    if (lvl < Trace || lvl > Error) return "unknown";
    return names[lvl];
}

Result<Level> parse_level(const std::string& name) {
    if (name == "warning") return Result<Level>::ok(Warn);
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        if (name == level_name(lvl)) return Result<Level>::ok(lvl);
    }
    return B58Error(B58Error::Config,
        "unknown log level: '" + name + "'",
        "expected one of: trace, debug, info, warn, error");
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Error, fmt, args);
    va_end(args);
}

} // namespace b58uuid::log
