#include <treecopy/log.hpp>
#include <cstdarg>
#include <cstdio>
#include <unistd.h>

namespace treecopy::log {

static Level s_level = Info;
static bool s_color_initialized = false;
static bool s_color_enabled = false;
static std::function<void()> s_pre_write_hook;

static void init_color() {
    if (!s_color_initialized) {
        s_color_enabled = isatty(fileno(stderr));
        s_color_initialized = true;
    }
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

void set_color_enabled(bool enabled) {
    s_color_enabled = enabled;
    s_color_initialized = true;
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled;
}

void set_pre_write_hook(std::function<void()> hook) {
    s_pre_write_hook = std::move(hook);
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
    }
    return "unknown";
}

std::optional<Level> level_from_name(const std::string& name) {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        if (name == level_name(lvl)) return lvl;
    }
    if (name == "warning") return Warn;
    return std::nullopt;
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";   // gray
        case Debug: return "\033[36m";   // cyan
        case Info:  return "\033[32m";   // green
        case Warn:  return "\033[33m";   // yellow
        case Error: return "\033[31m";   // red
    }
    return "";
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level) return;
    init_color();
    if (s_pre_write_hook) s_pre_write_hook();

    if (s_color_enabled) {
        std::fprintf(stderr, "%s%s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(stderr, "%s: ", level_name(lvl));
    }

    std::vfprintf(stderr, fmt, args);
    std::fprintf(stderr, "\n");
}

#define TREECOPY_LOG_FN(name, lvl)          \
    void name(const char* fmt, ...) {       \
        va_list args;                       \
        va_start(args, fmt);                \
        log_message(lvl, fmt, args);        \
        va_end(args);                       \
    }

TREECOPY_LOG_FN(trace, Trace)
TREECOPY_LOG_FN(debug, Debug)
TREECOPY_LOG_FN(info, Info)
TREECOPY_LOG_FN(warn, Warn)
TREECOPY_LOG_FN(error, Error)

#undef TREECOPY_LOG_FN

} // namespace treecopy::log
