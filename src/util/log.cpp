#include <sift/log.hpp>

#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <unistd.h>

namespace sift::log {

namespace {

struct LevelInfo {
    const char* name;
    const char* color;
};

constexpr LevelInfo kLevels[] = {
    {"trace", "\033[90m"},
    {"debug", "\033[36m"},
    {"info",  "\033[32m"},
    {"warn",  "\033[33m"},
    {"error", "\033[31m"},
    {"off",   ""},
};

Level g_level = Info;
int g_color = -1;  // -1: not yet detected

bool color_on() {
    if (g_color < 0) g_color = isatty(fileno(stderr)) ? 1 : 0;
    return g_color == 1;
}

void emit(Level lvl, const char* fmt, va_list args) {
    if (lvl < g_level || g_level == Off) return;

    const LevelInfo& li = kLevels[lvl];
    if (color_on()) {
        std::fprintf(stderr, "sift %s%s\033[0m: ", li.color, li.name);
    } else {
        std::fprintf(stderr, "sift %s: ", li.name);
    }
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
}

} // namespace

void set_level(Level lvl) { g_level = lvl; }
Level get_level() { return g_level; }

bool parse_level(const std::string& name, Level& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (int i = Trace; i <= Off; ++i) {
        if (lower == kLevels[i].name) {
            out = static_cast<Level>(i);
            return true;
        }
    }
    return false;
}

void init_from_env() {
    const char* env = std::getenv("SIFT_LOG");
    Level lvl;
    if (env && parse_level(env, lvl)) set_level(lvl);
}

void set_color_enabled(bool enabled) { g_color = enabled ? 1 : 0; }
bool is_color_enabled() { return color_on(); }

const char* level_name(Level lvl) {
    if (lvl < Trace || lvl > Off) return "unknown";
    return kLevels[lvl].name;
}

#define SIFT_LOG_FN(fn_name, lvl)        \
    void fn_name(const char* fmt, ...) { \
        va_list args;                    \
        va_start(args, fmt);             \
        emit(lvl, fmt, args);            \
        va_end(args);                    \
    }

SIFT_LOG_FN(trace, Trace)
SIFT_LOG_FN(debug, Debug)
SIFT_LOG_FN(info, Info)
SIFT_LOG_FN(warn, Warn)
SIFT_LOG_FN(error, Error)

#undef SIFT_LOG_FN

} // namespace sift::log
