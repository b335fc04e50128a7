#pragma once

#include <string>

namespace sift::log {

enum Level { Trace, Debug, Info, Warn, Error, Off };

void set_level(Level lvl);
Level get_level();

// Accepts "trace", "debug", "info", "warn", "error", "off" (case-insensitive).
bool parse_level(const std::string& name, Level& out);

// Applies SIFT_LOG from the environment if it names a valid level.
void init_from_env();

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

} // namespace sift::log
