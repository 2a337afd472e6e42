#pragma once

#include <string>
#include <functional>
#include <optional>

namespace treecopy::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Called before every emitted message. The terminal progress bar uses it
// to erase its line so log output does not interleave with the bar.
void set_pre_write_hook(std::function<void()> hook);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Inverse of level_name(); nullopt for unknown names
std::optional<Level> level_from_name(const std::string& name);

} // namespace treecopy::log
