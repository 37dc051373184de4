#pragma once

#include <functional>
#include <string>

namespace turngate::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void set_level(Level lvl);
Level level();

const char* level_label(Level lvl);

// Parses "debug", "info", "warn", "error" or "off" (case-insensitive).
// Returns false and leaves *out untouched for anything else.
bool parse_level(const std::string& s, Level* out);

// Replaces the output sink. The default sink writes "[LEVEL] message" lines to
// stderr. Passing an empty function restores the default.
using Sink = std::function<void(Level, const std::string&)>;
void set_sink(Sink sink);

void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

} // namespace turngate::log
