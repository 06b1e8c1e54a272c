#pragma once
#include <sstream>
#include <string>

namespace txguard {
namespace log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

void set_level(Level level);
Level level();
bool enabled(Level level);

// Parses "debug", "info", "warn" or "error". Returns false on anything else.
bool parse_level(const std::string& name, Level& out);

// Writes "[TAG] message" to stderr as one line.
void write(Level level, const char* tag, const std::string& message);

inline void debug(const char* tag, const std::string& m) { write(Level::Debug, tag, m); }
inline void info(const char* tag, const std::string& m) { write(Level::Info, tag, m); }
inline void warn(const char* tag, const std::string& m) { write(Level::Warn, tag, m); }
inline void error(const char* tag, const std::string& m) { write(Level::Error, tag, m); }

} // namespace log
} // namespace txguard
