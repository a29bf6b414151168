#pragma once

#include <functional>
#include <string>

namespace sentiment {
namespace log {

enum class Level {
    Debug = 0,
    Info,
    Warning,
    Error
};

// Parses "debug", "info", "warning"/"warn" or "error" (any case).
// Returns false and leaves `out` untouched for anything else.
bool parseLevel(const std::string& name, Level& out);
const char* levelName(Level level);

void setLevel(Level level);
Level level();
bool enabled(Level level);

// Receives a finished line ("[LEVEL] message", no trailing newline).
// Calls are serialized.
using Sink = std::function<void(Level, const std::string&)>;

// Replaces the stdout/stderr sink; an empty Sink restores it.
void setSink(Sink sink);

// Control characters in message are written as \xNN.
std::string escapeControl(const std::string& message);

// Each call writes exactly one line. Debug/Info go to stdout, Warning/Error to
// stderr. Lines from concurrent threads never interleave.
void write(Level level, const std::string& message);

inline void debug(const std::string& message) { write(Level::Debug, message); }
inline void info(const std::string& message) { write(Level::Info, message); }
inline void warning(const std::string& message) { write(Level::Warning, message); }
inline void error(const std::string& message) { write(Level::Error, message); }

} // namespace log
} // namespace sentiment
